#ifndef CLIENT_SCRIPT_HPP
#define CLIENT_SCRIPT_HPP

#include <string>

// The browser side of live reload, with the websocket port and endpoint
// path filled in.
std::string render_client_script(unsigned short ws_port,
                                 const std::string &reload_path);

// Adds a <script> tag loading the client script before </body>, or at the
// end when the document has none.
std::string inject_reload_script(const std::string &html,
                                 const std::string &script_path);

#endif // CLIENT_SCRIPT_HPP
