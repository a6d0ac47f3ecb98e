#include "client_script.hpp"
#include "livereload.js.h"
#include <regex>

std::string render_client_script(unsigned short ws_port,
                                 const std::string &reload_path) {
  std::string script(reinterpret_cast<const char *>(assets_livereload_js),
                     assets_livereload_js_len);

  script = std::regex_replace(script, std::regex(R"(\{\{\s*ws_port\s*\}\})"),
                              std::to_string(ws_port));
  script = std::regex_replace(
      script, std::regex(R"(\{\{\s*reload_path\s*\}\})"), reload_path);
  return script;
}

std::string inject_reload_script(const std::string &html,
                                 const std::string &script_path) {
  std::string tag = "<script defer src=\"" + script_path + "\"></script>\n";

  size_t body_close = html.rfind("</body>");
  if (body_close == std::string::npos) {
    body_close = html.rfind("</BODY>");
  }

  if (body_close != std::string::npos) {
    return html.substr(0, body_close) + tag + html.substr(body_close);
  }
  return html + tag;
}
