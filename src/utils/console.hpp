#ifndef CONSOLE_HPP
#define CONSOLE_HPP

#include <cstddef>
#include <string>
#include <string_view>

// Colored console output shared by every thread of the server. Each call
// writes one complete line.
namespace console {

void set_verbose(bool verbose);
bool is_verbose();

// HH:MM:SS.mmm in local time.
std::string timestamp();

void success(std::string_view message);
void info(std::string_view message);
void warn(std::string_view message);
void error(std::string_view message);
void debug(std::string_view message);

// Timestamped line with a highlighted tag, e.g. "🔌 WebSocket".
void event(std::string_view tag, std::string_view message);

void request(std::string_view method, std::string_view path, int status,
             std::size_t bytes);

} // namespace console

#endif // CONSOLE_HPP
