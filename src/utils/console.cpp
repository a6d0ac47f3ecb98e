#include "console.hpp"
#include <termcolor/termcolor.hpp>
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace console {

namespace {

std::mutex output_mutex;
std::atomic<bool> verbose_output{false};

} // namespace

void set_verbose(bool verbose) { verbose_output = verbose; }

bool is_verbose() { return verbose_output.load(); }

std::string timestamp() {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::tm tm{};
  localtime_r(&time, &tm);

  std::stringstream ss;
  ss << std::put_time(&tm, "%H:%M:%S");
  ss << "." << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

void success(std::string_view message) {
  std::lock_guard<std::mutex> lock(output_mutex);
  std::cout << termcolor::bright_green << "✓ " << termcolor::reset << message
            << "\n";
}

void info(std::string_view message) {
  std::lock_guard<std::mutex> lock(output_mutex);
  std::cout << termcolor::bright_blue << "→ " << termcolor::reset << message
            << "\n";
}

void warn(std::string_view message) {
  std::lock_guard<std::mutex> lock(output_mutex);
  std::cerr << termcolor::yellow << "⚠ Warning: " << termcolor::reset
            << message << "\n";
}

void error(std::string_view message) {
  std::lock_guard<std::mutex> lock(output_mutex);
  std::cerr << termcolor::bright_red << "✗ " << termcolor::reset
            << termcolor::bright_white << message << termcolor::reset << "\n";
}

void debug(std::string_view message) {
  if (!verbose_output.load()) {
    return;
  }

  std::lock_guard<std::mutex> lock(output_mutex);
  std::cout << termcolor::bright_blue << "[" << timestamp() << "]"
            << termcolor::reset << " " << termcolor::grey << message
            << termcolor::reset << "\n";
}

void event(std::string_view tag, std::string_view message) {
  std::lock_guard<std::mutex> lock(output_mutex);
  std::cout << termcolor::bright_blue << "[" << timestamp() << "]"
            << termcolor::reset << " " << termcolor::bright_magenta << tag
            << termcolor::reset << " " << message << "\n";
}

void request(std::string_view method, std::string_view path, int status,
             std::size_t bytes) {
  std::lock_guard<std::mutex> lock(output_mutex);

  std::cout << termcolor::bright_blue << "[" << timestamp() << "]"
            << termcolor::reset << " ";

  if (method == "GET") {
    std::cout << termcolor::bright_cyan;
  } else if (method == "HEAD") {
    std::cout << termcolor::cyan;
  } else {
    std::cout << termcolor::bright_yellow;
  }
  std::cout << method << termcolor::reset << " ";

  std::cout << termcolor::white << std::setw(30) << std::left << path
            << termcolor::reset << " ";

  if (status >= 200 && status < 300) {
    std::cout << termcolor::bright_green;
  } else if (status >= 300 && status < 400) {
    std::cout << termcolor::bright_blue;
  } else if (status >= 400 && status < 500) {
    std::cout << termcolor::bright_yellow;
  } else {
    std::cout << termcolor::red << termcolor::bold;
  }

  std::cout << status << termcolor::reset << " " << termcolor::bright_blue
            << bytes << "B" << termcolor::reset << "\n";
}

} // namespace console
