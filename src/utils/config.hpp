#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <filesystem>
#include <stdexcept>
#include <string>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Server settings, resolved once before anything starts and never modified
// afterwards. A port of 0 asks the OS for an ephemeral port.
struct ServerConfig {
  std::string bind_address = "0.0.0.0";
  unsigned short port = 4000;
  unsigned short ws_port = 8090;
  unsigned short trigger_port = 8091;
  fs::path root_dir = ".";
  bool watch = false;
  bool verbose = false;
  std::string index_file = "index.html";
  std::string reload_path = "/__livereload";
  std::string script_path = "/__livereload.js";

  // Reads a YAML file on top of the defaults.
  static ServerConfig load(const fs::path &config_path);

  // Parses the command line. A --config file is applied first so flags
  // given on the command line win over it. Throws ConfigError.
  static ServerConfig from_args(int argc, char *argv[]);

  // Checks the address and root directory and canonicalizes the root.
  void validate();

  void apply_yaml(const YAML::Node &yaml);
  void set_addr(const std::string &addr);
};

unsigned short parse_port(const std::string &value);

#endif // CONFIG_HPP
