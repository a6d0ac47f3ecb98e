#include "config.hpp"
#include <boost/asio/ip/address.hpp>
#include <optional>
#include <vector>

unsigned short parse_port(const std::string &value) {
  std::size_t consumed = 0;
  unsigned long port = 0;

  try {
    port = std::stoul(value, &consumed);
  } catch (const std::exception &) {
    throw ConfigError("Invalid port: " + value);
  }

  if (consumed != value.size() || port > 65535) {
    throw ConfigError("Invalid port: " + value);
  }
  return static_cast<unsigned short>(port);
}

void ServerConfig::set_addr(const std::string &addr) {
  size_t colon = addr.rfind(':');
  if (colon == std::string::npos || colon == 0) {
    throw ConfigError("Address must be IP:PORT, got " + addr);
  }

  std::string host = addr.substr(0, colon);
  if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
    host = host.substr(1, host.size() - 2);
  }

  bind_address = host;
  port = parse_port(addr.substr(colon + 1));
}

void ServerConfig::apply_yaml(const YAML::Node &yaml) {
  if (!yaml.IsMap()) {
    throw ConfigError("Config must be a YAML mapping");
  }

  try {
    if (yaml["addr"])
      set_addr(yaml["addr"].as<std::string>());
    if (yaml["ws_port"])
      ws_port = parse_port(yaml["ws_port"].as<std::string>());
    if (yaml["trigger_port"])
      trigger_port = parse_port(yaml["trigger_port"].as<std::string>());
    if (yaml["root"])
      root_dir = yaml["root"].as<std::string>();
    if (yaml["watch"])
      watch = yaml["watch"].as<bool>();
    if (yaml["verbose"])
      verbose = yaml["verbose"].as<bool>();
    if (yaml["index"])
      index_file = yaml["index"].as<std::string>();
  } catch (const YAML::Exception &e) {
    throw ConfigError(std::string("Invalid config value: ") + e.what());
  }
}

ServerConfig ServerConfig::load(const fs::path &config_path) {
  if (!fs::exists(config_path)) {
    throw ConfigError("Config file not found: " + config_path.string());
  }

  ServerConfig config;
  try {
    config.apply_yaml(YAML::LoadFile(config_path.string()));
  } catch (const YAML::Exception &e) {
    throw ConfigError("Cannot parse " + config_path.string() + ": " +
                      e.what());
  }
  return config;
}

ServerConfig ServerConfig::from_args(int argc, char *argv[]) {
  std::vector<std::string> args(argv + 1, argv + argc);

  auto value_of = [&args](size_t &i) -> const std::string & {
    if (i + 1 >= args.size()) {
      throw ConfigError("Missing value for " + args[i]);
    }
    return args[++i];
  };

  std::optional<fs::path> config_file;
  for (size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "-c" || args[i] == "--config") {
      config_file = value_of(i);
    }
  }

  ServerConfig config = config_file ? load(*config_file) : ServerConfig{};
  bool root_seen = false;

  for (size_t i = 0; i < args.size(); ++i) {
    const std::string &arg = args[i];

    if (arg == "-c" || arg == "--config") {
      ++i;
    } else if (arg == "-a" || arg == "--addr") {
      config.set_addr(value_of(i));
    } else if (arg == "--ws-port") {
      config.ws_port = parse_port(value_of(i));
    } else if (arg == "--trigger-port") {
      config.trigger_port = parse_port(value_of(i));
    } else if (arg == "-w" || arg == "--watch") {
      config.watch = true;
    } else if (arg == "-v" || arg == "--verbose") {
      config.verbose = true;
    } else if (!arg.empty() && arg[0] == '-') {
      throw ConfigError("Unknown option: " + arg);
    } else if (root_seen) {
      throw ConfigError("Unexpected argument: " + arg);
    } else {
      config.root_dir = arg;
      root_seen = true;
    }
  }

  return config;
}

void ServerConfig::validate() {
  boost::system::error_code ec;
  boost::asio::ip::make_address(bind_address, ec);
  if (ec) {
    throw ConfigError("Invalid bind address: " + bind_address);
  }

  std::error_code fs_ec;
  if (!fs::is_directory(root_dir, fs_ec)) {
    throw ConfigError("Root directory not found: " + root_dir.string());
  }

  root_dir = fs::canonical(root_dir, fs_ec);
  if (fs_ec) {
    throw ConfigError("Cannot resolve root directory: " + fs_ec.message());
  }

  if (index_file.empty() || index_file.find('/') != std::string::npos) {
    throw ConfigError("Invalid index file name: " + index_file);
  }
}
