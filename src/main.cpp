#include "server/dev_server.hpp"
#include "utils/config.hpp"
#include "utils/console.hpp"
#include <iostream>
#include <string>

void print_usage() {
  std::cout << "hotserve - A static HTTP file server with live reload\n\n";
  std::cout << "Usage:\n";
  std::cout << "  hotserve [ROOT] [options]\n\n";
  std::cout << "Options:\n";
  std::cout << "  -a, --addr IP:PORT        Address to serve on "
               "(default 0.0.0.0:4000)\n";
  std::cout << "      --ws-port PORT        Live reload websocket port "
               "(default 8090)\n";
  std::cout << "      --trigger-port PORT   Loopback port that triggers a "
               "reload (default 8091)\n";
  std::cout << "  -w, --watch               Reload when files under ROOT "
               "change\n";
  std::cout << "  -c, --config FILE         Read settings from a YAML file\n";
  std::cout << "  -v, --verbose             Log path resolution details\n";
  std::cout << "  -h, --help                Show this help\n";
}

int main(int argc, char *argv[]) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    }
  }

  try {
    ServerConfig config = ServerConfig::from_args(argc, argv);
    config.validate();
    console::set_verbose(config.verbose);

    DevServer server(config);
    server.run();

  } catch (const ConfigError &e) {
    std::cerr << "Configuration error: " << e.what() << std::endl;
    print_usage();
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
