#include "dev_server.hpp"
#include "http_session.hpp"
#include "utils/console.hpp"
#include "utils/file_watcher_listener.hpp"
#include <algorithm>
#include <arpa/inet.h>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <efsw/efsw.hpp>
#include <ifaddrs.h>
#include <iomanip>
#include <iostream>
#include <netinet/in.h>
#include <termcolor/termcolor.hpp>

#ifndef HOTSERVE_VERSION
#define HOTSERVE_VERSION "unknown"
#endif

namespace {

constexpr std::chrono::milliseconds shutdown_grace{500};

bool is_private(const net::ip::address_v4 &addr) {
  auto bytes = addr.to_bytes();
  return bytes[0] == 10 || (bytes[0] == 172 && (bytes[1] & 0xf0) == 16) ||
         (bytes[0] == 192 && bytes[1] == 168);
}

// IPv4 LAN addresses of this machine, for the banner.
std::vector<std::string> lan_addresses() {
  std::vector<std::string> result;

  ifaddrs *list = nullptr;
  if (getifaddrs(&list) != 0) {
    return result;
  }

  for (ifaddrs *it = list; it != nullptr; it = it->ifa_next) {
    if (it->ifa_addr == nullptr || it->ifa_addr->sa_family != AF_INET) {
      continue;
    }
    auto *sin = reinterpret_cast<sockaddr_in *>(it->ifa_addr);
    net::ip::address_v4 addr(ntohl(sin->sin_addr.s_addr));
    if (is_private(addr)) {
      result.push_back(addr.to_string());
    }
  }

  freeifaddrs(list);
  return result;
}

void banner_row(const std::string &label, const std::string &value) {
  std::cout << termcolor::bright_green << "║  " << termcolor::reset << label
            << termcolor::bright_white << std::setw(28) << std::left << value
            << termcolor::reset << termcolor::bright_green << "║"
            << termcolor::reset << "\n";
}

} // namespace

DevServer::DevServer(const ServerConfig &config)
    : config_(config), trigger_(channel_),
      resolver_(config.root_dir, config.index_file),
      responder_(resolver_, config.script_path), signals_(ioc_) {
  auto address = net::ip::make_address(config_.bind_address);

  http_listener_ = std::make_shared<Listener>(
      ioc_, tcp::endpoint(address, config_.port),
      [this](tcp::socket &&socket) { accept_http(std::move(socket)); },
      "HTTP");

  if (config_.ws_port != config_.port || config_.port == 0) {
    ws_listener_ = std::make_shared<Listener>(
        ioc_, tcp::endpoint(address, config_.ws_port),
        [this](tcp::socket &&socket) { accept_http(std::move(socket)); },
        "WebSocket");
  }

  // The trigger is only meant for tools running on this machine.
  trigger_listener_ = std::make_shared<Listener>(
      ioc_, tcp::endpoint(net::ip::address_v4::loopback(),
                          config_.trigger_port),
      [this](tcp::socket &&socket) { trigger_.accept(std::move(socket)); },
      "Trigger");

  dispatcher_ = std::make_unique<Dispatcher>(responder_, channel_,
                                             config_.reload_path,
                                             config_.script_path, ws_port());
}

DevServer::~DevServer() { stop(); }

unsigned short DevServer::ws_port() const {
  return ws_listener_ ? ws_listener_->port() : http_listener_->port();
}

void DevServer::accept_http(tcp::socket &&socket) {
  std::make_shared<HttpSession>(std::move(socket), *dispatcher_)->run();
}

void DevServer::start() {
  if (running_.exchange(true)) {
    return;
  }

  http_listener_->run();
  if (ws_listener_) {
    ws_listener_->run();
  }
  trigger_listener_->run();

  if (config_.watch) {
    start_watcher();
  }

  unsigned workers = std::max(2u, std::thread::hardware_concurrency());
  threads_.reserve(workers);
  for (unsigned i = 0; i < workers; ++i) {
    threads_.emplace_back([this]() {
      try {
        ioc_.run();
      } catch (const std::exception &e) {
        console::error(std::string("worker stopped: ") + e.what());
      }
    });
  }
}

void DevServer::start_watcher() {
  file_watcher_ = std::make_unique<efsw::FileWatcher>();
  watch_listener_ = std::make_unique<DevServerListener>(
      config_.root_dir, &trigger_, ioc_);

  efsw::WatchID id = file_watcher_->addWatch(config_.root_dir.string(),
                                             watch_listener_.get(), true);
  if (id < 0) {
    console::warn("cannot watch " + config_.root_dir.string() + ": " +
                  efsw::Errors::Log::getLastErrorLog());
    return;
  }

  file_watcher_->watch();
  console::success("Watching " + config_.root_dir.string());
}

void DevServer::stop() {
  if (!running_.exchange(false)) {
    return;
  }

  console::info("Shutting down servers...");

  // The watcher thread may still post into the io_context.
  file_watcher_.reset();

  http_listener_->stop();
  if (ws_listener_) {
    ws_listener_->stop();
  }
  trigger_listener_->stop();

  net::post(ioc_, [this]() {
    boost::system::error_code ec;
    signals_.cancel(ec);
  });

  channel_.close_all();

  // Let the close handshakes run before the loop is torn down. Idle HTTP
  // keep-alive reads would otherwise hold the workers until their timeout.
  auto deadline = std::make_shared<net::steady_timer>(ioc_, shutdown_grace);
  deadline->async_wait(
      [this, deadline](const boost::system::error_code &) { ioc_.stop(); });

  for (auto &thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  threads_.clear();

  console::success("Server stopped cleanly");
}

void DevServer::request_shutdown() {
  {
    std::lock_guard<std::mutex> lock(shutdown_mutex_);
    shutdown_requested_ = true;
  }
  shutdown_cv_.notify_all();
}

void DevServer::run() {
  signals_.add(SIGINT);
  signals_.add(SIGTERM);
  signals_.async_wait([this](const boost::system::error_code &ec, int) {
    if (!ec) {
      request_shutdown();
    }
  });

  start();
  print_banner();

  {
    std::unique_lock<std::mutex> lock(shutdown_mutex_);
    shutdown_cv_.wait(lock, [this]() { return shutdown_requested_; });
  }

  std::cout << "\n";
  stop();
}

void DevServer::print_banner() const {
  std::string http_url = "http://" + config_.bind_address + ":" +
                         std::to_string(http_port());

  std::cout << "\n"
            << termcolor::bright_green
            << "╔═══════════════════════════════════════════╗\n"
            << "║        🚀 hotserve live reload            ║\n"
            << "╠═══════════════════════════════════════════╣"
            << termcolor::reset << "\n";
  banner_row("Version:    ", HOTSERVE_VERSION);
  banner_row("HTTP:       ", http_url);
  banner_row("WebSocket:  ", "ws port " + std::to_string(ws_port()));
  banner_row("Trigger:    ", "127.0.0.1:" + std::to_string(trigger_port()));
  banner_row("Watching:   ", config_.watch ? "yes" : "no");
  std::cout << termcolor::bright_green
            << "╚═══════════════════════════════════════════╝"
            << termcolor::reset << "\n\n";

  console::info("root dir: " + config_.root_dir.string());

  auto addresses = lan_addresses();
  if (!addresses.empty()) {
    console::info("Available (IPv4 LAN) address(es):");
    for (const auto &addr : addresses) {
      console::info("  http://" + addr + ":" + std::to_string(http_port()));
    }
  }

  std::cout << termcolor::bright_blue << "Press Ctrl+C to stop server..."
            << termcolor::reset << "\n\n";
}
