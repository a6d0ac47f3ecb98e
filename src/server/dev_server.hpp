#ifndef DEV_SERVER_HPP
#define DEV_SERVER_HPP

#include "change_trigger.hpp"
#include "core/file_resolver.hpp"
#include "dispatcher.hpp"
#include "listener.hpp"
#include "reload_channel.hpp"
#include "static_responder.hpp"
#include "utils/config.hpp"
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <condition_variable>
#include <csignal>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace efsw {
class FileWatcher;
}
class DevServerListener;

// The whole server: HTTP and websocket listeners, the trigger port, the
// reload channel and, in watch mode, the file watcher.
class DevServer {
public:
  // Binds every port. Throws when one cannot be bound.
  explicit DevServer(const ServerConfig &config);
  ~DevServer();

  DevServer(const DevServer &) = delete;
  DevServer &operator=(const DevServer &) = delete;

  void start();
  void stop();

  // Starts, prints the banner and blocks until SIGINT or SIGTERM.
  void run();

  unsigned short http_port() const { return http_listener_->port(); }
  unsigned short ws_port() const;
  unsigned short trigger_port() const { return trigger_listener_->port(); }

  ReloadChannel &channel() { return channel_; }
  ChangeTrigger &trigger() { return trigger_; }

private:
  void accept_http(tcp::socket &&socket);
  void start_watcher();
  void print_banner() const;
  void request_shutdown();

  const ServerConfig config_;
  net::io_context ioc_;
  ReloadChannel channel_;
  ChangeTrigger trigger_;
  FileResolver resolver_;
  StaticResponder responder_;
  std::unique_ptr<Dispatcher> dispatcher_;

  std::shared_ptr<Listener> http_listener_;
  std::shared_ptr<Listener> ws_listener_;
  std::shared_ptr<Listener> trigger_listener_;

  std::unique_ptr<DevServerListener> watch_listener_;
  std::unique_ptr<efsw::FileWatcher> file_watcher_;

  net::signal_set signals_;
  std::vector<std::thread> threads_;
  std::atomic<bool> running_{false};

  std::mutex shutdown_mutex_;
  std::condition_variable shutdown_cv_;
  bool shutdown_requested_ = false;
};

#endif // DEV_SERVER_HPP
