#pragma once

#include "reload_channel.hpp"
#include <atomic>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <memory>
#include <string>
#include <vector>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

// Server side of one live-reload websocket.
//
// Handshaking -> Registered -> Closed. While registered, every notify()
// becomes one "reload" text frame; frames sent by the client are read and
// thrown away. The session removes itself from the channel when the
// connection closes or fails.
class ReloadSession : public ReloadSubscriber,
                      public std::enable_shared_from_this<ReloadSession> {
public:
  enum class State { handshaking, registered, closed };

  static constexpr const char *reload_message = "reload";

  ReloadSession(tcp::socket &&socket, ReloadChannel &channel);

  // Completes the handshake for an upgrade request that was already read.
  void run(http::request<http::string_body> req);

  bool notify() override;
  void close() override;
  std::string describe() const override { return remote_; }

  State state() const { return state_.load(); }

private:
  void on_accept(beast::error_code ec);
  void do_read();
  void on_read(beast::error_code ec, std::size_t bytes);
  void do_write();
  void on_write(beast::error_code ec, std::size_t bytes);
  void finish(beast::error_code ec);

  websocket::stream<beast::tcp_stream> ws_;
  beast::flat_buffer buffer_;
  std::vector<std::string> queue_;
  ReloadChannel &channel_;
  ReloadChannel::Handle handle_ = 0;
  std::atomic<State> state_{State::handshaking};
  std::string remote_;
};
