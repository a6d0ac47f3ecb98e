#ifndef HTTP_SESSION_HPP
#define HTTP_SESSION_HPP

#include "dispatcher.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <memory>
#include <optional>

namespace net = boost::asio;
using tcp = net::ip::tcp;

// One HTTP/1.1 connection. Reads requests one after another and answers
// them through the dispatcher until the peer closes, or hands the socket
// over to a ReloadSession when a live-reload upgrade arrives.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  HttpSession(tcp::socket &&socket, const Dispatcher &dispatcher);

  void run();

private:
  void do_read();
  void on_read(beast::error_code ec, std::size_t bytes);
  void send(Reply &&reply);
  void on_write(bool close, beast::error_code ec, std::size_t bytes);
  void do_close();

  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  std::optional<http::request_parser<http::string_body>> parser_;
  const Dispatcher &dispatcher_;
};

#endif // HTTP_SESSION_HPP
