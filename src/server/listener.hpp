#ifndef LISTENER_HPP
#define LISTENER_HPP

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/io_context.hpp>
#include <functional>
#include <memory>
#include <string>

namespace net = boost::asio;
using tcp = net::ip::tcp;

// Accepts TCP connections and hands each socket, already bound to its own
// strand, to a handler.
class Listener : public std::enable_shared_from_this<Listener> {
public:
  using Handler = std::function<void(tcp::socket &&)>;

  // Binds immediately; throws boost::system::system_error when the
  // endpoint cannot be bound.
  Listener(net::io_context &ioc, const tcp::endpoint &endpoint,
           Handler handler, std::string name);

  void run();
  void stop();

  unsigned short port() const { return port_; }
  const std::string &name() const { return name_; }

private:
  void do_accept();
  void on_accept(boost::system::error_code ec, tcp::socket socket);

  net::io_context &ioc_;
  tcp::acceptor acceptor_;
  Handler handler_;
  std::string name_;
  unsigned short port_ = 0;
};

#endif // LISTENER_HPP
