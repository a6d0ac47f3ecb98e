#include "listener.hpp"
#include "utils/console.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core/bind_handler.hpp>

Listener::Listener(net::io_context &ioc, const tcp::endpoint &endpoint,
                   Handler handler, std::string name)
    : ioc_(ioc), acceptor_(net::make_strand(ioc)),
      handler_(std::move(handler)), name_(std::move(name)) {
  acceptor_.open(endpoint.protocol());
  acceptor_.set_option(net::socket_base::reuse_address(true));
  acceptor_.bind(endpoint);
  acceptor_.listen(net::socket_base::max_listen_connections);
  port_ = acceptor_.local_endpoint().port();
}

void Listener::run() { do_accept(); }

void Listener::stop() {
  net::post(acceptor_.get_executor(), [self = shared_from_this()]() {
    boost::system::error_code ec;
    self->acceptor_.close(ec);
  });
}

void Listener::do_accept() {
  acceptor_.async_accept(net::make_strand(ioc_),
                         boost::beast::bind_front_handler(
                             &Listener::on_accept, shared_from_this()));
}

void Listener::on_accept(boost::system::error_code ec, tcp::socket socket) {
  if (ec == net::error::operation_aborted) {
    return;
  }

  if (ec) {
    console::error(name_ + " accept error: " + ec.message());
  } else {
    handler_(std::move(socket));
  }

  if (acceptor_.is_open()) {
    do_accept();
  }
}
