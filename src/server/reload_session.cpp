#include "reload_session.hpp"
#include "utils/console.hpp"
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>

namespace {

std::string endpoint_string(const tcp::socket &socket) {
  beast::error_code ec;
  auto endpoint = socket.remote_endpoint(ec);
  if (ec) {
    return "unknown";
  }
  return endpoint.address().to_string() + ":" +
         std::to_string(endpoint.port());
}

} // namespace

ReloadSession::ReloadSession(tcp::socket &&socket, ReloadChannel &channel)
    : ws_(std::move(socket)), channel_(channel) {
  remote_ = endpoint_string(beast::get_lowest_layer(ws_).socket());
}

void ReloadSession::run(http::request<http::string_body> req) {
  // The websocket stream has its own timeouts.
  beast::get_lowest_layer(ws_).expires_never();

  auto timeouts =
      websocket::stream_base::timeout::suggested(beast::role_type::server);
  timeouts.keep_alive_pings = true;
  ws_.set_option(timeouts);
  ws_.set_option(
      websocket::stream_base::decorator([](websocket::response_type &res) {
        res.set(http::field::server, "hotserve");
      }));

  ws_.async_accept(req, beast::bind_front_handler(&ReloadSession::on_accept,
                                                  shared_from_this()));
}

void ReloadSession::on_accept(beast::error_code ec) {
  if (ec) {
    state_ = State::closed;
    console::error("WebSocket handshake with " + remote_ +
                   " failed: " + ec.message());
    return;
  }

  State expected = State::handshaking;
  if (!state_.compare_exchange_strong(expected, State::registered)) {
    return;
  }

  handle_ = channel_.add_client(shared_from_this());
  do_read();
}

bool ReloadSession::notify() {
  if (state_.load() != State::registered) {
    return false;
  }

  net::post(ws_.get_executor(), [self = shared_from_this()]() {
    if (self->state_.load() != State::registered) {
      return;
    }
    self->queue_.emplace_back(reload_message);
    if (self->queue_.size() == 1) {
      self->do_write();
    }
  });
  return true;
}

void ReloadSession::close() {
  net::post(ws_.get_executor(), [self = shared_from_this()]() {
    if (self->state_.exchange(State::closed) == State::closed) {
      return;
    }
    self->ws_.async_close(websocket::close_code::going_away,
                          [self](beast::error_code ec) {
                            if (ec) {
                              console::debug("WebSocket close: " +
                                             ec.message());
                            }
                          });
  });
}

void ReloadSession::do_read() {
  ws_.async_read(buffer_, beast::bind_front_handler(&ReloadSession::on_read,
                                                    shared_from_this()));
}

void ReloadSession::on_read(beast::error_code ec, std::size_t bytes) {
  if (ec) {
    finish(ec);
    return;
  }

  console::debug("WebSocket ignored " + std::to_string(bytes) + "B from " +
                 remote_);
  buffer_.consume(buffer_.size());
  do_read();
}

void ReloadSession::do_write() {
  ws_.text(true);
  ws_.async_write(net::buffer(queue_.front()),
                  beast::bind_front_handler(&ReloadSession::on_write,
                                            shared_from_this()));
}

void ReloadSession::on_write(beast::error_code ec, std::size_t bytes) {
  (void)bytes;

  if (ec) {
    finish(ec);
    return;
  }

  queue_.erase(queue_.begin());
  if (!queue_.empty() && state_.load() == State::registered) {
    do_write();
  }
}

void ReloadSession::finish(beast::error_code ec) {
  State previous = state_.exchange(State::closed);

  if (previous != State::closed) {
    if (ec == websocket::error::closed) {
      console::event("🔌 WebSocket", "connection closed by " + remote_);
    } else if (ec != net::error::operation_aborted) {
      console::event("🔌 WebSocket",
                     remote_ + " dropped: " + ec.message());
    }
  }

  channel_.remove_client(handle_);
}
