#include "http_session.hpp"
#include "reload_session.hpp"
#include "utils/console.hpp"
#include <boost/asio/dispatch.hpp>
#include <chrono>

namespace {

constexpr std::uint64_t request_body_limit = 64 * 1024;
constexpr std::chrono::seconds read_timeout{30};

} // namespace

HttpSession::HttpSession(tcp::socket &&socket, const Dispatcher &dispatcher)
    : stream_(std::move(socket)), dispatcher_(dispatcher) {}

void HttpSession::run() {
  net::dispatch(stream_.get_executor(),
                beast::bind_front_handler(&HttpSession::do_read,
                                          shared_from_this()));
}

void HttpSession::do_read() {
  parser_.emplace();
  parser_->body_limit(request_body_limit);
  stream_.expires_after(read_timeout);

  http::async_read(stream_, buffer_, *parser_,
                   beast::bind_front_handler(&HttpSession::on_read,
                                             shared_from_this()));
}

void HttpSession::on_read(beast::error_code ec, std::size_t bytes) {
  (void)bytes;

  if (ec == http::error::end_of_stream) {
    do_close();
    return;
  }

  if (ec) {
    if (ec != beast::error::timeout && ec != net::error::operation_aborted &&
        ec != net::error::connection_reset) {
      console::debug("HTTP read: " + ec.message());
    }
    return;
  }

  Request req = parser_->release();
  Route route = dispatcher_.route(req);

  if (route == Route::reload_upgrade) {
    console::event("🔌 WebSocket", "upgrade request for " +
                                       std::string(req.target()));
    std::make_shared<ReloadSession>(stream_.release_socket(),
                                    dispatcher_.channel())
        ->run(std::move(req));
    return;
  }

  Reply reply = dispatcher_.respond(req, route);
  console::request(req.method_string(), req.target(),
                   static_cast<int>(reply_status(reply)),
                   reply_body_size(reply));
  send(std::move(reply));
}

void HttpSession::send(Reply &&reply) {
  std::visit(
      [this](auto &&res) {
        using Response = std::decay_t<decltype(res)>;
        auto sp = std::make_shared<Response>(std::move(res));
        bool close = sp->need_eof();

        http::async_write(
            stream_, *sp,
            [self = shared_from_this(), sp,
             close](beast::error_code ec, std::size_t bytes) {
              self->on_write(close, ec, bytes);
            });
      },
      std::move(reply));
}

void HttpSession::on_write(bool close, beast::error_code ec,
                           std::size_t bytes) {
  (void)bytes;

  if (ec) {
    console::debug("HTTP write: " + ec.message());
    return;
  }

  if (close) {
    do_close();
    return;
  }

  do_read();
}

void HttpSession::do_close() {
  beast::error_code ec;
  stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
}
