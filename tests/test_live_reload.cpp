#include "doctest/doctest.h"
#include "server/dev_server.hpp"
#include "server/reload_session.hpp"
#include "test_support.hpp"
#include <boost/asio/read.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <functional>
#include <future>
#include <thread>

namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

constexpr std::chrono::seconds io_limit{5};

bool wait_until(const std::function<bool()> &condition,
                std::chrono::milliseconds limit = std::chrono::seconds(5)) {
  auto deadline = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return condition();
}

tcp::endpoint local(unsigned short port) {
  return {net::ip::address_v4::loopback(), port};
}

// Runs one asynchronous operation to completion on `ioc`. The stream's
// deadline turns a silent peer into beast::error::timeout.
template <class Initiate>
beast::error_code run_op(net::io_context &ioc, beast::tcp_stream &stream,
                         Initiate &&initiate) {
  beast::error_code result = net::error::would_block;
  stream.expires_after(io_limit);
  initiate([&result](beast::error_code ec, auto &&...) { result = ec; });
  ioc.restart();
  ioc.run();
  return result;
}

void throw_on_error(beast::error_code ec) {
  if (ec) {
    throw beast::system_error(ec);
  }
}

http::response<http::string_body> http_get(net::io_context &ioc,
                                           unsigned short port,
                                           const std::string &target) {
  beast::tcp_stream stream(ioc);
  throw_on_error(run_op(ioc, stream, [&](auto handler) {
    stream.async_connect(local(port), std::move(handler));
  }));

  http::request<http::empty_body> req{http::verb::get, target, 11};
  req.set(http::field::host, "127.0.0.1");
  req.keep_alive(false);
  throw_on_error(run_op(ioc, stream, [&](auto handler) {
    http::async_write(stream, req, std::move(handler));
  }));

  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  throw_on_error(run_op(ioc, stream, [&](auto handler) {
    http::async_read(stream, buffer, res, std::move(handler));
  }));

  beast::error_code ec;
  stream.socket().shutdown(tcp::socket::shutdown_both, ec);
  return res;
}

// Connects to the trigger port and returns everything it writes before
// closing.
std::string pull_trigger(net::io_context &ioc, unsigned short port) {
  beast::tcp_stream stream(ioc);
  throw_on_error(run_op(ioc, stream, [&](auto handler) {
    stream.async_connect(local(port), std::move(handler));
  }));

  std::string reply;
  beast::error_code ec = run_op(ioc, stream, [&](auto handler) {
    net::async_read(stream, net::dynamic_buffer(reply), std::move(handler));
  });
  if (ec != net::error::eof) {
    throw_on_error(ec);
  }
  return reply;
}

class ReloadClient {
public:
  ReloadClient(net::io_context &ioc, unsigned short port)
      : ioc_(ioc), ws_(ioc) {
    throw_on_error(run([&](auto handler) {
      beast::get_lowest_layer(ws_).async_connect(local(port),
                                                 std::move(handler));
    }));
    std::string host = "127.0.0.1:" + std::to_string(port);
    throw_on_error(run([&](auto handler) {
      ws_.async_handshake(host, "/__livereload", std::move(handler));
    }));
  }

  std::string next_message() {
    beast::flat_buffer buffer;
    throw_on_error(run([&](auto handler) {
      ws_.async_read(buffer, std::move(handler));
    }));
    return beast::buffers_to_string(buffer.data());
  }

  // Waits for the next frame and reports how the read ended.
  beast::error_code read_error() {
    beast::flat_buffer buffer;
    return run(
        [&](auto handler) { ws_.async_read(buffer, std::move(handler)); });
  }

  void send(const std::string &text) {
    ws_.text(true);
    throw_on_error(run([&](auto handler) {
      ws_.async_write(net::buffer(text), std::move(handler));
    }));
  }

  void close() {
    throw_on_error(run([&](auto handler) {
      ws_.async_close(websocket::close_code::normal, std::move(handler));
    }));
  }

  // Drops the TCP connection without a close frame.
  void drop() {
    beast::error_code ec;
    beast::get_lowest_layer(ws_).socket().close(ec);
  }

private:
  template <class Initiate> beast::error_code run(Initiate &&initiate) {
    return run_op(ioc_, beast::get_lowest_layer(ws_),
                  std::forward<Initiate>(initiate));
  }

  net::io_context &ioc_;
  websocket::stream<beast::tcp_stream> ws_;
};

struct RunningServer {
  TempDir site;
  ServerConfig config;
  std::unique_ptr<DevServer> server;

  RunningServer() {
    site.write("index.html",
               "<html><head></head><body><h1>hello</h1></body></html>");
    config.bind_address = "127.0.0.1";
    config.port = 0;
    config.ws_port = 0;
    config.trigger_port = 0;
    config.root_dir = site.path();
    server = std::make_unique<DevServer>(config);
    server->start();
  }

  ~RunningServer() { server->stop(); }
};

} // namespace

DOCTEST_TEST_CASE("end to end: page, live reload connection and trigger") {
  RunningServer running;
  DevServer &server = *running.server;
  net::io_context ioc;

  auto page = http_get(ioc, server.http_port(), "/");
  DOCTEST_CHECK(page.result() == http::status::ok);
  DOCTEST_CHECK(page[http::field::content_type] == "text/html");
  DOCTEST_CHECK(page.body().find("<h1>hello</h1>") != std::string::npos);
  DOCTEST_CHECK(page.body().find("/__livereload.js") != std::string::npos);

  auto script = http_get(ioc, server.http_port(), "/__livereload.js");
  DOCTEST_CHECK(script.result() == http::status::ok);
  DOCTEST_CHECK(script.body().find(":" + std::to_string(server.ws_port())) !=
                std::string::npos);

  ReloadClient client(ioc, server.ws_port());
  DOCTEST_REQUIRE(
      wait_until([&server]() { return server.channel().client_count() == 1; }));

  DOCTEST_CHECK(pull_trigger(ioc, server.trigger_port()) == "ok 1\n");
  DOCTEST_CHECK(client.next_message() == "reload");

  client.close();
  DOCTEST_REQUIRE(
      wait_until([&server]() { return server.channel().client_count() == 0; }));

  DOCTEST_CHECK(pull_trigger(ioc, server.trigger_port()) == "ok 0\n");
  DOCTEST_CHECK(server.trigger().fired() == 2);
}

DOCTEST_TEST_CASE("every client gets one message per trigger, in order") {
  RunningServer running;
  DevServer &server = *running.server;
  net::io_context ioc;

  ReloadClient first(ioc, server.ws_port());
  // The reload endpoint also answers on the HTTP port.
  ReloadClient second(ioc, server.http_port());
  DOCTEST_REQUIRE(
      wait_until([&server]() { return server.channel().client_count() == 2; }));

  server.trigger().fire("test");
  server.trigger().fire("test");

  DOCTEST_CHECK(first.next_message() == "reload");
  DOCTEST_CHECK(first.next_message() == "reload");
  DOCTEST_CHECK(second.next_message() == "reload");
  DOCTEST_CHECK(second.next_message() == "reload");

  first.close();
  DOCTEST_REQUIRE(
      wait_until([&server]() { return server.channel().client_count() == 1; }));

  auto result = server.trigger().fire("test");
  DOCTEST_CHECK(result.delivered == 1);
  DOCTEST_CHECK(second.next_message() == "reload");
  second.close();
}

DOCTEST_TEST_CASE("plain requests to the reload endpoint are rejected") {
  RunningServer running;
  DevServer &server = *running.server;
  net::io_context ioc;

  auto res = http_get(ioc, server.ws_port(), "/__livereload");
  DOCTEST_CHECK(res.result() == http::status::bad_request);
  DOCTEST_CHECK(server.channel().client_count() == 0);

  auto missing = http_get(ioc, server.http_port(), "/../../etc/passwd");
  DOCTEST_CHECK(missing.result() == http::status::not_found);
}

DOCTEST_TEST_CASE("stopping the server releases live reload clients") {
  RunningServer running;
  DevServer &server = *running.server;
  net::io_context ioc;

  ReloadClient client(ioc, server.ws_port());
  DOCTEST_REQUIRE(
      wait_until([&server]() { return server.channel().client_count() == 1; }));

  auto closed = std::async(std::launch::async,
                           [&client]() { return client.read_error(); });
  server.stop();

  DOCTEST_CHECK(closed.get() == websocket::error::closed);
  DOCTEST_CHECK(server.channel().client_count() == 0);
}

DOCTEST_TEST_CASE("frames sent by a client are ignored") {
  RunningServer running;
  DevServer &server = *running.server;
  net::io_context ioc;

  ReloadClient client(ioc, server.ws_port());
  DOCTEST_REQUIRE(
      wait_until([&server]() { return server.channel().client_count() == 1; }));

  client.send("hello");
  client.send("{\"command\":\"hello\"}");

  auto result = server.trigger().fire("test");
  DOCTEST_CHECK(result.delivered == 1);
  DOCTEST_CHECK(client.next_message() == "reload");
  DOCTEST_CHECK(server.channel().client_count() == 1);
  client.close();
}

DOCTEST_TEST_CASE("a session whose connection drops leaves the channel") {
  net::io_context server_ioc;
  ReloadChannel channel;
  tcp::acceptor acceptor(server_ioc, local(0));
  std::shared_ptr<ReloadSession> session;
  beast::flat_buffer server_buffer;
  http::request<http::string_body> upgrade;

  acceptor.async_accept([&](beast::error_code ec, tcp::socket socket) {
    if (ec) {
      return;
    }
    auto peer = std::make_shared<tcp::socket>(std::move(socket));
    http::async_read(*peer, server_buffer, upgrade,
                     [&, peer](beast::error_code read_ec, std::size_t) {
                       if (read_ec) {
                         return;
                       }
                       session = std::make_shared<ReloadSession>(
                           std::move(*peer), channel);
                       session->run(std::move(upgrade));
                     });
  });
  std::thread worker([&server_ioc]() { server_ioc.run(); });

  net::io_context ioc;
  ReloadClient client(ioc, acceptor.local_endpoint().port());
  bool registered =
      wait_until([&channel]() { return channel.client_count() == 1; });
  if (registered) {
    client.drop();
  }
  bool released =
      wait_until([&channel]() { return channel.client_count() == 0; });

  server_ioc.stop();
  worker.join();

  DOCTEST_REQUIRE(registered);
  DOCTEST_REQUIRE(released);
  DOCTEST_REQUIRE(session);
  DOCTEST_CHECK(session->state() == ReloadSession::State::closed);
  DOCTEST_CHECK_FALSE(session->notify());
  DOCTEST_CHECK(channel.broadcast_reload().delivered == 0);
}

DOCTEST_TEST_CASE("a port that is already taken is a startup error") {
  RunningServer running;

  ServerConfig clash = running.config;
  clash.port = running.server->http_port();
  DOCTEST_CHECK_THROWS_AS(DevServer{clash}, boost::system::system_error);
}
