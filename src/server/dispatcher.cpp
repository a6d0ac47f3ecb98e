#include "dispatcher.hpp"
#include "core/client_script.hpp"
#include "core/file_resolver.hpp"
#include "utils/console.hpp"
#include <boost/beast/websocket/rfc6455.hpp>

Dispatcher::Dispatcher(const StaticResponder &responder,
                       ReloadChannel &channel, std::string reload_path,
                       std::string script_path, unsigned short ws_port)
    : responder_(responder), channel_(channel),
      reload_path_(std::move(reload_path)),
      script_path_(std::move(script_path)),
      client_script_(render_client_script(ws_port, reload_path_)) {}

bool Dispatcher::is_valid_handshake(const Request &req) {
  if (!beast::websocket::is_upgrade(req)) {
    return false;
  }

  auto key = req[http::field::sec_websocket_key];
  auto version = req[http::field::sec_websocket_version];
  return !key.empty() && key.size() <= 24 && version == "13";
}

Route Dispatcher::route(const Request &req) const {
  std::string_view path = FileResolver::path_part(req.target());

  if (path == reload_path_) {
    if (is_valid_handshake(req)) {
      return Route::reload_upgrade;
    }
    return Route::bad_upgrade;
  }

  if (path == script_path_ && (req.method() == http::verb::get ||
                               req.method() == http::verb::head)) {
    return Route::client_script;
  }

  return Route::static_file;
}

Reply Dispatcher::respond(const Request &req, Route route) const {
  switch (route) {
  case Route::client_script:
    return text_reply(req, http::status::ok, client_script_,
                      "application/javascript");
  case Route::reload_upgrade:
    console::error("websocket handshake for " + std::string(req.target()) +
                   " reached the HTTP reply path instead of a reload "
                   "session");
    return error_reply(req, http::status::internal_server_error);
  case Route::bad_upgrade:
    console::warn("rejected live reload request to " +
                  std::string(req.target()) + ": not a websocket handshake");
    return error_reply(req, http::status::bad_request);
  case Route::static_file:
    break;
  }
  return responder_.respond(req);
}
