#ifndef DISPATCHER_HPP
#define DISPATCHER_HPP

#include "reload_channel.hpp"
#include "reply.hpp"
#include "static_responder.hpp"
#include <string>

enum class Route {
  static_file,
  client_script,
  reload_upgrade,
  bad_upgrade,
};

// Decides what to do with a request: live-reload upgrades go to a
// ReloadSession, everything else gets an HTTP reply.
class Dispatcher {
public:
  Dispatcher(const StaticResponder &responder, ReloadChannel &channel,
             std::string reload_path, std::string script_path,
             unsigned short ws_port);

  Route route(const Request &req) const;

  // Reply for every route except reload_upgrade.
  Reply respond(const Request &req, Route route) const;

  ReloadChannel &channel() const { return channel_; }

  static bool is_valid_handshake(const Request &req);

private:
  const StaticResponder &responder_;
  ReloadChannel &channel_;
  std::string reload_path_;
  std::string script_path_;
  std::string client_script_;
};

#endif // DISPATCHER_HPP
