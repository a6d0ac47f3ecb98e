#include "change_trigger.hpp"
#include "utils/console.hpp"
#include <boost/asio/write.hpp>
#include <memory>
#include <string>

ChangeTrigger::ChangeTrigger(ReloadChannel &channel) : channel_(channel) {}

ReloadChannel::BroadcastResult ChangeTrigger::fire(std::string_view source) {
  std::uint64_t count = ++fired_;
  console::event("⚡ Trigger",
                 "#" + std::to_string(count) + " from " + std::string(source));
  return channel_.broadcast_reload();
}

void ChangeTrigger::accept(tcp::socket &&s) {
  auto socket = std::make_shared<tcp::socket>(std::move(s));

  boost::system::error_code peer_ec;
  auto peer = socket->remote_endpoint(peer_ec);
  std::string source =
      peer_ec ? std::string("trigger port") : peer.address().to_string();

  auto result = fire(source);
  auto reply =
      std::make_shared<std::string>("ok " + std::to_string(result.delivered) +
                                    "\n");

  net::async_write(*socket, net::buffer(*reply),
                   [socket, reply](boost::system::error_code ec,
                                   std::size_t) {
                     if (ec) {
                       console::debug("trigger reply: " + ec.message());
                     }
                     boost::system::error_code ignored;
                     socket->shutdown(tcp::socket::shutdown_both, ignored);
                     socket->close(ignored);
                   });
}
