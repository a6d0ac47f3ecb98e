#ifndef CHANGE_TRIGGER_HPP
#define CHANGE_TRIGGER_HPP

#include "reload_channel.hpp"
#include <atomic>
#include <boost/asio/ip/tcp.hpp>
#include <cstdint>
#include <string_view>

namespace net = boost::asio;
using tcp = net::ip::tcp;

// Entry point for "something changed". Each fire() is exactly one
// broadcast on the channel.
class ChangeTrigger {
public:
  explicit ChangeTrigger(ReloadChannel &channel);

  ReloadChannel::BroadcastResult fire(std::string_view source);

  // Serves one connection from the trigger port: fires once, answers
  // "ok <clients notified>\n" and closes.
  void accept(tcp::socket &&socket);

  std::uint64_t fired() const { return fired_.load(); }

private:
  ReloadChannel &channel_;
  std::atomic<std::uint64_t> fired_{0};
};

#endif // CHANGE_TRIGGER_HPP
