#ifndef RELOAD_CHANNEL_HPP
#define RELOAD_CHANNEL_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

// One live-reload client as seen by the channel.
class ReloadSubscriber {
public:
  virtual ~ReloadSubscriber() = default;

  // Queues one reload notification without blocking. Returns false when
  // the subscriber can no longer deliver anything. Must not call back into
  // the channel.
  virtual bool notify() = 0;

  // Asks the connection to close (server shutdown).
  virtual void close() {}

  virtual std::string describe() const { return "client"; }
};

// Registry of live-reload subscribers with a broadcast operation.
//
// Structural changes (add/remove) take the lock exclusively. A broadcast
// holds it shared for the whole fan-out, so a subscriber removed before the
// broadcast starts is never notified by it, and one added while it runs
// gets the next one.
class ReloadChannel {
public:
  using Handle = std::uint64_t;

  struct BroadcastResult {
    std::size_t delivered = 0;
    std::size_t failed = 0;
  };

  ReloadChannel() = default;
  ReloadChannel(const ReloadChannel &) = delete;
  ReloadChannel &operator=(const ReloadChannel &) = delete;

  Handle add_client(std::shared_ptr<ReloadSubscriber> client);

  // Unknown or already removed handles are ignored.
  void remove_client(Handle handle);

  // Notifies every registered client once. Clients whose notify() fails
  // are removed afterwards.
  BroadcastResult broadcast_reload();

  // Empties the registry and closes every client that was in it.
  void close_all();

  std::size_t client_count() const;

private:
  bool erase(Handle handle);

  mutable std::shared_mutex mutex_;
  std::unordered_map<Handle, std::shared_ptr<ReloadSubscriber>> clients_;
  Handle next_handle_ = 1;
};

#endif // RELOAD_CHANNEL_HPP
