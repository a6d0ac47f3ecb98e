#include "reload_channel.hpp"
#include "utils/console.hpp"
#include <mutex>
#include <vector>

namespace {

std::string plural_clients(std::size_t count) {
  return std::to_string(count) + (count == 1 ? " client" : " clients");
}

} // namespace

ReloadChannel::Handle
ReloadChannel::add_client(std::shared_ptr<ReloadSubscriber> client) {
  std::string name = client->describe();
  Handle handle;
  std::size_t total;
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    handle = next_handle_++;
    clients_.emplace(handle, std::move(client));
    total = clients_.size();
  }

  console::event("🔌 WebSocket", name + " registered (total: " +
                                     std::to_string(total) + ")");
  return handle;
}

bool ReloadChannel::erase(Handle handle) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  return clients_.erase(handle) > 0;
}

void ReloadChannel::remove_client(Handle handle) {
  if (!erase(handle)) {
    return;
  }

  console::event("🔌 WebSocket",
                 "client disconnected (total: " +
                     std::to_string(client_count()) + ")");
}

ReloadChannel::BroadcastResult ReloadChannel::broadcast_reload() {
  BroadcastResult result;
  std::vector<Handle> dead;

  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto &[handle, client] : clients_) {
      if (client->notify()) {
        result.delivered++;
      } else {
        result.failed++;
        dead.push_back(handle);
      }
    }
  }

  for (Handle handle : dead) {
    erase(handle);
  }

  if (result.delivered == 0 && result.failed == 0) {
    console::event("📡 Broadcast", "reload, no clients connected");
    return result;
  }

  std::string message = "reload to " + plural_clients(result.delivered);
  if (result.failed > 0) {
    message += " (" + std::to_string(result.failed) + " failed, dropped)";
  }
  console::event("📡 Broadcast", message);
  return result;
}

void ReloadChannel::close_all() {
  std::unordered_map<Handle, std::shared_ptr<ReloadSubscriber>> closing;
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    closing.swap(clients_);
  }

  if (!closing.empty()) {
    console::info("Closing " + plural_clients(closing.size()));
  }

  for (auto &[handle, client] : closing) {
    client->close();
  }
}

std::size_t ReloadChannel::client_count() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return clients_.size();
}
