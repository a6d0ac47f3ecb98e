#include "file_watcher_listener.hpp"
#include "console.hpp"
#include "server/change_trigger.hpp"
#include <boost/asio/post.hpp>

namespace fs = std::filesystem;

namespace {

bool ends_with(const std::string &str, const std::string &suffix) {
  if (suffix.size() > str.size())
    return false;
  return str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

const char *action_name(efsw::Action action) {
  switch (action) {
  case efsw::Actions::Add:
    return "➕ Added";
  case efsw::Actions::Delete:
    return "➖ Deleted";
  case efsw::Actions::Moved:
    return "🔀 Moved";
  case efsw::Actions::Modified:
  default:
    return "📝 Modified";
  }
}

} // namespace

DevServerListener::DevServerListener(const fs::path &root, ChangeTrigger *t,
                                     boost::asio::io_context &ioc,
                                     std::chrono::milliseconds quiet)
    : watch_root(root), trigger(t), strand(boost::asio::make_strand(ioc)),
      timer(strand), quiet_period(quiet) {}

bool DevServerListener::is_relevant(const std::string &filename) {
  if (filename.empty() || filename[0] == '.' || filename[0] == '~') {
    return false;
  }

  // vim writes this scratch file to test directory permissions
  if (filename == "4913") {
    return false;
  }

  return !(ends_with(filename, "~") || ends_with(filename, ".swp") ||
           ends_with(filename, ".swx") || ends_with(filename, ".tmp"));
}

void DevServerListener::handleFileAction(efsw::WatchID watchid,
                                         const std::string &dir,
                                         const std::string &filename,
                                         efsw::Action action,
                                         std::string oldFilename) {
  (void)watchid;
  (void)oldFilename;

  if (!is_relevant(fs::path(filename).filename().string())) {
    return;
  }

  fs::path changed = fs::path(dir) / filename;
  std::error_code ec;
  fs::path relative = fs::relative(changed, watch_root, ec);
  std::string shown = ec ? changed.string() : relative.string();

  console::event("👁  Watch", std::string(action_name(action)) + " " + shown);
  schedule(shown);
}

void DevServerListener::schedule(const std::string &relative) {
  boost::asio::post(strand, [this, relative]() {
    pending_changes++;
    console::debug("change queued: " + relative);

    // Restarting the timer cancels the previous wait.
    timer.expires_after(quiet_period);
    timer.async_wait([this](const boost::system::error_code &ec) {
      if (ec == boost::asio::error::operation_aborted) {
        return;
      }
      std::size_t changes = pending_changes;
      pending_changes = 0;
      trigger->fire("watcher (" + std::to_string(changes) +
                    (changes == 1 ? " change)" : " changes)"));
    });
  });
}
