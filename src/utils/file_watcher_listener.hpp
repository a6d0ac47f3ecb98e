#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <efsw/efsw.hpp>
#include <filesystem>
#include <string>

class ChangeTrigger;

// Turns filesystem events under the served root into trigger calls. Bursts
// of events (an editor writing a temp file and renaming it) are coalesced:
// the trigger fires once the tree has been quiet for the given delay.
class DevServerListener : public efsw::FileWatchListener {
private:
  std::filesystem::path watch_root;
  ChangeTrigger *trigger;
  boost::asio::strand<boost::asio::io_context::executor_type> strand;
  boost::asio::steady_timer timer;
  std::chrono::milliseconds quiet_period;
  std::size_t pending_changes = 0;

  void schedule(const std::string &relative);

public:
  DevServerListener(const std::filesystem::path &root, ChangeTrigger *t,
                    boost::asio::io_context &ioc,
                    std::chrono::milliseconds quiet = std::chrono::milliseconds(100));

  void handleFileAction(efsw::WatchID watchid, const std::string &dir,
                        const std::string &filename, efsw::Action action,
                        std::string oldFilename = "") override;

  // Hidden files, editor swap and backup files never cause a reload.
  static bool is_relevant(const std::string &filename);
};
