#pragma once

#include "usage_ledger/event_queue.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

struct inotify_event;

namespace usage_ledger {

struct WatchEvent {
  // Rescan: the files under a source can no longer be tracked one by one
  // (a directory moved or removed, or the kernel dropped events).
  enum class Kind { Changed, Deleted, Rescan, Error };

  Kind kind{Kind::Changed};
  std::string source;
  std::string path;
  std::string message;

  static WatchEvent changed(std::string source, std::string path) {
    return {Kind::Changed, std::move(source), std::move(path), {}};
  }
  static WatchEvent deleted(std::string source, std::string path) {
    return {Kind::Deleted, std::move(source), std::move(path), {}};
  }
  static WatchEvent rescan(std::string source) {
    return {Kind::Rescan, std::move(source), {}, {}};
  }
  static WatchEvent error(std::string message) {
    return {Kind::Error, {}, {}, std::move(message)};
  }
};

// watched directory -> source name
using RouteTable = std::map<std::string, std::string>;

// Source owning path: the longest watched directory containing it, compared
// by whole path components.
std::optional<std::string> route_path(const std::string &path,
                                      const RouteTable &routes);

struct WatcherStats {
  std::size_t watches{0};
  std::uint64_t events{0};
  std::uint64_t dropped{0};
  std::uint64_t errors{0};
  std::uint64_t watch_failures{0};
  std::uint64_t rescans{0};
};

// Recursive inotify watcher. Raw events are routed and pushed onto the
// queue from a monitor thread; failures surface as Error events.
class Watcher {
public:
  Watcher(RouteTable routes, EventQueue<WatchEvent> &out);
  ~Watcher();
  Watcher(const Watcher &) = delete;
  Watcher &operator=(const Watcher &) = delete;

  bool start(std::string *err = nullptr);
  void stop();
  bool running() const { return running_.load(); }
  WatcherStats stats() const;

private:
  void add_tree(const std::string &dir, bool report_files);
  bool add_watch(const std::string &dir);
  void drop_watches_under(const std::string &dir);
  void rescan_sources_under(const std::string &dir);
  void monitor();
  void handle(const ::inotify_event *ev);
  void emit(WatchEvent ev);

  RouteTable routes_;
  EventQueue<WatchEvent> &out_;
  int inotify_fd_{-1};
  std::unordered_map<int, std::string> watches_;
  std::atomic<bool> running_{false};
  std::thread thread_;
  mutable std::mutex stats_mu_;
  WatcherStats stats_;
};

} // namespace usage_ledger
