#include "usage_ledger/watcher.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <set>
#include <system_error>

#include <spdlog/spdlog.h>

#include <sys/inotify.h>
#include <sys/select.h>
#include <unistd.h>

namespace usage_ledger {
namespace {
constexpr std::uint32_t kWatchMask = IN_CREATE | IN_MODIFY | IN_CLOSE_WRITE |
                                     IN_MOVED_TO | IN_MOVED_FROM | IN_DELETE |
                                     IN_DELETE_SELF | IN_MOVE_SELF;

bool under(const std::string &path, const std::string &dir) {
  if (path.size() < dir.size() || path.compare(0, dir.size(), dir) != 0)
    return false;
  return path.size() == dir.size() || dir.back() == '/' ||
         path[dir.size()] == '/';
}
} // namespace

std::optional<std::string> route_path(const std::string &path,
                                      const RouteTable &routes) {
  const std::string *best = nullptr;
  std::size_t best_len = 0;
  for (const auto &[dir, source] : routes) {
    if (dir.size() >= best_len && under(path, dir)) {
      best = &source;
      best_len = dir.size();
    }
  }
  if (best == nullptr)
    return std::nullopt;
  return *best;
}

Watcher::Watcher(RouteTable routes, EventQueue<WatchEvent> &out)
    : routes_(std::move(routes)), out_(out) {}

Watcher::~Watcher() { stop(); }

bool Watcher::start(std::string *err) {
  if (running_)
    return true;
  inotify_fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
  if (inotify_fd_ < 0) {
    if (err)
      *err = std::string("inotify_init1: ") + std::strerror(errno);
    return false;
  }
  for (const auto &[dir, source] : routes_)
    add_tree(dir, false);
  running_ = true;
  thread_ = std::thread([this] { monitor(); });
  spdlog::info("watcher started with {} watches", stats().watches);
  return true;
}

void Watcher::stop() {
  if (!running_.exchange(false)) {
    if (thread_.joinable())
      thread_.join();
    return;
  }
  if (thread_.joinable())
    thread_.join();
  for (const auto &[wd, _] : watches_)
    inotify_rm_watch(inotify_fd_, wd);
  watches_.clear();
  if (inotify_fd_ >= 0) {
    close(inotify_fd_);
    inotify_fd_ = -1;
  }
}

WatcherStats Watcher::stats() const {
  std::lock_guard<std::mutex> lk(stats_mu_);
  return stats_;
}

bool Watcher::add_watch(const std::string &dir) {
  int wd = inotify_add_watch(inotify_fd_, dir.c_str(), kWatchMask);
  if (wd < 0) {
    spdlog::warn("cannot watch {}: {}", dir, std::strerror(errno));
    std::lock_guard<std::mutex> lk(stats_mu_);
    ++stats_.watch_failures;
    return false;
  }
  watches_[wd] = dir;
  std::lock_guard<std::mutex> lk(stats_mu_);
  stats_.watches = watches_.size();
  return true;
}

void Watcher::drop_watches_under(const std::string &dir) {
  for (auto it = watches_.begin(); it != watches_.end();) {
    if (under(it->second, dir)) {
      // The kernel may already have released it; the IN_IGNORED that
      // follows finds no entry.
      inotify_rm_watch(inotify_fd_, it->first);
      it = watches_.erase(it);
    } else {
      ++it;
    }
  }
  std::lock_guard<std::mutex> lk(stats_mu_);
  stats_.watches = watches_.size();
}

// Every source owning files below dir: the one routing dir itself and any
// nested root inside it.
void Watcher::rescan_sources_under(const std::string &dir) {
  std::set<std::string> sources;
  if (auto owner = route_path(dir, routes_))
    sources.insert(*owner);
  for (const auto &[root, source] : routes_)
    if (under(root, dir))
      sources.insert(source);
  for (const auto &source : sources) {
    {
      std::lock_guard<std::mutex> lk(stats_mu_);
      ++stats_.rescans;
    }
    emit(WatchEvent::rescan(source));
  }
}

void Watcher::add_tree(const std::string &dir, bool report_files) {
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    spdlog::warn("watch root {} is not a readable directory", dir);
    std::lock_guard<std::mutex> lk(stats_mu_);
    ++stats_.watch_failures;
    return;
  }
  if (!add_watch(dir))
    return;
  std::filesystem::recursive_directory_iterator it(
      dir, std::filesystem::directory_options::skip_permission_denied, ec);
  for (; !ec && it != std::filesystem::recursive_directory_iterator();
       it.increment(ec)) {
    const auto path = it->path().string();
    if (it->is_directory(ec)) {
      if (!add_watch(path))
        it.disable_recursion_pending();
    } else if (report_files && it->is_regular_file(ec)) {
      if (auto source = route_path(path, routes_))
        emit(WatchEvent::changed(*source, path));
    }
  }
  if (ec)
    spdlog::warn("watch scan of {} stopped early: {}", dir, ec.message());
}

void Watcher::emit(WatchEvent ev) {
  const bool ok = out_.push(std::move(ev));
  std::lock_guard<std::mutex> lk(stats_mu_);
  if (ok)
    ++stats_.events;
  else
    ++stats_.dropped;
}

void Watcher::handle(const ::inotify_event *ev) {
  if (ev->mask & IN_Q_OVERFLOW) {
    {
      std::lock_guard<std::mutex> lk(stats_mu_);
      ++stats_.errors;
    }
    emit(WatchEvent::error("inotify queue overflow, events were lost"));
    std::set<std::string> sources;
    for (const auto &[root, source] : routes_)
      sources.insert(source);
    for (const auto &source : sources) {
      {
        std::lock_guard<std::mutex> lk(stats_mu_);
        ++stats_.rescans;
      }
      emit(WatchEvent::rescan(source));
    }
    return;
  }
  auto it = watches_.find(ev->wd);
  if (it == watches_.end())
    return;
  if (ev->mask & IN_IGNORED) {
    watches_.erase(it);
    std::lock_guard<std::mutex> lk(stats_mu_);
    stats_.watches = watches_.size();
    return;
  }
  if (ev->mask & (IN_DELETE_SELF | IN_MOVE_SELF)) {
    // Still mapped only when the parent is not watched, i.e. a root went
    // away. Its old path no longer names it.
    const std::string dir = it->second;
    drop_watches_under(dir);
    rescan_sources_under(dir);
    return;
  }
  if (ev->len == 0)
    return;

  const std::string path = it->second + "/" + ev->name;
  if (ev->mask & IN_ISDIR) {
    if (ev->mask & (IN_DELETE | IN_MOVED_FROM)) {
      // Watches follow the inode, so a renamed directory would keep
      // reporting under its old path. A move back in re-adds it.
      drop_watches_under(path);
      rescan_sources_under(path);
    } else if (ev->mask & (IN_CREATE | IN_MOVED_TO)) {
      add_tree(path, true);
    }
    return;
  }
  auto source = route_path(path, routes_);
  if (!source)
    return;
  if (ev->mask & (IN_DELETE | IN_MOVED_FROM))
    emit(WatchEvent::deleted(*source, path));
  else if (ev->mask & (IN_CREATE | IN_MODIFY | IN_CLOSE_WRITE | IN_MOVED_TO))
    emit(WatchEvent::changed(*source, path));
}

void Watcher::monitor() {
  alignas(::inotify_event) char buffer[16 * 1024];

  while (running_) {
    fd_set fds;
    FD_ZERO(&fds);
    FD_SET(inotify_fd_, &fds);

    struct timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = 100000;

    int ret = select(inotify_fd_ + 1, &fds, nullptr, nullptr, &tv);
    if (ret < 0) {
      if (errno != EINTR) {
        {
          std::lock_guard<std::mutex> lk(stats_mu_);
          ++stats_.errors;
        }
        emit(WatchEvent::error(std::string("select: ") + std::strerror(errno)));
      }
      continue;
    }
    if (ret == 0)
      continue;

    ssize_t length = read(inotify_fd_, buffer, sizeof(buffer));
    if (length < 0) {
      if (errno != EAGAIN && errno != EINTR) {
        {
          std::lock_guard<std::mutex> lk(stats_mu_);
          ++stats_.errors;
        }
        emit(WatchEvent::error(std::string("read: ") + std::strerror(errno)));
      }
      continue;
    }

    ssize_t i = 0;
    while (i < length) {
      auto *event = reinterpret_cast<const ::inotify_event *>(&buffer[i]);
      handle(event);
      i += static_cast<ssize_t>(sizeof(::inotify_event) + event->len);
    }
  }
}

} // namespace usage_ledger
