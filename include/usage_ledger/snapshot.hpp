#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>

namespace usage_ledger {

// Single-slot channel: publish() replaces the value for every reader, there
// is no backlog. Values are immutable once published.
template <typename T> class SnapshotChannel {
public:
  void publish(std::shared_ptr<const T> value) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      value_ = std::move(value);
      ++version_;
    }
    cv_.notify_all();
  }

  std::shared_ptr<const T> latest() const {
    std::lock_guard<std::mutex> lk(mu_);
    return value_;
  }

  std::uint64_t version() const {
    std::lock_guard<std::mutex> lk(mu_);
    return version_;
  }

  // Waits until the version moves past seen or the timeout expires.
  std::uint64_t wait_newer(std::uint64_t seen,
                           std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait_for(lk, timeout, [&] { return version_ != seen; });
    return version_;
  }

private:
  mutable std::mutex mu_;
  mutable std::condition_variable cv_;
  std::shared_ptr<const T> value_;
  std::uint64_t version_{0};
};

// Read-only subscription to a SnapshotChannel.
template <typename T> class SnapshotReader {
public:
  explicit SnapshotReader(const SnapshotChannel<T> &channel)
      : channel_(&channel) {}

  bool has_changed() const { return channel_->version() != seen_; }

  // Returns the latest value and marks it seen.
  std::shared_ptr<const T> borrow() {
    seen_ = channel_->version();
    return channel_->latest();
  }

  bool wait_changed(std::chrono::milliseconds timeout) {
    return channel_->wait_newer(seen_, timeout) != seen_;
  }

private:
  const SnapshotChannel<T> *channel_;
  std::uint64_t seen_{0};
};

} // namespace usage_ledger
