#pragma once

#include "usage_ledger/aggregate.hpp"
#include "usage_ledger/cache_repository.hpp"
#include "usage_ledger/event_queue.hpp"
#include "usage_ledger/log.hpp"
#include "usage_ledger/model_interner.hpp"
#include "usage_ledger/snapshot.hpp"
#include "usage_ledger/source.hpp"
#include "usage_ledger/thread_pool.hpp"
#include "usage_ledger/watcher.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace usage_ledger {

enum class SourcePhase { Uninitialized, Loaded, Updating };

const char *source_phase_name(SourcePhase p);

struct SourceSnapshot {
  std::string name;
  SourcePhase phase{SourcePhase::Uninitialized};
  std::size_t files{0};
  std::shared_ptr<const AggregateView> view;
};

struct LedgerSnapshot {
  std::uint64_t version{0};
  std::vector<SourceSnapshot> sources;

  const SourceSnapshot *find(const std::string &name) const;
};

struct CoordinatorConfig {
  CacheConfig cache;
  std::size_t worker_threads{4};
};

struct CoordinatorStats {
  std::uint64_t files_loaded{0};
  std::uint64_t cache_hits_at_start{0};
  std::uint64_t events{0};
  std::uint64_t reparses{0};
  std::uint64_t unchanged_skips{0};
  std::uint64_t parse_failures{0};
  std::uint64_t deletions{0};
  std::uint64_t rescans{0};
  std::uint64_t publishes{0};
  // Distinct parse warnings still remembered.
  std::size_t parse_warnings{0};
};

// Owns one cache and one running aggregate per source. Events for one
// source are applied under that source's mutex; readers only ever see
// published immutable views.
class RealtimeCoordinator {
public:
  using PublishHook = std::function<void()>;

  RealtimeCoordinator(CoordinatorConfig cfg,
                      std::vector<std::shared_ptr<ISource>> sources,
                      ModelInterner &interner);
  ~RealtimeCoordinator();
  RealtimeCoordinator(const RealtimeCoordinator &) = delete;
  RealtimeCoordinator &operator=(const RealtimeCoordinator &) = delete;

  // Bulk load of every source, then the initial publish.
  void start();

  void handle_event(const WatchEvent &ev);
  // Processes queue events on a background thread until stop().
  void run(EventQueue<WatchEvent> &queue);
  void stop();

  // Rediscovers files: vanished ones are pruned, new or stale ones
  // reprocessed. Also the answer to a watcher Rescan.
  bool reconcile(const std::string &source);
  // Refolds the aggregate from the cache from scratch.
  bool rebuild(const std::string &source);
  bool persist();

  RouteTable routes() const;
  SnapshotReader<LedgerSnapshot> subscribe() const {
    return SnapshotReader<LedgerSnapshot>(channel_);
  }
  std::shared_ptr<const LedgerSnapshot> latest() const {
    return channel_.latest();
  }
  void set_publish_hook(PublishHook hook);

  std::optional<std::vector<Message>> load_records(const std::string &source,
                                                   const std::string &path,
                                                   std::string *err = nullptr);
  std::vector<Message> full_corpus();

  std::optional<SourcePhase> phase(const std::string &source) const;
  CoordinatorStats stats() const;

private:
  struct SourceState {
    SourceState(std::shared_ptr<ISource> s, CacheConfig cache,
                ModelInterner &interner)
        : source(std::move(s)), repo(std::move(cache), interner) {}

    std::shared_ptr<ISource> source;
    LazyRepository repo;
    std::mutex mu;
    AggregateView view;
    std::atomic<SourcePhase> phase{SourcePhase::Uninitialized};
  };

  struct FileResult {
    std::string path;
    std::optional<Contribution> contribution;
    bool from_cache{false};
  };

  SourceState *find(const std::string &name) const;
  void load_source(SourceState &st, ThreadPool &pool);
  FileResult load_file(SourceState &st, const std::string &path);
  std::optional<CacheEntry> parse_entry(SourceState &st,
                                        const std::string &path,
                                        const FileIdentity &identity);
  bool process_changed(SourceState &st, const std::string &path);
  bool process_deleted(SourceState &st, const std::string &path);
  void forget_vanished(SourceState &st,
                       const std::unordered_set<std::string> &current);
  void publish(SourceState &st);

  CoordinatorConfig cfg_;
  ModelInterner &interner_;
  std::vector<std::unique_ptr<SourceState>> states_;

  SnapshotChannel<LedgerSnapshot> channel_;
  std::mutex publish_mu_;
  std::vector<SourceSnapshot> current_;
  std::uint64_t publish_version_{0};
  PublishHook hook_;

  // Keyed by path; forgotten when the file parses again or goes away.
  LogOnce parse_log_;
  std::atomic<bool> running_{false};
  std::thread run_thread_;

  mutable std::mutex stats_mu_;
  CoordinatorStats stats_;
};

} // namespace usage_ledger
