#pragma once

#include "usage_ledger/contribution.hpp"
#include "usage_ledger/model_interner.hpp"
#include "usage_ledger/record_store.hpp"
#include "usage_ledger/types.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace usage_ledger {

struct CacheConfig {
  std::string dir{"./ledger_cache"};
  FsyncMode fsync{FsyncMode::EverySec};
  std::size_t segment_max_bytes{64 * 1024 * 1024};
  double gc_fragmentation_threshold{0.5};
};

// Hot part (identity, contribution, scalar, record count) is always
// resident; records are the cold part and are only filled on request.
struct CacheEntry {
  FileIdentity identity;
  Contribution contribution;
  std::optional<std::string> cached_scalar;
  std::uint32_t record_count{0};
  std::vector<Message> records;
};

enum class LoadMode { Hot, Full };

enum class LoadOutcome { ColdStart, Loaded, Recovered, Unavailable };

const char *load_outcome_name(LoadOutcome o);

struct CacheStats {
  std::size_t entries{0};
  std::map<std::string, std::size_t> by_source;
  std::uint64_t hot_bytes{0};
  std::uint64_t cold_bytes{0};
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t persists{0};
  std::uint64_t persist_failures{0};
  std::size_t dirty_entries{0};
};

using CacheItem = std::pair<CacheKey, CacheEntry>;

// Durable map from (source, path) to CacheEntry. Reads share the lock;
// insert, remove and persist take it exclusively.
class CacheRepository {
public:
  static constexpr std::uint32_t kFormatVersion = 1;

  CacheRepository(CacheConfig cfg, ModelInterner &interner);
  CacheRepository(const CacheRepository &) = delete;
  CacheRepository &operator=(const CacheRepository &) = delete;

  // Never fails: unreadable or outdated state is discarded and the
  // repository starts empty.
  LoadOutcome load();

  std::optional<CacheEntry> get(const CacheKey &key,
                                const FileIdentity &current,
                                LoadMode mode = LoadMode::Hot);
  std::optional<CacheEntry> get_unchecked(const CacheKey &key,
                                          LoadMode mode = LoadMode::Hot);
  bool is_stale(const CacheKey &key, const FileIdentity &current) const;
  bool contains(const CacheKey &key) const;

  void insert(const CacheKey &key, CacheEntry entry);
  std::optional<CacheEntry> remove(const CacheKey &key);
  // Removes every entry of source whose path is not in current_paths and
  // returns the removed entries so callers can cancel their contributions.
  std::vector<CacheItem>
  prune_deleted(const std::string &source,
                const std::unordered_set<std::string> &current_paths);
  std::size_t invalidate_source(const std::string &source);
  void clear();

  std::vector<CacheItem> entries_for(const std::string &source) const;
  std::optional<std::vector<Message>> load_records(const CacheKey &key,
                                                   std::string *err = nullptr);

  // Fails soft: logs and returns false, the in-memory state stays valid and
  // dirty so a later call can retry.
  bool persist(std::string *err = nullptr);

  CacheStats stats() const;
  std::string info() const;
  std::size_t size() const;
  const std::string &hot_path() const { return hot_path_; }

private:
  struct HotEntry {
    FileIdentity identity;
    Contribution contribution;
    std::optional<std::string> cached_scalar;
    std::uint32_t record_count{0};
  };

  CacheEntry to_entry(const HotEntry &h) const;
  bool read_archive(std::string *err);
  bool write_archive(std::string *err);
  std::optional<std::vector<Message>> read_cold(const CacheKey &key,
                                                std::string *err);

  CacheConfig cfg_;
  ModelInterner &interner_;
  std::string hot_path_;

  mutable std::shared_mutex mu_;
  std::unordered_map<CacheKey, HotEntry, CacheKeyHash> index_;
  std::unordered_map<CacheKey, std::vector<Message>, CacheKeyHash> dirty_;
  std::unordered_set<CacheKey, CacheKeyHash> removed_;
  bool hot_dirty_{false};
  bool cold_available_{false};

  // RecordStore is single-threaded; readers holding the shared lock still
  // serialise on this.
  mutable std::mutex cold_mu_;
  RecordStore cold_;

  std::atomic<std::uint64_t> hits_{0};
  std::atomic<std::uint64_t> misses_{0};
  std::uint64_t persists_{0};
  std::uint64_t persist_failures_{0};
  std::uint64_t hot_bytes_{0};
};

// Opens a CacheRepository on first use. Concurrent first callers block on
// the exclusive lock and exactly one of them runs load().
class LazyRepository {
public:
  LazyRepository(CacheConfig cfg, ModelInterner &interner);

  CacheRepository &get();
  bool initialized() const;
  std::optional<LoadOutcome> outcome() const;
  std::uint32_t init_count() const;

private:
  CacheConfig cfg_;
  ModelInterner &interner_;
  mutable std::shared_mutex mu_;
  std::unique_ptr<CacheRepository> repo_;
  std::optional<LoadOutcome> outcome_;
  std::uint32_t init_count_{0};
};

} // namespace usage_ledger
