#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace usage_ledger {

enum class FsyncMode { Never, EverySec, Always };

const char *fsync_mode_name(FsyncMode m);
std::optional<FsyncMode> parse_fsync_mode(const std::string &name);

struct RecordStoreConfig {
  std::string dir{"./ledger_cache/cold"};
  std::uint32_t format_version{1};
  std::size_t segment_max_bytes{64 * 1024 * 1024};
  double gc_fragmentation_threshold{0.5};
  FsyncMode fsync{FsyncMode::EverySec};
};

struct RecordStoreStats {
  std::size_t live_bytes{0};
  std::size_t segment_bytes{0};
  std::uint64_t gets{0};
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t gc_runs{0};
  std::uint64_t gc_bytes_reclaimed{0};
  std::uint64_t tail_repairs{0};
  double fragmentation_estimate{0.0};
  std::size_t index_rebuild_ms{0};
  bool wiped_on_version_change{false};
};

// Append-only segment log of cold payloads keyed by string. Each record
// carries a checksummed header; a torn tail is truncated on open. The store
// is not internally synchronised.
class RecordStore {
public:
  explicit RecordStore(RecordStoreConfig cfg);
  ~RecordStore();
  RecordStore(const RecordStore &) = delete;
  RecordStore &operator=(const RecordStore &) = delete;

  bool init(std::string *err = nullptr);
  bool put(const std::string &key, const std::vector<std::uint8_t> &value,
           std::string *err = nullptr);
  bool del(const std::string &key, std::string *err = nullptr);
  std::optional<std::vector<std::uint8_t>> get(const std::string &key);
  bool contains(const std::string &key) const;
  bool sync(std::string *err = nullptr);
  // Removes every segment and starts over with an empty log.
  bool wipe(std::string *err = nullptr);
  void maybe_compact();

  const RecordStoreStats &stats() const { return stats_; }
  std::size_t size() const;
  bool is_open() const { return active_fd_ >= 0; }

private:
  struct IndexEntry {
    std::uint32_t segment_id{0};
    std::uint64_t offset{0};
    std::uint32_t len{0};
    std::uint64_t seq{0};
    bool tombstone{false};
  };

  struct SegmentMeta {
    std::uint32_t id{0};
    std::size_t bytes{0};
  };

  std::string seg_path(std::uint32_t id) const;
  bool append_record(int fd, std::uint32_t segment_id, const std::string &key,
                     const std::vector<std::uint8_t> &value, std::uint64_t seq,
                     bool tombstone, IndexEntry *entry, std::string *err);
  bool open_active(std::uint32_t id, std::string *err);
  bool maybe_rotate(std::string *err);
  bool sync_for_policy();
  bool load_manifest(std::vector<std::uint32_t> *segments,
                     std::uint32_t *active, std::uint32_t *version);
  bool write_manifest();
  bool scan_segment(std::uint32_t id);
  bool read_entry(const IndexEntry &e, std::vector<std::uint8_t> *value_out);
  void recount();
  void update_fragmentation();
  void close_active();

  RecordStoreConfig cfg_;
  RecordStoreStats stats_;
  std::unordered_map<std::string, IndexEntry> index_;
  std::vector<SegmentMeta> segments_;
  std::uint32_t active_segment_{1};
  int active_fd_{-1};
  std::uint64_t next_seq_{1};
  std::uint64_t last_fsync_epoch_s_{0};
};

} // namespace usage_ledger
