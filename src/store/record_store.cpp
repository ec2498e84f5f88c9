#include "usage_ledger/record_store.hpp"

#include "usage_ledger/types.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <system_error>

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace usage_ledger {
namespace {
#pragma pack(push, 1)
struct RecordHeader {
  std::uint32_t magic;
  std::uint32_t checksum;
  std::uint64_t key_hash;
  std::uint64_t seq;
  std::uint32_t key_len;
  std::uint32_t value_len;
  std::uint8_t tombstone;
  std::uint8_t reserved[7];
};
#pragma pack(pop)

constexpr std::uint32_t kMagic = 0x554c4331; // ULC1

std::uint32_t record_checksum(const std::string &key,
                              const std::vector<std::uint8_t> &value,
                              const RecordHeader &h) {
  std::uint32_t sum = 2166136261u;
  auto mix = [&](std::uint8_t b) {
    sum ^= b;
    sum *= 16777619u;
  };
  auto *p = reinterpret_cast<const std::uint8_t *>(&h);
  for (std::size_t i = 0; i < sizeof(RecordHeader); ++i) {
    if (i >= offsetof(RecordHeader, checksum) &&
        i < offsetof(RecordHeader, checksum) + sizeof(h.checksum))
      continue;
    mix(p[i]);
  }
  for (unsigned char c : key)
    mix(c);
  for (auto b : value)
    mix(b);
  return sum;
}

bool write_all(int fd, const void *data, std::size_t n) {
  auto *p = static_cast<const std::uint8_t *>(data);
  while (n > 0) {
    const ssize_t w = ::write(fd, p, n);
    if (w < 0) {
      if (errno == EINTR)
        continue;
      return false;
    }
    p += w;
    n -= static_cast<std::size_t>(w);
  }
  return true;
}

bool fsync_dir(const std::string &dir) {
  int dfd = open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (dfd < 0)
    return false;
  bool ok = ::fsync(dfd) == 0;
  close(dfd);
  return ok;
}

std::size_t file_size_or_zero(const std::string &path) {
  std::error_code ec;
  auto n = std::filesystem::file_size(path, ec);
  return ec ? 0 : static_cast<std::size_t>(n);
}
} // namespace

const char *fsync_mode_name(FsyncMode m) {
  switch (m) {
  case FsyncMode::Never:
    return "never";
  case FsyncMode::EverySec:
    return "everysec";
  case FsyncMode::Always:
    return "always";
  }
  return "unknown";
}

std::optional<FsyncMode> parse_fsync_mode(const std::string &name) {
  if (name == "never")
    return FsyncMode::Never;
  if (name == "everysec")
    return FsyncMode::EverySec;
  if (name == "always")
    return FsyncMode::Always;
  return std::nullopt;
}

RecordStore::RecordStore(RecordStoreConfig cfg) : cfg_(std::move(cfg)) {}

RecordStore::~RecordStore() { close_active(); }

bool RecordStore::init(std::string *err) {
  std::error_code ec;
  std::filesystem::create_directories(cfg_.dir, ec);
  if (ec) {
    if (err)
      *err = "cannot create " + cfg_.dir + ": " + ec.message();
    return false;
  }
  close_active();
  index_.clear();
  segments_.clear();
  stats_ = {};
  next_seq_ = 1;

  std::vector<std::uint32_t> segs;
  std::uint32_t active = 1;
  std::uint32_t version = 0;
  if (load_manifest(&segs, &active, &version) &&
      version != cfg_.format_version) {
    spdlog::warn("cold store {}: format version {} -> {}, discarding",
                 cfg_.dir, version, cfg_.format_version);
    for (auto s : segs)
      std::filesystem::remove(seg_path(s), ec);
    segs.clear();
    stats_.wiped_on_version_change = true;
  }
  if (segs.empty()) {
    segs = {1};
    active = 1;
  }

  auto start = std::chrono::steady_clock::now();
  for (auto s : segs) {
    if (!scan_segment(s)) {
      if (err)
        *err = "segment scan failed: " + seg_path(s);
      return false;
    }
    segments_.push_back({s, file_size_or_zero(seg_path(s))});
  }
  if (std::none_of(segments_.begin(), segments_.end(),
                   [&](const SegmentMeta &m) { return m.id == active; }))
    active = segments_.back().id;
  recount();
  stats_.index_rebuild_ms = static_cast<std::size_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - start)
          .count());
  if (!open_active(active, err))
    return false;
  if (!write_manifest()) {
    if (err)
      *err = "failed to write manifest";
    return false;
  }
  return true;
}

bool RecordStore::put(const std::string &key,
                      const std::vector<std::uint8_t> &value,
                      std::string *err) {
  if (active_fd_ < 0) {
    if (err)
      *err = "cold store not open";
    return false;
  }
  if (!maybe_rotate(err))
    return false;
  IndexEntry ie;
  if (!append_record(active_fd_, active_segment_, key, value, next_seq_++,
                     false, &ie, err))
    return false;
  auto it = index_.find(key);
  if (it != index_.end() && !it->second.tombstone)
    stats_.live_bytes -= it->second.len;
  index_[key] = ie;
  stats_.live_bytes += ie.len;
  update_fragmentation();
  return true;
}

bool RecordStore::del(const std::string &key, std::string *err) {
  if (active_fd_ < 0) {
    if (err)
      *err = "cold store not open";
    return false;
  }
  auto it = index_.find(key);
  if (it == index_.end() || it->second.tombstone)
    return true;
  IndexEntry ie;
  if (!append_record(active_fd_, active_segment_, key, {}, next_seq_++, true,
                     &ie, err))
    return false;
  stats_.live_bytes -= it->second.len;
  it->second = ie;
  update_fragmentation();
  return true;
}

std::optional<std::vector<std::uint8_t>>
RecordStore::get(const std::string &key) {
  ++stats_.gets;
  auto it = index_.find(key);
  if (it == index_.end() || it->second.tombstone) {
    ++stats_.misses;
    return std::nullopt;
  }
  std::vector<std::uint8_t> out;
  if (!read_entry(it->second, &out)) {
    ++stats_.misses;
    return std::nullopt;
  }
  ++stats_.hits;
  return out;
}

bool RecordStore::contains(const std::string &key) const {
  auto it = index_.find(key);
  return it != index_.end() && !it->second.tombstone;
}

std::size_t RecordStore::size() const {
  return static_cast<std::size_t>(
      std::count_if(index_.begin(), index_.end(),
                    [](const auto &kv) { return !kv.second.tombstone; }));
}

bool RecordStore::sync(std::string *err) {
  if (active_fd_ < 0)
    return true;
  if (cfg_.fsync == FsyncMode::Never)
    return true;
  if (::fsync(active_fd_) != 0) {
    if (err)
      *err = std::string("fsync failed: ") + std::strerror(errno);
    return false;
  }
  return true;
}

bool RecordStore::wipe(std::string *err) {
  close_active();
  std::error_code ec;
  for (const auto &s : segments_)
    std::filesystem::remove(seg_path(s.id), ec);
  std::filesystem::remove(cfg_.dir + "/manifest.txt", ec);
  index_.clear();
  segments_ = {{1, 0}};
  next_seq_ = 1;
  recount();
  if (!open_active(1, err))
    return false;
  if (!write_manifest()) {
    if (err)
      *err = "failed to write manifest";
    return false;
  }
  return true;
}

void RecordStore::maybe_compact() {
  if (active_fd_ < 0 || segments_.size() < 2)
    return;
  recount();
  if (stats_.fragmentation_estimate < cfg_.gc_fragmentation_threshold)
    return;

  auto start = std::chrono::steady_clock::now();
  const std::size_t before = stats_.segment_bytes;
  std::uint32_t compact_id = 0;
  for (const auto &s : segments_)
    compact_id = std::max(compact_id, s.id);
  ++compact_id;
  const std::string compact_path = seg_path(compact_id);
  int fd = open(compact_path.c_str(), O_CREAT | O_RDWR | O_TRUNC | O_APPEND,
                0644);
  if (fd < 0) {
    spdlog::warn("cold store compaction: cannot open {}", compact_path);
    return;
  }

  std::unordered_map<std::string, IndexEntry> next;
  for (const auto &[k, e] : index_) {
    if (e.tombstone)
      continue;
    std::vector<std::uint8_t> val;
    IndexEntry ne;
    if (!read_entry(e, &val) ||
        !append_record(fd, compact_id, k, val, e.seq, false, &ne, nullptr)) {
      close(fd);
      std::error_code ec;
      std::filesystem::remove(compact_path, ec);
      spdlog::warn("cold store compaction aborted at key {}", k);
      return;
    }
    next[k] = ne;
  }
  ::fsync(fd);

  const auto old = segments_;
  close_active();
  active_fd_ = fd;
  active_segment_ = compact_id;
  index_ = std::move(next);
  segments_ = {{compact_id, file_size_or_zero(compact_path)}};
  if (!write_manifest()) {
    spdlog::warn("cold store compaction: manifest write failed");
    return;
  }
  std::error_code ec;
  for (const auto &s : old)
    std::filesystem::remove(seg_path(s.id), ec);
  recount();

  ++stats_.gc_runs;
  if (before > stats_.segment_bytes)
    stats_.gc_bytes_reclaimed += before - stats_.segment_bytes;
  spdlog::debug("cold store compacted {} -> {} bytes in {} ms", before,
                stats_.segment_bytes,
                std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - start)
                    .count());
}

std::string RecordStore::seg_path(std::uint32_t id) const {
  return cfg_.dir + "/segment_" + std::to_string(id) + ".log";
}

bool RecordStore::append_record(int fd, std::uint32_t segment_id,
                                const std::string &key,
                                const std::vector<std::uint8_t> &value,
                                std::uint64_t seq, bool tombstone,
                                IndexEntry *entry, std::string *err) {
  RecordHeader h{};
  h.magic = kMagic;
  h.key_hash = fnv1a(key);
  h.seq = seq;
  h.key_len = static_cast<std::uint32_t>(key.size());
  h.value_len = static_cast<std::uint32_t>(value.size());
  h.tombstone = tombstone ? 1 : 0;
  h.checksum = record_checksum(key, value, h);

  off_t off = lseek(fd, 0, SEEK_END);
  if (off < 0 || !write_all(fd, &h, sizeof(h)) ||
      !write_all(fd, key.data(), key.size()) ||
      (!value.empty() && !write_all(fd, value.data(), value.size()))) {
    if (err)
      *err = std::string("cold store write failed: ") + std::strerror(errno);
    return false;
  }
  if (fd == active_fd_ && !sync_for_policy()) {
    if (err)
      *err = std::string("cold store fsync failed: ") + std::strerror(errno);
    return false;
  }

  const std::size_t need = sizeof(RecordHeader) + key.size() + value.size();
  if (entry) {
    entry->segment_id = segment_id;
    entry->offset = static_cast<std::uint64_t>(off);
    entry->len = h.value_len;
    entry->seq = seq;
    entry->tombstone = tombstone;
  }
  for (auto &s : segments_) {
    if (s.id == segment_id) {
      s.bytes += need;
      stats_.segment_bytes += need;
      break;
    }
  }
  return true;
}

bool RecordStore::open_active(std::uint32_t id, std::string *err) {
  close_active();
  const auto p = seg_path(id);
  active_fd_ = open(p.c_str(), O_CREAT | O_RDWR | O_APPEND, 0644);
  if (active_fd_ < 0) {
    if (err)
      *err = "failed to open active segment " + p;
    return false;
  }
  active_segment_ = id;
  if (std::none_of(segments_.begin(), segments_.end(),
                   [&](const SegmentMeta &m) { return m.id == id; }))
    segments_.push_back({id, file_size_or_zero(p)});
  return true;
}

bool RecordStore::maybe_rotate(std::string *err) {
  std::size_t active_bytes = 0;
  std::uint32_t max_id = 0;
  for (const auto &s : segments_) {
    if (s.id == active_segment_)
      active_bytes = s.bytes;
    max_id = std::max(max_id, s.id);
  }
  if (active_bytes < cfg_.segment_max_bytes)
    return true;
  if (active_fd_ >= 0)
    ::fsync(active_fd_);
  if (!open_active(max_id + 1, err))
    return false;
  if (!write_manifest()) {
    if (err)
      *err = "failed to write manifest";
    return false;
  }
  return true;
}

bool RecordStore::sync_for_policy() {
  if (cfg_.fsync == FsyncMode::Never)
    return true;
  if (cfg_.fsync == FsyncMode::Always)
    return ::fsync(active_fd_) == 0;
  const auto now_s = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::seconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
  if (now_s != last_fsync_epoch_s_) {
    last_fsync_epoch_s_ = now_s;
    return ::fsync(active_fd_) == 0;
  }
  return true;
}

bool RecordStore::load_manifest(std::vector<std::uint32_t> *segments,
                                std::uint32_t *active,
                                std::uint32_t *version) {
  std::ifstream in(cfg_.dir + "/manifest.txt");
  if (!in.is_open())
    return false;
  std::string line;
  try {
    while (std::getline(in, line)) {
      if (line.rfind("version=", 0) == 0)
        *version = static_cast<std::uint32_t>(std::stoul(line.substr(8)));
      if (line.rfind("active=", 0) == 0)
        *active = static_cast<std::uint32_t>(std::stoul(line.substr(7)));
      if (line.rfind("segment=", 0) == 0)
        segments->push_back(
            static_cast<std::uint32_t>(std::stoul(line.substr(8))));
    }
  } catch (const std::exception &e) {
    spdlog::warn("cold store manifest unreadable ({}), starting empty",
                 e.what());
    segments->clear();
    *version = 0;
    return true;
  }
  if (segments->empty())
    segments->push_back(*active);
  return true;
}

bool RecordStore::write_manifest() {
  const std::string tmp = cfg_.dir + "/manifest.tmp";
  const std::string final = cfg_.dir + "/manifest.txt";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out.is_open())
      return false;
    out << "version=" << cfg_.format_version << "\n";
    out << "active=" << active_segment_ << "\n";
    for (const auto &s : segments_)
      out << "segment=" << s.id << "\n";
    out.flush();
    if (!out)
      return false;
  }
  int fd = open(tmp.c_str(), O_RDONLY);
  if (fd < 0)
    return false;
  bool ok = ::fsync(fd) == 0;
  close(fd);
  if (!ok)
    return false;
  if (rename(tmp.c_str(), final.c_str()) != 0)
    return false;
  return fsync_dir(cfg_.dir);
}

bool RecordStore::scan_segment(std::uint32_t id) {
  const std::string path = seg_path(id);
  int fd = open(path.c_str(), O_CREAT | O_RDWR, 0644);
  if (fd < 0)
    return false;
  off_t off = 0;
  auto repair = [&] {
    if (ftruncate(fd, off) == 0)
      ++stats_.tail_repairs;
    else
      spdlog::warn("cold store: cannot truncate torn tail of {}", path);
  };
  while (true) {
    RecordHeader h{};
    ssize_t r = pread(fd, &h, sizeof(h), off);
    if (r == 0)
      break;
    if (r != static_cast<ssize_t>(sizeof(h)) || h.magic != kMagic) {
      repair();
      break;
    }
    std::string key(h.key_len, '\0');
    std::vector<std::uint8_t> value(h.value_len);
    if (pread(fd, key.data(), h.key_len, off + static_cast<off_t>(sizeof(h))) !=
        static_cast<ssize_t>(h.key_len)) {
      repair();
      break;
    }
    if (h.value_len > 0 &&
        pread(fd, value.data(), h.value_len,
              off + static_cast<off_t>(sizeof(h) + h.key_len)) !=
            static_cast<ssize_t>(h.value_len)) {
      repair();
      break;
    }
    if (record_checksum(key, value, h) != h.checksum) {
      repair();
      break;
    }
    IndexEntry e;
    e.segment_id = id;
    e.offset = static_cast<std::uint64_t>(off);
    e.len = h.value_len;
    e.seq = h.seq;
    e.tombstone = h.tombstone != 0;
    auto it = index_.find(key);
    if (it == index_.end() || it->second.seq <= e.seq)
      index_[key] = e;
    next_seq_ = std::max(next_seq_, e.seq + 1);
    off += static_cast<off_t>(sizeof(h) + h.key_len + h.value_len);
  }
  close(fd);
  return true;
}

bool RecordStore::read_entry(const IndexEntry &e,
                             std::vector<std::uint8_t> *value_out) {
  const std::string path = seg_path(e.segment_id);
  int fd = open(path.c_str(), O_RDONLY);
  if (fd < 0)
    return false;
  RecordHeader h{};
  if (pread(fd, &h, sizeof(h), static_cast<off_t>(e.offset)) !=
          static_cast<ssize_t>(sizeof(h)) ||
      h.magic != kMagic) {
    close(fd);
    return false;
  }
  std::string key(h.key_len, '\0');
  if (pread(fd, key.data(), h.key_len,
            static_cast<off_t>(e.offset + sizeof(h))) !=
      static_cast<ssize_t>(h.key_len)) {
    close(fd);
    return false;
  }
  value_out->assign(h.value_len, 0);
  if (h.value_len > 0 &&
      pread(fd, value_out->data(), h.value_len,
            static_cast<off_t>(e.offset + sizeof(h) + h.key_len)) !=
          static_cast<ssize_t>(h.value_len)) {
    close(fd);
    return false;
  }
  close(fd);
  return record_checksum(key, *value_out, h) == h.checksum;
}

void RecordStore::recount() {
  stats_.live_bytes = 0;
  for (const auto &[_, e] : index_)
    if (!e.tombstone)
      stats_.live_bytes += e.len;
  stats_.segment_bytes = 0;
  for (const auto &s : segments_)
    stats_.segment_bytes += s.bytes;
  update_fragmentation();
}

void RecordStore::update_fragmentation() {
  stats_.fragmentation_estimate =
      stats_.segment_bytes == 0
          ? 0.0
          : 1.0 - static_cast<double>(stats_.live_bytes) /
                      static_cast<double>(stats_.segment_bytes);
}

void RecordStore::close_active() {
  if (active_fd_ >= 0) {
    close(active_fd_);
    active_fd_ = -1;
  }
}

} // namespace usage_ledger
