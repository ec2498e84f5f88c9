#include "usage_ledger/cache_repository.hpp"

#include "usage_ledger/codec.hpp"

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <system_error>

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace usage_ledger {
namespace {
#pragma pack(push, 1)
struct ArchiveHeader {
  std::uint32_t magic;
  std::uint32_t version;
  std::uint64_t entry_count;
  std::uint64_t payload_len;
  std::uint32_t checksum;
  std::uint32_t reserved;
};
#pragma pack(pop)

constexpr std::uint32_t kArchiveMagic = 0x554c4831; // ULH1

bool fsync_dir(const std::string &dir) {
  int dfd = open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (dfd < 0)
    return false;
  bool ok = ::fsync(dfd) == 0;
  close(dfd);
  return ok;
}

bool write_file_atomic(const std::string &path,
                       const std::vector<std::uint8_t> &bytes,
                       std::string *err) {
  const std::string tmp = path + ".tmp";
  int fd = open(tmp.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
  if (fd < 0) {
    if (err)
      *err = "open " + tmp + ": " + std::strerror(errno);
    return false;
  }
  const std::uint8_t *p = bytes.data();
  std::size_t left = bytes.size();
  while (left > 0) {
    ssize_t w = ::write(fd, p, left);
    if (w < 0) {
      if (errno == EINTR)
        continue;
      if (err)
        *err = "write " + tmp + ": " + std::strerror(errno);
      close(fd);
      return false;
    }
    p += w;
    left -= static_cast<std::size_t>(w);
  }
  if (::fsync(fd) != 0) {
    if (err)
      *err = "fsync " + tmp + ": " + std::strerror(errno);
    close(fd);
    return false;
  }
  close(fd);
  if (rename(tmp.c_str(), path.c_str()) != 0) {
    if (err)
      *err = "rename " + tmp + ": " + std::strerror(errno);
    return false;
  }
  const auto dir = std::filesystem::path(path).parent_path().string();
  return fsync_dir(dir.empty() ? "." : dir);
}

// Read-only mapping of a whole file.
class MappedFile {
public:
  ~MappedFile() {
    if (data_ != nullptr)
      munmap(data_, size_);
  }

  bool open(const std::string &path, std::string *err) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
      if (err)
        *err = "open " + path + ": " + std::strerror(errno);
      return false;
    }
    struct stat st {};
    if (fstat(fd, &st) != 0) {
      if (err)
        *err = "stat " + path + ": " + std::strerror(errno);
      close(fd);
      return false;
    }
    size_ = static_cast<std::size_t>(st.st_size);
    if (size_ == 0) {
      close(fd);
      return true;
    }
    void *p = mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd, 0);
    close(fd);
    if (p == MAP_FAILED) {
      if (err)
        *err = "mmap " + path + ": " + std::strerror(errno);
      size_ = 0;
      return false;
    }
    data_ = p;
    return true;
  }

  const std::uint8_t *data() const {
    return static_cast<const std::uint8_t *>(data_);
  }
  std::size_t size() const { return size_; }

private:
  void *data_{nullptr};
  std::size_t size_{0};
};
} // namespace

const char *load_outcome_name(LoadOutcome o) {
  switch (o) {
  case LoadOutcome::ColdStart:
    return "cold_start";
  case LoadOutcome::Loaded:
    return "loaded";
  case LoadOutcome::Recovered:
    return "recovered";
  case LoadOutcome::Unavailable:
    return "unavailable";
  }
  return "unknown";
}

CacheRepository::CacheRepository(CacheConfig cfg, ModelInterner &interner)
    : cfg_(std::move(cfg)), interner_(interner),
      hot_path_(cfg_.dir + "/hot.ledger"),
      cold_({cfg_.dir + "/cold", kFormatVersion, cfg_.segment_max_bytes,
             cfg_.gc_fragmentation_threshold, cfg_.fsync}) {}

LoadOutcome CacheRepository::load() {
  std::unique_lock lk(mu_);
  index_.clear();
  dirty_.clear();
  removed_.clear();
  hot_dirty_ = false;

  std::error_code ec;
  std::filesystem::create_directories(cfg_.dir, ec);
  std::string err;
  {
    std::lock_guard<std::mutex> cold_lk(cold_mu_);
    cold_available_ = !ec && cold_.init(&err);
  }
  if (!cold_available_) {
    spdlog::warn("cache {} unavailable ({}), running without persistence",
                 cfg_.dir, ec ? ec.message() : err);
    return LoadOutcome::Unavailable;
  }

  if (!std::filesystem::exists(hot_path_, ec)) {
    std::lock_guard<std::mutex> cold_lk(cold_mu_);
    if (cold_.size() > 0 && !cold_.wipe(&err))
      spdlog::warn("cache {}: cannot reset orphaned cold store: {}", cfg_.dir,
                   err);
    return LoadOutcome::ColdStart;
  }

  if (!read_archive(&err)) {
    spdlog::warn("cache {}: {}; starting empty", cfg_.dir, err);
    index_.clear();
    hot_dirty_ = true;
    std::lock_guard<std::mutex> cold_lk(cold_mu_);
    std::string wipe_err;
    if (!cold_.wipe(&wipe_err))
      spdlog::warn("cache {}: cannot reset cold store: {}", cfg_.dir,
                   wipe_err);
    return LoadOutcome::Recovered;
  }
  spdlog::debug("cache {}: loaded {} entries", cfg_.dir, index_.size());
  return LoadOutcome::Loaded;
}

bool CacheRepository::read_archive(std::string *err) {
  MappedFile file;
  if (!file.open(hot_path_, err))
    return false;
  if (file.size() < sizeof(ArchiveHeader)) {
    if (err)
      *err = "hot archive truncated";
    return false;
  }
  ArchiveHeader h{};
  std::memcpy(&h, file.data(), sizeof(h));
  if (h.magic != kArchiveMagic) {
    if (err)
      *err = "hot archive has bad magic";
    return false;
  }
  if (h.version != kFormatVersion) {
    if (err)
      *err = "cache version " + std::to_string(h.version) + " -> " +
             std::to_string(kFormatVersion) + ": clearing old cache";
    return false;
  }
  if (h.payload_len != file.size() - sizeof(ArchiveHeader)) {
    if (err)
      *err = "hot archive length mismatch";
    return false;
  }
  const std::uint8_t *payload = file.data() + sizeof(ArchiveHeader);
  if (checksum32(payload, h.payload_len) != h.checksum) {
    if (err)
      *err = "hot archive checksum mismatch";
    return false;
  }

  ByteReader r(payload, h.payload_len);
  std::uint32_t model_count = 0;
  if (!r.get_u32(&model_count)) {
    if (err)
      *err = "hot archive model table truncated";
    return false;
  }
  std::vector<ModelKey> remap;
  remap.reserve(model_count);
  for (std::uint32_t i = 0; i < model_count; ++i) {
    std::string name;
    if (!r.get_string(&name)) {
      if (err)
        *err = "hot archive model table truncated";
      return false;
    }
    auto key = interner_.intern(name);
    if (!key) {
      if (err)
        *err = "model interner exhausted";
      return false;
    }
    remap.push_back(*key);
  }

  for (std::uint64_t i = 0; i < h.entry_count; ++i) {
    CacheKey key;
    HotEntry e;
    if (!r.get_string(&key.source) || !r.get_string(&key.path) ||
        !get_identity(r, &e.identity) || !r.get_opt_string(&e.cached_scalar) ||
        !r.get_u32(&e.record_count) ||
        !get_contribution(r, remap, &e.contribution)) {
      if (err)
        *err = "hot archive entry " + std::to_string(i) + " corrupt";
      return false;
    }
    index_.insert_or_assign(std::move(key), std::move(e));
  }
  hot_bytes_ = file.size();
  return true;
}

bool CacheRepository::write_archive(std::string *err) {
  ModelTable models(interner_);
  ByteWriter entries;
  for (const auto &[key, e] : index_) {
    entries.put_string(key.source);
    entries.put_string(key.path);
    put_identity(entries, e.identity);
    entries.put_opt_string(e.cached_scalar);
    entries.put_u32(e.record_count);
    put_contribution(entries, e.contribution, models);
  }

  ByteWriter payload;
  payload.put_u32(static_cast<std::uint32_t>(models.names().size()));
  for (const auto &name : models.names())
    payload.put_string(name);
  payload.put_bytes(entries.data().data(), entries.size());

  ArchiveHeader h{};
  h.magic = kArchiveMagic;
  h.version = kFormatVersion;
  h.entry_count = index_.size();
  h.payload_len = payload.size();
  h.checksum = checksum32(payload.data().data(), payload.size());

  ByteWriter file;
  file.put_bytes(reinterpret_cast<const std::uint8_t *>(&h), sizeof(h));
  file.put_bytes(payload.data().data(), payload.size());
  if (!write_file_atomic(hot_path_, file.data(), err))
    return false;
  hot_bytes_ = file.size();
  return true;
}

CacheEntry CacheRepository::to_entry(const HotEntry &h) const {
  CacheEntry e;
  e.identity = h.identity;
  e.contribution = h.contribution;
  e.cached_scalar = h.cached_scalar;
  e.record_count = h.record_count;
  return e;
}

std::optional<CacheEntry> CacheRepository::get(const CacheKey &key,
                                               const FileIdentity &current,
                                               LoadMode mode) {
  std::shared_lock lk(mu_);
  auto it = index_.find(key);
  if (it == index_.end() || it->second.identity != current) {
    ++misses_;
    return std::nullopt;
  }
  ++hits_;
  CacheEntry e = to_entry(it->second);
  if (mode == LoadMode::Full) {
    auto d = dirty_.find(key);
    if (d != dirty_.end()) {
      e.records = d->second;
    } else {
      std::string err;
      auto recs = read_cold(key, &err);
      if (!recs) {
        spdlog::warn("cache {}: records of {} unavailable: {}", cfg_.dir,
                     key.path, err);
        return std::nullopt;
      }
      e.records = std::move(*recs);
    }
  }
  return e;
}

std::optional<CacheEntry> CacheRepository::get_unchecked(const CacheKey &key,
                                                         LoadMode mode) {
  std::shared_lock lk(mu_);
  auto it = index_.find(key);
  if (it == index_.end())
    return std::nullopt;
  CacheEntry e = to_entry(it->second);
  if (mode == LoadMode::Full) {
    auto d = dirty_.find(key);
    if (d != dirty_.end()) {
      e.records = d->second;
    } else {
      std::string err;
      auto recs = read_cold(key, &err);
      if (recs)
        e.records = std::move(*recs);
      else
        spdlog::debug("cache {}: records of {} unavailable: {}", cfg_.dir,
                      key.path, err);
    }
  }
  return e;
}

bool CacheRepository::is_stale(const CacheKey &key,
                               const FileIdentity &current) const {
  std::shared_lock lk(mu_);
  auto it = index_.find(key);
  return it == index_.end() || it->second.identity != current;
}

bool CacheRepository::contains(const CacheKey &key) const {
  std::shared_lock lk(mu_);
  return index_.contains(key);
}

void CacheRepository::insert(const CacheKey &key, CacheEntry entry) {
  HotEntry h;
  h.identity = entry.identity;
  h.contribution = std::move(entry.contribution);
  h.cached_scalar = std::move(entry.cached_scalar);
  h.record_count = static_cast<std::uint32_t>(entry.records.size());

  std::unique_lock lk(mu_);
  index_.insert_or_assign(key, std::move(h));
  dirty_.insert_or_assign(key, std::move(entry.records));
  removed_.erase(key);
  hot_dirty_ = true;
}

std::optional<CacheEntry> CacheRepository::remove(const CacheKey &key) {
  std::unique_lock lk(mu_);
  auto it = index_.find(key);
  if (it == index_.end())
    return std::nullopt;
  CacheEntry e = to_entry(it->second);
  index_.erase(it);
  dirty_.erase(key);
  removed_.insert(key);
  hot_dirty_ = true;
  return e;
}

std::vector<CacheItem>
CacheRepository::prune_deleted(const std::string &source,
                               const std::unordered_set<std::string> &current) {
  std::unique_lock lk(mu_);
  std::vector<CacheItem> out;
  for (auto it = index_.begin(); it != index_.end();) {
    if (it->first.source == source && !current.contains(it->first.path)) {
      out.emplace_back(it->first, to_entry(it->second));
      dirty_.erase(it->first);
      removed_.insert(it->first);
      it = index_.erase(it);
    } else {
      ++it;
    }
  }
  if (!out.empty())
    hot_dirty_ = true;
  return out;
}

std::size_t CacheRepository::invalidate_source(const std::string &source) {
  return prune_deleted(source, {}).size();
}

void CacheRepository::clear() {
  std::unique_lock lk(mu_);
  index_.clear();
  dirty_.clear();
  removed_.clear();
  hot_dirty_ = true;
  std::lock_guard<std::mutex> cold_lk(cold_mu_);
  std::string err;
  if (cold_available_ && !cold_.wipe(&err))
    spdlog::warn("cache {}: cannot clear cold store: {}", cfg_.dir, err);
}

std::vector<CacheItem>
CacheRepository::entries_for(const std::string &source) const {
  std::shared_lock lk(mu_);
  std::vector<CacheItem> out;
  for (const auto &[k, h] : index_)
    if (k.source == source)
      out.emplace_back(k, to_entry(h));
  return out;
}

std::optional<std::vector<Message>>
CacheRepository::load_records(const CacheKey &key, std::string *err) {
  std::shared_lock lk(mu_);
  if (!index_.contains(key)) {
    if (err)
      *err = "no cache entry for " + key.path;
    return std::nullopt;
  }
  auto d = dirty_.find(key);
  if (d != dirty_.end())
    return d->second;
  return read_cold(key, err);
}

std::optional<std::vector<Message>>
CacheRepository::read_cold(const CacheKey &key, std::string *err) {
  std::lock_guard<std::mutex> cold_lk(cold_mu_);
  if (!cold_available_) {
    if (err)
      *err = "cold store unavailable";
    return std::nullopt;
  }
  auto bytes = cold_.get(key.encoded());
  if (!bytes) {
    if (err)
      *err = "records not in cold store";
    return std::nullopt;
  }
  FileIdentity identity;
  std::vector<Message> out;
  if (!decode_records(*bytes, &identity, &out, err))
    return std::nullopt;
  // A crash between the cold write and the archive rename leaves newer
  // records behind an older hot entry.
  auto it = index_.find(key);
  if (it == index_.end() || it->second.identity != identity) {
    if (err)
      *err = "records do not match the cached identity";
    return std::nullopt;
  }
  return out;
}

bool CacheRepository::persist(std::string *err) {
  std::unique_lock lk(mu_);
  if (!hot_dirty_ && dirty_.empty() && removed_.empty())
    return true;
  std::string why;
  auto fail = [&](const std::string &reason) {
    ++persist_failures_;
    spdlog::warn("cache {}: persist failed: {}", cfg_.dir, reason);
    if (err)
      *err = reason;
    return false;
  };
  if (!cold_available_)
    return fail("cold store unavailable");

  {
    std::lock_guard<std::mutex> cold_lk(cold_mu_);
    for (auto it = removed_.begin(); it != removed_.end();) {
      if (!cold_.del(it->encoded(), &why))
        return fail(why);
      it = removed_.erase(it);
    }
    for (auto it = dirty_.begin(); it != dirty_.end();) {
      const auto &identity = index_.at(it->first).identity;
      if (!cold_.put(it->first.encoded(), encode_records(identity, it->second),
                     &why))
        return fail(why);
      it = dirty_.erase(it);
    }
    if (!cold_.sync(&why))
      return fail(why);
    cold_.maybe_compact();
  }

  if (!write_archive(&why))
    return fail(why);
  hot_dirty_ = false;
  ++persists_;
  return true;
}

CacheStats CacheRepository::stats() const {
  std::shared_lock lk(mu_);
  CacheStats s;
  s.entries = index_.size();
  for (const auto &[k, _] : index_)
    ++s.by_source[k.source];
  s.hot_bytes = hot_bytes_;
  {
    std::lock_guard<std::mutex> cold_lk(cold_mu_);
    s.cold_bytes = cold_.stats().segment_bytes;
  }
  s.hits = hits_.load();
  s.misses = misses_.load();
  s.persists = persists_;
  s.persist_failures = persist_failures_;
  s.dirty_entries = dirty_.size() + removed_.size();
  return s;
}

std::string CacheRepository::info() const {
  const auto s = stats();
  std::ostringstream os;
  os << "cache_dir:" << cfg_.dir << "\n";
  os << "entries:" << s.entries << "\n";
  for (const auto &[source, n] : s.by_source)
    os << "entries_" << source << ":" << n << "\n";
  os << "hot_bytes:" << s.hot_bytes << "\n";
  os << "cold_bytes:" << s.cold_bytes << "\n";
  os << "hits:" << s.hits << "\n";
  os << "misses:" << s.misses << "\n";
  os << "persists:" << s.persists << "\n";
  os << "persist_failures:" << s.persist_failures << "\n";
  os << "dirty_entries:" << s.dirty_entries << "\n";
  return os.str();
}

std::size_t CacheRepository::size() const {
  std::shared_lock lk(mu_);
  return index_.size();
}

LazyRepository::LazyRepository(CacheConfig cfg, ModelInterner &interner)
    : cfg_(std::move(cfg)), interner_(interner) {}

CacheRepository &LazyRepository::get() {
  {
    std::shared_lock lk(mu_);
    if (repo_)
      return *repo_;
  }
  std::unique_lock lk(mu_);
  if (!repo_) {
    auto repo = std::make_unique<CacheRepository>(cfg_, interner_);
    outcome_ = repo->load();
    ++init_count_;
    repo_ = std::move(repo);
  }
  return *repo_;
}

bool LazyRepository::initialized() const {
  std::shared_lock lk(mu_);
  return repo_ != nullptr;
}

std::optional<LoadOutcome> LazyRepository::outcome() const {
  std::shared_lock lk(mu_);
  return outcome_;
}

std::uint32_t LazyRepository::init_count() const {
  std::shared_lock lk(mu_);
  return init_count_;
}

} // namespace usage_ledger
