#include "test_support.hpp"
#include "usage_ledger/cache_repository.hpp"

#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <thread>

using namespace usage_ledger;
using namespace usage_ledger::testing;

namespace {
CacheConfig config(const std::string &dir) {
  CacheConfig cfg;
  cfg.dir = dir;
  cfg.fsync = FsyncMode::Never;
  return cfg;
}

CacheEntry entry_for(std::vector<Message> records, ModelInterner &in,
                     std::uint64_t size = 100, std::int64_t mtime = 1) {
  CacheEntry e;
  e.identity = {size, mtime, std::nullopt};
  e.contribution =
      from_records(ContributionStrategy::SingleSession, records, in);
  e.records = std::move(records);
  return e;
}

void patch_byte(const std::string &path, std::streamoff at, char value) {
  std::fstream f(path, std::ios::in | std::ios::out | std::ios::binary);
  f.seekp(at);
  f.put(value);
}

void flip_byte(const std::string &path, std::streamoff at) {
  std::fstream f(path, std::ios::in | std::ios::out | std::ios::binary);
  f.seekg(at);
  const char c = static_cast<char>(f.get());
  f.seekp(at);
  f.put(static_cast<char>(c ^ 0x5a));
}
} // namespace

TEST_CASE("fresh directory is a cold start", "[cache]") {
  TempDir tmp("cache_cold");
  ModelInterner in;
  CacheRepository repo(config(tmp.path()), in);
  CHECK(repo.load() == LoadOutcome::ColdStart);
  CHECK(repo.size() == 0);
}

TEST_CASE("entries are stale once the file identity changes", "[cache]") {
  TempDir tmp("cache_stale");
  ModelInterner in;
  CacheRepository repo(config(tmp.path()), in);
  repo.load();
  const CacheKey key{"src", "/data/a.tsv"};
  repo.insert(key, entry_for({user_msg(kDay0, "s")}, in, 10, 5));

  CHECK_FALSE(repo.is_stale(key, {10, 5, std::nullopt}));
  CHECK(repo.is_stale(key, {11, 5, std::nullopt}));
  CHECK(repo.is_stale(key, {10, 6, std::nullopt}));
  CHECK(repo.is_stale({"src", "/data/missing.tsv"}, {10, 5, std::nullopt}));

  CHECK(repo.get(key, {10, 5, std::nullopt}).has_value());
  CHECK_FALSE(repo.get(key, {10, 6, std::nullopt}).has_value());
  CHECK(repo.get_unchecked(key).has_value());
  const auto s = repo.stats();
  CHECK(s.hits == 1);
  CHECK(s.misses == 1);
}

TEST_CASE("persisted entries reload with their contributions and records",
          "[cache][persist]") {
  TempDir tmp("cache_persist");
  const CacheKey a{"src", "/data/a.tsv"};
  const CacheKey b{"src", "/data/b.tsv"};
  const std::vector<Message> recs = {
      user_msg(kDay0, "s1"), ai_msg(kDay0 + 10, "s1", "gpt-4o", 50, 7, 0.75)};
  Contribution expected;
  {
    ModelInterner in;
    in.intern("unrelated-model");
    CacheRepository repo(config(tmp.path()), in);
    repo.load();
    auto e = entry_for(recs, in, 42, 7);
    e.cached_scalar = "gpt-4o";
    repo.insert(a, std::move(e));
    repo.insert(b, entry_for({user_msg(kDay0, "s2")}, in));
    REQUIRE(repo.persist());
    CHECK(repo.stats().persists == 1);
    CHECK(std::filesystem::exists(repo.hot_path()));
    REQUIRE(repo.remove(b).has_value());
    REQUIRE(repo.persist());
  }

  // Keys are process-local; a fresh interner assigns different ones.
  ModelInterner in;
  CacheRepository repo(config(tmp.path()), in);
  REQUIRE(repo.load() == LoadOutcome::Loaded);
  CHECK(repo.size() == 1);
  CHECK_FALSE(repo.contains(b));

  auto hot = repo.get(a, {42, 7, std::nullopt});
  REQUIRE(hot.has_value());
  CHECK(hot->records.empty());
  CHECK(hot->record_count == 2);
  CHECK(hot->cached_scalar == "gpt-4o");
  CHECK(hot->contribution == from_records(ContributionStrategy::SingleSession,
                                          recs, in));

  auto full = repo.get(a, {42, 7, std::nullopt}, LoadMode::Full);
  REQUIRE(full.has_value());
  CHECK(full->records == recs);
  CHECK(repo.load_records(a) == recs);

  std::string err;
  CHECK_FALSE(repo.load_records(b, &err).has_value());
  CHECK_FALSE(err.empty());
}

TEST_CASE("prune_deleted returns the entries it drops", "[cache][prune]") {
  TempDir tmp("cache_prune");
  ModelInterner in;
  CacheRepository repo(config(tmp.path()), in);
  repo.load();
  repo.insert({"src", "/d/keep.tsv"}, entry_for({user_msg(kDay0, "k")}, in));
  repo.insert({"src", "/d/gone.tsv"}, entry_for({user_msg(kDay0, "g")}, in));
  repo.insert({"other", "/d/gone.tsv"}, entry_for({user_msg(kDay0, "o")}, in));

  auto removed = repo.prune_deleted("src", {"/d/keep.tsv"});
  REQUIRE(removed.size() == 1);
  CHECK(removed.front().first.path == "/d/gone.tsv");
  CHECK(std::holds_alternative<SingleSessionContribution>(
      removed.front().second.contribution));
  CHECK(repo.size() == 2);
  CHECK(repo.contains({"other", "/d/gone.tsv"}));
  CHECK(repo.entries_for("src").size() == 1);
  CHECK(repo.invalidate_source("other") == 1);
  CHECK(repo.stats().by_source.count("other") == 0);
}

TEST_CASE("a corrupt hot archive falls back to an empty cache",
          "[cache][recovery]") {
  TempDir tmp("cache_corrupt");
  {
    ModelInterner in;
    CacheRepository repo(config(tmp.path()), in);
    repo.load();
    repo.insert({"src", "/d/a.tsv"}, entry_for({user_msg(kDay0, "s")}, in));
    REQUIRE(repo.persist());
  }
  const auto hot = tmp.path() + "/hot.ledger";
  const auto size = static_cast<std::streamoff>(std::filesystem::file_size(hot));
  flip_byte(hot, size - 1);

  ModelInterner in;
  CacheRepository repo(config(tmp.path()), in);
  CHECK(repo.load() == LoadOutcome::Recovered);
  CHECK(repo.size() == 0);
  CHECK_FALSE(repo.load_records({"src", "/d/a.tsv"}).has_value());

  // The next persist replaces the damaged archive.
  REQUIRE(repo.persist());
  CacheRepository again(config(tmp.path()), in);
  CHECK(again.load() == LoadOutcome::Loaded);
}

TEST_CASE("an archive from another format version is discarded",
          "[cache][version]") {
  TempDir tmp("cache_version");
  {
    ModelInterner in;
    CacheRepository repo(config(tmp.path()), in);
    repo.load();
    repo.insert({"src", "/d/a.tsv"}, entry_for({user_msg(kDay0, "s")}, in));
    REQUIRE(repo.persist());
  }
  // version field follows the 4-byte magic
  patch_byte(tmp.path() + "/hot.ledger", 4, '\x09');

  ModelInterner in;
  CacheRepository repo(config(tmp.path()), in);
  CHECK(repo.load() == LoadOutcome::Recovered);
  CHECK(repo.size() == 0);
  CHECK(repo.stats().cold_bytes == 0);
}

TEST_CASE("cold records without a hot archive are dropped", "[cache][recovery]") {
  TempDir tmp("cache_orphan");
  {
    ModelInterner in;
    CacheRepository repo(config(tmp.path()), in);
    repo.load();
    repo.insert({"src", "/d/a.tsv"}, entry_for({user_msg(kDay0, "s")}, in));
    REQUIRE(repo.persist());
  }
  std::filesystem::remove(tmp.path() + "/hot.ledger");
  ModelInterner in;
  CacheRepository repo(config(tmp.path()), in);
  CHECK(repo.load() == LoadOutcome::ColdStart);
  CHECK(repo.stats().cold_bytes == 0);
}

TEST_CASE("clear removes everything including persisted state", "[cache]") {
  TempDir tmp("cache_clear");
  ModelInterner in;
  {
    CacheRepository repo(config(tmp.path()), in);
    repo.load();
    repo.insert({"src", "/d/a.tsv"}, entry_for({user_msg(kDay0, "s")}, in));
    REQUIRE(repo.persist());
    repo.clear();
    REQUIRE(repo.persist());
  }
  CacheRepository repo(config(tmp.path()), in);
  CHECK(repo.load() == LoadOutcome::Loaded);
  CHECK(repo.size() == 0);
}

TEST_CASE("lazy repository loads exactly once under contention",
          "[cache][lazy]") {
  TempDir tmp("cache_lazy");
  ModelInterner in;
  LazyRepository lazy(config(tmp.path()), in);
  CHECK_FALSE(lazy.initialized());
  CHECK_FALSE(lazy.outcome().has_value());

  std::vector<std::thread> threads;
  std::vector<CacheRepository *> seen(16, nullptr);
  for (int i = 0; i < 16; ++i)
    threads.emplace_back([&, i] { seen[i] = &lazy.get(); });
  for (auto &t : threads)
    t.join();

  CHECK(lazy.initialized());
  CHECK(lazy.init_count() == 1);
  CHECK(lazy.outcome() == LoadOutcome::ColdStart);
  for (auto *p : seen)
    CHECK(p == seen.front());
}
