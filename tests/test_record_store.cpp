#include "test_support.hpp"
#include "usage_ledger/record_store.hpp"

#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>

using namespace usage_ledger;
using namespace usage_ledger::testing;

namespace {
std::vector<std::uint8_t> bytes(const std::string &s) {
  return {s.begin(), s.end()};
}

RecordStoreConfig config(const std::string &dir) {
  RecordStoreConfig cfg;
  cfg.dir = dir;
  cfg.fsync = FsyncMode::Never;
  return cfg;
}
} // namespace

TEST_CASE("record store put get del survive reopen", "[record_store]") {
  TempDir tmp("rs_basic");
  {
    RecordStore rs(config(tmp.path()));
    std::string err;
    REQUIRE(rs.init(&err));
    REQUIRE(rs.put("a", bytes("alpha")));
    REQUIRE(rs.put("b", bytes("beta")));
    REQUIRE(rs.put("a", bytes("alpha-2")));
    REQUIRE(rs.del("b"));
    CHECK(rs.get("a") == bytes("alpha-2"));
    CHECK_FALSE(rs.get("b").has_value());
    CHECK(rs.size() == 1);
    REQUIRE(rs.sync());
  }
  RecordStore rs(config(tmp.path()));
  REQUIRE(rs.init());
  CHECK(rs.contains("a"));
  CHECK_FALSE(rs.contains("b"));
  CHECK(rs.get("a") == bytes("alpha-2"));
  CHECK(rs.stats().hits == 1);
  CHECK(rs.stats().tail_repairs == 0);
}

TEST_CASE("torn tail is truncated on open", "[record_store][recovery]") {
  TempDir tmp("rs_tail");
  {
    RecordStore rs(config(tmp.path()));
    REQUIRE(rs.init());
    REQUIRE(rs.put("kept", bytes("payload")));
  }
  const auto seg = tmp.file("segment_1.log");
  const auto good_size = std::filesystem::file_size(seg);
  {
    std::ofstream out(seg, std::ios::app | std::ios::binary);
    out << "ULC1 partial record that never finished";
  }
  RecordStore rs(config(tmp.path()));
  REQUIRE(rs.init());
  CHECK(rs.stats().tail_repairs == 1);
  CHECK(std::filesystem::file_size(seg) == good_size);
  CHECK(rs.get("kept") == bytes("payload"));
  REQUIRE(rs.put("after", bytes("more")));
  CHECK(rs.get("after") == bytes("more"));
}

TEST_CASE("a format version change discards old segments",
          "[record_store][version]") {
  TempDir tmp("rs_version");
  {
    RecordStore rs(config(tmp.path()));
    REQUIRE(rs.init());
    REQUIRE(rs.put("old", bytes("v1 data")));
  }
  auto cfg = config(tmp.path());
  cfg.format_version = 2;
  RecordStore rs(cfg);
  REQUIRE(rs.init());
  CHECK(rs.stats().wiped_on_version_change);
  CHECK(rs.size() == 0);
  CHECK_FALSE(rs.get("old").has_value());
}

TEST_CASE("segments rotate and compaction keeps live values",
          "[record_store][compaction]") {
  TempDir tmp("rs_compact");
  auto cfg = config(tmp.path());
  cfg.segment_max_bytes = 512;
  cfg.gc_fragmentation_threshold = 0.3;
  RecordStore rs(cfg);
  REQUIRE(rs.init());
  const std::string value(100, 'x');
  for (int round = 0; round < 5; ++round)
    for (int i = 0; i < 10; ++i)
      REQUIRE(rs.put("k" + std::to_string(i), bytes(value + std::to_string(round))));
  const auto before = rs.stats().segment_bytes;
  REQUIRE(rs.stats().fragmentation_estimate > 0.3);

  rs.maybe_compact();
  CHECK(rs.stats().gc_runs == 1);
  CHECK(rs.stats().segment_bytes < before);
  CHECK(rs.stats().gc_bytes_reclaimed > 0);
  for (int i = 0; i < 10; ++i)
    CHECK(rs.get("k" + std::to_string(i)) == bytes(value + "4"));

  RecordStore reopened(cfg);
  REQUIRE(reopened.init());
  CHECK(reopened.size() == 10);
  CHECK(reopened.get("k3") == bytes(value + "4"));
}

TEST_CASE("wipe empties the store", "[record_store]") {
  TempDir tmp("rs_wipe");
  RecordStore rs(config(tmp.path()));
  REQUIRE(rs.init());
  REQUIRE(rs.put("a", bytes("1")));
  REQUIRE(rs.wipe());
  CHECK(rs.size() == 0);
  CHECK(rs.is_open());
  REQUIRE(rs.put("b", bytes("2")));

  RecordStore reopened(config(tmp.path()));
  REQUIRE(reopened.init());
  CHECK_FALSE(reopened.contains("a"));
  CHECK(reopened.contains("b"));
}

TEST_CASE("fsync mode names parse", "[record_store][config]") {
  CHECK(parse_fsync_mode("always") == FsyncMode::Always);
  CHECK(parse_fsync_mode("everysec") == FsyncMode::EverySec);
  CHECK(parse_fsync_mode("never") == FsyncMode::Never);
  CHECK_FALSE(parse_fsync_mode("sometimes").has_value());
  CHECK(std::string(fsync_mode_name(FsyncMode::Always)) == "always");
}
