#include "test_support.hpp"
#include "usage_ledger/watcher.hpp"

#include <catch2/catch.hpp>

#include <chrono>
#include <filesystem>
#include <set>
#include <thread>

using namespace usage_ledger;
using namespace usage_ledger::testing;

namespace {
bool wait_for_event(EventQueue<WatchEvent> &q, WatchEvent::Kind kind,
                    const std::string &path,
                    std::chrono::milliseconds timeout =
                        std::chrono::milliseconds(5000)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    auto ev = q.pop_for(std::chrono::milliseconds(50));
    if (ev && ev->kind == kind && ev->path == path)
      return true;
  }
  return false;
}
} // namespace

TEST_CASE("paths route to the longest watched directory", "[watcher][route]") {
  const RouteTable routes = {{"/data", "root"},
                             {"/data/claude", "claude"},
                             {"/data/claude/sub", "sub"}};
  CHECK(route_path("/data/claude/x.tsv", routes) == "claude");
  CHECK(route_path("/data/claude/sub/y.tsv", routes) == "sub");
  CHECK(route_path("/data/claude/subway/y.tsv", routes) == "claude");
  CHECK(route_path("/data/claudette/z.tsv", routes) == "root");
  CHECK(route_path("/data/claude", routes) == "claude");
  CHECK_FALSE(route_path("/datastore/a.tsv", routes).has_value());
  CHECK_FALSE(route_path("/other/a.tsv", routes).has_value());
  CHECK_FALSE(route_path("/data/a.tsv", RouteTable{}).has_value());
}

TEST_CASE("event queue drains after close", "[watcher][queue]") {
  EventQueue<WatchEvent> q;
  CHECK(q.push(WatchEvent::changed("s", "/a")));
  q.close();
  CHECK_FALSE(q.push(WatchEvent::changed("s", "/b")));
  CHECK(q.size() == 1);
  auto ev = q.pop_for(std::chrono::milliseconds(10));
  REQUIRE(ev.has_value());
  CHECK(ev->path == "/a");
  CHECK_FALSE(q.pop_for(std::chrono::milliseconds(10)).has_value());
}

TEST_CASE("watcher reports writes and deletes under watched trees",
          "[watcher][inotify]") {
  TempDir tmp("watch");
  EventQueue<WatchEvent> q;
  Watcher w({{tmp.path(), "src"}}, q);
  std::string err;
  REQUIRE(w.start(&err));
  CHECK(w.running());
  CHECK(w.stats().watches == 1);

  const auto a = tmp.file("a.tsv");
  write_file(a, "hello\n");
  CHECK(wait_for_event(q, WatchEvent::Kind::Changed, a));

  std::filesystem::create_directories(tmp.file("nested"));
  // Give the monitor a moment to add the new directory's watch.
  std::this_thread::sleep_for(std::chrono::milliseconds(300));
  const auto b = tmp.file("nested/b.tsv");
  write_file(b, "world\n");
  CHECK(wait_for_event(q, WatchEvent::Kind::Changed, b));
  CHECK(w.stats().watches == 2);

  std::filesystem::remove(a);
  CHECK(wait_for_event(q, WatchEvent::Kind::Deleted, a));

  w.stop();
  CHECK_FALSE(w.running());
  CHECK(w.stats().events >= 3);
}

TEST_CASE("moved directories trigger a rescan and are watched at their new path",
          "[watcher][inotify][rename]") {
  TempDir tmp("watch_rename");
  const auto root = tmp.file("data");
  write_file(root + "/sub/a.tsv", "one\n");
  write_file(root + "/old/b.tsv", "two\n");
  EventQueue<WatchEvent> q;
  Watcher w({{root, "src"}}, q);
  REQUIRE(w.start());
  CHECK(w.stats().watches == 3);

  std::filesystem::rename(root + "/sub", root + "/renamed");
  CHECK(wait_for_event(q, WatchEvent::Kind::Rescan, ""));
  CHECK(wait_for_event(q, WatchEvent::Kind::Changed, root + "/renamed/a.tsv"));
  CHECK(w.stats().watches == 3);

  write_file(root + "/renamed/a.tsv", "one\nmore\n");
  CHECK(wait_for_event(q, WatchEvent::Kind::Changed, root + "/renamed/a.tsv"));

  std::filesystem::rename(root + "/old", tmp.file("outside"));
  CHECK(wait_for_event(q, WatchEvent::Kind::Rescan, ""));
  CHECK(w.stats().watches == 2);
  CHECK(w.stats().rescans == 2);

  // Nothing under the moved-out tree is reported any more.
  write_file(tmp.file("outside/b.tsv"), "gone\n");
  std::this_thread::sleep_for(std::chrono::milliseconds(300));
  while (auto ev = q.try_pop())
    CHECK(ev->path.rfind(tmp.file("outside"), 0) != 0);
  w.stop();
}

TEST_CASE("rescans go to the owning and every nested source",
          "[watcher][inotify][rename]") {
  TempDir tmp("watch_nested");
  const auto root = tmp.file("data");
  write_file(root + "/team/claude/a.tsv", "x\n");
  EventQueue<WatchEvent> q;
  Watcher w({{root, "all"}, {root + "/team/claude", "claude"}}, q);
  REQUIRE(w.start());

  std::filesystem::remove_all(root + "/team");
  std::set<std::string> rescanned;
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(5000);
  while (rescanned.size() < 2 && std::chrono::steady_clock::now() < deadline) {
    auto ev = q.pop_for(std::chrono::milliseconds(50));
    if (ev && ev->kind == WatchEvent::Kind::Rescan)
      rescanned.insert(ev->source);
  }
  CHECK(rescanned == std::set<std::string>{"all", "claude"});
  w.stop();
}

TEST_CASE("missing watch roots are counted, not fatal", "[watcher]") {
  TempDir tmp("watch_missing");
  EventQueue<WatchEvent> q;
  Watcher w({{tmp.file("nope"), "src"}}, q);
  REQUIRE(w.start());
  CHECK(w.stats().watches == 0);
  CHECK(w.stats().watch_failures == 1);
  w.stop();
}
