#include "usage_ledger/model_interner.hpp"
#include "usage_ledger/packed_stats.hpp"
#include "usage_ledger/types.hpp"

#include <catch2/catch.hpp>

#include <thread>
#include <vector>

using namespace usage_ledger;

TEST_CASE("interner returns stable keys and resolves them back",
          "[interner]") {
  ModelInterner in;
  auto a = in.intern("claude-sonnet-4");
  auto b = in.intern("gpt-4o");
  auto a2 = in.intern("claude-sonnet-4");
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());
  CHECK(*a == *a2);
  CHECK(*a != *b);
  CHECK(in.resolve(*a) == "claude-sonnet-4");
  CHECK(in.resolve(*b) == "gpt-4o");
  CHECK(in.size() == 2);
  CHECK(in.find("gpt-4o") == b);
  CHECK_FALSE(in.find("o3").has_value());
  CHECK(in.resolve(ModelKey{999}).empty());
}

TEST_CASE("concurrent interning agrees on one key per name",
          "[interner][concurrency]") {
  ModelInterner in;
  std::vector<std::thread> threads;
  std::vector<std::vector<ModelKey>> seen(8);
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < 200; ++i)
        seen[t].push_back(*in.intern("model-" + std::to_string(i % 50)));
    });
  }
  for (auto &th : threads)
    th.join();
  CHECK(in.size() == 50);
  for (int t = 1; t < 8; ++t)
    CHECK(seen[t] == seen[0]);
}

TEST_CASE("interner refuses names past the key space", "[interner][limits]") {
  ModelInterner in;
  for (std::size_t i = 0; i < ModelInterner::kMaxModels; ++i)
    REQUIRE(in.intern("m" + std::to_string(i)).has_value());
  CHECK_FALSE(in.intern("one-too-many").has_value());
  CHECK(in.intern("m0").has_value());
}

TEST_CASE("compact dates order chronologically and print ISO",
          "[types][date]") {
  const auto d = CompactDate::from_ymd(2025, 3, 10);
  CHECK(d.year() == 2025);
  CHECK(d.month() == 3);
  CHECK(d.day() == 10);
  CHECK(d.to_string() == "2025-03-10");
  CHECK(CompactDate::from_epoch_seconds(1741564800) == d);
  CHECK(CompactDate::from_epoch_seconds(1741564800 - 1) ==
        CompactDate::from_ymd(2025, 3, 9));
  CHECK(CompactDate::from_ymd(2024, 12, 31) < CompactDate::from_ymd(2025, 1, 1));
  CHECK(parse_date("2025-03-10") == d);
  CHECK_FALSE(parse_date("2025-13-01").has_value());
  CHECK_FALSE(parse_date("yesterday").has_value());
}

TEST_CASE("packed stats saturate and tallies clamp at zero",
          "[types][stats]") {
  Stats s;
  s.input_tokens = 10'000'000'000ULL;
  s.output_tokens = 7;
  s.cost = 1.234567;
  s.tool_calls = 100000;
  const auto p = PackedStats::pack(s);
  CHECK(p.input_tokens == 0xFFFFFFFFu);
  CHECK(p.output_tokens == 7);
  CHECK(p.cost_units == 123457);
  CHECK(p.tool_calls == 0xFFFF);

  PackedStats acc = p;
  acc += p;
  CHECK(acc.input_tokens == 0xFFFFFFFFu);
  CHECK(acc.output_tokens == 14);

  TallyStats t = p.widen();
  TallyStats bigger = acc.widen();
  t -= bigger;
  CHECK(t.is_zero());

  CHECK(cost_to_units(2.5) == 250000);
  CHECK(units_to_cost(250000) == 2.5);
  CHECK(cost_to_units(-1.0) == 0);
}

TEST_CASE("model counts drop entries that reach zero", "[types][models]") {
  ModelCounts c;
  c.add(ModelKey{3}, 2);
  c.add(ModelKey{1});
  REQUIRE(c.size() == 2);
  CHECK(c.items().front().first == ModelKey{1});
  c.subtract(ModelKey{3}, 2);
  CHECK(c.size() == 1);
  CHECK(c.count(ModelKey{3}) == 0);
  c.subtract(ModelKey{1}, 5);
  CHECK(c.empty());
}
