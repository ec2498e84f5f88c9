#include "test_support.hpp"
#include "usage_ledger/contribution.hpp"

#include <catch2/catch.hpp>

#include <algorithm>
#include <random>

using namespace usage_ledger;
using namespace usage_ledger::testing;

namespace {
AggregateView fold(const std::vector<Contribution> &cs) {
  AggregateView v;
  for (const auto &c : cs)
    merge_into(c, v);
  return v;
}
} // namespace

TEST_CASE("strategy names round trip", "[contribution]") {
  for (auto s : {ContributionStrategy::SingleMessage,
                 ContributionStrategy::SingleSession,
                 ContributionStrategy::MultiSession})
    CHECK(parse_strategy(strategy_name(s)) == s);
  CHECK_FALSE(parse_strategy("per_file").has_value());
}

TEST_CASE("single message contribution counts one message",
          "[contribution][single_message]") {
  ModelInterner in;
  auto c = from_records(ContributionStrategy::SingleMessage,
                        {ai_msg(kDay0 + 60, "s1", "gpt-4o", 100, 20, 1.0)}, in);
  REQUIRE(std::holds_alternative<SingleMessageContribution>(c));
  const auto &m = std::get<SingleMessageContribution>(c);
  CHECK(m.present);
  CHECK(m.ai);
  CHECK(m.stats.cost_units == 100000);

  AggregateView v;
  merge_into(c, v);
  const auto *day = v.day(CompactDate::from_epoch_seconds(kDay0));
  REQUIRE(day != nullptr);
  CHECK(day->ai_messages == 1);
  CHECK(day->user_messages == 0);
  CHECK(day->conversations == 1);
  CHECK(day->stats.input_tokens == 100);
  CHECK(day->models.count(*in.find("gpt-4o")) == 1);
  CHECK(v.conversation_count() == 1);
  CHECK(v.totals().cost() == 1.0);

  unmerge_from(c, v);
  CHECK(v.empty());
}

TEST_CASE("empty files contribute nothing", "[contribution][empty]") {
  ModelInterner in;
  for (auto s : {ContributionStrategy::SingleMessage,
                 ContributionStrategy::SingleSession,
                 ContributionStrategy::MultiSession}) {
    auto c = from_records(s, {}, in);
    CHECK(is_empty(c));
    CHECK(strategy_of(c) == s);
    AggregateView v;
    merge_into(c, v);
    CHECK(v.empty());
    unmerge_from(c, v);
    CHECK(v.empty());
  }
}

TEST_CASE("records that do not fit the strategy are promoted",
          "[contribution][promotion]") {
  ModelInterner in;
  auto two = from_records(ContributionStrategy::SingleMessage,
                          {user_msg(kDay0, "a"), user_msg(kDay0 + 5, "a")}, in);
  CHECK(strategy_of(two) == ContributionStrategy::MultiSession);

  auto mixed = from_records(
      ContributionStrategy::SingleSession,
      {user_msg(kDay0, "a"), ai_msg(kDay0 + 1, "b", "o3", 1, 1, 0.01)}, in);
  REQUIRE(strategy_of(mixed) == ContributionStrategy::MultiSession);
  CHECK(std::get<MultiSessionContribution>(mixed).sessions.size() == 2);

  auto one = from_records(
      ContributionStrategy::SingleSession,
      {user_msg(kDay0, "a"), ai_msg(kDay0 + kDaySecs, "a", "o3", 1, 1, 0.01)},
      in);
  REQUIRE(strategy_of(one) == ContributionStrategy::SingleSession);
  CHECK(std::get<SingleSessionContribution>(one).days.size() == 2);
}

TEST_CASE("only assistant messages carry stats and models",
          "[contribution][roles]") {
  ModelInterner in;
  auto user = user_msg(kDay0, "s");
  user.stats.input_tokens = 500;
  user.stats.cost = 3.0;
  auto c = from_records(ContributionStrategy::SingleSession,
                        {user, ai_msg(kDay0 + 1, "s", "o3", 10, 5, 0.5)}, in);
  AggregateView v;
  merge_into(c, v);
  const auto *s = v.session("s");
  REQUIRE(s != nullptr);
  CHECK(s->user_messages == 1);
  CHECK(s->ai_messages == 1);
  CHECK(s->stats.input_tokens == 10);
  CHECK(s->stats.cost() == 0.5);
  CHECK(s->models.size() == 1);
  CHECK(v.total_messages() == 2);
}

TEST_CASE("messages without a session id add no session",
          "[contribution][sessions]") {
  ModelInterner in;
  auto c = from_records(ContributionStrategy::SingleMessage,
                        {ai_msg(kDay0, "", "o3", 1, 1, 0.1)}, in);
  AggregateView v;
  merge_into(c, v);
  CHECK(v.sessions().empty());
  CHECK(v.conversation_count() == 0);
  REQUIRE(v.days().size() == 1);
  CHECK(v.days().begin()->second.conversations == 0);
  CHECK(v.days().begin()->second.ai_messages == 1);
}

TEST_CASE("a session shared by two files starts on its earliest day",
          "[contribution][multi_session]") {
  ModelInterner in;
  const auto day0 = CompactDate::from_epoch_seconds(kDay0);
  const auto day2 = CompactDate::from_epoch_seconds(kDay0 + 2 * kDaySecs);
  auto late = from_records(
      ContributionStrategy::MultiSession,
      {ai_msg(kDay0 + 2 * kDaySecs, "shared", "o3", 5, 5, 0.2),
       user_msg(kDay0 + 2 * kDaySecs + 9, "other")},
      in);
  auto early = from_records(ContributionStrategy::MultiSession,
                            {user_msg(kDay0 + 30, "shared")}, in);

  AggregateView v;
  merge_into(late, v);
  CHECK(v.day(day2)->conversations == 2);
  CHECK(v.conversation_count() == 2);

  merge_into(early, v);
  CHECK(v.day(day0)->conversations == 1);
  CHECK(v.day(day2)->conversations == 1);
  CHECK(v.conversation_count() == 2);
  CHECK(v.session("shared")->contributors() == 2);
  CHECK(v.session("shared")->first_date() == day0);

  unmerge_from(early, v);
  CHECK(v.day(day0) == nullptr);
  CHECK(v.day(day2)->conversations == 2);
  CHECK(v.session("shared")->contributors() == 1);
  CHECK(v == fold({late}));
}

TEST_CASE("session display name comes from the earliest named origin",
          "[contribution][sessions]") {
  ModelInterner in;
  auto named = user_msg(kDay0 + 100, "s");
  named.session_name = "refactor parser";
  auto a = from_records(ContributionStrategy::SingleMessage, {named}, in);
  auto b = from_records(ContributionStrategy::SingleMessage,
                        {user_msg(kDay0, "s")}, in);
  AggregateView v;
  merge_into(b, v);
  CHECK_FALSE(v.session("s")->display_name().has_value());
  merge_into(a, v);
  CHECK(v.session("s")->display_name() == "refactor parser");
}

TEST_CASE("unmerge is the exact inverse of merge", "[contribution][inverse]") {
  ModelInterner in;
  std::mt19937_64 rng(7);
  const char *models[] = {"o3", "gpt-4o", "claude-sonnet-4"};
  auto random_records = [&](int n, int sessions) {
    std::vector<Message> out;
    for (int i = 0; i < n; ++i) {
      const auto ts =
          kDay0 + static_cast<std::int64_t>(rng() % 5) * kDaySecs + i;
      const auto session = "s" + std::to_string(rng() % sessions);
      if (rng() % 3 == 0)
        out.push_back(user_msg(ts, session));
      else
        out.push_back(ai_msg(ts, session, models[rng() % 3], rng() % 5000,
                             rng() % 900,
                             static_cast<double>(rng() % 400) / 100.0));
    }
    return out;
  };

  std::vector<Contribution> base;
  for (int i = 0; i < 20; ++i)
    base.push_back(from_records(ContributionStrategy::MultiSession,
                                random_records(8, 6), in));
  const AggregateView before = fold(base);

  for (auto strategy : {ContributionStrategy::SingleMessage,
                        ContributionStrategy::SingleSession,
                        ContributionStrategy::MultiSession}) {
    for (int i = 0; i < 30; ++i) {
      const int n = strategy == ContributionStrategy::SingleMessage ? 1 : 6;
      const int sessions =
          strategy == ContributionStrategy::MultiSession ? 6 : 1;
      auto c = from_records(strategy, random_records(n, sessions), in);
      AggregateView v = before;
      merge_into(c, v);
      unmerge_from(c, v);
      CHECK(v == before);
    }
  }
}

TEST_CASE("merge order does not change the aggregate",
          "[contribution][order]") {
  ModelInterner in;
  std::vector<Contribution> cs;
  for (int i = 0; i < 12; ++i)
    cs.push_back(from_records(
        ContributionStrategy::SingleSession,
        {user_msg(kDay0 + (12 - i) * 3600, "s" + std::to_string(i % 4)),
         ai_msg(kDay0 + (12 - i) * 3600 + kDaySecs * (i % 3),
                "s" + std::to_string(i % 4), "o3", 10 * i, i, 0.25)},
        in));
  const auto forward = fold(cs);
  std::reverse(cs.begin(), cs.end());
  CHECK(fold(cs) == forward);
  std::mt19937 rng(3);
  std::shuffle(cs.begin(), cs.end(), rng);
  CHECK(fold(cs) == forward);
}

TEST_CASE("saturated counters still cancel exactly",
          "[contribution][saturation]") {
  ModelInterner in;
  auto huge = ai_msg(kDay0, "s", "o3", 0, 0, 1e9);
  huge.stats.input_tokens = 50'000'000'000ULL;
  huge.stats.tool_calls = 1'000'000;
  auto c = from_records(ContributionStrategy::SingleMessage, {huge}, in);
  const auto &m = std::get<SingleMessageContribution>(c);
  CHECK(m.stats.input_tokens == 0xFFFFFFFFu);
  CHECK(m.stats.cost_units == 0xFFFFFFFFu);
  CHECK(m.stats.tool_calls == 0xFFFF);

  AggregateView v;
  merge_into(c, v);
  merge_into(c, v);
  CHECK(v.totals().input_tokens == 2ULL * 0xFFFFFFFFu);
  unmerge_from(c, v);
  unmerge_from(c, v);
  CHECK(v.empty());
}
