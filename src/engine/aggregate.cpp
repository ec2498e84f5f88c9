#include "usage_ledger/aggregate.hpp"

#include <algorithm>

namespace usage_ledger {
namespace {
std::uint32_t sub_u32(std::uint32_t a, std::uint32_t b) {
  return a > b ? a - b : 0;
}
} // namespace

std::int64_t SessionAggregate::first_timestamp() const {
  return origins.empty() ? 0 : origins.front().first_timestamp;
}

CompactDate SessionAggregate::first_date() const {
  return CompactDate::from_epoch_seconds(first_timestamp());
}

std::optional<std::string> SessionAggregate::display_name() const {
  for (const auto &o : origins)
    if (o.name.has_value() && !o.name->empty())
      return o.name;
  return std::nullopt;
}

void AggregateView::add_day(const DayTally &d) {
  auto &day = days_[d.date];
  day.date = d.date;
  day.user_messages = saturating_add32(day.user_messages, d.user_messages);
  day.ai_messages = saturating_add32(day.ai_messages, d.ai_messages);
  day.stats += d.stats.widen();
  day.models.add_all(d.models);
  ++day.contributors;
}

void AggregateView::subtract_day(const DayTally &d) {
  auto it = days_.find(d.date);
  if (it == days_.end())
    return;
  auto &day = it->second;
  day.user_messages = sub_u32(day.user_messages, d.user_messages);
  day.ai_messages = sub_u32(day.ai_messages, d.ai_messages);
  day.stats -= d.stats.widen();
  day.models.subtract_all(d.models);
  if (--day.contributors == 0)
    days_.erase(it);
}

void AggregateView::add_session(const SessionTally &s) {
  std::optional<CompactDate> before;
  auto it = sessions_.find(s.session_id);
  if (it == sessions_.end())
    it = sessions_.emplace(s.session_id, SessionAggregate{}).first;
  else
    before = it->second.first_date();

  auto &agg = it->second;
  agg.session_id = s.session_id;
  agg.user_messages = saturating_add32(agg.user_messages, s.user_messages);
  agg.ai_messages = saturating_add32(agg.ai_messages, s.ai_messages);
  agg.stats += s.stats.widen();
  agg.models.add_all(s.models);
  agg.origins.insert(
      std::upper_bound(agg.origins.begin(), agg.origins.end(), s.origin),
      s.origin);

  const CompactDate after = agg.first_date();
  if (before != after)
    move_conversation_start(before, after);
}

void AggregateView::subtract_session(const SessionTally &s) {
  auto it = sessions_.find(s.session_id);
  if (it == sessions_.end())
    return;
  auto &agg = it->second;
  const CompactDate before = agg.first_date();

  auto pos = std::lower_bound(agg.origins.begin(), agg.origins.end(), s.origin);
  if (pos != agg.origins.end() && *pos == s.origin)
    agg.origins.erase(pos);
  agg.user_messages = sub_u32(agg.user_messages, s.user_messages);
  agg.ai_messages = sub_u32(agg.ai_messages, s.ai_messages);
  agg.stats -= s.stats.widen();
  agg.models.subtract_all(s.models);

  std::optional<CompactDate> after;
  if (agg.origins.empty())
    sessions_.erase(it);
  else
    after = agg.first_date();
  if (after != before)
    move_conversation_start(before, after);
}

void AggregateView::move_conversation_start(std::optional<CompactDate> from,
                                            std::optional<CompactDate> to) {
  if (from.has_value()) {
    auto it = days_.find(*from);
    if (it != days_.end())
      it->second.conversations = sub_u32(it->second.conversations, 1);
  }
  if (to.has_value()) {
    auto it = days_.find(*to);
    if (it != days_.end())
      ++it->second.conversations;
  }
}

const DailyStats *AggregateView::day(CompactDate date) const {
  auto it = days_.find(date);
  return it == days_.end() ? nullptr : &it->second;
}

const SessionAggregate *AggregateView::session(const std::string &id) const {
  auto it = sessions_.find(id);
  return it == sessions_.end() ? nullptr : &it->second;
}

TallyStats AggregateView::totals() const {
  TallyStats t;
  for (const auto &[_, d] : days_)
    t += d.stats;
  return t;
}

std::uint64_t AggregateView::total_messages() const {
  std::uint64_t n = 0;
  for (const auto &[_, d] : days_)
    n += static_cast<std::uint64_t>(d.user_messages) + d.ai_messages;
  return n;
}

void AggregateView::clear() {
  days_.clear();
  sessions_.clear();
}

} // namespace usage_ledger
