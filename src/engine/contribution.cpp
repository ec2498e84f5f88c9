#include "usage_ledger/contribution.hpp"

#include <algorithm>
#include <map>
#include <type_traits>

namespace usage_ledger {
namespace {

struct Fold {
  std::map<CompactDate, DayTally> days;
  std::map<std::string, SessionTally> sessions;
};

void fold_record(const Message &m, ModelInterner &interner, Fold &f) {
  const CompactDate date = CompactDate::from_epoch_seconds(m.timestamp);
  std::optional<ModelKey> model;
  if (m.is_ai())
    model = interner.intern(*m.model);
  const PackedStats packed = m.is_ai() ? PackedStats::pack(m.stats) : PackedStats{};

  auto &d = f.days[date];
  d.date = date;
  if (m.is_ai()) {
    ++d.ai_messages;
    d.stats += packed;
    if (model)
      d.models.add(*model);
  } else {
    ++d.user_messages;
  }

  if (m.session_id.empty())
    return;
  auto [it, inserted] = f.sessions.try_emplace(m.session_id);
  auto &s = it->second;
  if (inserted) {
    s.session_id = m.session_id;
    s.origin.first_timestamp = m.timestamp;
  } else {
    s.origin.first_timestamp = std::min(s.origin.first_timestamp, m.timestamp);
  }
  if (!s.origin.name.has_value() && m.session_name.has_value() &&
      !m.session_name->empty())
    s.origin.name = m.session_name;
  if (m.is_ai()) {
    ++s.ai_messages;
    s.stats += packed;
    if (model)
      s.models.add(*model);
  } else {
    ++s.user_messages;
  }
}

Fold fold_all(const std::vector<Message> &records, ModelInterner &interner) {
  Fold f;
  for (const auto &m : records)
    fold_record(m, interner, f);
  return f;
}

std::vector<DayTally> day_list(Fold &f) {
  std::vector<DayTally> out;
  out.reserve(f.days.size());
  for (auto &[_, d] : f.days)
    out.push_back(std::move(d));
  return out;
}

MultiSessionContribution make_multi(Fold f) {
  MultiSessionContribution c;
  c.days = day_list(f);
  c.sessions.reserve(f.sessions.size());
  for (auto &[_, s] : f.sessions)
    c.sessions.push_back(std::move(s));
  return c;
}

SingleMessageContribution make_single_message(const Message &m,
                                              ModelInterner &interner) {
  SingleMessageContribution c;
  c.present = true;
  c.date = CompactDate::from_epoch_seconds(m.timestamp);
  c.timestamp = m.timestamp;
  c.ai = m.is_ai();
  if (c.ai) {
    c.stats = PackedStats::pack(m.stats);
    c.model = interner.intern(*m.model);
  }
  c.session_id = m.session_id;
  if (m.session_name.has_value() && !m.session_name->empty())
    c.session_name = m.session_name;
  return c;
}

DayTally day_of(const SingleMessageContribution &c) {
  DayTally d;
  d.date = c.date;
  d.stats = c.stats;
  if (c.ai) {
    d.ai_messages = 1;
    if (c.model)
      d.models.add(*c.model);
  } else {
    d.user_messages = 1;
  }
  return d;
}

SessionTally session_of(const SingleMessageContribution &c) {
  SessionTally s;
  s.session_id = c.session_id;
  s.stats = c.stats;
  s.ai_messages = c.ai ? 1 : 0;
  s.user_messages = c.ai ? 0 : 1;
  if (c.ai && c.model)
    s.models.add(*c.model);
  s.origin = {c.timestamp, c.session_name};
  return s;
}

SessionTally session_of(const SingleSessionContribution &c) {
  SessionTally s;
  s.session_id = c.session_id;
  for (const auto &d : c.days) {
    s.stats += d.stats;
    s.user_messages = saturating_add32(s.user_messages, d.user_messages);
    s.ai_messages = saturating_add32(s.ai_messages, d.ai_messages);
    s.models.add_all(d.models);
  }
  s.origin = {c.first_timestamp, c.session_name};
  return s;
}

template <class> inline constexpr bool kAlwaysFalse = false;

} // namespace

const char *strategy_name(ContributionStrategy s) {
  switch (s) {
  case ContributionStrategy::SingleMessage:
    return "single_message";
  case ContributionStrategy::SingleSession:
    return "single_session";
  case ContributionStrategy::MultiSession:
    return "multi_session";
  }
  return "unknown";
}

std::optional<ContributionStrategy> parse_strategy(const std::string &name) {
  if (name == "single_message")
    return ContributionStrategy::SingleMessage;
  if (name == "single_session")
    return ContributionStrategy::SingleSession;
  if (name == "multi_session")
    return ContributionStrategy::MultiSession;
  return std::nullopt;
}

Contribution from_records(ContributionStrategy strategy,
                          const std::vector<Message> &records,
                          ModelInterner &interner) {
  switch (strategy) {
  case ContributionStrategy::SingleMessage:
    if (records.empty())
      return SingleMessageContribution{};
    if (records.size() == 1)
      return make_single_message(records.front(), interner);
    break;
  case ContributionStrategy::SingleSession: {
    if (records.empty())
      return SingleSessionContribution{};
    const bool one_session = std::all_of(
        records.begin(), records.end(), [&](const Message &m) {
          return m.session_id == records.front().session_id;
        });
    if (!one_session)
      break;
    Fold f = fold_all(records, interner);
    SingleSessionContribution c;
    c.session_id = records.front().session_id;
    if (!f.sessions.empty()) {
      const auto &s = f.sessions.begin()->second;
      c.first_timestamp = s.origin.first_timestamp;
      c.session_name = s.origin.name;
    } else {
      c.first_timestamp = records.front().timestamp;
      for (const auto &m : records)
        c.first_timestamp = std::min(c.first_timestamp, m.timestamp);
    }
    c.days = day_list(f);
    return c;
  }
  case ContributionStrategy::MultiSession:
    break;
  }
  return make_multi(fold_all(records, interner));
}

void merge_into(const Contribution &c, AggregateView &view) {
  std::visit(
      [&](const auto &v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, SingleMessageContribution>) {
          if (!v.present)
            return;
          view.add_day(day_of(v));
          if (!v.session_id.empty())
            view.add_session(session_of(v));
        } else if constexpr (std::is_same_v<T, SingleSessionContribution>) {
          if (v.days.empty())
            return;
          for (const auto &d : v.days)
            view.add_day(d);
          if (!v.session_id.empty())
            view.add_session(session_of(v));
        } else if constexpr (std::is_same_v<T, MultiSessionContribution>) {
          for (const auto &d : v.days)
            view.add_day(d);
          for (const auto &s : v.sessions)
            view.add_session(s);
        } else {
          static_assert(kAlwaysFalse<T>, "unhandled contribution");
        }
      },
      c);
}

void unmerge_from(const Contribution &c, AggregateView &view) {
  std::visit(
      [&](const auto &v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, SingleMessageContribution>) {
          if (!v.present)
            return;
          if (!v.session_id.empty())
            view.subtract_session(session_of(v));
          view.subtract_day(day_of(v));
        } else if constexpr (std::is_same_v<T, SingleSessionContribution>) {
          if (v.days.empty())
            return;
          if (!v.session_id.empty())
            view.subtract_session(session_of(v));
          for (const auto &d : v.days)
            view.subtract_day(d);
        } else if constexpr (std::is_same_v<T, MultiSessionContribution>) {
          for (const auto &s : v.sessions)
            view.subtract_session(s);
          for (const auto &d : v.days)
            view.subtract_day(d);
        } else {
          static_assert(kAlwaysFalse<T>, "unhandled contribution");
        }
      },
      c);
}

ContributionStrategy strategy_of(const Contribution &c) {
  switch (c.index()) {
  case 0:
    return ContributionStrategy::SingleMessage;
  case 1:
    return ContributionStrategy::SingleSession;
  default:
    return ContributionStrategy::MultiSession;
  }
}

bool is_empty(const Contribution &c) {
  if (const auto *m = std::get_if<SingleMessageContribution>(&c))
    return !m->present;
  if (const auto *s = std::get_if<SingleSessionContribution>(&c))
    return s->days.empty();
  const auto &multi = std::get<MultiSessionContribution>(c);
  return multi.days.empty() && multi.sessions.empty();
}

} // namespace usage_ledger
