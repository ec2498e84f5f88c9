#pragma once

#include "usage_ledger/packed_stats.hpp"
#include "usage_ledger/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace usage_ledger {

// One file's effect on a single calendar day.
struct DayTally {
  CompactDate date;
  PackedStats stats;
  std::uint32_t user_messages{0};
  std::uint32_t ai_messages{0};
  ModelCounts models;

  bool operator==(const DayTally &) const = default;
};

// Where and when one contributor first saw a session.
struct SessionOrigin {
  std::int64_t first_timestamp{0};
  std::optional<std::string> name;

  auto operator<=>(const SessionOrigin &) const = default;
};

// One file's effect on a single session.
struct SessionTally {
  std::string session_id;
  PackedStats stats;
  std::uint32_t user_messages{0};
  std::uint32_t ai_messages{0};
  ModelCounts models;
  SessionOrigin origin;

  bool operator==(const SessionTally &) const = default;
};

struct DailyStats {
  CompactDate date;
  std::uint32_t user_messages{0};
  std::uint32_t ai_messages{0};
  std::uint32_t conversations{0};
  std::uint32_t contributors{0};
  TallyStats stats;
  ModelCounts models;

  bool operator==(const DailyStats &) const = default;
};

struct SessionAggregate {
  std::string session_id;
  std::uint32_t user_messages{0};
  std::uint32_t ai_messages{0};
  TallyStats stats;
  ModelCounts models;
  // Sorted; one element per contributing file.
  std::vector<SessionOrigin> origins;

  std::int64_t first_timestamp() const;
  CompactDate first_date() const;
  std::optional<std::string> display_name() const;
  std::size_t contributors() const { return origins.size(); }
  bool operator==(const SessionAggregate &) const = default;
};

// Per-source roll-up by date and by session. Only contributions mutate it:
// days are added before sessions and sessions are subtracted before days, so
// the day holding a session's conversation start always exists.
class AggregateView {
public:
  void add_day(const DayTally &d);
  void subtract_day(const DayTally &d);
  void add_session(const SessionTally &s);
  void subtract_session(const SessionTally &s);

  const std::map<CompactDate, DailyStats> &days() const { return days_; }
  const std::map<std::string, SessionAggregate> &sessions() const {
    return sessions_;
  }
  const DailyStats *day(CompactDate date) const;
  const SessionAggregate *session(const std::string &id) const;

  std::size_t conversation_count() const { return sessions_.size(); }
  TallyStats totals() const;
  std::uint64_t total_messages() const;
  bool empty() const { return days_.empty() && sessions_.empty(); }
  void clear();

  bool operator==(const AggregateView &) const = default;

private:
  void move_conversation_start(std::optional<CompactDate> from,
                               std::optional<CompactDate> to);

  std::map<CompactDate, DailyStats> days_;
  std::map<std::string, SessionAggregate> sessions_;
};

} // namespace usage_ledger
