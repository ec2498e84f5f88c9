#pragma once

#include "usage_ledger/aggregate.hpp"
#include "usage_ledger/model_interner.hpp"
#include "usage_ledger/packed_stats.hpp"
#include "usage_ledger/types.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace usage_ledger {

enum class ContributionStrategy { SingleMessage, SingleSession, MultiSession };

const char *strategy_name(ContributionStrategy s);
std::optional<ContributionStrategy> parse_strategy(const std::string &name);

// A file holding exactly one message. An empty file yields present == false
// and contributes nothing.
struct SingleMessageContribution {
  bool present{false};
  CompactDate date;
  std::int64_t timestamp{0};
  PackedStats stats;
  std::optional<ModelKey> model;
  bool ai{false};
  std::string session_id;
  std::optional<std::string> session_name;

  bool operator==(const SingleMessageContribution &) const = default;
};

// A file holding many messages of one session.
struct SingleSessionContribution {
  std::string session_id;
  std::optional<std::string> session_name;
  std::int64_t first_timestamp{0};
  std::vector<DayTally> days; // sorted by date

  bool operator==(const SingleSessionContribution &) const = default;
};

// A file holding messages of many sessions, such as a shared database.
struct MultiSessionContribution {
  std::vector<SessionTally> sessions; // sorted by session id
  std::vector<DayTally> days;         // sorted by date

  bool operator==(const MultiSessionContribution &) const = default;
};

using Contribution =
    std::variant<SingleMessageContribution, SingleSessionContribution,
                 MultiSessionContribution>;

// Builds the contribution of a file from its records. Records that do not
// fit the requested strategy are promoted to MultiSession so the result
// always describes the records exactly.
Contribution from_records(ContributionStrategy strategy,
                          const std::vector<Message> &records,
                          ModelInterner &interner);

void merge_into(const Contribution &c, AggregateView &view);
// Exact inverse of merge_into.
void unmerge_from(const Contribution &c, AggregateView &view);

ContributionStrategy strategy_of(const Contribution &c);
bool is_empty(const Contribution &c);

} // namespace usage_ledger
