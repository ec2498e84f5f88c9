#pragma once

#include "usage_ledger/model_interner.hpp"
#include "usage_ledger/types.hpp"

#include <cstdint>
#include <utility>
#include <vector>

namespace usage_ledger {

// Cost is kept as an integer number of 1e-5 dollar units so that adding and
// subtracting the same contribution always cancels exactly.
constexpr double kCostUnitsPerDollar = 100000.0;

std::uint64_t cost_to_units(double dollars);
double units_to_cost(std::uint64_t units);

struct TallyStats;

// Compact counter block stored inside contributions. Every field saturates at
// its maximum instead of wrapping.
struct PackedStats {
  std::uint32_t input_tokens{0};
  std::uint32_t output_tokens{0};
  std::uint32_t reasoning_tokens{0};
  std::uint32_t cache_creation_tokens{0};
  std::uint32_t cache_read_tokens{0};
  std::uint32_t cached_tokens{0};
  std::uint32_t cost_units{0};
  std::uint16_t tool_calls{0};

  static PackedStats pack(const Stats &s);
  PackedStats &operator+=(const PackedStats &o);
  TallyStats widen() const;
  bool operator==(const PackedStats &) const = default;
};

// Full-width counters used by the aggregate. Subtraction clamps at zero.
struct TallyStats {
  std::uint64_t input_tokens{0};
  std::uint64_t output_tokens{0};
  std::uint64_t reasoning_tokens{0};
  std::uint64_t cache_creation_tokens{0};
  std::uint64_t cache_read_tokens{0};
  std::uint64_t cached_tokens{0};
  std::uint64_t cost_units{0};
  std::uint64_t tool_calls{0};

  TallyStats &operator+=(const TallyStats &o);
  TallyStats &operator-=(const TallyStats &o);
  double cost() const { return units_to_cost(cost_units); }
  std::uint64_t total_tokens() const;
  bool is_zero() const { return *this == TallyStats{}; }
  bool operator==(const TallyStats &) const = default;
};

// Per-model message counts, sorted by key. Entries that drop to zero are
// erased.
class ModelCounts {
public:
  void add(ModelKey key, std::uint32_t n = 1);
  void subtract(ModelKey key, std::uint32_t n = 1);
  void add_all(const ModelCounts &o);
  void subtract_all(const ModelCounts &o);
  std::uint32_t count(ModelKey key) const;
  bool empty() const { return items_.empty(); }
  std::size_t size() const { return items_.size(); }
  const std::vector<std::pair<ModelKey, std::uint32_t>> &items() const {
    return items_;
  }
  bool operator==(const ModelCounts &) const = default;

private:
  std::vector<std::pair<ModelKey, std::uint32_t>> items_;
};

std::uint32_t saturating_add32(std::uint32_t a, std::uint64_t b);

} // namespace usage_ledger
