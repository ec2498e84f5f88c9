#include "usage_ledger/packed_stats.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace usage_ledger {
namespace {
std::uint16_t saturating_add16(std::uint16_t a, std::uint64_t b) {
  const std::uint64_t sum = static_cast<std::uint64_t>(a) + b;
  return static_cast<std::uint16_t>(
      std::min<std::uint64_t>(sum, std::numeric_limits<std::uint16_t>::max()));
}

std::uint64_t saturating_sub(std::uint64_t a, std::uint64_t b) {
  return a > b ? a - b : 0;
}
} // namespace

std::uint32_t saturating_add32(std::uint32_t a, std::uint64_t b) {
  const std::uint64_t sum = static_cast<std::uint64_t>(a) + b;
  return static_cast<std::uint32_t>(
      std::min<std::uint64_t>(sum, std::numeric_limits<std::uint32_t>::max()));
}

std::uint64_t cost_to_units(double dollars) {
  if (!(dollars > 0.0))
    return 0;
  const double units = std::round(dollars * kCostUnitsPerDollar);
  if (units >= static_cast<double>(std::numeric_limits<std::uint64_t>::max()))
    return std::numeric_limits<std::uint64_t>::max();
  return static_cast<std::uint64_t>(units);
}

double units_to_cost(std::uint64_t units) {
  return static_cast<double>(units) / kCostUnitsPerDollar;
}

PackedStats PackedStats::pack(const Stats &s) {
  PackedStats p;
  p.input_tokens = saturating_add32(0, s.input_tokens);
  p.output_tokens = saturating_add32(0, s.output_tokens);
  p.reasoning_tokens = saturating_add32(0, s.reasoning_tokens);
  p.cache_creation_tokens = saturating_add32(0, s.cache_creation_tokens);
  p.cache_read_tokens = saturating_add32(0, s.cache_read_tokens);
  p.cached_tokens = saturating_add32(0, s.cached_tokens);
  p.cost_units = saturating_add32(0, cost_to_units(s.cost));
  p.tool_calls = saturating_add16(0, s.tool_calls);
  return p;
}

PackedStats &PackedStats::operator+=(const PackedStats &o) {
  input_tokens = saturating_add32(input_tokens, o.input_tokens);
  output_tokens = saturating_add32(output_tokens, o.output_tokens);
  reasoning_tokens = saturating_add32(reasoning_tokens, o.reasoning_tokens);
  cache_creation_tokens =
      saturating_add32(cache_creation_tokens, o.cache_creation_tokens);
  cache_read_tokens = saturating_add32(cache_read_tokens, o.cache_read_tokens);
  cached_tokens = saturating_add32(cached_tokens, o.cached_tokens);
  cost_units = saturating_add32(cost_units, o.cost_units);
  tool_calls = saturating_add16(tool_calls, o.tool_calls);
  return *this;
}

TallyStats PackedStats::widen() const {
  TallyStats t;
  t.input_tokens = input_tokens;
  t.output_tokens = output_tokens;
  t.reasoning_tokens = reasoning_tokens;
  t.cache_creation_tokens = cache_creation_tokens;
  t.cache_read_tokens = cache_read_tokens;
  t.cached_tokens = cached_tokens;
  t.cost_units = cost_units;
  t.tool_calls = tool_calls;
  return t;
}

TallyStats &TallyStats::operator+=(const TallyStats &o) {
  input_tokens += o.input_tokens;
  output_tokens += o.output_tokens;
  reasoning_tokens += o.reasoning_tokens;
  cache_creation_tokens += o.cache_creation_tokens;
  cache_read_tokens += o.cache_read_tokens;
  cached_tokens += o.cached_tokens;
  cost_units += o.cost_units;
  tool_calls += o.tool_calls;
  return *this;
}

TallyStats &TallyStats::operator-=(const TallyStats &o) {
  input_tokens = saturating_sub(input_tokens, o.input_tokens);
  output_tokens = saturating_sub(output_tokens, o.output_tokens);
  reasoning_tokens = saturating_sub(reasoning_tokens, o.reasoning_tokens);
  cache_creation_tokens =
      saturating_sub(cache_creation_tokens, o.cache_creation_tokens);
  cache_read_tokens = saturating_sub(cache_read_tokens, o.cache_read_tokens);
  cached_tokens = saturating_sub(cached_tokens, o.cached_tokens);
  cost_units = saturating_sub(cost_units, o.cost_units);
  tool_calls = saturating_sub(tool_calls, o.tool_calls);
  return *this;
}

std::uint64_t TallyStats::total_tokens() const {
  return input_tokens + output_tokens + reasoning_tokens +
         cache_creation_tokens + cache_read_tokens;
}

void ModelCounts::add(ModelKey key, std::uint32_t n) {
  if (n == 0)
    return;
  auto it = std::lower_bound(
      items_.begin(), items_.end(), key,
      [](const auto &item, ModelKey k) { return item.first < k; });
  if (it != items_.end() && it->first == key)
    it->second = saturating_add32(it->second, n);
  else
    items_.insert(it, {key, n});
}

void ModelCounts::subtract(ModelKey key, std::uint32_t n) {
  auto it = std::lower_bound(
      items_.begin(), items_.end(), key,
      [](const auto &item, ModelKey k) { return item.first < k; });
  if (it == items_.end() || it->first != key)
    return;
  if (it->second <= n)
    items_.erase(it);
  else
    it->second -= n;
}

void ModelCounts::add_all(const ModelCounts &o) {
  for (const auto &[k, n] : o.items_)
    add(k, n);
}

void ModelCounts::subtract_all(const ModelCounts &o) {
  for (const auto &[k, n] : o.items_)
    subtract(k, n);
}

std::uint32_t ModelCounts::count(ModelKey key) const {
  auto it = std::lower_bound(
      items_.begin(), items_.end(), key,
      [](const auto &item, ModelKey k) { return item.first < k; });
  if (it == items_.end() || it->first != key)
    return 0;
  return it->second;
}

} // namespace usage_ledger
