#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace usage_ledger {

struct ModelKey {
  std::uint16_t value{0};

  auto operator<=>(const ModelKey &) const = default;
};

// Append-only bijection between model names and ModelKeys. Construct one per
// process at startup and pass it by reference; keys are never reused or
// removed, so they stay valid for the lifetime of the interner. Keys are
// process-local and must not be persisted; persist names instead.
class ModelInterner {
public:
  static constexpr std::size_t kMaxModels = 0xFFFF;

  ModelInterner() = default;
  ModelInterner(const ModelInterner &) = delete;
  ModelInterner &operator=(const ModelInterner &) = delete;

  // Returns nullopt only when the key space is exhausted.
  std::optional<ModelKey> intern(std::string_view name);
  std::optional<ModelKey> find(std::string_view name) const;
  std::string resolve(ModelKey key) const;
  std::size_t size() const;

private:
  mutable std::shared_mutex mu_;
  std::unordered_map<std::string, ModelKey> by_name_;
  // deque keeps element addresses stable while growing.
  std::deque<std::string> names_;
};

} // namespace usage_ledger
