#include "usage_ledger/model_interner.hpp"

#include <mutex>

namespace usage_ledger {

std::optional<ModelKey> ModelInterner::intern(std::string_view name) {
  {
    std::shared_lock lk(mu_);
    auto it = by_name_.find(std::string(name));
    if (it != by_name_.end())
      return it->second;
  }
  std::unique_lock lk(mu_);
  auto it = by_name_.find(std::string(name));
  if (it != by_name_.end())
    return it->second;
  if (names_.size() >= kMaxModels)
    return std::nullopt;
  ModelKey key{static_cast<std::uint16_t>(names_.size())};
  names_.emplace_back(name);
  by_name_.emplace(names_.back(), key);
  return key;
}

std::optional<ModelKey> ModelInterner::find(std::string_view name) const {
  std::shared_lock lk(mu_);
  auto it = by_name_.find(std::string(name));
  if (it == by_name_.end())
    return std::nullopt;
  return it->second;
}

std::string ModelInterner::resolve(ModelKey key) const {
  std::shared_lock lk(mu_);
  if (key.value >= names_.size())
    return {};
  return names_[key.value];
}

std::size_t ModelInterner::size() const {
  std::shared_lock lk(mu_);
  return names_.size();
}

} // namespace usage_ledger
