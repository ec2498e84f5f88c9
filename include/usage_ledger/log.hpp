#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_set>

namespace usage_ledger {

// Installs a colour stdout logger as the spdlog default. Unknown levels fall
// back to info.
void init_logging(const std::string &level,
                  const std::string &name = "usage-ledger");

// Emits each distinct (key, message) warning only once. warn() returns
// whether it logged.
class LogOnce {
public:
  bool warn(const std::string &key, const std::string &message);
  std::size_t distinct() const;
  void forget(const std::string &key);
  // Drops the warnings of every key pred accepts.
  void forget_if(const std::function<bool(const std::string &key)> &pred);

private:
  mutable std::mutex mu_;
  std::unordered_set<std::string> seen_;
};

} // namespace usage_ledger
