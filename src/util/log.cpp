#include "usage_ledger/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace usage_ledger {

void init_logging(const std::string &level, const std::string &name) {
  auto logger = spdlog::get(name);
  if (!logger)
    logger = spdlog::stdout_color_mt(name);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  auto lvl = spdlog::level::from_str(level);
  if (lvl == spdlog::level::off && level != "off")
    lvl = spdlog::level::info;
  spdlog::set_level(lvl);
}

bool LogOnce::warn(const std::string &key, const std::string &message) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!seen_.insert(key + '\x1f' + message).second)
      return false;
  }
  spdlog::warn("{}", message);
  return true;
}

std::size_t LogOnce::distinct() const {
  std::lock_guard<std::mutex> lk(mu_);
  return seen_.size();
}

void LogOnce::forget(const std::string &key) {
  forget_if([&key](const std::string &k) { return k == key; });
}

void LogOnce::forget_if(
    const std::function<bool(const std::string &key)> &pred) {
  std::lock_guard<std::mutex> lk(mu_);
  for (auto it = seen_.begin(); it != seen_.end();) {
    if (pred(it->substr(0, it->find('\x1f'))))
      it = seen_.erase(it);
    else
      ++it;
  }
}

} // namespace usage_ledger
