#include "usage_ledger/config.hpp"

#include <algorithm>
#include <fstream>
#include <regex>
#include <sstream>

namespace usage_ledger {
namespace {
bool extract_u64(const std::string &text, const std::string &key,
                 std::uint64_t &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*([0-9]+)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  try {
    out = static_cast<std::uint64_t>(std::stoull(m[1].str()));
  } catch (const std::out_of_range &) {
    out = UINT64_MAX;
  }
  return true;
}
bool extract_bool(const std::string &text, const std::string &key,
                  bool &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*(true|false)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str() == "true";
  return true;
}
bool extract_string(const std::string &text, const std::string &key,
                    std::string &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*\"([^\"]*)\"");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str();
  return true;
}
bool extract_string_array(const std::string &text, const std::string &key,
                          std::vector<std::string> &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*\\[([^\\]]*)\\]");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  const std::string body = m[1].str();
  std::regex item("\"([^\"]*)\"");
  out.clear();
  for (auto it = std::sregex_iterator(body.begin(), body.end(), item);
       it != std::sregex_iterator(); ++it)
    out.push_back((*it)[1].str());
  return true;
}
} // namespace

bool parse_config_text(const std::string &text, LedgerConfig *cfg,
                       std::string *err) {
  if (text.find('{') == std::string::npos ||
      text.find('}') == std::string::npos) {
    if (err)
      *err = "invalid schema";
    return false;
  }

  LedgerConfig c = *cfg;
  std::uint64_t u;
  std::string s;
  bool b;
  if (extract_string(text, "cache_dir", s) && !s.empty())
    c.cache_dir = s;
  if (extract_u64(text, "worker_threads", u))
    c.worker_threads = static_cast<std::size_t>(
        std::clamp(u, static_cast<std::uint64_t>(1),
                   static_cast<std::uint64_t>(256)));
  if (extract_string(text, "fsync", s)) {
    auto mode = parse_fsync_mode(s);
    if (!mode) {
      if (err)
        *err = "unknown fsync mode '" + s + "'";
      return false;
    }
    c.fsync = *mode;
  }
  if (extract_u64(text, "persist_interval_ms", u))
    c.persist_interval_ms = std::clamp(
        u, static_cast<std::uint64_t>(100), static_cast<std::uint64_t>(3600000));
  if (extract_bool(text, "auto_upload", b))
    c.auto_upload = b;
  if (extract_u64(text, "upload_debounce_ms", u))
    c.upload_debounce_ms = std::clamp(
        u, static_cast<std::uint64_t>(0), static_cast<std::uint64_t>(600000));
  if (extract_string(text, "upload_spool_path", s))
    c.upload_spool_path = s;
  if (extract_string(text, "log_level", s))
    c.log_level = s;

  std::vector<std::string> items;
  if (extract_string_array(text, "sources", items)) {
    c.sources.clear();
    for (const auto &item : items) {
      auto spec = parse_source_spec(item, err);
      if (!spec)
        return false;
      c.sources.push_back(std::move(*spec));
    }
  }

  *cfg = std::move(c);
  return true;
}

bool load_config(const std::string &path, LedgerConfig *cfg,
                 std::string *err) {
  std::ifstream in(path);
  if (!in.is_open()) {
    if (err)
      *err = "config file not found: " + path;
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  return parse_config_text(ss.str(), cfg, err);
}

CoordinatorConfig coordinator_config(const LedgerConfig &cfg) {
  CoordinatorConfig out;
  out.cache.dir = cfg.cache_dir;
  out.cache.fsync = cfg.fsync;
  out.worker_threads = cfg.worker_threads;
  return out;
}

std::string describe(const LedgerConfig &cfg) {
  std::ostringstream os;
  os << "cache_dir:" << cfg.cache_dir << "\n";
  os << "worker_threads:" << cfg.worker_threads << "\n";
  os << "fsync:" << fsync_mode_name(cfg.fsync) << "\n";
  os << "persist_interval_ms:" << cfg.persist_interval_ms << "\n";
  os << "auto_upload:" << (cfg.auto_upload ? "true" : "false") << "\n";
  os << "upload_debounce_ms:" << cfg.upload_debounce_ms << "\n";
  os << "upload_spool_path:" << cfg.upload_spool_path << "\n";
  os << "log_level:" << cfg.log_level << "\n";
  for (const auto &s : cfg.sources)
    os << "source:" << s.name << "=" << strategy_name(s.strategy) << ":"
       << s.root << "\n";
  return os.str();
}

} // namespace usage_ledger
