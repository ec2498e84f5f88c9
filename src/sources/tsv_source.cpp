#include "usage_ledger/tsv_source.hpp"

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <system_error>

#include <spdlog/spdlog.h>

namespace usage_ledger {
namespace {
constexpr std::size_t kMinFields = 13;

std::vector<std::string> split_tabs(const std::string &line) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (true) {
    auto pos = line.find('\t', start);
    if (pos == std::string::npos) {
      out.push_back(line.substr(start));
      return out;
    }
    out.push_back(line.substr(start, pos - start));
    start = pos + 1;
  }
}

bool parse_u64(const std::string &s, std::uint64_t &out) {
  if (s.empty())
    return false;
  try {
    std::size_t idx = 0;
    out = std::stoull(s, &idx);
    return idx == s.size() && s.front() != '-';
  } catch (const std::exception &) {
    return false;
  }
}

bool parse_double(const std::string &s, double &out) {
  if (s.empty())
    return false;
  try {
    std::size_t idx = 0;
    out = std::stod(s, &idx);
    return idx == s.size() && out >= 0.0;
  } catch (const std::exception &) {
    return false;
  }
}
} // namespace

TsvSource::TsvSource(SourceSpec spec) : spec_(std::move(spec)) {}

std::vector<std::string> TsvSource::discover_files() {
  std::vector<std::string> out;
  std::error_code ec;
  if (!std::filesystem::is_directory(spec_.root, ec))
    return out;
  std::filesystem::recursive_directory_iterator it(
      spec_.root, std::filesystem::directory_options::skip_permission_denied,
      ec);
  for (; !ec && it != std::filesystem::recursive_directory_iterator();
       it.increment(ec)) {
    if (it->is_regular_file(ec) && is_source_file(it->path().string()))
      out.push_back(it->path().string());
  }
  if (ec)
    spdlog::warn("{}: discovery under {} stopped early: {}", spec_.name,
                 spec_.root, ec.message());
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<std::string> TsvSource::watched_directories() const {
  return {spec_.root};
}

bool TsvSource::is_source_file(const std::string &path) const {
  std::filesystem::path p(path);
  const auto name = p.filename().string();
  if (name.empty() || name.front() == '.')
    return false;
  return spec_.extension.empty() || p.extension().string() == spec_.extension;
}

std::optional<std::int64_t>
TsvSource::parse_timestamp(const std::string &text) {
  std::uint64_t secs = 0;
  if (parse_u64(text, secs))
    return static_cast<std::int64_t>(secs);
  std::tm tm{};
  char z = 0;
  if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%c", &tm.tm_year,
                  &tm.tm_mon, &tm.tm_mday, &tm.tm_hour, &tm.tm_min,
                  &tm.tm_sec, &z) != 7 ||
      z != 'Z')
    return std::nullopt;
  if (tm.tm_mon < 1 || tm.tm_mon > 12 || tm.tm_mday < 1 || tm.tm_mday > 31)
    return std::nullopt;
  tm.tm_year -= 1900;
  tm.tm_mon -= 1;
  return static_cast<std::int64_t>(timegm(&tm));
}

bool TsvSource::parse_line(const std::string &line,
                           const std::string &default_model,
                           std::size_t line_no, Message *out,
                           std::string *err) const {
  auto fail = [&](const std::string &why) {
    if (err)
      *err = "line " + std::to_string(line_no) + ": " + why;
    return false;
  };
  const auto f = split_tabs(line);
  if (f.size() < kMinFields)
    return fail("expected at least " + std::to_string(kMinFields) +
                " fields, got " + std::to_string(f.size()));

  Message m;
  m.application = spec_.name;
  auto ts = parse_timestamp(f[0]);
  if (!ts)
    return fail("bad timestamp '" + f[0] + "'");
  m.timestamp = *ts;
  if (f[1] == "user")
    m.role = MessageRole::User;
  else if (f[1] == "assistant")
    m.role = MessageRole::Assistant;
  else
    return fail("bad role '" + f[1] + "'");
  m.session_id = f[2];
  if (!f[3].empty() && f[3] != "-")
    m.model = f[3];
  else if (m.role == MessageRole::Assistant && !default_model.empty())
    m.model = default_model;

  std::uint64_t tool_calls = 0;
  if (!parse_u64(f[4], m.stats.input_tokens) ||
      !parse_u64(f[5], m.stats.output_tokens) ||
      !parse_u64(f[6], m.stats.reasoning_tokens) ||
      !parse_u64(f[7], m.stats.cache_creation_tokens) ||
      !parse_u64(f[8], m.stats.cache_read_tokens) ||
      !parse_u64(f[9], m.stats.cached_tokens) ||
      !parse_double(f[10], m.stats.cost) || !parse_u64(f[11], tool_calls))
    return fail("bad numeric field");
  m.stats.tool_calls = static_cast<std::uint32_t>(
      std::min<std::uint64_t>(tool_calls, 0xFFFFFFFFull));
  m.project_hash = f[12];
  if (f.size() > 13 && !f[13].empty())
    m.session_name = f[13];
  if (f.size() > 14 && !f[14].empty()) {
    m.uuid = f[14];
    m.local_hash = f[14];
  }
  m.global_hash = std::to_string(
      fnv1a(spec_.name + '\x1f' + m.session_id + '\x1f' +
            (m.uuid ? *m.uuid : std::to_string(m.timestamp))));
  *out = std::move(m);
  return true;
}

std::optional<ParsedFile> TsvSource::parse_file(const std::string &path,
                                                std::string *err) {
  std::ifstream in(path);
  if (!in.is_open()) {
    if (err)
      *err = "cannot open " + path;
    return std::nullopt;
  }
  ParsedFile parsed;
  std::string default_model;
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (line.empty())
      continue;
    if (line.front() == '#') {
      if (line.rfind("#model\t", 0) == 0) {
        default_model = line.substr(7);
        parsed.cached_scalar = default_model;
      }
      continue;
    }
    Message m;
    if (!parse_line(line, default_model, line_no, &m, err))
      return std::nullopt;
    parsed.records.push_back(std::move(m));
  }
  if (in.bad()) {
    if (err)
      *err = "read error on " + path;
    return std::nullopt;
  }
  return parsed;
}

} // namespace usage_ledger
