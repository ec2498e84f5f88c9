#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace usage_ledger {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class MessageRole : std::uint8_t { User = 0, Assistant = 1 };

// Full-width statistics of one normalized message.
struct Stats {
  std::uint64_t input_tokens{0};
  std::uint64_t output_tokens{0};
  std::uint64_t reasoning_tokens{0};
  std::uint64_t cache_creation_tokens{0};
  std::uint64_t cache_read_tokens{0};
  std::uint64_t cached_tokens{0};
  double cost{0.0};
  std::uint32_t tool_calls{0};

  bool operator==(const Stats &) const = default;
};

// One record produced by a source parser. A message without a model is a
// user message.
struct Message {
  std::string application;
  std::int64_t timestamp{0}; // epoch seconds, UTC
  std::string project_hash;
  std::string session_id;
  std::optional<std::string> local_hash;
  std::string global_hash;
  std::optional<std::string> model;
  MessageRole role{MessageRole::User};
  Stats stats;
  std::optional<std::string> session_name;
  std::optional<std::string> uuid;

  bool is_ai() const { return model.has_value(); }
  bool operator==(const Message &) const = default;
};

// Calendar day in UTC, packed so it orders and hashes as one integer.
struct CompactDate {
  std::uint32_t packed{0};

  static CompactDate from_ymd(int year, unsigned month, unsigned day);
  static CompactDate from_epoch_seconds(std::int64_t ts);

  int year() const { return static_cast<int>(packed >> 9); }
  unsigned month() const { return (packed >> 5) & 0xF; }
  unsigned day() const { return packed & 0x1F; }
  std::string to_string() const;

  auto operator<=>(const CompactDate &) const = default;
};

std::optional<CompactDate> parse_date(const std::string &text);

// What a file looked like when it was last parsed.
struct FileIdentity {
  std::uint64_t size{0};
  std::int64_t mtime_ns{0};
  std::optional<std::uint64_t> fingerprint;

  bool operator==(const FileIdentity &) const = default;
};

std::optional<FileIdentity> read_identity(const std::string &path,
                                          std::string *err = nullptr);

struct CacheKey {
  std::string source;
  std::string path;

  std::string encoded() const { return source + '\x1f' + path; }
  bool operator==(const CacheKey &) const = default;
};

struct CacheKeyHash {
  std::size_t operator()(const CacheKey &k) const {
    const auto h1 = std::hash<std::string>{}(k.source);
    const auto h2 = std::hash<std::string>{}(k.path);
    return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
  }
};

std::uint64_t fnv1a(const std::string &s);

} // namespace usage_ledger
