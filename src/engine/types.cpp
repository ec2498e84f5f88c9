#include "usage_ledger/types.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>

#include <sys/stat.h>

namespace usage_ledger {

CompactDate CompactDate::from_ymd(int year, unsigned month, unsigned day) {
  CompactDate d;
  d.packed = (static_cast<std::uint32_t>(year) << 9) | ((month & 0xF) << 5) |
             (day & 0x1F);
  return d;
}

CompactDate CompactDate::from_epoch_seconds(std::int64_t ts) {
  const std::time_t t = static_cast<std::time_t>(ts);
  std::tm tm{};
  if (gmtime_r(&t, &tm) == nullptr)
    return from_ymd(1970, 1, 1);
  return from_ymd(tm.tm_year + 1900, static_cast<unsigned>(tm.tm_mon + 1),
                  static_cast<unsigned>(tm.tm_mday));
}

std::string CompactDate::to_string() const {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", year(), month(), day());
  return buf;
}

std::optional<CompactDate> parse_date(const std::string &text) {
  int y = 0;
  unsigned m = 0, d = 0;
  char tail = 0;
  if (std::sscanf(text.c_str(), "%4d-%2u-%2u%c", &y, &m, &d, &tail) != 3)
    return std::nullopt;
  if (m < 1 || m > 12 || d < 1 || d > 31 || y < 1970)
    return std::nullopt;
  return CompactDate::from_ymd(y, m, d);
}

std::optional<FileIdentity> read_identity(const std::string &path,
                                          std::string *err) {
  struct stat st {};
  if (::stat(path.c_str(), &st) != 0) {
    if (err)
      *err = path + ": " + std::strerror(errno);
    return std::nullopt;
  }
  if (!S_ISREG(st.st_mode)) {
    if (err)
      *err = path + ": not a regular file";
    return std::nullopt;
  }
  FileIdentity id;
  id.size = static_cast<std::uint64_t>(st.st_size);
  id.mtime_ns = static_cast<std::int64_t>(st.st_mtim.tv_sec) * 1000000000LL +
                static_cast<std::int64_t>(st.st_mtim.tv_nsec);
  return id;
}

std::uint64_t fnv1a(const std::string &s) {
  std::uint64_t hash = 14695981039346656037ull;
  for (unsigned char c : s) {
    hash ^= c;
    hash *= 1099511628211ull;
  }
  return hash;
}

} // namespace usage_ledger
