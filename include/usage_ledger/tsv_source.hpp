#pragma once

#include "usage_ledger/source.hpp"

#include <string>
#include <vector>

namespace usage_ledger {

// Source over files of already-normalized records, one per line:
//
//   timestamp  role  session  model  input  output  reasoning
//   cache_creation  cache_read  cached  cost  tool_calls  project
//   [session_name  [uuid]]
//
// Fields are tab separated. timestamp is epoch seconds or
// YYYY-MM-DDTHH:MM:SSZ; a model of "-" or "" means none. Lines starting with
// '#' are comments, except "#model<TAB>name", which sets the model used by
// assistant lines that leave theirs empty.
class TsvSource : public ISource {
public:
  explicit TsvSource(SourceSpec spec);

  std::string name() const override { return spec_.name; }
  ContributionStrategy strategy() const override { return spec_.strategy; }
  std::vector<std::string> discover_files() override;
  std::optional<ParsedFile> parse_file(const std::string &path,
                                       std::string *err) override;
  std::vector<std::string> watched_directories() const override;
  bool is_source_file(const std::string &path) const override;

  static std::optional<std::int64_t> parse_timestamp(const std::string &text);

private:
  bool parse_line(const std::string &line, const std::string &default_model,
                  std::size_t line_no, Message *out, std::string *err) const;

  SourceSpec spec_;
};

} // namespace usage_ledger
