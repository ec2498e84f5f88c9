#pragma once

#include "usage_ledger/contribution.hpp"
#include "usage_ledger/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace usage_ledger {

struct ParsedFile {
  std::vector<Message> records;
  // File-level value some formats state only once, such as a session model.
  std::optional<std::string> cached_scalar;
};

// One upstream tool. Implementations turn their own on-disk layout into
// normalized messages; the core never looks inside the files itself.
class ISource {
public:
  virtual ~ISource() = default;
  virtual std::string name() const = 0;
  virtual ContributionStrategy strategy() const = 0;
  virtual std::vector<std::string> discover_files() = 0;
  virtual std::optional<ParsedFile> parse_file(const std::string &path,
                                               std::string *err) = 0;
  virtual std::vector<std::string> watched_directories() const = 0;
  // Filters watcher events down to files this source would discover.
  virtual bool is_source_file(const std::string &path) const = 0;
};

struct SourceSpec {
  std::string name;
  ContributionStrategy strategy{ContributionStrategy::SingleSession};
  std::string root;
  std::string extension{".tsv"};
};

// Parses "name=strategy:root".
std::optional<SourceSpec> parse_source_spec(const std::string &text,
                                            std::string *err = nullptr);

std::unique_ptr<ISource> make_source(const SourceSpec &spec);

} // namespace usage_ledger
