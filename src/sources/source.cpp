#include "usage_ledger/source.hpp"

#include "usage_ledger/tsv_source.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace usage_ledger {
namespace {
// Names become cache subdirectories: one plain path component.
bool valid_source_name(const std::string &name) {
  if (name.empty() || name == "." || name == "..")
    return false;
  return std::all_of(name.begin(), name.end(), [](unsigned char c) {
    return std::isalnum(c) || c == '_' || c == '.' || c == '-';
  });
}
} // namespace

std::optional<SourceSpec> parse_source_spec(const std::string &text,
                                            std::string *err) {
  const auto eq = text.find('=');
  const auto colon = text.find(':', eq == std::string::npos ? 0 : eq);
  if (eq == std::string::npos || eq == 0 || colon == std::string::npos ||
      colon + 1 >= text.size()) {
    if (err)
      *err = "expected name=strategy:root, got '" + text + "'";
    return std::nullopt;
  }
  SourceSpec spec;
  spec.name = text.substr(0, eq);
  if (!valid_source_name(spec.name)) {
    if (err)
      *err = "invalid source name '" + spec.name +
             "': use letters, digits, '_', '.' or '-'";
    return std::nullopt;
  }
  const auto strategy = parse_strategy(text.substr(eq + 1, colon - eq - 1));
  if (!strategy) {
    if (err)
      *err = "unknown strategy in '" + text + "'";
    return std::nullopt;
  }
  spec.strategy = *strategy;
  std::error_code ec;
  auto root = std::filesystem::absolute(text.substr(colon + 1), ec);
  spec.root = ec ? text.substr(colon + 1) : root.lexically_normal().string();
  while (spec.root.size() > 1 && spec.root.back() == '/')
    spec.root.pop_back();
  return spec;
}

std::unique_ptr<ISource> make_source(const SourceSpec &spec) {
  return std::make_unique<TsvSource>(spec);
}

} // namespace usage_ledger
