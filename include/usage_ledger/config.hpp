#pragma once

#include "usage_ledger/coordinator.hpp"
#include "usage_ledger/record_store.hpp"
#include "usage_ledger/source.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace usage_ledger {

struct LedgerConfig {
  std::string cache_dir{"./ledger_cache"};
  std::size_t worker_threads{4};
  FsyncMode fsync{FsyncMode::EverySec};
  std::uint64_t persist_interval_ms{30000};
  bool auto_upload{false};
  std::uint64_t upload_debounce_ms{5000};
  std::string upload_spool_path{"./ledger_upload.tsv"};
  std::string log_level{"info"};
  std::vector<SourceSpec> sources;
};

// Applies the fields present in a JSON document onto cfg. Out-of-range
// numbers are clamped. On error cfg is left untouched.
bool parse_config_text(const std::string &text, LedgerConfig *cfg,
                       std::string *err = nullptr);
bool load_config(const std::string &path, LedgerConfig *cfg,
                 std::string *err = nullptr);

CoordinatorConfig coordinator_config(const LedgerConfig &cfg);
std::string describe(const LedgerConfig &cfg);

} // namespace usage_ledger
