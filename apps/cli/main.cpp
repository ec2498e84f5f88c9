#include "usage_ledger/aggregate.hpp"
#include "usage_ledger/cache_repository.hpp"
#include "usage_ledger/contribution.hpp"
#include "usage_ledger/log.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>

using namespace usage_ledger;

namespace {
void usage() {
  std::cerr << "usage: usage_ledger_cli <cache_dir> stats\n"
               "       usage_ledger_cli <cache_dir> days <source>\n"
               "       usage_ledger_cli <cache_dir> records <source> <path>\n"
               "       usage_ledger_cli <cache_dir> clear <source>\n";
}

CacheConfig source_cache(const std::string &root, const std::string &source) {
  CacheConfig cfg;
  cfg.dir = root + "/" + source;
  return cfg;
}

int cmd_stats(const std::string &root, ModelInterner &interner) {
  std::error_code ec;
  std::filesystem::directory_iterator it(root, ec);
  if (ec) {
    std::cerr << root << ": " << ec.message() << "\n";
    return 1;
  }
  for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
    if (!it->is_directory(ec))
      continue;
    const auto source = it->path().filename().string();
    CacheRepository repo(source_cache(root, source), interner);
    const auto outcome = repo.load();
    std::cout << "# " << source << " (" << load_outcome_name(outcome) << ")\n"
              << repo.info();
  }
  return 0;
}

int cmd_days(const std::string &root, const std::string &source,
             ModelInterner &interner) {
  CacheRepository repo(source_cache(root, source), interner);
  repo.load();
  AggregateView view;
  for (const auto &[key, entry] : repo.entries_for(source))
    merge_into(entry.contribution, view);
  std::cout << std::fixed << std::setprecision(2);
  for (const auto &[date, d] : view.days()) {
    std::cout << date.to_string() << " user=" << d.user_messages
              << " ai=" << d.ai_messages << " conversations=" << d.conversations
              << " tokens=" << d.stats.total_tokens() << " cost=$"
              << d.stats.cost();
    for (const auto &[model, n] : d.models.items())
      std::cout << " " << interner.resolve(model) << ":" << n;
    std::cout << "\n";
  }
  std::cout << "sessions=" << view.conversation_count()
            << " total_cost=$" << view.totals().cost() << "\n";
  return 0;
}

int cmd_records(const std::string &root, const std::string &source,
                const std::string &path, ModelInterner &interner) {
  CacheRepository repo(source_cache(root, source), interner);
  repo.load();
  std::string err;
  auto records = repo.load_records({source, path}, &err);
  if (!records) {
    std::cerr << err << "\n";
    return 1;
  }
  std::cout << std::fixed << std::setprecision(5);
  for (const auto &m : *records)
    std::cout << m.timestamp << '\t' << m.session_id << '\t'
              << (m.model ? *m.model : "-") << '\t' << m.stats.input_tokens
              << '\t' << m.stats.output_tokens << '\t' << m.stats.cost << "\n";
  return 0;
}

int cmd_clear(const std::string &root, const std::string &source,
              ModelInterner &interner) {
  CacheRepository repo(source_cache(root, source), interner);
  repo.load();
  repo.clear();
  std::string err;
  if (!repo.persist(&err)) {
    std::cerr << "clear failed: " << err << "\n";
    return 1;
  }
  return 0;
}
} // namespace

int main(int argc, char **argv) {
  if (argc < 3) {
    usage();
    return 2;
  }
  init_logging("warn", "usage-ledger-cli");
  ModelInterner interner;
  const std::string root = argv[1];
  const std::string cmd = argv[2];
  if (cmd == "stats")
    return cmd_stats(root, interner);
  if (cmd == "days" && argc == 4)
    return cmd_days(root, argv[3], interner);
  if (cmd == "records" && argc == 5)
    return cmd_records(root, argv[3], argv[4], interner);
  if (cmd == "clear" && argc == 4)
    return cmd_clear(root, argv[3], interner);
  usage();
  return 2;
}
