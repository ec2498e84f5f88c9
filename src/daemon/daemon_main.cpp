#include "usage_ledger/config.hpp"
#include "usage_ledger/coordinator.hpp"
#include "usage_ledger/log.hpp"
#include "usage_ledger/model_interner.hpp"
#include "usage_ledger/upload.hpp"
#include "usage_ledger/watcher.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace {
volatile std::sig_atomic_t running = 1;
void on_signal(int) { running = 0; }

bool parse_u64(const std::string &s, std::uint64_t &out) {
  try {
    std::size_t idx = 0;
    out = std::stoull(s, &idx);
    return idx == s.size();
  } catch (const std::exception &) {
    return false;
  }
}

void usage() {
  std::cerr << "usage: usage_ledger_daemon [--config file] [--cache-dir dir]\n"
               "  [--source name=strategy:root]... [--threads n]\n"
               "  [--fsync never|everysec|always] [--log-level level]\n"
               "  [--auto-upload] [--upload-debounce-ms n] [--spool file]\n"
               "  [--once]\n";
}

void log_snapshot(const usage_ledger::LedgerSnapshot &snap) {
  for (const auto &s : snap.sources) {
    if (!s.view)
      continue;
    const auto totals = s.view->totals();
    spdlog::info("{} [{}]: files={} days={} sessions={} messages={} "
                 "tokens={} cost=${:.2f}",
                 s.name, usage_ledger::source_phase_name(s.phase), s.files,
                 s.view->days().size(), s.view->conversation_count(),
                 s.view->total_messages(), totals.total_tokens(),
                 totals.cost());
  }
}
} // namespace

int main(int argc, char **argv) {
  using namespace usage_ledger;

  LedgerConfig cfg;
  std::vector<std::string> source_args;
  std::string config_path;
  bool once = false;
  bool bad_args = false;

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    std::uint64_t u = 0;
    if (a == "--config" && i + 1 < argc)
      config_path = argv[++i];
    else if (a == "--cache-dir" && i + 1 < argc)
      cfg.cache_dir = argv[++i];
    else if (a == "--source" && i + 1 < argc)
      source_args.emplace_back(argv[++i]);
    else if (a == "--threads" && i + 1 < argc && parse_u64(argv[++i], u))
      cfg.worker_threads = static_cast<std::size_t>(u);
    else if (a == "--fsync" && i + 1 < argc) {
      auto mode = parse_fsync_mode(argv[++i]);
      if (!mode)
        bad_args = true;
      else
        cfg.fsync = *mode;
    } else if (a == "--log-level" && i + 1 < argc)
      cfg.log_level = argv[++i];
    else if (a == "--auto-upload")
      cfg.auto_upload = true;
    else if (a == "--upload-debounce-ms" && i + 1 < argc &&
             parse_u64(argv[++i], u))
      cfg.upload_debounce_ms = u;
    else if (a == "--spool" && i + 1 < argc)
      cfg.upload_spool_path = argv[++i];
    else if (a == "--once")
      once = true;
    else
      bad_args = true;
  }
  if (bad_args) {
    usage();
    return 2;
  }

  std::string err;
  if (!config_path.empty() && !load_config(config_path, &cfg, &err)) {
    std::cerr << "config: " << err << "\n";
    return 2;
  }
  for (const auto &arg : source_args) {
    auto spec = parse_source_spec(arg, &err);
    if (!spec) {
      std::cerr << "--source: " << err << "\n";
      return 2;
    }
    cfg.sources.push_back(std::move(*spec));
  }
  if (cfg.sources.empty()) {
    std::cerr << "no sources configured\n";
    usage();
    return 2;
  }

  init_logging(cfg.log_level, "usage-ledger-daemon");
  spdlog::debug("effective config:\n{}", describe(cfg));

  // Lives for the whole process; every component borrows it.
  ModelInterner interner;

  std::vector<std::shared_ptr<ISource>> sources;
  for (const auto &spec : cfg.sources)
    sources.push_back(make_source(spec));

  RealtimeCoordinator coordinator(coordinator_config(cfg), sources, interner);
  if (once) {
    coordinator.start();
    if (auto snap = coordinator.latest())
      log_snapshot(*snap);
    const bool ok = coordinator.persist();
    return ok ? 0 : 1;
  }

  // Watch before the initial scan so nothing written during it is missed.
  // Events queued meanwhile are applied once the sources are loaded.
  EventQueue<WatchEvent> queue;
  Watcher watcher(coordinator.routes(), queue);
  if (!watcher.start(&err))
    spdlog::warn("live updates disabled: {}", err);
  coordinator.start();
  if (auto snap = coordinator.latest())
    log_snapshot(*snap);

  std::unique_ptr<SpoolUploadSink> sink;
  std::unique_ptr<UploadScheduler> uploads;
  if (cfg.auto_upload) {
    sink = std::make_unique<SpoolUploadSink>(cfg.upload_spool_path);
    uploads = std::make_unique<UploadScheduler>(
        *sink, [&coordinator] { return coordinator.full_corpus(); },
        std::chrono::milliseconds(cfg.upload_debounce_ms));
    coordinator.set_publish_hook([&uploads] { uploads->notify_changed(); });
    uploads->notify_changed();
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  coordinator.run(queue);

  auto reader = coordinator.subscribe();
  reader.borrow();
  auto last_persist = std::chrono::steady_clock::now();
  const auto persist_every =
      std::chrono::milliseconds(cfg.persist_interval_ms);
  while (running) {
    if (reader.wait_changed(std::chrono::milliseconds(500))) {
      if (auto snap = reader.borrow())
        log_snapshot(*snap);
    }
    if (std::chrono::steady_clock::now() - last_persist >= persist_every) {
      if (!coordinator.persist())
        spdlog::warn("periodic persist incomplete, will retry");
      last_persist = std::chrono::steady_clock::now();
    }
  }

  spdlog::info("shutting down");
  watcher.stop();
  queue.close();
  coordinator.stop();
  coordinator.set_publish_hook(nullptr);
  if (uploads) {
    uploads->stop();
    const auto st = uploads->state();
    spdlog::info("upload status: {} ({} uploads)",
                 upload_status_name(st.status), st.completed_uploads);
  }
  const bool ok = coordinator.persist();
  spdlog::shutdown();
  return ok ? 0 : 1;
}
