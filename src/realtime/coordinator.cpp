#include "usage_ledger/coordinator.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <unordered_set>

#include <spdlog/spdlog.h>

namespace usage_ledger {

const char *source_phase_name(SourcePhase p) {
  switch (p) {
  case SourcePhase::Uninitialized:
    return "uninitialized";
  case SourcePhase::Loaded:
    return "loaded";
  case SourcePhase::Updating:
    return "updating";
  }
  return "unknown";
}

const SourceSnapshot *LedgerSnapshot::find(const std::string &name) const {
  for (const auto &s : sources)
    if (s.name == name)
      return &s;
  return nullptr;
}

RealtimeCoordinator::RealtimeCoordinator(
    CoordinatorConfig cfg, std::vector<std::shared_ptr<ISource>> sources,
    ModelInterner &interner)
    : cfg_(std::move(cfg)), interner_(interner) {
  auto empty = std::make_shared<const AggregateView>();
  for (auto &source : sources) {
    CacheConfig cache = cfg_.cache;
    cache.dir = cfg_.cache.dir + "/" + source->name();
    const auto name = source->name();
    states_.push_back(
        std::make_unique<SourceState>(std::move(source), cache, interner_));
    current_.push_back({name, SourcePhase::Uninitialized, 0, empty});
  }
}

RealtimeCoordinator::~RealtimeCoordinator() { stop(); }

void RealtimeCoordinator::start() {
  auto started = std::chrono::steady_clock::now();
  {
    ThreadPool pool(cfg_.worker_threads);
    for (auto &st : states_)
      load_source(*st, pool);
  }
  const auto s = stats();
  spdlog::info("loaded {} files ({} from cache) across {} sources in {} ms",
               s.files_loaded, s.cache_hits_at_start, states_.size(),
               std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::steady_clock::now() - started)
                   .count());
}

void RealtimeCoordinator::load_source(SourceState &st, ThreadPool &pool) {
  std::lock_guard<std::mutex> lk(st.mu);
  const auto name = st.source->name();
  auto &repo = st.repo.get();

  const auto files = st.source->discover_files();
  const std::unordered_set<std::string> current(files.begin(), files.end());
  const auto pruned = repo.prune_deleted(name, current);
  forget_vanished(st, current);
  if (!pruned.empty())
    spdlog::info("{}: pruned {} vanished files from cache", name,
                 pruned.size());

  std::vector<std::future<FileResult>> pending;
  pending.reserve(files.size());
  for (const auto &path : files)
    pending.push_back(
        pool.submit([this, &st, path] { return load_file(st, path); }));

  st.view.clear();
  std::uint64_t loaded = 0, hits = 0;
  for (auto &f : pending) {
    FileResult r = f.get();
    if (!r.contribution)
      continue;
    merge_into(*r.contribution, st.view);
    ++loaded;
    if (r.from_cache)
      ++hits;
  }
  {
    std::lock_guard<std::mutex> slk(stats_mu_);
    stats_.files_loaded += loaded;
    stats_.cache_hits_at_start += hits;
  }

  std::string err;
  if (!repo.persist(&err))
    spdlog::warn("{}: initial persist failed: {}", name, err);
  st.phase = SourcePhase::Loaded;
  publish(st);
}

RealtimeCoordinator::FileResult
RealtimeCoordinator::load_file(SourceState &st, const std::string &path) {
  FileResult r;
  r.path = path;
  auto &repo = st.repo.get();
  const CacheKey key{st.source->name(), path};
  std::string err;
  auto identity = read_identity(path, &err);
  if (!identity) {
    parse_log_.warn(path, st.source->name() + ": " + err);
    repo.remove(key);
    return r;
  }
  if (auto hit = repo.get(key, *identity)) {
    r.contribution = std::move(hit->contribution);
    r.from_cache = true;
    return r;
  }
  auto entry = parse_entry(st, path, *identity);
  if (!entry) {
    // A stale entry whose contribution is not merged must not linger.
    repo.remove(key);
    return r;
  }
  r.contribution = entry->contribution;
  repo.insert(key, std::move(*entry));
  return r;
}

std::optional<CacheEntry>
RealtimeCoordinator::parse_entry(SourceState &st, const std::string &path,
                                 const FileIdentity &identity) {
  std::string err;
  auto parsed = st.source->parse_file(path, &err);
  if (!parsed) {
    parse_log_.warn(path, st.source->name() + ": cannot parse " + path +
                              ": " + err);
    std::lock_guard<std::mutex> lk(stats_mu_);
    ++stats_.parse_failures;
    return std::nullopt;
  }
  parse_log_.forget(path);
  CacheEntry e;
  e.identity = identity;
  e.contribution = from_records(st.source->strategy(), parsed->records, interner_);
  e.cached_scalar = std::move(parsed->cached_scalar);
  e.records = std::move(parsed->records);
  return e;
}

void RealtimeCoordinator::handle_event(const WatchEvent &ev) {
  {
    std::lock_guard<std::mutex> lk(stats_mu_);
    ++stats_.events;
  }
  if (ev.kind == WatchEvent::Kind::Error) {
    spdlog::warn("watcher: {}", ev.message);
    return;
  }
  if (ev.kind == WatchEvent::Kind::Rescan) {
    const auto p = phase(ev.source);
    if (!p || *p == SourcePhase::Uninitialized)
      return;
    spdlog::info("{}: rescanning after a directory change", ev.source);
    reconcile(ev.source);
    std::lock_guard<std::mutex> lk(stats_mu_);
    ++stats_.rescans;
    return;
  }
  SourceState *st = find(ev.source);
  if (st == nullptr) {
    spdlog::debug("event for unknown source {}: {}", ev.source, ev.path);
    return;
  }
  if (!st->source->is_source_file(ev.path))
    return;

  std::lock_guard<std::mutex> lk(st->mu);
  if (st->phase == SourcePhase::Uninitialized) {
    spdlog::debug("{}: ignoring event before initial load: {}", ev.source,
                  ev.path);
    return;
  }
  st->phase = SourcePhase::Updating;
  const bool changed = ev.kind == WatchEvent::Kind::Deleted
                           ? process_deleted(*st, ev.path)
                           : process_changed(*st, ev.path);
  st->phase = SourcePhase::Loaded;
  if (changed)
    publish(*st);
}

bool RealtimeCoordinator::process_changed(SourceState &st,
                                          const std::string &path) {
  auto &repo = st.repo.get();
  const CacheKey key{st.source->name(), path};
  std::string err;
  auto identity = read_identity(path, &err);
  if (!identity)
    return process_deleted(st, path);

  auto prev = repo.get_unchecked(key);
  if (prev && prev->identity == *identity) {
    std::lock_guard<std::mutex> lk(stats_mu_);
    ++stats_.unchanged_skips;
    return false;
  }
  if (prev)
    unmerge_from(prev->contribution, st.view);
  {
    std::lock_guard<std::mutex> lk(stats_mu_);
    ++stats_.reparses;
  }

  auto entry = parse_entry(st, path, *identity);
  if (!entry) {
    if (prev)
      repo.remove(key);
    return prev.has_value();
  }
  merge_into(entry->contribution, st.view);
  repo.insert(key, std::move(*entry));
  return true;
}

bool RealtimeCoordinator::process_deleted(SourceState &st,
                                          const std::string &path) {
  parse_log_.forget(path);
  auto removed = st.repo.get().remove({st.source->name(), path});
  if (!removed)
    return false;
  unmerge_from(removed->contribution, st.view);
  std::lock_guard<std::mutex> lk(stats_mu_);
  ++stats_.deletions;
  return true;
}

// Files that never parsed have no cache entry to prune, so their warnings
// are dropped by path.
void RealtimeCoordinator::forget_vanished(
    SourceState &st, const std::unordered_set<std::string> &current) {
  const auto table = routes();
  const auto name = st.source->name();
  parse_log_.forget_if([&](const std::string &path) {
    return current.count(path) == 0 && route_path(path, table) == name;
  });
}

void RealtimeCoordinator::run(EventQueue<WatchEvent> &queue) {
  if (running_.exchange(true))
    return;
  run_thread_ = std::thread([this, &queue] {
    while (running_) {
      auto ev = queue.pop_for(std::chrono::milliseconds(100));
      if (!ev) {
        if (queue.closed())
          break;
        continue;
      }
      handle_event(*ev);
    }
  });
}

void RealtimeCoordinator::stop() {
  running_ = false;
  if (run_thread_.joinable())
    run_thread_.join();
}

bool RealtimeCoordinator::reconcile(const std::string &source) {
  SourceState *st = find(source);
  if (st == nullptr)
    return false;
  std::lock_guard<std::mutex> lk(st->mu);
  auto &repo = st->repo.get();
  const auto files = st->source->discover_files();
  const std::unordered_set<std::string> current(files.begin(), files.end());

  bool changed = false;
  for (const auto &[key, entry] : repo.prune_deleted(source, current)) {
    unmerge_from(entry.contribution, st->view);
    changed = true;
  }
  forget_vanished(*st, current);
  st->phase = SourcePhase::Updating;
  for (const auto &path : files)
    changed = process_changed(*st, path) || changed;
  st->phase = SourcePhase::Loaded;
  if (changed)
    publish(*st);
  return true;
}

bool RealtimeCoordinator::rebuild(const std::string &source) {
  SourceState *st = find(source);
  if (st == nullptr)
    return false;
  std::lock_guard<std::mutex> lk(st->mu);
  st->view.clear();
  for (const auto &[key, entry] : st->repo.get().entries_for(source))
    merge_into(entry.contribution, st->view);
  st->phase = SourcePhase::Loaded;
  publish(*st);
  return true;
}

bool RealtimeCoordinator::persist() {
  bool ok = true;
  for (auto &st : states_) {
    if (!st->repo.initialized())
      continue;
    std::string err;
    ok = st->repo.get().persist(&err) && ok;
  }
  return ok;
}

RouteTable RealtimeCoordinator::routes() const {
  RouteTable routes;
  for (const auto &st : states_)
    for (auto dir : st->source->watched_directories()) {
      while (dir.size() > 1 && dir.back() == '/')
        dir.pop_back();
      routes[dir] = st->source->name();
    }
  return routes;
}

void RealtimeCoordinator::set_publish_hook(PublishHook hook) {
  std::lock_guard<std::mutex> lk(publish_mu_);
  hook_ = std::move(hook);
}

void RealtimeCoordinator::publish(SourceState &st) {
  PublishHook hook;
  {
    std::lock_guard<std::mutex> lk(publish_mu_);
    const auto name = st.source->name();
    for (auto &s : current_) {
      if (s.name != name)
        continue;
      s.phase = st.phase.load();
      s.files = st.repo.get().size();
      s.view = std::make_shared<const AggregateView>(st.view);
    }
    auto snap = std::make_shared<LedgerSnapshot>();
    snap->version = ++publish_version_;
    snap->sources = current_;
    channel_.publish(std::move(snap));
    hook = hook_;
  }
  {
    std::lock_guard<std::mutex> lk(stats_mu_);
    ++stats_.publishes;
  }
  if (hook)
    hook();
}

std::optional<std::vector<Message>>
RealtimeCoordinator::load_records(const std::string &source,
                                  const std::string &path, std::string *err) {
  SourceState *st = find(source);
  if (st == nullptr) {
    if (err)
      *err = "unknown source " + source;
    return std::nullopt;
  }
  return st->repo.get().load_records({source, path}, err);
}

std::vector<Message> RealtimeCoordinator::full_corpus() {
  std::vector<Message> out;
  for (auto &st : states_) {
    auto &repo = st->repo.get();
    const auto name = st->source->name();
    for (const auto &[key, entry] : repo.entries_for(name)) {
      std::string err;
      auto records = repo.load_records(key, &err);
      if (!records) {
        spdlog::debug("{}: skipping {} in corpus: {}", name, key.path, err);
        continue;
      }
      out.insert(out.end(), std::make_move_iterator(records->begin()),
                 std::make_move_iterator(records->end()));
    }
  }
  return out;
}

std::optional<SourcePhase>
RealtimeCoordinator::phase(const std::string &source) const {
  SourceState *st = find(source);
  if (st == nullptr)
    return std::nullopt;
  return st->phase.load();
}

CoordinatorStats RealtimeCoordinator::stats() const {
  CoordinatorStats s;
  {
    std::lock_guard<std::mutex> lk(stats_mu_);
    s = stats_;
  }
  s.parse_warnings = parse_log_.distinct();
  return s;
}

RealtimeCoordinator::SourceState *
RealtimeCoordinator::find(const std::string &name) const {
  for (const auto &st : states_)
    if (st->source->name() == name)
      return st.get();
  return nullptr;
}

} // namespace usage_ledger
