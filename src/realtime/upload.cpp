#include "usage_ledger/upload.hpp"

#include <fstream>
#include <iomanip>

#include <spdlog/spdlog.h>

namespace usage_ledger {

const char *upload_status_name(UploadStatus s) {
  switch (s) {
  case UploadStatus::Idle:
    return "idle";
  case UploadStatus::Scheduled:
    return "scheduled";
  case UploadStatus::Uploading:
    return "uploading";
  case UploadStatus::Uploaded:
    return "uploaded";
  case UploadStatus::Failed:
    return "failed";
  }
  return "unknown";
}

bool SpoolUploadSink::upload(const std::vector<Message> &messages,
                             std::string *err) {
  std::ofstream out(path_, std::ios::app);
  if (!out.is_open()) {
    if (err)
      *err = "cannot open spool " + path_;
    return false;
  }
  out << "#batch\t" << messages.size() << "\n";
  for (const auto &m : messages) {
    out << m.timestamp << '\t' << m.application << '\t' << m.session_id
        << '\t' << (m.model ? *m.model : "-") << '\t' << m.stats.input_tokens
        << '\t' << m.stats.output_tokens << '\t' << m.stats.reasoning_tokens
        << '\t' << m.stats.cache_creation_tokens << '\t'
        << m.stats.cache_read_tokens << '\t' << std::fixed
        << std::setprecision(5) << m.stats.cost << '\t' << m.stats.tool_calls
        << '\t' << m.global_hash << "\n";
  }
  out.flush();
  if (!out) {
    if (err)
      *err = "write to spool " + path_ + " failed";
    return false;
  }
  return true;
}

UploadScheduler::UploadScheduler(IUploadSink &sink, CorpusFn corpus,
                                 std::chrono::milliseconds debounce)
    : sink_(sink), corpus_(std::move(corpus)), debounce_(debounce) {
  thread_ = std::thread([this] { loop(); });
}

UploadScheduler::~UploadScheduler() { stop(); }

void UploadScheduler::notify_changed() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (stopping_)
      return;
    if (in_flight_) {
      pending_ = true;
    } else {
      scheduled_ = true;
      deadline_ = std::chrono::steady_clock::now() + debounce_;
      state_.status = UploadStatus::Scheduled;
    }
  }
  cv_.notify_all();
}

void UploadScheduler::stop() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable())
    thread_.join();
}

UploadState UploadScheduler::state() const {
  std::lock_guard<std::mutex> lk(mu_);
  return state_;
}

bool UploadScheduler::in_flight() const {
  std::lock_guard<std::mutex> lk(mu_);
  return in_flight_;
}

bool UploadScheduler::pending() const {
  std::lock_guard<std::mutex> lk(mu_);
  return pending_;
}

bool UploadScheduler::wait_idle(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lk(mu_);
  return cv_.wait_for(lk, timeout,
                      [&] { return !scheduled_ && !in_flight_ && !pending_; });
}

void UploadScheduler::loop() {
  std::unique_lock<std::mutex> lk(mu_);
  while (true) {
    cv_.wait(lk, [&] { return stopping_ || scheduled_; });
    if (stopping_)
      return;
    while (!stopping_ && std::chrono::steady_clock::now() < deadline_)
      cv_.wait_until(lk, deadline_);
    if (stopping_)
      return;

    scheduled_ = false;
    in_flight_ = true;
    state_.status = UploadStatus::Uploading;
    lk.unlock();

    std::vector<Message> corpus = corpus_();
    std::string err;
    const bool ok = sink_.upload(corpus, &err);

    lk.lock();
    in_flight_ = false;
    if (ok) {
      state_.status = UploadStatus::Uploaded;
      state_.uploaded_messages = corpus.size();
      ++state_.completed_uploads;
      state_.last_error.clear();
      spdlog::info("uploaded {} messages", corpus.size());
    } else {
      state_.status = UploadStatus::Failed;
      ++state_.failed_uploads;
      state_.last_error = err;
      spdlog::warn("upload failed: {}", err);
    }
    if (pending_) {
      pending_ = false;
      scheduled_ = true;
      deadline_ = std::chrono::steady_clock::now() + debounce_;
      state_.status = UploadStatus::Scheduled;
    }
    cv_.notify_all();
  }
}

} // namespace usage_ledger
