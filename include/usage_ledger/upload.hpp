#pragma once

#include "usage_ledger/types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace usage_ledger {

// Remote collaborator receiving the full message corpus.
class IUploadSink {
public:
  virtual ~IUploadSink() = default;
  virtual bool upload(const std::vector<Message> &messages,
                      std::string *err) = 0;
};

// Appends every uploaded corpus to a local file, one record per line.
class SpoolUploadSink : public IUploadSink {
public:
  explicit SpoolUploadSink(std::string path) : path_(std::move(path)) {}
  bool upload(const std::vector<Message> &messages, std::string *err) override;

private:
  std::string path_;
};

enum class UploadStatus { Idle, Scheduled, Uploading, Uploaded, Failed };

const char *upload_status_name(UploadStatus s);

struct UploadState {
  UploadStatus status{UploadStatus::Idle};
  std::uint64_t uploaded_messages{0};
  std::uint64_t completed_uploads{0};
  std::uint64_t failed_uploads{0};
  std::string last_error;
};

// Runs an upload once changes have been quiet for the debounce interval.
// Changes that arrive during an upload set a pending flag and cause exactly
// one follow-up upload. Failures are reported through state(), never
// retried here.
class UploadScheduler {
public:
  using CorpusFn = std::function<std::vector<Message>()>;

  UploadScheduler(IUploadSink &sink, CorpusFn corpus,
                  std::chrono::milliseconds debounce);
  ~UploadScheduler();
  UploadScheduler(const UploadScheduler &) = delete;
  UploadScheduler &operator=(const UploadScheduler &) = delete;

  void notify_changed();
  void stop();

  UploadState state() const;
  bool in_flight() const;
  bool pending() const;
  // Blocks until nothing is scheduled or running, or the timeout expires.
  bool wait_idle(std::chrono::milliseconds timeout) const;

private:
  void loop();

  IUploadSink &sink_;
  CorpusFn corpus_;
  std::chrono::milliseconds debounce_;

  mutable std::mutex mu_;
  mutable std::condition_variable cv_;
  UploadState state_;
  bool scheduled_{false};
  bool in_flight_{false};
  bool pending_{false};
  bool stopping_{false};
  std::chrono::steady_clock::time_point deadline_{};
  std::thread thread_;
};

} // namespace usage_ledger
