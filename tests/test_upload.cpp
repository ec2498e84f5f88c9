#include "test_support.hpp"
#include "usage_ledger/upload.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <functional>
#include <fstream>
#include <thread>

using namespace usage_ledger;
using namespace usage_ledger::testing;
using namespace std::chrono_literals;

namespace {
class FakeSink : public IUploadSink {
public:
  bool upload(const std::vector<Message> &messages, std::string *err) override {
    ++calls;
    while (hold.load())
      std::this_thread::sleep_for(1ms);
    last_size = messages.size();
    if (fail.load()) {
      if (err)
        *err = "endpoint rejected batch";
      return false;
    }
    return true;
  }

  std::atomic<int> calls{0};
  std::atomic<bool> hold{false};
  std::atomic<bool> fail{false};
  std::atomic<std::size_t> last_size{0};
};

std::vector<Message> corpus() {
  return {user_msg(kDay0, "s"), ai_msg(kDay0 + 1, "s", "o3", 1, 1, 0.1)};
}

bool eventually(const std::function<bool()> &pred) {
  for (int i = 0; i < 500; ++i) {
    if (pred())
      return true;
    std::this_thread::sleep_for(10ms);
  }
  return false;
}
} // namespace

TEST_CASE("bursts of changes collapse into one upload", "[upload][debounce]") {
  FakeSink sink;
  UploadScheduler sched(sink, corpus, 100ms);
  CHECK(sched.state().status == UploadStatus::Idle);
  for (int i = 0; i < 5; ++i) {
    sched.notify_changed();
    std::this_thread::sleep_for(10ms);
  }
  CHECK(sched.state().status == UploadStatus::Scheduled);
  REQUIRE(sched.wait_idle(5000ms));
  CHECK(sink.calls.load() == 1);
  const auto st = sched.state();
  CHECK(st.status == UploadStatus::Uploaded);
  CHECK(st.completed_uploads == 1);
  CHECK(st.uploaded_messages == 2);
  CHECK(sink.last_size.load() == 2);
}

TEST_CASE("changes during an upload cause exactly one follow-up",
          "[upload][inflight]") {
  FakeSink sink;
  sink.hold = true;
  UploadScheduler sched(sink, corpus, 20ms);
  sched.notify_changed();
  REQUIRE(eventually([&] { return sched.in_flight(); }));
  CHECK(sched.state().status == UploadStatus::Uploading);

  for (int i = 0; i < 4; ++i)
    sched.notify_changed();
  CHECK(sched.pending());
  sink.hold = false;

  REQUIRE(sched.wait_idle(5000ms));
  CHECK(sink.calls.load() == 2);
  CHECK(sched.state().completed_uploads == 2);
  CHECK_FALSE(sched.pending());
}

TEST_CASE("failed uploads are reported and not retried", "[upload][failure]") {
  FakeSink sink;
  sink.fail = true;
  UploadScheduler sched(sink, corpus, 10ms);
  sched.notify_changed();
  REQUIRE(sched.wait_idle(5000ms));
  std::this_thread::sleep_for(100ms);
  const auto st = sched.state();
  CHECK(st.status == UploadStatus::Failed);
  CHECK(st.failed_uploads == 1);
  CHECK(st.last_error == "endpoint rejected batch");
  CHECK(sink.calls.load() == 1);
  CHECK(std::string(upload_status_name(st.status)) == "failed");
}

TEST_CASE("stop abandons a scheduled upload", "[upload]") {
  FakeSink sink;
  {
    UploadScheduler sched(sink, corpus, 10000ms);
    sched.notify_changed();
    sched.stop();
    sched.notify_changed();
  }
  CHECK(sink.calls.load() == 0);
}

TEST_CASE("spool sink appends one batch per upload", "[upload][spool]") {
  TempDir tmp("spool");
  SpoolUploadSink sink(tmp.file("spool.tsv"));
  std::string err;
  REQUIRE(sink.upload(corpus(), &err));
  REQUIRE(sink.upload({}, &err));
  std::ifstream in(tmp.file("spool.tsv"));
  std::string line;
  std::vector<std::string> lines;
  while (std::getline(in, line))
    lines.push_back(line);
  REQUIRE(lines.size() == 4);
  CHECK(lines[0] == "#batch\t2");
  CHECK(lines[2].find("\to3\t") != std::string::npos);
  CHECK(lines[3] == "#batch\t0");

  SpoolUploadSink bad(tmp.file("no/such/dir/spool.tsv"));
  CHECK_FALSE(bad.upload(corpus(), &err));
}
