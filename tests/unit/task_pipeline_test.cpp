#include "internal/worker/task_pipeline.hpp"

#include <arrow/filesystem/localfs.h>
#include <arrow/util/io_util.h>

#include <algorithm>
#include <cassert>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

#include "internal/db/memory/memory_dead_letter_repository.hpp"
#include "internal/db/memory/memory_queue_repository.hpp"
#include "internal/download/request.hpp"
#include "internal/ledger/job_ledger.hpp"
#include "internal/storage/arrow_object_sink.hpp"
#include "internal/storage/checksum.hpp"
#include "internal/storage/destination.hpp"

namespace {

using fetchbox::jobs::v1::QUEUE_STATUS_COMPLETED;
using fetchbox::jobs::v1::QUEUE_STATUS_DEAD_LETTERED;
using fetchbox::jobs::v1::QUEUE_STATUS_LEASED;
using fetchbox::jobs::v1::QUEUE_STATUS_PENDING;
using fetchbox::jobs::v1::Task;
using fetchbox::retry::FailureKind;
using fetchbox::retry::TaskFailure;
using fetchbox::worker::Outcome;
using fetchbox::worker::TaskPipeline;
using fetchbox::worker::WorkerContext;

class StringStream final : public fetchbox::download::ByteStream {
 public:
  explicit StringStream(std::string data, size_t fail_after = std::string::npos) : data_(std::move(data)), fail_after_(fail_after) {
  }

  size_t Read(char* buffer, size_t size) override {
    if (offset_ >= fail_after_) throw TaskFailure(FailureKind::kConnection, "connection reset mid-body");
    const size_t n = std::min(size, std::min(data_.size(), fail_after_) - offset_);
    std::memcpy(buffer, data_.data() + offset_, n);
    offset_ += n;
    return n;
  }

 private:
  std::string data_;
  size_t      fail_after_;
  size_t      offset_ = 0;
};

// Endpoint url -> scripted behaviour. Unscripted endpoints succeed with "body".
class ScriptedDownloader final : public fetchbox::download::Downloader {
 public:
  std::map<std::string, TaskFailure> failures;

  std::unique_ptr<fetchbox::download::ByteStream> Fetch(const fetchbox::download::DownloadRequest& request,
                                                        const fetchbox::proxy::ProxyEndpoint&     endpoint,
                                                        const fetchbox::util::CancellationToken&) override {
    {
      std::lock_guard lock(mutex_);
      tried_.push_back(endpoint.url);
      requests_.push_back(request);
    }
    if (auto it = failures.find(endpoint.url); it != failures.end()) throw it->second;
    return std::make_unique<StringStream>("body");
  }

  std::vector<std::string> Tried() const {
    std::lock_guard lock(mutex_);
    return tried_;
  }

  std::vector<fetchbox::download::DownloadRequest> Requests() const {
    std::lock_guard lock(mutex_);
    return requests_;
  }

 private:
  mutable std::mutex                               mutex_;
  std::vector<std::string>                         tried_;
  std::vector<fetchbox::download::DownloadRequest> requests_;
};

class RecordingSink final : public fetchbox::storage::ObjectSink {
 public:
  fetchbox::storage::UploadedRef Upload(fetchbox::download::ByteStream& body, const fetchbox::storage::Destination& destination) override {
    std::string content;
    char        buffer[16];
    while (const size_t n = body.Read(buffer, sizeof(buffer))) content.append(buffer, n);

    uploads.push_back({destination, content});
    return {destination.bucket, destination.key, content.size(), ""};
  }

  std::vector<std::pair<fetchbox::storage::Destination, std::string>> uploads;
};

struct Fixture {
  std::shared_ptr<fetchbox::queue::DurableQueue>         queue;
  std::shared_ptr<fetchbox::deadletter::DeadLetterStore> dead_letters;
  std::shared_ptr<ScriptedDownloader>                    downloader;
  std::shared_ptr<RecordingSink>                         sink;
  std::shared_ptr<fetchbox::ledger::JobLedger>           ledger;
  std::unique_ptr<TaskPipeline>                          pipeline;
};

Fixture MakeFixture() {
  Fixture f;
  f.queue        = std::make_shared<fetchbox::queue::DurableQueue>(std::make_shared<fetchbox::db::memory::MemoryQueueRepository>(),
                                                            fetchbox::queue::QueueOptions{});
  f.dead_letters = std::make_shared<fetchbox::deadletter::DeadLetterStore>(std::make_shared<fetchbox::db::memory::MemoryDeadLetterRepository>(),
                                                                           f.queue);
  f.downloader   = std::make_shared<ScriptedDownloader>();
  f.sink         = std::make_shared<RecordingSink>();
  f.ledger       = std::make_shared<fetchbox::ledger::JobLedger>();

  fetchbox::proxy::PoolGraph pools;
  pools["primary"] = {{"http://a:3128", "http://b:3128"}, {"pools/secondary"}};
  pools["secondary"] = {{"http://c:3128"}, {}};
  pools["hollow"]    = {{}, {}};

  fetchbox::retry::RetryLimits limits;
  limits.download_retry_limit = 3;
  limits.storage_retry_limit  = 2;

  auto context                  = std::make_shared<WorkerContext>();
  context->queue                = f.queue;
  context->dead_letters         = f.dead_letters;
  context->proxies              = std::make_shared<fetchbox::proxy::ProxyResolver>(pools);
  context->downloader           = f.downloader;
  context->sink                 = f.sink;
  context->ledger               = f.ledger;
  context->retry_policy         = std::make_shared<fetchbox::retry::RetryPolicy>(limits);
  context->default_headers      = {{"User-Agent", "fetchbox-test"}, {"Accept", "*/*"}};
  context->destination_defaults = {"default-bucket", {{"origin", "fetchbox"}}};

  f.pipeline = std::make_unique<TaskPipeline>(context);
  return f;
}

Task MakeTask(const std::string& resource_id, const std::string& proxy_hint = "primary") {
  Task task;
  task.set_resource_id(resource_id);
  task.set_job_id("job-1");
  task.set_job_type("crawl");
  task.set_url("http://origin.invalid/" + resource_id);
  task.set_proxy_hint(proxy_hint);
  return task;
}

fetchbox::db::model::QueueEntryRecord EnqueueAndLease(Fixture& f, const Task& task, const std::string& worker_id = "w0") {
  f.queue->Enqueue(task);
  auto leased = f.queue->LeaseNext(worker_id);
  assert(leased);
  return *leased;
}

void TestFallsBackAcrossTiers() {
  auto f = MakeFixture();
  f.downloader->failures.emplace("http://a:3128", TaskFailure(FailureKind::kConnection, "refused"));
  f.downloader->failures.emplace("http://b:3128", TaskFailure::FromHttpStatus(503, "http://origin.invalid/r1"));

  const auto                      entry = EnqueueAndLease(f, MakeTask("r1"));
  fetchbox::util::CancellationToken cancel;
  assert(f.pipeline->Execute(entry, "w0", cancel) == Outcome::kCompleted);

  const std::vector<std::string> expected = {"http://a:3128", "http://b:3128", "http://c:3128"};
  assert(f.downloader->Tried() == expected);

  assert(f.sink->uploads.size() == 1);
  assert(f.sink->uploads[0].second == "body");
  assert(f.sink->uploads[0].first.bucket == "default-bucket");
  assert(f.sink->uploads[0].first.key == "resources/crawl/job-1/r1");

  const auto stored = f.queue->Get(entry.sequence);
  assert(stored->status == QUEUE_STATUS_COMPLETED);
  assert(stored->attempt_count == 1);
  assert(f.ledger->Snapshot("job-1").completed == 1);
}

void TestNonRetryableStatusStopsFallback() {
  auto f = MakeFixture();
  f.downloader->failures.emplace("http://a:3128", TaskFailure::FromHttpStatus(404, "http://origin.invalid/r1"));

  const auto                      entry = EnqueueAndLease(f, MakeTask("r1"));
  fetchbox::util::CancellationToken cancel;
  assert(f.pipeline->Execute(entry, "w0", cancel) == Outcome::kDeadLettered);

  assert(f.downloader->Tried() == std::vector<std::string>{"http://a:3128"});
  assert(f.sink->uploads.empty());

  const auto record = f.dead_letters->Get(entry.sequence);
  assert(record && record->failure_code == "download.http_status.404");
  assert(record->attempts == 1);
  assert(f.queue->Get(entry.sequence)->status == QUEUE_STATUS_DEAD_LETTERED);

  const auto counters = f.ledger->Snapshot("job-1");
  assert(counters.failed == 1);
  assert(counters.last_failure_code == "download.http_status.404");
}

void TestRetryableExhaustionRequeuesThenDeadLetters() {
  auto f = MakeFixture();
  for (const auto* url : {"http://a:3128", "http://b:3128", "http://c:3128"}) {
    f.downloader->failures.emplace(url, TaskFailure(FailureKind::kTimeout, "timed out"));
  }

  fetchbox::util::CancellationToken cancel;
  f.queue->Enqueue(MakeTask("r1"));

  const auto before = fetchbox::util::ToUnixMillis(fetchbox::util::Now());
  auto       entry  = f.queue->LeaseNext("w0");
  assert(f.pipeline->Execute(*entry, "w0", cancel) == Outcome::kRequeued);

  auto stored = f.queue->Get(entry->sequence);
  assert(stored->status == QUEUE_STATUS_PENDING);
  assert(stored->attempt_count == 1);
  // base 500ms, -20% jitter at most
  assert(stored->visible_after_ms >= before + 400);

  // Attempts 2 and 3: the third failure reaches the download limit.
  const auto far_future = fetchbox::util::Now() + std::chrono::hours(1);
  entry                 = f.queue->LeaseNext("w0", far_future);
  assert(entry && entry->attempt_count == 1);
  assert(f.pipeline->Execute(*entry, "w0", cancel) == Outcome::kRequeued);

  entry = f.queue->LeaseNext("w0", far_future + std::chrono::hours(1));
  assert(entry && entry->attempt_count == 2);
  assert(f.pipeline->Execute(*entry, "w0", cancel) == Outcome::kDeadLettered);

  const auto record = f.dead_letters->Get(entry->sequence);
  assert(record && record->failure_code == "download.timeout");
  assert(record->attempts == 3);
}

void TestMissingOrEmptyPoolIsTerminal() {
  for (const std::string hint : {"nowhere", "hollow"}) {
    auto f     = MakeFixture();
    auto entry = EnqueueAndLease(f, MakeTask("r1", hint));

    fetchbox::util::CancellationToken cancel;
    assert(f.pipeline->Execute(entry, "w0", cancel) == Outcome::kDeadLettered);
    assert(f.downloader->Tried().empty());
    assert(f.dead_letters->Get(entry.sequence)->failure_code == "download.proxy_tiers_exhausted");
  }
}

void TestDirectWhenNoProxyHint() {
  auto f     = MakeFixture();
  auto entry = EnqueueAndLease(f, MakeTask("r1", ""));

  fetchbox::util::CancellationToken cancel;
  assert(f.pipeline->Execute(entry, "w0", cancel) == Outcome::kCompleted);
  assert(f.downloader->Tried() == std::vector<std::string>{""});
}

void TestCorruptEntryIsSystemFailure() {
  auto f     = MakeFixture();
  auto entry = EnqueueAndLease(f, MakeTask("r1"));
  entry.corrupt = true;

  fetchbox::util::CancellationToken cancel;
  assert(f.pipeline->Execute(entry, "w0", cancel) == Outcome::kDeadLettered);
  assert(f.downloader->Tried().empty());
  assert(f.dead_letters->Get(entry.sequence)->failure_code == "system.queue_corruption");
}

// Times out on the first `failures` fetches, then serves "body".
class FlakyDownloader final : public fetchbox::download::Downloader {
 public:
  explicit FlakyDownloader(int failures) : failures_(failures) {
  }

  std::unique_ptr<fetchbox::download::ByteStream> Fetch(const fetchbox::download::DownloadRequest&, const fetchbox::proxy::ProxyEndpoint&,
                                                        const fetchbox::util::CancellationToken&) override {
    if (failures_ > 0) {
      --failures_;
      throw TaskFailure(FailureKind::kTimeout, "timed out");
    }
    return std::make_unique<StringStream>("body");
  }

 private:
  int failures_;
};

class ThrottledSink final : public fetchbox::storage::ObjectSink {
 public:
  fetchbox::storage::UploadedRef Upload(fetchbox::download::ByteStream&, const fetchbox::storage::Destination&) override {
    ++calls;
    throw TaskFailure(FailureKind::kThrottled, "SlowDown");
  }

  int calls = 0;
};

std::unique_ptr<TaskPipeline> MakeThrottledPipeline(Fixture& f, std::shared_ptr<fetchbox::download::Downloader> downloader,
                                                    std::shared_ptr<ThrottledSink> sink, uint32_t download_limit, uint32_t storage_limit) {
  auto context          = std::make_shared<WorkerContext>();
  context->queue        = f.queue;
  context->dead_letters = f.dead_letters;
  context->proxies      = std::make_shared<fetchbox::proxy::ProxyResolver>(fetchbox::proxy::PoolGraph{});
  context->downloader   = std::move(downloader);
  context->sink         = std::move(sink);
  context->ledger       = f.ledger;

  fetchbox::retry::RetryLimits limits;
  limits.download_retry_limit = download_limit;
  limits.storage_retry_limit  = storage_limit;
  context->retry_policy       = std::make_shared<fetchbox::retry::RetryPolicy>(limits);
  return std::make_unique<TaskPipeline>(context);
}

// Leases the entry again past any backoff and runs one cycle.
Outcome RunCycle(Fixture& f, TaskPipeline& pipeline, fetchbox::util::TimePoint& clock) {
  clock += std::chrono::hours(1);
  auto entry = f.queue->LeaseNext("w0", clock);
  assert(entry);
  fetchbox::util::CancellationToken cancel;
  return pipeline.Execute(*entry, "w0", cancel);
}

void TestUploadFailureDeadLettersAtStorageLimit() {
  auto f        = MakeFixture();
  auto sink     = std::make_shared<ThrottledSink>();
  auto pipeline = MakeThrottledPipeline(f, f.downloader, sink, 5, 1);
  auto entry    = EnqueueAndLease(f, MakeTask("r1", ""));

  fetchbox::util::CancellationToken cancel;
  assert(pipeline->Execute(entry, "w0", cancel) == Outcome::kDeadLettered);

  const auto record = f.dead_letters->Get(entry.sequence);
  assert(record && record->failure_code == "upload.throttled");
  assert(record->attempts == 1);
  assert(record->total_attempts == 1);
}

void TestUploadFailureIsRequeuedWithinStorageLimit() {
  auto f        = MakeFixture();
  auto sink     = std::make_shared<ThrottledSink>();
  auto pipeline = MakeThrottledPipeline(f, f.downloader, sink, 5, 3);
  auto entry    = EnqueueAndLease(f, MakeTask("r1", ""));

  fetchbox::util::CancellationToken cancel;
  assert(pipeline->Execute(entry, "w0", cancel) == Outcome::kRequeued);

  const auto stored = f.queue->Get(entry.sequence);
  assert(stored->status == QUEUE_STATUS_PENDING);
  assert(stored->attempt_count == 1);
  assert(stored->upload_attempts == 1);
  assert(!f.dead_letters->Get(entry.sequence));
}

void TestUploadBudgetIsSpentSeparately() {
  auto f        = MakeFixture();
  auto sink     = std::make_shared<ThrottledSink>();
  auto pipeline = MakeThrottledPipeline(f, f.downloader, sink, 2, 3);
  const auto sequence = f.queue->Enqueue(MakeTask("r1", ""));
  auto       clock    = fetchbox::util::Now();

  // upload limit 3 is honoured even though it exceeds the download limit 2
  assert(RunCycle(f, *pipeline, clock) == Outcome::kRequeued);
  assert(RunCycle(f, *pipeline, clock) == Outcome::kRequeued);
  assert(RunCycle(f, *pipeline, clock) == Outcome::kDeadLettered);
  assert(sink->calls == 3);

  const auto record = f.dead_letters->Get(sequence);
  assert(record && record->failure_code == "upload.throttled");
  assert(record->attempts == 3);
  assert(record->total_attempts == 3);
}

void TestDownloadThenUploadFailuresUseTheirOwnLimits() {
  auto f          = MakeFixture();
  auto sink       = std::make_shared<ThrottledSink>();
  auto downloader = std::make_shared<FlakyDownloader>(4);
  auto pipeline   = MakeThrottledPipeline(f, downloader, sink, 5, 3);
  const auto sequence = f.queue->Enqueue(MakeTask("r1", ""));
  auto       clock    = fetchbox::util::Now();

  for (int i = 0; i < 4; ++i) assert(RunCycle(f, *pipeline, clock) == Outcome::kRequeued);
  assert(sink->calls == 0);

  // the download now succeeds; the upload budget starts from zero
  assert(RunCycle(f, *pipeline, clock) == Outcome::kRequeued);
  assert(RunCycle(f, *pipeline, clock) == Outcome::kRequeued);
  assert(RunCycle(f, *pipeline, clock) == Outcome::kDeadLettered);
  assert(sink->calls == 3);

  const auto record = f.dead_letters->Get(sequence);
  assert(record && record->failure_code == "upload.throttled");
  assert(record->attempts == 3);
  assert(record->attempts <= 3);
  assert(record->total_attempts == 7);

  const auto stored = f.queue->Get(sequence);
  assert(stored->status == QUEUE_STATUS_DEAD_LETTERED);
  assert(stored->attempt_count == 7);
  assert(stored->upload_attempts == 3);
}

void TestCancelledAttemptIsAbandoned() {
  auto f     = MakeFixture();
  auto entry = EnqueueAndLease(f, MakeTask("r1"));

  fetchbox::util::CancellationToken cancel;
  cancel.Cancel();
  assert(f.pipeline->Execute(entry, "w0", cancel) == Outcome::kAbandoned);

  const auto stored = f.queue->Get(entry.sequence);
  assert(stored->status == QUEUE_STATUS_LEASED);
  assert(stored->attempt_count == 0);
  assert(!f.dead_letters->Get(entry.sequence));
}

void TestForeignLeaseIsStale() {
  auto f     = MakeFixture();
  auto entry = EnqueueAndLease(f, MakeTask("r1"), "w0");

  fetchbox::util::CancellationToken cancel;
  assert(f.pipeline->Execute(entry, "w9", cancel) == Outcome::kStale);
  assert(f.queue->Get(entry.sequence)->status == QUEUE_STATUS_LEASED);
  assert(f.ledger->Snapshot("job-1").completed == 0);
}

void TestRequestCarriesMergedHeaders() {
  auto f    = MakeFixture();
  auto task = MakeTask("r1", "");
  auto* ua  = task.add_headers();
  ua->set_name("user-agent");
  ua->set_value("custom/1.0");
  auto* auth = task.add_headers();
  auth->set_name("Authorization");
  auth->set_value("Bearer t");

  auto                            entry = EnqueueAndLease(f, task);
  fetchbox::util::CancellationToken cancel;
  assert(f.pipeline->Execute(entry, "w0", cancel) == Outcome::kCompleted);

  const auto requests = f.downloader->Requests();
  assert(requests.size() == 1);
  assert(requests[0].url == "http://origin.invalid/r1");

  const std::vector<fetchbox::download::Header> expected = {
      {"Accept", "*/*"},
      {"user-agent", "custom/1.0"},
      {"Authorization", "Bearer t"},
  };
  assert(requests[0].headers == expected);
}

void TestDestinationResolution() {
  fetchbox::storage::DestinationDefaults defaults;
  defaults.metadata = {{"origin", "fetchbox"}, {"tier", "cold"}};

  auto task = MakeTask("r1");
  auto dest = fetchbox::storage::ResolveDestination(task, defaults);
  assert(dest.bucket == fetchbox::storage::kDefaultBucket);
  assert(dest.key == "resources/crawl/job-1/r1");
  assert(dest.metadata.at("job-id") == "job-1");
  assert(dest.metadata.at("resource-id") == "r1");
  assert(dest.metadata.at("tier") == "cold");

  auto* hint = task.mutable_storage_hint();
  hint->set_bucket("archive");
  hint->set_key_prefix("/exports/2024/");
  (*hint->mutable_metadata())["tier"] = "hot";

  dest = fetchbox::storage::ResolveDestination(task, defaults);
  assert(dest.bucket == "archive");
  assert(dest.key == "exports/2024/r1");
  assert(dest.metadata.at("tier") == "hot");
  assert(dest.metadata.at("origin") == "fetchbox");
}

void TestSha256() {
  fetchbox::storage::Sha256 digest;
  digest.Update("a", 1);
  digest.Update("bc", 2);
  assert(digest.HexDigest() == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

  fetchbox::storage::Sha256 empty;
  assert(empty.HexDigest() == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream     in(path, std::ios::binary);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void TestArrowSinkWritesObjects() {
  const auto root = std::filesystem::temp_directory_path() / "fetchbox_task_pipeline_tests";
  std::filesystem::remove_all(root);
  std::filesystem::create_directories(root);

  fetchbox::storage::ArrowObjectSink sink(std::make_shared<arrow::fs::LocalFileSystem>(), root.string(), /*checksum=*/true);

  const std::string             payload(200 * 1024, 'x');
  StringStream                  body(payload);
  fetchbox::storage::Destination dest{"bucket-a", "resources/crawl/job-1/r1", {{"job-id", "job-1"}}};

  const auto ref = sink.Upload(body, dest);
  assert(ref.bucket == "bucket-a");
  assert(ref.key == "resources/crawl/job-1/r1");
  assert(ref.bytes == payload.size());
  assert(ref.checksum.size() == 64);

  fetchbox::storage::Sha256 expected;
  expected.Update(payload.data(), payload.size());
  assert(ref.checksum == expected.HexDigest());

  const auto object = root / "bucket-a" / "resources" / "crawl" / "job-1" / "r1";
  assert(ReadFile(object) == payload);

  // A body that breaks mid-stream leaves nothing behind.
  StringStream                   broken(payload, 100 * 1024);
  fetchbox::storage::Destination broken_dest{"bucket-a", "partial/r2", {}};
  bool                           thrown = false;
  try {
    sink.Upload(broken, broken_dest);
  } catch (const TaskFailure& failure) {
    thrown = failure.Kind() == FailureKind::kConnection;
  }
  assert(thrown);
  assert(!std::filesystem::exists(root / "bucket-a" / "partial" / "r2"));

  for (const std::string key : {"../escape", "a//b", "", "a/./b"}) {
    StringStream                   unused("data");
    fetchbox::storage::Destination bad{"bucket-a", key, {}};
    bool                           rejected = false;
    try {
      sink.Upload(unused, bad);
    } catch (const TaskFailure& failure) {
      rejected = failure.Kind() == FailureKind::kInvalidDestination;
    }
    assert(rejected);
  }

  std::filesystem::remove_all(root);
}

FailureKind Classify(const arrow::Status& status, const std::string& path) {
  try {
    fetchbox::storage::ThrowUploadFailure(status, path);
  } catch (const TaskFailure& failure) {
    assert(failure.GetPhase() == fetchbox::retry::Phase::kUpload);
    return failure.Kind();
  }
  assert(false);
  return FailureKind::kInternalFault;
}

void TestUploadFailureClassification() {
  const std::string path = "/data/bucket-a/reports/403/429-503";

  // codes inside the object path never decide the kind
  assert(Classify(arrow::Status::IOError("Failed to write '", path, "'"), path) == FailureKind::kNetwork);
  assert(Classify(arrow::internal::IOErrorFromErrno(ENOTDIR, "Cannot create directory '", path, "'"), path) ==
         FailureKind::kInvalidDestination);

  assert(Classify(arrow::internal::IOErrorFromErrno(EACCES, "Failed to open local file '", path, "'"), path) == FailureKind::kAccessDenied);
  assert(Classify(arrow::internal::IOErrorFromErrno(EPERM, "Failed to open local file"), path) == FailureKind::kAccessDenied);
  assert(Classify(arrow::internal::IOErrorFromErrno(ENOSPC, "Failed to write"), path) == FailureKind::kStorageUnavailable);
  assert(Classify(arrow::Status::Invalid("Expected a bucket name"), path) == FailureKind::kInvalidDestination);

  assert(Classify(arrow::Status::IOError("When uploading key 'reports/ACCESS_DENIED/403' in bucket 'b': AWS Error SLOW_DOWN during "
                                         "PutObject operation: Please reduce your request rate."),
                  path) == FailureKind::kThrottled);
  assert(Classify(arrow::Status::IOError("When uploading key 'k' in bucket 'b': AWS Error ACCESS_DENIED during PutObject operation: denied"),
                  path) == FailureKind::kAccessDenied);
  assert(Classify(arrow::Status::IOError("When uploading key 'k': AWS Error UNKNOWN (HTTP status 502) during CompleteMultipartUpload operation"),
                  path) == FailureKind::kStorageUnavailable);
  assert(Classify(arrow::Status::IOError("When uploading key '403': AWS Error NETWORK_CONNECTION during PutObject operation"), path) ==
         FailureKind::kNetwork);
}

void TestArrowSinkKeepsDigitsInKeysOutOfClassification() {
  const auto root = std::filesystem::temp_directory_path() / "fetchbox_task_pipeline_classify";
  std::filesystem::remove_all(root);
  std::filesystem::create_directories(root);
  // a file where the bucket directory should be
  std::ofstream(root / "bucket-403") << "not a directory";

  fetchbox::storage::ArrowObjectSink sink(std::make_shared<arrow::fs::LocalFileSystem>(), root.string(), /*checksum=*/false);

  StringStream                   body("data");
  fetchbox::storage::Destination dest{"bucket-403", "reports/403/r1", {}};
  bool                           invalid = false;
  try {
    sink.Upload(body, dest);
  } catch (const TaskFailure& failure) {
    invalid = failure.Kind() == FailureKind::kInvalidDestination;
    assert(std::string(failure.what()).find("403") != std::string::npos);
  }
  assert(invalid);

  std::filesystem::remove_all(root);
}

} // namespace

int main() {
  TestFallsBackAcrossTiers();
  TestNonRetryableStatusStopsFallback();
  TestRetryableExhaustionRequeuesThenDeadLetters();
  TestMissingOrEmptyPoolIsTerminal();
  TestDirectWhenNoProxyHint();
  TestCorruptEntryIsSystemFailure();
  TestUploadFailureDeadLettersAtStorageLimit();
  TestUploadFailureIsRequeuedWithinStorageLimit();
  TestUploadBudgetIsSpentSeparately();
  TestDownloadThenUploadFailuresUseTheirOwnLimits();
  TestCancelledAttemptIsAbandoned();
  TestForeignLeaseIsStale();
  TestRequestCarriesMergedHeaders();
  TestDestinationResolution();
  TestSha256();
  TestArrowSinkWritesObjects();
  TestUploadFailureClassification();
  TestArrowSinkKeepsDigitsInKeysOutOfClassification();

  std::cout << "fetchbox_unit_task_pipeline: pass\n";
  return 0;
}
