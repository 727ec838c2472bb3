#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "fetchbox/v1.hpp"
#include "internal/broker/task_broker.hpp"
#include "internal/db/memory/memory_dead_letter_repository.hpp"
#include "internal/db/memory/memory_queue_repository.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/ledger/job_ledger.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/service_context.hpp"

namespace {

struct TestServer {
  fetchbox::service::ServiceContext            ctx;
  std::unique_ptr<fetchbox::grpc::AdminServer> server;
};

TestServer BuildServer(uint64_t capacity = 100) {
  fetchbox::queue::QueueOptions options;
  options.capacity = capacity;

  auto queue = std::make_shared<fetchbox::queue::DurableQueue>(std::make_shared<fetchbox::db::memory::MemoryQueueRepository>(), options);
  auto dead_letters =
      std::make_shared<fetchbox::deadletter::DeadLetterStore>(std::make_shared<fetchbox::db::memory::MemoryDeadLetterRepository>(), queue);

  auto context          = std::make_shared<fetchbox::worker::WorkerContext>();
  context->queue        = queue;
  context->dead_letters = dead_letters;
  context->proxies      = std::make_shared<fetchbox::proxy::ProxyResolver>(fetchbox::proxy::PoolGraph{});
  context->ledger       = std::make_shared<fetchbox::ledger::JobLedger>();
  context->retry_policy = std::make_shared<fetchbox::retry::RetryPolicy>(fetchbox::retry::RetryLimits{});

  fetchbox::broker::BrokerOptions broker_options;
  broker_options.instance_id  = "test";
  broker_options.worker_count = 1;

  TestServer ts;
  ts.ctx.broker       = std::make_shared<fetchbox::broker::TaskBroker>(broker_options, context);
  ts.ctx.queue        = queue;
  ts.ctx.dead_letters = dead_letters;
  ts.server           = std::make_unique<fetchbox::grpc::AdminServer>(std::make_shared<fetchbox::service::AdminService>(ts.ctx));
  return ts;
}

fetchbox::v1::EnqueueRequest ValidRequest(const std::string& resource_id) {
  fetchbox::v1::EnqueueRequest req;
  req.mutable_task()->set_resource_id(resource_id);
  req.mutable_task()->set_job_id("job-1");
  req.mutable_task()->set_url("http://origin.invalid/" + resource_id);
  return req;
}

void TestEnqueueThenGetQueueEntry() {
  auto ts = BuildServer();

  const auto                    req = ValidRequest("r1");
  fetchbox::v1::EnqueueResponse resp;
  ::grpc::ServerContext         enqueue_ctx;
  assert(ts.server->Enqueue(&enqueue_ctx, &req, &resp).ok());
  assert(resp.sequence() >= 1);

  fetchbox::v1::GetQueueEntryRequest get_req;
  get_req.set_sequence(resp.sequence());
  fetchbox::v1::GetQueueEntryResponse get_resp;
  ::grpc::ServerContext               get_ctx;
  assert(ts.server->GetQueueEntry(&get_ctx, &get_req, &get_resp).ok());
  assert(get_resp.entry().status() == fetchbox::v1::QUEUE_STATUS_PENDING);
  assert(get_resp.entry().task().resource_id() == "r1");
  assert(get_resp.entry().attempt_count() == 0);
}

void TestMissingQueueEntryReturnsNotFound() {
  auto ts = BuildServer();

  fetchbox::v1::GetQueueEntryRequest req;
  req.set_sequence(999);
  fetchbox::v1::GetQueueEntryResponse resp;
  ::grpc::ServerContext               grpc_ctx;

  const auto status = ts.server->GetQueueEntry(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestIncompleteTaskReturnsInvalidArgument() {
  auto ts = BuildServer();

  for (const char* missing : {"url", "job_id", "resource_id", "header"}) {
    auto req = ValidRequest("r1");
    if (std::string(missing) == "url") req.mutable_task()->clear_url();
    if (std::string(missing) == "job_id") req.mutable_task()->clear_job_id();
    if (std::string(missing) == "resource_id") req.mutable_task()->clear_resource_id();
    if (std::string(missing) == "header") req.mutable_task()->add_headers()->set_value("orphan");

    fetchbox::v1::EnqueueResponse resp;
    ::grpc::ServerContext         grpc_ctx;
    const auto                    status = ts.server->Enqueue(&grpc_ctx, &req, &resp);
    assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  }
  assert(ts.ctx.queue->Stats().pending == 0);
}

void TestFullQueueReturnsResourceExhausted() {
  auto ts = BuildServer(1);

  const auto                    first = ValidRequest("r1");
  fetchbox::v1::EnqueueResponse resp;
  ::grpc::ServerContext         first_ctx;
  assert(ts.server->Enqueue(&first_ctx, &first, &resp).ok());

  const auto            second = ValidRequest("r2");
  ::grpc::ServerContext second_ctx;
  const auto            status = ts.server->Enqueue(&second_ctx, &second, &resp);
  assert(status.error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
}

void TestDeadLetterInspectionAndReplay() {
  auto ts = BuildServer();

  ts.ctx.queue->Enqueue(ValidRequest("r1").task());
  auto leased = ts.ctx.queue->LeaseNext("w0");
  assert(leased);
  ts.ctx.dead_letters->Commit(*leased, "w0", "download.http_status.410", "gone");

  fetchbox::v1::ListDeadLettersRequest list_req;
  list_req.set_job_id("job-1");
  fetchbox::v1::ListDeadLettersResponse list_resp;
  ::grpc::ServerContext                 list_ctx;
  assert(ts.server->ListDeadLetters(&list_ctx, &list_req, &list_resp).ok());
  assert(list_resp.total() == 1);
  assert(list_resp.entries_size() == 1);
  assert(list_resp.entries(0).failure_code() == "download.http_status.410");
  assert(list_resp.entries(0).attempts() == 1);
  assert(list_resp.entries(0).total_attempts() == 1);

  fetchbox::v1::GetDeadLetterRequest get_req;
  get_req.set_sequence(leased->sequence);
  fetchbox::v1::GetDeadLetterResponse get_resp;
  ::grpc::ServerContext               get_ctx;
  assert(ts.server->GetDeadLetter(&get_ctx, &get_req, &get_resp).ok());
  assert(get_resp.entry().task().resource_id() == "r1");

  fetchbox::v1::ReplayDeadLetterRequest replay_req;
  replay_req.set_sequence(leased->sequence);
  fetchbox::v1::ReplayDeadLetterResponse replay_resp;
  ::grpc::ServerContext                  replay_ctx;
  assert(ts.server->ReplayDeadLetter(&replay_ctx, &replay_req, &replay_resp).ok());
  assert(replay_resp.new_sequence() > leased->sequence);

  replay_req.set_sequence(12345);
  ::grpc::ServerContext missing_ctx;
  assert(ts.server->ReplayDeadLetter(&missing_ctx, &replay_req, &replay_resp).error_code() == ::grpc::StatusCode::NOT_FOUND);

  get_req.set_sequence(12345);
  ::grpc::ServerContext missing_get_ctx;
  assert(ts.server->GetDeadLetter(&missing_get_ctx, &get_req, &get_resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestStatsAndHealth() {
  auto ts = BuildServer();
  ts.ctx.queue->Enqueue(ValidRequest("r1").task());

  fetchbox::v1::StatsRequest  stats_req;
  fetchbox::v1::StatsResponse stats_resp;
  ::grpc::ServerContext       stats_ctx;
  assert(ts.server->Stats(&stats_ctx, &stats_req, &stats_resp).ok());
  assert(stats_resp.pending() == 1);
  assert(stats_resp.dead_letters() == 0);
  assert(stats_resp.inflight_size() == 1);

  fetchbox::v1::HealthRequest  health_req;
  fetchbox::v1::HealthResponse health_resp;
  ::grpc::ServerContext        health_ctx;
  assert(ts.server->Health(&health_ctx, &health_req, &health_resp).ok());
  assert(!health_resp.ok());
}

} // namespace

int main() {
  TestEnqueueThenGetQueueEntry();
  TestMissingQueueEntryReturnsNotFound();
  TestIncompleteTaskReturnsInvalidArgument();
  TestFullQueueReturnsResourceExhausted();
  TestDeadLetterInspectionAndReplay();
  TestStatsAndHealth();

  std::cout << "fetchbox_unit_grpc_status: pass\n";
  return 0;
}
