#include <grpcpp/grpcpp.h>

#include <iostream>
#include <memory>
#include <string>

#include "fetchbox/v1.hpp"

using namespace fetchbox::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  fetchboxctl <addr> enqueue <job_id> <resource_id> <url> [proxy_pool] [job_type]\n"
            << "  fetchboxctl <addr> entry <sequence>\n"
            << "  fetchboxctl <addr> dlq [limit] [offset] [job_id]\n"
            << "  fetchboxctl <addr> dlq-get <sequence>\n"
            << "  fetchboxctl <addr> replay <sequence>\n"
            << "  fetchboxctl <addr> stats\n"
            << "  fetchboxctl <addr> health\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_code() << ": " << status.error_message() << "\n";
  return 2;
}

static void PrintDeadLetter(const DeadLetterEntry& entry) {
  std::cout << "sequence=" << entry.sequence() << " job=" << entry.task().job_id() << " resource=" << entry.task().resource_id()
            << " code=" << entry.failure_code() << " attempts=" << entry.attempts() << "/" << entry.total_attempts() << " failed_at_ms=" << entry.failed_at_ms() << "\n"
            << "  message=" << entry.failure_message() << "\n";
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = FetchboxAdminService::NewStub(channel);

  grpc::ClientContext ctx;

  try {
    // ------------------------------------------------------------

    if (cmd == "enqueue") {
      if (argc < 6) {
        Usage();
        return 1;
      }

      EnqueueRequest req;
      auto*          task = req.mutable_task();
      task->set_job_id(argv[3]);
      task->set_resource_id(argv[4]);
      task->set_url(argv[5]);
      if (argc >= 7) task->set_proxy_hint(argv[6]);
      if (argc >= 8) task->set_job_type(argv[7]);

      EnqueueResponse resp;
      auto            status = stub->Enqueue(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "sequence=" << resp.sequence() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "entry") {
      if (argc < 4) return 1;

      GetQueueEntryRequest req;
      req.set_sequence(std::stoull(argv[3]));

      GetQueueEntryResponse resp;
      auto                  status = stub->GetQueueEntry(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      const auto& entry = resp.entry();
      std::cout << "sequence=" << entry.sequence() << "\n"
                << "status=" << QueueStatus_Name(entry.status()) << "\n"
                << "attempt_count=" << entry.attempt_count() << "\n"
                << "upload_attempts=" << entry.upload_attempts() << "\n"
                << "lease_owner=" << entry.lease_owner() << "\n"
                << "visible_after_ms=" << entry.visible_after_ms() << "\n"
                << "url=" << entry.task().url() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "dlq") {
      ListDeadLettersRequest req;
      if (argc >= 4) req.set_limit(static_cast<uint32_t>(std::stoul(argv[3])));
      if (argc >= 5) req.set_offset(static_cast<uint32_t>(std::stoul(argv[4])));
      if (argc >= 6) req.set_job_id(argv[5]);

      ListDeadLettersResponse resp;
      auto                    status = stub->ListDeadLetters(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      for (const auto& entry : resp.entries()) {
        PrintDeadLetter(entry);
      }
      std::cout << "total=" << resp.total() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "dlq-get") {
      if (argc < 4) return 1;

      GetDeadLetterRequest req;
      req.set_sequence(std::stoull(argv[3]));

      GetDeadLetterResponse resp;
      auto                  status = stub->GetDeadLetter(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      PrintDeadLetter(resp.entry());
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "replay") {
      if (argc < 4) return 1;

      ReplayDeadLetterRequest req;
      req.set_sequence(std::stoull(argv[3]));

      ReplayDeadLetterResponse resp;
      auto                     status = stub->ReplayDeadLetter(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "new_sequence=" << resp.new_sequence() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "stats") {
      StatsRequest  req;
      StatsResponse resp;

      auto status = stub->Stats(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "pending=" << resp.pending() << "\n";
      std::cout << "leased=" << resp.leased() << "\n";
      std::cout << "completed=" << resp.completed() << "\n";
      std::cout << "dead_lettered=" << resp.dead_lettered() << "\n";
      std::cout << "next_sequence=" << resp.next_sequence() << "\n";
      std::cout << "dead_letters=" << resp.dead_letters() << "\n";
      for (int i = 0; i < resp.inflight_size(); ++i) {
        std::cout << "worker[" << i << "].inflight=" << resp.inflight(i) << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "health") {
      HealthRequest  req;
      HealthResponse resp;

      auto status = stub->Health(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << (resp.ok() ? "ok" : "unhealthy") << " " << resp.detail() << "\n";
      return resp.ok() ? 0 : 3;
    }
  } catch (const std::exception& e) {
    std::cerr << "invalid argument: " << e.what() << "\n";
    return 1;
  }

  Usage();
  return 1;
}
