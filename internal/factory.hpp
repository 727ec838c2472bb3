#pragma once

#include <grpcpp/grpcpp.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/broker/task_broker.hpp"
#include "internal/ledger/job_ledger.hpp"
#include "internal/worker/worker_context.hpp"

namespace fetchbox::factory {

/*
  Everything the daemon owns for the lifetime of the process.
*/
struct Application {
  std::string                                  instance_id;
  std::shared_ptr<const worker::WorkerContext> context;
  std::shared_ptr<ledger::JobLedger>           ledger;
  std::shared_ptr<broker::TaskBroker>          broker;
  std::chrono::milliseconds                    shutdown_grace{30000};

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Composition root. The only place that knows concrete store, downloader
  and sink types. Expects a config that went through ApplyDefaults().
  An empty instance_id gets a fresh MakeInstanceId().
*/
Application Build(const fetchbox::runtime::config::RuntimeConfig& config, std::string instance_id = {});

// <host>-<pid>-<start_ms>; prefix of every worker id of this process.
std::string MakeInstanceId();

} // namespace fetchbox::factory
