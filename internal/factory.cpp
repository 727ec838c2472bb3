#include "factory.hpp"

#include <unistd.h>

#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include <utility>

#include "internal/db/memory/memory_dead_letter_repository.hpp"
#include "internal/db/memory/memory_queue_repository.hpp"
#include "internal/deadletter/dead_letter_store.hpp"
#include "internal/download/curl_downloader.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/proxy/proxy_resolver.hpp"
#include "internal/queue/durable_queue.hpp"
#include "internal/retry/backoff.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/storage/storage_factory.hpp"
#include "internal/util/time.hpp"
#if FETCHBOX_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_dead_letter_repository.hpp"
#include "internal/db/sqlite/sqlite_queue_repository.hpp"
#endif

namespace fetchbox::factory {

using observability::StringField;

namespace {

struct Repositories {
  std::shared_ptr<db::QueueRepository>      queue;
  std::shared_ptr<db::DeadLetterRepository> dead_letters;
};

Repositories BuildRepositories(const fetchbox::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if FETCHBOX_DB_SQLITE
    const std::filesystem::path dir = database.sqlite().path();
    std::filesystem::create_directories(dir);

    Repositories repos;
    repos.queue        = std::make_shared<db::sqlite::SqliteQueueRepository>(std::make_shared<db::sqlite::SqliteDB>((dir / "queue.sqlite").string()));
    repos.dead_letters = std::make_shared<db::sqlite::SqliteDeadLetterRepository>(
        std::make_shared<db::sqlite::SqliteDB>((dir / "dead_letter.sqlite").string()));

    FETCHBOX_LOG_INFO("Using sqlite stores", {StringField("path", dir.string())});
    return repos;
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  FETCHBOX_LOG_WARN("Using in-memory stores; queue contents do not survive a restart");
  return {std::make_shared<db::memory::MemoryQueueRepository>(), std::make_shared<db::memory::MemoryDeadLetterRepository>()};
}

} // namespace

std::string MakeInstanceId() {
  char host[256] = {};
  if (gethostname(host, sizeof(host) - 1) != 0 || host[0] == '\0') {
    std::snprintf(host, sizeof(host), "fetchbox");
  }
  return std::string(host) + "-" + std::to_string(::getpid()) + "-" + std::to_string(util::ToUnixMillis(util::Now()));
}

/*
    Build full application dependency graph
*/
Application Build(const fetchbox::runtime::config::RuntimeConfig& config, std::string instance_id) {
  Application app;
  app.instance_id    = instance_id.empty() ? MakeInstanceId() : std::move(instance_id);
  app.shutdown_grace = std::chrono::milliseconds(config.workers().shutdown_grace_ms());

  // ------------------------------------------------------------------
  // Stores
  // ------------------------------------------------------------------
  auto repos = BuildRepositories(config);

  queue::QueueOptions queue_options;
  queue_options.capacity  = config.queue().capacity();
  queue_options.lease_ttl = std::chrono::milliseconds(config.queue().lease_ttl_ms());

  auto queue        = std::make_shared<queue::DurableQueue>(repos.queue, queue_options);
  auto dead_letters = std::make_shared<deadletter::DeadLetterStore>(repos.dead_letters, queue);

  // ------------------------------------------------------------------
  // Worker collaborators
  // ------------------------------------------------------------------
  app.ledger = std::make_shared<ledger::JobLedger>();

  auto context          = std::make_shared<worker::WorkerContext>();
  context->queue        = queue;
  context->dead_letters = dead_letters;
  context->proxies      = std::make_shared<proxy::ProxyResolver>(proxy::PoolGraphFromConfig(config.proxy()));
  context->downloader   = std::make_shared<download::CurlDownloader>(download::CurlOptions::FromConfig(config.http()));
  context->sink         = storage::BuildObjectSink(config.storage());
  context->ledger       = app.ledger;
  context->retry_policy = std::make_shared<retry::RetryPolicy>(retry::RetryLimits::FromConfig(config.retry()));
  context->default_headers.insert(config.http().default_headers().begin(), config.http().default_headers().end());
  context->destination_defaults.bucket = config.storage().default_bucket();
  context->destination_defaults.metadata.insert(config.storage().default_metadata().begin(), config.storage().default_metadata().end());
  app.context = context;

  // ------------------------------------------------------------------
  // Broker
  // ------------------------------------------------------------------
  broker::BrokerOptions broker_options;
  broker_options.instance_id                  = app.instance_id;
  broker_options.worker_count                 = config.workers().count();
  broker_options.worker.concurrency           = config.workers().concurrency();
  broker_options.worker.max_inflight          = config.workers().max_inflight_per_worker();
  broker_options.worker.rate_limit_per_second = config.workers().rate_limit_per_worker();
  broker_options.poll_interval                = std::chrono::milliseconds(config.queue().poll_interval_ms());
  broker_options.prune_interval               = std::chrono::milliseconds(config.queue().prune_interval_ms());
  broker_options.completed_retention          = std::chrono::milliseconds(config.queue().completed_retention_ms());
  broker_options.dead_letter_retention        = std::chrono::milliseconds(config.dead_letter().retention_ms());
  broker_options.stop_timeout                 = std::chrono::milliseconds(config.workers().stop_timeout_ms());

  app.broker = std::make_shared<broker::TaskBroker>(broker_options, context);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.broker       = app.broker;
  ctx.queue        = queue;
  ctx.dead_letters = dead_letters;

  auto admin_service = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  return app;
}

} // namespace fetchbox::factory
