#pragma once

#include <map>
#include <memory>
#include <string>

#include "internal/deadletter/dead_letter_store.hpp"
#include "internal/download/downloader.hpp"
#include "internal/ledger/ledger_sink.hpp"
#include "internal/proxy/proxy_resolver.hpp"
#include "internal/queue/durable_queue.hpp"
#include "internal/retry/backoff.hpp"
#include "internal/storage/destination.hpp"
#include "internal/storage/object_sink.hpp"

namespace fetchbox::worker {

/*
  Collaborators shared by every worker. Built once by the composition root.
*/
struct WorkerContext {
  std::shared_ptr<queue::DurableQueue>         queue;
  std::shared_ptr<deadletter::DeadLetterStore> dead_letters;
  std::shared_ptr<proxy::ProxyResolver>        proxies;
  std::shared_ptr<download::Downloader>        downloader;
  std::shared_ptr<storage::ObjectSink>         sink;
  std::shared_ptr<ledger::LedgerSink>          ledger;
  std::shared_ptr<const retry::RetryPolicy>    retry_policy;

  std::map<std::string, std::string> default_headers;
  storage::DestinationDefaults       destination_defaults;
};

} // namespace fetchbox::worker
