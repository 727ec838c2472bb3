#include "defaults.hpp"

#include <string>

namespace fetchbox::config {

void ApplyDefaults(fetchbox::runtime::config::RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) server->set_bind_address("0.0.0.0:50061");

  auto* queue = config.mutable_queue();
  if (queue->capacity() == 0) queue->set_capacity(100000);
  if (queue->lease_ttl_ms() == 0) queue->set_lease_ttl_ms(300000);
  if (queue->poll_interval_ms() == 0) queue->set_poll_interval_ms(500);
  if (queue->completed_retention_ms() == 0) queue->set_completed_retention_ms(24ull * 60 * 60 * 1000);
  if (queue->prune_interval_ms() == 0) queue->set_prune_interval_ms(60000);

  auto* workers = config.mutable_workers();
  if (workers->count() == 0) workers->set_count(4);
  if (workers->concurrency() == 0) workers->set_concurrency(1);
  if (workers->max_inflight_per_worker() == 0) workers->set_max_inflight_per_worker(8);
  if (!workers->has_rate_limit_per_worker()) workers->set_rate_limit_per_worker(10.0);
  if (workers->shutdown_grace_ms() == 0) workers->set_shutdown_grace_ms(30000);
  if (workers->stop_timeout_ms() == 0) workers->set_stop_timeout_ms(5000);

  auto* retry = config.mutable_retry();
  if (retry->base_backoff_ms() == 0) retry->set_base_backoff_ms(500);
  if (retry->max_backoff_ms() == 0) retry->set_max_backoff_ms(60000);
  if (retry->download_retry_limit() == 0) retry->set_download_retry_limit(5);
  if (retry->storage_retry_limit() == 0) retry->set_storage_retry_limit(3);

  auto* http = config.mutable_http();
  if (http->connect_timeout_ms() == 0) http->set_connect_timeout_ms(10000);
  if (http->request_timeout_ms() == 0) http->set_request_timeout_ms(60000);
  if (http->user_agent().empty()) http->set_user_agent("FetchBox/0.1.0");
  if (!http->has_max_redirects()) http->set_max_redirects(10);

  auto* storage = config.mutable_storage();
  if (storage->root_uri().empty()) storage->set_root_uri("/tmp/fetchbox/objects");
  if (storage->default_bucket().empty()) storage->set_default_bucket("fetchbox-default");

  auto* logging = config.mutable_logging();
  if (logging->level().empty()) logging->set_level("info");
}

fetchbox::runtime::config::RuntimeConfig DefaultConfig() {
  fetchbox::runtime::config::RuntimeConfig config;
  ApplyDefaults(config);
  return config;
}

} // namespace fetchbox::config
