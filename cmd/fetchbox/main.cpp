#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/config/defaults.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/proxy/proxy_resolver.hpp"
#include "internal/runtime/server.hpp"

using fetchbox::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;
static volatile std::sig_atomic_t g_reload  = 0;

void HandleSignal(int) {
  g_running = 0;
}

void HandleReload(int) {
  g_reload = 1;
}

// Re-reads the config file and swaps in its proxy pools. Other sections need a restart.
void ReloadProxyPools(const std::string& config_path, const fetchbox::factory::Application& app) {
  try {
    auto config = fetchbox::config::ConfigLoader::LoadFromYaml(config_path);
    fetchbox::config::ApplyDefaults(config);
    app.context->proxies->Reload(fetchbox::proxy::PoolGraphFromConfig(config.proxy()));
    FETCHBOX_LOG_INFO("Proxy pools reloaded", {fetchbox::observability::UIntField("pools", config.proxy().pools_size())});
  } catch (const std::exception& e) {
    FETCHBOX_LOG_ERROR("Proxy pool reload failed, keeping current pools", {fetchbox::observability::StringField("error", e.what())});
  }
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: fetchbox <config.yaml> OR fetchbox --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = fetchbox::config::ConfigLoader::LoadFromYaml(config_path);
    fetchbox::config::ApplyDefaults(config);

    const auto instance_id = fetchbox::factory::MakeInstanceId();
    fetchbox::observability::InitializeLogging(config);
    fetchbox::observability::InitializeTracing(config, instance_id);
    fetchbox::observability::InitializeMetrics(config, instance_id);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = fetchbox::factory::Build(config, instance_id);

    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
    std::signal(SIGHUP, HandleReload);

    app.broker->Start();
    server.Start();
    FETCHBOX_LOG_INFO("FetchBox started", {fetchbox::observability::StringField("bind_address", config.server().bind_address()),
                                           fetchbox::observability::StringField("instance_id", app.instance_id)});

    while (g_running) {
      if (g_reload) {
        g_reload = 0;
        ReloadProxyPools(config_path, app);
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    FETCHBOX_LOG_INFO("Shutting down fetchbox");

    server.Stop();
    app.broker->Shutdown(app.shutdown_grace);

    fetchbox::observability::ShutdownLogging();
    fetchbox::observability::ShutdownMetrics();
    fetchbox::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    FETCHBOX_LOG_ERROR("Fatal error", {fetchbox::observability::StringField("error", e.what())});
    fetchbox::observability::ShutdownLogging();
    fetchbox::observability::ShutdownMetrics();
    fetchbox::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
