#include "proxy_resolver.hpp"

#include <functional>
#include <set>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace fetchbox::proxy {

namespace {

constexpr std::string_view kPoolPrefix = "pools/";

std::string NormalizePoolName(const std::string& name) {
  if (name.compare(0, kPoolPrefix.size(), kPoolPrefix) == 0) {
    return name.substr(kPoolPrefix.size());
  }
  return name;
}

} // namespace

bool ResolvedProxyPool::Empty() const {
  for (const auto& tier : tiers) {
    if (!tier.empty()) return false;
  }
  return true;
}

PoolGraph PoolGraphFromConfig(const fetchbox::runtime::config::ProxyConfig& config) {
  PoolGraph graph;
  for (const auto& [name, pool] : config.pools()) {
    PoolDefinition definition;
    definition.primary.assign(pool.primary().begin(), pool.primary().end());
    definition.fallbacks.assign(pool.fallbacks().begin(), pool.fallbacks().end());
    graph.emplace(NormalizePoolName(name), std::move(definition));
  }
  return graph;
}

ProxyResolver::ProxyResolver(PoolGraph pools) : pools_(std::move(pools)) {
}

std::shared_ptr<const ResolvedProxyPool> ProxyResolver::Resolve(const std::string& pool_name) {
  const auto name = NormalizePoolName(pool_name);

  std::lock_guard lock(mutex_);
  if (auto it = cache_.find(name); it != cache_.end()) {
    return it->second;
  }

  auto resolved = std::make_shared<const ResolvedProxyPool>(Flatten(name));
  cache_.emplace(name, resolved);
  return resolved;
}

void ProxyResolver::Reload(PoolGraph pools) {
  std::lock_guard lock(mutex_);
  pools_ = std::move(pools);
  cache_.clear();
}

ResolvedProxyPool ProxyResolver::Flatten(const std::string& pool_name) const {
  ResolvedProxyPool resolved;

  if (pool_name.empty()) {
    resolved.tiers.push_back({ProxyEndpoint{}});
    return resolved;
  }

  std::set<std::string> visited;

  std::function<void(const std::string&)> visit = [&](const std::string& name) {
    if (!visited.insert(name).second) return;

    auto it = pools_.find(name);
    if (it == pools_.end()) {
      throw util::ProxyPoolNotFound("proxy pool '" + name + "' is not configured");
    }

    std::vector<ProxyEndpoint> tier;
    tier.reserve(it->second.primary.size());
    for (const auto& url : it->second.primary) {
      tier.push_back(ProxyEndpoint{url});
    }
    resolved.tiers.push_back(std::move(tier));

    for (const auto& fallback : it->second.fallbacks) {
      visit(NormalizePoolName(fallback));
    }
  };

  visit(pool_name);
  return resolved;
}

} // namespace fetchbox::proxy
