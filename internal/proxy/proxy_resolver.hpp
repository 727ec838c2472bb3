#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace fetchbox::runtime::config {
class ProxyConfig;
}

namespace fetchbox::proxy {

struct ProxyEndpoint {
  std::string url; // empty = direct connection

  bool Direct() const {
    return url.empty();
  }
};

inline bool operator==(const ProxyEndpoint& a, const ProxyEndpoint& b) {
  return a.url == b.url;
}

/*
  tiers[0] is tried first; within a tier endpoints are tried in order.
*/
struct ResolvedProxyPool {
  std::vector<std::vector<ProxyEndpoint>> tiers;

  bool Empty() const;
};

struct PoolDefinition {
  std::vector<std::string> primary;
  std::vector<std::string> fallbacks; // pool names, "pools/<name>" accepted
};

using PoolGraph = std::map<std::string, PoolDefinition>;

PoolGraph PoolGraphFromConfig(const fetchbox::runtime::config::ProxyConfig& config);

/*
  Flattens the pool graph into fallback tiers.

  Depth-first from the named pool, each visited pool contributes its primary
  list as one tier in visitation order. A pool reachable through several
  paths (including cycles) appears once, at its first visit.

  Results are cached per pool name until Reload().
*/
class ProxyResolver {
 public:
  explicit ProxyResolver(PoolGraph pools);

  // Empty name resolves to a single direct tier. Throws util::ProxyPoolNotFound.
  std::shared_ptr<const ResolvedProxyPool> Resolve(const std::string& pool_name);

  void Reload(PoolGraph pools);

 private:
  ResolvedProxyPool Flatten(const std::string& pool_name) const;

  std::mutex                                                                mutex_;
  PoolGraph                                                                 pools_;
  std::unordered_map<std::string, std::shared_ptr<const ResolvedProxyPool>> cache_;
};

} // namespace fetchbox::proxy
