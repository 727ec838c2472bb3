#include "internal/proxy/proxy_resolver.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace {

using fetchbox::proxy::PoolGraph;
using fetchbox::proxy::ProxyResolver;
using fetchbox::proxy::ResolvedProxyPool;

std::vector<std::vector<std::string>> Urls(const ResolvedProxyPool& pool) {
  std::vector<std::vector<std::string>> tiers;
  for (const auto& tier : pool.tiers) {
    std::vector<std::string> urls;
    for (const auto& endpoint : tier) urls.push_back(endpoint.url);
    tiers.push_back(std::move(urls));
  }
  return tiers;
}

PoolGraph CyclicGraph() {
  PoolGraph graph;
  graph["eu"]     = {{"http://eu-1:3128", "http://eu-2:3128"}, {"pools/us", "backup"}};
  graph["us"]     = {{"http://us-1:3128"}, {"eu"}};
  graph["backup"] = {{"http://backup-1:3128"}, {"pools/us"}};
  return graph;
}

void TestDepthFirstTiersVisitEachPoolOnce() {
  ProxyResolver resolver(CyclicGraph());

  const auto eu = resolver.Resolve("eu");
  const std::vector<std::vector<std::string>> expected_eu = {
      {"http://eu-1:3128", "http://eu-2:3128"},
      {"http://us-1:3128"},
      {"http://backup-1:3128"},
  };
  assert(Urls(*eu) == expected_eu);

  const auto backup = resolver.Resolve("pools/backup");
  const std::vector<std::vector<std::string>> expected_backup = {
      {"http://backup-1:3128"},
      {"http://us-1:3128"},
      {"http://eu-1:3128", "http://eu-2:3128"},
  };
  assert(Urls(*backup) == expected_backup);
}

void TestResolveIsCached() {
  ProxyResolver resolver(CyclicGraph());
  const auto    first  = resolver.Resolve("eu");
  const auto    second = resolver.Resolve("pools/eu");
  assert(first.get() == second.get());
}

void TestEmptyNameIsDirect() {
  ProxyResolver resolver({});
  const auto    direct = resolver.Resolve("");
  assert(direct->tiers.size() == 1);
  assert(direct->tiers[0].size() == 1);
  assert(direct->tiers[0][0].Direct());
  assert(!direct->Empty());
}

void TestUnknownPoolThrows() {
  PoolGraph graph;
  graph["a"] = {{"http://a:1"}, {"missing"}};
  ProxyResolver resolver(graph);

  for (const std::string name : {"missing", "a"}) {
    bool thrown = false;
    try {
      resolver.Resolve(name);
    } catch (const fetchbox::util::ProxyPoolNotFound&) {
      thrown = true;
    }
    assert(thrown);
  }
}

void TestPoolWithoutEndpointsIsEmpty() {
  PoolGraph graph;
  graph["hollow"] = {{}, {}};
  ProxyResolver resolver(graph);
  assert(resolver.Resolve("hollow")->Empty());
}

void TestReloadDropsCache() {
  ProxyResolver resolver(CyclicGraph());
  const auto    before = resolver.Resolve("us");
  assert(before->tiers.size() == 3);

  PoolGraph graph;
  graph["us"] = {{"http://us-9:3128"}, {}};
  resolver.Reload(graph);

  const auto after = resolver.Resolve("us");
  assert(Urls(*after) == (std::vector<std::vector<std::string>>{{"http://us-9:3128"}}));
  // handed-out snapshots stay valid
  assert(before->tiers.size() == 3);
}

void TestGraphFromConfig() {
  fetchbox::runtime::config::ProxyConfig config;
  auto&                                  pools = *config.mutable_pools();
  pools["pools/main"].add_primary("http://m:1");
  pools["pools/main"].add_fallbacks("pools/spare");
  pools["spare"].add_primary("http://s:1");

  ProxyResolver resolver(fetchbox::proxy::PoolGraphFromConfig(config));
  assert(Urls(*resolver.Resolve("main")) == (std::vector<std::vector<std::string>>{{"http://m:1"}, {"http://s:1"}}));
}

} // namespace

int main() {
  TestDepthFirstTiersVisitEachPoolOnce();
  TestResolveIsCached();
  TestEmptyNameIsDirect();
  TestUnknownPoolThrows();
  TestPoolWithoutEndpointsIsEmpty();
  TestReloadDropsCache();
  TestGraphFromConfig();

  std::cout << "fetchbox_unit_proxy_resolver: pass\n";
  return 0;
}
