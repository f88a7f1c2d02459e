/**
 * @file test_scan.cpp
 * @brief Orchestration: resolution cache, target expansion, worker pool
 *        completeness and failure isolation, summary.
 *
 * Network operations are replaced through scan_hooks so the tests run offline.
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "scan.hpp"

namespace {
  scan_hooks fake_hooks() {
    scan_hooks h;
    h.probe = [](const std::string& ip, const std::string&) {
      // last octet doubles as the latency
      const double ms = std::stod(ip.substr(ip.rfind('.') + 1));
      return probe_outcome{ip, ms, ms < 100};
    };
    h.region = [](const std::string&) { return std::string("ptr.example"); };
    h.locate = [](const std::string& ip) {
      geodata g;
      g.ip = ip;
      g.country = "JP";
      g.region = "13";
      g.city = "Tokyo";
      return g;
    };
    return h;
  }

  std::vector<resolved_target> make_targets(size_t n) {
    std::vector<resolved_target> targets;
    for (size_t i = 0; i < n; ++i)
      targets.push_back({{"E" + std::to_string(i), "Cat", "d.example"}, "192.0.2." + std::to_string(i % 250)});
    return targets;
  }

  enriched_result with_status(colo_status s) {
    enriched_result r{};
    r.status = s;
    return r;
  }
}

// --------------------------- Resolution ------------------------------------

TEST(ResolveDomains, SharedDomainResolvedOnce) {
  const std::vector<endpoint> eps = {
      {"SPOT", "Spot", "api.example.com"},
      {"SPOT_ALT", "Spot", "api.example.com"},
      {"WS", "Stream", "ws.example.com"},
      {"DEAD", "Stream", "gone.example.com"},
  };
  std::map<std::string, int> calls;
  domain_cache cache([&calls](const std::string& d) {
    ++calls[d];
    if (d == "gone.example.com") return ip_list{};
    if (d == "ws.example.com") return ip_list{"198.51.100.7"};
    return ip_list{"192.0.2.1", "192.0.2.2"};
  });
  std::ostringstream log;

  resolve_domains(eps, cache, log);
  EXPECT_EQ(calls["api.example.com"], 1);
  EXPECT_EQ(calls["ws.example.com"], 1);
  EXPECT_EQ(calls["gone.example.com"], 1);
  EXPECT_NE(log.str().find("gone.example.com: no IPv4 addresses"), std::string::npos);

  const auto targets = expand_targets(eps, cache);
  ASSERT_EQ(targets.size(), 5u);
  EXPECT_EQ(targets[0].ep.name, "SPOT");
  EXPECT_EQ(targets[0].ip, "192.0.2.1");
  EXPECT_EQ(targets[1].ip, "192.0.2.2");
  EXPECT_EQ(targets[2].ep.name, "SPOT_ALT");
  EXPECT_EQ(targets[2].ip, "192.0.2.1");
  EXPECT_EQ(targets[4].ep.name, "WS");
}

// --------------------------- Worker pool -----------------------------------

/**
 * @test EveryTargetYieldsOneResult
 * @brief More targets than workers; every target must come back exactly once.
 */
TEST(RunScan, EveryTargetYieldsOneResult) {
  const auto targets = make_targets(500);
  scan_options opts;
  opts.workers = 16;
  std::ostringstream log;

  const auto results = run_scan(targets, opts, fake_hooks(), log);
  ASSERT_EQ(results.size(), targets.size());

  std::multiset<std::string> names;
  for (const auto& r : results) names.insert(r.constant);
  for (const auto& t : targets) EXPECT_EQ(names.count(t.ep.name), 1u) << t.ep.name;
}

TEST(RunScan, EnrichesAndClassifies) {
  const std::vector<resolved_target> targets = {
      {{"FAST", "Spot", "api.example.com"}, "192.0.2.5"},
      {{"EDGE", "Spot", "api.example.com"}, "192.0.2.12"},
      {{"DOWN", "Spot", "api.example.com"}, "192.0.2.200"},
  };
  scan_options opts;
  opts.threshold = 12.0;
  std::ostringstream log;

  auto results = run_scan(targets, opts, fake_hooks(), log);
  ASSERT_EQ(results.size(), 3u);
  std::sort(results.begin(), results.end(), [](const auto& a, const auto& b) { return a.latency_ms < b.latency_ms; });

  EXPECT_EQ(results[0].constant, "FAST");
  EXPECT_EQ(results[0].category, "Spot");
  EXPECT_EQ(results[0].domain, "api.example.com");
  EXPECT_EQ(results[0].status, colo_status::colo);
  EXPECT_EQ(results[0].aws_region, "ptr.example");
  EXPECT_EQ(results[0].country, "JP");
  EXPECT_EQ(results[0].region, "13");
  EXPECT_EQ(results[0].city, "Tokyo");
  EXPECT_EQ(results[1].status, colo_status::slow);
  EXPECT_EQ(results[2].status, colo_status::fail);
  EXPECT_DOUBLE_EQ(results[2].latency_ms, 200.0);
}

TEST(RunScan, SniIsTheEndpointDomain) {
  std::mutex mtx;
  std::set<std::pair<std::string, std::string>> seen;
  scan_hooks hooks = fake_hooks();
  hooks.probe = [&](const std::string& ip, const std::string& sni) {
    std::lock_guard<std::mutex> lk(mtx);
    seen.insert({ip, sni});
    return probe_outcome{ip, 1.0, true};
  };
  const std::vector<resolved_target> targets = {
      {{"A", "c", "a.example"}, "192.0.2.1"},
      {{"B", "c", "b.example"}, "192.0.2.1"},
  };
  std::ostringstream log;
  run_scan(targets, scan_options{}, hooks, log);
  EXPECT_EQ(seen.count({"192.0.2.1", "a.example"}), 1u);
  EXPECT_EQ(seen.count({"192.0.2.1", "b.example"}), 1u);
}

TEST(RunScan, ConcurrencyIsBounded) {
  std::atomic<int> active{0};
  std::atomic<int> peak{0};
  scan_hooks hooks = fake_hooks();
  hooks.probe = [&](const std::string& ip, const std::string&) {
    const int now = ++active;
    int prev = peak.load();
    while (prev < now && !peak.compare_exchange_weak(prev, now)) {}
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    --active;
    return probe_outcome{ip, 1.0, true};
  };
  scan_options opts;
  opts.workers = 4;
  std::ostringstream log;

  const auto results = run_scan(make_targets(64), opts, hooks, log);
  EXPECT_EQ(results.size(), 64u);
  EXPECT_LE(peak.load(), 4);
}

/**
 * @test FailuresStayWithTheirTarget
 * @brief A throwing component only degrades its own field of its own row.
 */
TEST(RunScan, FailuresStayWithTheirTarget) {
  scan_hooks hooks = fake_hooks();
  hooks.probe = [](const std::string& ip, const std::string&) -> probe_outcome {
    if (ip == "192.0.2.1") throw std::runtime_error("socket exploded");
    return probe_outcome{ip, 3.0, true};
  };
  hooks.region = [](const std::string& ip) -> std::string {
    if (ip == "192.0.2.2") throw std::runtime_error("resolver gone");
    return "ptr.example";
  };
  hooks.locate = [](const std::string& ip) -> geodata {
    if (ip == "192.0.2.3") throw std::runtime_error("bad json");
    geodata g;
    g.ip = ip;
    g.country = "JP";
    return g;
  };
  const std::vector<resolved_target> targets = {
      {{"P", "c", "d.example"}, "192.0.2.1"},
      {{"R", "c", "d.example"}, "192.0.2.2"},
      {{"G", "c", "d.example"}, "192.0.2.3"},
      {{"OK", "c", "d.example"}, "192.0.2.4"},
  };
  std::ostringstream log;
  const auto results = run_scan(targets, scan_options{}, hooks, log);
  ASSERT_EQ(results.size(), 4u);

  std::map<std::string, enriched_result> by_name;
  for (const auto& r : results) by_name[r.constant] = r;

  EXPECT_EQ(by_name["P"].status, colo_status::fail);
  EXPECT_EQ(by_name["P"].ip, "192.0.2.1");
  EXPECT_EQ(by_name["P"].country, "JP");
  EXPECT_EQ(by_name["R"].aws_region, "No PTR");
  EXPECT_EQ(by_name["R"].status, colo_status::colo);
  EXPECT_EQ(by_name["G"].country, "Unknown");
  EXPECT_EQ(by_name["G"].city, "Unknown");
  EXPECT_EQ(by_name["G"].aws_region, "ptr.example");
  EXPECT_EQ(by_name["OK"].status, colo_status::colo);
  EXPECT_EQ(by_name["OK"].aws_region, "ptr.example");
  EXPECT_NE(log.str().find("socket exploded"), std::string::npos);
}

TEST(RunScan, NonStandardThrowIsContained) {
  scan_hooks hooks = fake_hooks();
  hooks.region = [](const std::string& ip) -> std::string {
    if (ip == "192.0.2.1") throw 42;
    return "ptr.example";
  };
  const std::vector<resolved_target> targets = {
      {{"ODD", "c", "d.example"}, "192.0.2.1"},
      {{"OK", "c", "d.example"}, "192.0.2.2"},
  };
  std::ostringstream log;
  const auto results = run_scan(targets, scan_options{}, hooks, log);
  ASSERT_EQ(results.size(), 2u);
  for (const auto& r : results)
    EXPECT_EQ(r.aws_region, r.constant == "ODD" ? "No PTR" : "ptr.example");
  EXPECT_NE(log.str().find("ptr 192.0.2.1 failed: unknown error"), std::string::npos);
}

TEST(RunScan, NoTargets) {
  std::ostringstream log;
  EXPECT_TRUE(run_scan({}, scan_options{}, fake_hooks(), log).empty());
}

TEST(RunScan, ProgressReachesTotal) {
  std::atomic<size_t> calls{0};
  std::atomic<size_t> max_done{0};
  scan_options opts;
  opts.workers = 8;
  std::ostringstream log;
  run_scan(make_targets(40), opts, fake_hooks(), log, [&](size_t done, size_t total) {
    ++calls;
    EXPECT_EQ(total, 40u);
    size_t prev = max_done.load();
    while (prev < done && !max_done.compare_exchange_weak(prev, done)) {}
  });
  EXPECT_EQ(calls.load(), 40u);
  EXPECT_EQ(max_done.load(), 40u);
}

// --------------------------- Summary ---------------------------------------

TEST(Summarize, ThreeOfSixIsHalf) {
  const std::vector<enriched_result> results = {
      with_status(colo_status::colo), with_status(colo_status::colo), with_status(colo_status::colo),
      with_status(colo_status::slow), with_status(colo_status::slow), with_status(colo_status::fail),
  };
  const scan_summary s = summarize(results);
  EXPECT_EQ(s.colo_count, 3u);
  EXPECT_EQ(s.total_count, 6u);
  EXPECT_DOUBLE_EQ(s.colo_percentage, 50.0);
}

TEST(Summarize, EmptyIsZero) {
  const scan_summary s = summarize({});
  EXPECT_EQ(s.colo_count, 0u);
  EXPECT_EQ(s.total_count, 0u);
  EXPECT_EQ(s.colo_percentage, 0.0);
}
