#include "domainflow/pool/resource_pool.hpp"

#include <gtest/gtest.h>

#include <map>

using namespace domainflow;
using namespace std::chrono_literals;

namespace {

const util::TimePoint kNow = util::from_unix_millis(1'700'000'000'000);

auto make_pool(std::vector<std::string> ids, SelectionStrategy strategy,
               std::chrono::seconds rotation = 0s,
               std::shared_ptr<HealthRegistry> registry = nullptr)
    -> ResourcePool {
  if (!registry) {
    registry = std::make_shared<HealthRegistry>(
        resource_state::CircuitPolicy{.failure_threshold = 2,
                                      .probe_interval = 60s});
  }
  return ResourcePool(ResourceKind::Persona, std::move(ids), strategy,
                      rotation, std::move(registry));
}

} // namespace

TEST(ResourcePoolTest, RoundRobinCyclesSortedIds) {
  auto pool = make_pool({"c", "a", "b", "a"}, SelectionStrategy::RoundRobin);
  EXPECT_EQ(pool.size(), 3U);
  EXPECT_EQ(pool.select("d", "", kNow).value(), "a");
  EXPECT_EQ(pool.select("d", "", kNow).value(), "b");
  EXPECT_EQ(pool.select("d", "", kNow).value(), "c");
  EXPECT_EQ(pool.select("d", "", kNow).value(), "a");
}

TEST(ResourcePoolTest, EmptyPoolIsExhausted) {
  auto pool = make_pool({}, SelectionStrategy::RoundRobin);
  EXPECT_EQ(pool.select("d", "", kNow).error(),
            make_error_code(Error::ResourcePoolExhausted));
}

TEST(ResourcePoolTest, OpenCircuitsAreSkipped) {
  auto pool = make_pool({"a", "b"}, SelectionStrategy::RoundRobin);
  pool.report("a", false, kNow);
  pool.report("a", false, kNow);
  for (int i = 0; i < 4; ++i) {
    EXPECT_EQ(pool.select("d", "", kNow).value(), "b");
  }
  pool.report("b", false, kNow);
  pool.report("b", false, kNow);
  EXPECT_EQ(pool.select("d", "", kNow).error(),
            make_error_code(Error::ResourcePoolExhausted));
}

TEST(ResourcePoolTest, SharedRegistryExcludesAcrossPools) {
  auto registry = std::make_shared<HealthRegistry>(
      resource_state::CircuitPolicy{.failure_threshold = 1,
                                    .probe_interval = 60s});
  auto first = make_pool({"a", "b"}, SelectionStrategy::RoundRobin, 0s,
                         registry);
  auto second = make_pool({"a", "b"}, SelectionStrategy::RoundRobin, 0s,
                          registry);
  first.report("a", false, kNow);
  EXPECT_EQ(second.select("d", "", kNow).value(), "b");
  EXPECT_EQ(second.select("d", "", kNow).value(), "b");
}

TEST(ResourcePoolTest, ExcludeHonouredWhileAlternativeExists) {
  auto pool = make_pool({"a", "b"}, SelectionStrategy::StickyPerDomain);
  auto first = pool.select("example.com", "", kNow).value();
  auto retry = pool.select("example.com", first, kNow).value();
  EXPECT_NE(first, retry);

  auto single = make_pool({"a"}, SelectionStrategy::StickyPerDomain);
  EXPECT_EQ(single.select("example.com", "a", kNow).value(), "a");
}

TEST(ResourcePoolTest, StickyKeepsDomainOnSameResource) {
  auto pool = make_pool({"a", "b", "c"}, SelectionStrategy::StickyPerDomain);
  auto first = pool.select("shop.com", "", kNow).value();
  for (int i = 0; i < 5; ++i) {
    EXPECT_EQ(pool.select("shop.com", "", kNow).value(), first);
  }
}

TEST(ResourcePoolTest, WeightedFavoursHigherSuccessRate) {
  auto registry = std::make_shared<HealthRegistry>(
      resource_state::CircuitPolicy{.failure_threshold = 100,
                                    .probe_interval = 60s});
  auto pool = make_pool({"good", "poor"},
                        SelectionStrategy::WeightedBySuccessRate, 0s, registry);
  for (int i = 0; i < 4; ++i) {
    pool.report("good", true, kNow);
  }
  // poor: 1 of 4 succeeded.
  pool.report("poor", true, kNow);
  for (int i = 0; i < 3; ++i) {
    pool.report("poor", false, kNow);
  }

  std::map<std::string, int> picks;
  for (int i = 0; i < 50; ++i) {
    picks[pool.select("d", "", kNow).value()]++;
  }
  EXPECT_EQ(picks["good"], 40);
  EXPECT_EQ(picks["poor"], 10);
}

TEST(ResourcePoolTest, RotationRestsBusyResource) {
  auto pool = make_pool({"a", "b"}, SelectionStrategy::StickyPerDomain, 10s);
  auto first = pool.select("shop.com", "", kNow).value();
  EXPECT_EQ(pool.select("shop.com", "", kNow + 5s).value(), first);
  // Ten seconds of continuous use: rested, the other one takes over.
  auto rotated = pool.select("shop.com", "", kNow + 10s).value();
  EXPECT_NE(rotated, first);
  EXPECT_EQ(pool.select("shop.com", "", kNow + 12s).value(), rotated);
}
