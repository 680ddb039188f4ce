#include "domainflow/core/runtime.hpp"
#include "domainflow/pool/health_prober.hpp"
#include "domainflow/storage/memory_store.hpp"

#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <tuple>

using namespace domainflow;
using namespace std::chrono_literals;
using domainflow::test::run_coro;

namespace {

class ScriptedProber final : public ResourceProber {
public:
  auto probe_persona(const Persona &persona) -> task<bool> override {
    probed.push_back(persona.id.str());
    co_return persona_ok;
  }
  auto probe_proxy(const Proxy &proxy) -> task<bool> override {
    probed.push_back(proxy.id.str());
    co_return proxy_ok;
  }

  bool persona_ok{true};
  bool proxy_ok{true};
  std::vector<std::string> probed;
};

class HealthProberTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(run_coro(store.open()));
    ASSERT_TRUE(run_coro(store.upsert_persona(test::dns_persona("p1"))));
    ASSERT_TRUE(run_coro(store.upsert_persona(test::dns_persona("p2"))));
    auto campaign = test::make_campaign(DnsValidationParams{
        .settings = test::dns_settings(CampaignId{"src"},
                                       {PersonaId{"p1"}, PersonaId{"p2"}})});
    ASSERT_TRUE(run_coro(pools.acquire(campaign)));
  }

  auto open_circuit(std::string_view id, util::TimePoint at) -> void {
    for (int i = 0; i < 2; ++i) {
      std::ignore = registry->report(ResourceKind::Persona, id, false, at);
    }
  }

  storage::MemoryCampaignStore store;
  std::shared_ptr<HealthRegistry> registry = std::make_shared<HealthRegistry>(
      resource_state::CircuitPolicy{.failure_threshold = 2,
                                    .probe_interval = 30s});
  ResourcePoolManager pools{store, registry};
  Runtime runtime{1};
  ScriptedProber prober;
  HealthProber health{runtime, pools, prober, PoolConfig{}};
};

} // namespace

TEST_F(HealthProberTest, ProbesOnlyAfterInterval) {
  const auto t0 = util::Clock::now();
  open_circuit("p1", t0);
  ASSERT_EQ(registry->get(ResourceKind::Persona, "p1")->circuit,
            CircuitState::Open);

  EXPECT_EQ(run_coro(health.probe_once(t0 + 5s)), 0U);
  EXPECT_EQ(run_coro(health.probe_once(t0 + 31s)), 1U);
  EXPECT_EQ(prober.probed, std::vector<std::string>{"p1"});
  EXPECT_EQ(registry->get(ResourceKind::Persona, "p1")->circuit,
            CircuitState::Closed);
  EXPECT_TRUE(registry->is_eligible(ResourceKind::Persona, "p1",
                                    util::Clock::now()));
}

TEST_F(HealthProberTest, FailedProbeKeepsCircuitOpen) {
  const auto t0 = util::Clock::now();
  open_circuit("p2", t0);
  prober.persona_ok = false;

  EXPECT_EQ(run_coro(health.probe_once(t0 + 31s)), 1U);
  auto h = registry->get(ResourceKind::Persona, "p2");
  ASSERT_TRUE(h);
  EXPECT_EQ(h->circuit, CircuitState::Open);
  EXPECT_FALSE(h->healthy);
}

TEST_F(HealthProberTest, FlushPersistsChangedHealth) {
  open_circuit("p1", util::Clock::now());
  auto written = run_coro(pools.flush_health());
  ASSERT_TRUE(written);
  EXPECT_EQ(*written, 1U);

  std::vector ids{PersonaId{"p1"}};
  auto stored = run_coro(store.get_personas(ids));
  ASSERT_EQ(stored->size(), 1U);
  EXPECT_EQ((*stored)[0].health.circuit, CircuitState::Open);

  auto again = run_coro(pools.flush_health());
  EXPECT_EQ(*again, 0U);
}

TEST_F(HealthProberTest, StartStop) {
  ASSERT_TRUE(runtime.start());
  health.start();
  EXPECT_TRUE(health.is_running());
  health.stop();
  EXPECT_FALSE(health.is_running());
  runtime.stop();
}
