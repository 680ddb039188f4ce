#include "domainflow/storage/memory_store.hpp"
#include "domainflow/validation/validation_pipeline.hpp"

#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <mutex>

using namespace domainflow;
using domainflow::test::run_coro;

namespace {

class ValidationPipelineTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(run_coro(store.open()));
    ASSERT_TRUE(run_coro(store.upsert_persona(test::dns_persona("dns-1"))));
    ASSERT_TRUE(run_coro(store.upsert_persona(test::dns_persona("dns-2"))));
    ASSERT_TRUE(run_coro(store.upsert_persona(test::http_persona("http-1"))));
  }

  auto add(CampaignParams params,
           CampaignStatus status = CampaignStatus::Running) -> Campaign {
    auto c = test::make_campaign(std::move(params), status);
    EXPECT_TRUE(run_coro(store.create_campaign(c)));
    return c;
  }

  auto generation_with(std::vector<std::string> names,
                       CampaignStatus status = CampaignStatus::Completed)
      -> Campaign {
    auto c = add(test::generation_params(), status);
    std::vector<GeneratedDomain> rows;
    for (std::size_t i = 0; i < names.size(); ++i) {
      rows.push_back(GeneratedDomain{.domain_name = names[i],
                                     .offset_index = static_cast<std::int64_t>(i)});
    }
    EXPECT_TRUE(run_coro(store.commit_generated_domains(c.id, rows)));
    return c;
  }

  auto dns_campaign(const CampaignId &source,
                    std::vector<PersonaId> personas = {PersonaId{"dns-1"},
                                                       PersonaId{"dns-2"}})
      -> Campaign {
    return add(DnsValidationParams{
        .settings = test::dns_settings(source, std::move(personas))});
  }

  auto batch(const CampaignId &id) -> Result<BatchOutcome> {
    auto fresh = run_coro(store.get_campaign(id));
    if (!fresh) {
      return std::unexpected(fresh.error());
    }
    return run_coro(pipeline.run_batch(*fresh));
  }

  storage::MemoryCampaignStore store;
  std::shared_ptr<HealthRegistry> health = std::make_shared<HealthRegistry>();
  ResourcePoolManager pools{store, health};
  test::FakeDnsChecker dns;
  test::FakeHttpChecker http;
  ValidationPipeline pipeline{store, pools, dns, http, HttpConfig{}};
};

} // namespace

TEST_F(ValidationPipelineTest, DnsBatchRecordsEveryDomain) {
  auto gen = generation_with({"a.com", "b.com", "c.com"});
  auto val = dns_campaign(gen.id);
  dns.resolved["a.com"] = "192.0.2.1";
  dns.resolved["c.com"] = "192.0.2.3";

  auto outcome = batch(val.id);
  ASSERT_TRUE(outcome) << outcome.error().message();
  EXPECT_EQ(outcome->processed, 3);
  EXPECT_TRUE(outcome->done);
  EXPECT_EQ(outcome->counters.successful_items, 2);
  EXPECT_EQ(outcome->counters.failed_items, 1);
  EXPECT_EQ(outcome->counters.total_items, 3);

  auto results = run_coro(store.list_dns_results(val.id));
  ASSERT_TRUE(results);
  ASSERT_EQ(results->size(), 3U);
  EXPECT_EQ((*results)[0].domain_name, "a.com");
  EXPECT_EQ((*results)[0].ips, std::vector<std::string>{"192.0.2.1"});
  EXPECT_EQ((*results)[1].status, DnsStatus::Unresolved);
  EXPECT_EQ((*results)[1].attempts, 1);

  auto stored = run_coro(store.get_campaign(val.id));
  EXPECT_GT(stored->source_cursor, 0);
}

TEST_F(ValidationPipelineTest, TransportFailuresAreRetriedThenRecorded) {
  auto gen = generation_with({"flaky.com"});
  auto val = dns_campaign(gen.id);
  dns.failing["flaky.com"] = true;

  auto outcome = batch(val.id);
  ASSERT_TRUE(outcome);
  EXPECT_EQ(dns.calls.load(), 2);

  auto results = run_coro(store.list_dns_results(val.id));
  ASSERT_EQ(results->size(), 1U);
  const auto &r = (*results)[0];
  EXPECT_EQ(r.status, DnsStatus::Error);
  EXPECT_EQ(r.system_status, SystemStatus::TransportError);
  EXPECT_EQ(r.attempts, 2);
  // The retry moved to the other persona.
  EXPECT_EQ(r.persona_id.value(), "dns-2");
  EXPECT_EQ(outcome->counters.failed_items, 1);
}

TEST_F(ValidationPipelineTest, WaitsWhileSourceIsActive) {
  auto gen = generation_with({}, CampaignStatus::Running);
  auto val = dns_campaign(gen.id);

  auto outcome = batch(val.id);
  ASSERT_TRUE(outcome);
  EXPECT_TRUE(outcome->waiting_for_source);
  EXPECT_FALSE(outcome->done);
  EXPECT_EQ(dns.calls.load(), 0);
}

TEST_F(ValidationPipelineTest, ConsumesSourceIncrementally) {
  auto gen = generation_with({"a.com", "b.com"}, CampaignStatus::Running);
  auto val = dns_campaign(gen.id);

  auto first = batch(val.id);
  ASSERT_TRUE(first);
  EXPECT_EQ(first->processed, 2);
  EXPECT_FALSE(first->done);

  std::vector rows{GeneratedDomain{.domain_name = "c.com", .offset_index = 2}};
  ASSERT_TRUE(run_coro(store.commit_generated_domains(gen.id, rows)));
  ASSERT_TRUE(run_coro(store.update_campaign_status(
      gen.id, CampaignStatus::Running, CampaignStatus::Completed, "")));

  auto second = batch(val.id);
  ASSERT_TRUE(second);
  EXPECT_EQ(second->processed, 1);
  EXPECT_TRUE(second->done);
  EXPECT_EQ(second->counters.processed_items, 3);
  EXPECT_EQ(dns.calls.load(), 3);
}

TEST_F(ValidationPipelineTest, HttpStageReadsResolvedDomainsOnly) {
  auto gen = generation_with({"a.com", "b.com", "c.com"});
  auto val = dns_campaign(gen.id);
  dns.resolved["a.com"] = "192.0.2.1";
  dns.resolved["b.com"] = "192.0.2.2";
  ASSERT_TRUE(batch(val.id));
  ASSERT_TRUE(run_coro(store.update_campaign_status(
      val.id, CampaignStatus::Running, CampaignStatus::Completed, "")));

  HttpValidationParams params;
  params.settings = test::dns_settings(val.id, {PersonaId{"http-1"}});
  params.settings.source_type = CampaignType::DnsValidation;
  params.ad_hoc_keywords = {"sale"};
  auto web = add(params);
  http.add_page("http://a.com/", 200, "<title>A</title> summer sale");
  http.add_page("http://b.com/", 200, "<title>B</title> nothing");

  auto outcome = batch(web.id);
  ASSERT_TRUE(outcome) << outcome.error().message();
  EXPECT_EQ(outcome->processed, 2);
  EXPECT_TRUE(outcome->done);
  EXPECT_EQ(outcome->counters.successful_items, 1);

  auto results = run_coro(store.list_http_results(web.id));
  ASSERT_EQ(results->size(), 2U);
  EXPECT_EQ((*results)[0].status, HttpStatus::KeywordsFound);
  EXPECT_EQ((*results)[0].page_title, "A");
  EXPECT_EQ((*results)[1].status, HttpStatus::NoKeywords);
  EXPECT_TRUE((*results)[0].proxy_id.value().empty());
}

TEST_F(ValidationPipelineTest, HttpAttemptsUpdatePersonaHealth) {
  auto gen = generation_with({"up.com", "down.com"});
  auto val = dns_campaign(gen.id);
  dns.resolved["up.com"] = "192.0.2.1";
  dns.resolved["down.com"] = "192.0.2.2";
  ASSERT_TRUE(batch(val.id));
  ASSERT_TRUE(run_coro(store.update_campaign_status(
      val.id, CampaignStatus::Running, CampaignStatus::Completed, "")));

  HttpValidationParams params;
  params.settings = test::dns_settings(val.id, {PersonaId{"http-1"}});
  params.settings.source_type = CampaignType::DnsValidation;
  params.settings.retry_attempts = 0;
  auto web = add(params);
  http.add_page("http://up.com/", 200, "<title>Up</title>");

  ASSERT_TRUE(batch(web.id));
  auto h = health->get(ResourceKind::Persona, "http-1");
  ASSERT_TRUE(h.has_value());
  EXPECT_EQ(h->total_requests, 2);
  EXPECT_EQ(h->failed_requests, 1);
  EXPECT_DOUBLE_EQ(h->success_rate, 0.5);
}

TEST_F(ValidationPipelineTest, HttpPortsShareOneRequestTimeout) {
  auto gen = generation_with({"slow.com"});
  auto val = dns_campaign(gen.id);
  dns.resolved["slow.com"] = "192.0.2.1";
  ASSERT_TRUE(batch(val.id));
  ASSERT_TRUE(run_coro(store.update_campaign_status(
      val.id, CampaignStatus::Running, CampaignStatus::Completed, "")));

  HttpValidationParams params;
  params.settings = test::dns_settings(val.id, {PersonaId{"http-1"}});
  params.settings.source_type = CampaignType::DnsValidation;
  params.settings.retry_attempts = 0;
  params.settings.request_timeout_seconds = 1;
  params.target_http_ports = {80, 8080};
  auto web = add(params);
  http.delay = std::chrono::milliseconds(300);

  ASSERT_TRUE(batch(web.id));
  std::lock_guard lock(http.mu);
  ASSERT_EQ(http.timeouts.size(), 2U);
  EXPECT_LE(http.timeouts[0], std::chrono::seconds(1));
  EXPECT_GT(http.timeouts[0], std::chrono::milliseconds(700));
  EXPECT_LE(http.timeouts[1], std::chrono::milliseconds(700));
}

TEST_F(ValidationPipelineTest, MismatchedSourceTypeIsUnrecoverable) {
  auto gen = generation_with({"a.com"});
  auto settings = test::dns_settings(gen.id, {PersonaId{"dns-1"}});
  settings.source_type = CampaignType::DnsValidation;
  auto val = add(DnsValidationParams{.settings = settings});

  auto outcome = batch(val.id);
  ASSERT_FALSE(outcome);
  EXPECT_EQ(outcome.error(), make_error_code(Error::InvalidConfig));
  EXPECT_TRUE(is_unrecoverable(outcome.error()));
}

TEST_F(ValidationPipelineTest, MissingSourceIsUnrecoverable) {
  auto val = dns_campaign(CampaignId{"nope"});
  auto outcome = batch(val.id);
  ASSERT_FALSE(outcome);
  EXPECT_EQ(outcome.error(), make_error_code(Error::InvalidConfig));
}

TEST_F(ValidationPipelineTest, NoUsablePersonaExhaustsPool) {
  auto gen = generation_with({"a.com"});
  // An HTTP persona is not usable for DNS.
  auto val = dns_campaign(gen.id, {PersonaId{"http-1"}});
  auto outcome = batch(val.id);
  ASSERT_FALSE(outcome);
  EXPECT_EQ(outcome.error(), make_error_code(Error::ResourcePoolExhausted));
}

TEST(PacerTest, SpacesAttempts) {
  Pacer unlimited(0);
  auto now = std::chrono::steady_clock::now();
  EXPECT_EQ(unlimited.reserve(now), std::chrono::steady_clock::duration::zero());

  Pacer pacer(60);
  EXPECT_EQ(pacer.reserve(now), std::chrono::steady_clock::duration::zero());
  EXPECT_EQ(pacer.reserve(now), std::chrono::seconds(1));
  EXPECT_EQ(pacer.reserve(now), std::chrono::seconds(2));
  EXPECT_EQ(pacer.reserve(now + std::chrono::seconds(10)),
            std::chrono::steady_clock::duration::zero());
}
