#include "domainflow/app/campaign_plan.hpp"
#include "domainflow/progress/progress_aggregator.hpp"
#include "domainflow/scheduler/job_scheduler.hpp"
#include "domainflow/storage/memory_store.hpp"

#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <tuple>

using namespace domainflow;
using namespace std::chrono_literals;
using domainflow::test::run_coro;

namespace {

constexpr std::string_view kFullPlan = R"(
name = "shop-leads"

[[personas]]
id = "dns-a"
type = "dns"
resolvers = ["1.1.1.1:53", "8.8.8.8"]
query_type = "AAAA"

[[personas]]
id = "web-a"
type = "http"
user_agent = "leads/1.0"
allowed_status_codes = [200, 301]
follow_redirects = "false"

[[proxies]]
id = "squid"
host = "10.0.0.2"
port = 3128

[[keyword_sets]]
id = "commerce"
rules = [
  { pattern = "add to cart", rule_type = "string", weight = 2.0 },
  { pattern = "shop(ping)?", rule_type = "regex" }
]

[generation]
pattern_type = "both"
variable_length = 2
character_set = "ab"
constant_string = "shop"
tld = "net"
num_domains_to_generate = 8
batch_size = 4

[dns]
persona_ids = ["dns-a"]
persona_strategy = "weighted_by_success_rate"
parallel_workers = 4

[http]
name = "crawl"
persona_ids = ["web-a"]
keyword_set_ids = ["commerce"]
ad_hoc_keywords = ["sale"]
proxy_ids = ["squid"]
proxy_strategy = "sticky_per_domain"
target_http_ports = [80, 443]
)";

class NullNotifier final : public Notifier {
public:
  auto publish(const CampaignEvent & /*event*/) -> void override {}
};

} // namespace

TEST(CampaignPlanTest, LoadsAllStages) {
  auto plan = load_plan_from_string(kFullPlan);
  ASSERT_TRUE(plan) << plan.error().message();
  EXPECT_EQ(plan->name, "shop-leads");

  ASSERT_EQ(plan->personas.size(), 2U);
  const auto &dns = std::get<DnsPersonaConfig>(plan->personas[0].config);
  EXPECT_EQ(dns.resolvers.size(), 2U);
  EXPECT_EQ(dns.query_type, DnsQueryType::Aaaa);
  const auto &http = std::get<HttpPersonaConfig>(plan->personas[1].config);
  EXPECT_EQ(http.user_agent, "leads/1.0");
  EXPECT_EQ(http.follow_redirects, std::optional<bool>{false});
  EXPECT_EQ(plan->personas[1].name, "web-a");

  ASSERT_EQ(plan->proxies.size(), 1U);
  EXPECT_EQ(plan->proxies[0].protocol, "http");
  EXPECT_EQ(plan->proxies[0].port, 3128);

  ASSERT_EQ(plan->keyword_sets.size(), 1U);
  ASSERT_EQ(plan->keyword_sets[0].rules.size(), 2U);
  EXPECT_EQ(plan->keyword_sets[0].rules[1].rule_type, KeywordRuleType::Regex);
  EXPECT_DOUBLE_EQ(plan->keyword_sets[0].rules[0].weight, 2.0);

  EXPECT_EQ(plan->generation.name, "shop-leads generation");
  EXPECT_EQ(plan->generation.params.pattern_type, PatternType::Both);
  EXPECT_EQ(plan->generation.params.tld, "net");

  ASSERT_TRUE(plan->dns);
  EXPECT_EQ(plan->dns->params.settings.persona_strategy,
            SelectionStrategy::WeightedBySuccessRate);
  EXPECT_EQ(plan->dns->params.settings.parallel_workers, 4);

  ASSERT_TRUE(plan->http);
  EXPECT_EQ(plan->http->name, "crawl");
  const auto &hp = plan->http->params;
  EXPECT_EQ(hp.settings.source_type, CampaignType::DnsValidation);
  EXPECT_EQ(hp.proxy_strategy, SelectionStrategy::StickyPerDomain);
  EXPECT_EQ(hp.target_http_ports, (std::vector<std::uint16_t>{80, 443}));
  EXPECT_EQ(hp.ad_hoc_keywords, std::vector<std::string>{"sale"});
}

TEST(CampaignPlanTest, StagesWithoutPersonasAreAbsent) {
  auto plan = load_plan_from_string(R"(
name = "gen-only"
[generation]
variable_length = 3
character_set = "abc"
tld = "com"
num_domains_to_generate = 5
)");
  ASSERT_TRUE(plan) << plan.error().message();
  EXPECT_FALSE(plan->dns);
  EXPECT_FALSE(plan->http);
  EXPECT_EQ(plan->generation.params.pattern_type, PatternType::Prefix);
  EXPECT_EQ(plan->generation.params.batch_size, 1000);
}

TEST(CampaignPlanTest, HttpFromDnsNeedsDnsStage) {
  auto plan = load_plan_from_string(R"(
name = "x"
[generation]
variable_length = 1
character_set = "a"
tld = "com"
num_domains_to_generate = 1
[http]
persona_ids = ["web"]
)");
  EXPECT_EQ(plan.error(), make_error_code(Error::ParseError));

  plan = load_plan_from_string(R"(
name = "x"
[generation]
variable_length = 1
character_set = "a"
tld = "com"
num_domains_to_generate = 1
[http]
source = "generation"
persona_ids = ["web"]
)");
  ASSERT_TRUE(plan);
  EXPECT_EQ(plan->http->params.settings.source_type,
            CampaignType::DomainGeneration);
}

TEST(CampaignPlanTest, RejectsUnknownEnumValues) {
  EXPECT_FALSE(load_plan_from_string(R"(
name = "x"
[generation]
pattern_type = "middle"
)"));
  EXPECT_FALSE(load_plan_from_string(R"(
name = "x"
[[personas]]
id = "p"
type = "smtp"
)"));
  EXPECT_FALSE(load_plan_from_string(R"(
name = "x"
[[personas]]
id = "p"
type = "http"
follow_redirects = "maybe"
)"));
}

TEST(CampaignPlanTest, MissingFileFails) {
  EXPECT_EQ(load_plan_from_file("/nonexistent/plan.toml").error(),
            make_error_code(Error::FileNotFound));
}

TEST(CampaignPlanTest, LoadFromFile) {
  auto path = test::make_temp_path("domainflow_plan_");
  ASSERT_FALSE(path.empty());
  {
    std::ofstream out(path);
    out << kFullPlan;
  }
  auto plan = load_plan_from_file(path);
  std::ignore = std::remove(path.c_str());
  ASSERT_TRUE(plan);
  EXPECT_TRUE(plan->http);
}

TEST(CampaignPlanTest, SubmitChainsStages) {
  auto plan = load_plan_from_string(kFullPlan);
  ASSERT_TRUE(plan);

  storage::MemoryCampaignStore store;
  ASSERT_TRUE(run_coro(store.open()));
  NullNotifier notifier;
  ProgressAggregator progress{store, notifier};
  JobScheduler scheduler{store, ExponentialBackoff{{.base = 0ms, .max = 0ms}}};
  CampaignService service{store, scheduler, progress, SchedulerConfig{}};

  auto submitted = run_coro(submit_plan(service, *plan));
  ASSERT_TRUE(submitted) << submitted.error().message();
  ASSERT_TRUE(submitted->dns);
  ASSERT_TRUE(submitted->http);
  EXPECT_EQ(submitted->ids().size(), 3U);

  for (const auto &id : submitted->ids()) {
    auto c = run_coro(store.get_campaign(id));
    ASSERT_TRUE(c);
    EXPECT_EQ(c->status, CampaignStatus::Queued);
    auto jobs = run_coro(store.list_jobs(id));
    ASSERT_TRUE(jobs);
    EXPECT_EQ(jobs->size(), 1U);
  }

  auto dns = run_coro(store.get_campaign(*submitted->dns));
  EXPECT_EQ(validation_settings(dns->params)->source_campaign_id,
            submitted->generation);
  auto http = run_coro(store.get_campaign(*submitted->http));
  EXPECT_EQ(validation_settings(http->params)->source_campaign_id,
            *submitted->dns);
}

TEST(CampaignPlanTest, SubmitStopsOnBadProxy) {
  auto plan = load_plan_from_string(kFullPlan);
  ASSERT_TRUE(plan);
  plan->proxies[0].port = 0;

  storage::MemoryCampaignStore store;
  ASSERT_TRUE(run_coro(store.open()));
  NullNotifier notifier;
  ProgressAggregator progress{store, notifier};
  JobScheduler scheduler{store, ExponentialBackoff{}};
  CampaignService service{store, scheduler, progress, SchedulerConfig{}};

  EXPECT_EQ(run_coro(submit_plan(service, *plan)).error(),
            make_error_code(Error::InvalidConfig));
  auto all = run_coro(store.list_campaigns());
  ASSERT_TRUE(all);
  EXPECT_TRUE(all->empty());
}
