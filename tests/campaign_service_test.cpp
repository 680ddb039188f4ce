#include "domainflow/app/campaign_service.hpp"
#include "domainflow/progress/progress_aggregator.hpp"
#include "domainflow/scheduler/job_scheduler.hpp"
#include "domainflow/storage/memory_store.hpp"

#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <mutex>
#include <vector>

using namespace domainflow;
using namespace std::chrono_literals;
using domainflow::test::run_coro;

namespace {

class RecordingNotifier final : public Notifier {
public:
  auto publish(const CampaignEvent &event) -> void override {
    std::scoped_lock lock(mu);
    types.push_back(event.type);
  }
  auto count(EventType type) -> long {
    std::scoped_lock lock(mu);
    return std::ranges::count(types, type);
  }

  std::mutex mu;
  std::vector<EventType> types;
};

class CampaignServiceTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(run_coro(store.open()));
    ASSERT_TRUE(run_coro(service.add_persona(test::dns_persona("dns"))));
    ASSERT_TRUE(run_coro(service.add_persona(test::http_persona("web"))));
  }

  auto created_generation() -> Campaign {
    auto c = run_coro(service.create("gen", test::generation_params()));
    EXPECT_TRUE(c) << c.error().message();
    return c ? *c : Campaign{};
  }

  auto dns_params(const CampaignId &source) -> DnsValidationParams {
    return DnsValidationParams{
        .settings = test::dns_settings(source, {PersonaId{"dns"}})};
  }

  auto jobs_of(const CampaignId &id) -> std::vector<CampaignJob> {
    auto jobs = run_coro(store.list_jobs(id));
    return jobs ? *jobs : std::vector<CampaignJob>{};
  }

  storage::MemoryCampaignStore store;
  RecordingNotifier notifier;
  ProgressAggregator progress{store, notifier};
  JobScheduler scheduler{store, ExponentialBackoff{{.base = 0ms, .max = 0ms}}};
  CampaignService service{store, scheduler, progress, SchedulerConfig{}};
};

} // namespace

TEST(ValidateParamsTest, Generation) {
  EXPECT_TRUE(validate_params(test::generation_params()));

  auto p = test::generation_params();
  p.variable_length = 0;
  EXPECT_EQ(validate_params(p).error(), make_error_code(Error::InvalidConfig));

  p = test::generation_params();
  p.character_set.clear();
  EXPECT_FALSE(validate_params(p));

  p = test::generation_params();
  p.num_domains_to_generate = 0;
  EXPECT_FALSE(validate_params(p));

  // 36^20 overflows the offset space.
  p = test::generation_params("abcdefghijklmnopqrstuvwxyz0123456789", 20);
  EXPECT_FALSE(validate_params(p));
}

TEST(ValidateParamsTest, Validation) {
  auto source = generate_id<CampaignId>();
  DnsValidationParams dns{.settings =
                              test::dns_settings(source, {PersonaId{"d"}})};
  EXPECT_TRUE(validate_params(dns));

  auto bad = dns;
  bad.settings.persona_ids.clear();
  EXPECT_FALSE(validate_params(bad));

  bad = dns;
  bad.settings.source_type = CampaignType::DnsValidation;
  EXPECT_FALSE(validate_params(bad));

  bad = dns;
  bad.settings.source_campaign_id = CampaignId{};
  EXPECT_FALSE(validate_params(bad));

  HttpValidationParams http;
  http.settings = test::dns_settings(source, {PersonaId{"h"}});
  http.settings.source_type = CampaignType::DnsValidation;
  EXPECT_TRUE(validate_params(http));
  http.target_http_ports = {80, 0};
  EXPECT_FALSE(validate_params(http));
  http.target_http_ports.clear();
  EXPECT_FALSE(validate_params(http));
}

TEST_F(CampaignServiceTest, CreateGenerationResolvesCapacity) {
  auto c = run_coro(service.create("gen", test::generation_params("AB", 2, 10)));
  ASSERT_TRUE(c);
  EXPECT_EQ(c->status, CampaignStatus::Pending);
  EXPECT_EQ(c->counters.total_items, 4);
  const auto &gen = std::get<GenerationParams>(c->params);
  EXPECT_EQ(gen.character_set, "ab");
  EXPECT_EQ(gen.total_possible_combinations, 4);
  ASSERT_FALSE(gen.config_fingerprint.empty());

  auto cursor = run_coro(store.get_generation_config(gen.config_fingerprint));
  ASSERT_TRUE(cursor);
  EXPECT_EQ(cursor->current_offset, 0);
  EXPECT_TRUE(jobs_of(c->id).empty());

  auto listed = run_coro(service.list());
  ASSERT_TRUE(listed);
  ASSERT_EQ(listed->size(), 1U);
  EXPECT_EQ(listed->front().id, c->id);
  EXPECT_EQ(run_coro(service.get(c->id))->name, "gen");
}

TEST_F(CampaignServiceTest, CreateRejectsUnknownOrWrongPersona) {
  auto source = created_generation();
  auto unknown = dns_params(source.id);
  unknown.settings.persona_ids = {PersonaId{"missing"}};
  EXPECT_EQ(run_coro(service.create("dns", unknown)).error(),
            make_error_code(Error::InvalidConfig));

  auto wrong = dns_params(source.id);
  wrong.settings.persona_ids = {PersonaId{"web"}};
  EXPECT_EQ(run_coro(service.create("dns", wrong)).error(),
            make_error_code(Error::InvalidConfig));
}

TEST_F(CampaignServiceTest, CreateRejectsUnknownProxyAndKeywordSet) {
  auto source = created_generation();
  HttpValidationParams http;
  http.settings = test::dns_settings(source.id, {PersonaId{"web"}});
  http.proxy_ids = {ProxyId{"nope"}};
  EXPECT_FALSE(run_coro(service.create("http", http)));

  http.proxy_ids.clear();
  http.keyword_set_ids = {KeywordSetId{"nope"}};
  EXPECT_FALSE(run_coro(service.create("http", http)));

  ASSERT_TRUE(run_coro(service.add_keyword_set(
      KeywordSet{.id = KeywordSetId{"nope"}, .name = "kw", .rules = {}})));
  EXPECT_TRUE(run_coro(service.create("http", http)));
}

TEST_F(CampaignServiceTest, StartQueuesOneJob) {
  auto c = created_generation();
  auto started = run_coro(service.start(c.id, 8));
  ASSERT_TRUE(started);
  EXPECT_EQ(started->status, CampaignStatus::Queued);
  auto jobs = jobs_of(c.id);
  ASSERT_EQ(jobs.size(), 1U);
  EXPECT_EQ(jobs[0].priority, 8);
  EXPECT_EQ(jobs[0].status, JobStatus::Pending);

  EXPECT_EQ(run_coro(service.start(c.id)).error(),
            make_error_code(Error::InvalidState));
}

TEST_F(CampaignServiceTest, StartRejectsMismatchedSource) {
  auto gen = created_generation();
  auto dns = run_coro(service.create("dns", dns_params(gen.id)));
  ASSERT_TRUE(dns);

  // Declares a DNS predecessor but points at a generation campaign.
  HttpValidationParams http;
  http.settings = test::dns_settings(gen.id, {PersonaId{"web"}});
  http.settings.source_type = CampaignType::DnsValidation;
  auto web = run_coro(service.create("http", http));
  ASSERT_TRUE(web);

  EXPECT_EQ(run_coro(service.start(web->id)).error(),
            make_error_code(Error::InvalidConfig));
  auto stored = run_coro(store.get_campaign(web->id));
  EXPECT_EQ(stored->status, CampaignStatus::Pending);
  EXPECT_TRUE(jobs_of(web->id).empty());

  EXPECT_TRUE(run_coro(service.start(dns->id)));
}

TEST_F(CampaignServiceTest, StartRejectsMissingSource) {
  auto dns =
      run_coro(service.create("dns", dns_params(generate_id<CampaignId>())));
  ASSERT_TRUE(dns);
  EXPECT_EQ(run_coro(service.start(dns->id)).error(),
            make_error_code(Error::InvalidConfig));
  EXPECT_TRUE(jobs_of(dns->id).empty());
}

TEST_F(CampaignServiceTest, PauseAndResumeKeepOneActiveJob) {
  auto c = created_generation();
  ASSERT_TRUE(run_coro(service.start(c.id)));

  auto paused = run_coro(service.pause(c.id));
  ASSERT_TRUE(paused);
  EXPECT_EQ(paused->status, CampaignStatus::Paused);
  EXPECT_EQ(notifier.count(EventType::CampaignPaused), 1);
  EXPECT_FALSE(run_coro(service.pause(c.id)));

  auto resumed = run_coro(service.resume(c.id));
  ASSERT_TRUE(resumed);
  EXPECT_EQ(resumed->status, CampaignStatus::Queued);
  // The original job never ran, so no second one is queued.
  EXPECT_EQ(jobs_of(c.id).size(), 1U);

  auto job = run_coro(scheduler.claim("w", util::Clock::now()));
  ASSERT_TRUE(job && job->has_value());
  ASSERT_TRUE(run_coro(scheduler.complete(**job)));
  ASSERT_TRUE(run_coro(service.pause(c.id)));
  ASSERT_TRUE(run_coro(service.resume(c.id)));
  EXPECT_EQ(jobs_of(c.id).size(), 2U);
}

TEST_F(CampaignServiceTest, CancelIsFinal) {
  auto c = created_generation();
  auto cancelled = run_coro(service.cancel(c.id));
  ASSERT_TRUE(cancelled);
  EXPECT_EQ(cancelled->status, CampaignStatus::Cancelled);
  EXPECT_EQ(notifier.count(EventType::CampaignCancelled), 1);
  EXPECT_EQ(run_coro(service.cancel(c.id)).error(),
            make_error_code(Error::InvalidState));
  EXPECT_FALSE(run_coro(service.start(c.id)));
  EXPECT_FALSE(run_coro(service.archive(c.id)));
}

TEST_F(CampaignServiceTest, RetryRequeuesFailedCampaign) {
  auto c = created_generation();
  EXPECT_FALSE(run_coro(service.retry(c.id)));

  ASSERT_TRUE(run_coro(service.start(c.id)));
  ASSERT_TRUE(run_coro(store.update_campaign_status(
      c.id, CampaignStatus::Queued, CampaignStatus::Running, "")));
  auto job = run_coro(scheduler.claim("w", util::Clock::now()));
  ASSERT_TRUE(job && job->has_value());
  ASSERT_TRUE(run_coro(scheduler.abandon(**job, "boom")));
  ASSERT_TRUE(run_coro(store.update_campaign_status(
      c.id, CampaignStatus::Running, CampaignStatus::Failed, "boom")));

  auto retried = run_coro(service.retry(c.id));
  ASSERT_TRUE(retried);
  EXPECT_EQ(retried->status, CampaignStatus::Queued);
  auto jobs = jobs_of(c.id);
  EXPECT_EQ(jobs.size(), 2U);
  EXPECT_EQ(std::ranges::count_if(jobs,
                                  [](const CampaignJob &j) {
                                    return j.status == JobStatus::Pending;
                                  }),
            1);
}

TEST_F(CampaignServiceTest, ArchiveFromFailedOnly) {
  auto c = created_generation();
  EXPECT_FALSE(run_coro(service.archive(c.id)));
  ASSERT_TRUE(run_coro(service.start(c.id)));
  ASSERT_TRUE(run_coro(store.update_campaign_status(
      c.id, CampaignStatus::Queued, CampaignStatus::Running, "")));
  ASSERT_TRUE(run_coro(store.update_campaign_status(
      c.id, CampaignStatus::Running, CampaignStatus::Failed, "x")));
  auto archived = run_coro(service.archive(c.id));
  ASSERT_TRUE(archived);
  EXPECT_EQ(archived->status, CampaignStatus::Archived);
}

TEST_F(CampaignServiceTest, ProxiesMustBeHttp) {
  Proxy proxy{.id = ProxyId{"p1"},
              .name = "p1",
              .protocol = "http",
              .host = "127.0.0.1",
              .port = 3128,
              .enabled = true,
              .health = {}};
  EXPECT_TRUE(run_coro(service.add_proxy(proxy)));

  auto socks = proxy;
  socks.protocol = "socks5";
  EXPECT_EQ(run_coro(service.add_proxy(socks)).error(),
            make_error_code(Error::InvalidConfig));

  auto no_port = proxy;
  no_port.port = 0;
  EXPECT_FALSE(run_coro(service.add_proxy(no_port)));
}

TEST_F(CampaignServiceTest, PersonaNeedsId) {
  auto p = test::dns_persona("");
  EXPECT_FALSE(run_coro(service.add_persona(p)));
}
