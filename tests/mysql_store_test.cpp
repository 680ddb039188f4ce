#include "domainflow/core/runtime.hpp"
#include "domainflow/storage/mysql_store.hpp"

#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <format>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace domainflow;
using namespace domainflow::test;
using namespace std::chrono_literals;

namespace {

auto load_test_db_config() -> DatabaseConfig {
  DatabaseConfig cfg;
  cfg.host = env_or_default("DOMAINFLOW_TEST_MYSQL_HOST", cfg.host);
  cfg.username = env_or_default("DOMAINFLOW_TEST_MYSQL_USER", cfg.username);
  cfg.password =
      env_or_default("DOMAINFLOW_TEST_MYSQL_PASSWORD", cfg.password);
  cfg.database = env_or_default("DOMAINFLOW_TEST_MYSQL_DB", cfg.database);
  cfg.connect_timeout = 2;
  return cfg;
}

auto domains(const CampaignId &id, std::initializer_list<const char *> names,
             std::int64_t first_offset = 0) -> std::vector<GeneratedDomain> {
  std::vector<GeneratedDomain> rows;
  auto offset = first_offset;
  for (const auto *n : names) {
    rows.push_back(GeneratedDomain{.seq = 0,
                                   .campaign_id = id,
                                   .domain_name = n,
                                   .offset_index = offset++,
                                   .validation_status = {},
                                   .created_at = util::Clock::now()});
  }
  return rows;
}

} // namespace

class MySQLStoreTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(runtime_.start().has_value());
    store_ = std::make_unique<storage::MySQLCampaignStore>(
        runtime_.executor_for(0), load_test_db_config());
    auto open_res = run_coro(store_->open());
    if (!open_res) {
      store_.reset();
      runtime_.stop();
      GTEST_SKIP() << "MySQL unavailable for store tests: "
                   << open_res.error().message();
    }
    ASSERT_TRUE(run_coro(store_->clear_all()));
  }

  void TearDown() override {
    if (store_) {
      run_coro(store_->close());
      store_.reset();
    }
    runtime_.stop();
  }

  auto stored(CampaignParams params, CampaignStatus status) -> Campaign {
    auto c = make_campaign(std::move(params), status);
    c.created_at = util::Clock::now();
    EXPECT_TRUE(run_coro(store_->create_campaign(c)));
    return c;
  }

  Runtime runtime_{2};
  std::unique_ptr<storage::MySQLCampaignStore> store_;
};

TEST_F(MySQLStoreTest, CampaignRoundTrip) {
  auto params = generation_params();
  params.config_fingerprint = "fp-roundtrip";
  params.total_possible_combinations = 4;
  auto c = stored(params, CampaignStatus::Pending);

  auto loaded = run_coro(store_->get_campaign(c.id));
  ASSERT_TRUE(loaded) << loaded.error().message();
  EXPECT_EQ(loaded->name, c.name);
  EXPECT_EQ(loaded->type, CampaignType::DomainGeneration);
  EXPECT_EQ(std::get<GenerationParams>(loaded->params), params);

  EXPECT_EQ(run_coro(store_->get_campaign(generate_id<CampaignId>())).error(),
            make_error_code(Error::NotFound));
  auto all = run_coro(store_->list_campaigns());
  ASSERT_TRUE(all);
  EXPECT_EQ(all->size(), 1U);
}

TEST_F(MySQLStoreTest, StatusCompareAndSet) {
  auto c = stored(generation_params(), CampaignStatus::Queued);
  EXPECT_TRUE(run_coro(store_->update_campaign_status(
      c.id, CampaignStatus::Queued, CampaignStatus::Running, "")));
  EXPECT_EQ(run_coro(store_->update_campaign_status(
                c.id, CampaignStatus::Queued, CampaignStatus::Running, ""))
                .error(),
            make_error_code(Error::InvalidState));
  ASSERT_TRUE(run_coro(store_->update_campaign_status(
      c.id, CampaignStatus::Running, CampaignStatus::Failed, "boom")));

  auto loaded = run_coro(store_->get_campaign(c.id));
  ASSERT_TRUE(loaded);
  EXPECT_EQ(loaded->status, CampaignStatus::Failed);
  EXPECT_EQ(loaded->error_message, "boom");
  EXPECT_NE(loaded->started_at, util::TimePoint{});
  EXPECT_NE(loaded->completed_at, util::TimePoint{});
}

TEST_F(MySQLStoreTest, CursorReservationsNeverOverlap) {
  GenerationConfigState initial{.fingerprint = "fp-concurrent",
                                .total_possible_combinations = 1000,
                                .current_offset = 0,
                                .config_details = "{}",
                                .updated_at = util::Clock::now()};
  ASSERT_TRUE(run_coro(store_->ensure_generation_config(initial)));
  initial.current_offset = 500;
  auto again = run_coro(store_->ensure_generation_config(initial));
  ASSERT_TRUE(again);
  EXPECT_EQ(again->current_offset, 0);

  std::mutex mu;
  std::vector<OffsetRange> ranges;
  {
    std::vector<std::jthread> threads;
    for (int t = 0; t < 4; ++t) {
      threads.emplace_back([&] {
        for (;;) {
          auto r = run_coro(store_->reserve_range("fp-concurrent", 64));
          if (!r || r->exhausted()) {
            return;
          }
          std::scoped_lock lock(mu);
          ranges.push_back(*r);
        }
      });
    }
  }
  std::ranges::sort(ranges, {}, &OffsetRange::start);
  std::int64_t expected = 0;
  for (const auto &r : ranges) {
    EXPECT_EQ(r.start, expected);
    expected = r.end();
  }
  EXPECT_EQ(expected, 1000);
}

TEST_F(MySQLStoreTest, GeneratedDomainsInsertIgnore) {
  auto c = stored(generation_params(), CampaignStatus::Running);
  auto first = run_coro(
      store_->commit_generated_domains(c.id, domains(c.id, {"a.com", "b.com"})));
  ASSERT_TRUE(first) << first.error().message();
  EXPECT_EQ(first->processed_items, 2);

  auto second = run_coro(store_->commit_generated_domains(
      c.id, domains(c.id, {"b.com", "c.com"}, 1)));
  ASSERT_TRUE(second);
  EXPECT_EQ(second->processed_items, 3);
  EXPECT_EQ(second->successful_items, 3);

  auto rows = run_coro(store_->list_generated_domains(c.id, 0, 10));
  ASSERT_TRUE(rows);
  ASSERT_EQ(rows->size(), 3U);
  EXPECT_LT((*rows)[0].seq, (*rows)[1].seq);
  auto tail = run_coro(store_->list_generated_domains(c.id, (*rows)[0].seq, 10));
  ASSERT_TRUE(tail);
  EXPECT_EQ(tail->size(), 2U);
}

TEST_F(MySQLStoreTest, DnsResultsFeedHttpCandidates) {
  auto gen = stored(generation_params(), CampaignStatus::Running);
  ASSERT_TRUE(run_coro(store_->commit_generated_domains(
      gen.id, domains(gen.id, {"a.com", "b.com"}))));
  auto source = run_coro(store_->list_source_candidates(
      gen.id, CampaignType::DomainGeneration, 0, 10));
  ASSERT_TRUE(source);
  ASSERT_EQ(source->size(), 2U);

  auto dns = stored(DnsValidationParams{.settings = dns_settings(
                                            gen.id, {PersonaId{"d"}})},
                    CampaignStatus::Running);
  std::vector<DnsResult> results{
      DnsResult{.campaign_id = dns.id,
                .domain_name = "a.com",
                .source_seq = (*source)[0].seq,
                .status = DnsStatus::Resolved,
                .ips = {"192.0.2.1"},
                .resolver = "r",
                .persona_id = PersonaId{"d"},
                .attempts = 1,
                .checked_at = util::Clock::now()},
      DnsResult{.campaign_id = dns.id,
                .domain_name = "b.com",
                .source_seq = (*source)[1].seq,
                .status = DnsStatus::Unresolved,
                .resolver = "r",
                .persona_id = PersonaId{"d"},
                .attempts = 1,
                .checked_at = util::Clock::now()},
  };
  auto counters = run_coro(
      store_->commit_dns_results(dns.id, results, (*source)[1].seq));
  ASSERT_TRUE(counters) << counters.error().message();
  EXPECT_EQ(counters->processed_items, 2);
  EXPECT_EQ(counters->successful_items, 1);

  auto loaded = run_coro(store_->get_campaign(dns.id));
  EXPECT_EQ(loaded->source_cursor, (*source)[1].seq);

  auto candidates = run_coro(store_->list_source_candidates(
      dns.id, CampaignType::DnsValidation, 0, 10));
  ASSERT_TRUE(candidates);
  ASSERT_EQ(candidates->size(), 1U);
  EXPECT_EQ((*candidates)[0].domain_name, "a.com");
  EXPECT_EQ(*run_coro(store_->count_source_candidates(
                dns.id, CampaignType::DnsValidation)),
            1);

  auto marked = run_coro(store_->list_generated_domains(gen.id, 0, 10));
  ASSERT_TRUE(marked);
  EXPECT_EQ((*marked)[0].validation_status, DomainValidationStatus::Valid);
  EXPECT_EQ((*marked)[1].validation_status, DomainValidationStatus::Invalid);
}

TEST_F(MySQLStoreTest, JobLeaseLifecycle) {
  auto c = stored(generation_params(), CampaignStatus::Queued);
  const auto now = util::Clock::now();
  CampaignJob job{.id = generate_id<JobId>(),
                  .campaign_id = c.id,
                  .job_type = c.type,
                  .priority = 5,
                  .max_attempts = 3,
                  .timeout_seconds = 60,
                  .scheduled_at = now,
                  .next_execution_at = now,
                  .created_at = now,
                  .updated_at = now};
  ASSERT_TRUE(run_coro(store_->enqueue_job(job)));

  auto claimed = run_coro(store_->claim_next_job("w1", now + 1s));
  ASSERT_TRUE(claimed) << claimed.error().message();
  ASSERT_TRUE(claimed->has_value());
  EXPECT_EQ((*claimed)->status, JobStatus::Locked);
  EXPECT_EQ((*claimed)->locked_by, "w1");
  auto none = run_coro(store_->claim_next_job("w2", now + 1s));
  ASSERT_TRUE(none);
  EXPECT_FALSE(none->has_value());

  auto stolen = run_coro(store_->apply_job_transition(
      job.id, JobTransition{.expected_status = JobStatus::Locked,
                            .expected_locked_by = "w2",
                            .status = JobStatus::Running,
                            .locked_by = "w2"}));
  EXPECT_EQ(stolen.error(), make_error_code(Error::LeaseLost));

  auto expired = run_coro(store_->find_expired_leases(now + 2min));
  ASSERT_TRUE(expired);
  ASSERT_EQ(expired->size(), 1U);
  EXPECT_EQ((*expired)[0].id, job.id);
}

TEST_F(MySQLStoreTest, ConcurrentClaimsTakeEveryJobOnce) {
  const auto now = util::Clock::now();
  for (int i = 0; i < 8; ++i) {
    auto c = stored(generation_params(), CampaignStatus::Queued);
    CampaignJob job{.id = generate_id<JobId>(),
                    .campaign_id = c.id,
                    .job_type = c.type,
                    .priority = 5,
                    .max_attempts = 3,
                    .timeout_seconds = 60,
                    .scheduled_at = now,
                    .next_execution_at = now,
                    .created_at = now,
                    .updated_at = now};
    ASSERT_TRUE(run_coro(store_->enqueue_job(job)));
  }

  std::mutex mu;
  std::vector<std::string> claimed;
  int empty_claims = 0;
  {
    std::vector<std::jthread> threads;
    for (int t = 0; t < 4; ++t) {
      threads.emplace_back([&, t] {
        for (int i = 0; i < 2; ++i) {
          auto r = run_coro(
              store_->claim_next_job(std::format("w{}", t), now + 1s));
          std::scoped_lock lock(mu);
          if (r && r->has_value()) {
            claimed.push_back((*r)->id.str());
          } else {
            ++empty_claims;
          }
        }
      });
    }
  }
  std::ranges::sort(claimed);
  EXPECT_EQ(std::ranges::adjacent_find(claimed), claimed.end());
  EXPECT_EQ(claimed.size(), 8U);
  EXPECT_EQ(empty_claims, 0);
}

TEST_F(MySQLStoreTest, ResourcesAndHealth) {
  ASSERT_TRUE(run_coro(store_->upsert_persona(dns_persona("p1"))));
  ASSERT_TRUE(run_coro(store_->upsert_persona(http_persona("p2"))));
  std::vector<PersonaId> ids{PersonaId{"p1"}, PersonaId{"p2"},
                             PersonaId{"missing"}};
  auto personas = run_coro(store_->get_personas(ids));
  ASSERT_TRUE(personas);
  EXPECT_EQ(personas->size(), 2U);

  ResourceHealth health;
  health.healthy = false;
  health.circuit = CircuitState::Open;
  health.consecutive_failures = 3;
  health.opened_at = util::Clock::now();
  ASSERT_TRUE(run_coro(
      store_->save_resource_health(ResourceKind::Persona, "p1", health)));
  std::vector<PersonaId> one{PersonaId{"p1"}};
  auto reloaded = run_coro(store_->get_personas(one));
  ASSERT_TRUE(reloaded);
  ASSERT_EQ(reloaded->size(), 1U);
  EXPECT_FALSE((*reloaded)[0].health.healthy);
  EXPECT_EQ((*reloaded)[0].health.consecutive_failures, 3);

  KeywordSet set{.id = KeywordSetId{"k"},
                 .name = "k",
                 .enabled = true,
                 .rules = {KeywordRule{.pattern = "sale"}}};
  ASSERT_TRUE(run_coro(store_->upsert_keyword_set(set)));
  std::vector<KeywordSetId> kids{KeywordSetId{"k"}};
  auto sets = run_coro(store_->get_keyword_sets(kids));
  ASSERT_TRUE(sets);
  ASSERT_EQ(sets->size(), 1U);
  EXPECT_EQ((*sets)[0].rules, set.rules);
}
