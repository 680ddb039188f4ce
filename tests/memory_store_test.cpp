#include "domainflow/storage/memory_store.hpp"

#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <format>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace domainflow;
using domainflow::test::run_coro;

namespace {

auto domain(std::string name, std::int64_t offset) -> GeneratedDomain {
  return GeneratedDomain{.domain_name = std::move(name), .offset_index = offset};
}

auto dns_result(std::string name, DnsStatus status) -> DnsResult {
  return DnsResult{.domain_name = std::move(name), .status = status};
}

class MemoryStoreTest : public ::testing::Test {
protected:
  void SetUp() override { ASSERT_TRUE(run_coro(store.open())); }

  auto add(Campaign campaign) -> Campaign {
    EXPECT_TRUE(run_coro(store.create_campaign(campaign)));
    return campaign;
  }

  storage::MemoryCampaignStore store;
};

} // namespace

TEST_F(MemoryStoreTest, OpenClose) {
  EXPECT_TRUE(store.is_open());
  run_coro(store.close());
  EXPECT_FALSE(store.is_open());
}

TEST_F(MemoryStoreTest, CursorFirstWriterWins) {
  GenerationConfigState initial{.fingerprint = "fp",
                                .total_possible_combinations = 10};
  auto first = run_coro(store.ensure_generation_config(initial));
  ASSERT_TRUE(first);
  ASSERT_TRUE(run_coro(store.reserve_range("fp", 4)));

  initial.total_possible_combinations = 999;
  auto second = run_coro(store.ensure_generation_config(initial));
  ASSERT_TRUE(second);
  EXPECT_EQ(second->total_possible_combinations, 10);
  EXPECT_EQ(second->current_offset, 4);
}

TEST_F(MemoryStoreTest, ReserveRangeClampsAtCapacity) {
  ASSERT_TRUE(run_coro(store.ensure_generation_config(
      {.fingerprint = "fp", .total_possible_combinations = 5})));
  auto a = run_coro(store.reserve_range("fp", 3));
  auto b = run_coro(store.reserve_range("fp", 3));
  auto c = run_coro(store.reserve_range("fp", 3));
  ASSERT_TRUE(a && b && c);
  EXPECT_EQ(a->start, 0);
  EXPECT_EQ(a->size, 3);
  EXPECT_EQ(b->start, 3);
  EXPECT_EQ(b->size, 2);
  EXPECT_TRUE(c->exhausted());

  EXPECT_EQ(run_coro(store.reserve_range("missing", 1)).error(),
            make_error_code(Error::NotFound));
  EXPECT_FALSE(run_coro(store.reserve_range("fp", 0)));
}

TEST_F(MemoryStoreTest, ConcurrentReservationsNeverOverlap) {
  constexpr int kThreads = 8;
  constexpr std::int64_t kCapacity = 1000;
  ASSERT_TRUE(run_coro(store.ensure_generation_config(
      {.fingerprint = "fp", .total_possible_combinations = kCapacity})));

  std::mutex mu;
  std::vector<OffsetRange> ranges;
  std::vector<std::jthread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&] {
      while (true) {
        auto r = run_coro(store.reserve_range("fp", 7));
        if (!r || r->exhausted()) {
          return;
        }
        std::scoped_lock lock(mu);
        ranges.push_back(*r);
      }
    });
  }
  threads.clear();

  std::ranges::sort(ranges, {}, &OffsetRange::start);
  std::int64_t expected = 0;
  for (const auto &r : ranges) {
    EXPECT_EQ(r.start, expected);
    expected = r.end();
  }
  EXPECT_EQ(expected, kCapacity);
}

TEST_F(MemoryStoreTest, StatusUpdateIsCompareAndSet) {
  auto c = add(test::make_campaign(test::generation_params(),
                                   CampaignStatus::Pending));
  EXPECT_TRUE(run_coro(store.update_campaign_status(
      c.id, CampaignStatus::Pending, CampaignStatus::Queued, "")));
  auto stale = run_coro(store.update_campaign_status(
      c.id, CampaignStatus::Pending, CampaignStatus::Queued, ""));
  EXPECT_EQ(stale.error(), make_error_code(Error::InvalidState));

  ASSERT_TRUE(run_coro(store.update_campaign_status(
      c.id, CampaignStatus::Queued, CampaignStatus::Running, "")));
  ASSERT_TRUE(run_coro(store.update_campaign_status(
      c.id, CampaignStatus::Running, CampaignStatus::Failed, "boom")));
  auto stored = run_coro(store.get_campaign(c.id));
  ASSERT_TRUE(stored);
  EXPECT_EQ(stored->status, CampaignStatus::Failed);
  EXPECT_EQ(stored->error_message, "boom");
  EXPECT_NE(stored->started_at, util::TimePoint{});
  EXPECT_NE(stored->completed_at, util::TimePoint{});
}

TEST_F(MemoryStoreTest, DuplicateDomainsAreNotCounted) {
  auto c = add(test::make_campaign(test::generation_params()));
  std::vector rows{domain("aashop.com", 0), domain("abshop.com", 1)};
  auto first = run_coro(store.commit_generated_domains(c.id, rows));
  ASSERT_TRUE(first);
  EXPECT_EQ(first->processed_items, 2);

  std::vector again{domain("abshop.com", 1), domain("bashop.com", 2)};
  auto second = run_coro(store.commit_generated_domains(c.id, again));
  ASSERT_TRUE(second);
  EXPECT_EQ(second->processed_items, 3);
  EXPECT_EQ(second->successful_items, 3);

  auto listed = run_coro(store.list_generated_domains(c.id, 0, 10));
  ASSERT_TRUE(listed);
  ASSERT_EQ(listed->size(), 3U);
  EXPECT_LT((*listed)[0].seq, (*listed)[1].seq);
  auto after = run_coro(store.list_generated_domains(c.id, (*listed)[0].seq, 1));
  ASSERT_EQ(after->size(), 1U);
  EXPECT_EQ((*after)[0].domain_name, "abshop.com");
}

TEST_F(MemoryStoreTest, DnsCandidatesAreOnlyResolvedRows) {
  auto gen = add(test::make_campaign(test::generation_params()));
  std::vector rows{domain("a.com", 0), domain("b.com", 1), domain("c.com", 2)};
  ASSERT_TRUE(run_coro(store.commit_generated_domains(gen.id, rows)));

  auto dns = add(test::make_campaign(DnsValidationParams{
      .settings = test::dns_settings(gen.id, {PersonaId{"p"}})}));
  auto gen_candidates = run_coro(store.list_source_candidates(
      gen.id, CampaignType::DomainGeneration, 0, 10));
  ASSERT_TRUE(gen_candidates);
  ASSERT_EQ(gen_candidates->size(), 3U);

  std::vector results{dns_result("a.com", DnsStatus::Resolved),
                      dns_result("b.com", DnsStatus::Unresolved),
                      dns_result("c.com", DnsStatus::Resolved)};
  auto counters = run_coro(store.commit_dns_results(
      dns.id, results, gen_candidates->back().seq));
  ASSERT_TRUE(counters);
  EXPECT_EQ(counters->successful_items, 2);
  EXPECT_EQ(counters->failed_items, 1);

  auto candidates = run_coro(store.list_source_candidates(
      dns.id, CampaignType::DnsValidation, 0, 10));
  ASSERT_TRUE(candidates);
  ASSERT_EQ(candidates->size(), 2U);
  EXPECT_EQ((*candidates)[0].domain_name, "a.com");
  EXPECT_EQ((*candidates)[1].domain_name, "c.com");
  EXPECT_EQ(*run_coro(store.count_source_candidates(
                dns.id, CampaignType::DnsValidation)),
            2);

  auto stored = run_coro(store.get_campaign(dns.id));
  EXPECT_EQ(stored->source_cursor, gen_candidates->back().seq);

  auto marked = run_coro(store.list_generated_domains(gen.id, 0, 10));
  EXPECT_EQ((*marked)[1].validation_status, DomainValidationStatus::Invalid);
  EXPECT_EQ((*marked)[2].validation_status, DomainValidationStatus::Valid);
}

TEST_F(MemoryStoreTest, HttpResultsCountKeywordHitsOnly) {
  auto c = add(test::make_campaign(HttpValidationParams{}));
  std::vector results{
      HttpResult{.domain_name = "a.com", .status = HttpStatus::KeywordsFound},
      HttpResult{.domain_name = "b.com", .status = HttpStatus::NoKeywords},
      HttpResult{.domain_name = "a.com", .status = HttpStatus::Error}};
  auto counters = run_coro(store.commit_http_results(c.id, results, 5));
  ASSERT_TRUE(counters);
  EXPECT_EQ(counters->processed_items, 2);
  EXPECT_EQ(counters->successful_items, 1);
  auto stored = run_coro(store.list_http_results(c.id));
  ASSERT_EQ(stored->size(), 2U);
  EXPECT_EQ((*stored)[0].campaign_id, c.id);
}

TEST_F(MemoryStoreTest, ClaimOrdersByPriority) {
  auto c = add(test::make_campaign(test::generation_params()));
  const auto now = util::Clock::now();
  auto job = [&](std::string id, std::int32_t priority) {
    return CampaignJob{.id = JobId{std::move(id)},
                       .campaign_id = c.id,
                       .priority = priority,
                       .scheduled_at = now,
                       .next_execution_at = now};
  };
  ASSERT_TRUE(run_coro(store.enqueue_job(job("low", 1))));
  ASSERT_TRUE(run_coro(store.enqueue_job(job("high", 9))));
  auto later = job("later", 10);
  later.next_execution_at = now + std::chrono::hours(1);
  ASSERT_TRUE(run_coro(store.enqueue_job(later)));

  auto first = run_coro(store.claim_next_job("w1", now));
  ASSERT_TRUE(first && first->has_value());
  EXPECT_EQ((*first)->id.value(), "high");
  EXPECT_EQ((*first)->status, JobStatus::Locked);
  EXPECT_EQ((*first)->locked_by, "w1");

  auto second = run_coro(store.claim_next_job("w2", now));
  EXPECT_EQ((*second)->id.value(), "low");
  auto none = run_coro(store.claim_next_job("w3", now));
  ASSERT_TRUE(none);
  EXPECT_FALSE(none->has_value());
}

TEST_F(MemoryStoreTest, ConcurrentClaimsHandOutEachJobOnce) {
  auto c = add(test::make_campaign(test::generation_params()));
  const auto now = util::Clock::now();
  for (int i = 0; i < 20; ++i) {
    ASSERT_TRUE(run_coro(store.enqueue_job(
        CampaignJob{.id = generate_id<JobId>(), .campaign_id = c.id})));
  }
  std::mutex mu;
  std::set<std::string> claimed;
  int duplicates = 0;
  std::vector<std::jthread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&, t] {
      auto worker = std::format("w{}", t);
      while (true) {
        auto job = run_coro(store.claim_next_job(worker, now));
        if (!job || !job->has_value()) {
          return;
        }
        std::scoped_lock lock(mu);
        if (!claimed.insert((*job)->id.str()).second) {
          ++duplicates;
        }
      }
    });
  }
  threads.clear();
  EXPECT_EQ(claimed.size(), 20U);
  EXPECT_EQ(duplicates, 0);
}

TEST_F(MemoryStoreTest, TransitionRejectsLostLease) {
  auto c = add(test::make_campaign(test::generation_params()));
  ASSERT_TRUE(run_coro(store.enqueue_job(
      CampaignJob{.id = JobId{"j"}, .campaign_id = c.id})));
  auto claimed = run_coro(store.claim_next_job("w1", util::Clock::now()));
  ASSERT_TRUE(claimed && claimed->has_value());

  JobTransition stolen{.expected_status = JobStatus::Locked,
                       .expected_locked_by = "w2",
                       .status = JobStatus::Running,
                       .locked_by = "w2"};
  EXPECT_EQ(run_coro(store.apply_job_transition(JobId{"j"}, stolen)).error(),
            make_error_code(Error::LeaseLost));

  auto job = run_coro(store.get_job(JobId{"j"}));
  ASSERT_TRUE(job);
  EXPECT_EQ(job->status, JobStatus::Locked);
  EXPECT_EQ(job->locked_by, "w1");
  EXPECT_EQ(run_coro(store.get_job(JobId{"missing"})).error(),
            make_error_code(Error::NotFound));
}

TEST_F(MemoryStoreTest, ResourcesAndHealth) {
  auto persona = test::dns_persona("p1");
  ASSERT_TRUE(run_coro(store.upsert_persona(persona)));
  ASSERT_TRUE(run_coro(store.upsert_proxy(
      Proxy{.id = ProxyId{"x1"}, .host = "10.0.0.1", .port = 8080})));

  std::vector ids{PersonaId{"p1"}, PersonaId{"ghost"}};
  auto personas = run_coro(store.get_personas(ids));
  ASSERT_TRUE(personas);
  ASSERT_EQ(personas->size(), 1U);

  ResourceHealth health{.healthy = false, .circuit = CircuitState::Open};
  ASSERT_TRUE(run_coro(
      store.save_resource_health(ResourceKind::Persona, "p1", health)));
  auto reread = run_coro(store.get_personas(ids));
  EXPECT_EQ((*reread)[0].health.circuit, CircuitState::Open);
  EXPECT_FALSE(run_coro(
      store.save_resource_health(ResourceKind::Proxy, "ghost", health)));
}

TEST_F(MemoryStoreTest, CountersStayConsistentUnderConcurrentCommits) {
  auto gen = add(test::make_campaign(test::generation_params()));
  auto dns = add(test::make_campaign(DnsValidationParams{
      .settings = test::dns_settings(gen.id, {PersonaId{"p"}})}));

  std::mutex mu;
  std::vector<CampaignCounters> seen;
  auto keep = [&](const Result<CampaignCounters> &r) {
    ASSERT_TRUE(r);
    std::scoped_lock lock(mu);
    seen.push_back(*r);
  };

  constexpr int kWriters = 4;
  constexpr int kBatches = 50;
  constexpr int kBatchSize = 5;
  {
    std::vector<std::jthread> threads;
    for (int t = 0; t < kWriters; ++t) {
      threads.emplace_back([&, t] {
        for (int b = 0; b < kBatches; ++b) {
          std::vector<DnsResult> rows;
          for (int i = 0; i < kBatchSize; ++i) {
            rows.push_back(dns_result(std::format("d{}-{}-{}.com", t, b, i),
                                      i % 2 == 0 ? DnsStatus::Resolved
                                                 : DnsStatus::Unresolved));
          }
          keep(run_coro(store.commit_dns_results(dns.id, rows, b)));
        }
      });
    }
    threads.emplace_back([&] {
      for (int i = 0; i < kWriters * kBatches; ++i) {
        keep(run_coro(store.set_campaign_total(dns.id, i % 7 == 0 ? 0 : i)));
      }
    });
  }

  for (const auto &c : seen) {
    EXPECT_LE(c.processed_items, c.total_items);
    EXPECT_LE(c.successful_items + c.failed_items, c.processed_items);
  }
  auto final_state = run_coro(store.get_campaign(dns.id));
  ASSERT_TRUE(final_state);
  EXPECT_EQ(final_state->counters.processed_items,
            kWriters * kBatches * kBatchSize);
}
