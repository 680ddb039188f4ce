#include "domainflow/scheduler/job_state.hpp"

#include <gtest/gtest.h>

using namespace domainflow;
using namespace std::chrono_literals;

namespace {

const util::TimePoint kNow = util::from_unix_millis(1'700'000'000'000);

auto pending_job() -> CampaignJob {
  CampaignJob job;
  job.id = JobId{"job-1"};
  job.campaign_id = CampaignId{"c-1"};
  job.status = JobStatus::Pending;
  job.max_attempts = 3;
  job.timeout_seconds = 60;
  job.next_execution_at = kNow - 1s;
  return job;
}

auto step(const CampaignJob &job, Result<JobTransition> t) -> CampaignJob {
  EXPECT_TRUE(t.has_value());
  return job_state::apply(job, *t, kNow);
}

const ExponentialBackoff kBackoff{
    ExponentialBackoff::Config{.base = 1000ms, .max = 60s}};

} // namespace

TEST(JobStateTest, ClaimLocksForWorker) {
  auto job = step(pending_job(), job_state::claim(pending_job(), "w1", kNow));
  EXPECT_EQ(job.status, JobStatus::Locked);
  EXPECT_EQ(job.locked_by, "w1");
  EXPECT_EQ(job.locked_at, kNow);
}

TEST(JobStateTest, ClaimRequiresDuePendingJob) {
  auto future = pending_job();
  future.next_execution_at = kNow + 1s;
  EXPECT_FALSE(job_state::claim(future, "w1", kNow).has_value());

  auto locked = step(pending_job(), job_state::claim(pending_job(), "w1", kNow));
  EXPECT_FALSE(job_state::claim(locked, "w2", kNow).has_value());
  EXPECT_FALSE(job_state::claim(pending_job(), "", kNow).has_value());
}

TEST(JobStateTest, ConditionalUpdateCarriesExpectedHolder) {
  auto locked = step(pending_job(), job_state::claim(pending_job(), "w1", kNow));
  auto t = job_state::start(locked, kNow);
  ASSERT_TRUE(t.has_value());
  EXPECT_EQ(t->expected_status, JobStatus::Locked);
  EXPECT_EQ(t->expected_locked_by, "w1");
  EXPECT_EQ(t->status, JobStatus::Running);
}

TEST(JobStateTest, CompleteReleasesLease) {
  auto job = pending_job();
  job = step(job, job_state::claim(job, "w1", kNow));
  job = step(job, job_state::start(job, kNow));
  job = step(job, job_state::complete(job, kNow));
  EXPECT_EQ(job.status, JobStatus::Completed);
  EXPECT_TRUE(job.locked_by.empty());
  EXPECT_FALSE(job_state::complete(job, kNow).has_value());
}

TEST(JobStateTest, FailSchedulesRetryWithBackoff) {
  auto job = pending_job();
  job = step(job, job_state::claim(job, "w1", kNow));
  job = step(job, job_state::fail(job, kBackoff, "boom", kNow));
  EXPECT_EQ(job.status, JobStatus::RetryPending);
  EXPECT_EQ(job.attempts, 1);
  EXPECT_EQ(job.last_error, "boom");
  EXPECT_EQ(job.next_execution_at, kNow + kBackoff.delay(1));

  job = step(job, job_state::release_retry(job));
  EXPECT_EQ(job.status, JobStatus::Pending);
  EXPECT_EQ(job.next_execution_at, kNow + kBackoff.delay(1));
}

TEST(JobStateTest, FailOnLastAttemptIsTerminal) {
  auto job = pending_job();
  job.attempts = 2;
  job = step(job, job_state::claim(job, "w1", kNow));
  job = step(job, job_state::fail(job, kBackoff, "boom", kNow));
  EXPECT_EQ(job.status, JobStatus::Failed);
  EXPECT_EQ(job.attempts, 3);
  EXPECT_TRUE(is_terminal(job.status));
}

TEST(JobStateTest, AbandonIgnoresRemainingAttempts) {
  auto job = pending_job();
  job = step(job, job_state::claim(job, "w1", kNow));
  job = step(job, job_state::abandon(job, "bad config", kNow));
  EXPECT_EQ(job.status, JobStatus::Failed);
  EXPECT_EQ(job.attempts, 1);
}

TEST(JobStateTest, DeferDoesNotCountAttempt) {
  auto job = pending_job();
  job = step(job, job_state::claim(job, "w1", kNow));
  job = step(job, job_state::defer(job, 500ms, kNow));
  EXPECT_EQ(job.status, JobStatus::Pending);
  EXPECT_EQ(job.attempts, 0);
  EXPECT_TRUE(job.locked_by.empty());
  EXPECT_EQ(job.next_execution_at, kNow + 500ms);
}

TEST(JobStateTest, ExpiredLeaseFollowsFailPath) {
  auto job = pending_job();
  job = step(job, job_state::claim(job, "w1", kNow - 120s));
  EXPECT_TRUE(job_state::is_lease_expired(job, kNow));
  EXPECT_FALSE(job_state::is_lease_expired(job, kNow - 90s));

  auto t = job_state::expire_lease(job, kBackoff, kNow);
  ASSERT_TRUE(t.has_value());
  EXPECT_EQ(t->status, JobStatus::RetryPending);
  EXPECT_EQ(t->attempts, 1);
  EXPECT_NE(t->last_error.find("w1"), std::string::npos);
}

TEST(JobStateTest, LiveLeaseCannotExpire) {
  auto job = pending_job();
  job = step(job, job_state::claim(job, "w1", kNow));
  EXPECT_FALSE(job_state::expire_lease(job, kBackoff, kNow).has_value());
}

TEST(JobStateTest, HeartbeatMovesLockForward) {
  auto job = pending_job();
  job = step(job, job_state::claim(job, "w1", kNow - 30s));
  job = step(job, job_state::heartbeat(job, kNow));
  EXPECT_EQ(job.locked_at, kNow);
  EXPECT_EQ(job.status, JobStatus::Locked);
}

TEST(BackoffTest, DoublesUntilCap) {
  EXPECT_EQ(kBackoff.delay(0), 1000ms);
  EXPECT_EQ(kBackoff.delay(1), 2000ms);
  EXPECT_EQ(kBackoff.delay(3), 8000ms);
  EXPECT_EQ(kBackoff.delay(30), 60s);
}
