#include "domainflow/scheduler/job_state.hpp"

#include <format>

namespace domainflow::job_state {
namespace {

[[nodiscard]] auto from(const CampaignJob &job) -> JobTransition {
  return JobTransition{
      .expected_status = job.status,
      .expected_locked_by = job.locked_by,
      .status = job.status,
      .locked_by = job.locked_by,
      .locked_at = job.locked_at,
      .attempts = job.attempts,
      .next_execution_at = job.next_execution_at,
      .last_error = job.last_error,
  };
}

[[nodiscard]] auto to_pending(JobTransition t, util::TimePoint next)
    -> JobTransition {
  t.status = JobStatus::Pending;
  t.locked_by.clear();
  t.locked_at = {};
  t.next_execution_at = next;
  return t;
}

} // namespace

auto claim(const CampaignJob &job, std::string_view worker_id,
           util::TimePoint now) -> Result<JobTransition> {
  if (job.status != JobStatus::Pending || !job.locked_by.empty() ||
      job.next_execution_at > now || worker_id.empty()) {
    return domainflow::fail(Error::InvalidState);
  }
  auto t = from(job);
  t.status = JobStatus::Locked;
  t.locked_by = std::string{worker_id};
  t.locked_at = now;
  return t;
}

auto start(const CampaignJob &job, util::TimePoint now)
    -> Result<JobTransition> {
  if (job.status != JobStatus::Locked) {
    return domainflow::fail(Error::InvalidState);
  }
  auto t = from(job);
  t.status = JobStatus::Running;
  t.locked_at = now;
  return t;
}

auto heartbeat(const CampaignJob &job, util::TimePoint now)
    -> Result<JobTransition> {
  if (!holds_lease(job.status)) {
    return domainflow::fail(Error::InvalidState);
  }
  auto t = from(job);
  t.locked_at = now;
  return t;
}

auto complete(const CampaignJob &job, util::TimePoint now)
    -> Result<JobTransition> {
  if (!holds_lease(job.status)) {
    return domainflow::fail(Error::InvalidState);
  }
  auto t = from(job);
  t.status = JobStatus::Completed;
  t.locked_by.clear();
  t.locked_at = {};
  t.next_execution_at = now;
  return t;
}

auto fail(const CampaignJob &job, const ExponentialBackoff &backoff,
          std::string_view error, util::TimePoint now)
    -> Result<JobTransition> {
  if (!holds_lease(job.status)) {
    return domainflow::fail(Error::InvalidState);
  }
  auto t = from(job);
  t.attempts = job.attempts + 1;
  t.last_error = std::string{error};
  t.locked_by.clear();
  t.locked_at = {};
  if (t.attempts >= job.max_attempts) {
    t.status = JobStatus::Failed;
    t.next_execution_at = now;
    return t;
  }
  t.status = JobStatus::RetryPending;
  t.next_execution_at = now + backoff.delay(t.attempts);
  return t;
}

auto abandon(const CampaignJob &job, std::string_view error,
             util::TimePoint now) -> Result<JobTransition> {
  if (!holds_lease(job.status)) {
    return domainflow::fail(Error::InvalidState);
  }
  auto t = from(job);
  t.attempts = job.attempts + 1;
  t.last_error = std::string{error};
  t.locked_by.clear();
  t.locked_at = {};
  t.status = JobStatus::Failed;
  t.next_execution_at = now;
  return t;
}

auto expire_lease(const CampaignJob &job, const ExponentialBackoff &backoff,
                  util::TimePoint now) -> Result<JobTransition> {
  if (!is_lease_expired(job, now)) {
    return domainflow::fail(Error::InvalidState);
  }
  auto reason =
      job.last_error.empty()
          ? std::format("lease held by {} expired", job.locked_by)
          : std::format("lease held by {} expired; last error: {}",
                        job.locked_by, job.last_error);
  return fail(job, backoff, reason, now);
}

auto release_retry(const CampaignJob &job) -> Result<JobTransition> {
  if (job.status != JobStatus::RetryPending) {
    return domainflow::fail(Error::InvalidState);
  }
  return to_pending(from(job), job.next_execution_at);
}

auto defer(const CampaignJob &job, std::chrono::milliseconds delay,
           util::TimePoint now) -> Result<JobTransition> {
  if (!holds_lease(job.status)) {
    return domainflow::fail(Error::InvalidState);
  }
  return to_pending(from(job), now + delay);
}

auto is_lease_expired(const CampaignJob &job, util::TimePoint now) -> bool {
  return holds_lease(job.status) &&
         job.locked_at + std::chrono::seconds(job.timeout_seconds) < now;
}

auto apply(CampaignJob job, const JobTransition &t, util::TimePoint now)
    -> CampaignJob {
  job.status = t.status;
  job.locked_by = t.locked_by;
  job.locked_at = t.locked_at;
  job.attempts = t.attempts;
  job.next_execution_at = t.next_execution_at;
  job.last_error = t.last_error;
  job.updated_at = now;
  return job;
}

} // namespace domainflow::job_state
