#include "domainflow/scheduler/job_scheduler.hpp"

#include "domainflow/scheduler/job_state.hpp"
#include "domainflow/util/log.hpp"

#include <algorithm>

namespace domainflow {

JobScheduler::JobScheduler(storage::CampaignStore &store,
                           ExponentialBackoff backoff)
    : store_(store), backoff_(backoff) {}

auto JobScheduler::enqueue(const Campaign &campaign, const JobOptions &options)
    -> task<Result<CampaignJob>> {
  const auto now = util::Clock::now();
  CampaignJob job{
      .id = generate_id<JobId>(),
      .campaign_id = campaign.id,
      .job_type = campaign.type,
      .status = JobStatus::Pending,
      .priority =
          std::clamp(options.priority, kMinJobPriority, kMaxJobPriority),
      .attempts = 0,
      .max_attempts = std::max(1, options.max_attempts),
      .locked_by = {},
      .locked_at = {},
      .timeout_seconds = std::max(1, options.timeout_seconds),
      .scheduled_at = now,
      .next_execution_at = now,
      .last_error = {},
      .created_at = now,
      .updated_at = now,
  };
  if (auto r = co_await store_.enqueue_job(job); !r) {
    log::error("Failed to enqueue job for campaign {}: {}", campaign.id,
               r.error().message());
    co_return std::unexpected(r.error());
  }
  log::info("Enqueued {} job {} for campaign {}",
            to_string_view(job.job_type), job.id, campaign.id);
  co_return job;
}

auto JobScheduler::claim(std::string_view worker_id, util::TimePoint now)
    -> task<Result<std::optional<CampaignJob>>> {
  co_return co_await store_.claim_next_job(worker_id, now);
}

auto JobScheduler::apply(const CampaignJob &job,
                         Result<JobTransition> transition)
    -> task<Result<CampaignJob>> {
  if (!transition) {
    co_return std::unexpected(transition.error());
  }
  co_return co_await store_.apply_job_transition(job.id, *transition);
}

auto JobScheduler::release(CampaignJob job) -> task<Result<CampaignJob>> {
  if (job.status != JobStatus::RetryPending) {
    co_return job;
  }
  co_return co_await apply(job, job_state::release_retry(job));
}

auto JobScheduler::start(const CampaignJob &job) -> task<Result<CampaignJob>> {
  co_return co_await apply(job, job_state::start(job, util::Clock::now()));
}

auto JobScheduler::heartbeat(const CampaignJob &job)
    -> task<Result<CampaignJob>> {
  co_return co_await apply(job, job_state::heartbeat(job, util::Clock::now()));
}

auto JobScheduler::complete(const CampaignJob &job)
    -> task<Result<CampaignJob>> {
  co_return co_await apply(job, job_state::complete(job, util::Clock::now()));
}

auto JobScheduler::fail(const CampaignJob &job, std::string_view error)
    -> task<Result<CampaignJob>> {
  auto failed = co_await apply(
      job, job_state::fail(job, backoff_, error, util::Clock::now()));
  if (!failed) {
    co_return failed;
  }
  if (failed->status == JobStatus::Failed) {
    log::error("Job {} failed permanently after {} attempt(s): {}", job.id,
               failed->attempts, error);
    co_return failed;
  }
  log::warn("Job {} attempt {}/{} failed, retry at {}: {}", job.id,
            failed->attempts, failed->max_attempts,
            util::format_iso8601(failed->next_execution_at), error);
  co_return co_await release(*failed);
}

auto JobScheduler::abandon(const CampaignJob &job, std::string_view error)
    -> task<Result<CampaignJob>> {
  log::error("Job {} abandoned: {}", job.id, error);
  co_return co_await apply(job,
                           job_state::abandon(job, error, util::Clock::now()));
}

auto JobScheduler::defer(const CampaignJob &job,
                         std::chrono::milliseconds delay)
    -> task<Result<CampaignJob>> {
  co_return co_await apply(job,
                           job_state::defer(job, delay, util::Clock::now()));
}

auto JobScheduler::sweep_expired_leases(util::TimePoint now)
    -> task<Result<SweepReport>> {
  auto expired = co_await store_.find_expired_leases(now);
  if (!expired) {
    co_return std::unexpected(expired.error());
  }

  SweepReport report;
  for (const auto &job : *expired) {
    auto reclaimed =
        co_await apply(job, job_state::expire_lease(job, backoff_, now));
    if (!reclaimed) {
      // Heartbeat or completion won the race; the lease is no longer stale.
      log::debug("Lease sweep skipped job {}: {}", job.id,
                 reclaimed.error().message());
      continue;
    }
    log::warn("Reclaimed expired lease of job {} held by {} (attempt {}/{})",
              job.id, job.locked_by, reclaimed->attempts,
              reclaimed->max_attempts);
    if (reclaimed->status == JobStatus::Failed) {
      report.failed.push_back(std::move(*reclaimed));
      continue;
    }
    if (auto released = co_await release(*reclaimed); !released) {
      log::warn("Failed to release job {} for retry: {}", job.id,
                released.error().message());
      continue;
    }
    ++report.requeued;
  }
  co_return report;
}

} // namespace domainflow
