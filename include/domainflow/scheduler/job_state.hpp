#pragma once

#include "domainflow/core/error.hpp"
#include "domainflow/model/job.hpp"
#include "domainflow/util/backoff.hpp"
#include "domainflow/util/time.hpp"

#include <chrono>
#include <string_view>

// Pure job lifecycle transitions:
//
//   pending -> locked -> running -> completed
//                 \         \----> retry_pending -> pending
//                  \--------------> failed (attempts exhausted)
//
// Each function checks that the move is legal for the job as read and
// returns the conditional update to hand to CampaignStore; nothing here
// touches storage or the clock.
namespace domainflow::job_state {

[[nodiscard]] auto claim(const CampaignJob &job, std::string_view worker_id,
                         util::TimePoint now) -> Result<JobTransition>;

[[nodiscard]] auto start(const CampaignJob &job, util::TimePoint now)
    -> Result<JobTransition>;

/// Lease renewal; keeps the status, moves locked_at forward.
[[nodiscard]] auto heartbeat(const CampaignJob &job, util::TimePoint now)
    -> Result<JobTransition>;

[[nodiscard]] auto complete(const CampaignJob &job, util::TimePoint now)
    -> Result<JobTransition>;

/// Counts an attempt. Leads to retry_pending with a backoff delay, or to
/// failed once attempts reaches max_attempts.
[[nodiscard]] auto fail(const CampaignJob &job,
                        const ExponentialBackoff &backoff,
                        std::string_view error, util::TimePoint now)
    -> Result<JobTransition>;

/// Unrecoverable error (bad configuration): straight to failed regardless of
/// the remaining attempts.
[[nodiscard]] auto abandon(const CampaignJob &job, std::string_view error,
                           util::TimePoint now) -> Result<JobTransition>;

/// A lease that ran past timeout_seconds is treated as a crashed worker and
/// follows the fail() path.
[[nodiscard]] auto expire_lease(const CampaignJob &job,
                                const ExponentialBackoff &backoff,
                                util::TimePoint now) -> Result<JobTransition>;

/// retry_pending -> pending, keeping the scheduled next_execution_at.
[[nodiscard]] auto release_retry(const CampaignJob &job)
    -> Result<JobTransition>;

/// Gives the job back without counting an attempt (predecessor not ready,
/// batch budget used up). It becomes claimable again after `delay`.
[[nodiscard]] auto defer(const CampaignJob &job,
                         std::chrono::milliseconds delay, util::TimePoint now)
    -> Result<JobTransition>;

[[nodiscard]] auto is_lease_expired(const CampaignJob &job,
                                    util::TimePoint now) -> bool;

/// Folds a transition into the job as read, mirroring what the store writes.
[[nodiscard]] auto apply(CampaignJob job, const JobTransition &t,
                         util::TimePoint now) -> CampaignJob;

} // namespace domainflow::job_state
