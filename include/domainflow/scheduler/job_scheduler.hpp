#pragma once

#include "domainflow/core/coroutine.hpp"
#include "domainflow/core/error.hpp"
#include "domainflow/model/campaign.hpp"
#include "domainflow/model/job.hpp"
#include "domainflow/storage/campaign_store.hpp"
#include "domainflow/util/backoff.hpp"
#include "domainflow/util/time.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace domainflow {

struct JobOptions {
  std::int32_t priority{kDefaultJobPriority};
  std::int32_t max_attempts{3};
  std::int32_t timeout_seconds{3600};
};

struct SweepReport {
  std::size_t requeued{0};
  // Jobs that ran out of attempts; their campaigns must be failed.
  std::vector<CampaignJob> failed;
};

/// Lease-based job queue over CampaignStore. Every call reads nothing itself:
/// it computes the transition from the job the caller holds (job_state) and
/// hands it to the store as a conditional update, so a caller that lost its
/// lease gets Error::LeaseLost back.
class JobScheduler {
public:
  JobScheduler(storage::CampaignStore &store, ExponentialBackoff backoff);

  auto enqueue(const Campaign &campaign, const JobOptions &options)
      -> task<Result<CampaignJob>>;

  /// nullopt when no job is due.
  auto claim(std::string_view worker_id, util::TimePoint now)
      -> task<Result<std::optional<CampaignJob>>>;

  auto start(const CampaignJob &job) -> task<Result<CampaignJob>>;
  auto heartbeat(const CampaignJob &job) -> task<Result<CampaignJob>>;
  auto complete(const CampaignJob &job) -> task<Result<CampaignJob>>;

  /// Counts an attempt. The job comes back as pending with a backoff delay,
  /// or as failed once max_attempts is reached.
  auto fail(const CampaignJob &job, std::string_view error)
      -> task<Result<CampaignJob>>;
  auto abandon(const CampaignJob &job, std::string_view error)
      -> task<Result<CampaignJob>>;
  auto defer(const CampaignJob &job, std::chrono::milliseconds delay)
      -> task<Result<CampaignJob>>;

  /// Reclaims locked/running jobs whose lease ran past timeout_seconds.
  auto sweep_expired_leases(util::TimePoint now) -> task<Result<SweepReport>>;

  [[nodiscard]] auto backoff() const noexcept -> const ExponentialBackoff & {
    return backoff_;
  }

private:
  auto apply(const CampaignJob &job, Result<JobTransition> transition)
      -> task<Result<CampaignJob>>;
  auto release(CampaignJob job) -> task<Result<CampaignJob>>;

  storage::CampaignStore &store_;
  ExponentialBackoff backoff_;
};

} // namespace domainflow
