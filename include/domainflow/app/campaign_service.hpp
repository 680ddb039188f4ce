#pragma once

#include "domainflow/config/system_config.hpp"
#include "domainflow/core/coroutine.hpp"
#include "domainflow/core/error.hpp"
#include "domainflow/model/campaign.hpp"
#include "domainflow/model/resource.hpp"
#include "domainflow/progress/progress_aggregator.hpp"
#include "domainflow/scheduler/job_scheduler.hpp"
#include "domainflow/storage/campaign_store.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace domainflow {

/// Validates campaign parameters the way creation does; Error::InvalidConfig
/// on the first violation. Resource references are not checked here.
[[nodiscard]] auto validate_params(const CampaignParams &params)
    -> Result<void>;

/// Entry point for everything that changes a campaign from outside the
/// workers: creation, the status commands and the pool resources campaigns
/// refer to.
class CampaignService {
public:
  CampaignService(storage::CampaignStore &store, JobScheduler &scheduler,
                  ProgressAggregator &progress, SchedulerConfig config);

  /// Validates, normalises and stores a pending campaign. Generation
  /// campaigns get their fingerprint, capacity and cursor row here.
  auto create(std::string name, CampaignParams params)
      -> task<Result<Campaign>>;

  /// pending -> queued plus a job. Validation campaigns pass admission first:
  /// a missing predecessor or a mismatched source type fails with
  /// Error::InvalidConfig and leaves the campaign pending without jobs.
  auto start(const CampaignId &id,
             std::int32_t priority = kDefaultJobPriority)
      -> task<Result<Campaign>>;
  auto pause(const CampaignId &id) -> task<Result<Campaign>>;
  /// paused -> queued; a job is enqueued unless one is still active.
  auto resume(const CampaignId &id) -> task<Result<Campaign>>;
  auto cancel(const CampaignId &id) -> task<Result<Campaign>>;
  /// failed -> queued with a fresh job.
  auto retry(const CampaignId &id) -> task<Result<Campaign>>;
  auto archive(const CampaignId &id) -> task<Result<Campaign>>;

  auto get(const CampaignId &id) -> task<Result<Campaign>>;
  auto list() -> task<Result<std::vector<Campaign>>>;

  auto add_persona(const Persona &persona) -> task<Result<void>>;
  auto add_proxy(const Proxy &proxy) -> task<Result<void>>;
  auto add_keyword_set(const KeywordSet &set) -> task<Result<void>>;

private:
  auto check_references(const CampaignParams &params) -> task<Result<void>>;
  auto transition(const CampaignId &id, CampaignStatus from,
                  CampaignStatus to, std::string_view message = {})
      -> task<Result<Campaign>>;
  auto ensure_job(const Campaign &campaign, std::int32_t priority)
      -> task<Result<void>>;

  storage::CampaignStore &store_;
  JobScheduler &scheduler_;
  ProgressAggregator &progress_;
  SchedulerConfig config_;
};

} // namespace domainflow
