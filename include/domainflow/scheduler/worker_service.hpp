#pragma once

#include "domainflow/config/system_config.hpp"
#include "domainflow/core/coroutine.hpp"
#include "domainflow/core/error.hpp"
#include "domainflow/model/job.hpp"
#include "domainflow/progress/progress_aggregator.hpp"
#include "domainflow/scheduler/campaign_runner.hpp"
#include "domainflow/scheduler/job_scheduler.hpp"
#include "domainflow/storage/campaign_store.hpp"

#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace domainflow {

class Runtime;

/// "<hostname>-<pid>" unless configured.
[[nodiscard]] auto default_worker_id() -> std::string;

/// Polls the job queue on `workers` coroutines spread over the runtime shards
/// and drives claimed jobs through their campaign's runner, plus a periodic
/// lease sweep.
///
/// One job run: queued -> running on the campaign, then batches until the
/// runner reports done, the campaign leaves running (pause/cancel), the
/// predecessor has nothing ready (job deferred by readiness_retry_ms) or
/// batches_per_lease is used up (job deferred with no delay so other
/// campaigns get a turn). The lease is renewed after every batch.
class WorkerService {
public:
  WorkerService(Runtime &runtime, storage::CampaignStore &store,
                JobScheduler &scheduler, ProgressAggregator &progress,
                SchedulerConfig config);
  ~WorkerService() = default;

  WorkerService(const WorkerService &) = delete;
  auto operator=(const WorkerService &) -> WorkerService & = delete;

  auto add_runner(CampaignRunner &runner) -> void;

  auto start() -> void;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
  }

  /// Claims and runs at most one job. Returns whether a job was run.
  auto poll_once(std::string_view worker_id) -> task<bool>;

  /// One lease sweep; fails the campaigns of jobs that ran out of attempts.
  auto sweep_once(util::TimePoint now) -> task<Result<SweepReport>>;

  [[nodiscard]] auto worker_id() const noexcept -> const std::string & {
    return worker_id_;
  }

private:
  auto worker_loop(std::string worker_id) -> task<void>;
  auto sweep_loop() -> task<void>;

  auto run_job(CampaignJob job) -> task<void>;
  auto drive(CampaignJob job, CampaignRunner &runner) -> task<void>;
  auto handle_batch_error(const CampaignJob &job, std::error_code ec)
      -> task<void>;
  auto finish_job(const CampaignJob &job) -> task<void>;
  auto fail_campaign(const CampaignId &id, std::string_view message)
      -> task<void>;

  [[nodiscard]] auto runner_for(CampaignType type) const -> CampaignRunner *;

  Runtime &runtime_;
  storage::CampaignStore &store_;
  JobScheduler &scheduler_;
  ProgressAggregator &progress_;
  SchedulerConfig config_;
  std::string worker_id_;
  std::vector<CampaignRunner *> runners_;
  std::atomic<bool> running_{false};
  std::atomic<int> inflight_{0};
};

} // namespace domainflow
