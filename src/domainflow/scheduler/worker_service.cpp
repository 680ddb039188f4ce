#include "domainflow/scheduler/worker_service.hpp"

#include "domainflow/core/asio_awaitable.hpp"
#include "domainflow/core/runtime.hpp"
#include "domainflow/model/campaign_state.hpp"
#include "domainflow/util/log.hpp"

#include <boost/asio/ip/host_name.hpp>

#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <format>
#include <thread>

namespace domainflow {

auto default_worker_id() -> std::string {
  boost::system::error_code ec;
  auto host = boost::asio::ip::host_name(ec);
  if (ec || host.empty()) {
    host = "worker";
  }
  return std::format("{}-{}", host, static_cast<std::int64_t>(::getpid()));
}

WorkerService::WorkerService(Runtime &runtime, storage::CampaignStore &store,
                             JobScheduler &scheduler,
                             ProgressAggregator &progress,
                             SchedulerConfig config)
    : runtime_(runtime), store_(store), scheduler_(scheduler),
      progress_(progress), config_(std::move(config)),
      worker_id_(config_.worker_id.empty() ? default_worker_id()
                                           : config_.worker_id) {}

auto WorkerService::add_runner(CampaignRunner &runner) -> void {
  runners_.push_back(&runner);
}

auto WorkerService::runner_for(CampaignType type) const -> CampaignRunner * {
  auto it = std::ranges::find_if(
      runners_, [type](const CampaignRunner *r) { return r->handles(type); });
  return it == runners_.end() ? nullptr : *it;
}

auto WorkerService::start() -> void {
  if (running_.exchange(true)) {
    return;
  }
  const auto workers = std::max(1, config_.workers);
  const auto shards = std::max(1U, runtime_.shard_count());
  for (int i = 0; i < workers; ++i) {
    runtime_.spawn_on(static_cast<shard_id>(static_cast<unsigned>(i) % shards),
                      worker_loop(std::format("{}/{}", worker_id_, i)));
  }
  if (config_.lease_sweep_interval_sec > 0) {
    runtime_.spawn_external(sweep_loop());
  }
  log::info("Worker service {} started with {} worker(s)", worker_id_,
            workers);
}

auto WorkerService::stop() -> void {
  if (!running_.exchange(false)) {
    return;
  }
  // Best-effort drain; a job cut off here is reclaimed by the lease sweep.
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(200);
  while (inflight_.load(std::memory_order_acquire) > 0 &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  log::info("Worker service {} stopped", worker_id_);
}

auto WorkerService::worker_loop(std::string worker_id) -> task<void> {
  const auto idle = std::chrono::milliseconds(std::max(1, config_.poll_interval_ms));
  while (running_.load(std::memory_order_acquire)) {
    bool ran = false;
    inflight_.fetch_add(1, std::memory_order_acq_rel);
    try {
      ran = co_await poll_once(worker_id);
    } catch (const std::exception &e) {
      log::error("Worker {} aborted a job run: {}", worker_id, e.what());
    }
    inflight_.fetch_sub(1, std::memory_order_acq_rel);
    if (ran) {
      continue;
    }
    try {
      co_await async_sleep(idle);
    } catch (const std::exception &) {
      break;
    }
  }
}

auto WorkerService::sweep_loop() -> task<void> {
  const auto interval = std::chrono::seconds(config_.lease_sweep_interval_sec);
  while (running_.load(std::memory_order_acquire)) {
    try {
      co_await async_sleep(interval);
    } catch (const std::exception &) {
      break;
    }
    if (!running_.load(std::memory_order_acquire)) {
      break;
    }
    inflight_.fetch_add(1, std::memory_order_acq_rel);
    auto report = co_await sweep_once(util::Clock::now());
    inflight_.fetch_sub(1, std::memory_order_acq_rel);
    if (!report) {
      log::warn("Lease sweep failed: {}", report.error().message());
    }
  }
}

auto WorkerService::sweep_once(util::TimePoint now)
    -> task<Result<SweepReport>> {
  auto report = co_await scheduler_.sweep_expired_leases(now);
  if (!report) {
    co_return report;
  }
  for (const auto &job : report->failed) {
    co_await fail_campaign(job.campaign_id, job.last_error);
  }
  if (report->requeued > 0 || !report->failed.empty()) {
    log::info("Lease sweep requeued {} job(s), failed {}", report->requeued,
              report->failed.size());
  }
  co_return report;
}

auto WorkerService::poll_once(std::string_view worker_id) -> task<bool> {
  auto claimed = co_await scheduler_.claim(worker_id, util::Clock::now());
  if (!claimed) {
    log::warn("Worker {} failed to claim a job: {}", worker_id,
              claimed.error().message());
    co_return false;
  }
  if (!claimed->has_value()) {
    co_return false;
  }
  log::debug("Worker {} claimed job {} for campaign {}", worker_id,
             (*claimed)->id, (*claimed)->campaign_id);
  co_await run_job(std::move(**claimed));
  co_return true;
}

auto WorkerService::run_job(CampaignJob job) -> task<void> {
  auto started = co_await scheduler_.start(job);
  if (!started) {
    log::warn("Job {} could not start: {}", job.id, started.error().message());
    co_return;
  }
  job = std::move(*started);

  auto campaign = co_await store_.get_campaign(job.campaign_id);
  if (!campaign) {
    if (campaign.error() == make_error_code(Error::NotFound)) {
      if (auto r = co_await scheduler_.abandon(job, "campaign not found");
          !r) {
        log::warn("Failed to update job {}: {}", job.id, r.error().message());
      }
    } else {
      if (auto r = co_await scheduler_.fail(job, campaign.error().message());
          !r) {
        log::warn("Failed to update job {}: {}", job.id, r.error().message());
      }
    }
    co_return;
  }

  auto *runner = runner_for(campaign->type);
  if (runner == nullptr) {
    const auto msg = std::format("no runner for {} campaigns",
                                 to_string_view(campaign->type));
    if (auto r = co_await scheduler_.abandon(job, msg); !r) {
      log::warn("Failed to update job {}: {}", job.id, r.error().message());
    }
    co_await fail_campaign(campaign->id, msg);
    co_return;
  }

  switch (campaign->status) {
  case CampaignStatus::Queued:
    if (auto r = co_await store_.update_campaign_status(
            campaign->id, CampaignStatus::Queued, CampaignStatus::Running, {});
        !r) {
      log::warn("Campaign {} could not start: {}", campaign->id,
                r.error().message());
      co_await finish_job(job);
      co_return;
    }
    log::info("Campaign {} ({}) running", campaign->id,
              to_string_view(campaign->type));
    break;
  case CampaignStatus::Running:
    break;
  default:
    log::info("Campaign {} is {}; nothing to run for job {}", campaign->id,
              to_string_view(campaign->status), job.id);
    co_await finish_job(job);
    co_return;
  }

  co_await drive(std::move(job), *runner);
  runner->finish(campaign->id);

  auto after = co_await store_.get_campaign(campaign->id);
  if (!after) {
    log::warn("Cannot reload campaign {}: {}", campaign->id,
              after.error().message());
  } else if (is_terminal(after->status)) {
    progress_.forget(campaign->id);
  }
}

auto WorkerService::drive(CampaignJob job, CampaignRunner &runner)
    -> task<void> {
  const auto id = job.campaign_id;
  const auto budget = std::max(1, config_.batches_per_lease);

  for (int batch = 0; batch < budget; ++batch) {
    auto campaign = co_await store_.get_campaign(id);
    if (!campaign) {
      co_await handle_batch_error(job, campaign.error());
      co_return;
    }
    // Paused and resumed while this job still held the lease: resume() found
    // the job active and queued nothing, so this job carries on.
    if (campaign->status == CampaignStatus::Queued) {
      if (auto r = co_await store_.update_campaign_status(
              id, CampaignStatus::Queued, CampaignStatus::Running, {});
          !r) {
        log::warn("Campaign {} could not resume: {}", id, r.error().message());
        co_await finish_job(job);
        co_return;
      }
      log::info("Campaign {} resumed by job {}", id, job.id);
      campaign->status = CampaignStatus::Running;
    }
    // Pause and cancel take effect here.
    if (campaign->status != CampaignStatus::Running) {
      log::info("Campaign {} is {}; job {} stops", id,
                to_string_view(campaign->status), job.id);
      co_await finish_job(job);
      co_return;
    }

    auto outcome = co_await runner.run_batch(*campaign);
    if (!outcome) {
      co_await handle_batch_error(job, outcome.error());
      co_return;
    }

    const auto now = util::Clock::now();
    if (outcome->processed > 0 || outcome->done) {
      auto snap = co_await progress_.record(
          id,
          outcome->done ? CampaignStatus::Completed : CampaignStatus::Running,
          outcome->counters, now);
      if (!snap) {
        log::warn("Failed to record progress of campaign {}: {}", id,
                  snap.error().message());
      }
    }

    if (outcome->done) {
      if (auto r = co_await store_.update_campaign_status(
              id, CampaignStatus::Running, CampaignStatus::Completed, {});
          !r) {
        log::warn("Campaign {} finished but could not be completed: {}", id,
                  r.error().message());
      } else {
        progress_.publish_lifecycle(id, EventType::CampaignCompleted);
        log::info("Campaign {} completed: {} processed, {} successful, {} "
                  "failed",
                  id, outcome->counters.processed_items,
                  outcome->counters.successful_items,
                  outcome->counters.failed_items);
      }
      co_await finish_job(job);
      co_return;
    }

    if (outcome->waiting_for_source) {
      log::debug("Campaign {} waits for its source", id);
      if (auto r = co_await scheduler_.defer(
              job, std::chrono::milliseconds(config_.readiness_retry_ms));
          !r) {
        log::warn("Failed to defer job {}: {}", job.id, r.error().message());
      }
      co_return;
    }

    auto renewed = co_await scheduler_.heartbeat(job);
    if (!renewed) {
      log::warn("Job {} lost its lease: {}", job.id,
                renewed.error().message());
      co_return;
    }
    job = std::move(*renewed);
  }

  if (auto r = co_await scheduler_.defer(job, std::chrono::milliseconds{0});
      !r) {
    log::warn("Failed to requeue job {}: {}", job.id, r.error().message());
  }
}

auto WorkerService::handle_batch_error(const CampaignJob &job,
                                       std::error_code ec) -> task<void> {
  const auto message = ec.message();
  const auto &id = job.campaign_id;

  if (ec == make_error_code(Error::ResourcePoolExhausted)) {
    if (auto r = co_await store_.update_campaign_status(
            id, CampaignStatus::Running, CampaignStatus::Paused, message);
        r) {
      log::warn("Campaign {} paused: {}", id, message);
      progress_.publish_lifecycle(id, EventType::CampaignDegraded, message);
    } else {
      log::warn("Campaign {} could not be paused: {}", id,
                r.error().message());
    }
    co_await finish_job(job);
    co_return;
  }

  if (is_unrecoverable(ec) || ec == make_error_code(Error::NotFound)) {
    if (auto r = co_await scheduler_.abandon(job, message); !r) {
      log::warn("Failed to update job {}: {}", job.id, r.error().message());
    }
    co_await fail_campaign(id, message);
    co_return;
  }

  auto failed = co_await scheduler_.fail(job, message);
  if (!failed) {
    log::warn("Failed to record failure of job {}: {}", job.id,
              failed.error().message());
    co_return;
  }
  if (failed->status == JobStatus::Failed) {
    co_await fail_campaign(id, message);
  }
}

auto WorkerService::finish_job(const CampaignJob &job) -> task<void> {
  if (auto r = co_await scheduler_.complete(job); !r) {
    log::warn("Failed to complete job {}: {}", job.id, r.error().message());
  }
}

auto WorkerService::fail_campaign(const CampaignId &id,
                                  std::string_view message) -> task<void> {
  auto campaign = co_await store_.get_campaign(id);
  if (!campaign) {
    log::warn("Cannot fail campaign {}: {}", id, campaign.error().message());
    co_return;
  }
  auto status = campaign->status;
  if (status == CampaignStatus::Queued) {
    if (auto r = co_await store_.update_campaign_status(
            id, CampaignStatus::Queued, CampaignStatus::Running, {});
        r) {
      status = CampaignStatus::Running;
    }
  }
  if (!can_transition(status, CampaignStatus::Failed)) {
    log::warn("Campaign {} is {} and cannot be failed ({})", id,
              to_string_view(status), message);
    co_return;
  }
  if (auto r = co_await store_.update_campaign_status(
          id, status, CampaignStatus::Failed, message);
      !r) {
    log::warn("Failed to mark campaign {} failed: {}", id,
              r.error().message());
    co_return;
  }
  log::error("Campaign {} failed: {}", id, message);
  progress_.publish_lifecycle(id, EventType::CampaignFailed, message);
  progress_.forget(id);
}

} // namespace domainflow
