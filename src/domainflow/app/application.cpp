#include "domainflow/app/application.hpp"

#include "domainflow/app/campaign_service.hpp"
#include "domainflow/generation/generation_worker.hpp"
#include "domainflow/model/campaign_state.hpp"
#include "domainflow/notify/event_hub.hpp"
#include "domainflow/pool/health_prober.hpp"
#include "domainflow/pool/health_registry.hpp"
#include "domainflow/pool/resource_pool_manager.hpp"
#include "domainflow/progress/progress_aggregator.hpp"
#include "domainflow/scheduler/job_scheduler.hpp"
#include "domainflow/scheduler/worker_service.hpp"
#include "domainflow/storage/memory_store.hpp"
#include "domainflow/storage/mysql_store.hpp"
#include "domainflow/util/log.hpp"
#include "domainflow/validation/dns_client.hpp"
#include "domainflow/validation/http_fetcher.hpp"
#include "domainflow/validation/network_prober.hpp"
#include "domainflow/validation/validation_pipeline.hpp"

#include <algorithm>
#include <csignal>
#include <thread>

namespace domainflow {
namespace {

constexpr auto kSettlePollInterval = std::chrono::milliseconds(250);

[[nodiscard]] auto make_store(Runtime &runtime, const SystemConfig &config)
    -> std::unique_ptr<storage::CampaignStore> {
  if (config.storage.backend == StorageBackend::Memory) {
    return std::make_unique<storage::MemoryCampaignStore>();
  }
  return std::make_unique<storage::MySQLCampaignStore>(
      runtime.executor_for(0), config.database);
}

[[nodiscard]] auto is_settled(CampaignStatus status) noexcept -> bool {
  return is_terminal(status) || status == CampaignStatus::Paused;
}

} // namespace

Application::Application(SystemConfig config)
    : config_(std::move(config)),
      runtime_(static_cast<unsigned>(std::max(0, config_.scheduler.shards))),
      store_(make_store(runtime_, config_)),
      events_(std::make_unique<EventHub>(runtime_)),
      progress_(std::make_unique<ProgressAggregator>(*store_, *events_)),
      scheduler_(std::make_unique<JobScheduler>(
          *store_,
          ExponentialBackoff(ExponentialBackoff::Config{
              .base = std::chrono::milliseconds(
                  config_.scheduler.backoff_base_ms),
              .max = std::chrono::milliseconds(
                  config_.scheduler.backoff_max_ms)}))),
      pools_(std::make_unique<ResourcePoolManager>(
          *store_, std::make_shared<HealthRegistry>(
                       resource_state::CircuitPolicy{
                           .failure_threshold =
                               config_.pool.circuit_failure_threshold,
                           .probe_interval = std::chrono::seconds(
                               config_.pool.probe_interval_sec)}))),
      dns_(std::make_unique<DnsClient>()),
      http_(std::make_unique<HttpFetcher>(config_.http)),
      validation_(std::make_unique<ValidationPipeline>(
          *store_, *pools_, *dns_, *http_, config_.http)),
      generation_(std::make_unique<GenerationWorker>(*store_)),
      workers_(std::make_unique<WorkerService>(
          runtime_, *store_, *scheduler_, *progress_, config_.scheduler)),
      network_prober_(std::make_unique<NetworkProber>(
          *dns_, config_.pool.dns_probe_name)),
      health_prober_(std::make_unique<HealthProber>(
          runtime_, *pools_, *network_prober_, config_.pool)),
      campaigns_(std::make_unique<CampaignService>(
          *store_, *scheduler_, *progress_, config_.scheduler)) {
  std::signal(SIGPIPE, SIG_IGN);
  workers_->add_runner(*generation_);
  workers_->add_runner(*validation_);
}

Application::~Application() { stop(); }

auto Application::start() -> Result<void> {
  if (running_.exchange(true)) {
    return ok();
  }

  if (auto r = runtime_.start(); !r) {
    running_ = false;
    return fail(r.error());
  }
  log::start();
  log::info("Runtime started with {} shards", runtime_.shard_count());

  if (auto r = sync_wait(store_->open()); !r) {
    log::error("Failed to open {} store: {}",
               to_string_view(config_.storage.backend), r.error().message());
    runtime_.stop();
    running_ = false;
    return fail(r.error());
  }

  events_->subscribe(std::make_shared<LoggingEventSink>());
  workers_->start();
  health_prober_->start();
  log::info("Worker {} started ({} workers)", workers_->worker_id(),
            config_.scheduler.workers);
  return ok();
}

auto Application::stop() noexcept -> void {
  if (!running_.exchange(false)) {
    return;
  }

  log::info("Stopping domainflow...");

  // Stop claiming first so no batch starts against a closing store.
  workers_->stop();
  health_prober_->stop();
  events_->close_all();

  sync_wait(store_->close());
  runtime_.stop();
  log::info("domainflow stopped");
}

auto Application::submit(const CampaignPlan &plan) -> Result<SubmittedPlan> {
  return sync_wait(submit_plan(*campaigns_, plan));
}

auto Application::read_all(const std::vector<CampaignId> &ids)
    -> task<Result<std::vector<Campaign>>> {
  std::vector<Campaign> out;
  out.reserve(ids.size());
  for (const auto &id : ids) {
    auto campaign = co_await campaigns_->get(id);
    if (!campaign) {
      co_return std::unexpected(campaign.error());
    }
    out.push_back(std::move(*campaign));
  }
  co_return out;
}

auto Application::read_campaigns(const std::vector<CampaignId> &ids)
    -> Result<std::vector<Campaign>> {
  return sync_wait(read_all(ids));
}

auto Application::wait_until_settled(const std::vector<CampaignId> &ids,
                                     std::chrono::milliseconds timeout)
    -> Result<std::vector<Campaign>> {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    auto campaigns = read_campaigns(ids);
    if (!campaigns) {
      return campaigns;
    }
    if (std::ranges::all_of(*campaigns, [](const Campaign &c) {
          return is_settled(c.status);
        })) {
      return campaigns;
    }
    if (timeout.count() > 0 && std::chrono::steady_clock::now() >= deadline) {
      return fail(Error::Timeout);
    }
    std::this_thread::sleep_for(kSettlePollInterval);
  }
}

auto Application::campaigns() -> CampaignService & { return *campaigns_; }

auto Application::events() -> EventHub & { return *events_; }

auto Application::store() -> storage::CampaignStore & { return *store_; }

} // namespace domainflow
