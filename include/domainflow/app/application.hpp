#pragma once

#include "domainflow/app/campaign_plan.hpp"
#include "domainflow/config/system_config.hpp"
#include "domainflow/core/coroutine.hpp"
#include "domainflow/core/error.hpp"
#include "domainflow/core/runtime.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_future.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <vector>

namespace domainflow {

namespace storage {
class CampaignStore;
}

class CampaignService;
class DnsClient;
class EventHub;
class GenerationWorker;
class HealthProber;
class HttpFetcher;
class JobScheduler;
class NetworkProber;
class ProgressAggregator;
class ResourcePoolManager;
class ValidationPipeline;
class WorkerService;

// Application facade - owns the runtime, the store and every service
class Application {
public:
  explicit Application(SystemConfig config);
  ~Application();

  Application(const Application &) = delete;
  auto operator=(const Application &) -> Application & = delete;

  [[nodiscard]] auto config() const noexcept -> const SystemConfig & {
    return config_;
  }

  // Lifecycle
  [[nodiscard]] auto start() -> Result<void>;
  auto stop() noexcept -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
  }

  /// Blocks the calling (non-shard) thread until `op` finishes on a shard.
  template <typename T> auto sync_wait(task<T> op) -> T {
    auto fut = boost::asio::co_spawn(runtime_.executor_for(
                                         runtime_.next_shard()),
                                     std::move(op), boost::asio::use_future);
    return fut.get();
  }

  [[nodiscard]] auto submit(const CampaignPlan &plan)
      -> Result<SubmittedPlan>;

  /// Polls until every campaign is terminal or paused, or `timeout` passes
  /// (zero waits forever). Returns the last read state of each.
  [[nodiscard]] auto wait_until_settled(const std::vector<CampaignId> &ids,
                                        std::chrono::milliseconds timeout)
      -> Result<std::vector<Campaign>>;

  /// Current state of each campaign, in order.
  [[nodiscard]] auto read_campaigns(const std::vector<CampaignId> &ids)
      -> Result<std::vector<Campaign>>;

  // Service access
  [[nodiscard]] auto runtime() noexcept -> Runtime & { return runtime_; }
  [[nodiscard]] auto campaigns() -> CampaignService &;
  [[nodiscard]] auto events() -> EventHub &;
  [[nodiscard]] auto store() -> storage::CampaignStore &;

private:
  auto read_all(const std::vector<CampaignId> &ids)
      -> task<Result<std::vector<Campaign>>>;

  std::atomic<bool> running_{false};
  SystemConfig config_;
  Runtime runtime_;

  std::unique_ptr<storage::CampaignStore> store_;
  std::unique_ptr<EventHub> events_;
  std::unique_ptr<ProgressAggregator> progress_;
  std::unique_ptr<JobScheduler> scheduler_;
  std::unique_ptr<ResourcePoolManager> pools_;
  std::unique_ptr<DnsClient> dns_;
  std::unique_ptr<HttpFetcher> http_;
  std::unique_ptr<ValidationPipeline> validation_;
  std::unique_ptr<GenerationWorker> generation_;
  std::unique_ptr<WorkerService> workers_;
  std::unique_ptr<NetworkProber> network_prober_;
  std::unique_ptr<HealthProber> health_prober_;
  std::unique_ptr<CampaignService> campaigns_;
};

} // namespace domainflow
