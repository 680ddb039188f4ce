#pragma once

#include "domainflow/config/system_config.hpp"
#include "domainflow/pool/resource_pool_manager.hpp"
#include "domainflow/scheduler/campaign_runner.hpp"
#include "domainflow/storage/campaign_store.hpp"
#include "domainflow/validation/checkers.hpp"
#include "domainflow/validation/keyword_matcher.hpp"

#include <ankerl/unordered_dense.h>

#include <chrono>
#include <memory>
#include <mutex>

namespace domainflow {

/// Spaces attempt starts so that a campaign stays under its
/// processing_speed_per_minute, across lanes and batches.
class Pacer {
public:
  explicit Pacer(std::int32_t per_minute);

  /// How long the caller must wait before starting its attempt.
  [[nodiscard]] auto reserve(std::chrono::steady_clock::time_point now)
      -> std::chrono::steady_clock::duration;

private:
  std::chrono::steady_clock::duration interval_{};
  std::chrono::steady_clock::time_point next_{};
  std::mutex mu_;
};

/// CampaignRunner for DNS and HTTP keyword validation campaigns.
///
/// Each batch reads up to batch_size eligible predecessor rows after the
/// campaign's source cursor, checks them on parallel_workers lanes and
/// commits the results together with the cursor advance. Transport failures
/// are retried retry_attempts times on a different resource when one is
/// available; a domain whose retries run out is recorded with business
/// status error.
class ValidationPipeline final : public CampaignRunner {
public:
  static constexpr std::int32_t kMaxLanes = 64;

  ValidationPipeline(storage::CampaignStore &store, ResourcePoolManager &pools,
                     DnsChecker &dns, HttpChecker &http, HttpConfig config);

  [[nodiscard]] auto handles(CampaignType type) const -> bool override;
  auto run_batch(const Campaign &campaign)
      -> task<Result<BatchOutcome>> override;
  auto finish(const CampaignId &id) -> void override;

private:
  struct CampaignState {
    std::shared_ptr<Pacer> pacer;
    std::shared_ptr<KeywordMatcher> matcher; // HTTP only
  };

  auto state_for(const Campaign &campaign) -> task<Result<CampaignState>>;

  auto check_dns(const Campaign &campaign, const CampaignResources &res,
                 Pacer &pacer, const SourceCandidate &candidate)
      -> task<Result<DnsResult>>;
  auto check_http(const Campaign &campaign, const CampaignResources &res,
                  Pacer &pacer, const KeywordMatcher &matcher,
                  const SourceCandidate &candidate) -> task<Result<HttpResult>>;

  storage::CampaignStore &store_;
  ResourcePoolManager &pools_;
  DnsChecker &dns_;
  HttpChecker &http_;
  HttpConfig config_;
  std::mutex mu_;
  ankerl::unordered_dense::map<CampaignId, CampaignState> states_;
};

} // namespace domainflow
