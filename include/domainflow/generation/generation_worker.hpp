#pragma once

#include "domainflow/scheduler/campaign_runner.hpp"
#include "domainflow/storage/campaign_store.hpp"

#include <ankerl/unordered_dense.h>

#include <chrono>
#include <mutex>
#include <string>

namespace domainflow {

/// CampaignRunner for domain generation campaigns.
///
/// A batch reserves the next offset range of the campaign's pattern
/// (shared by every campaign with the same fingerprint), enumerates it and
/// inserts the domains. The range is consumed once reserved: a failed write
/// is retried on the same range, never on a fresh one.
class GenerationWorker final : public CampaignRunner {
public:
  static constexpr int kMaxBatchWriteAttempts = 3;

  explicit GenerationWorker(
      storage::CampaignStore &store,
      std::chrono::milliseconds write_retry_delay = std::chrono::milliseconds(
          200));

  [[nodiscard]] auto handles(CampaignType type) const -> bool override {
    return type == CampaignType::DomainGeneration;
  }
  auto run_batch(const Campaign &campaign)
      -> task<Result<BatchOutcome>> override;

private:
  auto ensure_cursor(const GenerationParams &params, std::int64_t capacity)
      -> task<Result<std::string>>;
  auto exhaust(const Campaign &campaign) -> task<Result<BatchOutcome>>;

  storage::CampaignStore &store_;
  std::chrono::milliseconds write_retry_delay_;
  std::mutex mu_;
  ankerl::unordered_dense::set<std::string> ensured_;
};

} // namespace domainflow
