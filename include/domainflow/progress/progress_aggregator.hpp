#pragma once

#include "domainflow/core/coroutine.hpp"
#include "domainflow/core/error.hpp"
#include "domainflow/model/campaign.hpp"
#include "domainflow/notify/notifier.hpp"
#include "domainflow/storage/campaign_store.hpp"

#include <ankerl/unordered_dense.h>

#include <mutex>
#include <optional>
#include <string_view>

namespace domainflow {

inline constexpr double kRateSmoothing = 0.3;

/// rate' = alpha * sample + (1 - alpha) * rate; the first sample seeds it.
[[nodiscard]] constexpr auto ewma_rate(double previous, double sample,
                                       double alpha = kRateSmoothing) noexcept
    -> double {
  if (previous <= 0.0) {
    return sample;
  }
  return alpha * sample + (1.0 - alpha) * previous;
}

/// Percentage, ETA and heartbeat derived from committed counters and the
/// smoothed rate (items per second).
[[nodiscard]] auto derive_progress(const CampaignCounters &counters,
                                   double rate, util::TimePoint now)
    -> ProgressUpdate;

struct ProgressSnapshot {
  CampaignId campaign_id;
  CampaignStatus status{CampaignStatus::Running};
  CampaignCounters counters;
  ProgressUpdate progress;
};

/// Turns post-commit counters into derived progress, persists it and
/// publishes campaign_progress events. Counters themselves are written only by
/// the store's commit functions.
class ProgressAggregator {
public:
  ProgressAggregator(storage::CampaignStore &store, Notifier &notifier);

  /// Call after every committed batch with the counters the commit returned.
  auto record(const CampaignId &id, CampaignStatus status,
              const CampaignCounters &counters, util::TimePoint now)
      -> task<Result<ProgressSnapshot>>;

  /// Emits a terminal or lifecycle event (completed, failed, paused, ...).
  auto publish_lifecycle(const CampaignId &id, EventType type,
                         std::string_view message = {}) -> void;

  [[nodiscard]] auto snapshot(const CampaignId &id) const
      -> std::optional<ProgressSnapshot>;

  auto forget(const CampaignId &id) -> void;

private:
  struct RateState {
    std::int64_t last_processed{0};
    util::TimePoint last_at{};
    double rate{0.0};
    ProgressSnapshot snapshot;
  };

  storage::CampaignStore &store_;
  Notifier &notifier_;
  mutable std::mutex mu_;
  ankerl::unordered_dense::map<CampaignId, RateState> states_;
};

} // namespace domainflow
