#pragma once

#include "domainflow/core/coroutine.hpp"
#include "domainflow/core/error.hpp"
#include "domainflow/model/campaign.hpp"

#include <cstdint>

namespace domainflow {

struct BatchOutcome {
  std::int64_t processed{0};
  bool done{false};
  // Validation only: nothing to consume yet, the predecessor is still active.
  bool waiting_for_source{false};
  CampaignCounters counters;
};

/// Executes one batch of a campaign's work. The worker service calls
/// run_batch() repeatedly with a freshly read campaign while it holds the
/// job lease.
///
/// Errors: Error::InvalidConfig and Error::BatchWriteFailed are unrecoverable
/// (job and campaign fail), Error::ResourcePoolExhausted pauses the campaign,
/// anything else counts as a failed job attempt.
class CampaignRunner {
public:
  virtual ~CampaignRunner() = default;

  [[nodiscard]] virtual auto handles(CampaignType type) const -> bool = 0;
  virtual auto run_batch(const Campaign &campaign)
      -> task<Result<BatchOutcome>> = 0;
  /// Called when a job run ends, whatever the reason.
  virtual auto finish(const CampaignId & /*id*/) -> void {}
};

[[nodiscard]] inline auto is_unrecoverable(std::error_code ec) -> bool {
  return ec == make_error_code(Error::InvalidConfig) ||
         ec == make_error_code(Error::BatchWriteFailed);
}

} // namespace domainflow
