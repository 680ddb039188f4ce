#include "domainflow/model/campaign_state.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace domainflow {
namespace {

using S = CampaignStatus;

constexpr std::array kFromPending{S::Queued, S::Cancelled};
constexpr std::array kFromQueued{S::Running, S::Paused, S::Cancelled};
constexpr std::array kFromRunning{S::Paused, S::Completed, S::Failed,
                                  S::Cancelled};
constexpr std::array kFromPaused{S::Running, S::Queued, S::Cancelled};
constexpr std::array kFromCompleted{S::Archived};
constexpr std::array kFromFailed{S::Queued, S::Archived};

} // namespace

auto allowed_transitions(CampaignStatus from)
    -> std::span<const CampaignStatus> {
  switch (from) {
  case S::Pending:
    return kFromPending;
  case S::Queued:
    return kFromQueued;
  case S::Running:
    return kFromRunning;
  case S::Paused:
    return kFromPaused;
  case S::Completed:
    return kFromCompleted;
  case S::Failed:
    return kFromFailed;
  case S::Archived:
  case S::Cancelled:
    return {};
  }
  std::unreachable();
}

auto can_transition(CampaignStatus from, CampaignStatus to) -> bool {
  return std::ranges::contains(allowed_transitions(from), to);
}

auto check_transition(CampaignStatus from, CampaignStatus to) -> Result<void> {
  if (!can_transition(from, to)) {
    return fail(Error::InvalidState);
  }
  return ok();
}

} // namespace domainflow
