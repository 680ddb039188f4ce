#pragma once

#include "domainflow/core/error.hpp"
#include "domainflow/model/campaign.hpp"

#include <span>

namespace domainflow {

[[nodiscard]] auto can_transition(CampaignStatus from, CampaignStatus to)
    -> bool;

[[nodiscard]] auto allowed_transitions(CampaignStatus from)
    -> std::span<const CampaignStatus>;

/// Ok when the move is allowed, Error::InvalidState otherwise.
[[nodiscard]] auto check_transition(CampaignStatus from, CampaignStatus to)
    -> Result<void>;

/// No further work is executed for a campaign in one of these states.
[[nodiscard]] constexpr auto is_terminal(CampaignStatus s) noexcept -> bool {
  return s == CampaignStatus::Completed || s == CampaignStatus::Failed ||
         s == CampaignStatus::Cancelled || s == CampaignStatus::Archived;
}

} // namespace domainflow
