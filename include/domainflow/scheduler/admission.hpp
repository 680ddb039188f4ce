#pragma once

#include "domainflow/core/error.hpp"
#include "domainflow/model/campaign.hpp"

namespace domainflow::admission {

/// Source stage types a campaign of `type` may consume.
[[nodiscard]] auto accepts_source(CampaignType type, CampaignType source)
    -> bool;

/// Checks a validation campaign against its predecessor as stored: the
/// declared source type must be valid for the stage and equal to the
/// predecessor's actual type. Error::InvalidConfig otherwise. Generation
/// campaigns have no predecessor and always pass.
[[nodiscard]] auto check_link(const Campaign &campaign,
                              const Campaign &source) -> Result<void>;

} // namespace domainflow::admission
