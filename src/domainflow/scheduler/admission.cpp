#include "domainflow/scheduler/admission.hpp"

#include "domainflow/util/log.hpp"

namespace domainflow::admission {

auto accepts_source(CampaignType type, CampaignType source) -> bool {
  switch (type) {
  case CampaignType::DnsValidation:
    return source == CampaignType::DomainGeneration;
  case CampaignType::HttpKeywordValidation:
    return source == CampaignType::DomainGeneration ||
           source == CampaignType::DnsValidation;
  case CampaignType::DomainGeneration:
    break;
  }
  return false;
}

auto check_link(const Campaign &campaign, const Campaign &source)
    -> Result<void> {
  const auto *settings = validation_settings(campaign.params);
  if (settings == nullptr) {
    return ok();
  }
  if (settings->source_campaign_id != source.id) {
    return fail(Error::InvalidConfig);
  }
  if (!accepts_source(campaign.type, settings->source_type)) {
    log::warn("campaign {}: {} cannot consume a {} campaign", campaign.id,
              to_string_view(campaign.type),
              to_string_view(settings->source_type));
    return fail(Error::InvalidConfig);
  }
  if (settings->source_type != source.type) {
    log::warn("campaign {}: declares source {} as {} but it is {}",
              campaign.id, source.id, to_string_view(settings->source_type),
              to_string_view(source.type));
    return fail(Error::InvalidConfig);
  }
  return ok();
}

} // namespace domainflow::admission
