#pragma once

#include "domainflow/app/campaign_service.hpp"
#include "domainflow/core/coroutine.hpp"
#include "domainflow/core/error.hpp"
#include "domainflow/model/campaign.hpp"
#include "domainflow/model/resource.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace domainflow {

struct GenerationStage {
  std::string name;
  GenerationParams params;
};

struct DnsStage {
  std::string name;
  DnsValidationParams params; // source filled in on submission
};

struct HttpStage {
  std::string name;
  HttpValidationParams params; // settings.source_type picks the predecessor
};

/// A chained generation -> DNS -> HTTP run plus the resources it uses, read
/// from a TOML file:
///
///   name = "shop-leads"
///   [[personas]]     id, name, type ("dns" | "http"), persona fields
///   [[proxies]]      id, name, host, port
///   [[keyword_sets]] id, name, rules = [{ pattern, rule_type, weight }]
///   [generation]     pattern fields
///   [dns]            optional stage
///   [http]           optional stage; source = "dns" | "generation"
struct CampaignPlan {
  std::string name;
  std::vector<Persona> personas;
  std::vector<Proxy> proxies;
  std::vector<KeywordSet> keyword_sets;
  GenerationStage generation;
  std::optional<DnsStage> dns;
  std::optional<HttpStage> http;
};

[[nodiscard]] auto load_plan_from_string(std::string_view toml)
    -> Result<CampaignPlan>;
[[nodiscard]] auto load_plan_from_file(std::string_view path)
    -> Result<CampaignPlan>;

struct SubmittedPlan {
  CampaignId generation;
  std::optional<CampaignId> dns;
  std::optional<CampaignId> http;

  [[nodiscard]] auto ids() const -> std::vector<CampaignId>;
};

/// Registers the plan's resources, creates every stage with the previous one
/// as its source and starts them all. Later stages wait for their source
/// through job deferral.
auto submit_plan(CampaignService &service, const CampaignPlan &plan)
    -> task<Result<SubmittedPlan>>;

} // namespace domainflow
