#pragma once

#include "domainflow/core/error.hpp"
#include "domainflow/model/campaign.hpp"
#include "domainflow/model/resource.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace domainflow::codec {

// JSON documents stored alongside rows (params, persona configs, keyword
// rules, findings). Decoders validate and fail with Error::ParseError or
// Error::InvalidConfig.

[[nodiscard]] auto encode_params(const CampaignParams &params) -> std::string;
[[nodiscard]] auto decode_params(CampaignType type, std::string_view json)
    -> Result<CampaignParams>;

[[nodiscard]] auto encode_persona_config(const PersonaConfig &cfg)
    -> std::string;
[[nodiscard]] auto decode_persona_config(PersonaType type,
                                         std::string_view json)
    -> Result<PersonaConfig>;
[[nodiscard]] auto validate_persona_config(const PersonaConfig &cfg)
    -> Result<void>;

[[nodiscard]] auto encode_keyword_rules(const std::vector<KeywordRule> &rules)
    -> std::string;
[[nodiscard]] auto decode_keyword_rules(std::string_view json)
    -> Result<std::vector<KeywordRule>>;

[[nodiscard]] auto encode_strings(const std::vector<std::string> &values)
    -> std::string;
[[nodiscard]] auto decode_strings(std::string_view json)
    -> Result<std::vector<std::string>>;

[[nodiscard]] auto encode_findings(const KeywordFindings &findings)
    -> std::string;
[[nodiscard]] auto decode_findings(std::string_view json)
    -> Result<KeywordFindings>;

} // namespace domainflow::codec
