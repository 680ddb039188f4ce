#include "domainflow/model/codec.hpp"

#include "domainflow/util/json.hpp"
#include "domainflow/util/log.hpp"

#include <glaze/json.hpp>

#include <algorithm>
#include <optional>
#include <ranges>

namespace domainflow::codec::wire {

struct GenerationJson {
  std::string pattern_type;
  std::int32_t variable_length{0};
  std::string character_set;
  std::string constant_string;
  std::string tld;
  std::int64_t num_domains_to_generate{0};
  std::int32_t batch_size{1000};
  std::string config_fingerprint;
  std::int64_t total_possible_combinations{0};
};

struct ValidationJson {
  std::string source_campaign_id;
  std::string source_type;
  std::vector<std::string> persona_ids;
  std::string persona_strategy{"round_robin"};
  std::int32_t rotation_interval_seconds{0};
  std::int32_t processing_speed_per_minute{0};
  std::int32_t batch_size{50};
  std::int32_t retry_attempts{1};
  std::int32_t parallel_workers{1};
  std::int32_t request_timeout_seconds{30};
};

struct HttpJson {
  ValidationJson validation;
  std::vector<std::string> keyword_set_ids;
  std::vector<std::string> ad_hoc_keywords;
  std::vector<std::string> proxy_ids;
  std::string proxy_strategy{"round_robin"};
  std::vector<std::uint16_t> target_http_ports{80};
  bool follow_redirects{true};
  std::int32_t max_redirects{5};
};

struct DnsPersonaJson {
  std::vector<std::string> resolvers;
  bool use_system_resolvers{false};
  std::int32_t query_timeout_seconds{5};
  std::string query_type{"A"};
};

struct HttpPersonaJson {
  std::string user_agent;
  std::map<std::string, std::string> headers;
  std::vector<std::int32_t> allowed_status_codes;
  std::optional<bool> follow_redirects;
  std::uint64_t max_body_read_bytes{5ULL * 1024 * 1024};
  std::int32_t request_timeout_seconds{0};
  bool allow_insecure_tls{false};
};

struct KeywordRuleJson {
  std::string pattern;
  std::string rule_type{"string"};
  bool case_sensitive{false};
  double weight{1.0};
  bool active{true};
};

struct SetMatchJson {
  std::string set_id;
  std::vector<std::string> matched;
  double score{0.0};
};

struct FindingsJson {
  std::vector<SetMatchJson> sets;
  std::vector<std::string> ad_hoc;
  double score{0.0};
};

} // namespace domainflow::codec::wire

namespace glz {
template <> struct meta<domainflow::codec::wire::GenerationJson> {
  using T = domainflow::codec::wire::GenerationJson;
  static constexpr auto value = object(
      "patternType", &T::pattern_type, "variableLength", &T::variable_length,
      "characterSet", &T::character_set, "constantString", &T::constant_string,
      "tld", &T::tld, "numDomainsToGenerate", &T::num_domains_to_generate,
      "batchSize", &T::batch_size, "configFingerprint", &T::config_fingerprint,
      "totalPossibleCombinations", &T::total_possible_combinations);
};

template <> struct meta<domainflow::codec::wire::ValidationJson> {
  using T = domainflow::codec::wire::ValidationJson;
  static constexpr auto value = object(
      "sourceCampaignId", &T::source_campaign_id, "sourceType",
      &T::source_type, "personaIds", &T::persona_ids, "personaStrategy",
      &T::persona_strategy, "rotationIntervalSeconds",
      &T::rotation_interval_seconds, "processingSpeedPerMinute",
      &T::processing_speed_per_minute, "batchSize", &T::batch_size,
      "retryAttempts", &T::retry_attempts, "parallelWorkers",
      &T::parallel_workers, "requestTimeoutSeconds",
      &T::request_timeout_seconds);
};

template <> struct meta<domainflow::codec::wire::HttpJson> {
  using T = domainflow::codec::wire::HttpJson;
  static constexpr auto value = object(
      "validation", &T::validation, "keywordSetIds", &T::keyword_set_ids,
      "adHocKeywords", &T::ad_hoc_keywords, "proxyIds", &T::proxy_ids,
      "proxyStrategy", &T::proxy_strategy, "targetHttpPorts",
      &T::target_http_ports, "followRedirects", &T::follow_redirects,
      "maxRedirects", &T::max_redirects);
};

template <> struct meta<domainflow::codec::wire::DnsPersonaJson> {
  using T = domainflow::codec::wire::DnsPersonaJson;
  static constexpr auto value =
      object("resolvers", &T::resolvers, "useSystemResolvers",
             &T::use_system_resolvers, "queryTimeoutSeconds",
             &T::query_timeout_seconds, "queryType", &T::query_type);
};

template <> struct meta<domainflow::codec::wire::HttpPersonaJson> {
  using T = domainflow::codec::wire::HttpPersonaJson;
  static constexpr auto value = object(
      "userAgent", &T::user_agent, "headers", &T::headers,
      "allowedStatusCodes", &T::allowed_status_codes, "followRedirects",
      &T::follow_redirects, "maxBodyReadBytes", &T::max_body_read_bytes,
      "requestTimeoutSeconds", &T::request_timeout_seconds, "allowInsecureTLS",
      &T::allow_insecure_tls);
};

template <> struct meta<domainflow::codec::wire::KeywordRuleJson> {
  using T = domainflow::codec::wire::KeywordRuleJson;
  static constexpr auto value =
      object("pattern", &T::pattern, "ruleType", &T::rule_type,
             "caseSensitive", &T::case_sensitive, "weight", &T::weight,
             "active", &T::active);
};

template <> struct meta<domainflow::codec::wire::SetMatchJson> {
  using T = domainflow::codec::wire::SetMatchJson;
  static constexpr auto value = object("setId", &T::set_id, "matched",
                                       &T::matched, "score", &T::score);
};

template <> struct meta<domainflow::codec::wire::FindingsJson> {
  using T = domainflow::codec::wire::FindingsJson;
  static constexpr auto value =
      object("sets", &T::sets, "adHoc", &T::ad_hoc, "score", &T::score);
};
} // namespace glz

namespace domainflow::codec {
namespace {

template <typename Id>
[[nodiscard]] auto ids_to_strings(const std::vector<Id> &ids)
    -> std::vector<std::string> {
  return ids | std::views::transform([](const Id &id) { return id.str(); }) |
         std::ranges::to<std::vector>();
}

template <typename Id>
[[nodiscard]] auto strings_to_ids(const std::vector<std::string> &values)
    -> std::vector<Id> {
  return values |
         std::views::transform([](const std::string &s) { return Id{s}; }) |
         std::ranges::to<std::vector>();
}

template <typename E>
[[nodiscard]] auto strict_enum(std::string_view text, std::string_view field)
    -> Result<E> {
  auto parsed = util::try_parse_enum<E>(text);
  if (!parsed) {
    log::warn("Unknown value '{}' for {}", text, field);
    return fail(Error::InvalidConfig);
  }
  return *parsed;
}

[[nodiscard]] auto to_wire(const ValidationSettings &s) -> wire::ValidationJson {
  return wire::ValidationJson{
      .source_campaign_id = s.source_campaign_id.str(),
      .source_type = std::string{to_string_view(s.source_type)},
      .persona_ids = ids_to_strings(s.persona_ids),
      .persona_strategy = std::string{to_string_view(s.persona_strategy)},
      .rotation_interval_seconds = s.rotation_interval_seconds,
      .processing_speed_per_minute = s.processing_speed_per_minute,
      .batch_size = s.batch_size,
      .retry_attempts = s.retry_attempts,
      .parallel_workers = s.parallel_workers,
      .request_timeout_seconds = s.request_timeout_seconds,
  };
}

[[nodiscard]] auto from_wire(const wire::ValidationJson &w)
    -> Result<ValidationSettings> {
  auto source_type = strict_enum<CampaignType>(w.source_type, "sourceType");
  if (!source_type) {
    return fail(source_type.error());
  }
  auto strategy =
      strict_enum<SelectionStrategy>(w.persona_strategy, "personaStrategy");
  if (!strategy) {
    return fail(strategy.error());
  }
  return ValidationSettings{
      .source_campaign_id = CampaignId{w.source_campaign_id},
      .source_type = *source_type,
      .persona_ids = strings_to_ids<PersonaId>(w.persona_ids),
      .persona_strategy = *strategy,
      .rotation_interval_seconds = w.rotation_interval_seconds,
      .processing_speed_per_minute = w.processing_speed_per_minute,
      .batch_size = w.batch_size,
      .retry_attempts = w.retry_attempts,
      .parallel_workers = w.parallel_workers,
      .request_timeout_seconds = w.request_timeout_seconds,
  };
}

[[nodiscard]] auto encode(const GenerationParams &p) -> std::string {
  return write_json_of(wire::GenerationJson{
      .pattern_type = std::string{to_string_view(p.pattern_type)},
      .variable_length = p.variable_length,
      .character_set = p.character_set,
      .constant_string = p.constant_string,
      .tld = p.tld,
      .num_domains_to_generate = p.num_domains_to_generate,
      .batch_size = p.batch_size,
      .config_fingerprint = p.config_fingerprint,
      .total_possible_combinations = p.total_possible_combinations,
  });
}

[[nodiscard]] auto encode(const DnsValidationParams &p) -> std::string {
  return write_json_of(to_wire(p.settings));
}

[[nodiscard]] auto encode(const HttpValidationParams &p) -> std::string {
  return write_json_of(wire::HttpJson{
      .validation = to_wire(p.settings),
      .keyword_set_ids = ids_to_strings(p.keyword_set_ids),
      .ad_hoc_keywords = p.ad_hoc_keywords,
      .proxy_ids = ids_to_strings(p.proxy_ids),
      .proxy_strategy = std::string{to_string_view(p.proxy_strategy)},
      .target_http_ports = p.target_http_ports,
      .follow_redirects = p.follow_redirects,
      .max_redirects = p.max_redirects,
  });
}

[[nodiscard]] auto decode_generation(std::string_view json)
    -> Result<CampaignParams> {
  auto w = read_json_as<wire::GenerationJson>(json);
  if (!w) {
    return fail(w.error());
  }
  auto pattern = strict_enum<PatternType>(w->pattern_type, "patternType");
  if (!pattern) {
    return fail(pattern.error());
  }
  return CampaignParams{GenerationParams{
      .pattern_type = *pattern,
      .variable_length = w->variable_length,
      .character_set = std::move(w->character_set),
      .constant_string = std::move(w->constant_string),
      .tld = std::move(w->tld),
      .num_domains_to_generate = w->num_domains_to_generate,
      .batch_size = w->batch_size,
      .config_fingerprint = std::move(w->config_fingerprint),
      .total_possible_combinations = w->total_possible_combinations,
  }};
}

[[nodiscard]] auto decode_dns(std::string_view json) -> Result<CampaignParams> {
  return read_json_as<wire::ValidationJson>(json)
      .and_then([](const wire::ValidationJson &w) { return from_wire(w); })
      .transform([](ValidationSettings s) {
        return CampaignParams{DnsValidationParams{.settings = std::move(s)}};
      });
}

[[nodiscard]] auto decode_http(std::string_view json)
    -> Result<CampaignParams> {
  auto w = read_json_as<wire::HttpJson>(json);
  if (!w) {
    return fail(w.error());
  }
  auto settings = from_wire(w->validation);
  if (!settings) {
    return fail(settings.error());
  }
  auto proxy_strategy =
      strict_enum<SelectionStrategy>(w->proxy_strategy, "proxyStrategy");
  if (!proxy_strategy) {
    return fail(proxy_strategy.error());
  }
  return CampaignParams{HttpValidationParams{
      .settings = std::move(*settings),
      .keyword_set_ids = strings_to_ids<KeywordSetId>(w->keyword_set_ids),
      .ad_hoc_keywords = std::move(w->ad_hoc_keywords),
      .proxy_ids = strings_to_ids<ProxyId>(w->proxy_ids),
      .proxy_strategy = *proxy_strategy,
      .target_http_ports = std::move(w->target_http_ports),
      .follow_redirects = w->follow_redirects,
      .max_redirects = w->max_redirects,
  }};
}

} // namespace

auto encode_params(const CampaignParams &params) -> std::string {
  return std::visit([](const auto &p) { return encode(p); }, params);
}

auto decode_params(CampaignType type, std::string_view json)
    -> Result<CampaignParams> {
  switch (type) {
  case CampaignType::DomainGeneration:
    return decode_generation(json);
  case CampaignType::DnsValidation:
    return decode_dns(json);
  case CampaignType::HttpKeywordValidation:
    return decode_http(json);
  }
  return fail(Error::InvalidArgument);
}

auto validate_persona_config(const PersonaConfig &cfg) -> Result<void> {
  if (const auto *dns = std::get_if<DnsPersonaConfig>(&cfg)) {
    if (dns->resolvers.empty() && !dns->use_system_resolvers) {
      log::warn("DNS persona has no resolvers and system resolvers disabled");
      return fail(Error::InvalidConfig);
    }
    if (dns->query_timeout_seconds <= 0) {
      return fail(Error::InvalidConfig);
    }
    return ok();
  }
  const auto &http = std::get<HttpPersonaConfig>(cfg);
  if (http.max_body_read_bytes == 0 || http.request_timeout_seconds < 0) {
    return fail(Error::InvalidConfig);
  }
  if (std::ranges::any_of(http.allowed_status_codes,
                          [](std::int32_t c) { return c < 100 || c > 599; })) {
    log::warn("HTTP persona allows an out-of-range status code");
    return fail(Error::InvalidConfig);
  }
  return ok();
}

auto encode_persona_config(const PersonaConfig &cfg) -> std::string {
  if (const auto *dns = std::get_if<DnsPersonaConfig>(&cfg)) {
    return write_json_of(wire::DnsPersonaJson{
        .resolvers = dns->resolvers,
        .use_system_resolvers = dns->use_system_resolvers,
        .query_timeout_seconds = dns->query_timeout_seconds,
        .query_type = dns->query_type == DnsQueryType::A ? "A" : "AAAA",
    });
  }
  const auto &http = std::get<HttpPersonaConfig>(cfg);
  return write_json_of(wire::HttpPersonaJson{
      .user_agent = http.user_agent,
      .headers = http.headers,
      .allowed_status_codes = http.allowed_status_codes,
      .follow_redirects = http.follow_redirects,
      .max_body_read_bytes = http.max_body_read_bytes,
      .request_timeout_seconds = http.request_timeout_seconds,
      .allow_insecure_tls = http.allow_insecure_tls,
  });
}

auto decode_persona_config(PersonaType type, std::string_view json)
    -> Result<PersonaConfig> {
  PersonaConfig cfg;
  if (type == PersonaType::Dns) {
    auto w = read_json_as<wire::DnsPersonaJson>(json);
    if (!w) {
      return fail(w.error());
    }
    auto qtype = strict_enum<DnsQueryType>(w->query_type, "queryType");
    if (!qtype) {
      return fail(qtype.error());
    }
    cfg = DnsPersonaConfig{
        .resolvers = std::move(w->resolvers),
        .use_system_resolvers = w->use_system_resolvers,
        .query_timeout_seconds = w->query_timeout_seconds,
        .query_type = *qtype,
    };
  } else {
    auto w = read_json_as<wire::HttpPersonaJson>(json);
    if (!w) {
      return fail(w.error());
    }
    cfg = HttpPersonaConfig{
        .user_agent = std::move(w->user_agent),
        .headers = std::move(w->headers),
        .allowed_status_codes = std::move(w->allowed_status_codes),
        .follow_redirects = w->follow_redirects,
        .max_body_read_bytes = w->max_body_read_bytes,
        .request_timeout_seconds = w->request_timeout_seconds,
        .allow_insecure_tls = w->allow_insecure_tls,
    };
  }
  if (auto valid = validate_persona_config(cfg); !valid) {
    return fail(valid.error());
  }
  return cfg;
}

auto encode_keyword_rules(const std::vector<KeywordRule> &rules)
    -> std::string {
  auto wires =
      rules | std::views::transform([](const KeywordRule &r) {
        return wire::KeywordRuleJson{
            .pattern = r.pattern,
            .rule_type = std::string{to_string_view(r.rule_type)},
            .case_sensitive = r.case_sensitive,
            .weight = r.weight,
            .active = r.active,
        };
      }) |
      std::ranges::to<std::vector>();
  return write_json_of(wires);
}

auto decode_keyword_rules(std::string_view json)
    -> Result<std::vector<KeywordRule>> {
  auto wires = read_json_as<std::vector<wire::KeywordRuleJson>>(json);
  if (!wires) {
    return fail(wires.error());
  }
  std::vector<KeywordRule> rules;
  rules.reserve(wires->size());
  for (auto &w : *wires) {
    auto rule_type = strict_enum<KeywordRuleType>(w.rule_type, "ruleType");
    if (!rule_type) {
      return fail(rule_type.error());
    }
    rules.push_back(KeywordRule{
        .pattern = std::move(w.pattern),
        .rule_type = *rule_type,
        .case_sensitive = w.case_sensitive,
        .weight = w.weight,
        .active = w.active,
    });
  }
  return rules;
}

auto encode_strings(const std::vector<std::string> &values) -> std::string {
  return write_json_of(values);
}

auto decode_strings(std::string_view json) -> Result<std::vector<std::string>> {
  if (json.empty()) {
    return std::vector<std::string>{};
  }
  return read_json_as<std::vector<std::string>>(json);
}

auto encode_findings(const KeywordFindings &findings) -> std::string {
  wire::FindingsJson w{.ad_hoc = findings.ad_hoc, .score = findings.score};
  for (const auto &set : findings.sets) {
    w.sets.push_back(wire::SetMatchJson{
        .set_id = set.set_id.str(), .matched = set.matched, .score = set.score});
  }
  return write_json_of(w);
}

auto decode_findings(std::string_view json) -> Result<KeywordFindings> {
  if (json.empty()) {
    return KeywordFindings{};
  }
  auto w = read_json_as<wire::FindingsJson>(json);
  if (!w) {
    return fail(w.error());
  }
  KeywordFindings out{.ad_hoc = std::move(w->ad_hoc), .score = w->score};
  for (auto &set : w->sets) {
    out.sets.push_back(KeywordSetMatch{.set_id = KeywordSetId{set.set_id},
                                       .matched = std::move(set.matched),
                                       .score = set.score});
  }
  return out;
}

} // namespace domainflow::codec
