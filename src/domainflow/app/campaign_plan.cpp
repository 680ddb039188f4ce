#include "domainflow/app/campaign_plan.hpp"

#include "domainflow/config/toml_util.hpp"
#include "domainflow/util/enum.hpp"
#include "domainflow/util/log.hpp"

#include <glaze/toml.hpp>

#include <cstdint>
#include <map>

namespace domainflow {
namespace detail {

struct PersonaToml {
  std::string id;
  std::string name;
  std::string type{"dns"};
  bool enabled{true};
  // dns
  std::vector<std::string> resolvers;
  bool use_system_resolvers{false};
  std::int32_t query_timeout_seconds{5};
  std::string query_type{"A"};
  // http
  std::string user_agent;
  std::map<std::string, std::string> headers;
  std::vector<std::int32_t> allowed_status_codes;
  std::string follow_redirects; // "", "true" or "false"
  std::uint64_t max_body_read_bytes{5ULL * 1024 * 1024};
  std::int32_t request_timeout_seconds{0};
  bool allow_insecure_tls{false};
};

struct ProxyToml {
  std::string id;
  std::string name;
  std::string protocol{"http"};
  std::string host;
  std::uint16_t port{0};
  bool enabled{true};
};

struct RuleToml {
  std::string pattern;
  std::string rule_type{"string"};
  bool case_sensitive{false};
  double weight{1.0};
  bool active{true};
};

struct KeywordSetToml {
  std::string id;
  std::string name;
  bool enabled{true};
  std::vector<RuleToml> rules;
};

struct GenerationToml {
  std::string name;
  std::string pattern_type{"prefix"};
  std::int32_t variable_length{0};
  std::string character_set;
  std::string constant_string;
  std::string tld;
  std::int64_t num_domains_to_generate{0};
  std::int32_t batch_size{1000};
};

struct DnsToml {
  std::string name;
  std::vector<std::string> persona_ids;
  std::string persona_strategy{"round_robin"};
  std::int32_t rotation_interval_seconds{0};
  std::int32_t processing_speed_per_minute{0};
  std::int32_t batch_size{50};
  std::int32_t retry_attempts{1};
  std::int32_t parallel_workers{1};
  std::int32_t request_timeout_seconds{30};
};

struct HttpToml {
  std::string name;
  std::string source{"dns"};
  std::vector<std::string> persona_ids;
  std::string persona_strategy{"round_robin"};
  std::int32_t rotation_interval_seconds{0};
  std::int32_t processing_speed_per_minute{0};
  std::int32_t batch_size{10};
  std::int32_t retry_attempts{1};
  std::int32_t parallel_workers{1};
  std::int32_t request_timeout_seconds{30};
  std::vector<std::string> keyword_set_ids;
  std::vector<std::string> ad_hoc_keywords;
  std::vector<std::string> proxy_ids;
  std::string proxy_strategy{"round_robin"};
  std::vector<std::uint16_t> target_http_ports{80};
  bool follow_redirects{true};
  std::int32_t max_redirects{5};
};

struct PlanToml {
  std::string name;
  std::vector<PersonaToml> personas;
  std::vector<ProxyToml> proxies;
  std::vector<KeywordSetToml> keyword_sets;
  GenerationToml generation{};
  DnsToml dns{};
  HttpToml http{};
};

} // namespace detail
} // namespace domainflow

namespace glz {
template <> struct meta<domainflow::detail::PersonaToml> {
  using T = domainflow::detail::PersonaToml;
  static constexpr auto value = object(
      "id", &T::id, "name", &T::name, "type", &T::type, "enabled", &T::enabled,
      "resolvers", &T::resolvers, "use_system_resolvers",
      &T::use_system_resolvers, "query_timeout_seconds",
      &T::query_timeout_seconds, "query_type", &T::query_type, "user_agent",
      &T::user_agent, "headers", &T::headers, "allowed_status_codes",
      &T::allowed_status_codes, "follow_redirects", &T::follow_redirects,
      "max_body_read_bytes", &T::max_body_read_bytes,
      "request_timeout_seconds", &T::request_timeout_seconds,
      "allow_insecure_tls", &T::allow_insecure_tls);
};

template <> struct meta<domainflow::detail::ProxyToml> {
  using T = domainflow::detail::ProxyToml;
  static constexpr auto value =
      object("id", &T::id, "name", &T::name, "protocol", &T::protocol, "host",
             &T::host, "port", &T::port, "enabled", &T::enabled);
};

template <> struct meta<domainflow::detail::RuleToml> {
  using T = domainflow::detail::RuleToml;
  static constexpr auto value =
      object("pattern", &T::pattern, "rule_type", &T::rule_type,
             "case_sensitive", &T::case_sensitive, "weight", &T::weight,
             "active", &T::active);
};

template <> struct meta<domainflow::detail::KeywordSetToml> {
  using T = domainflow::detail::KeywordSetToml;
  static constexpr auto value = object("id", &T::id, "name", &T::name,
                                       "enabled", &T::enabled, "rules",
                                       &T::rules);
};

template <> struct meta<domainflow::detail::GenerationToml> {
  using T = domainflow::detail::GenerationToml;
  static constexpr auto value = object(
      "name", &T::name, "pattern_type", &T::pattern_type, "variable_length",
      &T::variable_length, "character_set", &T::character_set,
      "constant_string", &T::constant_string, "tld", &T::tld,
      "num_domains_to_generate", &T::num_domains_to_generate, "batch_size",
      &T::batch_size);
};

template <> struct meta<domainflow::detail::DnsToml> {
  using T = domainflow::detail::DnsToml;
  static constexpr auto value = object(
      "name", &T::name, "persona_ids", &T::persona_ids, "persona_strategy",
      &T::persona_strategy, "rotation_interval_seconds",
      &T::rotation_interval_seconds, "processing_speed_per_minute",
      &T::processing_speed_per_minute, "batch_size", &T::batch_size,
      "retry_attempts", &T::retry_attempts, "parallel_workers",
      &T::parallel_workers, "request_timeout_seconds",
      &T::request_timeout_seconds);
};

template <> struct meta<domainflow::detail::HttpToml> {
  using T = domainflow::detail::HttpToml;
  static constexpr auto value = object(
      "name", &T::name, "source", &T::source, "persona_ids", &T::persona_ids,
      "persona_strategy", &T::persona_strategy, "rotation_interval_seconds",
      &T::rotation_interval_seconds, "processing_speed_per_minute",
      &T::processing_speed_per_minute, "batch_size", &T::batch_size,
      "retry_attempts", &T::retry_attempts, "parallel_workers",
      &T::parallel_workers, "request_timeout_seconds",
      &T::request_timeout_seconds, "keyword_set_ids", &T::keyword_set_ids,
      "ad_hoc_keywords", &T::ad_hoc_keywords, "proxy_ids", &T::proxy_ids,
      "proxy_strategy", &T::proxy_strategy, "target_http_ports",
      &T::target_http_ports, "follow_redirects", &T::follow_redirects,
      "max_redirects", &T::max_redirects);
};

template <> struct meta<domainflow::detail::PlanToml> {
  using T = domainflow::detail::PlanToml;
  static constexpr auto value =
      object("name", &T::name, "personas", &T::personas, "proxies",
             &T::proxies, "keyword_sets", &T::keyword_sets, "generation",
             &T::generation, "dns", &T::dns, "http", &T::http);
};
} // namespace glz

namespace domainflow {
namespace {

template <typename E>
[[nodiscard]] auto parse_field(std::string_view text, std::string_view field)
    -> Result<E> {
  auto value = util::try_parse_enum<E>(text);
  if (!value) {
    log::error("Plan: unknown {} '{}'", field, text);
    return fail(Error::ParseError);
  }
  return *value;
}

template <typename Id>
[[nodiscard]] auto to_ids(const std::vector<std::string> &values)
    -> std::vector<Id> {
  std::vector<Id> out;
  out.reserve(values.size());
  for (const auto &v : values) {
    out.emplace_back(v);
  }
  return out;
}

template <typename Raw>
[[nodiscard]] auto to_settings(const Raw &raw) -> Result<ValidationSettings> {
  auto strategy =
      parse_field<SelectionStrategy>(raw.persona_strategy, "persona_strategy");
  if (!strategy) {
    return fail(strategy.error());
  }
  return ValidationSettings{
      .source_campaign_id = {},
      .source_type = CampaignType::DomainGeneration,
      .persona_ids = to_ids<PersonaId>(raw.persona_ids),
      .persona_strategy = *strategy,
      .rotation_interval_seconds = raw.rotation_interval_seconds,
      .processing_speed_per_minute = raw.processing_speed_per_minute,
      .batch_size = raw.batch_size,
      .retry_attempts = raw.retry_attempts,
      .parallel_workers = raw.parallel_workers,
      .request_timeout_seconds = raw.request_timeout_seconds,
  };
}

[[nodiscard]] auto to_persona(const detail::PersonaToml &raw)
    -> Result<Persona> {
  auto type = parse_field<PersonaType>(raw.type, "persona type");
  if (!type) {
    return fail(type.error());
  }
  Persona p{.id = PersonaId{raw.id},
            .name = raw.name.empty() ? raw.id : raw.name,
            .enabled = raw.enabled,
            .config = {},
            .health = {}};
  if (*type == PersonaType::Dns) {
    auto qtype = parse_field<DnsQueryType>(raw.query_type, "query_type");
    if (!qtype) {
      return fail(qtype.error());
    }
    p.config = DnsPersonaConfig{
        .resolvers = raw.resolvers,
        .use_system_resolvers = raw.use_system_resolvers,
        .query_timeout_seconds = raw.query_timeout_seconds,
        .query_type = *qtype,
    };
    return p;
  }

  std::optional<bool> follow;
  if (raw.follow_redirects == "true") {
    follow = true;
  } else if (raw.follow_redirects == "false") {
    follow = false;
  } else if (!raw.follow_redirects.empty()) {
    log::error("Plan: persona {} follow_redirects must be true or false",
               raw.id);
    return fail(Error::ParseError);
  }
  p.config = HttpPersonaConfig{
      .user_agent = raw.user_agent,
      .headers = raw.headers,
      .allowed_status_codes = raw.allowed_status_codes,
      .follow_redirects = follow,
      .max_body_read_bytes = raw.max_body_read_bytes,
      .request_timeout_seconds = raw.request_timeout_seconds,
      .allow_insecure_tls = raw.allow_insecure_tls,
  };
  return p;
}

[[nodiscard]] auto to_keyword_set(const detail::KeywordSetToml &raw)
    -> Result<KeywordSet> {
  KeywordSet set{.id = KeywordSetId{raw.id},
                 .name = raw.name.empty() ? raw.id : raw.name,
                 .enabled = raw.enabled,
                 .rules = {}};
  for (const auto &r : raw.rules) {
    auto type = parse_field<KeywordRuleType>(r.rule_type, "rule_type");
    if (!type) {
      return fail(type.error());
    }
    set.rules.push_back(KeywordRule{.pattern = r.pattern,
                                    .rule_type = *type,
                                    .case_sensitive = r.case_sensitive,
                                    .weight = r.weight,
                                    .active = r.active});
  }
  return set;
}

[[nodiscard]] auto convert(detail::PlanToml raw) -> Result<CampaignPlan> {
  CampaignPlan plan;
  plan.name = raw.name;

  for (const auto &p : raw.personas) {
    auto persona = to_persona(p);
    if (!persona) {
      return fail(persona.error());
    }
    plan.personas.push_back(std::move(*persona));
  }
  for (const auto &p : raw.proxies) {
    plan.proxies.push_back(Proxy{.id = ProxyId{p.id},
                                 .name = p.name.empty() ? p.id : p.name,
                                 .protocol = p.protocol,
                                 .host = p.host,
                                 .port = p.port,
                                 .enabled = p.enabled,
                                 .health = {}});
  }
  for (const auto &k : raw.keyword_sets) {
    auto set = to_keyword_set(k);
    if (!set) {
      return fail(set.error());
    }
    plan.keyword_sets.push_back(std::move(*set));
  }

  const auto &g = raw.generation;
  auto pattern = parse_field<PatternType>(g.pattern_type, "pattern_type");
  if (!pattern) {
    return fail(pattern.error());
  }
  plan.generation = GenerationStage{
      .name = g.name.empty() ? plan.name + " generation" : g.name,
      .params = GenerationParams{
          .pattern_type = *pattern,
          .variable_length = g.variable_length,
          .character_set = g.character_set,
          .constant_string = g.constant_string,
          .tld = g.tld,
          .num_domains_to_generate = g.num_domains_to_generate,
          .batch_size = g.batch_size,
          .config_fingerprint = {},
          .total_possible_combinations = 0,
      }};

  if (!raw.dns.persona_ids.empty()) {
    auto settings = to_settings(raw.dns);
    if (!settings) {
      return fail(settings.error());
    }
    plan.dns = DnsStage{
        .name = raw.dns.name.empty() ? plan.name + " dns" : raw.dns.name,
        .params = DnsValidationParams{.settings = std::move(*settings)}};
  }

  if (!raw.http.persona_ids.empty()) {
    const auto &h = raw.http;
    auto settings = to_settings(h);
    if (!settings) {
      return fail(settings.error());
    }
    if (h.source == "dns") {
      if (!plan.dns) {
        log::error("Plan: http stage reads from dns but no dns stage is set");
        return fail(Error::ParseError);
      }
      settings->source_type = CampaignType::DnsValidation;
    } else if (h.source != "generation") {
      log::error("Plan: http source must be dns or generation, got '{}'",
                 h.source);
      return fail(Error::ParseError);
    }
    auto proxy_strategy =
        parse_field<SelectionStrategy>(h.proxy_strategy, "proxy_strategy");
    if (!proxy_strategy) {
      return fail(proxy_strategy.error());
    }
    plan.http = HttpStage{
        .name = h.name.empty() ? plan.name + " http" : h.name,
        .params = HttpValidationParams{
            .settings = std::move(*settings),
            .keyword_set_ids = to_ids<KeywordSetId>(h.keyword_set_ids),
            .ad_hoc_keywords = h.ad_hoc_keywords,
            .proxy_ids = to_ids<ProxyId>(h.proxy_ids),
            .proxy_strategy = *proxy_strategy,
            .target_http_ports = h.target_http_ports,
            .follow_redirects = h.follow_redirects,
            .max_redirects = h.max_redirects,
        }};
  }
  return plan;
}

} // namespace

auto load_plan_from_string(std::string_view toml) -> Result<CampaignPlan> {
  auto raw = toml_util::parse_toml<detail::PlanToml>(toml);
  if (!raw) {
    return fail(raw.error());
  }
  return convert(std::move(*raw));
}

auto load_plan_from_file(std::string_view path) -> Result<CampaignPlan> {
  auto text = toml_util::read_file(path);
  if (!text) {
    log::error("Cannot read campaign plan {}", path);
    return fail(text.error());
  }
  return load_plan_from_string(*text);
}

auto SubmittedPlan::ids() const -> std::vector<CampaignId> {
  std::vector<CampaignId> out{generation};
  if (dns) {
    out.push_back(*dns);
  }
  if (http) {
    out.push_back(*http);
  }
  return out;
}

auto submit_plan(CampaignService &service, const CampaignPlan &plan)
    -> task<Result<SubmittedPlan>> {
  for (const auto &p : plan.personas) {
    if (auto r = co_await service.add_persona(p); !r) {
      log::error("Plan: persona {} rejected: {}", p.id, r.error().message());
      co_return std::unexpected(r.error());
    }
  }
  for (const auto &p : plan.proxies) {
    if (auto r = co_await service.add_proxy(p); !r) {
      co_return std::unexpected(r.error());
    }
  }
  for (const auto &k : plan.keyword_sets) {
    if (auto r = co_await service.add_keyword_set(k); !r) {
      co_return std::unexpected(r.error());
    }
  }

  auto generation =
      co_await service.create(plan.generation.name, plan.generation.params);
  if (!generation) {
    co_return std::unexpected(generation.error());
  }
  SubmittedPlan submitted{.generation = generation->id,
                          .dns = std::nullopt,
                          .http = std::nullopt};
  if (auto r = co_await service.start(generation->id); !r) {
    co_return std::unexpected(r.error());
  }

  if (plan.dns) {
    auto params = plan.dns->params;
    params.settings.source_campaign_id = generation->id;
    params.settings.source_type = CampaignType::DomainGeneration;
    auto dns = co_await service.create(plan.dns->name, params);
    if (!dns) {
      co_return std::unexpected(dns.error());
    }
    submitted.dns = dns->id;
    if (auto r = co_await service.start(dns->id); !r) {
      co_return std::unexpected(r.error());
    }
  }

  if (plan.http) {
    auto params = plan.http->params;
    params.settings.source_campaign_id =
        params.settings.source_type == CampaignType::DnsValidation &&
                submitted.dns
            ? *submitted.dns
            : generation->id;
    auto http = co_await service.create(plan.http->name, params);
    if (!http) {
      co_return std::unexpected(http.error());
    }
    submitted.http = http->id;
    if (auto r = co_await service.start(http->id); !r) {
      co_return std::unexpected(r.error());
    }
  }
  co_return submitted;
}

} // namespace domainflow
