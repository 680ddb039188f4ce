#pragma once

#include "domainflow/util/enum.hpp"
#include "domainflow/util/id.hpp"
#include "domainflow/util/time.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace domainflow {

enum class ResourceKind : std::uint8_t { Persona, Proxy };
BOOST_DESCRIBE_ENUM(ResourceKind, Persona, Proxy)
DOMAINFLOW_DEFINE_ENUM_SERDE(ResourceKind, ResourceKind::Persona)

enum class PersonaType : std::uint8_t { Dns, Http };
BOOST_DESCRIBE_ENUM(PersonaType, Dns, Http)
DOMAINFLOW_DEFINE_ENUM_SERDE(PersonaType, PersonaType::Dns)

enum class CircuitState : std::uint8_t { Closed, Open, HalfOpen };
BOOST_DESCRIBE_ENUM(CircuitState, Closed, Open, HalfOpen)
DOMAINFLOW_DEFINE_ENUM_SERDE(CircuitState, CircuitState::Closed)

enum class DnsQueryType : std::uint8_t { A, Aaaa };
BOOST_DESCRIBE_ENUM(DnsQueryType, A, Aaaa)
DOMAINFLOW_DEFINE_ENUM_SERDE(DnsQueryType, DnsQueryType::A)

struct DnsPersonaConfig {
  std::vector<std::string> resolvers; // "ip" or "ip:port"
  bool use_system_resolvers{false};
  std::int32_t query_timeout_seconds{5};
  DnsQueryType query_type{DnsQueryType::A};

  auto operator==(const DnsPersonaConfig &) const -> bool = default;
};

struct HttpPersonaConfig {
  std::string user_agent;
  std::map<std::string, std::string> headers;
  std::vector<std::int32_t> allowed_status_codes; // empty = any 2xx
  std::optional<bool> follow_redirects;
  std::uint64_t max_body_read_bytes{5ULL * 1024 * 1024};
  std::int32_t request_timeout_seconds{0}; // 0 = campaign setting
  bool allow_insecure_tls{false};

  auto operator==(const HttpPersonaConfig &) const -> bool = default;
};

/// Persona configuration keyed by persona type.
using PersonaConfig = std::variant<DnsPersonaConfig, HttpPersonaConfig>;

[[nodiscard]] inline auto persona_type_of(const PersonaConfig &cfg)
    -> PersonaType {
  return cfg.index() == 0 ? PersonaType::Dns : PersonaType::Http;
}

/// Usage and circuit state of one persona or proxy. Mutated only through the
/// pure functions in pool/resource_state.hpp.
struct ResourceHealth {
  bool healthy{true};
  CircuitState circuit{CircuitState::Closed};
  std::int64_t total_requests{0};
  std::int64_t failed_requests{0};
  std::int32_t consecutive_failures{0};
  double success_rate{1.0};
  util::TimePoint opened_at{};
  util::TimePoint last_checked_at{};
  util::TimePoint last_used_at{};
  util::TimePoint in_use_since{};
  util::TimePoint resting_until{};

  auto operator==(const ResourceHealth &) const -> bool = default;
};

struct Persona {
  PersonaId id;
  std::string name;
  bool enabled{true};
  PersonaConfig config;
  ResourceHealth health;

  [[nodiscard]] auto type() const -> PersonaType {
    return persona_type_of(config);
  }
};

struct Proxy {
  ProxyId id;
  std::string name;
  std::string protocol{"http"};
  std::string host;
  std::uint16_t port{0};
  bool enabled{true};
  ResourceHealth health;
};

enum class KeywordRuleType : std::uint8_t { String, Regex, CaseInsensitive };
BOOST_DESCRIBE_ENUM(KeywordRuleType, String, Regex, CaseInsensitive)
DOMAINFLOW_DEFINE_ENUM_SERDE(KeywordRuleType, KeywordRuleType::String)

struct KeywordRule {
  std::string pattern;
  KeywordRuleType rule_type{KeywordRuleType::String};
  bool case_sensitive{false}; // string rules only
  double weight{1.0};
  bool active{true};

  auto operator==(const KeywordRule &) const -> bool = default;
};

struct KeywordSet {
  KeywordSetId id;
  std::string name;
  bool enabled{true};
  std::vector<KeywordRule> rules;
};

} // namespace domainflow
