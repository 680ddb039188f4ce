#pragma once

#include "domainflow/util/enum.hpp"
#include "domainflow/util/id.hpp"
#include "domainflow/util/time.hpp"

#include <boost/describe/enum.hpp>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace domainflow {

enum class CampaignType : std::uint8_t {
  DomainGeneration,
  DnsValidation,
  HttpKeywordValidation,
};
BOOST_DESCRIBE_ENUM(CampaignType, DomainGeneration, DnsValidation,
                    HttpKeywordValidation)
DOMAINFLOW_DEFINE_ENUM_SERDE(CampaignType, CampaignType::DomainGeneration)

enum class CampaignStatus : std::uint8_t {
  Pending,
  Queued,
  Running,
  Paused,
  Completed,
  Failed,
  Archived,
  Cancelled,
};
BOOST_DESCRIBE_ENUM(CampaignStatus, Pending, Queued, Running, Paused,
                    Completed, Failed, Archived, Cancelled)
DOMAINFLOW_DEFINE_ENUM_SERDE(CampaignStatus, CampaignStatus::Pending)

enum class PatternType : std::uint8_t { Prefix, Suffix, Both };
BOOST_DESCRIBE_ENUM(PatternType, Prefix, Suffix, Both)
DOMAINFLOW_DEFINE_ENUM_SERDE(PatternType, PatternType::Prefix)

enum class SelectionStrategy : std::uint8_t {
  RoundRobin,
  WeightedBySuccessRate,
  StickyPerDomain,
};
BOOST_DESCRIBE_ENUM(SelectionStrategy, RoundRobin, WeightedBySuccessRate,
                    StickyPerDomain)
DOMAINFLOW_DEFINE_ENUM_SERDE(SelectionStrategy, SelectionStrategy::RoundRobin)

enum class DomainValidationStatus : std::uint8_t {
  Pending,
  Valid,
  Invalid,
  Error,
  Skipped,
};
BOOST_DESCRIBE_ENUM(DomainValidationStatus, Pending, Valid, Invalid, Error,
                    Skipped)
DOMAINFLOW_DEFINE_ENUM_SERDE(DomainValidationStatus,
                             DomainValidationStatus::Pending)

/// Whether an attempt ran to completion, independent of what it found.
enum class SystemStatus : std::uint8_t { Ok, TransportError, Timeout };
BOOST_DESCRIBE_ENUM(SystemStatus, Ok, TransportError, Timeout)
DOMAINFLOW_DEFINE_ENUM_SERDE(SystemStatus, SystemStatus::Ok)

enum class DnsStatus : std::uint8_t { Resolved, Unresolved, Error };
BOOST_DESCRIBE_ENUM(DnsStatus, Resolved, Unresolved, Error)
DOMAINFLOW_DEFINE_ENUM_SERDE(DnsStatus, DnsStatus::Error)

enum class HttpStatus : std::uint8_t {
  KeywordsFound,
  NoKeywords,
  AccessDenied,
  Error,
};
BOOST_DESCRIBE_ENUM(HttpStatus, KeywordsFound, NoKeywords, AccessDenied, Error)
DOMAINFLOW_DEFINE_ENUM_SERDE(HttpStatus, HttpStatus::Error)

struct GenerationParams {
  PatternType pattern_type{PatternType::Prefix};
  std::int32_t variable_length{0};
  std::string character_set;
  std::string constant_string;
  std::string tld;
  std::int64_t num_domains_to_generate{0};
  std::int32_t batch_size{1000};
  // Resolved when the campaign is created.
  std::string config_fingerprint;
  std::int64_t total_possible_combinations{0};

  auto operator==(const GenerationParams &) const -> bool = default;
};

/// Settings shared by both validation stages.
struct ValidationSettings {
  CampaignId source_campaign_id;
  CampaignType source_type{CampaignType::DomainGeneration};
  std::vector<PersonaId> persona_ids;
  SelectionStrategy persona_strategy{SelectionStrategy::RoundRobin};
  std::int32_t rotation_interval_seconds{0};
  std::int32_t processing_speed_per_minute{0}; // 0 = unlimited
  std::int32_t batch_size{50};
  std::int32_t retry_attempts{1};
  std::int32_t parallel_workers{1};
  std::int32_t request_timeout_seconds{30};

  auto operator==(const ValidationSettings &) const -> bool = default;
};

struct DnsValidationParams {
  ValidationSettings settings;

  auto operator==(const DnsValidationParams &) const -> bool = default;
};

struct HttpValidationParams {
  ValidationSettings settings{.batch_size = 10};
  std::vector<KeywordSetId> keyword_set_ids;
  std::vector<std::string> ad_hoc_keywords;
  std::vector<ProxyId> proxy_ids;
  SelectionStrategy proxy_strategy{SelectionStrategy::RoundRobin};
  std::vector<std::uint16_t> target_http_ports{80};
  bool follow_redirects{true};
  std::int32_t max_redirects{5};

  auto operator==(const HttpValidationParams &) const -> bool = default;
};

using CampaignParams =
    std::variant<GenerationParams, DnsValidationParams, HttpValidationParams>;

[[nodiscard]] inline auto params_type(const CampaignParams &params)
    -> CampaignType {
  switch (params.index()) {
  case 0:
    return CampaignType::DomainGeneration;
  case 1:
    return CampaignType::DnsValidation;
  default:
    return CampaignType::HttpKeywordValidation;
  }
}

/// Settings of a validation campaign; nullptr for generation.
[[nodiscard]] inline auto validation_settings(const CampaignParams &params)
    -> const ValidationSettings * {
  if (const auto *dns = std::get_if<DnsValidationParams>(&params)) {
    return &dns->settings;
  }
  if (const auto *http = std::get_if<HttpValidationParams>(&params)) {
    return &http->settings;
  }
  return nullptr;
}

struct CampaignCounters {
  std::int64_t total_items{0};
  std::int64_t processed_items{0};
  std::int64_t successful_items{0};
  std::int64_t failed_items{0};

  auto operator==(const CampaignCounters &) const -> bool = default;
};

/// Derived progress fields written by the progress aggregator.
struct ProgressUpdate {
  double progress_percentage{0.0};
  double avg_processing_rate{0.0};
  util::TimePoint estimated_completion_at{};
  util::TimePoint last_heartbeat_at{};
};

struct Campaign {
  CampaignId id;
  std::string name;
  CampaignType type{CampaignType::DomainGeneration};
  CampaignStatus status{CampaignStatus::Pending};
  CampaignCounters counters;
  ProgressUpdate progress;
  std::string error_message;
  util::TimePoint created_at{};
  util::TimePoint started_at{};
  util::TimePoint completed_at{};
  util::TimePoint updated_at{};
  CampaignParams params;
  // Validation campaigns: last consumed predecessor row sequence.
  std::int64_t source_cursor{0};
};

struct GenerationConfigState {
  std::string fingerprint;
  std::int64_t total_possible_combinations{0};
  std::int64_t current_offset{0};
  std::string config_details;
  util::TimePoint updated_at{};
};

/// Half-open offset range [start, start + size).
struct OffsetRange {
  std::int64_t start{0};
  std::int64_t size{0};

  [[nodiscard]] auto exhausted() const noexcept -> bool { return size == 0; }
  [[nodiscard]] auto end() const noexcept -> std::int64_t {
    return start + size;
  }
};

struct GeneratedDomain {
  std::int64_t seq{0};
  CampaignId campaign_id;
  std::string domain_name;
  std::int64_t offset_index{0};
  DomainValidationStatus validation_status{DomainValidationStatus::Pending};
  util::TimePoint created_at{};
};

/// A predecessor row eligible for validation.
struct SourceCandidate {
  std::int64_t seq{0};
  std::string domain_name;
};

struct DnsResult {
  CampaignId campaign_id;
  std::string domain_name;
  std::int64_t source_seq{0};
  DnsStatus status{DnsStatus::Error};
  SystemStatus system_status{SystemStatus::Ok};
  std::vector<std::string> ips;
  std::string resolver;
  PersonaId persona_id;
  std::int32_t attempts{0};
  std::int64_t duration_ms{0};
  std::string error;
  util::TimePoint checked_at{};
};

struct KeywordSetMatch {
  KeywordSetId set_id;
  std::vector<std::string> matched;
  double score{0.0};

  auto operator==(const KeywordSetMatch &) const -> bool = default;
};

struct KeywordFindings {
  std::vector<KeywordSetMatch> sets;
  std::vector<std::string> ad_hoc;
  double score{0.0};

  [[nodiscard]] auto any() const noexcept -> bool {
    return !ad_hoc.empty() ||
           std::ranges::any_of(sets, [](const KeywordSetMatch &m) {
             return !m.matched.empty();
           });
  }
};

struct HttpResult {
  CampaignId campaign_id;
  std::string domain_name;
  std::int64_t source_seq{0};
  HttpStatus status{HttpStatus::Error};
  SystemStatus system_status{SystemStatus::Ok};
  std::int32_t http_status_code{0};
  std::string final_url;
  std::int32_t redirect_count{0};
  std::string page_title;
  std::string content_snippet;
  std::string content_hash;
  std::int64_t content_length{0};
  KeywordFindings findings;
  PersonaId persona_id;
  ProxyId proxy_id; // empty when fetched directly
  std::int32_t attempts{0};
  std::int64_t duration_ms{0};
  std::string error;
  util::TimePoint checked_at{};
};

/// Counts toward successful_items; every other outcome counts as failed.
[[nodiscard]] constexpr auto is_positive(DnsStatus s) noexcept -> bool {
  return s == DnsStatus::Resolved;
}

[[nodiscard]] constexpr auto is_positive(HttpStatus s) noexcept -> bool {
  return s == HttpStatus::KeywordsFound;
}

} // namespace domainflow
