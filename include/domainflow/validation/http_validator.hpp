#pragma once

#include "domainflow/config/system_config.hpp"
#include "domainflow/model/campaign.hpp"
#include "domainflow/model/resource.hpp"
#include "domainflow/validation/checkers.hpp"
#include "domainflow/validation/keyword_matcher.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

// Building blocks of one HTTP keyword check: URL per target port, request
// from persona and campaign settings, and classification of the response.
namespace domainflow::http_check {

inline constexpr std::size_t kSnippetBytes = 256;

/// 443 -> https://domain/, 80 -> http://domain/, other -> http://domain:port/
[[nodiscard]] auto target_url(std::string_view domain, std::uint16_t port)
    -> std::string;

/// Text of the first <title> element, whitespace collapsed; empty if none.
[[nodiscard]] auto extract_title(std::string_view html) -> std::string;

/// First kSnippetBytes of the body, with "..." appended when cut.
[[nodiscard]] auto make_snippet(std::string_view body) -> std::string;

/// An empty allow-list accepts any 2xx.
[[nodiscard]] auto status_allowed(std::int32_t status,
                                  std::span<const std::int32_t> allowed)
    -> bool;

[[nodiscard]] auto build_request(const HttpPersonaConfig &persona,
                                 const HttpValidationParams &params,
                                 const HttpConfig &defaults, std::string url,
                                 const Proxy *proxy) -> HttpFetchRequest;

/// Fills the response-derived fields of `out` and sets its business status.
auto classify(const HttpFetchResponse &response,
              const HttpPersonaConfig &persona, const KeywordMatcher &matcher,
              HttpResult &out) -> void;

} // namespace domainflow::http_check
