#pragma once

#include "domainflow/model/campaign.hpp"
#include "domainflow/model/resource.hpp"

#include <regex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace domainflow {

/// Keyword rules of a campaign compiled once and evaluated per page.
///
/// Ad-hoc keywords match as case-insensitive substrings. Set rules match by
/// rule type: `string` honours case_sensitive, `case_insensitive` ignores
/// case, `regex` is an ECMAScript search over the first kRegexWindowBytes of
/// the page (std::regex recurses per character). The score is the sum of the weights
/// of the matched rules (ad-hoc keywords weigh 1).
class KeywordMatcher {
public:
  static constexpr std::size_t kRegexWindowBytes = 4 * 1024;

  KeywordMatcher(std::span<const KeywordSet> sets,
                 std::span<const std::string> ad_hoc_keywords);

  [[nodiscard]] auto match(std::string_view content) const -> KeywordFindings;

  /// Rules skipped at compile time (inactive, empty or invalid regex).
  [[nodiscard]] auto skipped_rules() const noexcept -> std::size_t {
    return skipped_;
  }

private:
  struct CompiledRule {
    std::string label;  // pattern as written, reported when matched
    std::string needle; // lowercased for case-insensitive string rules
    KeywordRuleType type{KeywordRuleType::String};
    bool case_sensitive{false};
    double weight{1.0};
    std::regex regex;
  };
  struct CompiledSet {
    KeywordSetId id;
    std::vector<CompiledRule> rules;
  };

  [[nodiscard]] static auto search_regex(const CompiledRule &rule,
                                         std::string_view text) -> bool;

  std::vector<CompiledSet> sets_;
  std::vector<std::string> ad_hoc_; // lowercased
  std::vector<std::string> ad_hoc_labels_;
  std::size_t skipped_{0};
};

[[nodiscard]] auto to_lower_ascii(std::string_view s) -> std::string;

} // namespace domainflow
