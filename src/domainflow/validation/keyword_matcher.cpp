#include "domainflow/validation/keyword_matcher.hpp"

#include "domainflow/util/log.hpp"

#include <algorithm>
#include <cctype>

namespace domainflow {

auto to_lower_ascii(std::string_view s) -> std::string {
  std::string out(s);
  std::ranges::transform(out, out.begin(), [](char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  });
  return out;
}

KeywordMatcher::KeywordMatcher(std::span<const KeywordSet> sets,
                               std::span<const std::string> ad_hoc_keywords) {
  for (const auto &set : sets) {
    if (!set.enabled) {
      continue;
    }
    CompiledSet compiled{.id = set.id, .rules = {}};
    for (const auto &rule : set.rules) {
      if (!rule.active || rule.pattern.empty()) {
        ++skipped_;
        continue;
      }
      CompiledRule c{.label = rule.pattern,
                     .needle = rule.pattern,
                     .type = rule.rule_type,
                     .case_sensitive = rule.case_sensitive,
                     .weight = rule.weight,
                     .regex = {}};
      if (rule.rule_type == KeywordRuleType::Regex) {
        try {
          c.regex = std::regex(rule.pattern, std::regex::ECMAScript |
                                                 std::regex::optimize);
        } catch (const std::regex_error &e) {
          log::warn("Keyword set {}: skipping invalid regex '{}': {}", set.id,
                    rule.pattern, e.what());
          ++skipped_;
          continue;
        }
      } else if (rule.rule_type == KeywordRuleType::CaseInsensitive ||
                 !rule.case_sensitive) {
        c.needle = to_lower_ascii(rule.pattern);
      }
      compiled.rules.push_back(std::move(c));
    }
    sets_.push_back(std::move(compiled));
  }

  for (const auto &kw : ad_hoc_keywords) {
    if (kw.empty()) {
      continue;
    }
    ad_hoc_.push_back(to_lower_ascii(kw));
    ad_hoc_labels_.push_back(kw);
  }
}

auto KeywordMatcher::search_regex(const CompiledRule &rule,
                                  std::string_view text) -> bool {
  try {
    return std::regex_search(text.begin(), text.end(), rule.regex);
  } catch (const std::regex_error &e) {
    log::debug("Regex '{}' gave up on page: {}", rule.label, e.what());
    return false;
  }
}

auto KeywordMatcher::match(std::string_view content) const -> KeywordFindings {
  const auto lowered = to_lower_ascii(content);
  const auto regex_window = content.substr(0, kRegexWindowBytes);
  KeywordFindings out;

  for (const auto &set : sets_) {
    KeywordSetMatch m{.set_id = set.id, .matched = {}, .score = 0.0};
    for (const auto &rule : set.rules) {
      bool hit = false;
      switch (rule.type) {
      case KeywordRuleType::Regex:
        hit = search_regex(rule, regex_window);
        break;
      case KeywordRuleType::String:
        hit = rule.case_sensitive
                  ? content.find(rule.needle) != std::string_view::npos
                  : lowered.find(rule.needle) != std::string::npos;
        break;
      case KeywordRuleType::CaseInsensitive:
        hit = lowered.find(rule.needle) != std::string::npos;
        break;
      }
      if (hit) {
        m.matched.push_back(rule.label);
        m.score += rule.weight;
      }
    }
    out.score += m.score;
    if (!m.matched.empty()) {
      out.sets.push_back(std::move(m));
    }
  }

  for (std::size_t i = 0; i < ad_hoc_.size(); ++i) {
    if (lowered.find(ad_hoc_[i]) != std::string::npos) {
      out.ad_hoc.push_back(ad_hoc_labels_[i]);
      out.score += 1.0;
    }
  }
  return out;
}

} // namespace domainflow
