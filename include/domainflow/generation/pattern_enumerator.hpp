#pragma once

#include "domainflow/core/error.hpp"
#include "domainflow/model/campaign.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace domainflow {

struct PatternSpec {
  PatternType pattern_type{PatternType::Prefix};
  std::string character_set;
  std::string constant_string;
  std::int32_t variable_length{0};
  std::string tld;

  [[nodiscard]] static auto from_params(const GenerationParams &p)
      -> PatternSpec {
    return {p.pattern_type, p.character_set, p.constant_string,
            p.variable_length, p.tld};
  }
};

/// Deterministic offset -> domain mapping over a pattern space.
///
/// The variable part is read as a fixed-width number in base |charset| with
/// the character set in canonical_charset() order and the most significant
/// digit first, so offset 0 is the first character
/// repeated. For PatternType::Both the number is 2 * variable_length digits
/// wide and its upper half fills the left-hand side.
class PatternEnumerator {
public:
  /// Fails with Error::InvalidConfig for an empty character set, a
  /// non-positive variable length or a space larger than int64.
  [[nodiscard]] static auto create(const PatternSpec &spec)
      -> Result<PatternEnumerator>;

  [[nodiscard]] auto capacity() const noexcept -> std::int64_t {
    return capacity_;
  }

  /// Error::Exhausted when offset >= capacity().
  [[nodiscard]] auto at(std::int64_t offset) const -> Result<std::string>;

  /// Up to `count` domains starting at `from`; shorter when the space ends.
  /// Error::Exhausted when `from` is already past the end.
  [[nodiscard]] auto enumerate(std::int64_t from, std::int64_t count) const
      -> Result<std::vector<std::string>>;

  [[nodiscard]] auto charset() const noexcept -> std::string_view {
    return charset_;
  }

private:
  PatternEnumerator() = default;

  auto render(std::int64_t offset, std::string &out) const -> void;

  PatternType pattern_type_{PatternType::Prefix};
  std::string charset_;
  std::string constant_;
  std::string suffix_; // ".tld" or empty
  std::int32_t variable_length_{0};
  std::int32_t digits_{0};
  std::int64_t capacity_{0};
};

/// Lowercased, de-duplicated and sorted. Enumeration and the resumption
/// fingerprint both use this form so equivalent sets share one cursor.
[[nodiscard]] auto canonical_charset(std::string_view charset) -> std::string;

/// Lowercase ".tld" with surrounding dots trimmed, or empty.
[[nodiscard]] auto canonical_tld(std::string_view tld) -> std::string;

/// |charset|^digits, or Error::InvalidConfig when it does not fit in int64.
[[nodiscard]] auto checked_pow(std::int64_t base, std::int32_t exponent)
    -> Result<std::int64_t>;

} // namespace domainflow
