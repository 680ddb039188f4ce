#pragma once

#include "domainflow/model/campaign.hpp"

#include <string>

namespace domainflow {

struct NormalizedPattern {
  std::string pattern_type;
  std::int32_t variable_length{0};
  std::string character_set;
  std::string constant_string;
  std::string tld;
};

struct ConfigFingerprint {
  std::string hash;    // hex SHA-256 of `details`
  std::string details; // canonical JSON of the normalized pattern
  NormalizedPattern normalized;
};

/// Canonical form used as the resumption key: lowercase pattern type,
/// character set lowercased de-duplicated and sorted, TLD lowercased with a
/// single leading dot. The constant string is kept as given.
[[nodiscard]] auto normalize_pattern(const GenerationParams &params)
    -> NormalizedPattern;

[[nodiscard]] auto fingerprint_of(const GenerationParams &params)
    -> ConfigFingerprint;

} // namespace domainflow
