#include "domainflow/generation/config_fingerprint.hpp"
#include "domainflow/generation/pattern_enumerator.hpp"

#include "domainflow/util/digest.hpp"
#include "domainflow/util/json.hpp"

template <> struct glz::meta<domainflow::NormalizedPattern> {
  using T = domainflow::NormalizedPattern;
  static constexpr auto value = object(
      "patternType", &T::pattern_type, "variableLength", &T::variable_length,
      "characterSet", &T::character_set, "constantString", &T::constant_string,
      "tld", &T::tld);
};

namespace domainflow {

auto normalize_pattern(const GenerationParams &params) -> NormalizedPattern {
  return NormalizedPattern{
      .pattern_type = std::string{to_string_view(params.pattern_type)},
      .variable_length = params.variable_length,
      .character_set = canonical_charset(params.character_set),
      .constant_string = params.constant_string,
      .tld = canonical_tld(params.tld),
  };
}

auto fingerprint_of(const GenerationParams &params) -> ConfigFingerprint {
  auto normalized = normalize_pattern(params);
  auto details = write_json_of(normalized);
  return ConfigFingerprint{
      .hash = util::sha256_hex(details),
      .details = std::move(details),
      .normalized = std::move(normalized),
  };
}

} // namespace domainflow
