#include "domainflow/cli/commands.hpp"
#include "domainflow/generation/config_fingerprint.hpp"
#include "domainflow/generation/pattern_enumerator.hpp"
#include "domainflow/util/enum.hpp"
#include "domainflow/util/json.hpp"

#include <algorithm>
#include <cctype>
#include <print>
#include <ranges>

namespace domainflow::cli {
namespace {

struct PreviewOutput {
  std::string fingerprint;
  std::string normalized;
  std::int64_t capacity{0};
  std::int64_t offset{0};
  std::vector<std::string> domains;
};

} // namespace

auto cmd_preview(const PreviewOptions &opts) -> int {
  auto pattern = util::try_parse_enum<PatternType>(opts.pattern_type);
  if (!pattern) {
    std::println(stderr, "Error: unknown pattern type '{}'",
                 opts.pattern_type);
    return 1;
  }

  GenerationParams params{.pattern_type = *pattern,
                          .variable_length = opts.variable_length,
                          .character_set = opts.character_set,
                          .constant_string = opts.constant_string,
                          .tld = opts.tld};
  std::ranges::transform(params.character_set, params.character_set.begin(),
                         [](unsigned char c) {
                           return static_cast<char>(std::tolower(c));
                         });

  auto enumerator =
      PatternEnumerator::create(PatternSpec::from_params(params));
  if (!enumerator) {
    std::println(stderr, "Error: invalid pattern: {}",
                 enumerator.error().message());
    return 1;
  }

  const auto offset = std::max<std::int64_t>(0, opts.offset);
  const auto fp = fingerprint_of(params);
  PreviewOutput out{.fingerprint = fp.hash,
                    .normalized = fp.details,
                    .capacity = enumerator->capacity(),
                    .offset = offset,
                    .domains = {}};
  if (opts.count > 0 && offset < enumerator->capacity()) {
    auto domains = enumerator->enumerate(offset, opts.count);
    if (!domains) {
      std::println(stderr, "Error: {}", domains.error().message());
      return 1;
    }
    out.domains = std::move(*domains);
  }

  if (opts.json) {
    std::println("{}", write_json_of(out));
    return 0;
  }
  std::println("fingerprint  {}", out.fingerprint);
  std::println("pattern      {}", out.normalized);
  std::println("capacity     {}", out.capacity);
  for (auto [i, domain] : out.domains | std::views::enumerate) {
    std::println("{:>12}  {}", out.offset + i, domain);
  }
  return 0;
}

} // namespace domainflow::cli
