// bench_pattern_enumerator.cpp: offset -> domain rendering and keyword
// scoring, the two per-item hot paths of a campaign.

#include "domainflow/generation/config_fingerprint.hpp"
#include "domainflow/generation/pattern_enumerator.hpp"
#include "domainflow/validation/keyword_matcher.hpp"

#include <benchmark/benchmark.h>

#include <cstdint>
#include <format>
#include <string>
#include <vector>

namespace domainflow {
namespace {

[[nodiscard]] auto make_params(PatternType type, std::int32_t length)
    -> GenerationParams {
  return GenerationParams{.pattern_type = type,
                          .variable_length = length,
                          .character_set =
                              "abcdefghijklmnopqrstuvwxyz0123456789",
                          .constant_string = "shop",
                          .tld = "com",
                          .num_domains_to_generate = 1'000'000,
                          .batch_size = 1000};
}

void BM_PatternAt(benchmark::State &state) {
  auto e = PatternEnumerator::create(PatternSpec::from_params(
      make_params(PatternType::Prefix, static_cast<std::int32_t>(state.range(0)))));
  if (!e) {
    state.SkipWithError("pattern rejected");
    return;
  }
  std::int64_t offset = 0;
  for (auto _ : state) {
    auto d = e->at(offset);
    benchmark::DoNotOptimize(d);
    offset = (offset + 7919) % e->capacity();
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_PatternAt)->Arg(3)->Arg(6)->Arg(10);

void BM_PatternEnumerateBatch(benchmark::State &state) {
  auto e = PatternEnumerator::create(
      PatternSpec::from_params(make_params(PatternType::Both, 3)));
  if (!e) {
    state.SkipWithError("pattern rejected");
    return;
  }
  const auto batch = state.range(0);
  std::int64_t from = 0;
  for (auto _ : state) {
    auto rows = e->enumerate(from, batch);
    benchmark::DoNotOptimize(rows);
    from = (from + batch) % (e->capacity() - batch);
  }
  state.SetItemsProcessed(state.iterations() * batch);
}
BENCHMARK(BM_PatternEnumerateBatch)->Arg(100)->Arg(1000)->Arg(10000);

void BM_Fingerprint(benchmark::State &state) {
  const auto params = make_params(PatternType::Suffix, 5);
  for (auto _ : state) {
    auto fp = fingerprint_of(params);
    benchmark::DoNotOptimize(fp);
  }
}
BENCHMARK(BM_Fingerprint);

void BM_KeywordMatch(benchmark::State &state) {
  std::vector<KeywordSet> sets{KeywordSet{
      .id = KeywordSetId{"bench"},
      .name = "bench",
      .enabled = true,
      .rules = {
          KeywordRule{.pattern = "add to cart", .weight = 2.0},
          KeywordRule{.pattern = "check(out)?",
                      .rule_type = KeywordRuleType::Regex},
          KeywordRule{.pattern = "FREE SHIPPING",
                      .rule_type = KeywordRuleType::CaseInsensitive},
      }}};
  std::vector<std::string> ad_hoc{"sale", "discount"};
  KeywordMatcher matcher(sets, ad_hoc);

  std::string page;
  for (int i = 0; i < state.range(0); ++i) {
    page += std::format("<p>item {} lorem ipsum dolor sit amet</p>", i);
  }
  page += "<button>Add to cart</button> free shipping on sale";

  for (auto _ : state) {
    auto findings = matcher.match(page);
    benchmark::DoNotOptimize(findings);
  }
  state.SetBytesProcessed(state.iterations() *
                          static_cast<std::int64_t>(page.size()));
}
BENCHMARK(BM_KeywordMatch)->Arg(10)->Arg(1000);

} // namespace
} // namespace domainflow
