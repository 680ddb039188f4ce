#include "domainflow/generation/config_fingerprint.hpp"

#include "test_utils.hpp"

#include <gtest/gtest.h>

using namespace domainflow;

TEST(ConfigFingerprintTest, NormalizesCharsetAndTld) {
  auto p = test::generation_params("cBAa", 3);
  p.tld = "..COM.";
  auto n = normalize_pattern(p);
  EXPECT_EQ(n.character_set, "abc");
  EXPECT_EQ(n.tld, ".com");
  EXPECT_EQ(n.pattern_type, "prefix");
  EXPECT_EQ(n.constant_string, "shop");
}

TEST(ConfigFingerprintTest, EquivalentPatternsShareFingerprint) {
  auto a = test::generation_params("abc", 3);
  auto b = test::generation_params("CBA", 3);
  b.tld = ".com";
  // Quantity and batch size do not change the pattern space.
  b.num_domains_to_generate = 999;
  b.batch_size = 7;
  EXPECT_EQ(fingerprint_of(a).hash, fingerprint_of(b).hash);
}

TEST(ConfigFingerprintTest, DifferentPatternsDiffer) {
  auto base = test::generation_params("abc", 3);
  auto other_len = base;
  other_len.variable_length = 4;
  auto other_type = base;
  other_type.pattern_type = PatternType::Suffix;
  auto other_constant = base;
  other_constant.constant_string = "Shop";

  const auto h = fingerprint_of(base).hash;
  EXPECT_NE(h, fingerprint_of(other_len).hash);
  EXPECT_NE(h, fingerprint_of(other_type).hash);
  EXPECT_NE(h, fingerprint_of(other_constant).hash);
}

TEST(ConfigFingerprintTest, HashIsHexSha256OfDetails) {
  auto fp = fingerprint_of(test::generation_params());
  EXPECT_EQ(fp.hash.size(), 64U);
  EXPECT_NE(fp.details.find("\"characterSet\":\"ab\""), std::string::npos);
}
