#include "domainflow/generation/pattern_enumerator.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <limits>

namespace domainflow {
namespace {

[[nodiscard]] auto to_lower(char c) -> char {
  return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

} // namespace

auto canonical_charset(std::string_view charset) -> std::string {
  std::string out;
  out.reserve(charset.size());
  std::ranges::transform(charset, std::back_inserter(out), to_lower);
  std::ranges::sort(out);
  auto dup = std::ranges::unique(out);
  out.erase(dup.begin(), dup.end());
  return out;
}

auto canonical_tld(std::string_view tld) -> std::string {
  while (tld.starts_with('.')) {
    tld.remove_prefix(1);
  }
  while (tld.ends_with('.')) {
    tld.remove_suffix(1);
  }
  if (tld.empty()) {
    return {};
  }
  std::string out{"."};
  std::ranges::transform(tld, std::back_inserter(out), to_lower);
  return out;
}

auto checked_pow(std::int64_t base, std::int32_t exponent)
    -> Result<std::int64_t> {
  if (base <= 0 || exponent <= 0) {
    return fail(Error::InvalidConfig);
  }
  std::int64_t result = 1;
  for (std::int32_t i = 0; i < exponent; ++i) {
    if (result > std::numeric_limits<std::int64_t>::max() / base) {
      return fail(Error::InvalidConfig);
    }
    result *= base;
  }
  return result;
}

auto PatternEnumerator::create(const PatternSpec &spec)
    -> Result<PatternEnumerator> {
  PatternEnumerator e;
  e.pattern_type_ = spec.pattern_type;
  e.charset_ = canonical_charset(spec.character_set);
  e.constant_ = spec.constant_string;
  e.variable_length_ = spec.variable_length;

  if (e.charset_.empty() || e.variable_length_ <= 0) {
    return fail(Error::InvalidConfig);
  }

  switch (spec.pattern_type) {
  case PatternType::Prefix:
  case PatternType::Suffix:
    e.digits_ = e.variable_length_;
    break;
  case PatternType::Both:
    if (e.variable_length_ > std::numeric_limits<std::int32_t>::max() / 2) {
      return fail(Error::InvalidConfig);
    }
    e.digits_ = e.variable_length_ * 2;
    break;
  default:
    return fail(Error::InvalidConfig);
  }

  auto cap = checked_pow(static_cast<std::int64_t>(e.charset_.size()),
                         e.digits_);
  if (!cap) {
    return fail(cap.error());
  }
  e.capacity_ = *cap;
  e.suffix_ = canonical_tld(spec.tld);
  return e;
}

auto PatternEnumerator::render(std::int64_t offset, std::string &out) const
    -> void {
  const auto base = static_cast<std::int64_t>(charset_.size());
  std::string digits(static_cast<std::size_t>(digits_), charset_.front());
  for (auto i = static_cast<std::ptrdiff_t>(digits_) - 1;
       i >= 0 && offset > 0; --i) {
    digits[static_cast<std::size_t>(i)] =
        charset_[static_cast<std::size_t>(offset % base)];
    offset /= base;
  }

  out.clear();
  out.reserve(digits.size() + constant_.size() + suffix_.size());
  const auto half = static_cast<std::size_t>(variable_length_);
  switch (pattern_type_) {
  case PatternType::Prefix:
    out.append(digits).append(constant_);
    break;
  case PatternType::Suffix:
    out.append(constant_).append(digits);
    break;
  case PatternType::Both:
    out.append(digits, 0, half).append(constant_).append(digits, half);
    break;
  }
  out.append(suffix_);
}

auto PatternEnumerator::at(std::int64_t offset) const -> Result<std::string> {
  if (offset < 0) {
    return fail(Error::InvalidArgument);
  }
  if (offset >= capacity_) {
    return fail(Error::Exhausted);
  }
  std::string out;
  render(offset, out);
  return out;
}

auto PatternEnumerator::enumerate(std::int64_t from, std::int64_t count) const
    -> Result<std::vector<std::string>> {
  if (from < 0 || count < 0) {
    return fail(Error::InvalidArgument);
  }
  if (from >= capacity_) {
    return fail(Error::Exhausted);
  }
  const auto n = std::min(count, capacity_ - from);
  std::vector<std::string> out(static_cast<std::size_t>(n));
  for (std::int64_t i = 0; i < n; ++i) {
    render(from + i, out[static_cast<std::size_t>(i)]);
  }
  return out;
}

} // namespace domainflow
