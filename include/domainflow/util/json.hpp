#pragma once

#include "domainflow/core/error.hpp"

#include <glaze/json.hpp>

#include <string>
#include <string_view>

namespace domainflow {

using JsonValue = glz::generic_json<glz::num_mode::i64>;

inline constexpr auto kJsonReadOpts =
    glz::opts{.null_terminated = false, .error_on_unknown_keys = false};

[[nodiscard]] inline auto dump_json(const JsonValue &value) -> std::string {
  auto out = glz::write_json(value);
  return out ? *out : "null";
}

/// Reads a typed struct (described through glz::meta or reflection).
template <typename T>
[[nodiscard]] auto read_json_as(std::string_view input) -> Result<T> {
  T value{};
  if (auto ec = glz::read<kJsonReadOpts>(value, input); ec) {
    return fail(Error::ParseError);
  }
  return ok(std::move(value));
}

template <typename T>
[[nodiscard]] auto write_json_of(const T &value) -> std::string {
  auto out = glz::write_json(value);
  return out ? *out : "null";
}

} // namespace domainflow
