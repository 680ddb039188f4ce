#pragma once

#include "domainflow/core/error.hpp"
#include "domainflow/util/log.hpp"

#include <glaze/toml.hpp>

#include <fstream>
#include <iterator>
#include <string>
#include <string_view>

namespace domainflow::toml_util {

[[nodiscard]] inline auto read_file(std::string_view path)
    -> Result<std::string> {
  std::ifstream in(std::string(path), std::ios::binary);
  if (!in) {
    return fail(Error::FileNotFound);
  }
  return ok(std::string((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>()));
}

/// Parse TOML text into a glaze-described struct T. Unknown keys are ignored.
template <typename T>
[[nodiscard]] auto parse_toml(std::string_view text) -> Result<T> {
  T raw{};
  constexpr auto kOpts =
      glz::opts{.format = glz::TOML, .error_on_unknown_keys = false};
  if (auto ec = glz::read<kOpts>(raw, text); ec) {
    log::error("TOML parse error: {}", glz::format_error(ec, text));
    return fail(Error::ParseError);
  }
  return ok(std::move(raw));
}

} // namespace domainflow::toml_util
