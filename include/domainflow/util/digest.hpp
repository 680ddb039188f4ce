#pragma once

#include <string>
#include <string_view>

namespace domainflow::util {

/// Lowercase hex SHA-256 of `data`.
[[nodiscard]] auto sha256_hex(std::string_view data) -> std::string;

} // namespace domainflow::util
