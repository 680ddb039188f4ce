#pragma once

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace domainflow {

// Transparent string hash for heterogeneous lookup
struct StringHash {
  using is_transparent = void;
  using is_avalanching = void;

  [[nodiscard]] auto operator()(std::string_view sv) const noexcept
      -> std::uint64_t {
    return ankerl::unordered_dense::hash<std::string_view>{}(sv);
  }
};

using StringEqual = std::equal_to<>;

template <typename V>
using StringMap =
    ankerl::unordered_dense::map<std::string, V, StringHash, StringEqual>;

} // namespace domainflow
