#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace domainflow::util {

// MurmurHash3 64-bit finalizer
[[nodiscard]] inline constexpr auto murmur3_mix64(std::uint64_t h) noexcept
    -> std::uint64_t {
  h ^= h >> 33;
  h *= 0xff51afd7ed558ccdULL;
  h ^= h >> 33;
  h *= 0xc4ceb9fe1a85ec53ULL;
  h ^= h >> 33;
  return h;
}

/// FNV-1a over the bytes followed by a murmur finalizer. Unlike std::hash this
/// is identical across processes and library versions, which matters for
/// sticky assignments that must survive restarts.
[[nodiscard]] inline constexpr auto stable_hash(std::string_view s) noexcept
    -> std::uint64_t {
  std::uint64_t h = 0xcbf29ce484222325ULL;
  for (char c : s) {
    h ^= static_cast<unsigned char>(c);
    h *= 0x100000001b3ULL;
  }
  return murmur3_mix64(h);
}

} // namespace domainflow::util
