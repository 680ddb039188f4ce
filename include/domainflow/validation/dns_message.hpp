#pragma once

#include "domainflow/core/error.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// Minimal RFC 1035 message codec: one-question A/AAAA queries out, answer
// addresses in. Names in responses are skipped (compression pointers
// included), never decoded.
namespace domainflow::dns {

enum class RecordType : std::uint16_t { A = 1, Cname = 5, Aaaa = 28 };

enum class Rcode : std::uint8_t {
  NoError = 0,
  FormErr = 1,
  ServFail = 2,
  NxDomain = 3,
  NotImp = 4,
  Refused = 5,
};

inline constexpr std::size_t kMaxUdpPayload = 512;
inline constexpr std::size_t kHeaderSize = 12;

struct Response {
  std::uint16_t id{0};
  Rcode rcode{Rcode::NoError};
  bool truncated{false};
  std::vector<std::string> addresses; // textual, records of the asked type
};

/// Error::InvalidArgument for an empty name, a label over 63 bytes or a name
/// over 253 bytes. A trailing dot is accepted.
[[nodiscard]] auto encode_query(std::uint16_t id, std::string_view name,
                                RecordType type)
    -> Result<std::vector<std::uint8_t>>;

/// Error::ProtocolError for anything that is not a well-formed response to
/// query `id`.
[[nodiscard]] auto decode_response(std::span<const std::uint8_t> packet,
                                   std::uint16_t id, RecordType type)
    -> Result<Response>;

} // namespace domainflow::dns
