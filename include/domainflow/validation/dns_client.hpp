#pragma once

#include "domainflow/validation/checkers.hpp"
#include "domainflow/validation/dns_message.hpp"

#include <boost/asio/ip/udp.hpp>

#include <atomic>
#include <cstdint>

namespace domainflow {

/// Parses "1.1.1.1", "1.1.1.1:5353", "::1" or "[::1]:5353"; port 53 unless
/// given.
[[nodiscard]] auto parse_resolver_endpoint(std::string_view text)
    -> Result<boost::asio::ip::udp::endpoint>;

/// DnsChecker speaking DNS over UDP to the persona's resolvers, or asking the
/// system resolver when the persona says so (or lists no resolvers).
/// Resolvers are tried in order until one gives an answer.
class DnsClient final : public DnsChecker {
public:
  auto resolve(const DnsPersonaConfig &persona, std::string_view domain,
               std::chrono::milliseconds timeout)
      -> task<Result<DnsCheck>> override;

  /// One UDP exchange with `server`.
  auto query(const boost::asio::ip::udp::endpoint &server,
             std::string_view domain, dns::RecordType type,
             std::chrono::milliseconds timeout) -> task<Result<dns::Response>>;

private:
  auto resolve_system(std::string_view domain, DnsQueryType type,
                      std::chrono::milliseconds timeout)
      -> task<Result<DnsCheck>>;

  std::atomic<std::uint16_t> next_id_{0x2a00};
};

} // namespace domainflow
