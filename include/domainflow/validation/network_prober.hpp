#pragma once

#include "domainflow/pool/health_prober.hpp"
#include "domainflow/validation/checkers.hpp"

#include <chrono>
#include <string>

namespace domainflow {

/// Probes over the network: a DNS persona must resolve a known name through
/// its own resolvers, a proxy must accept a TCP connection. HTTP personas
/// have no endpoint of their own and always pass.
class NetworkProber final : public ResourceProber {
public:
  NetworkProber(DnsChecker &dns, std::string probe_name,
                std::chrono::milliseconds timeout = std::chrono::seconds(5));

  auto probe_persona(const Persona &persona) -> task<bool> override;
  auto probe_proxy(const Proxy &proxy) -> task<bool> override;

private:
  DnsChecker &dns_;
  std::string probe_name_;
  std::chrono::milliseconds timeout_;
};

} // namespace domainflow
