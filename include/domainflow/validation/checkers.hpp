#pragma once

#include "domainflow/core/coroutine.hpp"
#include "domainflow/core/error.hpp"
#include "domainflow/model/campaign.hpp"
#include "domainflow/model/resource.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace domainflow {

/// Business outcome of one DNS lookup that completed at the transport level.
struct DnsCheck {
  DnsStatus status{DnsStatus::Unresolved};
  std::vector<std::string> ips;
  std::string resolver;
};

/// Resolves a domain the way a persona is configured to. Transport failures
/// and timeouts are returned as Error::Transport / Error::Timeout; NXDOMAIN
/// and empty answers are a successful DnsCheck with status unresolved.
class DnsChecker {
public:
  virtual ~DnsChecker() = default;
  virtual auto resolve(const DnsPersonaConfig &persona, std::string_view domain,
                       std::chrono::milliseconds timeout)
      -> task<Result<DnsCheck>> = 0;
};

struct HttpFetchRequest {
  std::string url;
  std::map<std::string, std::string> headers; // User-Agent included
  const Proxy *proxy{nullptr};
  bool follow_redirects{true};
  std::int32_t max_redirects{5};
  std::uint64_t max_body_bytes{5ULL * 1024 * 1024};
  bool insecure_tls{false};
  std::chrono::milliseconds timeout{30000};
};

struct HttpFetchResponse {
  std::int32_t status_code{0};
  std::string final_url;
  std::int32_t redirect_count{0};
  std::string body; // at most max_body_bytes
  std::int64_t content_length{0};
};

/// Fetches one URL. Any response, whatever its status code, is a success;
/// connection, TLS and timeout failures are transport errors.
class HttpChecker {
public:
  virtual ~HttpChecker() = default;
  virtual auto fetch(const HttpFetchRequest &request)
      -> task<Result<HttpFetchResponse>> = 0;
};

} // namespace domainflow
