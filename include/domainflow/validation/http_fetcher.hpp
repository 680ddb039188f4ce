#pragma once

#include "domainflow/config/system_config.hpp"
#include "domainflow/validation/checkers.hpp"

#include <memory>

namespace domainflow {

/// HttpChecker over Boost.Beast: plain or TLS connections, optional HTTP
/// proxy (absolute-form requests for http, CONNECT tunnels for https),
/// redirect following and a capped body read.
class HttpFetcher final : public HttpChecker {
public:
  explicit HttpFetcher(const HttpConfig &config);
  ~HttpFetcher() override;

  HttpFetcher(const HttpFetcher &) = delete;
  auto operator=(const HttpFetcher &) -> HttpFetcher & = delete;

  auto fetch(const HttpFetchRequest &request)
      -> task<Result<HttpFetchResponse>> override;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace domainflow
