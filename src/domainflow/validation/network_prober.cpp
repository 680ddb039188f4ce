#include "domainflow/validation/network_prober.hpp"

#include "domainflow/core/asio_awaitable.hpp"
#include "domainflow/util/log.hpp"

#include <boost/asio/cancel_after.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <string>
#include <variant>

namespace domainflow {

namespace net = boost::asio;
using tcp = net::ip::tcp;

NetworkProber::NetworkProber(DnsChecker &dns, std::string probe_name,
                             std::chrono::milliseconds timeout)
    : dns_(dns), probe_name_(std::move(probe_name)), timeout_(timeout) {}

auto NetworkProber::probe_persona(const Persona &persona) -> task<bool> {
  const auto *cfg = std::get_if<DnsPersonaConfig>(&persona.config);
  if (cfg == nullptr) {
    co_return true;
  }
  auto check = co_await dns_.resolve(*cfg, probe_name_, timeout_);
  if (!check) {
    log::debug("Probe of persona {} failed: {}", persona.id,
               check.error().message());
    co_return false;
  }
  co_return check->status == DnsStatus::Resolved;
}

auto NetworkProber::probe_proxy(const Proxy &proxy) -> task<bool> {
  auto executor = co_await net::this_coro::executor;
  tcp::resolver resolver(executor);
  auto endpoints = as_result(co_await resolver.async_resolve(
      proxy.host, std::to_string(proxy.port),
      net::cancel_after(timeout_, use_nothrow)));
  if (!endpoints) {
    log::debug("Probe of proxy {} failed to resolve {}: {}", proxy.id,
               proxy.host, endpoints.error().message());
    co_return false;
  }
  tcp::socket socket(executor);
  auto connected = as_result(co_await net::async_connect(
      socket, *endpoints, net::cancel_after(timeout_, use_nothrow)));
  if (!connected) {
    log::debug("Probe of proxy {} failed to connect: {}", proxy.id,
               connected.error().message());
    co_return false;
  }
  co_return true;
}

} // namespace domainflow
