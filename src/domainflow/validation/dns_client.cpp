#include "domainflow/validation/dns_client.hpp"

#include "domainflow/core/asio_awaitable.hpp"
#include "domainflow/util/log.hpp"

#include <boost/asio/cancel_after.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/lexical_cast.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <string>

namespace domainflow {

namespace {

constexpr std::uint16_t kDnsPort = 53;

auto record_type(DnsQueryType type) -> dns::RecordType {
  return type == DnsQueryType::Aaaa ? dns::RecordType::Aaaa
                                    : dns::RecordType::A;
}

} // namespace

auto parse_resolver_endpoint(std::string_view text)
    -> Result<boost::asio::ip::udp::endpoint> {
  std::string_view host = text;
  std::uint16_t port = kDnsPort;

  if (text.starts_with('[')) {
    auto close = text.find(']');
    if (close == std::string_view::npos) {
      return fail(Error::InvalidConfig);
    }
    host = text.substr(1, close - 1);
    auto rest = text.substr(close + 1);
    if (!rest.empty()) {
      if (!rest.starts_with(':')) {
        return fail(Error::InvalidConfig);
      }
      if (!boost::conversion::try_lexical_convert(std::string(rest.substr(1)),
                                                  port)) {
        return fail(Error::InvalidConfig);
      }
    }
  } else if (std::ranges::count(text, ':') == 1) {
    auto colon = text.find(':');
    host = text.substr(0, colon);
    if (!boost::conversion::try_lexical_convert(
            std::string(text.substr(colon + 1)), port)) {
      return fail(Error::InvalidConfig);
    }
  }

  boost::system::error_code ec;
  auto addr = boost::asio::ip::make_address(host, ec);
  if (ec || port == 0) {
    return fail(Error::InvalidConfig);
  }
  return boost::asio::ip::udp::endpoint(addr, port);
}

auto DnsClient::query(const boost::asio::ip::udp::endpoint &server,
                      std::string_view domain, dns::RecordType type,
                      std::chrono::milliseconds timeout)
    -> task<Result<dns::Response>> {
  const auto id = next_id_.fetch_add(1, std::memory_order_relaxed);
  auto packet = dns::encode_query(id, domain, type);
  if (!packet) {
    co_return fail(packet.error());
  }

  auto executor = co_await boost::asio::this_coro::executor;
  boost::asio::ip::udp::socket socket(executor);
  boost::system::error_code ec;
  socket.open(server.protocol(), ec);
  if (ec) {
    log::debug("DNS socket open failed: {}", ec.message());
    co_return fail(Error::Transport);
  }

  auto [send_ec, sent] = co_await socket.async_send_to(
      boost::asio::buffer(*packet), server,
      boost::asio::cancel_after(timeout, use_nothrow));
  (void)sent;
  if (send_ec) {
    co_return fail(classify_io_error(send_ec));
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::array<std::uint8_t, dns::kMaxUdpPayload> buf{};
  while (true) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0) {
      co_return fail(Error::Timeout);
    }
    boost::asio::ip::udp::endpoint from;
    auto [recv_ec, n] = co_await socket.async_receive_from(
        boost::asio::buffer(buf), from,
        boost::asio::cancel_after(left, use_nothrow));
    if (recv_ec) {
      co_return fail(classify_io_error(recv_ec));
    }
    if (from != server) {
      continue;
    }
    auto resp = dns::decode_response(std::span(buf.data(), n), id, type);
    if (!resp) {
      // Stray or late datagram for an earlier query id.
      log::trace("Ignoring DNS datagram from {}: {}",
                 server.address().to_string(), resp.error().message());
      continue;
    }
    co_return resp;
  }
}

auto DnsClient::resolve(const DnsPersonaConfig &persona,
                        std::string_view domain,
                        std::chrono::milliseconds timeout)
    -> task<Result<DnsCheck>> {
  if (persona.query_timeout_seconds > 0) {
    timeout = std::min(timeout, std::chrono::milliseconds(std::chrono::seconds(
                                    persona.query_timeout_seconds)));
  }
  if (persona.use_system_resolvers || persona.resolvers.empty()) {
    co_return co_await resolve_system(domain, persona.query_type, timeout);
  }

  const auto type = record_type(persona.query_type);
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::error_code last = make_error_code(Error::Transport);
  for (const auto &text : persona.resolvers) {
    auto server = parse_resolver_endpoint(text);
    if (!server) {
      log::warn("Skipping invalid resolver '{}'", text);
      continue;
    }
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0) {
      last = make_error_code(Error::Timeout);
      break;
    }
    auto resp = co_await query(*server, domain, type, left);
    if (!resp) {
      last = resp.error();
      log::debug("Resolver {} failed for {}: {}", text, domain,
                 last.message());
      continue;
    }

    DnsCheck check;
    check.resolver = text;
    switch (resp->rcode) {
    case dns::Rcode::NoError:
      if (resp->addresses.empty() && resp->truncated) {
        last = make_error_code(Error::Transport);
        continue;
      }
      check.status = resp->addresses.empty() ? DnsStatus::Unresolved
                                             : DnsStatus::Resolved;
      check.ips = std::move(resp->addresses);
      co_return check;
    case dns::Rcode::NxDomain:
      check.status = DnsStatus::Unresolved;
      co_return check;
    case dns::Rcode::ServFail:
    case dns::Rcode::Refused:
      // The resolver could not answer; another one may.
      last = make_error_code(Error::Transport);
      continue;
    default:
      check.status = DnsStatus::Error;
      co_return check;
    }
  }
  co_return fail(last);
}

auto DnsClient::resolve_system(std::string_view domain, DnsQueryType type,
                               std::chrono::milliseconds timeout)
    -> task<Result<DnsCheck>> {
  auto executor = co_await boost::asio::this_coro::executor;
  boost::asio::ip::tcp::resolver resolver(executor);
  auto [ec, results] = co_await resolver.async_resolve(
      std::string(domain), "",
      boost::asio::cancel_after(timeout, use_nothrow));

  DnsCheck check;
  check.resolver = "system";
  if (ec == boost::asio::error::host_not_found ||
      ec == boost::asio::error::no_data) {
    check.status = DnsStatus::Unresolved;
    co_return check;
  }
  if (ec) {
    co_return fail(classify_io_error(ec));
  }

  for (const auto &entry : results) {
    const auto addr = entry.endpoint().address();
    if ((type == DnsQueryType::A && addr.is_v4()) ||
        (type == DnsQueryType::Aaaa && addr.is_v6())) {
      auto text = addr.to_string();
      if (std::ranges::find(check.ips, text) == check.ips.end()) {
        check.ips.push_back(std::move(text));
      }
    }
  }
  check.status =
      check.ips.empty() ? DnsStatus::Unresolved : DnsStatus::Resolved;
  co_return check;
}

} // namespace domainflow
