#include "domainflow/validation/dns_client.hpp"

#include "test_utils.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/udp.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <format>
#include <vector>

using namespace domainflow;
using domainflow::test::run_coro;

TEST(DnsClientTest, ParsesResolverEndpoints) {
  EXPECT_EQ(parse_resolver_endpoint("192.0.2.1")->port(), 53);
  EXPECT_EQ(parse_resolver_endpoint("192.0.2.1:5353")->port(), 5353);
  EXPECT_EQ(parse_resolver_endpoint("[::1]:54")->port(), 54);
  EXPECT_FALSE(parse_resolver_endpoint("not-an-ip").has_value());
}

// Resolvers that accept datagrams and never answer.
TEST(DnsClientTest, SilentResolversShareOneTimeout) {
  boost::asio::io_context side;
  const auto loopback = boost::asio::ip::make_address("127.0.0.1");
  std::vector<boost::asio::ip::udp::socket> silent;
  DnsPersonaConfig persona;
  persona.query_timeout_seconds = 0;
  for (int i = 0; i < 3; ++i) {
    silent.emplace_back(side, boost::asio::ip::udp::endpoint(loopback, 0));
    persona.resolvers.push_back(
        std::format("127.0.0.1:{}", silent.back().local_endpoint().port()));
  }

  DnsClient client;
  const auto timeout = std::chrono::milliseconds(400);
  const auto started = std::chrono::steady_clock::now();
  auto check = run_coro(client.resolve(persona, "example.com", timeout));
  const auto elapsed = std::chrono::steady_clock::now() - started;

  ASSERT_FALSE(check.has_value());
  EXPECT_TRUE(is_transport_error(check.error()));
  EXPECT_LT(elapsed, 2 * timeout);
}
