#include "domainflow/validation/dns_message.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace domainflow;
using namespace domainflow::dns;

namespace {

auto put16(std::vector<std::uint8_t> &out, std::uint16_t v) -> void {
  out.push_back(static_cast<std::uint8_t>(v >> 8));
  out.push_back(static_cast<std::uint8_t>(v & 0xFF));
}

// Response to `query` with the question echoed and the given answers, each
// using a compression pointer to the question name.
auto make_response(std::vector<std::uint8_t> query, std::uint16_t flags,
                   const std::vector<std::pair<std::uint16_t,
                                               std::vector<std::uint8_t>>>
                       &answers) -> std::vector<std::uint8_t> {
  std::vector<std::uint8_t> out = std::move(query);
  out[2] = static_cast<std::uint8_t>(flags >> 8);
  out[3] = static_cast<std::uint8_t>(flags & 0xFF);
  out[6] = 0;
  out[7] = static_cast<std::uint8_t>(answers.size());
  for (const auto &[type, rdata] : answers) {
    out.push_back(0xC0);
    out.push_back(0x0C);
    put16(out, type);
    put16(out, 1); // IN
    put16(out, 0);
    put16(out, 300); // ttl
    put16(out, static_cast<std::uint16_t>(rdata.size()));
    out.insert(out.end(), rdata.begin(), rdata.end());
  }
  return out;
}

constexpr std::uint16_t kOkFlags = 0x8180;

} // namespace

TEST(DnsMessageTest, EncodesQuestion) {
  auto q = encode_query(0x1234, "shop.com.", RecordType::A);
  ASSERT_TRUE(q.has_value());
  ASSERT_EQ(q->size(), kHeaderSize + 10 + 4);
  EXPECT_EQ((*q)[0], 0x12);
  EXPECT_EQ((*q)[1], 0x34);
  EXPECT_EQ((*q)[5], 1); // qdcount
  EXPECT_EQ((*q)[12], 4);
  EXPECT_EQ(std::string(q->begin() + 13, q->begin() + 17), "shop");
  EXPECT_EQ((*q)[17], 3);
  EXPECT_EQ((*q)[21], 0);
  EXPECT_EQ((*q)[23], 1); // qtype A
}

TEST(DnsMessageTest, RejectsMalformedNames) {
  EXPECT_FALSE(encode_query(1, "", RecordType::A).has_value());
  EXPECT_FALSE(encode_query(1, "a..com", RecordType::A).has_value());
  EXPECT_FALSE(
      encode_query(1, std::string(64, 'a') + ".com", RecordType::A)
          .has_value());
  EXPECT_FALSE(
      encode_query(1, std::string(254, 'a'), RecordType::A).has_value());
}

TEST(DnsMessageTest, DecodesAddressesSkippingCname) {
  auto q = encode_query(7, "shop.com", RecordType::A).value();
  auto packet = make_response(q, kOkFlags,
                              {{5, {3, 'w', 'w', 'w', 0xC0, 0x0C}},
                               {1, {93, 184, 216, 34}},
                               {1, {10, 0, 0, 1}}});
  auto resp = decode_response(packet, 7, RecordType::A);
  ASSERT_TRUE(resp.has_value());
  EXPECT_EQ(resp->rcode, Rcode::NoError);
  EXPECT_EQ(resp->addresses,
            (std::vector<std::string>{"93.184.216.34", "10.0.0.1"}));
}

TEST(DnsMessageTest, DecodesAaaa) {
  auto q = encode_query(9, "shop.com", RecordType::Aaaa).value();
  std::vector<std::uint8_t> v6(16, 0);
  v6[0] = 0x20;
  v6[1] = 0x01;
  v6[2] = 0x0d;
  v6[3] = 0xb8;
  v6[15] = 1;
  auto packet = make_response(q, kOkFlags, {{28, v6}});
  auto resp = decode_response(packet, 9, RecordType::Aaaa);
  ASSERT_TRUE(resp.has_value());
  ASSERT_EQ(resp->addresses.size(), 1U);
  EXPECT_EQ(resp->addresses.front(), "2001:db8::1");
}

TEST(DnsMessageTest, ReportsRcode) {
  auto q = encode_query(3, "missing.com", RecordType::A).value();
  auto packet = make_response(q, 0x8183, {});
  auto resp = decode_response(packet, 3, RecordType::A);
  ASSERT_TRUE(resp.has_value());
  EXPECT_EQ(resp->rcode, Rcode::NxDomain);
  EXPECT_TRUE(resp->addresses.empty());
}

TEST(DnsMessageTest, RejectsMismatchedOrTruncatedPackets) {
  auto q = encode_query(3, "shop.com", RecordType::A).value();
  auto packet = make_response(q, kOkFlags, {{1, {1, 2, 3, 4}}});

  EXPECT_EQ(decode_response(packet, 4, RecordType::A).error(),
            make_error_code(Error::ProtocolError));
  // The query itself is not a response.
  EXPECT_FALSE(decode_response(q, 3, RecordType::A).has_value());

  packet.resize(packet.size() - 2);
  EXPECT_FALSE(decode_response(packet, 3, RecordType::A).has_value());
  EXPECT_FALSE(decode_response(std::span<const std::uint8_t>(packet.data(), 5),
                               3, RecordType::A)
                   .has_value());
}
