#include "domainflow/validation/dns_message.hpp"

#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/address_v6.hpp>

#include <algorithm>
#include <tuple>
#include <utility>

namespace domainflow::dns {

namespace {

constexpr std::uint16_t kClassIn = 1;
constexpr std::uint16_t kFlagRecursionDesired = 0x0100;
constexpr std::uint16_t kFlagResponse = 0x8000;
constexpr std::uint16_t kFlagTruncated = 0x0200;
constexpr std::size_t kMaxLabel = 63;
constexpr std::size_t kMaxName = 253;

auto put_u16(std::vector<std::uint8_t> &out, std::uint16_t v) -> void {
  out.push_back(static_cast<std::uint8_t>(v >> 8));
  out.push_back(static_cast<std::uint8_t>(v & 0xFF));
}

class Reader {
public:
  explicit Reader(std::span<const std::uint8_t> data) : data_(data) {}

  [[nodiscard]] auto u16(std::uint16_t &out) -> bool {
    if (pos_ + 2 > data_.size()) {
      return false;
    }
    out = static_cast<std::uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
    pos_ += 2;
    return true;
  }

  [[nodiscard]] auto skip(std::size_t n) -> bool {
    if (pos_ + n > data_.size()) {
      return false;
    }
    pos_ += n;
    return true;
  }

  // A name ends at a zero label or at the first compression pointer.
  [[nodiscard]] auto skip_name() -> bool {
    while (pos_ < data_.size()) {
      const auto len = data_[pos_];
      if ((len & 0xC0) == 0xC0) {
        return skip(2);
      }
      if ((len & 0xC0) != 0) {
        return false;
      }
      ++pos_;
      if (len == 0) {
        return true;
      }
      if (!skip(len)) {
        return false;
      }
    }
    return false;
  }

  [[nodiscard]] auto bytes(std::size_t n) const
      -> std::span<const std::uint8_t> {
    return data_.subspan(pos_, std::min(n, data_.size() - pos_));
  }

private:
  std::span<const std::uint8_t> data_;
  std::size_t pos_{0};
};

auto format_address(RecordType type, std::span<const std::uint8_t> rdata)
    -> std::string {
  if (type == RecordType::A) {
    boost::asio::ip::address_v4::bytes_type b{};
    std::ranges::copy(rdata, b.begin());
    return boost::asio::ip::address_v4(b).to_string();
  }
  boost::asio::ip::address_v6::bytes_type b{};
  std::ranges::copy(rdata, b.begin());
  return boost::asio::ip::address_v6(b).to_string();
}

} // namespace

auto encode_query(std::uint16_t id, std::string_view name, RecordType type)
    -> Result<std::vector<std::uint8_t>> {
  if (name.ends_with('.')) {
    name.remove_suffix(1);
  }
  if (name.empty() || name.size() > kMaxName) {
    return fail(Error::InvalidArgument);
  }

  std::vector<std::uint8_t> out;
  out.reserve(kHeaderSize + name.size() + 6);
  put_u16(out, id);
  put_u16(out, kFlagRecursionDesired);
  put_u16(out, 1); // qdcount
  put_u16(out, 0);
  put_u16(out, 0);
  put_u16(out, 0);

  std::size_t start = 0;
  while (start <= name.size()) {
    auto dot = name.find('.', start);
    if (dot == std::string_view::npos) {
      dot = name.size();
    }
    const auto label = name.substr(start, dot - start);
    if (label.empty() || label.size() > kMaxLabel) {
      return fail(Error::InvalidArgument);
    }
    out.push_back(static_cast<std::uint8_t>(label.size()));
    out.insert(out.end(), label.begin(), label.end());
    start = dot + 1;
  }
  out.push_back(0);
  put_u16(out, std::to_underlying(type));
  put_u16(out, kClassIn);
  return out;
}

auto decode_response(std::span<const std::uint8_t> packet, std::uint16_t id,
                     RecordType type) -> Result<Response> {
  Reader r(packet);
  std::uint16_t rid = 0;
  std::uint16_t flags = 0;
  std::uint16_t qdcount = 0;
  std::uint16_t ancount = 0;
  std::uint16_t nscount = 0;
  std::uint16_t arcount = 0;
  if (!r.u16(rid) || !r.u16(flags) || !r.u16(qdcount) || !r.u16(ancount) ||
      !r.u16(nscount) || !r.u16(arcount)) {
    return fail(Error::ProtocolError);
  }
  if (rid != id || (flags & kFlagResponse) == 0) {
    return fail(Error::ProtocolError);
  }

  Response resp;
  resp.id = rid;
  resp.rcode = static_cast<Rcode>(flags & 0x000F);
  resp.truncated = (flags & kFlagTruncated) != 0;

  for (std::uint16_t i = 0; i < qdcount; ++i) {
    if (!r.skip_name() || !r.skip(4)) {
      return fail(Error::ProtocolError);
    }
  }

  const std::size_t want = type == RecordType::A ? 4 : 16;
  for (std::uint16_t i = 0; i < ancount; ++i) {
    std::uint16_t rtype = 0;
    std::uint16_t rclass = 0;
    std::uint16_t rdlength = 0;
    if (!r.skip_name() || !r.u16(rtype) || !r.u16(rclass) || !r.skip(4) ||
        !r.u16(rdlength)) {
      return fail(Error::ProtocolError);
    }
    auto rdata = r.bytes(rdlength);
    if (rdata.size() != rdlength) {
      return fail(Error::ProtocolError);
    }
    std::ignore = r.skip(rdlength);
    // CNAME chains resolve to the address records that follow them.
    if (rtype == std::to_underlying(type) && rclass == kClassIn &&
        rdlength == want) {
      resp.addresses.push_back(format_address(type, rdata));
    }
  }
  return resp;
}

} // namespace domainflow::dns
