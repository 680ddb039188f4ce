#pragma once

#include "domainflow/core/error.hpp"

#include <boost/url/parse.hpp>
#include <boost/url/url.hpp>
#include <boost/url/url_view.hpp>

#include <cstdint>
#include <format>
#include <string>
#include <string_view>

namespace domainflow::util {

struct ParsedHttpUrl {
  std::string scheme{"http"};
  std::string host;
  std::uint16_t port{80};
  std::string target{"/"};

  [[nodiscard]] auto is_tls() const noexcept -> bool {
    return scheme == "https";
  }

  [[nodiscard]] auto default_port() const noexcept -> bool {
    return port == (is_tls() ? 443 : 80);
  }

  [[nodiscard]] auto host_header() const -> std::string {
    return default_port() ? host : std::format("{}:{}", host, port);
  }

  [[nodiscard]] auto str() const -> std::string {
    return std::format("{}://{}{}", scheme, host_header(), target);
  }
};

/// Parses an absolute http(s) URL; a bare host name is taken as https.
[[nodiscard]] inline auto parse_http_url(std::string_view url)
    -> Result<ParsedHttpUrl> {
  std::string normalized;
  if (url.find("://") == std::string_view::npos) {
    normalized = "https://";
    normalized.append(url);
    url = normalized;
  }

  auto parsed = boost::urls::parse_uri(url);
  if (!parsed) {
    return fail(Error::InvalidUrl);
  }
  const auto &uri = *parsed;

  ParsedHttpUrl out;
  out.scheme = std::string(uri.scheme());
  if (out.scheme != "http" && out.scheme != "https") {
    return fail(Error::InvalidUrl);
  }
  out.host = std::string(uri.encoded_host());
  if (out.host.empty()) {
    return fail(Error::InvalidUrl);
  }
  out.port = out.is_tls() ? 443 : 80;
  if (uri.has_port()) {
    auto port = uri.port_number();
    if (port == 0) {
      return fail(Error::InvalidUrl);
    }
    out.port = port;
  }

  auto target = std::string(uri.encoded_path());
  if (target.empty()) {
    target = "/";
  }
  if (uri.has_query()) {
    target.push_back('?');
    auto query = uri.encoded_query();
    target.append(query.data(), query.size());
  }
  out.target = std::move(target);
  return out;
}

/// Resolves a Location header value against the URL that produced it.
[[nodiscard]] inline auto resolve_redirect(const ParsedHttpUrl &base,
                                           std::string_view location)
    -> Result<ParsedHttpUrl> {
  auto ref = boost::urls::parse_uri_reference(location);
  if (!ref) {
    return fail(Error::InvalidUrl);
  }
  auto base_str = base.str();
  auto base_view = boost::urls::parse_uri(base_str);
  if (!base_view) {
    return fail(Error::InvalidUrl);
  }
  boost::urls::url dest;
  if (auto rv = boost::urls::resolve(*base_view, *ref, dest); !rv) {
    return fail(Error::InvalidUrl);
  }
  return parse_http_url(dest.buffer());
}

} // namespace domainflow::util
