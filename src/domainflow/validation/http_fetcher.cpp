#include "domainflow/validation/http_fetcher.hpp"

#include "domainflow/core/asio_awaitable.hpp"
#include "domainflow/util/log.hpp"
#include "domainflow/util/url.hpp"

#include <boost/asio/cancel_after.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>

#include <openssl/ssl.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <format>
#include <limits>
#include <optional>
#include <string>

namespace domainflow {

namespace {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace beast_http = beast::http;
using tcp = net::ip::tcp;
using Clock = std::chrono::steady_clock;

constexpr std::size_t kHeaderLimit = 64 * 1024;
constexpr std::size_t kReadChunk = 16 * 1024;

struct Deadline {
  Clock::time_point at;

  [[nodiscard]] auto left() const -> std::chrono::milliseconds {
    auto d = std::chrono::duration_cast<std::chrono::milliseconds>(
        at - Clock::now());
    return std::max(d, std::chrono::milliseconds{1});
  }
  [[nodiscard]] auto expired() const -> bool { return Clock::now() >= at; }
};

[[nodiscard]] auto is_redirect(unsigned status) -> bool {
  return status == 301 || status == 302 || status == 303 || status == 307 ||
         status == 308;
}

struct Exchange {
  unsigned status{0};
  std::string location;
  std::string body;
  std::int64_t content_length{0};
};

template <typename Stream>
auto exchange(Stream &stream, const HttpFetchRequest &req,
              const util::ParsedHttpUrl &url, bool absolute_target,
              const Deadline &deadline) -> task<Result<Exchange>> {
  beast_http::request<beast_http::empty_body> msg{
      beast_http::verb::get, absolute_target ? url.str() : url.target, 11};
  msg.set(beast_http::field::host, url.host_header());
  msg.set(beast_http::field::connection, "close");
  msg.set(beast_http::field::accept, "*/*");
  for (const auto &[name, value] : req.headers) {
    msg.set(name, value);
  }

  auto [write_ec, written] = co_await beast_http::async_write(
      stream, msg, net::cancel_after(deadline.left(), use_nothrow));
  (void)written;
  if (write_ec) {
    co_return fail(classify_io_error(write_ec));
  }

  beast::flat_buffer buffer;
  beast_http::response_parser<beast_http::buffer_body> parser;
  parser.header_limit(kHeaderLimit);
  parser.body_limit(std::numeric_limits<std::uint64_t>::max());

  auto [head_ec, head_n] = co_await beast_http::async_read_header(
      stream, buffer, parser, net::cancel_after(deadline.left(), use_nothrow));
  (void)head_n;
  if (head_ec) {
    co_return fail(classify_io_error(head_ec));
  }

  Exchange out;
  out.status = parser.get().result_int();
  if (auto it = parser.get().find(beast_http::field::location);
      it != parser.get().end()) {
    out.location = std::string(it->value());
  }
  if (auto len = parser.content_length()) {
    out.content_length = static_cast<std::int64_t>(*len);
  }
  if (is_redirect(out.status) && req.follow_redirects) {
    co_return out;
  }

  std::array<char, kReadChunk> chunk{};
  std::uint64_t seen = 0;
  while (!parser.is_done() && out.body.size() < req.max_body_bytes) {
    parser.get().body().data = chunk.data();
    parser.get().body().size = chunk.size();
    auto [read_ec, n] = co_await beast_http::async_read_some(
        stream, buffer, parser,
        net::cancel_after(deadline.left(), use_nothrow));
    (void)n;
    if (read_ec == beast_http::error::need_buffer) {
      read_ec = {};
    }
    const auto got = chunk.size() - parser.get().body().size;
    seen += got;
    const auto room = req.max_body_bytes - out.body.size();
    out.body.append(chunk.data(),
                    static_cast<std::size_t>(std::min<std::uint64_t>(got, room)));
    if (read_ec == beast_http::error::end_of_stream ||
        read_ec == net::error::eof ||
        read_ec == net::ssl::error::stream_truncated) {
      break;
    }
    if (read_ec) {
      // Headers arrived; keep what was read rather than failing the check.
      log::debug("Body read from {} stopped early: {}", url.host,
                 read_ec.message());
      break;
    }
  }
  if (out.content_length == 0) {
    out.content_length = static_cast<std::int64_t>(seen);
  }
  co_return out;
}

} // namespace

struct HttpFetcher::Impl {
  HttpConfig config;
  net::ssl::context verify_ctx{net::ssl::context::tls_client};
  net::ssl::context insecure_ctx{net::ssl::context::tls_client};

  explicit Impl(const HttpConfig &cfg) : config(cfg) {
    boost::system::error_code ec;
    verify_ctx.set_default_verify_paths(ec);
    if (ec) {
      log::warn("Could not load default CA paths: {}", ec.message());
    }
    verify_ctx.set_verify_mode(net::ssl::verify_peer, ec);
    insecure_ctx.set_verify_mode(net::ssl::verify_none, ec);
  }

  auto connect(std::string_view host, std::uint16_t port,
               const Deadline &deadline) -> task<Result<tcp::socket>> {
    auto executor = co_await net::this_coro::executor;
    tcp::resolver resolver(executor);
    auto [resolve_ec, endpoints] = co_await resolver.async_resolve(
        std::string(host), std::to_string(port),
        net::cancel_after(deadline.left(), use_nothrow));
    if (resolve_ec) {
      log::debug("Failed to resolve {}:{} - {}", host, port,
                 resolve_ec.message());
      co_return fail(classify_io_error(resolve_ec));
    }

    tcp::socket socket(executor);
    const auto connect_timeout =
        std::min(deadline.left(),
                 std::chrono::milliseconds(config.connect_timeout_ms));
    auto [connect_ec, endpoint] = co_await net::async_connect(
        socket, endpoints, net::cancel_after(connect_timeout, use_nothrow));
    (void)endpoint;
    if (connect_ec) {
      log::debug("Failed to connect to {}:{} - {}", host, port,
                 connect_ec.message());
      co_return fail(classify_io_error(connect_ec));
    }
    co_return socket;
  }

  auto open_tunnel(tcp::socket &socket, const util::ParsedHttpUrl &url,
                   const Deadline &deadline) -> task<Result<void>> {
    const auto authority = std::format("{}:{}", url.host, url.port);
    beast_http::request<beast_http::empty_body> msg{beast_http::verb::connect,
                                                    authority, 11};
    msg.set(beast_http::field::host, authority);
    auto [write_ec, written] = co_await beast_http::async_write(
        socket, msg, net::cancel_after(deadline.left(), use_nothrow));
    (void)written;
    if (write_ec) {
      co_return fail(classify_io_error(write_ec));
    }

    beast::flat_buffer buffer;
    beast_http::response_parser<beast_http::empty_body> parser;
    parser.skip(true);
    auto [read_ec, n] = co_await beast_http::async_read(
        socket, buffer, parser,
        net::cancel_after(deadline.left(), use_nothrow));
    (void)n;
    if (read_ec) {
      co_return fail(classify_io_error(read_ec));
    }
    if (parser.get().result_int() != 200) {
      log::debug("Proxy refused CONNECT {}: {}", authority,
                 parser.get().result_int());
      co_return fail(Error::Transport);
    }
    co_return ok();
  }

  auto fetch_once(const HttpFetchRequest &req, const util::ParsedHttpUrl &url,
                  const Deadline &deadline) -> task<Result<Exchange>> {
    const Proxy *proxy = req.proxy;
    const std::string_view host = proxy != nullptr ? proxy->host : url.host;
    const auto port = proxy != nullptr ? proxy->port : url.port;
    auto socket = co_await connect(host, port, deadline);
    if (!socket) {
      co_return fail(socket.error());
    }

    if (!url.is_tls()) {
      co_return co_await exchange(*socket, req, url, proxy != nullptr,
                                  deadline);
    }

    if (proxy != nullptr) {
      if (auto tunnel = co_await open_tunnel(*socket, url, deadline);
          !tunnel) {
        co_return fail(tunnel.error());
      }
    }

    const bool insecure = req.insecure_tls || config.insecure_skip_verify;
    net::ssl::stream<tcp::socket> stream(std::move(*socket),
                                         insecure ? insecure_ctx : verify_ctx);
    if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
      co_return fail(Error::Transport);
    }
    if (!insecure) {
      stream.set_verify_callback(net::ssl::host_name_verification(url.host));
    }

    auto [hs_ec] = co_await stream.async_handshake(
        net::ssl::stream_base::client,
        net::cancel_after(deadline.left(), use_nothrow));
    if (hs_ec) {
      log::debug("TLS handshake with {} failed: {}", url.host,
                 hs_ec.message());
      co_return fail(classify_io_error(hs_ec));
    }

    auto result = co_await exchange(stream, req, url, false, deadline);
    boost::system::error_code ec;
    stream.lowest_layer().close(ec);
    co_return result;
  }
};

HttpFetcher::HttpFetcher(const HttpConfig &config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpFetcher::~HttpFetcher() = default;

auto HttpFetcher::fetch(const HttpFetchRequest &request)
    -> task<Result<HttpFetchResponse>> {
  auto url = util::parse_http_url(request.url);
  if (!url) {
    co_return fail(url.error());
  }

  const Deadline deadline{Clock::now() + request.timeout};
  HttpFetchResponse out;
  while (true) {
    if (deadline.expired()) {
      co_return fail(Error::Timeout);
    }
    auto ex = co_await impl_->fetch_once(request, *url, deadline);
    if (!ex) {
      co_return fail(ex.error());
    }

    if (request.follow_redirects && is_redirect(ex->status) &&
        !ex->location.empty() && out.redirect_count < request.max_redirects) {
      auto next = util::resolve_redirect(*url, ex->location);
      if (next) {
        log::trace("{} redirected to {}", url->str(), next->str());
        url = std::move(next);
        ++out.redirect_count;
        continue;
      }
      log::debug("Ignoring bad Location '{}' from {}", ex->location,
                 url->str());
    }

    out.status_code = static_cast<std::int32_t>(ex->status);
    out.final_url = url->str();
    out.body = std::move(ex->body);
    out.content_length = ex->content_length;
    co_return out;
  }
}

} // namespace domainflow
