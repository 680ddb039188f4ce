#pragma once

#include "domainflow/core/asio_awaitable.hpp"
#include "domainflow/core/coroutine.hpp"
#include "domainflow/model/campaign.hpp"
#include "domainflow/model/resource.hpp"
#include "domainflow/util/id.hpp"
#include "domainflow/validation/checkers.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

namespace domainflow::test {

// Run a coroutine synchronously on a fresh io_context and return its result.
// Throws if the coroutine does not complete within `timeout`.
template <typename T>
[[nodiscard]] inline auto
run_coro(task<T> coro,
         std::chrono::milliseconds timeout = std::chrono::seconds(10)) -> T {
  boost::asio::io_context io;
  std::exception_ptr eptr;
  std::optional<T> result;
  boost::asio::co_spawn(
      io,
      [&]() -> task<void> {
        result = co_await std::move(coro);
        co_return;
      },
      [&](std::exception_ptr e) { eptr = e; });
  io.run_for(timeout);
  if (!result && !eptr)
    throw std::runtime_error("run_coro timed out");
  if (eptr)
    std::rethrow_exception(eptr);
  return std::move(*result);
}

// Specialisation for task<void>
inline auto
run_coro(task<void> coro,
         std::chrono::milliseconds timeout = std::chrono::seconds(10)) -> void {
  boost::asio::io_context io;
  std::exception_ptr eptr;
  bool done = false;
  boost::asio::co_spawn(
      io,
      [&]() -> task<void> {
        co_await std::move(coro);
        done = true;
        co_return;
      },
      [&](std::exception_ptr e) { eptr = e; });
  io.run_for(timeout);
  if (!done && !eptr)
    throw std::runtime_error("run_coro timed out");
  if (eptr)
    std::rethrow_exception(eptr);
}

template <typename Predicate>
[[nodiscard]] inline auto
poll_until(Predicate &&predicate, std::chrono::milliseconds timeout,
           std::chrono::milliseconds interval = std::chrono::milliseconds(10))
    -> bool {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (std::invoke(std::forward<Predicate>(predicate))) {
      return true;
    }
    std::this_thread::sleep_for(interval);
  }
  return std::invoke(std::forward<Predicate>(predicate));
}

[[nodiscard]] inline auto
make_temp_path(std::string_view prefix = "domainflow_test_") -> std::string {
  std::string templ = std::string("/tmp/") + std::string(prefix) + "XXXXXX";
  int fd = ::mkstemp(templ.data());
  if (fd < 0) {
    return "";
  }
  ::close(fd);
  return templ;
}

[[nodiscard]] inline auto env_or_default(const char *key, std::string fallback)
    -> std::string {
  if (const char *v = std::getenv(key); v && *v != '\0') {
    return v;
  }
  return fallback;
}

// --- fixtures -------------------------------------------------------------

[[nodiscard]] inline auto
generation_params(std::string charset = "ab", std::int32_t length = 2,
                  std::int64_t num = 4, std::int32_t batch = 2)
    -> GenerationParams {
  return GenerationParams{.pattern_type = PatternType::Prefix,
                          .variable_length = length,
                          .character_set = std::move(charset),
                          .constant_string = "shop",
                          .tld = "com",
                          .num_domains_to_generate = num,
                          .batch_size = batch};
}

[[nodiscard]] inline auto dns_persona(std::string id) -> Persona {
  return Persona{.id = PersonaId{std::move(id)},
                 .name = "dns persona",
                 .enabled = true,
                 .config = DnsPersonaConfig{.resolvers = {"127.0.0.1:53"}},
                 .health = {}};
}

[[nodiscard]] inline auto http_persona(std::string id) -> Persona {
  return Persona{.id = PersonaId{std::move(id)},
                 .name = "http persona",
                 .enabled = true,
                 .config = HttpPersonaConfig{.user_agent = "test-agent/1.0"},
                 .health = {}};
}

[[nodiscard]] inline auto dns_settings(CampaignId source,
                                       std::vector<PersonaId> personas)
    -> ValidationSettings {
  return ValidationSettings{.source_campaign_id = std::move(source),
                            .source_type = CampaignType::DomainGeneration,
                            .persona_ids = std::move(personas),
                            .batch_size = 10,
                            .retry_attempts = 1,
                            .parallel_workers = 2,
                            .request_timeout_seconds = 2};
}

[[nodiscard]] inline auto make_campaign(CampaignParams params,
                                        CampaignStatus status =
                                            CampaignStatus::Running)
    -> Campaign {
  Campaign c;
  c.id = generate_id<CampaignId>();
  c.name = "test campaign";
  c.type = params_type(params);
  c.status = status;
  c.params = std::move(params);
  return c;
}

// Scripted DNS answers keyed by domain. Unknown domains are unresolved;
// domains in `failing` return a transport error.
class FakeDnsChecker final : public DnsChecker {
public:
  auto resolve(const DnsPersonaConfig & /*persona*/, std::string_view domain,
               std::chrono::milliseconds /*timeout*/)
      -> task<Result<DnsCheck>> override {
    calls.fetch_add(1);
    std::string key(domain);
    {
      std::lock_guard lock(mu);
      if (failing.contains(key)) {
        co_return fail(Error::Transport);
      }
      if (auto it = resolved.find(key); it != resolved.end()) {
        co_return DnsCheck{.status = DnsStatus::Resolved,
                           .ips = {it->second},
                           .resolver = "fake"};
      }
    }
    co_return DnsCheck{.status = DnsStatus::Unresolved,
                       .ips = {},
                       .resolver = "fake"};
  }

  std::mutex mu;
  std::map<std::string, std::string, std::less<>> resolved;
  std::map<std::string, bool, std::less<>> failing;
  std::atomic<int> calls{0};
};

// Scripted HTTP responses keyed by URL; unknown URLs fail at transport level.
class FakeHttpChecker final : public HttpChecker {
public:
  auto fetch(const HttpFetchRequest &request)
      -> task<Result<HttpFetchResponse>> override {
    calls.fetch_add(1);
    if (delay.count() > 0) {
      co_await async_sleep(delay);
    }
    std::lock_guard lock(mu);
    last_request = request.url;
    timeouts.push_back(request.timeout);
    if (auto it = pages.find(request.url); it != pages.end()) {
      auto response = it->second;
      response.final_url = request.url;
      co_return response;
    }
    co_return fail(Error::Transport);
  }

  auto add_page(std::string url, std::int32_t status, std::string body)
      -> void {
    std::lock_guard lock(mu);
    auto length = static_cast<std::int64_t>(body.size());
    pages[std::move(url)] = HttpFetchResponse{.status_code = status,
                                              .final_url = {},
                                              .redirect_count = 0,
                                              .body = std::move(body),
                                              .content_length = length};
  }

  std::mutex mu;
  std::map<std::string, HttpFetchResponse, std::less<>> pages;
  std::string last_request;
  std::vector<std::chrono::milliseconds> timeouts;
  std::chrono::milliseconds delay{0};
  std::atomic<int> calls{0};
};

} // namespace domainflow::test
