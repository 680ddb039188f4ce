#include "domainflow/validation/validation_pipeline.hpp"

#include "domainflow/core/asio_awaitable.hpp"
#include "domainflow/model/campaign_state.hpp"
#include "domainflow/scheduler/admission.hpp"
#include "domainflow/util/log.hpp"
#include "domainflow/validation/http_validator.hpp"

#include <boost/asio/deferred.hpp>
#include <boost/asio/experimental/parallel_group.hpp>

#include <algorithm>
#include <chrono>
#include <exception>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace domainflow {

namespace {

namespace net = boost::asio;

[[nodiscard]] auto system_status_of(std::error_code ec) -> SystemStatus {
  return ec == make_error_code(Error::Timeout) ? SystemStatus::Timeout
                                               : SystemStatus::TransportError;
}

[[nodiscard]] auto elapsed_ms(std::chrono::steady_clock::time_point since)
    -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - since)
      .count();
}

auto pace(Pacer &pacer) -> task<void> {
  auto wait = pacer.reserve(std::chrono::steady_clock::now());
  if (wait > std::chrono::steady_clock::duration::zero()) {
    co_await async_sleep(wait);
  }
}

/// Runs `check` over every candidate on up to `lanes` coroutines of the
/// calling executor. Rows come back in candidate order. The first error stops
/// all lanes at their next candidate and is returned.
template <typename Row, typename Check>
auto run_lanes(std::span<const SourceCandidate> candidates,
               std::int32_t lanes, Check &check)
    -> task<Result<std::vector<Row>>> {
  std::vector<std::optional<Row>> slots(candidates.size());
  std::size_t next = 0;
  std::error_code first_error;

  // All lanes run on this executor's single thread; the shared cursor needs
  // no synchronisation.
  auto lane = [&]() -> task<void> {
    while (!first_error && next < candidates.size()) {
      const auto idx = next++;
      auto row = co_await check(candidates[idx]);
      if (!row) {
        if (!first_error) {
          first_error = row.error();
        }
        co_return;
      }
      slots[idx] = std::move(*row);
    }
  };

  auto executor = co_await net::this_coro::executor;
  using LaneOp = decltype(net::co_spawn(executor, lane(), net::deferred));
  std::vector<LaneOp> ops;
  const auto n = std::min<std::size_t>(static_cast<std::size_t>(lanes),
                                       candidates.size());
  ops.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    ops.push_back(net::co_spawn(executor, lane(), net::deferred));
  }

  auto [order, exceptions] =
      co_await net::experimental::make_parallel_group(std::move(ops))
          .async_wait(net::experimental::wait_for_all(), net::use_awaitable);
  (void)order;
  for (const auto &ex : exceptions) {
    if (!ex) {
      continue;
    }
    try {
      std::rethrow_exception(ex);
    } catch (const std::exception &e) {
      log::error("Validation lane failed: {}", e.what());
      first_error = make_error_code(Error::Unknown);
    }
  }
  if (first_error) {
    co_return fail(first_error);
  }

  std::vector<Row> rows;
  rows.reserve(slots.size());
  for (auto &slot : slots) {
    rows.push_back(std::move(*slot));
  }
  co_return rows;
}

} // namespace

Pacer::Pacer(std::int32_t per_minute) {
  if (per_minute > 0) {
    interval_ = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::minutes(1)) /
                per_minute;
  }
}

auto Pacer::reserve(std::chrono::steady_clock::time_point now)
    -> std::chrono::steady_clock::duration {
  if (interval_ == std::chrono::steady_clock::duration::zero()) {
    return {};
  }
  std::scoped_lock lock(mu_);
  const auto slot = std::max(now, next_);
  next_ = slot + interval_;
  return slot - now;
}

ValidationPipeline::ValidationPipeline(storage::CampaignStore &store,
                                       ResourcePoolManager &pools,
                                       DnsChecker &dns, HttpChecker &http,
                                       HttpConfig config)
    : store_(store), pools_(pools), dns_(dns), http_(http),
      config_(std::move(config)) {}

auto ValidationPipeline::handles(CampaignType type) const -> bool {
  return type == CampaignType::DnsValidation ||
         type == CampaignType::HttpKeywordValidation;
}

auto ValidationPipeline::state_for(const Campaign &campaign)
    -> task<Result<CampaignState>> {
  {
    std::scoped_lock lock(mu_);
    if (auto it = states_.find(campaign.id); it != states_.end()) {
      co_return it->second;
    }
  }

  const auto *settings = validation_settings(campaign.params);
  CampaignState state{
      .pacer = std::make_shared<Pacer>(settings->processing_speed_per_minute),
      .matcher = nullptr};

  if (const auto *http = std::get_if<HttpValidationParams>(&campaign.params)) {
    std::vector<KeywordSet> sets;
    if (!http->keyword_set_ids.empty()) {
      auto loaded = co_await store_.get_keyword_sets(http->keyword_set_ids);
      if (!loaded) {
        co_return fail(loaded.error());
      }
      sets = std::move(*loaded);
    }
    state.matcher =
        std::make_shared<KeywordMatcher>(sets, http->ad_hoc_keywords);
    if (state.matcher->skipped_rules() > 0) {
      log::info("campaign {}: {} keyword rule(s) skipped", campaign.id,
                state.matcher->skipped_rules());
    }
  }

  std::scoped_lock lock(mu_);
  co_return states_.try_emplace(campaign.id, std::move(state)).first->second;
}

auto ValidationPipeline::finish(const CampaignId &id) -> void {
  pools_.release(id);
  std::scoped_lock lock(mu_);
  states_.erase(id);
}

auto ValidationPipeline::run_batch(const Campaign &campaign)
    -> task<Result<BatchOutcome>> {
  const auto *settings = validation_settings(campaign.params);
  if (settings == nullptr) {
    co_return fail(Error::InvalidConfig);
  }

  auto source = co_await store_.get_campaign(settings->source_campaign_id);
  if (!source) {
    co_return fail(source.error() == make_error_code(Error::NotFound)
                       ? make_error_code(Error::InvalidConfig)
                       : source.error());
  }
  if (auto linked = admission::check_link(campaign, *source); !linked) {
    co_return fail(linked.error());
  }

  auto res = co_await pools_.acquire(campaign);
  if (!res) {
    co_return fail(res.error());
  }
  auto state = co_await state_for(campaign);
  if (!state) {
    co_return fail(state.error());
  }

  const auto batch = std::max(1, settings->batch_size);
  auto candidates = co_await store_.list_source_candidates(
      source->id, source->type, campaign.source_cursor, batch);
  if (!candidates) {
    co_return fail(candidates.error());
  }

  BatchOutcome outcome{.processed = 0,
                       .done = false,
                       .waiting_for_source = false,
                       .counters = campaign.counters};
  const bool source_final = is_terminal(source->status);

  if (candidates->empty()) {
    if (!source_final) {
      outcome.waiting_for_source = true;
      co_return outcome;
    }
    auto counters = co_await store_.set_campaign_total(
        campaign.id, campaign.counters.processed_items);
    if (!counters) {
      co_return fail(counters.error());
    }
    outcome.counters = *counters;
    outcome.done = true;
    co_return outcome;
  }

  // The total follows the predecessor as it grows.
  auto eligible =
      co_await store_.count_source_candidates(source->id, source->type);
  if (!eligible) {
    co_return fail(eligible.error());
  }
  if (auto grown = co_await store_.set_campaign_total(campaign.id, *eligible);
      !grown) {
    co_return fail(grown.error());
  }

  const auto lanes = std::clamp(settings->parallel_workers, 1, kMaxLanes);
  const auto cursor = candidates->back().seq;
  Result<CampaignCounters> counters = fail(Error::Unknown);

  if (campaign.type == CampaignType::DnsValidation) {
    auto check = [&](const SourceCandidate &c) {
      return check_dns(campaign, **res, *state->pacer, c);
    };
    auto rows = co_await run_lanes<DnsResult>(*candidates, lanes, check);
    if (!rows) {
      co_return fail(rows.error());
    }
    counters = co_await store_.commit_dns_results(campaign.id, *rows, cursor);
  } else {
    auto check = [&](const SourceCandidate &c) {
      return check_http(campaign, **res, *state->pacer, *state->matcher, c);
    };
    auto rows = co_await run_lanes<HttpResult>(*candidates, lanes, check);
    if (!rows) {
      co_return fail(rows.error());
    }
    counters = co_await store_.commit_http_results(campaign.id, *rows, cursor);
  }
  if (!counters) {
    co_return fail(counters.error());
  }

  outcome.processed = static_cast<std::int64_t>(candidates->size());
  outcome.counters = *counters;

  if (source_final && std::cmp_less(candidates->size(), batch)) {
    auto closed = co_await store_.set_campaign_total(
        campaign.id, outcome.counters.processed_items);
    if (!closed) {
      co_return fail(closed.error());
    }
    outcome.counters = *closed;
    outcome.done = true;
  }
  co_return outcome;
}

auto ValidationPipeline::check_dns(const Campaign &campaign,
                                   const CampaignResources &res, Pacer &pacer,
                                   const SourceCandidate &candidate)
    -> task<Result<DnsResult>> {
  const auto &params = std::get<DnsValidationParams>(campaign.params);
  const auto timeout = std::chrono::milliseconds(std::chrono::seconds(
      std::max(1, params.settings.request_timeout_seconds)));
  const auto max_attempts = 1 + std::max(0, params.settings.retry_attempts);
  const auto started = std::chrono::steady_clock::now();

  DnsResult r;
  r.campaign_id = campaign.id;
  r.domain_name = candidate.domain_name;
  r.source_seq = candidate.seq;
  r.status = DnsStatus::Error;

  std::string previous;
  for (std::int32_t attempt = 1; attempt <= max_attempts; ++attempt) {
    co_await pace(pacer);
    auto persona_id = res.persona_pool->select(candidate.domain_name, previous,
                                               util::Clock::now());
    if (!persona_id) {
      co_return fail(persona_id.error());
    }
    const auto *persona = res.persona(*persona_id);
    const auto *cfg = persona != nullptr
                          ? std::get_if<DnsPersonaConfig>(&persona->config)
                          : nullptr;
    if (cfg == nullptr) {
      co_return fail(Error::InvalidConfig);
    }

    r.attempts = attempt;
    r.persona_id = PersonaId{*persona_id};
    auto check = co_await dns_.resolve(*cfg, candidate.domain_name, timeout);
    if (check) {
      res.persona_pool->report(*persona_id, true, util::Clock::now());
      r.status = check->status;
      r.system_status = SystemStatus::Ok;
      r.ips = std::move(check->ips);
      r.resolver = std::move(check->resolver);
      r.error.clear();
      break;
    }
    if (!is_transport_error(check.error())) {
      r.status = DnsStatus::Error;
      r.system_status = SystemStatus::Ok;
      r.error = check.error().message();
      break;
    }
    res.persona_pool->report(*persona_id, false, util::Clock::now());
    r.system_status = system_status_of(check.error());
    r.error = check.error().message();
    previous = *persona_id;
    log::debug("campaign {}: DNS attempt {}/{} for {} failed: {}", campaign.id,
               attempt, max_attempts, candidate.domain_name, r.error);
  }

  r.duration_ms = elapsed_ms(started);
  r.checked_at = util::Clock::now();
  co_return r;
}

auto ValidationPipeline::check_http(const Campaign &campaign,
                                    const CampaignResources &res, Pacer &pacer,
                                    const KeywordMatcher &matcher,
                                    const SourceCandidate &candidate)
    -> task<Result<HttpResult>> {
  const auto &params = std::get<HttpValidationParams>(campaign.params);
  const auto max_attempts = 1 + std::max(0, params.settings.retry_attempts);
  const auto started = std::chrono::steady_clock::now();
  static const std::vector<std::uint16_t> kDefaultPorts{80};
  const auto &ports =
      params.target_http_ports.empty() ? kDefaultPorts : params.target_http_ports;

  HttpResult r;
  r.campaign_id = campaign.id;
  r.domain_name = candidate.domain_name;
  r.source_seq = candidate.seq;
  r.status = HttpStatus::Error;

  std::string previous_persona;
  std::string previous_proxy;
  for (std::int32_t attempt = 1; attempt <= max_attempts; ++attempt) {
    co_await pace(pacer);
    const auto now = util::Clock::now();
    auto persona_id =
        res.persona_pool->select(candidate.domain_name, previous_persona, now);
    if (!persona_id) {
      co_return fail(persona_id.error());
    }
    const auto *persona = res.persona(*persona_id);
    const auto *cfg = persona != nullptr
                          ? std::get_if<HttpPersonaConfig>(&persona->config)
                          : nullptr;
    if (cfg == nullptr) {
      co_return fail(Error::InvalidConfig);
    }

    const Proxy *proxy = nullptr;
    std::string proxy_id;
    if (res.proxy_pool) {
      auto picked =
          res.proxy_pool->select(candidate.domain_name, previous_proxy, now);
      if (!picked) {
        co_return fail(picked.error());
      }
      proxy_id = std::move(*picked);
      proxy = res.proxy(proxy_id);
    }

    r.attempts = attempt;
    r.persona_id = PersonaId{*persona_id};
    r.proxy_id = ProxyId{proxy_id};

    std::error_code last = make_error_code(Error::Timeout);
    bool fetched = false;
    std::optional<std::chrono::steady_clock::time_point> deadline;
    for (auto port : ports) {
      auto req = http_check::build_request(
          *cfg, params, config_,
          http_check::target_url(candidate.domain_name, port), proxy);
      // All ports of one attempt share a single request timeout.
      if (!deadline) {
        deadline = std::chrono::steady_clock::now() + req.timeout;
      }
      const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
          *deadline - std::chrono::steady_clock::now());
      if (left.count() <= 0) {
        last = make_error_code(Error::Timeout);
        break;
      }
      req.timeout = std::min(req.timeout, left);
      auto resp = co_await http_.fetch(req);
      if (resp) {
        http_check::classify(*resp, *cfg, matcher, r);
        fetched = true;
        break;
      }
      last = resp.error();
      if (!is_transport_error(last)) {
        break;
      }
    }

    if (fetched) {
      res.persona_pool->report(*persona_id, true, util::Clock::now());
      if (proxy != nullptr) {
        res.proxy_pool->report(proxy_id, true, util::Clock::now());
      }
      break;
    }
    r.status = HttpStatus::Error;
    r.error = last.message();
    if (!is_transport_error(last)) {
      r.system_status = SystemStatus::Ok;
      break;
    }
    res.persona_pool->report(*persona_id, false, util::Clock::now());
    if (proxy != nullptr) {
      res.proxy_pool->report(proxy_id, false, util::Clock::now());
    }
    r.system_status = system_status_of(last);
    previous_persona = *persona_id;
    previous_proxy = proxy_id;
    log::debug("campaign {}: HTTP attempt {}/{} for {} failed: {}",
               campaign.id, attempt, max_attempts, candidate.domain_name,
               r.error);
  }

  r.duration_ms = elapsed_ms(started);
  r.checked_at = util::Clock::now();
  co_return r;
}

} // namespace domainflow
