#include "domainflow/app/campaign_service.hpp"

#include "domainflow/generation/config_fingerprint.hpp"
#include "domainflow/generation/pattern_enumerator.hpp"
#include "domainflow/model/campaign_state.hpp"
#include "domainflow/model/codec.hpp"
#include "domainflow/scheduler/admission.hpp"
#include "domainflow/util/log.hpp"

#include <algorithm>
#include <cctype>

namespace domainflow {
namespace {

[[nodiscard]] auto invalid(std::string_view what) -> Result<void> {
  log::warn("Rejected campaign parameters: {}", what);
  return fail(Error::InvalidConfig);
}

[[nodiscard]] auto validate_generation(const GenerationParams &p)
    -> Result<void> {
  if (p.variable_length <= 0) {
    return invalid("variable_length must be positive");
  }
  if (p.character_set.empty()) {
    return invalid("character_set is empty");
  }
  if (p.num_domains_to_generate <= 0) {
    return invalid("num_domains_to_generate must be positive");
  }
  if (p.batch_size <= 0) {
    return invalid("batch_size must be positive");
  }
  if (auto e = PatternEnumerator::create(PatternSpec::from_params(p)); !e) {
    return invalid("pattern space does not fit in 64 bits");
  }
  return ok();
}

[[nodiscard]] auto validate_settings(CampaignType type,
                                     const ValidationSettings &s)
    -> Result<void> {
  if (s.source_campaign_id.empty()) {
    return invalid("source_campaign_id is required");
  }
  if (!admission::accepts_source(type, s.source_type)) {
    return invalid("source_type is not a valid predecessor for this stage");
  }
  if (s.persona_ids.empty()) {
    return invalid("at least one persona is required");
  }
  if (s.rotation_interval_seconds < 0 || s.processing_speed_per_minute < 0) {
    return invalid("rotation and speed must not be negative");
  }
  if (s.batch_size <= 0 || s.parallel_workers <= 0) {
    return invalid("batch_size and parallel_workers must be positive");
  }
  if (s.retry_attempts < 0) {
    return invalid("retry_attempts must not be negative");
  }
  if (s.request_timeout_seconds <= 0) {
    return invalid("request_timeout_seconds must be positive");
  }
  return ok();
}

[[nodiscard]] auto lowercase(std::string s) -> std::string {
  std::ranges::transform(s, s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

} // namespace

auto validate_params(const CampaignParams &params) -> Result<void> {
  if (const auto *gen = std::get_if<GenerationParams>(&params)) {
    return validate_generation(*gen);
  }
  if (const auto *dns = std::get_if<DnsValidationParams>(&params)) {
    return validate_settings(CampaignType::DnsValidation, dns->settings);
  }
  const auto &http = std::get<HttpValidationParams>(params);
  if (auto r = validate_settings(CampaignType::HttpKeywordValidation,
                                 http.settings);
      !r) {
    return r;
  }
  if (http.target_http_ports.empty() ||
      std::ranges::contains(http.target_http_ports, std::uint16_t{0})) {
    return invalid("target_http_ports must list non-zero ports");
  }
  if (http.max_redirects < 0) {
    return invalid("max_redirects must not be negative");
  }
  return ok();
}

CampaignService::CampaignService(storage::CampaignStore &store,
                                 JobScheduler &scheduler,
                                 ProgressAggregator &progress,
                                 SchedulerConfig config)
    : store_(store), scheduler_(scheduler), progress_(progress),
      config_(std::move(config)) {}

auto CampaignService::check_references(const CampaignParams &params)
    -> task<Result<void>> {
  const auto *settings = validation_settings(params);
  if (settings == nullptr) {
    co_return ok();
  }
  const auto wanted = params_type(params) == CampaignType::DnsValidation
                          ? PersonaType::Dns
                          : PersonaType::Http;

  auto personas = co_await store_.get_personas(settings->persona_ids);
  if (!personas) {
    co_return std::unexpected(personas.error());
  }
  if (personas->size() != settings->persona_ids.size()) {
    co_return invalid("unknown persona id");
  }
  for (const auto &p : *personas) {
    if (p.type() != wanted) {
      log::warn("Persona {} is a {} persona", p.id, to_string_view(p.type()));
      co_return fail(Error::InvalidConfig);
    }
  }

  if (const auto *http = std::get_if<HttpValidationParams>(&params)) {
    auto proxies = co_await store_.get_proxies(http->proxy_ids);
    if (!proxies) {
      co_return std::unexpected(proxies.error());
    }
    if (proxies->size() != http->proxy_ids.size()) {
      co_return invalid("unknown proxy id");
    }
    auto sets = co_await store_.get_keyword_sets(http->keyword_set_ids);
    if (!sets) {
      co_return std::unexpected(sets.error());
    }
    if (sets->size() != http->keyword_set_ids.size()) {
      co_return invalid("unknown keyword set id");
    }
  }
  co_return ok();
}

auto CampaignService::create(std::string name, CampaignParams params)
    -> task<Result<Campaign>> {
  if (auto *gen = std::get_if<GenerationParams>(&params)) {
    gen->character_set = lowercase(std::move(gen->character_set));
  }
  if (auto r = validate_params(params); !r) {
    co_return std::unexpected(r.error());
  }
  if (auto r = co_await check_references(params); !r) {
    co_return std::unexpected(r.error());
  }

  const auto now = util::Clock::now();
  Campaign campaign;
  campaign.id = generate_id<CampaignId>();
  campaign.name = std::move(name);
  campaign.type = params_type(params);
  campaign.status = CampaignStatus::Pending;
  campaign.created_at = now;
  campaign.updated_at = now;

  if (auto *gen = std::get_if<GenerationParams>(&params)) {
    auto enumerator =
        PatternEnumerator::create(PatternSpec::from_params(*gen));
    if (!enumerator) {
      co_return std::unexpected(enumerator.error());
    }
    auto fp = fingerprint_of(*gen);
    gen->config_fingerprint = fp.hash;
    gen->total_possible_combinations = enumerator->capacity();
    campaign.counters.total_items =
        std::min(gen->num_domains_to_generate, enumerator->capacity());

    auto cursor = co_await store_.ensure_generation_config(
        GenerationConfigState{.fingerprint = fp.hash,
                              .total_possible_combinations =
                                  enumerator->capacity(),
                              .current_offset = 0,
                              .config_details = fp.details,
                              .updated_at = now});
    if (!cursor) {
      co_return std::unexpected(cursor.error());
    }
    if (cursor->current_offset > 0) {
      log::info("Pattern {} resumes at offset {} of {}", fp.hash,
                cursor->current_offset, cursor->total_possible_combinations);
    }
  }
  campaign.params = std::move(params);

  if (auto r = co_await store_.create_campaign(campaign); !r) {
    co_return std::unexpected(r.error());
  }
  log::info("Created {} campaign {} '{}'", to_string_view(campaign.type),
            campaign.id, campaign.name);
  co_return campaign;
}

auto CampaignService::transition(const CampaignId &id, CampaignStatus from,
                                 CampaignStatus to, std::string_view message)
    -> task<Result<Campaign>> {
  if (auto r = co_await store_.update_campaign_status(id, from, to, message);
      !r) {
    co_return std::unexpected(r.error());
  }
  log::info("Campaign {}: {} -> {}", id, to_string_view(from),
            to_string_view(to));
  co_return co_await store_.get_campaign(id);
}

auto CampaignService::ensure_job(const Campaign &campaign,
                                 std::int32_t priority) -> task<Result<void>> {
  auto jobs = co_await store_.list_jobs(campaign.id);
  if (!jobs) {
    co_return std::unexpected(jobs.error());
  }
  if (std::ranges::any_of(*jobs, [](const CampaignJob &j) {
        return !is_terminal(j.status);
      })) {
    co_return ok();
  }
  auto job = co_await scheduler_.enqueue(
      campaign, JobOptions{.priority = priority,
                           .max_attempts = config_.default_max_attempts,
                           .timeout_seconds = config_.default_job_timeout_sec});
  if (!job) {
    co_return std::unexpected(job.error());
  }
  co_return ok();
}

auto CampaignService::start(const CampaignId &id, std::int32_t priority)
    -> task<Result<Campaign>> {
  auto campaign = co_await store_.get_campaign(id);
  if (!campaign) {
    co_return campaign;
  }
  if (campaign->status != CampaignStatus::Pending) {
    co_return fail(Error::InvalidState);
  }

  if (const auto *settings = validation_settings(campaign->params)) {
    auto source = co_await store_.get_campaign(settings->source_campaign_id);
    if (!source) {
      if (source.error() == make_error_code(Error::NotFound)) {
        log::warn("campaign {}: source campaign {} does not exist", id,
                  settings->source_campaign_id);
        co_return fail(Error::InvalidConfig);
      }
      co_return std::unexpected(source.error());
    }
    if (auto linked = admission::check_link(*campaign, *source); !linked) {
      co_return std::unexpected(linked.error());
    }
  }

  auto queued =
      co_await transition(id, CampaignStatus::Pending, CampaignStatus::Queued);
  if (!queued) {
    co_return queued;
  }
  if (auto r = co_await ensure_job(*queued, priority); !r) {
    co_return std::unexpected(r.error());
  }
  co_return queued;
}

auto CampaignService::pause(const CampaignId &id) -> task<Result<Campaign>> {
  auto campaign = co_await store_.get_campaign(id);
  if (!campaign) {
    co_return campaign;
  }
  if (campaign->status != CampaignStatus::Queued &&
      campaign->status != CampaignStatus::Running) {
    co_return fail(Error::InvalidState);
  }
  auto paused =
      co_await transition(id, campaign->status, CampaignStatus::Paused);
  if (paused) {
    progress_.publish_lifecycle(id, EventType::CampaignPaused);
  }
  co_return paused;
}

auto CampaignService::resume(const CampaignId &id) -> task<Result<Campaign>> {
  auto queued =
      co_await transition(id, CampaignStatus::Paused, CampaignStatus::Queued);
  if (!queued) {
    co_return queued;
  }
  if (auto r = co_await ensure_job(*queued, kDefaultJobPriority); !r) {
    co_return std::unexpected(r.error());
  }
  co_return queued;
}

auto CampaignService::cancel(const CampaignId &id) -> task<Result<Campaign>> {
  auto campaign = co_await store_.get_campaign(id);
  if (!campaign) {
    co_return campaign;
  }
  if (auto r = check_transition(campaign->status, CampaignStatus::Cancelled);
      !r) {
    co_return std::unexpected(r.error());
  }
  auto cancelled =
      co_await transition(id, campaign->status, CampaignStatus::Cancelled);
  if (cancelled) {
    progress_.publish_lifecycle(id, EventType::CampaignCancelled);
  }
  co_return cancelled;
}

auto CampaignService::retry(const CampaignId &id) -> task<Result<Campaign>> {
  auto queued =
      co_await transition(id, CampaignStatus::Failed, CampaignStatus::Queued);
  if (!queued) {
    co_return queued;
  }
  if (auto r = co_await ensure_job(*queued, kDefaultJobPriority); !r) {
    co_return std::unexpected(r.error());
  }
  co_return queued;
}

auto CampaignService::archive(const CampaignId &id) -> task<Result<Campaign>> {
  auto campaign = co_await store_.get_campaign(id);
  if (!campaign) {
    co_return campaign;
  }
  co_return co_await transition(id, campaign->status,
                                CampaignStatus::Archived);
}

auto CampaignService::get(const CampaignId &id) -> task<Result<Campaign>> {
  co_return co_await store_.get_campaign(id);
}

auto CampaignService::list() -> task<Result<std::vector<Campaign>>> {
  co_return co_await store_.list_campaigns();
}

auto CampaignService::add_persona(const Persona &persona)
    -> task<Result<void>> {
  if (persona.id.empty()) {
    co_return fail(Error::InvalidConfig);
  }
  if (auto r = codec::validate_persona_config(persona.config); !r) {
    co_return r;
  }
  co_return co_await store_.upsert_persona(persona);
}

auto CampaignService::add_proxy(const Proxy &proxy) -> task<Result<void>> {
  if (proxy.id.empty() || proxy.host.empty() || proxy.port == 0 ||
      proxy.protocol != "http") {
    log::warn("Rejected proxy '{}': an http proxy needs host and port",
              proxy.id);
    co_return fail(Error::InvalidConfig);
  }
  co_return co_await store_.upsert_proxy(proxy);
}

auto CampaignService::add_keyword_set(const KeywordSet &set)
    -> task<Result<void>> {
  if (set.id.empty()) {
    co_return fail(Error::InvalidConfig);
  }
  co_return co_await store_.upsert_keyword_set(set);
}

} // namespace domainflow
