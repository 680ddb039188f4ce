#include "domainflow/storage/memory_store.hpp"

#include "domainflow/model/campaign_state.hpp"
#include "domainflow/scheduler/job_state.hpp"
#include "domainflow/util/log.hpp"

#include <algorithm>
#include <ranges>
#include <tuple>

namespace domainflow::storage {
namespace {

auto count_outcome(CampaignCounters &c, bool positive) -> void {
  ++c.processed_items;
  if (positive) {
    ++c.successful_items;
  } else {
    ++c.failed_items;
  }
  c.total_items = std::max(c.total_items, c.processed_items);
}

[[nodiscard]] auto validation_status_for(DnsStatus s)
    -> DomainValidationStatus {
  switch (s) {
  case DnsStatus::Resolved:
    return DomainValidationStatus::Valid;
  case DnsStatus::Unresolved:
    return DomainValidationStatus::Invalid;
  case DnsStatus::Error:
    return DomainValidationStatus::Error;
  }
  return DomainValidationStatus::Error;
}

template <typename Id, typename Row, typename Map>
[[nodiscard]] auto collect(const Map &map, std::span<const Id> ids)
    -> std::vector<Row> {
  std::vector<Row> out;
  out.reserve(ids.size());
  for (const auto &id : ids) {
    if (auto it = map.find(id); it != map.end()) {
      out.push_back(it->second);
    }
  }
  return out;
}

} // namespace

auto MemoryCampaignStore::open() -> task<Result<void>> {
  std::scoped_lock lock(mu_);
  open_ = true;
  co_return ok();
}

auto MemoryCampaignStore::close() -> task<void> {
  std::scoped_lock lock(mu_);
  open_ = false;
  co_return;
}

auto MemoryCampaignStore::is_open() const noexcept -> bool {
  std::scoped_lock lock(mu_);
  return open_;
}

auto MemoryCampaignStore::find_campaign(const CampaignId &id) -> Campaign * {
  auto it = campaigns_.find(id);
  return it == campaigns_.end() ? nullptr : &it->second;
}

auto MemoryCampaignStore::ensure_generation_config(
    const GenerationConfigState &initial)
    -> task<Result<GenerationConfigState>> {
  std::scoped_lock lock(mu_);
  auto [it, inserted] = configs_.try_emplace(initial.fingerprint, initial);
  if (inserted) {
    it->second.current_offset = 0;
    it->second.updated_at = util::Clock::now();
  }
  co_return ok(it->second);
}

auto MemoryCampaignStore::get_generation_config(std::string_view fingerprint)
    -> task<Result<GenerationConfigState>> {
  std::scoped_lock lock(mu_);
  auto it = configs_.find(std::string{fingerprint});
  if (it == configs_.end()) {
    co_return fail(Error::NotFound);
  }
  co_return ok(it->second);
}

auto MemoryCampaignStore::reserve_range(std::string_view fingerprint,
                                        std::int64_t batch_size)
    -> task<Result<OffsetRange>> {
  if (batch_size <= 0) {
    co_return fail(Error::InvalidArgument);
  }
  std::scoped_lock lock(mu_);
  auto it = configs_.find(std::string{fingerprint});
  if (it == configs_.end()) {
    co_return fail(Error::NotFound);
  }
  auto &cfg = it->second;
  const auto remaining =
      std::max<std::int64_t>(0, cfg.total_possible_combinations -
                                    cfg.current_offset);
  OffsetRange range{.start = cfg.current_offset,
                    .size = std::min(batch_size, remaining)};
  cfg.current_offset += range.size;
  cfg.updated_at = util::Clock::now();
  co_return ok(range);
}

auto MemoryCampaignStore::create_campaign(const Campaign &campaign)
    -> task<Result<void>> {
  std::scoped_lock lock(mu_);
  if (!campaigns_.try_emplace(campaign.id, campaign).second) {
    co_return fail(Error::AlreadyExists);
  }
  campaign_order_.push_back(campaign.id);
  co_return ok();
}

auto MemoryCampaignStore::get_campaign(const CampaignId &id)
    -> task<Result<Campaign>> {
  std::scoped_lock lock(mu_);
  if (auto *c = find_campaign(id)) {
    co_return ok(*c);
  }
  co_return fail(Error::NotFound);
}

auto MemoryCampaignStore::list_campaigns()
    -> task<Result<std::vector<Campaign>>> {
  std::scoped_lock lock(mu_);
  std::vector<Campaign> out;
  out.reserve(campaign_order_.size());
  for (const auto &id : campaign_order_) {
    out.push_back(campaigns_.at(id));
  }
  co_return ok(std::move(out));
}

auto MemoryCampaignStore::update_campaign_status(const CampaignId &id,
                                                 CampaignStatus expected,
                                                 CampaignStatus next,
                                                 std::string_view error_message)
    -> task<Result<void>> {
  std::scoped_lock lock(mu_);
  auto *c = find_campaign(id);
  if (c == nullptr) {
    co_return fail(Error::NotFound);
  }
  if (c->status != expected || !can_transition(expected, next)) {
    co_return fail(Error::InvalidState);
  }
  const auto now = util::Clock::now();
  c->status = next;
  c->updated_at = now;
  if (!error_message.empty()) {
    c->error_message = std::string{error_message};
  }
  if (next == CampaignStatus::Running && c->started_at == util::TimePoint{}) {
    c->started_at = now;
  }
  if (is_terminal(next)) {
    c->completed_at = now;
  }
  co_return ok();
}

auto MemoryCampaignStore::update_campaign_progress(
    const CampaignId &id, const ProgressUpdate &progress)
    -> task<Result<void>> {
  std::scoped_lock lock(mu_);
  auto *c = find_campaign(id);
  if (c == nullptr) {
    co_return fail(Error::NotFound);
  }
  c->progress = progress;
  c->updated_at = util::Clock::now();
  co_return ok();
}

auto MemoryCampaignStore::set_campaign_total(const CampaignId &id,
                                             std::int64_t total)
    -> task<Result<CampaignCounters>> {
  std::scoped_lock lock(mu_);
  auto *c = find_campaign(id);
  if (c == nullptr) {
    co_return fail(Error::NotFound);
  }
  c->counters.total_items = std::max(total, c->counters.processed_items);
  co_return ok(c->counters);
}

auto MemoryCampaignStore::commit_generated_domains(
    const CampaignId &id, std::span<const GeneratedDomain> rows)
    -> task<Result<CampaignCounters>> {
  std::scoped_lock lock(mu_);
  auto *c = find_campaign(id);
  if (c == nullptr) {
    co_return fail(Error::NotFound);
  }
  auto &table = domains_[id];
  const auto now = util::Clock::now();
  for (const auto &row : rows) {
    if (!table.names.insert(row.domain_name).second) {
      continue;
    }
    auto stored = row;
    stored.seq = next_seq_++;
    stored.campaign_id = id;
    stored.created_at = now;
    table.rows.push_back(std::move(stored));
    count_outcome(c->counters, true);
  }
  c->updated_at = now;
  co_return ok(c->counters);
}

auto MemoryCampaignStore::list_generated_domains(const CampaignId &id,
                                                 std::int64_t after_seq,
                                                 std::int32_t limit)
    -> task<Result<std::vector<GeneratedDomain>>> {
  std::scoped_lock lock(mu_);
  std::vector<GeneratedDomain> out;
  if (auto it = domains_.find(id); it != domains_.end()) {
    for (const auto &row : it->second.rows) {
      if (row.seq > after_seq) {
        out.push_back(row);
        if (std::ssize(out) >= limit) {
          break;
        }
      }
    }
  }
  co_return ok(std::move(out));
}

auto MemoryCampaignStore::list_source_candidates(const CampaignId &source,
                                                 CampaignType source_type,
                                                 std::int64_t after_seq,
                                                 std::int32_t limit)
    -> task<Result<std::vector<SourceCandidate>>> {
  std::scoped_lock lock(mu_);
  std::vector<SourceCandidate> out;
  auto push = [&](std::int64_t seq, const std::string &name) {
    if (seq > after_seq && std::ssize(out) < limit) {
      out.push_back(SourceCandidate{.seq = seq, .domain_name = name});
    }
  };
  switch (source_type) {
  case CampaignType::DomainGeneration:
    if (auto it = domains_.find(source); it != domains_.end()) {
      for (const auto &row : it->second.rows) {
        push(row.seq, row.domain_name);
      }
    }
    break;
  case CampaignType::DnsValidation:
    if (auto it = dns_results_.find(source); it != dns_results_.end()) {
      for (const auto &row : it->second.rows) {
        if (row.result.status == DnsStatus::Resolved) {
          push(row.seq, row.result.domain_name);
        }
      }
    }
    break;
  case CampaignType::HttpKeywordValidation:
    co_return fail(Error::InvalidConfig);
  }
  co_return ok(std::move(out));
}

auto MemoryCampaignStore::count_source_candidates(const CampaignId &source,
                                                  CampaignType source_type)
    -> task<Result<std::int64_t>> {
  std::scoped_lock lock(mu_);
  switch (source_type) {
  case CampaignType::DomainGeneration: {
    auto it = domains_.find(source);
    co_return ok(it == domains_.end() ? std::int64_t{0}
                                      : std::ssize(it->second.rows));
  }
  case CampaignType::DnsValidation: {
    auto it = dns_results_.find(source);
    if (it == dns_results_.end()) {
      co_return ok(std::int64_t{0});
    }
    co_return ok(static_cast<std::int64_t>(
        std::ranges::count_if(it->second.rows, [](const DnsRow &r) {
          return r.result.status == DnsStatus::Resolved;
        })));
  }
  case CampaignType::HttpKeywordValidation:
    break;
  }
  co_return fail(Error::InvalidConfig);
}

auto MemoryCampaignStore::mark_source_domain(const Campaign &campaign,
                                             const DnsResult &result) -> void {
  const auto *settings = validation_settings(campaign.params);
  if (settings == nullptr ||
      settings->source_type != CampaignType::DomainGeneration) {
    return;
  }
  auto it = domains_.find(settings->source_campaign_id);
  if (it == domains_.end()) {
    return;
  }
  auto row = std::ranges::find(it->second.rows, result.domain_name,
                               &GeneratedDomain::domain_name);
  if (row != it->second.rows.end()) {
    row->validation_status = validation_status_for(result.status);
  }
}

auto MemoryCampaignStore::commit_dns_results(const CampaignId &id,
                                             std::span<const DnsResult> results,
                                             std::int64_t source_cursor)
    -> task<Result<CampaignCounters>> {
  std::scoped_lock lock(mu_);
  auto *c = find_campaign(id);
  if (c == nullptr) {
    co_return fail(Error::NotFound);
  }
  auto &table = dns_results_[id];
  for (const auto &result : results) {
    if (!table.names.insert(result.domain_name).second) {
      continue;
    }
    table.rows.push_back(DnsRow{.seq = next_seq_++, .result = result});
    table.rows.back().result.campaign_id = id;
    count_outcome(c->counters, is_positive(result.status));
    mark_source_domain(*c, result);
  }
  c->source_cursor = std::max(c->source_cursor, source_cursor);
  c->updated_at = util::Clock::now();
  co_return ok(c->counters);
}

auto MemoryCampaignStore::commit_http_results(
    const CampaignId &id, std::span<const HttpResult> results,
    std::int64_t source_cursor) -> task<Result<CampaignCounters>> {
  std::scoped_lock lock(mu_);
  auto *c = find_campaign(id);
  if (c == nullptr) {
    co_return fail(Error::NotFound);
  }
  auto &table = http_results_[id];
  for (const auto &result : results) {
    if (!table.names.insert(result.domain_name).second) {
      continue;
    }
    table.rows.push_back(result);
    table.rows.back().campaign_id = id;
    count_outcome(c->counters, is_positive(result.status));
  }
  c->source_cursor = std::max(c->source_cursor, source_cursor);
  c->updated_at = util::Clock::now();
  co_return ok(c->counters);
}

auto MemoryCampaignStore::list_dns_results(const CampaignId &id)
    -> task<Result<std::vector<DnsResult>>> {
  std::scoped_lock lock(mu_);
  std::vector<DnsResult> out;
  if (auto it = dns_results_.find(id); it != dns_results_.end()) {
    for (const auto &row : it->second.rows) {
      out.push_back(row.result);
    }
  }
  co_return ok(std::move(out));
}

auto MemoryCampaignStore::list_http_results(const CampaignId &id)
    -> task<Result<std::vector<HttpResult>>> {
  std::scoped_lock lock(mu_);
  std::vector<HttpResult> out;
  if (auto it = http_results_.find(id); it != http_results_.end()) {
    out = it->second.rows;
  }
  co_return ok(std::move(out));
}

auto MemoryCampaignStore::enqueue_job(const CampaignJob &job)
    -> task<Result<void>> {
  std::scoped_lock lock(mu_);
  if (!jobs_.try_emplace(job.id, job).second) {
    co_return fail(Error::AlreadyExists);
  }
  co_return ok();
}

auto MemoryCampaignStore::get_job(const JobId &id) -> task<Result<CampaignJob>> {
  std::scoped_lock lock(mu_);
  if (auto it = jobs_.find(id); it != jobs_.end()) {
    co_return ok(it->second);
  }
  co_return fail(Error::NotFound);
}

auto MemoryCampaignStore::list_jobs(const CampaignId &campaign)
    -> task<Result<std::vector<CampaignJob>>> {
  std::scoped_lock lock(mu_);
  auto out = jobs_ | std::views::values |
             std::views::filter([&](const CampaignJob &j) {
               return j.campaign_id == campaign;
             }) |
             std::ranges::to<std::vector>();
  std::ranges::sort(out, {}, &CampaignJob::created_at);
  co_return ok(std::move(out));
}

auto MemoryCampaignStore::claim_next_job(std::string_view worker_id,
                                         util::TimePoint now)
    -> task<Result<std::optional<CampaignJob>>> {
  std::scoped_lock lock(mu_);
  CampaignJob *best = nullptr;
  auto rank = [](const CampaignJob &j) {
    return std::make_tuple(-j.priority, j.scheduled_at, j.id.value());
  };
  for (auto &[id, job] : jobs_) {
    if (job.status != JobStatus::Pending || job.next_execution_at > now) {
      continue;
    }
    if (best == nullptr || rank(job) < rank(*best)) {
      best = &job;
    }
  }
  if (best == nullptr) {
    co_return ok(std::optional<CampaignJob>{});
  }
  auto t = job_state::claim(*best, worker_id, now);
  if (!t) {
    co_return fail(t.error());
  }
  *best = job_state::apply(*best, *t, now);
  co_return ok(std::optional<CampaignJob>{*best});
}

auto MemoryCampaignStore::apply_job_transition(const JobId &id,
                                               const JobTransition &transition)
    -> task<Result<CampaignJob>> {
  std::scoped_lock lock(mu_);
  auto it = jobs_.find(id);
  if (it == jobs_.end()) {
    co_return fail(Error::NotFound);
  }
  auto &job = it->second;
  if (job.status != transition.expected_status ||
      job.locked_by != transition.expected_locked_by) {
    co_return fail(Error::LeaseLost);
  }
  job = job_state::apply(job, transition, util::Clock::now());
  co_return ok(job);
}

auto MemoryCampaignStore::find_expired_leases(util::TimePoint now)
    -> task<Result<std::vector<CampaignJob>>> {
  std::scoped_lock lock(mu_);
  co_return ok(jobs_ | std::views::values |
               std::views::filter([&](const CampaignJob &j) {
                 return job_state::is_lease_expired(j, now);
               }) |
               std::ranges::to<std::vector>());
}

auto MemoryCampaignStore::upsert_persona(const Persona &persona)
    -> task<Result<void>> {
  std::scoped_lock lock(mu_);
  personas_.insert_or_assign(persona.id, persona);
  co_return ok();
}

auto MemoryCampaignStore::upsert_proxy(const Proxy &proxy)
    -> task<Result<void>> {
  std::scoped_lock lock(mu_);
  proxies_.insert_or_assign(proxy.id, proxy);
  co_return ok();
}

auto MemoryCampaignStore::upsert_keyword_set(const KeywordSet &set)
    -> task<Result<void>> {
  std::scoped_lock lock(mu_);
  keyword_sets_.insert_or_assign(set.id, set);
  co_return ok();
}

auto MemoryCampaignStore::get_personas(std::span<const PersonaId> ids)
    -> task<Result<std::vector<Persona>>> {
  std::scoped_lock lock(mu_);
  co_return ok(collect<PersonaId, Persona>(personas_, ids));
}

auto MemoryCampaignStore::get_proxies(std::span<const ProxyId> ids)
    -> task<Result<std::vector<Proxy>>> {
  std::scoped_lock lock(mu_);
  co_return ok(collect<ProxyId, Proxy>(proxies_, ids));
}

auto MemoryCampaignStore::get_keyword_sets(std::span<const KeywordSetId> ids)
    -> task<Result<std::vector<KeywordSet>>> {
  std::scoped_lock lock(mu_);
  co_return ok(collect<KeywordSetId, KeywordSet>(keyword_sets_, ids));
}

auto MemoryCampaignStore::save_resource_health(ResourceKind kind,
                                               std::string_view id,
                                               const ResourceHealth &health)
    -> task<Result<void>> {
  std::scoped_lock lock(mu_);
  if (kind == ResourceKind::Persona) {
    auto it = personas_.find(PersonaId{id});
    if (it == personas_.end()) {
      co_return fail(Error::NotFound);
    }
    it->second.health = health;
  } else {
    auto it = proxies_.find(ProxyId{id});
    if (it == proxies_.end()) {
      co_return fail(Error::NotFound);
    }
    it->second.health = health;
  }
  co_return ok();
}

} // namespace domainflow::storage
