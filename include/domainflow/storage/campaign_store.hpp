#pragma once

#include "domainflow/core/coroutine.hpp"
#include "domainflow/core/error.hpp"
#include "domainflow/model/campaign.hpp"
#include "domainflow/model/job.hpp"
#include "domainflow/model/resource.hpp"
#include "domainflow/util/time.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace domainflow::storage {

/// Persistence seam for campaigns, the generation cursor, jobs, results and
/// pool resources.
///
/// Two operations carry all cross-worker coordination and must be atomic in
/// every implementation: reserve_range() (offset cursor advance) and the
/// conditional job updates (claim_next_job / apply_job_transition). Every
/// commit_* call writes rows and adjusts the campaign counters in one
/// transaction and returns the counters as committed.
class CampaignStore {
public:
  virtual ~CampaignStore() = default;

  virtual auto open() -> task<Result<void>> = 0;
  virtual auto close() -> task<void> = 0;
  [[nodiscard]] virtual auto is_open() const noexcept -> bool = 0;

  // --- generation cursor -------------------------------------------------

  /// Creates the cursor row for `initial.fingerprint` at offset 0, or returns
  /// the existing row when another writer got there first.
  virtual auto ensure_generation_config(const GenerationConfigState &initial)
      -> task<Result<GenerationConfigState>> = 0;
  virtual auto get_generation_config(std::string_view fingerprint)
      -> task<Result<GenerationConfigState>> = 0;
  /// Atomically hands out [offset, offset + n) with n = min(batch_size,
  /// capacity - offset) and advances the cursor. n == 0 means exhausted.
  virtual auto reserve_range(std::string_view fingerprint,
                             std::int64_t batch_size)
      -> task<Result<OffsetRange>> = 0;

  // --- campaigns ---------------------------------------------------------

  virtual auto create_campaign(const Campaign &campaign)
      -> task<Result<void>> = 0;
  virtual auto get_campaign(const CampaignId &id) -> task<Result<Campaign>> = 0;
  virtual auto list_campaigns() -> task<Result<std::vector<Campaign>>> = 0;
  /// Compare-and-set on the status column; Error::InvalidState when the
  /// campaign is no longer in `expected`. Stamps started_at / completed_at.
  virtual auto update_campaign_status(const CampaignId &id,
                                      CampaignStatus expected,
                                      CampaignStatus next,
                                      std::string_view error_message)
      -> task<Result<void>> = 0;
  virtual auto update_campaign_progress(const CampaignId &id,
                                        const ProgressUpdate &progress)
      -> task<Result<void>> = 0;
  /// Sets total_items, never below processed_items.
  virtual auto set_campaign_total(const CampaignId &id, std::int64_t total)
      -> task<Result<CampaignCounters>> = 0;

  // --- generated domains -------------------------------------------------

  /// Insert-ignore on (campaign, domain). Only new rows count towards
  /// processed / successful, so a retried batch is harmless.
  virtual auto commit_generated_domains(const CampaignId &id,
                                        std::span<const GeneratedDomain> rows)
      -> task<Result<CampaignCounters>> = 0;
  virtual auto list_generated_domains(const CampaignId &id,
                                      std::int64_t after_seq,
                                      std::int32_t limit)
      -> task<Result<std::vector<GeneratedDomain>>> = 0;

  // --- validation --------------------------------------------------------

  /// Predecessor rows after `after_seq` that the next stage may consume:
  /// every generated domain, or DNS results whose status is resolved.
  virtual auto list_source_candidates(const CampaignId &source,
                                      CampaignType source_type,
                                      std::int64_t after_seq,
                                      std::int32_t limit)
      -> task<Result<std::vector<SourceCandidate>>> = 0;
  virtual auto count_source_candidates(const CampaignId &source,
                                       CampaignType source_type)
      -> task<Result<std::int64_t>> = 0;

  /// Insert-ignore on (campaign, domain) plus counters plus the source cursor
  /// advance, all in one transaction. DNS outcomes are also reflected on the
  /// predecessor's generated_domains.validation_status.
  virtual auto commit_dns_results(const CampaignId &id,
                                  std::span<const DnsResult> results,
                                  std::int64_t source_cursor)
      -> task<Result<CampaignCounters>> = 0;
  virtual auto commit_http_results(const CampaignId &id,
                                   std::span<const HttpResult> results,
                                   std::int64_t source_cursor)
      -> task<Result<CampaignCounters>> = 0;
  virtual auto list_dns_results(const CampaignId &id)
      -> task<Result<std::vector<DnsResult>>> = 0;
  virtual auto list_http_results(const CampaignId &id)
      -> task<Result<std::vector<HttpResult>>> = 0;

  // --- jobs --------------------------------------------------------------

  virtual auto enqueue_job(const CampaignJob &job) -> task<Result<void>> = 0;
  virtual auto get_job(const JobId &id) -> task<Result<CampaignJob>> = 0;
  virtual auto list_jobs(const CampaignId &campaign)
      -> task<Result<std::vector<CampaignJob>>> = 0;
  /// Locks the best pending job whose next_execution_at <= now, ordered by
  /// priority desc, scheduled_at asc, id asc. nullopt when none is due.
  virtual auto claim_next_job(std::string_view worker_id, util::TimePoint now)
      -> task<Result<std::optional<CampaignJob>>> = 0;
  /// Error::LeaseLost when the row no longer matches the expected status and
  /// holder.
  virtual auto apply_job_transition(const JobId &id,
                                    const JobTransition &transition)
      -> task<Result<CampaignJob>> = 0;
  /// Jobs in locked/running whose locked_at + timeout_seconds < now.
  virtual auto find_expired_leases(util::TimePoint now)
      -> task<Result<std::vector<CampaignJob>>> = 0;

  // --- pool resources ----------------------------------------------------

  virtual auto upsert_persona(const Persona &persona) -> task<Result<void>> = 0;
  virtual auto upsert_proxy(const Proxy &proxy) -> task<Result<void>> = 0;
  virtual auto upsert_keyword_set(const KeywordSet &set)
      -> task<Result<void>> = 0;
  /// Unknown ids are skipped; callers compare sizes when they care.
  virtual auto get_personas(std::span<const PersonaId> ids)
      -> task<Result<std::vector<Persona>>> = 0;
  virtual auto get_proxies(std::span<const ProxyId> ids)
      -> task<Result<std::vector<Proxy>>> = 0;
  virtual auto get_keyword_sets(std::span<const KeywordSetId> ids)
      -> task<Result<std::vector<KeywordSet>>> = 0;
  virtual auto save_resource_health(ResourceKind kind, std::string_view id,
                                    const ResourceHealth &health)
      -> task<Result<void>> = 0;
};

} // namespace domainflow::storage
