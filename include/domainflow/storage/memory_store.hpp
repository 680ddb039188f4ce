#pragma once

#include "domainflow/storage/campaign_store.hpp"

#include <ankerl/unordered_dense.h>

#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace domainflow::storage {

/// In-process CampaignStore. A single mutex serialises every operation, which
/// makes the cursor reservation and the conditional job updates trivially
/// atomic. Used by tests and `storage.backend = "memory"`.
class MemoryCampaignStore final : public CampaignStore {
public:
  MemoryCampaignStore() = default;

  auto open() -> task<Result<void>> override;
  auto close() -> task<void> override;
  [[nodiscard]] auto is_open() const noexcept -> bool override;

  auto ensure_generation_config(const GenerationConfigState &initial)
      -> task<Result<GenerationConfigState>> override;
  auto get_generation_config(std::string_view fingerprint)
      -> task<Result<GenerationConfigState>> override;
  auto reserve_range(std::string_view fingerprint, std::int64_t batch_size)
      -> task<Result<OffsetRange>> override;

  auto create_campaign(const Campaign &campaign) -> task<Result<void>> override;
  auto get_campaign(const CampaignId &id) -> task<Result<Campaign>> override;
  auto list_campaigns() -> task<Result<std::vector<Campaign>>> override;
  auto update_campaign_status(const CampaignId &id, CampaignStatus expected,
                              CampaignStatus next,
                              std::string_view error_message)
      -> task<Result<void>> override;
  auto update_campaign_progress(const CampaignId &id,
                                const ProgressUpdate &progress)
      -> task<Result<void>> override;
  auto set_campaign_total(const CampaignId &id, std::int64_t total)
      -> task<Result<CampaignCounters>> override;

  auto commit_generated_domains(const CampaignId &id,
                                std::span<const GeneratedDomain> rows)
      -> task<Result<CampaignCounters>> override;
  auto list_generated_domains(const CampaignId &id, std::int64_t after_seq,
                              std::int32_t limit)
      -> task<Result<std::vector<GeneratedDomain>>> override;

  auto list_source_candidates(const CampaignId &source,
                              CampaignType source_type, std::int64_t after_seq,
                              std::int32_t limit)
      -> task<Result<std::vector<SourceCandidate>>> override;
  auto count_source_candidates(const CampaignId &source,
                               CampaignType source_type)
      -> task<Result<std::int64_t>> override;
  auto commit_dns_results(const CampaignId &id,
                          std::span<const DnsResult> results,
                          std::int64_t source_cursor)
      -> task<Result<CampaignCounters>> override;
  auto commit_http_results(const CampaignId &id,
                           std::span<const HttpResult> results,
                           std::int64_t source_cursor)
      -> task<Result<CampaignCounters>> override;
  auto list_dns_results(const CampaignId &id)
      -> task<Result<std::vector<DnsResult>>> override;
  auto list_http_results(const CampaignId &id)
      -> task<Result<std::vector<HttpResult>>> override;

  auto enqueue_job(const CampaignJob &job) -> task<Result<void>> override;
  auto get_job(const JobId &id) -> task<Result<CampaignJob>> override;
  auto list_jobs(const CampaignId &campaign)
      -> task<Result<std::vector<CampaignJob>>> override;
  auto claim_next_job(std::string_view worker_id, util::TimePoint now)
      -> task<Result<std::optional<CampaignJob>>> override;
  auto apply_job_transition(const JobId &id, const JobTransition &transition)
      -> task<Result<CampaignJob>> override;
  auto find_expired_leases(util::TimePoint now)
      -> task<Result<std::vector<CampaignJob>>> override;

  auto upsert_persona(const Persona &persona) -> task<Result<void>> override;
  auto upsert_proxy(const Proxy &proxy) -> task<Result<void>> override;
  auto upsert_keyword_set(const KeywordSet &set) -> task<Result<void>> override;
  auto get_personas(std::span<const PersonaId> ids)
      -> task<Result<std::vector<Persona>>> override;
  auto get_proxies(std::span<const ProxyId> ids)
      -> task<Result<std::vector<Proxy>>> override;
  auto get_keyword_sets(std::span<const KeywordSetId> ids)
      -> task<Result<std::vector<KeywordSet>>> override;
  auto save_resource_health(ResourceKind kind, std::string_view id,
                            const ResourceHealth &health)
      -> task<Result<void>> override;

private:
  template <typename Row> struct Table {
    std::vector<Row> rows;
    ankerl::unordered_dense::set<std::string> names;
  };
  struct DnsRow {
    std::int64_t seq{0};
    DnsResult result;
  };

  [[nodiscard]] auto find_campaign(const CampaignId &id) -> Campaign *;
  auto mark_source_domain(const Campaign &campaign, const DnsResult &result)
      -> void;

  mutable std::mutex mu_;
  bool open_{false};
  std::int64_t next_seq_{1};

  ankerl::unordered_dense::map<std::string, GenerationConfigState> configs_;
  ankerl::unordered_dense::map<CampaignId, Campaign> campaigns_;
  std::vector<CampaignId> campaign_order_;
  ankerl::unordered_dense::map<CampaignId, Table<GeneratedDomain>> domains_;
  ankerl::unordered_dense::map<CampaignId, Table<DnsRow>> dns_results_;
  ankerl::unordered_dense::map<CampaignId, Table<HttpResult>> http_results_;
  ankerl::unordered_dense::map<JobId, CampaignJob> jobs_;
  ankerl::unordered_dense::map<PersonaId, Persona> personas_;
  ankerl::unordered_dense::map<ProxyId, Proxy> proxies_;
  ankerl::unordered_dense::map<KeywordSetId, KeywordSet> keyword_sets_;
};

} // namespace domainflow::storage
