#include "domainflow/generation/generation_worker.hpp"

#include "domainflow/core/asio_awaitable.hpp"
#include "domainflow/generation/config_fingerprint.hpp"
#include "domainflow/generation/pattern_enumerator.hpp"
#include "domainflow/util/log.hpp"

#include <algorithm>
#include <vector>

namespace domainflow {

GenerationWorker::GenerationWorker(storage::CampaignStore &store,
                                   std::chrono::milliseconds write_retry_delay)
    : store_(store), write_retry_delay_(write_retry_delay) {}

auto GenerationWorker::ensure_cursor(const GenerationParams &params,
                                     std::int64_t capacity)
    -> task<Result<std::string>> {
  auto fp = fingerprint_of(params);
  if (!params.config_fingerprint.empty() &&
      params.config_fingerprint != fp.hash) {
    log::warn("Stored fingerprint {} differs from computed {}",
              params.config_fingerprint, fp.hash);
  }
  {
    std::scoped_lock lock(mu_);
    if (ensured_.contains(fp.hash)) {
      co_return fp.hash;
    }
  }
  auto state = co_await store_.ensure_generation_config(GenerationConfigState{
      .fingerprint = fp.hash,
      .total_possible_combinations = capacity,
      .current_offset = 0,
      .config_details = fp.details,
      .updated_at = util::Clock::now(),
  });
  if (!state) {
    co_return std::unexpected(state.error());
  }
  std::scoped_lock lock(mu_);
  ensured_.insert(fp.hash);
  co_return fp.hash;
}

auto GenerationWorker::exhaust(const Campaign &campaign)
    -> task<Result<BatchOutcome>> {
  auto counters = co_await store_.set_campaign_total(
      campaign.id, campaign.counters.processed_items);
  if (!counters) {
    co_return std::unexpected(counters.error());
  }
  log::info("campaign {}: pattern space exhausted after {} domain(s)",
            campaign.id, counters->processed_items);
  co_return BatchOutcome{.processed = 0,
                         .done = true,
                         .waiting_for_source = false,
                         .counters = *counters};
}

auto GenerationWorker::run_batch(const Campaign &campaign)
    -> task<Result<BatchOutcome>> {
  const auto *params = std::get_if<GenerationParams>(&campaign.params);
  if (params == nullptr) {
    co_return fail(Error::InvalidConfig);
  }
  auto enumerator = PatternEnumerator::create(PatternSpec::from_params(*params));
  if (!enumerator) {
    co_return fail(Error::InvalidConfig);
  }

  const auto remaining =
      params->num_domains_to_generate - campaign.counters.processed_items;
  if (remaining <= 0) {
    co_return BatchOutcome{.processed = 0,
                           .done = true,
                           .waiting_for_source = false,
                           .counters = campaign.counters};
  }

  auto fingerprint = co_await ensure_cursor(*params, enumerator->capacity());
  if (!fingerprint) {
    co_return std::unexpected(fingerprint.error());
  }

  const auto want =
      std::min<std::int64_t>(std::max(1, params->batch_size), remaining);
  auto range = co_await store_.reserve_range(*fingerprint, want);
  if (!range) {
    co_return std::unexpected(range.error());
  }
  if (range->exhausted()) {
    co_return co_await exhaust(campaign);
  }

  auto names = enumerator->enumerate(range->start, range->size);
  if (!names) {
    co_return std::unexpected(names.error());
  }

  const auto now = util::Clock::now();
  std::vector<GeneratedDomain> rows;
  rows.reserve(names->size());
  for (std::size_t i = 0; i < names->size(); ++i) {
    rows.push_back(GeneratedDomain{
        .seq = 0,
        .campaign_id = campaign.id,
        .domain_name = std::move((*names)[i]),
        .offset_index = range->start + static_cast<std::int64_t>(i),
        .validation_status = DomainValidationStatus::Pending,
        .created_at = now,
    });
  }

  Result<CampaignCounters> counters = fail(Error::BatchWriteFailed);
  for (int attempt = 1; attempt <= kMaxBatchWriteAttempts; ++attempt) {
    counters = co_await store_.commit_generated_domains(campaign.id, rows);
    if (counters) {
      break;
    }
    log::warn("campaign {}: write of offsets [{}, {}) failed (attempt {}/{}): "
              "{}",
              campaign.id, range->start, range->end(), attempt,
              kMaxBatchWriteAttempts, counters.error().message());
    if (attempt < kMaxBatchWriteAttempts) {
      co_await async_sleep(write_retry_delay_ * attempt);
    }
  }
  if (!counters) {
    log::error("campaign {}: giving up on offsets [{}, {}): {}", campaign.id,
               range->start, range->end(), counters.error().message());
    co_return fail(Error::BatchWriteFailed);
  }

  BatchOutcome outcome{
      .processed = counters->processed_items -
                   campaign.counters.processed_items,
      .done = counters->processed_items >= params->num_domains_to_generate,
      .waiting_for_source = false,
      .counters = *counters,
  };
  // A short range means the shared cursor hit the end of the space.
  if (!outcome.done && range->size < want) {
    auto closed =
        co_await store_.set_campaign_total(campaign.id, counters->processed_items);
    if (!closed) {
      co_return std::unexpected(closed.error());
    }
    log::info("campaign {}: pattern space exhausted after {} domain(s)",
              campaign.id, closed->processed_items);
    outcome.counters = *closed;
    outcome.done = true;
  }
  co_return outcome;
}

} // namespace domainflow
