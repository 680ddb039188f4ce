#include "domainflow/progress/progress_aggregator.hpp"

#include "domainflow/util/log.hpp"

#include <algorithm>
#include <chrono>

namespace domainflow {
namespace {

[[nodiscard]] auto to_event_data(const ProgressSnapshot &s) -> JsonValue {
  return JsonValue{
      {"status", std::string{to_string_view(s.status)}},
      {"totalItems", s.counters.total_items},
      {"processedItems", s.counters.processed_items},
      {"successfulItems", s.counters.successful_items},
      {"failedItems", s.counters.failed_items},
      {"progressPercentage", s.progress.progress_percentage},
      {"avgProcessingRate", s.progress.avg_processing_rate},
      {"estimatedCompletionAt",
       util::format_iso8601(s.progress.estimated_completion_at)},
  };
}

} // namespace

auto derive_progress(const CampaignCounters &counters, double rate,
                     util::TimePoint now) -> ProgressUpdate {
  ProgressUpdate p{.avg_processing_rate = rate, .last_heartbeat_at = now};
  if (counters.total_items > 0) {
    p.progress_percentage =
        std::min(100.0, 100.0 * static_cast<double>(counters.processed_items) /
                            static_cast<double>(counters.total_items));
  }
  const auto remaining = counters.total_items - counters.processed_items;
  if (remaining <= 0) {
    p.estimated_completion_at = now;
  } else if (rate > 0.0) {
    p.estimated_completion_at =
        now + std::chrono::duration_cast<util::Clock::duration>(
                  std::chrono::duration<double>(
                      static_cast<double>(remaining) / rate));
  }
  return p;
}

ProgressAggregator::ProgressAggregator(storage::CampaignStore &store,
                                       Notifier &notifier)
    : store_(store), notifier_(notifier) {}

auto ProgressAggregator::record(const CampaignId &id, CampaignStatus status,
                                const CampaignCounters &counters,
                                util::TimePoint now)
    -> task<Result<ProgressSnapshot>> {
  ProgressSnapshot snap;
  {
    std::scoped_lock lock(mu_);
    auto [it, inserted] = states_.try_emplace(id);
    auto &st = it->second;
    if (!inserted && now > st.last_at) {
      const auto delta = counters.processed_items - st.last_processed;
      const auto elapsed =
          std::chrono::duration<double>(now - st.last_at).count();
      if (delta > 0 && elapsed > 0.0) {
        st.rate = ewma_rate(st.rate, static_cast<double>(delta) / elapsed);
      }
    }
    if (inserted || now > st.last_at) {
      st.last_processed = counters.processed_items;
      st.last_at = now;
    }
    st.snapshot = ProgressSnapshot{
        .campaign_id = id,
        .status = status,
        .counters = counters,
        .progress = derive_progress(counters, st.rate, now),
    };
    snap = st.snapshot;
  }

  if (auto r = co_await store_.update_campaign_progress(id, snap.progress);
      !r) {
    log::warn("Failed to persist progress for campaign {}: {}", id,
              r.error().message());
    co_return fail(r.error());
  }

  notifier_.publish(CampaignEvent{.campaign_id = id,
                                  .type = EventType::CampaignProgress,
                                  .data = to_event_data(snap),
                                  .timestamp = now});
  co_return ok(std::move(snap));
}

auto ProgressAggregator::publish_lifecycle(const CampaignId &id,
                                           EventType type,
                                           std::string_view message) -> void {
  JsonValue data = {{"message", std::string{message}}};
  if (auto snap = snapshot(id); snap) {
    data = to_event_data(*snap);
    data["message"] = std::string{message};
  }
  notifier_.publish(CampaignEvent{.campaign_id = id,
                                  .type = type,
                                  .data = std::move(data),
                                  .timestamp = util::Clock::now()});
}

auto ProgressAggregator::snapshot(const CampaignId &id) const
    -> std::optional<ProgressSnapshot> {
  std::scoped_lock lock(mu_);
  if (auto it = states_.find(id); it != states_.end()) {
    return it->second.snapshot;
  }
  return std::nullopt;
}

auto ProgressAggregator::forget(const CampaignId &id) -> void {
  std::scoped_lock lock(mu_);
  states_.erase(id);
}

} // namespace domainflow
