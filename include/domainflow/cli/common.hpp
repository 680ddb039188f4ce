#pragma once

#include "domainflow/config/config.hpp"
#include "domainflow/model/campaign.hpp"
#include "domainflow/util/time.hpp"

#include <cstdint>
#include <print>
#include <string>
#include <string_view>

namespace domainflow::cli {

inline auto load_config_or_print(std::string_view path)
    -> Result<SystemConfig> {
  auto result = path.empty() ? ConfigLoader::load_defaults()
                             : ConfigLoader::load_from_file(path);
  if (!result) {
    std::println(stderr, "Error: cannot load config '{}': {}", path,
                 result.error().message());
  }
  return result;
}

/// Row printed by `run` and `list`, also used for --json output.
struct CampaignSummary {
  std::string id;
  std::string name;
  std::string type;
  std::string status;
  std::int64_t total{0};
  std::int64_t processed{0};
  std::int64_t successful{0};
  std::int64_t failed{0};
  double progress{0.0};
  std::string error;
  std::string started_at;
  std::string completed_at;
};

inline auto summarize(const Campaign &c) -> CampaignSummary {
  auto stamp = [](util::TimePoint tp) -> std::string {
    return tp == util::TimePoint{} ? std::string{} : util::format_iso8601(tp);
  };
  return CampaignSummary{
      .id = std::string(c.id.str()),
      .name = c.name,
      .type = std::string(to_string_view(c.type)),
      .status = std::string(to_string_view(c.status)),
      .total = c.counters.total_items,
      .processed = c.counters.processed_items,
      .successful = c.counters.successful_items,
      .failed = c.counters.failed_items,
      .progress = c.progress.progress_percentage,
      .error = c.error_message,
      .started_at = stamp(c.started_at),
      .completed_at = stamp(c.completed_at),
  };
}

auto print_campaigns(const std::vector<Campaign> &campaigns, bool json)
    -> void;

} // namespace domainflow::cli
