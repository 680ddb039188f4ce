#pragma once

#include "domainflow/util/enum.hpp"
#include "domainflow/util/id.hpp"
#include "domainflow/util/json.hpp"
#include "domainflow/util/time.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <string>

namespace domainflow {

enum class EventType : std::uint8_t {
  CampaignProgress,
  CampaignCompleted,
  CampaignFailed,
  CampaignCancelled,
  CampaignPaused,
  CampaignDegraded,
};
BOOST_DESCRIBE_ENUM(EventType, CampaignProgress, CampaignCompleted,
                    CampaignFailed, CampaignCancelled, CampaignPaused,
                    CampaignDegraded)
DOMAINFLOW_DEFINE_ENUM_SERDE(EventType, EventType::CampaignProgress)

struct CampaignEvent {
  CampaignId campaign_id;
  EventType type{EventType::CampaignProgress};
  JsonValue data;
  util::TimePoint timestamp{};
};

/// Wire shape pushed to subscribers:
/// {"campaignId": ..., "type": ..., "data": {...}, "timestamp": ...}
[[nodiscard]] inline auto to_json(const CampaignEvent &event) -> std::string {
  JsonValue j = {{"campaignId", event.campaign_id.str()},
                 {"type", std::string{to_string_view(event.type)}},
                 {"data", event.data},
                 {"timestamp", util::format_iso8601(event.timestamp)}};
  return dump_json(j);
}

/// Outbound collaborator of the progress aggregator and the workers.
/// publish() must not block.
class Notifier {
public:
  virtual ~Notifier() = default;
  virtual auto publish(const CampaignEvent &event) -> void = 0;
};

} // namespace domainflow
