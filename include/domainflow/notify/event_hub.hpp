#pragma once

#include "domainflow/core/coroutine.hpp"
#include "domainflow/notify/notifier.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace domainflow {

class Runtime;

/// Receiving end of a subscription (a socket, a log, a test buffer).
class EventSink {
public:
  virtual ~EventSink() = default;
  virtual auto send_text(std::string message) -> task<void> = 0;
  [[nodiscard]] virtual auto is_closed() const -> bool = 0;
};

/// Fans campaign events out to sinks. Each sink lives on one shard and has a
/// bounded queue; a slow sink loses its oldest messages.
class EventHub final : public Notifier {
public:
  static constexpr std::size_t kMaxPendingMessages = 256;

  explicit EventHub(Runtime &runtime);
  ~EventHub() override;

  EventHub(const EventHub &) = delete;
  auto operator=(const EventHub &) -> EventHub & = delete;

  /// Attaches to the calling shard, or to the next shard when called from a
  /// foreign thread. An empty filter receives every campaign.
  auto subscribe(std::shared_ptr<EventSink> sink,
                 std::optional<CampaignId> campaign_filter = std::nullopt)
      -> void;

  auto publish(const CampaignEvent &event) -> void override;

  [[nodiscard]] auto subscriber_count() const -> std::size_t;
  auto close_all() -> void;

private:
  struct Impl;
  std::shared_ptr<Impl> impl_;
};

/// Writes every event to the log; used by the CLI.
class LoggingEventSink final : public EventSink {
public:
  auto send_text(std::string message) -> task<void> override;
  [[nodiscard]] auto is_closed() const -> bool override { return false; }
};

} // namespace domainflow
