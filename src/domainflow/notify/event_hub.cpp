#include "domainflow/notify/event_hub.hpp"

#include "domainflow/core/runtime.hpp"
#include "domainflow/util/log.hpp"

#include <boost/asio/post.hpp>

#include <atomic>
#include <deque>
#include <vector>

namespace domainflow {

struct EventHub::Impl : std::enable_shared_from_this<EventHub::Impl> {
  struct Subscriber {
    std::shared_ptr<EventSink> sink;
    std::optional<CampaignId> filter;
    std::deque<std::string> pending_messages;
    std::size_t dropped_messages{0};
    bool sending{false};
  };

  // Only touched by the owning shard.
  struct ShardLocalState {
    std::vector<std::shared_ptr<Subscriber>> subscribers;
  };

  Runtime &runtime;
  std::vector<ShardLocalState> shard_states_;
  std::atomic<std::size_t> total_subscribers_{0};

  explicit Impl(Runtime &rt) : runtime(rt), shard_states_(rt.shard_count()) {}

  static auto drain(std::shared_ptr<Subscriber> sub) -> spawn_task {
    while (!sub->sink->is_closed()) {
      if (sub->pending_messages.empty()) {
        sub->sending = false;
        co_return;
      }
      std::string msg = std::move(sub->pending_messages.front());
      sub->pending_messages.pop_front();
      co_await sub->sink->send_text(std::move(msg));
    }
    sub->sending = false;
  }

  auto publish_on_shard(shard_id sid, const std::string &json_str,
                        const CampaignId &campaign_id) -> void {
    auto &local = shard_states_[sid];
    const auto before = local.subscribers.size();
    std::erase_if(local.subscribers,
                  [](const std::shared_ptr<Subscriber> &entry) {
                    return !entry || !entry->sink || entry->sink->is_closed();
                  });
    if (const auto removed = before - local.subscribers.size(); removed > 0) {
      total_subscribers_.fetch_sub(removed, std::memory_order_relaxed);
    }

    for (auto &entry : local.subscribers) {
      if (entry->filter && *entry->filter != campaign_id) {
        continue;
      }
      if (entry->pending_messages.size() >= kMaxPendingMessages) {
        entry->pending_messages.pop_front();
        ++entry->dropped_messages;
        if ((entry->dropped_messages & (entry->dropped_messages - 1)) == 0) {
          log::warn("Event subscriber is slow: dropped={} pending={}",
                    entry->dropped_messages, entry->pending_messages.size());
        }
      }
      entry->pending_messages.emplace_back(json_str);
      if (!entry->sending) {
        entry->sending = true;
        runtime.spawn_on(sid, drain(entry));
      }
    }
  }
};

EventHub::EventHub(Runtime &runtime)
    : impl_(std::make_shared<Impl>(runtime)) {}

EventHub::~EventHub() = default;

auto EventHub::subscribe(std::shared_ptr<EventSink> sink,
                         std::optional<CampaignId> campaign_filter) -> void {
  auto sid = impl_->runtime.current_shard();
  if (sid == kInvalidShard) {
    sid = impl_->runtime.next_shard();
  }
  impl_->total_subscribers_.fetch_add(1, std::memory_order_relaxed);
  boost::asio::post(
      impl_->runtime.executor_for(sid),
      [self = impl_, sid, sink = std::move(sink),
       filter = std::move(campaign_filter)]() mutable {
        self->shard_states_[sid].subscribers.emplace_back(
            std::make_shared<Impl::Subscriber>(
                Impl::Subscriber{.sink = std::move(sink),
                                 .filter = std::move(filter),
                                 .pending_messages = {},
                                 .dropped_messages = 0,
                                 .sending = false}));
      });
}

auto EventHub::publish(const CampaignEvent &event) -> void {
  if (!impl_->runtime.is_running()) {
    return;
  }
  auto json_str = to_json(event);
  const auto n = impl_->runtime.shard_count();
  for (unsigned i = 0; i < n; ++i) {
    boost::asio::post(impl_->runtime.executor_for(i),
                      [self = impl_, i, json_str, id = event.campaign_id]() {
                        self->publish_on_shard(i, json_str, id);
                      });
  }
}

auto EventHub::subscriber_count() const -> std::size_t {
  return impl_->total_subscribers_.load(std::memory_order_relaxed);
}

auto EventHub::close_all() -> void {
  const auto n = impl_->runtime.shard_count();
  for (unsigned i = 0; i < n; ++i) {
    boost::asio::post(impl_->runtime.executor_for(i), [self = impl_, i]() {
      auto subscribers = std::move(self->shard_states_[i].subscribers);
      self->shard_states_[i].subscribers.clear();
      if (!subscribers.empty()) {
        self->total_subscribers_.fetch_sub(subscribers.size(),
                                           std::memory_order_relaxed);
      }
    });
  }
}

auto LoggingEventSink::send_text(std::string message) -> task<void> {
  log::info("event {}", message);
  co_return;
}

} // namespace domainflow
