#include "domainflow/core/runtime.hpp"
#include "domainflow/notify/event_hub.hpp"

#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <mutex>

using namespace domainflow;
using namespace std::chrono_literals;

namespace {

class CollectingSink final : public EventSink {
public:
  auto send_text(std::string message) -> task<void> override {
    std::scoped_lock lock(mu);
    messages.push_back(std::move(message));
    co_return;
  }
  [[nodiscard]] auto is_closed() const -> bool override { return closed; }

  [[nodiscard]] auto count() -> std::size_t {
    std::scoped_lock lock(mu);
    return messages.size();
  }

  std::mutex mu;
  std::vector<std::string> messages;
  std::atomic<bool> closed{false};
};

auto event(std::string campaign, EventType type) -> CampaignEvent {
  JsonValue data = {{"message", std::string{"hello"}}};
  return CampaignEvent{.campaign_id = CampaignId{std::move(campaign)},
                       .type = type,
                       .data = std::move(data),
                       .timestamp = util::Clock::now()};
}

class EventHubTest : public ::testing::Test {
protected:
  void SetUp() override { ASSERT_TRUE(runtime.start()); }
  void TearDown() override {
    hub.close_all();
    runtime.stop();
  }

  Runtime runtime{2};
  EventHub hub{runtime};
};

} // namespace

TEST(EventJsonTest, WireShape) {
  auto json = to_json(event("c-1", EventType::CampaignCompleted));
  EXPECT_NE(json.find(R"("campaignId":"c-1")"), std::string::npos);
  EXPECT_NE(json.find(R"("type":"campaign_completed")"), std::string::npos);
  EXPECT_NE(json.find(R"("message":"hello")"), std::string::npos);
  EXPECT_NE(json.find(R"("timestamp":")"), std::string::npos);
}

TEST_F(EventHubTest, DeliversToEverySubscriber) {
  auto a = std::make_shared<CollectingSink>();
  auto b = std::make_shared<CollectingSink>();
  hub.subscribe(a);
  hub.subscribe(b);
  EXPECT_EQ(hub.subscriber_count(), 2U);

  hub.publish(event("c-1", EventType::CampaignProgress));
  hub.publish(event("c-2", EventType::CampaignPaused));

  EXPECT_TRUE(test::poll_until([&] { return a->count() == 2; }, 2s));
  EXPECT_TRUE(test::poll_until([&] { return b->count() == 2; }, 2s));
  std::scoped_lock lock(a->mu);
  EXPECT_NE(a->messages[0].find("campaign_progress"), std::string::npos);
  EXPECT_NE(a->messages[1].find("campaign_paused"), std::string::npos);
}

TEST_F(EventHubTest, FilterLimitsToOneCampaign) {
  auto sink = std::make_shared<CollectingSink>();
  hub.subscribe(sink, CampaignId{"wanted"});

  hub.publish(event("other", EventType::CampaignProgress));
  hub.publish(event("wanted", EventType::CampaignCompleted));

  EXPECT_TRUE(test::poll_until([&] { return sink->count() == 1; }, 2s));
  std::this_thread::sleep_for(50ms);
  std::scoped_lock lock(sink->mu);
  ASSERT_EQ(sink->messages.size(), 1U);
  EXPECT_NE(sink->messages[0].find("wanted"), std::string::npos);
}

TEST_F(EventHubTest, ClosedSinksAreDropped) {
  auto sink = std::make_shared<CollectingSink>();
  hub.subscribe(sink);
  sink->closed = true;
  hub.publish(event("c-1", EventType::CampaignProgress));

  EXPECT_TRUE(test::poll_until([&] { return hub.subscriber_count() == 0; }, 2s));
  EXPECT_EQ(sink->count(), 0U);
}

TEST_F(EventHubTest, PublishWithoutRuntimeIsIgnored) {
  Runtime stopped{1};
  EventHub idle{stopped};
  idle.publish(event("c-1", EventType::CampaignProgress));
  EXPECT_EQ(idle.subscriber_count(), 0U);
}
