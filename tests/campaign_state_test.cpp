#include "domainflow/model/campaign_state.hpp"

#include <gtest/gtest.h>

using namespace domainflow;
using S = CampaignStatus;

TEST(CampaignStateTest, ForwardLifecycle) {
  EXPECT_TRUE(can_transition(S::Pending, S::Queued));
  EXPECT_TRUE(can_transition(S::Queued, S::Running));
  EXPECT_TRUE(can_transition(S::Running, S::Completed));
  EXPECT_TRUE(can_transition(S::Completed, S::Archived));
}

TEST(CampaignStateTest, PauseResumeAndRetry) {
  EXPECT_TRUE(can_transition(S::Running, S::Paused));
  EXPECT_TRUE(can_transition(S::Queued, S::Paused));
  EXPECT_TRUE(can_transition(S::Paused, S::Queued));
  EXPECT_TRUE(can_transition(S::Paused, S::Running));
  EXPECT_TRUE(can_transition(S::Failed, S::Queued));
}

TEST(CampaignStateTest, TerminalStatesAreSticky) {
  for (auto to : {S::Pending, S::Queued, S::Running, S::Paused, S::Completed,
                  S::Failed}) {
    EXPECT_FALSE(can_transition(S::Cancelled, to));
    EXPECT_FALSE(can_transition(S::Archived, to));
  }
  EXPECT_FALSE(can_transition(S::Completed, S::Running));
  EXPECT_TRUE(allowed_transitions(S::Cancelled).empty());
}

TEST(CampaignStateTest, IllegalMovesReportInvalidState) {
  EXPECT_EQ(check_transition(S::Pending, S::Running).error(),
            make_error_code(Error::InvalidState));
  EXPECT_EQ(check_transition(S::Pending, S::Completed).error(),
            make_error_code(Error::InvalidState));
  EXPECT_TRUE(check_transition(S::Pending, S::Cancelled).has_value());
}

TEST(CampaignStateTest, TerminalClassification) {
  EXPECT_TRUE(is_terminal(S::Completed));
  EXPECT_TRUE(is_terminal(S::Failed));
  EXPECT_TRUE(is_terminal(S::Cancelled));
  EXPECT_TRUE(is_terminal(S::Archived));
  EXPECT_FALSE(is_terminal(S::Paused));
  EXPECT_FALSE(is_terminal(S::Running));
}

TEST(CampaignStateTest, StatusNamesAreSnakeCase) {
  EXPECT_EQ(to_string_view(CampaignType::HttpKeywordValidation),
            "http_keyword_validation");
  EXPECT_EQ(parse<CampaignStatus>("running"), S::Running);
  EXPECT_EQ(util::try_parse_enum<CampaignStatus>("bogus"), std::nullopt);
}
