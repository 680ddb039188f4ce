#pragma once

#include "domainflow/model/campaign.hpp"
#include "domainflow/util/enum.hpp"
#include "domainflow/util/id.hpp"
#include "domainflow/util/time.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <string>

namespace domainflow {

enum class JobStatus : std::uint8_t {
  Pending,
  Locked,
  Running,
  Completed,
  Failed,
  RetryPending,
};
BOOST_DESCRIBE_ENUM(JobStatus, Pending, Locked, Running, Completed, Failed,
                    RetryPending)
DOMAINFLOW_DEFINE_ENUM_SERDE(JobStatus, JobStatus::Pending)

inline constexpr std::int32_t kMinJobPriority = 1;
inline constexpr std::int32_t kMaxJobPriority = 10;
inline constexpr std::int32_t kDefaultJobPriority = 5;

struct CampaignJob {
  JobId id;
  CampaignId campaign_id;
  CampaignType job_type{CampaignType::DomainGeneration};
  JobStatus status{JobStatus::Pending};
  std::int32_t priority{kDefaultJobPriority};
  std::int32_t attempts{0};
  std::int32_t max_attempts{3};
  std::string locked_by;
  util::TimePoint locked_at{};
  std::int32_t timeout_seconds{3600};
  util::TimePoint scheduled_at{};
  util::TimePoint next_execution_at{};
  std::string last_error;
  util::TimePoint created_at{};
  util::TimePoint updated_at{};
};

/// Conditional update of a job row. The store applies it only while the row
/// still has `expected_status` and `expected_locked_by`; otherwise the update
/// is rejected with Error::LeaseLost.
struct JobTransition {
  JobStatus expected_status{JobStatus::Pending};
  std::string expected_locked_by;

  JobStatus status{JobStatus::Pending};
  std::string locked_by;
  util::TimePoint locked_at{};
  std::int32_t attempts{0};
  util::TimePoint next_execution_at{};
  std::string last_error;
};

[[nodiscard]] constexpr auto is_terminal(JobStatus s) noexcept -> bool {
  return s == JobStatus::Completed || s == JobStatus::Failed;
}

[[nodiscard]] constexpr auto holds_lease(JobStatus s) noexcept -> bool {
  return s == JobStatus::Locked || s == JobStatus::Running;
}

} // namespace domainflow
