#pragma once

#include "domainflow/model/resource.hpp"
#include "domainflow/util/time.hpp"

#include <chrono>
#include <cstdint>

// Pure health and circuit transitions for personas and proxies:
//
//   closed --(consecutive_failures >= threshold)--> open
//   open   --(probe_interval elapsed)-------------> half_open
//   half_open --(probe ok)--> closed
//   half_open --(probe failed)--> open
//
// Every function takes the health as read and returns the next value.
namespace domainflow::resource_state {

struct CircuitPolicy {
  std::int32_t failure_threshold{5};
  std::chrono::seconds probe_interval{60};
};

[[nodiscard]] auto record_success(ResourceHealth health, util::TimePoint now)
    -> ResourceHealth;

[[nodiscard]] auto record_failure(ResourceHealth health,
                                  const CircuitPolicy &policy,
                                  util::TimePoint now) -> ResourceHealth;

/// Open and probe_interval has passed since the circuit opened.
[[nodiscard]] auto probe_due(const ResourceHealth &health,
                             const CircuitPolicy &policy, util::TimePoint now)
    -> bool;

[[nodiscard]] auto begin_probe(ResourceHealth health) -> ResourceHealth;

[[nodiscard]] auto record_probe(ResourceHealth health, bool success,
                                util::TimePoint now) -> ResourceHealth;

/// Closed, healthy and not resting.
[[nodiscard]] auto is_eligible(const ResourceHealth &health,
                               util::TimePoint now) -> bool;

/// Starts (or continues) a continuous-use window.
[[nodiscard]] auto mark_used(ResourceHealth health, util::TimePoint now)
    -> ResourceHealth;

/// True once the resource has been in continuous use for `interval`.
/// A zero interval disables rotation.
[[nodiscard]] auto rotation_due(const ResourceHealth &health,
                                std::chrono::seconds interval,
                                util::TimePoint now) -> bool;

/// Takes the resource out of selection for one interval and ends its usage
/// window.
[[nodiscard]] auto rest(ResourceHealth health, std::chrono::seconds interval,
                        util::TimePoint now) -> ResourceHealth;

} // namespace domainflow::resource_state
