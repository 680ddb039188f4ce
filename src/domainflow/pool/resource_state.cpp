#include "domainflow/pool/resource_state.hpp"

namespace domainflow::resource_state {

namespace {

auto refresh_rate(ResourceHealth &h) -> void {
  if (h.total_requests <= 0) {
    h.success_rate = 1.0;
    return;
  }
  h.success_rate = static_cast<double>(h.total_requests - h.failed_requests) /
                   static_cast<double>(h.total_requests);
}

} // namespace

auto record_success(ResourceHealth health, util::TimePoint now)
    -> ResourceHealth {
  health.total_requests += 1;
  health.consecutive_failures = 0;
  health.last_checked_at = now;
  refresh_rate(health);
  return health;
}

auto record_failure(ResourceHealth health, const CircuitPolicy &policy,
                    util::TimePoint now) -> ResourceHealth {
  health.total_requests += 1;
  health.failed_requests += 1;
  health.consecutive_failures += 1;
  health.last_checked_at = now;
  refresh_rate(health);
  if (health.circuit == CircuitState::Closed &&
      health.consecutive_failures >= policy.failure_threshold) {
    health.circuit = CircuitState::Open;
    health.healthy = false;
    health.opened_at = now;
  }
  return health;
}

auto probe_due(const ResourceHealth &health, const CircuitPolicy &policy,
               util::TimePoint now) -> bool {
  return health.circuit == CircuitState::Open &&
         now >= health.opened_at + policy.probe_interval;
}

auto begin_probe(ResourceHealth health) -> ResourceHealth {
  if (health.circuit == CircuitState::Open) {
    health.circuit = CircuitState::HalfOpen;
  }
  return health;
}

auto record_probe(ResourceHealth health, bool success, util::TimePoint now)
    -> ResourceHealth {
  health.last_checked_at = now;
  if (success) {
    health.circuit = CircuitState::Closed;
    health.healthy = true;
    health.consecutive_failures = 0;
    health.opened_at = {};
    return health;
  }
  health.circuit = CircuitState::Open;
  health.healthy = false;
  health.opened_at = now;
  return health;
}

auto is_eligible(const ResourceHealth &health, util::TimePoint now) -> bool {
  return health.circuit == CircuitState::Closed && health.healthy &&
         health.resting_until <= now;
}

auto mark_used(ResourceHealth health, util::TimePoint now) -> ResourceHealth {
  if (health.in_use_since == util::TimePoint{}) {
    health.in_use_since = now;
  }
  health.last_used_at = now;
  return health;
}

auto rotation_due(const ResourceHealth &health, std::chrono::seconds interval,
                  util::TimePoint now) -> bool {
  if (interval.count() <= 0 || health.in_use_since == util::TimePoint{}) {
    return false;
  }
  return now - health.in_use_since >= interval;
}

auto rest(ResourceHealth health, std::chrono::seconds interval,
          util::TimePoint now) -> ResourceHealth {
  health.resting_until = now + interval;
  health.in_use_since = {};
  return health;
}

} // namespace domainflow::resource_state
