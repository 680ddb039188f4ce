#include "domainflow/pool/health_registry.hpp"

#include "domainflow/util/log.hpp"

#include <tuple>
#include <utility>

namespace domainflow {

HealthRegistry::HealthRegistry(resource_state::CircuitPolicy policy)
    : policy_(policy) {}

auto HealthRegistry::entries(ResourceKind kind) -> EntryMap & {
  return maps_.at(std::to_underlying(kind));
}

auto HealthRegistry::entries(ResourceKind kind) const -> const EntryMap & {
  return maps_.at(std::to_underlying(kind));
}

template <typename F>
auto HealthRegistry::update(ResourceKind kind, std::string_view id, F &&fn)
    -> ResourceHealth {
  std::scoped_lock lock(mu_);
  auto &map = entries(kind);
  auto [it, inserted] = map.try_emplace(std::string(id));
  auto next = std::forward<F>(fn)(it->second.health);
  if (next != it->second.health || inserted) {
    it->second.health = next;
    it->second.dirty = true;
  }
  return next;
}

auto HealthRegistry::track(ResourceKind kind, std::string_view id,
                           const ResourceHealth &initial) -> void {
  std::scoped_lock lock(mu_);
  entries(kind).try_emplace(std::string(id), Entry{.health = initial});
}

auto HealthRegistry::get(ResourceKind kind, std::string_view id) const
    -> std::optional<ResourceHealth> {
  std::scoped_lock lock(mu_);
  const auto &map = entries(kind);
  auto it = map.find(id);
  if (it == map.end()) {
    return std::nullopt;
  }
  return it->second.health;
}

auto HealthRegistry::is_eligible(ResourceKind kind, std::string_view id,
                                 util::TimePoint now) const -> bool {
  std::scoped_lock lock(mu_);
  const auto &map = entries(kind);
  auto it = map.find(id);
  // Untracked resources have default health: closed and healthy.
  return it == map.end() ||
         resource_state::is_eligible(it->second.health, now);
}

auto HealthRegistry::report(ResourceKind kind, std::string_view id,
                            bool success, util::TimePoint now)
    -> ResourceHealth {
  auto next = update(kind, id, [&](const ResourceHealth &h) {
    return success ? resource_state::record_success(h, now)
                   : resource_state::record_failure(h, policy_, now);
  });
  if (!success && next.circuit == CircuitState::Open &&
      next.opened_at == now) {
    log::warn("{} {} circuit opened after {} consecutive failures",
              to_string_view(kind), id, next.consecutive_failures);
  }
  return next;
}

auto HealthRegistry::mark_used(ResourceKind kind, std::string_view id,
                               util::TimePoint now) -> void {
  std::ignore = update(kind, id, [&](const ResourceHealth &h) {
    return resource_state::mark_used(h, now);
  });
}

auto HealthRegistry::rotation_due(ResourceKind kind, std::string_view id,
                                  std::chrono::seconds interval,
                                  util::TimePoint now) const -> bool {
  std::scoped_lock lock(mu_);
  const auto &map = entries(kind);
  auto it = map.find(id);
  return it != map.end() &&
         resource_state::rotation_due(it->second.health, interval, now);
}

auto HealthRegistry::rest(ResourceKind kind, std::string_view id,
                          std::chrono::seconds interval, util::TimePoint now)
    -> void {
  std::ignore = update(kind, id, [&](const ResourceHealth &h) {
    return resource_state::rest(h, interval, now);
  });
  log::debug("{} {} rested for {}s", to_string_view(kind), id,
             interval.count());
}

auto HealthRegistry::probe_candidates(ResourceKind kind,
                                      util::TimePoint now) const
    -> std::vector<std::string> {
  std::scoped_lock lock(mu_);
  std::vector<std::string> out;
  for (const auto &[id, entry] : entries(kind)) {
    if (resource_state::probe_due(entry.health, policy_, now)) {
      out.push_back(id);
    }
  }
  return out;
}

auto HealthRegistry::begin_probe(ResourceKind kind, std::string_view id)
    -> void {
  std::ignore = update(kind, id, [](const ResourceHealth &h) {
    return resource_state::begin_probe(h);
  });
}

auto HealthRegistry::record_probe(ResourceKind kind, std::string_view id,
                                  bool success, util::TimePoint now)
    -> ResourceHealth {
  auto next = update(kind, id, [&](const ResourceHealth &h) {
    return resource_state::record_probe(h, success, now);
  });
  if (success) {
    log::info("{} {} probe succeeded, circuit closed", to_string_view(kind),
              id);
  } else {
    log::warn("{} {} probe failed, circuit stays open", to_string_view(kind),
              id);
  }
  return next;
}

auto HealthRegistry::take_dirty() -> std::vector<DirtyHealth> {
  std::scoped_lock lock(mu_);
  std::vector<DirtyHealth> out;
  for (auto kind : {ResourceKind::Persona, ResourceKind::Proxy}) {
    for (auto &[id, entry] : entries(kind)) {
      if (!entry.dirty) {
        continue;
      }
      entry.dirty = false;
      out.push_back({.kind = kind, .id = id, .health = entry.health});
    }
  }
  return out;
}

} // namespace domainflow
