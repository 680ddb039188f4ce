#pragma once

#include "domainflow/model/resource.hpp"
#include "domainflow/pool/resource_state.hpp"
#include "domainflow/util/string_hash.hpp"
#include "domainflow/util/time.hpp"

#include <array>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace domainflow {

struct DirtyHealth {
  ResourceKind kind{ResourceKind::Persona};
  std::string id;
  ResourceHealth health;
};

/// Process-wide health of every persona and proxy in use. Shared by all
/// campaign pools so that a resource failing for one campaign is excluded for
/// the others too. Values are eventually consistent with the store: changes
/// are marked dirty and written back by the health flush.
class HealthRegistry {
public:
  explicit HealthRegistry(resource_state::CircuitPolicy policy = {});

  /// Registers `initial` (usually the persisted health) unless the resource is
  /// already tracked.
  auto track(ResourceKind kind, std::string_view id,
             const ResourceHealth &initial) -> void;

  [[nodiscard]] auto get(ResourceKind kind, std::string_view id) const
      -> std::optional<ResourceHealth>;

  [[nodiscard]] auto is_eligible(ResourceKind kind, std::string_view id,
                                 util::TimePoint now) const -> bool;

  /// Outcome of one request made through the resource.
  auto report(ResourceKind kind, std::string_view id, bool success,
              util::TimePoint now) -> ResourceHealth;

  auto mark_used(ResourceKind kind, std::string_view id, util::TimePoint now)
      -> void;
  [[nodiscard]] auto rotation_due(ResourceKind kind, std::string_view id,
                                  std::chrono::seconds interval,
                                  util::TimePoint now) const -> bool;
  auto rest(ResourceKind kind, std::string_view id,
            std::chrono::seconds interval, util::TimePoint now) -> void;

  /// Open circuits whose probe interval has elapsed.
  [[nodiscard]] auto probe_candidates(ResourceKind kind,
                                      util::TimePoint now) const
      -> std::vector<std::string>;
  auto begin_probe(ResourceKind kind, std::string_view id) -> void;
  auto record_probe(ResourceKind kind, std::string_view id, bool success,
                    util::TimePoint now) -> ResourceHealth;

  /// Returns and clears everything changed since the previous call.
  [[nodiscard]] auto take_dirty() -> std::vector<DirtyHealth>;

  [[nodiscard]] auto policy() const noexcept
      -> const resource_state::CircuitPolicy & {
    return policy_;
  }

private:
  struct Entry {
    ResourceHealth health;
    bool dirty{false};
  };
  using EntryMap = StringMap<Entry>;

  [[nodiscard]] auto entries(ResourceKind kind) -> EntryMap &;
  [[nodiscard]] auto entries(ResourceKind kind) const -> const EntryMap &;

  template <typename F>
  auto update(ResourceKind kind, std::string_view id, F &&fn)
      -> ResourceHealth;

  resource_state::CircuitPolicy policy_;
  mutable std::mutex mu_;
  std::array<EntryMap, 2> maps_;
};

} // namespace domainflow
