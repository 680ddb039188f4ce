#pragma once

#include "domainflow/core/coroutine.hpp"
#include "domainflow/core/error.hpp"
#include "domainflow/model/campaign.hpp"
#include "domainflow/model/resource.hpp"
#include "domainflow/pool/health_registry.hpp"
#include "domainflow/pool/resource_pool.hpp"
#include "domainflow/storage/campaign_store.hpp"

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace domainflow {

/// Personas and proxies resolved for one validation campaign.
struct CampaignResources {
  ankerl::unordered_dense::map<PersonaId, Persona> personas;
  ankerl::unordered_dense::map<ProxyId, Proxy> proxies;
  std::shared_ptr<ResourcePool> persona_pool;
  std::shared_ptr<ResourcePool> proxy_pool; // null when fetching directly

  [[nodiscard]] auto persona(std::string_view id) const -> const Persona *;
  [[nodiscard]] auto proxy(std::string_view id) const -> const Proxy *;
};

/// Builds and caches per-campaign pools over the shared HealthRegistry and
/// writes health back to the store.
class ResourcePoolManager {
public:
  ResourcePoolManager(storage::CampaignStore &store,
                      std::shared_ptr<HealthRegistry> registry);

  /// Loads the campaign's enabled personas of the matching type (and its
  /// proxies for HTTP). Disabled or unknown entries are left out, so the pool
  /// may be empty; selection then reports ResourcePoolExhausted.
  auto acquire(const Campaign &campaign)
      -> task<Result<std::shared_ptr<CampaignResources>>>;

  /// Drops the cached pools; the next acquire reloads definitions.
  auto release(const CampaignId &id) -> void;

  /// Persists every health value changed since the last flush. Returns how
  /// many were written.
  auto flush_health() -> task<Result<std::size_t>>;

  [[nodiscard]] auto registry() const noexcept -> HealthRegistry & {
    return *registry_;
  }

  /// Definitions of every resource loaded so far, for the health prober.
  [[nodiscard]] auto find_persona(std::string_view id) const
      -> std::optional<Persona>;
  [[nodiscard]] auto find_proxy(std::string_view id) const
      -> std::optional<Proxy>;

private:
  auto remember(const std::vector<Persona> &personas,
                const std::vector<Proxy> &proxies) -> void;

  storage::CampaignStore &store_;
  std::shared_ptr<HealthRegistry> registry_;
  mutable std::mutex mu_;
  ankerl::unordered_dense::map<CampaignId, std::shared_ptr<CampaignResources>>
      campaigns_;
  ankerl::unordered_dense::map<PersonaId, Persona> known_personas_;
  ankerl::unordered_dense::map<ProxyId, Proxy> known_proxies_;
};

} // namespace domainflow
