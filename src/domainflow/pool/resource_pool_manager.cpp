#include "domainflow/pool/resource_pool_manager.hpp"

#include "domainflow/util/log.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <utility>

namespace domainflow {

auto CampaignResources::persona(std::string_view id) const -> const Persona * {
  auto it = personas.find(PersonaId{id});
  return it == personas.end() ? nullptr : &it->second;
}

auto CampaignResources::proxy(std::string_view id) const -> const Proxy * {
  auto it = proxies.find(ProxyId{id});
  return it == proxies.end() ? nullptr : &it->second;
}

ResourcePoolManager::ResourcePoolManager(
    storage::CampaignStore &store, std::shared_ptr<HealthRegistry> registry)
    : store_(store), registry_(std::move(registry)) {}

auto ResourcePoolManager::acquire(const Campaign &campaign)
    -> task<Result<std::shared_ptr<CampaignResources>>> {
  {
    std::scoped_lock lock(mu_);
    if (auto it = campaigns_.find(campaign.id); it != campaigns_.end()) {
      co_return it->second;
    }
  }

  const auto *settings = validation_settings(campaign.params);
  if (settings == nullptr) {
    co_return fail(Error::InvalidArgument);
  }
  const auto wanted = campaign.type == CampaignType::DnsValidation
                          ? PersonaType::Dns
                          : PersonaType::Http;

  auto personas = co_await store_.get_personas(settings->persona_ids);
  if (!personas) {
    co_return fail(personas.error());
  }

  std::vector<Proxy> proxies;
  SelectionStrategy proxy_strategy = SelectionStrategy::RoundRobin;
  if (const auto *http = std::get_if<HttpValidationParams>(&campaign.params)) {
    proxy_strategy = http->proxy_strategy;
    if (!http->proxy_ids.empty()) {
      auto loaded = co_await store_.get_proxies(http->proxy_ids);
      if (!loaded) {
        co_return fail(loaded.error());
      }
      proxies = std::move(*loaded);
    }
  }

  auto res = std::make_shared<CampaignResources>();
  std::vector<std::string> persona_ids;
  for (auto &p : *personas) {
    if (!p.enabled || p.type() != wanted) {
      log::debug("campaign {}: skipping persona {} (enabled={}, type={})",
                 campaign.id, p.id, p.enabled, to_string_view(p.type()));
      continue;
    }
    registry_->track(ResourceKind::Persona, p.id.value(), p.health);
    persona_ids.push_back(p.id.str());
    res->personas.emplace(p.id, p);
  }

  std::vector<std::string> proxy_ids;
  for (auto &p : proxies) {
    if (!p.enabled) {
      continue;
    }
    registry_->track(ResourceKind::Proxy, p.id.value(), p.health);
    proxy_ids.push_back(p.id.str());
    res->proxies.emplace(p.id, p);
  }

  const auto rotation =
      std::chrono::seconds(std::max(0, settings->rotation_interval_seconds));
  res->persona_pool = std::make_shared<ResourcePool>(
      ResourceKind::Persona, std::move(persona_ids), settings->persona_strategy,
      rotation, registry_);
  if (!proxy_ids.empty()) {
    res->proxy_pool = std::make_shared<ResourcePool>(
        ResourceKind::Proxy, std::move(proxy_ids), proxy_strategy, rotation,
        registry_);
  }

  log::info("campaign {}: resource pool with {} persona(s), {} proxy(ies)",
            campaign.id, res->persona_pool->size(),
            res->proxy_pool ? res->proxy_pool->size() : 0);

  remember(*personas, proxies);
  std::scoped_lock lock(mu_);
  // A concurrent acquire may have won; both built the same pools.
  co_return campaigns_.try_emplace(campaign.id, res).first->second;
}

auto ResourcePoolManager::release(const CampaignId &id) -> void {
  std::scoped_lock lock(mu_);
  campaigns_.erase(id);
}

auto ResourcePoolManager::flush_health() -> task<Result<std::size_t>> {
  auto dirty = registry_->take_dirty();
  std::size_t written = 0;
  for (const auto &entry : dirty) {
    auto r = co_await store_.save_resource_health(entry.kind, entry.id,
                                                  entry.health);
    if (!r) {
      // The next change marks the entry dirty again.
      log::warn("Failed to persist health of {} {}: {}",
                to_string_view(entry.kind), entry.id, r.error().message());
      continue;
    }
    ++written;
  }
  co_return written;
}

auto ResourcePoolManager::find_persona(std::string_view id) const
    -> std::optional<Persona> {
  std::scoped_lock lock(mu_);
  auto it = known_personas_.find(PersonaId{id});
  if (it == known_personas_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto ResourcePoolManager::find_proxy(std::string_view id) const
    -> std::optional<Proxy> {
  std::scoped_lock lock(mu_);
  auto it = known_proxies_.find(ProxyId{id});
  if (it == known_proxies_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto ResourcePoolManager::remember(const std::vector<Persona> &personas,
                                   const std::vector<Proxy> &proxies) -> void {
  std::scoped_lock lock(mu_);
  for (const auto &p : personas) {
    known_personas_.insert_or_assign(p.id, p);
  }
  for (const auto &p : proxies) {
    known_proxies_.insert_or_assign(p.id, p);
  }
}

} // namespace domainflow
