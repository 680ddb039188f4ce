#include "domainflow/pool/resource_pool.hpp"

#include "domainflow/util/hash.hpp"
#include "domainflow/util/log.hpp"

#include <algorithm>
#include <ranges>
#include <tuple>
#include <utility>

namespace domainflow {

auto RoundRobinSelector::pick(std::span<const PoolCandidate> candidates,
                              std::string_view /*domain*/) -> std::size_t {
  return static_cast<std::size_t>(next_++ % candidates.size());
}

auto WeightedSelector::pick(std::span<const PoolCandidate> candidates,
                            std::string_view /*domain*/) -> std::size_t {
  for (const auto &c : candidates) {
    if (!current_.contains(c.id)) {
      current_.emplace(std::string(c.id), 0.0);
    }
  }
  double total = 0.0;
  std::size_t best = 0;
  double *best_weight = nullptr;
  for (auto [i, c] : candidates | std::views::enumerate) {
    const double w = std::max(c.success_rate, kMinWeight);
    total += w;
    auto &current = current_.find(c.id)->second;
    current += w;
    if (best_weight == nullptr || current > *best_weight) {
      best = static_cast<std::size_t>(i);
      best_weight = &current;
    }
  }
  *best_weight -= total;
  return best;
}

auto StickySelector::pick(std::span<const PoolCandidate> candidates,
                          std::string_view domain) -> std::size_t {
  return static_cast<std::size_t>(util::stable_hash(domain) %
                                  candidates.size());
}

auto make_selector(SelectionStrategy strategy) -> std::unique_ptr<Selector> {
  switch (strategy) {
  case SelectionStrategy::WeightedBySuccessRate:
    return std::make_unique<WeightedSelector>();
  case SelectionStrategy::StickyPerDomain:
    return std::make_unique<StickySelector>();
  case SelectionStrategy::RoundRobin:
    break;
  }
  return std::make_unique<RoundRobinSelector>();
}

ResourcePool::ResourcePool(ResourceKind kind, std::vector<std::string> ids,
                           SelectionStrategy strategy,
                           std::chrono::seconds rotation,
                           std::shared_ptr<HealthRegistry> registry)
    : kind_(kind), ids_(std::move(ids)), rotation_(rotation),
      registry_(std::move(registry)), selector_(make_selector(strategy)) {
  std::ranges::sort(ids_);
  auto dup = std::ranges::unique(ids_);
  ids_.erase(dup.begin(), dup.end());
}

auto ResourcePool::eligible(util::TimePoint now) const
    -> std::vector<PoolCandidate> {
  std::vector<PoolCandidate> out;
  out.reserve(ids_.size());
  for (const auto &id : ids_) {
    auto health = registry_->get(kind_, id).value_or(ResourceHealth{});
    if (resource_state::is_eligible(health, now)) {
      out.push_back({.id = id, .success_rate = health.success_rate});
    }
  }
  return out;
}

auto ResourcePool::select(std::string_view domain, std::string_view exclude,
                          util::TimePoint now) -> Result<std::string> {
  std::scoped_lock lock(mu_);
  auto candidates = eligible(now);
  if (candidates.empty()) {
    return fail(Error::ResourcePoolExhausted);
  }

  auto drop = [&](std::string_view id) {
    if (candidates.size() < 2) {
      return;
    }
    std::erase_if(candidates,
                  [id](const PoolCandidate &c) { return c.id == id; });
  };
  if (!exclude.empty()) {
    drop(exclude);
  }

  auto chosen = candidates[selector_->pick(candidates, domain)].id;
  if (candidates.size() > 1 &&
      registry_->rotation_due(kind_, chosen, rotation_, now)) {
    registry_->rest(kind_, chosen, rotation_, now);
    drop(chosen);
    chosen = candidates[selector_->pick(candidates, domain)].id;
  }

  registry_->mark_used(kind_, chosen, now);
  return std::string(chosen);
}

auto ResourcePool::report(std::string_view id, bool success,
                          util::TimePoint now) -> void {
  std::ignore = registry_->report(kind_, id, success, now);
}

} // namespace domainflow
