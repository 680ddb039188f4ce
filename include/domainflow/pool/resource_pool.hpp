#pragma once

#include "domainflow/core/error.hpp"
#include "domainflow/model/campaign.hpp"
#include "domainflow/model/resource.hpp"
#include "domainflow/pool/health_registry.hpp"
#include "domainflow/util/string_hash.hpp"
#include "domainflow/util/time.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace domainflow {

struct PoolCandidate {
  std::string_view id;
  double success_rate{1.0};
};

/// Picks one of the eligible candidates. Candidates arrive sorted by id and
/// are never empty.
class Selector {
public:
  virtual ~Selector() = default;
  [[nodiscard]] virtual auto pick(std::span<const PoolCandidate> candidates,
                                  std::string_view domain) -> std::size_t = 0;
};

class RoundRobinSelector final : public Selector {
public:
  [[nodiscard]] auto pick(std::span<const PoolCandidate> candidates,
                          std::string_view domain) -> std::size_t override;

private:
  std::uint64_t next_{0};
};

/// Smooth weighted round-robin (the nginx upstream algorithm) with the
/// success rate as weight, floored so that a poor resource still gets the
/// occasional turn.
class WeightedSelector final : public Selector {
public:
  static constexpr double kMinWeight = 0.01;

  [[nodiscard]] auto pick(std::span<const PoolCandidate> candidates,
                          std::string_view domain) -> std::size_t override;

private:
  StringMap<double> current_;
};

/// Same domain, same resource, for as long as the active set is unchanged.
class StickySelector final : public Selector {
public:
  [[nodiscard]] auto pick(std::span<const PoolCandidate> candidates,
                          std::string_view domain) -> std::size_t override;
};

[[nodiscard]] auto make_selector(SelectionStrategy strategy)
    -> std::unique_ptr<Selector>;

/// The personas or proxies one campaign may use, with the campaign's
/// selection strategy and rotation interval on top of the shared health.
class ResourcePool {
public:
  ResourcePool(ResourceKind kind, std::vector<std::string> ids,
               SelectionStrategy strategy, std::chrono::seconds rotation,
               std::shared_ptr<HealthRegistry> registry);

  /// Error::ResourcePoolExhausted when nothing is eligible. `exclude` (the
  /// resource of the previous attempt) is honoured only while another
  /// resource remains.
  [[nodiscard]] auto select(std::string_view domain, std::string_view exclude,
                            util::TimePoint now) -> Result<std::string>;

  auto report(std::string_view id, bool success, util::TimePoint now) -> void;

  [[nodiscard]] auto kind() const noexcept -> ResourceKind { return kind_; }
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return ids_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return ids_.empty(); }
  [[nodiscard]] auto ids() const noexcept -> std::span<const std::string> {
    return ids_;
  }

private:
  [[nodiscard]] auto eligible(util::TimePoint now) const
      -> std::vector<PoolCandidate>;

  ResourceKind kind_;
  std::vector<std::string> ids_;
  std::chrono::seconds rotation_;
  std::shared_ptr<HealthRegistry> registry_;
  std::mutex mu_;
  std::unique_ptr<Selector> selector_;
};

} // namespace domainflow
