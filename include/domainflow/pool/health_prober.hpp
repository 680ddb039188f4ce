#pragma once

#include "domainflow/config/system_config.hpp"
#include "domainflow/core/coroutine.hpp"
#include "domainflow/model/resource.hpp"
#include "domainflow/pool/resource_pool_manager.hpp"
#include "domainflow/util/time.hpp"

#include <atomic>
#include <cstddef>

namespace domainflow {

class Runtime;

/// Checks whether a resource with an open circuit works again.
class ResourceProber {
public:
  virtual ~ResourceProber() = default;
  virtual auto probe_persona(const Persona &persona) -> task<bool> = 0;
  virtual auto probe_proxy(const Proxy &proxy) -> task<bool> = 0;
};

/// Background loops over the shared HealthRegistry: one probes open circuits
/// once their probe interval has elapsed (open -> half_open -> closed/open),
/// the other writes changed health back to the store.
class HealthProber {
public:
  HealthProber(Runtime &runtime, ResourcePoolManager &pools,
               ResourceProber &prober, PoolConfig config);
  ~HealthProber() = default;

  HealthProber(const HealthProber &) = delete;
  auto operator=(const HealthProber &) -> HealthProber & = delete;

  auto start() -> void;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
  }

  /// One probing round. Returns how many resources were probed.
  auto probe_once(util::TimePoint now) -> task<std::size_t>;

private:
  auto probe_loop() -> task<void>;
  auto flush_loop() -> task<void>;

  Runtime &runtime_;
  ResourcePoolManager &pools_;
  ResourceProber &prober_;
  PoolConfig config_;
  std::atomic<bool> running_{false};
  std::atomic<int> inflight_{0};
};

} // namespace domainflow
