#include "domainflow/pool/health_prober.hpp"

#include "domainflow/core/asio_awaitable.hpp"
#include "domainflow/core/runtime.hpp"
#include "domainflow/util/log.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

namespace domainflow {

HealthProber::HealthProber(Runtime &runtime, ResourcePoolManager &pools,
                           ResourceProber &prober, PoolConfig config)
    : runtime_(runtime), pools_(pools), prober_(prober),
      config_(std::move(config)) {}

auto HealthProber::probe_once(util::TimePoint now) -> task<std::size_t> {
  auto &registry = pools_.registry();
  std::size_t probed = 0;

  for (const auto &id : registry.probe_candidates(ResourceKind::Persona, now)) {
    auto persona = pools_.find_persona(id);
    if (!persona) {
      continue;
    }
    registry.begin_probe(ResourceKind::Persona, id);
    const bool healthy = co_await prober_.probe_persona(*persona);
    registry.record_probe(ResourceKind::Persona, id, healthy,
                          util::Clock::now());
    ++probed;
  }

  for (const auto &id : registry.probe_candidates(ResourceKind::Proxy, now)) {
    auto proxy = pools_.find_proxy(id);
    if (!proxy) {
      continue;
    }
    registry.begin_probe(ResourceKind::Proxy, id);
    const bool healthy = co_await prober_.probe_proxy(*proxy);
    registry.record_probe(ResourceKind::Proxy, id, healthy, util::Clock::now());
    ++probed;
  }
  co_return probed;
}

auto HealthProber::probe_loop() -> task<void> {
  const auto interval =
      std::chrono::seconds(std::max(1, config_.probe_interval_sec));
  while (running_.load(std::memory_order_acquire)) {
    try {
      co_await async_sleep(interval);
    } catch (const std::exception &) {
      break;
    }
    if (!running_.load(std::memory_order_acquire)) {
      break;
    }
    inflight_.fetch_add(1, std::memory_order_acq_rel);
    const auto probed = co_await probe_once(util::Clock::now());
    inflight_.fetch_sub(1, std::memory_order_acq_rel);
    if (probed > 0) {
      log::info("Health prober checked {} resource(s)", probed);
    }
  }
}

auto HealthProber::flush_loop() -> task<void> {
  const auto interval =
      std::chrono::seconds(std::max(1, config_.health_flush_interval_sec));
  while (running_.load(std::memory_order_acquire)) {
    try {
      co_await async_sleep(interval);
    } catch (const std::exception &) {
      break;
    }
    inflight_.fetch_add(1, std::memory_order_acq_rel);
    auto written = co_await pools_.flush_health();
    inflight_.fetch_sub(1, std::memory_order_acq_rel);
    if (!written) {
      log::warn("Health flush failed: {}", written.error().message());
    } else if (*written > 0) {
      log::debug("Health flush wrote {} resource(s)", *written);
    }
  }
}

auto HealthProber::start() -> void {
  if (running_.exchange(true)) {
    return;
  }
  runtime_.spawn_external(probe_loop());
  runtime_.spawn_external(flush_loop());
}

auto HealthProber::stop() -> void {
  if (!running_.exchange(false)) {
    return;
  }
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(200);
  while (inflight_.load(std::memory_order_acquire) > 0 &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
}

} // namespace domainflow
