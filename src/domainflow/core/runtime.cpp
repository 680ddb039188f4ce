#include "domainflow/core/runtime.hpp"

#include "domainflow/core/asio_awaitable.hpp"
#include "domainflow/util/log.hpp"

#include <chrono>
#include <ranges>

namespace domainflow {

namespace {
constexpr unsigned kDefaultShards = 4;
constexpr auto kHeartbeatInterval = std::chrono::milliseconds(50);
constexpr auto kWatchdogPollInterval = std::chrono::milliseconds(100);
constexpr std::uint64_t kStallThresholdMs = 500;

[[nodiscard]] auto now_monotonic_ms() -> std::uint64_t {
  const auto now = std::chrono::steady_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}
} // namespace

Runtime::Runtime(unsigned num_shards)
    : num_shards_(num_shards == 0 ? kDefaultShards : num_shards) {
  shards_.reserve(num_shards_);
  work_guards_.resize(num_shards_);
  shard_last_tick_ms_.reserve(num_shards_);
  for (auto i : std::views::iota(0U, num_shards_)) {
    shards_.emplace_back(std::make_unique<Shard>(i));
    shard_last_tick_ms_.emplace_back(
        std::make_unique<std::atomic<std::uint64_t>>(now_monotonic_ms()));
  }
}

Runtime::~Runtime() noexcept { stop(); }

auto Runtime::start() -> Result<void> {
  if (running_.exchange(true))
    return ok();

  log::debug("Starting runtime with {} shards", num_shards_);

  threads_.reserve(num_shards_);
  for (auto i : std::views::iota(0U, num_shards_)) {
    auto &ctx = shards_[i]->ctx();
    ctx.restart();
    work_guards_[i].emplace(boost::asio::make_work_guard(ctx));
    threads_.emplace_back([this, i] { run_shard(i); });
  }

  start_stall_detection();
  return ok();
}

auto Runtime::stop() noexcept -> void {
  if (!running_.exchange(false))
    return;
  stop_stall_detection();

  for (auto i : std::views::iota(0U, num_shards_)) {
    if (work_guards_[i].has_value()) {
      work_guards_[i]->reset();
      work_guards_[i].reset();
    }
    shards_[i]->ctx().stop();
  }
  threads_.clear();
}

auto Runtime::is_running() const noexcept -> bool {
  return running_.load(std::memory_order_acquire);
}

auto Runtime::current_shard() const noexcept -> shard_id {
  if (detail::current_runtime != this) {
    return kInvalidShard;
  }
  return detail::current_shard_id;
}

auto Runtime::run_shard(shard_id id) -> void {
  detail::current_shard_id = id;
  detail::current_runtime = this;

  start_heartbeat_on_shard(id);
  shards_[id]->ctx().run();

  detail::current_shard_id = kInvalidShard;
  detail::current_runtime = nullptr;
}

auto Runtime::stall_age_ms(shard_id id) const -> std::uint64_t {
  if (id >= num_shards_) {
    return 0;
  }
  const auto last_tick =
      shard_last_tick_ms_[id]->load(std::memory_order_acquire);
  const auto now_ms = now_monotonic_ms();
  return now_ms >= last_tick ? (now_ms - last_tick) : 0;
}

auto Runtime::start_heartbeat_on_shard(shard_id id) -> void {
  auto heartbeat = [](Runtime *self, shard_id s_id) -> spawn_task {
    while (self->running_.load(std::memory_order_acquire)) {
      self->shard_last_tick_ms_[s_id]->store(now_monotonic_ms(),
                                             std::memory_order_release);
      co_await async_sleep(kHeartbeatInterval);
    }
  };
  spawn_on(id, heartbeat(this, id));
}

auto Runtime::start_stall_detection() -> void {
  for (auto &tick : shard_last_tick_ms_) {
    tick->store(now_monotonic_ms(), std::memory_order_release);
  }

  stall_watchdog_thread_ = std::jthread([this](std::stop_token st) {
    std::vector<bool> warned(num_shards_, false);
    while (!st.stop_requested() && running_.load(std::memory_order_acquire)) {
      std::this_thread::sleep_for(kWatchdogPollInterval);
      for (auto i : std::views::iota(0U, num_shards_)) {
        const auto age_ms = stall_age_ms(i);
        if (age_ms > kStallThresholdMs) {
          if (!warned[i]) {
            log::warn("Shard {} stalled ({} ms without heartbeat)", i, age_ms);
            warned[i] = true;
          }
        } else {
          warned[i] = false;
        }
      }
    }
  });
}

auto Runtime::stop_stall_detection() -> void {
  if (stall_watchdog_thread_.joinable()) {
    stall_watchdog_thread_.request_stop();
    stall_watchdog_thread_.join();
  }
}

} // namespace domainflow
