#pragma once

#include "domainflow/core/coroutine.hpp"
#include "domainflow/core/error.hpp"
#include "domainflow/core/shard.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

namespace domainflow {

inline constexpr shard_id kInvalidShard = std::numeric_limits<shard_id>::max();

/// Thread-per-shard coroutine runtime. Every shard owns an io_context that is
/// run by exactly one thread; coroutines are spawned onto a shard and stay
/// there until they finish.
class Runtime {
public:
  explicit Runtime(unsigned num_shards = 0);
  ~Runtime() noexcept;

  Runtime(const Runtime &) = delete;
  Runtime &operator=(const Runtime &) = delete;

  [[nodiscard]] auto start() -> Result<void>;
  auto stop() noexcept -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  template <typename T> auto spawn_on(shard_id target, task<T> coro) -> void {
    co_spawn(executor_for(target), std::move(coro), detached);
  }

  /// Launch on the calling shard, or shard 0 from a foreign thread.
  template <typename T> auto spawn(task<T> coro) -> void {
    auto sid = current_shard();
    if (sid == kInvalidShard)
      sid = 0;
    spawn_on(sid, std::move(coro));
  }

  /// Launch on the next shard in round-robin order.
  template <typename T> auto spawn_external(task<T> coro) -> void {
    spawn_on(next_shard(), std::move(coro));
  }

  template <typename F> auto post_to(shard_id target, F &&fn) -> void {
    boost::asio::post(executor_for(target), std::forward<F>(fn));
  }

  [[nodiscard]] auto executor_for(shard_id id)
      -> boost::asio::io_context::executor_type {
    return shards_.at(id)->ctx().get_executor();
  }

  [[nodiscard]] auto next_shard() noexcept -> shard_id {
    return static_cast<shard_id>(
        external_rr_.fetch_add(1, std::memory_order_relaxed) %
        std::max(1U, num_shards_));
  }

  [[nodiscard]] auto shard_count() const noexcept -> unsigned {
    return num_shards_;
  }
  [[nodiscard]] auto current_shard() const noexcept -> shard_id;
  [[nodiscard]] auto stall_age_ms(shard_id id) const -> std::uint64_t;

private:
  auto run_shard(shard_id id) -> void;
  auto start_heartbeat_on_shard(shard_id id) -> void;
  auto start_stall_detection() -> void;
  auto stop_stall_detection() -> void;

  std::atomic<bool> running_{false};
  unsigned num_shards_;
  std::vector<std::unique_ptr<Shard>> shards_;
  std::vector<std::optional<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>>
      work_guards_;
  std::vector<std::jthread> threads_;
  std::jthread stall_watchdog_thread_;
  std::vector<std::unique_ptr<std::atomic<std::uint64_t>>> shard_last_tick_ms_;
  std::atomic<std::uint64_t> external_rr_{0};
};

namespace detail {
inline thread_local shard_id current_shard_id = kInvalidShard;
inline thread_local Runtime *current_runtime = nullptr;
} // namespace detail

} // namespace domainflow
