#pragma once

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <format>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <unistd.h>
#include <utility>

namespace domainflow::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error };

inline constexpr std::array<std::string_view, 5> level_names = {
    "trace", "debug", "info", "warn", "error"};

inline constexpr std::array<std::string_view, 5> level_colors = {
    "\o{33}[90m", "\o{33}[36m", "\o{33}[32m", "\o{33}[33m", "\o{33}[31m"};

[[nodiscard]] inline auto level_name(Level level) -> std::string_view {
  return level_names.at(std::to_underlying(level));
}

[[nodiscard]] inline auto parse_level(std::string_view name) -> Level {
  const auto *it = std::ranges::find(level_names, name);
  return it != level_names.end()
             ? static_cast<Level>(std::distance(level_names.begin(), it))
             : Level::Info;
}

/// Asynchronous line logger. Producers format on their own thread and hand the
/// line to a writer thread through a bounded channel; when the channel is full
/// and the sink is not a terminal the line is dropped instead of blocking.
class Logger {
  static constexpr std::size_t kQueueCapacity = 8192;
  using Channel = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, std::string)>;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> dropped_{0};

  std::mutex sink_mu_;
  FILE *sink_{stdout};
  FILE *owned_file_{nullptr};

  boost::asio::io_context writer_ctx_{1};
  std::shared_ptr<Channel> channel_;
  std::jthread writer_;

  auto write_line(std::string_view line) -> void {
    std::scoped_lock lock(sink_mu_);
    std::fwrite(line.data(), 1, line.size(), sink_);
  }

  auto flush() -> void {
    std::scoped_lock lock(sink_mu_);
    std::fflush(sink_);
  }

  auto receive_loop() -> void {
    auto channel = channel_;
    bool open = true;
    while (open) {
      channel->async_receive(
          [&](const boost::system::error_code &ec, std::string line) {
            if (ec) {
              open = false;
              return;
            }
            write_line(line);
          });
      writer_ctx_.restart();
      writer_ctx_.run();
      // Opportunistically drain whatever else is queued before flushing.
      while (channel->try_receive(
          [&](const boost::system::error_code &ec, std::string line) {
            if (!ec) {
              write_line(line);
            }
          })) {
      }
      flush();
    }
  }

  [[nodiscard]] auto sink_is_terminal() -> bool {
    std::scoped_lock lock(sink_mu_);
    const int fd = ::fileno(sink_);
    return fd >= 0 && ::isatty(fd) != 0;
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
    if (owned_file_ != nullptr) {
      std::fclose(owned_file_);
    }
  }

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  auto start() -> void {
    if (running_.exchange(true, std::memory_order_acq_rel))
      return;
    channel_ =
        std::make_shared<Channel>(writer_ctx_.get_executor(), kQueueCapacity);
    writer_ = std::jthread([this] { receive_loop(); });
  }

  auto stop() -> void {
    if (!running_.exchange(false, std::memory_order_acq_rel))
      return;
    channel_->close();
    if (writer_.joinable()) {
      writer_.join();
    }
    channel_.reset();
    if (auto n = dropped_.exchange(0); n > 0) {
      write_line(std::format("[logger] dropped {} messages\n", n));
    }
    flush();
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  auto set_output_stderr() -> void {
    std::scoped_lock lock(sink_mu_);
    sink_ = stderr;
  }

  /// Redirects output to `path` (append mode). An empty path restores stdout.
  auto set_output_file(std::string_view path) -> bool {
    FILE *next = stdout;
    if (!path.empty()) {
      next = std::fopen(std::string(path).c_str(), "a");
      if (next == nullptr) {
        return false;
      }
      std::setvbuf(next, nullptr, _IOLBF, 0);
    }
    std::scoped_lock lock(sink_mu_);
    std::fflush(sink_);
    if (owned_file_ != nullptr) {
      std::fclose(owned_file_);
    }
    owned_file_ = path.empty() ? nullptr : next;
    sink_ = next;
    return true;
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (level < level_.load(std::memory_order_acquire))
      return;

    auto time = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id()) %
               1000000;
    auto line = std::format("[{:%Y-%m-%d %H:%M:%S}] [{}{}\o{33}[0m] [{}] {}\n",
                            time, level_colors.at(std::to_underlying(level)),
                            level_name(level), tid,
                            std::format(fmt, std::forward<Args>(args)...));

    if (running_.load(std::memory_order_acquire) && channel_ &&
        channel_->try_send(boost::system::error_code{}, std::move(line))) {
      return;
    }
    if (running_.load(std::memory_order_acquire) && !sink_is_terminal()) {
      dropped_.fetch_add(1, std::memory_order_relaxed);
      return;
    }
    write_line(line);
    flush();
  }
};

inline auto logger() -> Logger & {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name));
}

inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}

inline auto set_output_stderr() -> void { logger().set_output_stderr(); }

inline auto start() -> void { logger().start(); }
inline auto stop() -> void { logger().stop(); }

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

} // namespace domainflow::log
