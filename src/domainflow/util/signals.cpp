#include "domainflow/util/signals.hpp"

#include <atomic>
#include <csignal>

namespace domainflow {
namespace {

std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int) {
  g_shutdown_requested.store(true, std::memory_order_release);
  g_shutdown_requested.notify_one();
}

} // namespace

void setup_signal_handlers() {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);
  std::signal(SIGPIPE, SIG_IGN);
}

auto shutdown_requested() noexcept -> bool {
  return g_shutdown_requested.load(std::memory_order_acquire);
}

void wait_for_shutdown() {
  g_shutdown_requested.wait(false, std::memory_order_acquire);
}

} // namespace domainflow
