#pragma once

namespace domainflow {

/// SIGINT/SIGTERM request shutdown; SIGPIPE is ignored.
void setup_signal_handlers();
[[nodiscard]] auto shutdown_requested() noexcept -> bool;
void wait_for_shutdown();

} // namespace domainflow
