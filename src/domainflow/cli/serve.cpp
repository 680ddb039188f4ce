#include "domainflow/app/application.hpp"
#include "domainflow/cli/commands.hpp"
#include "domainflow/cli/common.hpp"
#include "domainflow/util/log.hpp"
#include "domainflow/util/signals.hpp"

#include <print>

namespace domainflow::cli {

auto cmd_serve(const ServeOptions &opts) -> int {
  auto config_res = load_config_or_print(opts.config_file);
  if (!config_res) {
    return 1;
  }
  auto config = std::move(*config_res);

  if (opts.log_level) {
    config.logging.level = *opts.log_level;
  }
  if (opts.shards) {
    config.scheduler.shards = *opts.shards;
  }
  if (opts.workers) {
    config.scheduler.workers = *opts.workers;
  }

  const auto log_file = opts.log_file.value_or(config.logging.file);
  if (!log_file.empty() && !log::set_output_file(log_file)) {
    std::println(stderr, "Error: Failed to open log file: {}", log_file);
    return 1;
  }
  log::set_level(config.logging.level);

  Application app(std::move(config));
  if (auto r = app.start(); !r) {
    log::error("Failed to start: {}", r.error().message());
    log::stop();
    return 1;
  }

  setup_signal_handlers();
  log::info("domainflow serving as worker (storage={})",
            to_string_view(app.config().storage.backend));

  wait_for_shutdown();
  app.stop();
  log::stop();
  return 0;
}

} // namespace domainflow::cli
