#include "domainflow/app/application.hpp"
#include "domainflow/app/campaign_plan.hpp"
#include "domainflow/cli/commands.hpp"
#include "domainflow/cli/common.hpp"
#include "domainflow/util/log.hpp"
#include "domainflow/util/signals.hpp"

#include <algorithm>
#include <chrono>
#include <print>

namespace domainflow::cli {
namespace {

constexpr auto kWaitSlice = std::chrono::seconds(1);

} // namespace

auto cmd_run(const RunOptions &opts) -> int {
  auto config_res = load_config_or_print(opts.config_file);
  if (!config_res) {
    return 1;
  }
  auto config = std::move(*config_res);
  if (opts.memory) {
    config.storage.backend = StorageBackend::Memory;
  }

  auto plan = load_plan_from_file(opts.plan_file);
  if (!plan) {
    std::println(stderr, "Error: invalid plan '{}': {}", opts.plan_file,
                 plan.error().message());
    return 1;
  }

  if (!config.logging.file.empty() &&
      !log::set_output_file(config.logging.file)) {
    std::println(stderr, "Error: Failed to open log file: {}",
                 config.logging.file);
    return 1;
  }
  log::set_level(config.logging.level);

  Application app(std::move(config));
  if (auto r = app.start(); !r) {
    std::println(stderr, "Error: failed to start: {}", r.error().message());
    log::stop();
    return 1;
  }
  setup_signal_handlers();

  auto submitted = app.submit(*plan);
  if (!submitted) {
    std::println(stderr, "Error: plan rejected: {}",
                 submitted.error().message());
    app.stop();
    log::stop();
    return 1;
  }
  const auto ids = submitted->ids();
  std::println(stderr, "Submitted {} campaign(s) for plan '{}'", ids.size(),
               plan->name);

  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(opts.timeout_sec);
  Result<std::vector<Campaign>> final_state = fail(Error::Timeout);
  while (!shutdown_requested()) {
    final_state = app.wait_until_settled(ids, kWaitSlice);
    if (final_state || final_state.error() != make_error_code(Error::Timeout)) {
      break;
    }
    if (opts.timeout_sec > 0 && std::chrono::steady_clock::now() >= deadline) {
      break;
    }
  }

  if (!final_state) {
    std::println(stderr, "Warning: plan did not settle: {}",
                 final_state.error().message());
    final_state = app.read_campaigns(ids);
  }

  app.stop();
  log::stop();

  if (!final_state) {
    std::println(stderr, "Error: {}", final_state.error().message());
    return 1;
  }
  print_campaigns(*final_state, opts.json);
  const bool all_completed =
      std::ranges::all_of(*final_state, [](const Campaign &c) {
        return c.status == CampaignStatus::Completed;
      });
  return all_completed ? 0 : 2;
}

} // namespace domainflow::cli
