#include "domainflow/cli/commands.hpp"
#include "domainflow/util/log.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <string>

namespace {
auto default_config() -> std::string {
  if (const char *env = std::getenv("DOMAINFLOW_CONFIG"); env && *env) {
    return env;
  }
  return {};
}
} // namespace

int main(int argc, char *argv[]) {
  // Keep non-serve CLI output clean by default.
  domainflow::log::set_output_stderr();
  domainflow::log::set_level(domainflow::log::Level::Warn);

  CLI::App app{"domainflow",
               "Domain generation and DNS/HTTP validation campaigns"};
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  domainflow serve -c system.toml\n"
             "  domainflow run -c system.toml --plan plan.toml\n"
             "  domainflow preview --charset abc --length 2 --tld com\n"
             "\nTip: Set DOMAINFLOW_CONFIG=system.toml to skip -c on "
             "every command.");

  const std::string env_config = default_config();

  domainflow::cli::ServeOptions serve_opts;
  auto *serve =
      app.add_subcommand("serve", "Run workers until SIGINT/SIGTERM");
  serve_opts.config_file = env_config;
  auto *serve_cfg =
      serve->add_option("-c,--config", serve_opts.config_file,
                        "System config file")
          ->check(CLI::ExistingFile);
  if (env_config.empty())
    serve_cfg->required();
  serve->add_option("--log-file", serve_opts.log_file, "Log file path");
  serve->add_option("--log-level", serve_opts.log_level,
                    "Log level override: trace|debug|info|warn|error");
  serve->add_option("--shards", serve_opts.shards,
                    "Number of shards (default: config or 4)");
  serve->add_option("--workers", serve_opts.workers,
                    "Concurrent job workers");
  serve->callback(
      [&serve_opts]() { std::exit(domainflow::cli::cmd_serve(serve_opts)); });

  domainflow::cli::RunOptions run_opts;
  auto *run = app.add_subcommand(
      "run", "Submit a campaign plan and wait for every stage to settle");
  run->footer("\nExit status: 0 when every stage completed, 2 when one "
              "failed, paused or was cancelled, 1 on errors.");
  run_opts.config_file = env_config;
  run->add_option("-c,--config", run_opts.config_file, "System config file")
      ->check(CLI::ExistingFile);
  run->add_option("-p,--plan", run_opts.plan_file, "Campaign plan (TOML)")
      ->required()
      ->check(CLI::ExistingFile);
  run->add_option("--timeout", run_opts.timeout_sec,
                  "Seconds to wait before giving up (0 = no limit)");
  run->add_flag("--memory", run_opts.memory,
                "Use the in-process store instead of MySQL");
  run->add_flag("--json", run_opts.json, "Output JSON");
  run->callback(
      [&run_opts]() { std::exit(domainflow::cli::cmd_run(run_opts)); });

  domainflow::cli::ListOptions list_opts;
  auto *list = app.add_subcommand("list", "List stored campaigns");
  list_opts.config_file = env_config;
  auto *list_cfg =
      list->add_option("-c,--config", list_opts.config_file,
                       "System config file")
          ->check(CLI::ExistingFile);
  if (env_config.empty())
    list_cfg->required();
  list->add_flag("--json", list_opts.json, "Output JSON");
  list->callback(
      [&list_opts]() { std::exit(domainflow::cli::cmd_list(list_opts)); });

  domainflow::cli::PreviewOptions preview_opts;
  auto *preview = app.add_subcommand(
      "preview", "Print the domains a generation pattern yields");
  preview
      ->add_option("--pattern", preview_opts.pattern_type,
                   "prefix|suffix|both")
      ->check(CLI::IsMember({"prefix", "suffix", "both"}, CLI::ignore_case));
  preview->add_option("--charset", preview_opts.character_set,
                      "Characters of the variable part")
      ->required();
  preview->add_option("--length", preview_opts.variable_length,
                      "Length of the variable part")
      ->required();
  preview->add_option("--constant", preview_opts.constant_string,
                      "Constant part");
  preview->add_option("--tld", preview_opts.tld, "Top-level domain");
  preview->add_option("--offset", preview_opts.offset, "First offset");
  preview->add_option("-n,--count", preview_opts.count, "Domains to print");
  preview->add_flag("--json", preview_opts.json, "Output JSON");
  preview->callback([&preview_opts]() {
    std::exit(domainflow::cli::cmd_preview(preview_opts));
  });

  CLI11_PARSE(app, argc, argv);
  return 0;
}
