#include "domainflow/cli/commands.hpp"
#include "domainflow/cli/common.hpp"
#include "domainflow/cli/formatting.hpp"
#include "domainflow/storage/mysql_store.hpp"
#include "domainflow/util/json.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <algorithm>
#include <ranges>

namespace domainflow::cli {
namespace {

template <typename T>
auto run_async(boost::asio::io_context &io, task<T> op) -> T {
  auto fut = boost::asio::co_spawn(io, std::move(op), boost::asio::use_future);
  io.run();
  io.restart();
  return fut.get();
}

auto load_campaigns(storage::CampaignStore &store)
    -> task<Result<std::vector<Campaign>>> {
  if (auto r = co_await store.open(); !r) {
    co_return std::unexpected(r.error());
  }
  auto campaigns = co_await store.list_campaigns();
  co_await store.close();
  co_return campaigns;
}

} // namespace

auto print_campaigns(const std::vector<Campaign> &campaigns, bool json)
    -> void {
  if (json) {
    auto rows = campaigns | std::views::transform(summarize) |
                std::ranges::to<std::vector>();
    std::println("{}", write_json_of(rows));
    return;
  }

  fmt::Table table({{"ID", 36},
                    {"NAME", 24},
                    {"TYPE", 24},
                    {"STATUS", 10},
                    {"PROCESSED", 12, true},
                    {"OK", 10, true},
                    {"FAILED", 8, true},
                    {"PROGRESS", 22},
                    {"DURATION", 9}});
  table.print_header();
  for (const auto &c : campaigns) {
    const auto &n = c.counters;
    const double fraction =
        n.total_items > 0 ? static_cast<double>(n.processed_items) /
                                static_cast<double>(n.total_items)
                          : 0.0;
    table.print_row({c.id.str(), c.name.substr(0, 24),
                     std::string(to_string_view(c.type)),
                     fmt::colorize_status(c.status),
                     std::format("{}/{}", n.processed_items, n.total_items),
                     std::to_string(n.successful_items),
                     std::to_string(n.failed_items),
                     fmt::ascii_bar(std::clamp(fraction, 0.0, 1.0)),
                     fmt::format_duration(c.started_at, c.completed_at)});
    if (!c.error_message.empty()) {
      std::println("  {}", c.error_message);
    }
  }
  std::println("\n{}", fmt::ansi::bold(std::format("{} campaign(s)",
                                                   campaigns.size())));
}

auto cmd_list(const ListOptions &opts) -> int {
  auto config = load_config_or_print(opts.config_file);
  if (!config) {
    return 1;
  }

  if (config->storage.backend == StorageBackend::Memory) {
    std::println(stderr, "Error: the memory backend keeps no campaigns "
                         "between processes");
    return 1;
  }

  boost::asio::io_context io;
  storage::MySQLCampaignStore store(io.get_executor(), config->database);
  auto campaigns = run_async(io, load_campaigns(store));
  if (!campaigns) {
    std::println(stderr, "Error: {}", campaigns.error().message());
    return 1;
  }
  std::ranges::sort(*campaigns, {}, &Campaign::created_at);
  print_campaigns(*campaigns, opts.json);
  return 0;
}

} // namespace domainflow::cli
