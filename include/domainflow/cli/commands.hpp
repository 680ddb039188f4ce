#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace domainflow::cli {

struct ServeOptions {
  std::string config_file;
  std::optional<std::string> log_file;
  std::optional<std::string> log_level;
  std::optional<int> shards;
  std::optional<int> workers;
};

struct RunOptions {
  std::string config_file; // empty = defaults plus environment
  std::string plan_file;
  int timeout_sec{0}; // 0 = wait until every stage settles
  bool memory{false};
  bool json{false};
};

struct ListOptions {
  std::string config_file;
  bool json{false};
};

struct PreviewOptions {
  std::string pattern_type{"prefix"};
  std::int32_t variable_length{0};
  std::string character_set;
  std::string constant_string;
  std::string tld;
  std::int64_t offset{0};
  std::int64_t count{10};
  bool json{false};
};

auto cmd_serve(const ServeOptions &opts) -> int;
auto cmd_run(const RunOptions &opts) -> int;
auto cmd_list(const ListOptions &opts) -> int;
auto cmd_preview(const PreviewOptions &opts) -> int;

} // namespace domainflow::cli
