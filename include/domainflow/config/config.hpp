#pragma once

#include "domainflow/config/system_config.hpp"
#include "domainflow/core/error.hpp"

#include <string_view>

namespace domainflow {

/// Loads SystemConfig from TOML and applies DOMAINFLOW_* environment
/// overrides on top.
class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str)
      -> Result<SystemConfig>;
  /// Defaults plus environment overrides, for running without a file.
  [[nodiscard]] static auto load_defaults() -> Result<SystemConfig>;
};

} // namespace domainflow
