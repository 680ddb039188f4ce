#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>

namespace domainflow {

/// delay(n) = min(base * 2^n, max). Pure; the caller owns the attempt count.
class ExponentialBackoff {
public:
  struct Config {
    std::chrono::milliseconds base{1000};
    std::chrono::milliseconds max{std::chrono::minutes(5)};
  };

  ExponentialBackoff() = default;
  explicit ExponentialBackoff(Config cfg) : cfg_(cfg) {}

  [[nodiscard]] auto delay(std::int32_t attempts) const noexcept
      -> std::chrono::milliseconds {
    auto shift = static_cast<unsigned>(std::clamp(attempts, 0, 30));
    auto base = cfg_.base.count();
    if (base <= 0) {
      return std::chrono::milliseconds{0};
    }
    // Saturate before the multiplication can overflow.
    if (base > (cfg_.max.count() >> shift)) {
      return cfg_.max;
    }
    return std::min(std::chrono::milliseconds{base << shift}, cfg_.max);
  }

  [[nodiscard]] auto config() const noexcept -> const Config & { return cfg_; }

private:
  Config cfg_;
};

} // namespace domainflow
