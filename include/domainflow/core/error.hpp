#pragma once

#include <array>
#include <concepts>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace domainflow {

enum class Error : std::uint8_t {
  Success,
  FileNotFound,
  ParseError,
  DatabaseError,
  DatabaseOpenFailed,
  DatabaseQueryFailed,
  InvalidArgument,
  InvalidConfig,
  NotFound,
  AlreadyExists,
  Timeout,
  Cancelled,
  Exhausted,
  Transport,
  LeaseExpired,
  LeaseLost,
  ResourcePoolExhausted,
  InvalidState,
  InvalidUrl,
  ProtocolError,
  SystemNotRunning,
  BatchWriteFailed,
  Unknown,
};

class ErrorCategory : public std::error_category {
  static constexpr std::array<std::string_view, 23> messages = {
      "success",
      "file not found",
      "parse error",
      "database error",
      "failed to open database",
      "database query failed",
      "invalid argument",
      "invalid campaign configuration",
      "not found",
      "already exists",
      "timeout",
      "cancelled",
      "pattern space exhausted",
      "transport error",
      "job lease expired",
      "job lease lost to another worker",
      "resource pool exhausted",
      "invalid state transition",
      "invalid URL",
      "protocol error",
      "system not running",
      "batch write retries exhausted",
      "unknown error",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char * override {
    return "domainflow";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= std::size(messages)) {
      std::unreachable();
    }
    return std::string{messages.at(idx)};
  }
};

inline auto error_category() -> const ErrorCategory & {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

template <typename T>
concept ResultValue = std::destructible<T> || std::is_void_v<T>;

template <typename T> using Result = std::expected<T, std::error_code>;

template <typename T>
  requires ResultValue<std::decay_t<T>>
[[nodiscard]] constexpr auto ok(T &&value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> { return {}; }

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

/// Transport-class failures are retried by the validation pipeline; every
/// other error is final for the attempt.
[[nodiscard]] inline auto is_transport_error(std::error_code ec) -> bool {
  if (ec.category() == error_category()) {
    return ec == make_error_code(Error::Transport) ||
           ec == make_error_code(Error::Timeout);
  }
  return static_cast<bool>(ec);
}

} // namespace domainflow

template <> struct std::is_error_code_enum<domainflow::Error> : std::true_type {};
