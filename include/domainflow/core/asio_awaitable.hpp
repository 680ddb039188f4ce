#pragma once

#include "domainflow/core/coroutine.hpp"
#include "domainflow/core/error.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/cancel_after.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

#include <chrono>
#include <tuple>

namespace domainflow {

inline constexpr auto use_nothrow =
    boost::asio::as_tuple(boost::asio::use_awaitable);

template <typename T>
[[nodiscard]] inline auto
as_result(std::tuple<boost::system::error_code, T> &&v) -> Result<T> {
  auto [ec, value] = std::move(v);
  if (ec) {
    return fail(ec);
  }
  return ok(std::move(value));
}

[[nodiscard]] inline auto as_result(std::tuple<boost::system::error_code> &&v)
    -> Result<void> {
  auto [ec] = std::move(v);
  if (ec) {
    return fail(ec);
  }
  return ok();
}

/// Maps asio timeouts (operation_aborted after cancel_after) onto Error::Timeout
/// and everything else onto Error::Transport.
[[nodiscard]] inline auto
classify_io_error(const boost::system::error_code &ec) -> std::error_code {
  if (ec == boost::asio::error::operation_aborted ||
      ec == boost::asio::error::timed_out) {
    return make_error_code(Error::Timeout);
  }
  return make_error_code(Error::Transport);
}

template <typename Rep, typename Period>
[[nodiscard]] inline auto
async_sleep(std::chrono::duration<Rep, Period> duration) -> task<void> {
  boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor,
                                  duration);
  [[maybe_unused]] auto [ec] = co_await timer.async_wait(use_nothrow);
}

} // namespace domainflow
