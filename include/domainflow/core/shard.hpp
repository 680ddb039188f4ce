#pragma once

#include <boost/asio/io_context.hpp>

namespace domainflow {

using shard_id = unsigned;

/// One event loop driven by one runtime thread.
class Shard {
public:
  explicit Shard(shard_id id) : id_(id) {}

  Shard(const Shard &) = delete;
  Shard &operator=(const Shard &) = delete;

  [[nodiscard]] auto id() const noexcept -> shard_id { return id_; }
  [[nodiscard]] auto ctx() noexcept -> boost::asio::io_context & {
    return ctx_;
  }

private:
  shard_id id_;
  boost::asio::io_context ctx_{1};
};

} // namespace domainflow
