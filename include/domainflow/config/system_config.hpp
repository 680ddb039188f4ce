#pragma once

#include "domainflow/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <string>

namespace domainflow {

enum class StorageBackend : std::uint8_t { Mysql, Memory };
BOOST_DESCRIBE_ENUM(StorageBackend, Mysql, Memory)
DOMAINFLOW_DEFINE_ENUM_SERDE(StorageBackend, StorageBackend::Mysql)

struct StorageConfig {
  StorageBackend backend{StorageBackend::Mysql};

  auto operator==(const StorageConfig &) const -> bool = default;
};

struct DatabaseConfig {
  std::string host{"127.0.0.1"};
  uint16_t port{3306};
  std::string username{"domainflow"};
  std::string password{"domainflow"};
  std::string database{"domainflow"};
  uint16_t pool_size{8};
  uint16_t connect_timeout{5}; // seconds

  auto operator==(const DatabaseConfig &) const -> bool = default;
};

struct SchedulerConfig {
  std::string worker_id; // empty = hostname-pid
  int workers{4};
  int shards{0}; // 0 = runtime default
  int poll_interval_ms{500};
  int lease_sweep_interval_sec{30};
  int default_job_timeout_sec{3600};
  int default_max_attempts{3};
  int backoff_base_ms{1000};
  int backoff_max_ms{300000};
  int batches_per_lease{50};
  int readiness_retry_ms{5000};

  auto operator==(const SchedulerConfig &) const -> bool = default;
};

struct PoolConfig {
  int circuit_failure_threshold{5};
  int probe_interval_sec{60};
  int health_flush_interval_sec{30};
  std::string dns_probe_name{"example.com"};

  auto operator==(const PoolConfig &) const -> bool = default;
};

struct HttpConfig {
  std::string user_agent{"DomainFlowHTTPValidator/1.0"};
  std::uint64_t max_body_read_bytes{5ULL * 1024 * 1024};
  int connect_timeout_ms{10000};
  bool insecure_skip_verify{false};

  auto operator==(const HttpConfig &) const -> bool = default;
};

struct LoggingConfig {
  std::string level{"info"};
  std::string file;

  auto operator==(const LoggingConfig &) const -> bool = default;
};

struct SystemConfig {
  StorageConfig storage;
  DatabaseConfig database;
  SchedulerConfig scheduler;
  PoolConfig pool;
  HttpConfig http;
  LoggingConfig logging;

  auto operator==(const SystemConfig &) const -> bool = default;
};

} // namespace domainflow
