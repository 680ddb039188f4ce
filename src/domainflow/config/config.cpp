#include "domainflow/config/config.hpp"
#include "domainflow/config/toml_util.hpp"

#include "domainflow/util/log.hpp"

#include <boost/lexical_cast.hpp>

#include <cstdlib>
#include <string>
#include <string_view>

namespace domainflow {
namespace detail {

struct StorageToml {
  std::string backend{"mysql"};
};

struct SystemToml {
  StorageToml storage{};
  DatabaseConfig database{};
  SchedulerConfig scheduler{};
  PoolConfig pool{};
  HttpConfig http{};
  LoggingConfig logging{};
};

} // namespace detail
} // namespace domainflow

namespace glz {
template <> struct meta<domainflow::detail::StorageToml> {
  using T = domainflow::detail::StorageToml;
  static constexpr auto value = object("backend", &T::backend);
};

template <> struct meta<domainflow::DatabaseConfig> {
  using T = domainflow::DatabaseConfig;
  static constexpr auto value =
      object("host", &T::host, "port", &T::port, "username", &T::username,
             "password", &T::password, "database", &T::database, "pool_size",
             &T::pool_size, "connect_timeout", &T::connect_timeout);
};

template <> struct meta<domainflow::SchedulerConfig> {
  using T = domainflow::SchedulerConfig;
  static constexpr auto value = object(
      "worker_id", &T::worker_id, "workers", &T::workers, "shards", &T::shards,
      "poll_interval_ms", &T::poll_interval_ms, "lease_sweep_interval_sec",
      &T::lease_sweep_interval_sec, "default_job_timeout_sec",
      &T::default_job_timeout_sec, "default_max_attempts",
      &T::default_max_attempts, "backoff_base_ms", &T::backoff_base_ms,
      "backoff_max_ms", &T::backoff_max_ms, "batches_per_lease",
      &T::batches_per_lease, "readiness_retry_ms", &T::readiness_retry_ms);
};

template <> struct meta<domainflow::PoolConfig> {
  using T = domainflow::PoolConfig;
  static constexpr auto value =
      object("circuit_failure_threshold", &T::circuit_failure_threshold,
             "probe_interval_sec", &T::probe_interval_sec,
             "health_flush_interval_sec", &T::health_flush_interval_sec,
             "dns_probe_name", &T::dns_probe_name);
};

template <> struct meta<domainflow::HttpConfig> {
  using T = domainflow::HttpConfig;
  static constexpr auto value =
      object("user_agent", &T::user_agent, "max_body_read_bytes",
             &T::max_body_read_bytes, "connect_timeout_ms",
             &T::connect_timeout_ms, "insecure_skip_verify",
             &T::insecure_skip_verify);
};

template <> struct meta<domainflow::LoggingConfig> {
  using T = domainflow::LoggingConfig;
  static constexpr auto value = object("level", &T::level, "file", &T::file);
};

template <> struct meta<domainflow::detail::SystemToml> {
  using T = domainflow::detail::SystemToml;
  static constexpr auto value =
      object("storage", &T::storage, "database", &T::database, "scheduler",
             &T::scheduler, "pool", &T::pool, "http", &T::http, "logging",
             &T::logging);
};
} // namespace glz

namespace domainflow {
namespace {

template <typename T> auto env_override(const char *name, T &target) -> void {
  const char *v = std::getenv(name);
  if (v == nullptr) {
    return;
  }
  if constexpr (std::is_same_v<T, std::string>) {
    target = v;
  } else if constexpr (std::is_same_v<T, bool>) {
    const std::string_view s{v};
    target = (s == "1" || s == "true" || s == "yes");
  } else {
    target = boost::lexical_cast<T>(v);
  }
}

auto apply_env_overrides(SystemConfig &cfg) -> Result<void> {
  std::string backend{to_string_view(cfg.storage.backend)};
  env_override("DOMAINFLOW_STORAGE_BACKEND", backend);
  auto parsed = util::try_parse_enum<StorageBackend>(backend);
  if (!parsed) {
    log::error("Unknown storage backend '{}'", backend);
    return fail(Error::ParseError);
  }
  cfg.storage.backend = *parsed;

  env_override("DOMAINFLOW_DB_HOST", cfg.database.host);
  env_override("DOMAINFLOW_DB_PORT", cfg.database.port);
  env_override("DOMAINFLOW_DB_USERNAME", cfg.database.username);
  env_override("DOMAINFLOW_DB_PASSWORD", cfg.database.password);
  env_override("DOMAINFLOW_DB_DATABASE", cfg.database.database);
  env_override("DOMAINFLOW_DB_POOL_SIZE", cfg.database.pool_size);
  env_override("DOMAINFLOW_DB_CONNECT_TIMEOUT", cfg.database.connect_timeout);

  env_override("DOMAINFLOW_WORKER_ID", cfg.scheduler.worker_id);
  env_override("DOMAINFLOW_WORKERS", cfg.scheduler.workers);
  env_override("DOMAINFLOW_SHARDS", cfg.scheduler.shards);
  env_override("DOMAINFLOW_POLL_INTERVAL_MS", cfg.scheduler.poll_interval_ms);
  env_override("DOMAINFLOW_LEASE_SWEEP_INTERVAL_SEC",
               cfg.scheduler.lease_sweep_interval_sec);

  env_override("DOMAINFLOW_HTTP_USER_AGENT", cfg.http.user_agent);
  env_override("DOMAINFLOW_HTTP_INSECURE", cfg.http.insecure_skip_verify);

  env_override("DOMAINFLOW_LOG_LEVEL", cfg.logging.level);
  env_override("DOMAINFLOW_LOG_FILE", cfg.logging.file);
  return ok();
}

[[nodiscard]] auto validate(const SystemConfig &cfg) -> Result<void> {
  const auto &s = cfg.scheduler;
  if (s.workers <= 0 || s.shards < 0 || s.poll_interval_ms <= 0 ||
      s.lease_sweep_interval_sec <= 0 || s.default_job_timeout_sec <= 0 ||
      s.default_max_attempts <= 0 || s.backoff_base_ms < 0 ||
      s.backoff_max_ms < s.backoff_base_ms || s.batches_per_lease <= 0 ||
      s.readiness_retry_ms <= 0) {
    log::error("Invalid [scheduler] configuration");
    return fail(Error::ParseError);
  }
  const auto &p = cfg.pool;
  if (p.circuit_failure_threshold <= 0 || p.probe_interval_sec <= 0 ||
      p.health_flush_interval_sec <= 0) {
    log::error("Invalid [pool] configuration");
    return fail(Error::ParseError);
  }
  if (cfg.http.max_body_read_bytes == 0 || cfg.http.connect_timeout_ms <= 0) {
    log::error("Invalid [http] configuration");
    return fail(Error::ParseError);
  }
  if (cfg.database.pool_size == 0) {
    log::error("Invalid [database] configuration");
    return fail(Error::ParseError);
  }
  return ok();
}

[[nodiscard]] auto finish(SystemConfig cfg) -> Result<SystemConfig> {
  return apply_env_overrides(cfg)
      .and_then([&] { return validate(cfg); })
      .transform([&] { return std::move(cfg); });
}

[[nodiscard]] auto convert_toml(std::string_view toml_text)
    -> Result<SystemConfig> {
  auto raw = toml_util::parse_toml<detail::SystemToml>(toml_text);
  if (!raw) {
    return fail(raw.error());
  }

  SystemConfig cfg{};
  auto backend = util::try_parse_enum<StorageBackend>(raw->storage.backend);
  if (!backend) {
    log::error("Unknown storage backend '{}'", raw->storage.backend);
    return fail(Error::ParseError);
  }
  cfg.storage.backend = *backend;
  cfg.database = std::move(raw->database);
  cfg.scheduler = std::move(raw->scheduler);
  cfg.pool = std::move(raw->pool);
  cfg.http = std::move(raw->http);
  cfg.logging = std::move(raw->logging);
  return finish(std::move(cfg));
}

} // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  auto text = toml_util::read_file(path);
  if (!text) {
    log::error("Cannot read configuration file {}", path);
    return fail(text.error());
  }
  return load_from_string(*text);
}

auto ConfigLoader::load_from_string(std::string_view toml_str)
    -> Result<SystemConfig> {
  try {
    return convert_toml(toml_str);
  } catch (const boost::bad_lexical_cast &e) {
    log::error("Invalid environment override: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigLoader::load_defaults() -> Result<SystemConfig> {
  try {
    return finish(SystemConfig{});
  } catch (const boost::bad_lexical_cast &e) {
    log::error("Invalid environment override: {}", e.what());
    return fail(Error::ParseError);
  }
}

} // namespace domainflow
