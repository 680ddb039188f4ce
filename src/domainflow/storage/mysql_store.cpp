#include "domainflow/storage/mysql_store.hpp"

#include "domainflow/model/campaign_state.hpp"
#include "domainflow/model/codec.hpp"
#include "domainflow/scheduler/job_state.hpp"
#include "domainflow/storage/mysql_schema.hpp"
#include "domainflow/util/log.hpp"
#include "domainflow/util/time.hpp"

#include <boost/asio/cancel_after.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/mysql/any_connection.hpp>
#include <boost/mysql/connect_params.hpp>
#include <boost/mysql/format_sql.hpp>
#include <boost/mysql/pipeline.hpp>
#include <boost/mysql/results.hpp>
#include <boost/mysql/sequence.hpp>
#include <boost/mysql/with_params.hpp>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace domainflow::storage {
namespace {

using boost::asio::use_awaitable;

constexpr int kClaimRounds = 4;

[[nodiscard]] auto to_millis(util::TimePoint tp) -> std::int64_t {
  if (tp == util::TimePoint{}) {
    return 0;
  }
  return util::to_unix_millis(tp);
}

[[nodiscard]] auto from_millis(std::int64_t ts) -> util::TimePoint {
  return util::from_unix_millis(ts);
}

[[nodiscard]] auto split_sql_statements(std::string_view input)
    -> std::vector<std::string> {
  std::vector<std::string> out;
  std::string current;
  current.reserve(input.size());

  bool in_single = false;
  bool in_double = false;
  auto flush = [&] {
    auto first = current.find_first_not_of(" \n\r\t");
    if (first != std::string::npos) {
      auto last = current.find_last_not_of(" \n\r\t");
      out.emplace_back(current.substr(first, last - first + 1));
    }
    current.clear();
  };
  for (char c : input) {
    if (c == '\'' && !in_double) {
      in_single = !in_single;
    } else if (c == '"' && !in_single) {
      in_double = !in_double;
    }
    if (c == ';' && !in_single && !in_double) {
      flush();
      continue;
    }
    current.push_back(c);
  }
  flush();
  return out;
}

[[nodiscard]] auto make_pool_params(const DatabaseConfig &cfg)
    -> boost::mysql::pool_params {
  boost::mysql::pool_params params;
  params.server_address.emplace_host_and_port(cfg.host, cfg.port);
  params.username = cfg.username;
  params.password = cfg.password;
  params.database = cfg.database;
  params.initial_size = 1;
  params.max_size = std::max<std::size_t>(1, cfg.pool_size);
  params.thread_safe = true;
  params.connect_timeout = std::chrono::seconds(cfg.connect_timeout);
  params.ssl = boost::mysql::ssl_mode::disable;
  return params;
}

[[nodiscard]] auto as_i64(const boost::mysql::field_view &f) -> std::int64_t {
  if (f.is_int64()) {
    return f.as_int64();
  }
  if (f.is_uint64()) {
    return static_cast<std::int64_t>(f.as_uint64());
  }
  if (f.is_string()) {
    return std::stoll(std::string(f.as_string()));
  }
  return 0;
}

[[nodiscard]] auto as_i32(const boost::mysql::field_view &f) -> std::int32_t {
  return static_cast<std::int32_t>(as_i64(f));
}

[[nodiscard]] auto as_f64(const boost::mysql::field_view &f) -> double {
  if (f.is_double()) {
    return f.as_double();
  }
  if (f.is_float()) {
    return f.as_float();
  }
  return static_cast<double>(as_i64(f));
}

[[nodiscard]] auto as_bool(const boost::mysql::field_view &f) -> bool {
  return as_i64(f) != 0;
}

[[nodiscard]] auto as_sv(const boost::mysql::field_view &f)
    -> std::string_view {
  if (!f.is_string()) {
    return {};
  }
  auto s = f.as_string();
  return std::string_view(s.data(), s.size());
}

[[nodiscard]] auto as_str(const boost::mysql::field_view &f) -> std::string {
  if (f.is_string()) {
    return std::string(as_sv(f));
  }
  if (f.is_int64()) {
    return std::to_string(f.as_int64());
  }
  if (f.is_uint64()) {
    return std::to_string(f.as_uint64());
  }
  return {};
}

[[nodiscard]] auto as_time(const boost::mysql::field_view &f)
    -> util::TimePoint {
  return from_millis(as_i64(f));
}

// Column order of every campaigns SELECT below.
[[nodiscard]] auto to_campaign(const boost::mysql::row_view &row)
    -> Result<Campaign> {
  const auto type = parse<CampaignType>(as_sv(row.at(2)));
  auto params = codec::decode_params(type, as_sv(row.at(13)));
  if (!params) {
    log::warn("Corrupt params JSON for campaign {}", as_sv(row.at(0)));
    return fail(params.error());
  }
  return ok(Campaign{
      .id = CampaignId{as_str(row.at(0))},
      .name = as_str(row.at(1)),
      .type = type,
      .status = parse<CampaignStatus>(as_sv(row.at(3))),
      .counters =
          CampaignCounters{
              .total_items = as_i64(row.at(4)),
              .processed_items = as_i64(row.at(5)),
              .successful_items = as_i64(row.at(6)),
              .failed_items = as_i64(row.at(7)),
          },
      .progress =
          ProgressUpdate{
              .progress_percentage = as_f64(row.at(8)),
              .avg_processing_rate = as_f64(row.at(9)),
              .estimated_completion_at = as_time(row.at(10)),
              .last_heartbeat_at = as_time(row.at(11)),
          },
      .error_message = as_str(row.at(12)),
      .created_at = as_time(row.at(15)),
      .started_at = as_time(row.at(16)),
      .completed_at = as_time(row.at(17)),
      .updated_at = as_time(row.at(18)),
      .params = std::move(*params),
      .source_cursor = as_i64(row.at(14)),
  });
}

[[nodiscard]] auto to_job(const boost::mysql::row_view &row) -> CampaignJob {
  return CampaignJob{
      .id = JobId{as_str(row.at(0))},
      .campaign_id = CampaignId{as_str(row.at(1))},
      .job_type = parse<CampaignType>(as_sv(row.at(2))),
      .status = parse<JobStatus>(as_sv(row.at(3))),
      .priority = as_i32(row.at(4)),
      .attempts = as_i32(row.at(5)),
      .max_attempts = as_i32(row.at(6)),
      .locked_by = as_str(row.at(7)),
      .locked_at = as_time(row.at(8)),
      .timeout_seconds = as_i32(row.at(9)),
      .scheduled_at = as_time(row.at(10)),
      .next_execution_at = as_time(row.at(11)),
      .last_error = as_str(row.at(12)),
      .created_at = as_time(row.at(13)),
      .updated_at = as_time(row.at(14)),
  };
}

// Health columns start at `first`.
[[nodiscard]] auto to_health(const boost::mysql::row_view &row,
                             std::size_t first) -> ResourceHealth {
  return ResourceHealth{
      .healthy = as_bool(row.at(first)),
      .circuit = parse<CircuitState>(as_sv(row.at(first + 1))),
      .total_requests = as_i64(row.at(first + 2)),
      .failed_requests = as_i64(row.at(first + 3)),
      .consecutive_failures = as_i32(row.at(first + 4)),
      .success_rate = as_f64(row.at(first + 5)),
      .opened_at = as_time(row.at(first + 6)),
      .last_checked_at = as_time(row.at(first + 7)),
      .last_used_at = as_time(row.at(first + 8)),
      .in_use_since = {},
      .resting_until = as_time(row.at(first + 9)),
  };
}

[[nodiscard]] auto to_dns_result(const boost::mysql::row_view &row)
    -> DnsResult {
  return DnsResult{
      .campaign_id = CampaignId{as_str(row.at(0))},
      .domain_name = as_str(row.at(1)),
      .source_seq = as_i64(row.at(2)),
      .status = parse<DnsStatus>(as_sv(row.at(3))),
      .system_status = parse<SystemStatus>(as_sv(row.at(4))),
      .ips = codec::decode_strings(as_sv(row.at(5))).value_or(
          std::vector<std::string>{}),
      .resolver = as_str(row.at(6)),
      .persona_id = PersonaId{as_str(row.at(7))},
      .attempts = as_i32(row.at(8)),
      .duration_ms = as_i64(row.at(9)),
      .error = as_str(row.at(10)),
      .checked_at = as_time(row.at(11)),
  };
}

[[nodiscard]] auto to_http_result(const boost::mysql::row_view &row)
    -> HttpResult {
  return HttpResult{
      .campaign_id = CampaignId{as_str(row.at(0))},
      .domain_name = as_str(row.at(1)),
      .source_seq = as_i64(row.at(2)),
      .status = parse<HttpStatus>(as_sv(row.at(3))),
      .system_status = parse<SystemStatus>(as_sv(row.at(4))),
      .http_status_code = as_i32(row.at(5)),
      .final_url = as_str(row.at(6)),
      .redirect_count = as_i32(row.at(7)),
      .page_title = as_str(row.at(8)),
      .content_snippet = as_str(row.at(9)),
      .content_hash = as_str(row.at(10)),
      .content_length = as_i64(row.at(11)),
      .findings =
          codec::decode_findings(as_sv(row.at(12))).value_or(KeywordFindings{}),
      .persona_id = PersonaId{as_str(row.at(13))},
      .proxy_id = ProxyId{as_str(row.at(14))},
      .attempts = as_i32(row.at(15)),
      .duration_ms = as_i64(row.at(16)),
      .error = as_str(row.at(17)),
      .checked_at = as_time(row.at(18)),
  };
}

[[nodiscard]] auto validation_status_for(DnsStatus s)
    -> DomainValidationStatus {
  switch (s) {
  case DnsStatus::Resolved:
    return DomainValidationStatus::Valid;
  case DnsStatus::Unresolved:
    return DomainValidationStatus::Invalid;
  case DnsStatus::Error:
    break;
  }
  return DomainValidationStatus::Error;
}

template <typename F>
auto mysql_try(F &&f) -> task<typename std::invoke_result_t<F>::value_type> {
  try {
    co_return co_await std::forward<F>(f)();
  } catch (const std::exception &e) {
    log::error("MySQL operation failed: {}", e.what());
    co_return fail(Error::DatabaseQueryFailed);
  }
}

} // namespace

MySQLCampaignStore::MySQLCampaignStore(boost::asio::any_io_executor executor,
                                       const DatabaseConfig &config)
    : cfg_(config), pool_(executor, make_pool_params(config)) {}

MySQLCampaignStore::~MySQLCampaignStore() { pool_.cancel(); }

auto MySQLCampaignStore::ensure_database_exists() -> task<Result<void>> {
  std::string direct_connect_error;
  try {
    // Connecting to the configured database directly avoids needing the
    // CREATE DATABASE privilege outside of first runs.
    boost::mysql::connect_params params;
    params.server_address.emplace_host_and_port(cfg_.host, cfg_.port);
    params.username = cfg_.username;
    params.password = cfg_.password;
    params.database = cfg_.database;
    params.ssl = boost::mysql::ssl_mode::disable;

    boost::mysql::any_connection conn(pool_.get_executor());
    co_await conn.async_connect(
        params, boost::asio::cancel_after(
                    std::chrono::seconds(cfg_.connect_timeout), use_awaitable));
    co_await conn.async_close(use_awaitable);
    co_return ok();
  } catch (const std::exception &e) {
    direct_connect_error = e.what();
  }

  try {
    boost::mysql::connect_params params;
    params.server_address.emplace_host_and_port(cfg_.host, cfg_.port);
    params.username = cfg_.username;
    params.password = cfg_.password;
    params.ssl = boost::mysql::ssl_mode::disable;

    boost::mysql::any_connection conn(pool_.get_executor());
    co_await conn.async_connect(
        params, boost::asio::cancel_after(
                    std::chrono::seconds(cfg_.connect_timeout), use_awaitable));

    boost::mysql::results res;
    co_await conn.async_execute(
        boost::mysql::with_params("CREATE DATABASE IF NOT EXISTS {:i}",
                                  cfg_.database),
        res, use_awaitable);
    co_await conn.async_close(use_awaitable);
    co_return ok();
  } catch (const std::exception &e) {
    log::error(
        "MySQL ensure database failed: direct_connect='{}', create_db='{}'",
        direct_connect_error, e.what());
    co_return fail(Error::DatabaseOpenFailed);
  }
}

auto MySQLCampaignStore::open() -> task<Result<void>> {
  if (open_) {
    co_return ok();
  }

  auto db_res = co_await ensure_database_exists();
  if (!db_res) {
    co_return fail(db_res.error());
  }

  open_ = true;
  pool_.async_run(boost::asio::detached);

  auto conn_res = co_await get_connection();
  if (!conn_res) {
    open_ = false;
    co_return fail(conn_res.error());
  }

  auto schema_res = co_await ensure_schema(conn_res->get());
  if (!schema_res) {
    open_ = false;
    co_return fail(schema_res.error());
  }

  conn_res->return_without_reset();

  log::info("MySQL campaign store opened: {}:{} / {}", cfg_.host, cfg_.port,
            cfg_.database);
  co_return ok();
}

auto MySQLCampaignStore::close() -> task<void> {
  if (open_) {
    pool_.cancel();
    open_ = false;
  }
  co_return;
}

auto MySQLCampaignStore::is_open() const noexcept -> bool { return open_; }

auto MySQLCampaignStore::get_connection()
    -> task<Result<boost::mysql::pooled_connection>> {
  if (!open_) {
    co_return fail(Error::SystemNotRunning);
  }

  try {
    auto conn = co_await pool_.async_get_connection(boost::asio::cancel_after(
        std::chrono::seconds(cfg_.connect_timeout), use_awaitable));
    co_return ok(std::move(conn));
  } catch (const std::exception &e) {
    log::error("MySQL get connection failed: {}", e.what());
    co_return fail(Error::DatabaseOpenFailed);
  }
}

auto MySQLCampaignStore::ensure_schema(boost::mysql::any_connection &conn)
    -> task<Result<void>> {
  try {
    const auto stmts = split_sql_statements(schema::V1_SCHEMA);
    boost::mysql::pipeline_request req;
    for (const auto &stmt_sql : stmts) {
      req.add_execute(stmt_sql);
    }
    req.add_execute("INSERT IGNORE INTO schema_version(version) VALUES (" +
                    std::to_string(schema::CURRENT_SCHEMA_VERSION) + ")");

    std::vector<boost::mysql::stage_response> stage_responses;
    co_await conn.async_run_pipeline(req, stage_responses, use_awaitable);
    co_return ok();
  } catch (const std::exception &e) {
    log::error("MySQL schema ensure failed: {}", e.what());
    co_return fail(Error::DatabaseOpenFailed);
  }
}

auto MySQLCampaignStore::read_counters(boost::mysql::any_connection &conn,
                                       const CampaignId &id)
    -> task<Result<CampaignCounters>> {
  boost::mysql::results res;
  co_await conn.async_execute(
      boost::mysql::with_params(
          "SELECT total_items, processed_items, successful_items, "
          "failed_items FROM campaigns WHERE id = {}",
          id.str()),
      res, use_awaitable);
  if (res.rows().empty()) {
    co_return fail(Error::NotFound);
  }
  const auto row = res.rows().at(0);
  co_return ok(CampaignCounters{
      .total_items = as_i64(row.at(0)),
      .processed_items = as_i64(row.at(1)),
      .successful_items = as_i64(row.at(2)),
      .failed_items = as_i64(row.at(3)),
  });
}

// --- generation cursor ---------------------------------------------------

auto MySQLCampaignStore::ensure_generation_config(
    const GenerationConfigState &initial)
    -> task<Result<GenerationConfigState>> {
  co_return co_await mysql_try(
      [&]() -> task<Result<GenerationConfigState>> {
        auto conn_res = co_await get_connection();
        if (!conn_res) {
          co_return fail(conn_res.error());
        }

        // First writer wins; later writers keep the stored offset.
        boost::mysql::results ins_res;
        co_await conn_res->get().async_execute(
            boost::mysql::with_params(
                "INSERT IGNORE INTO generation_config_states(config_hash, "
                "total_possible_combinations, last_offset, config_details, "
                "updated_at) VALUES ({}, {}, 0, {}, {})",
                initial.fingerprint, initial.total_possible_combinations,
                initial.config_details,
                to_millis(util::Clock::now())),
            ins_res, use_awaitable);
        conn_res->return_without_reset();
        co_return co_await get_generation_config(initial.fingerprint);
      });
}

auto MySQLCampaignStore::get_generation_config(std::string_view fingerprint)
    -> task<Result<GenerationConfigState>> {
  co_return co_await mysql_try(
      [&]() -> task<Result<GenerationConfigState>> {
        auto conn_res = co_await get_connection();
        if (!conn_res) {
          co_return fail(conn_res.error());
        }

        boost::mysql::results res;
        co_await conn_res->get().async_execute(
            boost::mysql::with_params(
                "SELECT config_hash, total_possible_combinations, "
                "last_offset, config_details, updated_at "
                "FROM generation_config_states WHERE config_hash = {}",
                fingerprint),
            res, use_awaitable);
        conn_res->return_without_reset();
        if (res.rows().empty()) {
          co_return fail(Error::NotFound);
        }
        const auto row = res.rows().at(0);
        co_return ok(GenerationConfigState{
            .fingerprint = as_str(row.at(0)),
            .total_possible_combinations = as_i64(row.at(1)),
            .current_offset = as_i64(row.at(2)),
            .config_details = as_str(row.at(3)),
            .updated_at = as_time(row.at(4)),
        });
      });
}

auto MySQLCampaignStore::reserve_range(std::string_view fingerprint,
                                       std::int64_t batch_size)
    -> task<Result<OffsetRange>> {
  if (batch_size <= 0) {
    co_return fail(Error::InvalidArgument);
  }
  co_return co_await mysql_try([&]() -> task<Result<OffsetRange>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    auto &conn = conn_res->get();
    boost::mysql::results tx_res;
    co_await conn.async_execute("START TRANSACTION", tx_res, use_awaitable);

    boost::mysql::results sel_res;
    co_await conn.async_execute(
        boost::mysql::with_params(
            "SELECT total_possible_combinations, last_offset "
            "FROM generation_config_states WHERE config_hash = {} FOR UPDATE",
            fingerprint),
        sel_res, use_awaitable);

    boost::mysql::results commit_res;
    if (sel_res.rows().empty()) {
      co_await conn.async_execute("COMMIT", commit_res, use_awaitable);
      conn_res->return_without_reset();
      co_return fail(Error::NotFound);
    }

    const auto total = as_i64(sel_res.rows().at(0).at(0));
    const auto offset = as_i64(sel_res.rows().at(0).at(1));
    OffsetRange range{
        .start = offset,
        .size = std::min(batch_size, std::max<std::int64_t>(0, total - offset)),
    };

    if (!range.exhausted()) {
      boost::mysql::results upd_res;
      co_await conn.async_execute(
          boost::mysql::with_params(
              "UPDATE generation_config_states SET last_offset = {}, "
              "updated_at = {} WHERE config_hash = {}",
              range.end(), to_millis(util::Clock::now()), fingerprint),
          upd_res, use_awaitable);
    }

    co_await conn.async_execute("COMMIT", commit_res, use_awaitable);
    conn_res->return_without_reset();
    co_return ok(range);
  });
}

// --- campaigns -----------------------------------------------------------

auto MySQLCampaignStore::create_campaign(const Campaign &c)
    -> task<Result<void>> {
  co_return co_await mysql_try([&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "INSERT IGNORE INTO campaigns(id, name, campaign_type, status, "
            "total_items, processed_items, successful_items, failed_items, "
            "error_message, params, source_cursor, created_at, updated_at) "
            "VALUES ({}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {})",
            c.id.str(), c.name, c.type, c.status, c.counters.total_items,
            c.counters.processed_items, c.counters.successful_items,
            c.counters.failed_items, c.error_message,
            codec::encode_params(c.params), c.source_cursor,
            to_millis(c.created_at), to_millis(c.updated_at)),
        res, use_awaitable);
    conn_res->return_without_reset();
    if (res.affected_rows() == 0) {
      co_return fail(Error::AlreadyExists);
    }
    co_return ok();
  });
}

auto MySQLCampaignStore::get_campaign(const CampaignId &id)
    -> task<Result<Campaign>> {
  co_return co_await mysql_try([&]() -> task<Result<Campaign>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "SELECT id, name, campaign_type, status, total_items, "
            "processed_items, successful_items, failed_items, "
            "progress_percentage, avg_processing_rate, "
            "estimated_completion_at, last_heartbeat_at, error_message, "
            "params, source_cursor, created_at, started_at, completed_at, "
            "updated_at FROM campaigns WHERE id = {}",
            id.str()),
        res, use_awaitable);
    conn_res->return_without_reset();
    if (res.rows().empty()) {
      co_return fail(Error::NotFound);
    }
    co_return to_campaign(res.rows().at(0));
  });
}

auto MySQLCampaignStore::list_campaigns()
    -> task<Result<std::vector<Campaign>>> {
  co_return co_await mysql_try([&]() -> task<Result<std::vector<Campaign>>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        "SELECT id, name, campaign_type, status, total_items, "
        "processed_items, successful_items, failed_items, "
        "progress_percentage, avg_processing_rate, estimated_completion_at, "
        "last_heartbeat_at, error_message, params, source_cursor, "
        "created_at, started_at, completed_at, updated_at "
        "FROM campaigns ORDER BY created_at ASC, id ASC",
        res, use_awaitable);
    conn_res->return_without_reset();

    std::vector<Campaign> out;
    out.reserve(res.rows().size());
    for (auto row : res.rows()) {
      if (auto c = to_campaign(row); c) {
        out.push_back(std::move(*c));
      }
    }
    co_return ok(std::move(out));
  });
}

auto MySQLCampaignStore::update_campaign_status(const CampaignId &id,
                                                CampaignStatus expected,
                                                CampaignStatus next,
                                                std::string_view error_message)
    -> task<Result<void>> {
  if (!can_transition(expected, next)) {
    co_return fail(Error::InvalidState);
  }
  co_return co_await mysql_try([&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    const auto now_ms = to_millis(util::Clock::now());
    const auto started_ms = next == CampaignStatus::Running ? now_ms : 0;
    const auto completed_ms = is_terminal(next) ? now_ms : 0;

    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "UPDATE campaigns SET status = {}, updated_at = {}, "
            "error_message = IF({} = '', error_message, {}), "
            "started_at = IF(started_at = 0, {}, started_at), "
            "completed_at = IF({} > 0, {}, completed_at) "
            "WHERE id = {} AND status = {}",
            next, now_ms, error_message, error_message, started_ms,
            completed_ms, completed_ms, id.str(), expected),
        res, use_awaitable);

    if (res.affected_rows() == 0) {
      boost::mysql::results exists_res;
      co_await conn_res->get().async_execute(
          boost::mysql::with_params(
              "SELECT EXISTS(SELECT 1 FROM campaigns WHERE id = {})",
              id.str()),
          exists_res, use_awaitable);
      conn_res->return_without_reset();
      if (!as_bool(exists_res.rows().at(0).at(0))) {
        co_return fail(Error::NotFound);
      }
      co_return fail(Error::InvalidState);
    }
    conn_res->return_without_reset();
    co_return ok();
  });
}

auto MySQLCampaignStore::update_campaign_progress(const CampaignId &id,
                                                  const ProgressUpdate &p)
    -> task<Result<void>> {
  co_return co_await mysql_try([&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "UPDATE campaigns SET progress_percentage = {}, "
            "avg_processing_rate = {}, estimated_completion_at = {}, "
            "last_heartbeat_at = {}, updated_at = {} WHERE id = {}",
            p.progress_percentage, p.avg_processing_rate,
            to_millis(p.estimated_completion_at),
            to_millis(p.last_heartbeat_at), to_millis(util::Clock::now()),
            id.str()),
        res, use_awaitable);
    conn_res->return_without_reset();
    co_return ok();
  });
}

auto MySQLCampaignStore::set_campaign_total(const CampaignId &id,
                                            std::int64_t total)
    -> task<Result<CampaignCounters>> {
  co_return co_await mysql_try([&]() -> task<Result<CampaignCounters>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "UPDATE campaigns SET total_items = GREATEST({}, processed_items) "
            "WHERE id = {}",
            total, id.str()),
        res, use_awaitable);
    auto counters = co_await read_counters(conn_res->get(), id);
    conn_res->return_without_reset();
    co_return counters;
  });
}

// --- generated domains ---------------------------------------------------

auto MySQLCampaignStore::commit_generated_domains(
    const CampaignId &id, std::span<const GeneratedDomain> rows)
    -> task<Result<CampaignCounters>> {
  co_return co_await mysql_try([&]() -> task<Result<CampaignCounters>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    auto &conn = conn_res->get();
    if (rows.empty()) {
      auto counters = co_await read_counters(conn, id);
      conn_res->return_without_reset();
      co_return counters;
    }

    const auto now_ms = to_millis(util::Clock::now());
    auto format_row = [&](const GeneratedDomain &d,
                          boost::mysql::format_context_base &ctx) {
      boost::mysql::format_sql_to(ctx, "({}, {}, {}, {}, {})", id.str(),
                                  d.domain_name, d.offset_index,
                                  d.validation_status, now_ms);
    };

    boost::mysql::results tx_res;
    co_await conn.async_execute("START TRANSACTION", tx_res, use_awaitable);

    boost::mysql::results ins_res;
    co_await conn.async_execute(
        boost::mysql::with_params(
            "INSERT IGNORE INTO generated_domains(campaign_id, domain_name, "
            "offset_index, validation_status, created_at) VALUES {}",
            boost::mysql::sequence(rows, format_row)),
        ins_res, use_awaitable);
    const auto inserted = static_cast<std::int64_t>(ins_res.affected_rows());

    boost::mysql::results upd_res;
    co_await conn.async_execute(
        boost::mysql::with_params(
            "UPDATE campaigns SET processed_items = processed_items + {}, "
            "successful_items = successful_items + {}, "
            "total_items = GREATEST(total_items, processed_items), "
            "updated_at = {} WHERE id = {}",
            inserted, inserted, now_ms, id.str()),
        upd_res, use_awaitable);

    auto counters = co_await read_counters(conn, id);
    boost::mysql::results commit_res;
    co_await conn.async_execute("COMMIT", commit_res, use_awaitable);
    conn_res->return_without_reset();
    co_return counters;
  });
}

auto MySQLCampaignStore::list_generated_domains(const CampaignId &id,
                                                std::int64_t after_seq,
                                                std::int32_t limit)
    -> task<Result<std::vector<GeneratedDomain>>> {
  co_return co_await mysql_try(
      [&]() -> task<Result<std::vector<GeneratedDomain>>> {
        auto conn_res = co_await get_connection();
        if (!conn_res) {
          co_return fail(conn_res.error());
        }

        boost::mysql::results res;
        co_await conn_res->get().async_execute(
            boost::mysql::with_params(
                "SELECT seq, domain_name, offset_index, validation_status, "
                "created_at FROM generated_domains "
                "WHERE campaign_id = {} AND seq > {} ORDER BY seq LIMIT {}",
                id.str(), after_seq, limit),
            res, use_awaitable);
        conn_res->return_without_reset();

        std::vector<GeneratedDomain> out;
        out.reserve(res.rows().size());
        for (auto row : res.rows()) {
          out.push_back(GeneratedDomain{
              .seq = as_i64(row.at(0)),
              .campaign_id = id,
              .domain_name = as_str(row.at(1)),
              .offset_index = as_i64(row.at(2)),
              .validation_status =
                  parse<DomainValidationStatus>(as_sv(row.at(3))),
              .created_at = as_time(row.at(4)),
          });
        }
        co_return ok(std::move(out));
      });
}

// --- validation ----------------------------------------------------------

auto MySQLCampaignStore::list_source_candidates(const CampaignId &source,
                                                CampaignType source_type,
                                                std::int64_t after_seq,
                                                std::int32_t limit)
    -> task<Result<std::vector<SourceCandidate>>> {
  if (source_type == CampaignType::HttpKeywordValidation) {
    co_return fail(Error::InvalidConfig);
  }
  co_return co_await mysql_try(
      [&]() -> task<Result<std::vector<SourceCandidate>>> {
        auto conn_res = co_await get_connection();
        if (!conn_res) {
          co_return fail(conn_res.error());
        }

        boost::mysql::results res;
        if (source_type == CampaignType::DomainGeneration) {
          co_await conn_res->get().async_execute(
              boost::mysql::with_params(
                  "SELECT seq, domain_name FROM generated_domains "
                  "WHERE campaign_id = {} AND seq > {} ORDER BY seq LIMIT {}",
                  source.str(), after_seq, limit),
              res, use_awaitable);
        } else {
          co_await conn_res->get().async_execute(
              boost::mysql::with_params(
                  "SELECT seq, domain_name FROM dns_results "
                  "WHERE campaign_id = {} AND status = {} AND seq > {} "
                  "ORDER BY seq LIMIT {}",
                  source.str(), DnsStatus::Resolved, after_seq, limit),
              res, use_awaitable);
        }
        conn_res->return_without_reset();

        std::vector<SourceCandidate> out;
        out.reserve(res.rows().size());
        for (auto row : res.rows()) {
          out.push_back(SourceCandidate{.seq = as_i64(row.at(0)),
                                        .domain_name = as_str(row.at(1))});
        }
        co_return ok(std::move(out));
      });
}

auto MySQLCampaignStore::count_source_candidates(const CampaignId &source,
                                                 CampaignType source_type)
    -> task<Result<std::int64_t>> {
  if (source_type == CampaignType::HttpKeywordValidation) {
    co_return fail(Error::InvalidConfig);
  }
  co_return co_await mysql_try([&]() -> task<Result<std::int64_t>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    boost::mysql::results res;
    if (source_type == CampaignType::DomainGeneration) {
      co_await conn_res->get().async_execute(
          boost::mysql::with_params(
              "SELECT COUNT(*) FROM generated_domains WHERE campaign_id = {}",
              source.str()),
          res, use_awaitable);
    } else {
      co_await conn_res->get().async_execute(
          boost::mysql::with_params("SELECT COUNT(*) FROM dns_results "
                                    "WHERE campaign_id = {} AND status = {}",
                                    source.str(), DnsStatus::Resolved),
          res, use_awaitable);
    }
    conn_res->return_without_reset();
    co_return ok(as_i64(res.rows().at(0).at(0)));
  });
}

auto MySQLCampaignStore::commit_dns_results(const CampaignId &id,
                                            std::span<const DnsResult> results,
                                            std::int64_t source_cursor)
    -> task<Result<CampaignCounters>> {
  co_return co_await mysql_try([&]() -> task<Result<CampaignCounters>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    auto &conn = conn_res->get();

    boost::mysql::results tx_res;
    co_await conn.async_execute("START TRANSACTION", tx_res, use_awaitable);

    boost::mysql::results lock_res;
    co_await conn.async_execute(
        boost::mysql::with_params(
            "SELECT campaign_type, params FROM campaigns WHERE id = {} "
            "FOR UPDATE",
            id.str()),
        lock_res, use_awaitable);
    boost::mysql::results commit_res;
    if (lock_res.rows().empty()) {
      co_await conn.async_execute("COMMIT", commit_res, use_awaitable);
      conn_res->return_without_reset();
      co_return fail(Error::NotFound);
    }
    auto params = codec::decode_params(
        parse<CampaignType>(as_sv(lock_res.rows().at(0).at(0))),
        as_sv(lock_res.rows().at(0).at(1)));

    std::vector<DnsResult> positive;
    std::vector<DnsResult> negative;
    for (const auto &r : results) {
      (is_positive(r.status) ? positive : negative).push_back(r);
    }

    auto format_result = [&](const DnsResult &r,
                             boost::mysql::format_context_base &ctx) {
      boost::mysql::format_sql_to(
          ctx, "({}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {})", id.str(),
          r.domain_name, r.source_seq, r.status, r.system_status,
          codec::encode_strings(r.ips), r.resolver, r.persona_id.str(),
          r.attempts, r.duration_ms, r.error, to_millis(r.checked_at));
    };
    auto insert = [&](const std::vector<DnsResult> &batch)
        -> task<std::int64_t> {
      if (batch.empty()) {
        co_return 0;
      }
      boost::mysql::results ins_res;
      co_await conn.async_execute(
          boost::mysql::with_params(
              "INSERT IGNORE INTO dns_results(campaign_id, domain_name, "
              "source_seq, status, system_status, ips, resolver, persona_id, "
              "attempts, duration_ms, error, checked_at) VALUES {}",
              boost::mysql::sequence(std::cref(batch), format_result)),
          ins_res, use_awaitable);
      co_return static_cast<std::int64_t>(ins_res.affected_rows());
    };
    const auto ok_count = co_await insert(positive);
    const auto bad_count = co_await insert(negative);

    // Reflect outcomes on the generation campaign's domain rows.
    const auto *settings = params ? validation_settings(*params) : nullptr;
    if (settings != nullptr &&
        settings->source_type == CampaignType::DomainGeneration) {
      for (auto status :
           {DnsStatus::Resolved, DnsStatus::Unresolved, DnsStatus::Error}) {
        std::vector<std::string> names;
        for (const auto &r : results) {
          if (r.status == status) {
            names.push_back(r.domain_name);
          }
        }
        if (names.empty()) {
          continue;
        }
        boost::mysql::results mark_res;
        co_await conn.async_execute(
            boost::mysql::with_params(
                "UPDATE generated_domains SET validation_status = {} "
                "WHERE campaign_id = {} AND domain_name IN ({})",
                validation_status_for(status),
                settings->source_campaign_id.str(), names),
            mark_res, use_awaitable);
      }
    }

    boost::mysql::results upd_res;
    co_await conn.async_execute(
        boost::mysql::with_params(
            "UPDATE campaigns SET processed_items = processed_items + {}, "
            "successful_items = successful_items + {}, "
            "failed_items = failed_items + {}, "
            "total_items = GREATEST(total_items, processed_items), "
            "source_cursor = GREATEST(source_cursor, {}), updated_at = {} "
            "WHERE id = {}",
            ok_count + bad_count, ok_count, bad_count, source_cursor,
            to_millis(util::Clock::now()), id.str()),
        upd_res, use_awaitable);

    auto counters = co_await read_counters(conn, id);
    co_await conn.async_execute("COMMIT", commit_res, use_awaitable);
    conn_res->return_without_reset();
    co_return counters;
  });
}

auto MySQLCampaignStore::commit_http_results(
    const CampaignId &id, std::span<const HttpResult> results,
    std::int64_t source_cursor) -> task<Result<CampaignCounters>> {
  co_return co_await mysql_try([&]() -> task<Result<CampaignCounters>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    auto &conn = conn_res->get();

    std::vector<HttpResult> positive;
    std::vector<HttpResult> negative;
    for (const auto &r : results) {
      (is_positive(r.status) ? positive : negative).push_back(r);
    }

    auto format_result = [&](const HttpResult &r,
                             boost::mysql::format_context_base &ctx) {
      boost::mysql::format_sql_to(
          ctx,
          "({}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, "
          "{}, {}, {})",
          id.str(), r.domain_name, r.source_seq, r.status, r.system_status,
          r.http_status_code, r.final_url, r.redirect_count, r.page_title,
          r.content_snippet, r.content_hash, r.content_length,
          codec::encode_findings(r.findings), r.persona_id.str(),
          r.proxy_id.str(), r.attempts, r.duration_ms, r.error,
          to_millis(r.checked_at));
    };
    auto insert = [&](const std::vector<HttpResult> &batch)
        -> task<std::int64_t> {
      if (batch.empty()) {
        co_return 0;
      }
      boost::mysql::results ins_res;
      co_await conn.async_execute(
          boost::mysql::with_params(
              "INSERT IGNORE INTO http_results(campaign_id, domain_name, "
              "source_seq, status, system_status, http_status_code, "
              "final_url, redirect_count, page_title, content_snippet, "
              "content_hash, content_length, findings, persona_id, proxy_id, "
              "attempts, duration_ms, error, checked_at) VALUES {}",
              boost::mysql::sequence(std::cref(batch), format_result)),
          ins_res, use_awaitable);
      co_return static_cast<std::int64_t>(ins_res.affected_rows());
    };

    boost::mysql::results tx_res;
    co_await conn.async_execute("START TRANSACTION", tx_res, use_awaitable);
    const auto ok_count = co_await insert(positive);
    const auto bad_count = co_await insert(negative);

    boost::mysql::results upd_res;
    co_await conn.async_execute(
        boost::mysql::with_params(
            "UPDATE campaigns SET processed_items = processed_items + {}, "
            "successful_items = successful_items + {}, "
            "failed_items = failed_items + {}, "
            "total_items = GREATEST(total_items, processed_items), "
            "source_cursor = GREATEST(source_cursor, {}), updated_at = {} "
            "WHERE id = {}",
            ok_count + bad_count, ok_count, bad_count, source_cursor,
            to_millis(util::Clock::now()), id.str()),
        upd_res, use_awaitable);

    auto counters = co_await read_counters(conn, id);
    boost::mysql::results commit_res;
    co_await conn.async_execute("COMMIT", commit_res, use_awaitable);
    conn_res->return_without_reset();
    co_return counters;
  });
}

auto MySQLCampaignStore::list_dns_results(const CampaignId &id)
    -> task<Result<std::vector<DnsResult>>> {
  co_return co_await mysql_try([&]() -> task<Result<std::vector<DnsResult>>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "SELECT campaign_id, domain_name, source_seq, status, "
            "system_status, ips, resolver, persona_id, attempts, "
            "duration_ms, error, checked_at FROM dns_results "
            "WHERE campaign_id = {} ORDER BY seq",
            id.str()),
        res, use_awaitable);
    conn_res->return_without_reset();

    std::vector<DnsResult> out;
    out.reserve(res.rows().size());
    for (auto row : res.rows()) {
      out.push_back(to_dns_result(row));
    }
    co_return ok(std::move(out));
  });
}

auto MySQLCampaignStore::list_http_results(const CampaignId &id)
    -> task<Result<std::vector<HttpResult>>> {
  co_return co_await mysql_try([&]() -> task<Result<std::vector<HttpResult>>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "SELECT campaign_id, domain_name, source_seq, status, "
            "system_status, http_status_code, final_url, redirect_count, "
            "page_title, content_snippet, content_hash, content_length, "
            "findings, persona_id, proxy_id, attempts, duration_ms, error, "
            "checked_at FROM http_results WHERE campaign_id = {} ORDER BY seq",
            id.str()),
        res, use_awaitable);
    conn_res->return_without_reset();

    std::vector<HttpResult> out;
    out.reserve(res.rows().size());
    for (auto row : res.rows()) {
      out.push_back(to_http_result(row));
    }
    co_return ok(std::move(out));
  });
}

// --- jobs ----------------------------------------------------------------

auto MySQLCampaignStore::enqueue_job(const CampaignJob &job)
    -> task<Result<void>> {
  co_return co_await mysql_try([&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "INSERT IGNORE INTO campaign_jobs(id, campaign_id, job_type, "
            "status, priority, attempts, max_attempts, locked_by, locked_at, "
            "timeout_seconds, scheduled_at, next_execution_at, last_error, "
            "created_at, updated_at) "
            "VALUES ({}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, "
            "{})",
            job.id.str(), job.campaign_id.str(), job.job_type, job.status,
            job.priority, job.attempts, job.max_attempts, job.locked_by,
            to_millis(job.locked_at), job.timeout_seconds,
            to_millis(job.scheduled_at), to_millis(job.next_execution_at),
            job.last_error, to_millis(job.created_at),
            to_millis(job.updated_at)),
        res, use_awaitable);
    conn_res->return_without_reset();
    if (res.affected_rows() == 0) {
      co_return fail(Error::AlreadyExists);
    }
    co_return ok();
  });
}

auto MySQLCampaignStore::get_job(const JobId &id)
    -> task<Result<CampaignJob>> {
  co_return co_await mysql_try([&]() -> task<Result<CampaignJob>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "SELECT id, campaign_id, job_type, status, priority, attempts, "
            "max_attempts, locked_by, locked_at, timeout_seconds, "
            "scheduled_at, next_execution_at, last_error, created_at, "
            "updated_at FROM campaign_jobs WHERE id = {}",
            id.str()),
        res, use_awaitable);
    conn_res->return_without_reset();
    if (res.rows().empty()) {
      co_return fail(Error::NotFound);
    }
    co_return ok(to_job(res.rows().at(0)));
  });
}

auto MySQLCampaignStore::list_jobs(const CampaignId &campaign)
    -> task<Result<std::vector<CampaignJob>>> {
  co_return co_await mysql_try(
      [&]() -> task<Result<std::vector<CampaignJob>>> {
        auto conn_res = co_await get_connection();
        if (!conn_res) {
          co_return fail(conn_res.error());
        }

        boost::mysql::results res;
        co_await conn_res->get().async_execute(
            boost::mysql::with_params(
                "SELECT id, campaign_id, job_type, status, priority, "
                "attempts, max_attempts, locked_by, locked_at, "
                "timeout_seconds, scheduled_at, next_execution_at, "
                "last_error, created_at, updated_at FROM campaign_jobs "
                "WHERE campaign_id = {} ORDER BY created_at ASC",
                campaign.str()),
            res, use_awaitable);
        conn_res->return_without_reset();

        std::vector<CampaignJob> out;
        out.reserve(res.rows().size());
        for (auto row : res.rows()) {
          out.push_back(to_job(row));
        }
        co_return ok(std::move(out));
      });
}

auto MySQLCampaignStore::claim_next_job(std::string_view worker_id,
                                        util::TimePoint now)
    -> task<Result<std::optional<CampaignJob>>> {
  co_return co_await mysql_try(
      [&]() -> task<Result<std::optional<CampaignJob>>> {
        auto conn_res = co_await get_connection();
        if (!conn_res) {
          co_return fail(conn_res.error());
        }

        auto &conn = conn_res->get();
        // A candidate taken between SELECT and UPDATE by another worker
        // sends us round for the next one.
        for (int round = 0; round < kClaimRounds; ++round) {
          boost::mysql::results tx_res;
          co_await conn.async_execute("START TRANSACTION", tx_res,
                                      use_awaitable);

          boost::mysql::results sel_res;
          co_await conn.async_execute(
              boost::mysql::with_params(
                  "SELECT id, campaign_id, job_type, status, priority, "
                  "attempts, max_attempts, locked_by, locked_at, "
                  "timeout_seconds, scheduled_at, next_execution_at, "
                  "last_error, created_at, updated_at FROM campaign_jobs "
                  "WHERE status = {} AND next_execution_at <= {} "
                  "ORDER BY priority DESC, scheduled_at ASC, id ASC "
                  "LIMIT 1 FOR UPDATE SKIP LOCKED",
                  JobStatus::Pending, to_millis(now)),
              sel_res, use_awaitable);

          boost::mysql::results commit_res;
          if (sel_res.rows().empty()) {
            co_await conn.async_execute("COMMIT", commit_res, use_awaitable);
            conn_res->return_without_reset();
            co_return ok(std::optional<CampaignJob>{});
          }

          auto job = to_job(sel_res.rows().at(0));
          auto t = job_state::claim(job, worker_id, now);
          if (!t) {
            co_await conn.async_execute("COMMIT", commit_res, use_awaitable);
            conn_res->return_without_reset();
            co_return ok(std::optional<CampaignJob>{});
          }

          boost::mysql::results upd_res;
          co_await conn.async_execute(
              boost::mysql::with_params(
                  "UPDATE campaign_jobs SET status = {}, locked_by = {}, "
                  "locked_at = {}, updated_at = {} "
                  "WHERE id = {} AND status = {}",
                  t->status, t->locked_by, to_millis(t->locked_at),
                  to_millis(now), job.id.str(), JobStatus::Pending),
              upd_res, use_awaitable);

          co_await conn.async_execute("COMMIT", commit_res, use_awaitable);
          if (upd_res.affected_rows() != 0) {
            conn_res->return_without_reset();
            co_return ok(std::optional<CampaignJob>{
                job_state::apply(std::move(job), *t, now)});
          }
          log::debug("Job {} was claimed elsewhere; trying the next one",
                     job.id);
        }
        conn_res->return_without_reset();
        co_return ok(std::optional<CampaignJob>{});
      });
}

auto MySQLCampaignStore::apply_job_transition(const JobId &id,
                                              const JobTransition &t)
    -> task<Result<CampaignJob>> {
  co_return co_await mysql_try([&]() -> task<Result<CampaignJob>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    auto &conn = conn_res->get();
    boost::mysql::results upd_res;
    co_await conn.async_execute(
        boost::mysql::with_params(
            "UPDATE campaign_jobs SET status = {}, locked_by = {}, "
            "locked_at = {}, attempts = {}, next_execution_at = {}, "
            "last_error = {}, updated_at = {} "
            "WHERE id = {} AND status = {} AND locked_by = {}",
            t.status, t.locked_by, to_millis(t.locked_at), t.attempts,
            to_millis(t.next_execution_at), t.last_error,
            to_millis(util::Clock::now()), id.str(), t.expected_status,
            t.expected_locked_by),
        upd_res, use_awaitable);

    boost::mysql::results res;
    co_await conn.async_execute(
        boost::mysql::with_params(
            "SELECT id, campaign_id, job_type, status, priority, attempts, "
            "max_attempts, locked_by, locked_at, timeout_seconds, "
            "scheduled_at, next_execution_at, last_error, created_at, "
            "updated_at FROM campaign_jobs WHERE id = {}",
            id.str()),
        res, use_awaitable);
    conn_res->return_without_reset();
    if (res.rows().empty()) {
      co_return fail(Error::NotFound);
    }
    auto job = to_job(res.rows().at(0));
    if (upd_res.affected_rows() == 0) {
      // MySQL reports 0 affected rows when nothing changed (a heartbeat in
      // the same millisecond); only a row in another state is a lost lease.
      if (job.status != t.status || job.locked_by != t.locked_by ||
          to_millis(job.locked_at) != to_millis(t.locked_at)) {
        co_return fail(Error::LeaseLost);
      }
    }
    co_return ok(std::move(job));
  });
}

auto MySQLCampaignStore::find_expired_leases(util::TimePoint now)
    -> task<Result<std::vector<CampaignJob>>> {
  co_return co_await mysql_try(
      [&]() -> task<Result<std::vector<CampaignJob>>> {
        auto conn_res = co_await get_connection();
        if (!conn_res) {
          co_return fail(conn_res.error());
        }

        boost::mysql::results res;
        co_await conn_res->get().async_execute(
            boost::mysql::with_params(
                "SELECT id, campaign_id, job_type, status, priority, "
                "attempts, max_attempts, locked_by, locked_at, "
                "timeout_seconds, scheduled_at, next_execution_at, "
                "last_error, created_at, updated_at FROM campaign_jobs "
                "WHERE status IN ({}, {}) "
                "AND locked_at + timeout_seconds * 1000 < {}",
                JobStatus::Locked, JobStatus::Running, to_millis(now)),
            res, use_awaitable);
        conn_res->return_without_reset();

        std::vector<CampaignJob> out;
        out.reserve(res.rows().size());
        for (auto row : res.rows()) {
          out.push_back(to_job(row));
        }
        co_return ok(std::move(out));
      });
}

// --- pool resources ------------------------------------------------------

auto MySQLCampaignStore::upsert_persona(const Persona &p)
    -> task<Result<void>> {
  co_return co_await mysql_try([&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "INSERT INTO personas(id, name, persona_type, enabled, config) "
            "VALUES ({}, {}, {}, {}, {}) "
            "ON DUPLICATE KEY UPDATE name=VALUES(name), "
            "persona_type=VALUES(persona_type), enabled=VALUES(enabled), "
            "config=VALUES(config)",
            p.id.str(), p.name, p.type(), p.enabled ? 1 : 0,
            codec::encode_persona_config(p.config)),
        res, use_awaitable);
    conn_res->return_without_reset();
    co_return ok();
  });
}

auto MySQLCampaignStore::upsert_proxy(const Proxy &p) -> task<Result<void>> {
  co_return co_await mysql_try([&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "INSERT INTO proxies(id, name, protocol, host, port, enabled) "
            "VALUES ({}, {}, {}, {}, {}, {}) "
            "ON DUPLICATE KEY UPDATE name=VALUES(name), "
            "protocol=VALUES(protocol), host=VALUES(host), "
            "port=VALUES(port), enabled=VALUES(enabled)",
            p.id.str(), p.name, p.protocol, p.host, p.port,
            p.enabled ? 1 : 0),
        res, use_awaitable);
    conn_res->return_without_reset();
    co_return ok();
  });
}

auto MySQLCampaignStore::upsert_keyword_set(const KeywordSet &s)
    -> task<Result<void>> {
  co_return co_await mysql_try([&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "INSERT INTO keyword_sets(id, name, enabled, rules) "
            "VALUES ({}, {}, {}, {}) "
            "ON DUPLICATE KEY UPDATE name=VALUES(name), "
            "enabled=VALUES(enabled), rules=VALUES(rules)",
            s.id.str(), s.name, s.enabled ? 1 : 0,
            codec::encode_keyword_rules(s.rules)),
        res, use_awaitable);
    conn_res->return_without_reset();
    co_return ok();
  });
}

auto MySQLCampaignStore::get_personas(std::span<const PersonaId> ids)
    -> task<Result<std::vector<Persona>>> {
  if (ids.empty()) {
    co_return ok(std::vector<Persona>{});
  }
  co_return co_await mysql_try([&]() -> task<Result<std::vector<Persona>>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    auto format_id = [](const PersonaId &id,
                        boost::mysql::format_context_base &ctx) {
      boost::mysql::format_sql_to(ctx, "{}", id.str());
    };
    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "SELECT id, name, persona_type, enabled, config, healthy, "
            "circuit, total_requests, failed_requests, consecutive_failures, "
            "success_rate, opened_at, last_checked_at, last_used_at, "
            "resting_until FROM personas WHERE id IN ({})",
            boost::mysql::sequence(ids, format_id)),
        res, use_awaitable);
    conn_res->return_without_reset();

    std::vector<Persona> out;
    out.reserve(res.rows().size());
    for (auto row : res.rows()) {
      auto cfg = codec::decode_persona_config(
          parse<PersonaType>(as_sv(row.at(2))), as_sv(row.at(4)));
      if (!cfg) {
        log::warn("Skipping persona {} with corrupt config JSON",
                  as_sv(row.at(0)));
        continue;
      }
      out.push_back(Persona{
          .id = PersonaId{as_str(row.at(0))},
          .name = as_str(row.at(1)),
          .enabled = as_bool(row.at(3)),
          .config = std::move(*cfg),
          .health = to_health(row, 5),
      });
    }
    co_return ok(std::move(out));
  });
}

auto MySQLCampaignStore::get_proxies(std::span<const ProxyId> ids)
    -> task<Result<std::vector<Proxy>>> {
  if (ids.empty()) {
    co_return ok(std::vector<Proxy>{});
  }
  co_return co_await mysql_try([&]() -> task<Result<std::vector<Proxy>>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    auto format_id = [](const ProxyId &id,
                        boost::mysql::format_context_base &ctx) {
      boost::mysql::format_sql_to(ctx, "{}", id.str());
    };
    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "SELECT id, name, protocol, host, port, enabled, healthy, "
            "circuit, total_requests, failed_requests, consecutive_failures, "
            "success_rate, opened_at, last_checked_at, last_used_at, "
            "resting_until FROM proxies WHERE id IN ({})",
            boost::mysql::sequence(ids, format_id)),
        res, use_awaitable);
    conn_res->return_without_reset();

    std::vector<Proxy> out;
    out.reserve(res.rows().size());
    for (auto row : res.rows()) {
      out.push_back(Proxy{
          .id = ProxyId{as_str(row.at(0))},
          .name = as_str(row.at(1)),
          .protocol = as_str(row.at(2)),
          .host = as_str(row.at(3)),
          .port = static_cast<std::uint16_t>(as_i64(row.at(4))),
          .enabled = as_bool(row.at(5)),
          .health = to_health(row, 6),
      });
    }
    co_return ok(std::move(out));
  });
}

auto MySQLCampaignStore::get_keyword_sets(std::span<const KeywordSetId> ids)
    -> task<Result<std::vector<KeywordSet>>> {
  if (ids.empty()) {
    co_return ok(std::vector<KeywordSet>{});
  }
  co_return co_await mysql_try(
      [&]() -> task<Result<std::vector<KeywordSet>>> {
        auto conn_res = co_await get_connection();
        if (!conn_res) {
          co_return fail(conn_res.error());
        }

        auto format_id = [](const KeywordSetId &id,
                            boost::mysql::format_context_base &ctx) {
          boost::mysql::format_sql_to(ctx, "{}", id.str());
        };
        boost::mysql::results res;
        co_await conn_res->get().async_execute(
            boost::mysql::with_params(
                "SELECT id, name, enabled, rules FROM keyword_sets "
                "WHERE id IN ({})",
                boost::mysql::sequence(ids, format_id)),
            res, use_awaitable);
        conn_res->return_without_reset();

        std::vector<KeywordSet> out;
        out.reserve(res.rows().size());
        for (auto row : res.rows()) {
          auto rules = codec::decode_keyword_rules(as_sv(row.at(3)));
          if (!rules) {
            log::warn("Skipping keyword set {} with corrupt rules JSON",
                      as_sv(row.at(0)));
            continue;
          }
          out.push_back(KeywordSet{
              .id = KeywordSetId{as_str(row.at(0))},
              .name = as_str(row.at(1)),
              .enabled = as_bool(row.at(2)),
              .rules = std::move(*rules),
          });
        }
        co_return ok(std::move(out));
      });
}

auto MySQLCampaignStore::save_resource_health(ResourceKind kind,
                                              std::string_view id,
                                              const ResourceHealth &h)
    -> task<Result<void>> {
  co_return co_await mysql_try([&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    const std::string_view table =
        kind == ResourceKind::Persona ? "personas" : "proxies";
    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "UPDATE {:i} SET healthy = {}, circuit = {}, total_requests = {}, "
            "failed_requests = {}, consecutive_failures = {}, "
            "success_rate = {}, opened_at = {}, last_checked_at = {}, "
            "last_used_at = {}, resting_until = {} WHERE id = {}",
            table, h.healthy ? 1 : 0, h.circuit, h.total_requests,
            h.failed_requests, h.consecutive_failures, h.success_rate,
            to_millis(h.opened_at), to_millis(h.last_checked_at),
            to_millis(h.last_used_at), to_millis(h.resting_until), id),
        res, use_awaitable);
    conn_res->return_without_reset();
    co_return ok();
  });
}

auto MySQLCampaignStore::clear_all() -> task<Result<void>> {
  co_return co_await mysql_try([&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    boost::mysql::pipeline_request req;
    for (std::string_view table :
         {"campaign_jobs", "http_results", "dns_results", "generated_domains",
          "campaigns", "generation_config_states", "personas", "proxies",
          "keyword_sets"}) {
      req.add_execute(
          boost::mysql::format_sql(conn_res->get().format_opts().value(),
                                   "DELETE FROM {:i}", table));
    }
    std::vector<boost::mysql::stage_response> stage_responses;
    co_await conn_res->get().async_run_pipeline(req, stage_responses,
                                                use_awaitable);
    conn_res->return_without_reset();
    co_return ok();
  });
}

} // namespace domainflow::storage
