#pragma once

#include <string_view>

namespace domainflow::schema {

// MySQL 8 schema, version 1.
// All timestamps stored as Unix milliseconds (BIGINT); 0 means unset.
// Enum columns hold the snake_case enumerator name.

inline constexpr int CURRENT_SCHEMA_VERSION = 1;

inline constexpr std::string_view V1_SCHEMA = R"SQL(

CREATE TABLE IF NOT EXISTS schema_version (
    version INT NOT NULL PRIMARY KEY,
    applied_at DATETIME DEFAULT CURRENT_TIMESTAMP
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci;

CREATE TABLE IF NOT EXISTS generation_config_states (
    config_hash CHAR(64) NOT NULL PRIMARY KEY,
    total_possible_combinations BIGINT NOT NULL,
    last_offset BIGINT NOT NULL DEFAULT 0,
    config_details JSON NOT NULL,
    updated_at BIGINT NOT NULL
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci;

CREATE TABLE IF NOT EXISTS campaigns (
    id VARCHAR(64) NOT NULL PRIMARY KEY,
    name VARCHAR(255) NOT NULL,
    campaign_type VARCHAR(32) NOT NULL,
    status VARCHAR(16) NOT NULL,
    total_items BIGINT NOT NULL DEFAULT 0,
    processed_items BIGINT NOT NULL DEFAULT 0,
    successful_items BIGINT NOT NULL DEFAULT 0,
    failed_items BIGINT NOT NULL DEFAULT 0,
    progress_percentage DOUBLE NOT NULL DEFAULT 0,
    avg_processing_rate DOUBLE NOT NULL DEFAULT 0,
    estimated_completion_at BIGINT NOT NULL DEFAULT 0,
    last_heartbeat_at BIGINT NOT NULL DEFAULT 0,
    error_message TEXT NOT NULL,
    params JSON NOT NULL,
    source_cursor BIGINT NOT NULL DEFAULT 0,
    created_at BIGINT NOT NULL,
    started_at BIGINT NOT NULL DEFAULT 0,
    completed_at BIGINT NOT NULL DEFAULT 0,
    updated_at BIGINT NOT NULL,
    INDEX idx_campaigns_status (status)
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci;

CREATE TABLE IF NOT EXISTS generated_domains (
    seq BIGINT UNSIGNED AUTO_INCREMENT PRIMARY KEY,
    campaign_id VARCHAR(64) NOT NULL,
    domain_name VARCHAR(253) NOT NULL,
    offset_index BIGINT NOT NULL,
    validation_status VARCHAR(16) NOT NULL DEFAULT 'pending',
    created_at BIGINT NOT NULL,
    UNIQUE KEY uq_generated_domain (campaign_id, domain_name),
    INDEX idx_generated_domain_seq (campaign_id, seq),
    CONSTRAINT fk_generated_campaign FOREIGN KEY (campaign_id) REFERENCES campaigns(id) ON DELETE CASCADE
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci;

CREATE TABLE IF NOT EXISTS dns_results (
    seq BIGINT UNSIGNED AUTO_INCREMENT PRIMARY KEY,
    campaign_id VARCHAR(64) NOT NULL,
    domain_name VARCHAR(253) NOT NULL,
    source_seq BIGINT NOT NULL,
    status VARCHAR(16) NOT NULL,
    system_status VARCHAR(16) NOT NULL,
    ips JSON NOT NULL,
    resolver VARCHAR(255) NOT NULL DEFAULT '',
    persona_id VARCHAR(64) NOT NULL DEFAULT '',
    attempts INT NOT NULL DEFAULT 0,
    duration_ms BIGINT NOT NULL DEFAULT 0,
    error TEXT NOT NULL,
    checked_at BIGINT NOT NULL,
    UNIQUE KEY uq_dns_result (campaign_id, domain_name),
    INDEX idx_dns_result_status (campaign_id, status, seq),
    CONSTRAINT fk_dns_campaign FOREIGN KEY (campaign_id) REFERENCES campaigns(id) ON DELETE CASCADE
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci;

CREATE TABLE IF NOT EXISTS http_results (
    seq BIGINT UNSIGNED AUTO_INCREMENT PRIMARY KEY,
    campaign_id VARCHAR(64) NOT NULL,
    domain_name VARCHAR(253) NOT NULL,
    source_seq BIGINT NOT NULL,
    status VARCHAR(16) NOT NULL,
    system_status VARCHAR(16) NOT NULL,
    http_status_code INT NOT NULL DEFAULT 0,
    final_url TEXT NOT NULL,
    redirect_count INT NOT NULL DEFAULT 0,
    page_title TEXT NOT NULL,
    content_snippet TEXT NOT NULL,
    content_hash CHAR(64) NOT NULL DEFAULT '',
    content_length BIGINT NOT NULL DEFAULT 0,
    findings JSON NOT NULL,
    persona_id VARCHAR(64) NOT NULL DEFAULT '',
    proxy_id VARCHAR(64) NOT NULL DEFAULT '',
    attempts INT NOT NULL DEFAULT 0,
    duration_ms BIGINT NOT NULL DEFAULT 0,
    error TEXT NOT NULL,
    checked_at BIGINT NOT NULL,
    UNIQUE KEY uq_http_result (campaign_id, domain_name),
    CONSTRAINT fk_http_campaign FOREIGN KEY (campaign_id) REFERENCES campaigns(id) ON DELETE CASCADE
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci;

CREATE TABLE IF NOT EXISTS campaign_jobs (
    id VARCHAR(64) NOT NULL PRIMARY KEY,
    campaign_id VARCHAR(64) NOT NULL,
    job_type VARCHAR(32) NOT NULL,
    status VARCHAR(16) NOT NULL,
    priority INT NOT NULL DEFAULT 5,
    attempts INT NOT NULL DEFAULT 0,
    max_attempts INT NOT NULL DEFAULT 3,
    locked_by VARCHAR(255) NOT NULL DEFAULT '',
    locked_at BIGINT NOT NULL DEFAULT 0,
    timeout_seconds INT NOT NULL DEFAULT 3600,
    scheduled_at BIGINT NOT NULL,
    next_execution_at BIGINT NOT NULL,
    last_error TEXT NOT NULL,
    created_at BIGINT NOT NULL,
    updated_at BIGINT NOT NULL,
    INDEX idx_jobs_claim (status, next_execution_at, priority),
    INDEX idx_jobs_campaign (campaign_id),
    CONSTRAINT fk_job_campaign FOREIGN KEY (campaign_id) REFERENCES campaigns(id) ON DELETE CASCADE
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci;

CREATE TABLE IF NOT EXISTS personas (
    id VARCHAR(64) NOT NULL PRIMARY KEY,
    name VARCHAR(255) NOT NULL,
    persona_type VARCHAR(16) NOT NULL,
    enabled TINYINT NOT NULL DEFAULT 1,
    config JSON NOT NULL,
    healthy TINYINT NOT NULL DEFAULT 1,
    circuit VARCHAR(16) NOT NULL DEFAULT 'closed',
    total_requests BIGINT NOT NULL DEFAULT 0,
    failed_requests BIGINT NOT NULL DEFAULT 0,
    consecutive_failures INT NOT NULL DEFAULT 0,
    success_rate DOUBLE NOT NULL DEFAULT 1,
    opened_at BIGINT NOT NULL DEFAULT 0,
    last_checked_at BIGINT NOT NULL DEFAULT 0,
    last_used_at BIGINT NOT NULL DEFAULT 0,
    resting_until BIGINT NOT NULL DEFAULT 0
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci;

CREATE TABLE IF NOT EXISTS proxies (
    id VARCHAR(64) NOT NULL PRIMARY KEY,
    name VARCHAR(255) NOT NULL,
    protocol VARCHAR(16) NOT NULL DEFAULT 'http',
    host VARCHAR(255) NOT NULL,
    port INT NOT NULL,
    enabled TINYINT NOT NULL DEFAULT 1,
    healthy TINYINT NOT NULL DEFAULT 1,
    circuit VARCHAR(16) NOT NULL DEFAULT 'closed',
    total_requests BIGINT NOT NULL DEFAULT 0,
    failed_requests BIGINT NOT NULL DEFAULT 0,
    consecutive_failures INT NOT NULL DEFAULT 0,
    success_rate DOUBLE NOT NULL DEFAULT 1,
    opened_at BIGINT NOT NULL DEFAULT 0,
    last_checked_at BIGINT NOT NULL DEFAULT 0,
    last_used_at BIGINT NOT NULL DEFAULT 0,
    resting_until BIGINT NOT NULL DEFAULT 0
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci;

CREATE TABLE IF NOT EXISTS keyword_sets (
    id VARCHAR(64) NOT NULL PRIMARY KEY,
    name VARCHAR(255) NOT NULL,
    enabled TINYINT NOT NULL DEFAULT 1,
    rules JSON NOT NULL
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci;

)SQL";

} // namespace domainflow::schema
