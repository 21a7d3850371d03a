#pragma once

#include <array>

namespace portwatch::db::sql {

/*
  Bootstrap DDL, applied idempotently at startup by the factory.

  port_event references port_runtime and dies with it.
  port_note shares the key columns but is never linked to port_runtime.
*/

inline constexpr std::array<const char*, 5> kSqliteSchema = {
    "CREATE TABLE IF NOT EXISTS port_runtime ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " host_id TEXT NOT NULL,"
    " protocol TEXT NOT NULL,"
    " port INTEGER NOT NULL,"
    " first_seen_at_ms INTEGER NOT NULL,"
    " last_seen_at_ms INTEGER NOT NULL,"
    " last_disappeared_at_ms INTEGER,"
    " current_state TEXT NOT NULL,"
    " current_pid INTEGER NOT NULL DEFAULT 0,"
    " process_name TEXT NOT NULL DEFAULT '',"
    " cmdline TEXT NOT NULL DEFAULT '',"
    " total_seen_count INTEGER NOT NULL DEFAULT 0,"
    " total_uptime_seconds INTEGER NOT NULL DEFAULT 0,"
    " UNIQUE(host_id, protocol, port));",

    "CREATE TABLE IF NOT EXISTS port_event ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " port_runtime_id INTEGER NOT NULL REFERENCES port_runtime(id) ON DELETE CASCADE,"
    " event_type TEXT NOT NULL,"
    " timestamp_ms INTEGER NOT NULL,"
    " pid INTEGER NOT NULL DEFAULT 0,"
    " process_name TEXT NOT NULL DEFAULT '',"
    " diagnostic_output TEXT NOT NULL DEFAULT '');",

    "CREATE INDEX IF NOT EXISTS port_event_runtime_ts ON port_event(port_runtime_id, timestamp_ms);",

    "CREATE TABLE IF NOT EXISTS port_note ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " host_id TEXT NOT NULL,"
    " protocol TEXT NOT NULL,"
    " port INTEGER NOT NULL,"
    " title TEXT NOT NULL DEFAULT '',"
    " description TEXT NOT NULL DEFAULT '',"
    " owner TEXT NOT NULL DEFAULT '',"
    " risk_level TEXT NOT NULL DEFAULT 'expected',"
    " is_pinned INTEGER NOT NULL DEFAULT 0,"
    " UNIQUE(host_id, protocol, port));",

    "CREATE INDEX IF NOT EXISTS port_runtime_host ON port_runtime(host_id);"};

inline constexpr std::array<const char*, 5> kPostgresSchema = {
    "CREATE TABLE IF NOT EXISTS port_runtime ("
    " id BIGSERIAL PRIMARY KEY,"
    " host_id TEXT NOT NULL,"
    " protocol TEXT NOT NULL,"
    " port INTEGER NOT NULL,"
    " first_seen_at_ms BIGINT NOT NULL,"
    " last_seen_at_ms BIGINT NOT NULL,"
    " last_disappeared_at_ms BIGINT,"
    " current_state TEXT NOT NULL,"
    " current_pid INTEGER NOT NULL DEFAULT 0,"
    " process_name TEXT NOT NULL DEFAULT '',"
    " cmdline TEXT NOT NULL DEFAULT '',"
    " total_seen_count BIGINT NOT NULL DEFAULT 0,"
    " total_uptime_seconds BIGINT NOT NULL DEFAULT 0,"
    " UNIQUE(host_id, protocol, port));",

    "CREATE TABLE IF NOT EXISTS port_event ("
    " id BIGSERIAL PRIMARY KEY,"
    " port_runtime_id BIGINT NOT NULL REFERENCES port_runtime(id) ON DELETE CASCADE,"
    " event_type TEXT NOT NULL,"
    " timestamp_ms BIGINT NOT NULL,"
    " pid INTEGER NOT NULL DEFAULT 0,"
    " process_name TEXT NOT NULL DEFAULT '',"
    " diagnostic_output TEXT NOT NULL DEFAULT '');",

    "CREATE INDEX IF NOT EXISTS port_event_runtime_ts ON port_event(port_runtime_id, timestamp_ms);",

    "CREATE TABLE IF NOT EXISTS port_note ("
    " id BIGSERIAL PRIMARY KEY,"
    " host_id TEXT NOT NULL,"
    " protocol TEXT NOT NULL,"
    " port INTEGER NOT NULL,"
    " title TEXT NOT NULL DEFAULT '',"
    " description TEXT NOT NULL DEFAULT '',"
    " owner TEXT NOT NULL DEFAULT '',"
    " risk_level TEXT NOT NULL DEFAULT 'expected',"
    " is_pinned BOOLEAN NOT NULL DEFAULT FALSE,"
    " UNIQUE(host_id, protocol, port));",

    "CREATE INDEX IF NOT EXISTS port_runtime_host ON port_runtime(host_id);"};

} // namespace portwatch::db::sql
