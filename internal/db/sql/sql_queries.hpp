#pragma once

namespace portwatch::db::sql {

/*
  Canonical SQL (SQLite placeholder syntax).

  Column order of every SELECT matches the order the repositories read
  them back, so keep the *_COLUMNS lists and the readers in sync.
*/

#define PORTWATCH_FACT_COLUMNS                                                                      \
  "id,host_id,protocol,port,first_seen_at_ms,last_seen_at_ms,last_disappeared_at_ms,current_state," \
  "current_pid,process_name,cmdline,total_seen_count,total_uptime_seconds"

#define PORTWATCH_EVENT_COLUMNS "id,port_runtime_id,event_type,timestamp_ms,pid,process_name,diagnostic_output"

#define PORTWATCH_NOTE_COLUMNS "id,host_id,protocol,port,title,description,owner,risk_level,is_pinned"

// facts

static constexpr const char* INSERT_FACT =
    "INSERT INTO port_runtime(host_id,protocol,port,first_seen_at_ms,last_seen_at_ms,last_disappeared_at_ms,"
    "current_state,current_pid,process_name,cmdline,total_seen_count,total_uptime_seconds)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* UPDATE_FACT =
    "UPDATE port_runtime SET first_seen_at_ms=?,last_seen_at_ms=?,last_disappeared_at_ms=?,current_state=?,"
    "current_pid=?,process_name=?,cmdline=?,total_seen_count=?,total_uptime_seconds=?"
    " WHERE id=?;";

static constexpr const char* SELECT_FACT_BY_KEY =
    "SELECT " PORTWATCH_FACT_COLUMNS " FROM port_runtime WHERE host_id=? AND protocol=? AND port=?;";

static constexpr const char* SELECT_FACTS =
    "SELECT " PORTWATCH_FACT_COLUMNS " FROM port_runtime"
    " WHERE (?1 IS NULL OR host_id=?1) AND (?2 IS NULL OR current_state=?2)"
    " ORDER BY host_id,protocol,port;";

static constexpr const char* DELETE_FACT =
    "DELETE FROM port_runtime WHERE host_id=? AND protocol=? AND port=?;";

// timeline

static constexpr const char* INSERT_EVENT =
    "INSERT INTO port_event(port_runtime_id,event_type,timestamp_ms,pid,process_name,diagnostic_output)"
    " VALUES(?,?,?,?,?,?);";

static constexpr const char* SELECT_EVENTS =
    "SELECT " PORTWATCH_EVENT_COLUMNS " FROM port_event WHERE port_runtime_id=?"
    " ORDER BY timestamp_ms DESC, id DESC;";

static constexpr const char* SELECT_LATEST_EVENT =
    "SELECT " PORTWATCH_EVENT_COLUMNS " FROM port_event WHERE port_runtime_id=?"
    " ORDER BY timestamp_ms DESC, id DESC LIMIT 1;";

// annotations

static constexpr const char* UPSERT_NOTE =
    "INSERT INTO port_note(host_id,protocol,port,title,description,owner,risk_level,is_pinned)"
    " VALUES(?,?,?,?,?,?,?,?)"
    " ON CONFLICT(host_id,protocol,port) DO UPDATE SET"
    " title=excluded.title,"
    " description=excluded.description,"
    " owner=excluded.owner,"
    " risk_level=excluded.risk_level,"
    " is_pinned=excluded.is_pinned;";

static constexpr const char* SELECT_NOTE_BY_KEY =
    "SELECT " PORTWATCH_NOTE_COLUMNS " FROM port_note WHERE host_id=? AND protocol=? AND port=?;";

static constexpr const char* SELECT_NOTES =
    "SELECT " PORTWATCH_NOTE_COLUMNS " FROM port_note"
    " WHERE (?1 IS NULL OR host_id=?1)"
    " ORDER BY host_id,protocol,port;";

static constexpr const char* DELETE_NOTE =
    "DELETE FROM port_note WHERE host_id=? AND protocol=? AND port=?;";

} // namespace portwatch::db::sql
