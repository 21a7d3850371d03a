#include "pg_pool.hpp"

namespace portwatch::db::postgres {

namespace {

constexpr const char* kFactColumns =
    "id,host_id,protocol,port,first_seen_at_ms,last_seen_at_ms,last_disappeared_at_ms,current_state,"
    "current_pid,process_name,cmdline,total_seen_count,total_uptime_seconds";

constexpr const char* kEventColumns = "id,port_runtime_id,event_type,timestamp_ms,pid,process_name,diagnostic_output";

constexpr const char* kNoteColumns = "id,host_id,protocol,port,title,description,owner,risk_level,is_pinned";

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        if (conn->is_open()) {
          return Wrap(conn.release());
        }
        --live_connections_;
        continue;
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  const std::string fact_cols  = kFactColumns;
  const std::string event_cols = kEventColumns;
  const std::string note_cols  = kNoteColumns;

  conn.prepare("insert_fact",
               "INSERT INTO port_runtime(host_id,protocol,port,first_seen_at_ms,last_seen_at_ms,last_disappeared_at_ms,"
               "current_state,current_pid,process_name,cmdline,total_seen_count,total_uptime_seconds) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12) RETURNING id");

  conn.prepare("update_fact",
               "UPDATE port_runtime SET first_seen_at_ms=$2,last_seen_at_ms=$3,last_disappeared_at_ms=$4,"
               "current_state=$5,current_pid=$6,process_name=$7,cmdline=$8,total_seen_count=$9,"
               "total_uptime_seconds=$10 WHERE id=$1");

  conn.prepare("get_fact", "SELECT " + fact_cols + " FROM port_runtime WHERE host_id=$1 AND protocol=$2 AND port=$3");

  conn.prepare("list_facts", "SELECT " + fact_cols +
                                 " FROM port_runtime WHERE ($1::text IS NULL OR host_id=$1)"
                                 " AND ($2::text IS NULL OR current_state=$2) ORDER BY host_id,protocol,port");

  conn.prepare("delete_fact", "DELETE FROM port_runtime WHERE host_id=$1 AND protocol=$2 AND port=$3");

  conn.prepare("insert_event",
               "INSERT INTO port_event(port_runtime_id,event_type,timestamp_ms,pid,process_name,diagnostic_output) "
               "VALUES($1,$2,$3,$4,$5,$6) RETURNING id");

  conn.prepare("list_events",
               "SELECT " + event_cols + " FROM port_event WHERE port_runtime_id=$1 ORDER BY timestamp_ms DESC, id DESC");

  conn.prepare("latest_event", "SELECT " + event_cols +
                                   " FROM port_event WHERE port_runtime_id=$1 ORDER BY timestamp_ms DESC, id DESC LIMIT 1");

  conn.prepare("upsert_note",
               "INSERT INTO port_note(host_id,protocol,port,title,description,owner,risk_level,is_pinned) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8) "
               "ON CONFLICT(host_id,protocol,port) DO UPDATE SET title=EXCLUDED.title,description=EXCLUDED.description,"
               "owner=EXCLUDED.owner,risk_level=EXCLUDED.risk_level,is_pinned=EXCLUDED.is_pinned RETURNING id");

  conn.prepare("get_note", "SELECT " + note_cols + " FROM port_note WHERE host_id=$1 AND protocol=$2 AND port=$3");

  conn.prepare("list_notes", "SELECT " + note_cols +
                                 " FROM port_note WHERE ($1::text IS NULL OR host_id=$1) ORDER BY host_id,protocol,port");

  conn.prepare("delete_note", "DELETE FROM port_note WHERE host_id=$1 AND protocol=$2 AND port=$3");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace portwatch::db::postgres
