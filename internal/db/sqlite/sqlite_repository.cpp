#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/column_codec.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace portwatch::db::sqlite {

using portwatch::db::ErrorCode;
using portwatch::db::Result;
using portwatch::model::PortKey;

namespace {

struct StmtDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

Stmt Prepare(SqliteTransaction& tx, const char* sql) {
  return Stmt(tx.DB().Prepare(sql));
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

void BindOptU64(sqlite3_stmt* st, int idx, const std::optional<uint64_t>& v) {
  if (v) {
    BindU64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& v) {
  if (v) {
    BindText(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindKey(sqlite3_stmt* st, int first_idx, const PortKey& key) {
  BindText(st, first_idx, key.host_id);
  BindText(st, first_idx + 1, sql::Text(key.protocol));
  BindI32(st, first_idx + 2, key.port);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

PortKey ColKey(sqlite3_stmt* st, int first_col) {
  PortKey key;
  key.host_id  = ColText(st, first_col);
  key.protocol = sql::ProtocolColumn(ColText(st, first_col + 1));
  key.port     = static_cast<uint16_t>(ColI32(st, first_col + 2));
  return key;
}

model::FactRecord ReadFact(sqlite3_stmt* st) {
  model::FactRecord r;
  r.id               = ColU64(st, 0);
  r.key              = ColKey(st, 1);
  r.first_seen_at_ms = ColU64(st, 4);
  r.last_seen_at_ms  = ColU64(st, 5);
  if (sqlite3_column_type(st, 6) != SQLITE_NULL) {
    r.last_disappeared_at_ms = ColU64(st, 6);
  }
  r.state                = sql::StateColumn(ColText(st, 7));
  r.pid                  = ColI32(st, 8);
  r.process_name         = ColText(st, 9);
  r.cmdline              = ColText(st, 10);
  r.total_seen_count     = ColU64(st, 11);
  r.total_uptime_seconds = ColU64(st, 12);
  return r;
}

model::TimelineEventRecord ReadEvent(sqlite3_stmt* st) {
  model::TimelineEventRecord e;
  e.id                = ColU64(st, 0);
  e.fact_id           = ColU64(st, 1);
  e.kind              = sql::EventKindColumn(ColText(st, 2));
  e.timestamp_ms      = ColU64(st, 3);
  e.pid               = ColI32(st, 4);
  e.process_name      = ColText(st, 5);
  e.diagnostic_output = ColText(st, 6);
  return e;
}

model::AnnotationRecord ReadNote(sqlite3_stmt* st) {
  model::AnnotationRecord n;
  n.id          = ColU64(st, 0);
  n.key         = ColKey(st, 1);
  n.title       = ColText(st, 4);
  n.description = ColText(st, 5);
  n.owner       = ColText(st, 6);
  n.risk_level  = sql::RiskColumn(ColText(st, 7));
  n.is_pinned   = ColI32(st, 8) != 0;
  return n;
}

// Returns the extended code on failure so UNIQUE violations can be told apart.
int Step(sqlite3* db, sqlite3_stmt* st) {
  int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW || rc == SQLITE_DONE) return rc;
  return sqlite3_extended_errcode(db);
}

// Steps a query to completion, collecting every row through the reader.
template <typename Reader>
auto Collect(sqlite3* db, sqlite3_stmt* st, Reader read) {
  std::vector<decltype(read(st))> out;
  for (;;) {
    int rc = sqlite3_step(st);
    if (rc == SQLITE_DONE) break;
    if (rc != SQLITE_ROW) throw util::StoreUnavailable(sqlite3_errmsg(db));
    out.push_back(read(st));
  }
  return out;
}

template <typename Reader>
auto First(sqlite3* db, sqlite3_stmt* st, Reader read) -> std::optional<decltype(read(st))> {
  int rc = sqlite3_step(st);
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) throw util::StoreUnavailable(sqlite3_errmsg(db));
  return read(st);
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_, false);
}

std::unique_ptr<db::Transaction> SqliteRepository::BeginRead() {
  return std::make_unique<SqliteTransaction>(db_, true);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_UNIQUE || rc == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Facts
// ------------------------------------------------------------------

Result SqliteRepository::InsertFact(Transaction& t, model::FactRecord& r) {
  auto& tx = TX(t);
  auto  st = Prepare(tx, sql::INSERT_FACT);

  BindKey(st.get(), 1, r.key);
  BindU64(st.get(), 4, r.first_seen_at_ms);
  BindU64(st.get(), 5, r.last_seen_at_ms);
  BindOptU64(st.get(), 6, r.last_disappeared_at_ms);
  BindText(st.get(), 7, sql::Text(r.state));
  BindI32(st.get(), 8, r.pid);
  BindText(st.get(), 9, r.process_name);
  BindText(st.get(), 10, r.cmdline);
  BindU64(st.get(), 11, r.total_seen_count);
  BindU64(st.get(), 12, r.total_uptime_seconds);

  auto result = Translate(tx.Handle(), Step(tx.Handle(), st.get()));
  if (result) r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(tx.Handle()));
  return result;
}

Result SqliteRepository::UpdateFact(Transaction& t, const model::FactRecord& r) {
  auto& tx = TX(t);
  auto  st = Prepare(tx, sql::UPDATE_FACT);

  BindU64(st.get(), 1, r.first_seen_at_ms);
  BindU64(st.get(), 2, r.last_seen_at_ms);
  BindOptU64(st.get(), 3, r.last_disappeared_at_ms);
  BindText(st.get(), 4, sql::Text(r.state));
  BindI32(st.get(), 5, r.pid);
  BindText(st.get(), 6, r.process_name);
  BindText(st.get(), 7, r.cmdline);
  BindU64(st.get(), 8, r.total_seen_count);
  BindU64(st.get(), 9, r.total_uptime_seconds);
  BindU64(st.get(), 10, r.id);

  auto result = Translate(tx.Handle(), Step(tx.Handle(), st.get()));
  if (result && sqlite3_changes(tx.Handle()) == 0) {
    return Result::Err(ErrorCode::NotFound, portwatch::model::ToString(r.key));
  }
  return result;
}

std::optional<model::FactRecord> SqliteRepository::GetFact(Transaction& t, const PortKey& key) {
  auto& tx = TX(t);
  auto  st = Prepare(tx, sql::SELECT_FACT_BY_KEY);
  BindKey(st.get(), 1, key);
  return First(tx.Handle(), st.get(), ReadFact);
}

std::vector<model::FactRecord> SqliteRepository::ListFacts(Transaction& t, const FactFilter& filter) {
  auto& tx = TX(t);
  auto  st = Prepare(tx, sql::SELECT_FACTS);

  BindOptText(st.get(), 1, filter.host_id);
  std::optional<std::string> state;
  if (filter.state) state = sql::Text(*filter.state);
  BindOptText(st.get(), 2, state);

  return Collect(tx.Handle(), st.get(), ReadFact);
}

Result SqliteRepository::DeleteFact(Transaction& t, const PortKey& key) {
  auto& tx = TX(t);
  auto  st = Prepare(tx, sql::DELETE_FACT);
  BindKey(st.get(), 1, key);

  auto result = Translate(tx.Handle(), Step(tx.Handle(), st.get()));
  if (result && sqlite3_changes(tx.Handle()) == 0) {
    return Result::Err(ErrorCode::NotFound, portwatch::model::ToString(key));
  }
  return result;
}

// ------------------------------------------------------------------
// Timeline
// ------------------------------------------------------------------

Result SqliteRepository::AppendEvent(Transaction& t, model::TimelineEventRecord& e) {
  auto& tx = TX(t);
  auto  st = Prepare(tx, sql::INSERT_EVENT);

  BindU64(st.get(), 1, e.fact_id);
  BindText(st.get(), 2, sql::Text(e.kind));
  BindU64(st.get(), 3, e.timestamp_ms);
  BindI32(st.get(), 4, e.pid);
  BindText(st.get(), 5, e.process_name);
  BindText(st.get(), 6, e.diagnostic_output);

  auto result = Translate(tx.Handle(), Step(tx.Handle(), st.get()));
  if (result) e.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(tx.Handle()));
  return result;
}

std::vector<model::TimelineEventRecord> SqliteRepository::ListEvents(Transaction& t, uint64_t fact_id) {
  auto& tx = TX(t);
  auto  st = Prepare(tx, sql::SELECT_EVENTS);
  BindU64(st.get(), 1, fact_id);
  return Collect(tx.Handle(), st.get(), ReadEvent);
}

std::optional<model::TimelineEventRecord> SqliteRepository::LatestEvent(Transaction& t, uint64_t fact_id) {
  auto& tx = TX(t);
  auto  st = Prepare(tx, sql::SELECT_LATEST_EVENT);
  BindU64(st.get(), 1, fact_id);
  return First(tx.Handle(), st.get(), ReadEvent);
}

// ------------------------------------------------------------------
// Annotations
// ------------------------------------------------------------------

Result SqliteRepository::UpsertAnnotation(Transaction& t, model::AnnotationRecord& r) {
  auto& tx = TX(t);
  {
    auto st = Prepare(tx, sql::UPSERT_NOTE);
    BindKey(st.get(), 1, r.key);
    BindText(st.get(), 4, r.title);
    BindText(st.get(), 5, r.description);
    BindText(st.get(), 6, r.owner);
    BindText(st.get(), 7, sql::Text(r.risk_level));
    BindI32(st.get(), 8, r.is_pinned ? 1 : 0);

    auto result = Translate(tx.Handle(), Step(tx.Handle(), st.get()));
    if (!result) return result;
  }

  // last_insert_rowid is stale after the UPDATE branch of an upsert
  auto stored = GetAnnotation(t, r.key);
  if (!stored) return Result::Err(ErrorCode::InternalError, "annotation vanished after upsert");
  r.id = stored->id;
  return Result::Ok();
}

std::optional<model::AnnotationRecord> SqliteRepository::GetAnnotation(Transaction& t, const PortKey& key) {
  auto& tx = TX(t);
  auto  st = Prepare(tx, sql::SELECT_NOTE_BY_KEY);
  BindKey(st.get(), 1, key);
  return First(tx.Handle(), st.get(), ReadNote);
}

std::vector<model::AnnotationRecord> SqliteRepository::ListAnnotations(Transaction& t, const AnnotationFilter& filter) {
  auto& tx = TX(t);
  auto  st = Prepare(tx, sql::SELECT_NOTES);
  BindOptText(st.get(), 1, filter.host_id);
  return Collect(tx.Handle(), st.get(), ReadNote);
}

Result SqliteRepository::DeleteAnnotation(Transaction& t, const PortKey& key) {
  auto& tx = TX(t);
  auto  st = Prepare(tx, sql::DELETE_NOTE);
  BindKey(st.get(), 1, key);

  auto result = Translate(tx.Handle(), Step(tx.Handle(), st.get()));
  if (result && sqlite3_changes(tx.Handle()) == 0) {
    return Result::Err(ErrorCode::NotFound, portwatch::model::ToString(key));
  }
  return result;
}

} // namespace portwatch::db::sqlite
