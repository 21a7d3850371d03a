#include "pg_repository.hpp"

#include "internal/db/sql/column_codec.hpp"
#include "internal/util/errors.hpp"

namespace portwatch::db::postgres {

using portwatch::model::PortKey;

namespace {

int PortParam(const PortKey& key) {
  return static_cast<int>(key.port);
}

PortKey ReadKey(const pqxx::row& row, int first) {
  PortKey key;
  key.host_id  = row[first].as<std::string>();
  key.protocol = sql::ProtocolColumn(row[first + 1].as<std::string>());
  key.port     = static_cast<uint16_t>(row[first + 2].as<int>());
  return key;
}

model::FactRecord ReadFact(const pqxx::row& row) {
  model::FactRecord r;
  r.id               = row[0].as<uint64_t>();
  r.key              = ReadKey(row, 1);
  r.first_seen_at_ms = row[4].as<uint64_t>();
  r.last_seen_at_ms  = row[5].as<uint64_t>();
  if (!row[6].is_null()) {
    r.last_disappeared_at_ms = row[6].as<uint64_t>();
  }
  r.state                = sql::StateColumn(row[7].as<std::string>());
  r.pid                  = row[8].as<int32_t>();
  r.process_name         = row[9].as<std::string>();
  r.cmdline              = row[10].as<std::string>();
  r.total_seen_count     = row[11].as<uint64_t>();
  r.total_uptime_seconds = row[12].as<uint64_t>();
  return r;
}

model::TimelineEventRecord ReadEvent(const pqxx::row& row) {
  model::TimelineEventRecord e;
  e.id                = row[0].as<uint64_t>();
  e.fact_id           = row[1].as<uint64_t>();
  e.kind              = sql::EventKindColumn(row[2].as<std::string>());
  e.timestamp_ms      = row[3].as<uint64_t>();
  e.pid               = row[4].as<int32_t>();
  e.process_name      = row[5].as<std::string>();
  e.diagnostic_output = row[6].as<std::string>();
  return e;
}

model::AnnotationRecord ReadNote(const pqxx::row& row) {
  model::AnnotationRecord n;
  n.id          = row[0].as<uint64_t>();
  n.key         = ReadKey(row, 1);
  n.title       = row[4].as<std::string>();
  n.description = row[5].as<std::string>();
  n.owner       = row[6].as<std::string>();
  n.risk_level  = sql::RiskColumn(row[7].as<std::string>());
  n.is_pinned   = row[8].as<bool>();
  return n;
}

// Read paths report backend failures as an unavailable store.
template <typename Fn>
auto Query(Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const pqxx::failure& e) {
    throw util::StoreUnavailable(e.what());
  }
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_, false);
}

std::unique_ptr<db::Transaction> PgRepository::BeginRead() {
  return std::make_unique<PgTransaction>(pool_, true);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Facts
// ------------------------------------------------------------------

Result PgRepository::InsertFact(Transaction& t, model::FactRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_fact", r.key.host_id, sql::Text(r.key.protocol), PortParam(r.key),
                                          r.first_seen_at_ms, r.last_seen_at_ms, r.last_disappeared_at_ms,
                                          sql::Text(r.state), r.pid, r.process_name, r.cmdline, r.total_seen_count,
                                          r.total_uptime_seconds);
    r.id = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateFact(Transaction& t, const model::FactRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_fact", r.id, r.first_seen_at_ms, r.last_seen_at_ms,
                                          r.last_disappeared_at_ms, sql::Text(r.state), r.pid, r.process_name,
                                          r.cmdline, r.total_seen_count, r.total_uptime_seconds);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, portwatch::model::ToString(r.key));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::FactRecord> PgRepository::GetFact(Transaction& t, const PortKey& key) {
  return Query([&]() -> std::optional<model::FactRecord> {
    auto res = TX(t).Work().exec_prepared("get_fact", key.host_id, sql::Text(key.protocol), PortParam(key));
    if (res.empty()) return std::nullopt;
    return ReadFact(res[0]);
  });
}

std::vector<model::FactRecord> PgRepository::ListFacts(Transaction& t, const FactFilter& filter) {
  return Query([&] {
    std::optional<std::string> state;
    if (filter.state) state = sql::Text(*filter.state);

    auto res = TX(t).Work().exec_prepared("list_facts", filter.host_id, state);

    std::vector<model::FactRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(ReadFact(row));
    return out;
  });
}

Result PgRepository::DeleteFact(Transaction& t, const PortKey& key) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_fact", key.host_id, sql::Text(key.protocol), PortParam(key));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, portwatch::model::ToString(key));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Timeline
// ------------------------------------------------------------------

Result PgRepository::AppendEvent(Transaction& t, model::TimelineEventRecord& e) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_event", e.fact_id, sql::Text(e.kind), e.timestamp_ms, e.pid,
                                          e.process_name, e.diagnostic_output);
    e.id = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& ex) {
    return Translate(ex);
  }
}

std::vector<model::TimelineEventRecord> PgRepository::ListEvents(Transaction& t, uint64_t fact_id) {
  return Query([&] {
    auto res = TX(t).Work().exec_prepared("list_events", fact_id);

    std::vector<model::TimelineEventRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(ReadEvent(row));
    return out;
  });
}

std::optional<model::TimelineEventRecord> PgRepository::LatestEvent(Transaction& t, uint64_t fact_id) {
  return Query([&]() -> std::optional<model::TimelineEventRecord> {
    auto res = TX(t).Work().exec_prepared("latest_event", fact_id);
    if (res.empty()) return std::nullopt;
    return ReadEvent(res[0]);
  });
}

// ------------------------------------------------------------------
// Annotations
// ------------------------------------------------------------------

Result PgRepository::UpsertAnnotation(Transaction& t, model::AnnotationRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("upsert_note", r.key.host_id, sql::Text(r.key.protocol), PortParam(r.key),
                                          r.title, r.description, r.owner, sql::Text(r.risk_level), r.is_pinned);
    r.id = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::AnnotationRecord> PgRepository::GetAnnotation(Transaction& t, const PortKey& key) {
  return Query([&]() -> std::optional<model::AnnotationRecord> {
    auto res = TX(t).Work().exec_prepared("get_note", key.host_id, sql::Text(key.protocol), PortParam(key));
    if (res.empty()) return std::nullopt;
    return ReadNote(res[0]);
  });
}

std::vector<model::AnnotationRecord> PgRepository::ListAnnotations(Transaction& t, const AnnotationFilter& filter) {
  return Query([&] {
    auto res = TX(t).Work().exec_prepared("list_notes", filter.host_id);

    std::vector<model::AnnotationRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(ReadNote(row));
    return out;
  });
}

Result PgRepository::DeleteAnnotation(Transaction& t, const PortKey& key) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_note", key.host_id, sql::Text(key.protocol), PortParam(key));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, portwatch::model::ToString(key));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace portwatch::db::postgres
