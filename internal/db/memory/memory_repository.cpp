#include "memory_repository.hpp"

#include <algorithm>
#include <tuple>

#include "memory_tx.hpp"

namespace portwatch::db::memory {

using portwatch::model::PortKey;

namespace {

bool KeyLess(const PortKey& a, const PortKey& b) {
  return std::tie(a.host_id, a.protocol, a.port) < std::tie(b.host_id, b.protocol, b.port);
}

bool EventNewerFirst(const model::TimelineEventRecord& a, const model::TimelineEventRecord& b) {
  if (a.timestamp_ms != b.timestamp_ms) return a.timestamp_ms > b.timestamp_ms;
  return a.id > b.id;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this, false);
}

std::unique_ptr<db::Transaction> MemoryRepository::BeginRead() {
  return std::make_unique<MemoryTransaction>(*this, true);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Facts
// ------------------------------------------------------------------

Result MemoryRepository::InsertFact(Transaction& t, model::FactRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.fact_ids.contains(r.key)) return Result::Err(ErrorCode::AlreadyExists, portwatch::model::ToString(r.key));
  r.id = s.next_fact_id++;
  s.facts[r.id]     = r;
  s.fact_ids[r.key] = r.id;
  return Result::Ok();
}

Result MemoryRepository::UpdateFact(Transaction& t, const model::FactRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.facts.find(r.id);
  if (it == s.facts.end()) return Result::Err(ErrorCode::NotFound, portwatch::model::ToString(r.key));
  if (!(it->second.key == r.key)) return Result::Err(ErrorCode::ConstraintViolation, "fact key is immutable");
  it->second = r;
  return Result::Ok();
}

std::optional<model::FactRecord> MemoryRepository::GetFact(Transaction& t, const PortKey& key) {
  const auto& s  = TX(t).View();
  auto        it = s.fact_ids.find(key);
  if (it == s.fact_ids.end()) return std::nullopt;
  return s.facts.at(it->second);
}

std::vector<model::FactRecord> MemoryRepository::ListFacts(Transaction& t, const FactFilter& filter) {
  const auto&                    s = TX(t).View();
  std::vector<model::FactRecord> out;
  for (const auto& [_, r] : s.facts) {
    if (filter.host_id && r.key.host_id != *filter.host_id) continue;
    if (filter.state && r.state != *filter.state) continue;
    out.push_back(r);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return KeyLess(a.key, b.key); });
  return out;
}

Result MemoryRepository::DeleteFact(Transaction& t, const PortKey& key) {
  auto& s  = TX(t).Mutable();
  auto  it = s.fact_ids.find(key);
  if (it == s.fact_ids.end()) return Result::Err(ErrorCode::NotFound, portwatch::model::ToString(key));

  const uint64_t id = it->second;
  s.facts.erase(id);
  s.fact_ids.erase(it);

  // cascade, like the FK on port_event
  std::erase_if(s.events, [id](const model::TimelineEventRecord& e) { return e.fact_id == id; });
  return Result::Ok();
}

// ------------------------------------------------------------------
// Timeline
// ------------------------------------------------------------------

Result MemoryRepository::AppendEvent(Transaction& t, model::TimelineEventRecord& e) {
  auto& s = TX(t).Mutable();
  if (!s.facts.contains(e.fact_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "event references unknown fact " + std::to_string(e.fact_id));
  }
  e.id = s.next_event_id++;
  s.events.push_back(e);
  return Result::Ok();
}

std::vector<model::TimelineEventRecord> MemoryRepository::ListEvents(Transaction& t, uint64_t fact_id) {
  std::vector<model::TimelineEventRecord> out;
  for (const auto& e : TX(t).View().events)
    if (e.fact_id == fact_id) out.push_back(e);
  std::sort(out.begin(), out.end(), EventNewerFirst);
  return out;
}

std::optional<model::TimelineEventRecord> MemoryRepository::LatestEvent(Transaction& t, uint64_t fact_id) {
  std::optional<model::TimelineEventRecord> latest;
  for (const auto& e : TX(t).View().events) {
    if (e.fact_id != fact_id) continue;
    if (!latest || EventNewerFirst(e, *latest)) latest = e;
  }
  return latest;
}

// ------------------------------------------------------------------
// Annotations
// ------------------------------------------------------------------

Result MemoryRepository::UpsertAnnotation(Transaction& t, model::AnnotationRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.notes.find(r.key);
  if (it == s.notes.end()) {
    r.id = s.next_note_id++;
  } else {
    r.id = it->second.id;
  }
  s.notes[r.key] = r;
  return Result::Ok();
}

std::optional<model::AnnotationRecord> MemoryRepository::GetAnnotation(Transaction& t, const PortKey& key) {
  const auto& s  = TX(t).View();
  auto        it = s.notes.find(key);
  if (it == s.notes.end()) return std::nullopt;
  return it->second;
}

std::vector<model::AnnotationRecord> MemoryRepository::ListAnnotations(Transaction& t, const AnnotationFilter& filter) {
  std::vector<model::AnnotationRecord> out;
  for (const auto& [key, r] : TX(t).View().notes) {
    if (filter.host_id && key.host_id != *filter.host_id) continue;
    out.push_back(r);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return KeyLess(a.key, b.key); });
  return out;
}

Result MemoryRepository::DeleteAnnotation(Transaction& t, const PortKey& key) {
  auto& s = TX(t).Mutable();
  if (s.notes.erase(key) == 0) return Result::Err(ErrorCode::NotFound, portwatch::model::ToString(key));
  return Result::Ok();
}

} // namespace portwatch::db::memory
