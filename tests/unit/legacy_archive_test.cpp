#include "internal/archive/legacy_archive.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/model/port.hpp"
#include "internal/util/errors.hpp"

namespace {

using portwatch::archive::ExportLegacyJson;
using portwatch::archive::ImportLegacyJson;
using portwatch::db::AnnotationFilter;
using portwatch::db::FactFilter;
using portwatch::db::memory::MemoryRepository;
using portwatch::model::EventKind;
using portwatch::model::PortKey;
using portwatch::model::PortState;
using portwatch::model::Protocol;
using portwatch::model::RiskLevel;

constexpr uint64_t kFeb10    = 1770724510000; // 2026-02-10T11:55:10Z
constexpr uint64_t kFeb10Off = 1770724800000; // 2026-02-10T12:00:00Z

const char* kLegacyDump = R"({
  "runtimes": [
    {"id": 7, "host_id": "local", "protocol": "tcp", "port": 8080,
     "first_seen_at": "2026-02-10T11:55:10.000123", "last_seen_at": "2026-02-10T14:00:00+02:00",
     "last_disappeared_at": "2026-02-10T12:00:00Z", "current_state": "disappeared",
     "current_pid": 4242, "process_name": "python3", "cmdline": "python3 -m http.server 8080",
     "total_seen_count": 3, "total_uptime_seconds": 290, "legacy_column": "ignored"},
    {"id": 9, "host_id": "local", "protocol": "udp", "port": 53,
     "first_seen_at": "2026-02-10 11:55:10", "last_seen_at": "2026-02-10 11:55:10",
     "current_state": "active",
     "current_pid": 1, "process_name": "systemd-resolve", "cmdline": "",
     "total_seen_count": 1, "total_uptime_seconds": 0}
  ],
  "events": [
    {"id": 20, "port_runtime_id": 7, "event_type": "disappeared", "timestamp": "2026-02-10T12:00:00",
     "pid": 4242, "process_name": "python3", "diagnostic_output": ""},
    {"id": 10, "port_runtime_id": 7, "event_type": "appeared", "timestamp": "2026-02-10T13:55:10+02:00",
     "pid": 4242, "process_name": "python3", "diagnostic_output": ""},
    {"id": 30, "port_runtime_id": 99, "event_type": "appeared", "timestamp": "2026-02-10T11:55:10",
     "pid": 1, "process_name": "ghost", "diagnostic_output": ""}
  ],
  "notes": [
    {"id": 1, "host_id": "local", "protocol": "tcp", "port": 8080, "title": "dev server",
     "description": "", "owner": "alice", "risk_level": "suspicious", "is_pinned": true},
    {"id": 2, "host_id": "local", "protocol": "tcp", "port": 22, "title": "ssh",
     "description": "never observed", "owner": "", "risk_level": "", "is_pinned": false}
  ]
})";

void TestImportRemapsAndNormalizes() {
  MemoryRepository repo;

  const auto report = ImportLegacyJson(repo, kLegacyDump);
  assert(report.facts_imported == 2);
  assert(report.facts_skipped == 0);
  assert(report.events_imported == 2);
  assert(report.events_skipped == 1);
  assert(report.notes_imported == 2);

  auto tx   = repo.BeginRead();
  auto fact = repo.GetFact(*tx, PortKey{"local", Protocol::kTcp, 8080});
  assert(fact.has_value());
  assert(fact->first_seen_at_ms == kFeb10);
  assert(fact->last_seen_at_ms == kFeb10Off);
  assert(fact->last_disappeared_at_ms == kFeb10Off);
  assert(fact->state == PortState::kDisappeared);
  assert(fact->pid == 4242);
  assert(fact->total_seen_count == 3);
  assert(fact->total_uptime_seconds == 290);

  auto dns = repo.GetFact(*tx, PortKey{"local", Protocol::kUdp, 53});
  assert(dns.has_value());
  assert(!dns->last_disappeared_at_ms.has_value());
  assert(dns->state == PortState::kActive);

  // events follow the fresh fact id, newest first, ids in time order
  auto events = repo.ListEvents(*tx, fact->id);
  assert(events.size() == 2);
  assert(events[0].kind == EventKind::kDisappeared);
  assert(events[0].timestamp_ms == kFeb10Off);
  assert(events[1].kind == EventKind::kAppeared);
  assert(events[1].timestamp_ms == kFeb10);
  assert(events[1].id < events[0].id);
  assert(repo.ListEvents(*tx, dns->id).empty());

  auto pinned = repo.GetAnnotation(*tx, PortKey{"local", Protocol::kTcp, 8080});
  assert(pinned.has_value());
  assert(pinned->risk_level == RiskLevel::kSuspicious);
  assert(pinned->is_pinned);
  assert(pinned->owner == "alice");

  auto orphan_note = repo.GetAnnotation(*tx, PortKey{"local", Protocol::kTcp, 22});
  assert(orphan_note.has_value());
  assert(orphan_note->risk_level == RiskLevel::kExpected);
  tx->Commit();
}

void TestImportSkipsExistingTuples() {
  MemoryRepository repo;
  (void)ImportLegacyJson(repo, kLegacyDump);

  const auto again = ImportLegacyJson(repo, kLegacyDump);
  assert(again.facts_imported == 0);
  assert(again.facts_skipped == 2);
  // runtimes were skipped so their events have nowhere to go
  assert(again.events_imported == 0);
  assert(again.events_skipped == 3);
  assert(again.notes_imported == 2);

  auto tx = repo.BeginRead();
  assert(repo.ListFacts(*tx, FactFilter{}).size() == 2);
  assert(repo.ListAnnotations(*tx, AnnotationFilter{}).size() == 2);
  auto fact = repo.GetFact(*tx, PortKey{"local", Protocol::kTcp, 8080});
  assert(repo.ListEvents(*tx, fact->id).size() == 2);
  tx->Commit();
}

void TestMalformedInputWritesNothing() {
  MemoryRepository repo;

  bool threw = false;
  try {
    (void)ImportLegacyJson(repo, "{ not json");
  } catch (const portwatch::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  // second runtime is bad, so the first must not survive either
  threw = false;
  try {
    (void)ImportLegacyJson(repo, R"({"runtimes": [
      {"id": 1, "host_id": "local", "protocol": "tcp", "port": 80, "first_seen_at": "2026-02-10T11:55:10Z",
       "last_seen_at": "2026-02-10T11:55:10Z", "current_state": "active"},
      {"id": 2, "host_id": "local", "protocol": "sctp", "port": 81, "first_seen_at": "2026-02-10T11:55:10Z",
       "last_seen_at": "2026-02-10T11:55:10Z", "current_state": "active"}]})");
  } catch (const portwatch::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)ImportLegacyJson(repo, R"({"runtimes": [
      {"id": 1, "host_id": "local", "protocol": "tcp", "port": 80, "first_seen_at": "yesterday",
       "last_seen_at": "2026-02-10T11:55:10Z", "current_state": "active"}]})");
  } catch (const portwatch::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  auto tx = repo.BeginRead();
  assert(repo.ListFacts(*tx, FactFilter{}).empty());
  tx->Commit();
}

void TestExportUsesLegacyLayout() {
  MemoryRepository repo;
  (void)ImportLegacyJson(repo, kLegacyDump);

  const auto json = ExportLegacyJson(repo);
  assert(json.find("\"runtimes\"") != std::string::npos);
  assert(json.find("\"notes\"") != std::string::npos);
  assert(json.find("\"events\"") != std::string::npos);
  assert(json.find("\"port_runtime_id\"") != std::string::npos);
  assert(json.find("\"2026-02-10T11:55:10.000Z\"") != std::string::npos);
  assert(json.find("\"2026-02-10T12:00:00.000Z\"") != std::string::npos);
  assert(json.find("\"suspicious\"") != std::string::npos);
  assert(json.find("ghost") == std::string::npos);

  // an export reads back into an empty store unchanged
  MemoryRepository copy;
  const auto report = ImportLegacyJson(copy, json);
  assert(report.facts_imported == 2);
  assert(report.events_imported == 2);
  assert(report.events_skipped == 0);
  assert(report.notes_imported == 2);
}

} // namespace

int main() {
  TestImportRemapsAndNormalizes();
  TestImportSkipsExistingTuples();
  TestMalformedInputWritesNothing();
  TestExportUsesLegacyLayout();

  std::cout << "portwatch_unit_legacy_archive: pass\n";
  return 0;
}
