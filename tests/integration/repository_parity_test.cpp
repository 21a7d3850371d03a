#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"

namespace {

using portwatch::db::AnnotationFilter;
using portwatch::db::ErrorCode;
using portwatch::db::FactFilter;
using portwatch::db::Repository;
using portwatch::db::memory::MemoryRepository;
using portwatch::db::model::AnnotationRecord;
using portwatch::db::model::FactRecord;
using portwatch::db::model::TimelineEventRecord;
using portwatch::model::EventKind;
using portwatch::model::PortKey;
using portwatch::model::PortState;
using portwatch::model::Protocol;
using portwatch::model::RiskLevel;
using portwatch::runtime::config::RuntimeConfig;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

FactRecord MakeFact(const std::string& host, Protocol protocol, uint16_t port, uint64_t seen_ms) {
  FactRecord fact;
  fact.key              = PortKey{host, protocol, port};
  fact.first_seen_at_ms = seen_ms;
  fact.last_seen_at_ms  = seen_ms;
  fact.state            = PortState::kActive;
  fact.pid              = 100 + port;
  fact.process_name     = "proc-" + std::to_string(port);
  fact.cmdline          = "/usr/bin/proc --port " + std::to_string(port);
  fact.total_seen_count = 1;
  return fact;
}

TimelineEventRecord MakeEvent(uint64_t fact_id, EventKind kind, uint64_t ts_ms) {
  TimelineEventRecord event;
  event.fact_id      = fact_id;
  event.kind         = kind;
  event.timestamp_ms = ts_ms;
  event.pid          = 4242;
  event.process_name = "python3";
  return event;
}

void VerifyFactLifecycle(Repository& repo, const std::string& host) {
  auto tx = repo.Begin();

  auto fact = MakeFact(host, Protocol::kTcp, 8080, 1000);
  assert(repo.InsertFact(*tx, fact));
  assert(fact.id != 0);

  auto read = repo.GetFact(*tx, fact.key);
  assert(read.has_value());
  assert(read->id == fact.id);
  assert(read->state == PortState::kActive);
  assert(!read->last_disappeared_at_ms.has_value());
  assert(read->cmdline == fact.cmdline);

  read->state                  = PortState::kDisappeared;
  read->last_disappeared_at_ms = 5000;
  read->total_uptime_seconds   = 4;
  assert(repo.UpdateFact(*tx, *read));

  auto updated = repo.GetFact(*tx, fact.key);
  assert(updated.has_value());
  assert(updated->state == PortState::kDisappeared);
  assert(updated->last_disappeared_at_ms == 5000);
  assert(updated->total_uptime_seconds == 4);
  // process fields survive disappearance
  assert(updated->pid == fact.pid);
  assert(updated->process_name == fact.process_name);

  assert(!repo.GetFact(*tx, PortKey{host, Protocol::kUdp, 8080}).has_value());
  tx->Commit();
}

void VerifyDuplicateTupleRejected(Repository& repo, const std::string& host) {
  {
    auto tx   = repo.Begin();
    auto fact = MakeFact(host, Protocol::kUdp, 53, 1000);
    assert(repo.InsertFact(*tx, fact));
    tx->Commit();
  }

  auto tx        = repo.Begin();
  auto duplicate = MakeFact(host, Protocol::kUdp, 53, 2000);
  auto result    = repo.InsertFact(*tx, duplicate);
  assert(!result);
  assert(result.code == ErrorCode::AlreadyExists);
  tx->Rollback();
}

void VerifyListOrderAndFilters(Repository& repo, const std::string& host) {
  const std::string other = host + "-other";
  {
    auto tx = repo.Begin();
    for (auto fact : {MakeFact(host, Protocol::kUdp, 5353, 1), MakeFact(host, Protocol::kTcp, 22, 1), MakeFact(other, Protocol::kTcp, 443, 1)}) {
      assert(repo.InsertFact(*tx, fact));
    }
    auto gone  = MakeFact(host, Protocol::kTcp, 9000, 1);
    gone.state = PortState::kDisappeared;
    assert(repo.InsertFact(*tx, gone));
    tx->Commit();
  }

  auto tx = repo.BeginRead();

  // fact lifecycle and duplicate checks left tcp/8080 and udp/53 on this host
  const auto facts = repo.ListFacts(*tx, FactFilter{.host_id = host});
  assert(facts.size() == 5);
  assert(facts[0].key == (PortKey{host, Protocol::kTcp, 22}));
  assert(facts[1].key == (PortKey{host, Protocol::kTcp, 8080}));
  assert(facts[2].key == (PortKey{host, Protocol::kTcp, 9000}));
  assert(facts[3].key == (PortKey{host, Protocol::kUdp, 53}));
  assert(facts[4].key == (PortKey{host, Protocol::kUdp, 5353}));

  const auto disappeared = repo.ListFacts(*tx, FactFilter{.host_id = host, .state = PortState::kDisappeared});
  assert(disappeared.size() == 2);
  for (const auto& fact : disappeared) {
    assert(fact.state == PortState::kDisappeared);
  }

  const auto elsewhere = repo.ListFacts(*tx, FactFilter{.host_id = other});
  assert(elsewhere.size() == 1);
  assert(elsewhere[0].key.port == 443);
  tx->Commit();
}

void VerifyTimeline(Repository& repo, const std::string& host) {
  auto tx   = repo.Begin();
  auto fact = MakeFact(host, Protocol::kTcp, 3000, 1000);
  assert(repo.InsertFact(*tx, fact));

  assert(!repo.LatestEvent(*tx, fact.id).has_value());

  auto appeared = MakeEvent(fact.id, EventKind::kAppeared, 1000);
  assert(repo.AppendEvent(*tx, appeared));
  auto ack = MakeEvent(fact.id, EventKind::kAcknowledged, 3000);
  assert(repo.AppendEvent(*tx, ack));
  auto gone = MakeEvent(fact.id, EventKind::kDisappeared, 3000);
  assert(repo.AppendEvent(*tx, gone));
  auto diag              = MakeEvent(fact.id, EventKind::kDiagnosed, 2000);
  diag.diagnostic_output = "pid 4242 python3\nlistening on :3000\n";
  assert(repo.AppendEvent(*tx, diag));
  assert(appeared.id < ack.id && ack.id < gone.id && gone.id < diag.id);

  const auto events = repo.ListEvents(*tx, fact.id);
  assert(events.size() == 4);
  // newest first, ties broken by id
  assert(events[0].id == gone.id);
  assert(events[1].id == ack.id);
  assert(events[2].id == diag.id);
  assert(events[2].diagnostic_output == diag.diagnostic_output);
  assert(events[3].id == appeared.id);

  auto latest = repo.LatestEvent(*tx, fact.id);
  assert(latest.has_value());
  assert(latest->id == gone.id);
  assert(latest->kind == EventKind::kDisappeared);

  auto orphan = MakeEvent(fact.id + 1000000, EventKind::kAlive, 4000);
  tx->Commit();

  // an event for a missing fact must not land; checked in its own transaction
  auto bad_tx = repo.Begin();
  assert(!repo.AppendEvent(*bad_tx, orphan));
  bad_tx->Rollback();
}

void VerifyAnnotations(Repository& repo, const std::string& host) {
  const PortKey key{host, Protocol::kTcp, 5432};
  {
    auto tx = repo.Begin();

    AnnotationRecord note;
    note.key        = key;
    note.title      = "postgres";
    note.owner      = "dba";
    note.risk_level = RiskLevel::kTrusted;
    assert(repo.UpsertAnnotation(*tx, note));
    assert(note.id != 0);
    const auto first_id = note.id;

    note.description = "primary";
    note.is_pinned   = true;
    note.risk_level  = RiskLevel::kSuspicious;
    assert(repo.UpsertAnnotation(*tx, note));

    auto read = repo.GetAnnotation(*tx, key);
    assert(read.has_value());
    assert(read->id == first_id);
    assert(read->description == "primary");
    assert(read->is_pinned);
    assert(read->risk_level == RiskLevel::kSuspicious);

    // a note for a tuple never observed is fine
    AnnotationRecord planned;
    planned.key   = PortKey{host, Protocol::kUdp, 161};
    planned.title = "snmp";
    assert(repo.UpsertAnnotation(*tx, planned));
    tx->Commit();
  }

  {
    auto       tx    = repo.BeginRead();
    const auto notes = repo.ListAnnotations(*tx, AnnotationFilter{.host_id = host});
    assert(notes.size() == 2);
    assert(notes[0].key == key);
    assert(notes[1].key.port == 161);
    tx->Commit();
  }

  auto tx = repo.Begin();
  assert(repo.DeleteAnnotation(*tx, PortKey{host, Protocol::kUdp, 161}));
  auto missing = repo.DeleteAnnotation(*tx, PortKey{host, Protocol::kUdp, 161});
  assert(!missing);
  assert(missing.code == ErrorCode::NotFound);
  tx->Commit();
}

void VerifyDeleteCascadesEventsNotNotes(Repository& repo, const std::string& host) {
  const PortKey key{host, Protocol::kTcp, 6379};
  uint64_t      fact_id = 0;
  {
    auto tx   = repo.Begin();
    auto fact = MakeFact(host, Protocol::kTcp, 6379, 1000);
    assert(repo.InsertFact(*tx, fact));
    fact_id    = fact.id;
    auto event = MakeEvent(fact.id, EventKind::kAppeared, 1000);
    assert(repo.AppendEvent(*tx, event));

    AnnotationRecord note;
    note.key   = key;
    note.title = "redis";
    assert(repo.UpsertAnnotation(*tx, note));
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    assert(repo.DeleteFact(*tx, key));
    auto again = repo.DeleteFact(*tx, key);
    assert(!again);
    assert(again.code == ErrorCode::NotFound);
    tx->Commit();
  }

  auto tx = repo.BeginRead();
  assert(!repo.GetFact(*tx, key).has_value());
  assert(repo.ListEvents(*tx, fact_id).empty());
  auto note = repo.GetAnnotation(*tx, key);
  assert(note.has_value());
  assert(note->title == "redis");
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& host) {
  const PortKey explicit_key{host, Protocol::kTcp, 7001};
  const PortKey dropped_key{host, Protocol::kTcp, 7002};
  {
    auto tx   = repo.Begin();
    auto fact = MakeFact(host, Protocol::kTcp, 7001, 1);
    assert(repo.InsertFact(*tx, fact));
    tx->Rollback();
  }
  {
    // destructor rolls back an uncommitted transaction
    auto tx   = repo.Begin();
    auto fact = MakeFact(host, Protocol::kTcp, 7002, 1);
    assert(repo.InsertFact(*tx, fact));
  }

  auto check_tx = repo.BeginRead();
  assert(!repo.GetFact(*check_tx, explicit_key).has_value());
  assert(!repo.GetFact(*check_tx, dropped_key).has_value());
  check_tx->Commit();
}

void VerifyFinishedTransactionsReleaseTheStore(Repository& repo, const std::string& host) {
  // the first transaction object stays alive while the next ones open
  auto committed = repo.Begin();
  auto fact      = MakeFact(host, Protocol::kTcp, 8443, 1);
  assert(repo.InsertFact(*committed, fact));
  committed->Commit();

  auto rolled_back = repo.Begin();
  auto dropped     = MakeFact(host, Protocol::kTcp, 8444, 1);
  assert(repo.InsertFact(*rolled_back, dropped));
  rolled_back->Rollback();

  auto reader = repo.BeginRead();
  assert(repo.GetFact(*reader, fact.key).has_value());
  assert(!repo.GetFact(*reader, dropped.key).has_value());
  reader->Commit();

  assert(committed->IsCommitted());
  assert(!rolled_back->IsCommitted());
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& host) {
  if (!backend.supports_restart()) {
    return;
  }

  auto          repo = backend.make_repository();
  const PortKey key{host, Protocol::kTcp, 9090};
  {
    auto tx   = repo->Begin();
    auto fact = MakeFact(host, Protocol::kTcp, 9090, 1770724510000);
    fact.last_disappeared_at_ms = 1770724800000;
    fact.state                  = PortState::kDisappeared;
    assert(repo->InsertFact(*tx, fact));
    auto event = MakeEvent(fact.id, EventKind::kDisappeared, 1770724800000);
    assert(repo->AppendEvent(*tx, event));

    AnnotationRecord note;
    note.key        = key;
    note.title      = "metrics";
    note.risk_level = RiskLevel::kTrusted;
    note.is_pinned  = true;
    assert(repo->UpsertAnnotation(*tx, note));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx   = repo->BeginRead();
  auto fact = repo->GetFact(*tx, key);
  assert(fact.has_value());
  assert(fact->state == PortState::kDisappeared);
  assert(fact->first_seen_at_ms == 1770724510000);
  assert(fact->last_disappeared_at_ms == 1770724800000);

  auto latest = repo->LatestEvent(*tx, fact->id);
  assert(latest.has_value());
  assert(latest->kind == EventKind::kDisappeared);

  auto note = repo->GetAnnotation(*tx, key);
  assert(note.has_value());
  assert(note->risk_level == RiskLevel::kTrusted);
  assert(note->is_pinned);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("portwatch_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  RuntimeConfig config;
  config.mutable_database()->mutable_sqlite()->set_path(db_path);

  auto make_repo = [config]() { return portwatch::factory::BuildRepository(config); };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() { std::filesystem::remove(db_path); },
  };
}

#if PORTWATCH_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("PORTWATCH_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("PORTWATCH_TEST_POSTGRES_URI is not set");
  }

  RuntimeConfig config;
  config.mutable_database()->mutable_postgres()->set_connection_uri(uri);
  config.mutable_database()->mutable_postgres()->set_max_connections(2);

  auto make_repo = [config]() { return portwatch::factory::BuildRepository(config); };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";

  // a shared postgres database keeps rows between runs
  const auto host = backend.name + "-" + std::to_string(NowMs());

  {
    auto repo = backend.make_repository();
    VerifyFactLifecycle(*repo, host);
    VerifyDuplicateTupleRejected(*repo, host);
    VerifyListOrderAndFilters(*repo, host);
    VerifyTimeline(*repo, host + "-timeline");
    VerifyAnnotations(*repo, host + "-notes");
    VerifyDeleteCascadesEventsNotNotes(*repo, host + "-cascade");
    VerifyRollbackBehavior(*repo, host + "-rollback");
    VerifyFinishedTransactionsReleaseTheStore(*repo, host + "-release");
  }

  VerifyRestartDurability(backend, host + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeSqliteFactory());

#if PORTWATCH_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "portwatch_integration_repository_parity: pass\n";
  return 0;
}
