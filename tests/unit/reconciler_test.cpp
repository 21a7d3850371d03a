#include "internal/core/reconciler.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <exception>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using portwatch::core::Reconciler;
using portwatch::core::ReconcilerOptions;
using portwatch::db::FactFilter;
using portwatch::db::Repository;
using portwatch::db::Result;
using portwatch::db::Transaction;
using portwatch::db::memory::MemoryRepository;
using portwatch::db::model::FactRecord;
using portwatch::db::model::TimelineEventRecord;
using portwatch::model::EventKind;
using portwatch::model::PortKey;
using portwatch::model::PortState;
using portwatch::model::Protocol;
using portwatch::scan::Observation;
using portwatch::scan::ObservationMap;

class FakeScanner final : public portwatch::scan::SocketScanner {
 public:
  explicit FakeScanner(std::string host) : host_(std::move(host)) {}

  const std::string& HostId() const override {
    return host_;
  }

  ObservationMap Scan() override {
    if (fail) throw portwatch::util::ScanFailure("netlink unavailable");
    return next;
  }

  ObservationMap next;
  bool           fail = false;

 private:
  std::string host_;
};

// Holds every scan open for a while and counts how many run at once.
class SlowScanner final : public portwatch::scan::SocketScanner {
 public:
  const std::string& HostId() const override {
    return host_;
  }

  ObservationMap Scan() override {
    const int now_inside = ++inside;
    int       seen       = max_inside.load();
    while (now_inside > seen && !max_inside.compare_exchange_weak(seen, now_inside)) {
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    ++scans;
    --inside;
    return next;
  }

  ObservationMap   next;
  std::atomic<int> inside{0};
  std::atomic<int> max_inside{0};
  std::atomic<int> scans{0};

 private:
  std::string host_ = "local";
};

// Forwards to a memory store; AppendEvent fails once armed.
class FlakyRepository final : public Repository {
 public:
  explicit FlakyRepository(std::shared_ptr<MemoryRepository> inner) : inner_(std::move(inner)) {}

  bool fail_events = false;

  std::unique_ptr<Transaction> Begin() override { return inner_->Begin(); }
  std::unique_ptr<Transaction> BeginRead() override { return inner_->BeginRead(); }

  Result InsertFact(Transaction& tx, FactRecord& r) override { return inner_->InsertFact(tx, r); }
  Result UpdateFact(Transaction& tx, const FactRecord& r) override { return inner_->UpdateFact(tx, r); }
  std::optional<FactRecord> GetFact(Transaction& tx, const PortKey& k) override { return inner_->GetFact(tx, k); }
  std::vector<FactRecord> ListFacts(Transaction& tx, const FactFilter& f) override { return inner_->ListFacts(tx, f); }
  Result DeleteFact(Transaction& tx, const PortKey& k) override { return inner_->DeleteFact(tx, k); }

  Result AppendEvent(Transaction& tx, TimelineEventRecord& e) override {
    if (fail_events) return Result::Err(portwatch::db::ErrorCode::IOError, "disk full");
    return inner_->AppendEvent(tx, e);
  }
  std::vector<TimelineEventRecord> ListEvents(Transaction& tx, uint64_t id) override { return inner_->ListEvents(tx, id); }
  std::optional<TimelineEventRecord> LatestEvent(Transaction& tx, uint64_t id) override { return inner_->LatestEvent(tx, id); }

  Result UpsertAnnotation(Transaction& tx, portwatch::db::model::AnnotationRecord& r) override {
    return inner_->UpsertAnnotation(tx, r);
  }
  std::optional<portwatch::db::model::AnnotationRecord> GetAnnotation(Transaction& tx, const PortKey& k) override {
    return inner_->GetAnnotation(tx, k);
  }
  std::vector<portwatch::db::model::AnnotationRecord> ListAnnotations(Transaction& tx,
                                                                      const portwatch::db::AnnotationFilter& f) override {
    return inner_->ListAnnotations(tx, f);
  }
  Result DeleteAnnotation(Transaction& tx, const PortKey& k) override { return inner_->DeleteAnnotation(tx, k); }

 private:
  std::shared_ptr<MemoryRepository> inner_;
};

struct Harness {
  explicit Harness(bool emit_alive = false, std::string host = "local")
      : repository(std::make_shared<MemoryRepository>()), scanner(std::make_shared<FakeScanner>(std::move(host))) {
    ReconcilerOptions options;
    options.emit_alive_events = emit_alive;
    options.clock             = [this] { return now_ms; };
    reconciler                = std::make_unique<Reconciler>(repository, scanner, options);
  }

  std::optional<FactRecord> Fact(const PortKey& key) {
    auto tx   = repository->BeginRead();
    auto fact = repository->GetFact(*tx, key);
    tx->Commit();
    return fact;
  }

  std::vector<FactRecord> AllFacts() {
    auto tx    = repository->BeginRead();
    auto facts = repository->ListFacts(*tx, FactFilter{});
    tx->Commit();
    return facts;
  }

  std::vector<TimelineEventRecord> Events(const PortKey& key) {
    auto tx   = repository->BeginRead();
    auto fact = repository->GetFact(*tx, key);
    assert(fact.has_value());
    auto events = repository->ListEvents(*tx, fact->id);
    tx->Commit();
    return events;
  }

  uint64_t                          now_ms = 1'000'000;
  std::shared_ptr<MemoryRepository> repository;
  std::shared_ptr<FakeScanner>      scanner;
  std::unique_ptr<Reconciler>       reconciler;
};

const PortKey kHttp{"local", Protocol::kTcp, 8080};
const PortKey kDns{"local", Protocol::kUdp, 53};

void TestFirstObservationCreatesFact() {
  Harness h;
  h.scanner->next = {{kHttp, Observation{100, "nginx", "nginx -g daemon off;"}}};

  const auto report = h.reconciler->RunCycle();
  assert(report.observed == 1);
  assert(report.appeared == 1);

  const auto fact = h.Fact(kHttp);
  assert(fact.has_value());
  assert(fact->state == PortState::kActive);
  assert(fact->total_seen_count == 1);
  assert(fact->total_uptime_seconds == 0);
  assert(fact->first_seen_at_ms == h.now_ms && fact->last_seen_at_ms == h.now_ms);
  assert(!fact->last_disappeared_at_ms.has_value());
  assert(fact->pid == 100 && fact->process_name == "nginx");

  const auto events = h.Events(kHttp);
  assert(events.size() == 1);
  assert(events[0].kind == EventKind::kAppeared);
  assert(events[0].pid == 100);
}

void TestProcessTakeoverIsFlagged() {
  Harness h;
  h.scanner->next = {{kHttp, Observation{100, "nginx", ""}}};
  h.reconciler->RunCycle();

  h.now_ms += 30'000;
  h.scanner->next = {{kHttp, Observation{200, "caddy", "caddy run"}}};
  const auto report = h.reconciler->RunCycle();
  assert(report.process_changed == 1);
  assert(report.continued == 1);

  const auto fact = h.Fact(kHttp);
  assert(fact->pid == 200 && fact->process_name == "caddy" && fact->cmdline == "caddy run");
  assert(fact->total_seen_count == 2);
  assert(fact->total_uptime_seconds == 30);

  const auto events = h.Events(kHttp);
  assert(events.size() == 2);
  assert(events[0].kind == EventKind::kProcessChanged);
  assert(events[0].process_name == "caddy");
}

void TestEmptyNameIsNotATakeover() {
  Harness h;
  h.scanner->next = {{kHttp, Observation{100, "nginx", ""}}};
  h.reconciler->RunCycle();

  h.scanner->next = {{kHttp, Observation{100, "", ""}}};
  const auto report = h.reconciler->RunCycle();
  assert(report.process_changed == 0);
  assert(h.Events(kHttp).size() == 1);
}

void TestDisappearanceIsRecordedOnce() {
  Harness h;
  h.scanner->next = {{kDns, Observation{53, "dnsmasq", ""}}};
  h.reconciler->RunCycle();

  h.now_ms += 10'000;
  h.scanner->next.clear();
  auto report = h.reconciler->RunCycle();
  assert(report.disappeared == 1);

  auto fact = h.Fact(kDns);
  assert(fact->state == PortState::kDisappeared);
  assert(fact->last_disappeared_at_ms == h.now_ms);
  assert(fact->process_name == "dnsmasq"); // last known

  auto events = h.Events(kDns);
  assert(events.size() == 2);
  assert(events[0].kind == EventKind::kDisappeared);
  assert(events[0].pid == 53);

  h.now_ms += 10'000;
  report = h.reconciler->RunCycle();
  assert(report.disappeared == 0);
  assert(h.Events(kDns).size() == 2);
  assert(h.Fact(kDns)->last_disappeared_at_ms == h.now_ms - 10'000);
}

void TestReappearanceEmitsAppeared() {
  Harness h;
  h.scanner->next = {{kHttp, Observation{100, "nginx", ""}}};
  h.reconciler->RunCycle();
  h.now_ms += 1'000;
  h.scanner->next.clear();
  h.reconciler->RunCycle();

  h.now_ms += 1'000;
  h.scanner->next = {{kHttp, Observation{300, "caddy", ""}}};
  const auto report = h.reconciler->RunCycle();
  assert(report.reappeared == 1);
  assert(report.appeared == 0);
  // the record was not active, so a different name is not a takeover
  assert(report.process_changed == 0);

  const auto fact = h.Fact(kHttp);
  assert(fact->state == PortState::kActive);
  assert(fact->total_seen_count == 2);
  assert(fact->total_uptime_seconds == 2);

  const auto events = h.Events(kHttp);
  assert(events.size() == 3);
  assert(events[0].kind == EventKind::kAppeared);
  assert(events[1].kind == EventKind::kDisappeared);
}

void TestRescanIsIdempotent() {
  Harness h;
  h.scanner->next = {{kHttp, Observation{100, "nginx", ""}}, {kDns, Observation{53, "dnsmasq", ""}}};
  h.reconciler->RunCycle();

  for (int i = 0; i < 3; ++i) {
    h.now_ms += 60'000;
    const auto report = h.reconciler->RunCycle();
    assert(report.appeared == 0 && report.disappeared == 0 && report.continued == 2);
  }

  assert(h.Events(kHttp).size() == 1);
  assert(h.Events(kDns).size() == 1);
  const auto fact = h.Fact(kHttp);
  assert(fact->total_seen_count == 4);
  assert(fact->last_seen_at_ms == h.now_ms);
  assert(fact->total_uptime_seconds == 180);
}

void TestAliveHeartbeatWhenEnabled() {
  Harness h(true);
  h.scanner->next = {{kHttp, Observation{100, "nginx", ""}}};
  h.reconciler->RunCycle();
  h.reconciler->RunCycle();

  const auto events = h.Events(kHttp);
  assert(events.size() == 2);
  assert(events[0].kind == EventKind::kAlive);
}

void TestProtocolsAreDistinctKeys() {
  Harness h;
  const PortKey tcp53{"local", Protocol::kTcp, 53};
  h.scanner->next = {{kDns, Observation{53, "dnsmasq", ""}}, {tcp53, Observation{53, "dnsmasq", ""}}};
  const auto report = h.reconciler->RunCycle();
  assert(report.appeared == 2);
  assert(h.AllFacts().size() == 2);
}

void TestScanFailureLeavesStoreUntouched() {
  Harness h;
  h.scanner->next = {{kHttp, Observation{100, "nginx", ""}}};
  h.reconciler->RunCycle();

  h.scanner->fail = true;
  bool threw      = false;
  try {
    h.reconciler->RunCycle();
  } catch (const portwatch::util::ScanFailure&) {
    threw = true;
  }
  assert(threw);

  const auto fact = h.Fact(kHttp);
  assert(fact->state == PortState::kActive);
  assert(fact->total_seen_count == 1);
  assert(h.Events(kHttp).size() == 1);
}

void TestStoreFailureRollsBackWholeCycle() {
  auto memory  = std::make_shared<MemoryRepository>();
  auto flaky   = std::make_shared<FlakyRepository>(memory);
  auto scanner = std::make_shared<FakeScanner>("local");

  ReconcilerOptions options;
  options.clock = [] { return uint64_t{5'000}; };
  Reconciler reconciler(flaky, scanner, options);

  scanner->next     = {{kHttp, Observation{100, "nginx", ""}}};
  flaky->fail_events = true;

  bool threw = false;
  try {
    reconciler.RunCycle();
  } catch (const portwatch::util::StoreUnavailable&) {
    threw = true;
  }
  assert(threw);

  auto tx = memory->BeginRead();
  assert(memory->ListFacts(*tx, FactFilter{}).empty());
  tx->Commit();
}

void TestOtherHostsAreNeverTouched() {
  Harness h;
  {
    auto       tx = h.repository->Begin();
    FactRecord foreign;
    foreign.key              = {"edge-2", Protocol::kTcp, 22};
    foreign.first_seen_at_ms = 1;
    foreign.last_seen_at_ms  = 1;
    foreign.state            = PortState::kActive;
    foreign.total_seen_count = 1;
    assert(h.repository->InsertFact(*tx, foreign));
    tx->Commit();
  }

  // observations for another host are ignored as well
  h.scanner->next = {{PortKey{"edge-2", Protocol::kTcp, 443}, Observation{1, "x", ""}}};
  const auto report = h.reconciler->RunCycle();
  assert(report.observed == 0 && report.disappeared == 0);

  const auto foreign = h.Fact(PortKey{"edge-2", Protocol::kTcp, 22});
  assert(foreign->state == PortState::kActive);
  assert(h.AllFacts().size() == 1);
}

void TestConcurrentCyclesRunOneAtATime() {
  auto repository = std::make_shared<MemoryRepository>();
  auto scanner    = std::make_shared<SlowScanner>();
  scanner->next   = {{kHttp, Observation{100, "nginx", ""}}, {kDns, Observation{53, "dnsmasq", ""}}};

  ReconcilerOptions options;
  options.clock = [] { return uint64_t{1'000'000}; };
  Reconciler reconciler(repository, scanner, options);

  constexpr int            kThreads = 4;
  std::atomic<uint64_t>    appeared{0};
  std::atomic<int>         failures{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&] {
      try {
        appeared += reconciler.RunCycle().appeared;
      } catch (const std::exception&) {
        ++failures;
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(failures == 0);
  assert(scanner->scans == kThreads);
  assert(scanner->max_inside == 1);
  assert(appeared == 2);

  auto tx = repository->BeginRead();
  for (const auto& key : {kHttp, kDns}) {
    auto fact = repository->GetFact(*tx, key);
    assert(fact.has_value());
    assert(fact->total_seen_count == static_cast<uint64_t>(kThreads));

    int appeared_events = 0;
    for (const auto& event : repository->ListEvents(*tx, fact->id)) {
      if (event.kind == EventKind::kAppeared) ++appeared_events;
    }
    assert(appeared_events == 1);
  }
  tx->Commit();
}

void TestPlanNeverDropsFacts() {
  std::vector<FactRecord> existing(2);
  existing[0].id    = 1;
  existing[0].key   = kHttp;
  existing[0].state = PortState::kActive;
  existing[1].id    = 2;
  existing[1].key   = kDns;
  existing[1].state = PortState::kDisappeared;

  const auto plan = Reconciler::Plan("local", ObservationMap{}, existing, 10, false);
  assert(plan.inserts.empty());
  assert(plan.updates.size() == 1);
  assert(plan.updates[0].key == kHttp);
  assert(plan.events.size() == 1);
  assert(plan.events[0].kind == EventKind::kDisappeared);
}

} // namespace

int main() {
  TestFirstObservationCreatesFact();
  TestProcessTakeoverIsFlagged();
  TestEmptyNameIsNotATakeover();
  TestDisappearanceIsRecordedOnce();
  TestReappearanceEmitsAppeared();
  TestRescanIsIdempotent();
  TestAliveHeartbeatWhenEnabled();
  TestProtocolsAreDistinctKeys();
  TestScanFailureLeavesStoreUntouched();
  TestStoreFailureRollsBackWholeCycle();
  TestOtherHostsAreNeverTouched();
  TestPlanNeverDropsFacts();
  TestConcurrentCyclesRunOneAtATime();

  std::cout << "portwatch_unit_reconciler: pass\n";
  return 0;
}
