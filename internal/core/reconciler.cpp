#include "internal/core/reconciler.hpp"

#include <algorithm>
#include <chrono>
#include <tuple>
#include <unordered_map>

#include "internal/core/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace portwatch::core {

using db::model::FactRecord;
using model::EventKind;
using model::PortKey;
using model::PortState;

namespace {

bool KeyLess(const PortKey& a, const PortKey& b) {
  return std::tie(a.protocol, a.port) < std::tie(b.protocol, b.port);
}

void CopyProcess(FactRecord& fact, const scan::Observation& obs) {
  fact.pid          = obs.pid;
  fact.process_name = obs.process_name;
  fact.cmdline      = obs.cmdline;
}

uint64_t UptimeSeconds(const FactRecord& fact, uint64_t now_ms) {
  return now_ms > fact.first_seen_at_ms ? (now_ms - fact.first_seen_at_ms) / 1000 : 0;
}

} // namespace

Reconciler::Reconciler(std::shared_ptr<db::Repository> repository, std::shared_ptr<scan::SocketScanner> scanner,
                       ReconcilerOptions options)
    : repository_(std::move(repository)), scanner_(std::move(scanner)), options_(std::move(options)) {
  if (!options_.clock) {
    options_.clock = [] { return util::NowMillis(); };
  }
}

const std::string& Reconciler::HostId() const {
  return scanner_->HostId();
}

CyclePlan Reconciler::Plan(const std::string& host_id, const scan::ObservationMap& observed,
                           const std::vector<FactRecord>& existing, uint64_t now_ms, bool emit_alive_events) {
  CyclePlan plan;
  plan.report.host_id       = host_id;
  plan.report.started_at_ms = now_ms;

  std::unordered_map<PortKey, const FactRecord*, model::PortKeyHash> by_key;
  for (const auto& fact : existing) {
    if (fact.key.host_id == host_id) by_key.emplace(fact.key, &fact);
  }

  std::vector<const PortKey*> keys;
  keys.reserve(observed.size());
  for (const auto& [key, _] : observed) {
    if (key.host_id == host_id) keys.push_back(&key);
  }
  std::sort(keys.begin(), keys.end(), [](const PortKey* a, const PortKey* b) { return KeyLess(*a, *b); });
  plan.report.observed = keys.size();

  for (const PortKey* key : keys) {
    const auto& obs = observed.at(*key);
    auto        it  = by_key.find(*key);

    if (it == by_key.end()) {
      FactRecord fact;
      fact.key              = *key;
      fact.first_seen_at_ms = now_ms;
      fact.last_seen_at_ms  = now_ms;
      fact.state            = PortState::kActive;
      fact.total_seen_count = 1;
      CopyProcess(fact, obs);
      plan.inserts.push_back(std::move(fact));
      plan.events.push_back({*key, EventKind::kAppeared, obs.pid, obs.process_name});
      ++plan.report.appeared;
      continue;
    }

    const FactRecord& prior      = *it->second;
    const bool        was_active = prior.state == PortState::kActive;

    // a lookup failure leaves the name empty; that alone is not a takeover
    const bool changed = was_active && !prior.process_name.empty() && !obs.process_name.empty() &&
                         prior.process_name != obs.process_name;
    if (changed) {
      plan.events.push_back({*key, EventKind::kProcessChanged, obs.pid, obs.process_name});
      ++plan.report.process_changed;
    }

    if (!was_active) {
      plan.events.push_back({*key, EventKind::kAppeared, obs.pid, obs.process_name});
      ++plan.report.reappeared;
    } else {
      if (emit_alive_events && !changed) {
        plan.events.push_back({*key, EventKind::kAlive, obs.pid, obs.process_name});
      }
      ++plan.report.continued;
    }

    FactRecord fact      = prior;
    fact.last_seen_at_ms = now_ms;
    fact.state           = PortState::kActive;
    CopyProcess(fact, obs);
    fact.total_seen_count += 1;
    fact.total_uptime_seconds = UptimeSeconds(fact, now_ms);
    plan.updates.push_back(std::move(fact));
  }

  std::vector<const FactRecord*> gone;
  for (const auto& [key, fact] : by_key) {
    if (fact->state == PortState::kActive && !observed.contains(key)) gone.push_back(fact);
  }
  std::sort(gone.begin(), gone.end(), [](const FactRecord* a, const FactRecord* b) { return KeyLess(a->key, b->key); });

  for (const FactRecord* prior : gone) {
    FactRecord fact             = *prior;
    fact.state                  = PortState::kDisappeared;
    fact.last_disappeared_at_ms = now_ms;
    plan.events.push_back({fact.key, EventKind::kDisappeared, fact.pid, fact.process_name});
    plan.updates.push_back(std::move(fact));
    ++plan.report.disappeared;
  }

  return plan;
}

CycleReport Reconciler::RunCycle() {
  std::scoped_lock lock(cycle_mutex_);

  const auto started = std::chrono::steady_clock::now();
  const auto& host   = scanner_->HostId();

  // a failed scan must never reach the diff: it would read as "nothing listening"
  scan::ObservationMap observed;
  try {
    observed = scanner_->Scan();
  } catch (const util::ScanFailure& e) {
    observability::LogError("reconciliation skipped: scan failed",
                            {observability::StringField("host_id", host), observability::StringField("error", e.what())});
    throw;
  }

  CyclePlan plan;
  try {
    auto tx       = repository_->Begin();
    auto existing = repository_->ListFacts(*tx, db::FactFilter{host, std::nullopt});
    plan          = Plan(host, observed, existing, options_.clock(), options_.emit_alive_events);

    std::unordered_map<PortKey, uint64_t, model::PortKeyHash> ids;
    for (auto fact : plan.inserts) {
      ThrowIfDbError(repository_->InsertFact(*tx, fact), "insert fact " + model::ToString(fact.key));
      ids.emplace(fact.key, fact.id);
    }
    for (const auto& fact : plan.updates) {
      ThrowIfDbError(repository_->UpdateFact(*tx, fact), "update fact " + model::ToString(fact.key));
      ids.emplace(fact.key, fact.id);
    }
    for (const auto& pending : plan.events) {
      db::model::TimelineEventRecord event;
      event.fact_id      = ids.at(pending.key);
      event.kind         = pending.kind;
      event.timestamp_ms = plan.report.started_at_ms;
      event.pid          = pending.pid;
      event.process_name = pending.process_name;
      ThrowIfDbError(repository_->AppendEvent(*tx, event), "append event " + model::ToString(pending.key));
    }

    tx->Commit();
  } catch (const util::StoreUnavailable& e) {
    observability::LogError("reconciliation rolled back",
                            {observability::StringField("host_id", host), observability::StringField("error", e.what())});
    throw;
  } catch (const std::runtime_error& e) {
    observability::LogError("reconciliation rolled back",
                            {observability::StringField("host_id", host), observability::StringField("error", e.what())});
    throw util::StoreUnavailable(e.what());
  }

  plan.report.duration_ms = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count());

  const auto& r = plan.report;
  observability::LogInfo("reconciliation cycle complete",
                         {observability::StringField("host_id", host),
                          observability::IntField("observed", static_cast<int64_t>(r.observed)),
                          observability::IntField("appeared", static_cast<int64_t>(r.appeared)),
                          observability::IntField("reappeared", static_cast<int64_t>(r.reappeared)),
                          observability::IntField("continued", static_cast<int64_t>(r.continued)),
                          observability::IntField("process_changed", static_cast<int64_t>(r.process_changed)),
                          observability::IntField("disappeared", static_cast<int64_t>(r.disappeared)),
                          observability::IntField("duration_ms", static_cast<int64_t>(r.duration_ms))});
  return plan.report;
}

} // namespace portwatch::core
