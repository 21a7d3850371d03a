#include "internal/core/annotation_store.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using portwatch::core::AnnotationPatch;
using portwatch::core::AnnotationStore;
using portwatch::db::memory::MemoryRepository;
using portwatch::model::PortKey;
using portwatch::model::Protocol;
using portwatch::model::RiskLevel;

const PortKey kSsh{"local", Protocol::kTcp, 22};

void TestCreateUsesDefaults() {
  AnnotationStore store(std::make_shared<MemoryRepository>());

  AnnotationPatch patch;
  patch.title = "ssh";
  const auto created = store.Upsert(kSsh, patch);

  assert(created.id != 0);
  assert(created.title == "ssh");
  assert(created.description.empty());
  assert(created.risk_level == RiskLevel::kExpected);
  assert(!created.is_pinned);
}

void TestPartialUpdateKeepsOtherFields() {
  AnnotationStore store(std::make_shared<MemoryRepository>());

  AnnotationPatch first;
  first.title       = "ssh";
  first.owner       = "ops";
  first.risk_level  = RiskLevel::kTrusted;
  first.is_pinned   = true;
  const auto before = store.Upsert(kSsh, first);

  AnnotationPatch second;
  second.description = "bastion entry";
  const auto after   = store.Upsert(kSsh, second);

  assert(after.id == before.id);
  assert(after.title == "ssh");
  assert(after.owner == "ops");
  assert(after.description == "bastion entry");
  assert(after.risk_level == RiskLevel::kTrusted);
  assert(after.is_pinned);

  // an explicitly empty value is a change, not "unset"
  AnnotationPatch clear;
  clear.owner = "";
  assert(store.Upsert(kSsh, clear).owner.empty());
}

void TestGetAndDeleteReportMissingTuples() {
  AnnotationStore store(std::make_shared<MemoryRepository>());

  bool threw = false;
  try {
    (void)store.Get(kSsh);
  } catch (const portwatch::util::NotFound&) {
    threw = true;
  }
  assert(threw);
  assert(!store.Delete(kSsh));

  store.Upsert(kSsh, AnnotationPatch{});
  assert(store.Get(kSsh).key == kSsh);
  assert(store.Delete(kSsh));
  assert(!store.Delete(kSsh));
}

void TestListIsPerHost() {
  AnnotationStore store(std::make_shared<MemoryRepository>());
  store.Upsert(kSsh, AnnotationPatch{});
  store.Upsert(PortKey{"local", Protocol::kUdp, 53}, AnnotationPatch{});
  store.Upsert(PortKey{"edge-2", Protocol::kTcp, 22}, AnnotationPatch{});

  const auto local = store.List("local");
  assert(local.size() == 2);
  assert(local[0].key.protocol == Protocol::kTcp);
  assert(store.List("edge-2").size() == 1);
  assert(store.List("nowhere").empty());
}

void TestInvalidKeysNeverReachTheStore() {
  AnnotationStore store(std::make_shared<MemoryRepository>());
  bool            threw = false;
  try {
    store.Upsert(PortKey{"local", Protocol::kTcp, 0}, AnnotationPatch{});
  } catch (const portwatch::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
  assert(store.List("local").empty());
}

void TestConcurrentCommitIsStoreUnavailable() {
  auto repository = std::make_shared<MemoryRepository>();
  AnnotationStore store(repository);

  // a writer that started before the store's upsert loses at commit time
  auto stale = repository->Begin();
  portwatch::db::model::AnnotationRecord note;
  note.key   = PortKey{"local", Protocol::kTcp, 443};
  note.title = "https";
  assert(repository->UpsertAnnotation(*stale, note));

  AnnotationPatch patch;
  patch.title = "ssh";
  store.Upsert(kSsh, patch);

  bool threw = false;
  try {
    stale->Commit();
  } catch (const portwatch::util::StoreUnavailable&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)store.Get(PortKey{"local", Protocol::kTcp, 443});
  } catch (const portwatch::util::NotFound&) {
    threw = true;
  }
  assert(threw);
  assert(store.Get(kSsh).title == "ssh");
}

} // namespace

int main() {
  TestCreateUsesDefaults();
  TestPartialUpdateKeepsOtherFields();
  TestGetAndDeleteReportMissingTuples();
  TestListIsPerHost();
  TestInvalidKeysNeverReachTheStore();
  TestConcurrentCommitIsStoreUnavailable();

  std::cout << "portwatch_unit_annotation_store: pass\n";
  return 0;
}
