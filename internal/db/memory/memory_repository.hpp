#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace portwatch::db::memory {

class MemoryTransaction;

/*
  In-process backend used by tests and ephemeral deployments.

  Transactions work on a full copy of the committed state and publish it
  on commit; a concurrent commit in between is reported as a conflict.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginRead() override;

  Result InsertFact(Transaction&, model::FactRecord&) override;
  Result UpdateFact(Transaction&, const model::FactRecord&) override;
  std::optional<model::FactRecord> GetFact(Transaction&, const portwatch::model::PortKey&) override;
  std::vector<model::FactRecord> ListFacts(Transaction&, const FactFilter&) override;
  Result DeleteFact(Transaction&, const portwatch::model::PortKey&) override;

  Result AppendEvent(Transaction&, model::TimelineEventRecord&) override;
  std::vector<model::TimelineEventRecord> ListEvents(Transaction&, uint64_t fact_id) override;
  std::optional<model::TimelineEventRecord> LatestEvent(Transaction&, uint64_t fact_id) override;

  Result UpsertAnnotation(Transaction&, model::AnnotationRecord&) override;
  std::optional<model::AnnotationRecord> GetAnnotation(Transaction&, const portwatch::model::PortKey&) override;
  std::vector<model::AnnotationRecord> ListAnnotations(Transaction&, const AnnotationFilter&) override;
  Result DeleteAnnotation(Transaction&, const portwatch::model::PortKey&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::map<uint64_t, model::FactRecord> facts;
    std::unordered_map<portwatch::model::PortKey, uint64_t, portwatch::model::PortKeyHash> fact_ids;

    std::vector<model::TimelineEventRecord> events;

    std::unordered_map<portwatch::model::PortKey, model::AnnotationRecord, portwatch::model::PortKeyHash> notes;

    uint64_t next_fact_id  = 1;
    uint64_t next_event_id = 1;
    uint64_t next_note_id  = 1;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

}
