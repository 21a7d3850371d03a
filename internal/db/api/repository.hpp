#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/annotation_record.hpp"
#include "internal/db/model/fact_record.hpp"
#include "internal/db/model/timeline_event_record.hpp"

namespace portwatch::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All access goes through a Transaction
  - Reads inside a transaction see its writes
  - (host_id, protocol, port) is unique among facts and among annotations
  - Facts and annotations are independent keyed containers joined at
    query time; deleting one never touches the other
  - Timeline events are append-only and die with their fact

  The DB is the source of truth for:
    facts
    timeline
    annotations
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // Read-only transaction; may run alongside a writer.
  virtual std::unique_ptr<Transaction> BeginRead() = 0;

  // ---------------------------------------------------------------------
  // Facts
  // ---------------------------------------------------------------------

  // Assigns record.id.
  virtual Result InsertFact(Transaction&, model::FactRecord&) = 0;

  virtual Result UpdateFact(Transaction&, const model::FactRecord&) = 0;

  virtual std::optional<model::FactRecord> GetFact(Transaction&, const portwatch::model::PortKey&) = 0;

  virtual std::vector<model::FactRecord> ListFacts(Transaction&, const FactFilter&) = 0;

  // NotFound when no fact exists for the key.
  virtual Result DeleteFact(Transaction&, const portwatch::model::PortKey&) = 0;

  // ---------------------------------------------------------------------
  // Timeline
  // ---------------------------------------------------------------------

  // Assigns event.id.
  virtual Result AppendEvent(Transaction&, model::TimelineEventRecord&) = 0;

  // Newest first.
  virtual std::vector<model::TimelineEventRecord> ListEvents(Transaction&, uint64_t fact_id) = 0;

  virtual std::optional<model::TimelineEventRecord> LatestEvent(Transaction&, uint64_t fact_id) = 0;

  // ---------------------------------------------------------------------
  // Annotations
  // ---------------------------------------------------------------------

  // Insert-or-replace by key; assigns record.id on insert.
  virtual Result UpsertAnnotation(Transaction&, model::AnnotationRecord&) = 0;

  virtual std::optional<model::AnnotationRecord> GetAnnotation(Transaction&, const portwatch::model::PortKey&) = 0;

  virtual std::vector<model::AnnotationRecord> ListAnnotations(Transaction&, const AnnotationFilter&) = 0;

  // NotFound when no annotation exists for the key.
  virtual Result DeleteAnnotation(Transaction&, const portwatch::model::PortKey&) = 0;
};

} // namespace portwatch::db
