#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace portwatch::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}
