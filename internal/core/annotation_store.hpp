#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/annotation_record.hpp"

namespace portwatch::core {

// Fields to change; unset fields keep their stored value (or the default on create).
struct AnnotationPatch {
  std::optional<std::string>      title;
  std::optional<std::string>      description;
  std::optional<std::string>      owner;
  std::optional<model::RiskLevel> risk_level;
  std::optional<bool>             is_pinned;
};

void ApplyPatch(db::model::AnnotationRecord& record, const AnnotationPatch& patch);

/*
  Operator memory about tuples. Never consults or modifies facts.
*/
class AnnotationStore {
 public:
  explicit AnnotationStore(std::shared_ptr<db::Repository> repository);

  db::model::AnnotationRecord Upsert(const model::PortKey& key, const AnnotationPatch& patch);

  // Throws util::NotFound for an unknown tuple.
  db::model::AnnotationRecord Get(const model::PortKey& key);

  // false when nothing existed for the tuple.
  bool Delete(const model::PortKey& key);

  std::vector<db::model::AnnotationRecord> List(const std::string& host_id);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace portwatch::core
