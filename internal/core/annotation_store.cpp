#include "internal/core/annotation_store.hpp"

#include "internal/core/db_errors.hpp"
#include "internal/core/key_validation.hpp"
#include "internal/util/errors.hpp"

namespace portwatch::core {

void ApplyPatch(db::model::AnnotationRecord& record, const AnnotationPatch& patch) {
  if (patch.title) record.title = *patch.title;
  if (patch.description) record.description = *patch.description;
  if (patch.owner) record.owner = *patch.owner;
  if (patch.risk_level) record.risk_level = *patch.risk_level;
  if (patch.is_pinned) record.is_pinned = *patch.is_pinned;
}

AnnotationStore::AnnotationStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

db::model::AnnotationRecord AnnotationStore::Upsert(const model::PortKey& key, const AnnotationPatch& patch) {
  ValidateKey(key);

  auto tx = repository_->Begin();

  db::model::AnnotationRecord record;
  if (auto existing = repository_->GetAnnotation(*tx, key)) {
    record = std::move(*existing);
  } else {
    record.key = key;
  }
  ApplyPatch(record, patch);

  ThrowIfDbError(repository_->UpsertAnnotation(*tx, record), "upsert annotation " + model::ToString(key));
  tx->Commit();
  return record;
}

db::model::AnnotationRecord AnnotationStore::Get(const model::PortKey& key) {
  ValidateKey(key);

  auto tx       = repository_->BeginRead();
  auto existing = repository_->GetAnnotation(*tx, key);
  tx->Commit();
  if (!existing) {
    throw util::NotFound("no annotation for " + model::ToString(key));
  }
  return *existing;
}

bool AnnotationStore::Delete(const model::PortKey& key) {
  ValidateKey(key);

  auto tx     = repository_->Begin();
  auto result = repository_->DeleteAnnotation(*tx, key);
  if (result.code == db::ErrorCode::NotFound) {
    return false;
  }
  ThrowIfDbError(result, "delete annotation " + model::ToString(key));
  tx->Commit();
  return true;
}

std::vector<db::model::AnnotationRecord> AnnotationStore::List(const std::string& host_id) {
  auto tx  = repository_->BeginRead();
  auto out = repository_->ListAnnotations(*tx, db::AnnotationFilter{host_id});
  tx->Commit();
  return out;
}

} // namespace portwatch::core
