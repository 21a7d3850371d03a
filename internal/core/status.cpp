#include "internal/core/status.hpp"

namespace portwatch::core {

model::DerivedStatus DeriveStatus(const db::model::FactRecord* fact, const db::model::AnnotationRecord* annotation) {
  if (fact == nullptr) {
    return model::DerivedStatus::kUnknown;
  }
  if (fact->state == model::PortState::kDisappeared) {
    return model::DerivedStatus::kGhost;
  }
  if (annotation == nullptr) {
    return model::DerivedStatus::kSuspicious;
  }
  if (annotation->risk_level == model::RiskLevel::kSuspicious) {
    return model::DerivedStatus::kSuspicious;
  }
  return model::DerivedStatus::kHealthy;
}

} // namespace portwatch::core
