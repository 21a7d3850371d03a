#pragma once

#include "internal/db/model/annotation_record.hpp"
#include "internal/db/model/fact_record.hpp"
#include "internal/model/port.hpp"

namespace portwatch::core {

/*
  Presentation-only health of a tuple. Recomputed on every read, never stored.
  nullptr means the record does not exist.

  Rules, first match wins:
    no fact                          -> unknown
    disappeared                      -> ghost
    active, no annotation            -> suspicious
    active, annotated as suspicious  -> suspicious
    active, any other annotation     -> healthy
*/
model::DerivedStatus DeriveStatus(const db::model::FactRecord* fact, const db::model::AnnotationRecord* annotation);

} // namespace portwatch::core
