#pragma once

#include <cstdint>
#include <string>

#include "internal/db/api/repository.hpp"

namespace portwatch::archive {

struct ImportReport {
  uint32_t facts_imported  = 0;
  uint32_t facts_skipped   = 0;
  uint32_t events_imported = 0;
  uint32_t events_skipped  = 0;
  uint32_t notes_imported  = 0;
};

/*
  Reads the legacy JSON export ({"runtimes":[],"notes":[],"events":[]})
  into the store inside one transaction.

  Facts get fresh ids and events follow them through an old->new id map.
  A fact whose tuple already exists is skipped, as is an event whose
  runtime was not imported; both are logged. Notes are upserted by tuple.

  Throws util::InvalidArgument for malformed documents or rows, in which
  case nothing is written.
*/
ImportReport ImportLegacyJson(db::Repository& repository, const std::string& json);

// All facts, events and notes in the legacy layout, timestamps in RFC 3339 UTC.
std::string ExportLegacyJson(db::Repository& repository);

} // namespace portwatch::archive
