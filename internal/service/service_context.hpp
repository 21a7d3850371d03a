#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace portwatch::core { class AnnotationStore; }
namespace portwatch::collector { class CollectorWorker; }
namespace portwatch::diagnostics { class DiagnosticRunner; }
namespace portwatch::db { class Repository; }

namespace portwatch::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<portwatch::db::Repository> repository;
  std::shared_ptr<portwatch::core::AnnotationStore> annotations;
  std::shared_ptr<portwatch::collector::CollectorWorker> collector;
  std::shared_ptr<portwatch::diagnostics::DiagnosticRunner> diagnostics;

  // host observed by this process; requests with an empty host_id mean this one
  std::string host_id;

  // wall clock in Unix ms; tests pin it
  std::function<uint64_t()> clock;
};

}
