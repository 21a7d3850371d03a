#pragma once

#include <memory>
#include <vector>

#include "config/config.pb.h"

#if PORTWATCH_WITH_GRPC
#include <grpcpp/impl/service_type.h>
#endif

namespace portwatch::db {
class Repository;
}
namespace portwatch::core {
class Reconciler;
}
namespace portwatch::collector {
class CollectorWorker;
}
namespace portwatch::service {
class PortService;
}

namespace portwatch::factory {

/*
  Application

  Owns all long-lived components wired from one RuntimeConfig.
  Everything here lives for the lifetime of the process. The collector
  is built stopped; the caller starts it.
*/
struct Application {
  std::shared_ptr<db::Repository>             repository;
  std::shared_ptr<core::Reconciler>           reconciler;
  std::shared_ptr<collector::CollectorWorker> collector;
  std::shared_ptr<service::PortService>       port_service;

#if PORTWATCH_WITH_GRPC
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
#endif
};

/*
  Opens the configured backend and applies the bootstrap schema.

  This is the ONLY place allowed to know concrete DB types. Neither
  backend configured selects the in-memory store.
*/
std::shared_ptr<db::Repository> BuildRepository(const portwatch::runtime::config::RuntimeConfig& config);

// Composition root. Expects a config that went through ConfigLoader::Validate.
Application Build(const portwatch::runtime::config::RuntimeConfig& config);

} // namespace portwatch::factory
