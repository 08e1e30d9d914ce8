#pragma once

#include <memory>

namespace registry::catalog { class MetadataCatalog; }
namespace registry::core { class UploadCoordinator; class RetrievalResolver; }
namespace registry::gc { class MaintenanceWorker; }

namespace registry::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<registry::catalog::MetadataCatalog> catalog;
  std::shared_ptr<registry::core::UploadCoordinator> coordinator;
  std::shared_ptr<registry::core::RetrievalResolver> resolver;
  std::shared_ptr<registry::gc::MaintenanceWorker> maintenance;
};

} // namespace registry::service
