#include "registry_service.hpp"

#include "internal/catalog/metadata_catalog.hpp"
#include "internal/core/upload_coordinator.hpp"
#include "internal/util/time.hpp"
#include "traced_call.hpp"

namespace registry::service {

using namespace registry::v1;

RegistryService::RegistryService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

PublishResponse RegistryService::Publish(const PublishHeader& header, storage::ByteSource& source) {
  return TracedCall("RegistryService.Publish", [&](observability::SpanScope& span) {
    span.SetArtifact(header.name(), header.version());

    core::PublishRequest request;
    request.name          = header.name();
    request.version       = header.version();
    request.declared_hash = header.declared_hash();
    request.declared_size = header.declared_size();
    request.uploader      = header.uploader();

    const auto result = ctx_.coordinator->Publish(request, source);

    PublishResponse resp;
    resp.set_entry_id(result.entry_id);
    resp.set_created(result.created);
    return resp;
  });
}

std::unique_ptr<core::ArtifactStream> RegistryService::Fetch(const FetchRequest& req) {
  return TracedCall("RegistryService.Fetch", [&](observability::SpanScope& span) {
    span.SetAttribute(observability::attr::kArtifactName, req.name());
    span.SetAttribute(observability::attr::kVersionRange, req.version_or_range());
    return ctx_.resolver->Fetch(req.name(), req.version_or_range());
  });
}

void RegistryService::Delete(const DeleteRequest& req) {
  TracedCall("RegistryService.Delete", [&](observability::SpanScope& span) {
    span.SetArtifact(req.name(), req.version());
    ctx_.catalog->SoftDelete(req.name(), req.version(), req.reason());
  });
}

DeletePackageResponse RegistryService::DeletePackage(const DeletePackageRequest& req) {
  return TracedCall("RegistryService.DeletePackage", [&](observability::SpanScope& span) {
    span.SetAttribute(observability::attr::kArtifactName, req.name());
    const auto            deleted = ctx_.catalog->DeletePackage(req.name(), req.reason());
    DeletePackageResponse resp;
    resp.set_deleted_versions(static_cast<uint32_t>(deleted.size()));
    return resp;
  });
}

ListVersionsResponse RegistryService::ListVersions(const ListVersionsRequest& req) {
  return TracedCall("RegistryService.ListVersions", [&](observability::SpanScope&) {
    ListVersionsResponse resp;
    for (auto& v : ctx_.catalog->ListVersions(req.name())) resp.add_versions(std::move(v));
    return resp;
  });
}

ListPackagesResponse RegistryService::ListPackages() {
  return TracedCall("RegistryService.ListPackages", [&](observability::SpanScope&) {
    ListPackagesResponse resp;
    for (auto& name : ctx_.catalog->ListPackages()) resp.add_names(std::move(name));
    return resp;
  });
}

ArtifactDescriptor RegistryService::Describe(const catalog::CatalogEntryRecord& entry) {
  ArtifactDescriptor d;
  d.set_entry_id(entry.id);
  d.set_name(entry.name);
  d.set_version(entry.version);
  d.set_content_hash(entry.content_hash);
  d.set_size_bytes(entry.size_bytes);
  d.set_state(entry.state);
  d.set_uploader(entry.uploader);
  *d.mutable_uploaded_at() = util::ToProto(util::FromUnixMillis(entry.created_at_ms));
  d.set_download_count(entry.download_count);
  return d;
}

} // namespace registry::service
