#include <grpcpp/grpcpp.h>

#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/util/digest.hpp"
#include "registry/v1.hpp"

using namespace registry::v1;

namespace {

constexpr std::size_t kChunkBytes = 64 * 1024;

void Usage() {
  std::cout << "Usage:\n"
            << "  registryctl <addr> publish <name> <version> <file> [uploader]\n"
            << "  registryctl <addr> fetch <name> <version|range> [out_file]\n"
            << "  registryctl <addr> delete <name> <version> [reason]\n"
            << "  registryctl <addr> delete-package <name> [reason]\n"
            << "  registryctl <addr> versions <name>\n"
            << "  registryctl <addr> packages\n"
            << "  registryctl <addr> gc\n"
            << "  registryctl <addr> reconcile\n"
            << "  registryctl <addr> purge <name> <version>\n";
}

int Fail(const grpc::Status& status) {
  std::cerr << "error(" << status.error_code() << "): " << status.error_message() << "\n";
  return 2;
}

bool ReadFile(const std::string& path, std::string* out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return false;
  }
  out->assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  return true;
}

int Publish(RegistryService::Stub& stub, const std::string& name, const std::string& version, const std::string& path,
            const std::string& uploader) {
  std::string bytes;
  if (!ReadFile(path, &bytes)) {
    std::cerr << "cannot read " << path << "\n";
    return 1;
  }

  grpc::ClientContext ctx;
  PublishResponse     resp;
  auto                writer = stub.Publish(&ctx, &resp);

  PublishRequest header;
  header.mutable_header()->set_name(name);
  header.mutable_header()->set_version(version);
  header.mutable_header()->set_declared_hash(registry::util::Sha256::Of(bytes));
  header.mutable_header()->set_declared_size(bytes.size());
  header.mutable_header()->set_uploader(uploader);

  bool ok = writer->Write(header);
  for (std::size_t offset = 0; ok && offset < bytes.size(); offset += kChunkBytes) {
    PublishRequest chunk;
    chunk.set_chunk(bytes.substr(offset, kChunkBytes));
    ok = writer->Write(chunk);
  }
  writer->WritesDone();

  auto status = writer->Finish();
  if (!status.ok()) {
    return Fail(status);
  }

  std::cout << "entry_id=" << resp.entry_id() << " created=" << (resp.created() ? "true" : "false") << "\n";
  return 0;
}

int Fetch(RegistryService::Stub& stub, const std::string& name, const std::string& range, const std::string& out_path) {
  FetchRequest req;
  req.set_name(name);
  req.set_version_or_range(range);

  grpc::ClientContext ctx;
  auto                reader = stub.Fetch(&ctx, req);

  ArtifactDescriptor descriptor;
  std::string        bytes;
  FetchResponse      msg;
  while (reader->Read(&msg)) {
    if (msg.has_descriptor()) {
      descriptor = msg.descriptor();
    } else {
      bytes.append(msg.chunk());
    }
  }

  auto status = reader->Finish();
  if (!status.ok()) {
    // Bytes received before a DATA_LOSS status are not trustworthy.
    return Fail(status);
  }

  if (out_path.empty()) {
    std::cout << bytes;
  } else {
    std::ofstream out(out_path, std::ios::binary | std::ios::trunc);
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
      std::cerr << "cannot write " << out_path << "\n";
      return 1;
    }
  }

  std::cerr << descriptor.name() << "@" << descriptor.version() << " sha256=" << descriptor.content_hash()
            << " size=" << descriptor.size_bytes() << " downloads=" << descriptor.download_count() << "\n";
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::vector<std::string> args(argv, argv + argc);
  const std::string&             addr = args[1];
  const std::string&             cmd  = args[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto registry_stub = RegistryService::NewStub(channel);
  auto admin_stub    = RegistryAdminService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "publish") {
    if (argc < 6) return 1;
    return Publish(*registry_stub, args[3], args[4], args[5], argc >= 7 ? args[6] : std::string());
  }

  // ------------------------------------------------------------

  if (cmd == "fetch") {
    if (argc < 5) return 1;
    return Fetch(*registry_stub, args[3], args[4], argc >= 6 ? args[5] : std::string());
  }

  // ------------------------------------------------------------

  if (cmd == "delete") {
    if (argc < 5) return 1;

    DeleteRequest req;
    req.set_name(args[3]);
    req.set_version(args[4]);
    if (argc >= 6) req.set_reason(args[5]);

    google::protobuf::Empty resp;

    auto status = registry_stub->Delete(&ctx, req, &resp);
    if (!status.ok()) {
      return Fail(status);
    }

    std::cout << "deleted\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "delete-package") {
    if (argc < 4) return 1;

    DeletePackageRequest req;
    req.set_name(args[3]);
    if (argc >= 5) req.set_reason(args[4]);

    DeletePackageResponse resp;

    auto status = registry_stub->DeletePackage(&ctx, req, &resp);
    if (!status.ok()) {
      return Fail(status);
    }

    std::cout << "deleted_versions=" << resp.deleted_versions() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "versions") {
    if (argc < 4) return 1;

    ListVersionsRequest req;
    req.set_name(args[3]);

    ListVersionsResponse resp;

    auto status = registry_stub->ListVersions(&ctx, req, &resp);
    if (!status.ok()) {
      return Fail(status);
    }

    for (const auto& v : resp.versions()) {
      std::cout << v << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "packages") {
    google::protobuf::Empty req;
    ListPackagesResponse    resp;

    auto status = registry_stub->ListPackages(&ctx, req, &resp);
    if (!status.ok()) {
      return Fail(status);
    }

    for (const auto& n : resp.names()) {
      std::cout << n << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "gc") {
    google::protobuf::Empty req;
    GcReport                resp;

    auto status = admin_stub->RunGarbageCollection(&ctx, req, &resp);
    if (!status.ok()) {
      return Fail(status);
    }

    std::cout << "scanned=" << resp.scanned() << "\n";
    std::cout << "deleted=" << resp.deleted() << "\n";
    std::cout << "bytes_reclaimed=" << resp.bytes_reclaimed() << "\n";
    std::cout << "skipped_young=" << resp.skipped_young() << "\n";
    std::cout << "skipped_referenced=" << resp.skipped_referenced() << "\n";
    std::cout << "staging_removed=" << resp.staging_removed() << "\n";
    std::cout << "entries_purged=" << resp.entries_purged() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "reconcile") {
    google::protobuf::Empty req;
    ReconcileResponse       resp;

    auto status = admin_stub->ReconcilePending(&ctx, req, &resp);
    if (!status.ok()) {
      return Fail(status);
    }

    std::cout << "aborted=" << resp.aborted() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "purge") {
    if (argc < 5) return 1;

    PurgeRequest req;
    req.set_name(args[3]);
    req.set_version(args[4]);

    PurgeResponse resp;

    auto status = admin_stub->Purge(&ctx, req, &resp);
    if (!status.ok()) {
      return Fail(status);
    }

    std::cout << "purged=" << resp.purged() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
