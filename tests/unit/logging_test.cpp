#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/catalog/metadata_catalog.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/digest.hpp"

namespace {

namespace obs = registry::observability;

using registry::util::Sha256;

/*
  Routes the default logger into a ring buffer for the lifetime of the test.
*/
struct CapturedLog {
  std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(128);
  std::shared_ptr<spdlog::logger>                    previous = spdlog::default_logger();

  explicit CapturedLog(spdlog::level::level_enum level = spdlog::level::debug) {
    auto logger = std::make_shared<spdlog::logger>("captured", sink);
    logger->set_pattern("%v");
    logger->set_level(level);
    spdlog::set_default_logger(std::move(logger));
  }

  ~CapturedLog() {
    spdlog::set_default_logger(previous);
  }

  std::vector<std::string> Lines() {
    return sink->last_formatted();
  }

  std::size_t Count(const std::string& needle) {
    auto lines = Lines();
    return static_cast<std::size_t>(
        std::count_if(lines.begin(), lines.end(), [&](const std::string& line) { return line.find(needle) != std::string::npos; }));
  }
};

void TestFieldsSerializeAsKeyValue() {
  const auto hash = Sha256::Of("b1");
  assert(obs::FormatLine("artifact published", {obs::ArtifactField("left-pad", "1.0.0"), obs::HashField(hash), obs::BytesField(2)}) ==
         "artifact published artifact=left-pad@1.0.0 hash=" + hash + " size_bytes=2");
  assert(obs::FormatLine("abort failed", {obs::EntryField("e-1"), obs::ErrorField("disk full")}) ==
         "abort failed entry_id=e-1 error=\"disk full\"");
  assert(obs::FormatLine("deleted", {obs::StringField("reason", "")}) == "deleted reason=\"\"");
  assert(obs::FormatLine("odd", {obs::StringField("error", "say \"hi\"")}) == "odd error=\"say \\\"hi\\\"\"");
  assert(obs::FormatLine("bare", {}) == "bare");
}

void TestUnknownLevelFallsBackToInfo() {
  assert(obs::ParseLevel("debug") == spdlog::level::debug);
  assert(obs::ParseLevel("warn") == spdlog::level::warn);
  assert(obs::ParseLevel("error") == spdlog::level::err);
  assert(obs::ParseLevel("off") == spdlog::level::off);
  assert(obs::ParseLevel("verbose") == spdlog::level::info);
  assert(obs::ParseLevel("") == spdlog::level::info);
}

void TestLevelFiltering() {
  CapturedLog log(spdlog::level::warn);
  REGISTRY_LOG_INFO("quiet", {obs::HashField("aa")});
  REGISTRY_LOG_WARN("loud", {obs::HashField("bb")});
  assert(log.Count("quiet") == 0);
  assert(log.Count("loud hash=bb") == 1);
}

void TestCatalogMutationsAreLoggedOnce() {
  CapturedLog log;

  auto repository = std::make_shared<registry::db::memory::MemoryRepository>();
  auto catalog    = std::make_shared<registry::catalog::MetadataCatalog>(repository, std::make_shared<registry::util::ManualClock>(),
                                                                         std::make_shared<registry::catalog::EntryCache>());
  auto reservation = catalog->BeginPublish("left-pad", "1.0.0", 2, Sha256::Of("b1"));
  catalog->CommitPublish(reservation.entry_id);

  assert(catalog->HydrateCache() == 1);
  assert(log.Count("entry cache hydrated") == 1);
  assert(log.Count("entry cache hydrated entries=1") == 1);

  catalog->SoftDelete("left-pad", "1.0.0", "yanked by author");
  assert(log.Count("artifact deleted artifact=left-pad@1.0.0 hash=" + Sha256::Of("b1") + " reason=\"yanked by author\"") == 1);
}

void TestSpansAreInertWithoutTracing() {
  registry::runtime::config::RuntimeConfig config;
  assert(!obs::InitializeTracing(config));

  obs::SpanScope span("registry.publish");
  span.SetArtifact("left-pad", "1.0.0");
  span.SetContentHash(Sha256::Of("b1"));
  span.SetEntryId("e-1");
  span.SetAttribute(obs::attr::kSizeBytes, static_cast<std::int64_t>(2));
  span.RecordException("stream rejected");

  obs::SpanScope moved(std::move(span));
  moved.SetEntryId("e-2");
  obs::ShutdownTracing();
}

} // namespace

int main() {
  TestFieldsSerializeAsKeyValue();
  TestUnknownLevelFallsBackToInfo();
  TestLevelFiltering();
  TestCatalogMutationsAreLoggedOnce();
  TestSpansAreInertWithoutTracing();

  std::cout << "potato_registry_unit_logging: pass\n";
  return 0;
}
