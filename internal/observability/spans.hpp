#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace registry::runtime::config {
class RuntimeConfig;
}

namespace registry::observability {

// Span attribute keys shared by the publish, fetch and maintenance paths.
namespace attr {
inline constexpr char kArtifactName[]    = "registry.artifact.name";
inline constexpr char kArtifactVersion[] = "registry.artifact.version";
inline constexpr char kVersionRange[]    = "registry.artifact.range";
inline constexpr char kContentHash[]     = "registry.content_hash";
inline constexpr char kEntryId[]         = "registry.entry_id";
inline constexpr char kSizeBytes[]       = "registry.size_bytes";
} // namespace attr

// Exports over OTLP when enabled in config; returns false when tracing is off.
bool InitializeTracing(const registry::runtime::config::RuntimeConfig& config);
void ShutdownTracing();

/*
  RAII span. Ends the span on destruction; a no-op when tracing is not
  compiled in or not initialized.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void RecordException(std::string_view description);

  void SetArtifact(std::string_view name, std::string_view version) {
    SetAttribute(attr::kArtifactName, name);
    SetAttribute(attr::kArtifactVersion, version);
  }

  void SetContentHash(std::string_view content_hash) {
    SetAttribute(attr::kContentHash, content_hash);
  }

  void SetEntryId(std::string_view entry_id) {
    SetAttribute(attr::kEntryId, entry_id);
  }

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const registry::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::RecordException(std::string_view) {
}
#endif

} // namespace registry::observability
