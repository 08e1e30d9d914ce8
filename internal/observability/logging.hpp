#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace registry::runtime::config {
class RuntimeConfig;
}

namespace registry::observability {

/*
  One key=value pair appended to a log line. Values containing spaces or
  quotes are emitted double-quoted so lines stay machine-splittable.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// artifact=name@version
LogField ArtifactField(std::string_view name, std::string_view version);
LogField HashField(std::string_view content_hash);
LogField EntryField(std::string_view entry_id);
LogField BytesField(std::uint64_t size_bytes);
LogField ErrorField(std::string_view what);

// Unknown names fall back to info instead of silencing the logger.
spdlog::level::level_enum ParseLevel(std::string_view name);

// Line body as written to the sink: message followed by the serialized fields.
std::string FormatLine(std::string_view message, std::initializer_list<LogField> fields);

void InitializeLogging(const registry::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace registry::observability

#define REGISTRY_LOG_DEBUG(message, ...) ::registry::observability::LogDebug((message), ##__VA_ARGS__)
#define REGISTRY_LOG_INFO(message, ...) ::registry::observability::LogInfo((message), ##__VA_ARGS__)
#define REGISTRY_LOG_WARN(message, ...) ::registry::observability::LogWarn((message), ##__VA_ARGS__)
#define REGISTRY_LOG_ERROR(message, ...) ::registry::observability::LogError((message), ##__VA_ARGS__)
