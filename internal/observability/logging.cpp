#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace registry::observability {
namespace {

constexpr char kLoggerName[]     = "potato-registry";
constexpr char kDefaultPattern[] = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%t] %v";

std::string FromEnvOr(const char* variable, const std::string& configured, const std::string& fallback) {
  if (const char* value = std::getenv(variable)) return value;
  return configured.empty() ? fallback : configured;
}

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) return true;
  for (char c : value) {
    if (c == ' ' || c == '"' || c == '=' || c == '\t' || c == '\n') return true;
  }
  return false;
}

void AppendField(std::string* line, const LogField& field) {
  line->push_back(' ');
  line->append(field.key);
  line->push_back('=');
  if (!NeedsQuoting(field.value)) {
    line->append(field.value);
    return;
  }
  line->push_back('"');
  for (char c : field.value) {
    if (c == '"' || c == '\\') line->push_back('\\');
    line->push_back(c == '\n' ? ' ' : c);
  }
  line->push_back('"');
}

#ifdef ENABLE_OTEL
void AppendHex(std::string* line, const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  for (std::size_t i = 0; i < size; ++i) {
    line->push_back(kHex[(data[i] >> 4) & 0x0F]);
    line->push_back(kHex[data[i] & 0x0F]);
  }
}

// Correlates a log line with the publish/fetch/gc span it was written under.
void AppendTraceContext(std::string* line) {
  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;
  auto context = span->GetContext();
  if (!context.IsValid()) return;

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  line->append(" trace_id=");
  AppendHex(line, trace_bytes, sizeof(trace_bytes));
  line->append(" span_id=");
  AppendHex(line, span_bytes, sizeof(span_bytes));
}
#else
void AppendTraceContext(std::string*) {
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField ArtifactField(std::string_view name, std::string_view version) {
  std::string value;
  value.reserve(name.size() + version.size() + 1);
  value.append(name).append("@").append(version);
  return {"artifact", std::move(value)};
}

LogField HashField(std::string_view content_hash) {
  return {"hash", std::string(content_hash)};
}

LogField EntryField(std::string_view entry_id) {
  return {"entry_id", std::string(entry_id)};
}

LogField BytesField(std::uint64_t size_bytes) {
  return {"size_bytes", std::to_string(size_bytes)};
}

LogField ErrorField(std::string_view what) {
  return {"error", std::string(what)};
}

spdlog::level::level_enum ParseLevel(std::string_view name) {
  const auto level = spdlog::level::from_str(std::string(name));
  if (level == spdlog::level::off && name != "off") return spdlog::level::info;
  return level;
}

std::string FormatLine(std::string_view message, std::initializer_list<LogField> fields) {
  std::string line(message);
  for (const auto& field : fields) AppendField(&line, field);
  return line;
}

void InitializeLogging(const registry::runtime::config::RuntimeConfig& config) {
  const auto level_name = FromEnvOr("REGISTRY_LOG_LEVEL", config.logging().level(), "info");

  auto logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(FromEnvOr("REGISTRY_LOG_PATTERN", config.logging().pattern(), kDefaultPattern));
  logger->set_level(ParseLevel(level_name));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  if (ParseLevel(level_name) == spdlog::level::info && level_name != "info") {
    LogWarn("unknown log level, using info", {StringField("level", level_name)});
  }
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto* logger = spdlog::default_logger_raw();
  if (logger == nullptr || !logger->should_log(level)) return;

  auto line = FormatLine(message, fields);
  AppendTraceContext(&line);
  logger->log(level, "{}", line);
}

} // namespace registry::observability
