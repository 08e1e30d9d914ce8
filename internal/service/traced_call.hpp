#pragma once

#include <exception>
#include <string_view>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace registry::service {

/*
  Runs one service operation inside a span. Failures are recorded on the
  span, logged with the route, and rethrown unchanged.
*/
template <typename Fn>
auto TracedCall(std::string_view route, Fn&& fn) -> decltype(fn(std::declval<observability::SpanScope&>())) {
  observability::SpanScope span(route);
  try {
    return fn(span);
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    REGISTRY_LOG_WARN("RPC failed", {observability::StringField("route", route), observability::ErrorField(ex.what())});
    throw;
  }
}

} // namespace registry::service
