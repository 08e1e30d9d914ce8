#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace registry::util {

struct RetryPolicy {
  uint32_t                  max_attempts    = 3;
  std::chrono::milliseconds initial_backoff = std::chrono::milliseconds(50);
  std::chrono::milliseconds max_backoff     = std::chrono::milliseconds(2000);
};

/*
  Runs fn until it returns without throwing TransientStorageError or the
  attempt budget is spent. Backoff doubles after every failed attempt.
  Any other exception propagates immediately.
*/
template <typename Fn>
auto RetryTransient(const RetryPolicy& policy, const std::string& what, Fn&& fn) -> decltype(fn()) {
  const uint32_t attempts = std::max<uint32_t>(policy.max_attempts, 1);
  auto           backoff  = policy.initial_backoff;

  for (uint32_t attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const TransientStorageError& e) {
      if (attempt >= attempts) {
        throw;
      }
      REGISTRY_LOG_WARN("transient failure, retrying",
                        {registry::observability::StringField("op", what), registry::observability::IntField("attempt", attempt),
                         registry::observability::ErrorField(e.what())});
      std::this_thread::sleep_for(backoff);
      backoff = std::min(backoff * 2, policy.max_backoff);
    }
  }
}

} // namespace registry::util
