#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace registry::util {

/*
  Time utilities — single place to control clock source.

  Grace periods and pending timeouts are computed against a Clock so the
  sweeps can be driven deterministically.
*/

using SystemClock = std::chrono::system_clock;
using TimePoint   = SystemClock::time_point;
using Duration    = std::chrono::milliseconds;

class Clock {
 public:
  virtual ~Clock() = default;

  virtual TimePoint Now() const = 0;
};

class WallClock final : public Clock {
 public:
  TimePoint Now() const override {
    return SystemClock::now();
  }
};

/*
  Clock that only moves when told to. Starts at the wall clock time of
  construction so file modification times stay comparable.
*/
class ManualClock final : public Clock {
 public:
  ManualClock();

  TimePoint Now() const override;

  void Advance(Duration delta);
  void Set(TimePoint tp);

 private:
  mutable std::mutex mutex_;
  TimePoint          now_;
};

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

// Zero when the proto duration is unset.
Duration FromProto(const google::protobuf::Duration& d);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

} // namespace registry::util
