#pragma once
#include "util/common.h++"

namespace Tessera {
  class Clock {
  public:
    virtual ~Clock() = default;
    // Current instant, truncated to the millisecond. Not guaranteed to be
    // monotonic; callers must compare against their own last reading.
    virtual auto now() -> TimestampMs = 0;
  };

  class SystemClock : public Clock {
  public:
    auto now() -> TimestampMs override;
  };
}
