#include "clock.h++"

namespace Tessera {
  auto SystemClock::now() -> TimestampMs {
    return now_ms();
  }
}
