#pragma once
#include "services/clock.h++"
#include "models/id_layout.h++"
#include <memory>
#include <mutex>

namespace Tessera {
  struct SequenceTick {
    TimestampMs timestamp;
    uint16_t sequence;
  };

  // Per-millisecond sequence shared by every caller of one ID generator.
  // Thread-safe; all state changes happen under a single mutex.
  class SequenceCounter {
  private:
    std::shared_ptr<Clock> clock;
    std::mutex mutex;
    TimestampMs last = TimestampMs::min();
    uint16_t sequence = 0;

    auto wait_next_ms(TimestampMs after) -> TimestampMs;
  public:
    SequenceCounter(std::shared_ptr<Clock> clock);

    // Throws IdError (ClockRegression) if the clock reads earlier than the
    // last issued tick. Blocks until the next millisecond if the sequence
    // for the current millisecond is exhausted; a backward clock step during
    // that wait also throws ClockRegression.
    auto next() -> SequenceTick;

    auto last_timestamp() -> std::optional<TimestampMs>;
  };
}
