#include "sequence_counter.h++"
#include <thread>

namespace Tessera {
  static auto clock_regression(TimestampMs last, TimestampMs now) -> IdError {
    const auto behind = (last - now).count();
    spdlog::warn("Clock moved backwards by {:d} ms; refusing to issue an ID", behind);
    return IdError(IdErrorCode::ClockRegression, fmt::format(
      "clock moved backwards by {:d} ms (last issued at {}, now {})",
      behind, format_iso8601(last), format_iso8601(now)
    ));
  }

  SequenceCounter::SequenceCounter(std::shared_ptr<Clock> clock) : clock(clock) {
    if (!this->clock) throw std::invalid_argument("SequenceCounter: clock must not be null");
  }

  auto SequenceCounter::wait_next_ms(TimestampMs after) -> TimestampMs {
    auto now = clock->now();
    while (now <= after) {
      if (now < after) throw clock_regression(after, now);
      std::this_thread::yield();
      now = clock->now();
    }
    return now;
  }

  auto SequenceCounter::next() -> SequenceTick {
    std::lock_guard<std::mutex> lock(mutex);
    auto now = clock->now();
    if (now < last) throw clock_regression(last, now);
    uint16_t next_sequence = 0;
    if (now == last) {
      next_sequence = static_cast<uint16_t>((sequence + 1) & SEQUENCE_MAX);
      if (next_sequence == 0) {
        spdlog::debug("Sequence exhausted at {}, waiting for next millisecond", format_iso8601(now));
        now = wait_next_ms(last);
      }
    }
    // Only commit once nothing can throw, so a regression leaves the state as it was
    last = now;
    sequence = next_sequence;
    return { now, sequence };
  }

  auto SequenceCounter::last_timestamp() -> std::optional<TimestampMs> {
    std::lock_guard<std::mutex> lock(mutex);
    if (last == TimestampMs::min()) return {};
    return last;
  }
}
