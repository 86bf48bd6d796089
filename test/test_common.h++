#pragma once
#include "util/common.h++"
#include "services/clock.h++"
#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include <catch2/catch_test_macros.hpp>
#include <spdlog/sinks/ringbuffer_sink.h>

using std::make_shared, std::nullopt, std::optional, std::shared_ptr,
    std::string, std::string_view, std::vector;
using namespace std::chrono_literals;
using namespace std::literals::string_view_literals;
using namespace Tessera;

// 2023-12-26T20:13:13.348Z
static constexpr TimestampMs SAMPLE_INSTANT = TimestampMs(std::chrono::milliseconds(1'703'621'593'348));

class ManualClock : public Clock {
private:
  std::atomic<int64_t> ms;
  std::atomic<uint64_t> reads = 0;
public:
  ManualClock(TimestampMs start = SAMPLE_INSTANT) : ms(timestamp_to_ms(start)) {}

  auto now() -> TimestampMs override {
    reads.fetch_add(1, std::memory_order_relaxed);
    return ms_to_timestamp(ms.load(std::memory_order_acquire));
  }
  auto set(TimestampMs t) -> void {
    ms.store(timestamp_to_ms(t), std::memory_order_release);
  }
  auto advance(std::chrono::milliseconds d = 1ms) -> void {
    ms.fetch_add(d.count(), std::memory_order_acq_rel);
  }
  auto total_reads() const -> uint64_t {
    return reads.load(std::memory_order_relaxed);
  }
};

// Replaces the default logger for the lifetime of the object
struct CapturedLog {
  shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink;
  shared_ptr<spdlog::logger> previous;

  CapturedLog(spdlog::level::level_enum level = spdlog::level::debug)
    : sink(make_shared<spdlog::sinks::ringbuffer_sink_mt>(256)),
      previous(spdlog::default_logger())
  {
    auto logger = make_shared<spdlog::logger>("test", sink);
    logger->set_pattern("%l %v");
    logger->set_level(level);
    spdlog::set_default_logger(logger);
  }
  ~CapturedLog() {
    spdlog::set_default_logger(previous);
  }

  auto lines() -> vector<string> {
    auto lines = sink->last_formatted();
    for (auto& l : lines) {
      while (!l.empty() && (l.back() == '\n' || l.back() == '\r')) l.pop_back();
    }
    return lines;
  }
  auto contains(string_view needle) -> bool {
    for (const auto& l : lines()) if (l.find(needle) != string::npos) return true;
    return false;
  }
};
