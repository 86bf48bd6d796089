#pragma once
#include "models/parsed_id.h++"
#include "services/clock.h++"
#include "services/sequence_counter.h++"
#include "util/request_tag.h++"
#include <memory>

namespace Tessera {
  // 2023-01-01T00:00:00Z
  constexpr TimestampMs DEFAULT_EPOCH = TimestampMs(std::chrono::milliseconds(1'672'531'200'000));

  struct IdConfig {
    uint64_t machine_id = 0;
    TimestampMs epoch = DEFAULT_EPOCH;
  };

  // Throws IdError (MalformedId) if the string is not a well-formed encoded ID
  auto parse_id(std::string_view id, TimestampMs epoch = DEFAULT_EPOCH) -> ParsedId;

  auto try_parse_id(std::string_view id, TimestampMs epoch = DEFAULT_EPOCH) noexcept -> std::optional<ParsedId>;

  // Issues IDs for one machine. Construct one per process and share it;
  // every method is safe to call from multiple threads.
  class IdController {
  private:
    uint16_t _machine_id;
    TimestampMs _epoch;
    SequenceCounter counter;
  public:
    // Throws IdError (InvalidMachineId or InvalidEpoch) on bad configuration
    IdController(IdConfig config, std::shared_ptr<Clock> clock = std::make_shared<SystemClock>());

    auto machine_id() const noexcept -> uint16_t { return _machine_id; }
    auto epoch() const noexcept -> TimestampMs { return _epoch; }

    auto next_fields() -> IdFields;
    auto next_packed_id() -> uint64_t;
    auto next_id() -> std::string;

    auto parse_id(std::string_view id) const -> ParsedId {
      return Tessera::parse_id(id, _epoch);
    }
    auto try_parse_id(std::string_view id) const noexcept -> std::optional<ParsedId> {
      return Tessera::try_parse_id(id, _epoch);
    }
  };

  // Generator for RequestTag that draws each ID from a shared controller
  auto request_id_generator(std::shared_ptr<IdController> ids) -> RequestTag::Generator;
}
