#include "id_controller.h++"

using std::optional, std::shared_ptr, std::string, std::string_view;

namespace Tessera {
  static auto validate_config(const IdConfig& config, const shared_ptr<Clock>& clock) -> uint16_t {
    if (!clock) throw std::invalid_argument("IdController: clock must not be null");
    if (config.machine_id > MACHINE_ID_MAX) {
      throw IdError(IdErrorCode::InvalidMachineId,
        fmt::format("{:d} is out of range (0-{:d})", config.machine_id, MACHINE_ID_MAX));
    }
    const auto now = clock->now();
    if (config.epoch > now) {
      throw IdError(IdErrorCode::InvalidEpoch,
        fmt::format("{} is in the future (now {})", format_iso8601(config.epoch), format_iso8601(now)));
    }
    if (static_cast<uint64_t>((now - config.epoch).count()) > TIMESTAMP_MAX) {
      throw IdError(IdErrorCode::InvalidEpoch,
        fmt::format("{} is too far in the past for a {:d}-bit timestamp", format_iso8601(config.epoch), TIMESTAMP_BITS));
    }
    return static_cast<uint16_t>(config.machine_id);
  }

  IdController::IdController(IdConfig config, shared_ptr<Clock> clock)
    : _machine_id(validate_config(config, clock)), _epoch(config.epoch), counter(clock) {
    spdlog::info("ID generator ready: machine ID {:d}, epoch {}", _machine_id, format_iso8601(_epoch));
  }

  auto IdController::next_fields() -> IdFields {
    const auto tick = counter.next();
    const auto offset = (tick.timestamp - _epoch).count();
    if (offset < 0) {
      spdlog::critical("Clock reads {} which is before the epoch {}", format_iso8601(tick.timestamp), format_iso8601(_epoch));
      throw IdError(IdErrorCode::FieldOverflow, fmt::format("negative timestamp offset {:d}", offset));
    }
    return {
      .timestamp_offset = static_cast<uint64_t>(offset),
      .machine_id = _machine_id,
      .sequence = tick.sequence
    };
  }

  auto IdController::next_packed_id() -> uint64_t {
    return pack_id(next_fields());
  }

  auto IdController::next_id() -> string {
    return encode_id(next_packed_id());
  }

  auto parse_id(string_view id, TimestampMs epoch) -> ParsedId {
    if (id.length() != ENCODED_ID_LENGTH) {
      throw IdError(IdErrorCode::MalformedId,
        fmt::format("expected {:d} characters, got {:d}", ENCODED_ID_LENGTH, id.length()));
    }
    uint64_t packed;
    try {
      packed = Base62::decode(id);
    } catch (const IdError& e) {
      throw IdError(IdErrorCode::MalformedId, e.what());
    }
    if (packed > PACKED_ID_MAX) {
      throw IdError(IdErrorCode::MalformedId, fmt::format("\"{}\" is outside the valid ID range", id));
    }
    const auto fields = unpack_id(packed);
    const auto utc = epoch + std::chrono::milliseconds(fields.timestamp_offset);
    const auto offset = local_utc_offset(utc);
    return {
      .packed = packed,
      .timestamp_offset = fields.timestamp_offset,
      .machine_id = fields.machine_id,
      .sequence = fields.sequence,
      .utc = utc,
      .local = utc + offset,
      .utc_offset = offset
    };
  }

  auto try_parse_id(string_view id, TimestampMs epoch) noexcept -> optional<ParsedId> {
    try {
      return parse_id(id, epoch);
    } catch (const IdError& e) {
      spdlog::debug("Rejected ID \"{}\" - {}", id, e.message);
      return {};
    } catch (const std::runtime_error& e) {
      spdlog::debug("Rejected ID \"{}\" - {}", id, e.what());
      return {};
    }
  }

  auto request_id_generator(shared_ptr<IdController> ids) -> RequestTag::Generator {
    if (!ids) throw std::invalid_argument("request_id_generator: IdController must not be null");
    return [ids] { return ids->next_id(); };
  }
}
