#include "id_layout.h++"

namespace Tessera {
  static inline auto field_overflow(std::string_view field, uint64_t value, uint64_t max) -> IdError {
    spdlog::critical("ID field {} = {:d} exceeds maximum {:d}; this is a bug", field, value, max);
    return IdError(IdErrorCode::FieldOverflow, fmt::format("{} = {:d} exceeds maximum {:d}", field, value, max));
  }

  auto pack_id(IdFields fields) -> uint64_t {
    if (fields.timestamp_offset > TIMESTAMP_MAX) {
      throw field_overflow("timestamp offset", fields.timestamp_offset, TIMESTAMP_MAX);
    }
    if (fields.machine_id > MACHINE_ID_MAX) {
      throw field_overflow("machine ID", fields.machine_id, MACHINE_ID_MAX);
    }
    if (fields.sequence > SEQUENCE_MAX) {
      throw field_overflow("sequence", fields.sequence, SEQUENCE_MAX);
    }
    return (fields.timestamp_offset << TIMESTAMP_SHIFT)
      | (static_cast<uint64_t>(fields.machine_id) << MACHINE_ID_SHIFT)
      | fields.sequence;
  }
}
