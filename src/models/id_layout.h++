#pragma once
#include "util/common.h++"
#include "util/base62.h++"

namespace Tessera {

  // Packed layout, most significant bit first:
  //   1 unused | 41 timestamp offset (ms) | 10 machine ID | 12 sequence
  constexpr unsigned TIMESTAMP_BITS = 41, MACHINE_ID_BITS = 10, SEQUENCE_BITS = 12;
  constexpr unsigned MACHINE_ID_SHIFT = SEQUENCE_BITS, TIMESTAMP_SHIFT = SEQUENCE_BITS + MACHINE_ID_BITS;

  constexpr uint64_t TIMESTAMP_MAX = (1ULL << TIMESTAMP_BITS) - 1,
    MACHINE_ID_MAX = (1ULL << MACHINE_ID_BITS) - 1,
    SEQUENCE_MAX = (1ULL << SEQUENCE_BITS) - 1,
    PACKED_ID_MAX = (1ULL << (TIMESTAMP_BITS + MACHINE_ID_BITS + SEQUENCE_BITS)) - 1;

  // Every encoded ID is padded to this many base-62 symbols, so that string
  // order matches numeric order
  constexpr size_t ENCODED_ID_LENGTH = 11;

  static_assert(TIMESTAMP_BITS + MACHINE_ID_BITS + SEQUENCE_BITS == 63, "packed ID must leave the sign bit clear");
  static_assert(ENCODED_ID_LENGTH <= Base62::MAX_WIDTH);
  static_assert([] {
    uint64_t n = PACKED_ID_MAX;
    for (size_t i = 0; i < ENCODED_ID_LENGTH; i++) n /= Base62::BASE;
    return n == 0;
  }(), "ENCODED_ID_LENGTH symbols must hold PACKED_ID_MAX");

  struct IdFields {
    uint64_t timestamp_offset;
    uint16_t machine_id;
    uint16_t sequence;

    auto operator==(const IdFields&) const -> bool = default;
  };

  // Throws IdError (FieldOverflow) if any field exceeds its width
  auto pack_id(IdFields fields) -> uint64_t;

  constexpr auto unpack_id(uint64_t packed) noexcept -> IdFields {
    return {
      .timestamp_offset = (packed >> TIMESTAMP_SHIFT) & TIMESTAMP_MAX,
      .machine_id = static_cast<uint16_t>((packed >> MACHINE_ID_SHIFT) & MACHINE_ID_MAX),
      .sequence = static_cast<uint16_t>(packed & SEQUENCE_MAX)
    };
  }

  static inline auto encode_id(uint64_t packed) -> std::string {
    return Base62::encode(packed, ENCODED_ID_LENGTH);
  }
}

namespace fmt {
  template <> struct formatter<Tessera::IdFields> : public Tessera::CustomFormatter {
    template <typename FormatContext>
    auto format(const Tessera::IdFields& f, FormatContext& ctx) const {
      return format_to(ctx.out(), "(offset={:d}, machine={:d}, seq={:d})", f.timestamp_offset, f.machine_id, f.sequence);
    }
  };
}
