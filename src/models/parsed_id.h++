#pragma once
#include "models/id_layout.h++"

namespace Tessera {
  // Immutable result of parsing an encoded ID; copyable but never reassigned
  struct ParsedId {
    const uint64_t packed;
    const uint64_t timestamp_offset;
    const uint16_t machine_id;
    const uint16_t sequence;
    const TimestampMs utc;
    // Wall-clock time in the host's timezone when the ID was parsed; for display only
    const TimestampMs local;
    const std::chrono::seconds utc_offset;
  };
}

namespace fmt {
  template <> struct formatter<Tessera::ParsedId> : public Tessera::CustomFormatter {
    template <typename FormatContext>
    auto format(const Tessera::ParsedId& p, FormatContext& ctx) const {
      return format_to(ctx.out(), "machine_id={:d} sequence={:d} utc={} local={}",
        p.machine_id, p.sequence, Tessera::format_iso8601(p.utc), Tessera::format_iso8601(p.local));
    }
  };
}
