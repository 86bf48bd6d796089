#include "base62.h++"

using Tessera::IdError, Tessera::IdErrorCode;

namespace Base62 {
  static constexpr uint8_t INVALID = 0xff;

  static constexpr auto DECODING_TABLE = [] {
    std::array<uint8_t, 256> table {};
    table.fill(INVALID);
    for (size_t i = 0; i < ALPHABET.length(); i++) {
      table[static_cast<uint8_t>(ALPHABET[i])] = static_cast<uint8_t>(i);
    }
    return table;
  }();

  auto is_symbol(char c) noexcept -> bool {
    return DECODING_TABLE[static_cast<uint8_t>(c)] != INVALID;
  }

  auto encode(uint64_t n, size_t min_width) -> std::string {
    char buf[MAX_WIDTH];
    size_t i = MAX_WIDTH;
    do {
      buf[--i] = ALPHABET[n % BASE];
      n /= BASE;
    } while (n);
    std::string out(buf + i, MAX_WIDTH - i);
    if (out.length() < min_width) out.insert(0, min_width - out.length(), ALPHABET[0]);
    return out;
  }

  auto decode(std::string_view input) -> uint64_t {
    if (input.empty()) throw IdError(IdErrorCode::MalformedId, "empty string");
    static constexpr uint64_t LIMIT = std::numeric_limits<uint64_t>::max();
    uint64_t acc = 0;
    for (size_t i = 0; i < input.length(); i++) {
      const uint8_t digit = DECODING_TABLE[static_cast<uint8_t>(input[i])];
      if (digit == INVALID) {
        throw IdError(IdErrorCode::InvalidCharacter, fmt::format(
          "0x{:02x} at position {:d} is not a base-62 symbol",
          static_cast<uint8_t>(input[i]), i
        ));
      }
      if (acc > (LIMIT - digit) / BASE) {
        throw IdError(IdErrorCode::MalformedId, fmt::format("\"{}\" does not fit in 64 bits", input));
      }
      acc = acc * BASE + digit;
    }
    return acc;
  }

  auto try_decode(std::string_view input) noexcept -> std::optional<uint64_t> {
    try {
      return decode(input);
    } catch (const IdError& e) {
      spdlog::debug("Base-62 decode failed - {}", e.what());
      return {};
    }
  }
}
