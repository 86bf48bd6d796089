#pragma once
#include "util/common.h++"
#include <array>

namespace Base62 {

constexpr uint64_t BASE = 62;
constexpr std::string_view ALPHABET = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";

// Number of symbols needed for the largest uint64_t
constexpr size_t MAX_WIDTH = 11;

static_assert(ALPHABET.length() == BASE);

auto encode(uint64_t n, size_t min_width = 0) -> std::string;

// Throws IdError (InvalidCharacter) on a symbol outside the alphabet,
// or IdError (MalformedId) if the input is empty or does not fit in 64 bits
auto decode(std::string_view input) -> uint64_t;

auto try_decode(std::string_view input) noexcept -> std::optional<uint64_t>;

auto is_symbol(char c) noexcept -> bool;

}
