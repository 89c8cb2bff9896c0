#pragma once

#include <cstddef>
#include <span>

namespace trid::core {

// Weight applied to the sum of digits at positions 0, 2, 4, 6, 8.
// Fixed by the national identity number scheme.
inline constexpr int kOddSumWeight = 7;

// initial_checksum derives digit 9 from the nine ASCII digits at positions 0..8:
//   (7 * (d0 + d2 + d4 + d6 + d8) - (d1 + d3 + d5 + d7)) mod 10
// The remainder is Euclidean, so the result is always in 0..9.
// Precondition: every element is '0'..'9'.
[[nodiscard]] int initial_checksum(std::span<const char, 9> digits) noexcept;

// final_checksum derives digit 10 from the ten ASCII digits at positions 0..9:
//   (d0 + d1 + ... + d9) mod 10
// Precondition: every element is '0'..'9'.
[[nodiscard]] int final_checksum(std::span<const char, 10> digits) noexcept;

}  // namespace trid::core
