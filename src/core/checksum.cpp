#include "trid/core/checksum.h"

namespace trid::core {

namespace {

int digit_value(char c) noexcept {
  return c - '0';
}

}  // namespace

int initial_checksum(std::span<const char, 9> digits) noexcept {
  int odd_sum = 0;
  int even_sum = 0;
  for (std::size_t i = 0; i < digits.size(); ++i) {
    if (i % 2 == 0) {
      odd_sum += digit_value(digits[i]);
    } else {
      even_sum += digit_value(digits[i]);
    }
  }

  // even_sum can exceed 7 * odd_sum (e.g. "190909090"), so fold negatives back into 0..9.
  const int raw = (odd_sum * kOddSumWeight - even_sum) % 10;
  return raw < 0 ? raw + 10 : raw;
}

int final_checksum(std::span<const char, 10> digits) noexcept {
  int total = 0;
  for (const char c : digits) {
    total += digit_value(c);
  }
  return total % 10;
}

}  // namespace trid::core
