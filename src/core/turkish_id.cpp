#include "trid/core/turkish_id.h"

#include "trid/core/checksum.h"

#include <optional>
#include <ostream>
#include <span>

namespace trid::core {

namespace {

bool is_ascii_digit(char c) noexcept {
  return c >= '0' && c <= '9';
}

char to_ascii(int digit) noexcept {
  return static_cast<char>('0' + digit);
}

int to_digit(char c) noexcept {
  return c - '0';
}

// find_error runs the full validation pipeline and returns the first failed check,
// or nullopt when candidate is a valid identity number.
// Shared by is_valid() and TurkishId::parse() so the two can never disagree.
std::optional<IdError> find_error(std::string_view candidate) noexcept {
  if (candidate.size() != kLength) {
    return IdError::of(IdErrorCode::kInvalidLength);
  }

  for (std::size_t i = 0; i < kLength; ++i) {
    if (!is_ascii_digit(candidate[i])) {
      return IdError::invalid_character(candidate[i], i);
    }
  }

  if (candidate[0] == '0') {
    return IdError::of(IdErrorCode::kFirstDigitIsZero);
  }

  const std::span<const char, 9> seq_digits{candidate.data(), 9};
  if (to_digit(candidate[9]) != initial_checksum(seq_digits)) {
    return IdError::of(IdErrorCode::kInvalidInitialChecksum);
  }

  const std::span<const char, 10> checked_digits{candidate.data(), 10};
  if (to_digit(candidate[10]) != final_checksum(checked_digits)) {
    return IdError::of(IdErrorCode::kInvalidFinalChecksum);
  }

  return std::nullopt;
}

}  // namespace

bool is_valid(std::string_view candidate) noexcept {
  return !find_error(candidate).has_value();
}

TurkishId::ParseResult TurkishId::parse(std::string_view candidate) noexcept {
  if (const auto error = find_error(candidate)) {
    return ParseResult::err(*error);
  }

  Digits digits{};
  for (std::size_t i = 0; i < kLength; ++i) {
    digits[i] = candidate[i];
  }
  return ParseResult::ok(TurkishId{digits});
}

TurkishId::ParseResult TurkishId::from_seq(std::uint32_t seq) noexcept {
  if (seq < kSeqMin || seq > kSeqMax) {
    return ParseResult::err(IdError::of(IdErrorCode::kSequenceOutOfRange));
  }

  Digits digits{};
  std::uint32_t rest = seq;
  for (std::size_t i = 9; i-- > 0;) {
    digits[i] = to_ascii(static_cast<int>(rest % 10));
    rest /= 10;
  }

  // Checksums are derived here, not verified, so the result is valid by construction.
  digits[9] = to_ascii(initial_checksum(std::span<const char, 9>{digits.data(), 9}));
  digits[10] = to_ascii(final_checksum(std::span<const char, 10>{digits.data(), 10}));
  return ParseResult::ok(TurkishId{digits});
}

std::string TurkishId::to_string() const {
  return std::string{digits_.data(), digits_.size()};
}

std::size_t TurkishId::hash() const noexcept {
  return std::hash<std::string_view>{}(std::string_view{digits_.data(), digits_.size()});
}

std::ostream& operator<<(std::ostream& os, const TurkishId& id) {
  return os.write(id.digits_.data(), static_cast<std::streamsize>(id.digits_.size()));
}

}  // namespace trid::core
