#pragma once

#include "trid/core/id_error.h"
#include "trid/core/result.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>

namespace trid::core {

// Number of ASCII digits in a national identity number.
inline constexpr std::size_t kLength = 11;

// Inclusive range of seeds accepted by TurkishId::from_seq. A seed supplies
// digits 0..8, so nine digits with a non-zero leading digit.
inline constexpr std::uint32_t kSeqMin = 100'000'000;
inline constexpr std::uint32_t kSeqMax = 999'999'999;

// is_valid reports whether candidate is a well-formed national identity number:
// exactly 11 ASCII digits, non-zero leading digit, and both checksum digits correct.
// Total function: never throws, never allocates.
[[nodiscard]] bool is_valid(std::string_view candidate) noexcept;

// TurkishId is an immutable value holding a checksum-valid identity number.
//
// Instances are created only by parse() or from_seq(), so every live value
// satisfies the checksum invariants. The digits are never exposed by
// reference; read them through to_string() or operator<<.
class TurkishId {
 public:
  using ParseResult = Result<TurkishId, IdError>;

  // parse validates candidate and, on success, copies its digits.
  // Checks run in order and the first failure is returned:
  // length, character class, leading zero, initial checksum, final checksum.
  [[nodiscard]] static ParseResult parse(std::string_view candidate) noexcept;

  // from_seq builds an identifier whose digits 0..8 are the decimal digits of seq
  // and whose checksum digits are derived. seq must lie in [kSeqMin, kSeqMax].
  [[nodiscard]] static ParseResult from_seq(std::uint32_t seq) noexcept;

  // Returns the eleven digits with no separators.
  [[nodiscard]] std::string to_string() const;

  [[nodiscard]] std::size_t hash() const noexcept;

  bool operator==(const TurkishId&) const = default;

  friend std::ostream& operator<<(std::ostream& os, const TurkishId& id);

 private:
  using Digits = std::array<char, kLength>;

  explicit TurkishId(const Digits& digits) noexcept : digits_(digits) {}

  Digits digits_;
};

}  // namespace trid::core

namespace std {

template <>
struct hash<trid::core::TurkishId> {
  std::size_t operator()(const trid::core::TurkishId& id) const noexcept { return id.hash(); }
};

}  // namespace std
