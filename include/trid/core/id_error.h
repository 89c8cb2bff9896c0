#pragma once

#include <cstddef>
#include <string>

namespace trid::core {

// Error enumeration following E.14 (use purpose-designed types as error indicators).
// Each code names exactly one failed check of the validation pipeline.
enum class IdErrorCode {
  kInvalidLength,
  kInvalidCharacter,
  kFirstDigitIsZero,
  kInvalidInitialChecksum,
  kInvalidFinalChecksum,
  kSequenceOutOfRange,
};

// IdError is the failure half of every fallible identifier operation.
// character and position are meaningful only for kInvalidCharacter; they are
// zero for every other code so that equality stays structural.
struct IdError {
  IdErrorCode code{IdErrorCode::kInvalidLength};  // NOLINT(readability-identifier-naming)
  char character{'\0'};                           // NOLINT(readability-identifier-naming)
  std::size_t position{0};                        // NOLINT(readability-identifier-naming)

  static constexpr IdError of(IdErrorCode c) noexcept { return IdError{c, '\0', 0}; }
  static constexpr IdError invalid_character(char c, std::size_t pos) noexcept {
    return IdError{IdErrorCode::kInvalidCharacter, c, pos};
  }

  bool operator==(const IdError&) const = default;
};

// to_string returns the stable snake_case code ("invalid_length", ...).
[[nodiscard]] const char* to_string(IdErrorCode code) noexcept;

// describe returns a human-readable message, e.g.
// "invalid character 'a' at position 10".
[[nodiscard]] std::string describe(const IdError& error);

}  // namespace trid::core
