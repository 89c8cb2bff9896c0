#include "trid/core/id_error.h"

#include "trid/core/turkish_id.h"

namespace trid::core {

const char* to_string(IdErrorCode code) noexcept {
  switch (code) {
    case IdErrorCode::kInvalidLength:
      return "invalid_length";
    case IdErrorCode::kInvalidCharacter:
      return "invalid_character";
    case IdErrorCode::kFirstDigitIsZero:
      return "first_digit_is_zero";
    case IdErrorCode::kInvalidInitialChecksum:
      return "invalid_initial_checksum";
    case IdErrorCode::kInvalidFinalChecksum:
      return "invalid_final_checksum";
    case IdErrorCode::kSequenceOutOfRange:
      return "sequence_out_of_range";
  }
  return "unknown";
}

std::string describe(const IdError& error) {
  switch (error.code) {
    case IdErrorCode::kInvalidLength:
      return "length must be exactly " + std::to_string(kLength) + " characters";
    case IdErrorCode::kInvalidCharacter: {
      // Render non-printable bytes as hex so the message stays on one line.
      const auto byte = static_cast<unsigned char>(error.character);
      std::string shown;
      if (byte >= 0x20 && byte < 0x7f) {
        shown = std::string{"'"} + error.character + "'";
      } else {
        constexpr const char* kHex = "0123456789abcdef";
        shown = std::string{"0x"} + kHex[byte >> 4] + kHex[byte & 0x0f];
      }
      return "invalid character " + shown + " at position " + std::to_string(error.position);
    }
    case IdErrorCode::kFirstDigitIsZero:
      return "first digit cannot be zero";
    case IdErrorCode::kInvalidInitialChecksum:
      return "initial checksum at position 9 does not match";
    case IdErrorCode::kInvalidFinalChecksum:
      return "final checksum at position 10 does not match";
    case IdErrorCode::kSequenceOutOfRange:
      return "sequence must be between " + std::to_string(kSeqMin) + " and " +
             std::to_string(kSeqMax);
  }
  return "unknown error";
}

}  // namespace trid::core
