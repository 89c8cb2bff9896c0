#include "trid/core/id_error.h"

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace trid::core;

TEST_CASE("to_string returns stable snake_case codes", "[id-error]") {
  CHECK(std::string{to_string(IdErrorCode::kInvalidLength)} == "invalid_length");
  CHECK(std::string{to_string(IdErrorCode::kInvalidCharacter)} == "invalid_character");
  CHECK(std::string{to_string(IdErrorCode::kFirstDigitIsZero)} == "first_digit_is_zero");
  CHECK(std::string{to_string(IdErrorCode::kInvalidInitialChecksum)} ==
        "invalid_initial_checksum");
  CHECK(std::string{to_string(IdErrorCode::kInvalidFinalChecksum)} == "invalid_final_checksum");
  CHECK(std::string{to_string(IdErrorCode::kSequenceOutOfRange)} == "sequence_out_of_range");
}

TEST_CASE("describe names the offending character and position", "[id-error]") {
  CHECK(describe(IdError::invalid_character('a', 10)) == "invalid character 'a' at position 10");
  CHECK(describe(IdError::invalid_character('\n', 3)) == "invalid character 0x0a at position 3");
  CHECK(describe(IdError::invalid_character('\xc3', 0)) == "invalid character 0xc3 at position 0");
}

TEST_CASE("describe mentions the expected length and seed range", "[id-error]") {
  CHECK(describe(IdError::of(IdErrorCode::kInvalidLength)) ==
        "length must be exactly 11 characters");
  CHECK(describe(IdError::of(IdErrorCode::kSequenceOutOfRange)) ==
        "sequence must be between 100000000 and 999999999");
}

TEST_CASE("IdError equality is structural", "[id-error]") {
  CHECK(IdError::invalid_character('a', 10) == IdError::invalid_character('a', 10));
  CHECK_FALSE(IdError::invalid_character('a', 10) == IdError::invalid_character('a', 9));
  CHECK_FALSE(IdError::invalid_character('a', 10) == IdError::invalid_character('b', 10));
  CHECK(IdError::of(IdErrorCode::kInvalidLength) == IdError::of(IdErrorCode::kInvalidLength));
  CHECK_FALSE(IdError::of(IdErrorCode::kInvalidInitialChecksum) ==
              IdError::of(IdErrorCode::kInvalidFinalChecksum));
}
