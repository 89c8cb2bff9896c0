#pragma once

#include "trid/core/id_error.h"
#include "trid/core/turkish_id.h"

#include <nlohmann/json.hpp>

#include <string_view>

namespace trid::core {

// Deterministic JSON rendering for CLI output.
// Keys are sorted alphabetically (nlohmann::json uses std::map internally).

// {"id": "<11 digits>", "valid": true}
[[nodiscard]] nlohmann::json turkish_id_to_json(const TurkishId& id);

// {"error": "<code>", "message": "<text>", "valid": false}
// kInvalidCharacter additionally carries "character" and "position".
// Non-printable characters are rendered as their byte value so the output
// is always valid UTF-8.
[[nodiscard]] nlohmann::json id_error_to_json(const IdError& error);

// Validation report for one candidate: the error or id fields plus "input".
// "input" holds the raw bytes, so callers dump with
// nlohmann::json::error_handler_t::replace.
[[nodiscard]] nlohmann::json validation_to_json(std::string_view candidate);

}  // namespace trid::core
