#include "trid/core/turkish_id_json.h"

#include <string>

namespace trid::core {

nlohmann::json turkish_id_to_json(const TurkishId& id) {
  nlohmann::json j;
  j["id"] = id.to_string();
  j["valid"] = true;
  return j;
}

nlohmann::json id_error_to_json(const IdError& error) {
  nlohmann::json j;
  j["error"] = to_string(error.code);
  j["message"] = describe(error);
  j["valid"] = false;

  if (error.code == IdErrorCode::kInvalidCharacter) {
    const auto byte = static_cast<unsigned char>(error.character);
    if (byte < 0x80) {
      j["character"] = std::string(1, error.character);
    } else {
      // A lone byte >= 0x80 is not valid UTF-8; nlohmann::json would throw on dump().
      j["character"] = static_cast<unsigned int>(byte);
    }
    j["position"] = error.position;
  }

  return j;
}

nlohmann::json validation_to_json(std::string_view candidate) {
  const auto result = TurkishId::parse(candidate);
  nlohmann::json j =
      result.has_value() ? turkish_id_to_json(result.value()) : id_error_to_json(result.error());

  // The raw input may hold arbitrary bytes: dump with error_handler_t::replace.
  j["input"] = std::string{candidate};
  return j;
}

}  // namespace trid::core
