#include "validate_logic.h"

#include "trid/core/id_error.h"
#include "trid/core/turkish_id.h"
#include "trid/core/turkish_id_json.h"

#include <nlohmann/json.hpp>

int execute_validate(const std::vector<std::string>& candidates, bool json, std::ostream& out) {
  bool all_valid = true;

  for (const auto& candidate : candidates) {
    if (json) {
      const auto report = trid::core::validation_to_json(candidate);
      all_valid = all_valid && report.at("valid").get<bool>();
      out << report.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
      continue;
    }

    const auto result = trid::core::TurkishId::parse(candidate);
    if (result.has_value()) {
      out << candidate << ": valid\n";
    } else {
      all_valid = false;
      out << candidate << ": invalid (" << trid::core::describe(result.error()) << ")\n";
    }
  }

  return all_valid ? 0 : 1;
}
