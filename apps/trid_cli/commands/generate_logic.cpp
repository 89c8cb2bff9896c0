#include "generate_logic.h"

#include "trid/core/id_error.h"
#include "trid/core/turkish_id.h"
#include "trid/core/turkish_id_json.h"

#include <nlohmann/json.hpp>

int execute_generate(std::uint32_t count, trid::core::ISeedSource& source, bool json,
                     std::ostream& out, std::ostream& err) {
  for (std::uint32_t i = 0; i < count; ++i) {
    const auto result = trid::core::generate(source);
    if (!result.has_value()) {
      err << "Generation failed: " << trid::core::describe(result.error()) << "\n";
      return 1;
    }

    if (json) {
      out << trid::core::turkish_id_to_json(result.value()).dump() << "\n";
    } else {
      out << result.value() << "\n";
    }
  }
  return 0;
}

int execute_from_seq(std::uint32_t seq, bool json, std::ostream& out, std::ostream& err) {
  const auto result = trid::core::TurkishId::from_seq(seq);
  if (!result.has_value()) {
    if (json) {
      auto j = trid::core::id_error_to_json(result.error());
      j["seq"] = seq;
      out << j.dump() << "\n";
    }
    err << "Error: " << trid::core::describe(result.error()) << " (got " << seq << ")\n";
    return 1;
  }

  if (json) {
    auto j = trid::core::turkish_id_to_json(result.value());
    j["seq"] = seq;
    out << j.dump() << "\n";
  } else {
    out << result.value() << "\n";
  }
  return 0;
}
