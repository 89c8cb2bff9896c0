#include "validate.h"

#include "shared/arg_parser.h"
#include "validate_logic.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

struct ValidateCliConfig {
  bool json{false};
};

}  // namespace

int cmd_validate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<trid::apps::Option<ValidateCliConfig>> options = {
      {"--json", false, "Print one JSON object per identifier",
       [](ValidateCliConfig& c, const std::string&) {
         c.json = true;
         return true;
       }},
  };
  auto parsed = trid::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok) {
    return 1;
  }

  if (parsed.positionals.empty()) {
    std::cerr << "Usage: trid_cli validate <id>... [--json]\n";
    return 1;
  }

  return execute_validate(parsed.positionals, parsed.config.json, std::cout);
}
