#include "generate.h"

#include "trid/core/seed_source.h"

#include "generate_logic.h"
#include "shared/arg_parser.h"
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

struct GenerateCliConfig {
  std::optional<std::uint32_t> prng_seed;
  std::optional<std::uint32_t> start_seq;
  bool json{false};
};

struct FromSeqCliConfig {
  bool json{false};
};

}  // namespace

int cmd_generate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<trid::apps::Option<GenerateCliConfig>> options = {
      {"--seed", true, "Seed for the random generator (reproducible output)",
       [](GenerateCliConfig& c, const std::string& v) {
         const auto value = trid::apps::parse_uint32(v);
         if (!value.has_value()) {
           std::cerr << "Invalid --seed: " << v << " (expected unsigned 32-bit integer)\n";
           return false;
         }
         c.prng_seed = value;
         return true;
       }},
      {"--start", true, "Emit consecutive identifiers starting at this nine-digit sequence",
       [](GenerateCliConfig& c, const std::string& v) {
         const auto value = trid::apps::parse_uint32(v);
         if (!value.has_value() || *value < trid::core::kSeqMin || *value > trid::core::kSeqMax) {
           std::cerr << "Invalid --start: " << v << " (valid: " << trid::core::kSeqMin << ".."
                     << trid::core::kSeqMax << ")\n";
           return false;
         }
         c.start_seq = value;
         return true;
       }},
      {"--json", false, "Print one JSON object per identifier",
       [](GenerateCliConfig& c, const std::string&) {
         c.json = true;
         return true;
       }},
  };
  auto parsed = trid::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok) {
    return 1;
  }

  if (parsed.positionals.size() > 1) {
    std::cerr << "Usage: trid_cli generate [count] [--seed <n>] [--start <seq>] [--json]\n";
    return 1;
  }

  std::uint32_t count = 1;
  if (!parsed.positionals.empty()) {
    const auto value = trid::apps::parse_uint32(parsed.positionals.front());
    if (!value.has_value()) {
      std::cerr << "Invalid count: " << parsed.positionals.front() << "\n";
      return 1;
    }
    count = *value;
  }

  if (parsed.config.prng_seed.has_value() && parsed.config.start_seq.has_value()) {
    std::cerr << "Error: --seed and --start are mutually exclusive\n";
    return 1;
  }

  std::unique_ptr<trid::core::ISeedSource> source;
  if (parsed.config.start_seq.has_value()) {
    source = std::make_unique<trid::core::DeterministicSeedSource>(*parsed.config.start_seq);
  } else if (parsed.config.prng_seed.has_value()) {
    source = std::make_unique<trid::core::RandomSeedSource>(*parsed.config.prng_seed);
  } else {
    source = std::make_unique<trid::core::RandomSeedSource>();
  }

  return execute_generate(count, *source, parsed.config.json, std::cout, std::cerr);
}

int cmd_from_seq(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<trid::apps::Option<FromSeqCliConfig>> options = {
      {"--json", false, "Print the result as a JSON object",
       [](FromSeqCliConfig& c, const std::string&) {
         c.json = true;
         return true;
       }},
  };
  auto parsed = trid::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok) {
    return 1;
  }

  if (parsed.positionals.size() != 1) {
    std::cerr << "Usage: trid_cli from-seq <seq> [--json]\n";
    return 1;
  }

  const auto seq = trid::apps::parse_uint32(parsed.positionals.front());
  if (!seq.has_value()) {
    std::cerr << "Invalid sequence: " << parsed.positionals.front()
              << " (expected unsigned 32-bit integer)\n";
    return 1;
  }

  return execute_from_seq(*seq, parsed.config.json, std::cout, std::cerr);
}
