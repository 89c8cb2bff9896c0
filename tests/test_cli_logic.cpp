#include <catch2/catch_test_macros.hpp>

#include "generate_logic.h"
#include "shared/arg_parser.h"
#include "trid/core/seed_source.h"
#include "validate_logic.h"

#include <nlohmann/json.hpp>

#include <sstream>
#include <string>
#include <vector>

using trid::core::DeterministicSeedSource;

// ── validate ────────────────────────────────────────────────────────────────

TEST_CASE("execute_validate: all valid returns 0", "[cli][validate]") {
  std::ostringstream out;
  const int rc = execute_validate({"76558242278", "10000000146"}, false, out);
  CHECK(rc == 0);
  CHECK(out.str() == "76558242278: valid\n10000000146: valid\n");
}

TEST_CASE("execute_validate: any invalid returns 1 and explains why", "[cli][validate]") {
  std::ostringstream out;
  const int rc = execute_validate({"76558242278", "1234567890a"}, false, out);
  CHECK(rc == 1);
  CHECK(out.str() ==
        "76558242278: valid\n"
        "1234567890a: invalid (invalid character 'a' at position 10)\n");
}

TEST_CASE("execute_validate: --json prints one object per line", "[cli][validate]") {
  std::ostringstream out;
  const int rc = execute_validate({"76558242278", "04948892948"}, true, out);
  CHECK(rc == 1);

  std::istringstream lines(out.str());
  std::string line;
  std::vector<nlohmann::json> objects;
  while (std::getline(lines, line)) {
    objects.push_back(nlohmann::json::parse(line));
  }
  REQUIRE(objects.size() == 2);
  CHECK(objects[0]["valid"] == true);
  CHECK(objects[1]["valid"] == false);
  CHECK(objects[1]["error"] == "first_digit_is_zero");
}

// ── generate / from-seq ─────────────────────────────────────────────────────

TEST_CASE("execute_generate: deterministic source prints consecutive identifiers",
          "[cli][generate]") {
  DeterministicSeedSource source;
  std::ostringstream out;
  std::ostringstream err;
  const int rc = execute_generate(3, source, false, out, err);
  CHECK(rc == 0);
  CHECK(err.str().empty());
  // 100000000 -> d9 = 7, d10 = 8; 100000001 -> odd +1: d9 = 4, d10 = 6;
  // 100000002 -> odd +2: d9 = 1, d10 = 4
  CHECK(out.str() == "10000000078\n10000000146\n10000000214\n");
}

TEST_CASE("execute_generate: count of zero prints nothing", "[cli][generate]") {
  DeterministicSeedSource source;
  std::ostringstream out;
  std::ostringstream err;
  CHECK(execute_generate(0, source, false, out, err) == 0);
  CHECK(out.str().empty());
}

TEST_CASE("execute_from_seq: valid seed prints the identifier", "[cli][from-seq]") {
  std::ostringstream out;
  std::ostringstream err;
  CHECK(execute_from_seq(765'582'422, false, out, err) == 0);
  CHECK(out.str() == "76558242278\n");

  std::ostringstream json_out;
  CHECK(execute_from_seq(765'582'422, true, json_out, err) == 0);
  CHECK(json_out.str() == R"({"id":"76558242278","seq":765582422,"valid":true})"
                          "\n");
}

TEST_CASE("execute_from_seq: out-of-range seed returns 1", "[cli][from-seq]") {
  std::ostringstream out;
  std::ostringstream err;
  CHECK(execute_from_seq(99'999'999, false, out, err) == 1);
  CHECK(out.str().empty());
  CHECK(err.str().find("sequence must be between") != std::string::npos);
}

// ── shared option parsing ───────────────────────────────────────────────────

TEST_CASE("parse_uint32 accepts plain decimal only", "[cli][args]") {
  CHECK(trid::apps::parse_uint32("0") == 0U);
  CHECK(trid::apps::parse_uint32("4294967295") == 4294967295U);
  CHECK_FALSE(trid::apps::parse_uint32("4294967296").has_value());
  CHECK_FALSE(trid::apps::parse_uint32("").has_value());
  CHECK_FALSE(trid::apps::parse_uint32("-1").has_value());
  CHECK_FALSE(trid::apps::parse_uint32("12a").has_value());
  CHECK_FALSE(trid::apps::parse_uint32(" 12").has_value());
}

TEST_CASE("parse_options separates flags from positionals", "[cli][args]") {
  struct Config {
    bool json{false};
  };
  const std::vector<trid::apps::Option<Config>> options = {
      {"--json", false, "json output",
       [](Config& c, const std::string&) {
         c.json = true;
         return true;
       }},
  };

  std::string a0 = "trid_cli";
  std::string a1 = "validate";
  std::string a2 = "76558242278";
  std::string a3 = "--json";
  std::string a4 = "10000000146";
  std::vector<char*> argv = {a0.data(), a1.data(), a2.data(), a3.data(), a4.data()};

  const auto parsed =
      trid::apps::parse_options(static_cast<int>(argv.size()), argv.data(), options, 2);
  CHECK(parsed.ok);
  CHECK(parsed.config.json);
  CHECK(parsed.positionals == std::vector<std::string>{"76558242278", "10000000146"});
}

TEST_CASE("parse_options marks unknown flags as failure", "[cli][args]") {
  struct Config {};
  const std::vector<trid::apps::Option<Config>> options;

  std::string a0 = "trid_cli";
  std::string a1 = "--bogus";
  std::vector<char*> argv = {a0.data(), a1.data()};

  const auto parsed = trid::apps::parse_options(static_cast<int>(argv.size()), argv.data(), options);
  CHECK_FALSE(parsed.ok);
  CHECK(parsed.positionals.empty());
}
