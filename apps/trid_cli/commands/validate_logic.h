#pragma once

#include <ostream>
#include <string>
#include <vector>

// execute_validate: check each candidate and print one line (or one JSON object) per candidate.
// Returns 0 when every candidate is valid, 1 otherwise.
int execute_validate(const std::vector<std::string>& candidates, bool json, std::ostream& out);
