#pragma once

#include "trid/core/seed_source.h"

#include <cstdint>
#include <ostream>

// execute_generate: print count identifiers drawn from source, one per line.
// execute_from_seq: print the identifier derived from seq, or report why it cannot be built.
// Both take only interface types so tests can inject deterministic sources and streams.
int execute_generate(std::uint32_t count, trid::core::ISeedSource& source, bool json,
                     std::ostream& out, std::ostream& err);
int execute_from_seq(std::uint32_t seq, bool json, std::ostream& out, std::ostream& err);
