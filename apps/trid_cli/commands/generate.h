#pragma once

// cmd_generate: print random identity numbers.
// Usage: trid_cli generate [count] [--seed <n>] [--start <seq>] [--json]
// --seed makes the random sequence reproducible; --start switches to consecutive seeds.
// cmd_from_seq: print the identity number derived from a nine-digit seed.
// Usage: trid_cli from-seq <seq> [--json]
int cmd_generate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
int cmd_from_seq(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
