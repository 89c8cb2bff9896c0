#pragma once

// cmd_validate: check one or more identity numbers.
// Usage: trid_cli validate <id>... [--json]
// Exit status is 0 only when every argument is valid.
int cmd_validate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
