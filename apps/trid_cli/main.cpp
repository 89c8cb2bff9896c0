#include "trid/core/version.h"

#include "commands/generate.h"
#include "commands/validate.h"
#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "Usage: trid_cli <command> [options]\n"
            << "\n"
            << "Commands:\n"
            << "  validate <id>... [--json]        Check Turkish identity numbers\n"
            << "  generate [count] [--seed <n>]    Print random valid identity numbers\n"
            << "           [--start <seq>] [--json]\n"
            << "  from-seq <seq> [--json]          Build the identity number for a nine-digit seed\n"
            << "\n"
            << "  --version                        Print the version and exit\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "validate") {
    return cmd_validate(argc, argv);
  }
  if (subcommand == "generate") {
    return cmd_generate(argc, argv);
  }
  if (subcommand == "from-seq") {
    return cmd_from_seq(argc, argv);
  }
  if (subcommand == "--version") {
    std::cout << "trid_cli v" << trid::core::kBuildVersion << "\n";
    return 0;
  }
  if (subcommand == "--help" || subcommand == "-h") {
    print_usage();
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage();
  return 1;
}
