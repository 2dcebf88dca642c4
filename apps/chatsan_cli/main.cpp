#include "chatsan/core/version.h"

#include "commands/analyze.h"
#include "commands/batch.h"
#include "commands/clean.h"
#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "chatsan " << chatsan::core::kBuildVersion << "\n"
            << "Usage: chatsan_cli <command> [options]\n\n"
            << "Commands:\n"
            << "  clean <export.json>     Sanitize one chat export\n"
            << "  batch <dir>             Sanitize every .json export in a directory\n"
            << "  analyze <export.json>   Sanitize, then run an analysis plugin\n"
            << "  plugins                 List analysis plugins\n"
            << "  version                 Print the version\n\n"
            << "Run 'chatsan_cli <command> --help' for command options.\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 2;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "clean") {
    return cmd_clean(argc, argv);
  }
  if (subcommand == "batch") {
    return cmd_batch(argc, argv);
  }
  if (subcommand == "analyze") {
    return cmd_analyze(argc, argv);
  }
  if (subcommand == "plugins") {
    return cmd_plugins();
  }
  if (subcommand == "version" || subcommand == "--version") {
    std::cout << "chatsan " << chatsan::core::kBuildVersion << "\n";
    return 0;
  }
  if (subcommand == "help" || subcommand == "--help") {
    print_usage();
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage();
  return 2;
}
