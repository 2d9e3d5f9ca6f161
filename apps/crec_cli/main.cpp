#include "crec/core/version.h"

#include "commands/query_commands.h"
#include <functional>
#include <iostream>
#include <string>
#include <unordered_map>

namespace {

using Command = std::function<int(int, char**)>;

void print_usage() {
  std::cerr << "content-recommender CLI v" << crec::core::kBuildVersion << "\n"
            << "Usage: crec_cli <command> [options]\n"
            << "Commands:\n"
            << "  recommend --user <id> [--top <n>]   Ranked recommendations for a user\n"
            << "  similar   --item <id> [--k <n>]     Nearest items by embedding similarity\n"
            << "  history   --user <id>               Items the user has consumed\n"
            << "  users     [--limit <n>]             Known user identifiers\n"
            << "  stats                               Loaded data summary\n"
            << "  health                              Liveness check\n"
            << "Engine options (all data commands):\n"
            << "  --data <dir> --recency-cap <n> --candidate-breadth <n> --max-click-files <n>\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  const std::unordered_map<std::string, Command> commands = {
      {"recommend", cmd_recommend}, {"similar", cmd_similar}, {"history", cmd_history},
      {"users", cmd_users},         {"stats", cmd_stats},     {"health", cmd_health},
  };

  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_usage();
    return 0;
  }

  auto it = commands.find(subcommand);
  if (it == commands.end()) {
    std::cerr << "Unknown command: " << subcommand << "\n";
    print_usage();
    return 1;
  }
  return it->second(argc, argv);
}
