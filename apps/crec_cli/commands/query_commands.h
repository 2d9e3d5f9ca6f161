#pragma once

// Query subcommands. Each loads the data directory once, runs one query and prints
// pretty JSON to stdout. Load diagnostics go to stderr. Returns the process exit code.
//
// Usage: crec_cli recommend --user <id> [--top <n>]   [engine flags]
//        crec_cli similar   --item <id> [--k <n>]     [engine flags]
//        crec_cli history   --user <id>               [engine flags]
//        crec_cli users     [--limit <n>]             [engine flags]
//        crec_cli stats                               [engine flags]
//        crec_cli health
// Engine flags: --data <dir> --recency-cap <n> --candidate-breadth <n> --max-click-files <n>
int cmd_recommend(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
int cmd_similar(int argc, char* argv[]);    // NOLINT(modernize-avoid-c-arrays)
int cmd_history(int argc, char* argv[]);    // NOLINT(modernize-avoid-c-arrays)
int cmd_users(int argc, char* argv[]);      // NOLINT(modernize-avoid-c-arrays)
int cmd_stats(int argc, char* argv[]);      // NOLINT(modernize-avoid-c-arrays)
int cmd_health(int argc, char* argv[]);     // NOLINT(modernize-avoid-c-arrays)
