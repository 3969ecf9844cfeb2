#pragma once

namespace pathfence::cli {

void print_help();

/// Entry point behind `main`. Exit codes: 0 success, 1 usage or configuration error,
/// 2 one or more paths rejected.
int run_cli(int argc, char **argv);

} // namespace pathfence::cli
