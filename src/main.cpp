#include "pathfence/cli/commands.hpp"

int main(int argc, char **argv) { return pathfence::cli::run_cli(argc, argv); }
