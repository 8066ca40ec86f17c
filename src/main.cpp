#include "drover/cli/commands.hpp"

int main(int argc, char **argv) { return drover::cli::run_cli(argc, argv); }
