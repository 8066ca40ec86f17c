#pragma once

namespace drover::cli {

int run_cli(int argc, char **argv);
void print_help();

} // namespace drover::cli
