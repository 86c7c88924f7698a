#include "execbox/cli/commands.hpp"

int main(int argc, char **argv) { return execbox::cli::run_cli(argc, argv); }
