#include "transloom/cli/commands.hpp"

int main(int argc, char **argv) { return transloom::cli::run_cli(argc, argv); }
