#include "cdpgate/cli/commands.hpp"

int main(int argc, char **argv) { return cdpgate::cli::run_cli(argc, argv); }
