#include "toolwarden/cli/commands.hpp"

int main(int argc, char **argv) { return toolwarden::cli::run_cli(argc, argv); }
