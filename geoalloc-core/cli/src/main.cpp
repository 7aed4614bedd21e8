#include <geoalloc/cli/commands.hpp>

int main(int argc, char** argv) { return geoalloc::cli::run_cli(argc, argv); }
