// =============================================================================
// knowmap CLI entry point
// =============================================================================

#include "knowmap/cli/commands.hpp"

int main(int argc, char* argv[]) {
    return knowmap::cli::run(argc, argv);
}
