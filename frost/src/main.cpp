//! # Frost Entry Point
//!
//! The `frost` binary. All work happens in the CLI driver (`cli/driver.hpp`),
//! which parses arguments, runs build descriptions and lists archives.

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return frost::cli::frost_main(argc, argv);
}
