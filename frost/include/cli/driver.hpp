//! # CLI Driver
//!
//! Entry point of the `frost` executable.
//!
//! ## Usage
//!
//! ```bash
//! frost build.json              # Run every target of a build description
//! frost -v build.json           # Same, with debug logging
//! frost --list app.pkg          # Print the directory of a PKG or PYZ
//! frost --list dist/app         # Also works on an executable with an appended PKG
//! ```
//!
//! ## Build Description
//!
//! ```json
//! {
//!   "config": {"workpath": "build", "platform": "linux"},
//!   "graphs": [{"id": "app", "output_path": "app", "scripts": [...], "pure": [...]}],
//!   "merge": true,
//!   "targets": [
//!     {"type": "PYZ", "id": "pyz", "inputs": ["app.pure"], "code": {"app": "app.pyc"}},
//!     {"type": "EXE", "id": "exe", "name": "app", "inputs": ["pyz", "app.scripts"]},
//!     {"type": "COLLECT", "name": "app", "inputs": ["exe", "app.binaries", "app.datas"]}
//!   ]
//! }
//! ```
//!
//! `config` may also be a path to a configuration file. Relative paths in
//! the description resolve against its directory.
//!
//! ## Exit Codes
//!
//! | Code | Meaning |
//! |------|---------|
//! | 0 | Success |
//! | 1 | Fatal build error |
//! | 2 | Usage error |

#ifndef FROST_CLI_DRIVER_HPP
#define FROST_CLI_DRIVER_HPP

#include "cache/bin_cache.hpp"
#include "common.hpp"
#include "json/json_value.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace frost::cli {

namespace fs = std::filesystem;

/// What a successful build produced.
struct BuildSummary {
    std::vector<fs::path> artifacts; ///< One per target, in run order
    size_t merged_references = 0;    ///< Dependency entries created by MERGE
    cache::CacheStats cache;
};

/// Runs the build description `description`, whose relative paths resolve
/// against `base_dir`.
BuildResult<BuildSummary> run_build(const json::JsonValue& description, const fs::path& base_dir);

/// Loads and runs the build description file at `path`.
BuildResult<BuildSummary> run_build_file(const fs::path& path);

/// Formats the directory of the PKG or PYZ at `path`, one entry per line.
BuildResult<std::string> list_archive(const fs::path& path);

/// Parses the command line and runs the requested mode. Returns the exit code.
int frost_main(int argc, char* argv[]);

} // namespace frost::cli

#endif // FROST_CLI_DRIVER_HPP
