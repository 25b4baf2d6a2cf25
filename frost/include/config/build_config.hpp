//! # Build Configuration
//!
//! The immutable settings every target reads: where intermediate and final
//! artifacts go, where launcher stubs and the content cache live, the target
//! platform, the interpreter runtime identity written into archives, and the
//! bootstrap modules that must never go into the module archive.
//!
//! A `BuildConfig` is built once (from a JSON file or in code) and handed to
//! the build context by value; nothing mutates it afterwards.
//!
//! ## JSON Form
//!
//! ```json
//! {
//!     "workpath": "build/app",
//!     "distpath": "dist",
//!     "stub_dir": "/usr/share/frost/stubs",
//!     "platform": "linux",
//!     "runtime_library": "libpython3.4m.so.1.0",
//!     "runtime_version": 34,
//!     "runtime_magic": "ee0c0d0a",
//!     "has_upx": false,
//!     "bootstrap": [["_pyi_bootstrap", "loader/_pyi_bootstrap.pyc", "PYMODULE"]]
//! }
//! ```
//!
//! Relative paths resolve against the directory of the configuration file.

#ifndef FROST_CONFIG_BUILD_CONFIG_HPP
#define FROST_CONFIG_BUILD_CONFIG_HPP

#include "common.hpp"
#include "json/json_value.hpp"
#include "toc/toc.hpp"

#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace frost::config {

namespace fs = std::filesystem;

/// Operating system the artifacts are built for.
enum class Platform { Linux, Windows, Darwin };

/// Lowercase platform name ("linux", "windows", "darwin").
const char* platform_name(Platform platform);

/// Parses a lowercase platform name.
std::optional<Platform> parse_platform(std::string_view name);

/// The platform Frost itself was compiled for.
Platform host_platform();

/// Build settings shared by every target of one build.
struct BuildConfig {
    fs::path workpath;  ///< Intermediate artifacts and guts files
    fs::path distpath;  ///< Final artifacts
    fs::path specpath;  ///< Directory of the build description
    fs::path stub_dir;  ///< Root of the launcher stub tree
    fs::path cache_dir; ///< Root of the content cache

    Platform platform = host_platform();

    std::string runtime_library = "libpython3.so";
    int32_t runtime_version = 34;
    std::array<uint8_t, 4> runtime_magic = {0xee, 0x0c, 0x0d, 0x0a};

    bool has_upx = false;
    std::string strip_tool = "strip";
    std::string upx_tool = "upx";

    /// Loader modules that live in the package archive, not the PYZ.
    toc::Toc bootstrap;

    /// Defaults rooted at `base`: build/, dist/, stubs/ and the user cache.
    static BuildConfig defaults(const fs::path& base);

    [[nodiscard]] bool is_windows() const {
        return platform == Platform::Windows;
    }

    [[nodiscard]] bool is_darwin() const {
        return platform == Platform::Darwin;
    }

    /// Stub subdirectory name, e.g. "Linux-64bit".
    [[nodiscard]] std::string stub_platform_dir() const;

    /// File suffix of native extension modules (".so" or ".pyd").
    [[nodiscard]] std::string extension_suffix() const;
};

/// Builds a configuration from its JSON form. Relative paths resolve
/// against `base_dir`; absent keys keep their defaults.
Result<BuildConfig, std::string> config_from_json(const json::JsonValue& value,
                                                  const fs::path& base_dir);

/// Reads and parses a configuration file.
Result<BuildConfig, std::string> load_build_config(const fs::path& path);

/// Default content cache root: $FROST_CACHE_DIR, then $XDG_CACHE_HOME/frost,
/// then ~/.cache/frost.
fs::path default_cache_dir();

} // namespace frost::config

#endif // FROST_CONFIG_BUILD_CONFIG_HPP
