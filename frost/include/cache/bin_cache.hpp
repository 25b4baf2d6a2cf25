//! # Content Cache
//!
//! Memoizes the optional strip/compress transforms applied to native
//! binaries before they are packaged. Transforms always run on a copy in the
//! cache; the original file is never touched.
//!
//! ## Cache Layout
//!
//! ```text
//! <cache_dir>/bincache<strip><upx>_<platform>/
//!     <sha256(absolute source)[0:16]>/<destination name>
//! ```
//!
//! A slot is valid when it exists and is at least as new as its source.
//! Half-written slots fail that check (or the tool failed and the slot was
//! removed), so they are simply redone.

#ifndef FROST_CACHE_BIN_CACHE_HPP
#define FROST_CACHE_BIN_CACHE_HPP

#include "common.hpp"
#include "config/build_config.hpp"

#include <filesystem>
#include <string>
#include <unordered_map>

namespace frost::cache {

namespace fs = std::filesystem;

/// Counters reported in the build summary.
struct CacheStats {
    size_t hits = 0;
    size_t misses = 0;
    size_t tool_failures = 0;
};

/// Process-wide memo of transformed binaries, owned by the build context.
class BinaryCache {
public:
    explicit BinaryCache(const config::BuildConfig& config);

    /// Returns the path to package for `source` stored as `dest_name`.
    ///
    /// With neither transform requested (or upx requested but unavailable),
    /// `source` itself is returned.
    fs::path lookup(const fs::path& source, const std::string& dest_name, bool strip, bool upx);

    /// Slot the transformed copy of `source` would occupy.
    [[nodiscard]] fs::path slot_path(const fs::path& source, const std::string& dest_name,
                                     bool strip, bool upx) const;

    [[nodiscard]] const CacheStats& stats() const {
        return stats_;
    }

private:
    /// Runs one external tool on the cached copy. False if it failed.
    bool run_tool(const std::string& command, const fs::path& file);

    std::string strip_command() const;
    std::string upx_command() const;

    const config::BuildConfig& config_;
    std::unordered_map<std::string, fs::path> memo_;
    CacheStats stats_;
};

} // namespace frost::cache

#endif // FROST_CACHE_BIN_CACHE_HPP
