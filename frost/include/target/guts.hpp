//! # Guts Records
//!
//! A target's "guts" are the input values it was last built from. After a
//! successful build they are written next to the intermediate artifacts;
//! on the next run each field is compared with the current value using the
//! predicate the target declared for it.
//!
//! ## File Format
//!
//! ```json
//! {
//!     "format": "frost-guts",
//!     "version": 1,
//!     "target": "PKG",
//!     "schema": ["name", "cdict", "toc", ...],
//!     "values": [...]
//! }
//! ```
//!
//! A record that is missing, unreadable, of another format or version, for
//! another target kind, or whose schema differs is treated as absent.

#ifndef FROST_TARGET_GUTS_HPP
#define FROST_TARGET_GUTS_HPP

#include "common.hpp"
#include "json/json_value.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace frost::target {

namespace fs = std::filesystem;

constexpr const char* GUTS_FORMAT = "frost-guts";
constexpr int GUTS_VERSION = 1;

/// How a guts field is compared against its current value.
enum class GutsCheck {
    Eq,       ///< Plain equality
    TocSet,   ///< Same TOC entries, order ignored
    TocMtime, ///< TocSet, and no listed source newer than the last build
    Skip      ///< Compared by the target itself
};

struct GutsField {
    std::string name;
    GutsCheck check = GutsCheck::Eq;
};

using GutsSchema = std::vector<GutsField>;

/// A previously persisted record.
struct GutsRecord {
    std::vector<json::JsonValue> values;
    int64_t last_build = 0; ///< mtime of the guts file, ns since the Unix epoch

    /// Value of the field called `name` in `schema`, or nullptr.
    [[nodiscard]] const json::JsonValue* field(const GutsSchema& schema,
                                               std::string_view name) const;
};

/// Loads the record at `path` written for `kind`. Any mismatch yields
/// std::nullopt; the reason is logged at debug level.
std::optional<GutsRecord> load_guts(const fs::path& path, std::string_view kind,
                                    const GutsSchema& schema);

/// Persists `values` for `kind`.
BuildResult<fs::path> save_guts(const fs::path& path, std::string_view kind,
                                const GutsSchema& schema,
                                const std::vector<json::JsonValue>& values);

/// Compares `previous` with `current` field by field. Returns a human
/// readable reason when the target must be rebuilt.
std::optional<std::string> compare_guts(const GutsSchema& schema, const GutsRecord& previous,
                                        const std::vector<json::JsonValue>& current);

} // namespace frost::target

#endif // FROST_TARGET_GUTS_HPP
