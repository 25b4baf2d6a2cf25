//! # Manifest (TOC)
//!
//! The table of contents is the currency passed between every build stage:
//! an ordered list of `(logical name, source path, kind)` entries keyed by
//! logical name.
//!
//! ## Invariants
//!
//! - Insertion order is preserved and never re-sorted; it decides archive
//!   layout and which duplicate wins.
//! - The first entry with a given logical name wins. Later duplicates are
//!   dropped (with a warning if they point at another source).
//! - An empty source path is only meaningful for `Option` entries.
//!
//! ## Entry Kinds
//!
//! | Kind          | Tag        | Archive type code |
//! |---------------|------------|-------------------|
//! | Module        | PYMODULE   | `m` |
//! | Source        | PYSOURCE   | `s` |
//! | Extension     | EXTENSION  | `b` |
//! | Pyz           | PYZ        | `z` |
//! | Pkg           | PKG        | `a` |
//! | Data          | DATA       | `x` |
//! | Binary        | BINARY     | `b` |
//! | Zip           | ZIPFILE    | `Z` |
//! | Executable    | EXECUTABLE | `b` |
//! | Dependency    | DEPENDENCY | `d` |
//! | Option        | OPTION     | `o` |

#ifndef FROST_TOC_TOC_HPP
#define FROST_TOC_TOC_HPP

#include "common.hpp"
#include "json/json_value.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace frost::toc {

/// Kind of a manifest entry.
enum class TocKind : uint8_t {
    Module,     ///< Compiled interpreted module
    Source,     ///< Script source run at startup
    Extension,  ///< Native extension module
    Pyz,        ///< Module archive
    Pkg,        ///< Package archive
    Data,       ///< Arbitrary data file
    Binary,     ///< Native shared library
    Zip,        ///< Zipped package
    Executable, ///< Executable file
    Dependency, ///< Reference into another build's output
    Option      ///< Runtime option, no payload
};

/// Persisted tag of a kind (e.g., "BINARY").
const char* kind_name(TocKind kind);

/// Parses a persisted tag; std::nullopt for unknown tags.
std::optional<TocKind> parse_kind(std::string_view name);

/// One-letter archive type code of a kind.
char type_code(TocKind kind);

/// True for kinds routed through the content cache (Binary, Extension).
inline bool is_native_binary(TocKind kind) {
    return kind == TocKind::Binary || kind == TocKind::Extension;
}

/// A single manifest entry.
struct TocEntry {
    std::string name; ///< Logical name (path inside the artifact)
    std::string path; ///< Source path on disk (empty for options)
    TocKind kind = TocKind::Data;

    [[nodiscard]] auto operator==(const TocEntry& other) const -> bool = default;
};

/// Ordered, name-deduplicated list of entries.
class Toc {
public:
    Toc() = default;

    /// Builds a TOC from raw entries, applying the first-wins rule.
    explicit Toc(const std::vector<TocEntry>& entries);

    /// Inserts `entry` unless its name is already present.
    /// Returns true if the entry was inserted.
    bool append(TocEntry entry);

    /// Convenience overload of append().
    bool append(std::string name, std::string path, TocKind kind) {
        return append(TocEntry{std::move(name), std::move(path), kind});
    }

    /// Appends every entry of `other` in order.
    void extend(const Toc& other);
    void extend(const std::vector<TocEntry>& entries);

    /// Entries of this TOC whose full tuple is absent from `other`.
    [[nodiscard]] Toc difference(const Toc& other) const;

    /// This TOC followed by the entries of `other` whose name is new.
    [[nodiscard]] Toc union_with(const Toc& other) const;

    [[nodiscard]] bool contains(std::string_view name) const;

    /// Entry with the given logical name, or nullptr.
    [[nodiscard]] const TocEntry* find(std::string_view name) const;

    /// Removes the entry with the given logical name. Returns true if found.
    bool remove(std::string_view name);

    /// True if both TOCs hold the same set of entries, whatever their order.
    [[nodiscard]] bool same_members(const Toc& other) const;

    [[nodiscard]] size_t size() const {
        return entries_.size();
    }

    [[nodiscard]] bool empty() const {
        return entries_.empty();
    }

    [[nodiscard]] const std::vector<TocEntry>& entries() const {
        return entries_;
    }

    [[nodiscard]] const TocEntry& operator[](size_t i) const {
        return entries_[i];
    }

    auto begin() const {
        return entries_.begin();
    }

    auto end() const {
        return entries_.end();
    }

    [[nodiscard]] auto operator==(const Toc& other) const -> bool {
        return entries_ == other.entries_;
    }

    /// JSON form: `[[name, path, KIND], ...]`.
    [[nodiscard]] json::JsonValue to_json() const;

    /// Parses the JSON form. Returns an error naming the first bad entry.
    static Result<Toc, std::string> from_json(const json::JsonValue& value);

private:
    std::vector<TocEntry> entries_;
    std::unordered_set<std::string> names_;
};

/// Rewrites extension entries to file paths: `pkg.mod` becomes
/// `pkg/mod<suffix>` unless the name already ends with `suffix`.
Toc add_suffix_to_extensions(const Toc& toc, std::string_view suffix);

} // namespace frost::toc

#endif // FROST_TOC_TOC_HPP
