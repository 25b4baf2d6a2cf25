//! # Filesystem Helpers
//!
//! Small filesystem operations shared by the assemblers: modification
//! times, chunked copies, logical-name validation and the guarded removal
//! of output directories.

#ifndef FROST_UTIL_FS_UTILS_HPP
#define FROST_UTIL_FS_UTILS_HPP

#include "common.hpp"

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace frost::util {

namespace fs = std::filesystem;

/// Chunk size used when copying payloads into an archive.
constexpr size_t ARCHIVE_CHUNK = 16 * 1024;

/// Chunk size used when appending a package to a launcher stub.
constexpr size_t APPEND_CHUNK = 64 * 1024;

/// Modification time of `path` in nanoseconds since the Unix epoch, or
/// nullopt if it cannot be read.
std::optional<int64_t> get_mtime(const fs::path& path);

/// Reads a whole file. Returns an I/O error naming the path on failure.
BuildResult<std::string> read_file(const fs::path& path);

/// Writes `data` to `path`, replacing any existing file.
BuildResult<fs::path> write_file(const fs::path& path, std::string_view data);

/// Streams `src` into `out` in `chunk`-sized reads.
/// Returns the number of bytes copied.
BuildResult<uint64_t> append_file(const fs::path& src, std::ostream& out,
                                  size_t chunk = APPEND_CHUNK);

/// Copies `src` to `dst` and then tries to carry over permissions and the
/// modification time. Metadata failures are logged as warnings.
BuildResult<fs::path> copy_with_metadata(const fs::path& src, const fs::path& dst);

/// Sets rwxr-xr-x on `path`. Returns false (after logging) on failure.
bool make_executable(const fs::path& path);

/// True if `name` is a relative path without any `..` segment.
bool is_safe_logical_name(std::string_view name);

/// Fails with UnsafePath for the first entry name that escapes the output.
BuildResult<size_t> validate_logical_names(const std::vector<std::string>& names,
                                           std::string_view target);

/// True if some ancestor of `path` is a regular `.egg`, `.zip` or `.whl`
/// file, i.e. the source lives inside a zipped package.
bool is_inside_zip(const fs::path& path);

/// Canonical form of `path` that tolerates missing trailing components.
fs::path normalize(const fs::path& path);

/// True if `ancestor` equals `path` or is one of its parent directories.
bool is_same_or_ancestor(const fs::path& ancestor, const fs::path& path);

/// Removes directory `dir` after checking it is not the filesystem root, the
/// current directory, or an ancestor of the current directory or of any of
/// `protected_paths`. Returns the directory that was removed.
BuildResult<fs::path> remove_dir_guarded(const fs::path& dir,
                                         const std::vector<fs::path>& protected_paths);

/// Longest common string prefix of `items`, character by character.
std::string common_prefix(const std::vector<std::string>& items);

/// Lowercase hex encoding of `bytes`.
std::string to_hex(std::string_view bytes);

} // namespace frost::util

#endif // FROST_UTIL_FS_UTILS_HPP
