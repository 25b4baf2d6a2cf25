//! # Package Archive (CArchive)
//!
//! The self-describing container read by the launcher stub. It is written
//! as a relocatable blob: every offset is relative to the start of the
//! archive, so the same bytes work as a standalone `.pkg` file or appended
//! to the end of an executable.
//!
//! ## Layout (big-endian)
//!
//! ```text
//! payloads, entry after entry, starting at archive offset 0
//! directory, per entry:
//!     entry_len (i32) | offset (i32) | compressed_len (i32)
//!     | uncompressed_len (i32) | compression_flag (u8) | type_code (char)
//!     | name, NUL-padded so that entry_len is a multiple of 16
//! cookie (88 bytes):
//!     "MEI\014\013\012\013\016" | archive_len (i32) | directory_offset (i32)
//!     | directory_len (i32) | runtime_version (i32) | runtime_library (64 bytes)
//! ```
//!
//! A reader locates the cookie at the end of the carrying file and finds the
//! archive start at `file_size - archive_len`.

#ifndef FROST_ARCHIVE_CARCHIVE_HPP
#define FROST_ARCHIVE_CARCHIVE_HPP

#include "common.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

namespace frost::archive {

namespace fs = std::filesystem;

/// Cookie signature.
constexpr std::string_view CARCHIVE_MAGIC{"MEI\014\013\012\013\016", 8};

/// Size of the trailing cookie.
constexpr size_t CARCHIVE_COOKIE_SIZE = 88;

/// Fixed part of a directory entry before the name.
constexpr size_t CARCHIVE_ENTRY_HEADER = 18;

/// Width of the runtime library field of the cookie.
constexpr size_t RUNTIME_LIBRARY_FIELD = 64;

/// One directory entry of a package archive.
struct CArchiveEntry {
    int32_t offset = 0;
    int32_t compressed_len = 0;
    int32_t uncompressed_len = 0;
    uint8_t compression_flag = 0;
    char type_code = 'x';
    std::string name;
};

/// Streams entries into a package archive file.
///
/// ```cpp
/// CArchiveWriter writer(out, 34, "libpython3.4m.so.1.0");
/// writer.add_file("main", "build/main.pyc", 's', true);
/// writer.add_marker("v", 'o');
/// auto path = writer.finish();
/// ```
class CArchiveWriter {
public:
    CArchiveWriter(fs::path path, int32_t runtime_version, std::string runtime_library);

    /// Streams the file at `source` into the archive, deflating it in
    /// 16 KiB chunks when `compress` is set.
    BuildResult<size_t> add_file(const std::string& name, const fs::path& source, char type_code,
                                 bool compress);

    /// Adds a payload-less entry (runtime options and dependency references).
    BuildResult<size_t> add_marker(const std::string& name, char type_code);

    /// Writes the directory and cookie and closes the file.
    BuildResult<fs::path> finish();

    [[nodiscard]] const std::vector<CArchiveEntry>& entries() const {
        return entries_;
    }

private:
    BuildResult<size_t> open_if_needed();

    fs::path path_;
    int32_t runtime_version_;
    std::string runtime_library_;
    std::ofstream out_;
    bool opened_ = false;
    std::vector<CArchiveEntry> entries_;
};

/// Serializes one directory entry, padding the name to a 16-byte boundary.
std::string encode_directory_entry(const CArchiveEntry& entry);

/// Read access to a package archive, standalone or appended to a file.
class CArchiveReader {
public:
    static BuildResult<CArchiveReader> open(const fs::path& path);

    [[nodiscard]] const std::vector<CArchiveEntry>& entries() const {
        return entries_;
    }

    [[nodiscard]] const CArchiveEntry* find(std::string_view name) const;

    [[nodiscard]] std::vector<std::string> names() const;

    /// Offset of the archive within the carrying file.
    [[nodiscard]] uint64_t start_offset() const {
        return start_;
    }

    [[nodiscard]] int32_t runtime_version() const {
        return runtime_version_;
    }

    [[nodiscard]] const std::string& runtime_library() const {
        return runtime_library_;
    }

    /// Returns the uncompressed payload of `name`.
    BuildResult<std::string> extract(std::string_view name) const;

private:
    CArchiveReader() = default;

    fs::path path_;
    uint64_t start_ = 0;
    int32_t runtime_version_ = 0;
    std::string runtime_library_;
    std::vector<CArchiveEntry> entries_;
};

} // namespace frost::archive

#endif // FROST_ARCHIVE_CARCHIVE_HPP
