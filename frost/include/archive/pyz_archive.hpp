//! # Module Archive (PYZ)
//!
//! A single file holding compiled module code, read by the runtime importer.
//!
//! ## Layout (big-endian)
//!
//! ```text
//! +---------------------------+
//! | "PYZ\0"                   |  4 bytes
//! | runtime magic             |  4 bytes
//! | index offset (u32)        |  4 bytes
//! +---------------------------+
//! | payload blocks ...        |
//! +---------------------------+
//! | count (u32)               |
//! | per entry:                |
//! |   name_len (u16) | name   |
//! |   flags (u8)              |  1 = package, 2 = compressed, 4 = encrypted
//! |   offset (u32)            |  absolute file offset
//! |   length (u32)            |
//! +---------------------------+
//! ```
//!
//! Every payload is zlib-compressed; with a key the compressed block is then
//! encrypted (`iv || ciphertext`, see archive/codec.hpp).

#ifndef FROST_ARCHIVE_PYZ_ARCHIVE_HPP
#define FROST_ARCHIVE_PYZ_ARCHIVE_HPP

#include "common.hpp"

#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace frost::archive {

namespace fs = std::filesystem;

/// Leading signature of a module archive.
constexpr std::string_view PYZ_MAGIC{"PYZ\0", 4};

/// Size of the fixed header.
constexpr size_t PYZ_HEADER_SIZE = 12;

namespace pyz_flags {
constexpr uint8_t PACKAGE = 1;
constexpr uint8_t COMPRESSED = 2;
constexpr uint8_t ENCRYPTED = 4;
} // namespace pyz_flags

/// One directory entry of a module archive.
struct PyzIndexEntry {
    std::string name;
    uint8_t flags = 0;
    uint32_t offset = 0;
    uint32_t length = 0;

    [[nodiscard]] bool is_package() const {
        return (flags & pyz_flags::PACKAGE) != 0;
    }

    [[nodiscard]] bool is_encrypted() const {
        return (flags & pyz_flags::ENCRYPTED) != 0;
    }
};

/// Builds a module archive in memory and writes it in one go.
class PyzWriter {
public:
    /// `key` enables encryption of every payload.
    PyzWriter(std::array<uint8_t, 4> runtime_magic, std::optional<std::string> key);

    /// Compresses (and encrypts) `code` and queues it under `name`.
    BuildResult<size_t> add(const std::string& name, std::string_view code, bool is_package);

    /// Writes header, payloads and index to `path`.
    BuildResult<fs::path> write(const fs::path& path) const;

    [[nodiscard]] size_t size() const {
        return index_.size();
    }

private:
    std::array<uint8_t, 4> runtime_magic_;
    std::optional<std::string> key_;
    std::string payloads_;
    std::vector<PyzIndexEntry> index_;
};

/// Read access to a module archive.
class PyzReader {
public:
    /// Opens and validates the archive at `path`.
    static BuildResult<PyzReader> open(const fs::path& path);

    [[nodiscard]] const std::vector<PyzIndexEntry>& entries() const {
        return index_;
    }

    [[nodiscard]] const std::array<uint8_t, 4>& runtime_magic() const {
        return runtime_magic_;
    }

    [[nodiscard]] const PyzIndexEntry* find(std::string_view name) const;

    [[nodiscard]] std::vector<std::string> names() const;

    /// Returns the compiled code of `name`, decrypting with `key` if the
    /// entry is encrypted.
    BuildResult<std::string> extract(std::string_view name,
                                     std::optional<std::string_view> key = std::nullopt) const;

private:
    PyzReader() = default;

    std::string data_;
    std::array<uint8_t, 4> runtime_magic_{};
    std::vector<PyzIndexEntry> index_;
};

} // namespace frost::archive

#endif // FROST_ARCHIVE_PYZ_ARCHIVE_HPP
