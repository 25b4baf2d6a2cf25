//! # Archive Codecs
//!
//! Byte-level building blocks shared by both archive formats:
//!
//! - big-endian integer packing,
//! - zlib deflate/inflate, one-shot and streaming,
//! - AES-128-CFB8 payload encryption and SHA-256 digests (OpenSSL libcrypto).

#ifndef FROST_ARCHIVE_CODEC_HPP
#define FROST_ARCHIVE_CODEC_HPP

#include "common.hpp"

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>

namespace frost::archive {

/// zlib level used for every archive payload.
constexpr int COMPRESSION_LEVEL = 9;

/// AES block and key size used for module encryption.
constexpr size_t CIPHER_BLOCK = 16;

// ============================================================================
// Big-endian packing
// ============================================================================

void put_u8(std::string& out, uint8_t value);
void put_u16(std::string& out, uint16_t value);
void put_u32(std::string& out, uint32_t value);

inline void put_i32(std::string& out, int32_t value) {
    put_u32(out, static_cast<uint32_t>(value));
}

uint16_t get_u16(std::string_view data, size_t offset);
uint32_t get_u32(std::string_view data, size_t offset);

inline int32_t get_i32(std::string_view data, size_t offset) {
    return static_cast<int32_t>(get_u32(data, offset));
}

// ============================================================================
// zlib
// ============================================================================

/// Deflates `data` in one call.
BuildResult<std::string> deflate_bytes(std::string_view data, int level = COMPRESSION_LEVEL);

/// Inflates a complete zlib stream.
BuildResult<std::string> inflate_bytes(std::string_view data);

/// Deflates the file at `src` into `out`, reading `chunk` bytes at a time.
/// Returns the number of compressed bytes written.
BuildResult<uint64_t> deflate_file(const std::filesystem::path& src, std::ostream& out,
                                   size_t chunk, int level = COMPRESSION_LEVEL);

// ============================================================================
// OpenSSL
// ============================================================================

/// Normalizes a user key to 16 bytes: left-padded with '0', or truncated.
std::string normalize_key(std::string_view key);

/// Encrypts with AES-128-CFB8 under a fresh random IV.
/// Returns `iv || ciphertext`.
BuildResult<std::string> encrypt_payload(std::string_view plain, std::string_view key);

/// Inverse of encrypt_payload().
BuildResult<std::string> decrypt_payload(std::string_view blob, std::string_view key);

/// Raw SHA-256 digest (32 bytes).
std::string sha256(std::string_view data);

/// Lowercase hex SHA-256 digest.
std::string sha256_hex(std::string_view data);

} // namespace frost::archive

#endif // FROST_ARCHIVE_CODEC_HPP
