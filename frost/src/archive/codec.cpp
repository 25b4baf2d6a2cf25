//! # Archive Codecs Implementation

#include "archive/codec.hpp"

#include "util/fs_utils.hpp"

#include <fstream>
#include <memory>
#include <vector>

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <zlib.h>

namespace frost::archive {

// ============================================================================
// Big-endian packing
// ============================================================================

void put_u8(std::string& out, uint8_t value) {
    out += static_cast<char>(value);
}

void put_u16(std::string& out, uint16_t value) {
    out += static_cast<char>((value >> 8) & 0xFF);
    out += static_cast<char>(value & 0xFF);
}

void put_u32(std::string& out, uint32_t value) {
    out += static_cast<char>((value >> 24) & 0xFF);
    out += static_cast<char>((value >> 16) & 0xFF);
    out += static_cast<char>((value >> 8) & 0xFF);
    out += static_cast<char>(value & 0xFF);
}

uint16_t get_u16(std::string_view data, size_t offset) {
    auto b = [&](size_t i) { return static_cast<uint16_t>(static_cast<uint8_t>(data[offset + i])); };
    return static_cast<uint16_t>((b(0) << 8) | b(1));
}

uint32_t get_u32(std::string_view data, size_t offset) {
    auto b = [&](size_t i) { return static_cast<uint32_t>(static_cast<uint8_t>(data[offset + i])); };
    return (b(0) << 24) | (b(1) << 16) | (b(2) << 8) | b(3);
}

// ============================================================================
// zlib
// ============================================================================

namespace {

/// Owns a deflate stream for the duration of one compression.
struct DeflateStream {
    z_stream zs{};
    bool ready = false;

    explicit DeflateStream(int level) {
        ready = deflateInit(&zs, level) == Z_OK;
    }
    ~DeflateStream() {
        if (ready) {
            deflateEnd(&zs);
        }
    }
    DeflateStream(const DeflateStream&) = delete;
    DeflateStream& operator=(const DeflateStream&) = delete;
};

struct InflateStream {
    z_stream zs{};
    bool ready = false;

    InflateStream() {
        ready = inflateInit(&zs) == Z_OK;
    }
    ~InflateStream() {
        if (ready) {
            inflateEnd(&zs);
        }
    }
    InflateStream(const InflateStream&) = delete;
    InflateStream& operator=(const InflateStream&) = delete;
};

BuildError zlib_error(const char* what, const z_stream& zs) {
    return BuildError::make(BuildErrorKind::Io,
                            std::string(what) + ": " + (zs.msg ? zs.msg : "zlib error"));
}

} // namespace

BuildResult<std::string> deflate_bytes(std::string_view data, int level) {
    DeflateStream stream(level);
    if (!stream.ready) {
        return zlib_error("deflateInit", stream.zs);
    }

    std::string out;
    std::vector<char> buffer(util::ARCHIVE_CHUNK);
    stream.zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    stream.zs.avail_in = static_cast<uInt>(data.size());

    int rc = Z_OK;
    do {
        stream.zs.next_out = reinterpret_cast<Bytef*>(buffer.data());
        stream.zs.avail_out = static_cast<uInt>(buffer.size());
        rc = deflate(&stream.zs, Z_FINISH);
        if (rc == Z_STREAM_ERROR) {
            return zlib_error("deflate", stream.zs);
        }
        out.append(buffer.data(), buffer.size() - stream.zs.avail_out);
    } while (rc != Z_STREAM_END);

    return out;
}

BuildResult<std::string> inflate_bytes(std::string_view data) {
    InflateStream stream;
    if (!stream.ready) {
        return zlib_error("inflateInit", stream.zs);
    }

    std::string out;
    std::vector<char> buffer(util::ARCHIVE_CHUNK);
    stream.zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    stream.zs.avail_in = static_cast<uInt>(data.size());

    int rc = Z_OK;
    while (rc != Z_STREAM_END) {
        stream.zs.next_out = reinterpret_cast<Bytef*>(buffer.data());
        stream.zs.avail_out = static_cast<uInt>(buffer.size());
        rc = inflate(&stream.zs, Z_NO_FLUSH);
        if (rc == Z_NEED_DICT || rc == Z_DATA_ERROR || rc == Z_MEM_ERROR ||
            rc == Z_STREAM_ERROR) {
            return zlib_error("inflate", stream.zs);
        }
        out.append(buffer.data(), buffer.size() - stream.zs.avail_out);
        if (rc == Z_BUF_ERROR && stream.zs.avail_in == 0) {
            return BuildError::make(BuildErrorKind::Io, "inflate: truncated stream");
        }
    }
    return out;
}

BuildResult<uint64_t> deflate_file(const std::filesystem::path& src, std::ostream& out,
                                   size_t chunk, int level) {
    std::ifstream in(src, std::ios::binary);
    if (!in) {
        return BuildError::make(BuildErrorKind::Io, "cannot open " + src.string());
    }

    DeflateStream stream(level);
    if (!stream.ready) {
        return zlib_error("deflateInit", stream.zs);
    }

    std::vector<char> in_buf(chunk);
    std::vector<char> out_buf(chunk);
    uint64_t written = 0;
    int flush = Z_NO_FLUSH;

    do {
        in.read(in_buf.data(), static_cast<std::streamsize>(in_buf.size()));
        if (in.bad()) {
            return BuildError::make(BuildErrorKind::Io, "read failed on " + src.string());
        }
        stream.zs.next_in = reinterpret_cast<Bytef*>(in_buf.data());
        stream.zs.avail_in = static_cast<uInt>(in.gcount());
        flush = in.eof() ? Z_FINISH : Z_NO_FLUSH;

        do {
            stream.zs.next_out = reinterpret_cast<Bytef*>(out_buf.data());
            stream.zs.avail_out = static_cast<uInt>(out_buf.size());
            if (deflate(&stream.zs, flush) == Z_STREAM_ERROR) {
                return zlib_error("deflate", stream.zs);
            }
            size_t have = out_buf.size() - stream.zs.avail_out;
            out.write(out_buf.data(), static_cast<std::streamsize>(have));
            if (!out) {
                return BuildError::make(BuildErrorKind::Io,
                                        "write failed while compressing " + src.string());
            }
            written += have;
        } while (stream.zs.avail_out == 0);
    } while (flush != Z_FINISH);

    return written;
}

// ============================================================================
// OpenSSL
// ============================================================================

std::string normalize_key(std::string_view key) {
    if (key.size() >= CIPHER_BLOCK) {
        return std::string(key.substr(0, CIPHER_BLOCK));
    }
    return std::string(CIPHER_BLOCK - key.size(), '0') + std::string(key);
}

namespace {

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

BuildResult<std::string> run_cfb8(std::string_view input, std::string_view key,
                                  std::string_view iv, bool encrypt) {
    CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx) {
        return BuildError::make(BuildErrorKind::Io, "EVP_CIPHER_CTX_new failed");
    }

    auto k = normalize_key(key);
    auto* key_bytes = reinterpret_cast<const unsigned char*>(k.data());
    auto* iv_bytes = reinterpret_cast<const unsigned char*>(iv.data());
    if (EVP_CipherInit_ex(ctx.get(), EVP_aes_128_cfb8(), nullptr, key_bytes, iv_bytes,
                          encrypt ? 1 : 0) != 1) {
        return BuildError::make(BuildErrorKind::Io, "EVP_CipherInit_ex failed");
    }

    std::string out(input.size() + CIPHER_BLOCK, '\0');
    int len = 0;
    int total = 0;
    if (EVP_CipherUpdate(ctx.get(), reinterpret_cast<unsigned char*>(out.data()), &len,
                         reinterpret_cast<const unsigned char*>(input.data()),
                         static_cast<int>(input.size())) != 1) {
        return BuildError::make(BuildErrorKind::Io, "EVP_CipherUpdate failed");
    }
    total = len;
    if (EVP_CipherFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(out.data()) + total,
                           &len) != 1) {
        return BuildError::make(BuildErrorKind::Io, "EVP_CipherFinal_ex failed");
    }
    total += len;
    out.resize(static_cast<size_t>(total));
    return out;
}

} // namespace

BuildResult<std::string> encrypt_payload(std::string_view plain, std::string_view key) {
    std::string iv(CIPHER_BLOCK, '\0');
    if (RAND_bytes(reinterpret_cast<unsigned char*>(iv.data()), static_cast<int>(iv.size())) !=
        1) {
        return BuildError::make(BuildErrorKind::Io, "RAND_bytes failed");
    }

    auto cipher = run_cfb8(plain, key, iv, true);
    if (is_err(cipher)) {
        return cipher;
    }
    return iv + unwrap(cipher);
}

BuildResult<std::string> decrypt_payload(std::string_view blob, std::string_view key) {
    if (blob.size() < CIPHER_BLOCK) {
        return BuildError::make(BuildErrorKind::Io, "encrypted payload shorter than its IV");
    }
    return run_cfb8(blob.substr(CIPHER_BLOCK), key, blob.substr(0, CIPHER_BLOCK), false);
}

std::string sha256(std::string_view data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    unsigned int len = 0;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr);
    EVP_DigestUpdate(ctx, data.data(), data.size());
    EVP_DigestFinal_ex(ctx, digest, &len);
    EVP_MD_CTX_free(ctx);

    return std::string(reinterpret_cast<const char*>(digest), len);
}

std::string sha256_hex(std::string_view data) {
    return util::to_hex(sha256(data));
}

} // namespace frost::archive
