//! # Module Archive Implementation

#include "archive/pyz_archive.hpp"

#include "archive/codec.hpp"
#include "log/log.hpp"
#include "util/fs_utils.hpp"

#include <algorithm>
#include <limits>

namespace frost::archive {

// ============================================================================
// PyzWriter
// ============================================================================

PyzWriter::PyzWriter(std::array<uint8_t, 4> runtime_magic, std::optional<std::string> key)
    : runtime_magic_(runtime_magic), key_(std::move(key)) {}

BuildResult<size_t> PyzWriter::add(const std::string& name, std::string_view code,
                                   bool is_package) {
    if (name.size() > std::numeric_limits<uint16_t>::max()) {
        return BuildError::make(BuildErrorKind::InvalidInput, "module name too long: " + name);
    }

    auto compressed = deflate_bytes(code);
    if (is_err(compressed)) {
        return unwrap_err(compressed);
    }
    std::string payload = std::move(unwrap(compressed));

    uint8_t flags = pyz_flags::COMPRESSED;
    if (is_package) {
        flags |= pyz_flags::PACKAGE;
    }
    if (key_) {
        auto encrypted = encrypt_payload(payload, *key_);
        if (is_err(encrypted)) {
            return unwrap_err(encrypted);
        }
        payload = std::move(unwrap(encrypted));
        flags |= pyz_flags::ENCRYPTED;
    }

    uint64_t offset = PYZ_HEADER_SIZE + payloads_.size();
    if (offset + payload.size() > std::numeric_limits<uint32_t>::max()) {
        return BuildError::make(BuildErrorKind::Io, "module archive exceeds 4 GiB");
    }

    index_.push_back(PyzIndexEntry{name, flags, static_cast<uint32_t>(offset),
                                   static_cast<uint32_t>(payload.size())});
    payloads_ += payload;
    FROST_LOG_TRACE("pyz", "Added " << name << " (" << code.size() << " -> " << payload.size()
                                    << " bytes)");
    return index_.size();
}

BuildResult<fs::path> PyzWriter::write(const fs::path& path) const {
    std::string out;
    out.reserve(PYZ_HEADER_SIZE + payloads_.size() + index_.size() * 32);

    out.append(PYZ_MAGIC);
    for (uint8_t b : runtime_magic_) {
        put_u8(out, b);
    }
    put_u32(out, static_cast<uint32_t>(PYZ_HEADER_SIZE + payloads_.size()));
    out += payloads_;

    put_u32(out, static_cast<uint32_t>(index_.size()));
    for (const auto& entry : index_) {
        put_u16(out, static_cast<uint16_t>(entry.name.size()));
        out += entry.name;
        put_u8(out, entry.flags);
        put_u32(out, entry.offset);
        put_u32(out, entry.length);
    }

    return util::write_file(path, out);
}

// ============================================================================
// PyzReader
// ============================================================================

BuildResult<PyzReader> PyzReader::open(const fs::path& path) {
    auto data = util::read_file(path);
    if (is_err(data)) {
        return unwrap_err(data);
    }

    PyzReader reader;
    reader.data_ = std::move(unwrap(data));
    std::string_view bytes = reader.data_;

    auto corrupt = [&](const std::string& what) {
        return BuildError::make(BuildErrorKind::Io, path.string() + ": " + what);
    };

    if (bytes.size() < PYZ_HEADER_SIZE || bytes.substr(0, 4) != PYZ_MAGIC) {
        return corrupt("not a module archive");
    }
    for (size_t i = 0; i < 4; ++i) {
        reader.runtime_magic_[i] = static_cast<uint8_t>(bytes[4 + i]);
    }

    size_t pos = get_u32(bytes, 8);
    if (pos + 4 > bytes.size()) {
        return corrupt("index offset out of range");
    }
    uint32_t count = get_u32(bytes, pos);
    pos += 4;

    for (uint32_t i = 0; i < count; ++i) {
        if (pos + 2 > bytes.size()) {
            return corrupt("truncated index");
        }
        size_t name_len = get_u16(bytes, pos);
        pos += 2;
        if (pos + name_len + 9 > bytes.size()) {
            return corrupt("truncated index");
        }
        PyzIndexEntry entry;
        entry.name = std::string(bytes.substr(pos, name_len));
        pos += name_len;
        entry.flags = static_cast<uint8_t>(bytes[pos]);
        entry.offset = get_u32(bytes, pos + 1);
        entry.length = get_u32(bytes, pos + 5);
        pos += 9;
        if (static_cast<uint64_t>(entry.offset) + entry.length > bytes.size()) {
            return corrupt("payload of " + entry.name + " out of range");
        }
        reader.index_.push_back(std::move(entry));
    }

    return reader;
}

const PyzIndexEntry* PyzReader::find(std::string_view name) const {
    auto it = std::find_if(index_.begin(), index_.end(),
                           [name](const PyzIndexEntry& e) { return e.name == name; });
    return it == index_.end() ? nullptr : &*it;
}

std::vector<std::string> PyzReader::names() const {
    std::vector<std::string> result;
    result.reserve(index_.size());
    for (const auto& entry : index_) {
        result.push_back(entry.name);
    }
    return result;
}

BuildResult<std::string> PyzReader::extract(std::string_view name,
                                            std::optional<std::string_view> key) const {
    const auto* entry = find(name);
    if (!entry) {
        return BuildError::make(BuildErrorKind::MissingCode,
                                "no module " + std::string(name) + " in archive");
    }

    std::string payload = data_.substr(entry->offset, entry->length);
    if (entry->is_encrypted()) {
        if (!key) {
            return BuildError::make(BuildErrorKind::InvalidInput,
                                    "module " + entry->name + " is encrypted and no key was given");
        }
        auto plain = decrypt_payload(payload, *key);
        if (is_err(plain)) {
            return plain;
        }
        payload = std::move(unwrap(plain));
    }
    if (entry->flags & pyz_flags::COMPRESSED) {
        return inflate_bytes(payload);
    }
    return payload;
}

} // namespace frost::archive
