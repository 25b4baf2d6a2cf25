//! # Package Archive Implementation

#include "archive/carchive.hpp"

#include "archive/codec.hpp"
#include "log/log.hpp"
#include "util/fs_utils.hpp"

#include <algorithm>
#include <limits>

namespace frost::archive {

namespace {

constexpr uint64_t MAX_ARCHIVE = static_cast<uint64_t>(std::numeric_limits<int32_t>::max());

BuildError io_error(const fs::path& path, const std::string& what) {
    return BuildError::make(BuildErrorKind::Io, path.string() + ": " + what);
}

} // namespace

std::string encode_directory_entry(const CArchiveEntry& entry) {
    size_t raw = CARCHIVE_ENTRY_HEADER + entry.name.size() + 1;
    size_t padded = (raw % 16 == 0) ? raw : raw + (16 - raw % 16);

    std::string out;
    out.reserve(padded);
    put_i32(out, static_cast<int32_t>(padded));
    put_i32(out, entry.offset);
    put_i32(out, entry.compressed_len);
    put_i32(out, entry.uncompressed_len);
    put_u8(out, entry.compression_flag);
    out += entry.type_code;
    out += entry.name;
    out.append(padded - CARCHIVE_ENTRY_HEADER - entry.name.size(), '\0');
    return out;
}

// ============================================================================
// CArchiveWriter
// ============================================================================

CArchiveWriter::CArchiveWriter(fs::path path, int32_t runtime_version, std::string runtime_library)
    : path_(std::move(path)), runtime_version_(runtime_version),
      runtime_library_(std::move(runtime_library)) {}

BuildResult<size_t> CArchiveWriter::open_if_needed() {
    if (opened_) {
        return entries_.size();
    }
    std::error_code ec;
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
    }
    out_.open(path_, std::ios::binary | std::ios::trunc);
    if (!out_) {
        return io_error(path_, "cannot create archive");
    }
    opened_ = true;
    return entries_.size();
}

BuildResult<size_t> CArchiveWriter::add_file(const std::string& name, const fs::path& source,
                                             char type_code, bool compress) {
    auto opened = open_if_needed();
    if (is_err(opened)) {
        return opened;
    }

    std::error_code ec;
    uint64_t ulen = fs::file_size(source, ec);
    if (ec) {
        return io_error(source, "cannot stat: " + ec.message());
    }

    auto where = static_cast<uint64_t>(out_.tellp());
    uint64_t dlen = 0;
    if (compress) {
        auto written = deflate_file(source, out_, util::ARCHIVE_CHUNK);
        if (is_err(written)) {
            return unwrap_err(written);
        }
        dlen = unwrap(written);
    } else {
        auto written = util::append_file(source, out_, util::ARCHIVE_CHUNK);
        if (is_err(written)) {
            return unwrap_err(written);
        }
        dlen = unwrap(written);
    }

    if (where + dlen > MAX_ARCHIVE || ulen > MAX_ARCHIVE) {
        return io_error(path_, "archive exceeds 2 GiB while adding " + name);
    }

    entries_.push_back(CArchiveEntry{static_cast<int32_t>(where), static_cast<int32_t>(dlen),
                                     static_cast<int32_t>(ulen),
                                     static_cast<uint8_t>(compress ? 1 : 0), type_code, name});
    FROST_LOG_TRACE("carchive", "Added " << name << " [" << type_code << "] " << ulen << " -> "
                                         << dlen << " bytes");
    return entries_.size();
}

BuildResult<size_t> CArchiveWriter::add_marker(const std::string& name, char type_code) {
    auto opened = open_if_needed();
    if (is_err(opened)) {
        return opened;
    }
    auto where = static_cast<int32_t>(out_.tellp());
    entries_.push_back(CArchiveEntry{where, 0, 0, 0, type_code, name});
    return entries_.size();
}

BuildResult<fs::path> CArchiveWriter::finish() {
    auto opened = open_if_needed();
    if (is_err(opened)) {
        return unwrap_err(opened);
    }

    auto toc_offset = static_cast<uint64_t>(out_.tellp());
    std::string directory;
    for (const auto& entry : entries_) {
        directory += encode_directory_entry(entry);
    }
    uint64_t total = toc_offset + directory.size() + CARCHIVE_COOKIE_SIZE;
    if (total > MAX_ARCHIVE) {
        return io_error(path_, "archive exceeds 2 GiB");
    }

    std::string cookie;
    cookie.reserve(CARCHIVE_COOKIE_SIZE);
    cookie.append(CARCHIVE_MAGIC);
    put_i32(cookie, static_cast<int32_t>(total));
    put_i32(cookie, static_cast<int32_t>(toc_offset));
    put_i32(cookie, static_cast<int32_t>(directory.size()));
    put_i32(cookie, runtime_version_);
    std::string lib = runtime_library_.substr(0, RUNTIME_LIBRARY_FIELD - 1);
    cookie += lib;
    cookie.append(RUNTIME_LIBRARY_FIELD - lib.size(), '\0');

    out_.write(directory.data(), static_cast<std::streamsize>(directory.size()));
    out_.write(cookie.data(), static_cast<std::streamsize>(cookie.size()));
    out_.close();
    if (!out_) {
        return io_error(path_, "write failed");
    }
    FROST_LOG_DEBUG("carchive", "Wrote " << path_.string() << " (" << entries_.size()
                                         << " entries, " << total << " bytes)");
    return path_;
}

// ============================================================================
// CArchiveReader
// ============================================================================

BuildResult<CArchiveReader> CArchiveReader::open(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return io_error(path, "cannot open");
    }
    std::error_code ec;
    uint64_t file_size = fs::file_size(path, ec);
    if (ec || file_size < CARCHIVE_COOKIE_SIZE) {
        return io_error(path, "not a package archive");
    }

    std::string cookie(CARCHIVE_COOKIE_SIZE, '\0');
    in.seekg(static_cast<std::streamoff>(file_size - CARCHIVE_COOKIE_SIZE));
    in.read(cookie.data(), static_cast<std::streamsize>(cookie.size()));
    if (!in || std::string_view(cookie).substr(0, CARCHIVE_MAGIC.size()) != CARCHIVE_MAGIC) {
        return io_error(path, "package cookie not found");
    }

    CArchiveReader reader;
    reader.path_ = path;
    auto archive_len = static_cast<uint32_t>(get_i32(cookie, 8));
    auto toc_offset = static_cast<uint32_t>(get_i32(cookie, 12));
    auto toc_len = static_cast<uint32_t>(get_i32(cookie, 16));
    reader.runtime_version_ = get_i32(cookie, 20);
    std::string lib = cookie.substr(24, RUNTIME_LIBRARY_FIELD);
    reader.runtime_library_ = lib.substr(0, lib.find('\0'));

    if (archive_len > file_size ||
        static_cast<uint64_t>(toc_offset) + toc_len + CARCHIVE_COOKIE_SIZE > archive_len) {
        return io_error(path, "inconsistent package cookie");
    }
    reader.start_ = file_size - archive_len;

    std::string directory(toc_len, '\0');
    in.seekg(static_cast<std::streamoff>(reader.start_ + toc_offset));
    in.read(directory.data(), static_cast<std::streamsize>(directory.size()));
    if (!in) {
        return io_error(path, "cannot read package directory");
    }

    size_t pos = 0;
    while (pos + CARCHIVE_ENTRY_HEADER <= directory.size()) {
        int32_t raw_len = get_i32(directory, pos);
        if (raw_len <= static_cast<int32_t>(CARCHIVE_ENTRY_HEADER) ||
            static_cast<size_t>(raw_len) > directory.size() - pos) {
            return io_error(path, "corrupt package directory");
        }
        auto entry_len = static_cast<size_t>(raw_len);
        CArchiveEntry entry;
        entry.offset = get_i32(directory, pos + 4);
        entry.compressed_len = get_i32(directory, pos + 8);
        entry.uncompressed_len = get_i32(directory, pos + 12);
        entry.compression_flag = static_cast<uint8_t>(directory[pos + 16]);
        entry.type_code = directory[pos + 17];
        // Payloads live between the start of the archive and its directory
        if (entry.offset < 0 || entry.compressed_len < 0 || entry.uncompressed_len < 0 ||
            static_cast<uint64_t>(entry.offset) + static_cast<uint64_t>(entry.compressed_len) >
                toc_offset) {
            return io_error(path, "corrupt package directory");
        }
        std::string name = directory.substr(pos + CARCHIVE_ENTRY_HEADER,
                                            entry_len - CARCHIVE_ENTRY_HEADER);
        entry.name = name.substr(0, name.find('\0'));
        reader.entries_.push_back(std::move(entry));
        pos += entry_len;
    }

    return reader;
}

const CArchiveEntry* CArchiveReader::find(std::string_view name) const {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [name](const CArchiveEntry& e) { return e.name == name; });
    return it == entries_.end() ? nullptr : &*it;
}

std::vector<std::string> CArchiveReader::names() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.name);
    }
    return result;
}

BuildResult<std::string> CArchiveReader::extract(std::string_view name) const {
    const auto* entry = find(name);
    if (!entry) {
        return BuildError::make(BuildErrorKind::MissingSource,
                                "no entry " + std::string(name) + " in " + path_.string());
    }

    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        return io_error(path_, "cannot open");
    }
    std::string payload(static_cast<size_t>(entry->compressed_len), '\0');
    in.seekg(static_cast<std::streamoff>(start_ + static_cast<uint64_t>(entry->offset)));
    in.read(payload.data(), static_cast<std::streamsize>(payload.size()));
    if (!in) {
        return io_error(path_, "cannot read payload of " + entry->name);
    }

    if (entry->compression_flag) {
        return inflate_bytes(payload);
    }
    return payload;
}

} // namespace frost::archive
