//! # Content Cache Implementation

#include "cache/bin_cache.hpp"

#include "archive/codec.hpp"
#include "log/log.hpp"
#include "util/fs_utils.hpp"

#include <cstdlib>

namespace frost::cache {

namespace {

std::string quote(const fs::path& path) {
    std::string s = path.string();
    std::string out = "\"";
    for (char c : s) {
        if (c == '"' || c == '\\' || c == '$' || c == '`') {
            out += '\\';
        }
        out += c;
    }
    out += '"';
    return out;
}

} // namespace

BinaryCache::BinaryCache(const config::BuildConfig& config) : config_(config) {}

std::string BinaryCache::strip_command() const {
    return config_.is_darwin() ? config_.strip_tool + " -S" : config_.strip_tool;
}

std::string BinaryCache::upx_command() const {
    return config_.upx_tool + " --best -q";
}

fs::path BinaryCache::slot_path(const fs::path& source, const std::string& dest_name, bool strip,
                                bool upx) const {
    std::string root = "bincache";
    root += strip ? '1' : '0';
    root += upx ? '1' : '0';
    root += '_';
    root += config::platform_name(config_.platform);

    auto digest = archive::sha256_hex(util::normalize(source).string()).substr(0, 16);
    return config_.cache_dir / root / digest / fs::path(dest_name).relative_path();
}

bool BinaryCache::run_tool(const std::string& command, const fs::path& file) {
    std::string cmd = command + " " + quote(file);
#ifndef _WIN32
    cmd += " >/dev/null 2>&1";
#endif
    FROST_LOG_DEBUG("cache", "Running " << cmd);
    int rc = std::system(cmd.c_str());
    if (rc != 0) {
        FROST_LOG_WARN("cache", "'" << command << "' failed on " << file.string()
                                    << " (exit status " << rc << ")");
        ++stats_.tool_failures;
        return false;
    }
    return true;
}

fs::path BinaryCache::lookup(const fs::path& source, const std::string& dest_name, bool strip,
                             bool upx) {
    if (upx && !config_.has_upx) {
        FROST_LOG_TRACE("cache", "upx not available, ignoring compression of " << dest_name);
        upx = false;
    }
    if (!strip && !upx) {
        return source;
    }

    fs::path slot = slot_path(source, dest_name, strip, upx);
    std::string key = slot.string();
    if (auto it = memo_.find(key); it != memo_.end()) {
        return it->second;
    }

    auto source_mtime = util::get_mtime(source);
    auto slot_mtime = util::get_mtime(slot);
    std::error_code ec;
    if (source_mtime && slot_mtime && *slot_mtime >= *source_mtime) {
        FROST_LOG_DEBUG("cache", "Hit " << dest_name << " -> " << slot.string());
        ++stats_.hits;
        memo_[key] = slot;
        return slot;
    }

    ++stats_.misses;
    FROST_LOG_INFO("cache", "Transforming " << source.string() << " (strip=" << strip
                                            << ", upx=" << upx << ")");

    auto copied = util::copy_with_metadata(source, slot);
    if (is_err(copied)) {
        FROST_LOG_WARN("cache", unwrap_err(copied).message << "; using untransformed binary");
        fs::remove(slot, ec);
        return source;
    }
    util::make_executable(slot);

    bool ok = true;
    if (strip) {
        ok = run_tool(strip_command(), slot);
    }
    if (ok && upx) {
        ok = run_tool(upx_command(), slot);
    }
    if (!ok) {
        fs::remove(slot, ec);
        return source;
    }

    // The copy kept the source mtime; the transformed slot must look newer.
    fs::last_write_time(slot, fs::file_time_type::clock::now(), ec);
    memo_[key] = slot;
    return slot;
}

} // namespace frost::cache
