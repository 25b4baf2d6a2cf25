//! # Filesystem Helpers Implementation

#include "util/fs_utils.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <iterator>
#include <sstream>
#include <vector>

namespace frost::util {

std::optional<int64_t> get_mtime(const fs::path& path) {
    std::error_code ec;
    auto ftime = fs::last_write_time(path, ec);
    if (ec) {
        return std::nullopt;
    }
    // file_clock has an implementation-defined epoch; pin it to the system clock.
    auto sys = std::chrono::file_clock::to_sys(ftime);
    return static_cast<int64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(sys.time_since_epoch()).count());
}

BuildResult<std::string> read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return BuildError::make(BuildErrorKind::Io, "cannot open " + path.string());
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    if (in.bad()) {
        return BuildError::make(BuildErrorKind::Io, "cannot read " + path.string());
    }
    return oss.str();
}

BuildResult<fs::path> write_file(const fs::path& path, std::string_view data) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return BuildError::make(BuildErrorKind::Io, "cannot create " + path.string());
    }
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    out.close();
    if (!out) {
        return BuildError::make(BuildErrorKind::Io, "cannot write " + path.string());
    }
    return path;
}

BuildResult<uint64_t> append_file(const fs::path& src, std::ostream& out, size_t chunk) {
    std::ifstream in(src, std::ios::binary);
    if (!in) {
        return BuildError::make(BuildErrorKind::Io, "cannot open " + src.string());
    }

    std::vector<char> buffer(chunk);
    uint64_t total = 0;
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = in.gcount();
        if (got <= 0) {
            break;
        }
        out.write(buffer.data(), got);
        if (!out) {
            return BuildError::make(BuildErrorKind::Io, "write failed while copying " + src.string());
        }
        total += static_cast<uint64_t>(got);
    }
    if (in.bad()) {
        return BuildError::make(BuildErrorKind::Io, "read failed on " + src.string());
    }
    return total;
}

BuildResult<fs::path> copy_with_metadata(const fs::path& src, const fs::path& dst) {
    std::error_code ec;
    if (dst.has_parent_path()) {
        fs::create_directories(dst.parent_path(), ec);
    }
    fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return BuildError::make(BuildErrorKind::Io,
                                "cannot copy " + src.string() + " to " + dst.string() + ": " +
                                    ec.message());
    }

    auto perms = fs::status(src, ec).permissions();
    if (!ec) {
        fs::permissions(dst, perms, fs::perm_options::replace, ec);
    }
    if (!ec) {
        auto mtime = fs::last_write_time(src, ec);
        if (!ec) {
            fs::last_write_time(dst, mtime, ec);
        }
    }
    if (ec) {
        FROST_LOG_WARN("fs", "Cannot copy metadata of " << src.string() << " to " << dst.string()
                                                        << ": " << ec.message());
    }
    return dst;
}

bool make_executable(const fs::path& path) {
    using fs::perms;
    std::error_code ec;
    fs::permissions(path,
                    perms::owner_all | perms::group_read | perms::group_exec |
                        perms::others_read | perms::others_exec,
                    fs::perm_options::replace, ec);
    if (ec) {
        FROST_LOG_WARN("fs", "Cannot make " << path.string() << " executable: " << ec.message());
        return false;
    }
    return true;
}

bool is_safe_logical_name(std::string_view name) {
    if (name.empty() || name.front() == '/' || name.front() == '\\') {
        return false;
    }
    // Drive-qualified names ("C:foo") are absolute on Windows.
    if (name.size() >= 2 && name[1] == ':') {
        return false;
    }

    size_t start = 0;
    while (start <= name.size()) {
        size_t end = name.find_first_of("/\\", start);
        if (end == std::string_view::npos) {
            end = name.size();
        }
        if (name.substr(start, end - start) == "..") {
            return false;
        }
        start = end + 1;
    }
    return true;
}

BuildResult<size_t> validate_logical_names(const std::vector<std::string>& names,
                                           std::string_view target) {
    for (const auto& name : names) {
        if (!is_safe_logical_name(name)) {
            return BuildError::make(BuildErrorKind::UnsafePath,
                                    std::string(target) + ": entry name '" + name +
                                        "' would be written outside the output");
        }
    }
    return names.size();
}

bool is_inside_zip(const fs::path& path) {
    std::error_code ec;
    for (fs::path dir = path.parent_path(); !dir.empty() && dir != dir.parent_path();
         dir = dir.parent_path()) {
        auto ext = dir.extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if ((ext == ".egg" || ext == ".zip" || ext == ".whl") && fs::is_regular_file(dir, ec)) {
            return true;
        }
    }
    return false;
}

fs::path normalize(const fs::path& path) {
    std::error_code ec;
    auto result = fs::weakly_canonical(fs::absolute(path, ec), ec);
    if (ec) {
        return fs::absolute(path).lexically_normal();
    }
    return result;
}

bool is_same_or_ancestor(const fs::path& ancestor, const fs::path& path) {
    auto a = normalize(ancestor);
    auto p = normalize(path);
    auto [a_end, p_it] = std::mismatch(a.begin(), a.end(), p.begin(), p.end());
    if (a_end == a.end()) {
        return true;
    }
    // "/a/b/" vs "/a/b": a trailing empty component still matches
    return std::next(a_end) == a.end() && a_end->empty();
}

BuildResult<fs::path> remove_dir_guarded(const fs::path& dir,
                                         const std::vector<fs::path>& protected_paths) {
    std::error_code ec;
    fs::path lexical = fs::absolute(dir, ec).lexically_normal();
    if (ec) {
        return BuildError::make(BuildErrorKind::Io,
                                "cannot resolve " + dir.string() + ": " + ec.message());
    }
    if (!lexical.has_filename() && lexical != lexical.root_path()) {
        lexical = lexical.parent_path();
    }
    if (lexical == lexical.root_path()) {
        return BuildError::make(BuildErrorKind::ContainmentViolation,
                                "refusing to delete filesystem root " + lexical.string());
    }

    // Only the parent is resolved: a link in the last component must not be followed.
    fs::path target = normalize(lexical.parent_path()) / lexical.filename();
    if (fs::is_symlink(fs::symlink_status(target, ec))) {
        return BuildError::make(BuildErrorKind::ContainmentViolation,
                                "refusing to delete " + target.string() +
                                    ": it is a symbolic link");
    }

    fs::path cwd = fs::current_path(ec);
    if (!ec && is_same_or_ancestor(target, cwd)) {
        return BuildError::make(BuildErrorKind::ContainmentViolation,
                                "refusing to delete " + target.string() +
                                    ": it contains the current directory");
    }
    for (const auto& guarded : protected_paths) {
        if (!guarded.empty() && is_same_or_ancestor(target, guarded)) {
            return BuildError::make(BuildErrorKind::ContainmentViolation,
                                    "refusing to delete " + target.string() + ": it contains " +
                                        normalize(guarded).string());
        }
    }

    if (fs::exists(target, ec)) {
        FROST_LOG_DEBUG("fs", "Removing " << target.string());
        fs::remove_all(target, ec);
        if (ec) {
            return BuildError::make(BuildErrorKind::Io,
                                    "cannot remove " + target.string() + ": " + ec.message());
        }
    }
    return target;
}

std::string common_prefix(const std::vector<std::string>& items) {
    if (items.empty()) {
        return {};
    }
    auto [lo, hi] = std::minmax_element(items.begin(), items.end());
    size_t n = 0;
    while (n < lo->size() && n < hi->size() && (*lo)[n] == (*hi)[n]) {
        ++n;
    }
    return lo->substr(0, n);
}

std::string to_hex(std::string_view bytes) {
    static constexpr char DIGITS[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (unsigned char c : bytes) {
        out += DIGITS[c >> 4];
        out += DIGITS[c & 0x0F];
    }
    return out;
}

} // namespace frost::util
