//! # Build Configuration Loading

#include "config/build_config.hpp"

#include "json/json_parser.hpp"
#include "log/log.hpp"

#include <charconv>
#include <cstdlib>

namespace frost::config {

const char* platform_name(Platform platform) {
    switch (platform) {
    case Platform::Linux:
        return "linux";
    case Platform::Windows:
        return "windows";
    case Platform::Darwin:
        return "darwin";
    }
    return "linux";
}

std::optional<Platform> parse_platform(std::string_view name) {
    if (name == "linux") {
        return Platform::Linux;
    }
    if (name == "windows") {
        return Platform::Windows;
    }
    if (name == "darwin") {
        return Platform::Darwin;
    }
    return std::nullopt;
}

Platform host_platform() {
#if defined(_WIN32)
    return Platform::Windows;
#elif defined(__APPLE__)
    return Platform::Darwin;
#else
    return Platform::Linux;
#endif
}

fs::path default_cache_dir() {
    if (const char* dir = std::getenv("FROST_CACHE_DIR"); dir && *dir) {
        return fs::path(dir);
    }
    if (const char* xdg = std::getenv("XDG_CACHE_HOME"); xdg && *xdg) {
        return fs::path(xdg) / "frost";
    }
#ifdef _WIN32
    if (const char* appdata = std::getenv("LOCALAPPDATA"); appdata && *appdata) {
        return fs::path(appdata) / "frost";
    }
#else
    if (const char* home = std::getenv("HOME"); home && *home) {
        return fs::path(home) / ".cache" / "frost";
    }
#endif
    return fs::temp_directory_path() / "frost-cache";
}

BuildConfig BuildConfig::defaults(const fs::path& base) {
    BuildConfig config;
    config.specpath = base;
    config.workpath = base / "build";
    config.distpath = base / "dist";
    config.stub_dir = base / "stubs";
    config.cache_dir = default_cache_dir();
    return config;
}

std::string BuildConfig::stub_platform_dir() const {
    switch (platform) {
    case Platform::Windows:
        return "Windows-64bit";
    case Platform::Darwin:
        return "Darwin-64bit";
    case Platform::Linux:
        break;
    }
    return "Linux-64bit";
}

std::string BuildConfig::extension_suffix() const {
    return is_windows() ? ".pyd" : ".so";
}

namespace {

Result<std::array<uint8_t, 4>, std::string> parse_magic(const std::string& hex) {
    if (hex.size() != 8) {
        return "runtime_magic must be 8 hex digits, got '" + hex + "'";
    }
    std::array<uint8_t, 4> magic{};
    for (size_t i = 0; i < magic.size(); ++i) {
        unsigned int byte = 0;
        const char* first = hex.data() + i * 2;
        auto [ptr, ec] = std::from_chars(first, first + 2, byte, 16);
        if (ec != std::errc{} || ptr != first + 2) {
            return "runtime_magic is not hexadecimal: '" + hex + "'";
        }
        magic[i] = static_cast<uint8_t>(byte);
    }
    return magic;
}

/// Reads an optional path member, resolved against `base_dir`.
std::optional<std::string> read_path(const json::JsonValue& obj, const char* key,
                                     const fs::path& base_dir, fs::path& out) {
    const auto* value = obj.get(key);
    if (!value) {
        return std::nullopt;
    }
    if (!value->is_string()) {
        return std::string(key) + " must be a string";
    }
    fs::path p(value->as_string());
    out = p.is_absolute() ? p : (base_dir / p).lexically_normal();
    return std::nullopt;
}

std::optional<std::string> read_string(const json::JsonValue& obj, const char* key,
                                       std::string& out) {
    const auto* value = obj.get(key);
    if (!value) {
        return std::nullopt;
    }
    if (!value->is_string()) {
        return std::string(key) + " must be a string";
    }
    out = value->as_string();
    return std::nullopt;
}

} // namespace

Result<BuildConfig, std::string> config_from_json(const json::JsonValue& value,
                                                  const fs::path& base_dir) {
    if (!value.is_object()) {
        return std::string("configuration must be a JSON object");
    }

    BuildConfig config = BuildConfig::defaults(base_dir);

    for (auto [key, target] : {std::pair{"workpath", &config.workpath},
                               std::pair{"distpath", &config.distpath},
                               std::pair{"specpath", &config.specpath},
                               std::pair{"stub_dir", &config.stub_dir},
                               std::pair{"cache_dir", &config.cache_dir}}) {
        if (auto err = read_path(value, key, base_dir, *target)) {
            return *err;
        }
    }

    if (const auto* platform = value.get("platform")) {
        if (!platform->is_string()) {
            return std::string("platform must be a string");
        }
        auto parsed = parse_platform(platform->as_string());
        if (!parsed) {
            return "unknown platform '" + platform->as_string() + "'";
        }
        config.platform = *parsed;
    }

    for (auto [key, target] : {std::pair{"runtime_library", &config.runtime_library},
                               std::pair{"strip_tool", &config.strip_tool},
                               std::pair{"upx_tool", &config.upx_tool}}) {
        if (auto err = read_string(value, key, *target)) {
            return *err;
        }
    }
    if (config.runtime_library.size() >= 64) {
        return "runtime_library '" + config.runtime_library + "' is longer than 63 bytes";
    }

    if (const auto* version = value.get("runtime_version")) {
        auto v = version->try_as_i64();
        if (!v) {
            return std::string("runtime_version must be an integer");
        }
        config.runtime_version = static_cast<int32_t>(*v);
    }

    if (const auto* magic = value.get("runtime_magic")) {
        if (!magic->is_string()) {
            return std::string("runtime_magic must be a hex string");
        }
        auto parsed = parse_magic(magic->as_string());
        if (is_err(parsed)) {
            return unwrap_err(parsed);
        }
        config.runtime_magic = unwrap(parsed);
    }

    if (const auto* upx = value.get("has_upx")) {
        if (!upx->is_bool()) {
            return std::string("has_upx must be a boolean");
        }
        config.has_upx = upx->as_bool();
    }

    if (const auto* bootstrap = value.get("bootstrap")) {
        auto toc = toc::Toc::from_json(*bootstrap);
        if (is_err(toc)) {
            return "bootstrap: " + unwrap_err(toc);
        }
        // Bootstrap sources are relative to the configuration as well
        for (const auto& entry : unwrap(toc)) {
            fs::path src(entry.path);
            if (!src.empty() && src.is_relative()) {
                src = (base_dir / src).lexically_normal();
            }
            config.bootstrap.append(entry.name, src.string(), entry.kind);
        }
    }

    return config;
}

Result<BuildConfig, std::string> load_build_config(const fs::path& path) {
    auto parsed = json::parse_json_file(path);
    if (is_err(parsed)) {
        return path.string() + ": " + unwrap_err(parsed).to_string();
    }
    auto base_dir = fs::absolute(path).parent_path();
    auto config = config_from_json(unwrap(parsed), base_dir);
    if (is_err(config)) {
        return path.string() + ": " + unwrap_err(config);
    }
    FROST_LOG_DEBUG("config", "Loaded " << path.string() << " (platform "
                                        << platform_name(unwrap(config).platform) << ")");
    return config;
}

} // namespace frost::config
