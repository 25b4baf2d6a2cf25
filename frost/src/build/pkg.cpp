//! # PKG Target Implementation

#include "build/pkg.hpp"

#include "archive/carchive.hpp"
#include "log/log.hpp"
#include "util/fs_utils.hpp"

#include <unordered_map>

namespace frost::build {

CompressionPolicy default_compression() {
    using toc::TocKind;
    CompressionPolicy policy;
    for (TocKind kind : {TocKind::Module, TocKind::Source, TocKind::Extension, TocKind::Pkg,
                         TocKind::Data, TocKind::Binary, TocKind::Zip, TocKind::Executable}) {
        policy[kind] = true;
    }
    policy[TocKind::Pyz] = false;
    return policy;
}

json::JsonValue compression_to_json(const CompressionPolicy& policy) {
    auto obj = json::json_object();
    for (const auto& [kind, compress] : policy) {
        obj.set(toc::kind_name(kind), json::JsonValue(compress));
    }
    return obj;
}

PkgTarget::PkgTarget(target::BuildContext& ctx, const std::vector<target::BuildInput>& inputs,
                     fs::path artifact, PkgOptions options)
    : Target(ctx, "PKG", std::move(artifact)), toc_(target::resolve_inputs(inputs)),
      options_(std::move(options)) {
    if (artifact_.empty()) {
        artifact_ = fs::path(guts_path_).replace_extension(".pkg");
    }
    if (options_.exclude_binaries) {
        auto suffixed = toc::add_suffix_to_extensions(toc_, ctx.config().extension_suffix());
        for (const auto& entry : suffixed) {
            if (toc::is_native_binary(entry.kind)) {
                dependencies_.append(entry);
            }
        }
    }
}

target::GutsSchema PkgTarget::guts_schema() const {
    return {
        {"name", target::GutsCheck::Eq},
        {"cdict", target::GutsCheck::Eq},
        {"toc", target::GutsCheck::TocMtime},
        {"exclude_binaries", target::GutsCheck::Eq},
        {"strip_binaries", target::GutsCheck::Eq},
        {"upx_binaries", target::GutsCheck::Eq},
    };
}

std::vector<json::JsonValue> PkgTarget::guts_values() const {
    std::vector<json::JsonValue> values;
    values.emplace_back(artifact_.string());
    values.push_back(compression_to_json(options_.cdict));
    values.push_back(toc_.to_json());
    values.emplace_back(options_.exclude_binaries);
    values.emplace_back(options_.strip_binaries);
    values.emplace_back(options_.upx_binaries);
    return values;
}

bool PkgTarget::compressed(toc::TocKind kind) const {
    auto it = options_.cdict.find(kind);
    return it != options_.cdict.end() && it->second;
}

BuildResult<fs::path> PkgTarget::assemble() {
    FROST_LOG_INFO("pkg", "Building PKG " << artifact_.filename().string());
    const auto& config = ctx_.config();
    toc::Toc toc = toc::add_suffix_to_extensions(toc_, config.extension_suffix());

    std::vector<std::string> names;
    names.reserve(toc.size());
    for (const auto& entry : toc) {
        // References name a file in another build, not a path in this one
        if (entry.kind != toc::TocKind::Dependency) {
            names.push_back(entry.name);
        }
    }
    auto valid = util::validate_logical_names(names, "PKG " + artifact_.filename().string());
    if (is_err(valid)) {
        return unwrap_err(valid);
    }

    archive::CArchiveWriter writer(artifact_, config.runtime_version, config.runtime_library);
    std::unordered_map<std::string, std::string> seen_sources;

    for (const auto& entry : toc) {
        if (entry.kind == toc::TocKind::Option || entry.kind == toc::TocKind::Dependency) {
            auto added = writer.add_marker(entry.name, toc::type_code(entry.kind));
            if (is_err(added)) {
                return unwrap_err(added);
            }
            continue;
        }

        if (toc::is_native_binary(entry.kind) && options_.exclude_binaries) {
            continue;
        }

        std::error_code ec;
        if (!fs::is_regular_file(entry.path, ec)) {
            if (util::is_inside_zip(entry.path)) {
                FROST_LOG_DEBUG("pkg", entry.path << " is provided by its zipped package");
                continue;
            }
            return BuildError::make(BuildErrorKind::MissingSource,
                                    "source of " + entry.name + " not found: " + entry.path);
        }

        fs::path source = entry.path;
        if (toc::is_native_binary(entry.kind)) {
            auto [it, inserted] = seen_sources.emplace(entry.path, entry.name);
            if (!inserted) {
                FROST_LOG_WARN("pkg", "One binary added with two names: " << entry.path
                                                                          << " was stored as "
                                                                          << it->second
                                                                          << " previously");
            }
            source = ctx_.bin_cache().lookup(source, entry.name, options_.strip_binaries,
                                             options_.upx_binaries);
        }

        auto added =
            writer.add_file(entry.name, source, toc::type_code(entry.kind), compressed(entry.kind));
        if (is_err(added)) {
            return unwrap_err(added);
        }
    }

    return writer.finish();
}

} // namespace frost::build
