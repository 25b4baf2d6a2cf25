//! # COLLECT Target Implementation

#include "build/collect.hpp"

#include "log/log.hpp"
#include "util/fs_utils.hpp"

namespace frost::build {

CollectTarget::CollectTarget(target::BuildContext& ctx,
                             const std::vector<target::BuildInput>& inputs,
                             CollectOptions options)
    : Target(ctx, "COLLECT", ctx.config().distpath / fs::path(options.name).filename()),
      toc_(target::resolve_inputs(inputs)), options_(std::move(options)) {}

target::GutsSchema CollectTarget::guts_schema() const {
    return {
        {"name", target::GutsCheck::Eq},
        {"strip_binaries", target::GutsCheck::Eq},
        {"upx_binaries", target::GutsCheck::Eq},
        {"toc", target::GutsCheck::TocSet},
    };
}

std::vector<json::JsonValue> CollectTarget::guts_values() const {
    std::vector<json::JsonValue> values;
    values.emplace_back(artifact_.string());
    values.emplace_back(options_.strip_binaries);
    values.emplace_back(options_.upx_binaries);
    values.push_back(toc_.to_json());
    return values;
}

BuildResult<fs::path> CollectTarget::assemble() {
    const auto& config = ctx_.config();
    toc::Toc toc = toc::add_suffix_to_extensions(toc_, config.extension_suffix());

    std::vector<std::string> names;
    names.reserve(toc.size());
    for (const auto& entry : toc) {
        if (entry.kind != toc::TocKind::Option && entry.kind != toc::TocKind::Dependency) {
            names.push_back(entry.name);
        }
    }
    auto valid = util::validate_logical_names(names, "COLLECT " + artifact_.filename().string());
    if (is_err(valid)) {
        return unwrap_err(valid);
    }

    auto removed = util::remove_dir_guarded(artifact_, {config.workpath, config.specpath});
    if (is_err(removed)) {
        return removed;
    }

    FROST_LOG_INFO("collect", "Building COLLECT " << artifact_.filename().string());
    std::error_code ec;
    fs::create_directories(artifact_, ec);
    if (ec) {
        return BuildError::make(BuildErrorKind::Io,
                                "cannot create " + artifact_.string() + ": " + ec.message());
    }

    size_t copied = 0;
    for (const auto& entry : toc) {
        if (entry.kind == toc::TocKind::Option || entry.kind == toc::TocKind::Dependency) {
            continue;
        }
        if (!fs::is_regular_file(entry.path, ec)) {
            if (util::is_inside_zip(entry.path)) {
                FROST_LOG_DEBUG("collect", entry.path << " is provided by its zipped package");
                continue;
            }
            return BuildError::make(BuildErrorKind::MissingSource,
                                    "source of " + entry.name + " not found: " + entry.path);
        }

        fs::path source = entry.path;
        bool binary = toc::is_native_binary(entry.kind);
        if (binary) {
            source = ctx_.bin_cache().lookup(source, entry.name, options_.strip_binaries,
                                             options_.upx_binaries);
        }

        fs::path dest = artifact_ / fs::path(entry.name);
        auto placed = util::copy_with_metadata(source, dest);
        if (is_err(placed)) {
            return placed;
        }
        if (binary) {
            util::make_executable(dest);
        }
        ++copied;
    }

    FROST_LOG_INFO("collect", "Collected " << copied << " files into " << artifact_.string());
    return artifact_;
}

} // namespace frost::build
