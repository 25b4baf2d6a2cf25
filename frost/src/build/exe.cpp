//! # EXE / DLL Target Implementation

#include "build/exe.hpp"

#include "log/log.hpp"
#include "util/fs_utils.hpp"

#include <fstream>

namespace frost::build {

namespace {

fs::path output_path(const config::BuildConfig& config, const ExeOptions& options) {
    std::string base = fs::path(options.name).filename().string();
    if (options.kind == ExeKind::Dll) {
        if (fs::path(base).extension() != ".dll") {
            base += ".dll";
        }
    } else if (config.is_windows() && fs::path(base).extension() != ".exe") {
        base += ".exe";
    }
    return (options.exclude_binaries ? config.workpath : config.distpath) / base;
}

void report_edit(const BuildResult<fs::path>& result, const std::string& what) {
    if (is_err(result)) {
        FROST_LOG_WARN("exe", "Failed to " << what << ": " << unwrap_err(result).message);
    }
}

} // namespace

ExeTarget::ExeTarget(target::BuildContext& ctx, fs::path artifact, ExeOptions options)
    : Target(ctx, options.kind == ExeKind::Dll ? "DLL" : "EXE", std::move(artifact)),
      options_(std::move(options)) {}

BuildResult<Rc<ExeTarget>> ExeTarget::create(target::BuildContext& ctx,
                                             const std::vector<target::BuildInput>& inputs,
                                             ExeOptions options) {
    if (options.name.empty()) {
        return BuildError::make(BuildErrorKind::InvalidInput, "EXE needs a name");
    }
    const auto& config = ctx.config();
    auto exe = make_rc<ExeTarget>(ctx, output_path(config, options), std::move(options));

    exe->toc_ = target::resolve_inputs(inputs);
    // Keep the runtime from adding user site directories to its path
    exe->toc_.append("S", "", toc::TocKind::Option);

    if (config.is_windows() && exe->options_.kind == ExeKind::Exe) {
        std::string exe_name = exe->artifact_.filename().string();
        fs::path manifest = config.workpath / (exe_name + ".manifest");
        auto written = util::write_file(
            manifest, create_manifest_xml(exe->artifact_.stem().string(), exe->options_.uac_admin,
                                          exe->options_.uac_uiaccess));
        if (is_err(written)) {
            return unwrap_err(written);
        }
        exe->manifest_ = toc::TocEntry{exe_name + ".manifest", manifest.string(),
                                       toc::TocKind::Binary};
        exe->toc_.append(*exe->manifest_);
    }

    fs::path pkg_name = config.is_windows() ? exe->artifact_.stem() : exe->artifact_.filename();
    pkg_name += ".pkg";
    PkgOptions pkg_options;
    pkg_options.cdict = exe->options_.cdict;
    pkg_options.exclude_binaries = exe->options_.exclude_binaries;
    pkg_options.strip_binaries = exe->options_.strip;
    pkg_options.upx_binaries = exe->options_.upx;
    exe->pkg_ = make_rc<PkgTarget>(ctx, std::vector<target::BuildInput>{exe->toc_},
                                   config.workpath / pkg_name, std::move(pkg_options));
    exe->dependencies_ = exe->pkg_->dependencies();

    return exe;
}

fs::path ExeTarget::stub_path() const {
    const auto& config = ctx_.config();
    std::string file;
    if (options_.kind == ExeKind::Dll) {
        file = options_.debug ? "inprocsrvr_d.dll" : "inprocsrvr.dll";
    } else {
        file = "run";
        if (!options_.console && (config.is_windows() || config.is_darwin())) {
            file += 'w';
        }
        if (options_.debug) {
            file += "_d";
        }
        if (config.is_windows()) {
            file += ".exe";
        }
    }
    return config.stub_dir / config.stub_platform_dir() / file;
}

fs::path ExeTarget::side_pkg_path() const {
    return artifact_.parent_path() / pkg_->artifact().filename();
}

toc::Toc ExeTarget::collect_entries() const {
    toc::Toc entries;
    entries.append(artifact_.filename().string(), artifact_.string(), artifact_kind());
    if (manifest_) {
        entries.append(*manifest_);
    }
    if (!options_.append_pkg && options_.kind == ExeKind::Exe) {
        fs::path side = side_pkg_path();
        entries.append(side.filename().string(), side.string(), toc::TocKind::Pkg);
    }
    entries.extend(dependencies_);
    return entries;
}

target::GutsSchema ExeTarget::guts_schema() const {
    return {
        {"name", target::GutsCheck::Eq},    {"console", target::GutsCheck::Eq},
        {"debug", target::GutsCheck::Eq},   {"icon", target::GutsCheck::Eq},
        {"versrsrc", target::GutsCheck::Eq}, {"resources", target::GutsCheck::Eq},
        {"strip", target::GutsCheck::Eq},   {"upx", target::GutsCheck::Eq},
        {"append_pkg", target::GutsCheck::Eq}, {"mtm", target::GutsCheck::Skip},
    };
}

std::vector<json::JsonValue> ExeTarget::guts_values() const {
    std::vector<json::JsonValue> values;
    values.emplace_back(artifact_.string());
    values.emplace_back(options_.console);
    values.emplace_back(options_.debug);
    values.emplace_back(options_.icon);
    values.emplace_back(options_.versrsrc);
    values.push_back(json::json_string_array(options_.resources));
    values.emplace_back(options_.strip);
    values.emplace_back(options_.upx);
    values.emplace_back(options_.append_pkg || options_.kind == ExeKind::Dll);
    if (auto mtime = util::get_mtime(artifact_)) {
        values.emplace_back(*mtime);
    } else {
        values.emplace_back(nullptr);
    }
    return values;
}

std::optional<std::string> ExeTarget::check_specific(const target::GutsRecord& previous) {
    std::error_code ec;
    if (!options_.append_pkg && options_.kind == ExeKind::Exe && !fs::exists(side_pkg_path(), ec)) {
        return side_pkg_path().filename().string() + " is missing";
    }

    const auto* mtm = previous.field(guts_schema(), "mtm");
    std::optional<int64_t> recorded;
    if (mtm) {
        recorded = mtm->try_as_i64();
    }
    auto current = util::get_mtime(artifact_);
    if (!recorded || !current || *recorded != *current) {
        return std::string("mtimes don't match");
    }
    auto pkg_mtime = util::get_mtime(pkg_->artifact());
    if (!pkg_mtime || *pkg_mtime > *recorded) {
        return std::string("the package is more recent");
    }
    return std::nullopt;
}

BuildResult<fs::path> ExeTarget::edit_resources(const fs::path& stub,
                                                std::vector<fs::path>& trash) {
    const auto& config = ctx_.config();
    if (!options_.icon.empty() && !(config.is_windows() || config.is_darwin())) {
        FROST_LOG_WARN("exe", "Ignoring icon, platform not capable");
    }
    if ((!options_.versrsrc.empty() || !options_.resources.empty()) && !config.is_windows()) {
        FROST_LOG_WARN("exe", "Ignoring version and resources, platform not capable");
    }
    if (!config.is_windows()) {
        return stub;
    }

    bool embed = manifest_ && !options_.exclude_binaries;
    bool edit = !options_.icon.empty() || !options_.versrsrc.empty() || !options_.resources.empty();
    if (!embed && !edit) {
        return stub;
    }

    fs::path scratch = config.workpath / (artifact_.filename().string() + ".stub");
    auto copied = util::copy_with_metadata(stub, scratch);
    if (is_err(copied)) {
        return copied;
    }
    trash.push_back(scratch);
    util::make_executable(scratch);

    auto& editor = ctx_.resource_editor();
    if (embed) {
        FROST_LOG_INFO("exe", "One-file mode: embedding manifest into " << scratch.filename().string());
        report_edit(editor.embed_manifest(scratch, manifest_->path), "embed manifest");
    }
    if (!options_.icon.empty()) {
        report_edit(editor.set_icon(scratch, options_.icon), "set icon " + options_.icon);
    }
    if (!options_.versrsrc.empty()) {
        report_edit(editor.set_version(scratch, options_.versrsrc),
                    "set version from " + options_.versrsrc);
    }
    for (const auto& res : options_.resources) {
        auto spec = parse_resource_spec(res);
        if (is_err(spec)) {
            FROST_LOG_WARN("exe", "Skipping resource: " << unwrap_err(spec));
            continue;
        }
        report_edit(editor.add_resource(scratch, unwrap(spec)), "add resource " + res);
    }

    // Edited stubs must not be mistaken for the cached transform of an older edit
    std::error_code ec;
    fs::last_write_time(scratch, fs::file_time_type::clock::now(), ec);
    return scratch;
}

BuildResult<fs::path> ExeTarget::assemble() {
    FROST_LOG_INFO("exe", "Building " << kind() << " " << artifact_.filename().string());

    fs::path stub = stub_path();
    std::error_code ec;
    if (!fs::is_regular_file(stub, ec)) {
        return BuildError::make(BuildErrorKind::MissingStub,
                                "no launcher stub " + stub.string() +
                                    "; build the stubs for this platform first");
    }
    FROST_LOG_DEBUG("exe", "Stub " << stub.string());

    std::vector<fs::path> trash;
    if (options_.kind == ExeKind::Exe) {
        auto edited = edit_resources(stub, trash);
        if (is_err(edited)) {
            return edited;
        }
        stub = unwrap(edited);
    }
    stub = ctx_.bin_cache().lookup(stub, stub.filename().string(), options_.strip, options_.upx);

    fs::create_directories(artifact_.parent_path(), ec);
    std::ofstream out(artifact_, std::ios::binary | std::ios::trunc);
    if (!out) {
        return BuildError::make(BuildErrorKind::Io, "cannot create " + artifact_.string());
    }
    auto copied = util::append_file(stub, out);
    if (is_err(copied)) {
        return unwrap_err(copied);
    }

    const fs::path& pkg = pkg_->artifact();
    if (options_.append_pkg || options_.kind == ExeKind::Dll) {
        FROST_LOG_INFO("exe", "Appending archive to " << artifact_.filename().string());
        auto appended = util::append_file(pkg, out);
        if (is_err(appended)) {
            return unwrap_err(appended);
        }
    }
    out.close();
    if (!out) {
        return BuildError::make(BuildErrorKind::Io, "cannot write " + artifact_.string());
    }

    if (!options_.append_pkg && options_.kind == ExeKind::Exe) {
        fs::path side = side_pkg_path();
        if (util::normalize(side) != util::normalize(pkg)) {
            FROST_LOG_INFO("exe", "Copying archive to " << side.string());
            auto placed = util::copy_with_metadata(pkg, side);
            if (is_err(placed)) {
                return placed;
            }
        }
    }

    util::make_executable(artifact_);
    for (const auto& file : trash) {
        fs::remove(file, ec);
    }
    return artifact_;
}

} // namespace frost::build
