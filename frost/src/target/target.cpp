//! # Build Targets Implementation

#include "target/target.hpp"

#include "log/log.hpp"

namespace frost::target {

// ============================================================================
// BuildContext
// ============================================================================

BuildContext::BuildContext(config::BuildConfig config, Box<build::ResourceEditor> editor)
    : config_(std::move(config)), bin_cache_(config_), editor_(std::move(editor)) {
    if (!editor_) {
        editor_ = make_box<build::UnsupportedResourceEditor>();
    }
}

fs::path BuildContext::next_guts_path(const std::string& kind) {
    int n = instance_counts_[kind]++;
    return config_.workpath / ("out" + kind + std::to_string(n) + ".toc");
}

// ============================================================================
// Inputs
// ============================================================================

toc::Toc resolve_inputs(const std::vector<BuildInput>& inputs) {
    toc::Toc result;
    for (const auto& input : inputs) {
        if (const auto* entries = std::get_if<std::vector<toc::TocEntry>>(&input)) {
            result.extend(*entries);
        } else if (const auto* toc = std::get_if<toc::Toc>(&input)) {
            result.extend(*toc);
        } else if (const auto* target = std::get_if<Rc<Target>>(&input); target && *target) {
            result.extend((*target)->collect_entries());
        }
    }
    return result;
}

// ============================================================================
// Target
// ============================================================================

Target::Target(BuildContext& ctx, const std::string& kind, fs::path artifact)
    : ctx_(ctx), artifact_(std::move(artifact)), guts_path_(ctx.next_guts_path(kind)) {}

toc::Toc Target::collect_entries() const {
    toc::Toc entries;
    entries.append(artifact_.filename().string(), artifact_.string(), artifact_kind());
    entries.extend(dependencies_);
    return entries;
}

std::optional<std::string> Target::staleness(const std::optional<GutsRecord>& previous) {
    if (always_stale()) {
        return std::string("it is always rebuilt");
    }
    std::error_code ec;
    if (!fs::exists(artifact_, ec)) {
        return artifact_.filename().string() + " is missing";
    }
    if (!previous) {
        return std::string("no previous build record");
    }
    if (auto reason = compare_guts(guts_schema(), *previous, guts_values())) {
        return reason;
    }
    return check_specific(*previous);
}

BuildResult<fs::path> run_target(Target& target) {
    for (Target* prerequisite : target.prerequisites()) {
        auto result = run_target(*prerequisite);
        if (is_err(result)) {
            return result;
        }
    }

    auto schema = target.guts_schema();
    auto previous = load_guts(target.guts_path(), target.kind(), schema);
    auto reason = target.staleness(previous);
    if (!reason) {
        FROST_LOG_INFO("build", target.kind() << " " << target.artifact().filename().string()
                                              << " is up to date");
        return target.artifact();
    }

    FROST_LOG_INFO("build", "Building " << target.kind() << " "
                                        << target.artifact().filename().string() << " because "
                                        << *reason);
    auto built = target.assemble();
    if (is_err(built)) {
        return built;
    }

    auto saved = save_guts(target.guts_path(), target.kind(), schema, target.guts_values());
    if (is_err(saved)) {
        return saved;
    }
    FROST_LOG_DEBUG("build", "Saved " << unwrap(saved).string());
    return built;
}

} // namespace frost::target
