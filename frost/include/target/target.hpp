//! # Build Targets
//!
//! Every build step (PYZ, PKG, EXE, DLL, COLLECT) is a `Target`: a node
//! that declares its guts schema, decides whether it is stale, and
//! assembles one artifact.
//!
//! ## Lifecycle
//!
//! ```text
//! unbuilt --run_target()--> check stale --fresh--> skipped
//!                                      \--stale--> assemble() --> guts saved
//! ```
//!
//! Staleness, in order:
//!
//! 1. the artifact is missing;
//! 2. there is no usable previous record;
//! 3. a guts field differs under its predicate;
//! 4. a target-specific check (`check_specific()`) fails.
//!
//! Targets share a `BuildContext` that owns the configuration, the content
//! cache, the resource editor and the per-kind instance counters.

#ifndef FROST_TARGET_TARGET_HPP
#define FROST_TARGET_TARGET_HPP

#include "build/resources.hpp"
#include "cache/bin_cache.hpp"
#include "common.hpp"
#include "config/build_config.hpp"
#include "target/guts.hpp"
#include "toc/toc.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace frost::target {

namespace fs = std::filesystem;

/// State shared by all targets of one build.
class BuildContext {
public:
    /// `editor` defaults to UnsupportedResourceEditor.
    explicit BuildContext(config::BuildConfig config, Box<build::ResourceEditor> editor = nullptr);

    BuildContext(const BuildContext&) = delete;
    BuildContext& operator=(const BuildContext&) = delete;

    [[nodiscard]] const config::BuildConfig& config() const {
        return config_;
    }

    cache::BinaryCache& bin_cache() {
        return bin_cache_;
    }

    build::ResourceEditor& resource_editor() {
        return *editor_;
    }

    /// Guts file for the next instance of `kind`: `<workpath>/out<KIND><n>.toc`.
    fs::path next_guts_path(const std::string& kind);

private:
    config::BuildConfig config_;
    cache::BinaryCache bin_cache_;
    Box<build::ResourceEditor> editor_;
    std::map<std::string, int> instance_counts_;
};

class Target;

/// One constructor argument of a target: raw entries, a TOC, or another
/// target whose artifact and forwarded dependencies are consumed.
using BuildInput = std::variant<std::vector<toc::TocEntry>, toc::Toc, Rc<Target>>;

/// Flattens inputs into one TOC, in order, first name wins.
toc::Toc resolve_inputs(const std::vector<BuildInput>& inputs);

/// Abstract build step.
class Target {
public:
    virtual ~Target() = default;

    /// Persisted kind tag ("PYZ", "PKG", "EXE", "DLL", "COLLECT").
    [[nodiscard]] virtual const char* kind() const = 0;

    /// TOC kind under which consumers store this target's artifact.
    [[nodiscard]] virtual toc::TocKind artifact_kind() const = 0;

    [[nodiscard]] virtual GutsSchema guts_schema() const = 0;

    /// Current values, in schema order.
    [[nodiscard]] virtual std::vector<json::JsonValue> guts_values() const = 0;

    /// Produces the artifact. Returns its path.
    virtual BuildResult<fs::path> assemble() = 0;

    /// Targets that must run before this one.
    [[nodiscard]] virtual std::vector<Target*> prerequisites() {
        return {};
    }

    /// Returns a reason to rebuild, or std::nullopt if up to date.
    [[nodiscard]] std::optional<std::string> staleness(const std::optional<GutsRecord>& previous);

    /// Entries a consumer gets when this target is one of its inputs.
    [[nodiscard]] virtual toc::Toc collect_entries() const;

    [[nodiscard]] const fs::path& artifact() const {
        return artifact_;
    }

    [[nodiscard]] const fs::path& guts_path() const {
        return guts_path_;
    }

    /// Entries forwarded to consumers instead of being stored here.
    [[nodiscard]] const toc::Toc& dependencies() const {
        return dependencies_;
    }

protected:
    /// Allocates the guts file of the next `kind` instance.
    Target(BuildContext& ctx, const std::string& kind, fs::path artifact);

    /// COLLECT overrides this to rebuild unconditionally.
    [[nodiscard]] virtual bool always_stale() const {
        return false;
    }

    /// Step 4 of the staleness check.
    [[nodiscard]] virtual std::optional<std::string> check_specific(const GutsRecord& previous) {
        (void)previous;
        return std::nullopt;
    }

    BuildContext& ctx_;
    fs::path artifact_;
    fs::path guts_path_;
    toc::Toc dependencies_;
};

/// Runs `target` (after its prerequisites): skips it when fresh, otherwise
/// assembles it and saves its guts. Returns the artifact path.
BuildResult<fs::path> run_target(Target& target);

} // namespace frost::target

#endif // FROST_TARGET_TARGET_HPP
