//! # EXE / DLL Target
//!
//! Produces the final executable: a copy of the matching launcher stub with
//! the package archive appended (or placed beside it as `<base>.pkg`).
//!
//! ## Stub Selection
//!
//! ```text
//! <stub_dir>/<platform>/run[w][_d][.exe]     executables
//! <stub_dir>/<platform>/inprocsrvr[_d].dll   in-process servers (DLL)
//! ```
//!
//! `w` (windowed) only exists on Windows and macOS; `.exe` only on Windows.
//!
//! ## Output Location
//!
//! One-file builds go to `distpath`. With `exclude_binaries` the executable
//! is an intermediate of a one-directory build and goes to `workpath`.

#ifndef FROST_BUILD_EXE_HPP
#define FROST_BUILD_EXE_HPP

#include "build/pkg.hpp"
#include "target/target.hpp"

#include <optional>
#include <string>
#include <vector>

namespace frost::build {

enum class ExeKind { Exe, Dll };

struct ExeOptions {
    ExeKind kind = ExeKind::Exe;
    std::string name;
    bool console = true;
    bool debug = false;
    bool strip = false;
    bool upx = false;
    bool exclude_binaries = false;
    bool append_pkg = true;
    std::string icon;
    std::string versrsrc;
    std::vector<std::string> resources;
    bool uac_admin = false;
    bool uac_uiaccess = false;
    CompressionPolicy cdict = default_compression();
};

class ExeTarget final : public target::Target {
public:
    /// Builds the TOC, writes the Windows manifest and creates the PKG.
    static BuildResult<Rc<ExeTarget>> create(target::BuildContext& ctx,
                                             const std::vector<target::BuildInput>& inputs,
                                             ExeOptions options);

    [[nodiscard]] const char* kind() const override {
        return options_.kind == ExeKind::Dll ? "DLL" : "EXE";
    }

    [[nodiscard]] toc::TocKind artifact_kind() const override {
        return toc::TocKind::Executable;
    }

    [[nodiscard]] target::GutsSchema guts_schema() const override;
    [[nodiscard]] std::vector<json::JsonValue> guts_values() const override;

    BuildResult<fs::path> assemble() override;

    [[nodiscard]] std::vector<target::Target*> prerequisites() override {
        return {pkg_.get()};
    }

    /// Adds the manifest and side-placed package to the artifact entries.
    [[nodiscard]] toc::Toc collect_entries() const override;

    /// Launcher stub this target would copy.
    [[nodiscard]] fs::path stub_path() const;

    /// Package file placed beside the executable when `append_pkg` is off.
    [[nodiscard]] fs::path side_pkg_path() const;

    [[nodiscard]] const toc::Toc& toc() const {
        return toc_;
    }

    [[nodiscard]] const PkgTarget& pkg() const {
        return *pkg_;
    }

    [[nodiscard]] const std::optional<toc::TocEntry>& manifest_entry() const {
        return manifest_;
    }

    ExeTarget(target::BuildContext& ctx, fs::path artifact, ExeOptions options);

protected:
    [[nodiscard]] std::optional<std::string>
    check_specific(const target::GutsRecord& previous) override;

private:
    /// Copies the stub to a scratch file and applies resource edits.
    /// Returns the stub to use (the scratch copy, or `stub` if untouched).
    BuildResult<fs::path> edit_resources(const fs::path& stub, std::vector<fs::path>& trash);

    ExeOptions options_;
    toc::Toc toc_;
    Rc<PkgTarget> pkg_;
    std::optional<toc::TocEntry> manifest_;
};

} // namespace frost::build

#endif // FROST_BUILD_EXE_HPP
