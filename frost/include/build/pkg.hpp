//! # PKG Target
//!
//! Writes the package archive carried by the launcher: scripts, bootstrap
//! modules, the module archive, data files, binaries, references into other
//! builds and runtime options.
//!
//! With `exclude_binaries` (one-directory mode) binaries and extensions are
//! not stored; they are forwarded as dependencies so COLLECT places them
//! beside the executable.

#ifndef FROST_BUILD_PKG_HPP
#define FROST_BUILD_PKG_HPP

#include "target/target.hpp"

#include <map>

namespace frost::build {

/// Whether entries of each kind are stored compressed.
using CompressionPolicy = std::map<toc::TocKind, bool>;

/// Everything compressed except module archives.
CompressionPolicy default_compression();

json::JsonValue compression_to_json(const CompressionPolicy& policy);

struct PkgOptions {
    CompressionPolicy cdict = default_compression();
    bool exclude_binaries = false;
    bool strip_binaries = false;
    bool upx_binaries = false;
};

class PkgTarget final : public target::Target {
public:
    /// `artifact` empty means `<workpath>/<guts file stem>.pkg`.
    PkgTarget(target::BuildContext& ctx, const std::vector<target::BuildInput>& inputs,
              fs::path artifact = {}, PkgOptions options = {});

    [[nodiscard]] const char* kind() const override {
        return "PKG";
    }

    [[nodiscard]] toc::TocKind artifact_kind() const override {
        return toc::TocKind::Pkg;
    }

    [[nodiscard]] target::GutsSchema guts_schema() const override;
    [[nodiscard]] std::vector<json::JsonValue> guts_values() const override;

    BuildResult<fs::path> assemble() override;

    [[nodiscard]] const toc::Toc& toc() const {
        return toc_;
    }

    [[nodiscard]] const PkgOptions& options() const {
        return options_;
    }

private:
    [[nodiscard]] bool compressed(toc::TocKind kind) const;

    toc::Toc toc_;
    PkgOptions options_;
};

} // namespace frost::build

#endif // FROST_BUILD_PKG_HPP
