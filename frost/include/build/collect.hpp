//! # COLLECT Target
//!
//! Materializes a one-directory distribution under `distpath/<name>`: every
//! entry of its TOC is copied to its logical path. The directory is wiped
//! and rebuilt on every run.

#ifndef FROST_BUILD_COLLECT_HPP
#define FROST_BUILD_COLLECT_HPP

#include "target/target.hpp"

namespace frost::build {

struct CollectOptions {
    std::string name;
    bool strip_binaries = false;
    bool upx_binaries = false;
};

class CollectTarget final : public target::Target {
public:
    CollectTarget(target::BuildContext& ctx, const std::vector<target::BuildInput>& inputs,
                  CollectOptions options);

    [[nodiscard]] const char* kind() const override {
        return "COLLECT";
    }

    [[nodiscard]] toc::TocKind artifact_kind() const override {
        return toc::TocKind::Data;
    }

    [[nodiscard]] target::GutsSchema guts_schema() const override;
    [[nodiscard]] std::vector<json::JsonValue> guts_values() const override;

    BuildResult<fs::path> assemble() override;

    [[nodiscard]] const toc::Toc& toc() const {
        return toc_;
    }

protected:
    [[nodiscard]] bool always_stale() const override {
        return true;
    }

private:
    toc::Toc toc_;
    CollectOptions options_;
};

} // namespace frost::build

#endif // FROST_BUILD_COLLECT_HPP
