//! # PYZ Target
//!
//! Packs the pure modules of an application into a module archive. The
//! bootstrap modules named by the configuration are kept out of the archive
//! and forwarded to the consumer as dependencies, so they end up in the
//! package archive where the launcher can reach them before any importer
//! exists.

#ifndef FROST_BUILD_PYZ_HPP
#define FROST_BUILD_PYZ_HPP

#include "target/target.hpp"

#include <optional>
#include <string>
#include <unordered_map>

namespace frost::build {

/// Compiled code by module name.
using CodeMap = std::unordered_map<std::string, std::string>;

/// Name of the synthetic module carrying the archive key.
constexpr const char* CRYPTO_KEY_MODULE = "pyimod00_crypto_key";

struct PyzOptions {
    /// Output file name; defaults to the guts file name with a .pyz suffix.
    std::string name;
    /// Enables payload encryption.
    std::optional<std::string> cipher_key;
};

class PyzTarget final : public target::Target {
public:
    /// Fails if the key module cannot be written.
    static BuildResult<Rc<PyzTarget>> create(target::BuildContext& ctx,
                                             const std::vector<target::BuildInput>& inputs,
                                             CodeMap code, PyzOptions options = {});

    [[nodiscard]] const char* kind() const override {
        return "PYZ";
    }

    [[nodiscard]] toc::TocKind artifact_kind() const override {
        return toc::TocKind::Pyz;
    }

    [[nodiscard]] target::GutsSchema guts_schema() const override;
    [[nodiscard]] std::vector<json::JsonValue> guts_values() const override;

    BuildResult<fs::path> assemble() override;

    [[nodiscard]] const toc::Toc& toc() const {
        return toc_;
    }

    PyzTarget(target::BuildContext& ctx, toc::Toc toc, CodeMap code, PyzOptions options);

private:
    toc::Toc toc_;
    CodeMap code_;
    PyzOptions options_;
};

} // namespace frost::build

#endif // FROST_BUILD_PYZ_HPP
