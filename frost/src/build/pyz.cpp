//! # PYZ Target Implementation

#include "build/pyz.hpp"

#include "archive/codec.hpp"
#include "archive/pyz_archive.hpp"
#include "log/log.hpp"
#include "util/fs_utils.hpp"

namespace frost::build {

namespace {

std::string quote_literal(const std::string& text) {
    std::string out = "'";
    for (char c : text) {
        if (c == '\\' || c == '\'') {
            out += '\\';
        }
        out += c;
    }
    return out + "'";
}

fs::path default_pyz_path(const fs::path& guts_path) {
    fs::path p = guts_path;
    return p.replace_extension(".pyz");
}

} // namespace

PyzTarget::PyzTarget(target::BuildContext& ctx, toc::Toc toc, CodeMap code, PyzOptions options)
    : Target(ctx, "PYZ", fs::path()), toc_(std::move(toc)), code_(std::move(code)),
      options_(std::move(options)) {
    artifact_ = options_.name.empty() ? default_pyz_path(guts_path_)
                                      : ctx.config().workpath / options_.name;
}

BuildResult<Rc<PyzTarget>> PyzTarget::create(target::BuildContext& ctx,
                                             const std::vector<target::BuildInput>& inputs,
                                             CodeMap code, PyzOptions options) {
    auto pyz = make_rc<PyzTarget>(ctx, target::resolve_inputs(inputs), std::move(code),
                                  std::move(options));

    if (pyz->options_.cipher_key) {
        // The key travels as a one-line module the runtime imports first
        auto key = archive::normalize_key(*pyz->options_.cipher_key);
        fs::path key_file = ctx.config().workpath / (std::string(CRYPTO_KEY_MODULE) + ".py");
        auto written = util::write_file(key_file, "key = " + quote_literal(key) + "\n");
        if (is_err(written)) {
            return unwrap_err(written);
        }
        pyz->dependencies_.append(CRYPTO_KEY_MODULE, key_file.string(), toc::TocKind::Module);
    }
    pyz->dependencies_.extend(ctx.config().bootstrap);

    return pyz;
}

target::GutsSchema PyzTarget::guts_schema() const {
    return {
        {"name", target::GutsCheck::Eq},
        {"compression_level", target::GutsCheck::Eq},
        {"cipher", target::GutsCheck::Eq},
        {"toc", target::GutsCheck::TocSet},
    };
}

std::vector<json::JsonValue> PyzTarget::guts_values() const {
    std::vector<json::JsonValue> values;
    values.emplace_back(artifact_.string());
    values.emplace_back(archive::COMPRESSION_LEVEL);
    values.emplace_back(options_.cipher_key.has_value());
    values.push_back(toc_.to_json());
    return values;
}

BuildResult<fs::path> PyzTarget::assemble() {
    FROST_LOG_INFO("pyz", "Building PYZ " << artifact_.filename().string());

    archive::PyzWriter writer(ctx_.config().runtime_magic, options_.cipher_key);
    for (const auto& entry : toc_) {
        if (ctx_.config().bootstrap.contains(entry.name) || entry.name == CRYPTO_KEY_MODULE) {
            FROST_LOG_DEBUG("pyz", "Leaving bootstrap module " << entry.name << " to the package");
            continue;
        }

        auto it = code_.find(entry.name);
        if (it == code_.end()) {
            return BuildError::make(BuildErrorKind::MissingCode,
                                    "no compiled code for module " + entry.name);
        }
        bool is_package = fs::path(entry.path).stem() == "__init__";
        auto added = writer.add(entry.name, it->second, is_package);
        if (is_err(added)) {
            return unwrap_err(added);
        }
    }

    auto written = writer.write(artifact_);
    if (is_ok(written)) {
        FROST_LOG_INFO("pyz", "Wrote " << writer.size() << " modules to "
                                       << artifact_.filename().string());
    }
    return written;
}

} // namespace frost::build
