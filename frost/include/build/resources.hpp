//! # Executable Resources
//!
//! Resource editing of launcher stubs (icons, version information, named
//! resources and the application manifest) is delegated to a
//! `ResourceEditor`. The binary formats involved are outside Frost; the
//! assembler only decides what to apply and reports failures.

#ifndef FROST_BUILD_RESOURCES_HPP
#define FROST_BUILD_RESOURCES_HPP

#include "common.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace frost::build {

namespace fs = std::filesystem;

/// A named resource request: `file[,type[,name[,language]]]`.
/// Omitted parts are "*" (match everything in the file).
struct ResourceSpec {
    std::string file;
    std::string type = "*";
    std::string name = "*";
    std::string language = "*";
};

/// Parses a resource request string.
Result<ResourceSpec, std::string> parse_resource_spec(std::string_view spec);

/// Applies resource edits to an executable file in place.
class ResourceEditor {
public:
    virtual ~ResourceEditor() = default;

    /// Copies the icon(s) from `icon` (an .ico file, or "file,index").
    virtual BuildResult<fs::path> set_icon(const fs::path& exe, const std::string& icon) = 0;

    /// Replaces the version resource with the one described in `version_file`.
    virtual BuildResult<fs::path> set_version(const fs::path& exe,
                                              const std::string& version_file) = 0;

    virtual BuildResult<fs::path> add_resource(const fs::path& exe, const ResourceSpec& spec) = 0;

    /// Embeds `manifest` as the executable's application manifest.
    virtual BuildResult<fs::path> embed_manifest(const fs::path& exe,
                                                 const fs::path& manifest) = 0;
};

/// Editor used when no platform resource tooling is available: every edit
/// fails, so the assembler logs it and carries on.
class UnsupportedResourceEditor final : public ResourceEditor {
public:
    BuildResult<fs::path> set_icon(const fs::path& exe, const std::string& icon) override;
    BuildResult<fs::path> set_version(const fs::path& exe,
                                      const std::string& version_file) override;
    BuildResult<fs::path> add_resource(const fs::path& exe, const ResourceSpec& spec) override;
    BuildResult<fs::path> embed_manifest(const fs::path& exe, const fs::path& manifest) override;
};

/// Application manifest requesting the execution level implied by the UAC
/// flags, with the supported-OS compatibility section.
std::string create_manifest_xml(const std::string& exe_name, bool uac_admin, bool uac_uiaccess);

} // namespace frost::build

#endif // FROST_BUILD_RESOURCES_HPP
