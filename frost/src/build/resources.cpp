//! # Executable Resources Implementation

#include "build/resources.hpp"

#include <sstream>
#include <vector>

namespace frost::build {

Result<ResourceSpec, std::string> parse_resource_spec(std::string_view spec) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t comma = spec.find(',', start);
        parts.emplace_back(spec.substr(start, comma == std::string_view::npos ? std::string_view::npos
                                                                              : comma - start));
        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }

    if (parts.size() > 4) {
        return "too many fields in resource '" + std::string(spec) + "'";
    }
    if (parts[0].empty()) {
        return "resource '" + std::string(spec) + "' names no file";
    }

    ResourceSpec result;
    result.file = parts[0];
    std::string* fields[] = {&result.type, &result.name, &result.language};
    for (size_t i = 1; i < parts.size(); ++i) {
        if (!parts[i].empty()) {
            *fields[i - 1] = parts[i];
        }
    }
    return result;
}

namespace {

BuildError unsupported(const fs::path& exe, const std::string& what) {
    return BuildError::make(BuildErrorKind::Io,
                            "cannot " + what + " on " + exe.filename().string() +
                                ": resource editing is not supported on this host");
}

} // namespace

BuildResult<fs::path> UnsupportedResourceEditor::set_icon(const fs::path& exe,
                                                          const std::string& icon) {
    return unsupported(exe, "set icon " + icon);
}

BuildResult<fs::path> UnsupportedResourceEditor::set_version(const fs::path& exe,
                                                             const std::string& version_file) {
    return unsupported(exe, "set version from " + version_file);
}

BuildResult<fs::path> UnsupportedResourceEditor::add_resource(const fs::path& exe,
                                                              const ResourceSpec& spec) {
    return unsupported(exe, "add resource " + spec.file);
}

BuildResult<fs::path> UnsupportedResourceEditor::embed_manifest(const fs::path& exe,
                                                                const fs::path& manifest) {
    return unsupported(exe, "embed manifest " + manifest.filename().string());
}

std::string create_manifest_xml(const std::string& exe_name, bool uac_admin, bool uac_uiaccess) {
    const char* level = uac_admin ? "requireAdministrator" : "asInvoker";

    std::ostringstream xml;
    xml << "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
        << "<assembly xmlns=\"urn:schemas-microsoft-com:asm.v1\" manifestVersion=\"1.0\">\n"
        << "  <assemblyIdentity name=\"" << exe_name
        << "\" processorArchitecture=\"amd64\" type=\"win32\" version=\"1.0.0.0\"/>\n"
        << "  <trustInfo xmlns=\"urn:schemas-microsoft-com:asm.v3\">\n"
        << "    <security>\n"
        << "      <requestedPrivileges>\n"
        << "        <requestedExecutionLevel level=\"" << level << "\" uiAccess=\""
        << (uac_uiaccess ? "true" : "false") << "\"/>\n"
        << "      </requestedPrivileges>\n"
        << "    </security>\n"
        << "  </trustInfo>\n"
        << "  <compatibility xmlns=\"urn:schemas-microsoft-com:compatibility.v1\">\n"
        << "    <application>\n"
        << "      <supportedOS Id=\"{e2011457-1546-43c5-a5fe-008deee3d3f0}\"/>\n"
        << "      <supportedOS Id=\"{35138b9a-5d96-4fbd-8e2d-a2440225f93a}\"/>\n"
        << "      <supportedOS Id=\"{4a2f28e3-53b9-4441-ba9c-d69d4a4a6e38}\"/>\n"
        << "      <supportedOS Id=\"{1f676c76-80e1-4239-95bb-83d0f6d0da78}\"/>\n"
        << "      <supportedOS Id=\"{8e0f7a12-bfb3-4fe8-b9a5-48fd50a15a9a}\"/>\n"
        << "    </application>\n"
        << "  </compatibility>\n"
        << "</assembly>\n";
    return xml.str();
}

} // namespace frost::build
