//! # MERGE Implementation

#include "build/merge.hpp"

#include "log/log.hpp"
#include "util/fs_utils.hpp"

#include <filesystem>

namespace frost::build {

namespace fs = std::filesystem;

std::string relative_reference(const std::string& from, const std::string& to) {
    std::string result;
    size_t start = 0;
    while (true) {
        size_t slash = from.find('/', start);
        if (slash == std::string::npos) {
            break;
        }
        result += "../";
        start = slash + 1;
    }
    return result + to;
}

namespace {

std::string absolute_source(const std::string& path) {
    return fs::absolute(path).lexically_normal().generic_string();
}

std::string script_path(const BuildGraph& graph) {
    return absolute_source(graph.scripts.entries().back().path);
}

/// Hands every entry of `toc` to its first owner; returns the survivors.
toc::Toc claim_entries(const toc::Toc& toc, const std::string& path, BuildGraph& graph,
                       MergeReport& report) {
    toc::Toc kept;
    for (const auto& entry : toc) {
        auto [it, inserted] =
            report.owners.emplace(absolute_source(entry.path), MergeOwner{path, entry.name});
        if (inserted) {
            FROST_LOG_DEBUG("merge", "Adding dependency " << entry.path << " located in " << path);
            kept.append(entry);
            continue;
        }
        std::string ref = relative_reference(path, it->second.path) + ":" + it->second.name;
        FROST_LOG_DEBUG("merge", "Referencing " << entry.path << " from " << path << " as "
                                                << ref);
        graph.dependencies.append(ref, entry.path, toc::TocKind::Dependency);
        ++report.references;
    }
    return kept;
}

} // namespace

BuildResult<MergeReport> merge_graphs(std::vector<BuildGraph>& graphs) {
    MergeReport report;
    if (graphs.empty()) {
        return report;
    }

    std::map<std::string, std::string> id_to_path;
    std::vector<std::string> scripts;
    for (const auto& graph : graphs) {
        if (graph.scripts.empty()) {
            return BuildError::make(BuildErrorKind::InvalidInput,
                                    "graph " + graph.id + " has no script to merge on");
        }
        id_to_path[graph.id] = graph.output_path;
        scripts.push_back(script_path(graph));
    }

    std::string prefix = util::common_prefix(scripts);
    size_t slash = prefix.rfind('/');
    prefix = slash == std::string::npos ? std::string() : prefix.substr(0, slash);
    if (prefix.empty() || prefix.back() != '/') {
        prefix += '/';
    }
    report.common_prefix = prefix;
    FROST_LOG_INFO("merge", "Common prefix: " << prefix);

    for (size_t i = 0; i < graphs.size(); ++i) {
        auto& graph = graphs[i];
        std::string key = scripts[i];
        if (key.compare(0, prefix.size(), prefix) == 0) {
            key.erase(0, prefix.size());
        }
        std::string stem = fs::path(key).replace_extension().generic_string();
        auto it = id_to_path.find(stem);
        std::string path = it != id_to_path.end() ? it->second : stem;

        graph.binaries = claim_entries(graph.binaries, path, graph, report);
        graph.datas = claim_entries(graph.datas, path, graph, report);
    }

    FROST_LOG_INFO("merge", "Merged " << graphs.size() << " graphs, " << report.references
                                      << " shared entries referenced");
    return report;
}

} // namespace frost::build
