//! # MERGE
//!
//! Lets several executables built side by side share their binaries and
//! data files. The first graph that lists a source keeps it; every later
//! graph drops the entry and instead gets a dependency reference telling
//! the runtime where to find the owner's copy:
//!
//! ```text
//! ("<relative path to owner>:<owner logical name>", source, DEPENDENCY)
//! ```

#ifndef FROST_BUILD_MERGE_HPP
#define FROST_BUILD_MERGE_HPP

#include "common.hpp"
#include "toc/toc.hpp"

#include <map>
#include <string>
#include <vector>

namespace frost::build {

/// The manifests of one application, as produced by dependency analysis.
struct BuildGraph {
    std::string id;          ///< Identifier, matched against script keys
    std::string output_path; ///< Output path the id maps to
    toc::Toc scripts;        ///< Entry scripts; the last one names the graph
    toc::Toc pure;
    toc::Toc binaries;
    toc::Toc datas;
    toc::Toc dependencies;
};

/// Where a shared source ended up.
struct MergeOwner {
    std::string path; ///< Owner graph's output path
    std::string name; ///< Logical name in the owner graph
};

struct MergeReport {
    std::string common_prefix;
    std::map<std::string, MergeOwner> owners; ///< By source path
    size_t references = 0;                    ///< Dependency entries created
};

/// Relative path from the directory of `from` to `to`: one ".." per
/// directory component of `from`, then `to`.
std::string relative_reference(const std::string& from, const std::string& to);

/// Deduplicates binaries and datas across `graphs`, in order.
/// Fails if a graph has no script.
BuildResult<MergeReport> merge_graphs(std::vector<BuildGraph>& graphs);

} // namespace frost::build

#endif // FROST_BUILD_MERGE_HPP
