//! # CLI Driver Implementation
//!
//! Turns a JSON build description into targets and runs them in order.

#include "cli/driver.hpp"

#include "archive/carchive.hpp"
#include "archive/pyz_archive.hpp"
#include "build/collect.hpp"
#include "build/exe.hpp"
#include "build/merge.hpp"
#include "build/pkg.hpp"
#include "build/pyz.hpp"
#include "config/build_config.hpp"
#include "json/json_parser.hpp"
#include "log/log.hpp"
#include "target/target.hpp"
#include "util/fs_utils.hpp"

#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>

namespace frost::cli {

namespace {

BuildError invalid(const std::string& message) {
    return BuildError::make(BuildErrorKind::InvalidInput, message);
}

// ============================================================================
// Option reading
// ============================================================================

/// Reads typed options from one JSON object, remembering the first type error.
class OptionReader {
public:
    OptionReader(const json::JsonValue& object, std::string where)
        : object_(object), where_(std::move(where)) {}

    bool flag(const std::string& key, bool fallback) {
        const auto* value = object_.get(key);
        if (!value) {
            return fallback;
        }
        if (!value->is_bool()) {
            fail(key, "a boolean");
            return fallback;
        }
        return value->as_bool();
    }

    std::string text(const std::string& key, std::string fallback = {}) {
        const auto* value = object_.get(key);
        if (!value || value->is_null()) {
            return fallback;
        }
        if (!value->is_string()) {
            fail(key, "a string");
            return fallback;
        }
        return value->as_string();
    }

    std::vector<std::string> texts(const std::string& key) {
        std::vector<std::string> result;
        const auto* value = object_.get(key);
        if (!value) {
            return result;
        }
        if (!value->is_array()) {
            fail(key, "an array of strings");
            return result;
        }
        for (const auto& item : value->as_array()) {
            if (!item.is_string()) {
                fail(key, "an array of strings");
                return {};
            }
            result.push_back(item.as_string());
        }
        return result;
    }

    [[nodiscard]] const std::optional<std::string>& error() const {
        return error_;
    }

private:
    void fail(const std::string& key, const char* expected) {
        if (!error_) {
            error_ = where_ + ": '" + key + "' must be " + expected;
        }
    }

    const json::JsonValue& object_;
    std::string where_;
    std::optional<std::string> error_;
};

BuildResult<build::CompressionPolicy> read_cdict(const json::JsonValue& object,
                                                 const std::string& where) {
    build::CompressionPolicy policy = build::default_compression();
    const auto* cdict = object.get("cdict");
    if (!cdict) {
        return policy;
    }
    if (!cdict->is_object()) {
        return invalid(where + ": 'cdict' must be an object");
    }
    for (const auto& [name, value] : cdict->as_object()) {
        auto kind = toc::parse_kind(name);
        if (!kind || !value.is_bool()) {
            return invalid(where + ": bad cdict entry " + name);
        }
        policy[*kind] = value.as_bool();
    }
    return policy;
}

// ============================================================================
// Build description state
// ============================================================================

/// Everything targets can be built from while a description is loaded.
struct DescriptionState {
    fs::path base_dir;
    std::vector<build::BuildGraph> graphs;
    std::map<std::string, Rc<target::Target>> targets_by_id;
    std::vector<Rc<target::Target>> targets;
};

/// Resolves relative source paths against the description directory.
toc::Toc anchor_paths(const toc::Toc& toc, const fs::path& base_dir) {
    toc::Toc result;
    for (const auto& entry : toc) {
        if (entry.kind == toc::TocKind::Option || entry.path.empty() ||
            fs::path(entry.path).is_absolute()) {
            result.append(entry);
            continue;
        }
        result.append(entry.name, (base_dir / entry.path).lexically_normal().string(),
                      entry.kind);
    }
    return result;
}

BuildResult<toc::Toc> read_toc(const json::JsonValue& value, const fs::path& base_dir,
                               const std::string& where) {
    auto toc = toc::Toc::from_json(value);
    if (is_err(toc)) {
        return invalid(where + ": " + unwrap_err(toc));
    }
    return anchor_paths(unwrap(toc), base_dir);
}

/// Manifest named "<graph id>.<field>", or nullptr.
const toc::Toc* graph_manifest(const DescriptionState& state, const std::string& ref) {
    size_t dot = ref.rfind('.');
    if (dot == std::string::npos) {
        return nullptr;
    }
    std::string id = ref.substr(0, dot);
    std::string field = ref.substr(dot + 1);
    for (const auto& graph : state.graphs) {
        if (graph.id != id) {
            continue;
        }
        if (field == "scripts")
            return &graph.scripts;
        if (field == "pure")
            return &graph.pure;
        if (field == "binaries")
            return &graph.binaries;
        if (field == "datas")
            return &graph.datas;
        if (field == "dependencies")
            return &graph.dependencies;
    }
    return nullptr;
}

BuildResult<std::vector<target::BuildInput>> read_inputs(const json::JsonValue& spec,
                                                         const DescriptionState& state,
                                                         const std::string& where) {
    std::vector<target::BuildInput> inputs;
    const auto* list = spec.get("inputs");
    if (!list) {
        return inputs;
    }
    if (!list->is_array()) {
        return invalid(where + ": 'inputs' must be an array");
    }

    for (const auto& item : list->as_array()) {
        if (item.is_array()) {
            auto toc = read_toc(item, state.base_dir, where);
            if (is_err(toc)) {
                return unwrap_err(toc);
            }
            inputs.emplace_back(std::move(unwrap(toc)));
            continue;
        }
        if (!item.is_string()) {
            return invalid(where + ": an input must be a target id, a graph manifest or a TOC");
        }
        const std::string& ref = item.as_string();
        if (auto it = state.targets_by_id.find(ref); it != state.targets_by_id.end()) {
            inputs.emplace_back(it->second);
        } else if (const auto* manifest = graph_manifest(state, ref)) {
            inputs.emplace_back(*manifest);
        } else {
            return invalid(where + ": unknown input " + ref);
        }
    }
    return inputs;
}

// ============================================================================
// Graphs and MERGE
// ============================================================================

BuildResult<size_t> load_graphs(const json::JsonValue& description, DescriptionState& state) {
    const auto* graphs = description.get("graphs");
    if (!graphs) {
        return size_t{0};
    }
    if (!graphs->is_array()) {
        return invalid("'graphs' must be an array");
    }

    for (const auto& spec : graphs->as_array()) {
        OptionReader options(spec, "graph");
        build::BuildGraph graph;
        graph.id = options.text("id");
        graph.output_path = options.text("output_path", graph.id);
        if (options.error()) {
            return invalid(*options.error());
        }
        if (graph.id.empty()) {
            return invalid("every graph needs an id");
        }

        std::string where = "graph " + graph.id;
        for (auto [key, manifest] : {std::pair{"scripts", &graph.scripts},
                                     std::pair{"pure", &graph.pure},
                                     std::pair{"binaries", &graph.binaries},
                                     std::pair{"datas", &graph.datas},
                                     std::pair{"dependencies", &graph.dependencies}}) {
            const auto* value = spec.get(key);
            if (!value) {
                continue;
            }
            auto toc = read_toc(*value, state.base_dir, where + " " + key);
            if (is_err(toc)) {
                return unwrap_err(toc);
            }
            *manifest = std::move(unwrap(toc));
        }
        state.graphs.push_back(std::move(graph));
    }
    return state.graphs.size();
}

// ============================================================================
// Target construction
// ============================================================================

BuildResult<Rc<target::Target>> make_pyz(target::BuildContext& ctx, const json::JsonValue& spec,
                                         std::vector<target::BuildInput> inputs,
                                         const fs::path& base_dir, const std::string& where) {
    OptionReader options(spec, where);
    build::PyzOptions pyz;
    pyz.name = options.text("name");
    std::string cipher = options.text("cipher");
    if (options.error()) {
        return invalid(*options.error());
    }
    if (!cipher.empty()) {
        pyz.cipher_key = cipher;
    }

    build::CodeMap code;
    if (const auto* files = spec.get("code")) {
        if (!files->is_object()) {
            return invalid(where + ": 'code' must map module names to compiled files");
        }
        for (const auto& [module, file] : files->as_object()) {
            if (!file.is_string()) {
                return invalid(where + ": compiled file of " + module + " must be a string");
            }
            auto bytes = util::read_file(base_dir / file.as_string());
            if (is_err(bytes)) {
                return unwrap_err(bytes);
            }
            code.emplace(module, std::move(unwrap(bytes)));
        }
    }

    auto pyz_target = build::PyzTarget::create(ctx, inputs, std::move(code), std::move(pyz));
    if (is_err(pyz_target)) {
        return unwrap_err(pyz_target);
    }
    return Rc<target::Target>(unwrap(pyz_target));
}

BuildResult<Rc<target::Target>> make_pkg(target::BuildContext& ctx, const json::JsonValue& spec,
                                         std::vector<target::BuildInput> inputs,
                                         const std::string& where) {
    OptionReader options(spec, where);
    build::PkgOptions pkg;
    pkg.exclude_binaries = options.flag("exclude_binaries", false);
    pkg.strip_binaries = options.flag("strip", false);
    pkg.upx_binaries = options.flag("upx", false);
    std::string name = options.text("name");
    if (options.error()) {
        return invalid(*options.error());
    }
    auto cdict = read_cdict(spec, where);
    if (is_err(cdict)) {
        return unwrap_err(cdict);
    }
    pkg.cdict = std::move(unwrap(cdict));

    fs::path artifact;
    if (!name.empty()) {
        artifact = fs::path(name).is_absolute() ? fs::path(name) : ctx.config().workpath / name;
    }
    return Rc<target::Target>(make_rc<build::PkgTarget>(ctx, inputs, artifact, std::move(pkg)));
}

BuildResult<Rc<target::Target>> make_exe(target::BuildContext& ctx, const json::JsonValue& spec,
                                         std::vector<target::BuildInput> inputs,
                                         const fs::path& base_dir, const std::string& where,
                                         build::ExeKind kind) {
    OptionReader options(spec, where);
    build::ExeOptions exe;
    exe.kind = kind;
    exe.name = options.text("name");
    exe.console = options.flag("console", true);
    exe.debug = options.flag("debug", false);
    exe.strip = options.flag("strip", false);
    exe.upx = options.flag("upx", false);
    exe.exclude_binaries = options.flag("exclude_binaries", false);
    exe.append_pkg = options.flag("append_pkg", true);
    exe.icon = options.text("icon");
    exe.versrsrc = options.text("version");
    exe.resources = options.texts("resources");
    exe.uac_admin = options.flag("uac_admin", false);
    exe.uac_uiaccess = options.flag("uac_uiaccess", false);
    if (options.error()) {
        return invalid(*options.error());
    }
    auto cdict = read_cdict(spec, where);
    if (is_err(cdict)) {
        return unwrap_err(cdict);
    }
    exe.cdict = std::move(unwrap(cdict));

    if (!exe.icon.empty() && fs::path(exe.icon).is_relative()) {
        exe.icon = (base_dir / exe.icon).string();
    }
    if (!exe.versrsrc.empty() && fs::path(exe.versrsrc).is_relative()) {
        exe.versrsrc = (base_dir / exe.versrsrc).string();
    }

    auto exe_target = build::ExeTarget::create(ctx, inputs, std::move(exe));
    if (is_err(exe_target)) {
        return unwrap_err(exe_target);
    }
    return Rc<target::Target>(unwrap(exe_target));
}

BuildResult<Rc<target::Target>> make_collect(target::BuildContext& ctx,
                                             const json::JsonValue& spec,
                                             std::vector<target::BuildInput> inputs,
                                             const std::string& where) {
    OptionReader options(spec, where);
    build::CollectOptions collect;
    collect.name = options.text("name");
    collect.strip_binaries = options.flag("strip", false);
    collect.upx_binaries = options.flag("upx", false);
    if (options.error()) {
        return invalid(*options.error());
    }
    if (collect.name.empty()) {
        return invalid(where + ": COLLECT needs a name");
    }
    return Rc<target::Target>(make_rc<build::CollectTarget>(ctx, inputs, std::move(collect)));
}

BuildResult<Rc<target::Target>> make_target(target::BuildContext& ctx, const json::JsonValue& spec,
                                            const DescriptionState& state, size_t index) {
    if (!spec.is_object()) {
        return invalid("target " + std::to_string(index) + " is not an object");
    }
    OptionReader options(spec, "target " + std::to_string(index));
    std::string type = options.text("type");
    std::string id = options.text("id");
    if (options.error()) {
        return invalid(*options.error());
    }
    std::string where = type + " " + (id.empty() ? std::to_string(index) : id);

    auto inputs = read_inputs(spec, state, where);
    if (is_err(inputs)) {
        return unwrap_err(inputs);
    }
    auto& resolved = unwrap(inputs);

    if (type == "PYZ")
        return make_pyz(ctx, spec, std::move(resolved), state.base_dir, where);
    if (type == "PKG")
        return make_pkg(ctx, spec, std::move(resolved), where);
    if (type == "EXE")
        return make_exe(ctx, spec, std::move(resolved), state.base_dir, where, build::ExeKind::Exe);
    if (type == "DLL")
        return make_exe(ctx, spec, std::move(resolved), state.base_dir, where, build::ExeKind::Dll);
    if (type == "COLLECT")
        return make_collect(ctx, spec, std::move(resolved), where);
    return invalid(where + ": unknown target type '" + type + "'");
}

BuildResult<config::BuildConfig> load_config(const json::JsonValue& description,
                                             const fs::path& base_dir) {
    const auto* value = description.get("config");
    if (!value) {
        return config::BuildConfig::defaults(base_dir);
    }
    auto config = value->is_string() ? config::load_build_config(base_dir / value->as_string())
                                     : config::config_from_json(*value, base_dir);
    if (is_err(config)) {
        return invalid(unwrap_err(config));
    }
    return std::move(unwrap(config));
}

} // namespace

// ============================================================================
// Build
// ============================================================================

BuildResult<BuildSummary> run_build(const json::JsonValue& description, const fs::path& base_dir) {
    if (!description.is_object()) {
        return invalid("build description must be a JSON object");
    }

    auto config = load_config(description, base_dir);
    if (is_err(config)) {
        return unwrap_err(config);
    }

    BuildSummary summary;
    DescriptionState state;
    state.base_dir = base_dir;

    auto graphs = load_graphs(description, state);
    if (is_err(graphs)) {
        return unwrap_err(graphs);
    }
    if (const auto* merge = description.get("merge"); merge && merge->is_bool() && merge->as_bool()) {
        auto report = build::merge_graphs(state.graphs);
        if (is_err(report)) {
            return unwrap_err(report);
        }
        summary.merged_references = unwrap(report).references;
    }

    const auto* specs = description.get("targets");
    if (!specs || !specs->is_array()) {
        return invalid("build description needs a 'targets' array");
    }

    target::BuildContext ctx(std::move(unwrap(config)));
    FROST_LOG_DEBUG("cli", "Work path " << ctx.config().workpath.string() << ", dist path "
                                        << ctx.config().distpath.string());

    size_t index = 0;
    for (const auto& spec : specs->as_array()) {
        auto made = make_target(ctx, spec, state, index++);
        if (is_err(made)) {
            return unwrap_err(made);
        }
        auto target = unwrap(made);
        if (const auto* id = spec.get("id"); id && id->is_string()) {
            state.targets_by_id[id->as_string()] = target;
        }
        state.targets.push_back(target);
    }

    for (const auto& target : state.targets) {
        auto built = target::run_target(*target);
        if (is_err(built)) {
            return unwrap_err(built);
        }
        summary.artifacts.push_back(unwrap(built));
    }

    summary.cache = ctx.bin_cache().stats();
    return summary;
}

BuildResult<BuildSummary> run_build_file(const fs::path& path) {
    auto parsed = json::parse_json_file(path);
    if (is_err(parsed)) {
        return invalid(path.string() + ": " + unwrap_err(parsed).to_string());
    }
    fs::path base_dir = fs::absolute(path).parent_path();
    FROST_LOG_INFO("cli", "Build description " << path.string());
    return run_build(unwrap(parsed), base_dir);
}

// ============================================================================
// Archive listing
// ============================================================================

BuildResult<std::string> list_archive(const fs::path& path) {
    std::ostringstream out;

    auto pkg = archive::CArchiveReader::open(path);
    if (is_ok(pkg)) {
        const auto& reader = unwrap(pkg);
        out << "PKG " << path.string() << " (runtime " << reader.runtime_version() << ", "
            << reader.runtime_library() << ", starts at " << reader.start_offset() << ")\n";
        out << std::setw(10) << "offset" << std::setw(10) << "stored" << std::setw(10) << "size"
            << "  c t  name\n";
        for (const auto& entry : reader.entries()) {
            out << std::setw(10) << entry.offset << std::setw(10) << entry.compressed_len
                << std::setw(10) << entry.uncompressed_len << "  "
                << static_cast<int>(entry.compression_flag) << ' ' << entry.type_code << "  "
                << entry.name << '\n';
        }
        return out.str();
    }
    FROST_LOG_DEBUG("cli", path.string() << " is not a PKG: " << unwrap_err(pkg).message);

    auto pyz = archive::PyzReader::open(path);
    if (is_err(pyz)) {
        return invalid(path.string() + " is neither a PKG nor a PYZ: " +
                       unwrap_err(pyz).message);
    }
    const auto& reader = unwrap(pyz);
    out << "PYZ " << path.string() << " (magic "
        << util::to_hex(std::string_view(reinterpret_cast<const char*>(reader.runtime_magic().data()),
                                         reader.runtime_magic().size()))
        << ")\n";
    for (const auto& entry : reader.entries()) {
        out << std::setw(10) << entry.offset << std::setw(10) << entry.length << "  "
            << (entry.is_package() ? 'p' : '-') << (entry.is_encrypted() ? 'e' : '-') << "  "
            << entry.name << '\n';
    }
    return out.str();
}

// ============================================================================
// Command line
// ============================================================================

namespace {

void print_usage() {
    std::cout << "Frost " << VERSION << " - build graph and archive assembler\n\n";
    std::cout << "Usage:\n";
    std::cout << "  frost [options] <build.json>    Run a build description\n";
    std::cout << "  frost --list <archive>          Print the directory of a PKG or PYZ\n\n";
    std::cout << "Options:\n";
    std::cout << "  -v, -vv, --verbose              More logging (debug, trace)\n";
    std::cout << "  -q, --quiet                     Only warnings and errors\n";
    std::cout << "  --log-level=<level>             trace|debug|info|warn|error|off\n";
    std::cout << "  --log-filter=<spec>             Per module levels, e.g. pkg=debug,*=warn\n";
    std::cout << "  --log-file=<path>               Also write the log to a file\n";
    std::cout << "  --log-format=<text|json>        Log record format\n";
    std::cout << "  -h, --help                      Show this help\n";
    std::cout << "  -V, --version                   Show the version\n";
}

} // namespace

int frost_main(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (!log::is_log_option(arg)) {
            args.push_back(std::move(arg));
        }
    }

    if (args.empty() || args[0] == "-h" || args[0] == "--help") {
        print_usage();
        return args.empty() ? 2 : 0;
    }
    if (args[0] == "-V" || args[0] == "--version") {
        std::cout << "frost " << VERSION << "\n";
        return 0;
    }

    log::Logger::init(log::parse_log_options(argc, argv));
    auto warnings = std::make_unique<log::MemorySink>();
    auto* warning_counter = warnings.get();
    log::Logger::instance().add_sink(std::move(warnings));

    if (args[0] == "--list") {
        if (args.size() != 2) {
            std::cerr << "Usage: frost --list <archive>\n";
            return 2;
        }
        auto listing = list_archive(args[1]);
        if (is_err(listing)) {
            FROST_LOG_ERROR("cli", unwrap_err(listing).to_string());
            return 1;
        }
        std::cout << unwrap(listing);
        return 0;
    }

    if (args.size() != 1 || args[0].starts_with("-")) {
        std::cerr << "Usage: frost [options] <build.json>\n";
        return 2;
    }

    auto result = run_build_file(args[0]);
    if (is_err(result)) {
        FROST_LOG_FATAL("cli", unwrap_err(result).to_string());
        log::Logger::instance().flush();
        return 1;
    }

    const auto& summary = unwrap(result);
    FROST_LOG_INFO("cli", "Build complete: " << summary.artifacts.size() << " targets, "
                                             << warning_counter->count_at_least(log::LogLevel::Warn)
                                             << " warnings, binary cache " << summary.cache.hits
                                             << " hits / " << summary.cache.misses << " misses");
    if (summary.merged_references > 0) {
        FROST_LOG_INFO("cli", summary.merged_references << " entries shared through MERGE");
    }
    log::Logger::instance().flush();
    return 0;
}

} // namespace frost::cli
