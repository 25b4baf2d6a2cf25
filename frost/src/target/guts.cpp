//! # Guts Records Implementation

#include "target/guts.hpp"

#include "json/json_parser.hpp"
#include "log/log.hpp"
#include "toc/toc.hpp"
#include "util/fs_utils.hpp"

namespace frost::target {

const json::JsonValue* GutsRecord::field(const GutsSchema& schema, std::string_view name) const {
    for (size_t i = 0; i < schema.size() && i < values.size(); ++i) {
        if (schema[i].name == name) {
            return &values[i];
        }
    }
    return nullptr;
}

std::optional<GutsRecord> load_guts(const fs::path& path, std::string_view kind,
                                    const GutsSchema& schema) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        FROST_LOG_DEBUG("guts", "No previous record " << path.string());
        return std::nullopt;
    }

    auto parsed = json::parse_json_file(path);
    if (is_err(parsed)) {
        FROST_LOG_DEBUG("guts", "Ignoring unreadable record " << path.string() << ": "
                                                              << unwrap_err(parsed).to_string());
        return std::nullopt;
    }
    const auto& doc = unwrap(parsed);

    const auto* format = doc.get("format");
    const auto* version = doc.get("version");
    const auto* target = doc.get("target");
    const auto* names = doc.get("schema");
    const auto* values = doc.get("values");
    if (!format || !format->is_string() || format->as_string() != GUTS_FORMAT || !version ||
        version->try_as_i64() != GUTS_VERSION || !target || !target->is_string() ||
        target->as_string() != kind || !names || !names->is_array() || !values ||
        !values->is_array()) {
        FROST_LOG_DEBUG("guts", "Ignoring foreign record " << path.string());
        return std::nullopt;
    }

    if (names->size() != schema.size() || values->size() != schema.size()) {
        FROST_LOG_DEBUG("guts", "Schema of " << path.string() << " has " << values->size()
                                             << " fields, expected " << schema.size());
        return std::nullopt;
    }
    for (size_t i = 0; i < schema.size(); ++i) {
        const auto& n = (*names)[i];
        if (!n.is_string() || n.as_string() != schema[i].name) {
            FROST_LOG_DEBUG("guts", "Schema of " << path.string() << " differs at field " << i);
            return std::nullopt;
        }
    }

    GutsRecord record;
    for (const auto& value : values->as_array()) {
        record.values.push_back(value.clone());
    }
    auto stamp = util::get_mtime(path);
    if (!stamp) {
        return std::nullopt;
    }
    record.last_build = *stamp;
    return record;
}

BuildResult<fs::path> save_guts(const fs::path& path, std::string_view kind,
                                const GutsSchema& schema,
                                const std::vector<json::JsonValue>& values) {
    auto doc = json::json_object();
    doc.set("format", json::JsonValue(GUTS_FORMAT));
    doc.set("version", json::JsonValue(GUTS_VERSION));
    doc.set("target", json::JsonValue(kind));

    auto names = json::json_array();
    for (const auto& field : schema) {
        names.push(json::JsonValue(field.name));
    }
    doc.set("schema", std::move(names));

    auto vals = json::json_array();
    for (const auto& value : values) {
        vals.push(value.clone());
    }
    doc.set("values", std::move(vals));

    return util::write_file(path, doc.to_string_pretty(2) + "\n");
}

namespace {

/// Parses a persisted TOC; a malformed one compares as different.
std::optional<toc::Toc> as_toc(const json::JsonValue& value) {
    auto parsed = toc::Toc::from_json(value);
    if (is_err(parsed)) {
        return std::nullopt;
    }
    return std::move(unwrap(parsed));
}

std::optional<std::string> newer_source(const toc::Toc& old_toc, int64_t last_build) {
    for (const auto& entry : old_toc) {
        if (entry.path.empty()) {
            continue;
        }
        auto mtime = util::get_mtime(entry.path);
        if (!mtime || *mtime > last_build) {
            return entry.path;
        }
    }
    return std::nullopt;
}

} // namespace

std::optional<std::string> compare_guts(const GutsSchema& schema, const GutsRecord& previous,
                                        const std::vector<json::JsonValue>& current) {
    if (previous.values.size() != schema.size() || current.size() != schema.size()) {
        return std::string("guts schema changed");
    }

    for (size_t i = 0; i < schema.size(); ++i) {
        const auto& field = schema[i];
        const auto& old_value = previous.values[i];
        const auto& new_value = current[i];

        switch (field.check) {
        case GutsCheck::Skip:
            break;
        case GutsCheck::Eq:
            if (old_value != new_value) {
                return field.name + " changed";
            }
            break;
        case GutsCheck::TocMtime:
        case GutsCheck::TocSet: {
            auto old_toc = as_toc(old_value);
            auto new_toc = as_toc(new_value);
            if (!old_toc || !new_toc) {
                return field.name + " is unreadable";
            }
            if (field.check == GutsCheck::TocMtime) {
                if (auto src = newer_source(*old_toc, previous.last_build)) {
                    return *src + " changed";
                }
            }
            if (!old_toc->same_members(*new_toc)) {
                return field.name + " changed";
            }
            break;
        }
        }
    }
    return std::nullopt;
}

} // namespace frost::target
