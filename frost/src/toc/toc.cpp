//! # Manifest (TOC) Implementation

#include "toc/toc.hpp"

#include "log/log.hpp"

#include <algorithm>

namespace frost::toc {

// ============================================================================
// Kinds
// ============================================================================

const char* kind_name(TocKind kind) {
    switch (kind) {
    case TocKind::Module:
        return "PYMODULE";
    case TocKind::Source:
        return "PYSOURCE";
    case TocKind::Extension:
        return "EXTENSION";
    case TocKind::Pyz:
        return "PYZ";
    case TocKind::Pkg:
        return "PKG";
    case TocKind::Data:
        return "DATA";
    case TocKind::Binary:
        return "BINARY";
    case TocKind::Zip:
        return "ZIPFILE";
    case TocKind::Executable:
        return "EXECUTABLE";
    case TocKind::Dependency:
        return "DEPENDENCY";
    case TocKind::Option:
        return "OPTION";
    }
    return "DATA";
}

std::optional<TocKind> parse_kind(std::string_view name) {
    static constexpr TocKind ALL[] = {
        TocKind::Module, TocKind::Source,     TocKind::Extension,  TocKind::Pyz,
        TocKind::Pkg,    TocKind::Data,       TocKind::Binary,     TocKind::Zip,
        TocKind::Executable, TocKind::Dependency, TocKind::Option};
    for (TocKind kind : ALL) {
        if (name == kind_name(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

char type_code(TocKind kind) {
    switch (kind) {
    case TocKind::Module:
        return 'm';
    case TocKind::Source:
        return 's';
    case TocKind::Pyz:
        return 'z';
    case TocKind::Pkg:
        return 'a';
    case TocKind::Data:
        return 'x';
    case TocKind::Zip:
        return 'Z';
    case TocKind::Dependency:
        return 'd';
    case TocKind::Option:
        return 'o';
    case TocKind::Extension:
    case TocKind::Binary:
    case TocKind::Executable:
        return 'b';
    }
    return 'b';
}

// ============================================================================
// Toc
// ============================================================================

Toc::Toc(const std::vector<TocEntry>& entries) {
    extend(entries);
}

bool Toc::append(TocEntry entry) {
    if (names_.contains(entry.name)) {
        const TocEntry* kept = find(entry.name);
        if (kept && kept->path != entry.path) {
            FROST_LOG_WARN("toc", "Duplicate name " << entry.name << ": keeping " << kept->path
                                                    << ", dropping " << entry.path);
        } else {
            FROST_LOG_TRACE("toc", "Duplicate entry " << entry.name << " ignored");
        }
        return false;
    }
    names_.insert(entry.name);
    entries_.push_back(std::move(entry));
    return true;
}

void Toc::extend(const Toc& other) {
    extend(other.entries_);
}

void Toc::extend(const std::vector<TocEntry>& entries) {
    for (const auto& entry : entries) {
        append(entry);
    }
}

Toc Toc::difference(const Toc& other) const {
    Toc result;
    for (const auto& entry : entries_) {
        const TocEntry* theirs = other.find(entry.name);
        if (!theirs || !(*theirs == entry)) {
            result.append(entry);
        }
    }
    return result;
}

Toc Toc::union_with(const Toc& other) const {
    Toc result = *this;
    for (const auto& entry : other.entries_) {
        if (!result.contains(entry.name)) {
            result.append(entry);
        }
    }
    return result;
}

bool Toc::contains(std::string_view name) const {
    return names_.contains(std::string(name));
}

const TocEntry* Toc::find(std::string_view name) const {
    if (!contains(name)) {
        return nullptr;
    }
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [name](const TocEntry& e) { return e.name == name; });
    return it == entries_.end() ? nullptr : &*it;
}

bool Toc::remove(std::string_view name) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [name](const TocEntry& e) { return e.name == name; });
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    names_.erase(std::string(name));
    return true;
}

bool Toc::same_members(const Toc& other) const {
    if (entries_.size() != other.entries_.size()) {
        return false;
    }
    for (const auto& entry : entries_) {
        const TocEntry* theirs = other.find(entry.name);
        if (!theirs || !(*theirs == entry)) {
            return false;
        }
    }
    return true;
}

json::JsonValue Toc::to_json() const {
    json::JsonArray arr;
    arr.reserve(entries_.size());
    for (const auto& entry : entries_) {
        json::JsonArray tuple;
        tuple.emplace_back(entry.name);
        tuple.emplace_back(entry.path);
        tuple.emplace_back(kind_name(entry.kind));
        arr.emplace_back(std::move(tuple));
    }
    return json::JsonValue(std::move(arr));
}

Result<Toc, std::string> Toc::from_json(const json::JsonValue& value) {
    if (!value.is_array()) {
        return std::string("TOC must be an array");
    }

    Toc result;
    size_t index = 0;
    for (const auto& item : value.as_array()) {
        if (!item.is_array() || item.size() != 3 || !item[0].is_string() ||
            !(item[1].is_string() || item[1].is_null()) || !item[2].is_string()) {
            return "TOC entry " + std::to_string(index) + " is not [name, path, KIND]";
        }
        auto kind = parse_kind(item[2].as_string());
        if (!kind) {
            return "TOC entry " + std::to_string(index) + " has unknown kind " +
                   item[2].as_string();
        }
        std::string path = item[1].is_null() ? std::string() : item[1].as_string();
        if (path.empty() && *kind != TocKind::Option) {
            return "TOC entry " + item[0].as_string() + " has no source path";
        }
        result.append(item[0].as_string(), std::move(path), *kind);
        ++index;
    }
    return result;
}

// ============================================================================
// Extension names
// ============================================================================

Toc add_suffix_to_extensions(const Toc& toc, std::string_view suffix) {
    Toc result;
    for (const auto& entry : toc) {
        if (entry.kind != TocKind::Extension || entry.name.ends_with(suffix)) {
            result.append(entry);
            continue;
        }
        std::string name = entry.name;
        std::replace(name.begin(), name.end(), '.', '/');
        name += suffix;
        result.append(std::move(name), entry.path, entry.kind);
    }
    return result;
}

} // namespace frost::toc
