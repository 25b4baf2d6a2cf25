//! # JSON Serializer
//!
//! Compact and pretty-printed output for `JsonValue`. Integers are written
//! without a decimal point; NaN and infinities become `null`.

#include "json/json_value.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace frost::json {

namespace {

auto escape_string(const std::string& s) -> std::string {
    std::string result;
    result.reserve(s.size() + 2);

    for (char c : s) {
        switch (c) {
        case '"':
            result += "\\\"";
            break;
        case '\\':
            result += "\\\\";
            break;
        case '\b':
            result += "\\b";
            break;
        case '\f':
            result += "\\f";
            break;
        case '\n':
            result += "\\n";
            break;
        case '\r':
            result += "\\r";
            break;
        case '\t':
            result += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                std::ostringstream oss;
                oss << "\\u" << std::hex << std::setfill('0') << std::setw(4)
                    << static_cast<int>(static_cast<unsigned char>(c));
                result += oss.str();
            } else {
                result += c;
            }
            break;
        }
    }

    return result;
}

auto format_number(const JsonNumber& num) -> std::string {
    if (num.kind == JsonNumber::Kind::Int64) {
        return std::to_string(num.i64);
    }
    if (std::isnan(num.f64) || std::isinf(num.f64)) {
        return "null";
    }

    std::ostringstream oss;
    oss << std::setprecision(17) << num.f64;
    std::string result = oss.str();
    if (result.find_first_of(".eE") == std::string::npos) {
        result += ".0";
    }
    return result;
}

/// Writes `value`; `indent` == 0 selects compact output.
void serialize(const JsonValue& value, std::string& out, int indent, int depth) {
    if (value.is_null()) {
        out += "null";
    } else if (value.is_bool()) {
        out += value.as_bool() ? "true" : "false";
    } else if (value.is_number()) {
        out += format_number(value.as_number());
    } else if (value.is_string()) {
        out += '"';
        out += escape_string(value.as_string());
        out += '"';
    } else if (value.is_array() || value.is_object()) {
        const bool is_arr = value.is_array();
        const char open = is_arr ? '[' : '{';
        const char close = is_arr ? ']' : '}';
        if (value.size() == 0) {
            out += open;
            out += close;
            return;
        }

        std::string next_indent(static_cast<size_t>((depth + 1) * indent), ' ');
        out += open;
        if (indent > 0) {
            out += '\n';
        }

        size_t i = 0;
        auto emit_separator = [&]() {
            if (++i < value.size()) {
                out += ',';
            }
            if (indent > 0) {
                out += '\n';
            }
        };

        if (is_arr) {
            for (const auto& elem : value.as_array()) {
                out += next_indent;
                serialize(elem, out, indent, depth + 1);
                emit_separator();
            }
        } else {
            for (const auto& [key, val] : value.as_object()) {
                out += next_indent;
                out += '"';
                out += escape_string(key);
                out += indent > 0 ? "\": " : "\":";
                serialize(val, out, indent, depth + 1);
                emit_separator();
            }
        }

        out += std::string(static_cast<size_t>(depth * indent), ' ');
        out += close;
    }
}

} // namespace

auto JsonValue::to_string() const -> std::string {
    std::string out;
    serialize(*this, out, 0, 0);
    return out;
}

auto JsonValue::to_string_pretty(int indent) const -> std::string {
    std::string out;
    serialize(*this, out, indent, 0);
    return out;
}

} // namespace frost::json
