//! # JSON Parser
//!
//! Recursive descent parser producing a `JsonValue` tree, plus the error
//! type carrying the location of the first problem.
//!
//! ```cpp
//! auto result = parse_json(text);
//! if (is_err(result)) {
//!     FROST_LOG_WARN("guts", unwrap_err(result).to_string());
//! }
//! ```

#pragma once

#include "common.hpp"
#include "json/json_value.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace frost::json {

/// A parse error with 1-based line/column (0 when unknown).
struct JsonError {
    std::string message;
    size_t line = 0;
    size_t column = 0;

    static auto make(std::string msg, size_t line = 0, size_t column = 0) -> JsonError {
        return JsonError{std::move(msg), line, column};
    }

    /// "message at line L, column C", or just the message.
    [[nodiscard]] auto to_string() const -> std::string;
};

/// Parser over a complete input buffer.
class JsonParser {
public:
    explicit JsonParser(std::string_view input);

    [[nodiscard]] auto parse() -> Result<JsonValue, JsonError>;

private:
    std::string_view input_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;
    size_t depth_ = 0;
    static constexpr size_t MAX_DEPTH = 512;

    [[nodiscard]] auto peek(size_t ahead = 0) const -> char;
    auto advance() -> char;
    /// Consumes four hex digits of a `\u` escape.
    auto read_hex4() -> std::optional<unsigned int>;
    void skip_whitespace();
    [[nodiscard]] auto error(const std::string& msg) const -> JsonError;

    auto parse_value() -> Result<JsonValue, JsonError>;
    auto parse_object() -> Result<JsonValue, JsonError>;
    auto parse_array() -> Result<JsonValue, JsonError>;
    auto parse_string() -> Result<std::string, JsonError>;
    auto parse_number() -> Result<JsonValue, JsonError>;
    auto parse_keyword() -> Result<JsonValue, JsonError>;
};

/// Parses a complete JSON document.
[[nodiscard]] auto parse_json(std::string_view input) -> Result<JsonValue, JsonError>;

/// Reads and parses a JSON file.
[[nodiscard]] auto parse_json_file(const std::filesystem::path& path)
    -> Result<JsonValue, JsonError>;

} // namespace frost::json
