//! # JSON Parser Implementation
//!
//! Single-pass recursive descent over the input buffer. Integers without a
//! fraction or exponent are kept as `Int64`; anything that overflows falls
//! back to `Double`. Nesting is limited to MAX_DEPTH levels.

#include "json/json_parser.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace frost::json {

auto JsonError::to_string() const -> std::string {
    if (line == 0) {
        return message;
    }
    return message + " at line " + std::to_string(line) + ", column " + std::to_string(column);
}

JsonParser::JsonParser(std::string_view input) : input_(input) {}

auto JsonParser::peek(size_t ahead) const -> char {
    return pos_ + ahead < input_.size() ? input_[pos_ + ahead] : '\0';
}

auto JsonParser::advance() -> char {
    if (pos_ >= input_.size()) {
        return '\0';
    }
    char c = input_[pos_++];
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    return c;
}

auto JsonParser::read_hex4() -> std::optional<unsigned int> {
    if (pos_ + 4 > input_.size()) {
        return std::nullopt;
    }
    unsigned int unit = 0;
    const char* first = input_.data() + pos_;
    auto [ptr, ec] = std::from_chars(first, first + 4, unit, 16);
    if (ec != std::errc{} || ptr != first + 4) {
        return std::nullopt;
    }
    pos_ += 4;
    column_ += 4;
    return unit;
}

void JsonParser::skip_whitespace() {
    while (pos_ < input_.size()) {
        char c = peek();
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
            break;
        }
        advance();
    }
}

auto JsonParser::error(const std::string& msg) const -> JsonError {
    return JsonError::make(msg, line_, column_);
}

auto JsonParser::parse() -> Result<JsonValue, JsonError> {
    auto value = parse_value();
    if (is_err(value)) {
        return value;
    }
    skip_whitespace();
    if (pos_ != input_.size()) {
        return error("Trailing characters after JSON value");
    }
    return value;
}

auto JsonParser::parse_value() -> Result<JsonValue, JsonError> {
    skip_whitespace();
    char c = peek();
    switch (c) {
    case '{':
        return parse_object();
    case '[':
        return parse_array();
    case '"': {
        auto str = parse_string();
        if (is_err(str)) {
            return unwrap_err(str);
        }
        return JsonValue(std::move(unwrap(str)));
    }
    case 't':
    case 'f':
    case 'n':
        return parse_keyword();
    case '\0':
        return error("Unexpected end of input");
    default:
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
            return parse_number();
        }
        return error(std::string("Unexpected character: ") + c);
    }
}

auto JsonParser::parse_object() -> Result<JsonValue, JsonError> {
    if (++depth_ > MAX_DEPTH) {
        return error("Nesting too deep");
    }
    advance(); // '{'

    JsonObject obj;
    skip_whitespace();
    if (peek() == '}') {
        advance();
        --depth_;
        return JsonValue(std::move(obj));
    }

    while (true) {
        skip_whitespace();
        if (peek() != '"') {
            return error("Expected string key");
        }
        auto key = parse_string();
        if (is_err(key)) {
            return unwrap_err(key);
        }

        skip_whitespace();
        if (advance() != ':') {
            return error("Expected ':' after object key");
        }

        auto value = parse_value();
        if (is_err(value)) {
            return value;
        }
        obj[std::move(unwrap(key))] = std::move(unwrap(value));

        skip_whitespace();
        char c = advance();
        if (c == '}') {
            break;
        }
        if (c != ',') {
            return error("Expected ',' or '}' in object");
        }
    }

    --depth_;
    return JsonValue(std::move(obj));
}

auto JsonParser::parse_array() -> Result<JsonValue, JsonError> {
    if (++depth_ > MAX_DEPTH) {
        return error("Nesting too deep");
    }
    advance(); // '['

    JsonArray arr;
    skip_whitespace();
    if (peek() == ']') {
        advance();
        --depth_;
        return JsonValue(std::move(arr));
    }

    while (true) {
        auto value = parse_value();
        if (is_err(value)) {
            return value;
        }
        arr.push_back(std::move(unwrap(value)));

        skip_whitespace();
        char c = advance();
        if (c == ']') {
            break;
        }
        if (c != ',') {
            return error("Expected ',' or ']' in array");
        }
    }

    --depth_;
    return JsonValue(std::move(arr));
}

auto JsonParser::parse_string() -> Result<std::string, JsonError> {
    size_t start_line = line_;
    size_t start_col = column_;
    advance(); // opening quote

    std::string value;
    while (pos_ < input_.size()) {
        char c = advance();
        if (c == '"') {
            return value;
        }
        if (static_cast<unsigned char>(c) < 0x20) {
            return error("Control character in string");
        }
        if (c != '\\') {
            value += c;
            continue;
        }

        char escaped = advance();
        switch (escaped) {
        case '"':
        case '\\':
        case '/':
            value += escaped;
            break;
        case 'b':
            value += '\b';
            break;
        case 'f':
            value += '\f';
            break;
        case 'n':
            value += '\n';
            break;
        case 'r':
            value += '\r';
            break;
        case 't':
            value += '\t';
            break;
        case 'u': {
            auto unit = read_hex4();
            if (!unit) {
                return error("Invalid unicode escape sequence");
            }
            unsigned int codepoint = *unit;
            if (codepoint >= 0xDC00 && codepoint <= 0xDFFF) {
                return error("Unpaired low surrogate in unicode escape");
            }
            if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
                if (peek() != '\\' || peek(1) != 'u') {
                    return error("Unpaired high surrogate in unicode escape");
                }
                advance();
                advance();
                auto low = read_hex4();
                if (!low || *low < 0xDC00 || *low > 0xDFFF) {
                    return error("Unpaired high surrogate in unicode escape");
                }
                codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (*low - 0xDC00);
            }
            if (codepoint < 0x80) {
                value += static_cast<char>(codepoint);
            } else if (codepoint < 0x800) {
                value += static_cast<char>(0xC0 | (codepoint >> 6));
                value += static_cast<char>(0x80 | (codepoint & 0x3F));
            } else if (codepoint < 0x10000) {
                value += static_cast<char>(0xE0 | (codepoint >> 12));
                value += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
                value += static_cast<char>(0x80 | (codepoint & 0x3F));
            } else {
                value += static_cast<char>(0xF0 | (codepoint >> 18));
                value += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
                value += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
                value += static_cast<char>(0x80 | (codepoint & 0x3F));
            }
            break;
        }
        default:
            return error(std::string("Invalid escape sequence: \\") + escaped);
        }
    }

    return JsonError::make("Unterminated string", start_line, start_col);
}

auto JsonParser::parse_number() -> Result<JsonValue, JsonError> {
    size_t start = pos_;
    bool is_float = false;

    if (peek() == '-') {
        advance();
    }
    if (!std::isdigit(static_cast<unsigned char>(peek()))) {
        return error("Invalid number");
    }
    while (std::isdigit(static_cast<unsigned char>(peek()))) {
        advance();
    }
    if (peek() == '.') {
        is_float = true;
        advance();
        if (!std::isdigit(static_cast<unsigned char>(peek()))) {
            return error("Expected digit after decimal point");
        }
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            advance();
        }
    }
    if (peek() == 'e' || peek() == 'E') {
        is_float = true;
        advance();
        if (peek() == '+' || peek() == '-') {
            advance();
        }
        if (!std::isdigit(static_cast<unsigned char>(peek()))) {
            return error("Expected digit in exponent");
        }
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            advance();
        }
    }

    std::string_view text = input_.substr(start, pos_ - start);
    if (!is_float) {
        int64_t value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec == std::errc{}) {
            return JsonValue(value);
        }
    }
    return JsonValue(std::strtod(std::string(text).c_str(), nullptr));
}

auto JsonParser::parse_keyword() -> Result<JsonValue, JsonError> {
    size_t start = pos_;
    while (std::isalpha(static_cast<unsigned char>(peek()))) {
        advance();
    }
    std::string_view word = input_.substr(start, pos_ - start);
    if (word == "true") {
        return JsonValue(true);
    }
    if (word == "false") {
        return JsonValue(false);
    }
    if (word == "null") {
        return JsonValue();
    }
    return error("Unknown keyword: " + std::string(word));
}

auto parse_json(std::string_view input) -> Result<JsonValue, JsonError> {
    JsonParser parser(input);
    return parser.parse();
}

auto parse_json_file(const std::filesystem::path& path) -> Result<JsonValue, JsonError> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return JsonError::make("Cannot open " + path.string());
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return parse_json(oss.str());
}

} // namespace frost::json
