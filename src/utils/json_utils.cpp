#include "utils/json_utils.hpp"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace clinscribe {
namespace utils {

namespace {
// Deeply nested input is rejected rather than overflowing the stack
const int kMaxDepth = 64;
}

const JsonValue JsonValue::null_value_;

JsonValue JsonValue::makeObject() {
    JsonValue value;
    value.setObject();
    return value;
}

JsonValue JsonValue::makeArray() {
    JsonValue value;
    value.setArray();
    return value;
}

JsonValue JsonValue::fromStrings(const std::vector<std::string>& values) {
    JsonValue arr = makeArray();
    for (const auto& v : values) {
        arr.addArrayElement(JsonValue(v));
    }
    return arr;
}

std::vector<std::string> JsonValue::asStringList() const {
    std::vector<std::string> result;
    if (type_ == JsonType::STRING) {
        result.push_back(string_value_);
        return result;
    }
    for (const auto& element : array_value_) {
        if (element.isString()) {
            result.push_back(element.asString());
        }
    }
    return result;
}

const JsonValue& JsonValue::getProperty(const std::string& key) const {
    auto it = object_value_.find(key);
    return (it != object_value_.end()) ? it->second : null_value_;
}

std::string JsonValue::getString(const std::string& key, const std::string& fallback) const {
    const JsonValue& v = getProperty(key);
    return v.isString() ? v.asString() : fallback;
}

double JsonValue::getNumber(const std::string& key, double fallback) const {
    const JsonValue& v = getProperty(key);
    return v.isNumber() ? v.asNumber() : fallback;
}

bool JsonValue::getBool(const std::string& key, bool fallback) const {
    const JsonValue& v = getProperty(key);
    return v.isBool() ? v.asBool() : fallback;
}

JsonValue JsonParser::parse(const std::string& json) {
    size_t pos = 0;
    skipWhitespace(json, pos);
    JsonValue value = parseValue(json, pos, 0);
    skipWhitespace(json, pos);
    if (pos != json.length()) {
        throw parseError("Trailing characters after JSON value", pos);
    }
    return value;
}

JsonValue JsonParser::parseFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open JSON file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

std::string JsonParser::stringify(const JsonValue& value, int indent) {
    std::string out;
    stringifyValue(value, indent < 0 ? 0 : indent, 0, out);
    return out;
}

std::runtime_error JsonParser::parseError(const std::string& message, size_t pos) {
    return std::runtime_error(message + " at offset " + std::to_string(pos));
}

JsonValue JsonParser::parseValue(const std::string& json, size_t& pos, int depth) {
    skipWhitespace(json, pos);

    if (pos >= json.length()) {
        throw parseError("Unexpected end of JSON", pos);
    }
    if (depth > kMaxDepth) {
        throw parseError("JSON nesting too deep", pos);
    }

    char c = json[pos];

    if (c == '{') {
        return parseObject(json, pos, depth + 1);
    } else if (c == '[') {
        return parseArray(json, pos, depth + 1);
    } else if (c == '"') {
        return parseString(json, pos);
    } else if (c == 't' || c == 'f' || c == 'n') {
        return parseLiteral(json, pos);
    } else if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
        return parseNumber(json, pos);
    }
    throw parseError("Unexpected character '" + std::string(1, c) + "'", pos);
}

JsonValue JsonParser::parseObject(const std::string& json, size_t& pos, int depth) {
    JsonValue obj = JsonValue::makeObject();

    pos++; // '{'
    skipWhitespace(json, pos);

    if (pos < json.length() && json[pos] == '}') {
        pos++;
        return obj;
    }

    while (pos < json.length()) {
        skipWhitespace(json, pos);

        if (pos >= json.length() || json[pos] != '"') {
            throw parseError("Expected string key in object", pos);
        }

        JsonValue key = parseString(json, pos);
        skipWhitespace(json, pos);

        if (pos >= json.length() || json[pos] != ':') {
            throw parseError("Expected ':' after object key", pos);
        }
        pos++;

        obj.setObjectProperty(key.asString(), parseValue(json, pos, depth));

        skipWhitespace(json, pos);

        if (pos >= json.length()) {
            break;
        }
        if (json[pos] == '}') {
            pos++;
            return obj;
        } else if (json[pos] == ',') {
            pos++;
        } else {
            throw parseError("Expected ',' or '}' in object", pos);
        }
    }

    throw parseError("Unexpected end of JSON in object", pos);
}

JsonValue JsonParser::parseArray(const std::string& json, size_t& pos, int depth) {
    JsonValue arr = JsonValue::makeArray();

    pos++; // '['
    skipWhitespace(json, pos);

    if (pos < json.length() && json[pos] == ']') {
        pos++;
        return arr;
    }

    while (pos < json.length()) {
        arr.addArrayElement(parseValue(json, pos, depth));

        skipWhitespace(json, pos);

        if (pos >= json.length()) {
            break;
        }
        if (json[pos] == ']') {
            pos++;
            return arr;
        } else if (json[pos] == ',') {
            pos++;
        } else {
            throw parseError("Expected ',' or ']' in array", pos);
        }
    }

    throw parseError("Unexpected end of JSON in array", pos);
}

JsonValue JsonParser::parseString(const std::string& json, size_t& pos) {
    pos++; // opening '"'
    std::string result;

    while (pos < json.length()) {
        char c = json[pos];

        if (c == '"') {
            pos++;
            return JsonValue(result);
        }

        if (c == '\\') {
            pos++;
            if (pos >= json.length()) {
                break;
            }

            char escaped = json[pos];
            switch (escaped) {
                case '"': result += '"'; break;
                case '\\': result += '\\'; break;
                case '/': result += '/'; break;
                case 'b': result += '\b'; break;
                case 'f': result += '\f'; break;
                case 'n': result += '\n'; break;
                case 'r': result += '\r'; break;
                case 't': result += '\t'; break;
                case 'u': {
                    if (pos + 4 >= json.length()) {
                        throw parseError("Truncated \\u escape", pos);
                    }
                    unsigned int code_point = 0;
                    for (int i = 1; i <= 4; ++i) {
                        char h = json[pos + i];
                        if (!std::isxdigit(static_cast<unsigned char>(h))) {
                            throw parseError("Invalid \\u escape", pos);
                        }
                        code_point = code_point * 16 +
                            static_cast<unsigned int>(std::isdigit(static_cast<unsigned char>(h))
                                ? h - '0'
                                : std::tolower(static_cast<unsigned char>(h)) - 'a' + 10);
                    }
                    appendUtf8(result, code_point);
                    pos += 4;
                    break;
                }
                default:
                    throw parseError("Invalid escape sequence \\" + std::string(1, escaped), pos);
            }
        } else {
            result += c;
        }

        pos++;
    }

    throw parseError("Unterminated string", pos);
}

void JsonParser::appendUtf8(std::string& out, unsigned int code_point) {
    if (code_point < 0x80) {
        out += static_cast<char>(code_point);
    } else if (code_point < 0x800) {
        out += static_cast<char>(0xC0 | (code_point >> 6));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else {
        out += static_cast<char>(0xE0 | (code_point >> 12));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    }
}

JsonValue JsonParser::parseNumber(const std::string& json, size_t& pos) {
    size_t start = pos;
    auto isDigitAt = [&json](size_t p) {
        return p < json.length() && std::isdigit(static_cast<unsigned char>(json[p]));
    };

    if (json[pos] == '-') {
        pos++;
    }
    if (!isDigitAt(pos)) {
        throw parseError("Invalid number format", pos);
    }

    if (json[pos] == '0') {
        pos++;
    } else {
        while (isDigitAt(pos)) pos++;
    }

    if (pos < json.length() && json[pos] == '.') {
        pos++;
        if (!isDigitAt(pos)) {
            throw parseError("Invalid number format", pos);
        }
        while (isDigitAt(pos)) pos++;
    }

    if (pos < json.length() && (json[pos] == 'e' || json[pos] == 'E')) {
        pos++;
        if (pos < json.length() && (json[pos] == '+' || json[pos] == '-')) {
            pos++;
        }
        if (!isDigitAt(pos)) {
            throw parseError("Invalid number format", pos);
        }
        while (isDigitAt(pos)) pos++;
    }

    return JsonValue(std::stod(json.substr(start, pos - start)));
}

JsonValue JsonParser::parseLiteral(const std::string& json, size_t& pos) {
    if (json.compare(pos, 4, "true") == 0) {
        pos += 4;
        return JsonValue(true);
    } else if (json.compare(pos, 5, "false") == 0) {
        pos += 5;
        return JsonValue(false);
    } else if (json.compare(pos, 4, "null") == 0) {
        pos += 4;
        return JsonValue();
    }
    throw parseError("Invalid literal", pos);
}

void JsonParser::skipWhitespace(const std::string& json, size_t& pos) {
    while (pos < json.length() && std::isspace(static_cast<unsigned char>(json[pos]))) {
        pos++;
    }
}

std::string JsonParser::formatNumber(double value) {
    if (!std::isfinite(value)) {
        return "null";
    }
    if (value == std::floor(value) && std::fabs(value) < 1e15) {
        return std::to_string(static_cast<long long>(value));
    }
    std::ostringstream oss;
    oss << std::setprecision(12) << value;
    return oss.str();
}

void JsonParser::stringifyValue(const JsonValue& value, int indent, int level, std::string& out) {
    const bool pretty = indent > 0;
    auto newline = [&](int lvl) {
        if (pretty) {
            out += '\n';
            out.append(static_cast<size_t>(indent * lvl), ' ');
        }
    };

    switch (value.getType()) {
        case JsonType::NULL_VALUE:
            out += "null";
            return;
        case JsonType::BOOLEAN:
            out += value.asBool() ? "true" : "false";
            return;
        case JsonType::NUMBER:
            out += formatNumber(value.asNumber());
            return;
        case JsonType::STRING:
            out += "\"" + escapeString(value.asString()) + "\"";
            return;
        case JsonType::ARRAY: {
            const auto& arr = value.asArray();
            out += "[";
            for (size_t i = 0; i < arr.size(); ++i) {
                if (i > 0) out += ",";
                newline(level + 1);
                stringifyValue(arr[i], indent, level + 1, out);
            }
            if (!arr.empty()) newline(level);
            out += "]";
            return;
        }
        case JsonType::OBJECT: {
            const auto& obj = value.asObject();
            out += "{";
            bool first = true;
            for (const auto& pair : obj) {
                if (!first) out += ",";
                newline(level + 1);
                out += "\"" + escapeString(pair.first) + "\":";
                if (pretty) out += " ";
                stringifyValue(pair.second, indent, level + 1, out);
                first = false;
            }
            if (!obj.empty()) newline(level);
            out += "}";
            return;
        }
    }
    out += "null";
}

std::string JsonParser::escapeString(const std::string& str) {
    std::string result;
    result.reserve(str.size());
    for (char c : str) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    result += buf;
                } else {
                    result += c;
                }
                break;
        }
    }
    return result;
}

} // namespace utils
} // namespace clinscribe
