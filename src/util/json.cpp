// SEMAPHORE - JSON Value Implementation
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License

#include "semaphore/util/json.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <functional>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace semaphore {
namespace util {

namespace {

const std::string EMPTY_STRING;
const JSONValue::Array EMPTY_ARRAY;
const JSONValue::Object EMPTY_OBJECT;

void AppendUtf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

void WriteEscaped(std::ostringstream& ss, const std::string& str) {
    ss << '"';
    for (char c : str) {
        switch (c) {
            case '"':  ss << "\\\""; break;
            case '\\': ss << "\\\\"; break;
            case '\b': ss << "\\b"; break;
            case '\f': ss << "\\f"; break;
            case '\n': ss << "\\n"; break;
            case '\r': ss << "\\r"; break;
            case '\t': ss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    ss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                       << static_cast<int>(c) << std::dec;
                } else {
                    ss << c;
                }
        }
    }
    ss << '"';
}

} // namespace

// ============================================================================
// Accessors
// ============================================================================

const JSONValue& JSONValue::Null() {
    static const JSONValue nullValue;
    return nullValue;
}

bool JSONValue::GetBool(bool defaultValue) const {
    return type_ == Type::Bool ? boolValue_ : defaultValue;
}

int64_t JSONValue::GetInt(int64_t defaultValue) const {
    if (type_ == Type::Int) return intValue_;
    if (type_ == Type::Double) return static_cast<int64_t>(doubleValue_);
    return defaultValue;
}

double JSONValue::GetDouble(double defaultValue) const {
    if (type_ == Type::Double) return doubleValue_;
    if (type_ == Type::Int) return static_cast<double>(intValue_);
    return defaultValue;
}

const std::string& JSONValue::GetString() const {
    return type_ == Type::String ? stringValue_ : EMPTY_STRING;
}

const JSONValue::Array& JSONValue::GetArray() const {
    return type_ == Type::Array ? arrayValue_ : EMPTY_ARRAY;
}

const JSONValue::Object& JSONValue::GetObject() const {
    return type_ == Type::Object ? objectValue_ : EMPTY_OBJECT;
}

bool JSONValue::HasKey(const std::string& key) const {
    return Find(key) != nullptr;
}

const JSONValue* JSONValue::Find(const std::string& key) const {
    if (type_ != Type::Object) {
        return nullptr;
    }
    for (const auto& member : objectValue_) {
        if (member.first == key) {
            return &member.second;
        }
    }
    return nullptr;
}

const JSONValue& JSONValue::operator[](const std::string& key) const {
    const JSONValue* value = Find(key);
    return value ? *value : Null();
}

void JSONValue::Set(const std::string& key, JSONValue value) {
    if (type_ != Type::Object) {
        type_ = Type::Object;
        objectValue_.clear();
    }
    for (auto& member : objectValue_) {
        if (member.first == key) {
            member.second = std::move(value);
            return;
        }
    }
    objectValue_.emplace_back(key, std::move(value));
}

size_t JSONValue::Size() const {
    if (type_ == Type::Array) return arrayValue_.size();
    if (type_ == Type::Object) return objectValue_.size();
    return 0;
}

const JSONValue& JSONValue::operator[](size_t index) const {
    if (type_ != Type::Array || index >= arrayValue_.size()) {
        return Null();
    }
    return arrayValue_[index];
}

void JSONValue::Push(JSONValue value) {
    if (type_ != Type::Array) {
        type_ = Type::Array;
        arrayValue_.clear();
    }
    arrayValue_.push_back(std::move(value));
}

bool JSONValue::operator==(const JSONValue& other) const {
    if (type_ != other.type_) {
        return false;
    }
    switch (type_) {
        case Type::Null:   return true;
        case Type::Bool:   return boolValue_ == other.boolValue_;
        case Type::Int:    return intValue_ == other.intValue_;
        case Type::Double: return doubleValue_ == other.doubleValue_;
        case Type::String: return stringValue_ == other.stringValue_;
        case Type::Array:  return arrayValue_ == other.arrayValue_;
        case Type::Object: return objectValue_ == other.objectValue_;
    }
    return false;
}

// ============================================================================
// Serialization
// ============================================================================

std::string JSONValue::ToJSON(bool pretty, int indent) const {
    std::ostringstream ss;
    std::string indentStr(indent * 2, ' ');
    std::string childIndent((indent + 1) * 2, ' ');

    switch (type_) {
        case Type::Null:
            ss << "null";
            break;

        case Type::Bool:
            ss << (boolValue_ ? "true" : "false");
            break;

        case Type::Int:
            ss << intValue_;
            break;

        case Type::Double:
            if (std::isfinite(doubleValue_)) {
                std::ostringstream num;
                num << std::setprecision(17) << doubleValue_;
                std::string text = num.str();
                // Keep a fraction so the value parses back as a double
                if (text.find_first_of(".eE") == std::string::npos) {
                    text += ".0";
                }
                ss << text;
            } else {
                ss << "null";
            }
            break;

        case Type::String:
            WriteEscaped(ss, stringValue_);
            break;

        case Type::Array:
            if (arrayValue_.empty()) {
                ss << "[]";
                break;
            }
            ss << '[';
            for (size_t i = 0; i < arrayValue_.size(); ++i) {
                if (i > 0) ss << ',';
                if (pretty) ss << '\n' << childIndent;
                ss << arrayValue_[i].ToJSON(pretty, indent + 1);
            }
            if (pretty) ss << '\n' << indentStr;
            ss << ']';
            break;

        case Type::Object:
            if (objectValue_.empty()) {
                ss << "{}";
                break;
            }
            ss << '{';
            for (size_t i = 0; i < objectValue_.size(); ++i) {
                if (i > 0) ss << ',';
                if (pretty) ss << '\n' << childIndent;
                WriteEscaped(ss, objectValue_[i].first);
                ss << (pretty ? ": " : ":") << objectValue_[i].second.ToJSON(pretty, indent + 1);
            }
            if (pretty) ss << '\n' << indentStr;
            ss << '}';
            break;
    }
    return ss.str();
}

// ============================================================================
// Parsing
// ============================================================================

JSONValue JSONValue::Parse(const std::string& json) {
    auto result = TryParse(json);
    if (!result) {
        throw std::runtime_error("JSON parse error");
    }
    return std::move(*result);
}

std::optional<JSONValue> JSONValue::TryParse(const std::string& json) {
    size_t pos = 0;
    int depth = 0;

    auto skipWhitespace = [&]() {
        while (pos < json.size() &&
               (json[pos] == ' ' || json[pos] == '\t' || json[pos] == '\n' || json[pos] == '\r')) {
            ++pos;
        }
    };

    auto parseHex4 = [&]() -> std::optional<uint32_t> {
        if (pos + 4 > json.size()) return std::nullopt;
        uint32_t v = 0;
        for (int i = 0; i < 4; ++i) {
            char c = json[pos++];
            v <<= 4;
            if (c >= '0' && c <= '9') v |= c - '0';
            else if (c >= 'a' && c <= 'f') v |= c - 'a' + 10;
            else if (c >= 'A' && c <= 'F') v |= c - 'A' + 10;
            else return std::nullopt;
        }
        return v;
    };

    std::function<std::optional<JSONValue>()> parseValue;

    auto parseString = [&]() -> std::optional<std::string> {
        if (pos >= json.size() || json[pos] != '"') return std::nullopt;
        ++pos;

        std::string result;
        while (pos < json.size() && json[pos] != '"') {
            char c = json[pos++];
            if (static_cast<unsigned char>(c) < 0x20) {
                return std::nullopt;
            }
            if (c != '\\') {
                result += c;
                continue;
            }
            if (pos >= json.size()) return std::nullopt;
            switch (json[pos++]) {
                case '"':  result += '"'; break;
                case '\\': result += '\\'; break;
                case '/':  result += '/'; break;
                case 'b':  result += '\b'; break;
                case 'f':  result += '\f'; break;
                case 'n':  result += '\n'; break;
                case 'r':  result += '\r'; break;
                case 't':  result += '\t'; break;
                case 'u': {
                    auto cp = parseHex4();
                    if (!cp) return std::nullopt;
                    if (*cp >= 0xD800 && *cp <= 0xDBFF) {
                        // High surrogate must be followed by a low surrogate
                        if (json.compare(pos, 2, "\\u") != 0) return std::nullopt;
                        pos += 2;
                        auto low = parseHex4();
                        if (!low || *low < 0xDC00 || *low > 0xDFFF) return std::nullopt;
                        *cp = 0x10000 + ((*cp - 0xD800) << 10) + (*low - 0xDC00);
                    } else if (*cp >= 0xDC00 && *cp <= 0xDFFF) {
                        return std::nullopt;
                    }
                    AppendUtf8(result, *cp);
                    break;
                }
                default:
                    return std::nullopt;
            }
        }
        if (pos >= json.size()) return std::nullopt;
        ++pos;
        return result;
    };

    auto parseNumber = [&]() -> std::optional<JSONValue> {
        size_t start = pos;
        bool isFloat = false;

        if (json[pos] == '-') ++pos;
        if (pos >= json.size() || !std::isdigit(static_cast<unsigned char>(json[pos]))) {
            return std::nullopt;
        }
        if (json[pos] == '0') {
            ++pos;
        } else {
            while (pos < json.size() && std::isdigit(static_cast<unsigned char>(json[pos]))) ++pos;
        }

        if (pos < json.size() && json[pos] == '.') {
            isFloat = true;
            ++pos;
            size_t digits = pos;
            while (pos < json.size() && std::isdigit(static_cast<unsigned char>(json[pos]))) ++pos;
            if (pos == digits) return std::nullopt;
        }

        if (pos < json.size() && (json[pos] == 'e' || json[pos] == 'E')) {
            isFloat = true;
            ++pos;
            if (pos < json.size() && (json[pos] == '+' || json[pos] == '-')) ++pos;
            size_t digits = pos;
            while (pos < json.size() && std::isdigit(static_cast<unsigned char>(json[pos]))) ++pos;
            if (pos == digits) return std::nullopt;
        }

        std::string numStr = json.substr(start, pos - start);
        try {
            if (isFloat) {
                return JSONValue(std::stod(numStr));
            }
            return JSONValue(static_cast<int64_t>(std::stoll(numStr)));
        } catch (const std::out_of_range&) {
            // Integers beyond int64 are not representable here
            return std::nullopt;
        } catch (const std::invalid_argument&) {
            return std::nullopt;
        }
    };

    auto parseArray = [&]() -> std::optional<JSONValue> {
        ++pos;  // '['
        Array arr;
        skipWhitespace();
        if (pos < json.size() && json[pos] == ']') {
            ++pos;
            return JSONValue(std::move(arr));
        }

        while (true) {
            auto val = parseValue();
            if (!val) return std::nullopt;
            arr.push_back(std::move(*val));

            skipWhitespace();
            if (pos >= json.size()) return std::nullopt;
            if (json[pos] == ']') {
                ++pos;
                return JSONValue(std::move(arr));
            }
            if (json[pos] != ',') return std::nullopt;
            ++pos;
        }
    };

    auto parseObject = [&]() -> std::optional<JSONValue> {
        ++pos;  // '{'
        JSONValue obj = MakeObject();
        skipWhitespace();
        if (pos < json.size() && json[pos] == '}') {
            ++pos;
            return obj;
        }

        while (true) {
            skipWhitespace();
            auto key = parseString();
            if (!key || obj.HasKey(*key)) return std::nullopt;

            skipWhitespace();
            if (pos >= json.size() || json[pos] != ':') return std::nullopt;
            ++pos;

            auto val = parseValue();
            if (!val) return std::nullopt;
            obj.objectValue_.emplace_back(std::move(*key), std::move(*val));

            skipWhitespace();
            if (pos >= json.size()) return std::nullopt;
            if (json[pos] == '}') {
                ++pos;
                return obj;
            }
            if (json[pos] != ',') return std::nullopt;
            ++pos;
        }
    };

    parseValue = [&]() -> std::optional<JSONValue> {
        skipWhitespace();
        if (pos >= json.size()) return std::nullopt;

        char c = json[pos];
        if (json.compare(pos, 4, "null") == 0) {
            pos += 4;
            return JSONValue();
        }
        if (json.compare(pos, 4, "true") == 0) {
            pos += 4;
            return JSONValue(true);
        }
        if (json.compare(pos, 5, "false") == 0) {
            pos += 5;
            return JSONValue(false);
        }
        if (c == '"') {
            auto str = parseString();
            if (!str) return std::nullopt;
            return JSONValue(std::move(*str));
        }
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
            return parseNumber();
        }
        if (c != '[' && c != '{') {
            return std::nullopt;
        }

        if (++depth > MAX_NESTING) return std::nullopt;
        auto nested = (c == '[') ? parseArray() : parseObject();
        --depth;
        return nested;
    };

    auto result = parseValue();
    if (!result) return std::nullopt;

    skipWhitespace();
    if (pos != json.size()) return std::nullopt;
    return result;
}

} // namespace util
} // namespace semaphore
