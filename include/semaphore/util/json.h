// SEMAPHORE - JSON Value
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License
//
// Minimal JSON document model with a strict parser. Object members keep
// their insertion order so that serialized documents have a stable layout.

#ifndef SEMAPHORE_UTIL_JSON_H
#define SEMAPHORE_UTIL_JSON_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace semaphore {
namespace util {

class JSONValue {
public:
    enum class Type {
        Null,
        Bool,
        Int,
        Double,
        String,
        Array,
        Object
    };

    using Array = std::vector<JSONValue>;
    using Member = std::pair<std::string, JSONValue>;
    using Object = std::vector<Member>;

    /// Nesting limit enforced by the parser
    static constexpr int MAX_NESTING = 64;

    JSONValue() : type_(Type::Null) {}
    JSONValue(std::nullptr_t) : type_(Type::Null) {}
    JSONValue(bool value) : type_(Type::Bool), boolValue_(value) {}
    JSONValue(int value) : type_(Type::Int), intValue_(value) {}
    JSONValue(int64_t value) : type_(Type::Int), intValue_(value) {}
    JSONValue(uint64_t value) : type_(Type::Int), intValue_(static_cast<int64_t>(value)) {}
    JSONValue(double value) : type_(Type::Double), doubleValue_(value) {}
    JSONValue(const char* value) : type_(Type::String), stringValue_(value) {}
    JSONValue(const std::string& value) : type_(Type::String), stringValue_(value) {}
    JSONValue(std::string&& value) : type_(Type::String), stringValue_(std::move(value)) {}
    JSONValue(const Array& value) : type_(Type::Array), arrayValue_(value) {}
    JSONValue(Array&& value) : type_(Type::Array), arrayValue_(std::move(value)) {}
    JSONValue(const Object& value) : type_(Type::Object), objectValue_(value) {}
    JSONValue(Object&& value) : type_(Type::Object), objectValue_(std::move(value)) {}

    /// Empty object (distinct from Null)
    static JSONValue MakeObject() { return JSONValue(Object{}); }

    /// Empty array (distinct from Null)
    static JSONValue MakeArray() { return JSONValue(Array{}); }

    Type GetType() const { return type_; }
    bool IsNull() const { return type_ == Type::Null; }
    bool IsBool() const { return type_ == Type::Bool; }
    bool IsInt() const { return type_ == Type::Int; }
    bool IsDouble() const { return type_ == Type::Double; }
    bool IsNumber() const { return type_ == Type::Int || type_ == Type::Double; }
    bool IsString() const { return type_ == Type::String; }
    bool IsArray() const { return type_ == Type::Array; }
    bool IsObject() const { return type_ == Type::Object; }

    bool GetBool(bool defaultValue = false) const;
    int64_t GetInt(int64_t defaultValue = 0) const;
    double GetDouble(double defaultValue = 0.0) const;
    const std::string& GetString() const;
    const Array& GetArray() const;
    const Object& GetObject() const;

    // Object access
    bool HasKey(const std::string& key) const;

    /// Pointer to the member value, or nullptr if absent or not an object
    const JSONValue* Find(const std::string& key) const;

    /// Member value, or a shared Null value if absent
    const JSONValue& operator[](const std::string& key) const;

    /// Insert or replace a member; a replaced member keeps its position
    void Set(const std::string& key, JSONValue value);

    // Array access
    size_t Size() const;
    const JSONValue& operator[](size_t index) const;
    void Push(JSONValue value);

    bool operator==(const JSONValue& other) const;
    bool operator!=(const JSONValue& other) const { return !(*this == other); }

    /// Serialize; pretty output indents by two spaces per level
    std::string ToJSON(bool pretty = false, int indent = 0) const;

    /// Throws std::runtime_error on malformed input
    static JSONValue Parse(const std::string& json);

    /// Strict RFC 8259 parse. Rejects trailing data, duplicate object keys
    /// and nesting deeper than MAX_NESTING.
    static std::optional<JSONValue> TryParse(const std::string& json);

    static const JSONValue& Null();

private:
    Type type_;
    bool boolValue_{false};
    int64_t intValue_{0};
    double doubleValue_{0.0};
    std::string stringValue_;
    Array arrayValue_;
    Object objectValue_;
};

} // namespace util
} // namespace semaphore

#endif // SEMAPHORE_UTIL_JSON_H
