// ZEUS - JSON Value
// Copyright (c) 2024 ZEUS Developers
// MIT License
//
// Minimal JSON document model used for the line-delimited wire protocol,
// the cgminer API and the weights.json export.

#ifndef ZEUS_UTIL_JSON_H
#define ZEUS_UTIL_JSON_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace zeus {
namespace util {

// ============================================================================
// JSON Value
// ============================================================================

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
    using Object = std::map<std::string, JSONValue>;
    
    JSONValue() : type_(Type::Null) {}
    JSONValue(std::nullptr_t) : type_(Type::Null) {}
    JSONValue(bool value) : type_(Type::Bool), boolValue_(value) {}
    JSONValue(int value) : type_(Type::Int), intValue_(value) {}
    JSONValue(unsigned int value) : type_(Type::Int), intValue_(value) {}
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
    
    Type GetType() const { return type_; }
    bool IsNull() const { return type_ == Type::Null; }
    bool IsBool() const { return type_ == Type::Bool; }
    bool IsInt() const { return type_ == Type::Int; }
    bool IsDouble() const { return type_ == Type::Double; }
    bool IsNumber() const { return type_ == Type::Int || type_ == Type::Double; }
    bool IsString() const { return type_ == Type::String; }
    bool IsArray() const { return type_ == Type::Array; }
    bool IsObject() const { return type_ == Type::Object; }
    
    /// Getters return the default when the type does not match
    bool GetBool(bool defaultValue = false) const;
    int64_t GetInt(int64_t defaultValue = 0) const;
    double GetDouble(double defaultValue = 0.0) const;
    const std::string& GetString() const;
    const Array& GetArray() const;
    const Object& GetObject() const;
    
    bool HasKey(const std::string& key) const;
    
    /// Member lookup; nullptr when absent or not an object
    const JSONValue* Find(const std::string& key) const;
    
    /// Missing members read as null
    const JSONValue& operator[](const std::string& key) const;
    JSONValue& operator[](const std::string& key);
    
    size_t Size() const;
    const JSONValue& operator[](size_t index) const;
    void Push(JSONValue value);
    
    /// Serialize; object members come out in key order
    std::string ToJSON(bool pretty = false) const;
    
    /// Parse a complete document; throws std::runtime_error with the offset
    static JSONValue Parse(const std::string& json);
    
    /// Parse a complete document; nullopt on any syntax error
    static std::optional<JSONValue> TryParse(const std::string& json);

private:
    void Write(std::string& out, bool pretty, int depth) const;
    
    Type type_;
    bool boolValue_{false};
    int64_t intValue_{0};
    double doubleValue_{0.0};
    std::string stringValue_;
    Array arrayValue_;
    Object objectValue_;
};

/// Escape and quote a string for JSON output
std::string JSONQuote(const std::string& str);

} // namespace util
} // namespace zeus

#endif // ZEUS_UTIL_JSON_H
