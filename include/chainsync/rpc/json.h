// CHAINSYNC - JSON Document Type
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License
//
// A small JSON value used for RPC payloads, node responses, cached
// records and persisted wallet state.

#ifndef CHAINSYNC_RPC_JSON_H
#define CHAINSYNC_RPC_JSON_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace chainsync {
namespace rpc {

// ============================================================================
// JSON Value
// ============================================================================

/**
 * Simple JSON value representation.
 * Integers and doubles are kept apart so base-unit amounts survive a
 * serialize/parse cycle exactly.
 */
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

    // Constructors
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

    // Type checking
    Type GetType() const { return type_; }
    bool IsNull() const { return type_ == Type::Null; }
    bool IsBool() const { return type_ == Type::Bool; }
    bool IsInt() const { return type_ == Type::Int; }
    bool IsDouble() const { return type_ == Type::Double; }
    bool IsNumber() const { return type_ == Type::Int || type_ == Type::Double; }
    bool IsString() const { return type_ == Type::String; }
    bool IsArray() const { return type_ == Type::Array; }
    bool IsObject() const { return type_ == Type::Object; }

    // Value getters (with defaults)
    bool GetBool(bool defaultValue = false) const;
    int64_t GetInt(int64_t defaultValue = 0) const;
    double GetDouble(double defaultValue = 0.0) const;
    const std::string& GetString(const std::string& defaultValue = emptyString_) const;
    const Array& GetArray() const;
    const Object& GetObject() const;

    // Object access
    bool HasKey(const std::string& key) const;
    const JSONValue& operator[](const std::string& key) const;
    JSONValue& operator[](const std::string& key);
    bool Erase(const std::string& key);

    // Array access
    size_t Size() const;
    const JSONValue& operator[](size_t index) const;
    JSONValue& operator[](size_t index);
    void Push(const JSONValue& value);
    void Push(JSONValue&& value);

    /// Structural equality (Int and Double compare by type)
    bool operator==(const JSONValue& other) const;
    bool operator!=(const JSONValue& other) const { return !(*this == other); }

    // Serialization
    std::string ToJSON(bool pretty = false, int indent = 0) const;

    /// Parse a complete document; throws ProtocolError on malformed input
    static JSONValue Parse(const std::string& json);
    static std::optional<JSONValue> TryParse(const std::string& json);

    /// Get a null value reference (for returning from accessors)
    static const JSONValue& Null() { return nullValue_; }

private:
    Type type_;
    bool boolValue_{false};
    int64_t intValue_{0};
    double doubleValue_{0.0};
    std::string stringValue_;
    Array arrayValue_;
    Object objectValue_;

    static const JSONValue nullValue_;
    static const Array emptyArray_;
    static const Object emptyObject_;
    static const std::string emptyString_;
};

} // namespace rpc
} // namespace chainsync

#endif // CHAINSYNC_RPC_JSON_H
