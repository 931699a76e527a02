// CHAINSYNC - JSON Document Type Implementation
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License

#include <chainsync/rpc/json.h>
#include <chainsync/core/errors.h>

#include <cctype>
#include <cstdlib>
#include <functional>
#include <iomanip>
#include <sstream>

namespace chainsync {
namespace rpc {

// ============================================================================
// JSONValue Static Members
// ============================================================================

const JSONValue JSONValue::nullValue_;
const JSONValue::Array JSONValue::emptyArray_;
const JSONValue::Object JSONValue::emptyObject_;
const std::string JSONValue::emptyString_;

// ============================================================================
// Accessors
// ============================================================================

bool JSONValue::GetBool(bool defaultValue) const {
    if (type_ == Type::Bool) return boolValue_;
    return defaultValue;
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

const std::string& JSONValue::GetString(const std::string& defaultValue) const {
    if (type_ == Type::String) return stringValue_;
    return defaultValue;
}

const JSONValue::Array& JSONValue::GetArray() const {
    if (type_ == Type::Array) return arrayValue_;
    return emptyArray_;
}

const JSONValue::Object& JSONValue::GetObject() const {
    if (type_ == Type::Object) return objectValue_;
    return emptyObject_;
}

bool JSONValue::HasKey(const std::string& key) const {
    if (type_ != Type::Object) return false;
    return objectValue_.count(key) > 0;
}

const JSONValue& JSONValue::operator[](const std::string& key) const {
    if (type_ != Type::Object) return nullValue_;
    auto it = objectValue_.find(key);
    if (it == objectValue_.end()) return nullValue_;
    return it->second;
}

JSONValue& JSONValue::operator[](const std::string& key) {
    if (type_ != Type::Object) {
        type_ = Type::Object;
        objectValue_.clear();
    }
    return objectValue_[key];
}

bool JSONValue::Erase(const std::string& key) {
    if (type_ != Type::Object) return false;
    return objectValue_.erase(key) > 0;
}

size_t JSONValue::Size() const {
    if (type_ == Type::Array) return arrayValue_.size();
    if (type_ == Type::Object) return objectValue_.size();
    return 0;
}

const JSONValue& JSONValue::operator[](size_t index) const {
    if (type_ != Type::Array || index >= arrayValue_.size()) return nullValue_;
    return arrayValue_[index];
}

JSONValue& JSONValue::operator[](size_t index) {
    if (type_ != Type::Array) {
        type_ = Type::Array;
        arrayValue_.clear();
    }
    if (index >= arrayValue_.size()) {
        arrayValue_.resize(index + 1);
    }
    return arrayValue_[index];
}

void JSONValue::Push(const JSONValue& value) {
    if (type_ != Type::Array) {
        type_ = Type::Array;
        arrayValue_.clear();
    }
    arrayValue_.push_back(value);
}

void JSONValue::Push(JSONValue&& value) {
    if (type_ != Type::Array) {
        type_ = Type::Array;
        arrayValue_.clear();
    }
    arrayValue_.push_back(std::move(value));
}

bool JSONValue::operator==(const JSONValue& other) const {
    if (type_ != other.type_) return false;
    switch (type_) {
        case Type::Null: return true;
        case Type::Bool: return boolValue_ == other.boolValue_;
        case Type::Int: return intValue_ == other.intValue_;
        case Type::Double: return doubleValue_ == other.doubleValue_;
        case Type::String: return stringValue_ == other.stringValue_;
        case Type::Array: return arrayValue_ == other.arrayValue_;
        case Type::Object: return objectValue_ == other.objectValue_;
    }
    return false;
}

// ============================================================================
// Serialization
// ============================================================================

namespace {

void WriteEscaped(std::ostringstream& ss, const std::string& str) {
    ss << '"';
    for (char c : str) {
        switch (c) {
            case '"': ss << "\\\""; break;
            case '\\': ss << "\\\\"; break;
            case '\b': ss << "\\b"; break;
            case '\f': ss << "\\f"; break;
            case '\n': ss << "\\n"; break;
            case '\r': ss << "\\r"; break;
            case '\t': ss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 32) {
                    ss << "\\u" << std::hex << std::setw(4)
                       << std::setfill('0') << static_cast<int>(c) << std::dec;
                } else {
                    ss << c;
                }
        }
    }
    ss << '"';
}

} // namespace

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
            ss << std::setprecision(15) << doubleValue_;
            break;

        case Type::String:
            WriteEscaped(ss, stringValue_);
            break;

        case Type::Array: {
            if (arrayValue_.empty()) {
                ss << "[]";
            } else if (pretty) {
                ss << "[\n";
                for (size_t i = 0; i < arrayValue_.size(); ++i) {
                    ss << childIndent << arrayValue_[i].ToJSON(true, indent + 1);
                    if (i + 1 < arrayValue_.size()) ss << ",";
                    ss << "\n";
                }
                ss << indentStr << "]";
            } else {
                ss << "[";
                for (size_t i = 0; i < arrayValue_.size(); ++i) {
                    if (i > 0) ss << ",";
                    ss << arrayValue_[i].ToJSON(false, 0);
                }
                ss << "]";
            }
            break;
        }

        case Type::Object: {
            if (objectValue_.empty()) {
                ss << "{}";
            } else {
                ss << (pretty ? "{\n" : "{");
                size_t i = 0;
                for (const auto& [key, value] : objectValue_) {
                    if (pretty) {
                        ss << childIndent;
                    } else if (i > 0) {
                        ss << ",";
                    }
                    WriteEscaped(ss, key);
                    ss << (pretty ? ": " : ":") << value.ToJSON(pretty, pretty ? indent + 1 : 0);
                    if (pretty) {
                        if (i + 1 < objectValue_.size()) ss << ",";
                        ss << "\n";
                    }
                    ++i;
                }
                if (pretty) ss << indentStr;
                ss << "}";
            }
            break;
        }
    }

    return ss.str();
}

// ============================================================================
// Parsing
// ============================================================================

JSONValue JSONValue::Parse(const std::string& json) {
    auto result = TryParse(json);
    if (!result) {
        throw ProtocolError("JSON parse error");
    }
    return std::move(*result);
}

std::optional<JSONValue> JSONValue::TryParse(const std::string& json) {
    size_t pos = 0;

    auto skipWhitespace = [&]() {
        while (pos < json.size() && std::isspace(static_cast<unsigned char>(json[pos]))) ++pos;
    };

    std::function<std::optional<JSONValue>()> parseValue;

    auto parseString = [&]() -> std::optional<std::string> {
        if (pos >= json.size() || json[pos] != '"') return std::nullopt;
        ++pos;

        std::string result;
        while (pos < json.size() && json[pos] != '"') {
            if (json[pos] == '\\') {
                if (++pos >= json.size()) return std::nullopt;
                switch (json[pos]) {
                    case '"': result += '"'; break;
                    case '\\': result += '\\'; break;
                    case '/': result += '/'; break;
                    case 'b': result += '\b'; break;
                    case 'f': result += '\f'; break;
                    case 'n': result += '\n'; break;
                    case 'r': result += '\r'; break;
                    case 't': result += '\t'; break;
                    case 'u': {
                        if (pos + 4 >= json.size()) return std::nullopt;
                        unsigned code = 0;
                        for (size_t i = 1; i <= 4; ++i) {
                            char h = json[pos + i];
                            if (!std::isxdigit(static_cast<unsigned char>(h))) return std::nullopt;
                            code = code * 16 + static_cast<unsigned>(
                                std::isdigit(static_cast<unsigned char>(h))
                                    ? h - '0'
                                    : std::tolower(static_cast<unsigned char>(h)) - 'a' + 10);
                        }
                        pos += 4;
                        // Only the Basic Latin range is decoded
                        result += code < 0x80 ? static_cast<char>(code) : '?';
                        break;
                    }
                    default: return std::nullopt;
                }
            } else {
                result += json[pos];
            }
            ++pos;
        }
        if (pos >= json.size()) return std::nullopt;
        ++pos;  // Skip closing quote
        return result;
    };

    auto parseNumber = [&]() -> std::optional<JSONValue> {
        size_t start = pos;
        bool isFloat = false;

        if (json[pos] == '-') ++pos;

        size_t digits = pos;
        while (pos < json.size() && std::isdigit(static_cast<unsigned char>(json[pos]))) ++pos;
        if (pos == digits) return std::nullopt;

        if (pos < json.size() && json[pos] == '.') {
            isFloat = true;
            ++pos;
            while (pos < json.size() && std::isdigit(static_cast<unsigned char>(json[pos]))) ++pos;
        }

        if (pos < json.size() && (json[pos] == 'e' || json[pos] == 'E')) {
            isFloat = true;
            ++pos;
            if (pos < json.size() && (json[pos] == '+' || json[pos] == '-')) ++pos;
            while (pos < json.size() && std::isdigit(static_cast<unsigned char>(json[pos]))) ++pos;
        }

        std::string numStr = json.substr(start, pos - start);
        try {
            if (isFloat) {
                return JSONValue(std::stod(numStr));
            }
            return JSONValue(static_cast<int64_t>(std::stoll(numStr)));
        } catch (const std::out_of_range&) {
            // Integers beyond int64 degrade to double
            if (isFloat) return std::nullopt;
            return JSONValue(std::strtod(numStr.c_str(), nullptr));
        } catch (const std::invalid_argument&) {
            return std::nullopt;
        }
    };

    auto parseArray = [&]() -> std::optional<JSONValue> {
        if (pos >= json.size() || json[pos] != '[') return std::nullopt;
        ++pos;

        Array arr;
        skipWhitespace();

        if (pos < json.size() && json[pos] == ']') {
            ++pos;
            return JSONValue(arr);
        }

        while (true) {
            skipWhitespace();
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
        if (pos >= json.size() || json[pos] != '{') return std::nullopt;
        ++pos;

        Object obj;
        skipWhitespace();

        if (pos < json.size() && json[pos] == '}') {
            ++pos;
            return JSONValue(obj);
        }

        while (true) {
            skipWhitespace();
            auto key = parseString();
            if (!key) return std::nullopt;

            skipWhitespace();
            if (pos >= json.size() || json[pos] != ':') return std::nullopt;
            ++pos;

            skipWhitespace();
            auto val = parseValue();
            if (!val) return std::nullopt;
            obj[*key] = std::move(*val);

            skipWhitespace();
            if (pos >= json.size()) return std::nullopt;

            if (json[pos] == '}') {
                ++pos;
                return JSONValue(std::move(obj));
            }
            if (json[pos] != ',') return std::nullopt;
            ++pos;
        }
    };

    parseValue = [&]() -> std::optional<JSONValue> {
        skipWhitespace();
        if (pos >= json.size()) return std::nullopt;

        char c = json[pos];

        if (c == 'n' && json.compare(pos, 4, "null") == 0) {
            pos += 4;
            return JSONValue();
        }
        if (c == 't' && json.compare(pos, 4, "true") == 0) {
            pos += 4;
            return JSONValue(true);
        }
        if (c == 'f' && json.compare(pos, 5, "false") == 0) {
            pos += 5;
            return JSONValue(false);
        }
        if (c == '"') {
            auto str = parseString();
            if (!str) return std::nullopt;
            return JSONValue(std::move(*str));
        }
        if (c == '[') return parseArray();
        if (c == '{') return parseObject();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parseNumber();

        return std::nullopt;
    };

    auto result = parseValue();
    if (!result) return std::nullopt;

    skipWhitespace();
    if (pos != json.size()) return std::nullopt;  // Extra characters

    return result;
}

} // namespace rpc
} // namespace chainsync
