// ZEUS - JSON Value Implementation
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include "zeus/util/json.h"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

namespace zeus {
namespace util {

namespace {

const JSONValue kNull;
const JSONValue::Array kEmptyArray;
const JSONValue::Object kEmptyObject;
const std::string kEmptyString;

/// Maximum nesting accepted by the parser
constexpr int MAX_DEPTH = 64;

// ============================================================================
// Parser
// ============================================================================

class Reader {
public:
    explicit Reader(const std::string& text) : text_(text) {}
    
    bool ParseDocument(JSONValue& out) {
        SkipSpace();
        if (!ParseValue(out, 0)) {
            return false;
        }
        SkipSpace();
        return pos_ == text_.size();
    }
    
    size_t Offset() const { return pos_; }

private:
    void SkipSpace() {
        while (pos_ < text_.size() &&
               std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }
    
    bool Consume(char c) {
        if (pos_ < text_.size() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }
    
    bool Literal(const char* word) {
        size_t len = std::char_traits<char>::length(word);
        if (text_.compare(pos_, len, word) != 0) {
            return false;
        }
        pos_ += len;
        return true;
    }
    
    bool ParseValue(JSONValue& out, int depth) {
        if (depth > MAX_DEPTH || pos_ >= text_.size()) {
            return false;
        }
        char c = text_[pos_];
        switch (c) {
            case '{': return ParseObject(out, depth);
            case '[': return ParseArray(out, depth);
            case '"': {
                std::string s;
                if (!ParseString(s)) return false;
                out = JSONValue(std::move(s));
                return true;
            }
            case 't':
                if (!Literal("true")) return false;
                out = JSONValue(true);
                return true;
            case 'f':
                if (!Literal("false")) return false;
                out = JSONValue(false);
                return true;
            case 'n':
                if (!Literal("null")) return false;
                out = JSONValue();
                return true;
            default:
                return ParseNumber(out);
        }
    }
    
    bool ParseObject(JSONValue& out, int depth) {
        ++pos_;
        JSONValue::Object obj;
        SkipSpace();
        if (Consume('}')) {
            out = JSONValue(std::move(obj));
            return true;
        }
        while (true) {
            SkipSpace();
            std::string key;
            if (!ParseString(key)) return false;
            SkipSpace();
            if (!Consume(':')) return false;
            SkipSpace();
            JSONValue value;
            if (!ParseValue(value, depth + 1)) return false;
            obj[key] = std::move(value);
            SkipSpace();
            if (Consume('}')) break;
            if (!Consume(',')) return false;
        }
        out = JSONValue(std::move(obj));
        return true;
    }
    
    bool ParseArray(JSONValue& out, int depth) {
        ++pos_;
        JSONValue::Array arr;
        SkipSpace();
        if (Consume(']')) {
            out = JSONValue(std::move(arr));
            return true;
        }
        while (true) {
            SkipSpace();
            JSONValue value;
            if (!ParseValue(value, depth + 1)) return false;
            arr.push_back(std::move(value));
            SkipSpace();
            if (Consume(']')) break;
            if (!Consume(',')) return false;
        }
        out = JSONValue(std::move(arr));
        return true;
    }
    
    static void AppendUtf8(std::string& out, unsigned int cp) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }
    
    bool ParseString(std::string& out) {
        if (!Consume('"')) return false;
        while (pos_ < text_.size()) {
            char c = text_[pos_++];
            if (c == '"') {
                return true;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                return false;
            }
            if (c != '\\') {
                out += c;
                continue;
            }
            if (pos_ >= text_.size()) return false;
            char esc = text_[pos_++];
            switch (esc) {
                case '"': out += '"'; break;
                case '\\': out += '\\'; break;
                case '/': out += '/'; break;
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                case 'n': out += '\n'; break;
                case 'r': out += '\r'; break;
                case 't': out += '\t'; break;
                case 'u': {
                    if (pos_ + 4 > text_.size()) return false;
                    unsigned int cp = 0;
                    for (int i = 0; i < 4; ++i) {
                        char h = text_[pos_++];
                        cp <<= 4;
                        if (h >= '0' && h <= '9') cp |= static_cast<unsigned>(h - '0');
                        else if (h >= 'a' && h <= 'f') cp |= static_cast<unsigned>(h - 'a' + 10);
                        else if (h >= 'A' && h <= 'F') cp |= static_cast<unsigned>(h - 'A' + 10);
                        else return false;
                    }
                    AppendUtf8(out, cp);
                    break;
                }
                default:
                    return false;
            }
        }
        return false;
    }
    
    bool ParseNumber(JSONValue& out) {
        size_t start = pos_;
        bool isFloat = false;
        
        Consume('-');
        size_t digits = pos_;
        while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
        if (pos_ == digits) return false;
        if (Consume('.')) {
            isFloat = true;
            size_t frac = pos_;
            while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
            if (pos_ == frac) return false;
        }
        if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
            isFloat = true;
            ++pos_;
            if (!Consume('+')) Consume('-');
            size_t exp = pos_;
            while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
            if (pos_ == exp) return false;
        }
        
        std::string num = text_.substr(start, pos_ - start);
        errno = 0;
        if (!isFloat) {
            long long v = std::strtoll(num.c_str(), nullptr, 10);
            if (errno != ERANGE) {
                out = JSONValue(static_cast<int64_t>(v));
                return true;
            }
            errno = 0;
        }
        double d = std::strtod(num.c_str(), nullptr);
        if (errno == ERANGE) return false;
        out = JSONValue(d);
        return true;
    }
    
    const std::string& text_;
    size_t pos_{0};
};

void Indent(std::string& out, int depth) {
    out.append(static_cast<size_t>(depth) * 2, ' ');
}

} // namespace

// ============================================================================
// JSONValue
// ============================================================================

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
    return type_ == Type::String ? stringValue_ : kEmptyString;
}

const JSONValue::Array& JSONValue::GetArray() const {
    return type_ == Type::Array ? arrayValue_ : kEmptyArray;
}

const JSONValue::Object& JSONValue::GetObject() const {
    return type_ == Type::Object ? objectValue_ : kEmptyObject;
}

bool JSONValue::HasKey(const std::string& key) const {
    return Find(key) != nullptr;
}

const JSONValue* JSONValue::Find(const std::string& key) const {
    if (type_ != Type::Object) return nullptr;
    auto it = objectValue_.find(key);
    return it == objectValue_.end() ? nullptr : &it->second;
}

const JSONValue& JSONValue::operator[](const std::string& key) const {
    const JSONValue* found = Find(key);
    return found ? *found : kNull;
}

JSONValue& JSONValue::operator[](const std::string& key) {
    if (type_ != Type::Object) {
        type_ = Type::Object;
        objectValue_.clear();
    }
    return objectValue_[key];
}

size_t JSONValue::Size() const {
    if (type_ == Type::Array) return arrayValue_.size();
    if (type_ == Type::Object) return objectValue_.size();
    return 0;
}

const JSONValue& JSONValue::operator[](size_t index) const {
    if (type_ != Type::Array || index >= arrayValue_.size()) return kNull;
    return arrayValue_[index];
}

void JSONValue::Push(JSONValue value) {
    if (type_ != Type::Array) {
        type_ = Type::Array;
        arrayValue_.clear();
    }
    arrayValue_.push_back(std::move(value));
}

std::string JSONQuote(const std::string& str) {
    std::string out;
    out.reserve(str.size() + 2);
    out += '"';
    for (char c : str) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
    return out;
}

void JSONValue::Write(std::string& out, bool pretty, int depth) const {
    switch (type_) {
        case Type::Null:
            out += "null";
            break;
        case Type::Bool:
            out += boolValue_ ? "true" : "false";
            break;
        case Type::Int:
            out += std::to_string(intValue_);
            break;
        case Type::Double: {
            if (!std::isfinite(doubleValue_)) {
                out += "null";
                break;
            }
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.17g", doubleValue_);
            out += buf;
            break;
        }
        case Type::String:
            out += JSONQuote(stringValue_);
            break;
        case Type::Array: {
            if (arrayValue_.empty()) {
                out += "[]";
                break;
            }
            out += '[';
            for (size_t i = 0; i < arrayValue_.size(); ++i) {
                if (i > 0) out += ',';
                if (pretty) {
                    out += '\n';
                    Indent(out, depth + 1);
                }
                arrayValue_[i].Write(out, pretty, depth + 1);
            }
            if (pretty) {
                out += '\n';
                Indent(out, depth);
            }
            out += ']';
            break;
        }
        case Type::Object: {
            if (objectValue_.empty()) {
                out += "{}";
                break;
            }
            out += '{';
            bool first = true;
            for (const auto& kv : objectValue_) {
                if (!first) out += ',';
                first = false;
                if (pretty) {
                    out += '\n';
                    Indent(out, depth + 1);
                }
                out += JSONQuote(kv.first);
                out += pretty ? ": " : ":";
                kv.second.Write(out, pretty, depth + 1);
            }
            if (pretty) {
                out += '\n';
                Indent(out, depth);
            }
            out += '}';
            break;
        }
    }
}

std::string JSONValue::ToJSON(bool pretty) const {
    std::string out;
    Write(out, pretty, 0);
    return out;
}

JSONValue JSONValue::Parse(const std::string& json) {
    Reader reader(json);
    JSONValue value;
    if (!reader.ParseDocument(value)) {
        throw std::runtime_error("JSON parse error at offset " +
                                 std::to_string(reader.Offset()));
    }
    return value;
}

std::optional<JSONValue> JSONValue::TryParse(const std::string& json) {
    Reader reader(json);
    JSONValue value;
    if (!reader.ParseDocument(value)) {
        return std::nullopt;
    }
    return value;
}

} // namespace util
} // namespace zeus
