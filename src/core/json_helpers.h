/**
 * @file json_helpers.h
 * @brief JSON document model, parser and streaming writer.
 */

#pragma once

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace moira {
namespace json {

/**
 * @brief Escapes special characters in a string for JSON output.
 *
 * Handles `"`, `\`, newline, carriage return and tab; other control
 * characters are written as `\u00XX`.
 *
 * @param s The input string to escape.
 * @return The escaped string safe for JSON output.
 */
inline std::string escape(const std::string& s) {
  static const char kHex[] = "0123456789abcdef";
  std::string result;
  result.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '"':
        result += "\\\"";
        break;
      case '\\':
        result += "\\\\";
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
          result += "\\u00";
          result += kHex[(c >> 4) & 0x0F];
          result += kHex[c & 0x0F];
        } else {
          result += c;
        }
        break;
    }
  }
  return result;
}

/**
 * @brief A streaming JSON writer with optional pretty-print support.
 *
 * @example
 * ```cpp
 * std::ostringstream oss;
 * json::Writer w(oss);
 * w.beginObject()
 *     .write("name", "test")
 *     .beginArray("items")
 *         .value(1)
 *         .value(2)
 *     .endArray()
 * .endObject();
 * // Output: {"name":"test","items":[1,2]}
 * ```
 */
class Writer {
 public:
  explicit Writer(std::ostream& os, bool pretty = false, int indent_size = 2)
      : os_(os), pretty_(pretty), indent_size_(indent_size) {}

  /// @brief Begins an object, keyed when nested inside another object.
  Writer& beginObject(const char* key = nullptr) {
    writeCommaIfNeeded();
    if (key) {
      writeKey(key);
    } else if (depth_ > 0) {
      writeNewlineIndent();
    }
    os_ << "{";
    pushContext();
    return *this;
  }

  Writer& endObject() {
    popContext();
    writeNewlineIndent();
    os_ << "}";
    return *this;
  }

  /// @brief Begins an array, keyed when nested inside an object.
  Writer& beginArray(const char* key = nullptr) {
    writeCommaIfNeeded();
    if (key) {
      writeKey(key);
    } else if (depth_ > 0) {
      writeNewlineIndent();
    }
    os_ << "[";
    pushContext();
    return *this;
  }

  Writer& endArray() {
    popContext();
    writeNewlineIndent();
    os_ << "]";
    return *this;
  }

  /// @brief Writes a numeric key-value pair.
  template <typename T>
  Writer& write(const char* key, T value) {
    writeCommaIfNeeded();
    writeKey(key);
    os_ << value;
    return *this;
  }

  Writer& write(const char* key, bool value) {
    writeCommaIfNeeded();
    writeKey(key);
    os_ << (value ? "true" : "false");
    return *this;
  }

  Writer& write(const char* key, const std::string& value) {
    writeCommaIfNeeded();
    writeKey(key);
    os_ << "\"" << escape(value) << "\"";
    return *this;
  }

  Writer& write(const char* key, const char* value) {
    writeCommaIfNeeded();
    writeKey(key);
    os_ << "\"" << escape(value) << "\"";
    return *this;
  }

  /// @brief Writes a null-valued key.
  Writer& writeNull(const char* key) {
    writeCommaIfNeeded();
    writeKey(key);
    os_ << "null";
    return *this;
  }

  /// @brief Writes a numeric value to the current array.
  template <typename T>
  Writer& value(T v) {
    writeCommaIfNeeded();
    writeNewlineIndent();
    os_ << v;
    return *this;
  }

  Writer& value(bool v) {
    writeCommaIfNeeded();
    writeNewlineIndent();
    os_ << (v ? "true" : "false");
    return *this;
  }

  Writer& value(const std::string& v) {
    writeCommaIfNeeded();
    writeNewlineIndent();
    os_ << "\"" << escape(v) << "\"";
    return *this;
  }

  Writer& value(const char* v) {
    writeCommaIfNeeded();
    writeNewlineIndent();
    os_ << "\"" << escape(v) << "\"";
    return *this;
  }

  /// @brief Writes null to the current array.
  Writer& nullValue() {
    writeCommaIfNeeded();
    writeNewlineIndent();
    os_ << "null";
    return *this;
  }

 private:
  void writeKey(const char* key) {
    writeNewlineIndent();
    os_ << "\"" << escape(key) << "\":";
    if (pretty_) os_ << " ";
  }

  void writeCommaIfNeeded() {
    if (!first_) os_ << ",";
    first_ = false;
  }

  void writeNewlineIndent() {
    if (pretty_) {
      os_ << "\n";
      for (int i = 0; i < depth_ * indent_size_; ++i) os_ << " ";
    }
  }

  void pushContext() {
    ++depth_;
    first_ = true;
  }

  void popContext() {
    --depth_;
    first_ = false;
  }

  std::ostream& os_;
  bool pretty_;
  int indent_size_;
  int depth_ = 0;
  bool first_ = true;
};

// ============================================================================
// Document model
// ============================================================================

/**
 * @brief A parsed JSON value.
 *
 * Objects keep their members in document order; the score format relies on
 * the order of keys inside duration objects.
 */
class Value {
 public:
  enum class Type : uint8_t { Null, Bool, Number, String, Array, Object };

  struct Member;
  using Array = std::vector<Value>;
  using Object = std::vector<Member>;

  Value() = default;

  static inline Value makeBool(bool b);
  static inline Value makeNumber(double number);
  static inline Value makeInteger(int64_t number);
  static inline Value makeString(std::string s);
  static inline Value makeArray();
  static inline Value makeObject();

  Type type() const { return type_; }
  bool isNull() const { return type_ == Type::Null; }
  bool isBool() const { return type_ == Type::Bool; }
  bool isNumber() const { return type_ == Type::Number; }
  bool isString() const { return type_ == Type::String; }
  bool isArray() const { return type_ == Type::Array; }
  bool isObject() const { return type_ == Type::Object; }

  /// @brief True for numbers written without fraction or exponent that fit int64.
  bool isInteger() const { return type_ == Type::Number && is_integer_; }

  bool asBool() const { return bool_; }
  double asDouble() const { return number_; }
  int64_t asInt() const { return integer_; }
  const std::string& asString() const { return string_; }
  const Array& asArray() const { return array_; }
  Array& asArray() { return array_; }
  inline const Object& asObject() const;
  inline Object& asObject();

  /// @brief Member of an object by key, or nullptr (first match wins).
  inline const Value* find(const std::string& key) const;

  /// @brief Append to an array value.
  inline void push(Value v);

  /// @brief Append a member to an object value.
  inline void insert(std::string key, Value v);

  /// @brief Name of a type for error messages ("object", "array", ...).
  static const char* typeName(Type type) {
    switch (type) {
      case Type::Null: return "null";
      case Type::Bool: return "bool";
      case Type::Number: return "number";
      case Type::String: return "string";
      case Type::Array: return "array";
      case Type::Object: return "object";
    }
    return "unknown";
  }

 private:
  Type type_ = Type::Null;
  bool bool_ = false;
  double number_ = 0.0;
  int64_t integer_ = 0;
  bool is_integer_ = false;
  std::string string_;
  Array array_;
  Object object_;
};

struct Value::Member {
  std::string key;
  Value value;
};

inline Value Value::makeBool(bool b) {
  Value v;
  v.type_ = Type::Bool;
  v.bool_ = b;
  return v;
}

inline Value Value::makeNumber(double number) {
  Value v;
  v.type_ = Type::Number;
  v.number_ = number;
  return v;
}

inline Value Value::makeInteger(int64_t number) {
  Value v;
  v.type_ = Type::Number;
  v.number_ = static_cast<double>(number);
  v.integer_ = number;
  v.is_integer_ = true;
  return v;
}

inline Value Value::makeString(std::string s) {
  Value v;
  v.type_ = Type::String;
  v.string_ = std::move(s);
  return v;
}

inline Value Value::makeArray() {
  Value v;
  v.type_ = Type::Array;
  return v;
}

inline Value Value::makeObject() {
  Value v;
  v.type_ = Type::Object;
  return v;
}

inline const Value::Object& Value::asObject() const { return object_; }

inline Value::Object& Value::asObject() { return object_; }

inline const Value* Value::find(const std::string& key) const {
  for (const auto& member : object_) {
    if (member.key == key) return &member.value;
  }
  return nullptr;
}

inline void Value::push(Value v) { array_.push_back(std::move(v)); }

inline void Value::insert(std::string key, Value v) {
  object_.push_back(Member{std::move(key), std::move(v)});
}

// ============================================================================
// Parser
// ============================================================================

/**
 * @brief Strict JSON parser producing a Value tree.
 *
 * @example
 * ```cpp
 * json::Parser p(R"({"bpm":120,"tracks":[]})");
 * json::Value doc;
 * if (!p.parse(doc)) std::cerr << p.error() << "\n";
 * doc.find("bpm")->asInt();  // 120
 * ```
 */
class Parser {
 public:
  explicit Parser(const std::string& text) : text_(text) {}

  /**
   * @brief Parse the whole input.
   * @param out Receives the document on success
   * @return false with error() set on malformed input or trailing content
   */
  bool parse(Value& out) {
    pos_ = 0;
    error_.clear();
    skipWhitespace();
    if (!parseValue(out, 0)) return false;
    skipWhitespace();
    if (pos_ != text_.size()) return fail("Unexpected trailing characters");
    return true;
  }

  /// @brief "<message> at line L, column C" after a failed parse().
  const std::string& error() const { return error_; }

 private:
  static constexpr int kMaxDepth = 256;

  bool fail(const std::string& message) {
    size_t line = 1;
    size_t column = 1;
    for (size_t i = 0; i < pos_ && i < text_.size(); ++i) {
      if (text_[i] == '\n') {
        ++line;
        column = 1;
      } else {
        ++column;
      }
    }
    error_ = message + " at line " + std::to_string(line) + ", column " + std::to_string(column);
    return false;
  }

  void skipWhitespace() {
    while (pos_ < text_.size() && (text_[pos_] == ' ' || text_[pos_] == '\t' ||
                                   text_[pos_] == '\n' || text_[pos_] == '\r')) {
      ++pos_;
    }
  }

  bool consumeLiteral(const char* literal) {
    std::string lit(literal);
    if (text_.compare(pos_, lit.size(), lit) != 0) return false;
    pos_ += lit.size();
    return true;
  }

  bool parseValue(Value& out, int depth) {
    if (depth > kMaxDepth) return fail("Nesting too deep");
    if (pos_ >= text_.size()) return fail("Unexpected end of input");

    char c = text_[pos_];
    switch (c) {
      case '{':
        return parseObject(out, depth);
      case '[':
        return parseArray(out, depth);
      case '"': {
        std::string s;
        if (!parseString(s)) return false;
        out = Value::makeString(std::move(s));
        return true;
      }
      case 't':
        if (!consumeLiteral("true")) return fail("Invalid literal");
        out = Value::makeBool(true);
        return true;
      case 'f':
        if (!consumeLiteral("false")) return fail("Invalid literal");
        out = Value::makeBool(false);
        return true;
      case 'n':
        if (!consumeLiteral("null")) return fail("Invalid literal");
        out = Value();
        return true;
      default:
        if (c == '-' || (c >= '0' && c <= '9')) return parseNumber(out);
        return fail(std::string("Unexpected character '") + c + "'");
    }
  }

  bool parseObject(Value& out, int depth) {
    ++pos_;  // '{'
    out = Value::makeObject();
    skipWhitespace();
    if (pos_ < text_.size() && text_[pos_] == '}') {
      ++pos_;
      return true;
    }

    while (true) {
      skipWhitespace();
      if (pos_ >= text_.size() || text_[pos_] != '"') return fail("Expected object key");
      std::string key;
      if (!parseString(key)) return false;

      skipWhitespace();
      if (pos_ >= text_.size() || text_[pos_] != ':') return fail("Expected ':'");
      ++pos_;
      skipWhitespace();

      Value member;
      if (!parseValue(member, depth + 1)) return false;
      out.insert(std::move(key), std::move(member));

      skipWhitespace();
      if (pos_ >= text_.size()) return fail("Unterminated object");
      if (text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (text_[pos_] == '}') {
        ++pos_;
        return true;
      }
      return fail("Expected ',' or '}'");
    }
  }

  bool parseArray(Value& out, int depth) {
    ++pos_;  // '['
    out = Value::makeArray();
    skipWhitespace();
    if (pos_ < text_.size() && text_[pos_] == ']') {
      ++pos_;
      return true;
    }

    while (true) {
      skipWhitespace();
      Value element;
      if (!parseValue(element, depth + 1)) return false;
      out.push(std::move(element));

      skipWhitespace();
      if (pos_ >= text_.size()) return fail("Unterminated array");
      if (text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (text_[pos_] == ']') {
        ++pos_;
        return true;
      }
      return fail("Expected ',' or ']'");
    }
  }

  bool parseHex4(uint32_t& code) {
    if (pos_ + 4 > text_.size()) return fail("Truncated \\u escape");
    code = 0;
    for (int i = 0; i < 4; ++i) {
      char h = text_[pos_++];
      code <<= 4;
      if (h >= '0' && h <= '9') {
        code |= static_cast<uint32_t>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        code |= static_cast<uint32_t>(h - 'a' + 10);
      } else if (h >= 'A' && h <= 'F') {
        code |= static_cast<uint32_t>(h - 'A' + 10);
      } else {
        return fail("Invalid \\u escape");
      }
    }
    return true;
  }

  static void appendUtf8(std::string& out, uint32_t code) {
    if (code < 0x80) {
      out += static_cast<char>(code);
    } else if (code < 0x800) {
      out += static_cast<char>(0xC0 | (code >> 6));
      out += static_cast<char>(0x80 | (code & 0x3F));
    } else if (code < 0x10000) {
      out += static_cast<char>(0xE0 | (code >> 12));
      out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (code & 0x3F));
    } else {
      out += static_cast<char>(0xF0 | (code >> 18));
      out += static_cast<char>(0x80 | ((code >> 12) & 0x3F));
      out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (code & 0x3F));
    }
  }

  bool parseString(std::string& out) {
    ++pos_;  // opening quote
    while (pos_ < text_.size()) {
      char c = text_[pos_++];
      if (c == '"') return true;
      if (static_cast<unsigned char>(c) < 0x20) return fail("Control character in string");
      if (c != '\\') {
        out += c;
        continue;
      }

      if (pos_ >= text_.size()) break;
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
          uint32_t code = 0;
          if (!parseHex4(code)) return false;
          if (code >= 0xD800 && code <= 0xDBFF) {
            // High surrogate: a low surrogate escape must follow.
            uint32_t low = 0;
            if (!consumeLiteral("\\u") || !parseHex4(low) || low < 0xDC00 || low > 0xDFFF) {
              return fail("Invalid surrogate pair");
            }
            code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
          } else if (code >= 0xDC00 && code <= 0xDFFF) {
            return fail("Invalid surrogate pair");
          }
          appendUtf8(out, code);
          break;
        }
        default:
          return fail(std::string("Invalid escape '\\") + esc + "'");
      }
    }
    return fail("Unterminated string");
  }

  bool parseNumber(Value& out) {
    size_t start = pos_;
    bool is_integer = true;

    if (text_[pos_] == '-') ++pos_;
    if (pos_ >= text_.size() || !isDigit(text_[pos_])) return fail("Invalid number");
    if (text_[pos_] == '0') {
      ++pos_;
    } else {
      while (pos_ < text_.size() && isDigit(text_[pos_])) ++pos_;
    }
    if (pos_ < text_.size() && text_[pos_] == '.') {
      is_integer = false;
      ++pos_;
      if (pos_ >= text_.size() || !isDigit(text_[pos_])) return fail("Invalid number");
      while (pos_ < text_.size() && isDigit(text_[pos_])) ++pos_;
    }
    if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
      is_integer = false;
      ++pos_;
      if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) ++pos_;
      if (pos_ >= text_.size() || !isDigit(text_[pos_])) return fail("Invalid number");
      while (pos_ < text_.size() && isDigit(text_[pos_])) ++pos_;
    }

    std::string literal = text_.substr(start, pos_ - start);
    if (is_integer) {
      errno = 0;
      char* end = nullptr;
      long long value = std::strtoll(literal.c_str(), &end, 10);
      if (errno != ERANGE) {
        out = Value::makeInteger(static_cast<int64_t>(value));
        return true;
      }
    }
    out = Value::makeNumber(std::strtod(literal.c_str(), nullptr));
    return true;
  }

  static bool isDigit(char c) { return c >= '0' && c <= '9'; }

  std::string text_;
  size_t pos_ = 0;
  std::string error_;
};

}  // namespace json
}  // namespace moira
