#ifndef LFSPACK_CORE_JSON_DOM_HPP_
#define LFSPACK_CORE_JSON_DOM_HPP_

#include <cctype>
#include <charconv>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace lfspack::core::json {

// Small DOM for reading back files lfspack wrote itself (the pack manifest).
// Numbers keep their source token so byte counts above 2^53 survive intact;
// callers convert with `AsUnsigned`.
struct Value {
  enum class Type {
    kObject,
    kArray,
    kString,
    kNumber,
    kBool,
    kNull,
  };

  using Object = std::map<std::string, Value>;
  using Array = std::vector<Value>;

  Type type = Type::kNull;
  Object object_value;
  Array array_value;
  std::string string_value;
  std::string number_token;
  bool bool_value = false;
};

inline const char* ToString(Value::Type type) {
  switch (type) {
  case Value::Type::kObject:
    return "object";
  case Value::Type::kArray:
    return "array";
  case Value::Type::kString:
    return "string";
  case Value::Type::kNumber:
    return "number";
  case Value::Type::kBool:
    return "bool";
  case Value::Type::kNull:
    return "null";
  }
  return "null";
}

inline bool AsUnsigned(const Value& value, std::uint64_t& out, std::string& error) {
  if (value.type != Value::Type::kNumber) {
    error = std::string("expected number, got ") + ToString(value.type);
    return false;
  }
  const std::string& token = value.number_token;
  std::uint64_t parsed = 0;
  const auto result = std::from_chars(token.data(), token.data() + token.size(), parsed);
  if (result.ec != std::errc() || result.ptr != token.data() + token.size()) {
    error = "expected non-negative integer, got '" + token + "'";
    return false;
  }
  out = parsed;
  return true;
}

// Looks up `key` in an object value. Missing keys and type mismatches are
// reported with the key name so manifest errors point at the offending field.
inline const Value* FindMember(const Value& object, std::string_view key, Value::Type expected,
                               std::string& error) {
  if (object.type != Value::Type::kObject) {
    error = "expected object while looking up '" + std::string(key) + "'";
    return nullptr;
  }
  const auto it = object.object_value.find(std::string(key));
  if (it == object.object_value.end()) {
    error = "missing required field '" + std::string(key) + "'";
    return nullptr;
  }
  if (it->second.type != expected) {
    error = "field '" + std::string(key) + "' must be " + ToString(expected) + ", got " +
            ToString(it->second.type);
    return nullptr;
  }
  return &it->second;
}

// Quoted JSON string literal. Control bytes become \u00XX, which `Parser`
// reads back.
inline std::string QuoteString(std::string_view raw) {
  constexpr char kHex[] = "0123456789abcdef";
  std::string quoted;
  quoted.reserve(raw.size() + 2U);
  quoted.push_back('"');
  for (const char c : raw) {
    switch (c) {
    case '"':
      quoted += "\\\"";
      break;
    case '\\':
      quoted += "\\\\";
      break;
    case '\n':
      quoted += "\\n";
      break;
    case '\r':
      quoted += "\\r";
      break;
    case '\t':
      quoted += "\\t";
      break;
    default: {
      const auto byte = static_cast<unsigned char>(c);
      if (byte < 0x20U) {
        quoted += "\\u00";
        quoted.push_back(kHex[byte >> 4]);
        quoted.push_back(kHex[byte & 0x0FU]);
      } else {
        quoted.push_back(c);
      }
      break;
    }
    }
  }
  quoted.push_back('"');
  return quoted;
}

class Parser {
public:
  explicit Parser(std::string_view input) : input_(input) {}

  bool Parse(Value& root, std::string& error) {
    SkipWhitespace();
    if (!ParseValue(root, error)) {
      return false;
    }
    SkipWhitespace();
    if (!AtEnd()) {
      return Fail("unexpected trailing content after JSON value", error);
    }
    return true;
  }

private:
  bool ParseValue(Value& value, std::string& error) {
    if (AtEnd()) {
      return Fail("unexpected end of input while parsing value", error);
    }

    const char c = Peek();
    if (c == '{') {
      return ParseObject(value, error);
    }
    if (c == '[') {
      return ParseArray(value, error);
    }
    if (c == '"') {
      value.type = Value::Type::kString;
      return ParseString(value.string_value, error);
    }
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) {
      value.type = Value::Type::kNumber;
      return ParseNumber(value.number_token, error);
    }
    if (ConsumeKeyword("true")) {
      value.type = Value::Type::kBool;
      value.bool_value = true;
      return true;
    }
    if (ConsumeKeyword("false")) {
      value.type = Value::Type::kBool;
      value.bool_value = false;
      return true;
    }
    if (ConsumeKeyword("null")) {
      value.type = Value::Type::kNull;
      return true;
    }

    return Fail("expected JSON value", error);
  }

  bool ParseObject(Value& value, std::string& error) {
    value = Value{};
    value.type = Value::Type::kObject;
    Advance(); // '{'
    SkipWhitespace();
    if (Match('}')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      std::string key;
      if (!ParseString(key, error)) {
        return false;
      }
      SkipWhitespace();
      if (!ConsumeChar(':', "expected ':' after object key", error)) {
        return false;
      }
      SkipWhitespace();
      Value item;
      if (!ParseValue(item, error)) {
        return false;
      }
      value.object_value[key] = std::move(item);

      SkipWhitespace();
      if (Match('}')) {
        return true;
      }
      if (!ConsumeChar(',', "expected ',' between object entries", error)) {
        return false;
      }
    }
  }

  bool ParseArray(Value& value, std::string& error) {
    value = Value{};
    value.type = Value::Type::kArray;
    Advance(); // '['
    SkipWhitespace();
    if (Match(']')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      Value item;
      if (!ParseValue(item, error)) {
        return false;
      }
      value.array_value.push_back(std::move(item));

      SkipWhitespace();
      if (Match(']')) {
        return true;
      }
      if (!ConsumeChar(',', "expected ',' between array items", error)) {
        return false;
      }
    }
  }

  bool ParseString(std::string& output, std::string& error) {
    output.clear();
    if (!ConsumeChar('"', "expected '\"' to start string", error)) {
      return false;
    }

    while (!AtEnd()) {
      const char c = Advance();
      if (c == '"') {
        return true;
      }
      if (static_cast<unsigned char>(c) < 0x20U) {
        return Fail("control character in string is not allowed", error);
      }
      if (c != '\\') {
        output.push_back(c);
        continue;
      }
      if (AtEnd()) {
        break;
      }
      const char esc = Advance();
      switch (esc) {
      case '"':
      case '\\':
      case '/':
        output.push_back(esc);
        break;
      case 'b':
        output.push_back('\b');
        break;
      case 'f':
        output.push_back('\f');
        break;
      case 'n':
        output.push_back('\n');
        break;
      case 'r':
        output.push_back('\r');
        break;
      case 't':
        output.push_back('\t');
        break;
      case 'u':
        if (!ParseControlEscape(output, error)) {
          return false;
        }
        break;
      default:
        return Fail("invalid escape sequence in string", error);
      }
    }

    return Fail("unterminated string literal", error);
  }

  // The manifest writer only emits \u00XX for control bytes; wider code
  // points never appear in ref names or object ids.
  bool ParseControlEscape(std::string& output, std::string& error) {
    if (pos_ + 4 > input_.size()) {
      return Fail("truncated \\u escape", error);
    }
    unsigned int code = 0;
    const char* begin = input_.data() + pos_;
    const auto result = std::from_chars(begin, begin + 4, code, 16);
    if (result.ec != std::errc() || result.ptr != begin + 4) {
      return Fail("invalid \\u escape", error);
    }
    if (code > 0x7FU) {
      return Fail("\\u escapes above 0x7F are not supported", error);
    }
    for (int i = 0; i < 4; ++i) {
      Advance();
    }
    output.push_back(static_cast<char>(code));
    return true;
  }

  bool ParseNumber(std::string& token, std::string& error) {
    const std::size_t start = pos_;
    (void)Match('-');
    if (!Match('0') && !ConsumeDigits()) {
      return Fail("expected digits in number", error);
    }
    if (Match('.') && !ConsumeDigits()) {
      return Fail("expected digits after decimal point", error);
    }
    if (Match('e') || Match('E')) {
      if (!Match('+')) {
        (void)Match('-');
      }
      if (!ConsumeDigits()) {
        return Fail("expected exponent digits", error);
      }
    }
    token.assign(input_.substr(start, pos_ - start));
    return true;
  }

  void SkipWhitespace() {
    while (!AtEnd() && std::isspace(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
    }
  }

  bool ConsumeDigits() {
    std::size_t count = 0;
    while (!AtEnd() && std::isdigit(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
      ++count;
    }
    return count > 0U;
  }

  bool ConsumeKeyword(std::string_view keyword) {
    if (input_.substr(pos_, keyword.size()) != keyword) {
      return false;
    }
    for (std::size_t i = 0; i < keyword.size(); ++i) {
      Advance();
    }
    return true;
  }

  bool ConsumeChar(char expected, std::string_view message, std::string& error) {
    if (!Match(expected)) {
      return Fail(message, error);
    }
    return true;
  }

  bool Match(char expected) {
    if (AtEnd() || Peek() != expected) {
      return false;
    }
    Advance();
    return true;
  }

  char Peek() const {
    return input_[pos_];
  }

  char Advance() {
    const char c = input_[pos_++];
    if (c == '\n') {
      ++line_;
      col_ = 1;
    } else {
      ++col_;
    }
    return c;
  }

  bool AtEnd() const {
    return pos_ >= input_.size();
  }

  bool Fail(std::string_view message, std::string& error) const {
    error = "parse error at line " + std::to_string(line_) + ", col " + std::to_string(col_) +
            ": " + std::string(message);
    return false;
  }

  std::string_view input_;
  std::size_t pos_ = 0;
  std::size_t line_ = 1;
  std::size_t col_ = 1;
};

inline bool Parse(std::string_view input, Value& root, std::string& error) {
  Parser parser(input);
  return parser.Parse(root, error);
}

} // namespace lfspack::core::json

#endif // LFSPACK_CORE_JSON_DOM_HPP_
