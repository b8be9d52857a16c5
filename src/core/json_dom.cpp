#include "core/json_dom.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <limits>

namespace admapper::core::json {

namespace {

class Reader {
public:
  explicit Reader(std::string_view input) : input_(input) {}

  bool ReadDocument(Value& root, std::string& error) {
    SkipWhitespace();
    if (!ReadValue(root, /*depth=*/0, error)) {
      return false;
    }
    SkipWhitespace();
    if (!AtEnd()) {
      return Fail("unexpected trailing content after JSON value", error);
    }
    return true;
  }

private:
  static constexpr std::size_t kMaxDepth = 64;

  bool ReadValue(Value& value, std::size_t depth, std::string& error) {
    if (depth > kMaxDepth) {
      return Fail("document nesting is too deep", error);
    }
    if (AtEnd()) {
      return Fail("unexpected end of input while parsing value", error);
    }

    value = Value{};
    const char c = Peek();
    switch (c) {
    case '{':
      return ReadObject(value, depth, error);
    case '[':
      return ReadArray(value, depth, error);
    case '"':
      value.type = Value::Type::kString;
      return ReadString(value.string_value, error);
    case 't':
      return ReadLiteral("true", value, error);
    case 'f':
      return ReadLiteral("false", value, error);
    case 'n':
      return ReadLiteral("null", value, error);
    default:
      break;
    }
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) {
      value.type = Value::Type::kNumber;
      return ReadNumber(value.number_value, error);
    }
    return Fail("expected JSON value", error);
  }

  bool ReadLiteral(std::string_view token, Value& value, std::string& error) {
    if (input_.substr(pos_, token.size()) != token) {
      return Fail("invalid literal", error);
    }
    for (std::size_t i = 0; i < token.size(); ++i) {
      Advance();
    }
    if (token == "null") {
      value.type = Value::Type::kNull;
    } else {
      value.type = Value::Type::kBool;
      value.bool_value = token == "true";
    }
    return true;
  }

  bool ReadObject(Value& value, std::size_t depth, std::string& error) {
    value.type = Value::Type::kObject;
    Advance();
    SkipWhitespace();
    if (Match('}')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      std::string key;
      if (!ReadString(key, error)) {
        return false;
      }
      SkipWhitespace();
      if (!Expect(':', "expected ':' after object key", error)) {
        return false;
      }
      SkipWhitespace();
      Value member;
      if (!ReadValue(member, depth + 1, error)) {
        return false;
      }
      value.object_value[std::move(key)] = std::move(member);

      SkipWhitespace();
      if (Match('}')) {
        return true;
      }
      if (!Expect(',', "expected ',' or '}' in object", error)) {
        return false;
      }
    }
  }

  bool ReadArray(Value& value, std::size_t depth, std::string& error) {
    value.type = Value::Type::kArray;
    Advance();
    SkipWhitespace();
    if (Match(']')) {
      return true;
    }

    while (true) {
      SkipWhitespace();
      Value item;
      if (!ReadValue(item, depth + 1, error)) {
        return false;
      }
      value.array_value.push_back(std::move(item));

      SkipWhitespace();
      if (Match(']')) {
        return true;
      }
      if (!Expect(',', "expected ',' or ']' in array", error)) {
        return false;
      }
    }
  }

  bool ReadString(std::string& out, std::string& error) {
    out.clear();
    if (!Expect('"', "expected '\"' to start string", error)) {
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
        out.push_back(c);
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
        out.push_back(esc);
        break;
      case 'b':
        out.push_back('\b');
        break;
      case 'f':
        out.push_back('\f');
        break;
      case 'n':
        out.push_back('\n');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'u':
        if (!ReadUnicodeEscape(out, error)) {
          return false;
        }
        break;
      default:
        return Fail("invalid escape sequence in string", error);
      }
    }

    return Fail("unterminated string literal", error);
  }

  // Basic multilingual plane only; surrogate pairs are rejected.
  bool ReadUnicodeEscape(std::string& out, std::string& error) {
    unsigned int code_point = 0;
    for (int i = 0; i < 4; ++i) {
      if (AtEnd()) {
        return Fail("truncated \\u escape", error);
      }
      const char h = Advance();
      code_point <<= 4U;
      if (h >= '0' && h <= '9') {
        code_point |= static_cast<unsigned int>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        code_point |= static_cast<unsigned int>(h - 'a' + 10);
      } else if (h >= 'A' && h <= 'F') {
        code_point |= static_cast<unsigned int>(h - 'A' + 10);
      } else {
        return Fail("invalid hex digit in \\u escape", error);
      }
    }
    if (code_point >= 0xD800U && code_point <= 0xDFFFU) {
      return Fail("surrogate \\u escapes are not supported", error);
    }

    if (code_point < 0x80U) {
      out.push_back(static_cast<char>(code_point));
    } else if (code_point < 0x800U) {
      out.push_back(static_cast<char>(0xC0U | (code_point >> 6U)));
      out.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    } else {
      out.push_back(static_cast<char>(0xE0U | (code_point >> 12U)));
      out.push_back(static_cast<char>(0x80U | ((code_point >> 6U) & 0x3FU)));
      out.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    }
    return true;
  }

  bool ReadNumber(double& out, std::string& error) {
    const std::size_t start = pos_;
    Match('-');
    if (!Match('0') && !SkipDigits()) {
      return Fail("expected digits in number", error);
    }
    if (Match('.') && !SkipDigits()) {
      return Fail("expected digits after decimal point", error);
    }
    if (Match('e') || Match('E')) {
      if (!Match('+')) {
        Match('-');
      }
      if (!SkipDigits()) {
        return Fail("expected exponent digits", error);
      }
    }

    const std::string text(input_.substr(start, pos_ - start));
    char* end = nullptr;
    errno = 0;
    out = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || errno == ERANGE || !std::isfinite(out)) {
      return Fail("numeric value out of range", error);
    }
    return true;
  }

  void SkipWhitespace() {
    while (!AtEnd() && std::isspace(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
    }
  }

  bool SkipDigits() {
    std::size_t count = 0;
    while (!AtEnd() && std::isdigit(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
      ++count;
    }
    return count > 0U;
  }

  bool Expect(char expected, std::string_view message, std::string& error) {
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

} // namespace

bool Parse(std::string_view input, Value& root, std::string& error) {
  Reader reader(input);
  return reader.ReadDocument(root, error);
}

bool ParseFile(const std::string& path, Value& root, std::string& error) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    error = "unable to open file: " + path;
    return false;
  }
  const std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (!Parse(text, root, error)) {
    error = path + ": " + error;
    return false;
  }
  return true;
}

const Value* FindMember(const Value& object, std::string_view key) {
  if (!object.IsObject()) {
    return nullptr;
  }
  const auto it = object.object_value.find(std::string(key));
  if (it == object.object_value.end()) {
    return nullptr;
  }
  return &it->second;
}

bool TryGetUnsigned(const Value& value, std::uint64_t& out) {
  if (!value.IsNumber() || !std::isfinite(value.number_value) || value.number_value < 0.0) {
    return false;
  }
  const double floored = std::floor(value.number_value);
  if (floored != value.number_value ||
      floored >= static_cast<double>(std::numeric_limits<std::uint64_t>::max())) {
    return false;
  }
  out = static_cast<std::uint64_t>(floored);
  return true;
}

} // namespace admapper::core::json
