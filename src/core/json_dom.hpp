#ifndef ADMAPPER_CORE_JSON_DOM_HPP_
#define ADMAPPER_CORE_JSON_DOM_HPP_

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace admapper::core::json {

// Small STL-only JSON document used for configuration files and replay
// input. Object members are kept in a sorted map, so duplicate member names
// collapse to the last occurrence.
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
  double number_value = 0.0;
  bool bool_value = false;

  bool IsObject() const {
    return type == Type::kObject;
  }
  bool IsArray() const {
    return type == Type::kArray;
  }
  bool IsString() const {
    return type == Type::kString;
  }
  bool IsNumber() const {
    return type == Type::kNumber;
  }
  bool IsBool() const {
    return type == Type::kBool;
  }
};

// Parses one JSON document. Errors carry line/column of the failure.
bool Parse(std::string_view input, Value& root, std::string& error);

// Reads and parses a file; IO failures are reported with the path.
bool ParseFile(const std::string& path, Value& root, std::string& error);

// Returns nullptr when `object` is not an object or has no such member.
const Value* FindMember(const Value& object, std::string_view key);

// Accepts only finite, integral, non-negative numbers.
bool TryGetUnsigned(const Value& value, std::uint64_t& out);

} // namespace admapper::core::json

#endif // ADMAPPER_CORE_JSON_DOM_HPP_
