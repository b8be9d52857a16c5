#include "mapping/mapping_json.hpp"

#include <utility>

namespace admapper::mapping {

namespace {

using JsonValue = core::json::Value;

bool ParseOperand(const JsonValue& value, const std::string& path, Operand& operand,
                  std::string& error) {
  if (!value.IsObject()) {
    error = path + " must be an object with key and value";
    return false;
  }
  const JsonValue* key = core::json::FindMember(value, "key");
  const JsonValue* tag_value = core::json::FindMember(value, "value");
  if (key == nullptr || !key->IsString()) {
    error = path + ".key must be a string";
    return false;
  }
  if (tag_value == nullptr || !tag_value->IsString()) {
    error = path + ".value must be a string";
    return false;
  }
  operand.key = key->string_value;
  operand.value = tag_value->string_value;
  return true;
}

bool ParseExpression(const JsonValue& value, Expression& expression, std::string& error) {
  if (!value.IsObject()) {
    error = "expression must be an object";
    return false;
  }
  if (const JsonValue* op = core::json::FindMember(value, "operator"); op != nullptr) {
    if (!op->IsString() || op->string_value != "AND") {
      error = "expression.operator must be \"AND\" (only conjunctive expressions are supported)";
      return false;
    }
  }

  const JsonValue* operands = core::json::FindMember(value, "operands");
  if (operands == nullptr || !operands->IsArray()) {
    error = "expression.operands must be an array";
    return false;
  }
  expression.operands.clear();
  expression.operands.reserve(operands->array_value.size());
  for (std::size_t i = 0; i < operands->array_value.size(); ++i) {
    Operand operand;
    if (!ParseOperand(operands->array_value[i],
                      "expression.operands[" + std::to_string(i) + "]", operand, error)) {
      return false;
    }
    expression.operands.push_back(std::move(operand));
  }
  return true;
}

} // namespace

bool ParseDetectorMapping(const JsonValue& value, DetectorMapping& mapping, std::string& error) {
  if (!value.IsObject()) {
    error = "mapping must be an object";
    return false;
  }

  const JsonValue* detector = core::json::FindMember(value, "detector");
  if (detector == nullptr || !detector->IsObject()) {
    error = "detector must be an object";
    return false;
  }
  const JsonValue* uuid = core::json::FindMember(*detector, "uuid");
  if (uuid == nullptr || !uuid->IsString()) {
    error = "detector.uuid must be a string";
    return false;
  }
  std::string canonical;
  if (!NormalizeDetectorId(uuid->string_value, canonical, error)) {
    error = "detector.uuid: " + error;
    return false;
  }

  bool enabled = true;
  if (const JsonValue* flag = core::json::FindMember(*detector, "enabled"); flag != nullptr) {
    if (!flag->IsBool()) {
      error = "detector.enabled must be a bool";
      return false;
    }
    enabled = flag->bool_value;
  }

  const JsonValue* expression = core::json::FindMember(value, "expression");
  if (expression == nullptr) {
    error = "expression is required";
    return false;
  }
  Expression parsed_expression;
  if (!ParseExpression(*expression, parsed_expression, error)) {
    return false;
  }

  mapping.detector = Detector(std::move(canonical), enabled);
  mapping.expression = std::move(parsed_expression);
  return true;
}

bool ParseDetectorMappingList(const JsonValue& value, std::string_view path,
                              std::vector<DetectorMapping>& mappings, std::string& error) {
  if (!value.IsArray()) {
    error = std::string(path) + " must be an array";
    return false;
  }
  std::vector<DetectorMapping> parsed;
  parsed.reserve(value.array_value.size());
  for (std::size_t i = 0; i < value.array_value.size(); ++i) {
    DetectorMapping mapping;
    std::string item_error;
    if (!ParseDetectorMapping(value.array_value[i], mapping, item_error)) {
      error = std::string(path) + "[" + std::to_string(i) + "]." + item_error;
      return false;
    }
    parsed.push_back(std::move(mapping));
  }
  mappings = std::move(parsed);
  return true;
}

bool ParseTagMap(const JsonValue& value, std::string_view path, TagMap& tags,
                 std::string& error) {
  if (!value.IsObject()) {
    error = std::string(path) + " must be an object of string tags";
    return false;
  }
  TagMap parsed;
  for (const auto& [key, tag_value] : value.object_value) {
    if (!tag_value.IsString()) {
      error = std::string(path) + "." + key + " must be a string";
      return false;
    }
    parsed.emplace(key, tag_value.string_value);
  }
  tags = std::move(parsed);
  return true;
}

} // namespace admapper::mapping
