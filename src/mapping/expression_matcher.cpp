#include "mapping/expression_matcher.hpp"

namespace admapper::mapping {

namespace {

bool HasTag(const TagMap& tags, const std::string& key, const std::string& value) {
  const auto it = tags.find(key);
  return it != tags.end() && it->second == value;
}

} // namespace

bool Matches(const TagMap& tags, const Expression& expression) {
  for (const Operand& operand : expression.operands) {
    if (!HasTag(tags, operand.key, operand.value)) {
      return false;
    }
  }
  return true;
}

bool Matches(const TagMap& tags, const TagMap& required) {
  for (const auto& [key, value] : required) {
    if (!HasTag(tags, key, value)) {
      return false;
    }
  }
  return true;
}

bool FlattenExpression(const Expression& expression, TagMap& required, std::string& error) {
  required.clear();
  for (const Operand& operand : expression.operands) {
    const auto [it, inserted] = required.emplace(operand.key, operand.value);
    if (!inserted && it->second != operand.value) {
      error = "conflicting operands for tag '" + operand.key + "': '" + it->second + "' and '" +
              operand.value + "'";
      required.clear();
      return false;
    }
  }
  return true;
}

} // namespace admapper::mapping
