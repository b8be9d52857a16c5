#pragma once

#include "mapping/detector.hpp"

#include <string>

namespace admapper::mapping {

// Conjunctive tag matching.
//
// Capability limit: only AND is supported. An expression matches a tag-set
// iff every operand's key is present in the tags with exactly the operand's
// value. An expression with no operands matches every tag-set.
bool Matches(const TagMap& tags, const Expression& expression);

// Same contract against an already flattened `required` tag map.
bool Matches(const TagMap& tags, const TagMap& required);

// Flattens an expression's operands into one key -> value map.
//
// Fails (InvalidExpression) when two operands require different values for
// the same key; such an expression can never match and cannot be reduced to
// a single tag map. Repeated identical operands are accepted.
bool FlattenExpression(const Expression& expression, TagMap& required, std::string& error);

} // namespace admapper::mapping
