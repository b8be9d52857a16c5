#pragma once

#include "core/json_dom.hpp"
#include "mapping/detector.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace admapper::mapping {

// Mapping record shape, as served by the mapping service:
//   {
//     "detector": {"uuid": "2c49ba26-1a7d-43f4-b70c-c6644a2c1689", "enabled": true},
//     "expression": {
//       "operator": "AND",
//       "operands": [{"key": "region", "value": "us"}, {"key": "env", "value": "prod"}]
//     }
//   }
// `enabled` defaults to true and `operator` to "AND". Any other operator is
// rejected: expressions are conjunctive only.
bool ParseDetectorMapping(const core::json::Value& value, DetectorMapping& mapping,
                          std::string& error);

// Errors are prefixed with the failing index, e.g. `mappings[3].detector.uuid`.
bool ParseDetectorMappingList(const core::json::Value& value, std::string_view path,
                              std::vector<DetectorMapping>& mappings, std::string& error);

// `{"tag": "value", ...}`; every value must be a string.
bool ParseTagMap(const core::json::Value& value, std::string_view path, TagMap& tags,
                 std::string& error);

} // namespace admapper::mapping
