#include "mapping/mapping_json.hpp"

#include "../common/mapping_fixtures.hpp"

#include <catch2/catch.hpp>

#include <string>
#include <vector>

using admapper::mapping::DetectorMapping;
using admapper::mapping::TagMap;
namespace common = admapper::tests::common;
namespace json = admapper::core::json;
namespace mapping = admapper::mapping;

namespace {

json::Value ParseOrFail(const std::string& text) {
  json::Value root;
  std::string error;
  REQUIRE(json::Parse(text, root, error));
  return root;
}

} // namespace

TEST_CASE("Mapping records parse with defaults", "[mapping][json]") {
  const json::Value root = ParseOrFail(R"({
    "detector": {"uuid": "2C49BA26-1A7D-43F4-B70C-C6644A2C1689"},
    "expression": {"operands": [{"key": "region", "value": "us"}]}
  })");

  DetectorMapping parsed;
  std::string error;
  REQUIRE(mapping::ParseDetectorMapping(root, parsed, error));
  REQUIRE(parsed.detector.Id() == common::kDetectorOne);
  REQUIRE(parsed.detector.Enabled());
  REQUIRE(parsed.expression == common::MakeMapping(common::kDetectorOne, true,
                                                   {{"region", "us"}})
                                   .expression);
}

TEST_CASE("Disabled mappings and explicit AND are accepted", "[mapping][json]") {
  const json::Value root = ParseOrFail(R"({
    "detector": {"uuid": "5a7c3f1e-9b2d-4e8a-a1c4-3f6e2d9b8c70", "enabled": false},
    "expression": {"operator": "AND", "operands": [
      {"key": "region", "value": "us"}, {"key": "env", "value": "prod"}]}
  })");

  DetectorMapping parsed;
  std::string error;
  REQUIRE(mapping::ParseDetectorMapping(root, parsed, error));
  REQUIRE_FALSE(parsed.detector.Enabled());
  REQUIRE(parsed.expression.operands.size() == 2U);
}

TEST_CASE("Non-conjunctive operators are rejected", "[mapping][json]") {
  const json::Value root = ParseOrFail(R"({
    "detector": {"uuid": "5a7c3f1e-9b2d-4e8a-a1c4-3f6e2d9b8c70"},
    "expression": {"operator": "OR", "operands": []}
  })");

  DetectorMapping parsed;
  std::string error;
  REQUIRE_FALSE(mapping::ParseDetectorMapping(root, parsed, error));
  REQUIRE(error.find("expression.operator") != std::string::npos);
}

TEST_CASE("Mapping list errors name the failing element", "[mapping][json]") {
  const json::Value root = ParseOrFail(R"([
    {"detector": {"uuid": "5a7c3f1e-9b2d-4e8a-a1c4-3f6e2d9b8c70"},
     "expression": {"operands": []}},
    {"detector": {"uuid": "not-a-uuid"}, "expression": {"operands": []}}
  ])");

  std::vector<DetectorMapping> mappings;
  std::string error;
  REQUIRE_FALSE(mapping::ParseDetectorMappingList(root, "mappings", mappings, error));
  REQUIRE(error.rfind("mappings[1].detector.uuid", 0) == 0U);
  REQUIRE(mappings.empty());
}

TEST_CASE("Operands must carry string key and value", "[mapping][json]") {
  const json::Value root = ParseOrFail(R"({
    "detector": {"uuid": "5a7c3f1e-9b2d-4e8a-a1c4-3f6e2d9b8c70"},
    "expression": {"operands": [{"key": "region", "value": 7}]}
  })");

  DetectorMapping parsed;
  std::string error;
  REQUIRE_FALSE(mapping::ParseDetectorMapping(root, parsed, error));
  REQUIRE(error == "expression.operands[0].value must be a string");
}

TEST_CASE("Tag maps require string values", "[mapping][json]") {
  TagMap tags;
  std::string error;
  REQUIRE(mapping::ParseTagMap(ParseOrFail(R"({"region": "us", "env": "prod"})"), "lookup", tags,
                               error));
  REQUIRE(tags == TagMap{{"env", "prod"}, {"region", "us"}});

  REQUIRE_FALSE(mapping::ParseTagMap(ParseOrFail(R"({"region": 1})"), "lookup", tags, error));
  REQUIRE(error == "lookup.region must be a string");
}
