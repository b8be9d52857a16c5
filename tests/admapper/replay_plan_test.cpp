#include "admapper/replay/replay_plan.hpp"

#include "../common/mapping_fixtures.hpp"

#include <catch2/catch.hpp>

#include <string>

using admapper::replay::ParseReplayPlanText;
using admapper::replay::ReplayPlan;
using admapper::replay::ReplayStep;
namespace common = admapper::tests::common;

TEST_CASE("Replay plans parse mappings and ordered steps", "[replay]") {
  ReplayPlan plan;
  std::string error;
  REQUIRE(ParseReplayPlanText(R"({
    "mappings": [
      {"detector": {"uuid": "2c49ba26-1a7d-43f4-b70c-c6644a2c1689"},
       "expression": {"operands": [{"key": "region", "value": "us"}]}}
    ],
    "steps": [
      {"lookup": {"region": "us"}},
      {"refresh": []}
    ]
  })",
                              plan, error));

  REQUIRE(plan.initial_mappings.size() == 1U);
  REQUIRE(plan.initial_mappings.front().detector.Id() == common::kDetectorOne);
  REQUIRE(plan.steps.size() == 2U);
  REQUIRE(plan.steps[0].kind == ReplayStep::Kind::kLookup);
  REQUIRE(plan.steps[0].tags == admapper::mapping::TagMap{{"region", "us"}});
  REQUIRE(plan.steps[1].kind == ReplayStep::Kind::kRefresh);
  REQUIRE(plan.steps[1].mappings.empty());
}

TEST_CASE("Mappings are optional but steps are required", "[replay]") {
  ReplayPlan plan;
  std::string error;
  REQUIRE(ParseReplayPlanText(R"({"steps": []})", plan, error));
  REQUIRE(plan.initial_mappings.empty());

  REQUIRE_FALSE(ParseReplayPlanText(R"({"mappings": []})", plan, error));
  REQUIRE(error == "steps must be an array");
  REQUIRE_FALSE(ParseReplayPlanText(R"([])", plan, error));
  REQUIRE(error == "replay root must be a JSON object");
}

TEST_CASE("Malformed steps are reported by index", "[replay]") {
  ReplayPlan plan;
  std::string error;

  REQUIRE_FALSE(ParseReplayPlanText(R"({"steps": [{"lookup": {}}, {"resolve": {}}]})", plan,
                                    error));
  REQUIRE(error == "steps[1]: unknown step kind 'resolve'");

  REQUIRE_FALSE(ParseReplayPlanText(R"({"steps": [{"lookup": {}, "refresh": []}]})", plan,
                                    error));
  REQUIRE(error.rfind("steps[0] must be an object with exactly one of", 0) == 0U);

  REQUIRE_FALSE(ParseReplayPlanText(R"({"steps": [{"lookup": {"region": 1}}]})", plan, error));
  REQUIRE(error == "steps[0].lookup.region must be a string");
}
