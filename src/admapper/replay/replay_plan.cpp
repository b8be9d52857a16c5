#include "admapper/replay/replay_plan.hpp"

#include "core/json_dom.hpp"
#include "mapping/mapping_json.hpp"

#include <utility>

namespace admapper::replay {

namespace {

using JsonValue = core::json::Value;

bool ParseStep(const JsonValue& value, const std::string& path, ReplayStep& step,
               std::string& error) {
  if (!value.IsObject() || value.object_value.size() != 1U) {
    error = path + " must be an object with exactly one of: lookup, refresh";
    return false;
  }

  const auto& [kind, body] = *value.object_value.begin();
  if (kind == "lookup") {
    step.kind = ReplayStep::Kind::kLookup;
    return mapping::ParseTagMap(body, path + ".lookup", step.tags, error);
  }
  if (kind == "refresh") {
    step.kind = ReplayStep::Kind::kRefresh;
    return mapping::ParseDetectorMappingList(body, path + ".refresh", step.mappings, error);
  }

  error = path + ": unknown step kind '" + kind + "'";
  return false;
}

bool ParseReplayRoot(const JsonValue& root, ReplayPlan& plan, std::string& error) {
  if (!root.IsObject()) {
    error = "replay root must be a JSON object";
    return false;
  }

  ReplayPlan parsed;
  if (const JsonValue* mappings = core::json::FindMember(root, "mappings"); mappings != nullptr) {
    if (!mapping::ParseDetectorMappingList(*mappings, "mappings", parsed.initial_mappings,
                                           error)) {
      return false;
    }
  }

  const JsonValue* steps = core::json::FindMember(root, "steps");
  if (steps == nullptr || !steps->IsArray()) {
    error = "steps must be an array";
    return false;
  }
  parsed.steps.reserve(steps->array_value.size());
  for (std::size_t i = 0; i < steps->array_value.size(); ++i) {
    ReplayStep step;
    if (!ParseStep(steps->array_value[i], "steps[" + std::to_string(i) + "]", step, error)) {
      return false;
    }
    parsed.steps.push_back(std::move(step));
  }

  plan = std::move(parsed);
  return true;
}

} // namespace

bool ParseReplayPlanText(std::string_view json_text, ReplayPlan& plan, std::string& error) {
  JsonValue root;
  if (!core::json::Parse(json_text, root, error)) {
    return false;
  }
  return ParseReplayRoot(root, plan, error);
}

bool LoadReplayPlanFile(const std::string& path, ReplayPlan& plan, std::string& error) {
  JsonValue root;
  if (!core::json::ParseFile(path, root, error)) {
    return false;
  }
  if (!ParseReplayRoot(root, plan, error)) {
    error = path + ": " + error;
    return false;
  }
  return true;
}

} // namespace admapper::replay
