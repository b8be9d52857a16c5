#pragma once

#include "mapping/detector.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace admapper::replay {

struct ReplayStep {
  enum class Kind {
    kLookup,
    kRefresh,
  };

  Kind kind = Kind::kLookup;
  // kLookup: the metric's tag-set.
  mapping::TagMap tags;
  // kRefresh: the full upstream mapping list at this point in time.
  std::vector<mapping::DetectorMapping> mappings;
};

// A recorded sequence of metric lookups and refresh snapshots.
//
//   {
//     "mappings": [<mapping>, ...],
//     "steps": [
//       {"lookup": {"region": "us", "env": "prod"}},
//       {"refresh": [<mapping>, ...]}
//     ]
//   }
// `mappings` is the upstream state before the first step. Mapping records use
// the shape documented in mapping/mapping_json.hpp.
struct ReplayPlan {
  std::vector<mapping::DetectorMapping> initial_mappings;
  std::vector<ReplayStep> steps;
};

bool ParseReplayPlanText(std::string_view json_text, ReplayPlan& plan, std::string& error);

bool LoadReplayPlanFile(const std::string& path, ReplayPlan& plan, std::string& error);

} // namespace admapper::replay
