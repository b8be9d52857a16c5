#pragma once

#include "admapper/replay/replay_plan.hpp"
#include "config/service_config.hpp"

#include <ostream>

namespace admapper::core::logging {
class Logger;
}

namespace admapper::replay {

// Builds the full mapping stack (store, cache, invalidation engine,
// resolution service, mapper, refresher) from `config`, plays `plan`
// through it, and writes one line per step plus a final stats line:
//
//   lookup key=env:prod,region:us detectors=<uuid>,<uuid>
//   refresh disabled=1 changed=0 pruned=2 evicted=0 skipped_mappings=0
//   stats {"cache.hit":3,...}
void RunReplay(const ReplayPlan& plan, const config::ServiceConfig& config, std::ostream& out,
               core::logging::Logger& logger);

} // namespace admapper::replay
