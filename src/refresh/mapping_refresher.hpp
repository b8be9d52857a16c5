#pragma once

#include "cache/invalidation_engine.hpp"
#include "mapping/detector.hpp"

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace admapper::core::logging {
class Logger;
}

namespace admapper::refresh {

struct RefreshReport {
  // True when another cycle was still running and this one did nothing.
  bool skipped = false;
  std::size_t mappings_received = 0;
  std::size_t newly_disabled = 0;
  std::size_t created_or_changed = 0;
  cache::PruneReport prune;
  cache::EvictionReport eviction;
};

// Result of comparing a fresh mapping list with the last one applied.
struct MappingDelta {
  std::vector<mapping::DetectorMapping> newly_disabled;
  std::vector<mapping::DetectorMapping> created_or_changed;
  // Previous mapping of each enabled detector whose expression changed.
  // Tag-sets it matched may still list the detector.
  std::vector<mapping::DetectorMapping> retargeted_from;
};

// Splits `current` against `previous` (keyed by canonical detector id):
// - newly disabled: disabled now, and enabled or unknown before; also any
//   detector that was enabled before and is missing from `current`
// - created or changed: enabled now, and unknown, disabled, or carrying a
//   different expression before
// - retargeted from: for a detector enabled before and after with a
//   different expression, its previous mapping
// Entries whose id is not valid UUID text are ignored.
MappingDelta DiffMappings(
    const std::unordered_map<std::string, mapping::DetectorMapping>& previous,
    const std::vector<mapping::DetectorMapping>& current);

// Drives the invalidation engine from periodic snapshots of the full
// mapping list. The periodic trigger itself lives outside this class.
//
// A cycle runs prune-then-evict to completion and then records `current`
// as the last applied state. Cycles never overlap: one that starts while
// another is running returns immediately with `skipped` set.
class MappingRefresher {
public:
  MappingRefresher(cache::InvalidationEngine& engine, core::logging::Logger& logger);

  // Seeds the last-applied state without invalidating anything, for a cache
  // that was just populated against `mappings`.
  void Prime(const std::vector<mapping::DetectorMapping>& mappings);

  RefreshReport RunCycle(const std::vector<mapping::DetectorMapping>& current);

  std::size_t KnownMappings() const;

private:
  void RecordLocked(const std::vector<mapping::DetectorMapping>& mappings);

  cache::InvalidationEngine& engine_;
  core::logging::Logger& logger_;
  mutable std::mutex cycle_mutex_;
  std::unordered_map<std::string, mapping::DetectorMapping> last_applied_;
};

} // namespace admapper::refresh
