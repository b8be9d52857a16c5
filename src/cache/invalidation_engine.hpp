#pragma once

#include "cache/mapping_cache.hpp"
#include "mapping/detector.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace admapper::core::logging {
class Logger;
}

namespace admapper::cache {

struct PruneReport {
  std::vector<std::string> disabled_ids;
  std::size_t mappings_skipped = 0;
  std::size_t entries_scanned = 0;
  std::size_t entries_pruned = 0;
  // Subset of `entries_pruned` left holding an empty list.
  std::size_t entries_emptied = 0;
  // Entries that expired or changed between the snapshot and the rewrite.
  std::size_t entries_superseded = 0;
  std::size_t corrupt_entries = 0;
};

struct EvictionReport {
  std::size_t mappings_received = 0;
  std::size_t mappings_skipped = 0;
  std::size_t entries_scanned = 0;
  std::vector<std::string> evicted_keys;
  std::size_t corrupt_entries = 0;
};

// Keeps the mapping cache consistent with upstream mapping changes while
// lookups keep running.
//
// Both passes work the same way: take a snapshot of the live entries, decide
// per entry what must change without touching the cache, then apply the
// staged changes. Lookups for unrelated keys are never blocked, and a pass
// either stages and applies its whole batch or, for an empty or fully
// skipped batch, changes nothing. A staged rewrite is applied only to an
// entry that still holds the value it was computed from.
//
// Cost is O(entries x batch size) per pass. Batches are expected to be small
// next to the cache, so the scan stays in memory without a reverse index.
class InvalidationEngine {
public:
  InvalidationEngine(MappingCache& cache, core::logging::Logger& logger);

  // Disabled detectors: strips every id in `disabled_mappings` from each
  // entry that lists it and rewrites the entry under the same key.
  //
  // An entry whose list becomes empty stays cached as an empty list. It
  // means "resolved, currently no active detectors" and spares the mapping
  // service a re-resolution; lookups treat it as a hit.
  PruneReport RemoveDisabledDetectorMappings(
      const std::vector<mapping::DetectorMapping>& disabled_mappings);

  // New or changed mappings: evicts every entry whose tag-set satisfies at
  // least one mapping's expression, forcing re-resolution on the next
  // lookup. A mapping whose expression cannot be flattened is logged and
  // skipped; the rest of the batch is still applied.
  EvictionReport InvalidateEntriesWithChangedMappings(
      const std::vector<mapping::DetectorMapping>& changed_mappings);

private:
  MappingCache& cache_;
  core::logging::Logger& logger_;
};

} // namespace admapper::cache
