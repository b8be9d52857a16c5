#pragma once

#include "cache/mapping_cache.hpp"
#include "resolver/detector_mapper.hpp"

#include <string>

namespace admapper::metrics {

// Single-line JSON object read by the metrics exporter:
//   {"cache.hit":N,"cache.miss":N,"cache.size":N,"cache.corrupt_evictions":N,
//    "resolver.resolutions":N,"resolver.errors":N}
// Metric names are stable; exporters scrape by name.
std::string FormatStatsJson(const cache::CacheStats& cache_stats,
                            const resolver::LookupStats& lookup_stats);

} // namespace admapper::metrics
