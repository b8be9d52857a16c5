#include "metrics/stats_json.hpp"

#include "core/json_utils.hpp"

#include <cstdint>
#include <sstream>
#include <string_view>

namespace admapper::metrics {

namespace {

void AppendField(std::ostringstream& out, bool& first, std::string_view name,
                 const std::uint64_t value) {
  if (!first) {
    out << ',';
  }
  first = false;
  out << core::QuoteJson(name) << ':' << value;
}

} // namespace

std::string FormatStatsJson(const cache::CacheStats& cache_stats,
                            const resolver::LookupStats& lookup_stats) {
  std::ostringstream out;
  bool first = true;
  out << '{';
  AppendField(out, first, "cache.hit", cache_stats.hits);
  AppendField(out, first, "cache.miss", cache_stats.misses);
  AppendField(out, first, "cache.size", cache_stats.size);
  AppendField(out, first, "cache.corrupt_evictions", cache_stats.corrupt_evictions);
  AppendField(out, first, "resolver.resolutions", lookup_stats.resolutions);
  AppendField(out, first, "resolver.errors", lookup_stats.resolution_errors);
  out << '}';
  return out.str();
}

} // namespace admapper::metrics
