#include "resolver/detector_mapper.hpp"

#include "cache/key_codec.hpp"
#include "core/logging/logger.hpp"

#include <optional>
#include <string>
#include <utility>

namespace admapper::resolver {

DetectorMapper::DetectorMapper(cache::MappingCache& cache,
                               IDetectorResolutionService& service,
                               core::logging::Logger& logger)
    : cache_(cache), service_(service), logger_(logger) {}

std::vector<mapping::Detector> DetectorMapper::Lookup(const mapping::TagMap& tags) {
  const std::string cache_key = cache::EncodeKey(tags);
  if (std::optional<std::vector<mapping::Detector>> cached = cache_.Find(cache_key);
      cached.has_value()) {
    return std::move(*cached);
  }

  std::vector<mapping::DetectorMapping> mappings;
  std::string error;
  resolutions_.fetch_add(1, std::memory_order_relaxed);
  if (!service_.Resolve(tags, mappings, error)) {
    resolution_errors_.fetch_add(1, std::memory_order_relaxed);
    logger_.Warn("detector resolution failed; not caching",
                 {{"cache_key", cache_key}, {"error", error}});
    return {};
  }

  std::vector<mapping::Detector> detectors = ActiveDetectors(mappings, cache_key);
  cache_.Put(cache_key, detectors);
  return detectors;
}

std::vector<mapping::Detector> DetectorMapper::ActiveDetectors(
    const std::vector<mapping::DetectorMapping>& mappings, const std::string& cache_key) {
  std::vector<mapping::Detector> active;
  active.reserve(mappings.size());
  for (const mapping::DetectorMapping& mapping : mappings) {
    if (!mapping.detector.Enabled()) {
      continue;
    }
    std::string canonical;
    std::string error;
    if (!mapping::NormalizeDetectorId(mapping.detector.Id(), canonical, error)) {
      logger_.Warn("ignoring resolved detector with invalid id",
                   {{"cache_key", cache_key}, {"error", error}});
      continue;
    }
    active.emplace_back(std::move(canonical));
  }
  return mapping::UniqueById(active);
}

LookupStats DetectorMapper::Stats() const {
  LookupStats stats;
  stats.resolutions = resolutions_.load(std::memory_order_relaxed);
  stats.resolution_errors = resolution_errors_.load(std::memory_order_relaxed);
  return stats;
}

} // namespace admapper::resolver
