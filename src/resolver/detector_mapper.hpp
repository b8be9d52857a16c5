#pragma once

#include "cache/mapping_cache.hpp"
#include "mapping/detector.hpp"
#include "resolver/resolution_service.hpp"

#include <atomic>
#include <cstdint>
#include <vector>

namespace admapper::core::logging {
class Logger;
}

namespace admapper::resolver {

struct LookupStats {
  std::uint64_t resolutions = 0;
  std::uint64_t resolution_errors = 0;
};

// The one entry point the stream stage needs: tag-set in, active detectors
// out, with the mapping cache in front of the resolution service.
//
// On a cache miss the service is called, disabled detectors are dropped, and
// the remaining ids are written back. A failed resolution is logged and
// answered with an empty list but is not cached, so the next event for the
// same tag-set asks the service again.
class DetectorMapper {
public:
  DetectorMapper(cache::MappingCache& cache,
                 IDetectorResolutionService& service,
                 core::logging::Logger& logger);

  std::vector<mapping::Detector> Lookup(const mapping::TagMap& tags);

  LookupStats Stats() const;

private:
  std::vector<mapping::Detector> ActiveDetectors(
      const std::vector<mapping::DetectorMapping>& mappings, const std::string& cache_key);

  cache::MappingCache& cache_;
  IDetectorResolutionService& service_;
  core::logging::Logger& logger_;
  std::atomic<std::uint64_t> resolutions_{0};
  std::atomic<std::uint64_t> resolution_errors_{0};
};

} // namespace admapper::resolver
