#ifndef ADMAPPER_TESTS_COMMON_MAPPING_FIXTURES_HPP_
#define ADMAPPER_TESTS_COMMON_MAPPING_FIXTURES_HPP_

#include "cache/invalidation_engine.hpp"
#include "cache/mapping_cache.hpp"
#include "cache/sharded_ttl_store.hpp"
#include "core/clock.hpp"
#include "core/logging/logger.hpp"
#include "mapping/detector.hpp"

#include <algorithm>
#include <chrono>
#include <initializer_list>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace admapper::tests::common {

inline constexpr const char* kDetectorOne = "2c49ba26-1a7d-43f4-b70c-c6644a2c1689";
inline constexpr const char* kDetectorTwo = "5a7c3f1e-9b2d-4e8a-a1c4-3f6e2d9b8c70";
inline constexpr const char* kDetectorThree = "e3b0c442-98fc-4c14-9afb-f4c8996fb924";
inline constexpr const char* kDetectorFour = "0f8fad5b-d9cb-469f-a165-70867728950e";

// Clock that only moves when told to.
class ManualClock final : public core::IClock {
public:
  TimePoint Now() const override {
    return now_;
  }

  void Advance(std::chrono::milliseconds delta) {
    now_ += delta;
  }

private:
  TimePoint now_ = TimePoint(std::chrono::hours(1));
};

using TagList = std::initializer_list<std::pair<const char*, const char*>>;

inline mapping::DetectorMapping MakeMapping(const char* detector_id, bool enabled,
                                            TagList operands) {
  mapping::DetectorMapping result;
  result.detector = mapping::Detector(detector_id, enabled);
  for (const auto& [key, value] : operands) {
    result.expression.operands.push_back(mapping::Operand{key, value});
  }
  return result;
}

inline std::vector<mapping::Detector> Detectors(std::initializer_list<const char*> ids) {
  std::vector<mapping::Detector> detectors;
  for (const char* id : ids) {
    detectors.emplace_back(id);
  }
  return detectors;
}

// Sorted ids, for order-insensitive comparisons.
inline std::vector<std::string> SortedIds(const std::vector<mapping::Detector>& detectors) {
  std::vector<std::string> ids;
  ids.reserve(detectors.size());
  for (const mapping::Detector& detector : detectors) {
    ids.push_back(detector.Id());
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

inline std::vector<std::string> SortedIds(std::initializer_list<const char*> ids) {
  std::vector<std::string> sorted(ids.begin(), ids.end());
  std::sort(sorted.begin(), sorted.end());
  return sorted;
}

// Cache wired to a manual clock and an in-memory log sink.
struct CacheHarness {
  explicit CacheHarness(std::chrono::milliseconds ttl = std::chrono::minutes(120),
                        std::size_t shard_count = 4)
      : logger(core::logging::LogLevel::kDebug, log_output),
        cache(std::make_unique<cache::ShardedTtlStore>(ttl, shard_count, clock), logger),
        engine(cache, logger) {}

  std::string Logs() const {
    return log_output.str();
  }

  ManualClock clock;
  std::ostringstream log_output;
  core::logging::Logger logger;
  cache::MappingCache cache;
  cache::InvalidationEngine engine;
};

} // namespace admapper::tests::common

#endif // ADMAPPER_TESTS_COMMON_MAPPING_FIXTURES_HPP_
