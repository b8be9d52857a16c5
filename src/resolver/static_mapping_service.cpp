#include "resolver/static_mapping_service.hpp"

#include "mapping/expression_matcher.hpp"

#include <utility>

namespace admapper::resolver {

StaticMappingService::StaticMappingService(std::vector<mapping::DetectorMapping> mappings)
    : mappings_(std::move(mappings)) {}

bool StaticMappingService::Resolve(const mapping::TagMap& tags,
                                   std::vector<mapping::DetectorMapping>& mappings,
                                   std::string& error) {
  error.clear();
  mappings.clear();
  std::lock_guard<std::mutex> lock(mutex_);
  ++resolve_calls_;
  for (const mapping::DetectorMapping& candidate : mappings_) {
    if (mapping::Matches(tags, candidate.expression)) {
      mappings.push_back(candidate);
    }
  }
  return true;
}

void StaticMappingService::ReplaceMappings(std::vector<mapping::DetectorMapping> mappings) {
  std::lock_guard<std::mutex> lock(mutex_);
  mappings_ = std::move(mappings);
}

std::uint64_t StaticMappingService::ResolveCalls() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return resolve_calls_;
}

} // namespace admapper::resolver
