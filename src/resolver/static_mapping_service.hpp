#pragma once

#include "resolver/resolution_service.hpp"

#include <cstdint>
#include <mutex>
#include <vector>

namespace admapper::resolver {

// In-process resolution service over a fixed mapping list.
//
// Used by the replay CLI and tests in place of the remote service. A tag-set
// resolves to every held mapping whose expression it satisfies, disabled
// ones included. `ReplaceMappings` swaps the whole list at once, the way a
// refresh publishes a new upstream state.
class StaticMappingService final : public IDetectorResolutionService {
public:
  StaticMappingService() = default;
  explicit StaticMappingService(std::vector<mapping::DetectorMapping> mappings);

  bool Resolve(const mapping::TagMap& tags,
               std::vector<mapping::DetectorMapping>& mappings,
               std::string& error) override;

  void ReplaceMappings(std::vector<mapping::DetectorMapping> mappings);

  std::uint64_t ResolveCalls() const;

private:
  mutable std::mutex mutex_;
  std::vector<mapping::DetectorMapping> mappings_;
  std::uint64_t resolve_calls_ = 0;
};

} // namespace admapper::resolver
