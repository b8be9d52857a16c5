#pragma once

#include "mapping/detector.hpp"

#include <string>
#include <vector>

namespace admapper::resolver {

// Contract of the remote mapping service that resolves a metric's tag-set to
// the mapping records that apply to it.
//
// Returned records carry the detector's enabled flag as the service knows it;
// filtering is the caller's job. A `false` return is a resolution failure
// (transport, timeout, server error) described by `error`; it is never
// retried here.
class IDetectorResolutionService {
public:
  virtual ~IDetectorResolutionService() = default;

  virtual bool Resolve(const mapping::TagMap& tags,
                       std::vector<mapping::DetectorMapping>& mappings,
                       std::string& error) = 0;
};

} // namespace admapper::resolver
