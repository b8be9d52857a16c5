#pragma once

namespace admapper::core::errors {

// Process exit contract for the `admapper` CLI.
//
// 0/1/2 keep their conventional meanings (success, generic failure, usage).
// The remaining values separate bad configuration from bad replay input so
// wrappers can branch without scraping stderr.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kReplayInputInvalid = 20,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace admapper::core::errors
