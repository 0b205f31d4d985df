#pragma once

namespace agentwatch::core::errors {

// Stable process-exit contract for CLI automation.
//
// The first three values preserve conventional meanings used by scripts:
// - 0 success
// - 1 generic command failure
// - 2 usage/argument failure
//
// Additional values classify common operational failure modes so wrappers can
// branch without scraping stderr text.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kStorageFailed = 20,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace agentwatch::core::errors
