#pragma once

#include "core/logging/logger.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace agentwatch::cli {

// Options accepted before the subcommand by every command.
struct GlobalOptions {
  std::optional<std::filesystem::path> db_path;
  core::logging::LogLevel log_level = core::logging::LogLevel::kWarn;
};

// Parses `<number><m|h|d>` (for example `30m`, `24h`, `7d`) into seconds.
bool ParseTimeWindowSeconds(std::string_view text, double& seconds, std::string& error);

// Routes `agentwatch` subcommands and returns process exit codes with a stable
// contract for scripts and CI:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => config file invalid
//   20 => database could not be opened
int Dispatch(int argc, char** argv);

} // namespace agentwatch::cli
