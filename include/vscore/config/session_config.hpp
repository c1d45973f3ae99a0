#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "vscore/common/diagnostic/diagnostic.hpp"
#include "vscore/score/session_options.hpp"

namespace vscore::config {

struct LoggingConfig {
  // One of trace, debug, info, warn, error, off
  std::string level = "info";
};

struct SessionConfig {
  score::SessionOptions session;
  LoggingConfig logging;

  // Directory where vscore.toml was found
  std::filesystem::path root_dir;
};

// Search for vscore.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse a vscore.toml file. Every section and key is optional.
auto LoadConfig(const std::filesystem::path& config_path)
    -> Result<SessionConfig>;

// Same as LoadConfig, for text already in memory. `source_name` is used in
// messages.
auto ParseConfig(std::string_view text, std::string_view source_name)
    -> Result<SessionConfig>;

// Sets the level of the default spdlog logger.
void ApplyLoggingConfig(const LoggingConfig& logging);

}  // namespace vscore::config
