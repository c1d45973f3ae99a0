#include "vscore/config/session_config.hpp"

#include <algorithm>
#include <array>
#include <expected>
#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>
#include <toml++/toml.hpp>

namespace vscore::config {

namespace fs = std::filesystem;

namespace {

constexpr std::array<std::string_view, 6> kLogLevels = {
    "trace", "debug", "info", "warn", "error", "off"};

// Reads `key` of `section` into `out` if present. Fails when the value is
// not a boolean.
auto ReadBool(
    const toml::node_view<const toml::node>& section, std::string_view key,
    std::string_view source_name, bool& out) -> Result<void> {
  auto node = section[key];
  if (!node) {
    return {};
  }
  auto value = node.value<bool>();
  if (!value) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format(
                "{}: '{}' must be a boolean", source_name,
                std::string(key))));
  }
  out = *value;
  return {};
}

auto FromTable(const toml::table& tbl, std::string_view source_name)
    -> Result<SessionConfig> {
  SessionConfig config;

  // [session] section (optional)
  if (auto session = tbl["session"]) {
    if (!session.is_table()) {
      return std::unexpected(
          Diagnostic::HostError(
              std::format("{}: 'session' must be a table", source_name)));
    }
    for (auto [key, field] : {
             std::pair{"trace_scoreboard", &config.session.trace_scoreboard},
             std::pair{
                 "ignore_duplicate_defs",
                 &config.session.ignore_duplicate_defs},
             std::pair{"standard_library", &config.session.standard_library},
         }) {
      if (auto result = ReadBool(session, key, source_name, *field); !result) {
        return std::unexpected(std::move(result.error()));
      }
    }
  }

  // [logging] section (optional)
  if (auto logging = tbl["logging"]) {
    if (auto level_node = logging["level"]) {
      auto level = level_node.value<std::string>();
      if (!level) {
        return std::unexpected(
            Diagnostic::HostError(
                std::format(
                    "{}: 'logging.level' must be a string", source_name)));
      }
      if (std::ranges::find(kLogLevels, *level) == kLogLevels.end()) {
        return std::unexpected(
            Diagnostic::HostError(
                std::format(
                    "{}: unknown logging level '{}'", source_name, *level))
                .WithNote(
                    "expected one of trace, debug, info, warn, error, off"));
      }
      config.logging.level = *level;
    }
  }

  return config;
}

}  // namespace

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / "vscore.toml";
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path) -> Result<SessionConfig> {
  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format(
                "failed to parse {}: {}", config_path.string(),
                e.description())));
  }

  auto config = FromTable(tbl, config_path.string());
  if (config) {
    config->root_dir = config_path.parent_path();
  }
  return config;
}

auto ParseConfig(std::string_view text, std::string_view source_name)
    -> Result<SessionConfig> {
  toml::table tbl;
  try {
    tbl = toml::parse(text, source_name);
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format(
                "failed to parse {}: {}", source_name, e.description())));
  }
  return FromTable(tbl, source_name);
}

void ApplyLoggingConfig(const LoggingConfig& logging) {
  spdlog::set_level(spdlog::level::from_str(logging.level));
}

}  // namespace vscore::config
