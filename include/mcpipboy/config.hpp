#pragma once
#include "registry.hpp"
#include "logging.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpipboy {

/// Startup configuration of the `serve` command.
struct ServeConfig {
    std::vector<std::string> enable;
    std::vector<std::string> disable;
    bool debug = false;
    std::optional<std::string> log_file;
    std::optional<std::string> log_level;
};

/// Split a comma-separated list, trimming blanks and dropping empty items.
[[nodiscard]] std::vector<std::string> split_list(std::string_view csv);

/// Fill fields not set on the command line from MCPIPBOY_ENABLE,
/// MCPIPBOY_DISABLE, MCPIPBOY_LOG_LEVEL and MCPIPBOY_LOG_FILE.
/// The enable/disable variables are only read when neither list was given.
void apply_environment(ServeConfig& cfg);

/// Resolve enable/disable lists against the available tool names.
/// Throws ConfigError if both lists are given or a name is unknown.
[[nodiscard]] ToolFilter resolve_tool_filter(const ServeConfig& cfg,
                                             const std::vector<std::string>& available);

[[nodiscard]] logging::LogOptions log_options(const ServeConfig& cfg);

} // namespace mcpipboy
