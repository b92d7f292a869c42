#pragma once
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <spdlog/spdlog.h>
#include <spdlog/logger.h>

#define MCPIPBOY_TRACE(...) ::mcpipboy::logging::logger()->trace(__VA_ARGS__)
#define MCPIPBOY_DEBUG(...) ::mcpipboy::logging::logger()->debug(__VA_ARGS__)
#define MCPIPBOY_INFO(...) ::mcpipboy::logging::logger()->info(__VA_ARGS__)
#define MCPIPBOY_WARN(...) ::mcpipboy::logging::logger()->warn(__VA_ARGS__)
#define MCPIPBOY_ERROR(...) ::mcpipboy::logging::logger()->error(__VA_ARGS__)
#define MCPIPBOY_CRITICAL(...) ::mcpipboy::logging::logger()->critical(__VA_ARGS__)

namespace mcpipboy {
namespace logging {

struct LogOptions {
    /// trace, debug, info, warn, error, critical or off
    std::string level = "warn";
    /// Log file path; stderr when unset. stdout is never used since it
    /// carries protocol traffic.
    std::optional<std::string> file;
    /// Log every inbound and outbound protocol line at debug level.
    bool log_traffic = false;
};

/// Replace the process logger. Throws ConfigError on an unknown level or a
/// log file that cannot be opened.
void init(const LogOptions& opts);

/// The process logger. Before init() this is a logger with no sinks.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

[[nodiscard]] bool traffic_enabled();

/// Throws ConfigError for unknown names.
[[nodiscard]] spdlog::level::level_enum parse_level(std::string_view name);

} // namespace logging
} // namespace mcpipboy
