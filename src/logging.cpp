#include "mcpipboy/logging.hpp"
#include "mcpipboy/error.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <atomic>
#include <mutex>

namespace mcpipboy {
namespace logging {

namespace {

std::mutex g_mutex;
std::shared_ptr<spdlog::logger> g_logger;
std::atomic<bool> g_traffic{false};

std::shared_ptr<spdlog::logger> make_null_logger() {
    auto sink = std::make_shared<spdlog::sinks::null_sink_mt>();
    auto l = std::make_shared<spdlog::logger>("mcpipboy", sink);
    l->set_level(spdlog::level::off);
    return l;
}

} // anonymous namespace

spdlog::level::level_enum parse_level(std::string_view name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    throw ConfigError("invalid log level: " + std::string(name));
}

void init(const LogOptions& opts) {
    auto level = parse_level(opts.level);

    spdlog::sink_ptr sink;
    if (opts.file) {
        try {
            sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(*opts.file);
        } catch (const spdlog::spdlog_ex& e) {
            throw ConfigError("cannot open log file " + *opts.file + ": " + e.what());
        }
    } else {
        sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    }

    auto l = std::make_shared<spdlog::logger>("mcpipboy", std::move(sink));
    l->set_level(level);
    l->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    l->flush_on(level);

    std::lock_guard<std::mutex> lock(g_mutex);
    g_logger = std::move(l);
    g_traffic = opts.log_traffic;
}

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (!g_logger) g_logger = make_null_logger();
    return g_logger;
}

bool traffic_enabled() {
    return g_traffic;
}

} // namespace logging
} // namespace mcpipboy
