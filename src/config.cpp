#include "mcpipboy/config.hpp"
#include "mcpipboy/error.hpp"
#include <algorithm>
#include <cstdlib>

namespace mcpipboy {

namespace {

std::optional<std::string> env(const char* name) {
    const char* v = std::getenv(name);
    if (!v || !*v) return std::nullopt;
    return std::string(v);
}

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& s : items) {
        if (!out.empty()) out += ", ";
        out += s;
    }
    return out;
}

void check_known(const std::vector<std::string>& names, const std::vector<std::string>& available) {
    for (const auto& n : names) {
        if (std::find(available.begin(), available.end(), n) == available.end()) {
            throw ConfigError("invalid tool: " + n + ". Available tools: " + join(available));
        }
    }
}

} // anonymous namespace

std::vector<std::string> split_list(std::string_view csv) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= csv.size()) {
        size_t comma = csv.find(',', start);
        if (comma == std::string_view::npos) comma = csv.size();
        std::string_view item = csv.substr(start, comma - start);
        size_t b = item.find_first_not_of(" \t");
        size_t e = item.find_last_not_of(" \t");
        if (b != std::string_view::npos) {
            out.emplace_back(item.substr(b, e - b + 1));
        }
        start = comma + 1;
    }
    return out;
}

void apply_environment(ServeConfig& cfg) {
    if (cfg.enable.empty() && cfg.disable.empty()) {
        if (auto v = env("MCPIPBOY_ENABLE")) cfg.enable = split_list(*v);
        if (auto v = env("MCPIPBOY_DISABLE")) cfg.disable = split_list(*v);
    }
    if (!cfg.log_level) cfg.log_level = env("MCPIPBOY_LOG_LEVEL");
    if (!cfg.log_file) cfg.log_file = env("MCPIPBOY_LOG_FILE");
}

ToolFilter resolve_tool_filter(const ServeConfig& cfg, const std::vector<std::string>& available) {
    if (!cfg.enable.empty() && !cfg.disable.empty()) {
        throw ConfigError("--enable and --disable flags are mutually exclusive");
    }
    if (!cfg.enable.empty()) {
        check_known(cfg.enable, available);
        return ToolFilter::allow_only({cfg.enable.begin(), cfg.enable.end()});
    }
    if (!cfg.disable.empty()) {
        check_known(cfg.disable, available);
        std::set<std::string> allowed;
        for (const auto& name : available) {
            if (std::find(cfg.disable.begin(), cfg.disable.end(), name) == cfg.disable.end()) {
                allowed.insert(name);
            }
        }
        return ToolFilter::allow_only(std::move(allowed));
    }
    return ToolFilter::allow_all();
}

logging::LogOptions log_options(const ServeConfig& cfg) {
    logging::LogOptions opts;
    opts.level = "info";
    if (cfg.log_level) opts.level = *cfg.log_level;
    if (cfg.debug) opts.level = "debug";
    opts.file = cfg.log_file;
    opts.log_traffic = cfg.debug;
    return opts;
}

} // namespace mcpipboy
