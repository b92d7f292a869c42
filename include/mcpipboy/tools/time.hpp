#pragma once
#include "../clock.hpp"
#include "../tool.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mcpipboy {
namespace tools {

/// Seconds since the Unix epoch plus a sub-second part in [0, 1e9).
struct TimePoint {
    int64_t seconds = 0;
    int64_t nanos = 0;

    [[nodiscard]] static TimePoint from(std::chrono::system_clock::time_point tp);
    [[nodiscard]] TimePoint plus_nanos(int64_t delta) const;
};

struct TimeInput {
    std::string format = "iso";
    std::string timezone = "local";
    std::optional<std::string> input;
    std::optional<std::string> offset;
};

class TimeTool : public TypedTool<TimeInput> {
public:
    explicit TimeTool(std::shared_ptr<const Clock> clock);

    /// Parses absolute and relative date expressions. Inputs without a zone
    /// are UTC; relative forms are resolved against `now`.
    /// Throws ExecutionError with a usage hint when nothing matches.
    [[nodiscard]] static TimePoint parse_time(const std::string& input, TimePoint now);

    /// Duration like "1h30m", "-45s" or "+2d" in nanoseconds (units ns, us,
    /// ms, s, m, h, d, w). nullopt when malformed.
    [[nodiscard]] static std::optional<int64_t> parse_offset(std::string_view text);

    /// "utc", "local" or a zone name found in the zoneinfo database.
    [[nodiscard]] static bool is_valid_timezone(const std::string& name);

    [[nodiscard]] static std::string format_time(const TimePoint& t, const std::string& format,
                                                 const std::string& timezone);

protected:
    TimeInput parse(const nlohmann::json& params) const override;
    nlohmann::json run(const TimeInput& input) const override;

private:
    std::shared_ptr<const Clock> clock_;
};

} // namespace tools
} // namespace mcpipboy
