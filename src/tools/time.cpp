#include "mcpipboy/tools/time.hpp"
#include "mcpipboy/error.hpp"
#include "mcpipboy/logging.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <limits>
#include <mutex>
#include <regex>

namespace mcpipboy {
namespace tools {

namespace {

constexpr int64_t kNanosPerSecond = 1000000000;

const char* const kMonths[] = {"january", "february", "march", "april", "may", "june", "july",
                               "august", "september", "october", "november", "december"};
const char* const kWeekdays[] = {"sunday", "monday", "tuesday", "wednesday",
                                 "thursday", "friday", "saturday"};

const char* const kStandardHint =
    "\n\nHint: Try using a more standard date format like 'YYYY-MM-DD' or 'January 1, 2025'.";
const char* const kEarlyYearHint =
    "\n\nHint: If you were trying to parse a year prior to 1000, note that dates before year "
    "1000 are not supported. Otherwise, try using a more standard date format like "
    "'YYYY-MM-DD' or 'January 1, 2025'.";

// TZ is process-wide; every conversion through it holds this lock
std::mutex& tz_mutex() {
    static std::mutex m;
    return m;
}

class ScopedTimezone {
public:
    explicit ScopedTimezone(const std::string& zone) {
        if (const char* old = std::getenv("TZ")) saved_ = std::string(old);
        setenv("TZ", zone.c_str(), 1);
        tzset();
    }
    ~ScopedTimezone() {
        if (saved_) {
            setenv("TZ", saved_->c_str(), 1);
        } else {
            unsetenv("TZ");
        }
        tzset();
    }

    ScopedTimezone(const ScopedTimezone&) = delete;
    ScopedTimezone& operator=(const ScopedTimezone&) = delete;

private:
    std::optional<std::string> saved_;
};

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(std::string_view s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return std::string(s.substr(b, e - b));
}

bool is_utc(const std::string& zone) {
    return zone == "utc" || zone == "UTC";
}

/// Full name, or an abbreviation of at least three letters.
int name_index(const std::string& word, const char* const* names, int n) {
    if (word.size() < 3) return -1;
    for (int i = 0; i < n; ++i) {
        std::string_view full(names[i]);
        if (word.size() <= full.size() && full.compare(0, word.size(), word) == 0) return i;
    }
    return -1;
}

int month_number(const std::string& word) {
    int i = name_index(word, kMonths, 12);
    return i < 0 ? 0 : i + 1;
}

bool is_leap(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

int days_in_month(int y, int m) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return m == 2 && is_leap(y) ? 29 : days[m - 1];
}

std::tm utc_tm(int64_t seconds) {
    auto t = static_cast<std::time_t>(seconds);
    std::tm tm{};
    gmtime_r(&t, &tm);
    return tm;
}

int64_t from_utc_tm(std::tm tm) {
    return static_cast<int64_t>(timegm(&tm));
}

[[noreturn]] void unparsable(const std::string& input) {
    throw ExecutionError("failed to parse timestamp: unrecognized date/time \"" + input + "\""
                         + kStandardHint);
}

TimePoint from_civil(const std::string& input, int y, int mo, int d, int h = 0, int mi = 0, int s = 0) {
    if (y < 1000) {
        throw ExecutionError("failed to parse timestamp: year " + std::to_string(y)
                             + " is before 1000" + kEarlyYearHint);
    }
    if (mo < 1 || mo > 12 || d < 1 || d > days_in_month(y, mo) || h > 23 || mi > 59 || s > 59) {
        throw ExecutionError("failed to parse timestamp: field out of range in \"" + input + "\""
                             + kStandardHint);
    }
    std::tm tm{};
    tm.tm_year = y - 1900;
    tm.tm_mon = mo - 1;
    tm.tm_mday = d;
    tm.tm_hour = h;
    tm.tm_min = mi;
    tm.tm_sec = s;
    return TimePoint{from_utc_tm(tm), 0};
}

TimePoint midnight(int64_t seconds, int day_shift) {
    std::tm tm = utc_tm(seconds);
    tm.tm_hour = tm.tm_min = tm.tm_sec = 0;
    tm.tm_mday += day_shift;
    return TimePoint{from_utc_tm(tm), 0};
}

enum class Unit { Second, Minute, Hour, Day, Week, Month, Year };

std::optional<Unit> unit_named(const std::string& word) {
    static const std::pair<const char*, Unit> names[] = {
        {"second", Unit::Second}, {"seconds", Unit::Second}, {"sec", Unit::Second}, {"secs", Unit::Second},
        {"minute", Unit::Minute}, {"minutes", Unit::Minute}, {"min", Unit::Minute}, {"mins", Unit::Minute},
        {"hour", Unit::Hour}, {"hours", Unit::Hour}, {"hr", Unit::Hour}, {"hrs", Unit::Hour},
        {"day", Unit::Day}, {"days", Unit::Day},
        {"week", Unit::Week}, {"weeks", Unit::Week},
        {"month", Unit::Month}, {"months", Unit::Month},
        {"year", Unit::Year}, {"years", Unit::Year},
    };
    for (const auto& [name, unit] : names) {
        if (word == name) return unit;
    }
    return std::nullopt;
}

TimePoint shift(TimePoint t, int64_t n, Unit unit) {
    switch (unit) {
    case Unit::Second: t.seconds += n; return t;
    case Unit::Minute: t.seconds += n * 60; return t;
    case Unit::Hour: t.seconds += n * 3600; return t;
    case Unit::Day: t.seconds += n * 86400; return t;
    case Unit::Week: t.seconds += n * 604800; return t;
    case Unit::Month:
    case Unit::Year: {
        std::tm tm = utc_tm(t.seconds);
        if (unit == Unit::Month) {
            tm.tm_mon += static_cast<int>(n);
        } else {
            tm.tm_year += static_cast<int>(n);
        }
        t.seconds = from_utc_tm(tm);
        return t;
    }
    }
    return t;
}

// Largest "N units ago" amount; N * 604800 stays in int64 and N fits tm_year.
constexpr int64_t kMaxRelativeCount = 1000000;

int64_t parse_count(const std::string& input, const std::string& s) {
    if (s == "a" || s == "an") return 1;
    size_t first = s.find_first_not_of('0');
    std::string digits = first == std::string::npos ? "0" : s.substr(first);
    if (digits.size() > 7 || std::stoll(digits) > kMaxRelativeCount) {
        throw ExecutionError("failed to parse timestamp: relative amount " + s
                             + " is too large in \"" + input + "\"" + kStandardHint);
    }
    return std::stoll(digits);
}

/// "Z", "+01:00", "-0530"
int64_t zone_offset_seconds(const std::string& zone) {
    if (zone.empty() || zone == "Z" || zone == "z") return 0;
    int sign = zone[0] == '-' ? -1 : 1;
    std::string digits;
    for (char c : zone.substr(1)) {
        if (c != ':') digits += c;
    }
    int hh = std::stoi(digits.substr(0, 2));
    int mm = std::stoi(digits.substr(2, 2));
    return sign * (hh * 3600 + mm * 60);
}

int64_t fraction_nanos(const std::string& frac) {
    if (frac.empty()) return 0;
    std::string padded = frac.substr(0, 9);
    padded.append(9 - padded.size(), '0');
    return std::stoll(padded);
}

struct ZonedTime {
    std::tm tm;
    long offset_seconds;
};

ZonedTime break_down(int64_t seconds, const std::string& zone) {
    auto t = static_cast<std::time_t>(seconds);
    ZonedTime out{};
    if (is_utc(zone)) {
        gmtime_r(&t, &out.tm);
        out.offset_seconds = 0;
        return out;
    }
    std::lock_guard<std::mutex> lock(tz_mutex());
    if (zone == "local") {
        localtime_r(&t, &out.tm);
    } else {
        ScopedTimezone scoped(zone);
        localtime_r(&t, &out.tm);
    }
    out.offset_seconds = out.tm.tm_gmtoff;
    return out;
}

std::string strftime_str(const char* fmt, const std::tm& tm) {
    char buf[128];
    size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
    return std::string(buf, n);
}

std::string rfc3339_zone(long offset) {
    if (offset == 0) return "Z";
    char sign = offset < 0 ? '-' : '+';
    long abs = offset < 0 ? -offset : offset;
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%c%02ld:%02ld", sign, abs / 3600, (abs % 3600) / 60);
    return buf;
}

InputSchema time_schema() {
    InputSchema schema;
    schema.param(string_param("format", "Output format: iso, rfc3339, unix, date, datetime, time, weekday")
                     .one_of({"iso", "rfc3339", "unix", "date", "datetime", "time", "weekday"})
                     .defaults_to("iso"))
          .param(string_param("timezone", "Timezone: utc, local, or IANA timezone name")
                     .defaults_to("local"))
          .param(string_param("input",
                              "Input timestamp (ISO dates, 'January 9, 2025', 'next Monday', "
                              "'3 days ago', ...). Dates before year 1000 are not supported."))
          .param(string_param("offset", "Time offset (e.g., +1h, -2d, +30m)"));
    return schema;
}

nlohmann::json time_output_schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"result", {{"type", "string"}, {"description", "Formatted time string"}}}
        }}
    };
}

} // anonymous namespace

TimePoint TimePoint::from(std::chrono::system_clock::time_point tp) {
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
    return TimePoint{}.plus_nanos(ns);
}

TimePoint TimePoint::plus_nanos(int64_t delta) const {
    TimePoint out = *this;
    out.seconds += delta / kNanosPerSecond;
    out.nanos += delta % kNanosPerSecond;
    if (out.nanos < 0) {
        out.nanos += kNanosPerSecond;
        out.seconds -= 1;
    } else if (out.nanos >= kNanosPerSecond) {
        out.nanos -= kNanosPerSecond;
        out.seconds += 1;
    }
    return out;
}

TimeTool::TimeTool(std::shared_ptr<const Clock> clock)
    : TypedTool("time",
                "Comprehensive time utility with parsing, formatting, and calculations. Note: "
                "Dates before year 1000 are not supported.",
                time_schema(),
                time_output_schema()),
      clock_(std::move(clock)) {
    add_resource("time://formats", "Time Formats", "Output formats accepted by the time tool",
        nlohmann::json::array({
            {{"format", "iso"}, {"name", "ISO 8601"},
             {"description", "ISO 8601 format (2006-01-02T15:04:05Z07:00)"}, {"example", "2025-01-09T14:30:00Z"}},
            {{"format", "rfc3339"}, {"name", "RFC 3339"},
             {"description", "RFC 3339 format (2006-01-02T15:04:05Z07:00)"}, {"example", "2025-01-09T14:30:00Z"}},
            {{"format", "unix"}, {"name", "Unix Timestamp"},
             {"description", "Unix timestamp in seconds"}, {"example", "1736433000"}},
            {{"format", "date"}, {"name", "Date Only"},
             {"description", "Date in YYYY-MM-DD format"}, {"example", "2025-01-09"}},
            {{"format", "datetime"}, {"name", "Date and Time"},
             {"description", "Date and time in YYYY-MM-DD HH:MM:SS format"}, {"example", "2025-01-09 14:30:00"}},
            {{"format", "time"}, {"name", "Time Only"},
             {"description", "Time in HH:MM:SS format"}, {"example", "14:30:00"}},
            {{"format", "weekday"}, {"name", "Day of Week"},
             {"description", "Weekday with full date"}, {"example", "Thursday, January 9, 2025"}}
        }));
    add_resource("time://examples", "Time Examples", "Input expressions understood by the time tool",
        nlohmann::json::array({
            {{"input", "now"}, {"description", "Current time"}},
            {{"input", "today"}, {"description", "Today at midnight"}},
            {{"input", "2025-01-09"}, {"description", "Date in YYYY-MM-DD format"}},
            {{"input", "2025-01-09T14:30:00Z"}, {"description", "ISO 8601 format with UTC timezone"}},
            {{"input", "January 9, 2025"}, {"description", "Natural language date"}},
            {{"input", "yesterday"}, {"description", "Yesterday"}},
            {{"input", "tomorrow"}, {"description", "Tomorrow"}},
            {{"input", "next Monday"}, {"description", "Next occurrence of Monday"}},
            {{"input", "last Friday"}, {"description", "Last occurrence of Friday"}},
            {{"input", "3 days ago"}, {"description", "Relative time expression"}}
        }));
}

TimePoint TimeTool::parse_time(const std::string& raw, TimePoint now) {
    static const std::regex iso_date(R"(^(\d{1,4})-(\d{1,2})-(\d{1,2})$)");
    static const std::regex iso_datetime(
        R"(^(\d{1,4})-(\d{1,2})-(\d{1,2})[t ](\d{1,2}):(\d{2})(?::(\d{2})(?:\.(\d{1,9}))?)?(z|[+-]\d{2}:?\d{2})?$)");
    static const std::regex month_first(R"(^([a-z]+)\.? (\d{1,2})(?:st|nd|rd|th)?,? (\d{1,4})$)");
    static const std::regex day_first(R"(^(\d{1,2})(?:st|nd|rd|th)? ([a-z]+)\.?,? (\d{1,4})$)");
    static const std::regex next_last(R"(^(next|last) ([a-z]+)$)");
    static const std::regex ago(R"(^(\d+|an?) ([a-z]+) ago$)");
    static const std::regex in_future(R"(^in (\d+|an?) ([a-z]+)$)");

    std::string input = trim(raw);
    std::string text = lower(input);
    std::smatch m;

    if (text == "now") return now;
    if (text == "today") return midnight(now.seconds, 0);
    if (text == "yesterday") return midnight(now.seconds, -1);
    if (text == "tomorrow") return midnight(now.seconds, 1);

    if (std::regex_match(text, m, iso_date)) {
        return from_civil(input, std::stoi(m[1]), std::stoi(m[2]), std::stoi(m[3]));
    }
    if (std::regex_match(text, m, iso_datetime)) {
        int sec = m[6].matched ? std::stoi(m[6]) : 0;
        TimePoint t = from_civil(input, std::stoi(m[1]), std::stoi(m[2]), std::stoi(m[3]),
                                 std::stoi(m[4]), std::stoi(m[5]), sec);
        t.nanos = fraction_nanos(m[7].str());
        t.seconds -= zone_offset_seconds(m[8].str());
        return t;
    }
    if (std::regex_match(text, m, month_first)) {
        if (int mo = month_number(m[1]); mo > 0) {
            return from_civil(input, std::stoi(m[3]), mo, std::stoi(m[2]));
        }
    }
    if (std::regex_match(text, m, day_first)) {
        if (int mo = month_number(m[2]); mo > 0) {
            return from_civil(input, std::stoi(m[3]), mo, std::stoi(m[1]));
        }
    }
    if (std::regex_match(text, m, next_last)) {
        bool next = m[1] == "next";
        int wd = name_index(m[2], kWeekdays, 7);
        if (wd >= 0) {
            int today = utc_tm(now.seconds).tm_wday;
            int delta = next ? (wd - today + 7) % 7 : -((today - wd + 7) % 7);
            if (delta == 0) delta = next ? 7 : -7;
            return midnight(now.seconds, delta);
        }
        if (auto unit = unit_named(m[2])) {
            return shift(now, next ? 1 : -1, *unit);
        }
    }
    if (std::regex_match(text, m, ago)) {
        if (auto unit = unit_named(m[2])) return shift(now, -parse_count(input, m[1]), *unit);
    }
    if (std::regex_match(text, m, in_future)) {
        if (auto unit = unit_named(m[2])) return shift(now, parse_count(input, m[1]), *unit);
    }
    unparsable(input);
}

std::optional<int64_t> TimeTool::parse_offset(std::string_view s) {
    static const std::pair<std::string_view, int64_t> units[] = {
        {"ns", 1},
        {"us", 1000},
        {"\xC2\xB5s", 1000}, // U+00B5 micro sign
        {"\xCE\xBCs", 1000}, // U+03BC greek mu
        {"ms", 1000000},
        {"s", kNanosPerSecond},
        {"m", 60 * kNanosPerSecond},
        {"h", 3600 * kNanosPerSecond},
        {"d", 86400 * kNanosPerSecond},
        {"w", 604800 * kNanosPerSecond},
    };

    bool negative = false;
    if (!s.empty() && (s.front() == '+' || s.front() == '-')) {
        negative = s.front() == '-';
        s.remove_prefix(1);
    }
    if (s == "0") return 0;
    if (s.empty()) return std::nullopt;

    int64_t total = 0;
    while (!s.empty()) {
        size_t i = 0;
        int64_t whole = 0;
        bool any_digits = false;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
            if (whole > (std::numeric_limits<int64_t>::max() - 9) / 10) return std::nullopt;
            whole = whole * 10 + (s[i] - '0');
            any_digits = true;
            ++i;
        }
        double frac = 0.0;
        if (i < s.size() && s[i] == '.') {
            ++i;
            double scale = 0.1;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
                frac += (s[i] - '0') * scale;
                scale /= 10;
                any_digits = true;
                ++i;
            }
        }
        if (!any_digits) return std::nullopt;

        size_t u = i;
        while (u < s.size() && s[u] != '.' && !std::isdigit(static_cast<unsigned char>(s[u]))) ++u;
        std::string_view unit_name = s.substr(i, u - i);
        if (unit_name.empty()) return std::nullopt;

        auto it = std::find_if(std::begin(units), std::end(units),
                               [&](const auto& p) { return p.first == unit_name; });
        if (it == std::end(units)) return std::nullopt;
        if (whole > std::numeric_limits<int64_t>::max() / it->second) return std::nullopt;

        int64_t value = whole * it->second + static_cast<int64_t>(frac * static_cast<double>(it->second));
        if (total > std::numeric_limits<int64_t>::max() - value) return std::nullopt;
        total += value;
        s.remove_prefix(u);
    }
    return negative ? -total : total;
}

bool TimeTool::is_valid_timezone(const std::string& name) {
    if (name == "local" || is_utc(name)) return true;
    if (name.empty() || name.front() == '/' || name.find("..") != std::string::npos) return false;
    const char* dir = std::getenv("TZDIR");
    std::filesystem::path root = dir && *dir ? dir : "/usr/share/zoneinfo";
    std::error_code ec;
    return std::filesystem::is_regular_file(root / name, ec);
}

std::string TimeTool::format_time(const TimePoint& t, const std::string& format,
                                  const std::string& timezone) {
    if (format == "unix") return std::to_string(t.seconds);

    ZonedTime z = break_down(t.seconds, timezone);
    if (format == "iso" || format == "rfc3339") {
        return strftime_str("%Y-%m-%dT%H:%M:%S", z.tm) + rfc3339_zone(z.offset_seconds);
    }
    if (format == "date") return strftime_str("%Y-%m-%d", z.tm);
    if (format == "datetime") return strftime_str("%Y-%m-%d %H:%M:%S", z.tm);
    if (format == "time") return strftime_str("%H:%M:%S", z.tm);
    if (format == "weekday") {
        return strftime_str("%A, %B ", z.tm) + std::to_string(z.tm.tm_mday) + strftime_str(", %Y", z.tm);
    }
    throw ExecutionError("invalid format: " + format);
}

TimeInput TimeTool::parse(const nlohmann::json& params) const {
    const auto& schema = input_schema();
    TimeInput in;
    in.format = schema.get<std::string>(params, "format").value_or("iso");
    in.timezone = schema.get<std::string>(params, "timezone").value_or("local");
    if (in.timezone.empty()) in.timezone = "local";
    if (auto v = schema.get<std::string>(params, "input"); v && !v->empty()) in.input = *v;
    if (auto v = schema.get<std::string>(params, "offset"); v && !v->empty()) in.offset = *v;
    return in;
}

nlohmann::json TimeTool::run(const TimeInput& input) const {
    TimePoint now = TimePoint::from(clock_->now());
    TimePoint t = input.input ? parse_time(*input.input, now) : now;

    if (!is_valid_timezone(input.timezone)) {
        throw ExecutionError("invalid timezone: " + input.timezone);
    }
    if (input.offset) {
        auto delta = parse_offset(*input.offset);
        if (!delta) throw ExecutionError("invalid offset format: " + *input.offset);
        t = t.plus_nanos(*delta);
    }
    MCPIPBOY_DEBUG("time: {} -> {} in {}", input.input.value_or("now"), t.seconds, input.timezone);
    return format_time(t, input.format, input.timezone);
}

} // namespace tools
} // namespace mcpipboy
