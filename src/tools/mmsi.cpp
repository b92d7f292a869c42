#include "mcpipboy/tools/mmsi.hpp"
#include "mcpipboy/error.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>

namespace mcpipboy {
namespace tools {

namespace {

bool in_range(int64_t v, int64_t lo, int64_t hi) { return v >= lo && v <= hi; }

std::string format_mmsi(int64_t mmsi) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%09lld", static_cast<long long>(mmsi));
    return buf;
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

const std::vector<int>& all_mids() {
    static const std::vector<int> mids = [] {
        std::vector<int> out;
        for (const auto& c : maritime_countries()) {
            out.insert(out.end(), c.mids.begin(), c.mids.end());
        }
        return out;
    }();
    return mids;
}

const std::vector<int>* mids_for(const std::string& code) {
    for (const auto& c : maritime_countries()) {
        if (code == c.code) return &c.mids;
    }
    return nullptr;
}

InputSchema mmsi_schema() {
    InputSchema schema = checksum_schema("MMSI number", 100);
    schema.param(string_param("type", "Specific MMSI type to generate")
                     .one_of(MmsiTool::station_types()))
          .param(string_param("country-code",
                              "Country code for MMSI generation (e.g., 'US', 'GB', 'DE')"));
    return schema;
}

} // anonymous namespace

const std::vector<MaritimeCountry>& maritime_countries() {
    static const std::vector<MaritimeCountry> countries = {
        {"US", "United States", {366, 367, 368, 369}},
        {"GB", "United Kingdom", {232, 233, 234, 235}},
        {"DE", "Germany", {211, 218}},
        {"FR", "France", {226, 227, 228}},
        {"IT", "Italy", {247}},
        {"ES", "Spain", {224, 225}},
        {"NL", "Netherlands", {244, 245, 246}},
        {"NO", "Norway", {257, 258, 259}},
        {"SE", "Sweden", {265, 266}},
        {"DK", "Denmark", {219, 220}},
        {"FI", "Finland", {230, 231}},
        {"PL", "Poland", {261, 262}},
        {"RU", "Russia", {273, 274, 275, 276}},
        {"JP", "Japan", {431, 432}},
        {"CN", "China", {412, 413, 414}},
        {"KR", "South Korea", {440, 441}},
        {"IN", "India", {419, 420}},
        {"AU", "Australia", {503, 504}},
        {"NZ", "New Zealand", {512}},
        {"CA", "Canada", {316, 317}},
        {"BR", "Brazil", {710, 711}},
        {"AR", "Argentina", {701, 702}},
        {"MX", "Mexico", {345, 346}},
        {"ZA", "South Africa", {601, 602}},
        {"EG", "Egypt", {622, 623}},
        {"NG", "Nigeria", {636, 637}},
        {"KE", "Kenya", {634, 635}},
        {"MA", "Morocco", {242, 243}},
        {"TN", "Tunisia", {672, 673}},
        {"DZ", "Algeria", {605, 606}},
        {"LY", "Libya", {642, 643}},
        {"SD", "Sudan", {626, 627}},
        {"ET", "Ethiopia", {624, 625}},
        {"GH", "Ghana", {620, 621}},
        {"CI", "Ivory Coast", {618, 619}},
        {"SN", "Senegal", {660, 661}},
        {"ML", "Mali", {649, 650}},
        {"BF", "Burkina Faso", {633, 634}},
        {"NE", "Niger", {656, 657}},
        {"TD", "Chad", {670, 671}},
        {"CF", "Central African Republic", {612, 613}},
        {"CM", "Cameroon", {613, 614}},
        {"GA", "Gabon", {626, 627}},
        {"CG", "Congo", {676, 677}},
        {"CD", "Democratic Republic of Congo", {676, 677}},
        {"AO", "Angola", {603, 604}},
        {"ZM", "Zambia", {678, 679}},
        {"ZW", "Zimbabwe", {679, 680}},
        {"BW", "Botswana", {679, 680}},
        {"NA", "Namibia", {659, 660}},
        {"SZ", "Swaziland", {601, 602}},
        {"LS", "Lesotho", {601, 602}},
        {"MG", "Madagascar", {647, 648}},
        {"MU", "Mauritius", {645, 646}},
        {"SC", "Seychelles", {664, 665}},
        {"KM", "Comoros", {616, 617}},
        {"DJ", "Djibouti", {604, 605}},
        {"SO", "Somalia", {666, 667}},
        {"ER", "Eritrea", {625, 626}},
        {"SS", "South Sudan", {626, 627}},
        {"UG", "Uganda", {675, 676}},
        {"RW", "Rwanda", {661, 662}},
        {"BI", "Burundi", {609, 610}},
        {"TZ", "Tanzania", {677, 678}},
        {"MW", "Malawi", {655, 656}},
        {"MZ", "Mozambique", {650, 651}},
    };
    return countries;
}

const std::vector<MmsiTool::StationType>& MmsiTool::station_table() {
    using Mids = std::vector<int>;
    // MID-prefixed numbers: MID * 1e6 + a random tail below `tail`
    auto mid_based = [](int64_t tail) {
        return [tail](const MmsiTool& t, const Mids& mids) {
            return static_cast<int64_t>(t.pick_mid(mids)) * 1000000 + t.random_below(tail);
        };
    };
    auto fixed_prefix = [](int64_t base, int64_t tail) {
        return [base, tail](const MmsiTool& t, const Mids&) { return base + t.random_below(tail); };
    };

    static const std::vector<StationType> table = {
        {"us-coast-guard-ship", "US Coast Guard Group Ship Station",
         [](int64_t m) { return m == 36699999; },
         [](const MmsiTool&, const Mids&) -> int64_t { return 36699999; }},
        {"us-coast-guard-coast", "US Coast Guard Group Coast Station",
         [](int64_t m) { return m == 3669999; },
         [](const MmsiTool&, const Mids&) -> int64_t { return 3669999; }},
        {"us-federal", "US Federal MMSI",
         [](int64_t m) { return in_range(m, 366900000, 366999999); },
         fixed_prefix(366900000, 100000)},
        {"us-ship-international", "US Ship Station (International/Inmarsat)",
         [](int64_t m) { return in_range(m, 366000000, 366999999) && m % 1000 == 0; },
         [](const MmsiTool& t, const Mids&) { return 366000000 + t.random_below(1000) * 1000; }},
        {"us-ship-other", "US Ship Station (Other)",
         [](int64_t m) { return in_range(m, 366000000, 366899999) && m % 1000 != 0; },
         [](const MmsiTool& t, const Mids&) { return 366000000 + 100000 + t.random_below(900000); }},
        {"us-ship-regular", "US Ship Station (Regular)",
         [](int64_t m) { return in_range(m, 367000000, 369999999); },
         [](const MmsiTool& t, const Mids&) {
             return (367 + t.random_below(3)) * 1000000 + t.random_below(1000000);
         }},
        {"sar-aircraft", "SAR Aircraft",
         [](int64_t m) { return in_range(m, 111000000, 111999999); },
         fixed_prefix(111000000, 1000000)},
        {"ais-sart", "AIS-SART",
         [](int64_t m) { return in_range(m, 970000000, 970999999); },
         fixed_prefix(970000000, 1000000)},
        {"handheld-vhf", "Handheld VHF",
         [](int64_t m) { return in_range(m, 800000000, 899999999); },
         fixed_prefix(800000000, 100000000)},
        {"man-overboard", "Man Overboard Device",
         [](int64_t m) { return in_range(m, 972000000, 972999999); },
         fixed_prefix(972000000, 1000000)},
        {"epirb-ais", "EPIRB-AIS",
         [](int64_t m) { return in_range(m, 974000000, 974999999); },
         fixed_prefix(974000000, 1000000)},
        {"ship", "Ship Station",
         [](int64_t m) { return in_range(m, 100000000, 799999999) && !in_range(m, 111000000, 111999999); },
         mid_based(1000000)},
        {"group-ship", "Group Ship Station",
         [](int64_t m) { return in_range(m, 10000000, 99999999); },
         mid_based(100000)},
        {"coast-station", "Coast Station",
         [](int64_t m) { return in_range(m, 1000000, 9999999); },
         mid_based(1000000)},
        {"group-coast-station", "Group Coast Station",
         [](int64_t m) { return in_range(m, 100000, 999999); },
         mid_based(100000)},
        {"craft-associated", "Craft Associated with Parent Ship",
         [](int64_t m) { return in_range(m, 980000000, 989999999); },
         fixed_prefix(980000000, 10000000)},
        {"navigational-aid", "Navigational Aid",
         [](int64_t m) { return in_range(m, 990000000, 999999999); },
         fixed_prefix(990000000, 10000000)},
        {"free-form", "Free-form Device",
         [](int64_t m) { return in_range(m, 100000000, 999999999); },
         mid_based(1000000)},
    };
    return table;
}

MmsiTool::MmsiTool(std::shared_ptr<RandomSource> random)
    : TypedTool("mmsi",
                "Generate and validate Maritime Mobile Service Identity (MMSI) numbers. MMSI "
                "numbers are 9-digit identifiers used for maritime communication.",
                mmsi_schema(),
                identifier_output_schema("MMSI number")),
      random_(std::move(random)) {}

std::vector<std::string> MmsiTool::station_types() {
    std::vector<std::string> names;
    for (const auto& t : station_table()) names.emplace_back(t.name);
    return names;
}

std::string MmsiTool::classify(int64_t mmsi) {
    for (const auto& t : station_table()) {
        if (t.matches(mmsi)) return t.display_name;
    }
    return "Unknown";
}

std::string MmsiTool::country_name(int mid) {
    for (const auto& c : maritime_countries()) {
        if (std::find(c.mids.begin(), c.mids.end(), mid) != c.mids.end()) return c.name;
    }
    return "Unknown (MID: " + std::to_string(mid) + ")";
}

nlohmann::json MmsiTool::validate(const std::string& input) {
    std::string clean = remove_all(input, {" ", "-"});
    if (clean.size() != 9) {
        return invalid_result("MMSI number must be exactly 9 digits", input);
    }
    if (!all_digits(clean)) {
        return invalid_result("MMSI number must contain only digits", input);
    }
    int64_t number = std::stoll(clean);
    if (number < 100000000) {
        return invalid_result("MMSI number must be between 100000000 and 999999999", input);
    }
    int mid = static_cast<int>(number / 1000000);
    return {
        {"valid", true},
        {"mmsi", format_mmsi(number)},
        {"input", input},
        {"mid", mid},
        {"country_name", country_name(mid)},
        {"type", classify(number)}
    };
}

int64_t MmsiTool::random_below(int64_t bound) const {
    return random_->uniform_int(0, bound - 1);
}

int MmsiTool::pick_mid(const std::vector<int>& mids) const {
    return mids[static_cast<size_t>(random_below(static_cast<int64_t>(mids.size())))];
}

MmsiInput MmsiTool::parse(const nlohmann::json& params) const {
    MmsiInput in;
    in.common = parse_checksum_input(input_schema(), params);
    if (auto t = input_schema().get<std::string>(params, "type"); t && !t->empty()) {
        in.type = *t;
    }
    if (auto cc = input_schema().get<std::string>(params, "country-code"); cc && !cc->empty()) {
        in.country_code = to_upper(*cc);
    }
    return in;
}

nlohmann::json MmsiTool::run(const MmsiInput& input) const {
    if (input.common.operation == "validate") {
        return validate(input.common.input);
    }

    const std::vector<int>* mids = &all_mids();
    if (input.country_code) {
        mids = mids_for(*input.country_code);
        if (!mids) {
            throw ExecutionError("invalid country code: " + *input.country_code);
        }
    }

    const StationType* type = nullptr;
    if (input.type) {
        const auto& table = station_table();
        auto it = std::find_if(table.begin(), table.end(),
                               [&](const StationType& t) { return *input.type == t.name; });
        if (it == table.end()) {
            throw ExecutionError("unsupported MMSI type: " + *input.type);
        }
        type = &*it;
    }

    std::vector<std::string> out;
    out.reserve(static_cast<size_t>(input.common.count));
    for (int n = 0; n < input.common.count; ++n) {
        int64_t mmsi = type ? type->generate(*this, *mids)
                            : static_cast<int64_t>(pick_mid(*mids)) * 1000000 + random_below(1000000);
        out.push_back(format_mmsi(mmsi));
    }
    return one_or_many(out);
}

} // namespace tools
} // namespace mcpipboy
