#pragma once
#include "../clock.hpp"
#include "../tool.hpp"
#include "common.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcpipboy {
namespace tools {

struct MaritimeCountry {
    const char* code;
    const char* name;
    std::vector<int> mids;
};

/// Maritime Identification Digits by country, first match wins on lookup.
[[nodiscard]] const std::vector<MaritimeCountry>& maritime_countries();

struct MmsiInput {
    ChecksumInput common;
    std::optional<std::string> type;
    std::optional<std::string> country_code;
};

class MmsiTool : public TypedTool<MmsiInput> {
public:
    explicit MmsiTool(std::shared_ptr<RandomSource> random);

    /// Station type names accepted by `type`, most specific first.
    [[nodiscard]] static std::vector<std::string> station_types();
    /// Display name of the first station type whose range contains `mmsi`.
    [[nodiscard]] static std::string classify(int64_t mmsi);
    [[nodiscard]] static std::string country_name(int mid);
    [[nodiscard]] static nlohmann::json validate(const std::string& input);

protected:
    MmsiInput parse(const nlohmann::json& params) const override;
    nlohmann::json run(const MmsiInput& input) const override;

private:
    struct StationType {
        const char* name;
        const char* display_name;
        std::function<bool(int64_t)> matches;
        std::function<int64_t(const MmsiTool&, const std::vector<int>&)> generate;
    };

    static const std::vector<StationType>& station_table();

    int64_t random_below(int64_t bound) const;
    int pick_mid(const std::vector<int>& mids) const;

    std::shared_ptr<RandomSource> random_;
};

} // namespace tools
} // namespace mcpipboy
