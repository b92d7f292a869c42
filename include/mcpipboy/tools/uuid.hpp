#pragma once
#include "../clock.hpp"
#include "../tool.hpp"
#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mcpipboy {
namespace tools {

using UuidBytes = std::array<uint8_t, 16>;

/// Lower-case 8-4-4-4-12 form.
[[nodiscard]] std::string format_uuid(const UuidBytes& bytes);

/// Accepts the canonical, braced, urn:uuid: and bare 32-hex forms. On failure
/// returns nullopt and, when given, stores the reason in `error`.
[[nodiscard]] std::optional<UuidBytes> parse_uuid(std::string_view text, std::string* error = nullptr);

struct UuidInput {
    std::string version = "v4";
    int count = 1;
    std::optional<std::string> name_space;
    std::optional<std::string> name;
    std::string input;
};

class UuidTool : public TypedTool<UuidInput> {
public:
    UuidTool(std::shared_ptr<const Clock> clock, std::shared_ptr<RandomSource> random);

    /// Time-based UUID with a random multicast node id.
    [[nodiscard]] UuidBytes make_v1() const;
    [[nodiscard]] UuidBytes make_v4() const;
    /// Name-based UUID: SHA-1 of namespace bytes followed by the name.
    [[nodiscard]] static UuidBytes make_v5(const UuidBytes& name_space, std::string_view name);
    /// 48-bit Unix millisecond timestamp followed by random bits.
    [[nodiscard]] UuidBytes make_v7() const;

    [[nodiscard]] static nlohmann::json validate(const std::string& input);

    /// Resolves DNS, URL, OID and X500 aliases, otherwise parses a UUID.
    /// Throws ExecutionError for anything else.
    [[nodiscard]] static UuidBytes resolve_namespace(const std::string& text);

protected:
    UuidInput parse(const nlohmann::json& params) const override;
    nlohmann::json run(const UuidInput& input) const override;

private:
    std::shared_ptr<const Clock> clock_;
    std::shared_ptr<RandomSource> random_;
};

} // namespace tools
} // namespace mcpipboy
