#include "mcpipboy/tools/uuid.hpp"
#include "mcpipboy/error.hpp"
#include "mcpipboy/tools/common.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <vector>
#include <openssl/evp.h>

namespace mcpipboy {
namespace tools {

namespace {

// 100ns intervals between 1582-10-15 and 1970-01-01
constexpr int64_t kGregorianOffset = 0x01B21DD213814000LL;

struct NamespaceAlias {
    const char* alias;
    const char* uuid;
};

constexpr NamespaceAlias kNamespaces[] = {
    {"DNS", "6ba7b810-9dad-11d1-80b4-00c04fd430c8"},
    {"URL", "6ba7b811-9dad-11d1-80b4-00c04fd430c8"},
    {"OID", "6ba7b812-9dad-11d1-80b4-00c04fd430c8"},
    {"X500", "6ba7b814-9dad-11d1-80b4-00c04fd430c8"},
};

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string rfc3339_utc(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

void set_version(UuidBytes& b, int version) {
    b[6] = static_cast<uint8_t>((b[6] & 0x0F) | (version << 4));
    b[8] = static_cast<uint8_t>((b[8] & 0x3F) | 0x80);
}

int64_t unix_millis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

InputSchema uuid_schema() {
    InputSchema schema;
    schema.param(string_param("version",
                              "UUID version: v1 (time-based), v4 (random), v5 (name-based SHA-1), "
                              "v7 (time-ordered), validate")
                     .one_of({"v1", "v4", "v5", "v7", "validate"})
                     .defaults_to("v4"))
          .param(integer_param("count", "Number of UUIDs to generate (1-1000)")
                     .range(1, 1000)
                     .defaults_to(1))
          .param(string_param("namespace",
                              "Namespace UUID or one of DNS, URL, OID, X500 (required for v5)")
                     .non_empty())
          .param(string_param("name", "Name for v5 generation (required for v5)").non_empty())
          .param(string_param("input", "UUID string to validate (required for validate)").non_empty())
          .require_when("namespace", "version", "v5")
          .require_when("name", "version", "v5")
          .require_when("input", "version", "validate");
    return schema;
}

nlohmann::json uuid_output_schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"result", {
                {"description", "UUID, array of UUIDs, or validation result for validate"},
                {"oneOf", nlohmann::json::array({
                    {{"type", "string"}},
                    {{"type", "array"}, {"items", {{"type", "string"}}}},
                    {{"type", "object"}}
                })}
            }}
        }}
    };
}

} // anonymous namespace

std::string format_uuid(const UuidBytes& b) {
    char buf[37];
    std::snprintf(buf, sizeof(buf),
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7],
                  b[8], b[9], b[10], b[11], b[12], b[13], b[14], b[15]);
    return buf;
}

std::optional<UuidBytes> parse_uuid(std::string_view text, std::string* error) {
    auto fail = [error](std::string msg) -> std::optional<UuidBytes> {
        if (error) *error = std::move(msg);
        return std::nullopt;
    };

    std::string_view s = text;
    std::string hex;
    switch (s.size()) {
    case 36 + 9: {
        std::string prefix(s.substr(0, 9));
        std::transform(prefix.begin(), prefix.end(), prefix.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (prefix != "urn:uuid:") {
            return fail("invalid urn prefix: \"" + std::string(s.substr(0, 9)) + "\"");
        }
        s.remove_prefix(9);
        break;
    }
    case 36 + 2:
        if (s.front() != '{' || s.back() != '}') return fail("invalid UUID format");
        s = s.substr(1, 36);
        break;
    case 36:
        break;
    case 32:
        hex = std::string(s);
        break;
    default:
        return fail("invalid UUID length: " + std::to_string(s.size()));
    }

    if (hex.empty()) {
        if (s[8] != '-' || s[13] != '-' || s[18] != '-' || s[23] != '-') {
            return fail("invalid UUID format");
        }
        for (size_t i = 0; i < s.size(); ++i) {
            if (i != 8 && i != 13 && i != 18 && i != 23) hex += s[i];
        }
    }

    UuidBytes out{};
    for (size_t i = 0; i < 16; ++i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) return fail("invalid UUID format");
        out[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return out;
}

UuidTool::UuidTool(std::shared_ptr<const Clock> clock, std::shared_ptr<RandomSource> random)
    : TypedTool("uuid",
                "Generate and validate UUIDs with various versions (v1, v4, v5, v7)",
                uuid_schema(),
                uuid_output_schema()),
      clock_(std::move(clock)), random_(std::move(random)) {
    add_resource("uuid://versions", "UUID Versions", "Supported UUID versions",
        nlohmann::json::array({
            {{"version", "v1"}, {"name", "Time-based UUID"},
             {"description", "Based on timestamp and node identifier"},
             {"characteristics", nlohmann::json::array({"time-ordered", "includes node id", "predictable"})}},
            {{"version", "v4"}, {"name", "Random UUID"},
             {"description", "Randomly generated UUID"},
             {"characteristics", nlohmann::json::array({"random", "unpredictable", "most common"})}},
            {{"version", "v5"}, {"name", "Name-based UUID (SHA-1)"},
             {"description", "Generated from namespace and name using SHA-1"},
             {"characteristics", nlohmann::json::array({"deterministic", "requires namespace", "requires name"})}},
            {{"version", "v7"}, {"name", "Time-ordered UUID"},
             {"description", "Unix millisecond timestamp followed by random bits"},
             {"characteristics", nlohmann::json::array({"time-ordered", "sortable", "database friendly"})}}
        }));

    nlohmann::json namespaces = nlohmann::json::array();
    for (const auto& ns : kNamespaces) {
        namespaces.push_back({{"name", ns.alias}, {"uuid", ns.uuid}});
    }
    add_resource("uuid://namespaces", "UUID Namespaces", "Predefined namespaces for v5",
                 std::move(namespaces));

    add_resource("uuid://examples", "UUID Examples", "Example UUIDs of each version",
        nlohmann::json::array({
            {{"version", "v1"}, {"uuid", "6ba7b810-9dad-11d1-80b4-00c04fd430c8"}},
            {{"version", "v4"}, {"uuid", "f47ac10b-58cc-4372-a567-0e02b2c3d479"}},
            {{"version", "v5"}, {"namespace", "DNS"}, {"name", "example.com"},
             {"uuid", "cfbff0d1-9375-5685-968c-48ce8b15ae17"}},
            {{"version", "v7"}, {"uuid", "017f22e2-79b0-7cc3-98c4-dc0c0c07398f"}}
        }));
}

UuidBytes UuidTool::make_v1() const {
    int64_t ticks = std::chrono::duration_cast<std::chrono::nanoseconds>(
                        clock_->now().time_since_epoch()).count() / 100
                    + kGregorianOffset;
    auto t = static_cast<uint64_t>(ticks);

    UuidBytes b{};
    uint32_t time_low = static_cast<uint32_t>(t & 0xFFFFFFFFu);
    uint16_t time_mid = static_cast<uint16_t>((t >> 32) & 0xFFFF);
    uint16_t time_hi = static_cast<uint16_t>((t >> 48) & 0x0FFF);
    b[0] = static_cast<uint8_t>(time_low >> 24);
    b[1] = static_cast<uint8_t>(time_low >> 16);
    b[2] = static_cast<uint8_t>(time_low >> 8);
    b[3] = static_cast<uint8_t>(time_low);
    b[4] = static_cast<uint8_t>(time_mid >> 8);
    b[5] = static_cast<uint8_t>(time_mid);
    b[6] = static_cast<uint8_t>(time_hi >> 8);
    b[7] = static_cast<uint8_t>(time_hi);
    random_->fill(b.data() + 8, 8);
    b[10] |= 0x01; // multicast bit marks a random node id
    set_version(b, 1);
    return b;
}

UuidBytes UuidTool::make_v4() const {
    UuidBytes b{};
    random_->fill(b.data(), b.size());
    set_version(b, 4);
    return b;
}

UuidBytes UuidTool::make_v5(const UuidBytes& name_space, std::string_view name) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (!ctx
        || EVP_DigestInit_ex(ctx.get(), EVP_sha1(), nullptr) != 1
        || EVP_DigestUpdate(ctx.get(), name_space.data(), name_space.size()) != 1
        || EVP_DigestUpdate(ctx.get(), name.data(), name.size()) != 1
        || EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1
        || digest_len < 16) {
        throw ExecutionError("failed to compute SHA-1 digest");
    }
    UuidBytes b{};
    std::copy(digest, digest + 16, b.begin());
    set_version(b, 5);
    return b;
}

UuidBytes UuidTool::make_v7() const {
    auto ms = static_cast<uint64_t>(unix_millis(clock_->now()));
    UuidBytes b{};
    for (int i = 0; i < 6; ++i) {
        b[static_cast<size_t>(i)] = static_cast<uint8_t>(ms >> (40 - 8 * i));
    }
    random_->fill(b.data() + 6, 10);
    set_version(b, 7);
    return b;
}

UuidBytes UuidTool::resolve_namespace(const std::string& text) {
    for (const auto& ns : kNamespaces) {
        if (text == ns.alias) return *parse_uuid(ns.uuid);
    }
    std::string error;
    auto parsed = parse_uuid(text, &error);
    if (!parsed) {
        throw ExecutionError("invalid namespace UUID: " + error);
    }
    return *parsed;
}

nlohmann::json UuidTool::validate(const std::string& input) {
    std::string error;
    auto parsed = parse_uuid(input, &error);
    if (!parsed) {
        return {{"valid", false}, {"error", error}, {"version", nullptr}};
    }
    const UuidBytes& b = *parsed;
    int version = b[6] >> 4;
    nlohmann::json result = {{"valid", true}, {"version", version}, {"uuid", format_uuid(b)}};

    if (version == 1) {
        uint64_t t = (static_cast<uint64_t>(b[6] & 0x0F) << 56) | (static_cast<uint64_t>(b[7]) << 48)
                   | (static_cast<uint64_t>(b[4]) << 40) | (static_cast<uint64_t>(b[5]) << 32)
                   | (static_cast<uint64_t>(b[0]) << 24) | (static_cast<uint64_t>(b[1]) << 16)
                   | (static_cast<uint64_t>(b[2]) << 8) | static_cast<uint64_t>(b[3]);
        int64_t seconds = (static_cast<int64_t>(t) - kGregorianOffset) / 10000000;
        result["timestamp"] = rfc3339_utc(std::chrono::system_clock::time_point(std::chrono::seconds(seconds)));
        char mac[18];
        std::snprintf(mac, sizeof(mac), "%02x:%02x:%02x:%02x:%02x:%02x",
                      b[10], b[11], b[12], b[13], b[14], b[15]);
        result["mac_address"] = mac;
    } else if (version == 5) {
        result["namespace"] = "unknown (requires original name to determine)";
    } else if (version == 7) {
        int64_t ms = 0;
        for (size_t i = 0; i < 6; ++i) ms = (ms << 8) | b[i];
        result["timestamp"] = rfc3339_utc(std::chrono::system_clock::time_point(std::chrono::milliseconds(ms)));
    }
    return result;
}

UuidInput UuidTool::parse(const nlohmann::json& params) const {
    const auto& schema = input_schema();
    UuidInput in;
    in.version = schema.get<std::string>(params, "version").value_or("v4");
    in.count = schema.get<int>(params, "count").value_or(1);
    in.name_space = schema.get<std::string>(params, "namespace");
    in.name = schema.get<std::string>(params, "name");
    in.input = schema.get<std::string>(params, "input").value_or("");
    return in;
}

nlohmann::json UuidTool::run(const UuidInput& input) const {
    if (input.version == "validate") {
        return validate(input.input);
    }

    std::optional<UuidBytes> ns;
    if (input.version == "v5") {
        if (!input.name_space) throw ExecutionError("namespace parameter is required for UUID v5");
        if (!input.name) throw ExecutionError("name parameter is required for UUID v5");
        ns = resolve_namespace(*input.name_space);
    }

    std::vector<std::string> out;
    out.reserve(static_cast<size_t>(input.count));
    for (int i = 0; i < input.count; ++i) {
        UuidBytes b{};
        if (input.version == "v1") {
            b = make_v1();
        } else if (input.version == "v5") {
            std::string name = input.count > 1 ? *input.name + "-" + std::to_string(i) : *input.name;
            b = make_v5(*ns, name);
        } else if (input.version == "v7") {
            b = make_v7();
        } else {
            b = make_v4();
        }
        out.push_back(format_uuid(b));
    }
    return one_or_many(out);
}

} // namespace tools
} // namespace mcpipboy
