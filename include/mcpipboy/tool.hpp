#pragma once
#include "error.hpp"
#include "schema.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcpipboy {

/// A named unit of work with a schema-described input. Name, description and
/// schemas are fixed at construction and never change afterwards.
class Tool {
public:
    Tool(std::string name, std::string description, InputSchema input_schema,
         nlohmann::json output_schema = nlohmann::json::object());
    virtual ~Tool() = default;

    Tool(const Tool&) = delete;
    Tool& operator=(const Tool&) = delete;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::string& description() const noexcept { return description_; }
    [[nodiscard]] const InputSchema& input_schema() const noexcept { return input_schema_; }
    [[nodiscard]] const nlohmann::json& output_schema() const noexcept { return output_schema_; }

    /// Shape check against input_schema(). No side effects.
    [[nodiscard]] virtual std::optional<ValidationFailure> validate_params(const nlohmann::json& params) const;

    /// Runs the tool on params that already passed validate_params().
    /// Throws ExecutionError when the input is well-shaped but semantically invalid.
    [[nodiscard]] virtual nlohmann::json execute(const nlohmann::json& params) const = 0;

    [[nodiscard]] ToolDefinition definition() const;

    // ---- Documentation resources ----
    [[nodiscard]] std::vector<ResourceDefinition> resources() const;
    [[nodiscard]] bool has_resource(const std::string& uri) const;
    /// Throws ResourceNotFoundError for unknown URIs.
    [[nodiscard]] ResourceContent read_resource(const std::string& uri) const;

protected:
    void add_resource(std::string uri, std::string name, std::string description,
                      nlohmann::json body);

private:
    struct StaticResource {
        ResourceDefinition definition;
        nlohmann::json body;
    };

    std::string name_;
    std::string description_;
    InputSchema input_schema_;
    nlohmann::json output_schema_;
    std::vector<StaticResource> resources_;
};

/// Tool whose arguments are first decoded into a typed Input struct.
template<typename Input>
class TypedTool : public Tool {
public:
    using Tool::Tool;

    [[nodiscard]] nlohmann::json execute(const nlohmann::json& params) const final {
        return run(parse(params));
    }

protected:
    [[nodiscard]] virtual Input parse(const nlohmann::json& params) const = 0;
    [[nodiscard]] virtual nlohmann::json run(const Input& input) const = 0;
};

} // namespace mcpipboy
