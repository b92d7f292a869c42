#include "mcpipboy/tool.hpp"

namespace mcpipboy {

Tool::Tool(std::string name, std::string description, InputSchema input_schema,
           nlohmann::json output_schema)
    : name_(std::move(name)),
      description_(std::move(description)),
      input_schema_(std::move(input_schema)),
      output_schema_(std::move(output_schema)) {}

std::optional<ValidationFailure> Tool::validate_params(const nlohmann::json& params) const {
    return input_schema_.validate(params);
}

ToolDefinition Tool::definition() const {
    ToolDefinition def;
    def.name = name_;
    def.description = description_;
    def.input_schema = input_schema_.to_json();
    if (!output_schema_.empty()) def.output_schema = output_schema_;
    return def;
}

void Tool::add_resource(std::string uri, std::string name, std::string description,
                        nlohmann::json body) {
    StaticResource r;
    r.definition.uri = std::move(uri);
    r.definition.name = std::move(name);
    r.definition.description = std::move(description);
    r.definition.mime_type = "application/json";
    r.body = std::move(body);
    resources_.push_back(std::move(r));
}

std::vector<ResourceDefinition> Tool::resources() const {
    std::vector<ResourceDefinition> out;
    out.reserve(resources_.size());
    for (const auto& r : resources_) out.push_back(r.definition);
    return out;
}

bool Tool::has_resource(const std::string& uri) const {
    for (const auto& r : resources_) {
        if (r.definition.uri == uri) return true;
    }
    return false;
}

ResourceContent Tool::read_resource(const std::string& uri) const {
    for (const auto& r : resources_) {
        if (r.definition.uri == uri) {
            return ResourceContent{uri, r.definition.mime_type, r.body.dump(2)};
        }
    }
    throw ResourceNotFoundError(uri);
}

} // namespace mcpipboy
