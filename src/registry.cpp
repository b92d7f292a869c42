#include "mcpipboy/registry.hpp"
#include "mcpipboy/error.hpp"

namespace mcpipboy {

ToolFilter ToolFilter::allow_only(std::set<std::string> names) {
    ToolFilter f;
    f.allowed_.emplace(names.begin(), names.end());
    return f;
}

bool ToolFilter::allows(std::string_view name) const {
    if (!allowed_) return true;
    return allowed_->find(name) != allowed_->end();
}

ToolRegistry::ToolRegistry(ToolFilter filter) : filter_(std::move(filter)) {}

void ToolRegistry::register_tool(std::shared_ptr<const Tool> tool) {
    if (!tool) {
        throw McpError("cannot register a null tool");
    }
    const std::string& name = tool->name();
    if (name.empty() || index_.count(name) > 0) {
        throw DuplicateToolError(name);
    }
    index_.emplace(name, tools_.size());
    tools_.push_back(std::move(tool));
}

std::shared_ptr<const Tool> ToolRegistry::lookup(std::string_view name) const {
    auto it = index_.find(std::string(name));
    if (it == index_.end() || !filter_.allows(name)) {
        throw ToolNotFoundError(std::string(name));
    }
    return tools_[it->second];
}

std::vector<std::shared_ptr<const Tool>> ToolRegistry::list() const {
    std::vector<std::shared_ptr<const Tool>> out;
    out.reserve(tools_.size());
    for (const auto& t : tools_) {
        if (filter_.allows(t->name())) out.push_back(t);
    }
    return out;
}

std::vector<std::string> ToolRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(tools_.size());
    for (const auto& t : tools_) out.push_back(t->name());
    return out;
}

bool ToolRegistry::is_enabled(std::string_view name) const {
    return index_.count(std::string(name)) > 0 && filter_.allows(name);
}

} // namespace mcpipboy
