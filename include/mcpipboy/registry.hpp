#pragma once
#include "tool.hpp"
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace mcpipboy {

/// Static allow-set consulted by the registry. A default-constructed filter
/// allows every tool.
class ToolFilter {
public:
    ToolFilter() = default;

    [[nodiscard]] static ToolFilter allow_all() { return ToolFilter{}; }
    [[nodiscard]] static ToolFilter allow_only(std::set<std::string> names);

    [[nodiscard]] bool allows(std::string_view name) const;
    [[nodiscard]] bool restricts() const noexcept { return allowed_.has_value(); }

private:
    std::optional<std::set<std::string, std::less<>>> allowed_;
};

/// Name -> tool table. Registration order is preserved for listing. Disabled
/// tools stay registered but are invisible to lookup() and list().
class ToolRegistry {
public:
    explicit ToolRegistry(ToolFilter filter = {});

    /// Throws DuplicateToolError if the name is taken (or empty).
    void register_tool(std::shared_ptr<const Tool> tool);

    /// Throws ToolNotFoundError for unknown or disabled tools.
    [[nodiscard]] std::shared_ptr<const Tool> lookup(std::string_view name) const;

    /// Enabled tools in registration order.
    [[nodiscard]] std::vector<std::shared_ptr<const Tool>> list() const;

    /// Names of all registered tools, enabled or not, in registration order.
    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] bool is_enabled(std::string_view name) const;
    [[nodiscard]] size_t size() const noexcept { return tools_.size(); }
    [[nodiscard]] const ToolFilter& filter() const noexcept { return filter_; }

private:
    ToolFilter filter_;
    std::vector<std::shared_ptr<const Tool>> tools_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace mcpipboy
