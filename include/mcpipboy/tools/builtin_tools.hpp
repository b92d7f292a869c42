#pragma once
#include "../clock.hpp"
#include "../registry.hpp"
#include "../tool.hpp"
#include <memory>
#include <vector>

namespace mcpipboy {
namespace tools {

/// Effectful sources shared by the built-in tools.
struct ToolDependencies {
    std::shared_ptr<const Clock> clock;
    std::shared_ptr<RandomSource> random;

    /// System clock and a randomly seeded generator.
    [[nodiscard]] static ToolDependencies system();
};

/// Every built-in tool, in registration order.
[[nodiscard]] std::vector<std::shared_ptr<const Tool>> builtin_tools(const ToolDependencies& deps);

void register_builtin_tools(ToolRegistry& registry, const ToolDependencies& deps);

} // namespace tools
} // namespace mcpipboy
