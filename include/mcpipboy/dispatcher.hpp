#pragma once
#include "json_rpc.hpp"
#include "registry.hpp"
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace mcpipboy {

/// Resolves, validates and executes one tool call. Every failure comes back
/// as a JsonRpcError; nothing thrown by a tool escapes call().
class Dispatcher {
public:
    explicit Dispatcher(std::shared_ptr<const ToolRegistry> registry);

    /// Returns the tool's raw result value, or:
    ///  - MethodNotFound when the tool is unknown or disabled,
    ///  - InvalidParams with the validation failure in `data`,
    ///  - ToolExecutionError when the tool fails.
    [[nodiscard]] HandlerResult call(const std::string& name, const nlohmann::json& arguments) const;

    /// MCP tools/call result for a raw tool value: a single text item holding
    /// the compact JSON of {"result": value}.
    [[nodiscard]] static nlohmann::json wrap_result(const nlohmann::json& value);

    [[nodiscard]] const ToolRegistry& registry() const noexcept { return *registry_; }

private:
    std::shared_ptr<const ToolRegistry> registry_;
};

} // namespace mcpipboy
