#include "mcpipboy/dispatcher.hpp"
#include "mcpipboy/error.hpp"
#include "mcpipboy/logging.hpp"
#include "mcpipboy/types.hpp"

namespace mcpipboy {

namespace {

JsonRpcError invalid_params(const ValidationFailure& failure) {
    nlohmann::json data;
    to_json(data, failure);
    return JsonRpcError{error::InvalidParams, "Invalid params: " + describe(failure), data};
}

} // anonymous namespace

Dispatcher::Dispatcher(std::shared_ptr<const ToolRegistry> registry)
    : registry_(std::move(registry)) {
    if (!registry_) {
        throw McpError("Dispatcher requires a registry");
    }
}

HandlerResult Dispatcher::call(const std::string& name, const nlohmann::json& arguments) const {
    std::shared_ptr<const Tool> tool;
    try {
        tool = registry_->lookup(name);
    } catch (const ToolNotFoundError&) {
        MCPIPBOY_DEBUG("tools/call: unknown tool '{}'", name);
        return JsonRpcError{error::MethodNotFound, "Tool not found: " + name,
                            nlohmann::json{{"tool", name}}};
    }

    if (auto failure = tool->validate_params(arguments)) {
        MCPIPBOY_DEBUG("tools/call {}: {}", name, describe(*failure));
        return invalid_params(*failure);
    }

    const nlohmann::json& args = arguments.is_null() ? nlohmann::json::object() : arguments;
    try {
        return tool->execute(args);
    } catch (const ValidationError& e) {
        return invalid_params(e.failure);
    } catch (const ExecutionError& e) {
        MCPIPBOY_DEBUG("tools/call {} failed: {}", name, e.what());
        return JsonRpcError{error::ToolExecutionError, e.what(), nlohmann::json{{"tool", name}}};
    } catch (const std::exception& e) {
        MCPIPBOY_ERROR("tools/call {} raised an unexpected error: {}", name, e.what());
        return JsonRpcError{error::ToolExecutionError, "Tool execution failed: internal error",
                            nlohmann::json{{"tool", name}}};
    }
}

nlohmann::json Dispatcher::wrap_result(const nlohmann::json& value) {
    CallToolResult result;
    result.content.push_back(TextContent{nlohmann::json{{"result", value}}.dump()});
    nlohmann::json j;
    to_json(j, result);
    return j;
}

} // namespace mcpipboy
