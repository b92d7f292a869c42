#include "mcpipboy/tools/builtin_tools.hpp"
#include "mcpipboy/tools/creditcard.hpp"
#include "mcpipboy/tools/ean13.hpp"
#include "mcpipboy/tools/echo.hpp"
#include "mcpipboy/tools/iban.hpp"
#include "mcpipboy/tools/imo.hpp"
#include "mcpipboy/tools/isbn.hpp"
#include "mcpipboy/tools/mmsi.hpp"
#include "mcpipboy/tools/random.hpp"
#include "mcpipboy/tools/time.hpp"
#include "mcpipboy/tools/uuid.hpp"
#include "mcpipboy/tools/version.hpp"

namespace mcpipboy {
namespace tools {

ToolDependencies ToolDependencies::system() {
    return ToolDependencies{std::make_shared<SystemClock>(), std::make_shared<Mt19937Random>()};
}

std::vector<std::shared_ptr<const Tool>> builtin_tools(const ToolDependencies& deps) {
    return {
        std::make_shared<EchoTool>(),
        std::make_shared<VersionTool>(),
        std::make_shared<TimeTool>(deps.clock),
        std::make_shared<RandomTool>(deps.random),
        std::make_shared<UuidTool>(deps.clock, deps.random),
        std::make_shared<ImoTool>(deps.random),
        std::make_shared<MmsiTool>(deps.random),
        std::make_shared<CreditCardTool>(deps.random),
        std::make_shared<IsbnTool>(deps.random),
        std::make_shared<Ean13Tool>(deps.random),
        std::make_shared<IbanTool>(deps.random),
    };
}

void register_builtin_tools(ToolRegistry& registry, const ToolDependencies& deps) {
    for (auto& tool : builtin_tools(deps)) {
        registry.register_tool(std::move(tool));
    }
}

} // namespace tools
} // namespace mcpipboy
