#include "mcpipboy/tools/version.hpp"
#include "mcpipboy/version.hpp"

namespace mcpipboy {
namespace tools {

VersionTool::VersionTool()
    : Tool("version", "Returns the current version of mcpipboy", InputSchema{},
           {{"type", "object"},
            {"properties", {{"result", {{"type", "string"},
                                        {"description", "The mcpipboy version"}}}}}}) {}

nlohmann::json VersionTool::execute(const nlohmann::json&) const {
    return std::string(LIBRARY_VERSION);
}

} // namespace tools
} // namespace mcpipboy
