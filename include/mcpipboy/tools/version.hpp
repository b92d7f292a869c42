#pragma once
#include "../tool.hpp"

namespace mcpipboy {
namespace tools {

class VersionTool : public Tool {
public:
    VersionTool();

    nlohmann::json execute(const nlohmann::json& params) const override;
};

} // namespace tools
} // namespace mcpipboy
