#pragma once
#include "../tool.hpp"
#include <string>

namespace mcpipboy {
namespace tools {

struct EchoInput {
    std::string message;
};

/// Returns its `message` argument unchanged.
class EchoTool : public TypedTool<EchoInput> {
public:
    EchoTool();

protected:
    EchoInput parse(const nlohmann::json& params) const override;
    nlohmann::json run(const EchoInput& input) const override;
};

} // namespace tools
} // namespace mcpipboy
