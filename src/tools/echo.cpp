#include "mcpipboy/tools/echo.hpp"

namespace mcpipboy {
namespace tools {

namespace {

InputSchema echo_schema() {
    InputSchema schema;
    schema.param(string_param("message", "The message to echo back").require());
    return schema;
}

} // anonymous namespace

EchoTool::EchoTool()
    : TypedTool("echo", "Echoes back the input message", echo_schema(),
                {{"type", "object"},
                 {"properties", {{"result", {{"type", "string"},
                                             {"description", "The echoed message"}}}}}}) {}

EchoInput EchoTool::parse(const nlohmann::json& params) const {
    return EchoInput{params.at("message").get<std::string>()};
}

nlohmann::json EchoTool::run(const EchoInput& input) const {
    return input.message;
}

} // namespace tools
} // namespace mcpipboy
