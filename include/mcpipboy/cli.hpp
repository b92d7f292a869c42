#pragma once
#include "error.hpp"
#include "tools/builtin_tools.hpp"
#include <iosfwd>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcpipboy {

namespace exit_code {
    constexpr int Ok = 0;
    constexpr int Failure = 1;
    constexpr int Usage = 2;
}

/// Bad command line: unknown command or flag, missing or malformed value.
class UsageError : public McpError {
public:
    using McpError::McpError;
};

/// Turn a tool subcommand's arguments into a tool arguments object.
/// Flags are the tool's parameter names (`--name value` or `--name=value`)
/// converted by the parameter's declared type. A single positional argument
/// fills `message` (echo) or `input`. Throws UsageError.
[[nodiscard]] nlohmann::json parse_tool_arguments(const Tool& tool, const std::vector<std::string>& args);

/// Entry point behind main(). `args` excludes the program name.
/// Returns the process exit code.
int run_cli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err,
            const tools::ToolDependencies& deps = tools::ToolDependencies::system());

} // namespace mcpipboy
