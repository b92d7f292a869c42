#include "mcpipboy/cli.hpp"
#include "mcpipboy/config.hpp"
#include "mcpipboy/dispatcher.hpp"
#include "mcpipboy/logging.hpp"
#include "mcpipboy/server.hpp"
#include "mcpipboy/version.hpp"
#include <algorithm>
#include <iomanip>
#include <ostream>

namespace mcpipboy {

namespace {

void print_usage(std::ostream& os, const std::vector<std::shared_ptr<const Tool>>& tools) {
    os << "mcpipboy - MCP server for AI agent utility tools\n\n"
       << "Usage:\n"
       << "  mcpipboy [--help|--version] <command> [flags]\n\n"
       << "Server Commands:\n"
       << "  serve       Start the MCP server on stdin/stdout\n"
       << "              --enable a,b | --disable c   restrict the exposed tools\n"
       << "              --debug                      debug logging with protocol traffic\n"
       << "              --log-file PATH              log to PATH instead of stderr\n"
       << "              --log-level LEVEL            trace, debug, info, warn, error, off\n"
       << "  tools       List the available tools (--json for full definitions)\n\n"
       << "Tool Commands:\n";
    for (const auto& tool : tools) {
        os << "  " << std::left << std::setw(11) << tool->name() << ' ' << tool->description() << '\n';
    }
    os << "\nRun 'mcpipboy <command> --help' for the flags of a tool.\n";
}

void print_tool_usage(std::ostream& os, const Tool& tool) {
    os << tool.description() << "\n\nUsage:\n  mcpipboy " << tool.name();
    if (tool.input_schema().find("message")) {
        os << " <message>";
    } else if (tool.input_schema().find("input")) {
        os << " [input]";
    }
    os << " [flags]\n\nFlags:\n";
    for (const auto& p : tool.input_schema().params()) {
        os << "  --" << std::left << std::setw(14) << p.name << ' ' << to_string(p.type)
           << "  " << p.description;
        if (!p.enum_values.empty()) {
            os << " [";
            for (size_t i = 0; i < p.enum_values.size(); ++i) {
                if (i) os << '|';
                os << p.enum_values[i];
            }
            os << ']';
        }
        if (p.default_value) os << " (default " << p.default_value->dump() << ')';
        os << '\n';
    }
}

nlohmann::json convert_value(const ParamSpec& spec, const std::string& value) {
    auto bad = [&]() {
        return UsageError("invalid value for --" + spec.name + ": '" + value + "' is not "
                          + (spec.type == ParamType::Integer ? "an " : "a ")
                          + std::string(to_string(spec.type)));
    };
    switch (spec.type) {
    case ParamType::String:
        return value;
    case ParamType::Integer: {
        size_t used = 0;
        long long v = 0;
        try {
            v = std::stoll(value, &used);
        } catch (const std::logic_error&) {
            throw bad();
        }
        if (used != value.size()) throw bad();
        return v;
    }
    case ParamType::Number: {
        size_t used = 0;
        double v = 0;
        try {
            v = std::stod(value, &used);
        } catch (const std::logic_error&) {
            throw bad();
        }
        if (used != value.size()) throw bad();
        return v;
    }
    case ParamType::Boolean:
        if (value == "true" || value == "1") return true;
        if (value == "false" || value == "0") return false;
        throw bad();
    }
    throw bad();
}

void print_result(std::ostream& out, const nlohmann::json& value) {
    if (value.is_string()) {
        out << value.get_ref<const std::string&>() << '\n';
    } else {
        out << value.dump(2) << '\n';
    }
}

int run_serve(const std::vector<std::string>& args, std::ostream& out,
              const tools::ToolDependencies& deps) {
    ServeConfig cfg;
    for (size_t i = 0; i < args.size(); ++i) {
        std::string flag = args[i];
        std::optional<std::string> inline_value;
        if (auto eq = flag.find('='); flag.rfind("--", 0) == 0 && eq != std::string::npos) {
            inline_value = flag.substr(eq + 1);
            flag = flag.substr(0, eq);
        }
        auto value = [&]() -> std::string {
            if (inline_value) return *inline_value;
            if (i + 1 >= args.size()) throw UsageError("flag needs an argument: " + flag);
            return args[++i];
        };

        if (flag == "--help" || flag == "-h") {
            print_usage(out, tools::builtin_tools(deps));
            return exit_code::Ok;
        } else if (flag == "--enable") {
            auto names = split_list(value());
            cfg.enable.insert(cfg.enable.end(), names.begin(), names.end());
        } else if (flag == "--disable") {
            auto names = split_list(value());
            cfg.disable.insert(cfg.disable.end(), names.begin(), names.end());
        } else if (flag == "--debug") {
            cfg.debug = true;
        } else if (flag == "--log-file") {
            cfg.log_file = value();
        } else if (flag == "--log-level") {
            cfg.log_level = value();
        } else {
            throw UsageError("unknown flag for serve: " + flag);
        }
    }
    apply_environment(cfg);

    auto all = tools::builtin_tools(deps);
    std::vector<std::string> names;
    for (const auto& t : all) names.push_back(t->name());
    ToolFilter filter = resolve_tool_filter(cfg, names);

    logging::init(log_options(cfg));

    auto registry = std::make_shared<ToolRegistry>(std::move(filter));
    for (auto& t : all) registry->register_tool(std::move(t));

    McpServer server(McpServer::Options{}, registry);
    server.serve_stdio();
    return exit_code::Ok;
}

int run_tools(const std::vector<std::string>& args, std::ostream& out,
              const tools::ToolDependencies& deps) {
    bool as_json = false;
    for (const auto& a : args) {
        if (a == "--json") {
            as_json = true;
        } else {
            throw UsageError("unknown flag for tools: " + a);
        }
    }
    auto all = tools::builtin_tools(deps);
    if (as_json) {
        nlohmann::json defs = nlohmann::json::array();
        for (const auto& t : all) defs.push_back(t->definition());
        out << defs.dump(2) << '\n';
        return exit_code::Ok;
    }
    size_t width = 0;
    for (const auto& t : all) width = std::max(width, t->name().size());
    for (const auto& t : all) {
        out << std::left << std::setw(static_cast<int>(width + 2)) << t->name() << t->description() << '\n';
    }
    return exit_code::Ok;
}

int run_tool(const std::string& name, const std::vector<std::string>& args,
             std::ostream& out, std::ostream& err, const tools::ToolDependencies& deps) {
    auto registry = std::make_shared<ToolRegistry>();
    tools::register_builtin_tools(*registry, deps);
    auto tool = registry->lookup(name);

    if (std::find(args.begin(), args.end(), "--help") != args.end()
        || std::find(args.begin(), args.end(), "-h") != args.end()) {
        print_tool_usage(out, *tool);
        return exit_code::Ok;
    }

    nlohmann::json arguments = parse_tool_arguments(*tool, args);
    Dispatcher dispatcher(registry);
    HandlerResult result = dispatcher.call(name, arguments);
    if (const auto* value = std::get_if<nlohmann::json>(&result)) {
        print_result(out, *value);
        return exit_code::Ok;
    }
    const auto& error = std::get<JsonRpcError>(result);
    err << "Error: " << error.message << '\n';
    if (error.data && !error.data->is_null()) {
        err << error.data->dump() << '\n';
    }
    return exit_code::Failure;
}

} // anonymous namespace

nlohmann::json parse_tool_arguments(const Tool& tool, const std::vector<std::string>& args) {
    const InputSchema& schema = tool.input_schema();
    const char* positional_name = schema.find("message") ? "message"
                                : schema.find("input") ? "input" : nullptr;

    nlohmann::json out = nlohmann::json::object();
    bool positional_used = false;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg.rfind("--", 0) != 0 || arg.size() == 2) {
            if (!positional_name || positional_used) {
                throw UsageError("unexpected argument: " + arg);
            }
            out[positional_name] = arg;
            positional_used = true;
            continue;
        }

        std::string name = arg.substr(2);
        std::optional<std::string> value;
        if (auto eq = name.find('='); eq != std::string::npos) {
            value = name.substr(eq + 1);
            name = name.substr(0, eq);
        }
        const ParamSpec* spec = schema.find(name);
        if (!spec) {
            throw UsageError("unknown flag for " + tool.name() + ": --" + name);
        }
        if (!value) {
            if (spec->type == ParamType::Boolean
                && (i + 1 >= args.size() || args[i + 1].rfind("--", 0) == 0)) {
                value = "true";
            } else if (i + 1 < args.size()) {
                value = args[++i];
            } else {
                throw UsageError("flag needs an argument: --" + name);
            }
        }
        out[name] = convert_value(*spec, *value);
    }
    return out;
}

int run_cli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err,
            const tools::ToolDependencies& deps) {
    try {
        if (args.empty()) {
            print_usage(err, tools::builtin_tools(deps));
            return exit_code::Usage;
        }
        const std::string& command = args.front();
        std::vector<std::string> rest(args.begin() + 1, args.end());

        if (command == "--help" || command == "-h" || command == "help") {
            print_usage(out, tools::builtin_tools(deps));
            return exit_code::Ok;
        }
        if (command == "--version" || command == "-v") {
            out << SERVER_NAME << " version " << LIBRARY_VERSION << '\n';
            return exit_code::Ok;
        }
        if (command == "serve") return run_serve(rest, out, deps);
        if (command == "tools") return run_tools(rest, out, deps);
        return run_tool(command, rest, out, err, deps);
    } catch (const UsageError& e) {
        err << "Error: " << e.what() << "\nRun 'mcpipboy --help' for usage.\n";
        return exit_code::Usage;
    } catch (const ToolNotFoundError& e) {
        err << "Error: unknown command \"" << e.name << "\"\nRun 'mcpipboy --help' for usage.\n";
        return exit_code::Usage;
    } catch (const McpError& e) {
        err << "Error: " << e.what() << '\n';
        return exit_code::Failure;
    }
}

} // namespace mcpipboy
