/// mcpipboy: MCP tool server and command line front end.
/// Usage: ./mcpipboy serve | ./mcpipboy <tool> [flags]

#include <mcpipboy/mcpipboy.hpp>
#include <csignal>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    // a vanished client shows up as a write error
    std::signal(SIGPIPE, SIG_IGN);

    std::vector<std::string> args(argv + 1, argv + argc);
    try {
        mcpipboy::logging::init(mcpipboy::logging::LogOptions{});
        return mcpipboy::run_cli(args, std::cout, std::cerr);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return mcpipboy::exit_code::Failure;
    }
}
