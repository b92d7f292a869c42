#pragma once
#include "types.hpp"
#include "json_rpc.hpp"
#include "registry.hpp"
#include "session.hpp"
#include "transport/transport.hpp"
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mcpipboy {

/// JSON-RPC engine exposing a ToolRegistry: initialize, ping, tools/list,
/// tools/call, resources/list and resources/read.
class McpServer {
public:
    struct Options {
        Implementation server_info = default_server_info();
        std::optional<std::string> instructions;

        static Implementation default_server_info();
    };

    McpServer(Options opts, std::shared_ptr<const ToolRegistry> registry);
    ~McpServer();

    // Non-copyable, non-movable
    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    /// Handle one decoded message; returns the reply for requests.
    [[nodiscard]] std::optional<JsonRpcMessage> handle_message(const JsonRpcMessage& msg);

    /// Handle one raw line: decode, dispatch and encode the reply. Lines that
    /// are not JSON yield nullopt; malformed envelopes yield an error reply.
    [[nodiscard]] std::optional<std::string> handle_line(std::string_view line);

    /// Reply for a line the codec rejected, if one is owed.
    [[nodiscard]] std::optional<JsonRpcMessage> handle_decode_error(std::exception_ptr e);

    // ---- Transport ----
    /// Serve until the transport reaches end of input.
    void serve(std::unique_ptr<ITransport> transport);
    void serve_stdio();
    void shutdown();

    [[nodiscard]] bool is_running() const;
    [[nodiscard]] const Session& session() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mcpipboy
