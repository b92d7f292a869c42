#pragma once
#include "../json_rpc.hpp"
#include <exception>
#include <functional>

namespace mcpipboy {

/// Callback for incoming messages
using MessageCallback = std::function<void(JsonRpcMessage)>;
/// Called with McpParseError / McpInvalidRequestError for lines that did not
/// decode, and McpTransportError for I/O failures.
using ErrorCallback = std::function<void(std::exception_ptr)>;

/// Abstract transport interface
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Run the read loop on the calling thread until end of input or shutdown().
    /// Callbacks run synchronously, one message at a time.
    virtual void start(MessageCallback on_message,
                       ErrorCallback on_error = nullptr) = 0;

    /// Write one message to the peer before returning.
    virtual void send(const JsonRpcMessage& msg) = 0;

    /// Stop after the message currently being handled.
    virtual void shutdown() = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;
};

} // namespace mcpipboy
