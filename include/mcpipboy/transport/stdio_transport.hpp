#pragma once
#include "transport.hpp"
#include "../codec.hpp"
#include <atomic>
#include <string>
#include <string_view>

namespace mcpipboy {

/// Newline-delimited JSON over a pair of file descriptors (stdin/stdout by
/// default). Blocking and single-threaded: a line is read, handed to the
/// callback, and any reply is written before the next read.
class StdioTransport : public ITransport {
public:
    /// Create transport using system stdin/stdout.
    StdioTransport();

    /// Create transport over the given descriptors. They are closed on
    /// destruction only if `owns_fds` is set.
    StdioTransport(int read_fd, int write_fd, bool owns_fds = false);

    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    void start(MessageCallback on_message, ErrorCallback on_error = nullptr) override;
    void send(const JsonRpcMessage& msg) override;
    void shutdown() override;
    bool is_connected() const override;

private:
    void handle_line(std::string_view line, const MessageCallback& on_message,
                     const ErrorCallback& on_error);
    void write_line(std::string line);

    int read_fd_;
    int write_fd_;
    bool owns_fds_;

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<bool> shutdown_requested_{false};
};

} // namespace mcpipboy
