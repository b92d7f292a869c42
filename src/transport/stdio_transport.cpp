#include "mcpipboy/transport/stdio_transport.hpp"
#include "mcpipboy/error.hpp"
#include "mcpipboy/logging.hpp"
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace mcpipboy {

namespace {

void report(const ErrorCallback& on_error, std::exception_ptr e) {
    if (on_error) on_error(std::move(e));
}

} // anonymous namespace

StdioTransport::StdioTransport()
    : read_fd_(STDIN_FILENO), write_fd_(STDOUT_FILENO), owns_fds_(false) {
}

StdioTransport::StdioTransport(int read_fd, int write_fd, bool owns_fds)
    : read_fd_(read_fd), write_fd_(write_fd), owns_fds_(owns_fds) {
}

StdioTransport::~StdioTransport() {
    if (owns_fds_) {
        if (read_fd_ >= 0)  ::close(read_fd_);
        if (write_fd_ >= 0 && write_fd_ != read_fd_) ::close(write_fd_);
    }
}

void StdioTransport::start(MessageCallback on_message, ErrorCallback on_error) {
    if (shutdown_requested_.load()) return;
    if (running_.exchange(true)) return;
    connected_ = true;

    std::string buffer;
    buffer.reserve(4096);
    char chunk[4096];

    while (running_) {
        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR) continue;
            report(on_error, std::make_exception_ptr(
                McpTransportError(std::string("Read error: ") + std::strerror(errno))));
            break;
        }
        if (n == 0) {
            // EOF: a last line without a trailing newline still counts
            if (!buffer.empty()) {
                handle_line(buffer, on_message, on_error);
                buffer.clear();
            }
            break;
        }

        buffer.append(chunk, static_cast<size_t>(n));

        size_t pos = 0;
        while (running_) {
            size_t nl = buffer.find('\n', pos);
            if (nl == std::string::npos) break;
            std::string_view line(buffer.data() + pos, nl - pos);
            pos = nl + 1;
            handle_line(line, on_message, on_error);
        }
        if (pos > 0) buffer.erase(0, pos);
    }

    running_ = false;
    connected_ = false;
}

void StdioTransport::handle_line(std::string_view line, const MessageCallback& on_message,
                                 const ErrorCallback& on_error) {
    // Remove trailing \r if present (CRLF)
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    if (line.find_first_not_of(" \t") == std::string_view::npos) return;

    if (logging::traffic_enabled()) {
        MCPIPBOY_DEBUG("<- {}", line);
    }

    JsonRpcMessage msg;
    try {
        msg = Codec::parse(line);
    } catch (const McpError&) {
        report(on_error, std::current_exception());
        return;
    }
    on_message(std::move(msg));
}

void StdioTransport::write_line(std::string line) {
    if (logging::traffic_enabled()) {
        MCPIPBOY_DEBUG("-> {}", line);
    }
    line += '\n';
    const char* data = line.data();
    size_t remaining = line.size();

    while (remaining > 0) {
        ssize_t written = ::write(write_fd_, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            connected_ = false;
            throw McpTransportError(std::string("Write error: ") + std::strerror(errno));
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }
}

void StdioTransport::send(const JsonRpcMessage& msg) {
    if (shutdown_requested_) {
        throw McpTransportError("Transport shut down");
    }
    write_line(Codec::serialize(msg));
}

void StdioTransport::shutdown() {
    shutdown_requested_ = true;
    running_ = false;
}

bool StdioTransport::is_connected() const {
    return connected_;
}

} // namespace mcpipboy
