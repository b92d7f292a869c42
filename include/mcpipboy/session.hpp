#pragma once
#include "types.hpp"
#include <optional>
#include <string>

namespace mcpipboy {

enum class SessionState {
    Uninitialized,
    Initialized,
    Serving
};

[[nodiscard]] const char* to_string(SessionState s);

/// Per-connection lifecycle. `initialize` is expected first, but any other
/// request arriving earlier moves the session straight to Serving.
class Session {
public:
    [[nodiscard]] SessionState state() const noexcept { return state_; }

    /// Record the client's initialize request.
    void on_initialize(std::string client_protocol_version,
                       std::optional<Implementation> client_info);

    /// notifications/initialized received.
    void on_initialized();

    /// A request other than initialize is about to be served.
    void on_request();

    [[nodiscard]] const std::string& client_protocol_version() const noexcept {
        return client_protocol_version_;
    }
    [[nodiscard]] const std::optional<Implementation>& client_info() const noexcept {
        return client_info_;
    }

private:
    SessionState state_{SessionState::Uninitialized};
    std::string client_protocol_version_;
    std::optional<Implementation> client_info_;
};

} // namespace mcpipboy
