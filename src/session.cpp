#include "mcpipboy/session.hpp"
#include "mcpipboy/logging.hpp"

namespace mcpipboy {

const char* to_string(SessionState s) {
    switch (s) {
        case SessionState::Uninitialized: return "uninitialized";
        case SessionState::Initialized:   return "initialized";
        case SessionState::Serving:       return "serving";
    }
    return "unknown";
}

void Session::on_initialize(std::string client_protocol_version,
                            std::optional<Implementation> client_info) {
    if (state_ != SessionState::Uninitialized) {
        MCPIPBOY_DEBUG("initialize received in state {}", to_string(state_));
    }
    client_protocol_version_ = std::move(client_protocol_version);
    client_info_ = std::move(client_info);
    if (state_ == SessionState::Uninitialized) {
        state_ = SessionState::Initialized;
    }
}

void Session::on_initialized() {
    state_ = SessionState::Serving;
}

void Session::on_request() {
    if (state_ != SessionState::Serving) {
        if (state_ == SessionState::Uninitialized) {
            MCPIPBOY_DEBUG("request before initialize, serving lazily");
        }
        state_ = SessionState::Serving;
    }
}

} // namespace mcpipboy
