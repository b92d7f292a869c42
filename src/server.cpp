#include "mcpipboy/server.hpp"
#include "mcpipboy/codec.hpp"
#include "mcpipboy/dispatcher.hpp"
#include "mcpipboy/router.hpp"
#include "mcpipboy/error.hpp"
#include "mcpipboy/logging.hpp"
#include "mcpipboy/version.hpp"
#include "mcpipboy/transport/stdio_transport.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

namespace mcpipboy {

Implementation McpServer::Options::default_server_info() {
    return Implementation{std::string(SERVER_NAME), std::nullopt, std::string(LIBRARY_VERSION)};
}

// ----------- McpServer::Impl -----------

struct McpServer::Impl {
    Options opts;
    std::shared_ptr<const ToolRegistry> registry;
    Dispatcher dispatcher;
    Session session;
    Router router;

    ITransport* transport{nullptr};
    std::mutex transport_mutex;
    std::atomic<bool> running{false};

    Impl(Options o, std::shared_ptr<const ToolRegistry> r)
        : opts(std::move(o)), registry(r), dispatcher(std::move(r)) {}

    bool has_resources() const {
        for (const auto& tool : registry->list()) {
            if (!tool->resources().empty()) return true;
        }
        return false;
    }

    ServerCapabilities build_capabilities() const {
        ServerCapabilities caps;
        caps.tools = nlohmann::json{{"listChanged", false}};
        if (has_resources()) {
            caps.resources = nlohmann::json{{"subscribe", false}, {"listChanged", false}};
        }
        return caps;
    }

    static std::string require_string(const nlohmann::json& params, const char* key) {
        auto it = params.find(key);
        if (it == params.end() || !it->is_string()) {
            throw McpProtocolError(error::InvalidParams,
                                   std::string("Invalid params: '") + key + "' must be a string");
        }
        return it->get<std::string>();
    }

    void setup_handlers() {
        // initialize
        router.on_request("initialize", [this](const nlohmann::json& params) -> HandlerResult {
            std::string client_proto = params.value("protocolVersion", std::string(PROTOCOL_VERSION));
            std::optional<Implementation> client_info;
            if (auto it = params.find("clientInfo"); it != params.end()) {
                try {
                    client_info = it->get<Implementation>();
                } catch (const nlohmann::json::exception& e) {
                    MCPIPBOY_DEBUG("ignoring malformed clientInfo: {}", e.what());
                }
            }
            if (client_info) {
                MCPIPBOY_INFO("client {} {} connected (protocol {})",
                              client_info->name, client_info->version, client_proto);
            }
            session.on_initialize(client_proto, std::move(client_info));

            InitializeResult result;
            result.protocol_version = std::string(PROTOCOL_VERSION);
            result.capabilities = build_capabilities();
            result.server_info = opts.server_info;
            result.instructions = opts.instructions;

            nlohmann::json j;
            to_json(j, result);
            return j;
        });

        // notifications/initialized
        router.on_notification("notifications/initialized", [this](const nlohmann::json&) {
            session.on_initialized();
        });

        // ping
        router.on_request("ping", [](const nlohmann::json&) -> HandlerResult {
            return nlohmann::json::object();
        });

        // tools/list
        router.on_request("tools/list", [this](const nlohmann::json&) -> HandlerResult {
            nlohmann::json tools = nlohmann::json::array();
            for (const auto& tool : registry->list()) {
                tools.push_back({
                    {"name", tool->name()},
                    {"description", tool->description()},
                    {"inputSchema", tool->input_schema().to_json()}
                });
            }
            return nlohmann::json{{"tools", std::move(tools)}};
        });

        // tools/call
        router.on_request("tools/call", [this](const nlohmann::json& params) -> HandlerResult {
            std::string name = require_string(params, "name");
            nlohmann::json arguments = nlohmann::json::object();
            if (auto it = params.find("arguments"); it != params.end() && !it->is_null()) {
                if (!it->is_object()) {
                    return JsonRpcError{error::InvalidParams,
                                        "Invalid params: 'arguments' must be an object",
                                        std::nullopt};
                }
                arguments = *it;
            }

            auto result = dispatcher.call(name, arguments);
            if (auto* value = std::get_if<nlohmann::json>(&result)) {
                return Dispatcher::wrap_result(*value);
            }
            return std::get<JsonRpcError>(std::move(result));
        });

        // resources/list
        router.on_request("resources/list", [this](const nlohmann::json&) -> HandlerResult {
            nlohmann::json resources = nlohmann::json::array();
            for (const auto& tool : registry->list()) {
                for (const auto& def : tool->resources()) {
                    resources.push_back(def);
                }
            }
            return nlohmann::json{{"resources", std::move(resources)}};
        });

        // resources/read
        router.on_request("resources/read", [this](const nlohmann::json& params) -> HandlerResult {
            std::string uri = require_string(params, "uri");
            for (const auto& tool : registry->list()) {
                if (tool->has_resource(uri)) {
                    std::vector<ResourceContent> contents{tool->read_resource(uri)};
                    return nlohmann::json{{"contents", contents}};
                }
            }
            return JsonRpcError{error::ResourceNotFound, "Resource not found: " + uri,
                                nlohmann::json{{"uri", uri}}};
        });
    }

    std::optional<JsonRpcMessage> on_message(const JsonRpcMessage& msg) {
        if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
            if (req->method != "initialize") session.on_request();
        } else if (std::holds_alternative<JsonRpcResponse>(msg)) {
            MCPIPBOY_DEBUG("ignoring unsolicited response");
        }
        return router.dispatch(msg);
    }
};

// ----------- McpServer -----------

McpServer::McpServer(Options opts, std::shared_ptr<const ToolRegistry> registry)
    : impl_(std::make_unique<Impl>(std::move(opts), std::move(registry))) {
    impl_->setup_handlers();
}

McpServer::~McpServer() = default;

std::optional<JsonRpcMessage> McpServer::handle_message(const JsonRpcMessage& msg) {
    return impl_->on_message(msg);
}

std::optional<JsonRpcMessage> McpServer::handle_decode_error(std::exception_ptr e) {
    try {
        std::rethrow_exception(std::move(e));
    } catch (const McpInvalidRequestError& err) {
        MCPIPBOY_WARN("invalid request: {}", err.what());
        return make_error(err.id, JsonRpcError{error::InvalidRequest, err.what(), std::nullopt});
    } catch (const McpParseError& err) {
        MCPIPBOY_WARN("skipping unparsable line: {}", err.what());
    } catch (const McpTransportError& err) {
        MCPIPBOY_ERROR("transport error: {}", err.what());
    }
    return std::nullopt;
}

std::optional<std::string> McpServer::handle_line(std::string_view line) {
    std::optional<JsonRpcMessage> reply;
    try {
        auto msg = Codec::parse(line);
        reply = handle_message(msg);
    } catch (const McpParseError&) {
        reply = handle_decode_error(std::current_exception());
    } catch (const McpInvalidRequestError&) {
        reply = handle_decode_error(std::current_exception());
    }
    if (!reply) return std::nullopt;
    return Codec::serialize(*reply);
}

void McpServer::serve(std::unique_ptr<ITransport> transport) {
    impl_->running = true;
    {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->transport = transport.get();
    }
    ITransport* t = transport.get();
    MCPIPBOY_INFO("serving {} tool(s)", impl_->registry->list().size());

    try {
        t->start(
            [this, t](JsonRpcMessage msg) {
                if (auto reply = impl_->on_message(msg)) t->send(*reply);
            },
            [this, t](std::exception_ptr e) {
                if (auto reply = handle_decode_error(std::move(e))) t->send(*reply);
            });
    } catch (...) {
        impl_->running = false;
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->transport = nullptr;
        throw;
    }

    impl_->running = false;
    std::lock_guard<std::mutex> lock(impl_->transport_mutex);
    impl_->transport = nullptr;
    MCPIPBOY_INFO("end of input, server stopped");
}

void McpServer::serve_stdio() {
    serve(std::make_unique<StdioTransport>());
}

void McpServer::shutdown() {
    impl_->running = false;
    std::lock_guard<std::mutex> lock(impl_->transport_mutex);
    if (impl_->transport) {
        impl_->transport->shutdown();
    }
}

bool McpServer::is_running() const {
    return impl_->running;
}

const Session& McpServer::session() const {
    return impl_->session;
}

} // namespace mcpipboy
