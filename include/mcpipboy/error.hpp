#pragma once
#include "json_rpc.hpp"
#include <stdexcept>
#include <string>
#include <variant>
#include <optional>
#include <nlohmann/json.hpp>

namespace mcpipboy {

class McpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// The line is not JSON at all.
class McpParseError : public McpError {
public:
    using McpError::McpError;
};

/// The line is JSON but not a valid JSON-RPC 2.0 message. `id` holds the
/// request id when one could be recovered, null otherwise.
class McpInvalidRequestError : public McpError {
public:
    RequestId id;
    McpInvalidRequestError(RequestId id, const std::string& msg)
        : McpError(msg), id(std::move(id)) {}
};

class McpProtocolError : public McpError {
public:
    int code;
    std::optional<nlohmann::json> data;
    McpProtocolError(int code, const std::string& msg,
                     std::optional<nlohmann::json> data = std::nullopt)
        : McpError(msg), code(code), data(std::move(data)) {}
};

class McpTransportError : public McpError {
public:
    using McpError::McpError;
};

class ConfigError : public McpError {
public:
    using McpError::McpError;
};

class DuplicateToolError : public McpError {
public:
    std::string name;
    explicit DuplicateToolError(std::string name)
        : McpError("tool already registered: " + name), name(std::move(name)) {}
};

class ToolNotFoundError : public McpError {
public:
    std::string name;
    explicit ToolNotFoundError(std::string name)
        : McpError("tool not found: " + name), name(std::move(name)) {}
};

class ResourceNotFoundError : public McpError {
public:
    std::string uri;
    explicit ResourceNotFoundError(std::string uri)
        : McpError("Resource not found: " + uri), uri(std::move(uri)) {}
};

/// Semantic failure inside a tool; the message is shown to the caller as-is.
class ExecutionError : public McpError {
public:
    using McpError::McpError;
};

// ---------- Parameter validation failures ----------

struct MissingParameter {
    std::string field;

    bool operator==(const MissingParameter& o) const { return field == o.field; }
};

struct TypeMismatch {
    std::string field;
    std::string expected;
    std::string actual;

    bool operator==(const TypeMismatch& o) const {
        return field == o.field && expected == o.expected && actual == o.actual;
    }
};

struct ConstraintViolation {
    std::string field;
    std::string constraint;

    bool operator==(const ConstraintViolation& o) const {
        return field == o.field && constraint == o.constraint;
    }
};

using ValidationFailure = std::variant<MissingParameter, TypeMismatch, ConstraintViolation>;

/// Human readable one-line description, e.g. "missing required parameter: message".
[[nodiscard]] std::string describe(const ValidationFailure& failure);

void to_json(nlohmann::json& j, const ValidationFailure& failure);

class ValidationError : public McpError {
public:
    ValidationFailure failure;
    explicit ValidationError(ValidationFailure f)
        : McpError(describe(f)), failure(std::move(f)) {}
};

namespace error {
    constexpr int ParseError          = -32700;
    constexpr int InvalidRequest      = -32600;
    constexpr int MethodNotFound      = -32601;
    constexpr int InvalidParams       = -32602;
    constexpr int InternalError       = -32603;
    constexpr int ToolExecutionError  = -32000;
    constexpr int ResourceNotFound    = -32002;
} // namespace error

} // namespace mcpipboy
