#pragma once

#include <mcn_ls/core/result.hpp>
#include <mcn_ls/core/types.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcn_ls {

// ---------------------------------------------------------------------------
// Protocol errors (JSON-RPC 2.0 and LSP reserved codes).
// ---------------------------------------------------------------------------
enum class ErrorCode : int {
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603,
    ServerNotInitialized = -32002,
};

struct ResponseError {
    ErrorCode code = ErrorCode::InternalError;
    std::string message;

    [[nodiscard]] nlohmann::json ToJson() const;

    bool operator==(const ResponseError& other) const {
        return code == other.code && message == other.message;
    }
    bool operator!=(const ResponseError& other) const { return !(*this == other); }
};

// ---------------------------------------------------------------------------
// Envelopes.
// ---------------------------------------------------------------------------
struct Request {
    nlohmann::json id;
    std::string method;
    nlohmann::json params;
    // Carried through but never acted upon: requests always run to completion.
    std::optional<nlohmann::json> cancellation_token;
};

struct Notification {
    std::string method;
    nlohmann::json params;
};

struct Response {
    nlohmann::json id;
    std::optional<nlohmann::json> result;
    std::optional<ResponseError> error;

    static Response Success(nlohmann::json id, nlohmann::json result);
    static Response Failure(nlohmann::json id, ResponseError error);

    [[nodiscard]] bool IsError() const { return error.has_value(); }
    [[nodiscard]] nlohmann::json ToJson() const;
};

using InboundMessage = std::variant<Request, Notification>;

// Validate a decoded JSON-RPC message. Requests carry an "id" (integer or
// string); notifications do not.
Result<InboundMessage, ResponseError> ParseInboundMessage(const nlohmann::json& message);

// True for a message the client sent in reply to a server-originated request.
[[nodiscard]] bool IsClientResponse(const nlohmann::json& message);

nlohmann::json MakeNotification(const std::string& method, const nlohmann::json& params);
nlohmann::json MakeRequest(int64_t id, const std::string& method,
                           const nlohmann::json& params);

// ---------------------------------------------------------------------------
// Recognized methods.
// ---------------------------------------------------------------------------
enum class Method {
    Initialize,
    Initialized,
    Shutdown,
    Exit,
    DidOpen,
    DidChange,
    Diagnostic,
    CancelRequest,
    Unknown,
};

[[nodiscard]] Method MethodFromName(std::string_view name);

constexpr const char* kPublishDiagnostics = "textDocument/publishDiagnostics";

// ---------------------------------------------------------------------------
// Typed parameters, validated at the boundary.
// ---------------------------------------------------------------------------
struct InitializeParams {
    std::optional<int64_t> process_id;
    std::optional<std::string> root_uri;
    std::optional<std::string> client_name;
    nlohmann::json capabilities = nlohmann::json::object();
};

struct TextDocumentItem {
    DocumentUri uri;
    std::string language_id;
    int64_t version;
    std::string text;
};

struct DidOpenParams {
    TextDocumentItem text_document;
};

struct DidChangeParams {
    DocumentUri uri;
    int64_t version;
    std::vector<std::string> content_changes;  // full texts, in delivery order
};

struct DocumentDiagnosticParams {
    DocumentUri uri;
};

// Every field of initialize is optional; a missing or null params value is
// accepted as {}.
Result<InitializeParams, ResponseError> ParseInitializeParams(const nlohmann::json& params);
Result<DidOpenParams, ResponseError> ParseDidOpenParams(const nlohmann::json& params);
Result<DidChangeParams, ResponseError> ParseDidChangeParams(const nlohmann::json& params);
Result<DocumentDiagnosticParams, ResponseError> ParseDocumentDiagnosticParams(
    const nlohmann::json& params);

} // namespace mcn_ls
