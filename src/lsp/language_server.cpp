#include <mcn_ls/lsp/language_server.hpp>

#include <mcn_ls/core/log.hpp>
#include <mcn_ls/core/version.hpp>

#include <exception>
#include <variant>

namespace mcn_ls {

namespace {

constexpr int kTextDocumentSyncFull = 1;

nlohmann::json InitializeResult() {
    return {
        {"capabilities", {
            {"textDocumentSync", kTextDocumentSyncFull},
            {"diagnosticProvider", {
                {"interFileDependencies", false},
                {"workspaceDiagnostics", false}
            }}
        }},
        {"serverInfo", {
            {"name", "mcn-ls"},
            {"version", kVersion}
        }}
    };
}

} // anonymous namespace

const char* PhaseName(ServerPhase phase) {
    switch (phase) {
        case ServerPhase::Uninitialized: return "uninitialized";
        case ServerPhase::Initializing:  return "initializing";
        case ServerPhase::Ready:         return "ready";
        case ServerPhase::ShuttingDown:  return "shutting-down";
        case ServerPhase::Exited:        return "exited";
    }
    return "unknown";
}

LanguageServer::LanguageServer(CompilerAdapter adapter, OutboundSupplier outbound)
    : adapter_(std::move(adapter)), outbound_supplier_(std::move(outbound)) {}

std::optional<Response> LanguageServer::Dispatch(const InboundMessage& message) {
    if (const auto* request = std::get_if<Request>(&message)) {
        return HandleRequest(*request);
    }
    HandleNotification(std::get<Notification>(message));
    return std::nullopt;
}

std::optional<nlohmann::json> LanguageServer::HandleMessage(const nlohmann::json& message) {
    auto parsed = ParseInboundMessage(message);
    if (parsed.IsErr()) {
        LogWarn("server", "Rejected message: " + parsed.Error().message);
        if (message.is_object() && message.contains("id")) {
            return Response::Failure(message["id"], parsed.Error()).ToJson();
        }
        return std::nullopt;
    }

    auto response = Dispatch(parsed.Value());
    if (response) {
        return response->ToJson();
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Requests
// ---------------------------------------------------------------------------

Response LanguageServer::HandleRequest(const Request& request) {
    const Method method = MethodFromName(request.method);
    LogDebug("server", "Request '" + request.method + "' in phase " + PhaseName(phase_));

    if (phase_ == ServerPhase::Uninitialized && method != Method::Initialize) {
        return Response::Failure(request.id, ResponseError{ErrorCode::ServerNotInitialized,
                                                           "Server not initialized"});
    }
    if (phase_ == ServerPhase::ShuttingDown || phase_ == ServerPhase::Exited) {
        return Response::Failure(request.id, ResponseError{ErrorCode::InvalidRequest,
                                                           "Server is shutting down"});
    }

    HandlerResult result = HandlerResult::Err(
        ResponseError{ErrorCode::MethodNotFound, "Method not found: " + request.method});
    try {
        switch (method) {
            case Method::Initialize:
                if (phase_ != ServerPhase::Uninitialized) {
                    result = HandlerResult::Err(ResponseError{
                        ErrorCode::InvalidRequest, "Server is already initialized"});
                } else {
                    result = HandleInitialize(request.params);
                }
                break;
            case Method::Shutdown:
                result = HandleShutdown();
                break;
            case Method::Diagnostic:
                result = HandleDocumentDiagnostic(request.params);
                break;
            default:
                break;
        }
    } catch (const std::exception& e) {
        LogError("server", "Request '" + request.method + "' failed: " + e.what());
        result = HandlerResult::Err(ResponseError{ErrorCode::InternalError, e.what()});
    }

    if (result.IsErr()) {
        return Response::Failure(request.id, result.Error());
    }
    return Response::Success(request.id, std::move(result).Value());
}

LanguageServer::HandlerResult LanguageServer::HandleInitialize(const nlohmann::json& params) {
    phase_ = ServerPhase::Initializing;

    auto parsed = ParseInitializeParams(params);
    if (parsed.IsErr()) {
        phase_ = ServerPhase::Uninitialized;
        return HandlerResult::Err(parsed.Error());
    }

    try {
        outbound_ = outbound_supplier_ ? outbound_supplier_() : OutboundHandles{};
    } catch (const std::exception& e) {
        phase_ = ServerPhase::Uninitialized;
        LogError("server", std::string("Transport did not supply outbound handles: ") + e.what());
        return HandlerResult::Err(ResponseError{ErrorCode::InternalError, e.what()});
    } catch (...) {
        phase_ = ServerPhase::Uninitialized;
        LogError("server", "Transport did not supply outbound handles: unknown exception");
        return HandlerResult::Err(
            ResponseError{ErrorCode::InternalError, "Transport did not supply outbound handles"});
    }

    phase_ = ServerPhase::Ready;
    LogInfo("server", "Initialized for client '" +
                          parsed.Value().client_name.value_or("unknown") + "'");
    return HandlerResult::Ok(InitializeResult());
}

LanguageServer::HandlerResult LanguageServer::HandleShutdown() {
    shutdown_requested_ = true;
    phase_ = ServerPhase::ShuttingDown;
    LogInfo("server", "Shutdown requested");
    return HandlerResult::Ok(nlohmann::json());
}

LanguageServer::HandlerResult LanguageServer::HandleDocumentDiagnostic(
    const nlohmann::json& params) {
    auto parsed = ParseDocumentDiagnosticParams(params);
    if (parsed.IsErr()) {
        return HandlerResult::Err(parsed.Error());
    }

    nlohmann::json items = nlohmann::json::array();
    const auto& current = documents_.Current();
    if (current && current->uri == parsed.Value().uri) {
        items = ToJson(last_diagnostics_);
    }
    nlohmann::json report = {{"kind", "full"}, {"items", items}};
    return HandlerResult::Ok(std::move(report));
}

// ---------------------------------------------------------------------------
// Notifications
// ---------------------------------------------------------------------------

void LanguageServer::HandleNotification(const Notification& notification) {
    const Method method = MethodFromName(notification.method);

    if (method == Method::Exit) {
        HandleExit();
        return;
    }
    if (phase_ != ServerPhase::Ready) {
        LogDebug("server", "Dropping '" + notification.method + "' in phase " +
                               PhaseName(phase_));
        return;
    }

    try {
        switch (method) {
            case Method::Initialized:
                LogInfo("server", "Client confirmed initialization");
                break;
            case Method::DidOpen:
                HandleDidOpen(notification.params);
                break;
            case Method::DidChange:
                HandleDidChange(notification.params);
                break;
            case Method::CancelRequest:
                LogDebug("server", "Cancellation is not supported; ignoring");
                break;
            default:
                LogDebug("server", "Ignoring notification '" + notification.method + "'");
                break;
        }
    } catch (const std::exception& e) {
        LogError("server", "Notification '" + notification.method + "' failed: " + e.what());
    }
}

void LanguageServer::HandleDidOpen(const nlohmann::json& params) {
    auto parsed = ParseDidOpenParams(params);
    if (parsed.IsErr()) {
        LogWarn("server", "Invalid didOpen params: " + parsed.Error().message);
        return;
    }
    TextDocumentItem item = std::move(parsed).Value().text_document;
    ApplyDocument(Document{std::move(item.uri), std::move(item.text), item.version,
                           std::move(item.language_id)});
}

void LanguageServer::HandleDidChange(const nlohmann::json& params) {
    auto parsed = ParseDidChangeParams(params);
    if (parsed.IsErr()) {
        LogWarn("server", "Invalid didChange params: " + parsed.Error().message);
        return;
    }
    DidChangeParams change = std::move(parsed).Value();
    if (change.content_changes.size() > 1) {
        LogWarn("server", "Received " + std::to_string(change.content_changes.size()) +
                              " content changes; applying only the first");
    }

    std::string language_id;
    if (documents_.Current()) {
        language_id = documents_.Current()->language_id;
    }
    ApplyDocument(Document{std::move(change.uri), std::move(change.content_changes.front()),
                           change.version, std::move(language_id)});
}

void LanguageServer::HandleExit() {
    phase_ = ServerPhase::Exited;
    LogInfo("server", shutdown_requested_ ? "Exit after shutdown"
                                          : "Exit without prior shutdown");
}

void LanguageServer::ApplyDocument(Document document) {
    const int64_t version = document.version;
    if (!documents_.Replace(std::move(document))) {
        LogDebug("server", "Ignoring stale document version " + std::to_string(version));
        return;
    }

    const Document& current = *documents_.Current();
    auto result = adapter_.Compile(current.text);
    if (result.IsOk()) {
        last_diagnostics_.clear();
    } else {
        last_diagnostics_ = std::move(result).Error();
    }
    LogDebug("server", "Version " + std::to_string(version) + " compiled with " +
                           std::to_string(last_diagnostics_.size()) + " diagnostic(s)");
    PublishDiagnostics(current);
}

void LanguageServer::PublishDiagnostics(const Document& document) {
    if (!outbound_ || !outbound_->send_notification) {
        return;
    }
    const nlohmann::json params = {
        {"uri", document.uri.Value()},
        {"version", document.version},
        {"diagnostics", ToJson(last_diagnostics_)}
    };
    try {
        outbound_->send_notification(kPublishDiagnostics, params);
    } catch (const std::exception& e) {
        LogError("server", std::string("Failed to publish diagnostics: ") + e.what());
    } catch (...) {
        LogError("server", "Failed to publish diagnostics: unknown exception");
    }
}

} // namespace mcn_ls
