#pragma once

#include <mcn_ls/core/result.hpp>
#include <mcn_ls/lsp/compiler_adapter.hpp>
#include <mcn_ls/lsp/diagnostic.hpp>
#include <mcn_ls/lsp/document_store.hpp>
#include <mcn_ls/lsp/message.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcn_ls {

// ---------------------------------------------------------------------------
// OutboundHandles: the two primitives the transport exposes for
// server-originated traffic.
// ---------------------------------------------------------------------------
struct OutboundHandles {
    std::function<void(const std::string& method, const nlohmann::json& params)>
        send_notification;
    std::function<nlohmann::json(const std::string& method, const nlohmann::json& params)>
        send_request;
};

// Called exactly once, when initialize succeeds.
using OutboundSupplier = std::function<OutboundHandles()>;

enum class ServerPhase {
    Uninitialized,
    Initializing,
    Ready,
    ShuttingDown,
    Exited,
};

[[nodiscard]] const char* PhaseName(ServerPhase phase);

// ---------------------------------------------------------------------------
// LanguageServer: protocol state machine for a single document.
//
//   Uninitialized --initialize--> Initializing --> Ready
//   Ready --shutdown--> ShuttingDown --exit--> Exited
//
// Messages are handled one at a time. Every request yields exactly one
// response; notifications never do. No handler lets an exception escape:
// request faults become InternalError responses, notification faults are
// logged.
// ---------------------------------------------------------------------------
class LanguageServer {
public:
    LanguageServer(CompilerAdapter adapter, OutboundSupplier outbound);

    // Handle a validated message. Returns a response for requests only.
    std::optional<Response> Dispatch(const InboundMessage& message);

    // Handle a raw JSON-RPC message. Returns the response JSON for requests,
    // including malformed ones that carry an id.
    std::optional<nlohmann::json> HandleMessage(const nlohmann::json& message);

    [[nodiscard]] ServerPhase Phase() const { return phase_; }
    [[nodiscard]] const DocumentStore& Documents() const { return documents_; }
    [[nodiscard]] const std::vector<Diagnostic>& LastDiagnostics() const {
        return last_diagnostics_;
    }

    // 0 when exit followed shutdown, 1 otherwise.
    [[nodiscard]] int ExitCode() const { return shutdown_requested_ ? 0 : 1; }

private:
    using HandlerResult = Result<nlohmann::json, ResponseError>;

    Response HandleRequest(const Request& request);
    void HandleNotification(const Notification& notification);

    HandlerResult HandleInitialize(const nlohmann::json& params);
    HandlerResult HandleShutdown();
    HandlerResult HandleDocumentDiagnostic(const nlohmann::json& params);

    void HandleDidOpen(const nlohmann::json& params);
    void HandleDidChange(const nlohmann::json& params);
    void HandleExit();

    // Store the document and, if accepted, compile it and publish.
    void ApplyDocument(Document document);
    void PublishDiagnostics(const Document& document);

    CompilerAdapter adapter_;
    OutboundSupplier outbound_supplier_;
    std::optional<OutboundHandles> outbound_;
    ServerPhase phase_ = ServerPhase::Uninitialized;
    bool shutdown_requested_ = false;
    DocumentStore documents_;
    std::vector<Diagnostic> last_diagnostics_;
};

} // namespace mcn_ls
