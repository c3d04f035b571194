#include <mcn_ls/lsp/message.hpp>

namespace mcn_ls {

namespace {

ResponseError InvalidParams(std::string message) {
    return ResponseError{ErrorCode::InvalidParams, std::move(message)};
}

ResponseError InvalidRequest(std::string message) {
    return ResponseError{ErrorCode::InvalidRequest, std::move(message)};
}

// Looks up params[key] and requires it to be an object.
Result<const nlohmann::json*, ResponseError> RequireObject(const nlohmann::json& params,
                                                           const char* key) {
    using ObjectResult = Result<const nlohmann::json*, ResponseError>;
    if (!params.is_object()) {
        return ObjectResult::Err(InvalidParams("params must be an object"));
    }
    auto it = params.find(key);
    if (it == params.end() || !it->is_object()) {
        return ObjectResult::Err(InvalidParams(std::string("Missing object '") + key + "'"));
    }
    return ObjectResult::Ok(&*it);
}

Result<DocumentUri, ResponseError> RequireUri(const nlohmann::json& text_document) {
    auto it = text_document.find("uri");
    if (it == text_document.end() || !it->is_string()) {
        return Result<DocumentUri, ResponseError>::Err(
            InvalidParams("textDocument.uri must be a string"));
    }
    auto uri = DocumentUri::Create(it->get<std::string>());
    if (uri.IsErr()) {
        return Result<DocumentUri, ResponseError>::Err(
            InvalidParams("Invalid textDocument.uri: " + uri.Error()));
    }
    return Result<DocumentUri, ResponseError>::Ok(std::move(uri).Value());
}

Result<int64_t, ResponseError> RequireVersion(const nlohmann::json& text_document) {
    auto it = text_document.find("version");
    if (it == text_document.end() || !it->is_number_integer()) {
        return Result<int64_t, ResponseError>::Err(
            InvalidParams("textDocument.version must be an integer"));
    }
    return Result<int64_t, ResponseError>::Ok(it->get<int64_t>());
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Envelopes
// ---------------------------------------------------------------------------

nlohmann::json ResponseError::ToJson() const {
    return {{"code", static_cast<int>(code)}, {"message", message}};
}

Response Response::Success(nlohmann::json id, nlohmann::json result) {
    Response response;
    response.id = std::move(id);
    response.result = std::move(result);
    return response;
}

Response Response::Failure(nlohmann::json id, ResponseError error) {
    Response response;
    response.id = std::move(id);
    response.error = std::move(error);
    return response;
}

nlohmann::json Response::ToJson() const {
    nlohmann::json out = {{"jsonrpc", "2.0"}, {"id", id}};
    if (error) {
        out["error"] = error->ToJson();
    } else {
        out["result"] = result.value_or(nlohmann::json());
    }
    return out;
}

Result<InboundMessage, ResponseError> ParseInboundMessage(const nlohmann::json& message) {
    using ParseResult = Result<InboundMessage, ResponseError>;

    if (!message.is_object()) {
        return ParseResult::Err(InvalidRequest("Message must be a JSON object"));
    }
    auto version = message.find("jsonrpc");
    if (version == message.end() || *version != "2.0") {
        return ParseResult::Err(InvalidRequest("Invalid JSON-RPC version"));
    }
    auto method = message.find("method");
    if (method == message.end() || !method->is_string()) {
        return ParseResult::Err(InvalidRequest("Missing method"));
    }
    nlohmann::json params = message.value("params", nlohmann::json());

    auto id = message.find("id");
    if (id == message.end()) {
        return ParseResult::Ok(
            InboundMessage(Notification{method->get<std::string>(), std::move(params)}));
    }
    if (!id->is_number_integer() && !id->is_string()) {
        return ParseResult::Err(InvalidRequest("Request id must be an integer or a string"));
    }

    Request request{*id, method->get<std::string>(), std::move(params), std::nullopt};
    auto token = message.find("token");
    if (token != message.end() && !token->is_null()) {
        request.cancellation_token = *token;
    }
    return ParseResult::Ok(InboundMessage(std::move(request)));
}

bool IsClientResponse(const nlohmann::json& message) {
    return message.is_object() && !message.contains("method") &&
           message.contains("id") &&
           (message.contains("result") || message.contains("error"));
}

nlohmann::json MakeNotification(const std::string& method, const nlohmann::json& params) {
    return {{"jsonrpc", "2.0"}, {"method", method}, {"params", params}};
}

nlohmann::json MakeRequest(int64_t id, const std::string& method,
                           const nlohmann::json& params) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
}

Method MethodFromName(std::string_view name) {
    if (name == "initialize") return Method::Initialize;
    if (name == "initialized") return Method::Initialized;
    if (name == "shutdown") return Method::Shutdown;
    if (name == "exit") return Method::Exit;
    if (name == "textDocument/didOpen") return Method::DidOpen;
    if (name == "textDocument/didChange") return Method::DidChange;
    if (name == "textDocument/diagnostic") return Method::Diagnostic;
    if (name == "$/cancelRequest") return Method::CancelRequest;
    return Method::Unknown;
}

// ---------------------------------------------------------------------------
// Typed parameters
// ---------------------------------------------------------------------------

Result<InitializeParams, ResponseError> ParseInitializeParams(const nlohmann::json& params) {
    using InitResult = Result<InitializeParams, ResponseError>;

    InitializeParams out;
    if (params.is_null()) {
        return InitResult::Ok(std::move(out));
    }
    if (!params.is_object()) {
        return InitResult::Err(InvalidParams("initialize params must be an object"));
    }

    auto process_id = params.find("processId");
    if (process_id != params.end() && !process_id->is_null()) {
        if (!process_id->is_number_integer()) {
            return InitResult::Err(InvalidParams("processId must be an integer or null"));
        }
        out.process_id = process_id->get<int64_t>();
    }

    auto root_uri = params.find("rootUri");
    if (root_uri != params.end() && !root_uri->is_null()) {
        if (!root_uri->is_string()) {
            return InitResult::Err(InvalidParams("rootUri must be a string or null"));
        }
        out.root_uri = root_uri->get<std::string>();
    }

    auto client_info = params.find("clientInfo");
    if (client_info != params.end() && client_info->is_object()) {
        auto name = client_info->find("name");
        if (name != client_info->end() && name->is_string()) {
            out.client_name = name->get<std::string>();
        }
    }

    auto capabilities = params.find("capabilities");
    if (capabilities != params.end() && !capabilities->is_null()) {
        if (!capabilities->is_object()) {
            return InitResult::Err(InvalidParams("capabilities must be an object"));
        }
        out.capabilities = *capabilities;
    }
    return InitResult::Ok(std::move(out));
}

Result<DidOpenParams, ResponseError> ParseDidOpenParams(const nlohmann::json& params) {
    using OpenResult = Result<DidOpenParams, ResponseError>;

    auto document = RequireObject(params, "textDocument");
    if (document.IsErr()) {
        return OpenResult::Err(document.Error());
    }
    const nlohmann::json& item = *document.Value();

    auto uri = RequireUri(item);
    if (uri.IsErr()) {
        return OpenResult::Err(uri.Error());
    }
    auto version = RequireVersion(item);
    if (version.IsErr()) {
        return OpenResult::Err(version.Error());
    }
    auto text = item.find("text");
    if (text == item.end() || !text->is_string()) {
        return OpenResult::Err(InvalidParams("textDocument.text must be a string"));
    }
    std::string language_id;
    auto language = item.find("languageId");
    if (language != item.end() && language->is_string()) {
        language_id = language->get<std::string>();
    }

    return OpenResult::Ok(DidOpenParams{TextDocumentItem{
        std::move(uri).Value(), std::move(language_id), version.Value(),
        text->get<std::string>()}});
}

Result<DidChangeParams, ResponseError> ParseDidChangeParams(const nlohmann::json& params) {
    using ChangeResult = Result<DidChangeParams, ResponseError>;

    auto document = RequireObject(params, "textDocument");
    if (document.IsErr()) {
        return ChangeResult::Err(document.Error());
    }
    auto uri = RequireUri(*document.Value());
    if (uri.IsErr()) {
        return ChangeResult::Err(uri.Error());
    }
    auto version = RequireVersion(*document.Value());
    if (version.IsErr()) {
        return ChangeResult::Err(version.Error());
    }

    auto changes = params.find("contentChanges");
    if (changes == params.end() || !changes->is_array() || changes->empty()) {
        return ChangeResult::Err(InvalidParams("contentChanges must be a non-empty array"));
    }
    std::vector<std::string> texts;
    for (const auto& change : *changes) {
        if (!change.is_object() || !change.contains("text") || !change["text"].is_string()) {
            return ChangeResult::Err(InvalidParams("Each content change needs a 'text' string"));
        }
        texts.push_back(change["text"].get<std::string>());
    }

    return ChangeResult::Ok(
        DidChangeParams{std::move(uri).Value(), version.Value(), std::move(texts)});
}

Result<DocumentDiagnosticParams, ResponseError> ParseDocumentDiagnosticParams(
    const nlohmann::json& params) {
    using DiagnosticResult = Result<DocumentDiagnosticParams, ResponseError>;

    auto document = RequireObject(params, "textDocument");
    if (document.IsErr()) {
        return DiagnosticResult::Err(document.Error());
    }
    auto uri = RequireUri(*document.Value());
    if (uri.IsErr()) {
        return DiagnosticResult::Err(uri.Error());
    }
    return DiagnosticResult::Ok(DocumentDiagnosticParams{std::move(uri).Value()});
}

} // namespace mcn_ls
