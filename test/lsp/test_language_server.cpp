#include <catch2/catch_test_macros.hpp>

#include "mocks/capture_sink.hpp"
#include "mocks/mock_compiler.hpp"

#include <mcn_ls/compiler/compiler.hpp>
#include <mcn_ls/lsp/language_server.hpp>

#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

using namespace mcn_ls;
using mcn_ls::testing::MockCompiler;
using mcn_ls::testing::ScopedLogCapture;
using nlohmann::json;

namespace {

constexpr const char* kUri = "file:///work/blink.mcn";

struct SentNotification {
    std::string method;
    json params;
};

// Server wired to a real compiler, recording outbound traffic.
struct ServerHarness {
    Compiler compiler;
    std::vector<SentNotification> sent;
    int supplier_calls = 0;
    LanguageServer server{CompilerAdapter(compiler), [this]() {
        ++supplier_calls;
        OutboundHandles handles;
        handles.send_notification = [this](const std::string& method, const json& params) {
            sent.push_back({method, params});
        };
        handles.send_request = [](const std::string&, const json&) { return json(1); };
        return handles;
    }};

    std::optional<json> Request(int id, const std::string& method,
                                json params = json::object()) {
        return server.HandleMessage(
            {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}});
    }

    void Notify(const std::string& method, json params = json::object()) {
        auto response = server.HandleMessage(
            {{"jsonrpc", "2.0"}, {"method", method}, {"params", params}});
        REQUIRE_FALSE(response.has_value());
    }

    void Initialize() {
        auto response = Request(1, "initialize", {{"processId", nullptr}});
        REQUIRE(response.has_value());
        REQUIRE(response->contains("result"));
        Notify("initialized");
    }

    void Open(const std::string& text, int version) {
        Notify("textDocument/didOpen",
               {{"textDocument",
                 {{"uri", kUri}, {"languageId", "mcn-16"}, {"version", version},
                  {"text", text}}}});
    }

    void Change(const std::string& text, int version) {
        Notify("textDocument/didChange",
               {{"textDocument", {{"uri", kUri}, {"version", version}}},
                {"contentChanges", {{{"text", text}}}}});
    }
};

} // anonymous namespace

// ===========================================================================
// Lifecycle
// ===========================================================================

TEST_CASE("LanguageServer: requests before initialize are rejected", "[lsp][server]") {
    ServerHarness h;
    auto response = h.Request(5, "textDocument/diagnostic",
                              {{"textDocument", {{"uri", kUri}}}});
    REQUIRE(response.has_value());
    CHECK((*response)["id"] == 5);
    CHECK((*response)["error"]["code"] == -32002);
    CHECK(h.server.Phase() == ServerPhase::Uninitialized);
}

TEST_CASE("LanguageServer: notifications before initialize are dropped", "[lsp][server]") {
    ServerHarness h;
    h.Open("hi", 1);
    CHECK_FALSE(h.server.Documents().Current().has_value());
    CHECK(h.sent.empty());
}

TEST_CASE("LanguageServer: initialize advertises capabilities", "[lsp][server]") {
    ServerHarness h;
    auto response = h.Request(1, "initialize", json());
    REQUIRE(response.has_value());
    const json& result = (*response)["result"];
    CHECK(result["capabilities"]["textDocumentSync"] == 1);
    CHECK(result["capabilities"]["diagnosticProvider"]["interFileDependencies"] == false);
    CHECK(result["serverInfo"]["name"] == "mcn-ls");
    CHECK(h.server.Phase() == ServerPhase::Ready);
    CHECK(h.supplier_calls == 1);
}

TEST_CASE("LanguageServer: second initialize is an invalid request", "[lsp][server]") {
    ServerHarness h;
    h.Initialize();
    auto response = h.Request(2, "initialize");
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == -32600);
    CHECK(h.supplier_calls == 1);
    CHECK(h.server.Phase() == ServerPhase::Ready);
}

TEST_CASE("LanguageServer: invalid initialize params leave the server uninitialized",
          "[lsp][server]") {
    ServerHarness h;
    auto response = h.Request(1, "initialize", json::array({1, 2}));
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == -32602);
    CHECK(h.server.Phase() == ServerPhase::Uninitialized);
    CHECK(h.supplier_calls == 0);
}

TEST_CASE("LanguageServer: failing outbound supplier fails initialize", "[lsp][server]") {
    ScopedLogCapture capture;
    Compiler compiler;
    LanguageServer server(CompilerAdapter(compiler), []() -> OutboundHandles {
        throw std::runtime_error("transport closed");
    });

    auto response = server.HandleMessage(
        {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"}});
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == -32603);
    CHECK(server.Phase() == ServerPhase::Uninitialized);
}

TEST_CASE("LanguageServer: non-standard throw from the supplier fails initialize",
          "[lsp][server]") {
    ScopedLogCapture capture;
    Compiler compiler;
    LanguageServer server(CompilerAdapter(compiler), []() -> OutboundHandles { throw 7; });

    auto response = server.HandleMessage(
        {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"}});
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == -32603);
    CHECK(server.Phase() == ServerPhase::Uninitialized);
    CHECK(capture.Sink().Contains("unknown exception"));
}

TEST_CASE("LanguageServer: non-standard throw while publishing is contained",
          "[lsp][server]") {
    ScopedLogCapture capture;
    Compiler compiler;
    LanguageServer server(CompilerAdapter(compiler), []() {
        OutboundHandles handles;
        handles.send_notification = [](const std::string&, const json&) { throw 7; };
        handles.send_request = [](const std::string&, const json&) { return json(1); };
        return handles;
    });
    server.HandleMessage({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"}});
    REQUIRE(server.Phase() == ServerPhase::Ready);

    CHECK_NOTHROW(server.HandleMessage(
        {{"jsonrpc", "2.0"},
         {"method", "textDocument/didOpen"},
         {"params", {{"textDocument", {{"uri", kUri}, {"languageId", "mcn-16"},
                                       {"version", 1}, {"text", "hi"}}}}}}));
    CHECK(server.Phase() == ServerPhase::Ready);
    REQUIRE(server.Documents().Current().has_value());
    CHECK(server.Documents().Current()->version == 1);
    CHECK(capture.Sink().Contains("Failed to publish diagnostics: unknown exception"));
}

TEST_CASE("LanguageServer: shutdown then exit gives exit code 0", "[lsp][server]") {
    ServerHarness h;
    h.Initialize();
    auto response = h.Request(9, "shutdown", json());
    REQUIRE(response.has_value());
    CHECK(response->contains("result"));
    CHECK((*response)["result"].is_null());
    CHECK(h.server.Phase() == ServerPhase::ShuttingDown);

    auto late = h.Request(10, "textDocument/diagnostic", {{"textDocument", {{"uri", kUri}}}});
    REQUIRE(late.has_value());
    CHECK((*late)["error"]["code"] == -32600);

    h.Notify("exit");
    CHECK(h.server.Phase() == ServerPhase::Exited);
    CHECK(h.server.ExitCode() == 0);
}

TEST_CASE("LanguageServer: document changes after shutdown are dropped", "[lsp][server]") {
    ServerHarness h;
    h.Initialize();
    h.Open("hi", 1);
    REQUIRE(h.sent.size() == 1);

    auto response = h.Request(9, "shutdown", json());
    REQUIRE(response.has_value());
    h.Change("debug\n", 2);
    h.Open("pass\n", 3);

    CHECK(h.sent.size() == 1);
    REQUIRE(h.server.Documents().Current().has_value());
    CHECK(h.server.Documents().Current()->version == 1);
    CHECK(h.server.Documents().Current()->text == "hi");
    CHECK(h.server.Phase() == ServerPhase::ShuttingDown);
}

TEST_CASE("LanguageServer: exit without shutdown gives exit code 1", "[lsp][server]") {
    ServerHarness h;
    h.Initialize();
    h.Notify("exit");
    CHECK(h.server.Phase() == ServerPhase::Exited);
    CHECK(h.server.ExitCode() == 1);
}

TEST_CASE("LanguageServer: unknown request method", "[lsp][server]") {
    ServerHarness h;
    h.Initialize();
    auto response = h.Request(3, "textDocument/hover");
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == -32601);
    CHECK((*response)["error"]["message"] == "Method not found: textDocument/hover");
}

TEST_CASE("LanguageServer: malformed message with an id gets an error response",
          "[lsp][server]") {
    ServerHarness h;
    auto response = h.server.HandleMessage({{"jsonrpc", "2.0"}, {"id", 4}});
    REQUIRE(response.has_value());
    CHECK((*response)["id"] == 4);
    CHECK((*response)["error"]["code"] == -32600);

    CHECK_FALSE(h.server.HandleMessage(json::object({{"jsonrpc", "2.0"}})).has_value());
}

// ===========================================================================
// Documents and diagnostics
// ===========================================================================

TEST_CASE("LanguageServer: didOpen publishes compiler diagnostics", "[lsp][server]") {
    ServerHarness h;
    h.Initialize();
    h.Open("hi", 1);

    REQUIRE(h.sent.size() == 1);
    CHECK(h.sent[0].method == "textDocument/publishDiagnostics");
    const json& params = h.sent[0].params;
    CHECK(params["uri"] == kUri);
    CHECK(params["version"] == 1);
    REQUIRE(params["diagnostics"].size() == 1);
    const json& diagnostic = params["diagnostics"][0];
    CHECK(diagnostic["message"] == "Unknown variable 'hi'");
    CHECK(diagnostic["severity"] == 1);
    CHECK(diagnostic["source"] == "mcn-16");
    CHECK(diagnostic["range"]["end"]["character"] == 2);
}

TEST_CASE("LanguageServer: newer change clears diagnostics, stale change is ignored",
          "[lsp][server]") {
    ServerHarness h;
    h.Initialize();
    h.Open("hi", 1);
    h.Change("debug 1\n", 2);

    REQUIRE(h.sent.size() == 2);
    CHECK(h.sent[1].params["version"] == 2);
    CHECK(h.sent[1].params["diagnostics"].empty());
    CHECK(h.server.LastDiagnostics().empty());
    CHECK(h.server.Documents().Current()->language_id == "mcn-16");

    h.Change("hi", 1);
    CHECK(h.sent.size() == 2);
    CHECK(h.server.Documents().Current()->version == 2);
    CHECK(h.server.Documents().Current()->text == "debug 1\n");
}

TEST_CASE("LanguageServer: multiple content changes apply the first and warn",
          "[lsp][server]") {
    ScopedLogCapture capture;
    ServerHarness h;
    h.Initialize();
    h.Notify("textDocument/didChange",
             {{"textDocument", {{"uri", kUri}, {"version", 1}}},
              {"contentChanges", {{{"text", "pass"}}, {{"text", "hi"}}}}});

    REQUIRE(h.server.Documents().Current().has_value());
    CHECK(h.server.Documents().Current()->text == "pass");
    CHECK(capture.Sink().Contains("applying only the first"));
}

TEST_CASE("LanguageServer: pull diagnostics for the active document", "[lsp][server]") {
    ServerHarness h;
    h.Initialize();
    h.Open("hi", 1);

    auto response = h.Request(7, "textDocument/diagnostic", {{"textDocument", {{"uri", kUri}}}});
    REQUIRE(response.has_value());
    const json& report = (*response)["result"];
    CHECK(report["kind"] == "full");
    REQUIRE(report["items"].size() == 1);
    CHECK(report["items"][0]["message"] == "Unknown variable 'hi'");

    auto other = h.Request(8, "textDocument/diagnostic",
                           {{"textDocument", {{"uri", "file:///other.mcn"}}}});
    REQUIRE(other.has_value());
    CHECK((*other)["result"]["items"].empty());
}

TEST_CASE("LanguageServer: compiler fault becomes an internal diagnostic",
          "[lsp][server]") {
    ScopedLogCapture capture;
    MockCompiler engine;
    engine.ThrowNonStandard();
    std::vector<SentNotification> sent;
    LanguageServer server(CompilerAdapter(engine), [&sent]() {
        OutboundHandles handles;
        handles.send_notification = [&sent](const std::string& method, const json& params) {
            sent.push_back({method, params});
        };
        return handles;
    });

    server.HandleMessage({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"}});
    server.HandleMessage({{"jsonrpc", "2.0"},
                          {"method", "textDocument/didOpen"},
                          {"params", {{"textDocument", {{"uri", kUri},
                                                        {"version", 1},
                                                        {"text", "pass"}}}}}});

    REQUIRE(sent.size() == 1);
    REQUIRE(sent[0].params["diagnostics"].size() == 1);
    CHECK(sent[0].params["diagnostics"][0]["source"] == "internal");
    CHECK(server.Phase() == ServerPhase::Ready);
}

TEST_CASE("LanguageServer: invalid didOpen params are logged, not answered",
          "[lsp][server]") {
    ScopedLogCapture capture;
    ServerHarness h;
    h.Initialize();
    h.Notify("textDocument/didOpen", {{"textDocument", {{"uri", kUri}}}});
    CHECK(h.sent.empty());
    CHECK(capture.Sink().Contains("Invalid didOpen params"));
}

TEST_CASE("LanguageServer: cancellation is accepted and ignored", "[lsp][server]") {
    ServerHarness h;
    h.Initialize();
    h.Notify("$/cancelRequest", {{"id", 3}});
    CHECK(h.server.Phase() == ServerPhase::Ready);
}
