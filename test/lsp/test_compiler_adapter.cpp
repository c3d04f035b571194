#include <catch2/catch_test_macros.hpp>

#include "mocks/capture_sink.hpp"
#include "mocks/mock_compiler.hpp"

#include <mcn_ls/compiler/compiler.hpp>
#include <mcn_ls/lsp/compiler_adapter.hpp>

#include <string>

using namespace mcn_ls;
using mcn_ls::testing::MockCompiler;
using mcn_ls::testing::ScopedLogCapture;

// ===========================================================================
// Compile
// ===========================================================================

TEST_CASE("CompilerAdapter: success passes the assembly through", "[lsp][adapter]") {
    MockCompiler engine;
    engine.SetResponse(CompileOutcome::Ok("LAL 17\n"));
    CompilerAdapter adapter(engine);

    auto result = adapter.Compile("debug");
    REQUIRE(result.IsOk());
    CHECK(result.Value() == "LAL 17\n");
    REQUIRE(engine.CallCount() == 1);
    CHECK(engine.Calls()[0] == "debug");
}

TEST_CASE("CompilerAdapter: engine errors become compiler diagnostics", "[lsp][adapter]") {
    MockCompiler engine;
    const TextRange range{{1, 2}, {1, 5}};
    engine.SetErrors({CompileError{"Unknown variable 'foo'", range},
                      CompileError{"Empty block", TextRange{}}});
    CompilerAdapter adapter(engine);

    auto result = adapter.Compile("whatever");
    REQUIRE(result.IsErr());
    const auto& diagnostics = result.Error();
    REQUIRE(diagnostics.size() == 2);
    CHECK(diagnostics[0] == Diagnostic{range, DiagnosticSeverity::Error,
                                       "Unknown variable 'foo'", kCompilerSource});
    CHECK(diagnostics[1].message == "Empty block");
}

TEST_CASE("CompilerAdapter: std::exception becomes an internal diagnostic",
          "[lsp][adapter]") {
    ScopedLogCapture capture;
    MockCompiler engine;
    engine.ThrowStdException("boom");
    CompilerAdapter adapter(engine);

    auto result = adapter.Compile("pass");
    REQUIRE(result.IsErr());
    REQUIRE(result.Error().size() == 1);
    CHECK(result.Error()[0].source == kInternalSource);
    CHECK(result.Error()[0].severity == DiagnosticSeverity::Error);
    CHECK(result.Error()[0].message == "Internal compiler error: boom");
    CHECK(capture.Sink().Contains("boom"));
}

TEST_CASE("CompilerAdapter: non-standard throw is contained", "[lsp][adapter]") {
    ScopedLogCapture capture;
    MockCompiler engine;
    engine.ThrowNonStandard();
    CompilerAdapter adapter(engine);

    auto result = adapter.Compile("pass");
    REQUIRE(result.IsErr());
    REQUIRE(result.Error().size() == 1);
    CHECK(result.Error()[0].source == kInternalSource);
    CHECK(result.Error()[0].message == "Internal compiler error: unknown exception");
}

TEST_CASE("CompilerAdapter: failure without errors is an internal diagnostic",
          "[lsp][adapter]") {
    ScopedLogCapture capture;
    MockCompiler engine;
    engine.SetErrors({});
    CompilerAdapter adapter(engine);

    auto result = adapter.Compile("pass");
    REQUIRE(result.IsErr());
    REQUIRE(result.Error().size() == 1);
    CHECK(result.Error()[0].source == kInternalSource);
}

TEST_CASE("CompilerAdapter: oversized source never reaches the engine", "[lsp][adapter]") {
    MockCompiler engine;
    CompilerAdapter adapter(engine, 8);
    CHECK(adapter.MaxSourceBytes() == 8);

    auto result = adapter.Compile("123456789");
    REQUIRE(result.IsErr());
    CHECK(result.Error()[0].message ==
          "Document is too large to compile (9 bytes, limit 8)");
    CHECK(result.Error()[0].source == kCompilerSource);
    CHECK(engine.CallCount() == 0);

    CHECK(adapter.Compile("12345678").IsOk());
}

TEST_CASE("CompilerAdapter: same source compiles to the same result", "[lsp][adapter]") {
    Compiler engine;
    CompilerAdapter adapter(engine);

    auto first = adapter.Compile("x = 1\ny = z");
    auto second = adapter.Compile("x = 1\ny = z");
    REQUIRE(first.IsErr());
    REQUIRE(second.IsErr());
    CHECK(first.Error() == second.Error());
    CHECK(first.Error()[0].message == "Unknown variable 'z'");
}

TEST_CASE("CompilerAdapter: deeply nested source becomes one compiler diagnostic",
          "[lsp][adapter]") {
    Compiler engine;
    CompilerAdapter adapter(engine);

    std::string chain = "x = 1";
    for (int i = 0; i < 20000; ++i) {
        chain += "+1";
    }

    for (const std::string& source : {std::string(100000, '('), chain}) {
        auto result = adapter.Compile(source);
        REQUIRE(result.IsErr());
        REQUIRE(result.Error().size() == 1);
        CHECK(result.Error()[0].source == kCompilerSource);
        CHECK(result.Error()[0].message.find("Nesting too deep") != std::string::npos);
    }
}

// ===========================================================================
// CompileDirect
// ===========================================================================

TEST_CASE("CompileDirect: assembly text on success", "[lsp][adapter]") {
    Compiler engine;
    CompilerAdapter adapter(engine);

    auto result = adapter.CompileDirect("debug 1\n");
    REQUIRE(result.IsOk());
    CHECK(result.Value() == "LAL 17\nLAL 1\n");
}

TEST_CASE("CompileDirect: one-line summary with a one-based position", "[lsp][adapter]") {
    Compiler engine;
    CompilerAdapter adapter(engine);

    auto result = adapter.CompileDirect("pass\n  hi");
    REQUIRE(result.IsErr());
    CHECK(result.Error().summary == "Compilation error at 2:3: Unknown variable 'hi'");
}

TEST_CASE("CompileDirect: internal faults keep their message", "[lsp][adapter]") {
    ScopedLogCapture capture;
    MockCompiler engine;
    engine.ThrowStdException("engine crashed");
    CompilerAdapter adapter(engine);

    auto result = adapter.CompileDirect("pass");
    REQUIRE(result.IsErr());
    CHECK(result.Error().summary == "Internal compiler error: engine crashed");
}
