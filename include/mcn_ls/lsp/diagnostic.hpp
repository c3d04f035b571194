#pragma once

#include <mcn_ls/core/types.hpp>

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcn_ls {

enum class DiagnosticSeverity {
    Error = 1,
    Warning = 2,
    Information = 3,
    Hint = 4,
};

// Source tags attached to diagnostics.
constexpr const char* kCompilerSource = "mcn-16";
constexpr const char* kInternalSource = "internal";

// ---------------------------------------------------------------------------
// Diagnostic: a problem report against the active document.
// ---------------------------------------------------------------------------
struct Diagnostic {
    TextRange range;
    DiagnosticSeverity severity = DiagnosticSeverity::Error;
    std::string message;
    std::string source;

    bool operator==(const Diagnostic& other) const {
        return range == other.range && severity == other.severity &&
               message == other.message && source == other.source;
    }
    bool operator!=(const Diagnostic& other) const { return !(*this == other); }
};

nlohmann::json ToJson(const Position& position);
nlohmann::json ToJson(const TextRange& range);

// {range, severity, message, source}
nlohmann::json ToJson(const Diagnostic& diagnostic);
nlohmann::json ToJson(const std::vector<Diagnostic>& diagnostics);

} // namespace mcn_ls
