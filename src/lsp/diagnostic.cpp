#include <mcn_ls/lsp/diagnostic.hpp>

namespace mcn_ls {

nlohmann::json ToJson(const Position& position) {
    return {{"line", position.line}, {"character", position.character}};
}

nlohmann::json ToJson(const TextRange& range) {
    return {{"start", ToJson(range.start)}, {"end", ToJson(range.end)}};
}

nlohmann::json ToJson(const Diagnostic& diagnostic) {
    return {
        {"range", ToJson(diagnostic.range)},
        {"severity", static_cast<int>(diagnostic.severity)},
        {"message", diagnostic.message},
        {"source", diagnostic.source}
    };
}

nlohmann::json ToJson(const std::vector<Diagnostic>& diagnostics) {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& diagnostic : diagnostics) {
        items.push_back(ToJson(diagnostic));
    }
    return items;
}

} // namespace mcn_ls
