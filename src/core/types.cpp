#include <mcn_ls/core/types.hpp>

#include <cctype>

namespace mcn_ls {

namespace {

bool IsSchemeChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 ||
           c == '+' || c == '.' || c == '-';
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// DocumentUri
// ---------------------------------------------------------------------------
Result<DocumentUri, std::string> DocumentUri::Create(std::string_view uri) {
    if (uri.empty()) {
        return Result<DocumentUri, std::string>::Err("Document URI must not be empty");
    }

    auto colon = uri.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return Result<DocumentUri, std::string>::Err(
            "Document URI must start with a scheme: " + std::string(uri));
    }
    if (std::isalpha(static_cast<unsigned char>(uri[0])) == 0) {
        return Result<DocumentUri, std::string>::Err(
            "Document URI scheme must start with a letter: " + std::string(uri));
    }
    for (size_t i = 1; i < colon; ++i) {
        if (!IsSchemeChar(uri[i])) {
            return Result<DocumentUri, std::string>::Err(
                "Invalid character in document URI scheme: " + std::string(uri));
        }
    }
    if (colon + 1 == uri.size()) {
        return Result<DocumentUri, std::string>::Err(
            "Document URI has no path after the scheme: " + std::string(uri));
    }

    return Result<DocumentUri, std::string>::Ok(DocumentUri(std::string(uri)));
}

} // namespace mcn_ls
