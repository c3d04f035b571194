#pragma once

#include <mcn_ls/core/types.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace mcn_ls {

struct Document {
    DocumentUri uri;
    std::string text;
    int64_t version;
    std::string language_id;
};

// ---------------------------------------------------------------------------
// DocumentStore: the single active document.
//
// A replacement is accepted only when no document exists yet or its version
// is strictly greater than the stored one. Rejected replacements leave the
// store untouched. Versions are compared across URIs: the store models one
// document per server lifetime.
// ---------------------------------------------------------------------------
class DocumentStore {
public:
    // Returns true if the document was stored.
    bool Replace(Document document);

    [[nodiscard]] const std::optional<Document>& Current() const { return current_; }

private:
    std::optional<Document> current_;
};

} // namespace mcn_ls
