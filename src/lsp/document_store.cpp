#include <mcn_ls/lsp/document_store.hpp>

namespace mcn_ls {

bool DocumentStore::Replace(Document document) {
    if (current_ && document.version <= current_->version) {
        return false;
    }
    current_ = std::move(document);
    return true;
}

} // namespace mcn_ls
