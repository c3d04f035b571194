#pragma once

#include <mcn_ls/core/result.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace mcn_ls {

// ---------------------------------------------------------------------------
// Position / TextRange: zero-based line and character offsets into a
// document. Characters are counted in bytes; the language is ASCII-only.
// ---------------------------------------------------------------------------
struct Position {
    uint32_t line = 0;
    uint32_t character = 0;

    bool operator==(const Position& other) const {
        return line == other.line && character == other.character;
    }
    bool operator!=(const Position& other) const { return !(*this == other); }
    bool operator<(const Position& other) const {
        return line < other.line ||
               (line == other.line && character < other.character);
    }
};

struct TextRange {
    Position start;
    Position end;

    // Smallest range covering both operands.
    [[nodiscard]] TextRange Cover(const TextRange& other) const {
        return TextRange{other.start < start ? other.start : start,
                         end < other.end ? other.end : end};
    }

    bool operator==(const TextRange& other) const {
        return start == other.start && end == other.end;
    }
    bool operator!=(const TextRange& other) const { return !(*this == other); }
};

// ---------------------------------------------------------------------------
// DocumentUri: validated document identifier.
//
// Rules:
//   - Non-empty
//   - Has a scheme: "<alpha>[alnum+.-]*:" followed by at least one character
// ---------------------------------------------------------------------------
class DocumentUri {
public:
    static Result<DocumentUri, std::string> Create(std::string_view uri);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const DocumentUri& other) const { return value_ == other.value_; }
    bool operator!=(const DocumentUri& other) const { return value_ != other.value_; }

    DocumentUri(const DocumentUri&) = default;
    DocumentUri& operator=(const DocumentUri&) = default;
    DocumentUri(DocumentUri&&) noexcept = default;
    DocumentUri& operator=(DocumentUri&&) noexcept = default;

private:
    explicit DocumentUri(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

} // namespace mcn_ls
