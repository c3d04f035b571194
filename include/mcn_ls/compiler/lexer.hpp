#pragma once

#include <mcn_ls/compiler/token.hpp>
#include <mcn_ls/core/result.hpp>

#include <string_view>
#include <vector>

namespace mcn_ls {

// Split MCN-16 source into tokens. The returned sequence always ends with a
// single Eof token. Lexing continues past bad characters so that every
// problem in the document is reported at once.
Result<std::vector<Token>, std::vector<CompileError>> Tokenize(std::string_view source);

} // namespace mcn_ls
