#pragma once

#include <adocref/lang/token.hpp>
#include <string>
#include <vector>

namespace adocref {

struct LexResult {
    std::vector<AdocToken> tokens;
    // Delimited blocks still open at end of input (listing, example, comment)
    int unclosed_blocks = 0;
};

// Tokenize AsciiDoc source. Never fails: malformed constructs degrade to
// TEXT and the concatenated token texts always equal the input.
LexResult lex(const std::string& source,
              const std::string& filename = "<input>");

} // namespace adocref
