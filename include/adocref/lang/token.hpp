#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace adocref {

// Source position for diagnostics and index entries
struct SourcePos {
    std::string file;
    int line = 1;
    int col = 1;
    size_t offset = 0;
};

// Generic token with type parameter
template<typename T>
struct Token {
    T type;
    std::string text;
    SourcePos pos;
};

enum class AdocTokenType {
    Text,
    LineBreak,
    LineComment,
    BlockComment,
    ListingDelimiter,
    ListingText,
    Heading,
    ExampleBlockDelimiter,
    Title,
    BlockMacroId,
    BlockMacroBody,
    BlockMacroAttributes,
    BlockAttrsStart,
    BlockAttrName,
    BlockAttrsEnd
};

using AdocToken = Token<AdocTokenType>;

// Stable external name, e.g. "LISTING_DELIMITER"
const char* token_type_name(AdocTokenType t);

// Number of leading '=' of a HEADING token, 0 for any other token
int heading_level(const AdocToken& tok);

} // namespace adocref
