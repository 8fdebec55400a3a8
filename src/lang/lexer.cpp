#include <adocref/lang/lexer.hpp>
#include <cctype>

namespace adocref {

const char* token_type_name(AdocTokenType t) {
    switch (t) {
    case AdocTokenType::Text:                  return "TEXT";
    case AdocTokenType::LineBreak:             return "LINE_BREAK";
    case AdocTokenType::LineComment:           return "LINE_COMMENT";
    case AdocTokenType::BlockComment:          return "BLOCK_COMMENT";
    case AdocTokenType::ListingDelimiter:      return "LISTING_DELIMITER";
    case AdocTokenType::ListingText:           return "LISTING_TEXT";
    case AdocTokenType::Heading:               return "HEADING";
    case AdocTokenType::ExampleBlockDelimiter: return "EXAMPLE_BLOCK_DELIMITER";
    case AdocTokenType::Title:                 return "TITLE";
    case AdocTokenType::BlockMacroId:          return "BLOCK_MACRO_ID";
    case AdocTokenType::BlockMacroBody:        return "BLOCK_MACRO_BODY";
    case AdocTokenType::BlockMacroAttributes:  return "BLOCK_MACRO_ATTRIBUTES";
    case AdocTokenType::BlockAttrsStart:       return "BLOCK_ATTRS_START";
    case AdocTokenType::BlockAttrName:         return "BLOCK_ATTR_NAME";
    case AdocTokenType::BlockAttrsEnd:         return "BLOCK_ATTRS_END";
    }
    return "UNKNOWN";
}

int heading_level(const AdocToken& tok) {
    if (tok.type != AdocTokenType::Heading) return 0;
    int level = 0;
    while (level < static_cast<int>(tok.text.size()) && tok.text[level] == '=') {
        ++level;
    }
    return level;
}

// ---------------------------------------------------------------------------
// Line classification helpers
// ---------------------------------------------------------------------------

namespace {

enum class BlockKind { Listing, Example, Comment };

struct OpenBlock {
    BlockKind kind;
    std::string delimiter;
};

// Returns the delimiter character if the line is 4+ repetitions of one of
// '-', '=', '/', otherwise '\0'.
char delimiter_char(const std::string& line) {
    if (line.size() < 4) return '\0';
    char c = line[0];
    if (c != '-' && c != '=' && c != '/') return '\0';
    for (char x : line) {
        if (x != c) return '\0';
    }
    return c;
}

bool is_macro_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

// name::target[attrs] spanning the whole line.
// On success, body_begin is the offset after "::" and attrs_begin the
// offset of the opening '['.
bool split_block_macro(const std::string& line, size_t& body_begin,
                       size_t& attrs_begin) {
    size_t i = 0;
    while (i < line.size() && is_macro_name_char(line[i])) ++i;
    if (i == 0 || line.compare(i, 2, "::") != 0) return false;
    body_begin = i + 2;

    size_t j = body_begin;
    while (j < line.size() && line[j] != '[' &&
           !std::isspace(static_cast<unsigned char>(line[j]))) {
        ++j;
    }
    if (j >= line.size() || line[j] != '[') return false;
    if (line.back() != ']') return false;
    attrs_begin = j;
    return true;
}

// ---------------------------------------------------------------------------
// Lexer state machine
// ---------------------------------------------------------------------------

struct Lexer {
    const std::string& source;
    const std::string& filename;
    size_t pos;
    int line;
    int col;

    std::vector<AdocToken> tokens;
    std::vector<OpenBlock> blocks;
    bool comment_unterminated = false;

    Lexer(const std::string& src, const std::string& fname)
        : source(src), filename(fname), pos(0), line(1), col(1) {}

    bool at_end() const { return pos >= source.size(); }

    char peek() const { return source[pos]; }

    SourcePos current_pos() const {
        return {filename, line, col, pos};
    }

    // Consume n characters and return them
    std::string take(size_t n) {
        std::string text = source.substr(pos, n);
        for (char c : text) {
            if (c == '\n') {
                ++line;
                col = 1;
            } else {
                ++col;
            }
        }
        pos += text.size();
        return text;
    }

    void emit(AdocTokenType type, size_t n) {
        auto p = current_pos();
        tokens.push_back({type, take(n), p});
    }

    bool in_listing() const {
        return !blocks.empty() && blocks.back().kind == BlockKind::Listing;
    }

    bool closes_example(const std::string& delim) const {
        return !blocks.empty() && blocks.back().kind == BlockKind::Example &&
               blocks.back().delimiter == delim;
    }

    size_t line_end() const {
        size_t eol = source.find('\n', pos);
        return eol == std::string::npos ? source.size() : eol;
    }

    LexResult run() {
        while (!at_end()) {
            if (peek() == '\n') {
                emit(AdocTokenType::LineBreak, 1);
                continue;
            }
            lex_line();
        }

        LexResult result;
        result.tokens = std::move(tokens);
        result.unclosed_blocks = static_cast<int>(blocks.size()) +
                                 (comment_unterminated ? 1 : 0);
        return result;
    }

    void lex_line() {
        std::string text = source.substr(pos, line_end() - pos);

        if (in_listing()) {
            if (text == blocks.back().delimiter) {
                blocks.pop_back();
                emit(AdocTokenType::ListingDelimiter, text.size());
            } else {
                emit(AdocTokenType::ListingText, text.size());
            }
            return;
        }

        switch (delimiter_char(text)) {
        case '/':
            lex_comment_block(text);
            return;
        case '-':
            blocks.push_back({BlockKind::Listing, text});
            emit(AdocTokenType::ListingDelimiter, text.size());
            return;
        case '=': {
            if (closes_example(text)) {
                blocks.pop_back();
            } else {
                blocks.push_back({BlockKind::Example, text});
            }
            // The delimiter token owns its newline
            size_t n = text.size();
            if (pos + n < source.size()) ++n;
            emit(AdocTokenType::ExampleBlockDelimiter, n);
            return;
        }
        default:
            break;
        }

        if (is_heading(text)) {
            emit(AdocTokenType::Heading, text.size());
            return;
        }

        if (text.compare(0, 2, "//") == 0) {
            emit(AdocTokenType::LineComment, text.size());
            return;
        }

        if (text.size() > 1 && text[0] == '.' &&
            !std::isspace(static_cast<unsigned char>(text[1]))) {
            emit(AdocTokenType::Title, text.size());
            return;
        }

        if (text[0] == '[') {
            lex_block_attrs(text);
            return;
        }

        size_t body_begin = 0;
        size_t attrs_begin = 0;
        if (split_block_macro(text, body_begin, attrs_begin)) {
            emit(AdocTokenType::BlockMacroId, body_begin);
            if (attrs_begin > body_begin) {
                emit(AdocTokenType::BlockMacroBody, attrs_begin - body_begin);
            }
            emit(AdocTokenType::BlockMacroAttributes, text.size() - attrs_begin);
            return;
        }

        emit(AdocTokenType::Text, text.size());
    }

    static bool is_heading(const std::string& text) {
        size_t n = 0;
        while (n < text.size() && text[n] == '=') ++n;
        return n > 0 && n < text.size() && text[n] == ' ';
    }

    // Opening delimiter, content and closing delimiter become one token.
    void lex_comment_block(const std::string& delim) {
        size_t scan = pos + delim.size();
        while (scan < source.size()) {
            // scan points at the '\n' ending the previous line
            size_t begin = scan + 1;
            size_t eol = source.find('\n', begin);
            if (eol == std::string::npos) eol = source.size();
            if (source.compare(begin, eol - begin, delim) == 0 &&
                eol - begin == delim.size()) {
                emit(AdocTokenType::BlockComment, eol - pos);
                return;
            }
            scan = eol;
        }
        comment_unterminated = true;
        emit(AdocTokenType::BlockComment, source.size() - pos);
    }

    void lex_block_attrs(const std::string& text) {
        emit(AdocTokenType::BlockAttrsStart, 1);
        size_t i = 1;
        while (i < text.size()) {
            char c = text[i];
            if (c == ']') {
                emit(AdocTokenType::BlockAttrsEnd, 1);
                ++i;
                if (i < text.size()) {
                    emit(AdocTokenType::Text, text.size() - i);
                }
                return;
            }
            if (c == ',') {
                emit(AdocTokenType::Text, 1);
                ++i;
                continue;
            }
            size_t j = i;
            while (j < text.size() && text[j] != ',' && text[j] != ']') ++j;
            emit(AdocTokenType::BlockAttrName, j - i);
            i = j;
        }
        // Unterminated attribute list: tolerated, no END token
    }
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

LexResult lex(const std::string& source, const std::string& filename) {
    Lexer lexer(source, filename);
    return lexer.run();
}

} // namespace adocref
