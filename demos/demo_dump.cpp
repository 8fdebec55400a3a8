#include <adocref/lang/lexer.hpp>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>

using namespace adocref;

// Render control characters so one token stays on one output line
static std::string escape(const std::string& s) {
    std::string out;
    for (char c : s) {
        switch (c) {
        case '\n': out += "\\n"; break;
        case '\t': out += "\\t"; break;
        case '\r': out += "\\r"; break;
        default:   out += c;
        }
    }
    return out;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: adocref-dump <file.adoc> [--summary]\n";
        return 1;
    }

    std::string path = argv[1];
    bool summary_only = (argc > 2 && std::string(argv[2]) == "--summary");

    std::ifstream f(path, std::ios::binary);
    if (!f) {
        std::cerr << "error: cannot open " << path << "\n";
        return 1;
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    std::string source = ss.str();

    auto lr = lex(source, path);

    std::cout << "--- " << path << " ---\n";
    std::cout << "Tokens: " << lr.tokens.size();
    if (lr.unclosed_blocks > 0) {
        std::cout << "  Unclosed blocks: " << lr.unclosed_blocks;
    }
    std::cout << "\n";

    if (summary_only) {
        std::map<std::string, int> counts;
        for (auto& t : lr.tokens) counts[token_type_name(t.type)]++;
        for (auto& [name, n] : counts) {
            std::cout << "  " << name << ": " << n << "\n";
        }
        return 0;
    }

    std::cout << "\n";
    for (auto& t : lr.tokens) {
        if (t.type == AdocTokenType::LineBreak) continue;
        std::cout << "  " << t.pos.line << ":" << t.pos.col
                  << "  " << token_type_name(t.type);
        if (t.type == AdocTokenType::Heading) {
            std::cout << "(" << heading_level(t) << ")";
        }
        std::cout << "  \"" << escape(t.text) << "\"\n";
    }
    return 0;
}
