#include <adocref/glob.hpp>

namespace adocref {

static std::string normalize_path(const std::string& p) {
    std::string out;
    out.reserve(p.size());
    for (char c : p) {
        if (c == '\\') c = '/';
        if (c == '/' && !out.empty() && out.back() == '/') continue;
        out.push_back(c);
    }
    if (out.size() > 1 && out.back() == '/') out.pop_back();
    if (out.compare(0, 2, "./") == 0) out.erase(0, 2);
    return out;
}

static std::vector<std::string> split_segments(const std::string& s) {
    std::vector<std::string> segs;
    size_t start = 0;
    while (true) {
        size_t slash = s.find('/', start);
        if (slash == std::string::npos) {
            segs.push_back(s.substr(start));
            return segs;
        }
        segs.push_back(s.substr(start, slash - start));
        start = slash + 1;
    }
}

// Single segment, no '/' in either side
static bool match_segment(const std::string& pat, size_t pi,
                          const std::string& str, size_t si) {
    while (pi < pat.size()) {
        char pc = pat[pi];
        if (pc == '*') {
            while (pi < pat.size() && pat[pi] == '*') ++pi;
            if (pi == pat.size()) return true;
            for (size_t k = si; k <= str.size(); ++k) {
                if (match_segment(pat, pi, str, k)) return true;
            }
            return false;
        }
        if (si >= str.size()) return false;
        if (pc != '?' && pc != str[si]) return false;
        ++pi;
        ++si;
    }
    return si == str.size();
}

static bool match_segments(const std::vector<std::string>& pat, size_t pi,
                           const std::vector<std::string>& path, size_t si) {
    while (pi < pat.size()) {
        if (pat[pi] == "**") {
            while (pi < pat.size() && pat[pi] == "**") ++pi;
            if (pi == pat.size()) return true;
            for (size_t k = si; k <= path.size(); ++k) {
                if (match_segments(pat, pi, path, k)) return true;
            }
            return false;
        }
        if (si >= path.size()) return false;
        if (!match_segment(pat[pi], 0, path[si], 0)) return false;
        ++pi;
        ++si;
    }
    return si == path.size();
}

bool glob_match(const std::string& pattern, const std::string& path) {
    return match_segments(split_segments(normalize_path(pattern)), 0,
                          split_segments(normalize_path(path)), 0);
}

bool glob_excluded(const std::vector<std::string>& patterns,
                   const std::string& path) {
    std::string norm = normalize_path(path);
    for (const auto& pattern : patterns) {
        // Test the path itself and every parent directory
        std::string prefix = norm;
        while (!prefix.empty()) {
            if (glob_match(pattern, prefix)) return true;
            size_t slash = prefix.rfind('/');
            if (slash == std::string::npos) break;
            prefix.erase(slash);
        }
    }
    return false;
}

} // namespace adocref
