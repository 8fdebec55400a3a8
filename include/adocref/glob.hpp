#pragma once

#include <string>
#include <vector>

namespace adocref {

// Match a glob pattern against a relative path (both normalized to forward
// slashes). Supports * (any chars except /), ? (one char except /) and
// ** (zero or more whole path segments).
bool glob_match(const std::string& pattern, const std::string& path);

// True if path, or any of its parent directories, matches one of patterns.
// "build/**" and "build" both exclude "build/x/y.adoc".
bool glob_excluded(const std::vector<std::string>& patterns,
                   const std::string& path);

} // namespace adocref
