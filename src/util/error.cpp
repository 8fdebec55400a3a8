#include <adocref/error.hpp>

namespace adocref {

RefError RefError::io(const std::string& action, const std::filesystem::path& path,
                      const std::error_code& ec) {
    std::string msg = "cannot " + action;
    if (ec) {
        msg += ": ";
        msg += ec.message();
    }
    RefError e{IO, std::move(msg)};
    e.file = path.generic_string();
    return e;
}

RefError RefError::cache(const std::string& action, const std::string& sqlite_msg) {
    return RefError{Cache, action + ": " + sqlite_msg,
        "delete the cache file or set [cache] enabled = false in adocref.toml"};
}

const char* RefError::code_name(Code c) {
    switch (c) {
        case IO:         return "IO";
        case Parse:      return "Parse";
        case Config:     return "Config";
        case NotFound:   return "NotFound";
        case InvalidArg: return "InvalidArg";
        case Cache:      return "Cache";
    }
    return "Unknown";
}

// error[Cache]: failed to open descriptor cache: unable to open database file
//   while opening project /srv/docs
//   hint: delete the cache file or ...
//   --> /srv/docs/.adocref/cache.db
std::string RefError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    for (const auto& what : context) {
        result += "\n  while ";
        result += what;
    }

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

} // namespace adocref
