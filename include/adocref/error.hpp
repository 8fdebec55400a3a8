#pragma once

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace adocref {

struct RefError {
    enum Code {
        IO,
        Parse,
        Config,
        NotFound,
        InvalidArg,
        Cache
    };

    Code code = IO;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;
    // Operations the error interrupted, innermost first
    std::vector<std::string> context;

    RefError() = default;
    RefError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    RefError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    RefError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    // "cannot <action>: <reason>", located at path
    static RefError io(const std::string& action, const std::filesystem::path& path,
                       const std::error_code& ec = {});
    // SQLite failure; sqlite_msg comes from sqlite3_errmsg
    static RefError cache(const std::string& action, const std::string& sqlite_msg);

    RefError& at(std::string f, int l = 0) {
        file = std::move(f);
        line = l;
        return *this;
    }

    RefError& within(std::string what) {
        context.push_back(std::move(what));
        return *this;
    }

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace adocref
