#pragma once

#include <adocref/error.hpp>
#include <variant>

namespace adocref {

template<typename T>
class Result {
    std::variant<T, RefError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from RefError so ADOCREF_TRY can return errors across Result<T> types
    Result(RefError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(RefError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<RefError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    RefError& error() & { return std::get<RefError>(data_); }
    const RefError& error() const& { return std::get<RefError>(data_); }
    RefError&& error() && { return std::get<RefError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    // Record the operation an error interrupted; no-op on success
    Result within(std::string what) && {
        if (is_err()) std::get<RefError>(data_).within(std::move(what));
        return std::move(*this);
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define ADOCREF_TRY(expr) \
    do { \
        auto _adocref_result = (expr); \
        if (_adocref_result.is_err()) return std::move(_adocref_result).error(); \
    } while(0)

} // namespace adocref
