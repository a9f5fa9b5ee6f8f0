#pragma once

#include <sqlid/error.hpp>
#include <variant>
#include <optional>
#include <functional>

namespace sqlid {

template<typename T>
class Result {
    std::variant<T, SqlidError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from SqlidError so SQLID_TRY can return errors across Result<T> types
    Result(SqlidError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(SqlidError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<SqlidError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    SqlidError& error() & { return std::get<SqlidError>(data_); }
    const SqlidError& error() const& { return std::get<SqlidError>(data_); }
    SqlidError&& error() && { return std::get<SqlidError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    // Drops the error detail
    std::optional<T> to_optional() && {
        if (is_ok()) {
            return std::optional<T>(std::get<T>(std::move(data_)));
        }
        return std::nullopt;
    }

    template<typename F>
    auto map(F&& f) -> Result<decltype(f(std::declval<T&>()))> {
        using U = decltype(f(std::declval<T&>()));
        if (is_ok()) {
            return Result<U>::ok(f(value()));
        }
        return Result<U>::err(error());
    }

    template<typename F>
    auto and_then(F&& f) -> decltype(f(std::declval<T&>())) {
        if (is_ok()) {
            return f(value());
        }
        using RetType = decltype(f(std::declval<T&>()));
        return RetType::err(error());
    }

    template<typename F>
    Result or_else(F&& f) {
        if (is_ok()) {
            return *this;
        }
        return f(error());
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define SQLID_TRY(expr) \
    do { \
        auto _sqlid_result = (expr); \
        if (_sqlid_result.is_err()) return std::move(_sqlid_result).error(); \
    } while(0)

} // namespace sqlid
