#pragma once

#include <scribe/error.hpp>
#include <variant>
#include <utility>

namespace scribe {

template<typename T>
class Result {
    std::variant<T, ScribeError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from ScribeError so SCRIBE_TRY can forward errors across Result<T> types
    Result(ScribeError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(ScribeError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<ScribeError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    ScribeError& error() & { return std::get<ScribeError>(data_); }
    const ScribeError& error() const& { return std::get<ScribeError>(data_); }
    ScribeError&& error() && { return std::get<ScribeError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    T value_or(T fallback) const& {
        return is_ok() ? value() : std::move(fallback);
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
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define SCRIBE_TRY(expr) \
    do { \
        auto _scribe_result = (expr); \
        if (_scribe_result.is_err()) return std::move(_scribe_result).error(); \
    } while(0)

} // namespace scribe
