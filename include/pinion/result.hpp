#pragma once

#include <pinion/error.hpp>
#include <variant>
#include <functional>

namespace pinion {

template<typename T>
class Result {
    std::variant<T, PinionError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from PinionError so PINION_TRY can return errors across Result<T> types
    Result(PinionError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(PinionError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<PinionError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    PinionError& error() & { return std::get<PinionError>(data_); }
    const PinionError& error() const& { return std::get<PinionError>(data_); }
    PinionError&& error() && { return std::get<PinionError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    bool has_error(PinionError::Code code) const {
        return is_err() && error().code == code;
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

    // Rewrite the carried error, e.g. to prefix the offending package name
    template<typename F>
    Result map_err(F&& f) {
        if (is_ok()) {
            return *this;
        }
        return Result::err(f(error()));
    }

    T value_or(T fallback) const& {
        if (is_ok()) {
            return value();
        }
        return fallback;
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define PINION_TRY(expr) \
    do { \
        auto _pinion_result = (expr); \
        if (_pinion_result.is_err()) return std::move(_pinion_result).error(); \
    } while(0)

} // namespace pinion
