#pragma once

#include <pinch/error.hpp>
#include <variant>
#include <functional>

namespace pinch {

// Either a value or a PinchError. Library code never throws; callers check
// is_ok() / is_err() or propagate with PINCH_TRY.
template<typename T>
class Result {
    std::variant<T, PinchError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from PinchError so a bare error can be returned from any
    // Result<T> function
    Result(PinchError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(PinchError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<PinchError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    PinchError& error() & { return std::get<PinchError>(data_); }
    const PinchError& error() const& { return std::get<PinchError>(data_); }
    PinchError&& error() && { return std::get<PinchError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

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

    // Recover from an error; f receives the error and returns a Result<T>
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

#define PINCH_TRY(expr) \
    do { \
        auto _pinch_result = (expr); \
        if (_pinch_result.is_err()) return std::move(_pinch_result).error(); \
    } while(0)

} // namespace pinch
