#pragma once

#include <kunai/error.hpp>
#include <variant>
#include <functional>

namespace kunai {

template<typename T>
class Result {
    std::variant<T, KunaiError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from KunaiError so KUNAI_TRY can return errors across Result<T> types
    Result(KunaiError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(KunaiError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<KunaiError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    KunaiError& error() & { return std::get<KunaiError>(data_); }
    const KunaiError& error() const& { return std::get<KunaiError>(data_); }
    KunaiError&& error() && { return std::get<KunaiError>(std::move(data_)); }

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

    template<typename F>
    Result or_else(F&& f) {
        if (is_ok()) {
            return *this;
        }
        return f(error());
    }

    // Rewrite the error (e.g. to prefix the source name) and keep the code
    template<typename F>
    Result map_err(F&& f) && {
        if (is_err()) {
            return Result::err(f(std::move(error())));
        }
        return std::move(*this);
    }

    T value_or(T fallback) const& {
        return is_ok() ? value() : std::move(fallback);
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define KUNAI_TRY(expr) \
    do { \
        auto _kunai_result = (expr); \
        if (_kunai_result.is_err()) return std::move(_kunai_result).error(); \
    } while(0)

} // namespace kunai
