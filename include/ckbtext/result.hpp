#pragma once

#include <ckbtext/error.hpp>
#include <functional>
#include <utility>
#include <variant>

namespace ckbtext {

template<typename T>
class Result {
    std::variant<T, CkbError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from CkbError so CKBTEXT_TRY can propagate across Result<T> types
    Result(CkbError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(CkbError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<CkbError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    CkbError& error() & { return std::get<CkbError>(data_); }
    const CkbError& error() const& { return std::get<CkbError>(data_); }
    CkbError&& error() && { return std::get<CkbError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    T value_or(T fallback) const& {
        if (is_ok()) return std::get<T>(data_);
        return fallback;
    }

    bool has_code(CkbError::Code c) const {
        return is_err() && std::get<CkbError>(data_).code == c;
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

// Returns the error of a failed Result from the enclosing function. The
// argument may be an lvalue; its error is moved out.
#define CKBTEXT_TRY(expr) \
    do { \
        auto&& _ckb_result = (expr); \
        if (_ckb_result.is_err()) return std::move(_ckb_result).error(); \
    } while(0)

#define CKBTEXT_CONCAT_IMPL(a, b) a##b
#define CKBTEXT_CONCAT(a, b) CKBTEXT_CONCAT_IMPL(a, b)

// CKBTEXT_ASSIGN_OR_RETURN(Pipeline p, Pipeline::create(cfg));
// Declares or assigns `lhs` from the value of `expr`, or returns its error.
// Works for move-only values.
#define CKBTEXT_ASSIGN_OR_RETURN(lhs, expr) \
    CKBTEXT_ASSIGN_OR_RETURN_IMPL(CKBTEXT_CONCAT(_ckb_assign_, __LINE__), lhs, expr)

#define CKBTEXT_ASSIGN_OR_RETURN_IMPL(tmp, lhs, expr) \
    auto tmp = (expr); \
    if (tmp.is_err()) return std::move(tmp).error(); \
    lhs = std::move(tmp).value()

} // namespace ckbtext
