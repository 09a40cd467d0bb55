#pragma once

#include <tessera/error.hpp>
#include <string>
#include <utility>
#include <variant>

namespace tessera {

// Either a value or a TesseraError. Every fallible operation in the library
// returns one of these; nothing throws across the public API.
template<typename T>
class Result {
public:
    // Implicit so an error can be returned directly from any Result<T> function
    Result(TesseraError err) : data_(std::move(err)) {}

    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(TesseraError e) { return Result(std::move(e)); }

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return data_.index() == 1; }
    explicit operator bool() const { return is_ok(); }

    T& value() & { return std::get<0>(data_); }
    const T& value() const& { return std::get<0>(data_); }
    T&& value() && { return std::get<0>(std::move(data_)); }

    TesseraError& error() & { return std::get<1>(data_); }
    const TesseraError& error() const& { return std::get<1>(data_); }
    TesseraError&& error() && { return std::get<1>(std::move(data_)); }

    T value_or(T fallback) const& {
        if (is_ok()) return value();
        return fallback;
    }

    // Attach the path an error refers to, unless it already names one.
    Result& with_file(const std::string& file) & {
        if (is_err() && error().file.empty()) error().file = file;
        return *this;
    }
    Result&& with_file(const std::string& file) && {
        with_file(file);
        return std::move(*this);
    }

    template<typename F>
    auto map(F&& f) -> Result<decltype(f(std::declval<T&>()))> {
        using U = decltype(f(std::declval<T&>()));
        if (is_err()) return Result<U>::err(error());
        return Result<U>::ok(f(value()));
    }

    template<typename F>
    auto and_then(F&& f) -> decltype(f(std::declval<T&>())) {
        using R = decltype(f(std::declval<T&>()));
        if (is_err()) return R::err(error());
        return f(value());
    }

private:
    explicit Result(T val) : data_(std::move(val)) {}

    std::variant<T, TesseraError> data_;
};

using Status = Result<std::monostate>;

inline Status ok_status() { return Status::ok(std::monostate{}); }

// Return early with the error of `expr`, if any.
#define TESSERA_TRY(expr)                                                  \
    do {                                                                   \
        auto _tessera_result = (expr);                                     \
        if (_tessera_result.is_err()) return std::move(_tessera_result).error(); \
    } while (0)

#define TESSERA_CONCAT_INNER(a, b) a##b
#define TESSERA_CONCAT(a, b) TESSERA_CONCAT_INNER(a, b)

// Evaluate `expr`, return its error on failure, otherwise move the value
// into the declaration `decl` (e.g. `auto entries`).
#define TESSERA_TRY_ASSIGN(decl, expr) \
    TESSERA_TRY_ASSIGN_IMPL(TESSERA_CONCAT(_tessera_tmp_, __LINE__), decl, expr)

#define TESSERA_TRY_ASSIGN_IMPL(tmp, decl, expr)       \
    auto tmp = (expr);                                 \
    if (tmp.is_err()) return std::move(tmp).error();   \
    decl = std::move(tmp).value()

} // namespace tessera
