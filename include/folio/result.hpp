#pragma once

#include <folio/error.hpp>
#include <type_traits>
#include <utility>
#include <variant>

namespace folio {

// Value or FolioError. Nothing in the engine throws across an API boundary;
// every fallible operation returns one of these.
//
// Accessing the wrong alternative throws std::bad_variant_access, so check
// is_ok()/is_err() first or use FOLIO_TRY.
template<typename T>
class Result {
public:
    using value_type = T;

    // Implicit so FOLIO_TRY and `return FolioError{...}` work in any Result<U>
    Result(FolioError err) : data_(std::move(err)) {}

    static Result ok(T val) { return Result(std::in_place_index<0>, std::move(val)); }
    static Result err(FolioError e) { return Result(std::move(e)); }

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return data_.index() == 1; }
    explicit operator bool() const { return is_ok(); }

    // True when this holds an error with the given code
    bool has_code(FolioError::Code code) const {
        return is_err() && std::get<1>(data_).code == code;
    }

    T& value() & { return std::get<0>(data_); }
    const T& value() const& { return std::get<0>(data_); }
    T&& value() && { return std::get<0>(std::move(data_)); }

    FolioError& error() & { return std::get<1>(data_); }
    const FolioError& error() const& { return std::get<1>(data_); }
    FolioError&& error() && { return std::get<1>(std::move(data_)); }

    T value_or(T fallback) const& {
        return is_ok() ? value() : std::move(fallback);
    }

    // Prefix an error message with where it happened; values pass through
    Result with_context(const std::string& where) && {
        if (is_ok()) return std::move(*this);
        return std::move(error()).with_context(where);
    }

    template<typename F>
    auto map(F&& f) -> Result<std::invoke_result_t<F, T&>> {
        using U = std::invoke_result_t<F, T&>;
        if (is_err()) return Result<U>::err(error());
        return Result<U>::ok(std::forward<F>(f)(value()));
    }

    // f returns a Result of its own
    template<typename F>
    auto and_then(F&& f) -> std::invoke_result_t<F, T&> {
        using R = std::invoke_result_t<F, T&>;
        if (is_err()) return R::err(error());
        return std::forward<F>(f)(value());
    }

private:
    template<typename... Args>
    explicit Result(std::in_place_index_t<0> tag, Args&&... args)
        : data_(tag, std::forward<Args>(args)...) {}

    std::variant<T, FolioError> data_;
};

// Result of an operation that yields nothing but success
using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

// Return the error of expr from the enclosing function, if any
#define FOLIO_TRY(expr) \
    do { \
        auto _folio_result = (expr); \
        if (_folio_result.is_err()) return std::move(_folio_result).error(); \
    } while(0)

} // namespace folio
