/**
 * @file result.hpp
 * @brief Value-or-error return type used across every strata module
 *
 * Fallible operations return Result<T> instead of throwing. The error side
 * defaults to strata::Error so call sites can inspect error().kind.
 *
 * EXAMPLE:
 * Result<std::string> fingerprint_file(const fs::path& path);
 *
 * auto digest = fingerprint_file(path);
 * if (digest.is_error()) {
 *     return Err<ChangeSet>(digest.error());
 * }
 * use(digest.value());
 */

#pragma once

#include "strata/core/error.hpp"

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace strata {

// Wrappers keep construction unambiguous when T and E are the same type
template<typename T>
struct OkValue {
    T value;
    explicit OkValue(T v) : value(std::move(v)) {}
};

template<typename E>
struct ErrValue {
    E error;
    explicit ErrValue(E e) : error(std::move(e)) {}
};

template<typename T, typename E = Error>
class Result {
public:
    Result(OkValue<T> ok) : state_(std::in_place_index<0>, std::move(ok.value)) {}
    Result(ErrValue<E> err) : state_(std::in_place_index<1>, std::move(err.error)) {}

    bool is_ok() const { return state_.index() == 0; }
    bool is_error() const { return state_.index() == 1; }

    T& value() & { return std::get<0>(state_); }
    const T& value() const& { return std::get<0>(state_); }
    T&& value() && { return std::get<0>(std::move(state_)); }

    E& error() & { return std::get<1>(state_); }
    const E& error() const& { return std::get<1>(state_); }
    E&& error() && { return std::get<1>(std::move(state_)); }

    T value_or(T fallback) const& {
        return is_ok() ? std::get<0>(state_) : std::move(fallback);
    }

    T value_or(T fallback) && {
        return is_ok() ? std::get<0>(std::move(state_)) : std::move(fallback);
    }

private:
    std::variant<T, E> state_;
};

/**
 * @brief Success carries no value; only the error side is stored
 */
template<typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(ErrValue<E> err) : error_(std::move(err.error)) {}

    bool is_ok() const { return !error_.has_value(); }
    bool is_error() const { return error_.has_value(); }

    E& error() { return *error_; }
    const E& error() const { return *error_; }

private:
    std::optional<E> error_;
};

template<typename T>
Result<T> Ok(T value) { return Result<T>(OkValue<T>(std::move(value))); }

template<typename E = Error>
Result<void, E> Ok() { return Result<void, E>(); }

template<typename T, typename E>
Result<T, E> Err(E error) { return Result<T, E>(ErrValue<E>(std::move(error))); }

/**
 * @brief Shorthand for the common case of a fresh strata::Error
 *
 * return Err<WriteSummary>(ErrorKind::Io, "Failed to create " + dir.string());
 */
template<typename T>
Result<T> Err(ErrorKind kind, std::string message) {
    return Result<T>(ErrValue<Error>(Error(kind, std::move(message))));
}

} // namespace strata
