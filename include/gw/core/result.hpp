#pragma once

/// @file result.hpp
/// @brief Value-or-error return type used by every fallible engine call.

#include <cstddef>
#include <utility>
#include <variant>

namespace gw {

/// Holds either a T or an E, never both.
///
/// A rejected fire command, a failed map placement or a bad config key
/// comes back as the E alternative, so the caller decides whether the
/// match carries on.  Accessing the wrong alternative throws
/// std::bad_variant_access.
///
/// @code
///   auto fired = missiles.FireMissile(state, {0.5f, 7.0f});
///   if (!fired) {
///       report.rejectedCommands.push_back(fired.error());
///   }
/// @endcode
template <typename T, typename E>
class Result {
public:
    static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool hasError() const noexcept { return data_.index() == 1; }
    explicit operator bool() const noexcept { return hasValue(); }

    [[nodiscard]] const T& value() const { return std::get<0>(data_); }
    [[nodiscard]] T& value() { return std::get<0>(data_); }

    [[nodiscard]] const E& error() const { return std::get<1>(data_); }

private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> tag, U&& payload) : data_(tag, std::forward<U>(payload)) {}

    std::variant<T, E> data_;
};

/// Success carries no value.
template <typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(); }
    static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return !failed_; }
    [[nodiscard]] bool hasError() const noexcept { return failed_; }
    explicit operator bool() const noexcept { return !failed_; }

    [[nodiscard]] const E& error() const { return error_; }

private:
    Result() = default;
    explicit Result(E error) : failed_(true), error_(std::move(error)) {}

    bool failed_ = false;
    E error_;
};

}  // namespace gw
