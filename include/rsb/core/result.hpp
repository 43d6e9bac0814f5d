#pragma once

/// @file result.hpp
/// @brief Value-or-error return type used by every fallible bridge call.

#include <optional>
#include <utility>
#include <variant>

namespace rsb {

/// Holds either a success value of type T or an error of type E.
///
/// Bridge components report configuration problems, backend failures and
/// scheduler errors through Result rather than exceptions. At the bridge
/// boundary an error becomes a failed Response.
///
/// @code
///   ServiceResult<double> rate = config.get<double>("bridge.admission.refill_rate");
///   double perSecond = rate.valueOr(100.0);
/// @endcode
template <typename T, typename E>
class Result {
public:
    static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool hasError() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return hasValue(); }

    /// Precondition: hasValue().
    [[nodiscard]] const T& value() const& { return std::get<0>(storage_); }
    [[nodiscard]] T& value() & { return std::get<0>(storage_); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(storage_)); }

    /// Precondition: hasError().
    [[nodiscard]] const E& error() const& { return std::get<1>(storage_); }

    [[nodiscard]] T valueOr(T fallback) const& {
        if (hasValue()) {
            return value();
        }
        return fallback;
    }

private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> tag, U&& payload) : storage_(tag, std::forward<U>(payload)) {}

    std::variant<T, E> storage_;
};

/// Result of an operation with no value to return.
template <typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(std::nullopt); }
    static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool hasError() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return hasValue(); }

    /// Precondition: hasError().
    [[nodiscard]] const E& error() const& { return *error_; }

private:
    explicit Result(std::optional<E> error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

}  // namespace rsb
