#pragma once

/// @file result.hpp
/// @brief Value-or-error return type.

#include <cstddef>
#include <optional>
#include <utility>
#include <variant>

namespace sfe {

/// Holds either the value of a successful call or the error that stopped it.
///
/// Repository reads, configuration loading and database access report
/// failure through Result. The rating, strength and forecast models cannot
/// fail and return plain values.
///
/// The two alternatives are addressed by position, so T and E may be the
/// same type (for example Result<std::string, std::string>).
///
/// Example:
/// @code
///   auto completed = repository.listCompleted(query);
///   if (!completed) {
///       return Result<ForecastModel, EngineError>::err(completed.error());
///   }
///   auto strengths = fitStrengths(completed.value());
/// @endcode
template <typename T, typename E>
class Result {
public:
    static Result ok(T value) { return Result(std::in_place_index<kValue>, std::move(value)); }
    static Result err(E error) { return Result(std::in_place_index<kError>, std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return state_.index() == kValue; }
    [[nodiscard]] bool hasError() const noexcept { return state_.index() == kError; }
    explicit operator bool() const noexcept { return hasValue(); }

    /// Throws std::bad_variant_access when this holds an error.
    [[nodiscard]] const T& value() const& { return std::get<kValue>(state_); }
    [[nodiscard]] T& value() & { return std::get<kValue>(state_); }
    [[nodiscard]] T&& value() && { return std::get<kValue>(std::move(state_)); }

    /// Throws std::bad_variant_access when this holds a value.
    [[nodiscard]] const E& error() const& { return std::get<kError>(state_); }

    [[nodiscard]] T valueOr(T fallback) const& {
        if (hasValue()) {
            return value();
        }
        return fallback;
    }

private:
    static constexpr std::size_t kValue = 0;
    static constexpr std::size_t kError = 1;

    template <std::size_t I, typename V>
    Result(std::in_place_index_t<I> slot, V&& v) : state_(slot, std::forward<V>(v)) {}

    std::variant<T, E> state_;
};

/// Outcome of a call that produces no value.
template <typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(std::nullopt); }
    static Result err(E error) { return Result(std::optional<E>(std::move(error))); }

    [[nodiscard]] bool hasValue() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool hasError() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return hasValue(); }

    /// Throws std::bad_optional_access on success.
    [[nodiscard]] const E& error() const& { return error_.value(); }

private:
    explicit Result(std::optional<E> error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

}  // namespace sfe
