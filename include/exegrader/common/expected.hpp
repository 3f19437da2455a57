#pragma once

#include <exegrader/common/formatters/debug.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <concepts>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace exegrader {

template <typename T = void, typename E = std::error_code>
/**
 * @brief std::variant wrapper for a partial implementation of C++23's expected type
 *
 * @tparam T The expected value type
 * @tparam E The error type
 *
 * Note: types T and E must not be convertible between one another.
 */
class [[nodiscard]] Expected
{
    using StorageT = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

public:
    using ExpectedT = T;
    using ErrT = E;

    /// A default-constructed Expected<void> holds success
    constexpr Expected()
        requires(std::is_void_v<T>)
        : data_{std::monostate{}} {}

    template <typename Tu>
    constexpr Expected(Tu&& value) // NOLINT(*-explicit-*)
        requires(!std::is_void_v<T> && std::convertible_to<Tu, T> && !std::same_as<std::remove_cvref_t<Tu>, Expected>)
        : data_{std::in_place_index<0>, std::forward<Tu>(value)} {}

    template <typename Eu>
    constexpr Expected(Eu&& error) // NOLINT(*-explicit-*)
        requires(std::convertible_to<Eu, E> && !std::convertible_to<Eu, StorageT> &&
                 !std::same_as<std::remove_cvref_t<Eu>, Expected>)
        : data_{std::in_place_index<1>, std::forward<Eu>(error)} {}

    constexpr bool has_value() const noexcept { return data_.index() == 0; }

    constexpr bool has_error() const noexcept { return !has_value(); }

    constexpr explicit operator bool() const noexcept { return has_value(); }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    constexpr U& value() & {
        DEBUG_ASSERT(has_value(), "value() called on an Expected holding an error");
        return std::get<0>(data_);
    }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    constexpr const U& value() const& {
        DEBUG_ASSERT(has_value(), "value() called on an Expected holding an error");
        return std::get<0>(data_);
    }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    constexpr U&& value() && {
        DEBUG_ASSERT(has_value(), "value() called on an Expected holding an error");
        return std::get<0>(std::move(data_));
    }

    template <typename U = T>
        requires(std::is_void_v<U>)
    constexpr void value() const {
        DEBUG_ASSERT(has_value(), "value() called on an Expected holding an error");
    }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    constexpr U& operator*() & {
        return value();
    }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    constexpr const U& operator*() const& {
        return value();
    }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    constexpr U* operator->() {
        return &value();
    }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    constexpr const U* operator->() const {
        return &value();
    }

    template <typename Tu>
        requires(!std::is_void_v<T> && std::convertible_to<Tu, T>)
    constexpr T value_or(Tu&& default_value) const& {
        if (!has_value()) {
            return static_cast<T>(std::forward<Tu>(default_value));
        }
        return std::get<0>(data_);
    }

    constexpr const E& error() const {
        DEBUG_ASSERT(has_error(), "error() called on an Expected holding a value");
        return std::get<1>(data_);
    }

    template <typename Eu>
    constexpr E error_or(Eu&& default_value) const {
        if (has_value()) {
            return static_cast<E>(std::forward<Eu>(default_value));
        }
        return std::get<1>(data_);
    }

    /// Apply `func` to the contained value, if any, propagating the error otherwise
    template <typename Func>
        requires(!std::is_void_v<T>)
    constexpr Expected<std::invoke_result_t<Func, const T&>, E> transform(const Func& func) const {
        if (!has_value()) {
            return error();
        }

        return func(value());
    }

    constexpr bool operator==(const Expected& rhs) const
        requires(std::equality_comparable<E> && (std::is_void_v<T> || std::equality_comparable<T>))
    {
        return data_ == rhs.data_;
    }

    template <typename Tu>
        requires(!std::is_void_v<T> && !std::same_as<Tu, Expected> && std::equality_comparable_with<Tu, T>)
    constexpr bool operator==(const Tu& rhs) const {
        return has_value() && value() == rhs;
    }

    template <typename Eu>
        requires(!std::same_as<Eu, Expected> && std::equality_comparable_with<Eu, E> &&
                 (std::is_void_v<T> || !std::equality_comparable_with<Eu, T>))
    constexpr bool operator==(const Eu& rhs) const {
        return has_error() && error() == rhs;
    }

private:
    std::variant<StorageT, E> data_;
};

} // namespace exegrader

template <typename T, typename E>
struct fmt::formatter<::exegrader::Expected<T, E>> : ::exegrader::DebugFormatter
{
    auto format(const ::exegrader::Expected<T, E>& from, fmt::format_context& ctx) const {
        if (!from) {
            if constexpr (fmt::is_formattable<E>::value) {
                return fmt::format_to(ctx.out(), "Error({})", from.error());
            } else {
                return fmt::format_to(ctx.out(), "Error(<unformattable>)");
            }
        }

        if constexpr (std::is_void_v<T>) {
            return fmt::format_to(ctx.out(), "Expected(void)");
        } else if constexpr (fmt::is_formattable<T>::value) {
            return fmt::format_to(ctx.out(), "Expected({})", from.value());
        } else {
            return fmt::format_to(ctx.out(), "Expected(<unformattable>)");
        }
    }
};
