/// @file Expected.hpp
/// @brief `JBind::Utilities::Expected<T, E>`: the value-or-error type returned by every public parse entry point.
#pragma once

#include <JBind/Exceptions/Exception.hpp>
#include <JBind/Primitives.hpp>

#include <type_traits>
#include <utility>
#include <variant>

namespace JBind::Utilities
{
    /// @brief Wrapper used to explicitly construct an error value for `Expected<T, E>`.
    ///
    /// @tparam E Error type.
    template<class E>
    class Unexpected
    {
    public:
        /// @brief Error type.
        using ErrorType = E;

        constexpr explicit Unexpected(const E& error) noexcept(std::is_nothrow_copy_constructible_v<E>)
            : m_error {error}
        {
        }

        constexpr explicit Unexpected(E&& error) noexcept(std::is_nothrow_move_constructible_v<E>)
            : m_error {std::move(error)}
        {
        }

        [[nodiscard]] constexpr E&       Error() & noexcept { return m_error; }
        [[nodiscard]] constexpr const E& Error() const& noexcept { return m_error; }
        [[nodiscard]] constexpr E&&      Error() && noexcept { return std::move(m_error); }

    private:
        E m_error;
    };

    /// @brief Holds either a value of type `T` or an error of type `E`.
    ///
    /// `Value()` and `Error()` check the active state and throw `Exceptions::Exception` on misuse;
    /// the `Unsafe` accessors skip the check and require the caller to have tested `HasValue()`.
    ///
    /// @tparam T Value type.
    /// @tparam E Error type.
    template<class T, class E>
    class [[nodiscard]] Expected
    {
        static_assert(!std::is_reference_v<T>, "Expected<T&,...> is not supported.");
        static_assert(!std::is_reference_v<E>, "Expected<...,E&> is not supported.");

        static constexpr UIntSize kValueIndex = 0;
        static constexpr UIntSize kErrorIndex = 1;

    public:
        using ValueType = T;
        using ErrorType = E;

        constexpr explicit Expected(const T& value)
            : m_storage(std::in_place_index<kValueIndex>, value)
        {
        }

        constexpr explicit Expected(T&& value) noexcept(std::is_nothrow_move_constructible_v<T>)
            : m_storage(std::in_place_index<kValueIndex>, std::move(value))
        {
        }

        constexpr explicit Expected(Unexpected<E>&& unexpected) noexcept(std::is_nothrow_move_constructible_v<E>)
            : m_storage(std::in_place_index<kErrorIndex>, std::move(unexpected).Error())
        {
        }

        [[nodiscard]] constexpr bool HasValue() const noexcept { return m_storage.index() == kValueIndex; }

        constexpr explicit operator bool() const noexcept { return HasValue(); }

        [[nodiscard]] constexpr T& Value() &
        {
            RequireValue();
            return ValueUnsafe();
        }

        [[nodiscard]] constexpr const T& Value() const&
        {
            RequireValue();
            return ValueUnsafe();
        }

        [[nodiscard]] constexpr T&& Value() &&
        {
            RequireValue();
            return std::move(ValueUnsafe());
        }

        [[nodiscard]] constexpr E& Error() &
        {
            RequireError();
            return ErrorUnsafe();
        }

        [[nodiscard]] constexpr const E& Error() const&
        {
            RequireError();
            return ErrorUnsafe();
        }

        [[nodiscard]] constexpr E&& Error() &&
        {
            RequireError();
            return std::move(ErrorUnsafe());
        }

        [[nodiscard]] constexpr T&       ValueUnsafe() & noexcept { return *std::get_if<kValueIndex>(&m_storage); }
        [[nodiscard]] constexpr const T& ValueUnsafe() const& noexcept { return *std::get_if<kValueIndex>(&m_storage); }
        [[nodiscard]] constexpr T&&      ValueUnsafe() && noexcept { return std::move(*std::get_if<kValueIndex>(&m_storage)); }

        [[nodiscard]] constexpr E&       ErrorUnsafe() & noexcept { return *std::get_if<kErrorIndex>(&m_storage); }
        [[nodiscard]] constexpr const E& ErrorUnsafe() const& noexcept { return *std::get_if<kErrorIndex>(&m_storage); }
        [[nodiscard]] constexpr E&&      ErrorUnsafe() && noexcept { return std::move(*std::get_if<kErrorIndex>(&m_storage)); }

    private:
        constexpr void RequireValue() const
        {
            if (!HasValue())
                throw Exceptions::Exception("JBind::Utilities::Expected::Value called when holding error");
        }

        constexpr void RequireError() const
        {
            if (HasValue())
                throw Exceptions::Exception("JBind::Utilities::Expected::Error called when holding value");
        }

        std::variant<T, E> m_storage;
    };
}// namespace JBind::Utilities
