#pragma once

/// @file ParseException.hpp
/// @brief Declares the ParseException class.

#include <JBind/Exceptions/Exception.hpp>
#include <JBind/Serialization/Core/ParseError.hpp>

#include <utility>

namespace JBind::Exceptions
{
    /// @class ParseException
    /// @brief Carries a `ParseError` out of the lexer, the parser or the binder.
    class ParseException : public Exception
    {
    public:
        ParseException(Serialization::ParseErrorCode code, std::string message, Serialization::ParseLocation location = Serialization::ParseLocation::Unknown())
            : Exception(message), m_error {code, location, std::move(message)}
        {
        }

        ~ParseException() noexcept override = default;

        [[nodiscard]] Serialization::ParseErrorCode Code() const noexcept { return m_error.code; }

        [[nodiscard]] const Serialization::ParseError& GetError() const noexcept { return m_error; }

        /// @brief Attach a source position once it becomes known higher up the call chain.
        void SetLocation(const Serialization::ParseLocation& location) noexcept { m_error.location = location; }

    private:
        Serialization::ParseError m_error;
    };
}// namespace JBind::Exceptions
