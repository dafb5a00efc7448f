#pragma once

#include <stdexcept>
#include <string>

namespace JBind::Exceptions
{
    /// @class Exception
    /// @brief Base class for all exceptions in JBind.
    ///
    /// @details
    /// Exceptions never cross the public parse entry points: `JsonParser` converts them into a
    /// `ParseError` before returning. They exist so failures can travel through the lexer and parser
    /// coroutines, and so `ObjectFactory` can be used on its own.
    class Exception : public std::runtime_error
    {
    public:
        /// @brief Constructor.
        explicit Exception(const char* message)
            : std::runtime_error(message)
        {
        }

        /// @brief Constructor with an owned message.
        explicit Exception(const std::string& message)
            : std::runtime_error(message)
        {
        }

        /// @brief Destructor.
        ~Exception() noexcept override = default;

        /// @brief Returns the exception message.
        const char* GetMessage() const noexcept { return this->what(); }
    };
}// namespace JBind::Exceptions
