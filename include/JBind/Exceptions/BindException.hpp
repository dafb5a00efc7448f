#pragma once

/// @file BindException.hpp
/// @brief Declares the BindException class.

#include <JBind/Exceptions/ParseException.hpp>

#include <string>
#include <utility>
#include <vector>

namespace JBind::Exceptions
{
    /// @class BindException
    /// @brief Thrown when parsed members cannot be turned into an instance of a target type.
    ///
    /// @details
    /// Besides the message, the exception keeps the structured pieces needed for diagnostics: the
    /// target type, the member that could not be satisfied and every member name that was supplied.
    class BindException : public ParseException
    {
    public:
        BindException(Serialization::ParseErrorCode code,
                      std::string                   message,
                      std::string                   typeName,
                      std::string                   memberName      = {},
                      std::vector<std::string>      suppliedMembers = {})
            : ParseException(code, std::move(message)),
              m_typeName(std::move(typeName)),
              m_memberName(std::move(memberName)),
              m_suppliedMembers(std::move(suppliedMembers))
        {
        }

        ~BindException() noexcept override = default;

        [[nodiscard]] const std::string& TypeName() const noexcept { return m_typeName; }
        [[nodiscard]] const std::string& MemberName() const noexcept { return m_memberName; }
        [[nodiscard]] const std::vector<std::string>& SuppliedMembers() const noexcept { return m_suppliedMembers; }

    private:
        std::string              m_typeName;
        std::string              m_memberName;
        std::vector<std::string> m_suppliedMembers;
    };
}// namespace JBind::Exceptions
