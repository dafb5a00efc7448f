#pragma once

#include <JBind/Defines.hpp>
#include <JBind/Primitives.hpp>

#include <string>
#include <string_view>

namespace JBind::Serialization
{
    /// @brief Category of a failed parse or bind.
    enum class ParseErrorCode : UInt8
    {
        None,
        UnexpectedEnd,
        UnexpectedCharacter,
        InvalidNumber,
        UnexpectedToken,
        TrailingCharacters,
        TypeMismatch,
        MissingMember,
        UnknownMember,
        ConstructionNotAllowed,
        InternalConsistency,
    };

    /// @brief Stable, human-readable name of an error code.
    [[nodiscard]] JBIND_API std::string_view ToString(ParseErrorCode code) noexcept;

    /// @brief Byte offset and optional line/column position for parse errors.
    struct ParseLocation
    {
        UIntSize offset {0};
        UIntSize line {0};
        UIntSize column {0};

        [[nodiscard]] static constexpr ParseLocation Unknown() noexcept
        {
            return ParseLocation {};
        }
    };

    /// @brief Parsing error payload with code, location, and message.
    struct ParseError
    {
        ParseErrorCode code {ParseErrorCode::None};
        ParseLocation  location {};
        std::string    message {};
    };
}// namespace JBind::Serialization
