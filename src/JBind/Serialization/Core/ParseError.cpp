#include <JBind/Serialization/Core/ParseError.hpp>

namespace JBind::Serialization
{
    std::string_view ToString(ParseErrorCode code) noexcept
    {
        switch (code)
        {
            case ParseErrorCode::None:
                return "None";
            case ParseErrorCode::UnexpectedEnd:
                return "UnexpectedEnd";
            case ParseErrorCode::UnexpectedCharacter:
                return "UnexpectedCharacter";
            case ParseErrorCode::InvalidNumber:
                return "InvalidNumber";
            case ParseErrorCode::UnexpectedToken:
                return "UnexpectedToken";
            case ParseErrorCode::TrailingCharacters:
                return "TrailingCharacters";
            case ParseErrorCode::TypeMismatch:
                return "TypeMismatch";
            case ParseErrorCode::MissingMember:
                return "MissingMember";
            case ParseErrorCode::UnknownMember:
                return "UnknownMember";
            case ParseErrorCode::ConstructionNotAllowed:
                return "ConstructionNotAllowed";
            case ParseErrorCode::InternalConsistency:
                return "InternalConsistency";
        }
        return "Unknown";
    }
}// namespace JBind::Serialization
