#include <JBind/Serialization/JSON/JsonToken.hpp>

#include <sstream>

namespace JBind::Serialization
{
    std::string_view ToString(JsonToken::Kind kind) noexcept
    {
        switch (kind)
        {
            case JsonToken::Kind::OpenBrace:
                return "'{'";
            case JsonToken::Kind::CloseBrace:
                return "'}'";
            case JsonToken::Kind::OpenBracket:
                return "'['";
            case JsonToken::Kind::CloseBracket:
                return "']'";
            case JsonToken::Kind::Colon:
                return "':'";
            case JsonToken::Kind::Comma:
                return "','";
            case JsonToken::Kind::Whitespace:
                return "whitespace";
            case JsonToken::Kind::Null:
                return "null";
            case JsonToken::Kind::True:
                return "true";
            case JsonToken::Kind::False:
                return "false";
            case JsonToken::Kind::String:
                return "string";
            case JsonToken::Kind::Integer:
                return "integer";
            case JsonToken::Kind::Float:
                return "float";
        }
        return "unknown";
    }

    std::string JsonToken::Describe() const
    {
        std::ostringstream out;
        out << ToString(kind);
        switch (kind)
        {
            case Kind::String:
                out << " \"" << AsString() << '"';
                break;
            case Kind::Integer:
                out << ' ' << AsInteger();
                break;
            case Kind::Float:
                out << ' ' << AsFloat();
                break;
            default:
                break;
        }
        return out.str();
    }
}// namespace JBind::Serialization
