#include <JBind/Serialization/JSON/JsonLexer.hpp>

#include <JBind/Exceptions/ParseException.hpp>

#include <algorithm>
#include <charconv>
#include <cstdio>
#include <system_error>

namespace JBind::Serialization
{
    namespace
    {
        [[nodiscard]] bool IsDigit(char c) noexcept
        {
            return c >= '0' && c <= '9';
        }

        [[nodiscard]] bool IsSpace(char c) noexcept
        {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
        }

        [[nodiscard]] std::string Printable(char c)
        {
            const auto code = static_cast<unsigned char>(c);
            if (code >= 0x20 && code < 0x7F)
                return std::string(1, c);

            char buffer[8] {};
            std::snprintf(buffer, sizeof(buffer), "\\x%02X", static_cast<unsigned>(code));
            return buffer;
        }
    }// namespace

    Async::Generator<char> JsonLexer::Characters(std::string_view input)
    {
        for (const char c: input)
            co_yield c;
    }

    Async::Generator<JsonToken> JsonLexer::SkipWhitespace(Async::Generator<JsonToken> tokens)
    {
        for (const JsonToken& token: tokens)
        {
            if (token.kind == JsonToken::Kind::Whitespace)
                continue;
            co_yield token;
        }
    }

    Async::Generator<JsonToken> JsonLexer::Tokens()
    {
        while (const char* current = m_chars.Current())
        {
            const char     c      = *current;
            const UIntSize offset = m_chars.Position();
            m_chars.Advance();

            switch (c)
            {
                case '{':
                    co_yield JsonToken::Make(JsonToken::Kind::OpenBrace, offset);
                    break;
                case '}':
                    co_yield JsonToken::Make(JsonToken::Kind::CloseBrace, offset);
                    break;
                case '[':
                    co_yield JsonToken::Make(JsonToken::Kind::OpenBracket, offset);
                    break;
                case ']':
                    co_yield JsonToken::Make(JsonToken::Kind::CloseBracket, offset);
                    break;
                case ':':
                    co_yield JsonToken::Make(JsonToken::Kind::Colon, offset);
                    break;
                case ',':
                    co_yield JsonToken::Make(JsonToken::Kind::Comma, offset);
                    break;
                case 't':
                    ExpectSuffix("rue");
                    co_yield JsonToken::Make(JsonToken::Kind::True, offset);
                    break;
                case 'f':
                    ExpectSuffix("alse");
                    co_yield JsonToken::Make(JsonToken::Kind::False, offset);
                    break;
                case 'n':
                    ExpectSuffix("ull");
                    co_yield JsonToken::Make(JsonToken::Kind::Null, offset);
                    break;
                case '"':
                    co_yield JsonToken::MakeString(LexString(), offset);
                    break;
                default:
                    if (IsDigit(c))
                    {
                        co_yield LexNumber(c, offset);
                        break;
                    }
                    if (IsSpace(c))
                    {
                        SkipWhitespaceRun();
                        co_yield JsonToken::Make(JsonToken::Kind::Whitespace, offset);
                        break;
                    }
                    FailUnexpected(c, offset);
            }
        }
    }

    ParseLocation JsonLexer::Locate(UIntSize offset, bool trackLocation) const noexcept
    {
        ParseLocation location {offset, 0, 0};
        if (!trackLocation)
            return location;

        location.line   = 1;
        location.column = 1;

        const std::span<const char> history = m_chars.History();
        const UIntSize              end     = std::min(offset, history.size());
        for (UIntSize i = 0; i < end; ++i)
        {
            const char c = history[i];
            if (c == '\r')
            {
                if (i + 1 < end && history[i + 1] == '\n')
                    ++i;
                ++location.line;
                location.column = 1;
            }
            else if (c == '\n')
            {
                ++location.line;
                location.column = 1;
            }
            else
            {
                ++location.column;
            }
        }
        return location;
    }

    void JsonLexer::ExpectSuffix(std::string_view suffix)
    {
        for (const char expected: suffix)
        {
            const char* c = m_chars.Current();
            if (!c)
                FailEnd("Unexpected end of input inside literal");
            if (*c != expected)
                FailUnexpected(*c, m_chars.Position());
            m_chars.Advance();
        }
    }

    std::string JsonLexer::LexString()
    {
        std::string value;
        bool        escape = false;
        while (true)
        {
            const char* c = m_chars.Current();
            if (!c)
                FailEnd("Unterminated string");

            if (escape)
            {
                value.push_back(*c);
                escape = false;
            }
            else if (*c == '"')
            {
                break;
            }
            else if (*c == '\\')
            {
                escape = true;
            }
            else
            {
                value.push_back(*c);
            }
            m_chars.Advance();
        }
        m_chars.Advance();
        return value;
    }

    JsonToken JsonLexer::LexNumber(char first, UIntSize offset)
    {
        std::string integral(1, first);
        integral += ReadDigits();

        const char* next = m_chars.Current();
        if (!next || *next != '.')
        {
            Int64 value {0};
            const auto [end, ec] = std::from_chars(integral.data(), integral.data() + integral.size(), value);
            if (ec != std::errc {} || end != integral.data() + integral.size())
            {
                throw Exceptions::ParseException(ParseErrorCode::InvalidNumber,
                                                 "Integer literal " + integral + " does not fit in 64 bits",
                                                 ParseLocation {offset, 0, 0});
            }
            return JsonToken::MakeInteger(value, offset);
        }

        m_chars.Advance();
        std::string fraction = ReadDigits();
        if (fraction.empty())
            fraction = "0";

        const std::string text = integral + "." + fraction;
        F64               value {0.0};
        const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc {} || end != text.data() + text.size())
        {
            throw Exceptions::ParseException(ParseErrorCode::InvalidNumber,
                                             "Float literal " + text + " is out of range",
                                             ParseLocation {offset, 0, 0});
        }
        return JsonToken::MakeFloat(value, offset);
    }

    std::string JsonLexer::ReadDigits()
    {
        std::string digits;
        while (const char* c = m_chars.Current())
        {
            if (!IsDigit(*c))
                break;
            digits.push_back(*c);
            m_chars.Advance();
        }
        return digits;
    }

    void JsonLexer::SkipWhitespaceRun()
    {
        while (const char* c = m_chars.Current())
        {
            if (!IsSpace(*c))
                break;
            m_chars.Advance();
        }
    }

    void JsonLexer::FailUnexpected(char c, UIntSize offset) const
    {
        throw Exceptions::ParseException(ParseErrorCode::UnexpectedCharacter,
                                         "Unexpected character '" + Printable(c) + "' at offset " + std::to_string(offset),
                                         ParseLocation {offset, 0, 0});
    }

    void JsonLexer::FailEnd(const char* what) const
    {
        throw Exceptions::ParseException(ParseErrorCode::UnexpectedEnd,
                                         std::string(what) + " at offset " + std::to_string(m_chars.Position()),
                                         ParseLocation {m_chars.Position(), 0, 0});
    }
}// namespace JBind::Serialization
