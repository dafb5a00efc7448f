#pragma once

#include <JBind/Defines.hpp>
#include <JBind/Primitives.hpp>

#include <string>
#include <string_view>
#include <variant>

namespace JBind::Serialization
{
    /// @brief One lexical unit of JSON text.
    ///
    /// Punctuation and the `true`/`false`/`null` literals are identified by kind alone; strings,
    /// integers and floats carry their decoded value.
    struct JBIND_API JsonToken
    {
        enum class Kind : UInt8
        {
            OpenBrace,
            CloseBrace,
            OpenBracket,
            CloseBracket,
            Colon,
            Comma,
            Whitespace,
            Null,
            True,
            False,
            String,
            Integer,
            Float,
        };

        using Payload = std::variant<std::monostate, std::string, Int64, F64>;

        Kind     kind {Kind::Null};
        Payload  payload {};
        UIntSize offset {0};

        static JsonToken Make(Kind kind, UIntSize offset) noexcept
        {
            JsonToken token;
            token.kind   = kind;
            token.offset = offset;
            return token;
        }

        static JsonToken MakeString(std::string value, UIntSize offset)
        {
            JsonToken token = Make(Kind::String, offset);
            token.payload   = std::move(value);
            return token;
        }

        static JsonToken MakeInteger(Int64 value, UIntSize offset) noexcept
        {
            JsonToken token = Make(Kind::Integer, offset);
            token.payload   = value;
            return token;
        }

        static JsonToken MakeFloat(F64 value, UIntSize offset) noexcept
        {
            JsonToken token = Make(Kind::Float, offset);
            token.payload   = value;
            return token;
        }

        /// @brief True for tokens that stand for a complete scalar value.
        [[nodiscard]] bool IsScalar() const noexcept
        {
            switch (kind)
            {
                case Kind::Null:
                case Kind::True:
                case Kind::False:
                case Kind::String:
                case Kind::Integer:
                case Kind::Float:
                    return true;
                default:
                    return false;
            }
        }

        [[nodiscard]] const std::string& AsString() const noexcept { return *std::get_if<std::string>(&payload); }
        [[nodiscard]] Int64              AsInteger() const noexcept { return *std::get_if<Int64>(&payload); }
        [[nodiscard]] F64                AsFloat() const noexcept { return *std::get_if<F64>(&payload); }

        /// @brief Short description for diagnostics, e.g. `'{'` or `string "abc"`.
        [[nodiscard]] std::string Describe() const;

        [[nodiscard]] friend bool operator==(const JsonToken&, const JsonToken&) = default;
    };

    [[nodiscard]] JBIND_API std::string_view ToString(JsonToken::Kind kind) noexcept;
}// namespace JBind::Serialization
