#pragma once

#include <JBind/Async/Generator.hpp>
#include <JBind/Defines.hpp>
#include <JBind/Serialization/Core/LookaheadCursor.hpp>
#include <JBind/Serialization/Core/ParseError.hpp>
#include <JBind/Serialization/JSON/JsonToken.hpp>

#include <string>
#include <string_view>

namespace JBind::Serialization
{
    /// @brief Pull-based JSON tokenizer over a character cursor.
    ///
    /// `Tokens()` is lazy: a character is only examined when the consumer asks for the token that contains it.
    /// Lexing errors are thrown as `Exceptions::ParseException` from inside the coroutine and surface wherever the
    /// token is pulled.
    ///
    /// String escapes are deliberately narrow: a backslash makes the following character literal, so `\"` gives a
    /// quote and `\n` gives the letter `n`. Numbers are unsigned digit runs with an optional fraction.
    class JBIND_API JsonLexer
    {
    public:
        /// @param chars Character cursor; must outlive the lexer and every generator it returns.
        explicit JsonLexer(LookaheadCursor<char>& chars) noexcept
            : m_chars(chars)
        {
        }

        JsonLexer(const JsonLexer&)            = delete;
        JsonLexer& operator=(const JsonLexer&) = delete;

        /// @brief Lazy token sequence, including whitespace markers. Single pass.
        [[nodiscard]] Async::Generator<JsonToken> Tokens();

        /// @brief Single-pass character source over an in-memory document.
        [[nodiscard]] static Async::Generator<char> Characters(std::string_view input);

        /// @brief Drop whitespace markers from a token sequence.
        [[nodiscard]] static Async::Generator<JsonToken> SkipWhitespace(Async::Generator<JsonToken> tokens);

        /// @brief Resolve a byte offset against the characters consumed so far.
        ///
        /// When `trackLocation` is set, line and column (both 1-based) are computed from the cursor history;
        /// otherwise only the offset is filled in.
        [[nodiscard]] ParseLocation Locate(UIntSize offset, bool trackLocation) const noexcept;

    private:
        void        ExpectSuffix(std::string_view suffix);
        std::string LexString();
        JsonToken   LexNumber(char first, UIntSize offset);
        void        SkipWhitespaceRun();
        std::string ReadDigits();

        [[noreturn]] void FailUnexpected(char c, UIntSize offset) const;
        [[noreturn]] void FailEnd(const char* what) const;

        LookaheadCursor<char>& m_chars;
    };
}// namespace JBind::Serialization
