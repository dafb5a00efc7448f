#pragma once

#include <JBind/Binding/BoundValue.hpp>
#include <JBind/Binding/TypeDescriptor.hpp>
#include <JBind/Exceptions/ParseException.hpp>
#include <JBind/Serialization/Core/LookaheadCursor.hpp>
#include <JBind/Serialization/JSON/JsonLexer.hpp>
#include <JBind/Serialization/JSON/JsonParser.hpp>
#include <JBind/Serialization/JSON/JsonToken.hpp>
#include <JBind/Serialization/JSON/JsonTypes.hpp>
#include <JBind/Utilities/Expected.hpp>

#include <memory>
#include <string>
#include <utility>

namespace JBind::Serialization::detail
{
    using TokenCursor = LookaheadCursor<JsonToken>;

    /// State shared by the node parser and the typed parser for one call.
    struct JsonParseContext
    {
        TokenCursor&            tokens;
        const JsonParseOptions& options;
        UIntSize                inputSize {0};
    };

    [[nodiscard]] bool IsAt(const JsonParseContext& ctx, JsonToken::Kind kind) noexcept;

    /// Consume the current token if it has `kind`; otherwise throw `UnexpectedToken`.
    void Expect(JsonParseContext& ctx, JsonToken::Kind kind);

    /// Consume an object key.
    [[nodiscard]] std::string ExpectKey(JsonParseContext& ctx);

    [[noreturn]] void FailUnexpectedEnd(const JsonParseContext& ctx);
    [[noreturn]] void FailUnexpectedToken(const JsonToken& token);

    [[nodiscard]] JsonValue ScalarValue(const JsonToken& token);

    /// Node parser: one value starting at the current token.
    [[nodiscard]] JsonValue ParseValue(JsonParseContext& ctx);

    /// Typed parser: like `ParseValue`, binding objects against `type` when it is non-null.
    [[nodiscard]] Binding::BoundValue ParseTypedValue(JsonParseContext& ctx, const Binding::TypeDescriptor* type);

    /// Walk `{ "key": value, ... }`. `onMember` receives each key with the cursor on its value and must consume it.
    template<typename OnMember>
    void ParseMembers(JsonParseContext& ctx, OnMember&& onMember)
    {
        Expect(ctx, JsonToken::Kind::OpenBrace);
        if (IsAt(ctx, JsonToken::Kind::CloseBrace))
        {
            ctx.tokens.Advance();
            return;
        }

        while (true)
        {
            std::string key = ExpectKey(ctx);
            Expect(ctx, JsonToken::Kind::Colon);
            onMember(std::move(key));

            if (IsAt(ctx, JsonToken::Kind::Comma))
            {
                ctx.tokens.Advance();
                continue;
            }
            Expect(ctx, JsonToken::Kind::CloseBrace);
            return;
        }
    }

    /// Walk `[ value, ... ]`. `onElement` is called with the cursor on each element and must consume it.
    template<typename OnElement>
    void ParseElements(JsonParseContext& ctx, OnElement&& onElement)
    {
        Expect(ctx, JsonToken::Kind::OpenBracket);
        if (IsAt(ctx, JsonToken::Kind::CloseBracket))
        {
            ctx.tokens.Advance();
            return;
        }

        while (true)
        {
            onElement();

            if (IsAt(ctx, JsonToken::Kind::Comma))
            {
                ctx.tokens.Advance();
                continue;
            }
            Expect(ctx, JsonToken::Kind::CloseBracket);
            return;
        }
    }

    /// Set up the character cursor, lexer and token cursor for `input`, run `body`, and turn a thrown
    /// `ParseException` into an error result with a resolved location.
    template<typename R, typename Body>
    Utilities::Expected<R, ParseError> RunParse(std::string_view input, const JsonParseOptions& options, Body&& body)
    {
        std::unique_ptr<LookaheadCursor<char>> chars;
        std::unique_ptr<JsonLexer>             lexer;
        try
        {
            chars = std::make_unique<LookaheadCursor<char>>(JsonLexer::Characters(input));
            lexer = std::make_unique<JsonLexer>(*chars);

            TokenCursor      tokens {JsonLexer::SkipWhitespace(lexer->Tokens())};
            JsonParseContext ctx {tokens, options, input.size()};

            R result = body(ctx);
            if (options.rejectTrailingContent)
            {
                if (const JsonToken* trailing = tokens.Current())
                {
                    throw Exceptions::ParseException(ParseErrorCode::TrailingCharacters,
                                                     "Unexpected trailing " + trailing->Describe() + " after the top-level value",
                                                     ParseLocation {trailing->offset, 0, 0});
                }
            }
            return Utilities::Expected<R, ParseError>(std::move(result));
        }
        catch (const Exceptions::ParseException& e)
        {
            ParseError error = e.GetError();
            if (lexer)
                error.location = lexer->Locate(error.location.offset, options.trackLocation);
            return Utilities::Expected<R, ParseError>(Utilities::Unexpected<ParseError>(std::move(error)));
        }
    }
}// namespace JBind::Serialization::detail
