#include <JBind/Serialization/JSON/JsonParser.hpp>

#include "JsonParseContext.hpp"

namespace JBind::Serialization
{
    namespace detail
    {
        bool IsAt(const JsonParseContext& ctx, JsonToken::Kind kind) noexcept
        {
            const JsonToken* token = ctx.tokens.Current();
            return token && token->kind == kind;
        }

        void Expect(JsonParseContext& ctx, JsonToken::Kind kind)
        {
            const JsonToken* token = ctx.tokens.Current();
            if (!token)
            {
                throw Exceptions::ParseException(ParseErrorCode::UnexpectedToken,
                                                 "Expected " + std::string(ToString(kind)) + " but got end of input",
                                                 ParseLocation {ctx.inputSize, 0, 0});
            }
            if (token->kind != kind)
            {
                throw Exceptions::ParseException(ParseErrorCode::UnexpectedToken,
                                                 "Expected " + std::string(ToString(kind)) + " but got " + token->Describe(),
                                                 ParseLocation {token->offset, 0, 0});
            }
            ctx.tokens.Advance();
        }

        std::string ExpectKey(JsonParseContext& ctx)
        {
            const JsonToken* token = ctx.tokens.Current();
            if (!token)
            {
                throw Exceptions::ParseException(ParseErrorCode::UnexpectedToken,
                                                 "Expected string key but got end of input",
                                                 ParseLocation {ctx.inputSize, 0, 0});
            }
            if (token->kind != JsonToken::Kind::String)
            {
                throw Exceptions::ParseException(ParseErrorCode::UnexpectedToken,
                                                 "Expected string key but got " + token->Describe(),
                                                 ParseLocation {token->offset, 0, 0});
            }
            std::string key = token->AsString();
            ctx.tokens.Advance();
            return key;
        }

        void FailUnexpectedEnd(const JsonParseContext& ctx)
        {
            throw Exceptions::ParseException(ParseErrorCode::UnexpectedEnd,
                                             "Unexpected end of input, expected a value",
                                             ParseLocation {ctx.inputSize, 0, 0});
        }

        void FailUnexpectedToken(const JsonToken& token)
        {
            throw Exceptions::ParseException(ParseErrorCode::UnexpectedToken,
                                             "Unexpected " + token.Describe() + ", expected a value",
                                             ParseLocation {token.offset, 0, 0});
        }

        JsonValue ScalarValue(const JsonToken& token)
        {
            switch (token.kind)
            {
                case JsonToken::Kind::Null:
                    return JsonValue::MakeNull();
                case JsonToken::Kind::True:
                    return JsonValue::MakeBool(true);
                case JsonToken::Kind::False:
                    return JsonValue::MakeBool(false);
                case JsonToken::Kind::String:
                    return JsonValue::MakeString(token.AsString());
                case JsonToken::Kind::Integer:
                    return JsonValue::MakeInteger(token.AsInteger());
                case JsonToken::Kind::Float:
                    return JsonValue::MakeFloat(token.AsFloat());
                default:
                    FailUnexpectedToken(token);
            }
        }

        namespace
        {
            JsonValue ParseObject(JsonParseContext& ctx)
            {
                JsonObject object;
                ParseMembers(ctx, [&](std::string key) { object.Set(std::move(key), ParseValue(ctx)); });
                return JsonValue::MakeObject(std::move(object));
            }

            JsonValue ParseArray(JsonParseContext& ctx)
            {
                JsonArray array;
                ParseElements(ctx, [&] { array.values.push_back(ParseValue(ctx)); });
                return JsonValue::MakeArray(std::move(array));
            }
        }// namespace

        JsonValue ParseValue(JsonParseContext& ctx)
        {
            const JsonToken* token = ctx.tokens.Current();
            if (!token)
                FailUnexpectedEnd(ctx);

            switch (token->kind)
            {
                case JsonToken::Kind::OpenBrace:
                    return ParseObject(ctx);
                case JsonToken::Kind::OpenBracket:
                    return ParseArray(ctx);
                default:
                    break;
            }

            if (!token->IsScalar())
                FailUnexpectedToken(*token);

            // Containers consume their own closing token; scalars are consumed here.
            JsonValue value = ScalarValue(*token);
            ctx.tokens.Advance();
            return value;
        }
    }// namespace detail

    Utilities::Expected<JsonValue, ParseError> JsonParser::Parse(std::string_view input, const JsonParseOptions& options)
    {
        return detail::RunParse<JsonValue>(input, options, [](detail::JsonParseContext& ctx) { return detail::ParseValue(ctx); });
    }
}// namespace JBind::Serialization
