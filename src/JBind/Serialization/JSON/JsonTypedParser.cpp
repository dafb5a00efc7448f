#include <JBind/Serialization/JSON/JsonParser.hpp>

#include <JBind/Binding/ObjectFactory.hpp>
#include <JBind/Exceptions/BindException.hpp>

#include "JsonParseContext.hpp"

namespace JBind::Serialization
{
    namespace detail
    {
        namespace
        {
            Binding::BoundValue ParseTypedObject(JsonParseContext& ctx, const Binding::TypeDescriptor& type)
            {
                const UIntSize offset = ctx.tokens.Current()->offset;

                Binding::BoundMembers members;
                ParseMembers(ctx, [&](std::string key) {
                    const Binding::TypeDescriptor* declared = Binding::ObjectFactory::DeclaredTypeOf(type, key);
                    members.Set(std::move(key), ParseTypedValue(ctx, declared));
                });

                try
                {
                    return Binding::BoundValue::FromObject(Binding::ObjectFactory::Create(type, std::move(members)));
                }
                catch (Exceptions::ParseException& e)
                {
                    e.SetLocation(ParseLocation {offset, 0, 0});
                    throw;
                }
            }

            Binding::BoundValue ParseTypedArray(JsonParseContext& ctx, const Binding::TypeDescriptor& type)
            {
                Binding::BoundList values;
                ParseElements(ctx, [&] { values.push_back(ParseTypedValue(ctx, &type)); });
                return Binding::BoundValue::FromList(std::move(values));
            }

            [[noreturn]] void FailTargetMismatch(const TargetType& target, const Binding::BoundValue& result)
            {
                const std::string expected = (target.list ? "list of " : "instance of ") + target.type->Name();
                throw Exceptions::BindException(ParseErrorCode::TypeMismatch,
                                                "Expected " + expected + " but the document is " + result.Describe(),
                                                target.type->Name());
            }
        }// namespace

        Binding::BoundValue ParseTypedValue(JsonParseContext& ctx, const Binding::TypeDescriptor* type)
        {
            if (!type)
                return Binding::BoundValue::FromJson(ParseValue(ctx));

            const JsonToken* token = ctx.tokens.Current();
            if (!token)
                FailUnexpectedEnd(ctx);

            switch (token->kind)
            {
                case JsonToken::Kind::OpenBrace:
                    return ParseTypedObject(ctx, *type);
                case JsonToken::Kind::OpenBracket:
                    return ParseTypedArray(ctx, *type);
                default:
                    return Binding::BoundValue::FromJson(ParseValue(ctx));
            }
        }
    }// namespace detail

    Utilities::Expected<Binding::BoundValue, ParseError>
    JsonParser::Parse(std::string_view input, const TargetType& target, const JsonParseOptions& options)
    {
        return detail::RunParse<Binding::BoundValue>(input, options, [&target](detail::JsonParseContext& ctx) {
            Binding::BoundValue result = detail::ParseTypedValue(ctx, target.type);
            if (!target.type)
                return result;

            const bool matches = target.list ? result.IsList() : result.IsInstanceOf(*target.type);
            if (!matches)
                detail::FailTargetMismatch(target, result);
            return result;
        });
    }
}// namespace JBind::Serialization
