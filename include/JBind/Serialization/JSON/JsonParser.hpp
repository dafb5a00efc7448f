#pragma once

#include <JBind/Binding/BoundValue.hpp>
#include <JBind/Binding/TypeBuilder.hpp>
#include <JBind/Binding/TypeDescriptor.hpp>
#include <JBind/Binding/TypeSchema.hpp>
#include <JBind/Binding/ValueConverter.hpp>
#include <JBind/Defines.hpp>
#include <JBind/Exceptions/ParseException.hpp>
#include <JBind/Serialization/Core/ParseError.hpp>
#include <JBind/Serialization/JSON/JsonTypes.hpp>
#include <JBind/Utilities/Expected.hpp>

#include <string_view>
#include <vector>

namespace JBind::Serialization
{
    /// @brief JSON parsing configuration.
    struct JsonParseOptions
    {
        bool trackLocation {false};
        bool rejectTrailingContent {false};
    };

    /// @brief Requested shape of a typed parse: one instance of a type, or a list of them.
    struct TargetType
    {
        const Binding::TypeDescriptor* type {nullptr};
        bool                           list {false};

        template<Binding::Reflectable T>
        [[nodiscard]] static TargetType Of()
        {
            return TargetType {&Binding::DescriptorOf<T>(), false};
        }

        template<Binding::Reflectable T>
        [[nodiscard]] static TargetType ListOf()
        {
            return TargetType {&Binding::DescriptorOf<T>(), true};
        }
    };

    /// @brief JSON parser entry points for the node tree and for bound types.
    ///
    /// All entry points are all-or-nothing: they return either a complete result or the first error.
    class JBIND_API JsonParser
    {
    public:
        static Utilities::Expected<JsonValue, ParseError>
        Parse(std::string_view input, const JsonParseOptions& options = {});

        /// @brief Parse while binding objects against `target`.
        ///
        /// Members whose declared type has a schema are bound recursively; everything else stays untyped JSON.
        static Utilities::Expected<Binding::BoundValue, ParseError>
        Parse(std::string_view input, const TargetType& target, const JsonParseOptions& options = {});

        template<Binding::Reflectable T>
        static Utilities::Expected<T, ParseError> ParseAs(std::string_view input, const JsonParseOptions& options = {})
        {
            return Convert<T>(Parse(input, TargetType::Of<T>(), options));
        }

        template<Binding::Reflectable T>
        static Utilities::Expected<std::vector<T>, ParseError> ParseListOf(std::string_view input, const JsonParseOptions& options = {})
        {
            return Convert<std::vector<T>>(Parse(input, TargetType::ListOf<T>(), options));
        }

    private:
        template<typename R>
        static Utilities::Expected<R, ParseError> Convert(Utilities::Expected<Binding::BoundValue, ParseError>&& bound)
        {
            if (!bound.HasValue())
                return Utilities::Expected<R, ParseError>(Utilities::Unexpected<ParseError>(std::move(bound).ErrorUnsafe()));

            try
            {
                return Utilities::Expected<R, ParseError>(Binding::ValueConverter<R>::Convert(bound.ValueUnsafe(), Binding::ConversionContext {}));
            }
            catch (const Exceptions::ParseException& e)
            {
                return Utilities::Expected<R, ParseError>(Utilities::Unexpected<ParseError>(ParseError(e.GetError())));
            }
        }
    };
}// namespace JBind::Serialization
