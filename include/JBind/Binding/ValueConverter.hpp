#pragma once

#include <JBind/Binding/BoundValue.hpp>
#include <JBind/Binding/TypeSchema.hpp>
#include <JBind/Defines.hpp>
#include <JBind/Primitives.hpp>
#include <JBind/Serialization/JSON/JsonTypes.hpp>

#include <any>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace JBind::Binding
{
    /// @brief Where a conversion happens, for error messages.
    struct ConversionContext
    {
        std::string_view typeName {};
        std::string_view memberName {};
    };

    /// @brief Throws `Exceptions::BindException` (`TypeMismatch`) describing a failed conversion.
    [[noreturn]] JBIND_API void ThrowConversionError(const ConversionContext& context, std::string_view expected, const BoundValue& actual);

    /// @brief Converts a parsed value into a C++ member or parameter type.
    ///
    /// Specializations exist for booleans, arithmetic types, `std::string`, `JsonValue`, `BoundValue`,
    /// `std::optional`, `std::vector` and every `Reflectable` type.
    template<typename T>
    struct ValueConverter;

    template<>
    struct ValueConverter<BoundValue>
    {
        static BoundValue Convert(const BoundValue& value, const ConversionContext&)
        {
            return value;
        }
    };

    template<>
    struct ValueConverter<Serialization::JsonValue>
    {
        static Serialization::JsonValue Convert(const BoundValue& value, const ConversionContext& context)
        {
            if (value.IsJson())
                return value.AsJson();
            if (value.IsList())
            {
                Serialization::JsonArray array;
                array.values.reserve(value.AsList().size());
                for (const BoundValue& element: value.AsList())
                    array.values.push_back(Convert(element, context));
                return Serialization::JsonValue::MakeArray(std::move(array));
            }
            ThrowConversionError(context, "JSON value", value);
        }
    };

    template<>
    struct ValueConverter<bool>
    {
        static bool Convert(const BoundValue& value, const ConversionContext& context)
        {
            if (value.IsJson() && value.AsJson().IsBool())
                return value.AsJson().AsBool();
            ThrowConversionError(context, "bool", value);
        }
    };

    template<typename T>
        requires(std::is_integral_v<T> && !std::is_same_v<T, bool>)
    struct ValueConverter<T>
    {
        static T Convert(const BoundValue& value, const ConversionContext& context)
        {
            if (!value.IsJson() || !value.AsJson().IsInteger())
                ThrowConversionError(context, "integer", value);

            const Int64 raw = value.AsJson().AsInteger();
            if (!std::in_range<T>(raw))
                ThrowConversionError(context, "integer in range", value);
            return static_cast<T>(raw);
        }
    };

    template<typename T>
        requires std::is_floating_point_v<T>
    struct ValueConverter<T>
    {
        static T Convert(const BoundValue& value, const ConversionContext& context)
        {
            if (value.IsJson() && value.AsJson().IsNumber())
                return static_cast<T>(value.AsJson().AsNumber());
            ThrowConversionError(context, "number", value);
        }
    };

    template<>
    struct ValueConverter<std::string>
    {
        static std::string Convert(const BoundValue& value, const ConversionContext& context)
        {
            if (value.IsJson() && value.AsJson().IsString())
                return value.AsJson().AsString();
            ThrowConversionError(context, "string", value);
        }
    };

    template<typename U>
    struct ValueConverter<std::optional<U>>
    {
        static std::optional<U> Convert(const BoundValue& value, const ConversionContext& context)
        {
            if (value.IsJson() && value.AsJson().IsNull())
                return std::nullopt;
            return ValueConverter<U>::Convert(value, context);
        }
    };

    template<typename U>
    struct ValueConverter<std::vector<U>>
    {
        static std::vector<U> Convert(const BoundValue& value, const ConversionContext& context)
        {
            std::vector<U> result;
            if (value.IsList())
            {
                result.reserve(value.AsList().size());
                for (const BoundValue& element: value.AsList())
                    result.push_back(ValueConverter<U>::Convert(element, context));
                return result;
            }
            if (value.IsJson() && value.AsJson().IsArray())
            {
                const auto& elements = value.AsJson().AsArray().values;
                result.reserve(elements.size());
                for (const Serialization::JsonValue& element: elements)
                    result.push_back(ValueConverter<U>::Convert(BoundValue::FromJson(element), context));
                return result;
            }
            ThrowConversionError(context, "array", value);
        }
    };

    template<Reflectable T>
    struct ValueConverter<T>
    {
        static T Convert(const BoundValue& value, const ConversionContext& context)
        {
            const TypeDescriptor& expected = DescriptorOf<T>();
            if (value.IsInstanceOf(expected))
            {
                if (const T* instance = std::any_cast<T>(&value.AsObject().instance))
                    return *instance;
            }
            ThrowConversionError(context, expected.Name(), value);
        }
    };

    /// @brief Parameters of type `std::optional<U>` may be left out of the JSON object.
    template<typename T>
    inline constexpr bool IsOptionalMember = false;

    template<typename U>
    inline constexpr bool IsOptionalMember<std::optional<U>> = true;

    /// @brief Resolver for the schema a member of type `T` binds against: `T` itself, or the element type of an
    /// optional or vector. Null for members without a schema, which are parsed as untyped JSON.
    template<typename T>
    constexpr TypeResolver ResolverFor() noexcept
    {
        if constexpr (Reflectable<T>)
            return &ResolveDescriptor<T>;
        else
            return nullptr;
    }

    template<typename T>
    struct MemberResolver
    {
        static constexpr TypeResolver Get() noexcept { return ResolverFor<T>(); }
    };

    template<typename U>
    struct MemberResolver<std::optional<U>>
    {
        static constexpr TypeResolver Get() noexcept { return MemberResolver<U>::Get(); }
    };

    template<typename U>
    struct MemberResolver<std::vector<U>>
    {
        static constexpr TypeResolver Get() noexcept { return MemberResolver<U>::Get(); }
    };
}// namespace JBind::Binding
