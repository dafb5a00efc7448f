#pragma once

#include <JBind/Binding/TypeDescriptor.hpp>

#include <concepts>
#include <string_view>

namespace JBind::Binding
{
    /// @brief Customization point that makes a type bindable.
    ///
    /// Specialize it for each target type with a `Name` and a `Describe` function that declares the constructor and
    /// fields through the builder:
    /// @code
    /// namespace JBind::Binding
    /// {
    ///     template<>
    ///     struct TypeSchema<Person>
    ///     {
    ///         static constexpr std::string_view Name = "Person";
    ///         static void Describe(TypeBuilder<Person>& builder)
    ///         {
    ///             builder.Constructor<Int64, std::string>({"id", "name"}).Field("email", &Person::email);
    ///         }
    ///     };
    /// }
    /// @endcode
    /// Fields are written through pointers to members, so a schema that needs private members must be a friend.
    template<typename T>
    struct TypeSchema
    {
    };

    /// @brief Satisfied by types with a `TypeSchema` specialization.
    template<typename T>
    concept Reflectable = requires(TypeBuilder<T>& builder) {
        { TypeSchema<T>::Name } -> std::convertible_to<std::string_view>;
        TypeSchema<T>::Describe(builder);
    };

    /// @brief The single descriptor of `T`, built on first use.
    template<Reflectable T>
    const TypeDescriptor& DescriptorOf();

    template<Reflectable T>
    const TypeDescriptor* ResolveDescriptor()
    {
        return &DescriptorOf<T>();
    }
}// namespace JBind::Binding
