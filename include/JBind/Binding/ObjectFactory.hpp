#pragma once

#include <JBind/Binding/BoundValue.hpp>
#include <JBind/Binding/TypeBuilder.hpp>
#include <JBind/Binding/TypeDescriptor.hpp>
#include <JBind/Binding/TypeSchema.hpp>
#include <JBind/Binding/ValueConverter.hpp>
#include <JBind/Defines.hpp>

#include <string_view>

namespace JBind::Binding
{
    /// @brief Turns a name/value mapping into an instance of a described type.
    ///
    /// Binding runs in two steps. Constructor parameters are matched by name in declaration order and each match
    /// is consumed. The members left over are then written straight into same-named fields. Members that match
    /// neither are ignored.
    class JBIND_API ObjectFactory
    {
    public:
        /// @brief Construct and populate one instance of `type`.
        /// @throws Exceptions::BindException with `MissingMember` or `ConstructionNotAllowed`, or `TypeMismatch`
        ///         when a member value cannot be converted to its declared type.
        [[nodiscard]] static BoundObject Create(const TypeDescriptor& type, BoundMembers members);

        template<Reflectable T>
        [[nodiscard]] static T Create(BoundMembers members)
        {
            const TypeDescriptor& type = DescriptorOf<T>();
            return ValueConverter<T>::Convert(BoundValue::FromObject(Create(type, std::move(members))), ConversionContext {type.Name(), {}});
        }

        /// @brief Schema the member `name` of `type` binds against.
        ///
        /// A constructor parameter whose schema is constructible wins; otherwise the same-named field is consulted.
        /// Null means the member is parsed as untyped JSON.
        [[nodiscard]] static const TypeDescriptor* DeclaredTypeOf(const TypeDescriptor& type, std::string_view name);

    private:
        static std::any Construct(const TypeDescriptor& type, BoundMembers& members);
        static void     AssignFields(const TypeDescriptor& type, std::any& instance, const BoundMembers& members);
    };
}// namespace JBind::Binding
