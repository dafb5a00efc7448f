#pragma once

#include <JBind/Binding/BoundValue.hpp>
#include <JBind/Binding/TypeDescriptor.hpp>
#include <JBind/Binding/TypeSchema.hpp>
#include <JBind/Binding/ValueConverter.hpp>
#include <JBind/Exceptions/BindException.hpp>
#include <JBind/Exceptions/ParseException.hpp>
#include <JBind/Primitives.hpp>

#include <any>
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace JBind::Binding
{
    /// @brief Fills a `TypeDescriptor` for `T` from inside `TypeSchema<T>::Describe`.
    ///
    /// Calls chain:
    /// @code
    /// builder.Constructor<Int64, std::optional<std::string>>({"id", "nickname"})
    ///        .Field("tags", &Person::tags);
    /// @endcode
    template<typename T>
    class TypeBuilder
    {
    public:
        explicit TypeBuilder(TypeDescriptor& descriptor)
            : m_descriptor(descriptor)
        {
            if constexpr (std::is_default_constructible_v<T>)
                m_descriptor.m_defaultConstruct = [] { return std::any(T {}); };
        }

        TypeBuilder(const TypeBuilder&)            = delete;
        TypeBuilder& operator=(const TypeBuilder&) = delete;

        /// @brief Declare the constructor used for binding and name its parameters.
        ///
        /// The constructor is recorded even when `T(Args...)` is not publicly callable, in which case every
        /// construction attempt fails with `ConstructionNotAllowed`. Parameters of type `std::optional<U>` may be
        /// absent from the input.
        template<typename... Args>
        TypeBuilder& Constructor(const std::array<std::string_view, sizeof...(Args)>& names)
        {
            m_descriptor.m_hasConstructor        = true;
            m_descriptor.m_constructorAccessible = std::is_constructible_v<T, Args...>;
            m_descriptor.m_parameters.clear();

            [[maybe_unused]] UIntSize index = 0;
            (AddParameter<Args>(names[index++]), ...);

            if constexpr (std::is_constructible_v<T, Args...>)
            {
                m_descriptor.m_construct = [](const TypeDescriptor& self, TypeDescriptor::Arguments& arguments) {
                    return [&]<UIntSize... I>(std::index_sequence<I...>) {
                        return std::any(T(ConvertArgument<Args>(self, arguments[I], I)...));
                    }(std::index_sequence_for<Args...> {});
                };
            }
            else
            {
                m_descriptor.m_construct = nullptr;
            }
            return *this;
        }

        /// @brief Declare a data member that can be written directly after construction.
        template<typename M>
        TypeBuilder& Field(std::string_view name, M T::*member)
        {
            static_assert(!std::is_function_v<M>, "Field() expects a pointer to a data member");

            FieldDescriptor field;
            field.name   = std::string(name);
            field.type   = MemberResolver<M>::Get();
            field.assign = [member, fieldName = field.name](const TypeDescriptor& owner, std::any& instance, const BoundValue& value) {
                T* target = std::any_cast<T>(&instance);
                if (!target)
                {
                    throw Exceptions::ParseException(Serialization::ParseErrorCode::InternalConsistency,
                                                     "Instance does not hold a " + owner.Name());
                }
                target->*member = ValueConverter<M>::Convert(value, ConversionContext {owner.Name(), fieldName});
            };
            m_descriptor.m_fields.push_back(std::move(field));
            return *this;
        }

    private:
        template<typename A>
        void AddParameter(std::string_view name)
        {
            using Value = std::remove_cvref_t<A>;
            m_descriptor.m_parameters.push_back(ParameterDescriptor {std::string(name), MemberResolver<Value>::Get(), IsOptionalMember<Value>});
        }

        template<typename A>
        static std::remove_cvref_t<A> ConvertArgument(const TypeDescriptor& self, std::optional<BoundValue>& slot, UIntSize index)
        {
            using Value                          = std::remove_cvref_t<A>;
            const ParameterDescriptor& parameter = self.Parameters()[index];
            if (!slot)
            {
                if constexpr (IsOptionalMember<Value>)
                    return Value {};
                else
                    throw Exceptions::BindException(Serialization::ParseErrorCode::MissingMember,
                                                    "No value for required parameter \"" + parameter.name + "\" of " + self.Name(),
                                                    self.Name(),
                                                    parameter.name);
            }
            return ValueConverter<Value>::Convert(*slot, ConversionContext {self.Name(), parameter.name});
        }

        TypeDescriptor& m_descriptor;
    };

    template<Reflectable T>
    const TypeDescriptor& DescriptorOf()
    {
        static_assert(std::is_copy_constructible_v<T>, "Bound types are stored by value and must be copy constructible");

        static const TypeDescriptor descriptor = [] {
            TypeDescriptor result {std::string(TypeSchema<T>::Name)};
            TypeBuilder<T> builder {result};
            TypeSchema<T>::Describe(builder);
            return result;
        }();
        return descriptor;
    }
}// namespace JBind::Binding
