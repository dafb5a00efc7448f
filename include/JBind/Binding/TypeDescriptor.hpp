#pragma once

#include <JBind/Binding/BoundValue.hpp>
#include <JBind/Defines.hpp>

#include <any>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace JBind::Binding
{
    class TypeDescriptor;

    template<typename T>
    class TypeBuilder;

    /// @brief Lazily resolves the descriptor of a nested type. Null when the declared type has no schema.
    using TypeResolver = const TypeDescriptor* (*)();

    /// @brief Constructor parameter: name, declared nested type and whether it may be omitted.
    struct ParameterDescriptor
    {
        std::string  name {};
        TypeResolver type {nullptr};
        bool         optional {false};
    };

    /// @brief Directly assignable data member.
    struct FieldDescriptor
    {
        using AssignFn = std::function<void(const TypeDescriptor& owner, std::any& instance, const BoundValue& value)>;

        std::string  name {};
        TypeResolver type {nullptr};
        AssignFn     assign {};
    };

    /// @brief Runtime schema of one bindable C++ type.
    ///
    /// Descriptors are produced by `DescriptorOf<T>()` from a `TypeSchema<T>` specialization and live for the
    /// rest of the program. They answer the questions the typed parser and `ObjectFactory` need: which type a
    /// member is declared as, how to construct an instance from ordered arguments, and how to set a field.
    class JBIND_API TypeDescriptor
    {
    public:
        using Arguments          = std::vector<std::optional<BoundValue>>;
        using ConstructFn        = std::function<std::any(const TypeDescriptor& self, Arguments& arguments)>;
        using DefaultConstructFn = std::function<std::any()>;

        explicit TypeDescriptor(std::string name)
            : m_name(std::move(name))
        {
        }

        [[nodiscard]] const std::string& Name() const noexcept { return m_name; }

        /// @brief True when the schema declares a constructor; otherwise instances are default-constructed.
        [[nodiscard]] bool HasConstructor() const noexcept { return m_hasConstructor; }

        /// @brief False when the declared constructor cannot be called from outside the type.
        [[nodiscard]] bool IsConstructorAccessible() const noexcept { return m_constructorAccessible; }

        [[nodiscard]] bool IsDefaultConstructible() const noexcept { return static_cast<bool>(m_defaultConstruct); }

        /// @brief True when `ObjectFactory` can produce an instance through this descriptor.
        [[nodiscard]] bool IsConstructible() const noexcept
        {
            return m_hasConstructor ? m_constructorAccessible : IsDefaultConstructible();
        }

        [[nodiscard]] const std::vector<ParameterDescriptor>& Parameters() const noexcept { return m_parameters; }
        [[nodiscard]] const std::vector<FieldDescriptor>&     Fields() const noexcept { return m_fields; }

        [[nodiscard]] const ParameterDescriptor* FindParameter(std::string_view name) const noexcept;
        [[nodiscard]] const FieldDescriptor*     FindField(std::string_view name) const noexcept;

        /// @brief Declared type of the constructor parameter `name`, if it has a schema.
        [[nodiscard]] const TypeDescriptor* DeclaredTypeOfConstructorParameter(std::string_view name) const;

        /// @brief Declared type of the field `name`, if it has a schema.
        [[nodiscard]] const TypeDescriptor* DeclaredTypeOfField(std::string_view name) const;

        /// @brief Build an instance from arguments ordered like `Parameters()`.
        ///
        /// An empty slot is only valid for an optional parameter.
        /// @throws Exceptions::BindException with `ConstructionNotAllowed` when the type cannot be constructed.
        [[nodiscard]] std::any ConstructInstance(Arguments arguments) const;

        /// @brief Overwrite field `name` of `instance`, bypassing any setter the type may have.
        void AssignField(std::any& instance, std::string_view name, const BoundValue& value) const;

    private:
        template<typename T>
        friend class TypeBuilder;

        std::string                      m_name;
        bool                             m_hasConstructor {false};
        bool                             m_constructorAccessible {false};
        std::vector<ParameterDescriptor> m_parameters {};
        ConstructFn                      m_construct {};
        DefaultConstructFn               m_defaultConstruct {};
        std::vector<FieldDescriptor>     m_fields {};
    };
}// namespace JBind::Binding
