#include <JBind/Binding/TypeDescriptor.hpp>

#include <JBind/Exceptions/BindException.hpp>

namespace JBind::Binding
{
    const ParameterDescriptor* TypeDescriptor::FindParameter(std::string_view name) const noexcept
    {
        for (const ParameterDescriptor& parameter: m_parameters)
        {
            if (parameter.name == name)
                return &parameter;
        }
        return nullptr;
    }

    const FieldDescriptor* TypeDescriptor::FindField(std::string_view name) const noexcept
    {
        for (const FieldDescriptor& field: m_fields)
        {
            if (field.name == name)
                return &field;
        }
        return nullptr;
    }

    const TypeDescriptor* TypeDescriptor::DeclaredTypeOfConstructorParameter(std::string_view name) const
    {
        const ParameterDescriptor* parameter = FindParameter(name);
        return parameter && parameter->type ? parameter->type() : nullptr;
    }

    const TypeDescriptor* TypeDescriptor::DeclaredTypeOfField(std::string_view name) const
    {
        const FieldDescriptor* field = FindField(name);
        return field && field->type ? field->type() : nullptr;
    }

    std::any TypeDescriptor::ConstructInstance(Arguments arguments) const
    {
        if (!m_hasConstructor)
        {
            if (!m_defaultConstruct)
            {
                throw Exceptions::BindException(Serialization::ParseErrorCode::ConstructionNotAllowed,
                                                "Can't construct " + m_name + " because it declares no constructor and is not default constructible",
                                                m_name);
            }
            return m_defaultConstruct();
        }

        if (!m_constructorAccessible || !m_construct)
        {
            throw Exceptions::BindException(Serialization::ParseErrorCode::ConstructionNotAllowed,
                                            "Can't construct " + m_name + " because its constructor is not public",
                                            m_name);
        }

        arguments.resize(m_parameters.size());
        return m_construct(*this, arguments);
    }

    void TypeDescriptor::AssignField(std::any& instance, std::string_view name, const BoundValue& value) const
    {
        const FieldDescriptor* field = FindField(name);
        if (!field)
        {
            throw Exceptions::BindException(Serialization::ParseErrorCode::UnknownMember,
                                            m_name + " has no field named \"" + std::string(name) + "\"",
                                            m_name,
                                            std::string(name));
        }
        field->assign(*this, instance, value);
    }
}// namespace JBind::Binding
