#include <JBind/Binding/ObjectFactory.hpp>

#include <JBind/Exceptions/BindException.hpp>

#include <string>
#include <utility>
#include <vector>

namespace JBind::Binding
{
    namespace
    {
        [[nodiscard]] std::string JoinNames(const std::vector<std::string>& names)
        {
            std::string joined;
            for (const std::string& name: names)
            {
                if (!joined.empty())
                    joined += ", ";
                joined += name;
            }
            return joined;
        }
    }// namespace

    BoundObject ObjectFactory::Create(const TypeDescriptor& type, BoundMembers members)
    {
        const bool supplied = !members.Empty();

        BoundObject object {&type, Construct(type, members)};
        if (supplied)
            AssignFields(type, object.instance, members);
        return object;
    }

    const TypeDescriptor* ObjectFactory::DeclaredTypeOf(const TypeDescriptor& type, std::string_view name)
    {
        const TypeDescriptor* declared = type.DeclaredTypeOfConstructorParameter(name);
        if (declared && declared->IsConstructible())
            return declared;

        declared = type.DeclaredTypeOfField(name);
        return declared && declared->IsConstructible() ? declared : nullptr;
    }

    std::any ObjectFactory::Construct(const TypeDescriptor& type, BoundMembers& members)
    {
        if (!type.HasConstructor())
            return type.ConstructInstance({});

        if (!type.IsConstructorAccessible())
        {
            throw Exceptions::BindException(Serialization::ParseErrorCode::ConstructionNotAllowed,
                                            "Can't construct " + type.Name() + " because its constructor is not public",
                                            type.Name());
        }

        const std::vector<std::string> supplied = members.Names();

        TypeDescriptor::Arguments arguments;
        arguments.reserve(type.Parameters().size());
        for (const ParameterDescriptor& parameter: type.Parameters())
        {
            std::optional<BoundValue> value = members.Take(parameter.name);
            if (!value && !parameter.optional)
            {
                throw Exceptions::BindException(Serialization::ParseErrorCode::MissingMember,
                                                "The constructor of " + type.Name() + " requires a parameter named \"" + parameter.name +
                                                        "\", but none was provided. The provided members are: " + JoinNames(supplied),
                                                type.Name(),
                                                parameter.name,
                                                supplied);
            }
            arguments.push_back(std::move(value));
        }
        return type.ConstructInstance(std::move(arguments));
    }

    void ObjectFactory::AssignFields(const TypeDescriptor& type, std::any& instance, const BoundMembers& members)
    {
        for (const FieldDescriptor& field: type.Fields())
        {
            if (const BoundValue* value = members.Find(field.name))
                type.AssignField(instance, field.name, *value);
        }
    }
}// namespace JBind::Binding
