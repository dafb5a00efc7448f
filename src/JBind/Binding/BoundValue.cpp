#include <JBind/Binding/BoundValue.hpp>

#include <JBind/Binding/TypeDescriptor.hpp>
#include <JBind/Binding/ValueConverter.hpp>
#include <JBind/Exceptions/BindException.hpp>

#include <algorithm>

namespace JBind::Binding
{
    BoundValue BoundValue::FromJson(Serialization::JsonValue value)
    {
        BoundValue v;
        v.m_kind    = Kind::Json;
        v.m_payload = std::move(value);
        return v;
    }

    BoundValue BoundValue::FromObject(BoundObject object)
    {
        BoundValue v;
        v.m_kind    = Kind::Object;
        v.m_payload = std::move(object);
        return v;
    }

    BoundValue BoundValue::FromList(BoundList values)
    {
        BoundValue v;
        v.m_kind    = Kind::List;
        v.m_payload = std::shared_ptr<const BoundList>(std::make_shared<BoundList>(std::move(values)));
        return v;
    }

    bool BoundValue::IsInstanceOf(const TypeDescriptor& type) const noexcept
    {
        return IsObject() && AsObject().type == &type;
    }

    std::string BoundValue::Describe() const
    {
        switch (m_kind)
        {
            case Kind::Json:
                return std::string(Serialization::ToString(AsJson().GetType()));
            case Kind::Object:
                return "instance of " + (AsObject().type ? AsObject().type->Name() : std::string("unknown type"));
            case Kind::List:
                return "list";
        }
        return "unknown";
    }

    void BoundMembers::Set(std::string name, BoundValue value)
    {
        for (BoundMember& member: m_members)
        {
            if (member.name == name)
            {
                member.value = std::move(value);
                return;
            }
        }
        m_members.push_back(BoundMember {std::move(name), std::move(value)});
    }

    const BoundValue* BoundMembers::Find(std::string_view name) const noexcept
    {
        for (const BoundMember& member: m_members)
        {
            if (member.name == name)
                return &member.value;
        }
        return nullptr;
    }

    std::optional<BoundValue> BoundMembers::Take(std::string_view name)
    {
        const auto it = std::find_if(m_members.begin(), m_members.end(), [name](const BoundMember& member) { return member.name == name; });
        if (it == m_members.end())
            return std::nullopt;

        BoundValue value = std::move(it->value);
        m_members.erase(it);
        return value;
    }

    std::vector<std::string> BoundMembers::Names() const
    {
        std::vector<std::string> names;
        names.reserve(m_members.size());
        for (const BoundMember& member: m_members)
            names.push_back(member.name);
        return names;
    }

    void ThrowConversionError(const ConversionContext& context, std::string_view expected, const BoundValue& actual)
    {
        std::string message = "Expected " + std::string(expected) + " but got " + actual.Describe();
        if (!context.memberName.empty())
            message += " for member \"" + std::string(context.memberName) + "\"";
        if (!context.typeName.empty())
            message += " of " + std::string(context.typeName);

        throw Exceptions::BindException(Serialization::ParseErrorCode::TypeMismatch,
                                        std::move(message),
                                        std::string(context.typeName),
                                        std::string(context.memberName));
    }
}// namespace JBind::Binding
