#include <JBind/Serialization/JSON/JsonTypes.hpp>

#include <algorithm>

namespace JBind::Serialization
{
    JsonValue JsonValue::MakeArray(JsonArray array)
    {
        JsonValue v;
        v.m_type    = Type::Array;
        v.m_payload = std::shared_ptr<const JsonArray>(std::make_shared<JsonArray>(std::move(array)));
        return v;
    }

    JsonValue JsonValue::MakeObject(JsonObject object)
    {
        JsonValue v;
        v.m_type    = Type::Object;
        v.m_payload = std::shared_ptr<const JsonObject>(std::make_shared<JsonObject>(std::move(object)));
        return v;
    }

    bool operator==(const JsonValue& lhs, const JsonValue& rhs) noexcept
    {
        if (lhs.GetType() != rhs.GetType())
            return false;

        switch (lhs.GetType())
        {
            case JsonValue::Type::Null:
                return true;
            case JsonValue::Type::Bool:
                return lhs.AsBool() == rhs.AsBool();
            case JsonValue::Type::Integer:
                return lhs.AsInteger() == rhs.AsInteger();
            case JsonValue::Type::Float:
                return lhs.AsFloat() == rhs.AsFloat();
            case JsonValue::Type::String:
                return lhs.AsString() == rhs.AsString();
            case JsonValue::Type::Array:
                return lhs.AsArray().values == rhs.AsArray().values;
            case JsonValue::Type::Object:
            {
                const auto& left  = lhs.AsObject().members;
                const auto& right = rhs.AsObject().members;
                return std::equal(left.begin(), left.end(), right.begin(), right.end(), [](const JsonMember& a, const JsonMember& b) {
                    return a.name == b.name && a.value == b.value;
                });
            }
        }
        return false;
    }

    std::string_view ToString(JsonValue::Type type) noexcept
    {
        switch (type)
        {
            case JsonValue::Type::Null:
                return "null";
            case JsonValue::Type::Bool:
                return "bool";
            case JsonValue::Type::Integer:
                return "integer";
            case JsonValue::Type::Float:
                return "float";
            case JsonValue::Type::String:
                return "string";
            case JsonValue::Type::Array:
                return "array";
            case JsonValue::Type::Object:
                return "object";
        }
        return "unknown";
    }

    const JsonValue* JsonObject::Find(std::string_view key) const noexcept
    {
        for (const JsonMember& member: members)
        {
            if (member.name == key)
                return &member.value;
        }
        return nullptr;
    }

    void JsonObject::Set(std::string key, JsonValue value)
    {
        for (JsonMember& member: members)
        {
            if (member.name == key)
            {
                member.value = std::move(value);
                return;
            }
        }
        members.push_back(JsonMember {std::move(key), std::move(value)});
    }
}// namespace JBind::Serialization
