#pragma once

#include <JBind/Defines.hpp>
#include <JBind/Primitives.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace JBind::Serialization
{
    struct JsonArray;
    struct JsonObject;

    /// @brief Untyped JSON value node with shared, immutable arrays/objects.
    ///
    /// Integers and floats are distinct kinds: `1` parses as `Integer`, `1.0` as `Float`.
    class JBIND_API JsonValue
    {
    public:
        enum class Type : UInt8
        {
            Null,
            Bool,
            Integer,
            Float,
            String,
            Array,
            Object,
        };

        JsonValue() noexcept = default;

        static JsonValue MakeNull() noexcept
        {
            return JsonValue {};
        }

        static JsonValue MakeBool(bool value) noexcept
        {
            JsonValue v;
            v.m_type    = Type::Bool;
            v.m_payload = value;
            return v;
        }

        static JsonValue MakeInteger(Int64 value) noexcept
        {
            JsonValue v;
            v.m_type    = Type::Integer;
            v.m_payload = value;
            return v;
        }

        static JsonValue MakeFloat(F64 value) noexcept
        {
            JsonValue v;
            v.m_type    = Type::Float;
            v.m_payload = value;
            return v;
        }

        static JsonValue MakeString(std::string value)
        {
            JsonValue v;
            v.m_type    = Type::String;
            v.m_payload = std::move(value);
            return v;
        }

        static JsonValue MakeArray(JsonArray array);
        static JsonValue MakeObject(JsonObject object);

        [[nodiscard]] Type GetType() const noexcept { return m_type; }

        [[nodiscard]] bool IsNull() const noexcept { return m_type == Type::Null; }
        [[nodiscard]] bool IsBool() const noexcept { return m_type == Type::Bool; }
        [[nodiscard]] bool IsInteger() const noexcept { return m_type == Type::Integer; }
        [[nodiscard]] bool IsFloat() const noexcept { return m_type == Type::Float; }
        [[nodiscard]] bool IsNumber() const noexcept { return IsInteger() || IsFloat(); }
        [[nodiscard]] bool IsString() const noexcept { return m_type == Type::String; }
        [[nodiscard]] bool IsArray() const noexcept { return m_type == Type::Array; }
        [[nodiscard]] bool IsObject() const noexcept { return m_type == Type::Object; }

        [[nodiscard]] bool               AsBool() const noexcept { return *std::get_if<bool>(&m_payload); }
        [[nodiscard]] Int64              AsInteger() const noexcept { return *std::get_if<Int64>(&m_payload); }
        [[nodiscard]] F64                AsFloat() const noexcept { return *std::get_if<F64>(&m_payload); }
        [[nodiscard]] const std::string& AsString() const noexcept { return *std::get_if<std::string>(&m_payload); }
        [[nodiscard]] const JsonArray&   AsArray() const noexcept { return **std::get_if<std::shared_ptr<const JsonArray>>(&m_payload); }
        [[nodiscard]] const JsonObject&  AsObject() const noexcept { return **std::get_if<std::shared_ptr<const JsonObject>>(&m_payload); }

        /// @brief Numeric value as F64 regardless of whether it was written as an integer or a float.
        [[nodiscard]] F64 AsNumber() const noexcept { return IsInteger() ? static_cast<F64>(AsInteger()) : AsFloat(); }

    private:
        using Payload = std::variant<std::monostate,
                                     bool,
                                     Int64,
                                     F64,
                                     std::string,
                                     std::shared_ptr<const JsonArray>,
                                     std::shared_ptr<const JsonObject>>;

        Type    m_type {Type::Null};
        Payload m_payload {};
    };

    /// @brief Deep structural comparison. Object member order is significant.
    [[nodiscard]] JBIND_API bool operator==(const JsonValue& lhs, const JsonValue& rhs) noexcept;

    /// @brief Readable name of a value kind, used in diagnostics.
    [[nodiscard]] JBIND_API std::string_view ToString(JsonValue::Type type) noexcept;

    /// @brief Name/value member for JSON objects.
    struct JsonMember
    {
        std::string name {};
        JsonValue   value {};
    };

    /// @brief JSON array container.
    struct JsonArray
    {
        std::vector<JsonValue> values;
    };

    /// @brief JSON object container. Members keep insertion order.
    struct JBIND_API JsonObject
    {
        [[nodiscard]] const JsonValue* Find(std::string_view key) const noexcept;
        [[nodiscard]] bool             Contains(std::string_view key) const noexcept { return Find(key) != nullptr; }

        /// @brief Insert or overwrite a member.
        ///
        /// A key seen before keeps its original position and takes the new value (last write wins).
        void Set(std::string key, JsonValue value);

        std::vector<JsonMember> members;
    };
}// namespace JBind::Serialization
