#pragma once

#include <JBind/Defines.hpp>
#include <JBind/Primitives.hpp>
#include <JBind/Serialization/JSON/JsonTypes.hpp>

#include <any>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace JBind::Binding
{
    class TypeDescriptor;
    class BoundValue;

    /// @brief Instance of a described type, produced by `ObjectFactory`.
    struct BoundObject
    {
        const TypeDescriptor* type {nullptr};
        std::any              instance {};
    };

    using BoundList = std::vector<BoundValue>;

    /// @brief Result of a typed parse: an untyped node, a bound instance, or a list of either.
    class JBIND_API BoundValue
    {
    public:
        enum class Kind : UInt8
        {
            Json,
            Object,
            List,
        };

        BoundValue() = default;

        static BoundValue FromJson(Serialization::JsonValue value);
        static BoundValue FromObject(BoundObject object);
        static BoundValue FromList(BoundList values);

        [[nodiscard]] Kind GetKind() const noexcept { return m_kind; }
        [[nodiscard]] bool IsJson() const noexcept { return m_kind == Kind::Json; }
        [[nodiscard]] bool IsObject() const noexcept { return m_kind == Kind::Object; }
        [[nodiscard]] bool IsList() const noexcept { return m_kind == Kind::List; }

        [[nodiscard]] const Serialization::JsonValue& AsJson() const noexcept { return *std::get_if<Serialization::JsonValue>(&m_payload); }
        [[nodiscard]] const BoundObject&              AsObject() const noexcept { return *std::get_if<BoundObject>(&m_payload); }
        [[nodiscard]] const BoundList&                AsList() const noexcept { return **std::get_if<std::shared_ptr<const BoundList>>(&m_payload); }

        /// @brief True when this is a bound object built from `type`.
        [[nodiscard]] bool IsInstanceOf(const TypeDescriptor& type) const noexcept;

        /// @brief Short description for diagnostics, e.g. `integer` or `instance of Person`.
        [[nodiscard]] std::string Describe() const;

    private:
        using Payload = std::variant<Serialization::JsonValue, BoundObject, std::shared_ptr<const BoundList>>;

        Kind    m_kind {Kind::Json};
        Payload m_payload {};
    };

    /// @brief Named value collected from a JSON object, waiting to be bound.
    struct BoundMember
    {
        std::string name {};
        BoundValue  value {};
    };

    /// @brief Ordered member mapping handed to `ObjectFactory`.
    ///
    /// Keeps the same policy as `JsonObject`: a repeated name keeps its first position and takes the last value.
    class JBIND_API BoundMembers
    {
    public:
        void Set(std::string name, BoundValue value);

        [[nodiscard]] const BoundValue* Find(std::string_view name) const noexcept;

        /// @brief Remove a member and return its value, or `std::nullopt` when absent.
        std::optional<BoundValue> Take(std::string_view name);

        [[nodiscard]] bool     Empty() const noexcept { return m_members.empty(); }
        [[nodiscard]] UIntSize Size() const noexcept { return m_members.size(); }

        [[nodiscard]] std::vector<std::string> Names() const;

        [[nodiscard]] auto begin() const noexcept { return m_members.begin(); }
        [[nodiscard]] auto end() const noexcept { return m_members.end(); }

    private:
        std::vector<BoundMember> m_members;
    };
}// namespace JBind::Binding
