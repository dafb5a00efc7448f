#pragma once

#include <JBind/Async/Generator.hpp>
#include <JBind/Exceptions/ParseException.hpp>
#include <JBind/Primitives.hpp>

#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace JBind::Serialization
{
    /// @brief Describes which element value a lookahead source must never produce.
    ///
    /// The cursor reports exhaustion as "no element", so a source that yields the value the
    /// element type uses for "nothing" is broken. For characters that value is `'\0'`, the same
    /// end-of-input marker `InputCursor`-style readers hand out.
    template<typename T>
    struct LookaheadTraits
    {
        static constexpr bool IsReserved(const T&) noexcept { return false; }
    };

    template<>
    struct LookaheadTraits<char>
    {
        static constexpr bool IsReserved(char c) noexcept { return c == '\0'; }
    };

    template<typename T>
    struct LookaheadTraits<T*>
    {
        static constexpr bool IsReserved(const T* ptr) noexcept { return ptr == nullptr; }
    };

    /// @brief One-element lookahead window over a single-pass `Generator`.
    ///
    /// Construction draws two elements: the current one and the pre-fetched one. Every `Advance()` shifts the
    /// window and draws exactly one more. Each real element is appended to a history log that is only used for
    /// diagnostics (for example turning an offset into a line and column); it grows with the input, which is fine
    /// because the whole document is already in memory.
    template<typename T>
    class LookaheadCursor
    {
    public:
        explicit LookaheadCursor(Async::Generator<T> source)
            : m_source(std::move(source))
        {
            m_current = Pull();
            Record(m_current);
            m_next = Pull();
        }

        LookaheadCursor(const LookaheadCursor&)            = delete;
        LookaheadCursor& operator=(const LookaheadCursor&) = delete;

        /// @brief Current element, or null once the source is exhausted.
        [[nodiscard]] const T* Current() const noexcept { return m_current ? &*m_current : nullptr; }

        /// @brief Element after the current one, or null.
        [[nodiscard]] const T* Peek() const noexcept { return m_next ? &*m_next : nullptr; }

        [[nodiscard]] bool IsEof() const noexcept { return !m_current.has_value(); }

        void Advance()
        {
            m_current = std::move(m_next);
            Record(m_current);
            m_next = Pull();
            ++m_position;
        }

        /// @brief Number of `Advance()` calls so far. Equals the zero-based index of the current element.
        [[nodiscard]] UIntSize Position() const noexcept { return m_position; }

        [[nodiscard]] std::span<const T> History() const noexcept { return {m_history.data(), m_history.size()}; }

    private:
        std::optional<T> Pull()
        {
            std::optional<T> value = m_source.Next();
            if (!value)
                return value;
            if (LookaheadTraits<T>::IsReserved(*value))
            {
                throw Exceptions::ParseException(ParseErrorCode::InternalConsistency,
                                                 "Lookahead source produced the reserved end-of-input value",
                                                 ParseLocation {m_pulled, 0, 0});
            }
            ++m_pulled;
            return value;
        }

        void Record(const std::optional<T>& value)
        {
            if (value)
                m_history.push_back(*value);
        }

        Async::Generator<T> m_source;
        std::optional<T>    m_current {};
        std::optional<T>    m_next {};
        UIntSize            m_position {0};
        UIntSize            m_pulled {0};
        std::vector<T>      m_history {};
    };
}// namespace JBind::Serialization
