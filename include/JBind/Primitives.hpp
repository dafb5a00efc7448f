// Fundamental type definitions shared by every JBind module.
#pragma once
#include <cstddef>
#include <cstdint>

namespace JBind
{
    /// @brief Represents a 32-bit unsigned integer.
    using UInt32 = std::uint32_t;
    /// @brief Represents an 8-bit unsigned integer.
    using UInt8 = std::uint8_t;

    /// @brief Represents a 64-bit signed integer. JSON integers are carried at this width.
    using Int64 = std::int64_t;

    /// @brief Represents a 64-bit floating point number. JSON floats are carried at this width.
    using F64 = double;

    using UIntSize = std::size_t;
}// namespace JBind
