/// @file Primitives.hpp
/// @brief Integer aliases used across Locus.
#pragma once

#include <cstddef>
#include <cstdint>

namespace Locus
{
    using UInt8  = std::uint8_t;
    using UInt32 = std::uint32_t;///< identity hash codes wrap modulo 2^32

    using UIntSize = std::size_t;
}// namespace Locus
