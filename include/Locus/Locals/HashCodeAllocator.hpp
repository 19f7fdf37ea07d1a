/// @file HashCodeAllocator.hpp
/// @brief Generator of identity hash codes for owner-table handles.
///
/// Codes advance by a fixed odd increment, so the first 2^k codes drawn from one generator hit
/// every slot of a 2^k table exactly once; consecutive handles therefore rarely collide.
#pragma once

#include <Locus/Defines.hpp>
#include <Locus/Primitives.hpp>

#include <atomic>

namespace Locus::Locals
{
    class HashCodeAllocator
    {
    public:
        /// Fractional part of the golden ratio scaled to 32 bits (odd).
        static constexpr UInt32 kHashIncrement = 0x61c88647u;

        constexpr HashCodeAllocator() noexcept = default;
        explicit constexpr HashCodeAllocator(UInt32 seed) noexcept : m_counter(seed) {}

        HashCodeAllocator(const HashCodeAllocator&)            = delete;
        HashCodeAllocator& operator=(const HashCodeAllocator&) = delete;

        /// @brief The process-wide generator used by handles created without an explicit source.
        [[nodiscard]] LOCUS_BASE_API static HashCodeAllocator& Global() noexcept;

        /// @brief Advance the counter by kHashIncrement and return the new value (wraps mod 2^32).
        [[nodiscard]] UInt32 Allocate() noexcept
        {
            return m_counter.fetch_add(kHashIncrement, std::memory_order_relaxed) + kHashIncrement;
        }

        /// @brief Last value handed out (the seed if none yet).
        [[nodiscard]] UInt32 Peek() const noexcept { return m_counter.load(std::memory_order_relaxed); }

    private:
        std::atomic<UInt32> m_counter {0};
    };
}// namespace Locus::Locals
