/// @file SystemAllocator.hpp
/// @brief Stateless allocator over the platform's aligned heap.
#pragma once

#include <bit>
#include <cstddef>
#include <cstdlib>
#include <limits>

#include <Locus/Primitives.hpp>

namespace Locus::Memory
{
    /// @brief Default allocator for tables and handle control blocks.
    ///
    /// Zero-byte requests yield null. Alignments that are not a power of two fall back to
    /// `alignof(std::max_align_t)`.
    struct SystemAllocator
    {
        [[nodiscard]] void* Allocate(UIntSize size, UIntSize alignment) noexcept
        {
            if (size == 0)
                return nullptr;
            return AlignedAlloc_(size, std::has_single_bit(alignment) ? alignment : alignof(std::max_align_t));
        }

        void Deallocate(void* ptr, UIntSize, UIntSize) noexcept
        {
            if (ptr)
                AlignedFree_(ptr);
        }

        [[nodiscard]] constexpr UIntSize MaxSize() const noexcept { return std::numeric_limits<UIntSize>::max(); }

    private:
        static void* AlignedAlloc_(UIntSize size, UIntSize alignment) noexcept
        {
#if defined(_WIN32) || defined(_WIN64)
            return _aligned_malloc(size, alignment);
#else
            void* p = nullptr;
            // posix_memalign needs at least pointer alignment.
            return posix_memalign(&p, alignment < sizeof(void*) ? sizeof(void*) : alignment, size) == 0 ? p : nullptr;
#endif
        }

        static void AlignedFree_(void* ptr) noexcept
        {
#if defined(_WIN32) || defined(_WIN64)
            _aligned_free(ptr);
#else
            std::free(ptr);
#endif
        }
    };
}// namespace Locus::Memory
