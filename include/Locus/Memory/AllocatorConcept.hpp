/// @file AllocatorConcept.hpp
/// @brief The allocator interface Locus tables and smart pointers are written against.
#pragma once

#include <concepts>
#include <cstddef>
#include <limits>

namespace Locus::Memory
{
    /// @brief Raw byte allocation with explicit size and alignment.
    ///
    /// `Allocate` returns null when the request cannot be satisfied; callers turn that into
    /// `std::bad_alloc`. `Deallocate` must not throw and may ignore its size and alignment.
    template<class A>
    concept AllocatorConcept =
            requires(A a, std::size_t n, std::size_t align, void* p) {
                { a.Allocate(n, align) } -> std::same_as<void*>;
                { a.Deallocate(p, n, align) } noexcept;
            };

    /// Allocators may advertise the largest request they can ever serve.
    template<class A>
    concept AllocatorReportsMaxSize =
            requires(const A a) {
                { a.MaxSize() } -> std::same_as<std::size_t>;
            };

    template<class A>
    struct AllocatorTraits
    {
        /// Unbounded when the allocator does not say otherwise.
        static std::size_t MaxSize(const A& allocator) noexcept
        {
            if constexpr (AllocatorReportsMaxSize<A>)
                return allocator.MaxSize();
            else
                return std::numeric_limits<std::size_t>::max();
        }
    };
}// namespace Locus::Memory
