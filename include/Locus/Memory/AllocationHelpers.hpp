/// @file AllocationHelpers.hpp
/// @brief Typed allocation on top of `AllocatorConcept`, reporting exhaustion as `std::bad_alloc`.
#pragma once

#include <cstring>
#include <limits>
#include <new>
#include <type_traits>
#include <utility>

#include <Locus/Memory/AllocatorConcept.hpp>

namespace Locus::Memory
{
    /// @brief Allocate one T from @p alloc and construct it in place.
    /// @throws std::bad_alloc when the allocator returns null. A throwing constructor gives the
    ///         storage back before the exception propagates.
    template<AllocatorConcept A, class T, class... Args>
    [[nodiscard]] T* AllocateObject(A& alloc, Args&&... args)
    {
        void* mem = alloc.Allocate(sizeof(T), alignof(T));
        if (!mem)
            throw std::bad_alloc();
        try
        {
            return ::new (mem) T(std::forward<Args>(args)...);
        } catch (...)
        {
            alloc.Deallocate(mem, sizeof(T), alignof(T));
            throw;
        }
    }

    template<AllocatorConcept A, class T>
    void DeallocateObject(A& alloc, T* ptr) noexcept(std::is_nothrow_destructible_v<T>)
    {
        if (!ptr)
            return;
        ptr->~T();
        alloc.Deallocate(ptr, sizeof(T), alignof(T));
    }

    /// @brief Zero-filled storage for @p count objects of an implicit-lifetime T (no constructors run).
    /// @throws std::bad_alloc if the byte count overflows or the allocator returns null.
    template<class T, AllocatorConcept A>
    [[nodiscard]] T* AllocateZeroed(A& alloc, std::size_t count)
    {
        static_assert(std::is_trivially_default_constructible_v<T> && std::is_trivially_destructible_v<T>);
        if (count > std::numeric_limits<std::size_t>::max() / sizeof(T))
            throw std::bad_alloc();
        const std::size_t bytes = count * sizeof(T);
        void*             mem   = alloc.Allocate(bytes, alignof(T));
        if (!mem)
            throw std::bad_alloc();
        std::memset(mem, 0, bytes);
        return static_cast<T*>(mem);
    }

    template<class T, AllocatorConcept A>
    void DeallocateZeroed(A& alloc, T* ptr, std::size_t count) noexcept
    {
        alloc.Deallocate(ptr, count * sizeof(T), alignof(T));
    }
}// namespace Locus::Memory
