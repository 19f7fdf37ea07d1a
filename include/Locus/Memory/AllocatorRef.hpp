/// @file AllocatorRef.hpp
/// @brief Non-owning reference wrapper that adapts an allocator instance to `AllocatorConcept`.
#pragma once

#include <cstddef>

#include <Locus/Memory/AllocatorConcept.hpp>

namespace Locus::Memory
{
    /// @brief Lets several containers draw from one stateful allocator.
    /// The referenced allocator must outlive every container holding the reference.
    template<AllocatorConcept A>
    class AllocatorRef
    {
    public:
        explicit AllocatorRef(A& a) noexcept : m_target(&a) {}

        [[nodiscard]] void* Allocate(std::size_t n, std::size_t a) noexcept { return m_target->Allocate(n, a); }
        void                Deallocate(void* p, std::size_t n, std::size_t a) noexcept { m_target->Deallocate(p, n, a); }

        [[nodiscard]] std::size_t MaxSize() const noexcept { return AllocatorTraits<A>::MaxSize(*m_target); }

        [[nodiscard]] A& Target() const noexcept { return *m_target; }

    private:
        A* m_target;
    };
}// namespace Locus::Memory
