/// @file InheritanceCopier.hpp
/// @brief Builds a child context's table from a snapshot of its parent's.
#pragma once

#include <Locus/Locals/OwnerTable.hpp>
#include <Locus/Memory/AllocatorConcept.hpp>

namespace Locus::Locals
{
    /// @brief Produces an independent child table holding `ChildValue(v)` for every live parent entry.
    ///
    /// The child has the parent's capacity and allocator. Stale parent entries are skipped. Each
    /// child entry is placed by plain linear probing from its natural index; no cleanup or growth
    /// runs while copying. The parent is only read, so the caller must ensure the parent context is
    /// not mutating its table concurrently.
    class InheritanceCopier
    {
    public:
        /// @throws Exceptions::NotSupportedException if a live parent entry's handle is not inheritable.
        /// @throws Any exception raised by an inheritance transform; the partial child is discarded.
        template<class Value, Memory::AllocatorConcept AllocatorType>
        [[nodiscard]] static OwnerTable<Value, AllocatorType> Copy(const OwnerTable<Value, AllocatorType>& parent)
        {
            OwnerTable<Value, AllocatorType> child(parent.Capacity(), parent.GetAllocator());
            parent.ForEachLive([&child](const Handle<Value>& key, const Value& value) {
                child.InsertFresh_(key, key.ChildValue(value));
            });
            child.Validate_();
            return child;
        }
    };
}// namespace Locus::Locals
