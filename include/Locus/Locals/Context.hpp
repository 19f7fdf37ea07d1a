/// @file Context.hpp
/// @brief Per-context storage facade over `OwnerTable`: the explicit replacement for an ambient
///        "current thread" lookup.
///
/// A context keeps two tables, both created on first insertion:
/// - the plain table for handles without an inheritance capability;
/// - the inheritable table, which is what `Spawn()` copies into a child.
/// A context is owned by exactly one execution context and is not synchronized.
#pragma once

#include <Locus/Locals/Handle.hpp>
#include <Locus/Locals/InheritanceCopier.hpp>
#include <Locus/Locals/OwnerTable.hpp>
#include <Locus/Memory/AllocatorConcept.hpp>
#include <Locus/Memory/SmartPointers.hpp>
#include <Locus/Memory/SystemAllocator.hpp>

#include <concepts>
#include <optional>
#include <stdexcept>
#include <utility>

namespace Locus::Locals
{
    template<class Value, Memory::AllocatorConcept AllocatorType = Memory::SystemAllocator>
    class Context
    {
    public:
        using HandleType = Handle<Value>;
        using TableType  = OwnerTable<Value, AllocatorType>;

        Context()
            requires std::default_initializable<AllocatorType>
            : Context(AllocatorType {})
        {
        }

        explicit Context(const AllocatorType& allocator)
            : m_allocator(allocator), m_plain(nullptr, allocator), m_inheritable(nullptr, allocator)
        {
        }

        Context(const Context&)            = delete;
        Context& operator=(const Context&) = delete;
        Context(Context&&) noexcept        = default;
        Context& operator=(Context&&)      = default;

        /// @brief A new context whose inheritable values are derived from @p parent's.
        ///
        /// The parent must not be mutated while the snapshot is taken; the child is fully
        /// independent afterwards.
        [[nodiscard]] static Context Spawn(const Context& parent)
        {
            Context child(parent.m_allocator);
            if (const TableType* snapshot = parent.Snapshot())
                child.m_inheritable = Memory::MakeScoped<TableType>(child.m_allocator, InheritanceCopier::Copy(*snapshot));
            return child;
        }

        /// @brief The stored value, or the handle's initial value (which is then stored).
        /// @return Empty only for a handle without an initializer that has no value here.
        /// @throws std::invalid_argument for an empty handle, as Set() does.
        [[nodiscard]] std::optional<Value> Get(const HandleType& handle)
        {
            if (!handle)
                throw std::invalid_argument("Context::Get requires a non-empty handle");
            if (Value* stored = Find(handle))
                return *stored;
            std::optional<Value> initial = handle.InitialValue();
            if (initial)
                Set(handle, *initial);
            return initial;
        }

        /// @brief The stored value without materialising anything; nullptr if absent.
        [[nodiscard]] Value* Find(const HandleType& handle)
        {
            TableType* table = TableFor_(handle);
            return table ? table->GetPtr(handle) : nullptr;
        }

        void Set(const HandleType& handle, Value value)
        {
            auto& slot = SlotFor_(handle);
            if (slot)
                slot->Set(handle, std::move(value));
            else
                slot = Memory::MakeScoped<TableType>(m_allocator, handle, std::move(value), m_allocator);
        }

        void Remove(const HandleType& handle)
        {
            if (TableType* table = TableFor_(handle))
                table->Remove(handle);
        }

        /// @brief Expunge every stale entry from both tables.
        void ExpungeStaleEntries()
        {
            if (m_plain)
                m_plain->ExpungeStaleEntries();
            if (m_inheritable)
                m_inheritable->ExpungeStaleEntries();
        }

        /// @brief The table a child context inherits from; nullptr until an inheritable value is stored.
        [[nodiscard]] const TableType* Snapshot() const noexcept { return m_inheritable.Get(); }

        /// @brief The table holding non-inheritable values; nullptr until one is stored.
        [[nodiscard]] const TableType* Locals() const noexcept { return m_plain.Get(); }

    private:
        using TableSlot = Memory::Scoped<TableType, AllocatorType>;

        [[nodiscard]] TableSlot& SlotFor_(const HandleType& handle) noexcept
        {
            return handle.IsInheritable() ? m_inheritable : m_plain;
        }

        [[nodiscard]] TableType* TableFor_(const HandleType& handle) noexcept { return SlotFor_(handle).Get(); }

        [[no_unique_address]] AllocatorType m_allocator;

        TableSlot m_plain;
        TableSlot m_inheritable;
    };
}// namespace Locus::Locals
