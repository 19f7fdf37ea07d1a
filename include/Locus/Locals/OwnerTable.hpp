/// @file OwnerTable.hpp
/// @brief Open-addressing table from weakly held `Handle<V>` identities to values, owned by one context.
///
/// Semantics / constraints:
/// - Capacity is always a power of two; an entry's natural index is `hashCode & (capacity - 1)`.
/// - Linear probing with wraparound. Every live entry is reachable from its natural index without
///   crossing an empty slot, and at least one slot is always empty.
/// - Keys are weak. An entry whose handle died is *stale*: it still occupies its slot (and counts
///   towards `Size()`) until a later probe, cleanup scan or rehash expunges it. Expunging re-seats
///   the rest of the run so no live entry becomes unreachable.
/// - Not synchronized. Only the owning context may touch a table; handles must not die on another
///   thread while an operation is running.
/// - Entries move during expunge, stale replacement and growth, so pointers returned by
///   `GetPtr()` are invalidated by any later mutating call. `Value` must be nothrow-move-constructible.
#pragma once

#include <Locus/Defines.hpp>
#include <Locus/Exceptions/InvariantViolationException.hpp>
#include <Locus/Locals/Config.hpp>
#include <Locus/Locals/Handle.hpp>
#include <Locus/Memory/AllocationHelpers.hpp>
#include <Locus/Memory/AllocatorConcept.hpp>
#include <Locus/Memory/SystemAllocator.hpp>
#include <Locus/Primitives.hpp>

#include <bit>
#include <concepts>
#include <cstddef>
#include <iostream>
#include <limits>
#include <new>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace Locus::Locals
{
    class InheritanceCopier;

    enum class SlotState : UInt8
    {
        Empty,
        Live,
        Stale,
    };

    /// @brief Counters describing the maintenance work a table has performed.
    struct TableStatistics
    {
        std::size_t expungedEntries {0};  ///< stale entries cleared (including dead entries dropped by growth)
        std::size_t staleReplacements {0};///< inserts that reused a stale slot
        std::size_t cleanupScans {0};     ///< heuristic logarithmic scans started
        std::size_t rehashes {0};         ///< full stale passes triggered by the fill threshold
        std::size_t resizes {0};          ///< capacity doublings
    };

    template<class Value, Memory::AllocatorConcept AllocatorType = Memory::SystemAllocator>
    class OwnerTable
    {
    public:
        using value_type     = Value;
        using allocator_type = AllocatorType;
        using size_type      = std::size_t;
        using HandleType     = Handle<Value>;

        static constexpr size_type kInitialCapacity = LOCUS_LOCALS_INITIAL_CAPACITY;
        static constexpr size_type kNotFound        = static_cast<size_type>(-1);

        static_assert(std::is_nothrow_move_constructible_v<Value>,
                      "OwnerTable requires a nothrow move constructible Value (entries are relocated in place).");

        OwnerTable() : OwnerTable(kInitialCapacity) {}

        /// @brief Empty table with at least @p initialCapacity slots (rounded up to a power of two,
        ///        never below kInitialCapacity).
        explicit OwnerTable(size_type initialCapacity, const AllocatorType& allocator = AllocatorType {})
            : m_allocator(allocator)
        {
            Initialize_(initialCapacity);
        }

        /// @brief Table created for its first entry, placed directly at the handle's natural index.
        OwnerTable(const HandleType& firstKey, Value firstValue, const AllocatorType& allocator = AllocatorType {})
            : m_allocator(allocator)
        {
            RequireKey_(firstKey);
            Initialize_(kInitialCapacity);
            EmplaceAt_(IndexFor_(firstKey.HashCode()), firstKey, std::move(firstValue));
            m_size = 1;
        }

        OwnerTable(const OwnerTable&)            = delete;
        OwnerTable& operator=(const OwnerTable&) = delete;

        OwnerTable(OwnerTable&& other) noexcept
            : m_allocator(std::move(other.m_allocator)),
              m_slots(other.m_slots),
              m_capacity(other.m_capacity),
              m_mask(other.m_mask),
              m_size(other.m_size),
              m_threshold(other.m_threshold),
              m_stats(other.m_stats)
        {
            other.Detach_();
        }

        OwnerTable& operator=(OwnerTable&& other) noexcept
        {
            if (this == &other)
                return *this;
            ClearAndRelease_();
            m_allocator = std::move(other.m_allocator);
            m_slots     = other.m_slots;
            m_capacity  = other.m_capacity;
            m_mask      = other.m_mask;
            m_size      = other.m_size;
            m_threshold = other.m_threshold;
            m_stats     = other.m_stats;
            other.Detach_();
            return *this;
        }

        ~OwnerTable() { ClearAndRelease_(); }

        //--------------------------------------------------------------------------
        // Core ops
        //--------------------------------------------------------------------------

        /// @brief Value stored for @p key, or nullptr. Stale entries met on the probe path are expunged.
        [[nodiscard]] Value* GetPtr(const HandleType& key)
        {
            if (!key || !m_slots)
                return nullptr;
            const size_type i = IndexFor_(key.HashCode());
            if (m_slots[i].occupied && ResolveAt_(i) == key.Identity())
                return &ValueAt_(i);
            Value* found = GetAfterMiss_(key, i);
            Validate_();
            return found;
        }

        [[nodiscard]] std::optional<Value> TryGet(const HandleType& key)
            requires std::copy_constructible<Value>
        {
            if (Value* p = GetPtr(key))
                return *p;
            return std::nullopt;
        }

        [[nodiscard]] bool Contains(const HandleType& key) { return GetPtr(key) != nullptr; }

        /// @brief Insert or overwrite the value for @p key.
        /// @throws std::invalid_argument for an empty handle; std::bad_alloc if growth cannot allocate
        ///         (the entry itself is already stored when growth is attempted).
        void Set(const HandleType& key, const Value& value) { SetImpl_(key, value); }
        void Set(const HandleType& key, Value&& value) { SetImpl_(key, std::move(value)); }

        /// @brief Remove the entry for @p key. Absent keys are ignored.
        void Remove(const HandleType& key)
        {
            if (!key || !m_slots)
                return;
            for (size_type i = IndexFor_(key.HashCode()); m_slots[i].occupied; i = Next_(i))
            {
                if (ResolveAt_(i) == key.Identity())
                {
                    KeyAt_(i).Unlink();
                    ExpungeStaleEntry_(i);
                    Validate_();
                    return;
                }
            }
        }

        /// @brief Full pass expunging every stale entry. Does not change capacity.
        void ExpungeStaleEntries()
        {
            ExpungeStaleEntries_();
            Validate_();
        }

        //--------------------------------------------------------------------------
        // Capacity
        //--------------------------------------------------------------------------

        /// @brief Occupied slots, counting stale entries not yet expunged.
        [[nodiscard]] LOCUS_ALWAYS_INLINE size_type Size() const noexcept { return m_size; }
        [[nodiscard]] LOCUS_ALWAYS_INLINE bool      Empty() const noexcept { return m_size == 0; }
        [[nodiscard]] LOCUS_ALWAYS_INLINE size_type Capacity() const noexcept { return m_capacity; }
        [[nodiscard]] LOCUS_ALWAYS_INLINE size_type Threshold() const noexcept { return m_threshold; }

        [[nodiscard]] const AllocatorType& GetAllocator() const noexcept { return m_allocator; }

        //--------------------------------------------------------------------------
        // Introspection (no cleanup side effects)
        //--------------------------------------------------------------------------

        /// @brief Slot index holding the live entry for @p key, or kNotFound.
        [[nodiscard]] size_type IndexOf(const HandleType& key) const noexcept
        {
            if (!key || !m_slots)
                return kNotFound;
            for (size_type i = IndexFor_(key.HashCode()); m_slots[i].occupied; i = Next_(i))
            {
                if (ResolveAt_(i) == key.Identity())
                    return i;
            }
            return kNotFound;
        }

        [[nodiscard]] SlotState StateAt(size_type index) const
        {
            if (index >= m_capacity)
                throw std::out_of_range("OwnerTable slot index out of range");
            if (!m_slots[index].occupied)
                return SlotState::Empty;
            return ResolveAt_(index) ? SlotState::Live : SlotState::Stale;
        }

        [[nodiscard]] size_type LiveCount() const noexcept
        {
            size_type live = 0;
            for (size_type i = 0; i < m_capacity; ++i)
            {
                if (m_slots[i].occupied && ResolveAt_(i))
                    ++live;
            }
            return live;
        }

        /// @brief Invoke `fn(const HandleType&, const Value&)` for every live entry, in slot order.
        template<class Fn>
        void ForEachLive(Fn&& fn) const
        {
            for (size_type i = 0; i < m_capacity; ++i)
            {
                if (!m_slots[i].occupied)
                    continue;
                const HandleType key = KeyAt_(i).Lock();
                if (key)
                    fn(key, ValueAt_(i));
            }
        }

        [[nodiscard]] const TableStatistics& GetStatistics() const noexcept { return m_stats; }
        void                                 ResetStatistics() noexcept { m_stats = {}; }

        /// @brief Verify the structural invariants.
        /// @throws Exceptions::InvariantViolationException describing the first violation found.
        void CheckInvariants() const
        {
            if (!m_slots)
            {
                if (m_capacity != 0 || m_size != 0)
                    Fail_("detached table reports slots");
                return;
            }
            if (!std::has_single_bit(m_capacity))
                Fail_("capacity " + std::to_string(m_capacity) + " is not a power of two");
            if (m_mask != m_capacity - 1)
                Fail_("mask does not match capacity");
            if (m_threshold != ThresholdFor_(m_capacity))
                Fail_("threshold " + std::to_string(m_threshold) + " does not match capacity " + std::to_string(m_capacity));

            size_type occupied = 0;
            for (size_type i = 0; i < m_capacity; ++i)
            {
                if (m_slots[i].occupied)
                    ++occupied;
            }
            if (occupied != m_size)
                Fail_("size " + std::to_string(m_size) + " but " + std::to_string(occupied) + " occupied slots");
            if (occupied == m_capacity)
                Fail_("no empty slot left");

            for (size_type i = 0; i < m_capacity; ++i)
            {
                if (!m_slots[i].occupied)
                    continue;
                const auto* identity = ResolveAt_(i);
                if (!identity)
                    continue;
                // Walk from the natural index: the first slot naming this identity must be i.
                size_type probe = IndexFor_(identity->hashCode);
                while (probe != i)
                {
                    if (!m_slots[probe].occupied)
                        Fail_("entry at " + std::to_string(i) + " unreachable from natural index " +
                              std::to_string(IndexFor_(identity->hashCode)));
                    if (ResolveAt_(probe) == identity)
                        Fail_("duplicate entries at " + std::to_string(probe) + " and " + std::to_string(i));
                    probe = Next_(probe);
                }
            }
        }

    private:
        friend class InheritanceCopier;

        using KeyType = WeakHandle<Value>;

        struct Slot
        {
            bool occupied;

            alignas(KeyType) std::byte keyStorage[sizeof(KeyType)];
            alignas(Value) std::byte valueStorage[sizeof(Value)];
        };

        static_assert(std::is_trivially_default_constructible_v<Slot>);

        //--------------------------------------------------------------------------
        // Slot access
        //--------------------------------------------------------------------------

        [[nodiscard]] static KeyType& KeyAt_(Slot* slots, size_type idx) noexcept
        {
            return *std::launder(reinterpret_cast<KeyType*>(slots[idx].keyStorage));
        }

        [[nodiscard]] static Value& ValueAt_(Slot* slots, size_type idx) noexcept
        {
            return *std::launder(reinterpret_cast<Value*>(slots[idx].valueStorage));
        }

        [[nodiscard]] KeyType& KeyAt_(size_type idx) const noexcept { return KeyAt_(m_slots, idx); }
        [[nodiscard]] Value&   ValueAt_(size_type idx) const noexcept { return ValueAt_(m_slots, idx); }

        /// Identity of the key at an occupied slot; null when the entry is stale.
        [[nodiscard]] const typename HandleType::StateType* ResolveAt_(size_type idx) const noexcept
        {
            return KeyAt_(idx).Resolve();
        }

        [[nodiscard]] bool IsStale_(size_type idx) const noexcept
        {
            return m_slots[idx].occupied && ResolveAt_(idx) == nullptr;
        }

        [[nodiscard]] LOCUS_ALWAYS_INLINE size_type IndexFor_(UInt32 hashCode) const noexcept
        {
            return static_cast<size_type>(hashCode) & m_mask;
        }

        [[nodiscard]] LOCUS_ALWAYS_INLINE size_type Next_(size_type i) const noexcept { return (i + 1) & m_mask; }
        [[nodiscard]] LOCUS_ALWAYS_INLINE size_type Prev_(size_type i) const noexcept { return (i - 1) & m_mask; }

        [[nodiscard]] static constexpr size_type ThresholdFor_(size_type capacity) noexcept { return capacity * 2 / 3; }

        template<class V>
        void EmplaceAt_(size_type idx, const HandleType& key, V&& value)
        {
            Slot& s = m_slots[idx];
            ::new (static_cast<void*>(s.keyStorage)) KeyType(key);
            try
            {
                ::new (static_cast<void*>(s.valueStorage)) Value(std::forward<V>(value));
            } catch (...)
            {
                KeyAt_(idx).~KeyType();
                throw;
            }
            s.occupied = true;
        }

        static void DestroyAt_(Slot* slots, size_type idx) noexcept
        {
            if constexpr (!std::is_trivially_destructible_v<Value>)
                ValueAt_(slots, idx).~Value();
            KeyAt_(slots, idx).~KeyType();
            slots[idx].occupied = false;
        }

        void DestroyAt_(size_type idx) noexcept { DestroyAt_(m_slots, idx); }

        /// Move the entry at src (in srcSlots) into the empty dst (in dstSlots); src becomes empty.
        static void Relocate_(Slot* dstSlots, size_type dst, Slot* srcSlots, size_type src) noexcept
        {
            Slot& d = dstSlots[dst];
            ::new (static_cast<void*>(d.keyStorage)) KeyType(std::move(KeyAt_(srcSlots, src)));
            ::new (static_cast<void*>(d.valueStorage)) Value(std::move(ValueAt_(srcSlots, src)));
            d.occupied = true;
            DestroyAt_(srcSlots, src);
        }

        void SwapSlots_(size_type a, size_type b) noexcept
        {
            KeyAt_(a).Swap(KeyAt_(b));
            Value held(std::move(ValueAt_(a)));
            ValueAt_(a).~Value();
            ::new (static_cast<void*>(m_slots[a].valueStorage)) Value(std::move(ValueAt_(b)));
            ValueAt_(b).~Value();
            ::new (static_cast<void*>(m_slots[b].valueStorage)) Value(std::move(held));
        }

        //--------------------------------------------------------------------------
        // Storage
        //--------------------------------------------------------------------------

        [[nodiscard]] Slot* AllocateSlots_(size_type capacity) { return Memory::AllocateZeroed<Slot>(m_allocator, capacity); }

        void DeallocateSlots_(Slot* slots, size_type capacity) noexcept
        {
            Memory::DeallocateZeroed(m_allocator, slots, capacity);
        }

        void Initialize_(size_type requestedCapacity)
        {
            size_type cap = requestedCapacity <= kInitialCapacity ? kInitialCapacity : std::bit_ceil(requestedCapacity);
            m_slots       = AllocateSlots_(cap);
            m_capacity    = cap;
            m_mask        = cap - 1;
            m_size        = 0;
            m_threshold   = ThresholdFor_(cap);
        }

        void ClearAndRelease_() noexcept
        {
            if (!m_slots)
                return;
            for (size_type i = 0; i < m_capacity; ++i)
            {
                if (m_slots[i].occupied)
                    DestroyAt_(i);
            }
            DeallocateSlots_(m_slots, m_capacity);
            Detach_();
        }

        void Detach_() noexcept
        {
            m_slots     = nullptr;
            m_capacity  = 0;
            m_mask      = 0;
            m_size      = 0;
            m_threshold = 0;
        }

        static void RequireKey_(const HandleType& key)
        {
            if (!key)
                throw std::invalid_argument("OwnerTable keys must be non-empty handles");
        }

        //--------------------------------------------------------------------------
        // Probing and maintenance
        //--------------------------------------------------------------------------

        Value* GetAfterMiss_(const HandleType& key, size_type i)
        {
            while (m_slots[i].occupied)
            {
                const auto* identity = ResolveAt_(i);
                if (identity == key.Identity())
                    return &ValueAt_(i);
                if (!identity)
                    ExpungeStaleEntry_(i);// re-examines slot i, which now holds the next run member or nothing
                else
                    i = Next_(i);
            }
            return nullptr;
        }

        template<class V>
        void SetImpl_(const HandleType& key, V&& value)
        {
            RequireKey_(key);
            if (!m_slots)
                Initialize_(kInitialCapacity);

            size_type i = IndexFor_(key.HashCode());
            for (; m_slots[i].occupied; i = Next_(i))
            {
                const auto* identity = ResolveAt_(i);
                if (identity == key.Identity())
                {
                    ValueAt_(i) = std::forward<V>(value);
                    Validate_();
                    return;
                }
                if (!identity)
                {
                    ReplaceStaleEntry_(key, std::forward<V>(value), i);
                    Validate_();
                    return;
                }
            }

            // Only reachable after repeated failed growth: keep one slot empty so probes terminate.
            if (m_size + 1 >= m_capacity)
            {
                ExpungeStaleEntries_();
                Resize_();
                SetImpl_(key, std::forward<V>(value));
                return;
            }

            EmplaceAt_(i, key, std::forward<V>(value));
            const size_type sz = ++m_size;
            if (!CleanSomeSlots_(i, sz) && sz >= m_threshold)
                Rehash_();
            Validate_();
        }

        /// Store (key, value) while a stale entry occupies staleSlot on key's probe path.
        template<class V>
        void ReplaceStaleEntry_(const HandleType& key, V&& value, size_type staleSlot)
        {
            ++m_stats.staleReplacements;

            // Earliest stale entry of the run preceding staleSlot, so one expunge covers the run.
            size_type slotToExpunge = staleSlot;
            for (size_type i = Prev_(staleSlot); m_slots[i].occupied; i = Prev_(i))
            {
                if (!ResolveAt_(i))
                    slotToExpunge = i;
            }

            for (size_type i = Next_(staleSlot); m_slots[i].occupied; i = Next_(i))
            {
                const auto* identity = ResolveAt_(i);
                if (identity == key.Identity())
                {
                    // Move the entry into the stale slot so it sits closer to its natural index.
                    ValueAt_(i) = std::forward<V>(value);
                    SwapSlots_(i, staleSlot);

                    if (slotToExpunge == staleSlot)
                        slotToExpunge = i;
                    CleanSomeSlots_(ExpungeStaleEntry_(slotToExpunge), m_capacity);
                    return;
                }
                if (!identity && slotToExpunge == staleSlot)
                    slotToExpunge = i;
            }

            Value fresh(std::forward<V>(value));
            DestroyAt_(staleSlot);
            EmplaceAt_(staleSlot, key, std::move(fresh));

            if (slotToExpunge != staleSlot)
                CleanSomeSlots_(ExpungeStaleEntry_(slotToExpunge), m_capacity);
        }

        /// Clear staleSlot, then walk the rest of its run clearing dead entries and re-seating
        /// live ones that sit past an emptied slot. Returns the index of the empty slot ending the run.
        size_type ExpungeStaleEntry_(size_type staleSlot) noexcept
        {
            DestroyAt_(staleSlot);
            --m_size;
            ++m_stats.expungedEntries;

            size_type i = Next_(staleSlot);
            for (; m_slots[i].occupied; i = Next_(i))
            {
                const auto* identity = ResolveAt_(i);
                if (!identity)
                {
                    DestroyAt_(i);
                    --m_size;
                    ++m_stats.expungedEntries;
                    continue;
                }

                size_type h = IndexFor_(identity->hashCode);
                if (h == i)
                    continue;
                // First empty slot probing from h; i itself if nothing before it was freed.
                while (h != i && m_slots[h].occupied)
                    h = Next_(h);
                if (h != i)
                    Relocate_(m_slots, h, m_slots, i);
            }
            return i;
        }

        /// Inspect about log2(n) slots after i; each stale hit widens the scan to the full capacity.
        bool CleanSomeSlots_(size_type i, size_type n) noexcept
        {
            ++m_stats.cleanupScans;
            bool removed = false;
            do
            {
                i = Next_(i);
                if (IsStale_(i))
                {
                    n       = m_capacity;
                    removed = true;
                    i       = ExpungeStaleEntry_(i);
                }
            } while ((n >>= 1) != 0);
            return removed;
        }

        void ExpungeStaleEntries_() noexcept
        {
            for (size_type j = 0; j < m_capacity; ++j)
            {
                if (IsStale_(j))
                    ExpungeStaleEntry_(j);
            }
        }

        void Rehash_()
        {
            ++m_stats.rehashes;
            ExpungeStaleEntries_();
            // Lower bar than the threshold itself, to avoid hysteresis.
            if (m_size >= m_threshold - m_threshold / 4)
                Resize_();
        }

        /// Double the capacity. The new array is allocated before anything moves, so a failed
        /// allocation leaves the table untouched.
        void Resize_()
        {
            if (m_capacity > std::numeric_limits<size_type>::max() / 2)
                throw std::bad_alloc();
            const size_type newCapacity = m_capacity * 2;
            const size_type newMask     = newCapacity - 1;
            Slot*           fresh       = AllocateSlots_(newCapacity);

            size_type count = 0;
            for (size_type j = 0; j < m_capacity; ++j)
            {
                if (!m_slots[j].occupied)
                    continue;
                const auto* identity = ResolveAt_(j);
                if (!identity)
                {
                    DestroyAt_(j);
                    ++m_stats.expungedEntries;
                    continue;
                }
                size_type h = static_cast<size_type>(identity->hashCode) & newMask;
                while (fresh[h].occupied)
                    h = (h + 1) & newMask;
                Relocate_(fresh, h, m_slots, j);
                ++count;
            }

            DeallocateSlots_(m_slots, m_capacity);
            m_slots     = fresh;
            m_capacity  = newCapacity;
            m_mask      = newMask;
            m_size      = count;
            m_threshold = ThresholdFor_(newCapacity);
            ++m_stats.resizes;
        }

        /// Insertion used when building a child table: plain linear probing, no cleanup, no growth.
        template<class V>
        void InsertFresh_(const HandleType& key, V&& value)
        {
            size_type h = IndexFor_(key.HashCode());
            while (m_slots[h].occupied)
                h = Next_(h);
            EmplaceAt_(h, key, std::forward<V>(value));
            ++m_size;
        }

        //--------------------------------------------------------------------------
        // Validation
        //--------------------------------------------------------------------------

        LOCUS_ALWAYS_INLINE void Validate_() const
        {
#if LOCUS_LOCALS_VALIDATE
            CheckInvariants();
#endif
        }

        [[noreturn]] static void Fail_(const std::string& what)
        {
#if LOCUS_LOCALS_REPORT_VIOLATIONS
            std::cerr << "[OwnerTable] invariant violated: " << what << std::endl;
#endif
            throw Exceptions::InvariantViolationException(what);
        }

        [[no_unique_address]] AllocatorType m_allocator {};

        Slot*           m_slots {nullptr};
        size_type       m_capacity {0};
        size_type       m_mask {0};
        size_type       m_size {0};
        size_type       m_threshold {0};
        TableStatistics m_stats {};
    };
}// namespace Locus::Locals
