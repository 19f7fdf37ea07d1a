/// @file OwnerTableTests.cpp
/// @brief Tests for OwnerTable probing, stale-entry cleanup, growth and allocator behaviour.
///
/// Most cases use explicit hash codes so slot positions are deterministic in a 16-slot table.

#include <Locus/Locals/OwnerTable.hpp>
#include <Locus/Memory/AllocatorRef.hpp>
#include <Locus/Memory/SystemAllocator.hpp>
#include <Locus/Memory/TrackingAllocator.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <memory>
#include <new>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using Locus::Locals::Handle;
using Locus::Locals::OwnerTable;
using Locus::Locals::SlotState;

namespace
{
    using IntHandle = Handle<int>;
    using IntTable  = OwnerTable<int>;

    /// Allocator that serves a fixed number of requests, then reports exhaustion.
    class BudgetAllocator
    {
    public:
        explicit BudgetAllocator(int& remaining) noexcept : m_remaining(&remaining) {}

        [[nodiscard]] void* Allocate(std::size_t size, std::size_t alignment) noexcept
        {
            if (*m_remaining <= 0)
                return nullptr;
            --*m_remaining;
            return m_system.Allocate(size, alignment);
        }

        void Deallocate(void* ptr, std::size_t size, std::size_t alignment) noexcept
        {
            m_system.Deallocate(ptr, size, alignment);
        }

    private:
        int*                          m_remaining;
        Locus::Memory::SystemAllocator m_system {};
    };
}// namespace

TEST_CASE("OwnerTable starts empty with the initial capacity", "[Locals][OwnerTable]")
{
    IntTable table;
    CHECK(table.Empty());
    CHECK(table.Size() == 0u);
    CHECK(table.Capacity() == 16u);
    CHECK(table.Threshold() == 10u);
    table.CheckInvariants();

    IntTable rounded(40);
    CHECK(rounded.Capacity() == 64u);
    CHECK(rounded.Threshold() == 42u);

    IntTable clamped(3);
    CHECK(clamped.Capacity() == 16u);
}

TEST_CASE("OwnerTable first-entry constructor places the entry at its natural index", "[Locals][OwnerTable]")
{
    auto     key = IntHandle::Create(0x61c88647u);
    IntTable table(key, 99);

    CHECK(table.Size() == 1u);
    CHECK(table.IndexOf(key) == (0x61c88647u & 15u));
    CHECK(table.TryGet(key) == 99);

    CHECK_THROWS_AS(IntTable(IntHandle {}, 1), std::invalid_argument);
}

TEST_CASE("OwnerTable set, get, overwrite and remove", "[Locals][OwnerTable]")
{
    IntTable table;
    auto     a = IntHandle::Create();
    auto     b = IntHandle::Create();

    CHECK(table.GetPtr(a) == nullptr);
    CHECK_FALSE(table.Contains(a));

    table.Set(a, 1);
    table.Set(b, 2);
    CHECK(table.Size() == 2u);
    CHECK(table.TryGet(a) == 1);
    CHECK(table.TryGet(b) == 2);

    table.Set(a, 10);
    CHECK(table.Size() == 2u);
    CHECK(*table.GetPtr(a) == 10);

    table.Remove(a);
    CHECK(table.Size() == 1u);
    CHECK_FALSE(table.Contains(a));
    CHECK(table.Contains(b));

    table.Remove(a);
    CHECK(table.Size() == 1u);
}

TEST_CASE("OwnerTable rejects empty handles on insertion", "[Locals][OwnerTable]")
{
    IntTable  table;
    IntHandle empty;
    CHECK_THROWS_AS(table.Set(empty, 1), std::invalid_argument);
    CHECK(table.GetPtr(empty) == nullptr);
    CHECK(table.IndexOf(empty) == IntTable::kNotFound);
    table.Remove(empty);
    CHECK(table.Empty());
}

TEST_CASE("OwnerTable resolves collisions by linear probing", "[Locals][OwnerTable]")
{
    IntTable table;
    auto     a = IntHandle::Create(3u);
    auto     b = IntHandle::Create(19u);
    auto     c = IntHandle::Create(35u);
    table.Set(a, 1);
    table.Set(b, 2);
    table.Set(c, 3);

    CHECK(table.IndexOf(a) == 3u);
    CHECK(table.IndexOf(b) == 4u);
    CHECK(table.IndexOf(c) == 5u);
    CHECK(table.TryGet(c) == 3);
}

TEST_CASE("OwnerTable probes wrap around the end of the slot array", "[Locals][OwnerTable]")
{
    IntTable table;
    auto     a = IntHandle::Create(15u);
    auto     b = IntHandle::Create(31u);
    table.Set(a, 1);
    table.Set(b, 2);

    CHECK(table.IndexOf(a) == 15u);
    CHECK(table.IndexOf(b) == 0u);
    CHECK(table.TryGet(b) == 2);

    table.Remove(a);
    CHECK(table.IndexOf(b) == 15u);
    CHECK(table.StateAt(0) == SlotState::Empty);
    CHECK(table.TryGet(b) == 2);
}

TEST_CASE("OwnerTable removal re-seats the rest of the run", "[Locals][OwnerTable]")
{
    IntTable table;
    auto     a = IntHandle::Create(3u);
    auto     b = IntHandle::Create(19u);
    auto     c = IntHandle::Create(35u);
    table.Set(a, 1);
    table.Set(b, 2);
    table.Set(c, 3);

    table.Remove(b);
    CHECK(table.Size() == 2u);
    CHECK(table.IndexOf(a) == 3u);
    CHECK(table.IndexOf(c) == 4u);
    CHECK(table.StateAt(5) == SlotState::Empty);
    CHECK(table.TryGet(c) == 3);
}

TEST_CASE("OwnerTable grows by doubling at the fill threshold", "[Locals][OwnerTable]")
{
    std::vector<IntHandle> keys;
    IntTable               table;

    SECTION("nine entries fit the initial table")
    {
        for (unsigned i = 0; i < 9; ++i)
        {
            keys.push_back(IntHandle::Create(i));
            table.Set(keys.back(), static_cast<int>(i));
        }
        CHECK(table.Capacity() == 16u);
        CHECK(table.Size() == 9u);
    }

    SECTION("the tenth entry reaches the threshold and doubles the table")
    {
        for (unsigned i = 0; i < 10; ++i)
        {
            keys.push_back(IntHandle::Create(i));
            table.Set(keys.back(), static_cast<int>(i));
        }
        CHECK(table.Capacity() == 32u);
        CHECK(table.Threshold() == 21u);
        CHECK(table.Size() == 10u);
        CHECK(table.GetStatistics().rehashes == 1u);
        CHECK(table.GetStatistics().resizes == 1u);
        for (unsigned i = 0; i < 10; ++i)
            CHECK(table.TryGet(keys[i]) == static_cast<int>(i));
    }

    SECTION("eleven entries double the table")
    {
        for (unsigned i = 0; i < 11; ++i)
        {
            keys.push_back(IntHandle::Create(i));
            table.Set(keys.back(), static_cast<int>(i));
        }
        CHECK(table.Capacity() == 32u);
        CHECK(table.Threshold() == 21u);
        CHECK(table.Size() == 11u);
        CHECK(table.GetStatistics().resizes == 1u);
    }

    SECTION("a hundred entries only ever double")
    {
        for (int i = 0; i < 100; ++i)
        {
            keys.push_back(IntHandle::Create());
            table.Set(keys.back(), i);
        }
        CHECK(table.Capacity() == 256u);
        CHECK(table.GetStatistics().resizes == 4u);
        CHECK(table.Size() == 100u);
        for (int i = 0; i < 100; ++i)
            CHECK(table.TryGet(keys[static_cast<std::size_t>(i)]) == i);
    }

    table.CheckInvariants();
}

TEST_CASE("OwnerTable lookups expunge stale entries on the probe path", "[Locals][OwnerTable]")
{
    IntTable table;
    auto     a = IntHandle::Create(5u);
    auto     b = IntHandle::Create(6u);
    auto     c = IntHandle::Create(21u);
    table.Set(a, 1);
    table.Set(b, 2);
    table.Set(c, 3);
    REQUIRE(table.IndexOf(c) == 7u);

    a.Reset();
    CHECK(table.StateAt(5) == SlotState::Stale);
    CHECK(table.Size() == 3u);
    CHECK(table.LiveCount() == 2u);

    CHECK(table.TryGet(c) == 3);
    CHECK(table.Size() == 2u);
    CHECK(table.IndexOf(c) == 5u);
    CHECK(table.IndexOf(b) == 6u);
    CHECK(table.StateAt(7) == SlotState::Empty);
    CHECK(table.GetStatistics().expungedEntries == 1u);
}

TEST_CASE("OwnerTable reuses stale slots on insertion", "[Locals][OwnerTable]")
{
    IntTable table;

    SECTION("an existing key further along the run moves into the stale slot")
    {
        auto a = IntHandle::Create(5u);
        auto c = IntHandle::Create(21u);
        table.Set(a, 1);
        table.Set(c, 3);
        REQUIRE(table.IndexOf(c) == 6u);

        a.Reset();
        table.Set(c, 30);
        CHECK(table.IndexOf(c) == 5u);
        CHECK(table.TryGet(c) == 30);
        CHECK(table.Size() == 1u);
        CHECK(table.StateAt(6) == SlotState::Empty);
        CHECK(table.GetStatistics().staleReplacements == 1u);
    }

    SECTION("a new key takes over the stale slot")
    {
        auto a = IntHandle::Create(5u);
        table.Set(a, 1);
        a.Reset();

        auto d = IntHandle::Create(37u);
        table.Set(d, 4);
        CHECK(table.IndexOf(d) == 5u);
        CHECK(table.Size() == 1u);
        CHECK(table.GetStatistics().staleReplacements == 1u);
    }

    SECTION("stale entries earlier in the run are expunged as well")
    {
        auto x = IntHandle::Create(3u);
        auto y = IntHandle::Create(4u);
        auto a = IntHandle::Create(5u);
        table.Set(x, 1);
        table.Set(y, 2);
        table.Set(a, 3);
        x.Reset();
        a.Reset();

        auto k = IntHandle::Create(21u);
        table.Set(k, 4);
        CHECK(table.Size() == 2u);
        CHECK(table.StateAt(3) == SlotState::Empty);
        CHECK(table.IndexOf(y) == 4u);
        CHECK(table.IndexOf(k) == 5u);
    }

    table.CheckInvariants();
}

TEST_CASE("OwnerTable full expunge pass re-seats interleaved runs", "[Locals][OwnerTable]")
{
    IntTable table;
    auto     A = IntHandle::Create(2u);
    auto     B = IntHandle::Create(18u);
    auto     C = IntHandle::Create(3u);
    auto     D = IntHandle::Create(34u);
    auto     E = IntHandle::Create(4u);
    auto     F = IntHandle::Create(19u);
    for (const auto* h: {&A, &B, &C, &D, &E, &F})
        table.Set(*h, static_cast<int>(h->HashCode()));

    CHECK(table.IndexOf(F) == 7u);

    A.Reset();
    C.Reset();
    table.ExpungeStaleEntries();

    CHECK(table.Size() == 4u);
    CHECK(table.IndexOf(B) == 2u);
    CHECK(table.IndexOf(D) == 3u);
    CHECK(table.IndexOf(E) == 4u);
    CHECK(table.IndexOf(F) == 5u);
    CHECK(table.GetStatistics().expungedEntries == 2u);
    CHECK(table.TryGet(F) == 19);
}

TEST_CASE("OwnerTable insertion runs a cleanup scan after the new slot", "[Locals][OwnerTable]")
{
    IntTable table;
    auto     a = IntHandle::Create(6u);
    table.Set(a, 1);
    a.Reset();

    auto b = IntHandle::Create(5u);
    table.Set(b, 2);
    CHECK(table.Size() == 1u);
    CHECK(table.StateAt(6) == SlotState::Empty);
    CHECK(table.GetStatistics().expungedEntries == 1u);
    CHECK(table.GetStatistics().cleanupScans >= 1u);
}

TEST_CASE("OwnerTable rehash expunges before deciding to grow", "[Locals][OwnerTable]")
{
    IntTable               table;
    std::vector<IntHandle> keys;
    for (unsigned i = 0; i < 9; ++i)
    {
        keys.push_back(IntHandle::Create(i));
        table.Set(keys.back(), static_cast<int>(i));
    }
    keys[6].Reset();
    keys[7].Reset();
    keys[8].Reset();
    table.ResetStatistics();

    auto extra = IntHandle::Create(12u);
    table.Set(extra, 12);

    const auto& stats = table.GetStatistics();
    CHECK(table.Capacity() == 16u);
    CHECK(table.Size() == 7u);
    CHECK(stats.rehashes == 1u);
    CHECK(stats.resizes == 0u);
    CHECK(stats.expungedEntries == 3u);
}

TEST_CASE("OwnerTable rehash clears dead entries before growing", "[Locals][OwnerTable]")
{
    IntTable               table;
    std::vector<IntHandle> keys;
    for (unsigned i = 0; i < 9; ++i)
    {
        keys.push_back(IntHandle::Create(i));
        table.Set(keys.back(), static_cast<int>(i));
    }
    // Kill entries whose slots the post-insert scans will not reach.
    keys[1].Reset();
    keys[2].Reset();

    auto k9 = IntHandle::Create(9u);
    table.Set(k9, 9);
    CHECK(table.Capacity() == 32u);
    CHECK(table.LiveCount() == table.Size());
    CHECK(table.LiveCount() == 8u);
    CHECK(table.GetStatistics().expungedEntries == 2u);
    CHECK(table.TryGet(k9) == 9);
}

TEST_CASE("OwnerTable destroys values when entries are expunged", "[Locals][OwnerTable]")
{
    using PtrTable = OwnerTable<std::shared_ptr<std::string>>;
    using PtrKey   = Handle<std::shared_ptr<std::string>>;

    auto payload = std::make_shared<std::string>("payload");
    {
        PtrTable table;
        auto     key  = PtrKey::Create(5u);
        auto     next = PtrKey::Create(21u);
        table.Set(key, payload);
        table.Set(next, nullptr);
        CHECK(payload.use_count() == 2);

        key.Reset();
        CHECK(payload.use_count() == 2);

        CHECK(table.Contains(next));
        CHECK(payload.use_count() == 1);

        table.Set(next, payload);
        CHECK(payload.use_count() == 2);
    }
    CHECK(payload.use_count() == 1);
}

TEST_CASE("OwnerTable leaves the table intact when growth cannot allocate", "[Locals][OwnerTable][Allocator]")
{
    using BudgetTable = OwnerTable<int, BudgetAllocator>;

    int         remaining = 1;
    BudgetTable table(16, BudgetAllocator {remaining});
    CHECK(remaining == 0);

    std::vector<IntHandle> keys;
    for (unsigned i = 0; i < 9; ++i)
    {
        keys.push_back(IntHandle::Create(i));
        table.Set(keys.back(), static_cast<int>(i));
    }

    keys.push_back(IntHandle::Create(9u));
    CHECK_THROWS_AS(table.Set(keys.back(), 9), std::bad_alloc);
    CHECK(table.Capacity() == 16u);
    CHECK(table.Size() == 10u);
    CHECK(table.TryGet(keys.back()) == 9);
    table.CheckInvariants();

    remaining = 1;
    keys.push_back(IntHandle::Create(10u));
    table.Set(keys.back(), 10);
    CHECK(table.Capacity() == 32u);
    CHECK(table.Size() == 11u);
    for (unsigned i = 0; i < 11; ++i)
        CHECK(table.TryGet(keys[i]) == static_cast<int>(i));

    int empty = 0;
    CHECK_THROWS_AS(BudgetTable(16, BudgetAllocator {empty}), std::bad_alloc);
}

TEST_CASE("OwnerTable routes slot storage through the supplied allocator", "[Locals][OwnerTable][Allocator]")
{
    using Tracked = Locus::Memory::Tracking<Locus::Memory::SystemAllocator>;
    using Ref     = Locus::Memory::AllocatorRef<Tracked>;

    Tracked tracking {Locus::Memory::SystemAllocator {}};
    {
        OwnerTable<int, Ref>   table(16, Ref(tracking));
        std::vector<IntHandle> keys;
        for (int i = 0; i < 30; ++i)
        {
            keys.push_back(IntHandle::Create(static_cast<Locus::UInt32>(i)));
            table.Set(keys.back(), i);
        }
        CHECK(table.Capacity() == 64u);
        CHECK(tracking.GetStats().totalCount == 3u);
        CHECK(tracking.GetStats().currentCount == 1u);
    }
    CHECK(tracking.GetStats().currentBytes == 0u);
    CHECK(tracking.GetStats().currentCount == 0u);
}

TEST_CASE("OwnerTable moves transfer ownership of the slots", "[Locals][OwnerTable]")
{
    auto     a = IntHandle::Create(1u);
    IntTable source;
    source.Set(a, 7);

    IntTable moved(std::move(source));
    CHECK(moved.TryGet(a) == 7);
    CHECK(source.Size() == 0u);
    CHECK(source.Capacity() == 0u);
    CHECK(source.GetPtr(a) == nullptr);
    source.CheckInvariants();

    // A detached table becomes usable again on insertion.
    source.Set(a, 8);
    CHECK(source.Capacity() == 16u);
    CHECK(source.TryGet(a) == 8);

    IntTable assigned;
    assigned = std::move(moved);
    CHECK(assigned.TryGet(a) == 7);
}

TEST_CASE("OwnerTable introspection", "[Locals][OwnerTable]")
{
    IntTable table;
    auto     a = IntHandle::Create(2u);
    auto     b = IntHandle::Create(9u);
    auto     c = IntHandle::Create(4u);
    table.Set(a, 20);
    table.Set(b, 90);
    table.Set(c, 40);
    c.Reset();

    CHECK(table.StateAt(2) == SlotState::Live);
    CHECK(table.StateAt(4) == SlotState::Stale);
    CHECK(table.StateAt(3) == SlotState::Empty);
    CHECK_THROWS_AS(table.StateAt(16), std::out_of_range);

    std::vector<std::pair<Locus::UInt32, int>> visited;
    table.ForEachLive([&visited](const IntHandle& key, const int& value) {
        visited.emplace_back(key.HashCode(), value);
    });
    REQUIRE(visited.size() == 2u);
    CHECK(visited[0] == std::pair<Locus::UInt32, int> {2u, 20});
    CHECK(visited[1] == std::pair<Locus::UInt32, int> {9u, 90});

    // Introspection never cleans up.
    CHECK(table.Size() == 3u);
    CHECK(table.LiveCount() == 2u);
}

TEST_CASE("OwnerTable keeps its invariants under a random workload", "[Locals][OwnerTable]")
{
    std::mt19937 rng(20241018u);
    IntTable     table;

    std::vector<IntHandle> handles;
    std::vector<int>       expected;
    std::vector<bool>      present;

    for (int step = 0; step < 5000; ++step)
    {
        const auto op = rng() % 6;
        if (handles.empty() || op == 0)
        {
            handles.push_back(IntHandle::Create());
            expected.push_back(0);
            present.push_back(false);
            continue;
        }

        const std::size_t idx = rng() % handles.size();
        auto&             h   = handles[idx];
        switch (op)
        {
            case 1:
            case 2:
                if (h)
                {
                    const int v = static_cast<int>(rng() % 1000);
                    table.Set(h, v);
                    expected[idx] = v;
                    present[idx]  = true;
                }
                break;
            case 3:
                if (h)
                {
                    table.Remove(h);
                    present[idx] = false;
                }
                break;
            case 4:
                h.Reset();
                present[idx] = false;
                break;
            default:
                if (h)
                {
                    const int* v = table.GetPtr(h);
                    REQUIRE((v != nullptr) == present[idx]);
                    if (v)
                        REQUIRE(*v == expected[idx]);
                }
                break;
        }
        table.CheckInvariants();
    }

    table.ExpungeStaleEntries();
    std::size_t live = 0;
    for (std::size_t i = 0; i < handles.size(); ++i)
    {
        if (handles[i] && present[i])
        {
            ++live;
            CHECK(table.TryGet(handles[i]) == expected[i]);
        }
    }
    CHECK(table.Size() == live);
    CHECK(table.LiveCount() == live);
}
