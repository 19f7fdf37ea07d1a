/// @file SmartPointers.hpp
/// @brief Header-only smart pointers (`Scoped`, `Shared`, `Ticket`) with allocator support.
///
/// - `Scoped<T, A>`: unique ownership, minimal overhead.
/// - `Shared<T, A>`: reference-counted ownership; the object dies with the last `Shared`.
/// - `Ticket<T, A>`: weak reference to a `Shared` object. A live `Ticket` keeps the control
///   block (and the object's address) allocated even after the object is destroyed, so a ticket
///   never aliases a newer object.
/// - Deterministic deallocation through the provided allocator.
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <new>
#include <type_traits>
#include <utility>

#include <Locus/Memory/AllocationHelpers.hpp>
#include <Locus/Memory/AllocatorConcept.hpp>
#include <Locus/Memory/SystemAllocator.hpp>

namespace Locus::Memory
{
    namespace detail
    {
        template<class T, class Alloc>
        struct SharedControl final
        {
            std::atomic<std::size_t> strong {1};// number of Shared owners
            std::atomic<std::size_t> weak {1};  // number of Ticket owners + control's self-weak

            [[no_unique_address]] Alloc alloc {};
            void*                       base {nullptr};
            std::size_t                 totalBytes {0};
            std::size_t                 allocAlignment {alignof(std::max_align_t)};
            T*                          objectPtr {nullptr};

            SharedControl(Alloc a, void* b, std::size_t bytes, std::size_t aln, T* obj) noexcept
                : alloc(std::move(a)), base(b), totalBytes(bytes), allocAlignment(aln), objectPtr(obj) {}

            void DestroyObject() noexcept
            {
                if (objectPtr)
                {
                    T* obj    = objectPtr;
                    objectPtr = nullptr;
                    obj->~T();
                }
            }

            void DeallocateSelf() noexcept
            {
                if (!base)
                    return;
                // The allocator lives inside the block being released; move it out first.
                Alloc       a     = std::move(alloc);
                void*       b     = base;
                std::size_t bytes = totalBytes;
                std::size_t aln   = allocAlignment;
                this->~SharedControl();
                a.Deallocate(b, bytes, aln);
            }
        };
    }// namespace detail

    ////////////////////////////////////////////////////////////////////////////////
    // Scoped<T, Alloc>
    ////////////////////////////////////////////////////////////////////////////////

    /// \brief Unique-ownership smart pointer using an allocator.
    ///
    /// - Manages objects allocated via `AllocateObject(alloc, ...)`.
    /// - Deallocates with the same allocator instance.
    /// - Move-only. Null-safe operations.
    template<class T, AllocatorConcept Alloc = SystemAllocator>
    class Scoped
    {
    public:
        using Element   = T;
        using AllocType = Alloc;

        static_assert(!std::is_array_v<T>, "Scoped does not manage arrays.");

        constexpr Scoped() noexcept = default;
        constexpr Scoped(std::nullptr_t) noexcept {}

        explicit Scoped(T* ptr, Alloc alloc = Alloc {}) noexcept : m_ptr(ptr), m_alloc(std::move(alloc)) {}

        Scoped(const Scoped&)            = delete;
        Scoped& operator=(const Scoped&) = delete;

        Scoped(Scoped&& other) noexcept(std::is_nothrow_move_constructible_v<Alloc>)
            : m_ptr(other.m_ptr), m_alloc(std::move(other.m_alloc))
        {
            other.m_ptr = nullptr;
        }
        Scoped& operator=(Scoped&& other) noexcept(std::is_nothrow_move_assignable_v<Alloc>)
        {
            if (this != &other)
            {
                Reset();
                m_ptr       = other.m_ptr;
                m_alloc     = std::move(other.m_alloc);
                other.m_ptr = nullptr;
            }
            return *this;
        }

        ~Scoped() noexcept { Reset(); }

        [[nodiscard]] T*   Get() const noexcept { return m_ptr; }
        [[nodiscard]] T&   operator*() const { return *m_ptr; }
        [[nodiscard]] T*   operator->() const noexcept { return m_ptr; }
        explicit           operator bool() const noexcept { return m_ptr != nullptr; }
        [[nodiscard]] bool operator==(std::nullptr_t) const noexcept { return m_ptr == nullptr; }

        void Reset(T* newPtr = nullptr) noexcept
        {
            if (m_ptr)
                DeallocateObject<Alloc, T>(m_alloc, m_ptr);
            m_ptr = newPtr;
        }

        [[nodiscard]] T* Release() noexcept
        {
            T* p  = m_ptr;
            m_ptr = nullptr;
            return p;
        }

        [[nodiscard]] Alloc&       Allocator() noexcept { return m_alloc; }
        [[nodiscard]] const Alloc& Allocator() const noexcept { return m_alloc; }

    private:
        T*                          m_ptr {nullptr};
        [[no_unique_address]] Alloc m_alloc {};
    };

    /// \brief Factory: allocate and construct T with a specific allocator.
    template<class T, AllocatorConcept Alloc, class... Args>
    [[nodiscard]] Scoped<T, Alloc> MakeScoped(Alloc alloc, Args&&... args)
    {
        T* obj = AllocateObject<Alloc, T>(alloc, std::forward<Args>(args)...);
        return Scoped<T, Alloc>(obj, std::move(alloc));
    }

    ////////////////////////////////////////////////////////////////////////////////
    // Shared<T, Alloc> and Ticket<T, Alloc>
    ////////////////////////////////////////////////////////////////////////////////

    template<class T, AllocatorConcept Alloc = SystemAllocator>
    class Ticket;

    /// \brief Reference-counted shared pointer with weak references.
    ///
    /// Self-weak strategy: the control block holds one implicit weak count to prevent premature
    /// deallocation after the last strong owner releases but while weak owners remain.
    template<class T, AllocatorConcept Alloc = SystemAllocator>
    class Shared
    {
    public:
        using Element   = T;
        using AllocType = Alloc;

        static_assert(!std::is_array_v<T>, "Shared does not manage arrays.");

        constexpr Shared() noexcept = default;
        constexpr Shared(std::nullptr_t) noexcept {}

        Shared(const Shared& other) noexcept : m_ctrl(other.m_ctrl)
        {
            if (m_ctrl)
                m_ctrl->strong.fetch_add(1, std::memory_order_relaxed);
        }
        Shared& operator=(const Shared& other) noexcept
        {
            if (this != &other)
            {
                Release();
                m_ctrl = other.m_ctrl;
                if (m_ctrl)
                    m_ctrl->strong.fetch_add(1, std::memory_order_relaxed);
            }
            return *this;
        }

        Shared(Shared&& other) noexcept : m_ctrl(other.m_ctrl) { other.m_ctrl = nullptr; }
        Shared& operator=(Shared&& other) noexcept
        {
            if (this != &other)
            {
                Release();
                m_ctrl       = other.m_ctrl;
                other.m_ctrl = nullptr;
            }
            return *this;
        }

        ~Shared() noexcept { Release(); }

        [[nodiscard]] T* Get() const noexcept { return m_ctrl ? m_ctrl->objectPtr : nullptr; }
        [[nodiscard]] T& operator*() const { return *Get(); }
        [[nodiscard]] T* operator->() const noexcept { return Get(); }
        explicit         operator bool() const noexcept { return Get() != nullptr; }

        /// \brief Current strong owners (best-effort; relaxed).
        [[nodiscard]] std::size_t UseCount() const noexcept
        {
            return m_ctrl ? m_ctrl->strong.load(std::memory_order_relaxed) : 0;
        }

        void Reset() noexcept { Release(); }
        void Swap(Shared& other) noexcept { std::swap(m_ctrl, other.m_ctrl); }

        friend class Ticket<T, Alloc>;

        template<class U, AllocatorConcept A, class... Args>
        friend Shared<U, A> MakeShared(A alloc, Args&&... args);
        template<class U, AllocatorConcept A>
        friend Ticket<U, A> MakeTicket(const Shared<U, A>&) noexcept;

    private:
        using Control = detail::SharedControl<T, Alloc>;

        explicit Shared(Control* ctrl) noexcept : m_ctrl(ctrl) {}

        /// \brief Release one strong reference; destroy object on last strong, free on last weak.
        void Release() noexcept
        {
            if (!m_ctrl)
                return;
            Control* ctrl = m_ctrl;
            m_ctrl        = nullptr;
            if (ctrl->strong.fetch_sub(1, std::memory_order_acq_rel) == 1)
            {
                ctrl->DestroyObject();
                if (ctrl->weak.fetch_sub(1, std::memory_order_acq_rel) == 1)
                    ctrl->DeallocateSelf();
            }
        }

        Control* m_ctrl {nullptr};
    };

    /// \brief Weak non-owning reference that observes a `Shared` object.
    template<class T, AllocatorConcept Alloc>
    class Ticket
    {
    public:
        constexpr Ticket() noexcept = default;
        constexpr Ticket(std::nullptr_t) noexcept {}

        Ticket(const Ticket& other) noexcept : m_ctrl(other.m_ctrl)
        {
            if (m_ctrl)
                m_ctrl->weak.fetch_add(1, std::memory_order_relaxed);
        }
        Ticket& operator=(const Ticket& other) noexcept
        {
            if (this != &other)
            {
                Release();
                m_ctrl = other.m_ctrl;
                if (m_ctrl)
                    m_ctrl->weak.fetch_add(1, std::memory_order_relaxed);
            }
            return *this;
        }

        Ticket(Ticket&& other) noexcept : m_ctrl(other.m_ctrl) { other.m_ctrl = nullptr; }
        Ticket& operator=(Ticket&& other) noexcept
        {
            if (this != &other)
            {
                Release();
                m_ctrl       = other.m_ctrl;
                other.m_ctrl = nullptr;
            }
            return *this;
        }

        ~Ticket() noexcept { Release(); }

        /// \brief Drop the reference; the ticket becomes empty.
        void Reset() noexcept { Release(); }
        void Swap(Ticket& other) noexcept { std::swap(m_ctrl, other.m_ctrl); }

        [[nodiscard]] bool Empty() const noexcept { return m_ctrl == nullptr; }

        [[nodiscard]] bool Expired() const noexcept
        {
            return !m_ctrl || m_ctrl->strong.load(std::memory_order_acquire) == 0;
        }

        /// \brief Observe the object without taking ownership; null once expired or reset.
        ///
        /// The pointer stays valid only while some `Shared` owner is kept alive by the caller's
        /// context. Callers must not let the last owner be released concurrently.
        [[nodiscard]] T* Peek() const noexcept
        {
            if (Expired())
                return nullptr;
            return m_ctrl->objectPtr;
        }

        /// \brief True if this ticket observes the (still live) object owned by @p shared.
        [[nodiscard]] bool Refers(const Shared<T, Alloc>& shared) const noexcept
        {
            return m_ctrl != nullptr && m_ctrl == shared.m_ctrl && !Expired();
        }

        /// \brief Attempt to acquire a strong owner; returns empty on race/lifetime end.
        [[nodiscard]] Shared<T, Alloc> Lock() const noexcept
        {
            if (!m_ctrl)
                return {};

            std::size_t s = m_ctrl->strong.load(std::memory_order_relaxed);
            while (s != 0)
            {
                if (m_ctrl->strong.compare_exchange_weak(s, s + 1, std::memory_order_acquire, std::memory_order_relaxed))
                    return Shared<T, Alloc>(m_ctrl);
            }
            return {};
        }

    private:
        using Control = detail::SharedControl<T, Alloc>;

        explicit Ticket(Control* ctrl) noexcept : m_ctrl(ctrl) {}

        /// \brief Drop one weak reference; free the control block if this was the last one.
        void Release() noexcept
        {
            if (!m_ctrl)
                return;
            Control* ctrl = m_ctrl;
            m_ctrl        = nullptr;
            if (ctrl->weak.fetch_sub(1, std::memory_order_acq_rel) == 1)
                ctrl->DeallocateSelf();
        }

        Control* m_ctrl {nullptr};

        template<class U, AllocatorConcept A>
        friend Ticket<U, A> MakeTicket(const Shared<U, A>&) noexcept;
    };

    /// \brief Create a control block and T in one allocation with a specific allocator.
    template<class T, AllocatorConcept Alloc, class... Args>
    [[nodiscard]] Shared<T, Alloc> MakeShared(Alloc alloc, Args&&... args)
    {
        using Control = detail::SharedControl<T, Alloc>;

        constexpr std::size_t tAlign    = alignof(T);
        constexpr std::size_t ctrlAlign = alignof(Control);
        const std::size_t     alignment = ctrlAlign > tAlign ? ctrlAlign : tAlign;

        // conservative size: control + possible padding + T
        const std::size_t total = sizeof(Control) + (tAlign - 1) + sizeof(T);

        void* base = alloc.Allocate(total, alignment);
        if (!base)
            throw std::bad_alloc {};

        auto* raw   = static_cast<std::byte*>(base) + sizeof(Control);
        auto  space = total - sizeof(Control);

        void* objVoid = static_cast<void*>(raw);
        if (std::align(alignof(T), sizeof(T), objVoid, space) == nullptr)
        {
            alloc.Deallocate(base, total, alignment);
            throw std::bad_alloc {};
        }

        T* objPtr = nullptr;
        try
        {
            objPtr = std::construct_at(static_cast<T*>(objVoid), std::forward<Args>(args)...);
        } catch (...)
        {
            alloc.Deallocate(base, total, alignment);
            throw;
        }

        auto* ctrl = ::new (base) Control(std::move(alloc), base, total, alignment, objPtr);
        return Shared<T, Alloc>(ctrl);
    }

    /// \brief Create a weak Ticket from a Shared, bumping weak count.
    template<class T, AllocatorConcept Alloc>
    [[nodiscard]] Ticket<T, Alloc> MakeTicket(const Shared<T, Alloc>& shared) noexcept
    {
        auto* c = shared.m_ctrl;
        if (!c)
            return Ticket<T, Alloc> {};
        c->weak.fetch_add(1, std::memory_order_relaxed);
        return Ticket<T, Alloc>(c);
    }
}// namespace Locus::Memory
