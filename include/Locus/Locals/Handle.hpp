/// @file Handle.hpp
/// @brief Identity handles that key an `OwnerTable`, and the weak references tables hold to them.
///
/// A `Handle<V>` names one logical slot. It carries an immutable hash code and an initializer
/// chosen at construction:
/// - `NoInitializer`: nothing is materialised for a context that has no value.
/// - `DefaultInitializer`: a value-initialised `V`.
/// - `SuppliedInitializer`: the result of a user factory.
/// - `InheritableInitializer`: like Default, and child contexts receive `transform(parentValue)`.
///
/// Copies of a handle share one identity. When the last copy is destroyed (or `Reset()`), the
/// identity dies and every table entry keyed by it turns stale; tables discover this lazily.
#pragma once

#include <Locus/Exceptions/NotSupportedException.hpp>
#include <Locus/Locals/HashCodeAllocator.hpp>
#include <Locus/Memory/SmartPointers.hpp>
#include <Locus/Memory/SystemAllocator.hpp>
#include <Locus/Primitives.hpp>

#include <concepts>
#include <functional>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace Locus::Locals
{
    enum class InitializerKind : UInt8
    {
        None,
        Default,
        Supplied,
        Inheritable,
    };

    struct NoInitializer
    {
    };

    struct DefaultInitializer
    {
    };

    template<class V>
    struct SuppliedInitializer
    {
        std::function<V()> factory;
    };

    /// An empty transform copies the parent value unchanged.
    template<class V>
    struct InheritableInitializer
    {
        std::function<V(const V&)> transform;
    };

    template<class V>
    using Initializer = std::variant<NoInitializer, DefaultInitializer, SuppliedInitializer<V>, InheritableInitializer<V>>;

    namespace detail
    {
        template<class V>
        struct HandleState
        {
            HandleState(UInt32 code, Initializer<V> init)
                : hashCode(code), initializer(std::move(init))
            {
            }

            const UInt32         hashCode;
            const Initializer<V> initializer;
        };

        template<class V>
        using HandleOwner = Memory::Shared<HandleState<V>, Memory::SystemAllocator>;

        template<class V>
        using HandleTicket = Memory::Ticket<HandleState<V>, Memory::SystemAllocator>;
    }// namespace detail

    template<class V>
    class WeakHandle;

    template<class V>
    class Handle
    {
    public:
        using ValueType = V;
        using StateType = detail::HandleState<V>;

        /// @brief An empty handle. It names nothing and cannot key a table.
        Handle() noexcept = default;

        //--------------------------------------------------------------------------
        // Factories
        //--------------------------------------------------------------------------

        [[nodiscard]] static Handle Create() { return Create(HashCodeAllocator::Global()); }
        [[nodiscard]] static Handle Create(HashCodeAllocator& codes) { return Create(codes.Allocate()); }
        [[nodiscard]] static Handle Create(UInt32 hashCode) { return Make_(hashCode, NoInitializer {}); }

        [[nodiscard]] static Handle WithDefault()
            requires std::default_initializable<V>
        {
            return WithDefault(HashCodeAllocator::Global());
        }
        [[nodiscard]] static Handle WithDefault(HashCodeAllocator& codes)
            requires std::default_initializable<V>
        {
            return WithDefault(codes.Allocate());
        }
        [[nodiscard]] static Handle WithDefault(UInt32 hashCode)
            requires std::default_initializable<V>
        {
            return Make_(hashCode, DefaultInitializer {});
        }

        /// @throws std::invalid_argument if @p factory is empty.
        [[nodiscard]] static Handle WithInitial(std::function<V()> factory)
        {
            return WithInitial(std::move(factory), HashCodeAllocator::Global());
        }
        [[nodiscard]] static Handle WithInitial(std::function<V()> factory, HashCodeAllocator& codes)
        {
            if (!factory)
                throw std::invalid_argument("Handle::WithInitial requires a non-empty factory");
            return Make_(codes.Allocate(), SuppliedInitializer<V> {std::move(factory)});
        }
        [[nodiscard]] static Handle WithInitial(std::function<V()> factory, UInt32 hashCode)
        {
            if (!factory)
                throw std::invalid_argument("Handle::WithInitial requires a non-empty factory");
            return Make_(hashCode, SuppliedInitializer<V> {std::move(factory)});
        }

        [[nodiscard]] static Handle Inheritable(std::function<V(const V&)> transform = {})
        {
            return Inheritable(std::move(transform), HashCodeAllocator::Global());
        }
        [[nodiscard]] static Handle Inheritable(std::function<V(const V&)> transform, HashCodeAllocator& codes)
        {
            return Inheritable(std::move(transform), codes.Allocate());
        }
        [[nodiscard]] static Handle Inheritable(std::function<V(const V&)> transform, UInt32 hashCode)
        {
            return Make_(hashCode, InheritableInitializer<V> {std::move(transform)});
        }

        //--------------------------------------------------------------------------
        // Identity
        //--------------------------------------------------------------------------

        [[nodiscard]] bool Valid() const noexcept { return static_cast<bool>(m_owner); }
        explicit           operator bool() const noexcept { return Valid(); }

        /// @pre Valid()
        [[nodiscard]] UInt32 HashCode() const noexcept { return m_owner->hashCode; }

        [[nodiscard]] const StateType* Identity() const noexcept { return m_owner.Get(); }

        /// @brief Number of live copies sharing this identity.
        [[nodiscard]] std::size_t UseCount() const noexcept { return m_owner.UseCount(); }

        /// @brief Drop this copy. The identity dies with its last copy.
        void Reset() noexcept { m_owner.Reset(); }

        [[nodiscard]] WeakHandle<V> Weak() const noexcept;

        friend bool operator==(const Handle& lhs, const Handle& rhs) noexcept
        {
            return lhs.Identity() == rhs.Identity();
        }

        //--------------------------------------------------------------------------
        // Initialization capability
        //--------------------------------------------------------------------------

        /// @pre Valid()
        [[nodiscard]] InitializerKind Kind() const noexcept
        {
            return static_cast<InitializerKind>(m_owner->initializer.index());
        }

        [[nodiscard]] bool IsInheritable() const noexcept
        {
            return Valid() && Kind() == InitializerKind::Inheritable;
        }

        /// @brief Value a context materialises when it has none for this handle.
        /// @return Empty for an empty handle, for `NoInitializer`, and for Default/Inheritable when V
        ///         has no default constructor.
        [[nodiscard]] std::optional<V> InitialValue() const
        {
            if (!Valid())
                return std::nullopt;
            switch (Kind())
            {
                case InitializerKind::Supplied:
                    return std::get<SuppliedInitializer<V>>(m_owner->initializer).factory();
                case InitializerKind::Default:
                case InitializerKind::Inheritable:
                    if constexpr (std::is_default_constructible_v<V>)
                        return V {};
                    else
                        return std::nullopt;
                case InitializerKind::None:
                    break;
            }
            return std::nullopt;
        }

        /// @brief Value a child context starts with, given the parent's value.
        /// @throws Exceptions::NotSupportedException if the handle is not inheritable.
        [[nodiscard]] V ChildValue(const V& parentValue) const
        {
            if (!IsInheritable())
                throw Exceptions::NotSupportedException("ChildValue requires an inheritable handle");
            const auto& transform = std::get<InheritableInitializer<V>>(m_owner->initializer).transform;
            if (transform)
                return transform(parentValue);
            if constexpr (std::is_copy_constructible_v<V>)
                return parentValue;
            else
                throw Exceptions::NotSupportedException("Inheriting a non-copyable value requires a transform");
        }

    private:
        friend class WeakHandle<V>;

        explicit Handle(detail::HandleOwner<V> owner) noexcept : m_owner(std::move(owner)) {}

        [[nodiscard]] static Handle Make_(UInt32 hashCode, Initializer<V> init)
        {
            return Handle(Memory::MakeShared<StateType>(Memory::SystemAllocator {}, hashCode, std::move(init)));
        }

        detail::HandleOwner<V> m_owner {};
    };

    /// @brief Weak reference to a handle's identity, as stored in table entries.
    template<class V>
    class WeakHandle
    {
    public:
        using StateType = detail::HandleState<V>;

        WeakHandle() noexcept = default;
        explicit WeakHandle(const Handle<V>& handle) noexcept : m_ticket(Memory::MakeTicket(handle.m_owner)) {}

        /// @brief The identity if it is still alive, null once its last handle is gone or after Unlink().
        [[nodiscard]] const StateType* Resolve() const noexcept { return m_ticket.Peek(); }

        [[nodiscard]] bool Refers(const Handle<V>& handle) const noexcept { return m_ticket.Refers(handle.m_owner); }

        [[nodiscard]] bool Expired() const noexcept { return m_ticket.Expired(); }

        /// @brief A strong handle to the same identity, or an empty handle if it has died.
        [[nodiscard]] Handle<V> Lock() const noexcept { return Handle<V>(m_ticket.Lock()); }

        /// @brief Drop the reference explicitly; the entry reads as stale afterwards.
        void Unlink() noexcept { m_ticket.Reset(); }

        void Swap(WeakHandle& other) noexcept { m_ticket.Swap(other.m_ticket); }

    private:
        detail::HandleTicket<V> m_ticket {};
    };

    template<class V>
    WeakHandle<V> Handle<V>::Weak() const noexcept
    {
        return WeakHandle<V>(*this);
    }
}// namespace Locus::Locals
