#pragma once

#include <late-core/fwd.hh>
#include <late-core/macros.hh>

#include <type_traits>

// =========================================================================================================
// Utility functions and storage primitives
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//
// Object lifetime:
//   placement_new               - tag for constructing into existing storage without <new>
//   in_place                    - tag for constructing the stored value directly in a constructor
//   storage_for<T>              - storage of undetermined validity, sized and aligned for T
//

namespace lc
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
/// Usage:
///   cell.initialize(lc::move(config));
template <class T>
[[nodiscard]] LC_FORCE_INLINE constexpr std::remove_reference_t<T>&& move(T&& value) noexcept
{
    return static_cast<std::remove_reference_t<T>&&>(value);
}

/// Perfect forwarding for template arguments
/// Preserves value category (lvalue/rvalue) when forwarding arguments
/// Usage:
///   template<class U>
///   void initialize_unchecked(U&& value) const {
///       construct(lc::forward<U>(value));  // forwards as lvalue or rvalue depending on U
///   }
template <class T>
[[nodiscard]] LC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] LC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

// =========================================================================================================
// Object lifetime
// =========================================================================================================

/// Tag type selecting the non-allocating operator new below
/// Lets freestanding code construct objects in place without depending on <new>
/// Usage:
///   new (lc::placement_new, storage.placement_address()) T(lc::forward<Args>(args)...);
struct placement_new_t
{
    explicit constexpr placement_new_t() = default;
};
constexpr placement_new_t placement_new = placement_new_t{};

/// Tag type for constructors that build the stored value directly
/// Unlike placement_new this works in constant expressions, so it is used by all constexpr constructors
struct in_place_t
{
    explicit constexpr in_place_t() = default;
};
constexpr in_place_t in_place = in_place_t{};

/// Storage of undetermined validity: a region sized and aligned for T that may or may not hold a live T
/// Neither constructor nor destructor of T runs implicitly, the owner decides when `value` is alive.
/// Every read of `value` is only valid after a construction through in_place or placement_new.
/// This is the single place where late-core steps outside of normal object lifetimes:
///   - optional<T> pairs it with a tag
///   - unchecked_cell<T> uses it raw
///
/// Trivially destructible when T is, so wrapping types keep their triviality.
/// Default construction is constexpr and holds no T, which allows constinit placeholders.
/// T may be const or volatile: writes go through placement_address(), never through `value` itself.
template <class T>
union storage_for
{
    T value;

    // active member of the empty state, keeps a default-constructed storage a valid constant
    struct empty_t
    {
    } empty;

    constexpr storage_for() noexcept : empty() {}

    template <class... Args>
    constexpr explicit storage_for(in_place_t, Args&&... args) : value(lc::forward<Args>(args)...)
    {
    }

    /// Target for placement_new, with cv-qualifiers of T stripped
    [[nodiscard]] void* placement_address() noexcept
    {
        return const_cast<void*>(static_cast<void const volatile*>(&value));
    }

    ~storage_for()
        requires std::is_trivially_destructible_v<T>
    = default;

    // the owner is responsible for ~T()
    constexpr ~storage_for()
        requires(!std::is_trivially_destructible_v<T>)
    {
    }
};

} // namespace lc

/// Non-allocating placement new, selected via lc::placement_new
[[nodiscard]] LC_FORCE_INLINE void* operator new(std::size_t, lc::placement_new_t, void* buffer) noexcept
{
    return buffer;
}

/// Matching delete, only called by the compiler if a constructor throws during placement new
LC_FORCE_INLINE void operator delete(void*, lc::placement_new_t, void*) noexcept {}
