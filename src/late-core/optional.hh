#pragma once

#include <late-core/assert.hh>
#include <late-core/fwd.hh>
#include <late-core/utility.hh>

#include <type_traits>

/// Sentinel type used to represent the "no value" state in optional.
/// Construct as lc::nullopt to explicitly assign or compare against empty optionals.
/// Deliberately lacks a default constructor to avoid ambiguity in optional<T> = {}.
struct lc::nullopt_t
{
    enum class _ctor_tag // NOLINT(readability-identifier-naming)
    {
        tag
    };
    explicit constexpr nullopt_t(_ctor_tag) {}
};

namespace lc
{
/// The canonical instance of nullopt_t used to construct or assign empty optionals.
constexpr nullopt_t nullopt = nullopt_t{nullopt_t::_ctor_tag::tag};
} // namespace lc

/// Sum type representing either a value of type T or no value (T | none), similar to std::optional.
/// This is the present/absent container behind checked_cell<T>.
/// No operator* or operator-> to avoid misuse; value() asserts presence.
/// Trivially copyable and destructible when T is.
/// All constructors are constexpr so an optional can sit in a constinit placeholder.
template <class T>
struct lc::optional
{
    static_assert(!std::is_reference_v<T> || std::is_lvalue_reference_v<T>, "optional<T&&> is not supported");

    // construction
public:
    /// Default optional is empty: has_value() == false.
    constexpr optional() = default;

    /// Constructs an optional holding the given value; conditionally explicit.
    /// The value is built directly inside the storage, which keeps this usable in constant expressions.
    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, optional> && !std::is_same_v<std::remove_cvref_t<U>, nullopt_t>
                 && std::is_constructible_v<T, U &&>)
    explicit(!std::is_convertible_v<U, T>) constexpr optional(U&& value) // NOLINT
      : _storage(lc::in_place, lc::forward<U>(value)), _has_value(true)
    {
    }

    /// Constructs an empty optional from lc::nullopt.
    constexpr optional(nullopt_t) {}

    // trivial copy/move/destroy - defaulted when T allows bitwise operations
public:
    optional(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;

    ~optional()
        requires std::is_trivially_destructible_v<T>
    = default;

    // non-trivial copy/move/destroy - custom implementation when T requires special handling
public:
    /// Move constructor for non-trivial T: move-constructs value, then destroys rhs and marks it empty.
    optional(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
        {
            new (lc::placement_new, _storage.placement_address()) T(lc::move(rhs._storage.value));
            rhs._storage.value.~T();
            rhs._has_value = false;
        }
    }

    /// Copy constructor for non-trivial T: copy-constructs value when rhs holds one.
    optional(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (lc::placement_new, _storage.placement_address()) T(rhs._storage.value);
    }

    /// Move assignment for non-trivial T: moves or constructs from rhs, handling all state combinations.
    /// Leaves rhs engaged with a moved-from value (matches std::optional behavior).
    optional& operator=(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (rhs._has_value)
        {
            if (_has_value)
                _storage.value = lc::move(rhs._storage.value);
            else
                new (lc::placement_new, _storage.placement_address()) T(lc::move(rhs._storage.value));

            _has_value = true;
        }
        else if (_has_value)
        {
            _storage.value.~T();
            _has_value = false;
        }

        return *this;
    }

    /// Copy assignment for non-trivial T: copies or constructs from rhs, handling all state combinations.
    optional& operator=(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T> && std::is_copy_assignable_v<T>)
    {
        if (this != &rhs)
        {
            if (rhs._has_value)
            {
                if (_has_value)
                    _storage.value = rhs._storage.value;
                else
                    new (lc::placement_new, _storage.placement_address()) T(rhs._storage.value);

                _has_value = true;
            }
            else if (_has_value)
            {
                _storage.value.~T();
                _has_value = false;
            }
        }

        return *this;
    }

    /// Destructor for non-trivial T: destroys the held value if present.
    constexpr ~optional()
        requires(!std::is_trivially_destructible_v<T>)
    {
        if (_has_value)
            _storage.value.~T();
    }

    // modification
public:
    /// Constructs a new value in place, destroying the previous one first if present.
    /// Returns a reference to the new value.
    template <class... Args>
    T& emplace(Args&&... args)
    {
        if (_has_value)
        {
            _storage.value.~T();
            _has_value = false;
        }

        new (lc::placement_new, _storage.placement_address()) T(lc::forward<Args>(args)...);
        _has_value = true;
        return _storage.value;
    }

    // queries and access
public:
    /// Returns true if this optional holds a value, false if empty.
    [[nodiscard]] constexpr bool has_value() const { return _has_value; }

    /// Returns a reference to the held value.
    /// Precondition: has_value() == true.
    [[nodiscard]] constexpr T& value() &
    {
        LC_ASSERT(_has_value, "attempted to access value of empty optional");
        return _storage.value;
    }
    [[nodiscard]] constexpr T const& value() const&
    {
        LC_ASSERT(_has_value, "attempted to access value of empty optional");
        return _storage.value;
    }
    [[nodiscard]] constexpr T&& value() &&
    {
        LC_ASSERT(_has_value, "attempted to access value of empty optional");
        return lc::move(_storage.value);
    }

    // comparison
public:
    /// Equality comparison: two optionals are equal if both empty or both hold equal values.
    [[nodiscard]] friend bool operator==(optional const& lhs, optional const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        if (lhs._has_value != rhs._has_value)
            return false;
        if (lhs._has_value)
            return lhs._storage.value == rhs._storage.value;
        return true;
    }

    /// Equality comparison with a value: optional is equal to the value if it holds an equal value.
    [[nodiscard]] friend bool operator==(optional const& lhs, T const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        return lhs._has_value && lhs._storage.value == rhs;
    }

    /// Deleted when T is not bool to prevent optional<int> from comparing with true/false.
    [[nodiscard]] bool operator==(bool) const
        requires(!std::is_same_v<T, bool>)
    = delete;

    // members
private:
    /// Uninitialized storage with proper size and alignment for T.
    lc::storage_for<T> _storage;

    /// True when _storage.value holds a live T object.
    bool _has_value = false;
};

/// Optional reference: either refers to a T or to nothing.
/// Non-owning, rebinding on assignment, trivially copyable (a single pointer).
/// Returned by checked_cell::try_get_reference so "absent" is an explicit result, never a null dereference.
/// Cannot bind to temporaries.
namespace lc
{
template <class T>
struct optional<T&>
{
public:
    constexpr optional() = default;
    constexpr optional(nullopt_t) {}

    constexpr optional(T& value) : _ptr(&value) {} // NOLINT
    optional(std::remove_cv_t<T>&&) = delete;

    /// optional<U&> -> optional<U const&> and similar pointer-compatible conversions
    template <class U>
        requires(!std::is_same_v<U, T> && std::is_convertible_v<U*, T*>)
    constexpr optional(optional<U&> const& rhs) // NOLINT
      : _ptr(rhs.has_value() ? &rhs.value() : nullptr)
    {
    }

public:
    [[nodiscard]] constexpr bool has_value() const { return _ptr != nullptr; }

    /// Precondition: has_value() == true.
    [[nodiscard]] constexpr T& value() const
    {
        LC_ASSERT(_ptr != nullptr, "attempted to access value of empty optional reference");
        return *_ptr;
    }

public:
    /// Compares the referenced value, not the address.
    [[nodiscard]] friend bool operator==(optional const& lhs, std::remove_cv_t<T> const& rhs)
        requires requires(T& v) { bool(v == v); }
    {
        return lhs._ptr != nullptr && *lhs._ptr == rhs;
    }

    [[nodiscard]] bool operator==(bool) const
        requires(!std::is_same_v<std::remove_cv_t<T>, bool>)
    = delete;

private:
    T* _ptr = nullptr;
};
} // namespace lc
