#pragma once

#include <late-core/assert.hh>
#include <late-core/fwd.hh>
#include <late-core/optional.hh>
#include <late-core/utility.hh>

#include <type_traits>

/// Late-initialized slot that knows whether it was written (see unchecked_cell.hh for the shared contract).
///
/// States: absent -> present, via exactly one initialize. present is terminal.
/// create_with starts in present.
///
/// Contract checks (LC_ASSERT, active when LC_ASSERT_ENABLED):
///   - initialize on a present cell is reported; without assertions it silently replaces the value
///   - get_reference, get_mutable_reference and operator*/-> on an absent cell are reported;
///     without assertions that path is assumed unreachable (undefined behavior, not a checked error)
///
/// For legitimate uncertainty use the try_ accessors, they never assert:
///   - try_get_reference() / try_get_mutable_reference() return an empty optional when absent
///   - get_pointer() / get_mutable_pointer() return nullptr when absent
///
/// A present value is destroyed with the cell.
/// Costs one tag and a branch per access compared to unchecked_cell.
///
/// Usage:
///   constinit lc::checked_cell<board_revision> g_revision;
///
///   void boot() { g_revision.initialize(read_revision_pins()); }
///
///   if (auto rev = g_revision.try_get_reference(); rev.has_value())
///       use(rev.value());
template <class T>
struct lc::checked_cell
{
    static_assert(std::is_object_v<T> && !std::is_array_v<T>, "checked_cell requires a non-array object type");

    // construction
public:
    /// Empty placeholder: is_initialized() == false.
    constexpr checked_cell() = default;

    /// Present from the first instant: is_initialized() == true.
    [[nodiscard]] static constexpr checked_cell create_with(T value)
    {
        return checked_cell(lc::in_place, lc::move(value));
    }

    checked_cell(checked_cell const&) = delete;
    checked_cell(checked_cell&&) = delete;
    checked_cell& operator=(checked_cell const&) = delete;
    checked_cell& operator=(checked_cell&&) = delete;

    // queries
public:
    [[nodiscard]] constexpr bool is_initialized() const { return _inner.has_value(); }

    // initialization
public:
    /// The one absent -> present transition.
    /// Precondition: !is_initialized()
    void initialize(T value)
    {
        LC_ASSERT(!_inner.has_value(), "checked_cell initialized twice");
        _inner.emplace(lc::move(value));
    }

    /// Same transition through a shared cell.
    /// value is converted to T before anything is stored.
    /// The caller guarantees that no one else accesses the cell concurrently.
    template <class U>
        requires std::is_convertible_v<U&&, T>
    void initialize_unchecked(U&& value) const
    {
        T converted(lc::forward<U>(value));
        LC_ASSERT(!_inner.has_value(), "checked_cell initialized twice");
        _inner.emplace(lc::move(converted));
    }

    // non-asserting access
public:
    [[nodiscard]] constexpr lc::optional<T const&> try_get_reference() const
    {
        if (!_inner.has_value())
            return lc::nullopt;
        return _inner.value();
    }

    [[nodiscard]] constexpr lc::optional<T&> try_get_mutable_reference()
    {
        if (!_inner.has_value())
            return lc::nullopt;
        return _inner.value();
    }

    /// nullptr when absent
    [[nodiscard]] constexpr T const* get_pointer() const { return _inner.has_value() ? &_inner.value() : nullptr; }
    /// nullptr when absent
    [[nodiscard]] constexpr T* get_mutable_pointer() const { return _inner.has_value() ? &_inner.value() : nullptr; }

    // asserting access
public:
    /// Precondition: is_initialized()
    [[nodiscard]] constexpr T const& get_reference() const
    {
        if (!_inner.has_value()) [[unlikely]]
            on_uninitialized_access();
        return _inner.value();
    }

    /// Precondition: is_initialized()
    [[nodiscard]] constexpr T& get_mutable_reference()
    {
        if (!_inner.has_value()) [[unlikely]]
            on_uninitialized_access();
        return _inner.value();
    }

    /// Mutable access through a shared cell, caller guarantees exclusivity.
    /// Precondition: is_initialized()
    [[nodiscard]] constexpr T& get_mutable_reference_unchecked() const
    {
        if (!_inner.has_value()) [[unlikely]]
            on_uninitialized_access();
        return _inner.value();
    }

    [[nodiscard]] constexpr T const& operator*() const { return get_reference(); }
    [[nodiscard]] constexpr T& operator*() { return get_mutable_reference(); }
    [[nodiscard]] constexpr T const* operator->() const { return &get_reference(); }
    [[nodiscard]] constexpr T* operator->() { return &get_mutable_reference(); }

private:
    constexpr explicit checked_cell(in_place_t, T&& value) : _inner(lc::move(value)) {}

    [[noreturn]] static void on_uninitialized_access()
    {
        LC_ASSERT_UNREACHABLE("accessed checked_cell before initialization");
    }

    // members
private:
    mutable lc::optional<T> _inner;
};
