#pragma once

#include <late-core/fwd.hh>
#include <late-core/macros.hh>
#include <late-core/utility.hh>

#include <type_traits>

// =========================================================================================================
// Late initialization - shared contract of unchecked_cell<T> and checked_cell<T>
//
// A late cell is a slot that exists before its value does: declared as a global, a static or a member,
// written exactly once at runtime (after detecting hardware, parsing a config, ...) and then read as if it
// had always held the value.
//
// Both cells expose the same operations, so switching between them only changes the declared type:
//   default ctor / create_with(v)           - empty placeholder / initialized from the start (both constexpr)
//   initialize(v)                           - the one write, requires exclusive (non-const) access
//   initialize_unchecked(u)                 - the one write through a const (shared) cell, u convertible to T
//   get_pointer() / get_mutable_pointer()   - address of the storage
//   get_reference() / get_mutable_reference()
//   get_mutable_reference_unchecked()       - mutable access through a const (shared) cell
//   operator* / operator->
//
// Aliasing:
//   The storage is a mutable member. const members named *_unchecked and get_mutable_pointer() hand out
//   mutable access to a cell that may be shared. The caller guarantees that nobody else reads or writes
//   the value at the same time.
//
// Threads:
//   Cells contain no atomics and no fences. They are shareable, not synchronized:
//   exactly one writer initializes the cell, and every reader on any thread must be ordered after that
//   write by external means (thread start/join, an acquire/release flag, a barrier).
//   Anything else is a data race.
//
// Differences:
//   unchecked_cell  sizeof(T), no tag, read-before-write is UB, repeated initialize leaks the previous value,
//                   never destroys its value
//   checked_cell    optional<T>, read-before-write and double initialize are reported via LC_ASSERT,
//                   try_get_reference() checks without asserting, destroys its value
// =========================================================================================================

/// Late-initialized slot without any bookkeeping: same size and alignment as T, no tag, no checks.
///
/// Preconditions (all unchecked, violations are undefined behavior):
///   - no access to the value before the first initialize (unless built via create_with)
///   - initialize is expected once; a repeated initialize overwrites the storage WITHOUT destroying the
///     previous value, so its resources leak (never a double destroy)
///
/// The destructor never runs ~T(), the cell cannot know whether it was ever written.
/// If the value owns resources, tearing it down is the owner's job, e.g. lc::move(*cell) into a local.
///
/// Usage:
///   constinit lc::unchecked_cell<uart_config> g_uart;
///
///   void boot() { g_uart.initialize(detect_uart()); }
///   void send(byte b) { write_reg(g_uart->base, b); }
template <class T>
struct lc::unchecked_cell
{
    static_assert(std::is_object_v<T> && !std::is_array_v<T>, "unchecked_cell requires a non-array object type");

    // construction
public:
    /// Empty placeholder, the storage holds no T yet.
    constexpr unchecked_cell() noexcept {}

    /// Cell that holds value from the first instant.
    [[nodiscard]] static constexpr unchecked_cell create_with(T value)
    {
        return unchecked_cell(lc::in_place, lc::move(value));
    }

    unchecked_cell(unchecked_cell const&) = delete;
    unchecked_cell(unchecked_cell&&) = delete;
    unchecked_cell& operator=(unchecked_cell const&) = delete;
    unchecked_cell& operator=(unchecked_cell&&) = delete;

    ~unchecked_cell() = default;

    // initialization
public:
    /// Writes value into the storage.
    /// Always succeeds. A previously written value is overwritten without being destroyed.
    void initialize(T value) { this->construct(lc::move(value)); }

    /// Same effect as initialize, callable through a shared cell.
    /// The caller guarantees that no one else accesses the cell concurrently.
    template <class U>
        requires std::is_convertible_v<U&&, T>
    void initialize_unchecked(U&& value) const
    {
        this->construct(T(lc::forward<U>(value)));
    }

    // access
public:
    [[nodiscard]] constexpr T const* get_pointer() const { return &_storage.value; }
    [[nodiscard]] constexpr T* get_mutable_pointer() const { return &_storage.value; }

    [[nodiscard]] constexpr T const& get_reference() const { return _storage.value; }
    [[nodiscard]] constexpr T& get_mutable_reference() { return _storage.value; }

    /// Mutable access through a shared cell, caller guarantees exclusivity.
    [[nodiscard]] constexpr T& get_mutable_reference_unchecked() const { return _storage.value; }

    [[nodiscard]] constexpr T const& operator*() const { return _storage.value; }
    [[nodiscard]] constexpr T& operator*() { return _storage.value; }
    [[nodiscard]] constexpr T const* operator->() const { return &_storage.value; }
    [[nodiscard]] constexpr T* operator->() { return &_storage.value; }

private:
    template <class... Args>
    constexpr explicit unchecked_cell(in_place_t, Args&&... args) : _storage(lc::in_place, lc::forward<Args>(args)...)
    {
    }

    // all writes go through here
    template <class... Args>
    void construct(Args&&... args) const
    {
        new (lc::placement_new, _storage.placement_address()) T(lc::forward<Args>(args)...);
    }

    // members
private:
    mutable lc::storage_for<T> _storage;
};
