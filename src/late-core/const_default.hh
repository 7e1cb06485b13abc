#pragma once

#include <late-core/checked_cell.hh>
#include <late-core/fwd.hh>
#include <late-core/unchecked_cell.hh>

#include <concepts>
#include <type_traits>

#if !LC_ENABLE_CONST_DEFAULT
#error "late-core/const_default.hh requires the LC_CONST_DEFAULT build option"
#endif

// =========================================================================================================
// Const default - canonical compile-time placeholder value of a type
//
// Opt-in integration point for code that populates placeholder fields generically, e.g. a register map or a
// table of driver slots built from a type list. Nothing in the cells depends on it.
//
// Provide a specialization with a constexpr factory:
//   template <>
//   struct lc::const_default<my_type>
//   {
//       static constexpr my_type make() { return my_type{}; }
//   };
//
// Usage:
//   template <class... Fields>
//   struct driver_table
//   {
//       std::tuple<Fields...> fields{lc::make_const_default<Fields>()...};
//   };
//
// Provided:
//   arithmetic types  -> 0
//   pointers          -> nullptr
//   unchecked_cell<T> -> empty cell
//   checked_cell<T>   -> empty cell (absent)
// =========================================================================================================

namespace lc
{
template <class T>
concept has_const_default = requires {
    { const_default<T>::make() } -> std::same_as<T>;
};

/// Returns the canonical placeholder of T as a prvalue, so non-movable types (like the cells) work too.
template <class T>
    requires has_const_default<T>
[[nodiscard]] constexpr T make_const_default()
{
    return const_default<T>::make();
}

template <class T>
    requires std::is_arithmetic_v<T>
struct const_default<T>
{
    static constexpr T make() { return T(0); }
};

template <class T>
struct const_default<T*>
{
    static constexpr T* make() { return nullptr; }
};

template <class T>
struct const_default<unchecked_cell<T>>
{
    static constexpr unchecked_cell<T> make() { return unchecked_cell<T>(); }
};

template <class T>
struct const_default<checked_cell<T>>
{
    static constexpr checked_cell<T> make() { return checked_cell<T>(); }
};
} // namespace lc
