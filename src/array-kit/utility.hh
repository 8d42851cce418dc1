#pragma once

#include <array-kit/fwd.hh>
#include <array-kit/macros.hh>

#include <concepts>
#include <type_traits>
#include <utility>

// =========================================================================================================
// Utility functions and concepts shared by both array_ops strategies
// =========================================================================================================
//
// Move semantics:
//   move(value)                      - cast value to rvalue reference for moving
//   forward<T>(value)                - perfect forwarding for template arguments
//
// Duplication:
//   implicitly_duplicable<T>         - T is copy constructible
//   duplicable<T>                    - T is copy constructible or has "T clone() const"
//   duplicate(value)                 - copy or clone, whichever T offers (copy preferred)
//
// Closure capability tiers:
//   invocable_once<F, Args...>       - F can be called once as an rvalue (consumed by the call)
//   invocable_repeatedly<F, Args...> - F can be called any number of times as an lvalue
//   invocable_once_r<F, T, Args...>  - invocable_once and the result initializes a T element
//   invocable_repeatedly_r<F, T, Args...> - invocable_repeatedly and the result initializes a T element
//   element_initializable<R, T>      - R copy-initializes a T in a braced initializer (no explicit ctors, no narrowing)
//
// Callable utilities:
//   identify_function                - callable that returns its argument (identity function)
//
// Template metaprogramming:
//   always_false_v<V...>             - always false for static_assert with value parameters
//

namespace ak
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
/// Usage:
///   auto b = ak::move(a).map(f);  // consume a
template <class T>
[[nodiscard]] AK_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Perfect forwarding for template arguments
template <class T>
[[nodiscard]] AK_FORCE_INLINE constexpr T&& forward(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] AK_FORCE_INLINE constexpr T&& forward(T&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

// =========================================================================================================
// Duplication
// =========================================================================================================

/// T can be duplicated without asking: a plain copy construction
template <class T>
concept implicitly_duplicable = std::is_copy_constructible_v<T>;

/// T can be duplicated, implicitly (copy) or explicitly via a "T clone() const" member
/// Move-only handles with a clone() (unique strings, owning buffers) are duplicable
/// but not implicitly duplicable
template <class T>
concept duplicable = implicitly_duplicable<T> || requires(T const& v) {
    { v.clone() } -> std::same_as<T>;
};

/// Returns an independently owned duplicate of value
/// Copy construction wins when both copy and clone() are available
/// Usage:
///   auto b = ak::duplicate(a);
template <duplicable T>
[[nodiscard]] constexpr T duplicate(T const& value)
{
    if constexpr (implicitly_duplicable<T>)
        return value;
    else
        return value.clone();
}

// =========================================================================================================
// Closure capability tiers
// =========================================================================================================

/// F may be called exactly once, as an rvalue
/// This is the only requirement when the length is known to be at most 1
template <class F, class... Args>
concept invocable_once = std::is_invocable_v<F&&, Args...>;

/// F may be called any number of times, as an lvalue
/// Required whenever the number of calls is not statically known to be at most 1
template <class F, class... Args>
concept invocable_repeatedly = std::is_invocable_v<F&, Args...>;

/// An R can initialize an element of T[] = {r}
/// Rejects narrowing (double -> int), explicit constructors and dropping const (int const* -> int*)
template <class R, class T>
concept element_initializable = requires { std::type_identity_t<T[1]>{std::declval<R>()}; };

/// invocable_once whose result is an element_initializable T
template <class F, class T, class... Args>
concept invocable_once_r = invocable_once<F, Args...> && element_initializable<std::invoke_result_t<F&&, Args...>, T>;

/// invocable_repeatedly whose result is an element_initializable T
template <class F, class T, class... Args>
concept invocable_repeatedly_r
    = invocable_repeatedly<F, Args...> && element_initializable<std::invoke_result_t<F&, Args...>, T>;

// =========================================================================================================
// Callable utilities
// =========================================================================================================

/// Callable that returns its argument with perfect forwarding
/// Usage:
///   auto b = ak::move(a).map(ak::identify_function{});  // b == a
struct identify_function
{
    template <class T>
    constexpr T&& operator()(T&& arg) const noexcept
    {
        return forward<T>(arg);
    }
};

// =========================================================================================================
// Template metaprogramming utilities
// =========================================================================================================

/// Always false, but only after template instantiation
/// Usage:
///   static_assert(ak::always_false_v<L>, "length not supported");
template <auto... E>
constexpr bool always_false_v = false;

} // namespace ak
