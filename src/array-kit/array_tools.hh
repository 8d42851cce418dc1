#pragma once

#include <array-kit/array_ops.hh>
#include <array-kit/fixed_array.hh>
#include <array-kit/tuple_bridge.hh>
#include <array-kit/utility.hh>

#include <tuple>
#include <type_traits>

// =========================================================================================================
// Free functions around ak::fixed_array
// =========================================================================================================
//
// Factories where the length is the interesting parameter and the element type follows from the arguments:
//   generate<N>(f)              - [f(), f(), ..., f()], element type is the decayed result of f()
//   generate_with<N>(f)         - [f(0), f(1), ..., f(N-1)], element type is the decayed result of f(isize)
//   indices<N>()                - [0, 1, ..., N-1] as fixed_array<isize, N>
//   repeat<N>(value)            - N independent duplicates of value
//
// Tuple bridge:
//   from_tuple(std::tuple<T, T, ...>) - fixed_array<T, N>, all tuple elements must share one type
//   into_tuple(fixed_array<T, N>&&)   - std::tuple<T, ..., T>
//
// All of them go through ak::array_ops<N> like the fixed_array members and carry the same constraints,
// a call the strategy cannot serve fails overload resolution instead of the instantiation of a body.

namespace ak::impl
{
// element type produced by a generate / generate_with closure
template <class F, class... Args>
using generated_t = std::remove_cvref_t<std::invoke_result_t<F, Args...>>;
} // namespace ak::impl

namespace ak
{
/// Usage:
///   int state = 1;
///   auto a = ak::generate<4>([&] { return state *= 2; }); // [2, 4, 8, 16]
template <isize N, class F>
    requires(ak::invocable_once<F> && !std::is_void_v<impl::generated_t<F>>
             && requires(F&& f) { fixed_array<impl::generated_t<F>, N>::generate(ak::forward<F>(f)); })
[[nodiscard]] constexpr auto generate(F&& f)
{
    return fixed_array<impl::generated_t<F>, N>::generate(ak::forward<F>(f));
}

/// Usage:
///   auto squares = ak::generate_with<4>([](ak::isize i) { return i * i; }); // [0, 1, 4, 9]
template <isize N, class F>
    requires(ak::invocable_once<F, isize> && !std::is_void_v<impl::generated_t<F, isize>>
             && requires(F&& f) { fixed_array<impl::generated_t<F, isize>, N>::generate_with(ak::forward<F>(f)); })
[[nodiscard]] constexpr auto generate_with(F&& f)
{
    return fixed_array<impl::generated_t<F, isize>, N>::generate_with(ak::forward<F>(f));
}

template <isize N>
    requires requires { ak::array_ops<N>::indices(); }
[[nodiscard]] constexpr fixed_array<isize, N> indices()
{
    return ak::array_ops<N>::indices();
}

/// Same duplication requirement as fixed_array<T, N>::repeat, i.e. it depends on the strategy.
template <isize N, class T>
    requires requires(T v) { fixed_array<T, N>::repeat(ak::move(v)); }
[[nodiscard]] constexpr fixed_array<T, N> repeat(T value)
{
    return fixed_array<T, N>::repeat(ak::move(value));
}

/// Usage:
///   auto primes = ak::from_tuple(std::tuple{2, 3, 5, 7, 11}); // fixed_array<int, 5>
template <class T, class... Ts>
    requires(ak::has_tuple_shape<isize(1 + sizeof...(Ts))> && (std::is_same_v<T, Ts> && ...))
[[nodiscard]] constexpr fixed_array<T, isize(1 + sizeof...(Ts))> from_tuple(std::tuple<T, Ts...> t)
{
    return fixed_array<T, isize(1 + sizeof...(Ts))>::from_tuple(ak::move(t));
}

template <class T, isize N>
    requires requires(fixed_array<T, N>&& a) { ak::move(a).into_tuple(); }
[[nodiscard]] constexpr auto into_tuple(fixed_array<T, N>&& a)
{
    return ak::move(a).into_tuple();
}
} // namespace ak
