#pragma once

#include <array-kit/fixed_array.hh>
#include <array-kit/pair.hh>
#include <array-kit/tuple_bridge.hh>
#include <array-kit/utility.hh>

#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

/// Length-generic implementation of the fixed_array capability set.
/// One template over N, every operation is a single pack expansion over std::index_sequence<0 .. N-1>.
///
/// Element order:
///   All results are built with braced initialization, so the element expressions
///   (and therefore every call of a user closure) are evaluated strictly in ascending index order.
///
/// Ownership:
///   Consuming operations take the source as rvalue reference and move every element exactly once.
///   If a closure throws, the already built result elements are destroyed by the aggregate
///   initialization and the source still owns its remaining (moved-from or untouched) elements.
///
/// Closures:
///   The body is written once for every N, so it cannot rely on a closure being called at most once.
///   Closures are always invoked as lvalues (ak::invocable_repeatedly), even for N <= 1.
///   generate results must initialize a T implicitly and without narrowing (ak::invocable_repeatedly_r).
///
/// repeat:
///   Requires ak::duplicable<T> for every N, including N <= 1.
///   Each slot holds its own ak::duplicate of the value.
///
/// push / pop:
///   The result lengths N + 1 and N - 1 are template arguments evaluated at instantiation,
///   pop is constrained to N > 0.
template <ak::isize N>
struct ak::generic::array_ops
{
    static_assert(N >= 0, "fixed_array size must be non-negative");

    using indices_t = std::make_index_sequence<std::size_t(N)>;

    // transformation
public:
    template <class T, class F>
        requires ak::invocable_repeatedly<F, T&&>
    [[nodiscard]] static constexpr auto map(fixed_array<T, N>&& a, F&& f)
    {
        return map_impl(a, f, indices_t{});
    }

    template <class T, class F>
        requires ak::invocable_repeatedly<F, T const&>
    [[nodiscard]] static constexpr auto map(fixed_array<T, N> const& a, F&& f)
    {
        return map_cref_impl(a, f, indices_t{});
    }

    template <class T, class U>
    [[nodiscard]] static constexpr fixed_array<pair<T, U>, N> zip(fixed_array<T, N>&& a, fixed_array<U, N>&& b)
    {
        return zip_impl(a, b, indices_t{});
    }

    // factories
public:
    template <class T, class F>
        requires ak::invocable_repeatedly_r<F, T>
    [[nodiscard]] static constexpr fixed_array<T, N> generate(F&& f)
    {
        return generate_impl<T>(f, indices_t{});
    }

    template <class T, class F>
        requires ak::invocable_repeatedly_r<F, T, isize>
    [[nodiscard]] static constexpr fixed_array<T, N> generate_with(F&& f)
    {
        return generate_with_impl<T>(f, indices_t{});
    }

    [[nodiscard]] static constexpr fixed_array<isize, N> indices() { return indices_impl(indices_t{}); }

    template <class T>
        requires ak::duplicable<T>
    [[nodiscard]] static constexpr fixed_array<T, N> repeat(T value)
    {
        return repeat_impl(value, indices_t{});
    }

    // borrowing
public:
    template <class T>
    [[nodiscard]] static constexpr fixed_array<T const*, N> as_ref(fixed_array<T, N> const& a)
    {
        return as_ref_impl(a, indices_t{});
    }

    template <class T>
    [[nodiscard]] static constexpr fixed_array<T*, N> as_mut(fixed_array<T, N>& a)
    {
        return as_mut_impl(a, indices_t{});
    }

    // tuple bridge
public:
    template <class T>
        requires ak::has_tuple_shape<N>
    [[nodiscard]] static constexpr homogeneous_tuple<T, N> into_tuple(fixed_array<T, N>&& a)
    {
        return into_tuple_impl(a, indices_t{});
    }

    template <class T>
        requires ak::has_tuple_shape<N>
    [[nodiscard]] static constexpr fixed_array<T, N> from_tuple(homogeneous_tuple<T, N>&& t)
    {
        return from_tuple_impl<T>(t, indices_t{});
    }

    // length changes
public:
    template <class T>
    [[nodiscard]] static constexpr fixed_array<T, N + 1> push_back(fixed_array<T, N>&& a, T item)
    {
        return push_back_impl(a, item, indices_t{});
    }

    template <class T>
    [[nodiscard]] static constexpr fixed_array<T, N + 1> push_front(fixed_array<T, N>&& a, T item)
    {
        return push_front_impl(a, item, indices_t{});
    }

    template <class T>
        requires(N > 0)
    [[nodiscard]] static constexpr pair<T, fixed_array<T, N - 1>> pop_back(fixed_array<T, N>&& a)
    {
        return pop_back_impl(a, std::make_index_sequence<std::size_t(N - 1)>{});
    }

    template <class T>
        requires(N > 0)
    [[nodiscard]] static constexpr pair<T, fixed_array<T, N - 1>> pop_front(fixed_array<T, N>&& a)
    {
        return pop_front_impl(a, std::make_index_sequence<std::size_t(N - 1)>{});
    }

    // implementation
private:
    template <class T, class F, std::size_t... I>
    static constexpr auto map_impl(fixed_array<T, N>& a, F& f, std::index_sequence<I...>)
    {
        using U = std::remove_cvref_t<std::invoke_result_t<F&, T&&>>;
        return fixed_array<U, N>{std::invoke(f, ak::move(a._data[I]))...};
    }

    template <class T, class F, std::size_t... I>
    static constexpr auto map_cref_impl(fixed_array<T, N> const& a, F& f, std::index_sequence<I...>)
    {
        using U = std::remove_cvref_t<std::invoke_result_t<F&, T const&>>;
        return fixed_array<U, N>{std::invoke(f, a._data[I])...};
    }

    template <class T, class U, std::size_t... I>
    static constexpr fixed_array<pair<T, U>, N> zip_impl(fixed_array<T, N>& a, fixed_array<U, N>& b, std::index_sequence<I...>)
    {
        return {pair<T, U>{ak::move(a._data[I]), ak::move(b._data[I])}...};
    }

    template <class T, class F, std::size_t... I>
    static constexpr fixed_array<T, N> generate_impl(F& f, std::index_sequence<I...>)
    {
        return {((void)I, std::invoke(f))...};
    }

    template <class T, class F, std::size_t... I>
    static constexpr fixed_array<T, N> generate_with_impl(F& f, std::index_sequence<I...>)
    {
        return {std::invoke(f, isize(I))...};
    }

    template <std::size_t... I>
    static constexpr fixed_array<isize, N> indices_impl(std::index_sequence<I...>)
    {
        return {isize(I)...};
    }

    template <class T, std::size_t... I>
    static constexpr fixed_array<T, N> repeat_impl(T const& value, std::index_sequence<I...>)
    {
        return {((void)I, ak::duplicate(value))...};
    }

    template <class T, std::size_t... I>
    static constexpr fixed_array<T const*, N> as_ref_impl(fixed_array<T, N> const& a, std::index_sequence<I...>)
    {
        return {std::addressof(a._data[I])...};
    }

    template <class T, std::size_t... I>
    static constexpr fixed_array<T*, N> as_mut_impl(fixed_array<T, N>& a, std::index_sequence<I...>)
    {
        return {std::addressof(a._data[I])...};
    }

    template <class T, std::size_t... I>
    static constexpr homogeneous_tuple<T, N> into_tuple_impl(fixed_array<T, N>& a, std::index_sequence<I...>)
    {
        return homogeneous_tuple<T, N>{ak::move(a._data[I])...};
    }

    template <class T, std::size_t... I>
    static constexpr fixed_array<T, N> from_tuple_impl(homogeneous_tuple<T, N>& t, std::index_sequence<I...>)
    {
        return {std::get<I>(ak::move(t))...};
    }

    template <class T, std::size_t... I>
    static constexpr fixed_array<T, N + 1> push_back_impl(fixed_array<T, N>& a, T& item, std::index_sequence<I...>)
    {
        return {ak::move(a._data[I])..., ak::move(item)};
    }

    template <class T, std::size_t... I>
    static constexpr fixed_array<T, N + 1> push_front_impl(fixed_array<T, N>& a, T& item, std::index_sequence<I...>)
    {
        return {ak::move(item), ak::move(a._data[I])...};
    }

    template <class T, std::size_t... I>
    static constexpr pair<T, fixed_array<T, N - 1>> pop_back_impl(fixed_array<T, N>& a, std::index_sequence<I...>)
    {
        return {ak::move(a._data[N - 1]), fixed_array<T, N - 1>{ak::move(a._data[I])...}};
    }

    template <class T, std::size_t... I>
    static constexpr pair<T, fixed_array<T, N - 1>> pop_front_impl(fixed_array<T, N>& a, std::index_sequence<I...>)
    {
        return {ak::move(a._data[0]), fixed_array<T, N - 1>{ak::move(a._data[I + 1])...}};
    }
};
