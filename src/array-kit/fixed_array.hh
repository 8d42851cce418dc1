#pragma once

#include <array-kit/assert.hh>
#include <array-kit/fwd.hh>
#include <array-kit/pair.hh>
#include <array-kit/tuple_bridge.hh>
#include <array-kit/utility.hh>

#include <type_traits>
#include <utility>


// TODO:
// - order, hashing


namespace ak::impl
{
// Names ak::array_ops<N> through a type that depends on T.
// fixed_array<T, 0> would otherwise name the still incomplete ak::array_ops<0> at definition time.
template <class T, isize N>
struct array_ops_of
{
    using type = ak::array_ops<N>;
};
} // namespace ak::impl

/// Fixed-size array of exactly N elements of type T.
/// Trivial aggregate type - supports aggregate initialization: fixed_array<int, 3> arr = {1, 2, 3}.
/// Owns the underlying memory, never allocates.
///
/// Besides element access it carries the functional capability set:
///   map, zip, generate, generate_with, repeat, as_ref_array, as_mut_array,
///   into_tuple, from_tuple, push_back, push_front, pop_back, pop_front.
/// Every capability forwards to ak::array_ops<N>, i.e. to the strategy chosen by AK_ARRAY_OPS_STRATEGY.
///
/// Consuming operations are rvalue-qualified, an lvalue has to be moved in explicitly:
///   auto b = ak::move(a).map(f);
/// Length-changing operations return a new array of a different type, the length of an array never changes.
template <class T, ak::isize N>
struct ak::fixed_array
{
    static_assert(N >= 0, "fixed_array size must be non-negative");

    using element_t = T;
    static constexpr isize length = N;

    // capability dispatch, dependent on T so that it is only looked up once array_ops.hh is complete
private:
    using ops = typename ak::impl::array_ops_of<T, N>::type;

    // members
public:
    T _data[N];

    // element access
public:
    /// Returns a reference to the element at index i.
    /// Precondition: 0 <= i < N.
    [[nodiscard]] constexpr T& operator[](isize i)
    {
        AK_ASSERT(0 <= i && i < N, "index out of bounds");
        return _data[i];
    }
    [[nodiscard]] constexpr T const& operator[](isize i) const
    {
        AK_ASSERT(0 <= i && i < N, "index out of bounds");
        return _data[i];
    }

    [[nodiscard]] constexpr T& front() { return _data[0]; }
    [[nodiscard]] constexpr T const& front() const { return _data[0]; }

    [[nodiscard]] constexpr T& back() { return _data[N - 1]; }
    [[nodiscard]] constexpr T const& back() const { return _data[N - 1]; }

    /// Returns a pointer to the underlying contiguous storage.
    [[nodiscard]] constexpr T* data() { return _data; }
    [[nodiscard]] constexpr T const* data() const { return _data; }

    // iterators
public:
    [[nodiscard]] constexpr T* begin() { return _data; }
    [[nodiscard]] constexpr T* end() { return _data + N; }
    [[nodiscard]] constexpr T const* begin() const { return _data; }
    [[nodiscard]] constexpr T const* end() const { return _data + N; }

    // queries
public:
    [[nodiscard]] constexpr isize size() const { return N; }
    [[nodiscard]] constexpr bool empty() const { return N == 0; }

    // tuple protocol
public:
    /// Returns a reference to the I-th element.
    /// Supports std::get<I>(arr) and structured bindings.
    template <isize I>
    [[nodiscard]] constexpr T& get()
    {
        static_assert(0 <= I && I < N, "index out of bounds");
        return _data[I];
    }
    template <isize I>
    [[nodiscard]] constexpr T const& get() const
    {
        static_assert(0 <= I && I < N, "index out of bounds");
        return _data[I];
    }

    // comparison
public:
    /// Element-wise equality, only available if T is equality comparable.
    [[nodiscard]] friend constexpr bool operator==(fixed_array const&, fixed_array const&) = default;

    // transformation
public:
    /// Returns [f(a[0]), f(a[1]), ..., f(a[N-1])].
    /// f is called exactly once per element, in ascending index order, and receives the element as rvalue.
    /// If f throws, every element (consumed or not) is still destroyed exactly once.
    /// The result element type is the decayed return type of f.
    /// Usage:
    ///   auto b = ak::move(a).map([](int x) { return x + 1; });
    template <class F>
        requires requires(fixed_array&& a, F&& f) { ops::map(ak::move(a), ak::forward<F>(f)); }
    [[nodiscard]] constexpr auto map(F&& f) &&
    {
        return ops::map(ak::move(*this), ak::forward<F>(f));
    }
    /// Non-consuming map, f receives T const&.
    template <class F>
        requires requires(fixed_array const& a, F&& f) { ops::map(a, ak::forward<F>(f)); }
    [[nodiscard]] constexpr auto map(F&& f) const&
    {
        return ops::map(*this, ak::forward<F>(f));
    }

    /// Returns [pair{a[0], b[0]}, ..., pair{a[N-1], b[N-1]}], consuming both arrays.
    /// Both operands have the same N by type, there is no length mismatch case.
    template <class U>
        requires requires(fixed_array&& a, fixed_array<U, N>&& b) { ops::zip(ak::move(a), ak::move(b)); }
    [[nodiscard]] constexpr auto zip(fixed_array<U, N>&& other) &&
    {
        return ops::zip(ak::move(*this), ak::move(other));
    }

    // factories
public:
    /// Calls f() exactly N times, in ascending index order, and stores the results.
    /// The result of f must convert implicitly to T, narrowing conversions do not compile.
    /// State must be captured by the closure itself.
    /// Usage:
    ///   int state = 1;
    ///   auto a = ak::fixed_array<int, 4>::generate([&] { return state *= 2; }); // [2, 4, 8, 16]
    template <class F>
        requires requires(F&& f) { ops::template generate<T>(ak::forward<F>(f)); }
    [[nodiscard]] static constexpr fixed_array generate(F&& f)
    {
        return ops::template generate<T>(ak::forward<F>(f));
    }

    /// Calls f(i) for i = 0 .. N-1 in ascending order and stores the results.
    template <class F>
        requires requires(F&& f) { ops::template generate_with<T>(ak::forward<F>(f)); }
    [[nodiscard]] static constexpr fixed_array generate_with(F&& f)
    {
        return ops::template generate_with<T>(ak::forward<F>(f));
    }

    /// Returns an array where every slot holds its own duplicate of value.
    /// The duplication requirement depends on the strategy:
    ///   generic:  T must be ak::duplicable (copy or clone()) for every N
    ///   unrolled: N <= 1 needs no duplication (value is moved in), N >= 2 requires a copy constructor
    /// Unavailable (the constraint fails) when T does not meet the requirement.
    [[nodiscard]] static constexpr fixed_array repeat(T value)
        requires requires(T v) { ops::template repeat<T>(ak::move(v)); }
    {
        return ops::template repeat<T>(ak::move(value));
    }

    /// Inverse of into_tuple, only for N in 0 .. ak::max_tuple_arity.
    /// Usage:
    ///   auto a = ak::fixed_array<int, 5>::from_tuple(std::tuple{1, 1, 2, 3, 5});
    template <class Tuple>
        requires(ak::has_tuple_shape<N> && std::is_same_v<std::remove_cvref_t<Tuple>, homogeneous_tuple<T, N>>)
    [[nodiscard]] static constexpr fixed_array from_tuple(Tuple&& t)
    {
        return ops::template from_tuple<T>(homogeneous_tuple<T, N>(ak::forward<Tuple>(t)));
    }

    // borrowing
public:
    /// Returns [&a[0], ..., &a[N-1]] without consuming the array.
    /// The pointers are only valid as long as this array lives, hence not callable on rvalues.
    [[nodiscard]] constexpr auto as_ref_array() const& { return ops::as_ref(*this); }
    void as_ref_array() && = delete;
    void as_ref_array() const&& = delete;

    /// Mutable version of as_ref_array.
    [[nodiscard]] constexpr auto as_mut_array() & { return ops::as_mut(*this); }

    // tuple bridge
public:
    /// Returns std::tuple<T, ..., T> with the elements in order, only for N in 0 .. ak::max_tuple_arity.
    [[nodiscard]] constexpr auto into_tuple() &&
        requires(ak::has_tuple_shape<N> && requires(fixed_array&& a) { ops::into_tuple(ak::move(a)); })
    {
        return ops::into_tuple(ak::move(*this));
    }

    // length changes
public:
    /// Returns [a[0], ..., a[N-1], item] as fixed_array<T, N + 1>.
    [[nodiscard]] constexpr auto push_back(T item) &&
        requires requires(fixed_array&& a, T v) { ops::push_back(ak::move(a), ak::move(v)); }
    {
        return ops::push_back(ak::move(*this), ak::move(item));
    }
    /// Returns [item, a[0], ..., a[N-1]] as fixed_array<T, N + 1>.
    [[nodiscard]] constexpr auto push_front(T item) &&
        requires requires(fixed_array&& a, T v) { ops::push_front(ak::move(a), ak::move(v)); }
    {
        return ops::push_front(ak::move(*this), ak::move(item));
    }

    /// Returns pair{a[N-1], [a[0], ..., a[N-2]]}.
    /// Not available for N == 0.
    /// Usage:
    ///   auto [last, rest] = ak::move(a).pop_back();
    [[nodiscard]] constexpr auto pop_back() &&
        requires requires(fixed_array&& a) { ops::pop_back(ak::move(a)); }
    {
        return ops::pop_back(ak::move(*this));
    }
    /// Returns pair{a[0], [a[1], ..., a[N-1]]}.
    /// Not available for N == 0.
    [[nodiscard]] constexpr auto pop_front() &&
        requires requires(fixed_array&& a) { ops::pop_front(ak::move(a)); }
    {
        return ops::pop_front(ak::move(*this));
    }
};

/// Specialization for N == 0 (empty array).
/// Zero-sized arrays T[0] are not valid in standard C++.
/// Element access is rejected at compile time, pop_back / pop_front do not exist.
template <class T>
struct ak::fixed_array<T, 0>
{
    using element_t = T;
    static constexpr isize length = 0;

private:
    using ops = typename ak::impl::array_ops_of<T, 0>::type;

    // element access
public:
    [[nodiscard]] constexpr T& operator[](isize)
    {
        static_assert(!std::is_same_v<T, T>, "operator[] not available on empty fixed_array");
    }
    [[nodiscard]] constexpr T const& operator[](isize) const
    {
        static_assert(!std::is_same_v<T, T>, "operator[] not available on empty fixed_array");
    }

    [[nodiscard]] constexpr T& front() { static_assert(!std::is_same_v<T, T>, "front() not available on empty fixed_array"); }
    [[nodiscard]] constexpr T const& front() const
    {
        static_assert(!std::is_same_v<T, T>, "front() not available on empty fixed_array");
    }

    [[nodiscard]] constexpr T& back() { static_assert(!std::is_same_v<T, T>, "back() not available on empty fixed_array"); }
    [[nodiscard]] constexpr T const& back() const
    {
        static_assert(!std::is_same_v<T, T>, "back() not available on empty fixed_array");
    }

    /// Returns nullptr for empty array.
    [[nodiscard]] constexpr T* data() { return nullptr; }
    [[nodiscard]] constexpr T const* data() const { return nullptr; }

    // iterators
public:
    [[nodiscard]] constexpr T* begin() { return nullptr; }
    [[nodiscard]] constexpr T* end() { return nullptr; }
    [[nodiscard]] constexpr T const* begin() const { return nullptr; }
    [[nodiscard]] constexpr T const* end() const { return nullptr; }

    // queries
public:
    [[nodiscard]] constexpr isize size() const { return 0; }
    [[nodiscard]] constexpr bool empty() const { return true; }

    // comparison
public:
    [[nodiscard]] friend constexpr bool operator==(fixed_array const&, fixed_array const&) = default;

    // capabilities, see the primary template
public:
    template <class F>
        requires requires(fixed_array&& a, F&& f) { ops::map(ak::move(a), ak::forward<F>(f)); }
    [[nodiscard]] constexpr auto map(F&& f) &&
    {
        return ops::map(ak::move(*this), ak::forward<F>(f));
    }
    template <class F>
        requires requires(fixed_array const& a, F&& f) { ops::map(a, ak::forward<F>(f)); }
    [[nodiscard]] constexpr auto map(F&& f) const&
    {
        return ops::map(*this, ak::forward<F>(f));
    }

    template <class U>
        requires requires(fixed_array&& a, fixed_array<U, 0>&& b) { ops::zip(ak::move(a), ak::move(b)); }
    [[nodiscard]] constexpr auto zip(fixed_array<U, 0>&& other) &&
    {
        return ops::zip(ak::move(*this), ak::move(other));
    }

    template <class F>
        requires requires(F&& f) { ops::template generate<T>(ak::forward<F>(f)); }
    [[nodiscard]] static constexpr fixed_array generate(F&& f)
    {
        return ops::template generate<T>(ak::forward<F>(f));
    }
    template <class F>
        requires requires(F&& f) { ops::template generate_with<T>(ak::forward<F>(f)); }
    [[nodiscard]] static constexpr fixed_array generate_with(F&& f)
    {
        return ops::template generate_with<T>(ak::forward<F>(f));
    }
    [[nodiscard]] static constexpr fixed_array repeat(T value)
        requires requires(T v) { ops::template repeat<T>(ak::move(v)); }
    {
        return ops::template repeat<T>(ak::move(value));
    }
    template <class Tuple>
        requires std::is_same_v<std::remove_cvref_t<Tuple>, std::tuple<>>
    [[nodiscard]] static constexpr fixed_array from_tuple(Tuple&& t)
    {
        return ops::template from_tuple<T>(std::tuple<>(ak::forward<Tuple>(t)));
    }

    [[nodiscard]] constexpr auto as_ref_array() const& { return ops::as_ref(*this); }
    void as_ref_array() && = delete;
    void as_ref_array() const&& = delete;
    [[nodiscard]] constexpr auto as_mut_array() & { return ops::as_mut(*this); }

    [[nodiscard]] constexpr auto into_tuple() && { return ops::into_tuple(ak::move(*this)); }

    [[nodiscard]] constexpr auto push_back(T item) &&
        requires requires(fixed_array&& a, T v) { ops::push_back(ak::move(a), ak::move(v)); }
    {
        return ops::push_back(ak::move(*this), ak::move(item));
    }
    [[nodiscard]] constexpr auto push_front(T item) &&
        requires requires(fixed_array&& a, T v) { ops::push_front(ak::move(a), ak::move(v)); }
    {
        return ops::push_front(ak::move(*this), ak::move(item));
    }
};

namespace ak
{
/// Deduces fixed_array{1, 2, 3} as fixed_array<int, 3>; all initializers must have the same type.
template <class T, class... U>
    requires(std::is_same_v<T, U> && ...)
fixed_array(T, U...) -> fixed_array<T, isize(1 + sizeof...(U))>;
} // namespace ak

/// Specialization of std::tuple_size for fixed_array to enable structured bindings.
template <class T, ak::isize N>
struct std::tuple_size<ak::fixed_array<T, N>> : std::integral_constant<std::size_t, static_cast<std::size_t>(N)>
{
};

/// Specialization of std::tuple_element for fixed_array to enable structured bindings.
/// All elements have type T.
template <std::size_t I, class T, ak::isize N>
struct std::tuple_element<I, ak::fixed_array<T, N>>
{
    using type = T;
};

// the capability dispatch needs the complete fixed_array
#include <array-kit/array_ops.hh>
