#pragma once

#include <array-kit/config.hh>
#include <array-kit/fixed_array.hh>
#include <array-kit/impl/unrolled_sequence.hh>
#include <array-kit/pair.hh>
#include <array-kit/tuple_bridge.hh>
#include <array-kit/utility.hh>

#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

/// Length-indexed implementation of the fixed_array capability set.
/// Every length 0 .. ak::max_unrolled_length has its own explicit specialization whose bodies
/// spell out each element. Lengths 0 and 1 are written by hand, 2 .. 32 are stamped out from
/// AK_IMPL_UNROLLED_ARRAY_OPS. All specializations implement the same contracts as
/// ak::generic::array_ops and differ only in the unrolled element count.
///
/// Differences to the generic strategy, all of them at compile time:
///   - N <= 1 only needs single-use closures (ak::invocable_once), they are invoked as rvalues
///   - repeat: N == 0 drops the value, N == 1 moves it in (move-only T is fine),
///     N >= 2 requires ak::implicitly_duplicable<T> (a clone() member is not enough)
///   - pop_front / pop_back do not exist for N == 0
///   - lengths above ak::max_unrolled_length have no operations, with one exception:
///     push on length 32 produces a fixed_array<T, 33>, which can only be popped back to length 32
///
/// The primary template is empty so that the constrained fixed_array members simply disappear
/// for lengths without a specialization.
template <ak::isize N>
struct ak::unrolled::array_ops
{
};

// =========================================================================================================
// N == 0
// =========================================================================================================

template <>
struct ak::unrolled::array_ops<0>
{
public:
    // f is never called
    template <class T, class F>
        requires ak::invocable_once<F, T&&>
    [[nodiscard]] static constexpr auto map(fixed_array<T, 0>&&, F&&)
    {
        using U = std::remove_cvref_t<std::invoke_result_t<F&&, T&&>>;
        return fixed_array<U, 0>{};
    }
    template <class T, class F>
        requires ak::invocable_once<F, T const&>
    [[nodiscard]] static constexpr auto map(fixed_array<T, 0> const&, F&&)
    {
        using U = std::remove_cvref_t<std::invoke_result_t<F&&, T const&>>;
        return fixed_array<U, 0>{};
    }
    template <class T, class U>
    [[nodiscard]] static constexpr fixed_array<pair<T, U>, 0> zip(fixed_array<T, 0>&&, fixed_array<U, 0>&&)
    {
        return {};
    }

public:
    template <class T, class F>
        requires ak::invocable_once_r<F, T>
    [[nodiscard]] static constexpr fixed_array<T, 0> generate(F&&)
    {
        return {};
    }
    template <class T, class F>
        requires ak::invocable_once_r<F, T, isize>
    [[nodiscard]] static constexpr fixed_array<T, 0> generate_with(F&&)
    {
        return {};
    }
    [[nodiscard]] static constexpr fixed_array<isize, 0> indices() { return {}; }
    // the value is dropped, no duplication capability needed
    template <class T>
    [[nodiscard]] static constexpr fixed_array<T, 0> repeat(T)
    {
        return {};
    }

public:
    template <class T>
    [[nodiscard]] static constexpr fixed_array<T const*, 0> as_ref(fixed_array<T, 0> const&)
    {
        return {};
    }
    template <class T>
    [[nodiscard]] static constexpr fixed_array<T*, 0> as_mut(fixed_array<T, 0>&)
    {
        return {};
    }

public:
    template <class T>
    [[nodiscard]] static constexpr homogeneous_tuple<T, 0> into_tuple(fixed_array<T, 0>&&)
    {
        return {};
    }
    template <class T>
    [[nodiscard]] static constexpr fixed_array<T, 0> from_tuple(homogeneous_tuple<T, 0>&&)
    {
        return {};
    }

public:
    template <class T>
    [[nodiscard]] static constexpr fixed_array<T, 1> push_back(fixed_array<T, 0>&&, T item)
    {
        return {ak::move(item)};
    }
    template <class T>
    [[nodiscard]] static constexpr fixed_array<T, 1> push_front(fixed_array<T, 0>&&, T item)
    {
        return {ak::move(item)};
    }
};

// =========================================================================================================
// N == 1
// =========================================================================================================

template <>
struct ak::unrolled::array_ops<1>
{
public:
    // f is called exactly once and may consume itself
    template <class T, class F>
        requires ak::invocable_once<F, T&&>
    [[nodiscard]] static constexpr auto map(fixed_array<T, 1>&& a, F&& f)
    {
        using U = std::remove_cvref_t<std::invoke_result_t<F&&, T&&>>;
        return fixed_array<U, 1>{std::invoke(ak::forward<F>(f), ak::move(a._data[0]))};
    }
    template <class T, class F>
        requires ak::invocable_once<F, T const&>
    [[nodiscard]] static constexpr auto map(fixed_array<T, 1> const& a, F&& f)
    {
        using U = std::remove_cvref_t<std::invoke_result_t<F&&, T const&>>;
        return fixed_array<U, 1>{std::invoke(ak::forward<F>(f), a._data[0])};
    }
    template <class T, class U>
    [[nodiscard]] static constexpr fixed_array<pair<T, U>, 1> zip(fixed_array<T, 1>&& a, fixed_array<U, 1>&& b)
    {
        return {pair<T, U>{ak::move(a._data[0]), ak::move(b._data[0])}};
    }

public:
    template <class T, class F>
        requires ak::invocable_once_r<F, T>
    [[nodiscard]] static constexpr fixed_array<T, 1> generate(F&& f)
    {
        return {std::invoke(ak::forward<F>(f))};
    }
    template <class T, class F>
        requires ak::invocable_once_r<F, T, isize>
    [[nodiscard]] static constexpr fixed_array<T, 1> generate_with(F&& f)
    {
        return {std::invoke(ak::forward<F>(f), isize(0))};
    }
    [[nodiscard]] static constexpr fixed_array<isize, 1> indices() { return {0}; }
    // the value itself fills the only slot, no duplication capability needed
    template <class T>
    [[nodiscard]] static constexpr fixed_array<T, 1> repeat(T value)
    {
        return {ak::move(value)};
    }

public:
    template <class T>
    [[nodiscard]] static constexpr fixed_array<T const*, 1> as_ref(fixed_array<T, 1> const& a)
    {
        return {std::addressof(a._data[0])};
    }
    template <class T>
    [[nodiscard]] static constexpr fixed_array<T*, 1> as_mut(fixed_array<T, 1>& a)
    {
        return {std::addressof(a._data[0])};
    }

public:
    template <class T>
    [[nodiscard]] static constexpr homogeneous_tuple<T, 1> into_tuple(fixed_array<T, 1>&& a)
    {
        return homogeneous_tuple<T, 1>{ak::move(a._data[0])};
    }
    template <class T>
    [[nodiscard]] static constexpr fixed_array<T, 1> from_tuple(homogeneous_tuple<T, 1>&& t)
    {
        return {std::get<0>(ak::move(t))};
    }

public:
    template <class T>
    [[nodiscard]] static constexpr fixed_array<T, 2> push_back(fixed_array<T, 1>&& a, T item)
    {
        return {ak::move(a._data[0]), ak::move(item)};
    }
    template <class T>
    [[nodiscard]] static constexpr fixed_array<T, 2> push_front(fixed_array<T, 1>&& a, T item)
    {
        return {ak::move(item), ak::move(a._data[0])};
    }
    template <class T>
    [[nodiscard]] static constexpr pair<T, fixed_array<T, 0>> pop_back(fixed_array<T, 1>&& a)
    {
        return {ak::move(a._data[0]), fixed_array<T, 0>{}};
    }
    template <class T>
    [[nodiscard]] static constexpr pair<T, fixed_array<T, 0>> pop_front(fixed_array<T, 1>&& a)
    {
        return {ak::move(a._data[0]), fixed_array<T, 0>{}};
    }
};

// =========================================================================================================
// N == 2 .. 32
// =========================================================================================================

// element expressions, see impl/unrolled_sequence.hh
#define AK_IMPL_U_MOVE(i) ak::move(a._data[i])
#define AK_IMPL_U_MOVE_NEXT(i) ak::move(a._data[i + 1])
#define AK_IMPL_U_MAP(i) std::invoke(f, ak::move(a._data[i]))
#define AK_IMPL_U_MAP_CREF(i) std::invoke(f, a._data[i])
#define AK_IMPL_U_ZIP(i) pair<T, U>{ak::move(a._data[i]), ak::move(b._data[i])}
#define AK_IMPL_U_GENERATE(i) std::invoke(f)
#define AK_IMPL_U_GENERATE_WITH(i) std::invoke(f, isize(i))
#define AK_IMPL_U_INDEX(i) isize(i)
#define AK_IMPL_U_COPY_VALUE(i) value
#define AK_IMPL_U_ADDRESS(i) std::addressof(a._data[i])
#define AK_IMPL_U_TUPLE_GET(i) std::get<i>(ak::move(t))

// NM1 must be N - 1 as a literal, it selects the element list for repeat and pop
#define AK_IMPL_UNROLLED_ARRAY_OPS(N, NM1)                                                                        \
template <>                                                                                                       \
struct ak::unrolled::array_ops<N>                                                                                 \
{                                                                                                                 \
public:                                                                                                           \
    template <class T, class F>                                                                                   \
        requires ak::invocable_repeatedly<F, T&&>                                                                 \
    [[nodiscard]] static constexpr auto map(fixed_array<T, N>&& a, F&& f)                                         \
    {                                                                                                             \
        using U = std::remove_cvref_t<std::invoke_result_t<F&, T&&>>;                                             \
        return fixed_array<U, N>{AK_IMPL_SEQ(N, AK_IMPL_U_MAP)};                                                  \
    }                                                                                                             \
    template <class T, class F>                                                                                   \
        requires ak::invocable_repeatedly<F, T const&>                                                            \
    [[nodiscard]] static constexpr auto map(fixed_array<T, N> const& a, F&& f)                                    \
    {                                                                                                             \
        using U = std::remove_cvref_t<std::invoke_result_t<F&, T const&>>;                                        \
        return fixed_array<U, N>{AK_IMPL_SEQ(N, AK_IMPL_U_MAP_CREF)};                                             \
    }                                                                                                             \
    template <class T, class U>                                                                                   \
    [[nodiscard]] static constexpr fixed_array<pair<T, U>, N> zip(fixed_array<T, N>&& a, fixed_array<U, N>&& b)   \
    {                                                                                                             \
        return {AK_IMPL_SEQ(N, AK_IMPL_U_ZIP)};                                                                   \
    }                                                                                                             \
                                                                                                                  \
public:                                                                                                           \
    template <class T, class F>                                                                                   \
        requires ak::invocable_repeatedly_r<F, T>                                                                 \
    [[nodiscard]] static constexpr fixed_array<T, N> generate(F&& f)                                              \
    {                                                                                                             \
        return {AK_IMPL_SEQ(N, AK_IMPL_U_GENERATE)};                                                              \
    }                                                                                                             \
    template <class T, class F>                                                                                   \
        requires ak::invocable_repeatedly_r<F, T, isize>                                                          \
    [[nodiscard]] static constexpr fixed_array<T, N> generate_with(F&& f)                                         \
    {                                                                                                             \
        return {AK_IMPL_SEQ(N, AK_IMPL_U_GENERATE_WITH)};                                                         \
    }                                                                                                             \
    [[nodiscard]] static constexpr fixed_array<isize, N> indices() { return {AK_IMPL_SEQ(N, AK_IMPL_U_INDEX)}; }  \
    template <class T>                                                                                            \
        requires ak::implicitly_duplicable<T>                                                                     \
    [[nodiscard]] static constexpr fixed_array<T, N> repeat(T value)                                              \
    {                                                                                                             \
        return {AK_IMPL_SEQ(NM1, AK_IMPL_U_COPY_VALUE), ak::move(value)};                                         \
    }                                                                                                             \
                                                                                                                  \
public:                                                                                                           \
    template <class T>                                                                                            \
    [[nodiscard]] static constexpr fixed_array<T const*, N> as_ref(fixed_array<T, N> const& a)                    \
    {                                                                                                             \
        return {AK_IMPL_SEQ(N, AK_IMPL_U_ADDRESS)};                                                               \
    }                                                                                                             \
    template <class T>                                                                                            \
    [[nodiscard]] static constexpr fixed_array<T*, N> as_mut(fixed_array<T, N>& a)                                \
    {                                                                                                             \
        return {AK_IMPL_SEQ(N, AK_IMPL_U_ADDRESS)};                                                               \
    }                                                                                                             \
                                                                                                                  \
public:                                                                                                           \
    template <class T>                                                                                            \
    [[nodiscard]] static constexpr homogeneous_tuple<T, N> into_tuple(fixed_array<T, N>&& a)                      \
    {                                                                                                             \
        return homogeneous_tuple<T, N>{AK_IMPL_SEQ(N, AK_IMPL_U_MOVE)};                                           \
    }                                                                                                             \
    template <class T>                                                                                            \
    [[nodiscard]] static constexpr fixed_array<T, N> from_tuple(homogeneous_tuple<T, N>&& t)                      \
    {                                                                                                             \
        return {AK_IMPL_SEQ(N, AK_IMPL_U_TUPLE_GET)};                                                             \
    }                                                                                                             \
                                                                                                                  \
public:                                                                                                           \
    template <class T>                                                                                            \
    [[nodiscard]] static constexpr fixed_array<T, N + 1> push_back(fixed_array<T, N>&& a, T item)                 \
    {                                                                                                             \
        return {AK_IMPL_SEQ(N, AK_IMPL_U_MOVE), ak::move(item)};                                                  \
    }                                                                                                             \
    template <class T>                                                                                            \
    [[nodiscard]] static constexpr fixed_array<T, N + 1> push_front(fixed_array<T, N>&& a, T item)                \
    {                                                                                                             \
        return {ak::move(item), AK_IMPL_SEQ(N, AK_IMPL_U_MOVE)};                                                  \
    }                                                                                                             \
    template <class T>                                                                                            \
    [[nodiscard]] static constexpr pair<T, fixed_array<T, NM1>> pop_back(fixed_array<T, N>&& a)                   \
    {                                                                                                             \
        return {ak::move(a._data[NM1]), fixed_array<T, NM1>{AK_IMPL_SEQ(NM1, AK_IMPL_U_MOVE)}};                   \
    }                                                                                                             \
    template <class T>                                                                                            \
    [[nodiscard]] static constexpr pair<T, fixed_array<T, NM1>> pop_front(fixed_array<T, N>&& a)                  \
    {                                                                                                             \
        return {ak::move(a._data[0]), fixed_array<T, NM1>{AK_IMPL_SEQ(NM1, AK_IMPL_U_MOVE_NEXT)}};                \
    }                                                                                                             \
};

AK_IMPL_UNROLLED_ARRAY_OPS(2, 1)
AK_IMPL_UNROLLED_ARRAY_OPS(3, 2)
AK_IMPL_UNROLLED_ARRAY_OPS(4, 3)
AK_IMPL_UNROLLED_ARRAY_OPS(5, 4)
AK_IMPL_UNROLLED_ARRAY_OPS(6, 5)
AK_IMPL_UNROLLED_ARRAY_OPS(7, 6)
AK_IMPL_UNROLLED_ARRAY_OPS(8, 7)
AK_IMPL_UNROLLED_ARRAY_OPS(9, 8)
AK_IMPL_UNROLLED_ARRAY_OPS(10, 9)
AK_IMPL_UNROLLED_ARRAY_OPS(11, 10)
AK_IMPL_UNROLLED_ARRAY_OPS(12, 11)
AK_IMPL_UNROLLED_ARRAY_OPS(13, 12)
AK_IMPL_UNROLLED_ARRAY_OPS(14, 13)
AK_IMPL_UNROLLED_ARRAY_OPS(15, 14)
AK_IMPL_UNROLLED_ARRAY_OPS(16, 15)
AK_IMPL_UNROLLED_ARRAY_OPS(17, 16)
AK_IMPL_UNROLLED_ARRAY_OPS(18, 17)
AK_IMPL_UNROLLED_ARRAY_OPS(19, 18)
AK_IMPL_UNROLLED_ARRAY_OPS(20, 19)
AK_IMPL_UNROLLED_ARRAY_OPS(21, 20)
AK_IMPL_UNROLLED_ARRAY_OPS(22, 21)
AK_IMPL_UNROLLED_ARRAY_OPS(23, 22)
AK_IMPL_UNROLLED_ARRAY_OPS(24, 23)
AK_IMPL_UNROLLED_ARRAY_OPS(25, 24)
AK_IMPL_UNROLLED_ARRAY_OPS(26, 25)
AK_IMPL_UNROLLED_ARRAY_OPS(27, 26)
AK_IMPL_UNROLLED_ARRAY_OPS(28, 27)
AK_IMPL_UNROLLED_ARRAY_OPS(29, 28)
AK_IMPL_UNROLLED_ARRAY_OPS(30, 29)
AK_IMPL_UNROLLED_ARRAY_OPS(31, 30)
AK_IMPL_UNROLLED_ARRAY_OPS(32, 31)

// =========================================================================================================
// N == 33, only reachable through push on length 32
// =========================================================================================================

template <>
struct ak::unrolled::array_ops<33>
{
    template <class T>
    [[nodiscard]] static constexpr pair<T, fixed_array<T, 32>> pop_back(fixed_array<T, 33>&& a)
    {
        return {ak::move(a._data[32]), fixed_array<T, 32>{AK_IMPL_SEQ(32, AK_IMPL_U_MOVE)}};
    }
    template <class T>
    [[nodiscard]] static constexpr pair<T, fixed_array<T, 32>> pop_front(fixed_array<T, 33>&& a)
    {
        return {ak::move(a._data[0]), fixed_array<T, 32>{AK_IMPL_SEQ(32, AK_IMPL_U_MOVE_NEXT)}};
    }
};

#undef AK_IMPL_UNROLLED_ARRAY_OPS
#undef AK_IMPL_U_MOVE
#undef AK_IMPL_U_MOVE_NEXT
#undef AK_IMPL_U_MAP
#undef AK_IMPL_U_MAP_CREF
#undef AK_IMPL_U_ZIP
#undef AK_IMPL_U_GENERATE
#undef AK_IMPL_U_GENERATE_WITH
#undef AK_IMPL_U_INDEX
#undef AK_IMPL_U_COPY_VALUE
#undef AK_IMPL_U_ADDRESS
#undef AK_IMPL_U_TUPLE_GET
