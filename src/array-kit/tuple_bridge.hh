#pragma once

#include <array-kit/config.hh>
#include <array-kit/fwd.hh>
#include <array-kit/impl/unrolled_sequence.hh>
#include <array-kit/utility.hh>

#include <tuple>

// =========================================================================================================
// Tuple bridge
// =========================================================================================================
//
// Closed table from a length L to the homogeneous tuple with L slots of T:
//   tuple_shape<T, 0>::type == std::tuple<>
//   tuple_shape<T, 3>::type == std::tuple<T, T, T>
//
// Only lengths 0 .. ak::max_tuple_arity have an entry.
// into_tuple / from_tuple on any other length fails to compile at the lookup.
// Extending the bound is adding entries (and AK_IMPL_SEQ_k element lists), no logic changes.
//
// The bridge is a relabeling: element order and values are preserved exactly.

namespace ak
{
/// Homogeneous N-tuple of T, e.g. homogeneous_tuple<int, 2> is std::tuple<int, int>
template <class T, isize N>
using homogeneous_tuple = typename tuple_shape<T, N>::type;

/// True iff homogeneous_tuple<T, N> exists
template <isize N>
inline constexpr bool has_tuple_shape = 0 <= N && N <= max_tuple_arity;
} // namespace ak

template <class T, ak::isize L>
struct ak::tuple_shape
{
    static_assert(ak::always_false_v<L>, "tuple conversion is only defined for lengths 0 .. ak::max_tuple_arity");
};

template <class T>
struct ak::tuple_shape<T, 0>
{
    using type = std::tuple<>;
};

#define AK_IMPL_TUPLE_SLOT(i) T

#define AK_IMPL_TUPLE_SHAPE(L)                                       \
    template <class T>                                               \
    struct ak::tuple_shape<T, L>                                     \
    {                                                                \
        using type = std::tuple<AK_IMPL_SEQ(L, AK_IMPL_TUPLE_SLOT)>; \
    };

AK_IMPL_TUPLE_SHAPE(1)
AK_IMPL_TUPLE_SHAPE(2)
AK_IMPL_TUPLE_SHAPE(3)
AK_IMPL_TUPLE_SHAPE(4)
AK_IMPL_TUPLE_SHAPE(5)
AK_IMPL_TUPLE_SHAPE(6)
AK_IMPL_TUPLE_SHAPE(7)
AK_IMPL_TUPLE_SHAPE(8)
AK_IMPL_TUPLE_SHAPE(9)
AK_IMPL_TUPLE_SHAPE(10)
AK_IMPL_TUPLE_SHAPE(11)
AK_IMPL_TUPLE_SHAPE(12)
AK_IMPL_TUPLE_SHAPE(13)
AK_IMPL_TUPLE_SHAPE(14)
AK_IMPL_TUPLE_SHAPE(15)
AK_IMPL_TUPLE_SHAPE(16)
AK_IMPL_TUPLE_SHAPE(17)
AK_IMPL_TUPLE_SHAPE(18)
AK_IMPL_TUPLE_SHAPE(19)
AK_IMPL_TUPLE_SHAPE(20)
AK_IMPL_TUPLE_SHAPE(21)
AK_IMPL_TUPLE_SHAPE(22)
AK_IMPL_TUPLE_SHAPE(23)
AK_IMPL_TUPLE_SHAPE(24)
AK_IMPL_TUPLE_SHAPE(25)
AK_IMPL_TUPLE_SHAPE(26)
AK_IMPL_TUPLE_SHAPE(27)
AK_IMPL_TUPLE_SHAPE(28)
AK_IMPL_TUPLE_SHAPE(29)
AK_IMPL_TUPLE_SHAPE(30)
AK_IMPL_TUPLE_SHAPE(31)
AK_IMPL_TUPLE_SHAPE(32)

#undef AK_IMPL_TUPLE_SHAPE
#undef AK_IMPL_TUPLE_SLOT
