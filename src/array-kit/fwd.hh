#pragma once

#include <cstdint>


namespace ak
{

//
// Primitives
//

// signed size type
// Lengths and indices are signed so that "N - 1" for pop on a length-0 array
// is a visible negative number instead of a wrapped-around huge one.
// All array lengths, indices produced by indices() and generate_with(), and
// tuple arities are isize.
using isize = std::int64_t;

//
// Containers
//

template <class T, isize N>
struct fixed_array;

template <class T, class U>
struct pair;

//
// Capability dispatch
//

// the operation set selected by AK_ARRAY_OPS_STRATEGY (see array_ops.hh)
template <isize N>
struct array_ops;

namespace unrolled
{
// one explicit specialization per length in [0, max_unrolled_length]
template <isize N>
struct array_ops;
} // namespace unrolled

namespace generic
{
// single implementation for all lengths
template <isize N>
struct array_ops;
} // namespace generic

//
// Tuple bridge
//

template <class T, isize L>
struct tuple_shape;

} // namespace ak
