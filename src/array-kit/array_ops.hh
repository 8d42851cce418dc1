#pragma once

#include <array-kit/config.hh>
#include <array-kit/fixed_array.hh>
#include <array-kit/generic_array_ops.hh>
#include <array-kit/unrolled_array_ops.hh>

/// The capability set used by the members of ak::fixed_array<T, N>.
/// Resolves to ak::unrolled::array_ops<N> or ak::generic::array_ops<N> depending on AK_ARRAY_OPS_STRATEGY.
/// Nothing is ever picked at runtime, the choice is made once per translation unit.
///
/// Code that wants to compare or test both strategies side by side should name
/// ak::unrolled::array_ops<N> and ak::generic::array_ops<N> directly.
template <ak::isize N>
struct ak::array_ops
#if AK_ARRAY_OPS_STRATEGY == AK_STRATEGY_UNROLLED
  : ak::unrolled::array_ops<N>
#else
  : ak::generic::array_ops<N>
#endif
{
};
