#pragma once

#include <array-kit/fwd.hh>

// =========================================================================================================
// Strategy selection
// =========================================================================================================
//
// AK_ARRAY_OPS_STRATEGY decides which implementation backs ak::array_ops<N>
// and therefore every capability member of ak::fixed_array:
//
//   AK_STRATEGY_GENERIC   - one template over N (generic_array_ops.hh), any length
//   AK_STRATEGY_UNROLLED  - one explicit specialization per length (unrolled_array_ops.hh),
//                           lengths 0 .. ak::max_unrolled_length only
//
// Both implementations are always reachable directly as ak::generic::array_ops<N>
// and ak::unrolled::array_ops<N>, the macro only picks the default.
//
// From CMake: ARRAY_KIT_STRATEGY=generic|unrolled sets this macro.

#define AK_STRATEGY_GENERIC 1
#define AK_STRATEGY_UNROLLED 2

#ifndef AK_ARRAY_OPS_STRATEGY
#define AK_ARRAY_OPS_STRATEGY AK_STRATEGY_GENERIC
#endif

#if AK_ARRAY_OPS_STRATEGY != AK_STRATEGY_GENERIC && AK_ARRAY_OPS_STRATEGY != AK_STRATEGY_UNROLLED
#error "AK_ARRAY_OPS_STRATEGY must be AK_STRATEGY_GENERIC or AK_STRATEGY_UNROLLED"
#endif

// =========================================================================================================
// Assertion configuration
// =========================================================================================================
//
// From CMake: AK_ASSERT_ENABLED is 1 in Debug and RelWithDebInfo builds,
// and in Release builds configured with ARRAY_KIT_ENABLE_ASSERT_IN_RELEASE.
// Consumers outside the CMake build get assertions unless NDEBUG is set.

#ifndef AK_ASSERT_ENABLED
#ifdef NDEBUG
#define AK_ASSERT_ENABLED 0
#else
#define AK_ASSERT_ENABLED 1
#endif
#endif

namespace ak
{
/// Largest length with an explicit specialization in the unrolled strategy.
/// Raising it requires new AK_IMPL_SEQ_k element lists and table entries.
inline constexpr isize max_unrolled_length = 32;

/// Largest tuple arity covered by the tuple_shape table.
inline constexpr isize max_tuple_arity = 32;

/// True when ak::array_ops<N> resolves to the unrolled strategy.
inline constexpr bool uses_unrolled_strategy = AK_ARRAY_OPS_STRATEGY == AK_STRATEGY_UNROLLED;
} // namespace ak
