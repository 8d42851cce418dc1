#pragma once

#include <array-kit/macros.hh>

// =========================================================================================================
// Element lists for the unrolled array_ops tables
// =========================================================================================================
//
// AK_IMPL_SEQ_k(M) expands to the comma separated list M(0), M(1), ..., M(k-1).
// M is a function-like macro that turns an index literal into one element expression,
// e.g. with
//   #define AK_IMPL_U_MOVE(i) ak::move(a._data[i])
// AK_IMPL_SEQ_3(AK_IMPL_U_MOVE) is
//   ak::move(a._data[0]), ak::move(a._data[1]), ak::move(a._data[2])
//
// The lists cover 1 .. 32 (ak::max_unrolled_length and ak::max_tuple_arity).
// An empty list has no macro: length 0 is always written out by hand.
//
// AK_IMPL_SEQ(k, M) selects the list for a length given as a literal or a macro argument.

#define AK_IMPL_SEQ(k, M) AK_MACRO_JOIN(AK_IMPL_SEQ_, k)(M)

#define AK_IMPL_SEQ_1(M) M(0)
#define AK_IMPL_SEQ_2(M) AK_IMPL_SEQ_1(M), M(1)
#define AK_IMPL_SEQ_3(M) AK_IMPL_SEQ_2(M), M(2)
#define AK_IMPL_SEQ_4(M) AK_IMPL_SEQ_3(M), M(3)
#define AK_IMPL_SEQ_5(M) AK_IMPL_SEQ_4(M), M(4)
#define AK_IMPL_SEQ_6(M) AK_IMPL_SEQ_5(M), M(5)
#define AK_IMPL_SEQ_7(M) AK_IMPL_SEQ_6(M), M(6)
#define AK_IMPL_SEQ_8(M) AK_IMPL_SEQ_7(M), M(7)
#define AK_IMPL_SEQ_9(M) AK_IMPL_SEQ_8(M), M(8)
#define AK_IMPL_SEQ_10(M) AK_IMPL_SEQ_9(M), M(9)
#define AK_IMPL_SEQ_11(M) AK_IMPL_SEQ_10(M), M(10)
#define AK_IMPL_SEQ_12(M) AK_IMPL_SEQ_11(M), M(11)
#define AK_IMPL_SEQ_13(M) AK_IMPL_SEQ_12(M), M(12)
#define AK_IMPL_SEQ_14(M) AK_IMPL_SEQ_13(M), M(13)
#define AK_IMPL_SEQ_15(M) AK_IMPL_SEQ_14(M), M(14)
#define AK_IMPL_SEQ_16(M) AK_IMPL_SEQ_15(M), M(15)
#define AK_IMPL_SEQ_17(M) AK_IMPL_SEQ_16(M), M(16)
#define AK_IMPL_SEQ_18(M) AK_IMPL_SEQ_17(M), M(17)
#define AK_IMPL_SEQ_19(M) AK_IMPL_SEQ_18(M), M(18)
#define AK_IMPL_SEQ_20(M) AK_IMPL_SEQ_19(M), M(19)
#define AK_IMPL_SEQ_21(M) AK_IMPL_SEQ_20(M), M(20)
#define AK_IMPL_SEQ_22(M) AK_IMPL_SEQ_21(M), M(21)
#define AK_IMPL_SEQ_23(M) AK_IMPL_SEQ_22(M), M(22)
#define AK_IMPL_SEQ_24(M) AK_IMPL_SEQ_23(M), M(23)
#define AK_IMPL_SEQ_25(M) AK_IMPL_SEQ_24(M), M(24)
#define AK_IMPL_SEQ_26(M) AK_IMPL_SEQ_25(M), M(25)
#define AK_IMPL_SEQ_27(M) AK_IMPL_SEQ_26(M), M(26)
#define AK_IMPL_SEQ_28(M) AK_IMPL_SEQ_27(M), M(27)
#define AK_IMPL_SEQ_29(M) AK_IMPL_SEQ_28(M), M(28)
#define AK_IMPL_SEQ_30(M) AK_IMPL_SEQ_29(M), M(29)
#define AK_IMPL_SEQ_31(M) AK_IMPL_SEQ_30(M), M(30)
#define AK_IMPL_SEQ_32(M) AK_IMPL_SEQ_31(M), M(31)
