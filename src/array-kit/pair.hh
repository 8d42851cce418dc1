#pragma once

#include <array-kit/fwd.hh>
#include <array-kit/utility.hh>

#include <utility>

/// Two values of potentially different types
/// Element type of zip results, and the result of pop_front/pop_back
/// (removed element in first, remaining array in second)
/// Aggregate type with no user-defined constructors, supports structured bindings:
///   auto [item, rest] = ak::move(arr).pop_back();
template <class T, class U>
struct ak::pair
{
    [[nodiscard]] friend constexpr bool operator==(pair const&, pair const&) = default;

    T first;
    U second;

    template <std::size_t I, class P>
    [[nodiscard]] friend constexpr decltype(auto) get(P&& p) noexcept
        requires(std::is_same_v<std::remove_cvref_t<P>, pair> && I < 2)
    {
        // parenthesized so that lvalue pairs yield references and rvalue pairs yield rvalue references
        if constexpr (I == 0)
            return (ak::forward<P>(p).first);
        else
            return (ak::forward<P>(p).second);
    }
};

namespace std
{
template <class T, class U>
struct tuple_size<ak::pair<T, U>> : std::integral_constant<std::size_t, 2>
{
};

template <std::size_t I, class T, class U>
struct tuple_element<I, ak::pair<T, U>>
{
    static_assert(I < 2);
    using type = std::conditional_t<I == 0, T, U>;
};
} // namespace std
