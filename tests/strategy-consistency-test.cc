#include <array-kit/array_tools.hh>
#include <array-kit/config.hh>
#include <array-kit/fixed_array.hh>
#include <array-kit/generic_array_ops.hh>
#include <array-kit/unrolled_array_ops.hh>

#include <nexus/test.hh>

#include <string>
#include <type_traits>
#include <utility>

// Both strategies implement the same contracts.
// Every property below is checked on each strategy separately, then the results are compared,
// for every length the unrolled table covers.

static_assert(std::is_base_of_v<ak::unrolled::array_ops<3>, ak::array_ops<3>> == ak::uses_unrolled_strategy);
static_assert(std::is_base_of_v<ak::generic::array_ops<3>, ak::array_ops<3>> != ak::uses_unrolled_strategy);

namespace
{
template <ak::isize N>
ak::fixed_array<std::string, N> make_words()
{
    return ak::generic::array_ops<N>::template generate_with<std::string>([](ak::isize i) { return "w" + std::to_string(i); });
}

template <class Ops, ak::isize N>
struct strategy_results
{
    ak::fixed_array<ak::isize, N> indices;
    ak::fixed_array<ak::isize, N> generated;
    ak::fixed_array<std::size_t, N> mapped;
    ak::fixed_array<std::string, N> identity;
    ak::fixed_array<ak::pair<ak::isize, std::string>, N> zipped;
    ak::fixed_array<std::string, N> repeated;
    ak::fixed_array<std::string, N> from_tuple;
    ak::fixed_array<std::string, N + 1> pushed_back;
    ak::fixed_array<std::string, N + 1> pushed_front;

    static strategy_results compute()
    {
        ak::isize counter = 0;
        auto words = make_words<N>();

        return {
            Ops::indices(),
            Ops::template generate<ak::isize>([&] { return counter++ * 3; }),
            Ops::map(words, [](std::string const& s) { return s.size(); }),
            Ops::map(make_words<N>(), ak::identify_function{}),
            Ops::zip(Ops::indices(), make_words<N>()),
            Ops::template repeat<std::string>("r"),
            Ops::template from_tuple<std::string>(Ops::into_tuple(make_words<N>())),
            Ops::push_back(make_words<N>(), std::string("end")),
            Ops::push_front(make_words<N>(), std::string("begin")),
        };
    }
};

template <class Ops, ak::isize N>
void check_properties(strategy_results<Ops, N> const& r)
{
    CHECK(r.pushed_back[N] == "end");
    CHECK(r.pushed_front[0] == "begin");
    CHECK((r.identity == make_words<N>()));

    // element access on length 0 does not compile, not even in a loop that never runs
    if constexpr (N > 0)
    {
        auto const words = make_words<N>();

        for (ak::isize i = 0; i < N; ++i)
        {
            CHECK(r.indices[i] == i);
            CHECK(r.generated[i] == 3 * i);
            CHECK(r.mapped[i] == words[i].size());
            CHECK(r.zipped[i].first == i);
            CHECK(r.zipped[i].second == words[i]);
            CHECK(r.repeated[i] == "r");
            CHECK(r.from_tuple[i] == words[i]);
            CHECK(r.pushed_back[i] == words[i]);
            CHECK(r.pushed_front[i + 1] == words[i]);
        }

        auto copy = words;
        auto const refs = Ops::as_ref(copy);
        for (ak::isize i = 0; i < N; ++i)
            CHECK(refs[i] == &copy[i]);

        auto [last, init] = Ops::pop_back(make_words<N>());
        CHECK(last == words[N - 1]);
        auto [first, tail] = Ops::pop_front(make_words<N>());
        CHECK(first == words[0]);
        if constexpr (N > 1)
        {
            for (ak::isize i = 0; i < N - 1; ++i)
            {
                CHECK(init[i] == words[i]);
                CHECK(tail[i] == words[i + 1]);
            }
        }
        else
        {
            CHECK(init.empty());
            CHECK(tail.empty());
        }
    }
    else
    {
        CHECK(r.indices.empty());
        CHECK(Ops::as_ref(r.repeated).empty());
    }
}

template <template <ak::isize> class Ops, ak::isize N>
void check_push_then_pop()
{
    auto [last, init] = Ops<N + 1>::pop_back(Ops<N>::push_back(make_words<N>(), std::string("v")));
    CHECK(last == "v");
    CHECK((init == make_words<N>()));

    auto [first, tail] = Ops<N + 1>::pop_front(Ops<N>::push_front(make_words<N>(), std::string("v")));
    CHECK(first == "v");
    CHECK((tail == make_words<N>()));
}

template <ak::isize N>
void check_length()
{
    auto const g = strategy_results<ak::generic::array_ops<N>, N>::compute();
    auto const u = strategy_results<ak::unrolled::array_ops<N>, N>::compute();

    check_properties(g);
    check_properties(u);

    check_push_then_pop<ak::generic::array_ops, N>();
    check_push_then_pop<ak::unrolled::array_ops, N>();

    CHECK((g.indices == u.indices));
    CHECK((g.identity == u.identity));
    CHECK((g.generated == u.generated));
    CHECK((g.mapped == u.mapped));
    CHECK((g.zipped == u.zipped));
    CHECK((g.repeated == u.repeated));
    CHECK((g.from_tuple == u.from_tuple));
    CHECK((g.pushed_back == u.pushed_back));
    CHECK((g.pushed_front == u.pushed_front));
}

template <std::size_t... I>
void check_lengths(std::index_sequence<I...>)
{
    (check_length<ak::isize(I)>(), ...);
}
} // namespace

TEST("strategies - identical results for every length up to 32")
{
    check_lengths(std::make_index_sequence<std::size_t(ak::max_unrolled_length) + 1>{});
}

TEST("strategies - the selected strategy backs the members")
{
    auto const via_member = ak::fixed_array<int, 4>{1, 2, 3, 4}.map([](int x) { return x * x; });
    auto const via_ops = ak::array_ops<4>::map(ak::fixed_array<int, 4>{1, 2, 3, 4}, [](int x) { return x * x; });
    CHECK((via_member == via_ops));
    CHECK((via_member == ak::fixed_array<int, 4>{1, 4, 9, 16}));
}
