#include <array-kit/fixed_array.hh>
#include <array-kit/generic_array_ops.hh>
#include <array-kit/pair.hh>
#include <array-kit/unrolled_array_ops.hh>

#include <nexus/test.hh>

#include <string>
#include <type_traits>

#include "test_types.hh"

using ak::test::move_only;
using ak::test::tracked;

static_assert(std::is_same_v<decltype(ak::fixed_array<int, 2>{}.zip(ak::fixed_array<std::string, 2>{})),
                             ak::fixed_array<ak::pair<int, std::string>, 2>>);

namespace
{
template <class A, class B>
concept can_zip = requires(A a, B b) { ak::move(a).zip(ak::move(b)); };
} // namespace

// lengths are part of the type, a mismatch does not compile
static_assert(can_zip<ak::fixed_array<int, 3>, ak::fixed_array<float, 3>>);
static_assert(!can_zip<ak::fixed_array<int, 3>, ak::fixed_array<float, 2>>);
static_assert(can_zip<ak::fixed_array<int, 0>, ak::fixed_array<float, 0>>);

TEST("zip - pairs elements at the same index")
{
    SECTION("numbers and names")
    {
        auto r = ak::fixed_array<int, 2>{1, 2}.zip(ak::fixed_array<std::string, 2>{"one", "two"});
        CHECK(r[0].first == 1);
        CHECK(r[0].second == "one");
        CHECK(r[1].first == 2);
        CHECK(r[1].second == "two");
    }

    SECTION("structured bindings on the pairs")
    {
        auto r = ak::fixed_array{1, 2, 3}.zip(ak::fixed_array{'a', 'b', 'c'});
        int sum = 0;
        std::string chars;
        for (auto const& [n, c] : r)
        {
            sum += n;
            chars += c;
        }
        CHECK(sum == 6);
        CHECK(chars == "abc");
    }

    SECTION("N == 1")
    {
        auto r = ak::fixed_array<int, 1>{7}.zip(ak::fixed_array<double, 1>{0.5});
        CHECK((r[0] == ak::pair<int, double>{7, 0.5}));
    }

    SECTION("N == 0")
    {
        auto r = ak::fixed_array<int, 0>{}.zip(ak::fixed_array<std::string, 0>{});
        CHECK(r.empty());
    }
}

TEST("zip - consumes both operands")
{
    SECTION("move-only on both sides")
    {
        ak::fixed_array<move_only, 2> a = {move_only{1}, move_only{2}};
        ak::fixed_array<move_only, 2> b = {move_only{10}, move_only{20}};
        auto r = ak::move(a).zip(ak::move(b));
        CHECK(r[1].first.value == 2);
        CHECK(r[1].second.value == 20);
        CHECK(a[0].value == -1);
        CHECK(b[1].value == -1);
    }

    SECTION("no element is leaked or destroyed twice")
    {
        tracked::reset();
        {
            ak::fixed_array<tracked, 3> a = {tracked{1}, tracked{2}, tracked{3}};
            ak::fixed_array<tracked, 3> b = {tracked{4}, tracked{5}, tracked{6}};
            auto r = ak::move(a).zip(ak::move(b));
            CHECK(r[2].second.value == 6);
        }
        CHECK(tracked::alive() == 0);
    }
}

TEST("zip - strategies agree")
{
    auto const make = [] { return ak::fixed_array<int, 5>{1, 2, 3, 4, 5}; };
    auto const names = [] { return ak::fixed_array<std::string, 5>{"a", "b", "c", "d", "e"}; };

    auto g = ak::generic::array_ops<5>::zip(make(), names());
    auto u = ak::unrolled::array_ops<5>::zip(make(), names());
    CHECK(g == u);
    CHECK(u[3].second == "d");
}
