#include <array-kit/array_tools.hh>
#include <array-kit/fixed_array.hh>
#include <array-kit/generic_array_ops.hh>
#include <array-kit/unrolled_array_ops.hh>
#include <array-kit/utility.hh>

#include <nexus/test.hh>

#include <memory>
#include <string>
#include <type_traits>
#include <vector>

#include "test_types.hh"

using ak::test::move_only;
using ak::test::test_error;
using ak::test::tracked;

// result element type is the decayed return type of f
static_assert(std::is_same_v<decltype(ak::fixed_array<int, 3>{}.map([](int x) { return x * 0.5; })), ak::fixed_array<double, 3>>);
static_assert(std::is_same_v<decltype(ak::fixed_array<int, 0>{}.map([](int) { return std::string(); })),
                             ak::fixed_array<std::string, 0>>);

// identity returns a reference, the result still stores values
static_assert(std::is_same_v<decltype(ak::fixed_array<int, 2>{}.map(ak::identify_function{})), ak::fixed_array<int, 2>>);

static_assert(ak::fixed_array<int, 3>{1, 2, 3}.map([](int x) { return x + 1; }) == ak::fixed_array<int, 3>{2, 3, 4});

namespace
{
template <class Ops, ak::isize N>
std::vector<int> record_map_order(ak::fixed_array<int, N> a)
{
    std::vector<int> seen;
    auto r = Ops::map(ak::move(a),
                      [&](int x)
                      {
                          seen.push_back(x);
                          return x;
                      });
    CHECK(r == a);
    return seen;
}

template <class Ops>
void check_throwing_map()
{
    tracked::reset();
    {
        ak::fixed_array<tracked, 4> a = {tracked{0}, tracked{1}, tracked{2}, tracked{3}};
        int calls = 0;
        try
        {
            (void)Ops::map(ak::move(a),
                           [&](tracked&& t)
                           {
                               ++calls;
                               if (t.value == 2)
                                   throw test_error{t.value};
                               return tracked{t.value * 10};
                           });
            CHECK(false); // unreachable
        }
        catch (test_error const& e)
        {
            CHECK(e.index == 2);
        }
        CHECK(calls == 3);
    }
    CHECK(tracked::alive() == 0);
}
} // namespace

TEST("map - applies f to every element")
{
    SECTION("same type")
    {
        auto r = ak::fixed_array<int, 3>{1, 2, 3}.map([](int x) { return x + 1; });
        CHECK((r == ak::fixed_array<int, 3>{2, 3, 4}));
    }

    SECTION("type changing")
    {
        auto r = ak::fixed_array<int, 3>{1, 20, 300}.map([](int x) { return std::to_string(x); });
        CHECK((r == ak::fixed_array<std::string, 3>{"1", "20", "300"}));
    }

    SECTION("member pointer")
    {
        struct named
        {
            std::string name;
        };

        ak::fixed_array<named, 3> a = {named{"a"}, named{"bb"}, named{"cccc"}};
        auto r = ak::move(a).map(&named::name);
        static_assert(std::is_same_v<decltype(r), ak::fixed_array<std::string, 3>>);
        CHECK((r == ak::fixed_array<std::string, 3>{"a", "bb", "cccc"}));
    }

    SECTION("N == 1")
    {
        auto r = ak::fixed_array<int, 1>{41}.map([](int x) { return x + 1; });
        CHECK(r[0] == 42);
    }

    SECTION("N == 0 never calls f")
    {
        int calls = 0;
        auto r = ak::fixed_array<int, 0>{}.map(
            [&](int x)
            {
                ++calls;
                return x;
            });
        CHECK(r.empty());
        CHECK(calls == 0);
    }
}

TEST("map - identity and composition")
{
    ak::fixed_array<int, 5> const a = {3, 1, 4, 1, 5};
    auto const f = [](int x) { return x * 2; };
    auto const g = [](int x) { return x - 7; };

    SECTION("identity")
    {
        CHECK(a.map(ak::identify_function{}) == a);
        auto copy = a;
        CHECK(ak::move(copy).map(ak::identify_function{}) == a);
    }

    SECTION("composition")
    {
        auto lhs = a.map(f).map(g);
        auto rhs = a.map([&](int x) { return g(f(x)); });
        CHECK(lhs == rhs);
    }
}

TEST("map - calls f in ascending index order")
{
    SECTION("default strategy")
    {
        std::vector<int> seen;
        auto r = ak::fixed_array<int, 4>{5, 6, 7, 8}.map(
            [&](int x)
            {
                seen.push_back(x);
                return x;
            });
        CHECK((seen == std::vector<int>{5, 6, 7, 8}));
        CHECK(r.size() == 4);
    }

    SECTION("generic")
    {
        CHECK((record_map_order<ak::generic::array_ops<6>>(ak::fixed_array<int, 6>{1, 2, 3, 4, 5, 6})
               == std::vector<int>{1, 2, 3, 4, 5, 6}));
    }

    SECTION("unrolled")
    {
        CHECK((record_map_order<ak::unrolled::array_ops<6>>(ak::fixed_array<int, 6>{1, 2, 3, 4, 5, 6})
               == std::vector<int>{1, 2, 3, 4, 5, 6}));
        auto const idx = ak::indices<32>();
        CHECK((record_map_order<ak::unrolled::array_ops<32>>(idx.map([](ak::isize i) { return int(i); }))
               == std::vector<int>(idx.begin(), idx.end())));
    }
}

TEST("map - consumes elements")
{
    SECTION("move-only elements are moved into f exactly once")
    {
        ak::fixed_array<move_only, 3> a = {move_only{1}, move_only{2}, move_only{3}};
        auto r = ak::move(a).map([](move_only&& m) { return move_only{ak::move(m)}; });
        CHECK(r[0].value == 1);
        CHECK(r[1].value == 2);
        CHECK(r[2].value == 3);
        for (auto const& m : a)
            CHECK(m.value == -1);
    }

    SECTION("owning pointers")
    {
        ak::fixed_array<std::unique_ptr<int>, 2> a = {std::make_unique<int>(1), std::make_unique<int>(2)};
        auto r = ak::move(a).map([](std::unique_ptr<int> p) { return *p * 100; });
        CHECK((r == ak::fixed_array<int, 2>{100, 200}));
        CHECK(a[0] == nullptr);
        CHECK(a[1] == nullptr);
    }

    SECTION("const map leaves the source untouched")
    {
        ak::fixed_array<std::string, 2> a = {"x", "y"};
        auto r = a.map([](std::string const& s) { return s + s; });
        CHECK((r == ak::fixed_array<std::string, 2>{"xx", "yy"}));
        CHECK((a == ak::fixed_array<std::string, 2>{"x", "y"}));
    }

    SECTION("no element is leaked or destroyed twice")
    {
        tracked::reset();
        {
            ak::fixed_array<tracked, 3> a = {tracked{1}, tracked{2}, tracked{3}};
            auto r = ak::move(a).map([](tracked&& t) { return tracked{t.value + 1}; });
            CHECK(r[2].value == 4);
        }
        CHECK(tracked::alive() == 0);
    }
}

TEST("map - throwing closure")
{
    SECTION("generic")
    {
        check_throwing_map<ak::generic::array_ops<4>>();
    }

    SECTION("unrolled")
    {
        check_throwing_map<ak::unrolled::array_ops<4>>();
    }
}
