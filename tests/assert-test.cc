#include <array-kit/assert-handler.hh>
#include <array-kit/fixed_array.hh>

#include <nexus/test.hh>

#include <optional>
#include <string>
#include <vector>


namespace
{
struct assertion_thrown
{
    std::string message;
};

// turns every failing assertion in scope into an exception carrying the message
auto throwing_handler()
{
    return ak::impl::scoped_assertion_handler([](ak::impl::assertion_info const& info)
                                              { throw assertion_thrown{info.message}; });
}
} // namespace

TEST("assertions - failing assertion calls handler with correct payload")
{
    std::optional<ak::impl::assertion_info> captured;
    // CAREFUL: relies on the try block layout below
    int const test_line = __LINE__ + 11; // line where AK_ASSERT_ALWAYS is called

    {
        auto handler = ak::impl::scoped_assertion_handler(
            [&](ak::impl::assertion_info const& info)
            {
                captured = info;
                throw 0; // Must throw to prevent abort
            });
        try
        {
            AK_ASSERT_ALWAYS(1 + 1 == 3, "arithmetic is broken");
        }
        catch (int) // NOLINT(bugprone-empty-catch)
        {
        }
    }

    REQUIRE(captured.has_value());
    CHECK(captured->expression.find("1 + 1 == 3") != std::string::npos);
    CHECK(captured->message == "arithmetic is broken");
    CHECK(std::string(captured->location.file_name()).ends_with("assert-test.cc"));
    CHECK(captured->location.line() == test_line);
}

TEST("assertions - passing assertion does not call handler")
{
    bool handler_called = false;
    {
        auto handler
            = ak::impl::scoped_assertion_handler([&](ak::impl::assertion_info const&) { handler_called = true; });
        AK_ASSERT_ALWAYS(2 > 1, "should not matter");
    }
    CHECK(!handler_called);
}

TEST("assertions - handler stack is LIFO")
{
    std::vector<int> events;

    auto outer = ak::impl::scoped_assertion_handler(
        [&](ak::impl::assertion_info const&)
        {
            events.push_back(1);
            throw 0;
        });

    {
        auto inner = ak::impl::scoped_assertion_handler(
            [&](ak::impl::assertion_info const&)
            {
                events.push_back(2);
                throw 0;
            });

        try
        {
            AK_ASSERT_ALWAYS(false, "first failure");
        }
        catch (int) // NOLINT(bugprone-empty-catch)
        {
        }
    }

    try
    {
        AK_ASSERT_ALWAYS(false, "second failure");
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    REQUIRE(events.size() == 2);
    CHECK(events[0] == 2);
    CHECK(events[1] == 1);
}

TEST("assertions - out of bounds element access")
{
    ak::fixed_array<int, 3> a = {1, 2, 3};

    if constexpr (AK_ASSERT_ENABLED != 0)
    {
        auto handler = throwing_handler();

        for (ak::isize i : {ak::isize(-1), ak::isize(3), ak::isize(100)})
        {
            bool thrown = false;
            try
            {
                (void)a[i];
            }
            catch (assertion_thrown const& e)
            {
                thrown = true;
                CHECK(e.message == "index out of bounds");
            }
            CHECK(thrown);
        }

        // const access checks too
        auto const& c = a;
        bool thrown = false;
        try
        {
            (void)c[3];
        }
        catch (assertion_thrown const&)
        {
            thrown = true;
        }
        CHECK(thrown);
    }

    // valid indices never reach the handler
    auto handler = throwing_handler();
    CHECK(a[0] == 1);
    CHECK(a[2] == 3);
}
