#include <ring-core/assert-handler.hh>
#include <ring-core/assert.hh>
#include <ring-core/optional.hh>

#include <nexus/test.hh>

#include <optional>
#include <string>
#include <vector>

TEST("assertions - handler receives expression, message and location")
{
    std::optional<rc::impl::assertion_info> captured;
    int const test_line = __LINE__ + 11; // line of the RC_ASSERT_ALWAYS below

    {
        auto handler = rc::impl::scoped_assertion_handler(
            [&](rc::impl::assertion_info const& info)
            {
                captured = info;
                throw 0; // Must throw to prevent abort
            });
        try
        {
            RC_ASSERT_ALWAYS(3 < 2, "slot out of range");
        }
        catch (int) // NOLINT(bugprone-empty-catch)
        {
        }
    }

    REQUIRE(captured.has_value());
    CHECK(captured->expression == "3 < 2");
    CHECK(captured->message == "slot out of range");
    CHECK(std::string(captured->location.file_name()).ends_with("assert-test.cc"));
    CHECK(captured->location.line() == test_line);
    CHECK(!std::string(captured->location.function_name()).empty());
}

TEST("assertions - passing assertion stays silent")
{
    auto calls = 0;
    auto handler = rc::impl::scoped_assertion_handler([&](rc::impl::assertion_info const&) { ++calls; });

    RC_ASSERT_ALWAYS(1 + 1 == 2, "arithmetic");
    RC_ASSERT(true, "never fires");

    CHECK(calls == 0);
}

TEST("assertions - handlers form a stack")
{
    std::vector<char> events;
    auto const base_count = rc::impl::assertion_handler_count();

    auto outer = rc::impl::scoped_assertion_handler(
        [&](rc::impl::assertion_info const&)
        {
            events.push_back('o');
            throw 0;
        });
    CHECK(rc::impl::assertion_handler_count() == base_count + 1);

    {
        auto inner = rc::impl::scoped_assertion_handler(
            [&](rc::impl::assertion_info const&)
            {
                events.push_back('i');
                throw 0;
            });
        CHECK(rc::impl::assertion_handler_count() == base_count + 2);

        try
        {
            RC_ASSERT_ALWAYS(false, "inner active");
        }
        catch (int) // NOLINT(bugprone-empty-catch)
        {
        }
    }
    CHECK(rc::impl::assertion_handler_count() == base_count + 1);

    try
    {
        RC_ASSERT_ALWAYS(false, "outer active");
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    REQUIRE(events.size() == 2);
    CHECK(events[0] == 'i');
    CHECK(events[1] == 'o');
}

TEST("assertions - scoped handler is popped during unwinding")
{
    struct inner_failure
    {
    };

    auto const base_count = rc::impl::assertion_handler_count();

    try
    {
        auto inner = rc::impl::scoped_assertion_handler([](rc::impl::assertion_info const&) { throw inner_failure{}; });
        RC_ASSERT_ALWAYS(false, "unwind me");
        CHECK(false); // unreachable
    }
    catch (inner_failure const&) // NOLINT(bugprone-empty-catch)
    {
    }

    CHECK(rc::impl::assertion_handler_count() == base_count);
}

TEST("assertions - manual push and pop")
{
    auto const base_count = rc::impl::assertion_handler_count();
    std::string last_message;

    rc::impl::push_assertion_handler(
        [&](rc::impl::assertion_info const& info)
        {
            last_message = info.message;
            throw 0;
        });

    try
    {
        RC_ASSERT_ALWAYS(false, "pushed by hand");
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    rc::impl::pop_assertion_handler();

    CHECK(last_message == "pushed by hand");
    CHECK(rc::impl::assertion_handler_count() == base_count);
}

#if RC_ASSERT_ENABLED
TEST("assertions - library preconditions route through the handler")
{
    std::vector<std::string> messages;
    auto handler = rc::impl::scoped_assertion_handler(
        [&](rc::impl::assertion_info const& info)
        {
            messages.push_back(info.message);
            throw 0;
        });

    rc::optional<int> empty;
    try
    {
        (void)empty.value();
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    try
    {
        (void)rc::wrapped_increment(0, 0);
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    REQUIRE(messages.size() == 2);
    CHECK(messages[0] == "attempted to access value of empty optional");
    CHECK(messages[1] == "wrapped_increment: max must be positive");
}
#else
TEST("assertions - disabled assertions do not evaluate their condition")
{
    auto evaluated = 0;
    auto touch = [&]
    {
        ++evaluated;
        return false;
    };

    RC_ASSERT(touch(), "compiled out");
    CHECK(evaluated == 0);
}
#endif
