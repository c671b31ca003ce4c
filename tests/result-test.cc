#include <ring-core/result.hh>

#include <nexus/test.hh>

#include <memory>
#include <string>
#include <type_traits>

static_assert(std::is_trivially_copyable_v<rc::result<int, int>>);
static_assert(std::is_trivially_copyable_v<rc::result<void, int>>);
static_assert(!std::is_copy_constructible_v<rc::result<void, std::unique_ptr<int>>>);

namespace
{
struct refused
{
    std::string payload;
    rc::isize limit = 0;
};

struct move_only
{
    int value = 0;

    explicit move_only(int v) : value(v) {}
    move_only(move_only const&) = delete;
    move_only(move_only&& rhs) noexcept : value(rhs.value) { rhs.value = -1; }
    move_only& operator=(move_only const&) = delete;
    move_only& operator=(move_only&& rhs) noexcept
    {
        value = rhs.value;
        rhs.value = -1;
        return *this;
    }
};

rc::result<void, refused> try_store(std::string s, rc::isize limit)
{
    if (rc::isize(s.size()) > limit)
        return rc::error(refused{rc::move(s), limit});
    return {};
}

rc::result<int, std::string> parse_digit(char c)
{
    if (c < '0' || c > '9')
        return rc::error(std::string("not a digit"));
    return c - '0';
}
} // namespace

TEST("result - value or error")
{
    rc::result<int, int> ok = 42;
    CHECK(ok.has_value());
    CHECK(!ok.has_error());
    CHECK(ok.value() == 42);
    CHECK(ok.value_or(0) == 42);

    rc::result<int, int> bad = rc::error(99);
    CHECK(!bad.has_value());
    CHECK(bad.has_error());
    CHECK(bad.error() == 99);
    CHECK(bad.value_or(0) == 0);

    // default construction holds a default error
    rc::result<int, int> def;
    CHECK(def.has_error());
    CHECK(def.error() == 0);
}

TEST("result - non-trivial payloads")
{
    auto const digit = parse_digit('7');
    REQUIRE(digit.has_value());
    CHECK(digit.value() == 7);

    auto const not_digit = parse_digit('x');
    REQUIRE(not_digit.has_error());
    CHECK(not_digit.error() == "not a digit");

    auto copy = not_digit;
    CHECK(copy.error() == "not a digit");

    copy = digit;
    CHECK(copy.has_value());
    CHECK(copy.value() == 7);

    copy = parse_digit('y');
    CHECK(copy.has_error());
}

TEST("result<void> - success and error")
{
    rc::result<void, int> success;
    CHECK(success.has_value());
    success.value(); // no-op on success

    auto const stored = try_store("abc", 8);
    CHECK(stored.has_value());

    auto const rejected = try_store("too long for the slot", 4);
    REQUIRE(rejected.has_error());
    CHECK(rejected.error().payload == "too long for the slot");
    CHECK(rejected.error().limit == 4);
}

TEST("result<void> - error hands a move-only payload back")
{
    rc::result<void, move_only> r = rc::error(move_only(3));
    REQUIRE(r.has_error());

    auto moved = rc::move(r);
    CHECK(moved.has_error());
    CHECK(moved.error().value == 3);

    move_only back = rc::move(moved).error();
    CHECK(back.value == 3);
    CHECK(moved.error().value == -1); // NOLINT(bugprone-use-after-move)
}

TEST("result<void> - assignment between states")
{
    rc::result<void, std::string> r;
    r = rc::result<void, std::string>(rc::error(std::string("full")));
    REQUIRE(r.has_error());
    CHECK(r.error() == "full");

    r = rc::result<void, std::string>();
    CHECK(r.has_value());

    rc::result<void, std::string> const other = rc::error(std::string("again"));
    r = other;
    CHECK(r.error() == "again");
    CHECK(other.error() == "again");
}
