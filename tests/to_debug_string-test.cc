#include <ring-core/ringbuffer.hh>
#include <ring-core/to_debug_string.hh>
#include <ring-core/unique_array.hh>

#include <nexus/test.hh>

#include <cstdint>
#include <string>
#include <tuple>
#include <vector>

namespace
{
struct HasMemberToString
{
    std::string to_string() const { return "member_to_string"; }
};

struct Opaque
{
    uint16_t a;
    uint8_t b;
    uint8_t c;
};
} // namespace

TEST("to_debug_string - scalars")
{
    CHECK(rc::to_debug_string(42) == "42");
    CHECK(rc::to_debug_string(-7) == "-7");
    CHECK(rc::to_debug_string(true) == "true");
    CHECK(rc::to_debug_string(false) == "false");
    CHECK(rc::to_debug_string(rc::isize(1) << 40) == "1099511627776");
}

TEST("to_debug_string - strings and chars")
{
    CHECK(rc::to_debug_string(std::string("abc")) == "\"abc\"");
    CHECK(rc::to_debug_string(std::string()) == "\"\"");
    CHECK(rc::to_debug_string("lit") == "\"lit\"");

    CHECK(rc::to_debug_string('x') == "'x'");
    CHECK(rc::to_debug_string(' ') == "' '");
    CHECK(rc::to_debug_string('\n') == "'\\n'");
    CHECK(rc::to_debug_string('\0') == "'\\0'");
    CHECK(rc::to_debug_string('\'') == "'\\''");
    CHECK(rc::to_debug_string(char(1)) == "'\\x01'");
    CHECK(rc::to_debug_string(char(127)) == "'\\x7F'");
}

TEST("to_debug_string - ring in logical order")
{
    SECTION("empty")
    {
        auto const ring = rc::ringbuffer<int>::create_with_capacity(3);
        CHECK(rc::to_debug_string(ring) == "[]");
        CHECK(rc::to_debug_string(rc::ringbuffer<int>()) == "[]");
    }

    SECTION("wrapped")
    {
        // capacity 3 scenario: push 1, 2, 3, pop 1, push 4 wraps into slot 0
        auto ring = rc::ringbuffer<int>::create_with_capacity(3);
        (void)ring.push_back(1);
        (void)ring.push_back(2);
        (void)ring.push_back(3);
        (void)ring.pop_front();
        (void)ring.push_back(4);
        REQUIRE(ring.layout().head == 1);

        CHECK(rc::to_debug_string(ring) == "[2, 3, 4]");
        CHECK(rc::to_debug_string(ring.iter()) == "[2, 3, 4]");

        auto it = ring.iter();
        (void)it.next();
        CHECK(rc::to_debug_string(it) == "[3, 4]");
        CHECK(it.remaining() == 2);

        auto const arr = rc::move(ring).into_unique_array();
        CHECK(rc::to_debug_string(arr) == "[2, 3, 4]");
    }

    SECTION("nested elements")
    {
        auto ring = rc::ringbuffer<std::string>::create_with_capacity(2);
        (void)ring.push_back("b");
        (void)ring.push_front("a");
        CHECK(rc::to_debug_string(ring) == "[\"a\", \"b\"]");
    }
}

TEST("to_debug_string - long ranges are cut off")
{
    auto ring = rc::ringbuffer<int>::create_with_capacity(10);
    for (int i = 0; i < 10; ++i)
        (void)ring.push_back(i);

    rc::debug_string_config cfg;
    cfg.max_length = 5;
    CHECK(rc::to_debug_string(ring, cfg) == "[0, 1, ...]");
    CHECK(rc::to_debug_string(ring) == "[0, 1, 2, 3, 4, 5, 6, 7, 8, 9]");
}

TEST("to_debug_string - dispatch")
{
    CHECK(rc::to_debug_string(HasMemberToString{}) == "member_to_string");
    CHECK(rc::to_debug_string(std::make_tuple(1, 'c', std::string("s"))) == "(1, 'c', \"s\")");
    auto const nested = std::vector<std::vector<int>>{{1}, {}};
    CHECK(rc::to_debug_string(nested) == "[[1], []]");

    Opaque o = {0x0102, 0xAB, 0xCD};
    auto const dump = rc::to_debug_string(o);
    CHECK(dump.size() == 2 + 2 * sizeof(Opaque) + 1); // "0x" + bytes + one separator per alignment block
    CHECK(dump.starts_with("0x"));
}
