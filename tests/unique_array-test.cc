#include <ring-core/ringbuffer.hh>
#include <ring-core/unique_array.hh>

#include <nexus/test.hh>

#include <initializer_list>
#include <string>
#include <type_traits>
#include <vector>

static_assert(!std::is_copy_constructible_v<rc::unique_array<int>>);
static_assert(std::is_nothrow_move_constructible_v<rc::unique_array<int>>);

namespace
{
// unique_arrays are produced by linearizing a ring
template <class T>
rc::unique_array<T> make_array(std::initializer_list<T> values)
{
    return rc::ringbuffer<T>::create_copy_of(rc::span<T const>(values.begin(), values.end())).into_unique_array();
}
} // namespace

TEST("unique_array - default is empty")
{
    rc::unique_array<int> arr;
    CHECK(arr.empty());
    CHECK(arr.size() == 0);
    CHECK(arr.begin() == arr.end());
    CHECK(arr.as_span().size() == 0);
}

TEST("unique_array - element access")
{
    auto arr = make_array<std::string>({"a", "bb", "ccc"});
    REQUIRE(arr.size() == 3);
    CHECK(arr.front() == "a");
    CHECK(arr.back() == "ccc");
    CHECK(arr[1] == "bb");
    CHECK(arr.size_bytes() == 3 * rc::isize(sizeof(std::string)));

    arr[1] += "!";
    CHECK(arr.as_span()[1] == "bb!");

    std::vector<std::string> seen(arr.begin(), arr.end());
    CHECK(seen.size() == 3);
}

TEST("unique_array - equality is element-wise")
{
    auto const a = make_array<int>({1, 2, 3});
    auto const b = make_array<int>({1, 2, 3});
    auto const c = make_array<int>({1, 2});
    auto const d = make_array<int>({1, 2, 4});

    CHECK(bool(a == b));
    CHECK(!bool(a == c));
    CHECK(!bool(a == d));
    CHECK(bool(rc::unique_array<int>() == make_array<int>({})));
}

TEST("unique_array - adopts a fully alive allocation")
{
    auto alloc = rc::allocation<int>::create_empty(2, alignof(int), nullptr);
    auto const* const data = alloc.obj_start;
    int const values[2] = {4, 5};
    rc::impl::copy_create_objects_to(alloc.obj_end, values, values + 2);

    auto arr = rc::unique_array<int>::create_from_allocation(rc::move(alloc));
    CHECK(!alloc.is_valid()); // NOLINT(bugprone-use-after-move)
    CHECK(arr.data() == data);
    REQUIRE(arr.size() == 2);
    CHECK(arr[0] == 4);
    CHECK(arr[1] == 5);
}

TEST("unique_array - move leaves the source empty")
{
    auto a = make_array<int>({7, 8, 9});
    auto b = rc::move(a);
    CHECK(a.empty()); // NOLINT(bugprone-use-after-move)
    CHECK(b.size() == 3);

    a = rc::move(b);
    CHECK(a.size() == 3);
    CHECK(b.empty()); // NOLINT(bugprone-use-after-move)
}
