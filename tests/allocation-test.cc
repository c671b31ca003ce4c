#include <ring-core/allocation.hh>
#include <ring-core/span.hh>
#include <ring-core/utility.hh>

#include <nexus/test.hh>

#include <cstdint>
#include <new>
#include <vector>

namespace
{
// Instrumented type that tracks construction and destruction
struct Tracked
{
    int value = 0;
    static inline int copy_ctor_count = 0;
    static inline int dtor_count = 0;
    static inline std::vector<int>* destruction_order = nullptr;

    static void reset_counters()
    {
        copy_ctor_count = 0;
        dtor_count = 0;
        destruction_order = nullptr;
    }

    explicit Tracked(int v) : value(v) {}
    Tracked(Tracked const& rhs) : value(rhs.value) { ++copy_ctor_count; }
    Tracked& operator=(Tracked const&) = default;

    ~Tracked()
    {
        ++dtor_count;
        if (destruction_order)
            destruction_order->push_back(value);
    }
};

// resource that records every request it serves
struct RecordingResource : rc::memory_resource
{
    std::vector<rc::isize> requested_bytes;
    std::vector<rc::isize> requested_alignments;
    int live_blocks = 0;

    RecordingResource()
    {
        allocate_bytes = [](rc::byte** out_ptr, rc::isize min_bytes, rc::isize max_bytes, rc::isize alignment,
                            void* userdata) -> rc::isize
        {
            (void)max_bytes;
            auto* self = static_cast<RecordingResource*>(userdata);
            self->requested_bytes.push_back(min_bytes);
            self->requested_alignments.push_back(alignment);
            ++self->live_blocks;
            *out_ptr = static_cast<rc::byte*>(::operator new(min_bytes, std::align_val_t(alignment)));
            return min_bytes;
        };

        deallocate_bytes = [](rc::byte* p, rc::isize bytes, rc::isize alignment, void* userdata)
        {
            (void)bytes;
            --static_cast<RecordingResource*>(userdata)->live_blocks;
            ::operator delete(p, std::align_val_t(alignment));
        };

        userdata = this;
    }
};
} // namespace

TEST("allocation - default construction owns nothing")
{
    rc::allocation<int> alloc;
    CHECK(!alloc.is_valid());
    CHECK(alloc.obj_start == nullptr);
    CHECK(alloc.obj_end == nullptr);
    CHECK(alloc.alloc_size_bytes() == 0);
    CHECK(alloc.slot_count() == 0);
    CHECK(alloc.obj_span().size() == 0);
    CHECK(&alloc.resource() == rc::default_memory_resource);
}

TEST("allocation - create_empty leaves the live window empty")
{
    auto alloc = rc::allocation<int>::create_empty(10, alignof(int), nullptr);
    REQUIRE(alloc.is_valid());
    CHECK(alloc.obj_start == (int*)alloc.alloc_start);
    CHECK(alloc.obj_end == alloc.obj_start);
    CHECK(alloc.alloc_size_bytes() == 10 * rc::isize(sizeof(int)));
    CHECK(alloc.slot_count() == 10);
}

TEST("allocation - zero bytes makes no allocation call")
{
    RecordingResource res;
    {
        auto alloc = rc::allocation<int>::create_empty(0, alignof(int), &res);
        CHECK(!alloc.is_valid());
        CHECK(alloc.custom_resource == &res);
        CHECK(alloc.slot_count() == 0);
    }
    CHECK(res.requested_bytes.empty());
    CHECK(res.live_blocks == 0);
}

TEST("allocation - custom resource and alignment")
{
    RecordingResource res;
    {
        auto alloc = rc::allocation<char>::create_empty_bytes(128, 128, 64, &res);
        CHECK(&alloc.resource() == &res);
        CHECK(alloc.alignment == 64);
        CHECK(reinterpret_cast<std::uintptr_t>(alloc.alloc_start) % 64 == 0);
        CHECK(alloc.slot_count() == 128);
        CHECK(res.live_blocks == 1);
    }
    REQUIRE(res.requested_bytes.size() == 1);
    CHECK(res.requested_bytes[0] == 128);
    CHECK(res.requested_alignments[0] == 64);
    CHECK(res.live_blocks == 0);
}

TEST("allocation - live window is destroyed in reverse")
{
    Tracked::reset_counters();
    std::vector<int> order;

    {
        std::vector<Tracked> const source = {Tracked(1), Tracked(2), Tracked(3)};
        Tracked::reset_counters();

        auto alloc = rc::allocation<Tracked>::create_empty(3, alignof(Tracked), nullptr);
        rc::impl::copy_create_objects_to(alloc.obj_end, source.data(), source.data() + source.size());
        CHECK(Tracked::copy_ctor_count == 3);
        CHECK(alloc.obj_span().size() == 3);
        CHECK(alloc.obj_start[2].value == 3);

        Tracked::destruction_order = &order;
        alloc = rc::allocation<Tracked>();
        Tracked::destruction_order = nullptr;
    }

    REQUIRE(order.size() == 3);
    CHECK(order[0] == 3);
    CHECK(order[1] == 2);
    CHECK(order[2] == 1);
}

TEST("allocation - move transfers ownership")
{
    RecordingResource res;
    {
        auto a = rc::allocation<int>::create_empty(4, alignof(int), &res);
        auto* const block = a.alloc_start;

        auto b = rc::move(a);
        CHECK(!a.is_valid()); // NOLINT(bugprone-use-after-move)
        CHECK(b.alloc_start == block);
        CHECK(res.live_blocks == 1);

        auto c = rc::allocation<int>::create_empty(2, alignof(int), &res);
        CHECK(res.live_blocks == 2);
        c = rc::move(b); // frees c's old block
        CHECK(res.live_blocks == 1);
        CHECK(c.alloc_start == block);
    }
    CHECK(res.live_blocks == 0);
}
