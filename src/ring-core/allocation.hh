#pragma once

#include <ring-core/fwd.hh>
#include <ring-core/impl/object_lifetime_util.hh>
#include <ring-core/span.hh>
#include <ring-core/utility.hh>

// rc::allocation<T> is the owning "bytes + live window" handle behind every heap block in ring-core.
//
// It tracks two things:
// 1) which bytes are owned (a block from an rc::memory_resource),
// 2) which objects inside those bytes are alive (the contiguous live window [obj_start, obj_end)).
//
// unique_array<T> keeps its whole block alive through the window.
// ringbuffer<T> uses an allocation purely as slot storage: its live set wraps around and can be split
// into two segments, which a single window cannot describe. The ring therefore keeps the window empty
// (obj_start == obj_end == first slot) and destroys its live elements itself before the block is freed.
// During construction the ring temporarily grows the window so that a throwing copy unwinds cleanly.
//
// Memory comes from a polymorphic rc::memory_resource (POD with function pointers, usable during static
// initialization). The resource pointer is stored in the allocation; null means rc::default_memory_resource.
//
// Invariants:
// - [alloc_start, alloc_end) is the owned byte range.
// - alloc_start <= obj_start <= obj_end <= alloc_end, obj_start and obj_end aligned to alignof(T).
// - custom_resource == nullptr implies rc::default_memory_resource.

namespace rc
{
/// System allocator (aligned malloc/free) used when allocation::custom_resource == nullptr.
/// Lives in the data segment, so the pointer is valid during static initialization.
extern rc::memory_resource const* const default_memory_resource;
} // namespace rc

/// Pluggable allocation strategy for allocation<T>.
/// Plain function pointers plus userdata: no virtual dispatch, no non-trivial constructors.
struct rc::memory_resource
{
    /// Allocate between `min_bytes` and `max_bytes` with at least `alignment` alignment.
    /// Returns the actual allocated size in [min_bytes, max_bytes] and stores the block in `*out_ptr`.
    /// min_bytes == 0 sets *out_ptr to nullptr and returns 0.
    /// For min_bytes > 0 failure is fatal; there is no null return.
    rc::function_ptr<isize(rc::byte** out_ptr, isize min_bytes, isize max_bytes, isize alignment, void* userdata)> allocate_bytes
        = nullptr;

    /// Return a block obtained from allocate_bytes with the same size (the returned one) and alignment.
    /// Must not throw on exhaustion.
    rc::function_ptr<void(rc::byte* p, isize bytes, isize alignment, void* userdata)> deallocate_bytes = nullptr;

    /// Opaque state for stateful resources (pools, arenas, counters). May be nullptr.
    void* userdata = nullptr;
};

/// Owning handle for a byte block plus a typed live window inside it.
template <class T>
struct rc::allocation
{
    /// First live object. Also the first slot, for slot-storage users.
    T* obj_start = nullptr;

    /// One past the last live object.
    T* obj_end = nullptr;

    /// Base pointer returned by the memory resource (passed back on deallocation).
    rc::byte* alloc_start = nullptr;

    /// One past the last owned byte.
    rc::byte* alloc_end = nullptr;

    /// Alignment the block was requested with (needed again on deallocation).
    isize alignment = 0;

    /// Owning resource, or nullptr for the global default.
    rc::memory_resource const* custom_resource = nullptr;

    // minimal helper api
public:
    [[nodiscard]] rc::memory_resource const& resource() const
    {
        return custom_resource ? *custom_resource : *default_memory_resource;
    }

    /// True iff bytes are owned (alloc_start != nullptr)
    [[nodiscard]] bool is_valid() const { return alloc_start != nullptr; }

    [[nodiscard]] rc::span<T> obj_span() const { return rc::span<T>(obj_start, obj_end); }

    [[nodiscard]] isize alloc_size_bytes() const { return alloc_end - alloc_start; }

    /// Number of T that fit between obj_start and alloc_end
    [[nodiscard]] isize slot_count() const
    {
        return obj_start == nullptr ? 0 : ((rc::byte const*)alloc_end - (rc::byte const*)obj_start) / isize(sizeof(T));
    }

    // factories
public:
    /// Allocates between min_bytes and max_bytes without constructing anything.
    /// The result has obj_start == obj_end == alloc_start.
    /// min_bytes == 0 performs no allocation call and yields an empty allocation carrying the resource.
    [[nodiscard]] static allocation create_empty_bytes(isize min_bytes, isize max_bytes, isize alignment, memory_resource const* resource)
    {
        RC_ASSERT(alignment >= isize(alignof(T)), "alignment must be at least alignof(T)");
        RC_ASSERT(0 <= min_bytes && min_bytes <= max_bytes, "must have 0 <= min_bytes <= max_bytes");

        allocation result;
        result.custom_resource = resource;
        result.alignment = alignment;

        if (min_bytes == 0)
            return result;

        auto const& res = result.resource();
        auto const actual_byte_size = res.allocate_bytes(&result.alloc_start, min_bytes, max_bytes, alignment, res.userdata);
        RC_ASSERT_ALWAYS(result.alloc_start != nullptr, "memory resource returned no memory for a non-empty request");
        RC_ASSERT(min_bytes <= actual_byte_size && actual_byte_size <= max_bytes, "memory resource returned a size "
                                                                                  "outside the requested range");
        result.alloc_end = result.alloc_start + actual_byte_size;

        result.obj_start = (T*)result.alloc_start;
        result.obj_end = result.obj_start;

        return result;
    }

    /// Allocates room for exactly `size` objects, none constructed.
    [[nodiscard]] static allocation create_empty(isize size, isize alignment, memory_resource const* resource)
    {
        RC_ASSERT(size >= 0, "size must be non-negative");
        auto const byte_size = size * isize(sizeof(T));
        return create_empty_bytes(byte_size, byte_size, alignment, resource);
    }

    // lifecycle
public:
    allocation() = default;

    // owners copy explicitly
    allocation(allocation const&) = delete;
    allocation& operator=(allocation const&) = delete;

    allocation(allocation&& rhs) noexcept
      : obj_start(rc::exchange(rhs.obj_start, nullptr)),
        obj_end(rc::exchange(rhs.obj_end, nullptr)),
        alloc_start(rc::exchange(rhs.alloc_start, nullptr)),
        alloc_end(rc::exchange(rhs.alloc_end, nullptr)),
        alignment(rc::exchange(rhs.alignment, 0)),
        custom_resource(rhs.custom_resource) // rhs resource stays
    {
    }

    /// Safe even if rhs lives inside one of the objects destroyed here:
    /// rhs is emptied into a temporary first.
    allocation& operator=(allocation&& rhs) noexcept
    {
        if (this != &rhs)
        {
            auto rhs_tmp = rc::move(rhs);

            _release();

            obj_start = rc::exchange(rhs_tmp.obj_start, nullptr);
            obj_end = rc::exchange(rhs_tmp.obj_end, nullptr);
            alloc_start = rc::exchange(rhs_tmp.alloc_start, nullptr);
            alloc_end = rc::exchange(rhs_tmp.alloc_end, nullptr);
            alignment = rc::exchange(rhs_tmp.alignment, 0);
            custom_resource = rhs_tmp.custom_resource;
        }

        return *this;
    }

    ~allocation() { _release(); }

private:
    void _release()
    {
        impl::destroy_objects_in_reverse(obj_start, obj_end);

        if (alloc_start != nullptr)
        {
            auto const& res = resource();
            res.deallocate_bytes(alloc_start, alloc_end - alloc_start, alignment, res.userdata);
        }
    }
};
