#include "allocation.hh"

#include <ring-core/assert.hh>
#include <ring-core/macros.hh>
#include <ring-core/utility.hh>

#include <cstdlib>

namespace
{
// stateless system allocator, userdata is ignored

rc::isize system_allocate_bytes(rc::byte** out_ptr, rc::isize min_bytes, rc::isize max_bytes, rc::isize alignment, void* userdata)
{
    RC_UNUSED(max_bytes);
    RC_UNUSED(userdata);

    RC_ASSERT(alignment > 0 && rc::is_power_of_two(alignment), "alignment must be a power of 2");

    if (min_bytes == 0)
    {
        *out_ptr = nullptr;
        return 0;
    }

    rc::byte* p = nullptr;

#ifdef RC_OS_WINDOWS
    p = static_cast<rc::byte*>(_aligned_malloc(min_bytes, alignment));
#else
    // posix_memalign has no bytes % alignment requirement (unlike aligned_alloc)
    // but needs alignment >= sizeof(void*)
    void* raw_ptr = nullptr;
    rc::isize const effective_alignment = alignment < rc::isize(sizeof(void*)) ? rc::isize(sizeof(void*)) : alignment;
    if (posix_memalign(&raw_ptr, effective_alignment, min_bytes) == 0)
        p = static_cast<rc::byte*>(raw_ptr);
#endif

    RC_ASSERT_ALWAYS(p != nullptr, "system allocation failed");

    *out_ptr = p;
    return min_bytes;
}

void system_deallocate_bytes(rc::byte* p, rc::isize bytes, rc::isize alignment, void* userdata)
{
    RC_UNUSED(bytes);
    RC_UNUSED(alignment);
    RC_UNUSED(userdata);

#ifdef RC_OS_WINDOWS
    _aligned_free(p);
#else
    std::free(p);
#endif
}

constinit rc::memory_resource const system_memory_resource = {
    .allocate_bytes = system_allocate_bytes,
    .deallocate_bytes = system_deallocate_bytes,
    .userdata = nullptr,
};

} // namespace

constinit rc::memory_resource const* const rc::default_memory_resource = &system_memory_resource;
