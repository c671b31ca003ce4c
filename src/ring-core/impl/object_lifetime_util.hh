#pragma once

#include <ring-core/fwd.hh>
#include <ring-core/utility.hh>

#include <cstring>
#include <type_traits>

// Helpers that start and end object lifetimes in raw slot storage.
// The construct helpers advance dest_end only _after_ each successful construction, so if a
// constructor throws, [start, dest_end) is exactly the range that needs destroying.

namespace rc::impl
{
/// Calls destructors on [start, end) in reverse order.
/// Empty ranges and nullptr are valid no-ops.
template <class T>
constexpr void destroy_objects_in_reverse(T* start, T* end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");

    if constexpr (!std::is_trivially_destructible_v<T>)
    {
        while (end != start)
        {
            --end;
            end->~T();
        }
    }
}

/// Copy-constructs [src_start, src_end) into uninitialized memory starting at dest_end.
/// Trivially copyable types are copied with a single memcpy.
///
/// Usage pattern:
///   auto obj_end = obj_start;
///   copy_create_objects_to(obj_end, seg.data(), seg.data() + seg.size());
///   // [obj_start, obj_end) is now the constructed live range
template <class T>
constexpr void copy_create_objects_to(T*& dest_end, T const* src_start, T const* src_end)
{
    static_assert(std::is_copy_constructible_v<T>, "T must be copy constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        if (size > 0)
        {
            std::memcpy(dest_end, src_start, size * sizeof(T));
            dest_end += size;
        }
    }
    else
    {
        while (src_start != src_end)
        {
            new (rc::placement_new, dest_end) T(*src_start);
            ++dest_end;
            ++src_start;
        }
    }
}

/// Move-constructs [src_start, src_end) into uninitialized memory starting at dest_end.
/// The sources stay alive (moved-from) and must still be destroyed by their owner.
/// No exception safety is promised if a move constructor throws.
template <class T>
constexpr void move_create_objects_to(T*& dest_end, T* src_start, T* src_end)
{
    static_assert(std::is_move_constructible_v<T>, "T must be move constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        if (size > 0)
        {
            std::memcpy(dest_end, src_start, size * sizeof(T));
            dest_end += size;
        }
    }
    else
    {
        while (src_start != src_end)
        {
            new (rc::placement_new, dest_end) T(rc::move(*src_start));
            ++dest_end;
            ++src_start;
        }
    }
}
} // namespace rc::impl
