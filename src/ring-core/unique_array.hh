#pragma once

#include <ring-core/allocation.hh>
#include <ring-core/assert.hh>
#include <ring-core/fwd.hh>
#include <ring-core/span.hh>
#include <ring-core/utility.hh>

#include <type_traits>

/// Owned, heap-allocated, fixed-size contiguous sequence of T with move-only semantics.
/// Produced by ringbuffer::into_unique_array() holding the ring's elements in logical order.
/// All elements of the block are alive; the size never changes after creation.
template <class T>
struct rc::unique_array
{
    // element access
public:
    /// Precondition: 0 <= i < size()
    [[nodiscard]] T& operator[](isize i)
    {
        RC_ASSERT(0 <= i && i < size(), "index out of bounds");
        return _data.obj_start[i];
    }
    [[nodiscard]] T const& operator[](isize i) const
    {
        RC_ASSERT(0 <= i && i < size(), "index out of bounds");
        return _data.obj_start[i];
    }

    /// Precondition: !empty()
    [[nodiscard]] T& front()
    {
        RC_ASSERT(!empty(), "front() called on empty array");
        return _data.obj_start[0];
    }
    [[nodiscard]] T const& front() const
    {
        RC_ASSERT(!empty(), "front() called on empty array");
        return _data.obj_start[0];
    }

    /// Precondition: !empty()
    [[nodiscard]] T& back()
    {
        RC_ASSERT(!empty(), "back() called on empty array");
        return _data.obj_end[-1];
    }
    [[nodiscard]] T const& back() const
    {
        RC_ASSERT(!empty(), "back() called on empty array");
        return _data.obj_end[-1];
    }

    [[nodiscard]] T* data() { return _data.obj_start; }
    [[nodiscard]] T const* data() const { return _data.obj_start; }

    // iterators
public:
    [[nodiscard]] T* begin() { return _data.obj_start; }
    [[nodiscard]] T* end() { return _data.obj_end; }
    [[nodiscard]] T const* begin() const { return _data.obj_start; }
    [[nodiscard]] T const* end() const { return _data.obj_end; }

    // queries
public:
    [[nodiscard]] isize size() const { return _data.obj_end - _data.obj_start; }
    [[nodiscard]] bool empty() const { return _data.obj_end == _data.obj_start; }
    [[nodiscard]] isize size_bytes() const { return size() * isize(sizeof(T)); }

    [[nodiscard]] rc::span<T> as_span() { return _data.obj_span(); }
    [[nodiscard]] rc::span<T const> as_span() const { return rc::span<T const>(_data.obj_start, _data.obj_end); }

    // factories
public:
    /// Takes over a fully alive allocation (its live window becomes the array).
    [[nodiscard]] static unique_array create_from_allocation(rc::allocation<T> data)
    {
        unique_array result;
        result._data = rc::move(data);
        return result;
    }

    // comparison
public:
    /// Element-wise equality
    [[nodiscard]] friend bool operator==(unique_array const& lhs, unique_array const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        if (lhs.size() != rhs.size())
            return false;
        for (isize i = 0; i < lhs.size(); ++i)
            if (!(lhs._data.obj_start[i] == rhs._data.obj_start[i]))
                return false;
        return true;
    }

    // lifecycle
public:
    unique_array() = default;
    ~unique_array() = default;
    unique_array(unique_array&&) = default;
    unique_array& operator=(unique_array&&) = default;
    unique_array(unique_array const&) = delete;
    unique_array& operator=(unique_array const&) = delete;

private:
    rc::allocation<T> _data;
};
