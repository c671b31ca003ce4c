#pragma once

#include <ring-core/assert.hh>
#include <ring-core/fwd.hh>
#include <ring-core/optional.hh>
#include <ring-core/ring_layout.hh>
#include <ring-core/utility.hh>

#include <iterator>
#include <type_traits>

/// Double-ended cursor over the live elements of a ringbuffer, in logical order.
///
/// ring_iter<T const> is the read-only traversal (ringbuffer::iter()), ring_iter<T> the mutable one
/// (ringbuffer::iter_mut()). The cursor keeps its own copy of the layout plus two logical offsets:
/// [_next, _next_back) are the elements not yet yielded. next() takes from the front, next_back()
/// from the back, in any interleaving. Every element is yielded exactly once, so references handed
/// out by a mutable traversal never alias.
///
/// Once exhausted the cursor stays exhausted: next() and next_back() keep returning nullopt.
///
/// The cursor borrows the ring: it must not outlive it, and any mutation of the ring through another
/// path (push, pop, clear, move, ...) invalidates it. At most one mutable cursor or mutable element
/// reference may exist at a time, and never alongside read-only ones. Read-only cursors can coexist.
///
/// It is also a C++ range: begin() returns a copy of the cursor, end() an rc::sentinel.
/// Range-for therefore walks the remaining elements front to back without consuming *this.
///
///   auto it = ring.iter();
///   for (auto v = it.next(); v.has_value(); v = it.next())
///       use(v.value());
///
///   for (auto& v : ring.iter_mut())
///       v *= 2;
template <class T>
struct rc::ring_iter
{
    using value_type = std::remove_cv_t<T>;
    using difference_type = isize;
    using iterator_concept = std::input_iterator_tag;

    // construction
public:
    ring_iter() = default;

    /// Starts a traversal over all live elements of the ring described by layout.
    ring_iter(T* slots, ring_layout layout) : _slots(slots), _layout(layout), _next(0), _next_back(layout.length)
    {
        RC_ASSERT(layout.is_valid(), "corrupted ring layout");
        RC_ASSERT(slots != nullptr || layout.capacity == 0, "ring with slots needs slot storage");
    }

    /// mutable -> read-only traversal
    operator ring_iter<T const>() const
        requires(!std::is_const_v<T>)
    {
        ring_iter<T const> r(_slots, _layout);
        r._next = _next;
        r._next_back = _next_back;
        return r;
    }

    // stepping
public:
    /// Yields the front-most remaining element and advances the front cursor.
    [[nodiscard]] rc::optional<T&> next()
    {
        if (_next == _next_back)
            return rc::nullopt;

        // _next < _next_back <= length, so the unchecked mapping is in contract
        auto& v = _slots[_layout.physical_unchecked(_next)];
        ++_next;
        return v;
    }

    /// Yields the back-most remaining element and retreats the back cursor.
    [[nodiscard]] rc::optional<T&> next_back()
    {
        if (_next == _next_back)
            return rc::nullopt;

        --_next_back;
        return _slots[_layout.physical_unchecked(_next_back)];
    }

    /// Exact number of elements not yet yielded.
    [[nodiscard]] isize remaining() const { return _next_back - _next; }

    [[nodiscard]] bool is_exhausted() const { return _next == _next_back; }

    // range protocol
public:
    [[nodiscard]] ring_iter begin() const { return *this; }
    [[nodiscard]] rc::sentinel end() const { return {}; }

    /// Precondition: !is_exhausted()
    [[nodiscard]] T& operator*() const
    {
        RC_ASSERT(_next != _next_back, "dereferencing an exhausted ring_iter");
        return _slots[_layout.physical_unchecked(_next)];
    }

    /// Precondition: !is_exhausted()
    ring_iter& operator++()
    {
        RC_ASSERT(_next != _next_back, "advancing an exhausted ring_iter");
        ++_next;
        return *this;
    }
    void operator++(int) { ++*this; }

    [[nodiscard]] bool operator==(rc::sentinel) const { return _next == _next_back; }

private:
    T* _slots = nullptr;
    ring_layout _layout;
    isize _next = 0;
    isize _next_back = 0;

    template <class>
    friend struct rc::ring_iter;
};
