#pragma once

#include <ring-core/allocation.hh>
#include <ring-core/assert.hh>
#include <ring-core/fwd.hh>
#include <ring-core/impl/object_lifetime_util.hh>
#include <ring-core/optional.hh>
#include <ring-core/result.hh>
#include <ring-core/ring_iter.hh>
#include <ring-core/ring_layout.hh>
#include <ring-core/span.hh>
#include <ring-core/unique_array.hh>
#include <ring-core/utility.hh>

#include <new>
#include <type_traits>

/// Error of a push onto a full ring.
/// Carries the rejected element back to the caller, untouched, plus the capacity that refused it.
template <class T>
struct rc::capacity_exceeded
{
    T value;
    isize capacity = 0;
};

/// The live elements of a ring as at most two contiguous runs of slots, in logical order.
/// first starts at the front element; second is the wrapped part at the start of the slot block and is
/// empty unless the live set wraps around.
template <class T>
struct rc::ring_segments
{
    rc::span<T> first;
    rc::span<T> second;

    [[nodiscard]] isize size() const { return first.size() + second.size(); }
};

/// Fixed-capacity double-ended queue over a single slot block (circular buffer).
///
/// The slot block is allocated once, at creation, and never grows, shrinks or moves while the ring
/// lives. push_back/push_front/pop_back/pop_front are O(1) and never allocate.
/// A push onto a full ring is refused: the returned result holds the element in capacity_exceeded.
/// Nothing is ever overwritten or dropped.
///
/// Capacity 0 is allowed: such a ring is permanently both empty and full.
///
/// Access discipline: read-only views (front(), back(), get(), iter(), segments(), const operator[])
/// may coexist freely. A mutable view (front_mut(), back_mut(), get_mut(), iter_mut(), segments_mut(),
/// non-const operator[]) must be the only view alive. Any push/pop/clear invalidates all views.
///
/// Equality compares logical content only (size and elements front to back).
///
/// Usage:
///   auto ring = rc::ringbuffer<int>::create_with_capacity(3);
///   (void)ring.push_back(1);
///   (void)ring.push_back(2);
///   auto r = ring.push_front(0);         // ring is [0, 1, 2], r.has_value()
///   auto refused = ring.push_back(3);    // refused.error().value == 3
///   auto front = ring.pop_front();       // front.value() == 0
template <class T>
struct rc::ringbuffer
{
    static_assert(!std::is_reference_v<T>, "ringbuffer stores values, not references");
    static_assert(std::is_move_constructible_v<T>, "elements are moved into and out of the slots");

    /// Slot blocks start on their own destructive-interference unit (typically a cache line).
    static constexpr isize alloc_alignment = rc::max(alignof(T), std::hardware_destructive_interference_size);

    // element access
public:
    /// Front element, or nullopt when empty.
    [[nodiscard]] rc::optional<T const&> front() const
    {
        if (_layout.is_empty())
            return rc::nullopt;
        return _slot(_layout.head);
    }

    /// Back element, or nullopt when empty.
    [[nodiscard]] rc::optional<T const&> back() const
    {
        if (_layout.is_empty())
            return rc::nullopt;
        return _slot(_layout.back_slot());
    }

    /// Mutable front element, or nullopt when empty. Exclusive view.
    [[nodiscard]] rc::optional<T&> front_mut()
    {
        if (_layout.is_empty())
            return rc::nullopt;
        return _slot(_layout.head);
    }

    /// Mutable back element, or nullopt when empty. Exclusive view.
    [[nodiscard]] rc::optional<T&> back_mut()
    {
        if (_layout.is_empty())
            return rc::nullopt;
        return _slot(_layout.back_slot());
    }

    /// Element at logical index i (0 is the front), or nullopt if i is not in [0, size()).
    /// Always validated, in every build configuration.
    [[nodiscard]] rc::optional<T const&> get(isize i) const
    {
        auto const slot = _layout.physical(i);
        if (!slot.has_value())
            return rc::nullopt;
        return _slot(slot.value());
    }

    /// Mutable element at logical index i, or nullopt. Exclusive view.
    [[nodiscard]] rc::optional<T&> get_mut(isize i)
    {
        auto const slot = _layout.physical(i);
        if (!slot.has_value())
            return rc::nullopt;
        return _slot(slot.value());
    }

    /// Element at logical index i.
    /// Precondition: 0 <= i < size(). Asserted in checked builds, not validated in release builds.
    [[nodiscard]] T& operator[](isize i)
    {
        RC_ASSERT(0 <= i && i < _layout.length, "logical index out of bounds");
        return _slot(_layout.physical_unchecked(i));
    }
    [[nodiscard]] T const& operator[](isize i) const
    {
        RC_ASSERT(0 <= i && i < _layout.length, "logical index out of bounds");
        return _slot(_layout.physical_unchecked(i));
    }

    // iteration
public:
    /// Read-only front-to-back (and back-to-front) traversal.
    [[nodiscard]] rc::ring_iter<T const> iter() const { return rc::ring_iter<T const>(_slots.obj_start, _layout); }

    /// Mutable traversal. Exclusive view.
    [[nodiscard]] rc::ring_iter<T> iter_mut() { return rc::ring_iter<T>(_slots.obj_start, _layout); }

    [[nodiscard]] rc::ring_iter<T const> begin() const { return iter(); }
    [[nodiscard]] rc::ring_iter<T> begin() { return iter_mut(); }
    [[nodiscard]] rc::sentinel end() const { return {}; }

    /// Live elements as (at most) two contiguous slot runs in logical order.
    [[nodiscard]] rc::ring_segments<T const> segments() const
    {
        auto const s = _segments();
        return {s.first, s.second};
    }

    /// Mutable slot runs. Exclusive view.
    [[nodiscard]] rc::ring_segments<T> segments_mut() { return _segments(); }

    // queries
public:
    [[nodiscard]] isize size() const { return _layout.length; }
    [[nodiscard]] isize capacity() const { return _layout.capacity; }
    [[nodiscard]] bool empty() const { return _layout.is_empty(); }
    [[nodiscard]] bool full() const { return _layout.is_full(); }

    /// Current bookkeeping (head, length, capacity)
    [[nodiscard]] rc::ring_layout const& layout() const { return _layout; }

    [[nodiscard]] rc::memory_resource const* custom_resource() const { return _slots.custom_resource; }

    // modifiers
public:
    /// Appends value behind the back element.
    /// On a full ring nothing changes and the error carries value back.
    [[nodiscard]] rc::result<void, rc::capacity_exceeded<T>> push_back(T value)
    {
        if (_layout.is_full()) [[unlikely]]
            return rc::error(rc::capacity_exceeded<T>{rc::move(value), _layout.capacity});

        new (rc::placement_new, _slot_ptr(_layout.back_insert_slot())) T(rc::move(value));
        _layout.grow_back(); // _after_ construction so a throwing T leaves the ring unchanged
        return {};
    }

    /// Prepends value before the front element.
    /// On a full ring nothing changes and the error carries value back.
    [[nodiscard]] rc::result<void, rc::capacity_exceeded<T>> push_front(T value)
    {
        if (_layout.is_full()) [[unlikely]]
            return rc::error(rc::capacity_exceeded<T>{rc::move(value), _layout.capacity});

        new (rc::placement_new, _slot_ptr(_layout.front_insert_slot())) T(rc::move(value));
        _layout.grow_front();
        return {};
    }

    /// Removes and returns the front element, or nullopt when empty.
    [[nodiscard]] rc::optional<T> pop_front()
    {
        if (_layout.is_empty())
            return rc::nullopt;

        T* const p = _slot_ptr(_layout.head);
        rc::optional<T> value = rc::move(*p);
        p->~T();
        _layout.shrink_front();
        return value;
    }

    /// Removes and returns the back element, or nullopt when empty.
    [[nodiscard]] rc::optional<T> pop_back()
    {
        if (_layout.is_empty())
            return rc::nullopt;

        T* const p = _slot_ptr(_layout.back_slot());
        rc::optional<T> value = rc::move(*p);
        p->~T();
        _layout.shrink_back();
        return value;
    }

    /// Destroys all elements (front to back order is not guaranteed), keeps the slot block.
    void clear()
    {
        auto const s = _segments();
        impl::destroy_objects_in_reverse(s.second.begin(), s.second.end());
        impl::destroy_objects_in_reverse(s.first.begin(), s.first.end());
        _layout.reset();
    }

    // linearization
public:
    /// Consumes the ring and returns its elements, front first, in a new tight block from the same
    /// memory resource. The ring is left with capacity 0 and its slot block released.
    /// Usage:
    ///   auto arr = rc::move(ring).into_unique_array();
    [[nodiscard]] rc::unique_array<T> into_unique_array() &&
    {
        auto out = rc::allocation<T>::create_empty(_layout.length, alignof(T), _slots.custom_resource);

        auto const s = _segments();
        impl::move_create_objects_to(out.obj_end, s.first.begin(), s.first.end());
        impl::move_create_objects_to(out.obj_end, s.second.begin(), s.second.end());

        clear();
        _release_slots();

        return rc::unique_array<T>::create_from_allocation(rc::move(out));
    }

    // factories
public:
    /// Empty ring with `capacity` slots, allocated once from `resource` (nullptr: default resource).
    /// Capacity 0 allocates nothing.
    [[nodiscard]] static ringbuffer create_with_capacity(isize capacity, rc::memory_resource const* resource = nullptr)
    {
        RC_ASSERT(capacity >= 0, "ringbuffer capacity must be non-negative");

        ringbuffer r;
        r._slots = _allocate_slots(capacity, resource);
        r._layout = rc::ring_layout::create_empty(capacity);
        return r;
    }

    /// Full ring holding copies of source, front first (capacity == source.size()).
    [[nodiscard]] static ringbuffer create_copy_of(rc::span<T const> source, rc::memory_resource const* resource = nullptr)
        requires std::is_copy_constructible_v<T>
    {
        return create_copy_of(source, source.size(), resource);
    }

    /// Ring with `capacity` slots holding copies of source, front first.
    /// Precondition: capacity >= source.size()
    [[nodiscard]] static ringbuffer create_copy_of(rc::span<T const> source, isize capacity, rc::memory_resource const* resource = nullptr)
        requires std::is_copy_constructible_v<T>
    {
        RC_ASSERT(capacity >= source.size(), "capacity too small for the source elements");

        ringbuffer r;
        r._adopt_copies(capacity, resource, source, {});
        return r;
    }

    // comparison
public:
    /// Equal iff same size and pairwise equal elements in logical order.
    /// Capacity and physical placement are ignored.
    [[nodiscard]] friend bool operator==(ringbuffer const& lhs, ringbuffer const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        if (lhs.size() != rhs.size())
            return false;

        auto it_l = lhs.iter();
        auto it_r = rhs.iter();
        while (!it_l.is_exhausted())
            if (!(it_l.next().value() == it_r.next().value()))
                return false;
        return true;
    }

    // lifecycle
public:
    /// Zero-capacity ring
    ringbuffer() = default;

    /// Deep copy into a fresh block of the same capacity and resource, layout normalized to head == 0.
    ringbuffer(ringbuffer const& rhs)
        requires std::is_copy_constructible_v<T>
    {
        auto const s = rhs.segments();
        _adopt_copies(rhs.capacity(), rhs._slots.custom_resource, s.first, s.second);
    }

    ringbuffer& operator=(ringbuffer const& rhs)
        requires std::is_copy_constructible_v<T>
    {
        if (this != &rhs)
            *this = ringbuffer(rhs);
        return *this;
    }

    /// Takes over the slot block; no element is touched. rhs becomes a zero-capacity ring.
    ringbuffer(ringbuffer&& rhs) noexcept
      : _slots(rc::move(rhs._slots)), _layout(rc::exchange(rhs._layout, rc::ring_layout{}))
    {
    }

    /// Safe even if rhs lives inside one of our elements: rhs is emptied into a temporary first.
    ringbuffer& operator=(ringbuffer&& rhs) noexcept
    {
        if (this != &rhs)
        {
            auto tmp = rc::move(rhs);
            clear();
            _slots = rc::move(tmp._slots);
            _layout = rc::exchange(tmp._layout, rc::ring_layout{});
        }
        return *this;
    }

    /// Destroys the live elements, then the slot block is returned to its resource.
    ~ringbuffer() { clear(); }

    // helper
private:
    [[nodiscard]] T* _slot_ptr(isize slot) const { return _slots.obj_start + slot; }
    [[nodiscard]] T& _slot(isize slot) const { return _slots.obj_start[slot]; }

    [[nodiscard]] rc::ring_segments<T> _segments() const
    {
        if (_layout.is_empty())
            return {};

        auto const first_len = _layout.first_run_length();
        return {
            rc::span<T>(_slot_ptr(_layout.head), first_len),
            rc::span<T>(_slot_ptr(0), _layout.length - first_len),
        };
    }

    /// Slot block for `capacity` elements, rounded up to alloc_alignment. The live window stays empty.
    [[nodiscard]] static rc::allocation<T> _allocate_slots(isize capacity, rc::memory_resource const* resource)
    {
        auto const byte_size = rc::align_up(capacity * isize(sizeof(T)), alloc_alignment);
        auto slots = rc::allocation<T>::create_empty_bytes(byte_size, byte_size, alloc_alignment, resource);
        RC_ASSERT(slots.slot_count() >= capacity, "slot block too small for the requested capacity");
        return slots;
    }

    /// Replaces the (empty) slot block with a new one holding copies of a then b, starting at slot 0.
    /// While copying, the allocation's live window tracks the constructed prefix, so a throwing copy
    /// constructor destroys exactly what was built and frees the block.
    void _adopt_copies(isize capacity, rc::memory_resource const* resource, rc::span<T const> a, rc::span<T const> b)
    {
        RC_ASSERT(_layout.is_empty(), "can only adopt into an empty ring");

        auto slots = _allocate_slots(capacity, resource);
        impl::copy_create_objects_to(slots.obj_end, a.data(), a.data() + a.size());
        impl::copy_create_objects_to(slots.obj_end, b.data(), b.data() + b.size());

        auto const length = isize(slots.obj_end - slots.obj_start);
        slots.obj_end = slots.obj_start; // from here on the ring tracks liveness

        _slots = rc::move(slots);
        _layout = rc::ring_layout{0, length, capacity};
    }

    void _release_slots()
    {
        RC_ASSERT(_layout.is_empty(), "releasing slots with live elements");
        _slots = rc::allocation<T>();
        _layout = rc::ring_layout{};
    }

    // members
private:
    rc::allocation<T> _slots;
    rc::ring_layout _layout;
};
