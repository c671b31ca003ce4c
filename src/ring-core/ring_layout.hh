#pragma once

#include <ring-core/assert.hh>
#include <ring-core/fwd.hh>
#include <ring-core/optional.hh>
#include <ring-core/utility.hh>

// Index arithmetic of a ring with a fixed number of slots.
//
// A ring's occupancy is fully described by three numbers:
//   head     - physical slot of the logical front element (0 when empty)
//   length   - number of live elements
//   capacity - number of slots, fixed
// Live slots are exactly { (head + i) mod capacity : 0 <= i < length }.
//
// Two mapping flavors exist and agree on every valid input:
//   physical(offset)            checked, returns nullopt for anything outside [0, length) or capacity == 0
//   physical_unchecked(offset)  hot path, preconditions are asserted in checked builds only
// Neither divides: head + offset < 2 * capacity, so one conditional subtraction is enough.
// A zero-capacity ring never reaches any slot computation.
//
// The mutators only move bookkeeping. The owner constructs/destroys the element first and commits the
// layout change afterwards, so a throwing element constructor leaves the layout untouched.

struct rc::ring_layout
{
    isize head = 0;
    isize length = 0;
    isize capacity = 0;

    // construction
public:
    [[nodiscard]] static constexpr ring_layout create_empty(isize capacity)
    {
        RC_ASSERT(capacity >= 0, "capacity must be non-negative");
        return ring_layout{0, 0, capacity};
    }

    // queries
public:
    [[nodiscard]] constexpr bool is_empty() const { return length == 0; }

    /// A zero-capacity ring is both empty and full.
    [[nodiscard]] constexpr bool is_full() const { return length == capacity; }

    /// Checks 0 <= head < capacity (or head == 0 for capacity 0) and 0 <= length <= capacity.
    [[nodiscard]] constexpr bool is_valid() const
    {
        if (capacity < 0 || length < 0 || length > capacity)
            return false;
        if (capacity == 0)
            return head == 0;
        return 0 <= head && head < capacity;
    }

    // mapping
public:
    /// Physical slot of the element at logical offset, or nullopt if there is none.
    [[nodiscard]] constexpr rc::optional<isize> physical(isize offset) const
    {
        RC_ASSERT(is_valid(), "corrupted ring layout");

        if (offset < 0 || offset >= length) // also covers capacity == 0
            return rc::nullopt;

        auto const p = head + offset;
        return p >= capacity ? p - capacity : p;
    }

    /// Physical slot of logical offset without validation.
    /// Preconditions: capacity > 0, 0 <= head < capacity, 0 <= offset < capacity.
    /// offset may exceed length (used to address free slots behind the back).
    [[nodiscard]] RC_FORCE_INLINE constexpr isize physical_unchecked(isize offset) const
    {
        RC_ASSERT(capacity > 0, "zero-capacity ring has no slots");
        RC_ASSERT(0 <= head && head < capacity, "head outside of slot range");
        RC_ASSERT(0 <= offset && offset < capacity, "logical offset outside of slot range");

        auto const p = head + offset;
        return p >= capacity ? p - capacity : p;
    }

    /// Logical offset of a physical slot, or nullopt if the slot is not occupied.
    [[nodiscard]] constexpr rc::optional<isize> logical(isize slot) const
    {
        RC_ASSERT(is_valid(), "corrupted ring layout");

        if (slot < 0 || slot >= capacity)
            return rc::nullopt;

        auto const offset = slot >= head ? slot - head : slot + capacity - head;
        if (offset >= length)
            return rc::nullopt;
        return offset;
    }

    /// Slot a push_back writes to: (head + length) mod capacity.
    /// Precondition: !is_full()
    [[nodiscard]] constexpr isize back_insert_slot() const
    {
        RC_ASSERT(!is_full(), "no free slot behind the back");
        return physical_unchecked(length);
    }

    /// Slot a push_front writes to: (head - 1) mod capacity.
    /// Precondition: !is_full()
    [[nodiscard]] constexpr isize front_insert_slot() const
    {
        RC_ASSERT(!is_full(), "no free slot before the front");
        return rc::wrapped_decrement(head, capacity);
    }

    /// Slot of the last live element: (head + length - 1) mod capacity.
    /// Precondition: !is_empty()
    [[nodiscard]] constexpr isize back_slot() const
    {
        RC_ASSERT(!is_empty(), "empty ring has no back element");
        return physical_unchecked(length - 1);
    }

    /// Number of live elements in the first contiguous run, starting at head.
    /// The remaining length - first_run_length() elements start at slot 0.
    [[nodiscard]] constexpr isize first_run_length() const { return rc::min(length, capacity - head); }

    // bookkeeping mutators (commit after the element operation succeeded)
public:
    /// Commits an element constructed at back_insert_slot().
    constexpr void grow_back()
    {
        RC_ASSERT(!is_full(), "ring is full");
        ++length;
    }

    /// Commits an element constructed at front_insert_slot().
    constexpr void grow_front()
    {
        RC_ASSERT(!is_full(), "ring is full");
        head = rc::wrapped_decrement(head, capacity);
        ++length;
    }

    /// Commits removal of the element at head.
    constexpr void shrink_front()
    {
        RC_ASSERT(!is_empty(), "ring is empty");
        --length;
        // keep head canonical for empty rings so equal histories give equal layouts
        head = length == 0 ? 0 : rc::wrapped_increment(head, capacity);
    }

    /// Commits removal of the element at back_slot().
    constexpr void shrink_back()
    {
        RC_ASSERT(!is_empty(), "ring is empty");
        --length;
        if (length == 0)
            head = 0;
    }

    /// Forgets all elements, keeps the capacity.
    constexpr void reset()
    {
        head = 0;
        length = 0;
    }

    [[nodiscard]] constexpr bool operator==(ring_layout const&) const = default;
};
