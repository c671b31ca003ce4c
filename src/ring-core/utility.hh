#pragma once

#include <ring-core/assert.hh>
#include <ring-core/fwd.hh>

#include <type_traits>

// =========================================================================================================
// Utility functions for common operations
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//   exchange(obj, new_val)      - replace obj with new_val and return old value
//
// Comparison:
//   max(a, b) / min(a, b)       - larger / smaller of two values (requires operator<)
//
// Wrapping arithmetic:
//   wrapped_increment(pos, max) - increment with wrap-around to 0 at max
//   wrapped_decrement(pos, max) - decrement with wrap-around to max-1 at 0
//
// Alignment:
//   is_power_of_two(value)      - check if value is a power of 2
//   align_up(value, alignment)  - increment to next aligned boundary (power of 2)
//
// Object storage:
//   placement_new               - tag for constructing into raw storage without <new>
//   storage_for<T>              - uninitialized, correctly aligned storage for one T
//
// Template metaprogramming:
//   function_ptr<Signature>     - convert function signature to function pointer type
//
// Iterator utilities:
//   sentinel                    - lightweight end-of-range sentinel type
//

namespace rc
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
template <class T>
[[nodiscard]] RC_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Perfect forwarding for template arguments
template <class T>
[[nodiscard]] RC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] RC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// Replace object with new value and return the old value
/// Usage:
///   auto layout = rc::exchange(rhs._layout, {}); // take the bookkeeping, leave rhs empty
template <class T, class U = T>
[[nodiscard]] RC_FORCE_INLINE constexpr T exchange(T& obj, U&& new_val) // NOLINT
{
    T old_val = static_cast<T&&>(obj);
    obj = rc::forward<U>(new_val);
    return old_val;
}

// =========================================================================================================
// Comparison
// =========================================================================================================

/// Returns the larger of two values using operator<
/// When a == b, max returns b (consistent with min returning a)
template <class T>
[[nodiscard]] constexpr T const& max(T const& a, T const& b)
{
    return (b < a) ? a : b; // NOLINT(bugprone-return-const-ref-from-parameter)
}

/// Returns the smaller of two values using operator<
template <class T>
[[nodiscard]] constexpr T const& min(T const& a, T const& b)
{
    return (b < a) ? b : a; // NOLINT(bugprone-return-const-ref-from-parameter)
}

// =========================================================================================================
// Wrapping arithmetic
// =========================================================================================================

/// Increment with wrap-around: (pos + 1) % max, computed without a division
/// Preconditions: max > 0, 0 <= pos < max
/// Usage:
///   // wrapped_increment(0, 3) == 1
///   // wrapped_increment(2, 3) == 0
template <class T>
[[nodiscard]] constexpr T wrapped_increment(T pos, T max)
{
    RC_ASSERT(max > 0, "wrapped_increment: max must be positive");
    ++pos;
    return pos == max ? T(0) : pos;
}

/// Decrement with wrap-around: (pos - 1 + max) % max, computed without a division
/// Preconditions: max > 0, 0 <= pos < max
/// Usage:
///   // wrapped_decrement(1, 3) == 0
///   // wrapped_decrement(0, 3) == 2
template <class T>
[[nodiscard]] constexpr T wrapped_decrement(T pos, T max)
{
    RC_ASSERT(max > 0, "wrapped_decrement: max must be positive");
    return pos == 0 ? max - 1 : pos - 1;
}

// =========================================================================================================
// Alignment
// =========================================================================================================

/// Check if a positive value is a power of two
/// Precondition: value > 0
template <class T>
[[nodiscard]] constexpr bool is_power_of_two(T value)
{
    RC_ASSERT(value > 0, "is_power_of_two: value must be positive");
    return (value & (value - 1)) == 0;
}

/// Increment value to the next multiple of alignment (power of 2)
/// Usage:
///   // rc::align_up(300, 64) == 320
///   // rc::align_up(0, 64) == 0
template <class T>
[[nodiscard]] constexpr T align_up(T value, isize alignment)
{
    RC_ASSERT(alignment > 0 && is_power_of_two(alignment), "align_up: alignment must be a power of 2");
    auto const mask = alignment - 1;
    return (T)(((isize)value + mask) & ~mask);
}

// =========================================================================================================
// Object storage
// =========================================================================================================

/// Tag type selecting the ring-core placement new overload
/// Usage:
///   new (rc::placement_new, slot) T(rc::move(value));
struct placement_new_t
{
    explicit placement_new_t() = default;
};
inline constexpr placement_new_t placement_new{};

/// Uninitialized storage for exactly one T
/// The T is neither constructed nor destroyed automatically; the owner tracks liveness.
/// Trivially destructible, so owners with trivially destructible T stay trivial themselves.
template <class T>
union storage_for
{
    T value;

    constexpr storage_for() {}
    constexpr ~storage_for()
        requires std::is_trivially_destructible_v<T>
    = default;
    constexpr ~storage_for() {}
};

// =========================================================================================================
// Template metaprogramming utilities
// =========================================================================================================

template <class... E>
constexpr bool always_false_t = false;

namespace impl
{
template <class T>
struct function_ptr_t
{
    static_assert(always_false_t<T>, "function_ptr should only be used with function signatures");
};
template <class R, class... Args>
struct function_ptr_t<R(Args...)>
{
    using type = R (*)(Args...);
};
} // namespace impl

/// Type alias for readable function pointer types
/// Usage:
///   rc::function_ptr<void(rc::byte*, isize)> -> void (*)(rc::byte*, isize)
template <class T>
using function_ptr = typename impl::function_ptr_t<T>::type;

// =========================================================================================================
// Iterator utilities
// =========================================================================================================

/// A generic end-of-range sentinel type
/// Cursors that know their own end (like ring_iter) compare equal to it once exhausted.
struct sentinel
{
};

} // namespace rc

/// Placement new without including <new>
/// Only reachable through the rc::placement_new tag, so it never competes with the standard forms.
[[nodiscard]] inline void* operator new(std::size_t, rc::placement_new_t, void* ptr) noexcept
{
    return ptr;
}

/// Matching no-op placement delete, called only if a constructor throws during placement new
inline void operator delete(void*, rc::placement_new_t, void*) noexcept {}
