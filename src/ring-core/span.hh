#pragma once

#include <ring-core/assert.hh>
#include <ring-core/fwd.hh>

#include <concepts>
#include <initializer_list>
#include <type_traits>

namespace rc::impl
{
template <class T>
constexpr bool is_span = false;
template <class T>
constexpr bool is_span<rc::span<T>> = true;
} // namespace rc::impl

/// Non-owning view over a contiguous sequence of T (pointer + runtime size).
/// Used for the contiguous segments of a ring and as the input of the copy factories.
/// Trivially copyable regardless of T. The viewed data must outlive the span.
template <class T>
struct rc::span
{
    // construction
public:
    constexpr span() = default;

    constexpr explicit span(T* ptr, isize size) : _data(ptr), _size(size)
    {
        RC_ASSERT(size >= 0, "span size must be non-negative");
    }

    constexpr explicit span(T* begin, T* end) : _data(begin), _size(end - begin)
    {
        RC_ASSERT(begin <= end, "invalid pointer range");
    }

    /// Only for const T, so that create_copy_of({1, 2, 3}) works.
    /// WARNING: the list dies at the end of the full expression, use only as an immediate argument.
    constexpr span(std::initializer_list<std::remove_const_t<T>> init)
        requires std::is_const_v<T>
      : _data(init.begin()), _size(static_cast<isize>(init.size()))
    {
    }

    template <std::size_t N>
    constexpr span(T (&arr)[N]) : _data(arr), _size(static_cast<isize>(N))
    {
    }

    /// span<U> -> span<T> for qualification conversions (span<int> -> span<int const>)
    template <class U>
        requires(!std::is_same_v<U, T> && std::is_convertible_v<U (*)[], T (*)[]>)
    constexpr span(span<U> rhs) : _data(rhs.data()), _size(rhs.size()) // NOLINT
    {
    }

    /// Any container with .data() and .size(), e.g. std::vector
    template <class Container>
        requires(!impl::is_span<std::remove_cvref_t<Container>>) && requires(Container&& c) {
            { c.data() } -> std::convertible_to<T*>;
            { c.size() } -> std::convertible_to<isize>;
        }
    constexpr explicit span(Container&& c) : _data(c.data()), _size(static_cast<isize>(c.size()))
    {
    }

    // element access
public:
    /// Precondition: 0 <= i < size()
    [[nodiscard]] constexpr T& operator[](isize i) const
    {
        RC_ASSERT(0 <= i && i < _size, "index out of bounds");
        return _data[i];
    }

    [[nodiscard]] constexpr T* data() const { return _data; }

    // iterators
public:
    [[nodiscard]] constexpr T* begin() const { return _data; }
    [[nodiscard]] constexpr T* end() const { return _data + _size; }

    // queries
public:
    [[nodiscard]] constexpr isize size() const { return _size; }
    [[nodiscard]] constexpr bool empty() const { return _size == 0; }

    // members
private:
    T* _data = nullptr;
    isize _size = 0;
};
