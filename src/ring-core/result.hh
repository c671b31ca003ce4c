#pragma once

#include <ring-core/assert.hh>
#include <ring-core/fwd.hh>
#include <ring-core/utility.hh>

#include <type_traits>

// result<T, E> holds either a value T or an error E.
// In ring-core it reports refused operations that must hand data back to the caller:
// ringbuffer::push_back returns result<void, capacity_exceeded<T>> and the error carries the
// rejected element unchanged.
//
// Errors are constructed explicitly through rc::error(e) so that result<int, int> stays unambiguous:
//   rc::result<int, int> ok = 42;
//   rc::result<int, int> bad = rc::error(99);
//
// Semantics:
// - a default-constructed result<T, E> holds a default-constructed E
// - a default-constructed result<void, E> is a success (there is no value to default-construct)
// - moves leave the source in its state with a moved-from payload
// - trivially copyable when both payloads are

/// Wrapper that marks a value as the error alternative of a result.
template <class E>
struct rc::as_error_t
{
    E value;
};

namespace rc
{
/// Wraps e as an error, ready to convert into any result<T, E2> with E2 constructible from E.
template <class E>
[[nodiscard]] constexpr as_error_t<std::remove_cvref_t<E>> error(E&& e)
{
    return as_error_t<std::remove_cvref_t<E>>{rc::forward<E>(e)};
}

namespace impl
{
template <class T>
constexpr bool is_error_wrapper = false;
template <class E>
constexpr bool is_error_wrapper<as_error_t<E>> = true;

template <class T, class E>
union result_storage
{
    T value;
    E error;

    constexpr result_storage() {}
    constexpr ~result_storage()
        requires(std::is_trivially_destructible_v<T> && std::is_trivially_destructible_v<E>)
    = default;
    constexpr ~result_storage() {}
};
} // namespace impl
} // namespace rc

template <class T, class E>
struct rc::result
{
    static_assert(!std::is_reference_v<T> && !std::is_reference_v<E>, "result does not store references");

    static constexpr bool is_trivial = std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>;

    // construction
public:
    result()
        requires std::is_default_constructible_v<E>
      : _has_value(false)
    {
        new (rc::placement_new, &_storage.error) E();
    }

    template <class U = T>
        requires(!std::is_same_v<std::remove_cvref_t<U>, result> && !impl::is_error_wrapper<std::remove_cvref_t<U>>
                 && std::is_constructible_v<T, U &&>)
    explicit(!std::is_convertible_v<U, T>) result(U&& value) : _has_value(true) // NOLINT
    {
        new (rc::placement_new, &_storage.value) T(rc::forward<U>(value));
    }

    template <class G>
        requires std::is_constructible_v<E, G&&>
    result(as_error_t<G>&& e) : _has_value(false) // NOLINT
    {
        new (rc::placement_new, &_storage.error) E(rc::move(e.value));
    }

    template <class G>
        requires std::is_constructible_v<E, G const&>
    result(as_error_t<G> const& e) : _has_value(false) // NOLINT
    {
        new (rc::placement_new, &_storage.error) E(e.value);
    }

    // trivial copy/move/destroy
public:
    result(result&&)
        requires is_trivial
    = default;
    result(result const&)
        requires is_trivial
    = default;
    result& operator=(result&&)
        requires is_trivial
    = default;
    result& operator=(result const&)
        requires is_trivial
    = default;
    ~result()
        requires(std::is_trivially_destructible_v<T> && std::is_trivially_destructible_v<E>)
    = default;

    // non-trivial copy/move/destroy
public:
    result(result&& rhs) noexcept
        requires(!is_trivial)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (rc::placement_new, &_storage.value) T(rc::move(rhs._storage.value));
        else
            new (rc::placement_new, &_storage.error) E(rc::move(rhs._storage.error));
    }

    result(result const& rhs)
        requires(!is_trivial && std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (rc::placement_new, &_storage.value) T(rhs._storage.value);
        else
            new (rc::placement_new, &_storage.error) E(rhs._storage.error);
    }

    result& operator=(result&& rhs) noexcept
        requires(!is_trivial)
    {
        if (this == &rhs)
            return *this;

        if (_has_value && rhs._has_value)
            _storage.value = rc::move(rhs._storage.value);
        else if (!_has_value && !rhs._has_value)
            _storage.error = rc::move(rhs._storage.error);
        else
        {
            _destroy();
            if (rhs._has_value)
                new (rc::placement_new, &_storage.value) T(rc::move(rhs._storage.value));
            else
                new (rc::placement_new, &_storage.error) E(rc::move(rhs._storage.error));
            _has_value = rhs._has_value;
        }
        return *this;
    }

    result& operator=(result const& rhs)
        requires(!is_trivial && std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
    {
        if (this != &rhs)
            *this = result(rhs);
        return *this;
    }

    ~result()
        requires(!(std::is_trivially_destructible_v<T> && std::is_trivially_destructible_v<E>))
    {
        _destroy();
    }

    // queries and access
public:
    [[nodiscard]] bool has_value() const { return _has_value; }
    [[nodiscard]] bool has_error() const { return !_has_value; }

    /// Precondition: has_value()
    [[nodiscard]] T& value() &
    {
        RC_ASSERT(_has_value, "attempted to access value of result holding an error");
        return _storage.value;
    }
    [[nodiscard]] T const& value() const&
    {
        RC_ASSERT(_has_value, "attempted to access value of result holding an error");
        return _storage.value;
    }
    [[nodiscard]] T&& value() &&
    {
        RC_ASSERT(_has_value, "attempted to access value of result holding an error");
        return rc::move(_storage.value);
    }

    /// Precondition: has_error()
    [[nodiscard]] E& error() &
    {
        RC_ASSERT(!_has_value, "attempted to access error of result holding a value");
        return _storage.error;
    }
    [[nodiscard]] E const& error() const&
    {
        RC_ASSERT(!_has_value, "attempted to access error of result holding a value");
        return _storage.error;
    }
    [[nodiscard]] E&& error() &&
    {
        RC_ASSERT(!_has_value, "attempted to access error of result holding a value");
        return rc::move(_storage.error);
    }

    template <class U>
    [[nodiscard]] T value_or(U&& fallback) const&
    {
        return _has_value ? _storage.value : static_cast<T>(rc::forward<U>(fallback));
    }

private:
    void _destroy()
    {
        if (_has_value)
            _storage.value.~T();
        else
            _storage.error.~E();
    }

    impl::result_storage<T, E> _storage;
    bool _has_value;
};

/// Outcome of an operation that produces nothing on success.
template <class E>
struct rc::result<void, E>
{
    static_assert(!std::is_reference_v<E>, "result does not store references");

    // construction
public:
    /// Success
    result() = default;

    template <class G>
        requires std::is_constructible_v<E, G&&>
    result(as_error_t<G>&& e) : _has_value(false) // NOLINT
    {
        new (rc::placement_new, &_error.value) E(rc::move(e.value));
    }

    template <class G>
        requires std::is_constructible_v<E, G const&>
    result(as_error_t<G> const& e) : _has_value(false) // NOLINT
    {
        new (rc::placement_new, &_error.value) E(e.value);
    }

    // trivial copy/move/destroy
public:
    result(result&&)
        requires std::is_trivially_copyable_v<E>
    = default;
    result(result const&)
        requires std::is_trivially_copyable_v<E>
    = default;
    result& operator=(result&&)
        requires std::is_trivially_copyable_v<E>
    = default;
    result& operator=(result const&)
        requires std::is_trivially_copyable_v<E>
    = default;
    ~result()
        requires std::is_trivially_destructible_v<E>
    = default;

    // non-trivial copy/move/destroy
public:
    result(result&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<E>)
      : _has_value(rhs._has_value)
    {
        if (!_has_value)
            new (rc::placement_new, &_error.value) E(rc::move(rhs._error.value));
    }

    result(result const& rhs)
        requires(!std::is_trivially_copyable_v<E> && std::is_copy_constructible_v<E>)
      : _has_value(rhs._has_value)
    {
        if (!_has_value)
            new (rc::placement_new, &_error.value) E(rhs._error.value);
    }

    result& operator=(result&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<E>)
    {
        if (this == &rhs)
            return *this;

        if (!_has_value && !rhs._has_value)
            _error.value = rc::move(rhs._error.value);
        else
        {
            if (!_has_value)
                _error.value.~E();
            if (!rhs._has_value)
                new (rc::placement_new, &_error.value) E(rc::move(rhs._error.value));
            _has_value = rhs._has_value;
        }
        return *this;
    }

    result& operator=(result const& rhs)
        requires(!std::is_trivially_copyable_v<E> && std::is_copy_constructible_v<E>)
    {
        if (this != &rhs)
            *this = result(rhs);
        return *this;
    }

    ~result()
        requires(!std::is_trivially_destructible_v<E>)
    {
        if (!_has_value)
            _error.value.~E();
    }

    // queries and access
public:
    [[nodiscard]] bool has_value() const { return _has_value; }
    [[nodiscard]] bool has_error() const { return !_has_value; }

    /// Checks for success, the void analogue of value()
    void value() const { RC_ASSERT(_has_value, "attempted to access value of result holding an error"); }

    /// Precondition: has_error()
    [[nodiscard]] E& error() &
    {
        RC_ASSERT(!_has_value, "attempted to access error of result holding a value");
        return _error.value;
    }
    [[nodiscard]] E const& error() const&
    {
        RC_ASSERT(!_has_value, "attempted to access error of result holding a value");
        return _error.value;
    }
    [[nodiscard]] E&& error() &&
    {
        RC_ASSERT(!_has_value, "attempted to access error of result holding a value");
        return rc::move(_error.value);
    }

private:
    rc::storage_for<E> _error;
    bool _has_value = true;
};
