#pragma once

#include <ring-core/assert.hh>
#include <ring-core/fwd.hh>
#include <ring-core/utility.hh>

#include <type_traits>

/// Sentinel type for the "no value" state of optional.
/// Deliberately lacks a default constructor to avoid ambiguity in optional<T> = {}.
struct rc::nullopt_t
{
    enum class _ctor_tag // NOLINT(readability-identifier-naming)
    {
        tag
    };
    explicit constexpr nullopt_t(_ctor_tag) {}
};

namespace rc
{
/// Usage: optional<int> opt = nullopt; or if (opt == nullopt).
constexpr nullopt_t nullopt = nullopt_t{nullopt_t::_ctor_tag::tag};
} // namespace rc

/// Either a value of type T or nothing (T | none).
/// In ring-core this is the "Empty" outcome: pop_front/pop_back return optional<T>.
/// No operator* or operator->, value() asserts engagement.
/// Trivially copyable when T is trivially copyable.
template <class T>
struct rc::optional
{
    // construction
public:
    /// Default optional is empty
    optional() = default;

    /// Constructs an engaged optional by forwarding value into the internal storage.
    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, optional> && !std::is_same_v<std::remove_cvref_t<U>, nullopt_t>
                 && std::is_constructible_v<T, U &&>)
    explicit(!std::is_convertible_v<U, T>) constexpr optional(U&& value) : _has_value(true) // NOLINT
    {
        new (rc::placement_new, &_storage.value) T(rc::forward<U>(value));
    }

    optional(nullopt_t) {}

    // trivial copy/move/destroy
public:
    optional(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;

    ~optional()
        requires std::is_trivially_destructible_v<T>
    = default;

    // non-trivial copy/move/destroy
public:
    /// Moves the value out of rhs and disengages rhs.
    optional(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
        {
            new (rc::placement_new, &_storage.value) T(rc::move(rhs._storage.value));
            rhs._storage.value.~T();
            rhs._has_value = false;
        }
    }

    optional(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (rc::placement_new, &_storage.value) T(rhs._storage.value);
    }

    /// Leaves rhs engaged with a moved-from value (matches std::optional).
    optional& operator=(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (rhs._has_value)
        {
            if (_has_value)
                _storage.value = rc::move(rhs._storage.value);
            else
                new (rc::placement_new, &_storage.value) T(rc::move(rhs._storage.value));

            _has_value = true;
        }
        else if (_has_value)
        {
            _storage.value.~T();
            _has_value = false;
        }

        return *this;
    }

    optional& operator=(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T> && std::is_copy_assignable_v<T>)
    {
        if (this != &rhs)
        {
            if (rhs._has_value)
            {
                if (_has_value)
                    _storage.value = rhs._storage.value;
                else
                    new (rc::placement_new, &_storage.value) T(rhs._storage.value);

                _has_value = true;
            }
            else if (_has_value)
            {
                _storage.value.~T();
                _has_value = false;
            }
        }

        return *this;
    }

    ~optional()
        requires(!std::is_trivially_destructible_v<T>)
    {
        if (_has_value)
            _storage.value.~T();
    }

    // queries and access
public:
    [[nodiscard]] bool has_value() const { return _has_value; }

    /// Precondition: has_value()
    [[nodiscard]] T& value() &
    {
        RC_ASSERT(_has_value, "attempted to access value of empty optional");
        return _storage.value;
    }
    [[nodiscard]] T const& value() const&
    {
        RC_ASSERT(_has_value, "attempted to access value of empty optional");
        return _storage.value;
    }
    [[nodiscard]] T&& value() &&
    {
        RC_ASSERT(_has_value, "attempted to access value of empty optional");
        return rc::move(_storage.value);
    }

    /// Returns the held value or the fallback when empty.
    template <class U>
    [[nodiscard]] T value_or(U&& fallback) const&
    {
        return _has_value ? _storage.value : static_cast<T>(rc::forward<U>(fallback));
    }
    template <class U>
    [[nodiscard]] T value_or(U&& fallback) &&
    {
        return _has_value ? rc::move(_storage.value) : static_cast<T>(rc::forward<U>(fallback));
    }

    // comparison
public:
    /// Equal if both empty or both hold equal values.
    [[nodiscard]] friend bool operator==(optional const& lhs, optional const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        if (lhs._has_value != rhs._has_value)
            return false;
        if (lhs._has_value)
            return lhs._storage.value == rhs._storage.value;
        return true;
    }

    /// Equal if engaged with a value equal to rhs.
    [[nodiscard]] friend bool operator==(optional const& lhs, T const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        return lhs._has_value && lhs._storage.value == rhs;
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, nullopt_t) { return !lhs._has_value; }

    /// optional<int> == true would otherwise compile through int promotion.
    [[nodiscard]] bool operator==(bool) const
        requires(!std::is_same_v<T, bool>)
    = delete;

    // members
private:
    rc::storage_for<T> _storage;
    bool _has_value = false;
};

/// Optional reference: either refers to a T or to nothing.
/// Returned by the peek, lookup and iteration operations of ringbuffer and ring_iter, where it
/// points directly into the ring's slot storage. It never owns; the referent must outlive it.
/// Assignment rebinds (it is a nullable pointer with an asserting value()).
/// optional<T const&> is the read-only form, optional<T&> the mutable one.
template <class T>
struct rc::optional<T&>
{
public:
    constexpr optional() = default;
    constexpr optional(nullopt_t) {}
    constexpr optional(T& ref) : _ptr(&ref) {} // NOLINT

    /// optional<U&> -> optional<T&> when U* converts to T* (e.g. mutable to const)
    template <class U>
        requires(!std::is_same_v<U, T> && std::is_convertible_v<U*, T*>)
    constexpr optional(optional<U&> const& rhs) : _ptr(rhs.has_value() ? &rhs.value() : nullptr) // NOLINT
    {
    }

    optional(T&&) = delete; // no binding to temporaries

public:
    [[nodiscard]] constexpr bool has_value() const { return _ptr != nullptr; }

    /// Precondition: has_value()
    [[nodiscard]] constexpr T& value() const
    {
        RC_ASSERT(_ptr != nullptr, "attempted to access value of empty optional reference");
        return *_ptr;
    }

    /// Copies the referenced value, or returns the fallback when empty.
    template <class U>
    [[nodiscard]] constexpr std::remove_cv_t<T> value_or(U&& fallback) const
    {
        return _ptr ? *_ptr : static_cast<std::remove_cv_t<T>>(rc::forward<U>(fallback));
    }

public:
    /// Compares referenced values, not addresses.
    [[nodiscard]] friend bool operator==(optional const& lhs, optional const& rhs)
        requires requires(T& v) { bool(v == v); }
    {
        if (lhs.has_value() != rhs.has_value())
            return false;
        return !lhs.has_value() || *lhs._ptr == *rhs._ptr;
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, std::remove_cv_t<T> const& rhs)
        requires requires(T& v) { bool(v == v); }
    {
        return lhs._ptr != nullptr && *lhs._ptr == rhs;
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, nullopt_t) { return lhs._ptr == nullptr; }

    [[nodiscard]] bool operator==(bool) const
        requires(!std::is_same_v<std::remove_cv_t<T>, bool>)
    = delete;

private:
    T* _ptr = nullptr;
};
