#pragma once

#include <ring-core/fwd.hh>

#include <iterator> // std::begin, std::end
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility> // for index_sequence

namespace rc
{
struct debug_string_config
{
    // soft limit, the element that crosses it is still printed
    isize max_length = 100;
};

// Converts a value to a developer-facing debug string.
// Best-effort and intended only for diagnostics (test failures, assertion context).
//
// Strategy (in order):
//   - String-likes: wrap in double quotes "..."
//   - char: wrap in single quotes '...', control chars escaped (\n, \t, ... or \xHH)
//   - bool: true / false
//   - other arithmetic types: std::to_string
//   - Use to_string(v) if found via ADL
//   - Use v.to_string() if available
//   - For ranges (ringbuffer, ring_iter, unique_array, span, ...): [v0, v1, ...] in iteration order
//   - For tuple-likes: (v0, v1, ...)
//   - Otherwise emit a raw memory dump 0xHH..
//
// Usage:
//   auto ring = rc::ringbuffer<int>::create_copy_of({2, 3, 4});
//   rc::to_debug_string(ring); // "[2, 3, 4]"
//
// No stability guarantees, the output may change between versions.
template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg = {});

//
// Implementation
//

namespace impl
{
inline void append_hex_byte(std::string& s, unsigned char b)
{
    constexpr char digits[] = "0123456789ABCDEF";
    s += digits[b >> 4];
    s += digits[b & 0xF];
}

template <class T>
bool to_debug_string_append_elem(std::string& s, T const& v, debug_string_config const& cfg)
{
    if (isize(s.size()) >= cfg.max_length)
    {
        s += ", ...";
        return false;
    }

    if (s.size() > 1)
        s += ", ";

    s += rc::to_debug_string(v, cfg);

    return true;
}

template <class T, std::size_t... I>
void to_debug_string_append_tuple(std::string& s, T const& v, debug_string_config const& cfg, std::index_sequence<I...>)
{
    (void)(rc::impl::to_debug_string_append_elem(s, std::get<I>(v), cfg) && ...);
}
} // namespace impl

template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg)
{
    if constexpr (requires { std::string_view(v); })
    {
        auto s = std::string("\"");
        s += std::string_view(v);
        s += '\"';
        return s;
    }
    else if constexpr (std::is_same_v<T, char>)
    {
        auto s = std::string("'");

        if (v == '\0')
            s += "\\0";
        else if (v == '\n')
            s += "\\n";
        else if (v == '\r')
            s += "\\r";
        else if (v == '\t')
            s += "\\t";
        else if (v == '\\')
            s += "\\\\";
        else if (v == '\'')
            s += "\\'";
        else if ((v >= 0 && v < 32) || v == 127)
        {
            s += "\\x";
            impl::append_hex_byte(s, static_cast<unsigned char>(v));
        }
        else
            s += v;

        s += '\'';
        return s;
    }
    else if constexpr (std::is_same_v<T, bool>)
    {
        return v ? "true" : "false";
    }
    else if constexpr (std::is_arithmetic_v<T>)
    {
        return std::to_string(v);
    }
    else if constexpr (requires { to_string(v); })
    {
        return std::string(to_string(v));
    }
    else if constexpr (requires { v.to_string(); })
    {
        return std::string(v.to_string());
    }
    else if constexpr (requires {
                           std::begin(v);
                           std::end(v);
                       })
    {
        auto s = std::string("[");
        for (auto&& e : v)
            if (!impl::to_debug_string_append_elem(s, e, cfg))
                break;
        s += "]";
        return s;
    }
    else if constexpr (requires { std::tuple_size<T>::value; })
    {
        auto s = std::string("(");
        rc::impl::to_debug_string_append_tuple(s, v, cfg, std::make_index_sequence<std::tuple_size<T>::value>{});
        s += ")";
        return s;
    }
    else
    {
        auto s = std::string("0x");
        auto const align = alignof(T);
        auto const p_v = reinterpret_cast<unsigned char const*>(&v);
        for (std::size_t i = 0; i < sizeof(T); ++i)
        {
            if (i > 0 && i % align == 0)
                s += "_";
            impl::append_hex_byte(s, p_v[i]);
        }
        return s;
    }
}
} // namespace rc
