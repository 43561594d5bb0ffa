#pragma once

#include <any-of/fwd.hh>
#include <any-of/to_string.hh>

#include <cstddef>
#include <iterator>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility> // for tuple_size

namespace ao
{
struct debug_string_config
{
    // soft limit, checked between elements of a range or tuple-like
    isize max_length = 100;
};

// Developer-facing text for test output and assertion messages, no stability guarantees.
//
// Tried in order:
//   - string-likes           "..."
//   - char                   'c', with escapes for control characters
//   - to_string(v)           free function, found in ao or by ADL
//   - v.to_string()          member, e.g. optional, couple and the variants ("left(1)", "both(1, 2)", "neither")
//   - ranges                 [v0, v1, ...]
//   - tuple-likes            (v0, v1, ...), e.g. std::tuple and std::pair
//   - anything else          hex dump of the object representation
//
// Usage:
//   CHECK(ao::to_debug_string(values) == "[neither, left(1)]");
template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg = {});

namespace impl
{
inline void append_hex_byte(std::string& s, unsigned char b)
{
    constexpr char digits[] = "0123456789ABCDEF";
    s += digits[b >> 4];
    s += digits[b & 0xF];
}

inline void append_char_literal(std::string& s, char c)
{
    s += '\'';
    switch (c)
    {
    case '\0': s += "\\0"; break;
    case '\n': s += "\\n"; break;
    case '\r': s += "\\r"; break;
    case '\t': s += "\\t"; break;
    case '\\': s += "\\\\"; break;
    case '\'': s += "\\'"; break;
    default:
        if (c < 32 || c == 127)
        {
            s += "\\x";
            impl::append_hex_byte(s, static_cast<unsigned char>(c));
        }
        else
            s += c;
    }
    s += '\'';
}

template <class T>
void append_memory_dump(std::string& s, T const& v)
{
    s += "0x";
    auto const bytes = reinterpret_cast<unsigned char const*>(&v);
    for (std::size_t i = 0; i < sizeof(T); ++i)
    {
        if (i > 0 && i % alignof(T) == 0)
            s += '_';
        impl::append_hex_byte(s, bytes[i]);
    }
}

// appends ", elem" (or just "elem" after the opening bracket)
// returns false and appends ", ..." once the soft limit is reached
template <class T>
bool append_element(std::string& s, T const& v, debug_string_config const& cfg)
{
    if (isize(s.size()) >= cfg.max_length)
    {
        s += ", ...";
        return false;
    }

    if (s.size() > 1)
        s += ", ";

    s += ao::to_debug_string(v, cfg);
    return true;
}

template <class T, std::size_t... I>
void append_tuple_elements(std::string& s, T const& v, debug_string_config const& cfg, std::index_sequence<I...>)
{
    using std::get;
    (void)(impl::append_element(s, get<I>(v), cfg) && ...);
}
} // namespace impl

template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg)
{
    auto s = std::string();

    if constexpr (requires { std::string_view(v); })
    {
        s += '"';
        s += std::string_view(v);
        s += '"';
    }
    else if constexpr (std::is_same_v<T, char>)
    {
        impl::append_char_literal(s, v);
    }
    else if constexpr (requires { to_string(v); })
    {
        s = std::string(to_string(v));
    }
    else if constexpr (requires { v.to_string(); })
    {
        s = std::string(v.to_string());
    }
    else if constexpr (requires {
                           std::begin(v);
                           std::end(v);
                       })
    {
        s += '[';
        for (auto const& e : v)
            if (!impl::append_element(s, e, cfg))
                break;
        s += ']';
    }
    else if constexpr (requires { std::tuple_size<T>::value; })
    {
        s += '(';
        impl::append_tuple_elements(s, v, cfg, std::make_index_sequence<std::tuple_size<T>::value>{});
        s += ')';
    }
    else
    {
        impl::append_memory_dump(s, v);
    }

    return s;
}
} // namespace ao
