#pragma once

#include <any-of/fwd.hh>

#include <concepts>
#include <cstddef>
#include <functional>

namespace ao
{
/// True if std::hash<T> is enabled and yields a size_t
/// Variant types only specialize std::hash when all of their payloads satisfy this
template <class T>
concept hashable = requires(T const& v) {
    { std::hash<T>{}(v) } -> std::convertible_to<std::size_t>;
};

/// Mixes the hash of v into seed (boost-style combine)
/// Usage:
///   auto h = std::hash<bool>{}(has_value);
///   h = ao::hash_combine(h, value);
template <hashable T>
[[nodiscard]] constexpr std::size_t hash_combine(std::size_t seed, T const& v)
{
    auto const hashed_v = std::hash<T>{}(v);
    seed ^= hashed_v + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    return seed;
}

/// Hashes a case discriminator followed by the payloads
/// Different cases holding equal payloads must not collide trivially (left(1) vs right(1))
template <class... Ts>
[[nodiscard]] constexpr std::size_t hash_tagged(std::size_t tag, Ts const&... payloads)
{
    auto h = std::hash<std::size_t>{}(tag);
    ((h = ao::hash_combine(h, payloads)), ...);
    return h;
}
} // namespace ao
