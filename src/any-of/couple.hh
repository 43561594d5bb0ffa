#pragma once

#include <any-of/fwd.hh>
#include <any-of/hash.hh>
#include <any-of/to_debug_string.hh>
#include <any-of/utility.hh>

#include <string>
#include <utility>

/// Ordered product of two independently typed values
/// The substrate of every variant: both_of converts to and from it, opt2_of is a couple of slots.
/// Aggregate type with no user-defined constructors, supports structured bindings natively.
/// Usage:
///   auto c = ao::couple<int, std::string>{1, "one"};
///   auto [n, s] = c;
template <class T, class U>
struct ao::couple
{
    using first_t = T;
    using second_t = U;

    [[nodiscard]] friend constexpr bool operator==(couple const&, couple const&) = default;
    [[nodiscard]] friend constexpr auto operator<=>(couple const&, couple const&) = default;

    T first;
    U second;

    /// "(first, second)" with both members rendered by ao::to_debug_string
    [[nodiscard]] std::string to_string() const
    {
        return "(" + ao::to_debug_string(first) + ", " + ao::to_debug_string(second) + ")";
    }

    template <std::size_t I, class P>
    [[nodiscard]] friend constexpr decltype(auto) get(P&& p) noexcept
        requires(std::is_same_v<std::remove_cvref_t<P>, couple> && I < 2)
    {
        if constexpr (I == 0)
            return (ao::forward<P>(p).first);
        else
            return (ao::forward<P>(p).second);
    }
};

namespace std
{
template <class T, class U>
struct tuple_size<ao::couple<T, U>> : std::integral_constant<std::size_t, 2>
{
};

template <std::size_t I, class T, class U>
struct tuple_element<I, ao::couple<T, U>>
{
    static_assert(I < 2);
    using type = std::conditional_t<I == 0, T, U>;
};

template <class T, class U>
    requires ao::hashable<T> && ao::hashable<U>
struct hash<ao::couple<T, U>>
{
    [[nodiscard]] std::size_t operator()(ao::couple<T, U> const& c) const noexcept
    {
        return ao::hash_combine(ao::hash_combine(0, c.first), c.second);
    }
};
} // namespace std
