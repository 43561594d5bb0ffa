#pragma once

#include <any-of/assert.hh>
#include <any-of/couple.hh>
#include <any-of/fwd.hh>
#include <any-of/optional.hh>
#include <any-of/utility.hh>

#include <concepts>
#include <type_traits>

// =========================================================================================================
// Capability traits shared by either_of, both_of and any_of
// =========================================================================================================
//
// Each capability is a concept (what a type must provide) plus a CRTP interface base that derives
// every helper operation from that minimal core:
//
//   left_or_right      left(), right()            -> is_left(), is_right(), opt2()
//   mappable           map(fl, fr)                -> map_left(fl), map_right(fr), operator>>
//   unwrappable        left_or_else(f),           -> left_or(l), left_or_default(), expect_left(msg),
//                      right_or_else(f)              unwrap_left() and the right-hand counterparts
//   side_swappable     swap()                     -> operator~
//
// The variants derive from all four interfaces. A user type can derive from any subset and then
// participates in the generic utilities (ao::to_any_of, ao::at_path, the composite accessors).
//
// Value categories:
//   Every transforming/extracting helper has a const& overload (copies the payload) and a &&
//   overload (moves the payload out of an expiring value).
//

namespace ao
{
// =========================================================================================================
// Concepts
// =========================================================================================================

/// Presence probing: left()/right() borrow the slot when it is present in the current case
template <class T>
concept left_or_right = requires(T const& v) {
    typename T::left_type;
    typename T::right_type;
    { v.left() } -> std::same_as<optional<typename T::left_type const&>>;
    { v.right() } -> std::same_as<optional<typename T::right_type const&>>;
};

/// Case-preserving transformation of both sides
template <class T>
concept mappable = left_or_right<T> && requires(T v) {
    { ao::move(v).map(identify_function{}, identify_function{}) } -> left_or_right;
};

/// Extraction with a fallback producer
template <class T>
concept unwrappable = left_or_right<T>
                   && requires(T v, typename T::left_type (*make_left)(), typename T::right_type (*make_right)()) {
                          { ao::move(v).left_or_else(make_left) } -> std::same_as<typename T::left_type>;
                          { ao::move(v).right_or_else(make_right) } -> std::same_as<typename T::right_type>;
                      };

/// Exchanging the roles of the two sides
template <class T>
concept side_swappable = left_or_right<T> && requires(T v) {
    { ao::move(v).swap() } -> left_or_right;
};

// =========================================================================================================
// Interfaces
// =========================================================================================================

/// Derives the probing helpers from left() and right()
/// opt2() is implemented here and only here, so it cannot disagree with left()/right().
template <class Derived, class L, class R>
struct left_or_right_interface
{
    /// True if the left slot is present in the current case
    [[nodiscard]] constexpr bool is_left() const { return derived().left().has_value(); }

    /// True if the right slot is present in the current case
    [[nodiscard]] constexpr bool is_right() const { return derived().right().has_value(); }

    /// Canonical decomposed form, borrowing both slots
    [[nodiscard]] constexpr opt2_of<L const&, R const&> opt2() const { return {derived().left(), derived().right()}; }

    [[nodiscard]] friend constexpr bool operator==(left_or_right_interface const&, left_or_right_interface const&) = default;

protected:
    [[nodiscard]] constexpr Derived const& derived() const { return static_cast<Derived const&>(*this); }
};

/// Derives map_left / map_right and the map operator from map(fl, fr)
/// The untouched side goes through identify_function, so its payload is copied or moved unchanged.
template <class Derived>
struct map_interface
{
    /// Transforms the left slot (if present), keeps the right slot
    template <class FL>
    [[nodiscard]] constexpr auto map_left(FL&& fl) const&
    {
        return derived().map(ao::forward<FL>(fl), identify_function{});
    }
    template <class FL>
    [[nodiscard]] constexpr auto map_left(FL&& fl) &&
    {
        return ao::move(derived()).map(ao::forward<FL>(fl), identify_function{});
    }

    /// Transforms the right slot (if present), keeps the left slot
    template <class FR>
    [[nodiscard]] constexpr auto map_right(FR&& fr) const&
    {
        return derived().map(identify_function{}, ao::forward<FR>(fr));
    }
    template <class FR>
    [[nodiscard]] constexpr auto map_right(FR&& fr) &&
    {
        return ao::move(derived()).map(identify_function{}, ao::forward<FR>(fr));
    }

    /// Map operator: v >> both_of{fl, fr} is v.map(fl, fr)
    template <class FL, class FR>
    [[nodiscard]] friend constexpr auto operator>>(Derived const& v, both_of<FL, FR> fns)
    {
        return v.map(ao::move(fns.left_value), ao::move(fns.right_value));
    }
    template <class FL, class FR>
    [[nodiscard]] friend constexpr auto operator>>(Derived&& v, both_of<FL, FR> fns)
    {
        return ao::move(v).map(ao::move(fns.left_value), ao::move(fns.right_value));
    }

    [[nodiscard]] friend constexpr bool operator==(map_interface const&, map_interface const&) = default;

protected:
    [[nodiscard]] constexpr Derived const& derived() const& { return static_cast<Derived const&>(*this); }
    [[nodiscard]] constexpr Derived& derived() & { return static_cast<Derived&>(*this); }
    [[nodiscard]] constexpr Derived&& derived() && { return static_cast<Derived&&>(*this); }
};

/// Derives the fallback, default and fatal extraction helpers from left_or_else / right_or_else
/// expect_* and unwrap_* are intended for call sites that already established presence;
/// on failure they report through the assertion handler and abort (see assert-handler.hh).
template <class Derived, class L, class R>
struct unwrap_interface
{
    // fallback value
public:
    [[nodiscard]] constexpr L left_or(L fallback) const&
    {
        return derived().left_or_else([&]() -> L { return ao::move(fallback); });
    }
    [[nodiscard]] constexpr L left_or(L fallback) &&
    {
        return ao::move(derived()).left_or_else([&]() -> L { return ao::move(fallback); });
    }

    [[nodiscard]] constexpr R right_or(R fallback) const&
    {
        return derived().right_or_else([&]() -> R { return ao::move(fallback); });
    }
    [[nodiscard]] constexpr R right_or(R fallback) &&
    {
        return ao::move(derived()).right_or_else([&]() -> R { return ao::move(fallback); });
    }

    // default-constructed fallback
public:
    [[nodiscard]] constexpr L left_or_default() const&
        requires std::is_default_constructible_v<L>
    {
        return derived().left_or_else([]() -> L { return L(); });
    }
    [[nodiscard]] constexpr L left_or_default() &&
        requires std::is_default_constructible_v<L>
    {
        return ao::move(derived()).left_or_else([]() -> L { return L(); });
    }

    [[nodiscard]] constexpr R right_or_default() const&
        requires std::is_default_constructible_v<R>
    {
        return derived().right_or_else([]() -> R { return R(); });
    }
    [[nodiscard]] constexpr R right_or_default() &&
        requires std::is_default_constructible_v<R>
    {
        return ao::move(derived()).right_or_else([]() -> R { return R(); });
    }

    // fatal extraction
public:
    /// Returns the left payload, fails with msg if it is absent
    [[nodiscard]] constexpr L expect_left(char const* msg) const&
    {
        return derived().left_or_else([msg]() -> L { AO_PANIC(msg); });
    }
    [[nodiscard]] constexpr L expect_left(char const* msg) &&
    {
        return ao::move(derived()).left_or_else([msg]() -> L { AO_PANIC(msg); });
    }

    /// Returns the right payload, fails with msg if it is absent
    [[nodiscard]] constexpr R expect_right(char const* msg) const&
    {
        return derived().right_or_else([msg]() -> R { AO_PANIC(msg); });
    }
    [[nodiscard]] constexpr R expect_right(char const* msg) &&
    {
        return ao::move(derived()).right_or_else([msg]() -> R { AO_PANIC(msg); });
    }

    [[nodiscard]] constexpr L unwrap_left() const& { return expect_left(unwrap_left_message); }
    [[nodiscard]] constexpr L unwrap_left() && { return ao::move(*this).expect_left(unwrap_left_message); }

    [[nodiscard]] constexpr R unwrap_right() const& { return expect_right(unwrap_right_message); }
    [[nodiscard]] constexpr R unwrap_right() && { return ao::move(*this).expect_right(unwrap_right_message); }

    [[nodiscard]] friend constexpr bool operator==(unwrap_interface const&, unwrap_interface const&) = default;

protected:
    static constexpr char const* unwrap_left_message = "called unwrap_left on a value without a left side";
    static constexpr char const* unwrap_right_message = "called unwrap_right on a value without a right side";

    [[nodiscard]] constexpr Derived const& derived() const& { return static_cast<Derived const&>(*this); }
    [[nodiscard]] constexpr Derived& derived() & { return static_cast<Derived&>(*this); }
    [[nodiscard]] constexpr Derived&& derived() && { return static_cast<Derived&&>(*this); }
};

/// Derives the unary invert operator from swap()
/// ~v == v.swap(), and ~~v == v
template <class Derived>
struct swap_interface
{
    [[nodiscard]] constexpr auto operator~() const& { return static_cast<Derived const&>(*this).swap(); }
    [[nodiscard]] constexpr auto operator~() && { return static_cast<Derived&&>(*this).swap(); }

    [[nodiscard]] friend constexpr bool operator==(swap_interface const&, swap_interface const&) = default;
};

} // namespace ao
