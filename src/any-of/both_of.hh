#pragma once

#include <any-of/assert.hh>
#include <any-of/capabilities.hh>
#include <any-of/couple.hh>
#include <any-of/either_of.hh>
#include <any-of/fwd.hh>
#include <any-of/hash.hh>
#include <any-of/optional.hh>
#include <any-of/path.hh>
#include <any-of/to_debug_string.hh>
#include <any-of/utility.hh>

#include <functional>
#include <string>
#include <type_traits>

/// Conjunction: a left value (type L) and a right value (type R), both always present
/// Behaves like couple<L, R> but participates in the left/right capabilities,
/// so left() and right() are always populated.
/// Supports structured bindings: auto [l, r] = both;
///
/// Usage:
///   auto b = ao::both_of<int, std::string>(1, "one");
///   auto s = b.map_right([](std::string const& s) { return s.size(); });
///   auto c = ~b; // both_of<std::string, int>("one", 1)
template <class L, class R>
struct ao::both_of : ao::left_or_right_interface<ao::both_of<L, R>, L, R>,
                     ao::map_interface<ao::both_of<L, R>>,
                     ao::unwrap_interface<ao::both_of<L, R>, L, R>,
                     ao::swap_interface<ao::both_of<L, R>>,
                     ao::path_interface<ao::both_of<L, R>>
{
    using left_type = L;
    using right_type = R;

    L left_value;
    R right_value;

    // creation
public:
    constexpr both_of()
        requires std::is_default_constructible_v<L> && std::is_default_constructible_v<R>
      : left_value(), right_value()
    {
    }

    constexpr both_of(L l, R r) : left_value(ao::move(l)), right_value(ao::move(r)) {}

    [[nodiscard]] static constexpr both_of from_couple(couple<L, R> c) { return both_of(ao::move(c.first), ao::move(c.second)); }

    /// Both sides of opt must be present
    [[nodiscard]] static constexpr both_of from_opt2(opt2_of<L, R> opt)
    {
        AO_ASSERT_ALWAYS(opt.first.has_value() && opt.second.has_value(), "both_of::from_opt2 requires both sides");
        return both_of(ao::move(opt.first).value(), ao::move(opt.second).value());
    }

    // probing
public:
    [[nodiscard]] constexpr optional<L const&> left() const { return left_value; }
    [[nodiscard]] constexpr optional<R const&> right() const { return right_value; }

    [[nodiscard]] constexpr opt2_of<L, R> into_opt2() const& { return {left_value, right_value}; }
    [[nodiscard]] constexpr opt2_of<L, R> into_opt2() && { return {ao::move(left_value), ao::move(right_value)}; }

    // conversion
public:
    [[nodiscard]] constexpr couple<L, R> into_couple() const& { return {left_value, right_value}; }
    [[nodiscard]] constexpr couple<L, R> into_couple() && { return {ao::move(left_value), ao::move(right_value)}; }

    /// Keeps only the left value, as either_of
    [[nodiscard]] constexpr either_of<L, R> into_left() const& { return either_of<L, R>::create_left(left_value); }
    [[nodiscard]] constexpr either_of<L, R> into_left() && { return either_of<L, R>::create_left(ao::move(left_value)); }

    /// Keeps only the right value, as either_of
    [[nodiscard]] constexpr either_of<L, R> into_right() const& { return either_of<L, R>::create_right(right_value); }
    [[nodiscard]] constexpr either_of<L, R> into_right() && { return either_of<L, R>::create_right(ao::move(right_value)); }

    // transformation
public:
    /// Runs both functions, left first
    template <class FL, class FR>
    [[nodiscard]] constexpr auto map(FL&& fl, FR&& fr) const&
    {
        using result_t = both_of<std::remove_cvref_t<std::invoke_result_t<FL, L const&>>, //
                                 std::remove_cvref_t<std::invoke_result_t<FR, R const&>>>;
        auto l = std::invoke(ao::forward<FL>(fl), left_value);
        return result_t(ao::move(l), std::invoke(ao::forward<FR>(fr), right_value));
    }
    template <class FL, class FR>
    [[nodiscard]] constexpr auto map(FL&& fl, FR&& fr) &&
    {
        using result_t = both_of<std::remove_cvref_t<std::invoke_result_t<FL, L&&>>, //
                                 std::remove_cvref_t<std::invoke_result_t<FR, R&&>>>;
        auto l = std::invoke(ao::forward<FL>(fl), ao::move(left_value));
        return result_t(ao::move(l), std::invoke(ao::forward<FR>(fr), ao::move(right_value)));
    }

    [[nodiscard]] constexpr both_of<R, L> swap() const& { return both_of<R, L>(right_value, left_value); }
    [[nodiscard]] constexpr both_of<R, L> swap() && { return both_of<R, L>(ao::move(right_value), ao::move(left_value)); }

    // extraction
public:
    /// Never calls make_left, the left value is always present
    template <class F>
    [[nodiscard]] constexpr L left_or_else(F&&) const&
    {
        return left_value;
    }
    template <class F>
    [[nodiscard]] constexpr L left_or_else(F&&) &&
    {
        return ao::move(left_value);
    }

    template <class F>
    [[nodiscard]] constexpr R right_or_else(F&&) const&
    {
        return right_value;
    }
    template <class F>
    [[nodiscard]] constexpr R right_or_else(F&&) &&
    {
        return ao::move(right_value);
    }

    // debug
public:
    /// "both(l, r)"
    [[nodiscard]] std::string to_string() const
    {
        return "both(" + ao::to_debug_string(left_value) + ", " + ao::to_debug_string(right_value) + ")";
    }

    // comparison
public:
    [[nodiscard]] friend constexpr bool operator==(both_of const& lhs, both_of const& rhs)
        requires requires(L const& l, R const& r) {
            bool(l == l);
            bool(r == r);
        }
    {
        return lhs.left_value == rhs.left_value && lhs.right_value == rhs.right_value;
    }
};

namespace std
{
template <class L, class R>
    requires ao::hashable<L> && ao::hashable<R>
struct hash<ao::both_of<L, R>>
{
    [[nodiscard]] std::size_t operator()(ao::both_of<L, R> const& v) const noexcept
    {
        return ao::hash_tagged(3, v.left_value, v.right_value);
    }
};
} // namespace std
