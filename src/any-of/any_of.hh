#pragma once

#include <any-of/assert.hh>
#include <any-of/both_of.hh>
#include <any-of/capabilities.hh>
#include <any-of/couple.hh>
#include <any-of/either_of.hh>
#include <any-of/fwd.hh>
#include <any-of/hash.hh>
#include <any-of/optional.hh>
#include <any-of/path.hh>
#include <any-of/to_debug_string.hh>
#include <any-of/utility.hh>

#include <cstddef>
#include <functional>
#include <string>
#include <tuple>
#include <type_traits>

/// Which of the three shapes an any_of currently has
enum class ao::any_of_case : ao::u8
{
    neither,
    either,
    both,
};

/// Inclusive choice: neither, only a left value (type L), only a right value (type R), or both
/// Internally a tagged union of nothing, either_of<L, R> and both_of<L, R>.
/// Every factory normalizes to the unique case that matches the present slots,
/// so create(l, nullopt) and create_left(l) and from_either(either_of::create_left(l)) are the same value.
///
/// Slot algebra:
///   a + b   combine: every slot present in b, and the slots of a that b lacks
///   a - b   filter: the slots of a that b lacks
///   ~a      swap: left and right exchange roles
///   a >> both_of{fl, fr}   map
///
/// Usage:
///   auto v = ao::any_of<int, std::string>::create_left(3);
///   v = v.with_right("three");          // both(3, "three")
///   auto [l, r] = v.into_opt2();        // optional<int>, optional<std::string>
///   auto n = v.left_or(0);
template <class L, class R>
struct ao::any_of : ao::left_or_right_interface<ao::any_of<L, R>, L, R>,
                    ao::map_interface<ao::any_of<L, R>>,
                    ao::unwrap_interface<ao::any_of<L, R>, L, R>,
                    ao::swap_interface<ao::any_of<L, R>>,
                    ao::path_interface<ao::any_of<L, R>>
{
    using left_type = L;
    using right_type = R;
    using either_type = either_of<L, R>;
    using both_type = both_of<L, R>;

    static constexpr bool is_trivially_copyable = std::is_trivially_copyable_v<L> && std::is_trivially_copyable_v<R>;
    static constexpr bool is_trivially_destructible = std::is_trivially_destructible_v<L> && std::is_trivially_destructible_v<R>;

    // creation
public:
    /// Default any_of is neither
    constexpr any_of() {}

    constexpr any_of(either_of<L, R> e) : _either(ao::move(e)), _case(any_of_case::either) {} // NOLINT
    constexpr any_of(both_of<L, R> b) : _both(ao::move(b)), _case(any_of_case::both) {}       // NOLINT

    /// The case is chosen by which slots are present
    [[nodiscard]] static constexpr any_of create(optional<L> l, optional<R> r)
    {
        if (l.has_value() && r.has_value())
            return both_of<L, R>(ao::move(l).value(), ao::move(r).value());
        if (l.has_value())
            return either_of<L, R>::create_left(ao::move(l).value());
        if (r.has_value())
            return either_of<L, R>::create_right(ao::move(r).value());
        return {};
    }

    [[nodiscard]] static constexpr any_of create_neither() { return {}; }
    [[nodiscard]] static constexpr any_of create_left(L l) { return either_of<L, R>::create_left(ao::move(l)); }
    [[nodiscard]] static constexpr any_of create_right(R r) { return either_of<L, R>::create_right(ao::move(r)); }
    [[nodiscard]] static constexpr any_of create_both(L l, R r) { return both_of<L, R>(ao::move(l), ao::move(r)); }

    [[nodiscard]] static constexpr any_of from_either(either_of<L, R> e) { return any_of(ao::move(e)); }
    [[nodiscard]] static constexpr any_of from_both(both_of<L, R> b) { return any_of(ao::move(b)); }
    [[nodiscard]] static constexpr any_of from_opt2(opt2_of<L, R> opt) { return create(ao::move(opt.first), ao::move(opt.second)); }

    // composite creation
public:
    /// Builds a composite from its nested decomposition (see nested_opt_t)
    /// An inner node is present iff at least one of its leaves is present.
    template <int Depth, class Self = any_of>
        requires(Depth > 0) && nests_to<Self, Depth>
    [[nodiscard]] static constexpr any_of from_nested(nested_opt_t<Self, Depth> opt)
    {
        if constexpr (Depth == 1)
            return from_opt2(ao::move(opt));
        else
        {
            optional<L> l;
            optional<R> r;
            if (!impl::all_absent(opt.first))
                l = L::template from_nested<Depth - 1>(ao::move(opt.first));
            if (!impl::all_absent(opt.second))
                r = R::template from_nested<Depth - 1>(ao::move(opt.second));
            return create(ao::move(l), ao::move(r));
        }
    }

    template <class Self = any_of>
    [[nodiscard]] static constexpr any_of from_opt4(nested_opt_t<Self, 2> opt)
    {
        return from_nested<2>(ao::move(opt));
    }
    template <class Self = any_of>
    [[nodiscard]] static constexpr any_of from_opt8(nested_opt_t<Self, 3> opt)
    {
        return from_nested<3>(ao::move(opt));
    }
    template <class Self = any_of>
    [[nodiscard]] static constexpr any_of from_opt16(nested_opt_t<Self, 4> opt)
    {
        return from_nested<4>(ao::move(opt));
    }

    /// Builds a composite from its leaves in depth-first order (ll, lr, rl, rr)
    /// Each leaf is a value, an optional of the leaf type, or ao::nullopt.
    /// Usage:
    ///   auto v = ao::any_of4<int>::create4(1, ao::nullopt, ao::nullopt, 4);
    template <class... Leaves>
        requires(sizeof...(Leaves) == 4) && nests_to<any_of, 2>
    [[nodiscard]] static constexpr any_of create4(Leaves&&... leaves)
    {
        return create_from_leaves<2>(ao::forward<Leaves>(leaves)...);
    }
    template <class... Leaves>
        requires(sizeof...(Leaves) == 8) && nests_to<any_of, 3>
    [[nodiscard]] static constexpr any_of create8(Leaves&&... leaves)
    {
        return create_from_leaves<3>(ao::forward<Leaves>(leaves)...);
    }
    template <class... Leaves>
        requires(sizeof...(Leaves) == 16) && nests_to<any_of, 4>
    [[nodiscard]] static constexpr any_of create16(Leaves&&... leaves)
    {
        return create_from_leaves<4>(ao::forward<Leaves>(leaves)...);
    }

    // trivial copy/move/destroy
public:
    any_of(any_of&&)
        requires is_trivially_copyable
    = default;
    any_of(any_of const&)
        requires is_trivially_copyable
    = default;
    any_of& operator=(any_of&&)
        requires is_trivially_copyable
    = default;
    any_of& operator=(any_of const&)
        requires is_trivially_copyable
    = default;

    ~any_of()
        requires is_trivially_destructible
    = default;

    // non-trivial copy/move/destroy
public:
    /// Unlike optional, a moved-from any_of is not reset:
    /// rhs keeps its case and its slots hold moved-from payloads
    any_of(any_of&& rhs) noexcept
        requires(!is_trivially_copyable)
    {
        construct_from(ao::move(rhs));
    }

    any_of(any_of const& rhs)
        requires(!is_trivially_copyable && std::is_copy_constructible_v<L> && std::is_copy_constructible_v<R>)
    {
        construct_from(rhs);
    }

    any_of& operator=(any_of&& rhs) noexcept
        requires(!is_trivially_copyable)
    {
        if (this != &rhs)
        {
            destroy();
            construct_from(ao::move(rhs));
        }
        return *this;
    }

    any_of& operator=(any_of const& rhs)
        requires(!is_trivially_copyable && std::is_copy_constructible_v<L> && std::is_copy_constructible_v<R>)
    {
        if (this != &rhs)
        {
            destroy();
            construct_from(rhs);
        }
        return *this;
    }

    ~any_of()
        requires(!is_trivially_destructible)
    {
        destroy();
    }

    // case queries
public:
    [[nodiscard]] constexpr any_of_case kind() const { return _case; }

    [[nodiscard]] constexpr bool is_neither() const { return _case == any_of_case::neither; }
    [[nodiscard]] constexpr bool is_either() const { return _case == any_of_case::either; }
    [[nodiscard]] constexpr bool is_both() const { return _case == any_of_case::both; }
    [[nodiscard]] constexpr bool is_neither_or_both() const { return _case != any_of_case::either; }

    /// True unless neither
    [[nodiscard]] constexpr bool is_any() const { return _case != any_of_case::neither; }

    [[nodiscard]] constexpr bool has_left() const { return this->is_left(); }
    [[nodiscard]] constexpr bool has_right() const { return this->is_right(); }

    // probing
public:
    [[nodiscard]] constexpr optional<L const&> left() const
    {
        switch (_case)
        {
        case any_of_case::either: return _either.left();
        case any_of_case::both: return _both.left();
        case any_of_case::neither: break;
        }
        return nullopt;
    }

    [[nodiscard]] constexpr optional<R const&> right() const
    {
        switch (_case)
        {
        case any_of_case::either: return _either.right();
        case any_of_case::both: return _both.right();
        case any_of_case::neither: break;
        }
        return nullopt;
    }

    /// Borrows the inner either_of, present only in the either case
    [[nodiscard]] constexpr optional<either_of<L, R> const&> as_either() const
    {
        if (_case == any_of_case::either)
            return _either;
        return nullopt;
    }

    /// Borrows the inner both_of, present only in the both case
    [[nodiscard]] constexpr optional<both_of<L, R> const&> as_both() const
    {
        if (_case == any_of_case::both)
            return _both;
        return nullopt;
    }

    [[nodiscard]] constexpr opt2_of<L, R> into_opt2() const&
    {
        switch (_case)
        {
        case any_of_case::either: return _either.into_opt2();
        case any_of_case::both: return _both.into_opt2();
        case any_of_case::neither: break;
        }
        return {};
    }
    [[nodiscard]] constexpr opt2_of<L, R> into_opt2() &&
    {
        switch (_case)
        {
        case any_of_case::either: return ao::move(_either).into_opt2();
        case any_of_case::both: return ao::move(_both).into_opt2();
        case any_of_case::neither: break;
        }
        return {};
    }

    /// Each present side on its own: (left(l) or nullopt, right(r) or nullopt)
    [[nodiscard]] constexpr couple<optional<either_of<L, R>>, optional<either_of<L, R>>> to_either_pair() const
    {
        couple<optional<either_of<L, R>>, optional<either_of<L, R>>> result;
        if (auto const l = left(); l.has_value())
            result.first = either_of<L, R>::create_left(l.value());
        if (auto const r = right(); r.has_value())
            result.second = either_of<L, R>::create_right(r.value());
        return result;
    }

    // slot editing
public:
    /// Drops the right slot
    [[nodiscard]] constexpr any_of filter_left() const& { return create(left().to_value(), nullopt); }
    [[nodiscard]] constexpr any_of filter_left() &&
    {
        auto [l, r] = ao::move(*this).into_opt2();
        return create(ao::move(l), nullopt);
    }

    /// Drops the left slot
    [[nodiscard]] constexpr any_of filter_right() const& { return create(nullopt, right().to_value()); }
    [[nodiscard]] constexpr any_of filter_right() &&
    {
        auto [l, r] = ao::move(*this).into_opt2();
        return create(nullopt, ao::move(r));
    }

    /// Sets the left slot, replacing an existing left value
    [[nodiscard]] constexpr any_of with_left(L l) const& { return create(ao::move(l), right().to_value()); }
    [[nodiscard]] constexpr any_of with_left(L l) &&
    {
        auto [old_l, r] = ao::move(*this).into_opt2();
        return create(ao::move(l), ao::move(r));
    }

    /// Sets the right slot, replacing an existing right value
    [[nodiscard]] constexpr any_of with_right(R r) const& { return create(left().to_value(), ao::move(r)); }
    [[nodiscard]] constexpr any_of with_right(R r) &&
    {
        auto [l, old_r] = ao::move(*this).into_opt2();
        return create(ao::move(l), ao::move(r));
    }

    /// Every slot present in other, plus the slots of this that other lacks
    [[nodiscard]] constexpr any_of combine(any_of other) const& { return any_of(*this).combine(ao::move(other)); }
    [[nodiscard]] constexpr any_of combine(any_of other) &&
    {
        auto [l, r] = ao::move(*this).into_opt2();
        auto [other_l, other_r] = ao::move(other).into_opt2();
        return create(other_l.has_value() ? ao::move(other_l) : ao::move(l), //
                      other_r.has_value() ? ao::move(other_r) : ao::move(r));
    }

    /// The slots of this that other lacks
    [[nodiscard]] constexpr any_of filter(any_of const& other) const& { return any_of(*this).filter(other); }
    [[nodiscard]] constexpr any_of filter(any_of const& other) &&
    {
        auto [l, r] = ao::move(*this).into_opt2();
        if (other.has_left())
            l = nullopt;
        if (other.has_right())
            r = nullopt;
        return create(ao::move(l), ao::move(r));
    }

    [[nodiscard]] friend constexpr any_of operator+(any_of const& lhs, any_of rhs) { return lhs.combine(ao::move(rhs)); }
    [[nodiscard]] friend constexpr any_of operator+(any_of&& lhs, any_of rhs) { return ao::move(lhs).combine(ao::move(rhs)); }

    [[nodiscard]] friend constexpr any_of operator-(any_of const& lhs, any_of const& rhs) { return lhs.filter(rhs); }
    [[nodiscard]] friend constexpr any_of operator-(any_of&& lhs, any_of const& rhs) { return ao::move(lhs).filter(rhs); }

    // transformation
public:
    /// Runs fl and fr on the present slots only (zero, one or two calls), keeps the case
    template <class FL, class FR>
    [[nodiscard]] constexpr auto map(FL&& fl, FR&& fr) const&
    {
        using result_t = any_of<std::remove_cvref_t<std::invoke_result_t<FL, L const&>>, //
                                std::remove_cvref_t<std::invoke_result_t<FR, R const&>>>;
        switch (_case)
        {
        case any_of_case::either: return result_t(_either.map(ao::forward<FL>(fl), ao::forward<FR>(fr)));
        case any_of_case::both: return result_t(_both.map(ao::forward<FL>(fl), ao::forward<FR>(fr)));
        case any_of_case::neither: break;
        }
        return result_t();
    }
    template <class FL, class FR>
    [[nodiscard]] constexpr auto map(FL&& fl, FR&& fr) &&
    {
        using result_t = any_of<std::remove_cvref_t<std::invoke_result_t<FL, L&&>>, //
                                std::remove_cvref_t<std::invoke_result_t<FR, R&&>>>;
        switch (_case)
        {
        case any_of_case::either: return result_t(ao::move(_either).map(ao::forward<FL>(fl), ao::forward<FR>(fr)));
        case any_of_case::both: return result_t(ao::move(_both).map(ao::forward<FL>(fl), ao::forward<FR>(fr)));
        case any_of_case::neither: break;
        }
        return result_t();
    }

    /// Neither stays neither, left(x) becomes right(x), both(l, r) becomes both(r, l)
    [[nodiscard]] constexpr any_of<R, L> swap() const&
    {
        switch (_case)
        {
        case any_of_case::either: return any_of<R, L>(_either.swap());
        case any_of_case::both: return any_of<R, L>(_both.swap());
        case any_of_case::neither: break;
        }
        return any_of<R, L>();
    }
    [[nodiscard]] constexpr any_of<R, L> swap() &&
    {
        switch (_case)
        {
        case any_of_case::either: return any_of<R, L>(ao::move(_either).swap());
        case any_of_case::both: return any_of<R, L>(ao::move(_both).swap());
        case any_of_case::neither: break;
        }
        return any_of<R, L>();
    }

    // extraction
public:
    template <class F>
    [[nodiscard]] constexpr L left_or_else(F&& make_left) const&
    {
        switch (_case)
        {
        case any_of_case::either: return _either.left_or_else(ao::forward<F>(make_left));
        case any_of_case::both: return _both.left_value;
        case any_of_case::neither: break;
        }
        return std::invoke(ao::forward<F>(make_left));
    }
    template <class F>
    [[nodiscard]] constexpr L left_or_else(F&& make_left) &&
    {
        switch (_case)
        {
        case any_of_case::either: return ao::move(_either).left_or_else(ao::forward<F>(make_left));
        case any_of_case::both: return ao::move(_both.left_value);
        case any_of_case::neither: break;
        }
        return std::invoke(ao::forward<F>(make_left));
    }

    template <class F>
    [[nodiscard]] constexpr R right_or_else(F&& make_right) const&
    {
        switch (_case)
        {
        case any_of_case::either: return _either.right_or_else(ao::forward<F>(make_right));
        case any_of_case::both: return _both.right_value;
        case any_of_case::neither: break;
        }
        return std::invoke(ao::forward<F>(make_right));
    }
    template <class F>
    [[nodiscard]] constexpr R right_or_else(F&& make_right) &&
    {
        switch (_case)
        {
        case any_of_case::either: return ao::move(_either).right_or_else(ao::forward<F>(make_right));
        case any_of_case::both: return ao::move(_both.right_value);
        case any_of_case::neither: break;
        }
        return std::invoke(ao::forward<F>(make_right));
    }

    /// Precondition: is_both()
    [[nodiscard]] constexpr both_of<L, R> into_both() const&
    {
        AO_ASSERT_ALWAYS(_case == any_of_case::both, "into_both called on a value that is not both");
        return _both;
    }
    [[nodiscard]] constexpr both_of<L, R> into_both() &&
    {
        AO_ASSERT_ALWAYS(_case == any_of_case::both, "into_both called on a value that is not both");
        return ao::move(_both);
    }

    /// Precondition: is_either()
    [[nodiscard]] constexpr either_of<L, R> into_either() const&
    {
        AO_ASSERT_ALWAYS(_case == any_of_case::either, "into_either called on a value that is not either");
        return _either;
    }
    [[nodiscard]] constexpr either_of<L, R> into_either() &&
    {
        AO_ASSERT_ALWAYS(_case == any_of_case::either, "into_either called on a value that is not either");
        return ao::move(_either);
    }

    /// Precondition: is_both()
    [[nodiscard]] constexpr couple<L, R> into_couple() const& { return into_both().into_couple(); }
    [[nodiscard]] constexpr couple<L, R> into_couple() && { return ao::move(*this).into_both().into_couple(); }

    /// Like both_or, but as a couple
    [[nodiscard]] constexpr couple<L, R> couple_or(couple<L, R> fallback) const&
    {
        return both_or(both_of<L, R>::from_couple(ao::move(fallback))).into_couple();
    }
    [[nodiscard]] constexpr couple<L, R> couple_or(couple<L, R> fallback) &&
    {
        return ao::move(*this).both_or(both_of<L, R>::from_couple(ao::move(fallback))).into_couple();
    }

    /// make_couple is only called if a side is missing
    template <class F>
    [[nodiscard]] constexpr couple<L, R> couple_or_else(F&& make_couple) const&
    {
        return any_of(*this).couple_or_else(ao::forward<F>(make_couple));
    }
    template <class F>
    [[nodiscard]] constexpr couple<L, R> couple_or_else(F&& make_couple) &&
    {
        if (_case == any_of_case::both)
            return ao::move(_both).into_couple();
        return ao::move(*this).couple_or(std::invoke(ao::forward<F>(make_couple)));
    }

    /// Completes the missing side(s) from fallback, present slots are kept
    [[nodiscard]] constexpr both_of<L, R> both_or(both_of<L, R> fallback) const&
    {
        return any_of(*this).both_or(ao::move(fallback));
    }
    [[nodiscard]] constexpr both_of<L, R> both_or(both_of<L, R> fallback) &&
    {
        auto [l, r] = ao::move(*this).into_opt2();
        return both_of<L, R>(l.has_value() ? ao::move(l).value() : ao::move(fallback.left_value),
                             r.has_value() ? ao::move(r).value() : ao::move(fallback.right_value));
    }

    /// Like both_or, make_both is only called if a side is missing
    template <class F>
    [[nodiscard]] constexpr both_of<L, R> both_or_else(F&& make_both) const&
    {
        return any_of(*this).both_or_else(ao::forward<F>(make_both));
    }
    template <class F>
    [[nodiscard]] constexpr both_of<L, R> both_or_else(F&& make_both) &&
    {
        if (_case == any_of_case::both)
            return ao::move(_both);
        return ao::move(*this).both_or(std::invoke(ao::forward<F>(make_both)));
    }

    /// The inner either_of, or fallback if this is neither or both
    [[nodiscard]] constexpr either_of<L, R> either_or(either_of<L, R> fallback) const&
    {
        if (_case == any_of_case::either)
            return _either;
        return fallback;
    }
    [[nodiscard]] constexpr either_of<L, R> either_or(either_of<L, R> fallback) &&
    {
        if (_case == any_of_case::either)
            return ao::move(_either);
        return fallback;
    }

    template <class F>
    [[nodiscard]] constexpr either_of<L, R> either_or_else(F&& make_either) const&
    {
        if (_case == any_of_case::either)
            return _either;
        return std::invoke(ao::forward<F>(make_either));
    }
    template <class F>
    [[nodiscard]] constexpr either_of<L, R> either_or_else(F&& make_either) &&
    {
        if (_case == any_of_case::either)
            return ao::move(_either);
        return std::invoke(ao::forward<F>(make_either));
    }

    // debug
public:
    /// "neither", "left(x)", "right(x)" or "both(l, r)"
    [[nodiscard]] std::string to_string() const
    {
        switch (_case)
        {
        case any_of_case::either: return _either.to_string();
        case any_of_case::both: return _both.to_string();
        case any_of_case::neither: break;
        }
        return "neither";
    }

    // comparison
public:
    /// Equal if both have the same case and equal payloads
    [[nodiscard]] friend constexpr bool operator==(any_of const& lhs, any_of const& rhs)
        requires requires(L const& l, R const& r) {
            bool(l == l);
            bool(r == r);
        }
    {
        if (lhs._case != rhs._case)
            return false;
        switch (lhs._case)
        {
        case any_of_case::either: return lhs._either == rhs._either;
        case any_of_case::both: return lhs._both == rhs._both;
        case any_of_case::neither: break;
        }
        return true;
    }

private:
    template <int Depth, class... Leaves>
    [[nodiscard]] static constexpr any_of create_from_leaves(Leaves&&... leaves)
    {
        auto leaf_refs = std::forward_as_tuple(ao::forward<Leaves>(leaves)...);
        return from_nested<Depth>(impl::nested_from_leaves<any_of, Depth, 0>(leaf_refs));
    }

    template <class Rhs>
    void construct_from(Rhs&& rhs)
    {
        // _case is only set once the payload exists, a throwing copy leaves this neither
        switch (rhs._case)
        {
        case any_of_case::either: new (ao::placement_new, &_either) either_of<L, R>(ao::forward<Rhs>(rhs)._either); break;
        case any_of_case::both: new (ao::placement_new, &_both) both_of<L, R>(ao::forward<Rhs>(rhs)._both); break;
        case any_of_case::neither: break;
        }
        _case = rhs._case;
    }

    void destroy()
    {
        switch (_case)
        {
        case any_of_case::either: _either.~either_type(); break;
        case any_of_case::both: _both.~both_type(); break;
        case any_of_case::neither: break;
        }
        _case = any_of_case::neither;
    }

    // members
private:
    union
    {
        either_of<L, R> _either;
        both_of<L, R> _both;
    };
    any_of_case _case = any_of_case::neither;
};

namespace ao
{
/// Converts any left_or_right value into the any_of with the same present slots
/// Usage:
///   ao::any_of<int, int> v = ao::to_any_of(my_left_or_right_type);
template <left_or_right T>
[[nodiscard]] constexpr any_of<typename T::left_type, typename T::right_type> to_any_of(T const& v)
{
    return any_of<typename T::left_type, typename T::right_type>::create(v.left().to_value(), v.right().to_value());
}
} // namespace ao

namespace std
{
template <class L, class R>
    requires ao::hashable<L> && ao::hashable<R>
struct hash<ao::any_of<L, R>>
{
    [[nodiscard]] std::size_t operator()(ao::any_of<L, R> const& v) const noexcept
    {
        if (auto const e = v.as_either(); e.has_value())
            return std::hash<ao::either_of<L, R>>{}(e.value());
        if (auto const b = v.as_both(); b.has_value())
            return std::hash<ao::both_of<L, R>>{}(b.value());
        return ao::hash_tagged(0);
    }
};
} // namespace std
