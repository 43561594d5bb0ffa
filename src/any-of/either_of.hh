#pragma once

#include <any-of/assert.hh>
#include <any-of/capabilities.hh>
#include <any-of/fwd.hh>
#include <any-of/hash.hh>
#include <any-of/optional.hh>
#include <any-of/path.hh>
#include <any-of/to_debug_string.hh>
#include <any-of/utility.hh>

#include <functional>
#include <string>
#include <type_traits>

/// Exclusive choice: exactly one of a left value (type L) or a right value (type R)
/// There is no empty state, so either_of is not default constructible.
/// Built only through create_left / create_right, which keeps either_of<T, T> unambiguous.
/// Trivially copyable when both L and R are.
///
/// Usage:
///   auto e = ao::either_of<int, std::string>::create_right("error");
///   if (e.is_left()) use(e.left().value());
///   auto n = e.left_or(-1);
template <class L, class R>
struct ao::either_of : ao::left_or_right_interface<ao::either_of<L, R>, L, R>,
                       ao::map_interface<ao::either_of<L, R>>,
                       ao::unwrap_interface<ao::either_of<L, R>, L, R>,
                       ao::swap_interface<ao::either_of<L, R>>,
                       ao::path_interface<ao::either_of<L, R>>
{
    using left_type = L;
    using right_type = R;

    static constexpr bool is_trivially_copyable = std::is_trivially_copyable_v<L> && std::is_trivially_copyable_v<R>;
    static constexpr bool is_trivially_destructible = std::is_trivially_destructible_v<L> && std::is_trivially_destructible_v<R>;

    // creation
public:
    [[nodiscard]] static constexpr either_of create_left(L value) { return either_of(left_tag{}, ao::move(value)); }
    [[nodiscard]] static constexpr either_of create_right(R value) { return either_of(right_tag{}, ao::move(value)); }

    /// Exactly one side of opt must be present
    [[nodiscard]] static constexpr either_of from_opt2(opt2_of<L, R> opt)
    {
        AO_ASSERT_ALWAYS(opt.first.has_value() != opt.second.has_value(), "either_of::from_opt2 requires exactly one present side");
        if (opt.first.has_value())
            return create_left(ao::move(opt.first).value());
        return create_right(ao::move(opt.second).value());
    }

    // trivial copy/move/destroy
public:
    either_of(either_of&&)
        requires is_trivially_copyable
    = default;
    either_of(either_of const&)
        requires is_trivially_copyable
    = default;
    either_of& operator=(either_of&&)
        requires is_trivially_copyable
    = default;
    either_of& operator=(either_of const&)
        requires is_trivially_copyable
    = default;

    ~either_of()
        requires is_trivially_destructible
    = default;

    // non-trivial copy/move/destroy
public:
    /// Not reset like optional: rhs keeps its case, holding a moved-from payload
    either_of(either_of&& rhs) noexcept
        requires(!is_trivially_copyable)
      : _is_left(rhs._is_left)
    {
        if (_is_left)
            new (ao::placement_new, &_left) L(ao::move(rhs._left));
        else
            new (ao::placement_new, &_right) R(ao::move(rhs._right));
    }

    either_of(either_of const& rhs)
        requires(!is_trivially_copyable && std::is_copy_constructible_v<L> && std::is_copy_constructible_v<R>)
      : _is_left(rhs._is_left)
    {
        if (_is_left)
            new (ao::placement_new, &_left) L(rhs._left);
        else
            new (ao::placement_new, &_right) R(rhs._right);
    }

    either_of& operator=(either_of&& rhs) noexcept
        requires(!is_trivially_copyable)
    {
        if (this == &rhs)
            return *this;

        if (_is_left && rhs._is_left)
            _left = ao::move(rhs._left);
        else if (!_is_left && !rhs._is_left)
            _right = ao::move(rhs._right);
        else
        {
            destroy();
            construct_from(ao::move(rhs));
        }
        return *this;
    }

    either_of& operator=(either_of const& rhs)
        requires(!is_trivially_copyable && std::is_copy_constructible_v<L> && std::is_copy_constructible_v<R>)
    {
        if (this == &rhs)
            return *this;

        if (_is_left && rhs._is_left)
            _left = rhs._left;
        else if (!_is_left && !rhs._is_left)
            _right = rhs._right;
        else
        {
            // copy first, a throwing copy leaves this unchanged
            auto tmp = either_of(rhs);
            destroy();
            construct_from(ao::move(tmp));
        }
        return *this;
    }

    ~either_of()
        requires(!is_trivially_destructible)
    {
        destroy();
    }

    // probing
public:
    [[nodiscard]] constexpr optional<L const&> left() const
    {
        if (_is_left)
            return _left;
        return nullopt;
    }

    [[nodiscard]] constexpr optional<R const&> right() const
    {
        if (!_is_left)
            return _right;
        return nullopt;
    }

    [[nodiscard]] constexpr opt2_of<L, R> into_opt2() const&
    {
        if (_is_left)
            return {_left, nullopt};
        return {nullopt, _right};
    }
    [[nodiscard]] constexpr opt2_of<L, R> into_opt2() &&
    {
        if (_is_left)
            return {ao::move(_left), nullopt};
        return {nullopt, ao::move(_right)};
    }

    // transformation
public:
    /// Runs exactly one of the functions, on the present side
    template <class FL, class FR>
    [[nodiscard]] constexpr auto map(FL&& fl, FR&& fr) const&
    {
        using result_t = either_of<std::remove_cvref_t<std::invoke_result_t<FL, L const&>>, //
                                   std::remove_cvref_t<std::invoke_result_t<FR, R const&>>>;
        if (_is_left)
            return result_t::create_left(std::invoke(ao::forward<FL>(fl), _left));
        return result_t::create_right(std::invoke(ao::forward<FR>(fr), _right));
    }
    template <class FL, class FR>
    [[nodiscard]] constexpr auto map(FL&& fl, FR&& fr) &&
    {
        using result_t = either_of<std::remove_cvref_t<std::invoke_result_t<FL, L&&>>, //
                                   std::remove_cvref_t<std::invoke_result_t<FR, R&&>>>;
        if (_is_left)
            return result_t::create_left(std::invoke(ao::forward<FL>(fl), ao::move(_left)));
        return result_t::create_right(std::invoke(ao::forward<FR>(fr), ao::move(_right)));
    }

    /// left(l) becomes right(l) and vice versa
    [[nodiscard]] constexpr either_of<R, L> swap() const&
    {
        if (_is_left)
            return either_of<R, L>::create_right(_left);
        return either_of<R, L>::create_left(_right);
    }
    [[nodiscard]] constexpr either_of<R, L> swap() &&
    {
        if (_is_left)
            return either_of<R, L>::create_right(ao::move(_left));
        return either_of<R, L>::create_left(ao::move(_right));
    }

    // extraction
public:
    /// The left payload, or make_left() if this is a right value
    template <class F>
    [[nodiscard]] constexpr L left_or_else(F&& make_left) const&
    {
        if (_is_left)
            return _left;
        return std::invoke(ao::forward<F>(make_left));
    }
    template <class F>
    [[nodiscard]] constexpr L left_or_else(F&& make_left) &&
    {
        if (_is_left)
            return ao::move(_left);
        return std::invoke(ao::forward<F>(make_left));
    }

    template <class F>
    [[nodiscard]] constexpr R right_or_else(F&& make_right) const&
    {
        if (!_is_left)
            return _right;
        return std::invoke(ao::forward<F>(make_right));
    }
    template <class F>
    [[nodiscard]] constexpr R right_or_else(F&& make_right) &&
    {
        if (!_is_left)
            return ao::move(_right);
        return std::invoke(ao::forward<F>(make_right));
    }

    // debug
public:
    /// "left(x)" or "right(x)"
    [[nodiscard]] std::string to_string() const
    {
        if (_is_left)
            return "left(" + ao::to_debug_string(_left) + ")";
        return "right(" + ao::to_debug_string(_right) + ")";
    }

    // comparison
public:
    /// Equal if both hold the same side with equal payloads
    [[nodiscard]] friend constexpr bool operator==(either_of const& lhs, either_of const& rhs)
        requires requires(L const& l, R const& r) {
            bool(l == l);
            bool(r == r);
        }
    {
        if (lhs._is_left != rhs._is_left)
            return false;
        if (lhs._is_left)
            return lhs._left == rhs._left;
        return lhs._right == rhs._right;
    }

private:
    struct left_tag
    {
    };
    struct right_tag
    {
    };

    constexpr either_of(left_tag, L&& value) : _left(ao::move(value)), _is_left(true) {}
    constexpr either_of(right_tag, R&& value) : _right(ao::move(value)), _is_left(false) {}

    // only after destroy(), the payload move must not throw
    void construct_from(either_of&& rhs) noexcept
    {
        if (rhs._is_left)
            new (ao::placement_new, &_left) L(ao::move(rhs._left));
        else
            new (ao::placement_new, &_right) R(ao::move(rhs._right));
        _is_left = rhs._is_left;
    }

    void destroy()
    {
        if (_is_left)
            _left.~L();
        else
            _right.~R();
    }

    // members
private:
    union
    {
        L _left;
        R _right;
    };
    bool _is_left;
};

namespace std
{
template <class L, class R>
    requires ao::hashable<L> && ao::hashable<R>
struct hash<ao::either_of<L, R>>
{
    [[nodiscard]] std::size_t operator()(ao::either_of<L, R> const& v) const noexcept
    {
        if (v.is_left())
            return ao::hash_tagged(1, v.left().value());
        return ao::hash_tagged(2, v.right().value());
    }
};
} // namespace std
