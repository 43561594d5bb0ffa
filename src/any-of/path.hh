#pragma once

#include <any-of/capabilities.hh>
#include <any-of/couple.hh>
#include <any-of/fwd.hh>
#include <any-of/optional.hh>

#include <concepts>
#include <cstddef>
#include <tuple>
#include <type_traits>

// =========================================================================================================
// Paths into nested left_or_right values
// =========================================================================================================
//
// A composite like any_of<any_of<A, B>, any_of<C, D>> is addressed by a sequence of sides:
//
//   at_path<side::left, side::right>(v)  -> optional<B const&>, present iff v.left() and its right() are
//   v.lr()                               -> the same, as a named accessor (path_interface)
//   v.opt4()                             -> ((ll, lr), (rl, rr)), all borrowed
//
// Everything here is defined once over the left_or_right concept.
// Deeper composites reuse the same machinery by nesting, there is no per-arity logic.
//

enum class ao::side : ao::u8
{
    left,
    right,
};

namespace ao::impl
{
// no member `type` if the path does not exist
template <class T, side... Path>
struct path_node
{
};

template <class T>
struct path_node<T>
{
    using type = T;
};

template <class T, side S, side... Rest>
    requires left_or_right<T>
struct path_node<T, S, Rest...>
  : path_node<std::conditional_t<S == side::left, typename T::left_type, typename T::right_type>, Rest...>
{
};

// nested couples of slots, Depth levels deep
template <class T, int Depth>
struct nested_opt
{
};

template <class T>
struct nested_opt<T, 0>
{
    using type = optional<T>;
};

template <class T, int Depth>
    requires(Depth > 0) && left_or_right<T>
struct nested_opt<T, Depth>
{
    using type = couple<typename nested_opt<typename T::left_type, Depth - 1>::type, //
                        typename nested_opt<typename T::right_type, Depth - 1>::type>;
};

// same shape as nested_opt, but borrowing
template <class T, int Depth>
struct nested_ref
{
};

template <class T>
struct nested_ref<T, 0>
{
    using type = optional<T const&>;
};

template <class T, int Depth>
    requires(Depth > 0) && left_or_right<T>
struct nested_ref<T, Depth>
{
    using type = couple<typename nested_ref<typename T::left_type, Depth - 1>::type, //
                        typename nested_ref<typename T::right_type, Depth - 1>::type>;
};
} // namespace ao::impl

namespace ao
{
/// True if every side in Path descends through a left_or_right node of T
template <class T, side... Path>
concept has_path = requires { typename impl::path_node<T, Path...>::type; };

/// Type found at the end of Path, e.g. path_t<any_of4<A, B, C, D>, side::right, side::left> is C
template <class T, side... Path>
using path_t = typename impl::path_node<T, Path...>::type;

/// True if T is a full binary tree of left_or_right nodes at least Depth levels deep
template <class T, int Depth>
concept nests_to = requires { typename impl::nested_opt<T, Depth>::type; };

/// Owning nested decomposition: nested_opt_t<any_of4<A, B, C, D>, 2> is opt4_of<A, B, C, D>
template <class T, int Depth>
using nested_opt_t = typename impl::nested_opt<T, Depth>::type;

/// Borrowing nested decomposition, as returned by opt4() / opt8() / opt16()
template <class T, int Depth>
using nested_ref_t = typename impl::nested_ref<T, Depth>::type;

/// Borrows the node at the end of Path
/// Present iff every node along the path is present in its parent's current case.
template <side S, side... Rest, left_or_right T>
    requires has_path<T, S, Rest...>
[[nodiscard]] constexpr optional<path_t<T, S, Rest...> const&> at_path(T const& v)
{
    auto const node = [&] {
        if constexpr (S == side::left)
            return v.left();
        else
            return v.right();
    }();

    if constexpr (sizeof...(Rest) == 0)
        return node;
    else
    {
        if (!node.has_value())
            return nullopt;
        return ao::at_path<Rest...>(node.value());
    }
}

/// Decomposes v Depth levels deep into nested couples of borrowed slots
/// An absent inner node yields an all-absent subtree.
template <int Depth, left_or_right T>
    requires nests_to<T, Depth> && (Depth > 0)
[[nodiscard]] constexpr nested_ref_t<T, Depth> nested_opt_of(T const& v)
{
    if constexpr (Depth == 1)
        return {v.left(), v.right()};
    else
    {
        using left_t = nested_ref_t<typename T::left_type, Depth - 1>;
        using right_t = nested_ref_t<typename T::right_type, Depth - 1>;

        auto const l = v.left();
        auto const r = v.right();
        return {
            l.has_value() ? ao::nested_opt_of<Depth - 1>(l.value()) : left_t{},
            r.has_value() ? ao::nested_opt_of<Depth - 1>(r.value()) : right_t{},
        };
    }
}

namespace impl
{
template <class T>
[[nodiscard]] constexpr bool all_absent(optional<T> const& slot)
{
    return !slot.has_value();
}
template <class A, class B>
[[nodiscard]] constexpr bool all_absent(couple<A, B> const& c)
{
    return impl::all_absent(c.first) && impl::all_absent(c.second);
}

// builds nested_opt_t<T, Depth> from the leaves [Offset, Offset + 2^Depth) of a tuple of forwarding references
// leaves are ordered depth-first, left before right (ll, lr, rl, rr for Depth 2)
template <class T, int Depth, std::size_t Offset, class Tuple>
[[nodiscard]] constexpr nested_opt_t<T, Depth> nested_from_leaves(Tuple& leaves)
{
    if constexpr (Depth == 0)
        return nested_opt_t<T, 0>(std::get<Offset>(ao::move(leaves)));
    else
        return {
            impl::nested_from_leaves<typename T::left_type, Depth - 1, Offset>(leaves),
            impl::nested_from_leaves<typename T::right_type, Depth - 1, Offset + (std::size_t(1) << (Depth - 1))>(leaves),
        };
}
} // namespace impl

/// Named flat accessors for composites
/// Each accessor is available exactly when the nesting of Derived supports its path:
///   ll() lr() rl() rr()          on every any_of4 (and deeper)
///   lll() ... rrr()              on every any_of8 (and deeper)
///   llll() ... rrrr()            on every any_of16
/// Accessors borrow, presence follows at_path.
template <class Derived>
struct path_interface
{
#define AO_IMPL_PATH_ACCESSOR(name, ...)                                                  \
    [[nodiscard]] constexpr auto name() const                                             \
        requires has_path<Derived, __VA_ARGS__>                                           \
    {                                                                                     \
        return ao::at_path<__VA_ARGS__>(static_cast<Derived const&>(*this));              \
    }

    // any_of4
public:
    AO_IMPL_PATH_ACCESSOR(ll, side::left, side::left)
    AO_IMPL_PATH_ACCESSOR(lr, side::left, side::right)
    AO_IMPL_PATH_ACCESSOR(rl, side::right, side::left)
    AO_IMPL_PATH_ACCESSOR(rr, side::right, side::right)

    // any_of8
public:
    AO_IMPL_PATH_ACCESSOR(lll, side::left, side::left, side::left)
    AO_IMPL_PATH_ACCESSOR(llr, side::left, side::left, side::right)
    AO_IMPL_PATH_ACCESSOR(lrl, side::left, side::right, side::left)
    AO_IMPL_PATH_ACCESSOR(lrr, side::left, side::right, side::right)
    AO_IMPL_PATH_ACCESSOR(rll, side::right, side::left, side::left)
    AO_IMPL_PATH_ACCESSOR(rlr, side::right, side::left, side::right)
    AO_IMPL_PATH_ACCESSOR(rrl, side::right, side::right, side::left)
    AO_IMPL_PATH_ACCESSOR(rrr, side::right, side::right, side::right)

    // any_of16
public:
    AO_IMPL_PATH_ACCESSOR(llll, side::left, side::left, side::left, side::left)
    AO_IMPL_PATH_ACCESSOR(lllr, side::left, side::left, side::left, side::right)
    AO_IMPL_PATH_ACCESSOR(llrl, side::left, side::left, side::right, side::left)
    AO_IMPL_PATH_ACCESSOR(llrr, side::left, side::left, side::right, side::right)
    AO_IMPL_PATH_ACCESSOR(lrll, side::left, side::right, side::left, side::left)
    AO_IMPL_PATH_ACCESSOR(lrlr, side::left, side::right, side::left, side::right)
    AO_IMPL_PATH_ACCESSOR(lrrl, side::left, side::right, side::right, side::left)
    AO_IMPL_PATH_ACCESSOR(lrrr, side::left, side::right, side::right, side::right)
    AO_IMPL_PATH_ACCESSOR(rlll, side::right, side::left, side::left, side::left)
    AO_IMPL_PATH_ACCESSOR(rllr, side::right, side::left, side::left, side::right)
    AO_IMPL_PATH_ACCESSOR(rlrl, side::right, side::left, side::right, side::left)
    AO_IMPL_PATH_ACCESSOR(rlrr, side::right, side::left, side::right, side::right)
    AO_IMPL_PATH_ACCESSOR(rrll, side::right, side::right, side::left, side::left)
    AO_IMPL_PATH_ACCESSOR(rrlr, side::right, side::right, side::left, side::right)
    AO_IMPL_PATH_ACCESSOR(rrrl, side::right, side::right, side::right, side::left)
    AO_IMPL_PATH_ACCESSOR(rrrr, side::right, side::right, side::right, side::right)

#undef AO_IMPL_PATH_ACCESSOR

    // nested decomposition
public:
    /// ((ll, lr), (rl, rr))
    [[nodiscard]] constexpr auto opt4() const
        requires nests_to<Derived, 2>
    {
        return ao::nested_opt_of<2>(static_cast<Derived const&>(*this));
    }

    /// (((lll, llr), (lrl, lrr)), ((rll, rlr), (rrl, rrr)))
    [[nodiscard]] constexpr auto opt8() const
        requires nests_to<Derived, 3>
    {
        return ao::nested_opt_of<3>(static_cast<Derived const&>(*this));
    }

    [[nodiscard]] constexpr auto opt16() const
        requires nests_to<Derived, 4>
    {
        return ao::nested_opt_of<4>(static_cast<Derived const&>(*this));
    }

    [[nodiscard]] friend constexpr bool operator==(path_interface const&, path_interface const&) = default;
};

} // namespace ao
