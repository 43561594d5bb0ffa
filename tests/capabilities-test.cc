#include <any-of/any_of.hh>
#include <any-of/capabilities.hh>
#include <any-of/path.hh>

#include <nexus/test.hh>

#include <functional>
#include <string>

namespace
{
// a user type that participates through the interfaces: a reading with an optional value and an optional unit
template <class V, class U>
struct reading : ao::left_or_right_interface<reading<V, U>, V, U>,
                 ao::map_interface<reading<V, U>>,
                 ao::unwrap_interface<reading<V, U>, V, U>,
                 ao::swap_interface<reading<V, U>>
{
    using left_type = V;
    using right_type = U;

    ao::optional<V> value;
    ao::optional<U> unit;

    reading() = default;
    reading(ao::optional<V> v, ao::optional<U> u) : value(ao::move(v)), unit(ao::move(u)) {}

    ao::optional<V const&> left() const
    {
        if (value.has_value())
            return value.value();
        return ao::nullopt;
    }
    ao::optional<U const&> right() const
    {
        if (unit.has_value())
            return unit.value();
        return ao::nullopt;
    }

    template <class FL, class FR>
    auto map(FL&& fl, FR&& fr) const
    {
        using result_t = reading<std::remove_cvref_t<std::invoke_result_t<FL, V const&>>, //
                                 std::remove_cvref_t<std::invoke_result_t<FR, U const&>>>;
        auto r = result_t();
        if (value.has_value())
            r.value = std::invoke(fl, value.value());
        if (unit.has_value())
            r.unit = std::invoke(fr, unit.value());
        return r;
    }

    template <class F>
    V left_or_else(F&& f) const
    {
        return value.has_value() ? value.value() : std::invoke(f);
    }
    template <class F>
    U right_or_else(F&& f) const
    {
        return unit.has_value() ? unit.value() : std::invoke(f);
    }

    reading<U, V> swap() const { return reading<U, V>(unit, value); }

    friend bool operator==(reading const&, reading const&) = default;
};

// only probing, nothing else
struct probe_only
{
    using left_type = int;
    using right_type = int;

    int stored = 0;

    ao::optional<int const&> left() const { return stored; }
    ao::optional<int const&> right() const { return ao::nullopt; }
};

struct wrong_probe
{
    using left_type = int;
    using right_type = int;

    ao::optional<int> left() const { return 0; }
    ao::optional<int> right() const { return 0; }
};
} // namespace

static_assert(ao::left_or_right<reading<int, std::string>>);
static_assert(ao::mappable<reading<int, std::string>>);
static_assert(ao::unwrappable<reading<int, std::string>>);
static_assert(ao::side_swappable<reading<int, std::string>>);

static_assert(ao::left_or_right<probe_only>);
static_assert(!ao::mappable<probe_only>);
static_assert(!ao::unwrappable<probe_only>);
static_assert(!ao::side_swappable<probe_only>);

// probes must borrow
static_assert(!ao::left_or_right<wrong_probe>);
static_assert(!ao::left_or_right<int>);

TEST("capabilities - probing helpers on a user type")
{
    auto const r = reading<int, std::string>(21, ao::nullopt);
    CHECK(r.is_left());
    CHECK(!r.is_right());

    auto const [v, u] = r.opt2();
    CHECK(v == 21);
    CHECK(u == ao::nullopt);
}

TEST("capabilities - to_any_of mirrors the present slots")
{
    using any_t = ao::any_of<int, std::string>;

    CHECK(ao::to_any_of(reading<int, std::string>()) == any_t::create_neither());
    CHECK(ao::to_any_of(reading<int, std::string>(1, ao::nullopt)) == any_t::create_left(1));
    CHECK(ao::to_any_of(reading<int, std::string>(ao::nullopt, std::string("K"))) == any_t::create_right("K"));
    CHECK(ao::to_any_of(reading<int, std::string>(1, std::string("K"))) == any_t::create_both(1, "K"));

    auto const p = probe_only{5};
    CHECK(ao::to_any_of(p) == ao::any_of<int, int>::create_left(5));

    auto const r = reading<int, std::string>(3, std::string("C"));
    auto const a = ao::to_any_of(r);
    CHECK(a.opt2() == r.opt2());
}

TEST("capabilities - derived map helpers")
{
    auto const r = reading<int, std::string>(20, std::string("C"));

    auto const doubled = r.map_left([](int i) { return i * 2; });
    CHECK(doubled == reading<int, std::string>(40, std::string("C")));

    auto const lengths = r.map_right([](std::string const& s) { return s.size(); });
    CHECK(lengths.unit == std::size_t(1));

    auto const op = r >> ao::both_of{[](int i) { return i + 1; }, [](std::string const& s) { return s + "!"; }};
    CHECK(op == reading<int, std::string>(21, std::string("C!")));
}

TEST("capabilities - derived unwrap helpers")
{
    auto const present = reading<int, std::string>(7, ao::nullopt);

    CHECK(present.left_or(0) == 7);
    CHECK(present.right_or("none") == "none");
    CHECK(present.right_or_default().empty());
    CHECK(present.unwrap_left() == 7);
    CHECK(present.expect_left("value required") == 7);
}

TEST("capabilities - derived swap operator")
{
    auto const r = reading<int, std::string>(1, ao::nullopt);
    auto const swapped = ~r;
    static_assert(std::is_same_v<decltype(swapped), reading<std::string, int> const>);
    CHECK(swapped.right() == 1);
    CHECK(swapped.left() == ao::nullopt);
    CHECK(~~r == r);
}

TEST("capabilities - user types nest inside any_of")
{
    using nested = ao::any_of<reading<int, std::string>, int>;
    auto const v = nested::create_both(reading<int, std::string>(4, ao::nullopt), 9);

    CHECK(ao::at_path<ao::side::left, ao::side::left>(v) == 4);
    CHECK(ao::at_path<ao::side::left, ao::side::right>(v) == ao::nullopt);
    CHECK(ao::at_path<ao::side::right>(v) == 9);

    auto const [l, r] = ao::nested_opt_of<1>(v);
    CHECK(l.value().value == 4);
    CHECK(r == 9);
}
