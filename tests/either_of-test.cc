#include <any-of/assert-handler.hh>
#include <any-of/both_of.hh>
#include <any-of/either_of.hh>

#include <nexus/test.hh>

#include <memory>
#include <string>
#include <unordered_set>

static_assert(!std::is_default_constructible_v<ao::either_of<int, float>>);
static_assert(std::is_trivially_copyable_v<ao::either_of<int, float>>);
static_assert(std::is_trivially_destructible_v<ao::either_of<int, float>>);
static_assert(!std::is_trivially_copyable_v<ao::either_of<int, std::string>>);
static_assert(ao::left_or_right<ao::either_of<int, float>>);
static_assert(ao::mappable<ao::either_of<int, float>>);
static_assert(ao::unwrappable<ao::either_of<int, float>>);
static_assert(ao::side_swappable<ao::either_of<int, float>>);
static_assert(std::is_same_v<decltype(ao::either_of<int, float>::create_left(1).swap()), ao::either_of<float, int>>);

namespace
{
using text_or_number = ao::either_of<std::string, int>;

struct copy_failed
{
};

// tracks live instances, copies throw while fail_copies is set
struct fragile
{
    int value = 0;
    static inline int live = 0;
    static inline bool fail_copies = false;

    explicit fragile(int v) : value(v) { ++live; }
    fragile(fragile const& rhs) : value(rhs.value)
    {
        if (fail_copies)
            throw copy_failed{};
        ++live;
    }
    fragile(fragile&& rhs) noexcept : value(rhs.value) { ++live; }
    fragile& operator=(fragile const&) = default;
    fragile& operator=(fragile&&) noexcept = default;
    ~fragile() { --live; }
};
} // namespace

TEST("either_of - creation and probing")
{
    SECTION("left")
    {
        auto const e = text_or_number::create_left("abc");
        CHECK(e.is_left());
        CHECK(!e.is_right());
        CHECK(e.left() == std::string("abc"));
        CHECK(e.right() == ao::nullopt);
    }

    SECTION("right")
    {
        auto const e = text_or_number::create_right(7);
        CHECK(!e.is_left());
        CHECK(e.is_right());
        CHECK(e.left() == ao::nullopt);
        CHECK(e.right() == 7);
    }

    SECTION("same type on both sides stays unambiguous")
    {
        auto const l = ao::either_of<int>::create_left(1);
        auto const r = ao::either_of<int>::create_right(1);
        CHECK(l.is_left());
        CHECK(r.is_right());
        CHECK(l != r);
    }
}

TEST("either_of - opt2 agrees with left and right")
{
    auto const l = text_or_number::create_left("x");
    auto const [ll, lr] = l.opt2();
    CHECK(ll == std::string("x"));
    CHECK(lr == ao::nullopt);

    auto const r = text_or_number::create_right(3);
    CHECK(r.opt2().first == ao::nullopt);
    CHECK(r.opt2().second == 3);
}

TEST("either_of - from_opt2 and into_opt2")
{
    auto const l = text_or_number::from_opt2({std::string("left"), ao::nullopt});
    CHECK(l == text_or_number::create_left("left"));

    auto const r = text_or_number::from_opt2({ao::nullopt, 5});
    CHECK(r == text_or_number::create_right(5));

    CHECK(text_or_number::from_opt2(l.into_opt2()) == l);
    CHECK(text_or_number::from_opt2(r.into_opt2()) == r);
}

TEST("either_of - from_opt2 rejects zero or two present sides")
{
    int failures = 0;
    auto handler = ao::impl::scoped_assertion_handler(
        [&](ao::impl::assertion_info const&)
        {
            ++failures;
            throw 0;
        });

    try
    {
        (void)text_or_number::from_opt2({});
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    try
    {
        (void)text_or_number::from_opt2({std::string("a"), 1});
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    CHECK(failures == 2);
}

TEST("either_of - map runs exactly one function")
{
    int left_calls = 0;
    int right_calls = 0;
    auto const fl = [&](std::string const& s)
    {
        ++left_calls;
        return s.size();
    };
    auto const fr = [&](int i)
    {
        ++right_calls;
        return i * 2.0;
    };

    auto const mapped = text_or_number::create_right(4).map(fl, fr);
    static_assert(std::is_same_v<decltype(mapped), ao::either_of<std::size_t, double> const>);
    CHECK(mapped == ao::either_of<std::size_t, double>::create_right(8.0));
    CHECK(left_calls == 0);
    CHECK(right_calls == 1);

    auto const mapped_left = text_or_number::create_left("four").map(fl, fr);
    CHECK(mapped_left.left() == std::size_t(4));
    CHECK(left_calls == 1);
    CHECK(right_calls == 1);
}

TEST("either_of - map_left, map_right and the map operator")
{
    auto const e = text_or_number::create_left("ab");

    CHECK(e.map_left([](std::string const& s) { return s + s; }) == text_or_number::create_left("abab"));
    CHECK(e.map_right([](int i) { return i + 1; }) == e);

    auto const op = e >> ao::both_of{[](std::string const& s) { return int(s.size()); }, [](int i) { return i; }};
    CHECK(op == ao::either_of<int, int>::create_left(2));
}

TEST("either_of - map laws")
{
    auto const values = {text_or_number::create_left("law"), text_or_number::create_right(11)};
    auto const id = ao::identify_function{};

    auto const f1 = [](std::string const& s) { return s + "!"; };
    auto const f2 = [](std::string const& s) { return s.size(); };
    auto const g1 = [](int i) { return i - 1; };
    auto const g2 = [](int i) { return i * 3; };

    for (auto const& x : values)
    {
        CHECK(x.map(id, id) == x);
        CHECK(x.map(f1, g1).map(f2, g2) == x.map([&](std::string const& s) { return f2(f1(s)); }, [&](int i) { return g2(g1(i)); }));
    }
}

TEST("either_of - swap")
{
    auto const l = text_or_number::create_left("s");
    auto const swapped = l.swap();
    CHECK(swapped.is_right());
    CHECK(swapped.right() == std::string("s"));
    CHECK(~l == swapped);
    CHECK(swapped.swap() == l);
    CHECK(~~text_or_number::create_right(2) == text_or_number::create_right(2));
}

TEST("either_of - extraction")
{
    auto const l = text_or_number::create_left("value");
    auto const r = text_or_number::create_right(9);

    CHECK(l.left_or("fallback") == "value");
    CHECK(r.left_or("fallback") == "fallback");
    CHECK(l.right_or(-1) == -1);
    CHECK(r.right_or(-1) == 9);

    CHECK(r.left_or_default().empty());
    CHECK(l.right_or_default() == 0);

    int calls = 0;
    CHECK(l.left_or_else([&] { return std::to_string(++calls); }) == "value");
    CHECK(calls == 0);
    CHECK(r.left_or_else([&] { return std::to_string(++calls); }) == "1");
    CHECK(calls == 1);

    CHECK(l.unwrap_left() == "value");
    CHECK(r.expect_right("right side required") == 9);
}

TEST("either_of - move-only payload")
{
    using ptr_or_code = ao::either_of<std::unique_ptr<int>, int>;

    auto e = ptr_or_code::create_left(std::make_unique<int>(5));
    auto moved = ao::move(e);
    REQUIRE(moved.is_left());
    CHECK(*moved.left().value() == 5);

    auto ptr = ao::move(moved).unwrap_left();
    REQUIRE(ptr != nullptr);
    CHECK(*ptr == 5);

    auto code = ptr_or_code::create_right(3);
    code = ptr_or_code::create_left(std::make_unique<int>(8));
    CHECK(*code.left().value() == 8);
    code = ptr_or_code::create_right(4);
    CHECK(code.right() == 4);
}

TEST("either_of - throwing copy during assignment keeps the old value")
{
    using value_t = ao::either_of<int, fragile>;
    fragile::live = 0;

    {
        auto a = value_t::create_left(1);
        auto const b = value_t::create_right(fragile(2));
        REQUIRE(fragile::live == 1);

        fragile::fail_copies = true;
        bool threw = false;
        try
        {
            a = b;
        }
        catch (copy_failed const&)
        {
            threw = true;
        }
        fragile::fail_copies = false;

        CHECK(threw);
        REQUIRE(a.is_left());
        CHECK(a.left() == 1);
        CHECK(fragile::live == 1);

        a = b;
        REQUIRE(a.is_right());
        CHECK(a.right().value().value == 2);
        CHECK(fragile::live == 2);

        a = value_t::create_left(3);
        CHECK(fragile::live == 1);
    }

    CHECK(fragile::live == 0);
}

TEST("either_of - to_string and hash")
{
    CHECK(text_or_number::create_left("a").to_string() == "left(\"a\")");
    CHECK(text_or_number::create_right(2).to_string() == "right(2)");
    CHECK(ao::to_debug_string(ao::either_of<int>::create_left(1)) == "left(1)");

    auto set = std::unordered_set<ao::either_of<int>>();
    set.insert(ao::either_of<int>::create_left(1));
    set.insert(ao::either_of<int>::create_left(1));
    set.insert(ao::either_of<int>::create_right(1));
    CHECK(set.size() == 2);
}
