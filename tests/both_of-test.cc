#include <any-of/assert-handler.hh>
#include <any-of/both_of.hh>

#include <nexus/test.hh>

#include <memory>
#include <string>
#include <unordered_set>

static_assert(std::is_trivially_copyable_v<ao::both_of<int, float>>);
static_assert(ao::left_or_right<ao::both_of<int, float>>);
static_assert(ao::mappable<ao::both_of<int, float>>);
static_assert(ao::unwrappable<ao::both_of<int, float>>);
static_assert(ao::side_swappable<ao::both_of<int, float>>);
static_assert(std::is_same_v<decltype(ao::both_of<int, float>(1, 2.f).swap()), ao::both_of<float, int>>);

TEST("both_of - fields and probes")
{
    auto const b = ao::both_of<int, std::string>(1, "one");
    CHECK(b.left_value == 1);
    CHECK(b.right_value == "one");

    CHECK(b.is_left());
    CHECK(b.is_right());
    CHECK(b.left() == 1);
    CHECK(b.right() == std::string("one"));

    auto const [l, r] = b.opt2();
    CHECK(l == 1);
    CHECK(r == std::string("one"));
}

TEST("both_of - structured bindings and default construction")
{
    auto [n, s] = ao::both_of<int, std::string>(4, "four");
    CHECK(n == 4);
    CHECK(s == "four");

    auto const empty = ao::both_of<int, std::string>();
    CHECK(empty.left_value == 0);
    CHECK(empty.right_value.empty());
}

TEST("both_of - couple conversions")
{
    auto const b = ao::both_of<int, char>::from_couple({2, 'b'});
    CHECK(b == ao::both_of<int, char>(2, 'b'));
    CHECK(b.into_couple() == ao::couple<int, char>{2, 'b'});
}

TEST("both_of - opt2 conversions")
{
    auto const b = ao::both_of<int, char>::from_opt2({3, 'c'});
    CHECK(b == ao::both_of<int, char>(3, 'c'));

    auto const [l, r] = b.into_opt2();
    CHECK(l == 3);
    CHECK(r == 'c');

    bool reported = false;
    {
        auto handler = ao::impl::scoped_assertion_handler(
            [&](ao::impl::assertion_info const&)
            {
                reported = true;
                throw 0;
            });
        try
        {
            (void)ao::both_of<int, char>::from_opt2({3, ao::nullopt});
        }
        catch (int) // NOLINT(bugprone-empty-catch)
        {
        }
    }
    CHECK(reported);
}

TEST("both_of - into_left and into_right")
{
    auto const b = ao::both_of<int, std::string>(5, "five");
    CHECK(b.into_left() == ao::either_of<int, std::string>::create_left(5));
    CHECK(b.into_right() == ao::either_of<int, std::string>::create_right("five"));
}

TEST("both_of - map runs both functions, left first")
{
    std::string order;
    auto const b = ao::both_of<int, std::string>(2, "xy");

    auto const mapped = b.map(
        [&](int i)
        {
            order += 'l';
            return i * 10;
        },
        [&](std::string const& s)
        {
            order += 'r';
            return s.size();
        });

    CHECK(order == "lr");
    CHECK(mapped == ao::both_of<int, std::size_t>(20, 2));

    CHECK(b.map_left([](int i) { return -i; }) == ao::both_of<int, std::string>(-2, "xy"));
    CHECK(b.map_right([](std::string const& s) { return s + "z"; }) == ao::both_of<int, std::string>(2, "xyz"));
    CHECK((b >> ao::both_of{[](int i) { return i + 1; }, [](std::string const& s) { return s; }}) == ao::both_of<int, std::string>(3, "xy"));
}

TEST("both_of - map laws")
{
    auto const b = ao::both_of<int, double>(3, 0.5);
    auto const id = ao::identify_function{};
    auto const f1 = [](int i) { return i + 2; };
    auto const f2 = [](int i) { return i * i; };
    auto const g1 = [](double d) { return d * 4; };
    auto const g2 = [](double d) { return d - 1; };

    CHECK(b.map(id, id) == b);
    CHECK(b.map(f1, g1).map(f2, g2) == b.map([&](int i) { return f2(f1(i)); }, [&](double d) { return g2(g1(d)); }));
}

TEST("both_of - swap")
{
    auto const b = ao::both_of<int, std::string>(1, "a");
    CHECK(b.swap() == ao::both_of<std::string, int>("a", 1));
    CHECK(~b == b.swap());
    CHECK(~~b == b);
}

TEST("both_of - extraction never falls back")
{
    auto const b = ao::both_of<int, std::string>(6, "six");
    bool called = false;

    CHECK(b.left_or(0) == 6);
    CHECK(b.right_or("none") == "six");
    CHECK(b.left_or_else([&] { called = true; return 0; }) == 6);
    CHECK(!called);
    CHECK(b.unwrap_left() == 6);
    CHECK(b.expect_right("always present") == "six");
}

TEST("both_of - move-only payload")
{
    auto b = ao::both_of<std::unique_ptr<int>, int>(std::make_unique<int>(1), 2);
    auto swapped = ao::move(b).swap();
    REQUIRE(swapped.right_value != nullptr);
    CHECK(*swapped.right_value == 1);
    CHECK(swapped.left_value == 2);

    auto ptr = ao::move(swapped).unwrap_right();
    CHECK(*ptr == 1);
}

TEST("both_of - to_string and hash")
{
    CHECK(ao::both_of<int, char>(1, 'x').to_string() == "both(1, 'x')");

    auto set = std::unordered_set<ao::both_of<int>>();
    set.insert({1, 2});
    set.insert({1, 2});
    set.insert({2, 1});
    CHECK(set.size() == 2);
}
