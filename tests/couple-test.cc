#include <any-of/couple.hh>
#include <any-of/optional.hh>

#include <nexus/test.hh>

#include <string>
#include <tuple>
#include <type_traits>
#include <unordered_set>

static_assert(std::is_aggregate_v<ao::couple<int, float>>);
static_assert(std::is_trivially_copyable_v<ao::couple<int, float>>);
static_assert(std::tuple_size_v<ao::couple<int, std::string>> == 2);
static_assert(std::is_same_v<std::tuple_element_t<1, ao::couple<int, std::string>>, std::string>);
static_assert(std::is_same_v<ao::pair<int>, ao::couple<int, int>>);
static_assert(std::is_same_v<ao::opt2_of<int, char>, ao::couple<ao::optional<int>, ao::optional<char>>>);

TEST("couple - aggregate construction and access")
{
    auto const c = ao::couple<int, std::string>{7, "seven"};
    CHECK(c.first == 7);
    CHECK(c.second == "seven");
}

TEST("couple - structured bindings")
{
    SECTION("by value")
    {
        auto [n, s] = ao::couple<int, std::string>{1, "one"};
        CHECK(n == 1);
        CHECK(s == "one");
    }

    SECTION("by reference writes through")
    {
        auto c = ao::couple<int, int>{1, 2};
        auto& [a, b] = c;
        a = 10;
        b = 20;
        CHECK(c.first == 10);
        CHECK(c.second == 20);
    }

    SECTION("from an rvalue moves the members")
    {
        auto c = ao::couple<std::string, std::string>{"left", "right"};
        auto [l, r] = std::move(c);
        CHECK(l == "left");
        CHECK(r == "right");
    }
}

TEST("couple - comparison")
{
    auto const a = ao::couple<int, int>{1, 2};
    auto const b = ao::couple<int, int>{1, 3};

    CHECK(a == a);
    CHECK(a != b);
    CHECK(a < b);
    CHECK(b > a);
}

TEST("couple - couple of slots")
{
    auto const both = ao::opt2_of<int, char>{1, 'x'};
    CHECK(both.first == 1);
    CHECK(both.second == 'x');

    auto const none = ao::opt2_of<int, char>{};
    CHECK(none.first == ao::nullopt);
    CHECK(none.second == ao::nullopt);

    CHECK(both != none);
}

TEST("couple - to_string")
{
    CHECK(ao::couple<int, bool>{3, true}.to_string() == "(3, true)");
    CHECK(ao::couple<std::string, char>{"s", 'c'}.to_string() == "(\"s\", 'c')");
    CHECK(ao::opt2_of<int, int>{ao::nullopt, 4}.to_string() == "(nullopt, 4)");
}

TEST("couple - hash")
{
    auto set = std::unordered_set<ao::couple<int, int>>();
    set.insert({1, 2});
    set.insert({1, 2});
    set.insert({2, 1});
    CHECK(set.size() == 2);
}
