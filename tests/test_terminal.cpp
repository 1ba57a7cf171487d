#include <doctest.h>

#include "lazyseq/lazyseq.hpp"

#include <cstddef>
#include <list>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace {

namespace ls = lazyseq;

TEST_CASE("collect")
{
    CHECK(ls::sequence(std::vector{3, 1, 2}).collect() == std::vector{3, 1, 2});
    CHECK(ls::sequence(std::vector<int>{}).collect().empty());
}

TEST_CASE("collect into other containers")
{
    const auto seq = ls::sequence(std::vector{3, 1, 3, 2});
    CHECK(seq.to<std::set>() == std::set{1, 2, 3});
    CHECK(seq.to<std::list>() == std::list{3, 1, 3, 2});
}

TEST_CASE("consume runs side effects only")
{
    int sum = 0;
    ls::sequence(std::vector{1, 2, 3})
            .for_each([&sum] (int x) { sum += x; })
            .consume();
    CHECK(sum == 6);
}

TEST_CASE("count")
{
    CHECK(ls::sequence(std::vector{1, 2, 3}).count() == 3);
    CHECK(ls::sequence(std::vector<std::string>{}).count() == 0);
}

TEST_CASE("first and last")
{
    const auto seq = ls::sequence(std::vector{4, 5, 6});
    CHECK(seq.first() == 4);
    CHECK(seq.last() == 6);

    const auto empty = ls::sequence(std::vector<int>{});
    CHECK(empty.first() == std::nullopt);
    CHECK(empty.last() == std::nullopt);
}

TEST_CASE("find")
{
    const auto seq = ls::sequence(std::vector{1, 4, 9, 16});
    CHECK(seq.find([] (int x) { return x > 5; }) == 9);
    CHECK(seq.find([] (int, std::size_t i) { return i == 3; }) == 16);
    CHECK(seq.find([] (int x) { return x < 0; }) == std::nullopt);
}

TEST_CASE("some and every")
{
    const auto seq = ls::sequence(std::vector{2, 4, 6});
    CHECK(seq.some([] (int x) { return x == 4; }));
    CHECK_FALSE(seq.some([] (int x) { return x == 5; }));
    CHECK(seq.every([] (int x) { return x % 2 == 0; }));
    CHECK_FALSE(seq.every([] (int x, std::size_t i) { return i < 2 && x > 0; }));

    const auto empty = ls::sequence(std::vector<int>{});
    CHECK_FALSE(empty.some([] (int) { return true; }));
    CHECK(empty.every([] (int) { return false; }));
}

TEST_CASE("includes")
{
    const auto words = ls::sequence(std::vector<std::string>{"one", "two"});
    CHECK(words.includes("two"));
    CHECK_FALSE(words.includes("three"));
    CHECK(ls::sequence(std::vector{1.5, 2.5}).includes(2.5));
}

TEST_CASE("reduce")
{
    SUBCASE("sum") {
        const auto sum = ls::sequence(std::vector{1, 2, 3}).reduce(0, [] (int acc, int x) { return acc + x; });
        CHECK(sum == 6);
    }
    SUBCASE("with index") {
        const auto weighted = ls::sequence(std::vector{5, 5, 5})
                .reduce(std::size_t{0}, [] (std::size_t acc, int x, std::size_t i) { return acc + x * i; });
        CHECK(weighted == 15);
    }
    SUBCASE("accumulator of another type") {
        const auto text = ls::sequence(std::vector{1, 2, 3})
                .reduce(std::string{">"}, [] (std::string acc, int x) { return acc + std::to_string(x); });
        CHECK(text == ">123");
    }
    SUBCASE("empty sequence gives init") {
        CHECK(ls::sequence(std::vector<int>{}).reduce(42, [] (int, int) { return 0; }) == 42);
    }
}

TEST_CASE("join")
{
    SUBCASE("numbers") {
        CHECK(ls::sequence(std::vector{1, 2, 3}).join(", ") == "1, 2, 3");
        CHECK(ls::sequence(std::vector{0.5, 2.0}).join(" ") == "0.5 2");
    }
    SUBCASE("empty representations are skipped with their separator") {
        using item = std::variant<int, std::string>;
        const auto seq = ls::sequence(std::vector<item>{1, std::string{}, 0, std::string{"a"}});
        CHECK(seq.join(";") == "1;0;a");
    }
    SUBCASE("missing values") {
        const auto seq = ls::sequence(std::vector<std::optional<int>>{std::nullopt, 7, std::nullopt, 8});
        CHECK(seq.join("+") == "7+8");
    }
    SUBCASE("null C-strings are skipped") {
        const auto seq = ls::sequence(std::vector<const char*>{"a", nullptr, "b", nullptr});
        CHECK(seq.join(";") == "a;b");
    }
    SUBCASE("booleans and characters") {
        CHECK(ls::sequence(std::vector{true, false}).join("") == "truefalse");
        CHECK(ls::sequence(std::vector{'a', 'b'}).join(".") == "a.b");
    }
    SUBCASE("empty sequence") {
        CHECK(ls::sequence(std::vector<int>{}).join(",").empty());
    }
}

} // namespace anonymous
