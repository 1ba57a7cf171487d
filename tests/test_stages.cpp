#include <doctest.h>

#include "lazyseq/lazyseq.hpp"

#include <cstddef>
#include <limits>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace {

namespace ls = lazyseq;

const auto numbers = ls::sequence(std::vector{1, 2, 3, 4, 5});

TEST_CASE("map transforms every element")
{
    const auto result = numbers.map([] (int x) { return x * 2; }).collect();
    CHECK(result == std::vector{2, 4, 6, 8, 10});
}

TEST_CASE("map receives the position of the element")
{
    const auto result = numbers.map([] (int x, std::size_t i) { return x * 10 + static_cast<int>(i); }).collect();
    CHECK(result == std::vector{10, 21, 32, 43, 54});
}

TEST_CASE("map can change element type")
{
    const auto result = numbers.map([] (int x) { return std::to_string(x); }).collect();
    CHECK(result == std::vector<std::string>{"1", "2", "3", "4", "5"});
}

TEST_CASE("filter removes elements")
{
    const auto result = numbers.filter([] (int x) { return x % 2 == 1; }).collect();
    CHECK(result == std::vector{1, 3, 5});
}

TEST_CASE("filter index counts filtered out elements too")
{
    std::vector<std::size_t> seen;
    const auto result = ls::sequence(std::vector{10, 11, 12, 13})
        .filter([] (int x) { return x % 2 == 0; })
        .filter([&seen] (int, std::size_t i) { seen.push_back(i); return true; })
        .collect();

    CHECK(result == std::vector{10, 12});
    // second filter sees only what passed the first one
    CHECK(seen == std::vector<std::size_t>{0, 1});

    const auto odd_positions = ls::sequence(std::vector{10, 11, 12, 13})
        .filter([] (int, std::size_t i) { return i % 2 == 1; })
        .collect();
    CHECK(odd_positions == std::vector{11, 13});
}

TEST_CASE("for_each passes elements through unchanged")
{
    std::vector<std::pair<int, std::size_t>> calls;
    const auto result = numbers
        .for_each([&calls] (int x, std::size_t i) { calls.emplace_back(x, i); })
        .collect();

    CHECK(result == std::vector{1, 2, 3, 4, 5});
    REQUIRE(calls.size() == 5);
    CHECK(calls[0] == std::pair{1, std::size_t{0}});
    CHECK(calls[4] == std::pair{5, std::size_t{4}});
}

TEST_CASE("concat appends sources in order")
{
    const auto result = ls::sequence(std::vector{1, 2})
        .concat(std::vector{3}, ls::sequence(std::vector{4, 5}), ls::iota(6, 8))
        .collect();
    CHECK(result == std::vector{1, 2, 3, 4, 5, 6, 7});
}

TEST_CASE("concat with empty sources")
{
    const auto empty = std::vector<int>{};

    CHECK(ls::sequence(empty).concat(empty, std::vector{1}, empty).collect() == std::vector{1});
    CHECK(ls::sequence(empty).concat().collect().empty());
}

TEST_CASE("push and unshift")
{
    CHECK(numbers.push(6, 7).collect() == std::vector{1, 2, 3, 4, 5, 6, 7});
    CHECK(numbers.unshift(-1, 0).collect() == std::vector{-1, 0, 1, 2, 3, 4, 5});
    CHECK(numbers.push().collect() == std::vector{1, 2, 3, 4, 5});

    const auto words = ls::sequence(std::vector<std::string>{"b"});
    CHECK(words.unshift("a").push("c").collect() == std::vector<std::string>{"a", "b", "c"});
}

TEST_CASE("pop removes the last element")
{
    CHECK(numbers.pop().collect() == std::vector{1, 2, 3, 4});
    CHECK(ls::sequence({7}).pop().collect().empty());
    CHECK(ls::sequence(std::vector<int>{}).pop().collect().empty());
    CHECK(numbers.pop().pop().collect() == std::vector{1, 2, 3});
}

TEST_CASE("shift removes the first element")
{
    CHECK(numbers.shift().collect() == std::vector{2, 3, 4, 5});
    CHECK(ls::sequence({7}).shift().collect().empty());
    CHECK(ls::sequence(std::vector<int>{}).shift().collect().empty());
}

TEST_CASE("slice bounds are inclusive")
{
    const auto zero_based = ls::sequence(std::vector{0, 1, 2, 3, 4});

    CHECK(zero_based.slice(1, 3).collect() == std::vector{1, 2, 3});
    CHECK(zero_based.slice(0, 0).collect() == std::vector{0});
    CHECK(zero_based.slice(3, 100).collect() == std::vector{3, 4});
    CHECK(zero_based.slice(-5, 1).collect() == std::vector{0, 1});
    CHECK(zero_based.slice(3, 1).collect().empty());
    CHECK(zero_based.slice(0, -1).collect().empty());
}

TEST_CASE("take")
{
    CHECK(numbers.take(3).collect() == std::vector{1, 2, 3});
    CHECK(numbers.take(5).collect() == std::vector{1, 2, 3, 4, 5});
    CHECK(numbers.take(10).collect() == std::vector{1, 2, 3, 4, 5});
    CHECK(numbers.take(0).collect().empty());
    CHECK(numbers.take(-2).collect().empty());
}

TEST_CASE("drop withholds one element less than asked")
{
    CHECK(numbers.drop(3).collect() == std::vector{2, 3, 4, 5});
    CHECK(numbers.drop(1).collect() == std::vector{1, 2, 3, 4, 5});
    CHECK(numbers.drop(0).collect() == std::vector{1, 2, 3, 4, 5});
    CHECK(numbers.drop(-3).collect() == std::vector{1, 2, 3, 4, 5});
    CHECK(numbers.drop(6).collect().empty());
    CHECK(numbers.drop(5).collect() == std::vector{5});
}

TEST_CASE("counts at the limits of their type")
{
    constexpr auto min = std::numeric_limits<std::ptrdiff_t>::min();
    constexpr auto max = std::numeric_limits<std::ptrdiff_t>::max();

    CHECK(numbers.drop(min).collect() == std::vector{1, 2, 3, 4, 5});
    CHECK(numbers.drop(max).collect().empty());
    CHECK(numbers.drop_exactly(min).collect() == std::vector{1, 2, 3, 4, 5});
    CHECK(numbers.drop_exactly(max).collect().empty());
    CHECK(numbers.take(min).collect().empty());
    CHECK(numbers.take(max).collect() == std::vector{1, 2, 3, 4, 5});
    CHECK(numbers.slice(min, max).collect() == std::vector{1, 2, 3, 4, 5});
    CHECK(numbers.slice(max, max).collect().empty());
    CHECK(numbers.slice(min, min).collect().empty());
}

TEST_CASE("drop_exactly withholds n elements")
{
    CHECK(numbers.drop_exactly(3).collect() == std::vector{4, 5});
    CHECK(numbers.drop_exactly(0).collect() == std::vector{1, 2, 3, 4, 5});
    CHECK(numbers.drop_exactly(5).collect().empty());
    CHECK(numbers.drop_exactly(-1).collect() == std::vector{1, 2, 3, 4, 5});
}

TEST_CASE("entries and indexes")
{
    const auto words = ls::sequence(std::vector<std::string>{"a", "b"});

    const auto entries = words.entries().collect();
    REQUIRE(entries.size() == 2);
    CHECK(entries[0] == std::pair<std::string, std::size_t>{"a", 0});
    CHECK(entries[1] == std::pair<std::string, std::size_t>{"b", 1});

    CHECK(words.indexes().collect() == std::vector<std::size_t>{0, 1});
    CHECK(words.filter([] (const std::string& s) { return s == "b"; }).indexes().collect()
            == std::vector<std::size_t>{0});
}

TEST_CASE("replace with the same type")
{
    CHECK(ls::sequence(std::vector{1, 7, 3, 7}).replace(7, 0).collect() == std::vector{1, 0, 3, 0});
    CHECK(numbers.replace(42, 0).collect() == std::vector{1, 2, 3, 4, 5});

    const auto words = ls::sequence(std::vector<std::string>{"x", "y", "x"});
    CHECK(words.replace("x", "z").collect() == std::vector<std::string>{"z", "y", "z"});
}

TEST_CASE("replace with a value convertible to the element type")
{
    const auto longs = ls::sequence(std::vector<long>{1, 2, 1}).replace(1, 0);
    static_assert(std::is_same_v<decltype(longs), const ls::sequence<long>>);
    CHECK(longs.collect() == std::vector<long>{0, 2, 0});

    const auto doubles = ls::sequence(std::vector{1.0, 2.5}).replace(1.0, 0);
    static_assert(std::is_same_v<decltype(doubles), const ls::sequence<double>>);
    CHECK(doubles.collect() == std::vector{0.0, 2.5});
}

TEST_CASE("replace with another type changes element type")
{
    using element = std::variant<int, std::string>;

    const auto result = ls::sequence(std::vector{1, 2, 1})
        .replace(1, std::string{"one"})
        .collect();

    CHECK(result == std::vector<element>{std::string{"one"}, 2, std::string{"one"}});
}

TEST_CASE("stages compose")
{
    const auto chained = ls::sequence(ls::iota(0))
        .filter([] (int x) { return x % 3 == 0; })
        .map([] (int x) { return x * x; })
        .drop_exactly(1)
        .take(3)
        .collect();
    CHECK(chained == std::vector{9, 36, 81});
}

} // namespace anonymous
