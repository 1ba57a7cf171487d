#include <doctest.h>

#include "lazyseq/lazyseq.hpp"

#include <sstream>
#include <string>
#include <vector>

namespace {

namespace ls = lazyseq;

std::string chain_of(const auto& seq)
{
    std::ostringstream strm;
    ls::debug_print(strm, seq);
    return strm.str();
}

bool contains(const std::string& text, const std::string& what)
{
    return text.find(what) != std::string::npos;
}

TEST_CASE("type names")
{
    CHECK(ls::detail::type_name<int>() == "int");
    CHECK(ls::detail::type_name<std::string>() == "std::string");
    CHECK(ls::detail::type_name<ls::pull_sequence<int>>() == "pull_sequence<int>");
}

TEST_CASE("chain printout lists source and stages in order")
{
    const auto seq = ls::sequence(std::vector{1, 2, 3})
            .filter([] (int x) { return x > 1; })
            .map([] (int x) { return std::to_string(x); });

    const auto text = chain_of(seq);
    CHECK(contains(text, "Stages:\n"));
    CHECK(contains(text, "#0 source: \"collection\""));
    CHECK(contains(text, "#1 stage: \"filter_stage<"));
    CHECK(contains(text, "#2 stage: \"map_stage<"));
    CHECK(contains(text, "output: \"std::string\""));
    CHECK(contains(text, "streaming"));
    CHECK(text.find("filter_stage") < text.find("map_stage"));
    CHECK_FALSE(contains(text, "(eager)"));
}

TEST_CASE("eager stages are marked")
{
    const auto text = chain_of(ls::sequence(std::vector{2, 1}).sort().take(1));
    CHECK(contains(text, "sort_stage"));
    CHECK(contains(text, "buffering (eager)"));
}

TEST_CASE("concat prints appended sources")
{
    const auto seq = ls::sequence(ls::iota(0, 3))
            .concat(std::vector{7}, ls::generator<int>([] (auto) { return false; }));

    const auto text = chain_of(seq);
    CHECK(contains(text, "#0 source: \"factory\""));
    CHECK(contains(text, "Appended sources (2):"));
    CHECK(contains(text, "source: \"collection\""));
    CHECK(contains(text, "source: \"generator\""));
}

TEST_CASE("printing a chain pulls nothing")
{
    int calls = 0;
    const auto seq = ls::sequence(std::vector{1, 2}).for_each([&calls] (int) { ++calls; }).reverse();
    CHECK_FALSE(chain_of(seq).empty());
    CHECK(calls == 0);
}

} // namespace anonymous
