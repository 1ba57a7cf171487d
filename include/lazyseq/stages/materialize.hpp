#pragma once

#include "lazyseq/chain.hpp"
#include "lazyseq/pull_sequence.hpp"
#include "lazyseq/stage_styles.hpp"

#include <algorithm>
#include <cstddef>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace lazyseq {
namespace detail::stages {

// Shared implementation of eager stages (reverse, sort, take_last, drop_last).
//
// On the first pull the whole upstream is read into a buffer, Arrange reorders or trims it
// in place, then elements are produced from the buffer one by one.
// Nothing is read before the first pull.
//
// Arrange is called as arrange(std::vector<Input>& buffer).
// DisplayStage is the name shown by debug_print().
template <class DisplayStage, class Arrange>
struct base_materialize_stage
{
    static constexpr auto style = stage_styles::buffering;

    [[no_unique_address]]
    Arrange arrange;

    template <class Input>
    struct impl
    {
        using input_type = Input;
        using output_type = Input;
        using stage_type = base_materialize_stage; // for style
        using display_stage_type = DisplayStage; // for output in debug

        [[no_unique_address]]
        Arrange arrange;
        std::optional<std::vector<Input>> buffer;
        std::size_t position = 0;

        std::optional<Input> next(cursor<Input>& upstream)
        {
            if (!buffer.has_value()) {
                auto& elems = buffer.emplace();
                while (auto input = upstream.next()) {
                    elems.push_back(std::move(*input));
                }
                arrange(elems);
            }
            if (position == buffer->size()) {
                return std::nullopt;
            }
            return std::move((*buffer)[position++]);
        }
    };

    template <class Input>
    constexpr auto make_impl() const
    {
        static_assert(std::is_invocable_v<const Arrange&, std::vector<Input>&>,
                "arrange operation cannot be called with buffer of input type");
        return impl<Input>{arrange, std::nullopt, 0};
    }
};

template <class DisplayStage, class Arrange>
constexpr auto make_base_materialize_stage(Arrange&& arrange)
{
    return base_materialize_stage<DisplayStage, std::decay_t<Arrange>>{(Arrange&&) arrange};
}


// Keeps elements at positions [start, end] of buffer, both inclusive, same as slice() does
template <class T>
void keep_inclusive(std::vector<T>& buffer, const std::ptrdiff_t start, const std::ptrdiff_t end)
{
    const auto size = static_cast<std::ptrdiff_t>(buffer.size());
    const auto first = std::max<std::ptrdiff_t>(start, 0);
    const auto last = std::min<std::ptrdiff_t>(end, size - 1);
    if (first > last) {
        buffer.clear();
        return;
    }
    buffer.erase(buffer.begin() + last + 1, buffer.end());
    buffer.erase(buffer.begin(), buffer.begin() + first);
}

// Comparator may be a less-than predicate (returns bool)
// or a three-way function returning a signed number, negative meaning a goes before b
template <class Compare, class T>
bool compare_less(const Compare& compare, const T& a, const T& b)
{
    using result_type = std::remove_cvref_t<std::invoke_result_t<const Compare&, const T&, const T&>>;
    if constexpr (std::is_same_v<result_type, bool>) {
        return std::invoke(compare, a, b);
    }
    else {
        static_assert(std::is_arithmetic_v<result_type> || std::is_convertible_v<result_type, int>,
                "sort comparator must return bool or a number");
        return std::invoke(compare, a, b) < 0;
    }
}

} // namespace detail::stages


inline namespace stages {

template <class T>
auto reverse(const pull_sequence<T>& upstream)
{
    return detail::make_stage_sequence(upstream,
            detail::stages::make_base_materialize_stage<struct reverse_stage>(
                [] <class Input> (std::vector<Input>& buffer) {
                    std::reverse(buffer.begin(), buffer.end());
                }));
}

// Stable, so equal elements keep upstream order
template <class T, class Compare = std::less<>>
auto sort(const pull_sequence<T>& upstream, Compare&& compare = {})
{
    static_assert(std::is_invocable_v<const std::decay_t<Compare>&, const T&, const T&>,
            "sort comparator cannot be called with two elements");
    return detail::make_stage_sequence(upstream,
            detail::stages::make_base_materialize_stage<struct sort_stage>(
                [compare = (Compare&&) compare] <class Input> (std::vector<Input>& buffer) {
                    std::stable_sort(buffer.begin(), buffer.end(), [&compare] (const Input& a, const Input& b) {
                        return detail::stages::compare_less(compare, a, b);
                    });
                }));
}

// Buffer of length L, keeps [L - n, L - 1]
template <class T>
auto take_last(const pull_sequence<T>& upstream, const std::ptrdiff_t n)
{
    return detail::make_stage_sequence(upstream,
            detail::stages::make_base_materialize_stage<struct take_last_stage>(
                [n] <class Input> (std::vector<Input>& buffer) {
                    if (n <= 0) {
                        buffer.clear();
                        return;
                    }
                    const auto size = static_cast<std::ptrdiff_t>(buffer.size());
                    detail::stages::keep_inclusive(buffer, size - n, size - 1);
                }));
}

// Buffer of length L, keeps [0, L - n - 1]
template <class T>
auto drop_last(const pull_sequence<T>& upstream, const std::ptrdiff_t n)
{
    return detail::make_stage_sequence(upstream,
            detail::stages::make_base_materialize_stage<struct drop_last_stage>(
                [n] <class Input> (std::vector<Input>& buffer) {
                    if (n <= 0) {
                        return;
                    }
                    const auto size = static_cast<std::ptrdiff_t>(buffer.size());
                    detail::stages::keep_inclusive(buffer, 0, size - n - 1);
                }));
}

} // inline namespace stages
} // namespace lazyseq
