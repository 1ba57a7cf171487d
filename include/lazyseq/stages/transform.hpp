#pragma once

#include "lazyseq/chain.hpp"
#include "lazyseq/indexed.hpp"
#include "lazyseq/pull_sequence.hpp"
#include "lazyseq/stage_styles.hpp"

#include <cstddef>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace lazyseq {
namespace detail::stages {

// Shared implementation of one-to-one stages (map, entries, indexes, replace).
// Transform is called with (element, index) or (element), element is passed as rvalue.
// DisplayStage is the name shown by debug_print().
template <class DisplayStage, class Transform>
struct base_transform_stage
{
    static constexpr auto style = stage_styles::streaming;

    [[no_unique_address]]
    Transform transform;

    template <class Input>
    struct impl
    {
        using input_type = Input;
        using output_type = std::remove_cvref_t<indexed_invoke_result_t<Transform&, Input&&>>;
        using stage_type = base_transform_stage;
        using display_stage_type = DisplayStage; // for output in debug

        [[no_unique_address]]
        Transform transform;
        std::size_t index = 0;

        std::optional<output_type> next(cursor<Input>& upstream)
        {
            auto input = upstream.next();
            if (!input.has_value()) {
                return std::nullopt;
            }
            return indexed_invoke(transform, index++, std::move(*input));
        }
    };

    template <class Input>
    constexpr auto make_impl() const
    {
        static_assert(is_indexed_invocable_v<Transform&, Input&&>,
                "transform operation cannot be called with (element, index) or (element). Different type? Different reference category?");
        static_assert(!std::is_void_v<indexed_invoke_result_t<Transform&, Input&&>>,
                "transform operation must return a value, use for_each for side effects");
        return impl<Input>{transform, 0};
    }
};

template <class DisplayStage, class Transform>
constexpr auto make_base_transform_stage(Transform&& transform)
{
    return base_transform_stage<DisplayStage, std::decay_t<Transform>>{ (Transform&&) transform };
}

// Display names only
template <class Transform>
struct map_stage {};

template <class T, class Replacement>
struct replace_stage {};

} // namespace detail::stages


inline namespace stages {

// f is called as f(x, i) or f(x).
// Every traversal works on its own copy of f, so state of a mutable f starts over each time.
template <class T, class F>
auto map(const pull_sequence<T>& upstream, F&& f)
{
    using display_stage = detail::stages::map_stage<std::decay_t<F>>; // for displaying stage name during debug print
    return detail::make_stage_sequence(upstream,
            detail::stages::make_base_transform_stage<display_stage>((F&&) f));
}

// x -> (x, i)
template <class T>
auto entries(const pull_sequence<T>& upstream)
{
    return detail::make_stage_sequence(upstream,
            detail::stages::make_base_transform_stage<struct entries_stage>([] (T&& x, const std::size_t i) {
                return std::pair<T, std::size_t>{std::move(x), i};
            }));
}

// x -> i
template <class T>
auto indexes(const pull_sequence<T>& upstream)
{
    return detail::make_stage_sequence(upstream,
            detail::stages::make_base_transform_stage<struct indexes_stage>([] (T&&, const std::size_t i) {
                return i;
            }));
}

// Element type stays T if replacement converts to T (0 for long, "x" for std::string),
// otherwise elements become std::variant<T, Replacement>
template <class T, class U>
inline constexpr bool replace_keeps_type_v = std::is_convertible_v<U&&, T>;

// x -> b if x == a, otherwise x
template <class T, class U>
auto replace(const pull_sequence<T>& upstream, T a, U&& b)
{
    using replacement_type = std::decay_t<U>;
    using display_stage = detail::stages::replace_stage<T, replacement_type>;

    if constexpr (replace_keeps_type_v<T, U>) {
        return detail::make_stage_sequence(upstream,
                detail::stages::make_base_transform_stage<display_stage>(
                    [a = std::move(a), b = T((U&&) b)] (T&& x) -> T {
                        if (x == a) {
                            return b;
                        }
                        return std::move(x);
                    }));
    }
    else {
        using output_type = std::variant<T, replacement_type>;
        return detail::make_stage_sequence(upstream,
                detail::stages::make_base_transform_stage<display_stage>(
                    [a = std::move(a), b = replacement_type((U&&) b)] (T&& x) -> output_type {
                        if (x == a) {
                            return output_type{std::in_place_index<1>, b};
                        }
                        return output_type{std::in_place_index<0>, std::move(x)};
                    }));
    }
}

} // inline namespace stages
} // namespace lazyseq
