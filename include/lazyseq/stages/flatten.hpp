#pragma once

#include "lazyseq/chain.hpp"
#include "lazyseq/nested.hpp"
#include "lazyseq/pull_sequence.hpp"
#include "lazyseq/stage_styles.hpp"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace lazyseq {
namespace detail::stages {

// Descends into nested<T> elements depth-first, in order.
//
// Bounded: elements deeper than depth levels are produced as they are, output stays nested<T>.
//          depth 0 produces upstream unchanged.
// Unbounded: every nested sequence is descended, output is T.
//
// Nested sequences are opened only when reached and only one cursor per level is kept.
template <bool Unbounded>
struct flatten_stage
{
    static constexpr auto style = stage_styles::streaming;

    std::ptrdiff_t depth;

    template <class Input>
    struct impl
    {
        static_assert(is_specialization_of_v<nested, Input>,
                "flatten requires nested<T> elements");

        using leaf_type = typename Input::leaf_type;

        using input_type = Input;
        using output_type = std::conditional_t<Unbounded, leaf_type, Input>;
        using stage_type = flatten_stage;

        struct frame
        {
            cursor<Input> children;
            std::ptrdiff_t depth;
        };

        std::ptrdiff_t depth;
        std::vector<frame> frames;

        std::optional<output_type> next(cursor<Input>& upstream)
        {
            for (;;) {
                auto& current = frames.empty() ? upstream : frames.back().children;
                const auto current_depth = frames.empty() ? depth : frames.back().depth;

                auto elem = current.next();
                if (!elem.has_value()) {
                    if (frames.empty()) {
                        return std::nullopt;
                    }
                    frames.pop_back();
                    continue;
                }

                if constexpr (Unbounded) {
                    if (elem->is_leaf()) {
                        return std::move(*elem).leaf();
                    }
                    frames.push_back(frame{elem->children().open(), 0});
                }
                else {
                    if (current_depth == 0 || elem->is_leaf()) {
                        return elem;
                    }
                    frames.push_back(frame{elem->children().open(), current_depth - 1});
                }
            }
        }
    };

    template <class Input>
    constexpr auto make_impl() const
    {
        return impl<Input>{depth, {}};
    }
};

} // namespace detail::stages


inline namespace stages {

// Throws std::invalid_argument right away if depth is negative
template <class T>
auto flatten(const pull_sequence<nested<T>>& upstream, const std::ptrdiff_t depth)
{
    if (depth < 0) {
        throw std::invalid_argument("flatten: negative depth " + std::to_string(depth));
    }
    return detail::make_stage_sequence(upstream, detail::stages::flatten_stage<false>{depth});
}

template <class T>
auto flatten(const pull_sequence<nested<T>>& upstream)
{
    return detail::make_stage_sequence(upstream, detail::stages::flatten_stage<true>{0});
}

} // inline namespace stages
} // namespace lazyseq
