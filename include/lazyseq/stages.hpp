#pragma once

#include "lazyseq/chain.hpp"
#include "lazyseq/debug.hpp"
#include "lazyseq/indexed.hpp"
#include "lazyseq/iterate.hpp"
#include "lazyseq/pull_sequence.hpp"
#include "lazyseq/stage_styles.hpp"

#include <cstddef>
#include <optional>
#include <ostream>
#include <type_traits>
#include <utility>
#include <vector>

namespace lazyseq {
namespace detail::stages {

/*
Incremental stages: each impl pulls from upstream only what it needs for one output element.

Callbacks are invoked with (element, index) or (element), see indexed.hpp.
Index is the position of the element in the upstream, counting every element pulled so far.
*/

template <class Pred>
struct filter_stage
{
    static constexpr auto style = stage_styles::streaming;

    [[no_unique_address]]
    Pred pred;

    template <class Input>
    struct impl
    {
        using input_type = Input;
        using output_type = Input;
        using stage_type = filter_stage;

        [[no_unique_address]]
        Pred pred;
        std::size_t index = 0;

        std::optional<Input> next(cursor<Input>& upstream)
        {
            while (auto input = upstream.next()) {
                if (indexed_invoke(pred, index++, std::as_const(*input))) {
                    return input;
                }
            }
            return std::nullopt;
        }
    };

    template <class Input>
    constexpr auto make_impl() const
    {
        static_assert(is_indexed_invocable_v<Pred&, const Input&>,
                "filter predicate cannot be called with (element, index) or (element)");
        return impl<Input>{pred, 0};
    }
};


// Calls f right before the element is passed downstream, i.e. only for elements actually pulled
template <class F>
struct for_each_stage
{
    static constexpr auto style = stage_styles::streaming;

    [[no_unique_address]]
    F f;

    template <class Input>
    struct impl
    {
        using input_type = Input;
        using output_type = Input;
        using stage_type = for_each_stage;

        [[no_unique_address]]
        F f;
        std::size_t index = 0;

        std::optional<Input> next(cursor<Input>& upstream)
        {
            auto input = upstream.next();
            if (input.has_value()) {
                indexed_invoke(f, index++, std::as_const(*input));
            }
            return input;
        }
    };

    template <class Input>
    constexpr auto make_impl() const
    {
        static_assert(is_indexed_invocable_v<F&, const Input&>,
                "for_each function cannot be called with (element, index) or (element)");
        return impl<Input>{f, 0};
    }
};


// Upstream first, then every source of rest in order.
// Sources of rest are opened only when the previous one is exhausted.
template <class T>
struct concat_stage
{
    static constexpr auto style = stage_styles::streaming;

    std::vector<pull_sequence<T>> rest;

    template <class Input>
    struct impl
    {
        using input_type = Input;
        using output_type = Input;
        using stage_type = concat_stage;

        std::vector<pull_sequence<T>> rest;
        std::size_t current = 0; // 0 is upstream, i is rest[i - 1]
        std::optional<cursor<Input>> active;

        std::optional<Input> next(cursor<Input>& upstream)
        {
            if (current == 0) {
                if (auto input = upstream.next()) {
                    return input;
                }
                ++current;
            }
            while (current <= rest.size()) {
                if (!active.has_value()) {
                    active.emplace(rest[current - 1].open());
                }
                if (auto input = active->next()) {
                    return input;
                }
                active.reset();
                ++current;
            }
            return std::nullopt;
        }
    };

    template <class Input>
    constexpr auto make_impl() const
    {
        static_assert(std::is_same_v<Input, T>, "concat requires sources of the same element type");
        return impl<Input>{rest, 0, std::nullopt};
    }
};


// Holds one element back: it's passed downstream only once it's known not to be the last one
struct pop_stage
{
    static constexpr auto style = stage_styles::streaming;

    template <class Input>
    struct impl
    {
        using input_type = Input;
        using output_type = Input;
        using stage_type = pop_stage;

        std::optional<Input> pending;

        std::optional<Input> next(cursor<Input>& upstream)
        {
            if (!pending.has_value()) {
                pending = upstream.next();
                if (!pending.has_value()) {
                    return std::nullopt;
                }
            }
            auto successor = upstream.next();
            if (!successor.has_value()) {
                return std::nullopt; // pending is the last one
            }
            return std::exchange(*pending, std::move(*successor));
        }
    };

    template <class Input>
    constexpr auto make_impl() const
    {
        return impl<Input>{};
    }
};


// Withholds elements at positions [0, skip_count)
struct skip_stage
{
    static constexpr auto style = stage_styles::streaming;

    std::ptrdiff_t skip_count;

    template <class Input>
    struct impl
    {
        using input_type = Input;
        using output_type = Input;
        using stage_type = skip_stage;

        std::ptrdiff_t skip_count;
        std::ptrdiff_t position = 0;

        std::optional<Input> next(cursor<Input>& upstream)
        {
            while (auto input = upstream.next()) {
                if (position++ >= skip_count) {
                    return input;
                }
            }
            return std::nullopt;
        }
    };

    template <class Input>
    constexpr auto make_impl() const
    {
        return impl<Input>{skip_count, 0};
    }
};


// Elements at positions [start, end], both inclusive.
// Nothing is pulled once the position is past end.
struct slice_stage
{
    static constexpr auto style = stage_styles::streaming;

    std::ptrdiff_t start;
    std::ptrdiff_t end;

    template <class Input>
    struct impl
    {
        using input_type = Input;
        using output_type = Input;
        using stage_type = slice_stage;

        std::ptrdiff_t start;
        std::ptrdiff_t end;
        std::ptrdiff_t position = 0;

        std::optional<Input> next(cursor<Input>& upstream)
        {
            while (position <= end) {
                auto input = upstream.next();
                if (!input.has_value()) {
                    return std::nullopt;
                }
                if (position++ >= start) {
                    return input;
                }
            }
            return std::nullopt;
        }
    };

    template <class Input>
    constexpr auto make_impl() const
    {
        return impl<Input>{start, end, 0};
    }
};


struct take_stage
{
    static constexpr auto style = stage_styles::streaming;

    std::ptrdiff_t n;

    template <class Input>
    struct impl
    {
        using input_type = Input;
        using output_type = Input;
        using stage_type = take_stage;

        std::ptrdiff_t n;

        std::optional<Input> next(cursor<Input>& upstream)
        {
            if (n <= 0) {
                return std::nullopt;
            }
            --n;
            return upstream.next();
        }
    };

    template <class Input>
    constexpr auto make_impl() const
    {
        return impl<Input>{n};
    }
};

} // namespace detail::stages


namespace detail {

// Prints the chains of the sources appended by concat
template <class T>
struct custom_debug_printer<stages::concat_stage<T>>
{
    static void print(std::ostream& strm, const std::size_t depth, const stages::concat_stage<T>& stage)
    {
        strm << indent(depth) << "  Appended sources (" << stage.rest.size() << "):\n";
        for (std::size_t i = 0; i < stage.rest.size(); ++i) {
            strm << indent(depth) << "    [" << i << "]:\n";
            stage.rest[i].debug_print(strm, depth + 3);
        }
    }
};

} // namespace detail


inline namespace stages {

// Combinators: each one chains a new stage to upstream and returns the resulting pull sequence.
// No element is pulled here.

template <class T, class Pred>
auto filter(const pull_sequence<T>& upstream, Pred&& pred)
{
    return detail::make_stage_sequence(upstream, detail::stages::filter_stage<std::decay_t<Pred>>{(Pred&&) pred});
}

template <class T, class F>
auto for_each(const pull_sequence<T>& upstream, F&& f)
{
    return detail::make_stage_sequence(upstream, detail::stages::for_each_stage<std::decay_t<F>>{(F&&) f});
}

template <class T, class... Sources>
    requires (std::is_same_v<detail::element_type_of_t<Sources>, T> && ...)
auto concat(const pull_sequence<T>& upstream, Sources&&... sources)
{
    return detail::make_stage_sequence(upstream, detail::stages::concat_stage<T>{
            {detail::to_pull_sequence((Sources&&) sources)...}});
}

template <class T>
auto push(const pull_sequence<T>& upstream, std::vector<T> values)
{
    return concat(upstream, from(std::move(values)));
}

template <class T>
auto unshift(const pull_sequence<T>& upstream, std::vector<T> values)
{
    return concat(from(std::move(values)), upstream);
}

template <class T>
auto pop(const pull_sequence<T>& upstream)
{
    return detail::make_stage_sequence(upstream, detail::stages::pop_stage{});
}

template <class T>
auto shift(const pull_sequence<T>& upstream)
{
    return detail::make_stage_sequence(upstream, detail::stages::skip_stage{1});
}

template <class T>
auto slice(const pull_sequence<T>& upstream, const std::ptrdiff_t start, const std::ptrdiff_t end)
{
    return detail::make_stage_sequence(upstream, detail::stages::slice_stage{start, end});
}

template <class T>
auto take(const pull_sequence<T>& upstream, const std::ptrdiff_t n)
{
    return detail::make_stage_sequence(upstream, detail::stages::take_stage{n});
}

// Withholds only the first n - 1 elements: drop(1) keeps everything, drop(3) removes 2 elements.
// Kept for compatibility with existing users, see drop_exactly()
template <class T>
auto drop(const pull_sequence<T>& upstream, const std::ptrdiff_t n)
{
    return detail::make_stage_sequence(upstream, detail::stages::skip_stage{n > 0 ? n - 1 : 0});
}

template <class T>
auto drop_exactly(const pull_sequence<T>& upstream, const std::ptrdiff_t n)
{
    return detail::make_stage_sequence(upstream, detail::stages::skip_stage{n});
}

} // inline namespace stages
} // namespace lazyseq
