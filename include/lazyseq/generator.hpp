#pragma once

#include "lazyseq/debug.hpp"
#include "lazyseq/pull_sequence.hpp"

#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <ostream>
#include <type_traits>
#include <utility>

namespace lazyseq {
namespace detail {

// Generator function is called as f(output): it passes produced values to output(x)
// and returns false when there is nothing left.
// It may produce any number of values per call, including none.
template <class T, class F>
struct generator_state
{
    explicit generator_state(F f)
        : f(std::move(f))
    { }

    std::optional<T> pull()
    {
        while (pending.empty() && !exhausted) {
            const bool should_continue =
                f([this] (T x) {
                    pending.push_back(std::move(x));
                });
            if (!should_continue) {
                exhausted = true;
            }
        }
        if (pending.empty()) {
            return std::nullopt;
        }
        std::optional<T> output{std::move(pending.front())};
        pending.pop_front();
        return output;
    }

    F f;
    std::deque<T> pending;
    bool exhausted = false;
};

// StatePtr is std::unique_ptr for a private state or std::shared_ptr for a shared one
template <class T, class StatePtr>
struct generator_cursor final : cursor_base<T>
{
    explicit generator_cursor(StatePtr state)
        : m_state(std::move(state))
    { }

    std::optional<T> next() override
    { return m_state->pull(); }

    StatePtr m_state;
};

// Single use: all cursors pull from the same state
template <class T, class F>
struct generator_source final : source_base<T>
{
    using state_type = generator_state<T, F>;

    explicit generator_source(F f)
        : m_state(std::make_shared<state_type>(std::move(f)))
    { }

    std::unique_ptr<cursor_base<T>> open() const override
    {
        return std::make_unique<generator_cursor<T, std::shared_ptr<state_type>>>(m_state);
    }

    std::size_t debug_print(std::ostream& strm, const std::size_t depth) const override
    {
        debug_print_source<T>(strm, depth, "generator");
        return 0;
    }

    std::shared_ptr<state_type> m_state;
};

// Re-drivable: every cursor gets a fresh generator function from the factory
template <class T, class Factory>
struct factory_source final : source_base<T>
{
    using function_type = std::decay_t<std::invoke_result_t<const Factory&>>;
    using state_type = generator_state<T, function_type>;

    explicit factory_source(Factory factory)
        : m_factory(std::move(factory))
    { }

    std::unique_ptr<cursor_base<T>> open() const override
    {
        return std::make_unique<generator_cursor<T, std::unique_ptr<state_type>>>(
                std::make_unique<state_type>(m_factory()));
    }

    std::size_t debug_print(std::ostream& strm, const std::size_t depth) const override
    {
        debug_print_source<T>(strm, depth, "factory");
        return 0;
    }

    Factory m_factory;
};

} // namespace detail


// Wraps a live generator function. Its position is shared by every traversal:
// driving it twice continues where the previous traversal stopped.
template <class T, class F>
pull_sequence<T> generator(F&& f)
{
    using source_type = detail::generator_source<T, std::decay_t<F>>;
    return pull_sequence<T>{std::make_shared<const source_type>((F&&) f)};
}

// factory() is called on every traversal and should return a new generator function
template <class T, class Factory>
pull_sequence<T> make_pull_sequence(Factory&& factory)
{
    using source_type = detail::factory_source<T, std::decay_t<Factory>>;
    return pull_sequence<T>{std::make_shared<const source_type>((Factory&&) factory)};
}

// begin, begin + 1, ... endlessly
template <class T>
pull_sequence<T> iota(T begin)
{
    return make_pull_sequence<T>([begin] {
        return [begin] (auto output) mutable {
            std::move(output)(begin);
            ++begin;
            return true;
        };
    });
}

// [begin, end)
template <class T, class E>
pull_sequence<T> iota(T begin, E end)
{
    return make_pull_sequence<T>([begin, end] {
        return [begin, end] (auto output) mutable {
            if (begin != end) {
                std::move(output)(begin);
                ++begin;
                return true;
            }
            return false;
        };
    });
}

} // namespace lazyseq
