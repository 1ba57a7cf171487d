#pragma once

#include <cstddef>
#include <functional>
#include <type_traits>
#include <utility>

namespace lazyseq {
namespace detail {

// Every user callback may take the position of the element as its last argument.
// The position is the 0-based number of the element in the stream the callback observes.
//
// indexed_invoke(f, i, x) calls f(x, i) if possible, otherwise f(x)
// indexed_invoke(f, i, acc, x) calls f(acc, x, i) if possible, otherwise f(acc, x)
//
// Elements are passed with the value category given by the caller:
// map passes rvalues (element is consumed), predicates get const lvalues.

template <class F, class... Args>
inline constexpr bool is_indexed_invocable_v =
       std::is_invocable_v<F, Args..., std::size_t>
    || std::is_invocable_v<F, Args...>;

template <class F, class... Args>
constexpr decltype(auto) indexed_invoke(F&& f, const std::size_t index, Args&&... args)
{
    if constexpr (std::is_invocable_v<F&&, Args&&..., std::size_t>) {
        return std::invoke((F&&) f, (Args&&) args..., index);
    }
    else {
        return std::invoke((F&&) f, (Args&&) args...);
    }
}

template <class F, class... Args>
using indexed_invoke_result_t = decltype(indexed_invoke(std::declval<F>(), std::size_t{}, std::declval<Args>()...));

} // namespace detail
} // namespace lazyseq
