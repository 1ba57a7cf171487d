#pragma once

#include "lazyseq/helpers.hpp"
#include "lazyseq/indexed.hpp"
#include "lazyseq/iterate.hpp"
#include "lazyseq/nested.hpp"
#include "lazyseq/pull_sequence.hpp"
#include "lazyseq/stages.hpp"
#include "lazyseq/stages/flatten.hpp"
#include "lazyseq/stages/materialize.hpp"
#include "lazyseq/stages/transform.hpp"
#include "lazyseq/text.hpp"

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace lazyseq {

/*
Immutable wrapper over a pull_sequence<T>.

Every transformation returns a new sequence chained to this one, this one is never changed
and may still be used. Nothing is evaluated until a terminal operation (collect(), count(), join(), ...)
is called; the terminal operation pulls elements one by one through the whole chain.

Copies of a sequence share its source. For a re-drivable source (a collection) every terminal
operation starts over, for a generator every terminal operation continues where the previous one stopped.

Exceptions thrown by callbacks are not caught, they leave the terminal operation which is driving the chain.
*/
template <class T>
class sequence
{
public:
    using value_type = T;

    explicit sequence(pull_sequence<T> source) noexcept
        : m_source(std::move(source))
    { }

    sequence(std::initializer_list<T> values)
        : m_source(from(std::vector<T>(values)))
    { }

    // collection (copied), std::ref(collection) (referenced), generator, another sequence
    template <class Source>
        requires (   !std::is_same_v<std::remove_cvref_t<Source>, sequence>
                  && !std::is_same_v<std::remove_cvref_t<Source>, pull_sequence<T>>
                  && detail::sequence_source<Source>)
    explicit sequence(Source&& source)
        : m_source(detail::to_pull_sequence((Source&&) source))
    {
        static_assert(std::is_same_v<detail::element_type_of_t<Source>, T>,
                "source element type differs from sequence element type");
    }

    const pull_sequence<T>& as_pull_sequence() const noexcept
    { return m_source; }

    // f(pull_sequence<T>) should return pull_sequence<U>, sequence<U>, or a collection of U.
    // Result is wrapped as is, pipe() itself doesn't pull anything.
    template <class F>
    auto pipe(F&& f) const
    {
        static_assert(std::is_invocable_v<F&&, const pull_sequence<T>&>,
                "pipe function must accept pull_sequence<T>");
        using result_type = std::invoke_result_t<F&&, const pull_sequence<T>&>;
        static_assert(detail::sequence_source<result_type>,
                "pipe function must return pull_sequence, sequence or a collection");
        using output_type = detail::element_type_of_t<result_type>;

        return sequence<output_type>{detail::to_pull_sequence(std::invoke((F&&) f, m_source))};
    }

    // Transformations

    template <class F>
    auto map(F&& f) const
    {
        return pipe([&f] (const pull_sequence<T>& upstream) {
            return lazyseq::map(upstream, (F&&) f);
        });
    }

    template <class Pred>
    sequence filter(Pred&& pred) const
    {
        return pipe([&pred] (const pull_sequence<T>& upstream) {
            return lazyseq::filter(upstream, (Pred&&) pred);
        });
    }

    template <class F>
    sequence for_each(F&& f) const
    {
        return pipe([&f] (const pull_sequence<T>& upstream) {
            return lazyseq::for_each(upstream, (F&&) f);
        });
    }

    template <class... Sources>
    sequence concat(Sources&&... sources) const
    {
        static_assert((std::is_same_v<detail::element_type_of_t<Sources>, T> && ...),
                "concat requires sources of the same element type");
        return pipe([&sources...] (const pull_sequence<T>& upstream) {
            return lazyseq::concat(upstream, (Sources&&) sources...);
        });
    }

    template <class... Values>
    sequence push(Values&&... values) const
    {
        return pipe([&values...] (const pull_sequence<T>& upstream) {
            return lazyseq::push(upstream, std::vector<T>{T((Values&&) values)...});
        });
    }

    template <class... Values>
    sequence unshift(Values&&... values) const
    {
        return pipe([&values...] (const pull_sequence<T>& upstream) {
            return lazyseq::unshift(upstream, std::vector<T>{T((Values&&) values)...});
        });
    }

    // Expensive: reads everything before producing the first element
    sequence reverse() const
    {
        return pipe([] (const pull_sequence<T>& upstream) {
            return lazyseq::reverse(upstream);
        });
    }

    // Everything but the last element, see last() for getting it
    sequence pop() const
    {
        return pipe([] (const pull_sequence<T>& upstream) {
            return lazyseq::pop(upstream);
        });
    }

    // Everything but the first element, see first() for getting it
    sequence shift() const
    {
        return pipe([] (const pull_sequence<T>& upstream) {
            return lazyseq::shift(upstream);
        });
    }

    // Elements at positions [start, end], end is inclusive
    sequence slice(const std::ptrdiff_t start, const std::ptrdiff_t end) const
    {
        return pipe([start, end] (const pull_sequence<T>& upstream) {
            return lazyseq::slice(upstream, start, end);
        });
    }

    sequence take(const std::ptrdiff_t n) const
    {
        return pipe([n] (const pull_sequence<T>& upstream) {
            return lazyseq::take(upstream, n);
        });
    }

    // NB: removes n - 1 elements (drop(3) removes 2), use drop_exactly() to remove n
    sequence drop(const std::ptrdiff_t n) const
    {
        return pipe([n] (const pull_sequence<T>& upstream) {
            return lazyseq::drop(upstream, n);
        });
    }

    sequence drop_exactly(const std::ptrdiff_t n) const
    {
        return pipe([n] (const pull_sequence<T>& upstream) {
            return lazyseq::drop_exactly(upstream, n);
        });
    }

    // Expensive
    sequence take_last(const std::ptrdiff_t n) const
    {
        return pipe([n] (const pull_sequence<T>& upstream) {
            return lazyseq::take_last(upstream, n);
        });
    }

    // Expensive
    sequence drop_last(const std::ptrdiff_t n) const
    {
        return pipe([n] (const pull_sequence<T>& upstream) {
            return lazyseq::drop_last(upstream, n);
        });
    }

    // Descends at most depth levels into nested elements, throws std::invalid_argument if depth < 0
    sequence flatten(const std::ptrdiff_t depth) const
        requires detail::is_specialization_of_v<nested, T>
    {
        return pipe([depth] (const pull_sequence<T>& upstream) {
            return lazyseq::flatten(upstream, depth);
        });
    }

    // Descends into every nested element, produces leaves only
    auto flatten() const
        requires detail::is_specialization_of_v<nested, T>
    {
        return pipe([] (const pull_sequence<T>& upstream) {
            return lazyseq::flatten(upstream);
        });
    }

    auto entries() const
    {
        return pipe([] (const pull_sequence<T>& upstream) {
            return lazyseq::entries(upstream);
        });
    }

    auto indexes() const
    {
        return pipe([] (const pull_sequence<T>& upstream) {
            return lazyseq::indexes(upstream);
        });
    }

    template <class U>
    auto replace(T a, U&& b) const
    {
        return pipe([&a, &b] (const pull_sequence<T>& upstream) {
            return lazyseq::replace(upstream, std::move(a), (U&&) b);
        });
    }

    // Expensive, stable
    template <class Compare = std::less<>>
    sequence sort(Compare&& compare = {}) const
    {
        return pipe([&compare] (const pull_sequence<T>& upstream) {
            return lazyseq::sort(upstream, (Compare&&) compare);
        });
    }

    // Terminal operations

    std::vector<T> collect() const
    {
        return to<std::vector>();
    }

    template <template <class...> class Cont>
    auto to() const
    {
        using container_type = Cont<T>;
        static_assert(std::is_same_v<typename container_type::value_type, T>,
                "Can't collect elements into the container");

        return detail::accumulate(m_source, container_type{}, [] (container_type& out, T&& x, std::size_t) {
            out.insert(out.end(), std::move(x));
        });
    }

    // Only for side effects of for_each() and pipe()
    void consume() const
    {
        detail::drive(m_source, [] () { return false; }, [] (T&&, std::size_t) {});
    }

    std::size_t count() const
    {
        return detail::accumulate(m_source, std::size_t{0}, [] (std::size_t& count, T&&, std::size_t) {
            ++count;
        });
    }

    // Pulls exactly one element
    std::optional<T> first() const
    {
        std::optional<T> result;
        detail::drive(m_source,
                      [&result] () { return result.has_value(); },
                      [&result] (T&& x, std::size_t) { result.emplace(std::move(x)); });
        return result;
    }

    std::optional<T> last() const
    {
        return detail::accumulate(m_source, std::optional<T>{}, [] (std::optional<T>& result, T&& x, std::size_t) {
            result = std::move(x);
        });
    }

    // Stops pulling at the first element satisfying pred(x, i)
    template <class Pred>
    std::optional<T> find(Pred&& pred) const
    {
        static_assert(detail::is_indexed_invocable_v<Pred&, const T&>,
                "find predicate cannot be called with (element, index) or (element)");

        std::optional<T> found;
        detail::drive(m_source,
                      [&found] () { return found.has_value(); },
                      [&found, &pred] (T&& x, const std::size_t index) {
                          if (detail::indexed_invoke(pred, index, std::as_const(x))) {
                              found.emplace(std::move(x));
                          }
                      });
        return found;
    }

    template <class Pred>
    bool some(Pred&& pred) const
    {
        return find((Pred&&) pred).has_value();
    }

    template <class Pred>
    bool every(Pred&& pred) const
    {
        return !some([&pred] (const T& x, const std::size_t index) {
            return !detail::indexed_invoke(pred, index, x);
        });
    }

    template <class U>
    bool includes(const U& y) const
    {
        return some([&y] (const T& x) { return x == y; });
    }

    // result = f(result, x, i) for every element, left to right
    template <class Init, class F>
    auto reduce(Init init, F&& f) const
    {
        static_assert(detail::is_indexed_invocable_v<F&, Init&&, T&&>,
                "reduce function cannot be called with (accumulator, element, index) or (accumulator, element)");

        return detail::accumulate(m_source, std::move(init), [&f] (Init& result, T&& x, const std::size_t index) {
            result = detail::indexed_invoke(f, index, std::move(result), std::move(x));
        });
    }

    // Concatenates textual representations (see to_text()) with separator between them.
    // Elements without representation or with an empty one are skipped along with their separator.
    std::string join(const std::string_view separator) const
    {
        return detail::accumulate(m_source, std::string{}, [separator] (std::string& result, T&& x, std::size_t) {
            const auto text = to_text(std::as_const(x));
            if (!text.has_value() || text->empty()) {
                return;
            }
            if (!result.empty()) {
                result += separator;
            }
            result += *text;
        });
    }

private:
    pull_sequence<T> m_source;
};

template <class Source>
sequence(Source&&) -> sequence<detail::element_type_of_t<Source>>;


template <class T>
void debug_print(std::ostream& strm, const sequence<T>& seq)
{
    strm << "Stages:\n";
    seq.as_pull_sequence().debug_print(strm);
    strm.flush();
}

} // namespace lazyseq
