#pragma once

#include "lazyseq/debug.hpp"
#include "lazyseq/helpers.hpp"
#include "lazyseq/pull_sequence.hpp"

#include <cstddef>
#include <exception>
#include <functional>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <ranges>
#include <type_traits>
#include <utility>
#include <vector>

namespace lazyseq {
namespace detail {

/*
Collections can be turned into pull sequences in 2 ways:

x            -> collection is copied (or moved) into the source, the source owns it
std::ref(x)  -> source refers to x, x must outlive every traversal
std::cref(x)    (same)

Both are re-drivable: every traversal starts from the beginning of the collection.
Elements are always produced as copies.
*/

// ContainerPtr is std::shared_ptr<const Container> or Container*
template <class ContainerPtr>
struct collection_cursor final
    : cursor_base<std::ranges::range_value_t<std::remove_reference_t<decltype(*std::declval<ContainerPtr>())>>>
{
    using container_type = std::remove_reference_t<decltype(*std::declval<ContainerPtr>())>;
    using value_type = std::ranges::range_value_t<container_type>;

    explicit collection_cursor(ContainerPtr container)
        : m_container(std::move(container))
        , m_current(std::ranges::begin(*m_container))
    { }

    std::optional<value_type> next() override
    {
        if (m_current == std::ranges::end(*m_container)) {
            return std::nullopt;
        }
        std::optional<value_type> output{*m_current};
        ++m_current;
        return output;
    }

    ContainerPtr m_container; // keeps storage alive while iterating
    std::ranges::iterator_t<container_type> m_current;
};

template <class Container>
struct collection_source final : source_base<std::ranges::range_value_t<const Container>>
{
    using value_type = std::ranges::range_value_t<const Container>;
    using container_ptr = std::shared_ptr<const Container>;

    explicit collection_source(Container container)
        : m_container(std::make_shared<const Container>(std::move(container)))
    { }

    std::unique_ptr<cursor_base<value_type>> open() const override
    {
        return std::make_unique<collection_cursor<container_ptr>>(m_container);
    }

    std::size_t debug_print(std::ostream& strm, const std::size_t depth) const override
    {
        debug_print_source<value_type>(strm, depth, "collection");
        return 0;
    }

    container_ptr m_container;
};

// Container may be const-qualified
template <class Container>
struct reference_source final : source_base<std::ranges::range_value_t<Container>>
{
    using value_type = std::ranges::range_value_t<Container>;

    explicit reference_source(Container& container) noexcept
        : m_container(&container)
    { }

    std::unique_ptr<cursor_base<value_type>> open() const override
    {
        return std::make_unique<collection_cursor<Container*>>(m_container);
    }

    std::size_t debug_print(std::ostream& strm, const std::size_t depth) const override
    {
        debug_print_source<value_type>(strm, depth, "reference");
        return 0;
    }

    Container* m_container;
};


template <class Input>
concept sequence_source =
       is_specialization_of_v<pull_sequence, std::remove_cvref_t<Input>>
    || requires (const std::remove_cvref_t<Input>& input) { input.as_pull_sequence(); }
    || (   is_specialization_of_v<std::reference_wrapper, std::remove_cvref_t<Input>>
        && std::ranges::input_range<typename std::remove_cvref_t<Input>::type>)
    || std::ranges::input_range<std::remove_cvref_t<Input>>;

} // namespace detail


// Owning pull sequence over a copy of range
template <class Range>
    requires std::ranges::input_range<std::remove_cvref_t<Range>>
auto from(Range&& range)
{
    using decayed = std::remove_cvref_t<Range>;
    if constexpr (std::is_array_v<decayed>) {
        using vector_type = std::vector<std::ranges::range_value_t<decayed>>;
        return from(vector_type(std::begin(range), std::end(range)));
    }
    else {
        using source_type = detail::collection_source<decayed>;
        using value_type = typename source_type::value_type;
        return pull_sequence<value_type>{std::make_shared<const source_type>((Range&&) range)};
    }
}

// Non-owning pull sequence over range
template <class Range>
    requires std::ranges::input_range<Range>
auto from(std::reference_wrapper<Range> range)
{
    using source_type = detail::reference_source<Range>;
    using value_type = typename source_type::value_type;
    return pull_sequence<value_type>{std::make_shared<const source_type>(range.get())};
}


namespace detail {

template <class Input>
    requires sequence_source<Input>
auto to_pull_sequence(Input&& input)
{
    using decayed = std::remove_cvref_t<Input>;
    if constexpr (is_specialization_of_v<pull_sequence, decayed>) {
        return decayed((Input&&) input);
    }
    else if constexpr (requires { input.as_pull_sequence(); }) {
        return input.as_pull_sequence();
    }
    else {
        return lazyseq::from((Input&&) input);
    }
}

template <class Input>
using pull_sequence_for_t = decltype(to_pull_sequence(std::declval<Input>()));

template <class Input>
using element_type_of_t = typename pull_sequence_for_t<Input>::value_type;


// Pulls elements until done() or exhaustion, passes (element, index) to callback.
// done() is checked before every pull, so short-circuiting consumers never pull an extra element.
template <class T, class Done, class Callback>
void drive(const pull_sequence<T>& input, Done&& done, Callback&& callback)
{
#ifdef LAZYSEQ_ENABLE_TYPE_DEBUG
    try {
#endif
        auto cursor = input.open();
        std::size_t index = 0;
        while (!done()) {
            auto elem = cursor.next();
            if (!elem.has_value()) {
                break;
            }
            callback(std::move(*elem), index++);
        }
#ifdef LAZYSEQ_ENABLE_TYPE_DEBUG
    }
    catch (const std::exception& e) {
        std::cerr << "lazyseq: traversal failed: " << e.what() << '\n';
        std::cerr << "Stages:\n";
        input.debug_print(std::cerr, 1);
        std::cerr.flush();
        throw;
    }
#endif
}

// Drives the whole input, update_op(accum, element, index) is called for every element
template <class T, class Init, class UpdateOp>
Init accumulate(const pull_sequence<T>& input, Init init, UpdateOp&& update_op)
{
    drive(input,
          [] () { return false; },
          [&init, &update_op] (T&& elem, const std::size_t index) {
              update_op(init, std::move(elem), index);
          });
    return init;
}

} // namespace detail
} // namespace lazyseq
