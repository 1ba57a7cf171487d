#pragma once

#include "lazyseq/iterate.hpp"
#include "lazyseq/pull_sequence.hpp"

#include <initializer_list>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace lazyseq {

// Element of a nested structure: either a leaf T or a nested sequence of elements.
// Only the nested alternative is descended by flatten(), leaves are atomic
// whatever T is (std::string leaves are never split into characters).
template <class T>
class nested
{
public:
    using leaf_type = T;
    using children_type = pull_sequence<nested>;

    template <class U>
        requires (   !std::is_same_v<std::remove_cvref_t<U>, nested>
                  && !std::is_same_v<std::remove_cvref_t<U>, children_type>
                  && std::is_constructible_v<T, U&&>)
    nested(U&& leaf)
        : m_value(std::in_place_index<0>, (U&&) leaf)
    { }

    nested(children_type children)
        : m_value(std::in_place_index<1>, std::move(children))
    { }

    bool is_leaf() const noexcept
    { return m_value.index() == 0; }

    const T& leaf() const &
    { return std::get<0>(m_value); }
    T&& leaf() &&
    { return std::get<0>(std::move(m_value)); }

    const children_type& children() const
    { return std::get<1>(m_value); }

private:
    std::variant<T, children_type> m_value;
};

// nest<std::string>({"a", nest<std::string>({"b", "c"})})
template <class T>
nested<T> nest(std::initializer_list<nested<T>> children)
{
    return nested<T>{from(std::vector<nested<T>>(children))};
}

// Nested element over any pull-sequence source (generator, collection of nested<T>, ...)
template <class T, class Source>
    requires std::is_same_v<detail::element_type_of_t<Source>, nested<T>>
nested<T> nest(Source&& children)
{
    return nested<T>{detail::to_pull_sequence((Source&&) children)};
}

} // namespace lazyseq
