#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <ostream>
#include <utility>

namespace lazyseq {

namespace detail {

/*
Pull protocol:
    * a source is immutable and may be shared by any number of chains
    * source.open() starts a traversal and returns a cursor
    * cursor.next() produces the next element or std::nullopt once the traversal is over,
      after std::nullopt the cursor must not produce anything else

Whether two cursors of the same source are independent is up to the source:
collections start over on every open(), generators continue from a shared position.
*/

template <class T>
struct cursor_base
{
    virtual ~cursor_base() = default;

    virtual std::optional<T> next() = 0;
};

template <class T>
struct source_base
{
    virtual ~source_base() = default;

    virtual std::unique_ptr<cursor_base<T>> open() const = 0;

    // prints every stage up to this one, returns index of this one
    virtual std::size_t debug_print(std::ostream& strm, std::size_t depth) const = 0;
};

} // namespace detail


// One traversal over a pull_sequence. Move only.
template <class T>
class cursor
{
public:
    using value_type = T;

    explicit cursor(std::unique_ptr<detail::cursor_base<T>> impl) noexcept
        : m_impl(std::move(impl))
    { }

    std::optional<T> next()
    { return m_impl->next(); }

private:
    std::unique_ptr<detail::cursor_base<T>> m_impl;
};


// Cheap copyable handle to a source of T's.
// Copies refer to the same source object.
template <class T>
class pull_sequence
{
public:
    using value_type = T;
    using source_type = detail::source_base<T>;

    explicit pull_sequence(std::shared_ptr<const source_type> source) noexcept
        : m_source(std::move(source))
    { }

    [[nodiscard]]
    cursor<T> open() const
    { return cursor<T>{m_source->open()}; }

    std::size_t debug_print(std::ostream& strm, const std::size_t depth = 0) const
    { return m_source->debug_print(strm, depth); }

private:
    std::shared_ptr<const source_type> m_source;
};

} // namespace lazyseq
