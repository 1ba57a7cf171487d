#pragma once

#include "lazyseq/debug.hpp"
#include "lazyseq/pull_sequence.hpp"
#include "lazyseq/stage_styles.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <ostream>
#include <type_traits>
#include <utility>

namespace lazyseq::detail {

/*
Every stage is a pair of:
    * stage: the parameters (callable, counts, extra sources), immutable, shared by all traversals
    * stage::impl<Input>: state of one traversal, made by stage.make_impl<Input>()

make_impl() is called on every open(), so it always copies the stage data.

impl provides:
    using input_type, output_type, stage_type
    std::optional<output_type> next(cursor<Input>& upstream)

impl::next() pulls from upstream as many elements as it needs to produce one element (or to learn
there are none left) and returns. It is never called again after it returned std::nullopt.
*/

template <class Stage, class Input>
using stage_impl_t = decltype(std::declval<const Stage&>().template make_impl<Input>());


// Owns one traversal of the upstream and the impl driving it
template <class Input, class StageImpl>
struct stage_cursor final : cursor_base<typename StageImpl::output_type>
{
    using output_type = typename StageImpl::output_type;

    stage_cursor(cursor<Input> upstream, StageImpl stage_impl)
        : m_upstream(std::move(upstream))
        , m_stage_impl(std::move(stage_impl))
    { }

    std::optional<output_type> next() override
    {
        if (m_exhausted) {
            return std::nullopt;
        }
        auto output = m_stage_impl.next(m_upstream);
        m_exhausted = !output.has_value();
        return output;
    }

    cursor<Input> m_upstream;
    StageImpl m_stage_impl;
    bool m_exhausted = false;
};


template <class Input, class Stage>
struct stage_source final : source_base<typename stage_impl_t<Stage, Input>::output_type>
{
    using impl_type = stage_impl_t<Stage, Input>;
    using output_type = typename impl_type::output_type;

    static_assert(std::is_same_v<typename impl_type::input_type, Input>,
            "Stage impl must accept the element type of its upstream");
    static_assert(!std::is_reference_v<output_type> && !std::is_void_v<output_type>,
            "Stage must produce values");

    stage_source(pull_sequence<Input> upstream, Stage stage)
        : m_upstream(std::move(upstream))
        , m_stage(std::move(stage))
    { }

    std::unique_ptr<cursor_base<output_type>> open() const override
    {
        return std::make_unique<stage_cursor<Input, impl_type>>(
                m_upstream.open(),
                m_stage.template make_impl<Input>());
    }

    std::size_t debug_print(std::ostream& strm, const std::size_t depth) const override
    {
        const auto index = m_upstream.debug_print(strm, depth) + 1;

        // Generic debug info
        debug_print_stage_default<impl_type>(strm, depth, index);

        // Custom stage-specific debug info
        custom_debug_printer<Stage>::print(strm, depth, m_stage);
        return index;
    }

    pull_sequence<Input> m_upstream;
    Stage m_stage;
};


// Chains stage to upstream. Nothing is evaluated here.
template <class Input, Stage StageType>
auto make_stage_sequence(const pull_sequence<Input>& upstream, StageType&& stage)
{
    using stage_type = std::remove_cvref_t<StageType>;
    using source_type = stage_source<Input, stage_type>;
    using output_type = typename source_type::output_type;

    return pull_sequence<output_type>{
        std::make_shared<const source_type>(upstream, (StageType&&) stage)};
}

} // namespace lazyseq::detail
