#pragma once

#include <concepts>
#include <ostream>
#include <string_view>
#include <type_traits>

namespace lazyseq::detail {

namespace stage_styles {

// How a stage reads its upstream:
// streaming - one element at a time, only as many as it needs for the next output element
// buffering - the whole upstream on its first pull, then produces from the buffer
enum class upstream_access { streaming, buffering };

constexpr std::string_view to_string_view(const upstream_access access) noexcept
{
    switch (access) {
    case upstream_access::streaming: return "streaming";
    case upstream_access::buffering: return "buffering";
    }
    return "";
}

struct stage_style
{
    upstream_access access;

    friend std::ostream& operator << (std::ostream& strm, const stage_style style)
    { return strm << to_string_view(style.access); }
};

inline constexpr auto streaming = stage_style{upstream_access::streaming};
inline constexpr auto buffering = stage_style{upstream_access::buffering};

} // namespace stage_styles

// Stage parameters: style plus template make_impl<Input>(), see chain.hpp
template <class T>
concept Stage = requires
{
    { std::remove_cvref_t<T>::style } -> std::convertible_to<stage_styles::stage_style>;
};

// Eager stages read their whole upstream before producing the first element,
// so they never finish on an infinite source.
template <class StageType>
constexpr bool is_eager()
{ return std::remove_cvref_t<StageType>::style.access == stage_styles::upstream_access::buffering; }

} // namespace lazyseq::detail
