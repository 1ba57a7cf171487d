#pragma once

#include "lazyseq/stage_styles.hpp"

#include <cstddef>
#include <iomanip>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace lazyseq::detail {

// Name of T as the compiler spells it in the signature of this function
template <class T>
constexpr std::string_view raw_type_name()
{
#if defined(__clang__) || defined(__GNUC__)
    const std::string_view signature = __PRETTY_FUNCTION__;
#  if defined(__clang__)
    constexpr std::string_view prefix = "[T = ";
    constexpr char terminator = ']';
#  else
    constexpr std::string_view prefix = "[with T = ";
    constexpr char terminator = ';';
#  endif
    const auto first = signature.find(prefix) + prefix.size();
    return signature.substr(first, signature.find(terminator, first) - first);
#elif defined(_MSC_VER)
    const std::string_view signature = __FUNCSIG__;
    constexpr std::string_view prefix = "raw_type_name<";
    const auto first = signature.find(prefix) + prefix.size();
    return signature.substr(first, signature.rfind(">(void)") - first);
#else
    return "<unknown type>";
#endif
}

// Spellings shortened in the chain printout, longest first
inline constexpr std::pair<std::string_view, std::string_view> type_name_abbreviations[] = {
    {"std::__cxx11::basic_string<char, std::char_traits<char>, std::allocator<char> >", "std::string"},
    {"std::__cxx11::basic_string<char>", "std::string"},
    {"std::basic_string<char>", "std::string"},
    {"lazyseq::detail::stages::", ""},
    {"lazyseq::detail::", ""},
    {"lazyseq::", ""},
};

template <class T>
std::string type_name()
{
    std::string name{raw_type_name<T>()};
    for (const auto& [spelling, abbreviation] : type_name_abbreviations) {
        for (auto pos = name.find(spelling); pos != std::string::npos; pos = name.find(spelling, pos + abbreviation.size())) {
            name.replace(pos, spelling.size(), abbreviation);
        }
    }
    return name;
}


// Two spaces per nesting level of the printout
struct indent
{
    std::size_t depth = 0;

    friend std::ostream& operator << (std::ostream& strm, const indent ind)
    {
        return strm << std::string(2 * ind.depth, ' ');
    }
};

// Display name of a stage is its stage_type, unless impl names another one in display_stage_type.
// Stages built on a base stage (map, sort, ...) do, otherwise they would all print as the base.
template <class StageImpl>
struct display_stage_type_for_impl
{
    using type = typename StageImpl::stage_type;
};
template <class StageImpl>
    requires requires { typename StageImpl::display_stage_type; }
struct display_stage_type_for_impl<StageImpl>
{
    using type = typename StageImpl::display_stage_type;
};

// Sources are always the first entry of a chain
template <class Output>
void debug_print_source(std::ostream& strm, const std::size_t depth, const std::string_view name)
{
    strm << indent(depth) << "#0 source: " << std::quoted(name) << '\n';
    strm << indent(depth) << "output: " << std::quoted(type_name<Output>()) << '\n';
}

// Index, name, style, element types
template <class StageImpl>
void debug_print_stage_default(std::ostream& strm, const std::size_t depth, const std::size_t index)
{
    using display_stage_type = typename display_stage_type_for_impl<StageImpl>::type;
    constexpr auto style = StageImpl::stage_type::style;
    strm << indent(depth) << '#' << index << " stage: " << std::quoted(type_name<display_stage_type>()) << ' ' << style;
    if constexpr (is_eager<typename StageImpl::stage_type>()) {
        strm << " (eager)";
    }
    strm << '\n';
    strm << indent(depth) << "input: " << std::quoted(type_name<typename StageImpl::input_type>()) << '\n';
    strm << indent(depth) << "output: " << std::quoted(type_name<typename StageImpl::output_type>()) << '\n';
}

// Stage-specific part of the printout, specialize for stages holding something worth printing
// (concat prints its extra sources)
template <class StageType>
struct custom_debug_printer
{
    static void print(std::ostream&, std::size_t, const StageType&)
    {
        // Default: no custom output
    }
};

} // namespace lazyseq::detail
