#pragma once

#include "lazyseq/helpers.hpp"
#include "lazyseq/nested.hpp"

#include <charconv>
#include <cstddef>
#include <iterator>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

namespace lazyseq {
namespace detail {

template <class T>
concept ostreamable = requires (std::ostream& strm, const T& x) { strm << x; };

template <class T>
concept tuple_like = is_specialization_of_v<std::pair, T> || is_specialization_of_v<std::tuple, T>;

template <class T>
std::string number_to_text(const T x)
{
    char buffer[128];
    const auto [last, ec] = std::to_chars(std::begin(buffer), std::end(buffer), x);
    if (ec != std::errc{}) {
        // falls back to stream formatting
        std::ostringstream strm;
        strm << x;
        return strm.str();
    }
    return std::string(buffer, last);
}

} // namespace detail

// Textual representation of x used by join():
// * strings are taken as is, characters become one-character strings, null C-string has no representation
// * bool is "true" or "false"
// * numbers are in the shortest form which reads back to the same value ("1", "0.1", "1.5")
// * std::optional is its value, empty one has no representation
// * std::variant is its active alternative
// * pair and tuple are their elements separated by ',', elements without representation are empty
// * leaf of nested<T> is the leaf, nested sequence has no representation
// * anything else with operator << is what it prints
// * everything else has no representation
template <class T>
std::optional<std::string> to_text(const T& x)
{
    if constexpr (detail::is_string_like_v<T>) {
        if constexpr (std::is_pointer_v<T>) {
            if (x == nullptr) {
                return std::nullopt;
            }
        }
        return std::string(std::string_view(x));
    }
    else if constexpr (std::is_same_v<T, char>) {
        return std::string(1, x);
    }
    else if constexpr (std::is_same_v<T, bool>) {
        return std::string(x ? "true" : "false");
    }
    else if constexpr (std::is_arithmetic_v<T>) {
        return detail::number_to_text(x);
    }
    else if constexpr (detail::is_specialization_of_v<std::optional, T>) {
        if (!x.has_value()) {
            return std::nullopt;
        }
        return to_text(*x);
    }
    else if constexpr (detail::is_specialization_of_v<std::variant, T>) {
        return std::visit([] (const auto& alternative) {
            return to_text(alternative);
        }, x);
    }
    else if constexpr (detail::tuple_like<T>) {
        return std::apply([] (const auto&... elems) {
            std::string result;
            const char* sep = "";
            ((result += std::exchange(sep, ","), result += to_text(elems).value_or("")), ...);
            return result;
        }, x);
    }
    else if constexpr (detail::is_specialization_of_v<nested, T>) {
        if (!x.is_leaf()) {
            return std::nullopt;
        }
        return to_text(x.leaf());
    }
    else if constexpr (detail::ostreamable<T>) {
        std::ostringstream strm;
        strm << x;
        return strm.str();
    }
    else {
        return std::nullopt;
    }
}

} // namespace lazyseq
