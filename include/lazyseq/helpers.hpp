#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <type_traits>

namespace lazyseq::detail {

template <template <class...> class Template, class T>
struct is_specialization_of : std::false_type{};

template <template <class...> class Template, class... Ts>
struct is_specialization_of<Template, Template<Ts...>> : std::true_type{};

template <template <class...> class Template, class T>
inline constexpr bool is_specialization_of_v = is_specialization_of<Template, T>::value;

// std::string, std::string_view, const char*, char arrays
// (char itself is not string-like, it's a single character)
template <class T>
inline constexpr bool is_string_like_v =
       std::is_convertible_v<const std::remove_cvref_t<T>&, std::string_view>
    && !std::is_same_v<std::remove_cvref_t<T>, std::nullptr_t>;

} // namespace lazyseq::detail
