#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <type_traits>

#include "numeric_literal.hpp"
#include "scribe_concept.hpp"

namespace JsonScribe {

namespace value_detail {

template<class T>
struct is_optional : std::false_type {};

template<class T>
struct is_optional<std::optional<T>> : std::true_type {};

template<class T>
constexpr bool is_optional_v = is_optional<std::remove_cvref_t<T>>::value;

template<class T>
concept CharPointer =
    std::is_pointer_v<T> && std::is_same_v<std::remove_cv_t<std::remove_pointer_t<T>>, char>;

template<class T>
concept StringLike =
    !CharPointer<T> && std::is_convertible_v<const T&, std::string_view>;

// Char arrays stop at the first NUL or at their extent, whichever comes first.
template<std::size_t N>
constexpr std::string_view bounded_view(const char (&chars)[N]) {
    std::size_t len = 0;
    while (len < N && chars[len] != '\0') {
        ++len;
    }
    return std::string_view(chars, len);
}

} // namespace value_detail

/// Anything a `with(...)` entry point accepts as one JSON value.
template<class T>
concept WritableValue =
    std::is_same_v<std::remove_cvref_t<T>, std::nullptr_t>
    || std::is_same_v<std::remove_cvref_t<T>, bool>
    || std::is_same_v<std::remove_cvref_t<T>, char>
    || value_detail::CharPointer<std::remove_cvref_t<T>>
    || value_detail::StringLike<std::remove_cvref_t<T>>
    || NumericValue<std::remove_cvref_t<T>>
    || (value_detail::is_optional_v<T>
        && !value_detail::is_optional_v<typename std::remove_cvref_t<T>::value_type>
        && (std::is_same_v<typename std::remove_cvref_t<T>::value_type, bool>
            || std::is_same_v<typename std::remove_cvref_t<T>::value_type, char>
            || value_detail::StringLike<typename std::remove_cvref_t<T>::value_type>
            || NumericValue<typename std::remove_cvref_t<T>::value_type>));

/// Maps one C++ value onto the scribe: absent values (empty optional, nullptr,
/// null C string) become `null`, every numeric type goes through NumericLiteral.
template<ScribeLike S, WritableValue T>
constexpr bool write_value(S& scribe, const T& value) {
    using V = std::remove_cvref_t<T>;
    if constexpr (std::is_same_v<V, std::nullptr_t>) {
        return scribe.write_null();
    } else if constexpr (std::is_same_v<V, bool>) {
        return scribe.write_bool(value);
    } else if constexpr (std::is_same_v<V, char>) {
        return scribe.write_string(std::string_view(&value, 1));
    } else if constexpr (value_detail::is_optional_v<V>) {
        if (!value.has_value()) {
            return scribe.write_null();
        }
        return write_value(scribe, *value);
    } else if constexpr (value_detail::CharPointer<V>) {
        if (value == nullptr) {
            return scribe.write_null();
        }
        return scribe.write_string(std::string_view(value));
    } else if constexpr (std::is_array_v<V>) {
        return scribe.write_string(value_detail::bounded_view(value));
    } else if constexpr (NumericValue<V>) {
        return scribe.write_number(to_numeric_literal(value));
    } else {
        return scribe.write_string(std::string_view(value));
    }
}

} // namespace JsonScribe
