#pragma once

#include <charconv>
#include <cmath>
#include <concepts>
#include <cstdint>
#include <limits>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <variant>

#include "config.hpp"

namespace JsonScribe {

/// Canonical decimal text of an arbitrary-precision number, e.g. produced by a
/// big-integer or big-decimal library. Written verbatim; precision is never touched.
/// The text must match the JSON number grammar ("-12", "3.1400", "1E+3").
struct Decimal {
    std::string_view text;

    constexpr explicit Decimal(std::string_view t): text(t) {}
};

/// Every numeric value reaching the scribe goes through this one variant.
using NumericLiteral = std::variant<std::int64_t, std::uint64_t, float, double, long double, Decimal>;

namespace numeric_detail {

template<class T>
constexpr bool is_char_type_v =
    std::is_same_v<T, char> || std::is_same_v<T, wchar_t> ||
    std::is_same_v<T, char8_t> || std::is_same_v<T, char16_t> || std::is_same_v<T, char32_t>;

} // namespace numeric_detail

/// Types rendered as JSON numbers. bool and the character types are excluded:
/// they have their own literal forms. signed/unsigned char count as small integers.
template<class T>
concept NumericValue =
    (std::integral<T> && !std::is_same_v<T, bool> && !numeric_detail::is_char_type_v<T>)
    || std::floating_point<T>
    || std::same_as<T, Decimal>;

template<NumericValue T>
constexpr NumericLiteral to_numeric_literal(const T& v) {
    if constexpr (std::is_same_v<T, Decimal>) {
        return NumericLiteral(v);
    } else if constexpr (std::is_same_v<T, float>) {
        return NumericLiteral(std::in_place_type<float>, v);
    } else if constexpr (std::is_same_v<T, long double>) {
        return NumericLiteral(std::in_place_type<long double>, v);
    } else if constexpr (std::floating_point<T>) {
        return NumericLiteral(std::in_place_type<double>, static_cast<double>(v));
    } else if constexpr (std::is_signed_v<T>) {
        return NumericLiteral(std::in_place_type<std::int64_t>, static_cast<std::int64_t>(v));
    } else {
        return NumericLiteral(std::in_place_type<std::uint64_t>, static_cast<std::uint64_t>(v));
    }
}

// -------------------------
//  Format decimal integer
// -------------------------
// Writes base-10 representation of value into [first, last).
// Returns pointer one past last written char.
// Caller guarantees buffer is large enough (e.g. NumberBufSize).
template <class Int>
constexpr char* format_decimal_integer(Int value, char* first, char* last) noexcept {
    static_assert(std::is_integral_v<Int>, "[[[ JsonScribe ]]] Int must be an integral type");

    // Digits are generated backwards at the end of the buffer, then moved forward.
    char* p = last;

    using Unsigned = std::make_unsigned_t<Int>;
    Unsigned u;
    bool negative = false;

    if constexpr (std::is_signed_v<Int>) {
        if (value < 0) {
            negative = true;
            // min() is negated in the unsigned domain
            u = Unsigned(-(value + 1)) + 1u;
        } else {
            u = static_cast<Unsigned>(value);
        }
    } else {
        u = static_cast<Unsigned>(value);
    }

    do {
        if (p == first) {
            break;
        }
        unsigned digit = static_cast<unsigned>(u % 10u);
        u /= 10u;
        *--p = static_cast<char>('0' + digit);
    } while (u != 0);

    if (negative && p != first) {
        *--p = '-';
    }

    std::size_t len = static_cast<std::size_t>(last - p);
    for (std::size_t i = 0; i < len; ++i)
        first[i] = p[i];
    return first + len;
}

/// Shortest text that reads back as the same value of type Float.
/// Returns nullptr if [first, last) is too small.
template <std::floating_point Float>
inline char* format_floating(Float value, char* first, char* last) {
    std::to_chars_result r = std::to_chars(first, last, value);
    if (r.ec != std::errc{}) {
        return nullptr;
    }
    return r.ptr;
}

/// NaN and the infinities have no JSON number form.
constexpr bool has_json_number_form(const NumericLiteral& n) {
    if (const float* f = std::get_if<float>(&n)) {
        return std::isfinite(*f);
    }
    if (const double* d = std::get_if<double>(&n)) {
        return std::isfinite(*d);
    }
    if (const long double* ld = std::get_if<long double>(&n)) {
        return std::isfinite(*ld);
    }
    return true;
}

/// RFC 8259 number grammar: -? (0 | [1-9][0-9]*) (. [0-9]+)? ([eE] [+-]? [0-9]+)?
constexpr bool is_json_number(std::string_view s) {
    std::size_t i = 0;
    const std::size_t n = s.size();
    auto digit = [&](std::size_t k) constexpr { return k < n && s[k] >= '0' && s[k] <= '9'; };

    if (i < n && s[i] == '-') ++i;
    if (!digit(i)) return false;
    if (s[i] == '0') {
        ++i;
    } else {
        while (digit(i)) ++i;
    }
    if (i < n && s[i] == '.') {
        ++i;
        if (!digit(i)) return false;
        while (digit(i)) ++i;
    }
    if (i < n && (s[i] == 'e' || s[i] == 'E')) {
        ++i;
        if (i < n && (s[i] == '+' || s[i] == '-')) ++i;
        if (!digit(i)) return false;
        while (digit(i)) ++i;
    }
    return i == n;
}

/// Renders integers and finite floating values into [first, last).
/// Decimal text is not copied here: the scribe writes it straight to the sink.
/// Returns nullptr when the value has no buffer rendering.
constexpr char* format_number(const NumericLiteral& n, char* first, char* last) {
    if (const std::int64_t* i = std::get_if<std::int64_t>(&n)) {
        return format_decimal_integer<std::int64_t>(*i, first, last);
    }
    if (const std::uint64_t* u = std::get_if<std::uint64_t>(&n)) {
        return format_decimal_integer<std::uint64_t>(*u, first, last);
    }
    if (const float* f = std::get_if<float>(&n)) {
        return format_floating(*f, first, last);
    }
    if (const double* d = std::get_if<double>(&n)) {
        return format_floating(*d, first, last);
    }
    if (const long double* ld = std::get_if<long double>(&n)) {
        return format_floating(*ld, first, last);
    }
    return nullptr;
}

} // namespace JsonScribe
