#pragma once

#include <concepts>
#include <cstddef>
#include <string_view>

#include "errors.hpp"
#include "numeric_literal.hpp"

namespace JsonScribe {

namespace scribe {

template<typename S>
concept ScribeLike = requires(S scribe,
                              S& mutable_scribe,
                              std::string_view text,
                              char c,
                              bool flag,
                              std::size_t depth,
                              const NumericLiteral& number
                              ) {

    // ========== Type Requirements ==========
    typename S::error_type;

    // ========== State ==========
    // Current nesting depth
    { scribe.cursor() } -> std::convertible_to<std::size_t>;

    // Open sequence number of the innermost frame, 0 with nothing open
    { scribe.current_id() } -> std::convertible_to<std::size_t>;

    // Returns the current writing error state
    { scribe.getError() } -> std::same_as<typename S::error_type>;

    // ========== Containers ==========
    { mutable_scribe.begin_array() } -> std::same_as<bool>;
    { mutable_scribe.begin_object() } -> std::same_as<bool>;
    { mutable_scribe.end_current() } -> std::same_as<bool>;
    { mutable_scribe.end_through(depth) } -> std::same_as<bool>;
    { mutable_scribe.end_through(depth, depth) } -> std::same_as<bool>;
    { mutable_scribe.write_key(text) } -> std::same_as<bool>;

    // ========== String values ==========
    { mutable_scribe.begin_string_value() } -> std::same_as<bool>;
    { mutable_scribe.begin_string_value(text) } -> std::same_as<bool>;
    { mutable_scribe.append_to_string_value(text) } -> std::same_as<bool>;
    { mutable_scribe.append_to_string_value(c) } -> std::same_as<bool>;

    // ========== Literals ==========
    { mutable_scribe.write_literal(text) } -> std::same_as<bool>;
    { mutable_scribe.write_null() } -> std::same_as<bool>;
    { mutable_scribe.write_bool(flag) } -> std::same_as<bool>;
    { mutable_scribe.write_number(number) } -> std::same_as<bool>;
    { mutable_scribe.write_string(text) } -> std::same_as<bool>;
};

} // namespace scribe

using scribe::ScribeLike;

} // namespace JsonScribe
