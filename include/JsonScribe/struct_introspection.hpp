#pragma once

#include <cstddef>
#include <ranges>
#include <string_view>
#include <type_traits>
#include <utility>
#include <pfr/tuple_size.hpp>
#include <pfr/core.hpp>
#include <pfr/core_name.hpp>

#include "builder.hpp"
#include "value_writer.hpp"

namespace JsonScribe {

namespace introspection {

template<class StructT>
static constexpr std::size_t structureElementsCount = pfr::tuple_size_v<std::remove_cv_t<StructT>>;

template<std::size_t Index, class StructT>
static constexpr std::string_view structureElementNameByIndex = pfr::get_name<Index, std::remove_cv_t<StructT>>();

template<std::size_t Index, class StructT>
constexpr decltype(auto) getStructElementByIndex(const StructT & s) {
    return (pfr::get<Index>(s));
}

} // namespace introspection

/// Plain aggregates whose fields pfr can enumerate by name. Strings, ranges and
/// optionals are excluded even when they happen to be aggregates.
template<class T>
concept InscribableStruct =
    std::is_class_v<T> && std::is_aggregate_v<T>
    && !WritableValue<T> && !std::ranges::range<T>;

template<class Node, InscribableStruct S>
constexpr Node& inscribe_fields(Node& object, const S& s);

template<class Node, InscribableStruct S>
constexpr Node& inscribe(Node& unkeyed, const S& s);

namespace introspection_detail {

template<class Node, class R>
constexpr void inscribe_elements(Node& array, const R& range) {
    for (const auto& element : range) {
        using E = std::remove_cvref_t<decltype(element)>;
        if constexpr (WritableValue<E>) {
            array.with(element);
        } else if constexpr (InscribableStruct<E>) {
            inscribe(array, element);
        } else if constexpr (std::ranges::range<E>) {
            auto nested = array.array();
            inscribe_elements(nested, element);
            nested.then();
        } else {
            static_assert(!sizeof(E), "[[[ JsonScribe ]]] range element type has no JSON form");
        }
    }
}

template<std::size_t Index, class Node, class S>
constexpr void inscribe_field(Node& object, const S& s) {
    constexpr std::string_view name = introspection::structureElementNameByIndex<Index, S>;
    const auto& field = introspection::getStructElementByIndex<Index>(s);
    using F = std::remove_cvref_t<decltype(field)>;

    if constexpr (WritableValue<F>) {
        object.with(name, field);
    } else if constexpr (InscribableStruct<F>) {
        auto nested = object.object(name);
        inscribe_fields(nested, field);
        nested.then();
    } else if constexpr (std::ranges::range<F>) {
        auto nested = object.array(name);
        inscribe_elements(nested, field);
        nested.then();
    } else {
        static_assert(!sizeof(F), "[[[ JsonScribe ]]] field type has no JSON form");
    }
}

} // namespace introspection_detail

/// Writes every field of `s` into an open object as "fieldName": value.
/// Nested aggregates become objects and ranges become arrays.
template<class Node, InscribableStruct S>
constexpr Node& inscribe_fields(Node& object, const S& s) {
    [&]<std::size_t... I>(std::index_sequence<I...>) {
        (introspection_detail::inscribe_field<I>(object, s), ...);
    }(std::make_index_sequence<introspection::structureElementsCount<S>>{});
    return object;
}

/// Writes `s` as one object element of an array, or as the root of a document.
template<class Node, InscribableStruct S>
constexpr Node& inscribe(Node& unkeyed, const S& s) {
    auto object = unkeyed.object();
    inscribe_fields(object, s);
    object.then();
    return unkeyed;
}

} // namespace JsonScribe
