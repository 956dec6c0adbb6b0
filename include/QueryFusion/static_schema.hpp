#pragma once
#include <cstddef>
#include <cstdint>
#include <ranges>
#include <type_traits>
#include <string>
#include <string_view>
#include <optional>
#include <utility>
#include <vector>


#include "options.hpp"
#include "struct_introspection.hpp"

namespace QueryFusion {

namespace static_schema {


template <typename T>
concept DynamicContainerTypeConcept = requires (T  v) {
    typename T::value_type;
    v.push_back(std::declval<typename T::value_type>());
    v.clear();
};


namespace input_checks {


template<class T, template<class...> class Template>
struct is_specialization_of : std::false_type {};

template<template<class...> class Template, class... Args>
struct is_specialization_of<Template<Args...>, Template> : std::true_type {};

template<class T, template<class...> class Template>
constexpr bool is_specialization_of_v =
    is_specialization_of<std::remove_cvref_t<T>, Template>::value;

// Top-level forbidden shapes: no recursion, no PFR, no ranges.
template<class T>
struct is_directly_forbidden {
    using D = std::remove_cvref_t<T>;
    static constexpr bool value =
        std::is_void_v<D> ||
        std::is_pointer_v<D> ||
        std::is_member_pointer_v<D> ||
        std::is_null_pointer_v<D> ||
        std::is_function_v<D> ||
        std::is_enum_v<D> ||
        std::is_reference_v<T>;
};

template<class T>
constexpr bool is_directly_forbidden_v =
    is_directly_forbidden<T>::value;


} // namespace input_checks


using options::detail::annotation_meta_getter;
using input_checks::is_specialization_of_v;

template<class Field>
using AnnotatedValue = typename annotation_meta_getter<Field>::value_t;


/* ######## Scalars ######## */
template<class C>
concept QueryBool = std::same_as<AnnotatedValue<C>, bool>;

template<class C>
concept QueryChar = std::same_as<AnnotatedValue<C>, char>;

namespace detail {
template<class T>
inline constexpr bool is_wide_char_v =
    std::is_same_v<T, wchar_t>  ||
    std::is_same_v<T, char8_t>  ||
    std::is_same_v<T, char16_t> ||
    std::is_same_v<T, char32_t>;

template<class T>
struct always_false : std::false_type {};
}

// signed char and unsigned char count as 8-bit integers, plain char does not
template<class C>
concept QueryNumber =
    !QueryBool<C> && !QueryChar<C> &&
    ((std::is_integral_v<AnnotatedValue<C>> && !detail::is_wide_char_v<AnnotatedValue<C>>) ||
     std::same_as<AnnotatedValue<C>, float> ||
     std::same_as<AnnotatedValue<C>, double>);

template<class C>
concept QueryString = std::same_as<AnnotatedValue<C>, std::string>;

template<class C>
concept QueryBytes = std::same_as<AnnotatedValue<C>, std::vector<std::byte>>;

template<class C>
concept QueryScalar = QueryBool<C> || QueryChar<C> || QueryNumber<C> || QueryString<C> || QueryBytes<C>;


/* ######## Transformers ######## */
template<class T>
concept TransformerLike = requires(T & t, const T & ct,
                                   const typename T::wire_type & w,
                                   typename T::wire_type & wo) {
    typename T::wire_type;
    { t.transform_from(w) } -> std::same_as<bool>;
    { ct.transform_to(wo) } -> std::same_as<bool>;
};


/* ######## Array wire-value ######## */
// Array<T, SubCodec> publishes its element and codec types under these names
template<class T>
concept ArrayWrapperLike = requires {
    typename T::query_array_element;
    typename T::query_array_codec;
};


template<class T> struct is_query_field_value;  // primary declaration
template<class T> struct is_query_record;       // primary declaration


template<class T>
struct is_query_transformer {
    static constexpr bool value = []{
        using U = AnnotatedValue<T>;
        if constexpr (QueryScalar<T>) {
            return false;
        } else if constexpr (TransformerLike<U>) {
            using W = typename U::wire_type;
            return !is_query_record<W>::value
                   && !is_specialization_of_v<W, std::optional>
                   && is_query_field_value<W>::value;
        } else {
            return false;
        }
    }();
};

template<class C>
concept QueryTransformer = is_query_transformer<C>::value;


template<class T>
struct is_query_array {
    static constexpr bool value = []{
        using U = AnnotatedValue<T>;
        if constexpr (QueryScalar<T> || QueryTransformer<T>) {
            return false;
        } else {
            return ArrayWrapperLike<U>;
        }
    }();
};

template<class C>
concept QueryArray = is_query_array<C>::value;


/* ######## Sequence (repeated key) ######## */
// elements must be scalars or transformers with a scalar wire type
template<class T>
struct is_query_sequence_element {
    static constexpr bool value = []{
        if constexpr (QueryScalar<T>) {
            return true;
        } else if constexpr (QueryTransformer<T>) {
            return QueryScalar<typename AnnotatedValue<T>::wire_type>;
        } else {
            return false;
        }
    }();
};

template<class T>
struct is_query_sequence {
    static constexpr bool value = []{
        using U = AnnotatedValue<T>;
        if constexpr (QueryScalar<T> || QueryTransformer<T> || QueryArray<T>) {
            return false;
        } else if constexpr (is_specialization_of_v<U, std::optional>) {
            return false;
        } else if constexpr (DynamicContainerTypeConcept<U> && std::ranges::range<U>) {
            return is_query_sequence_element<typename U::value_type>::value;
        } else {
            return false;
        }
    }();
};

template<class C>
concept QuerySequence = is_query_sequence<C>::value;


/* ######## Record type detection ######## */

namespace detail {
template<class T, std::size_t I>
consteval bool fieldIsExcluded() {
    using Opts    = options::detail::aggregate_field_opts_getter<T, I>;
    return Opts::template has_option<options::detail::exclude_tag>;
}
}

template<typename T>
struct is_query_record {
    static constexpr bool value = [] {
        using U = AnnotatedValue<T>;
        if constexpr (QueryScalar<T> || QueryTransformer<T> || QueryArray<T>) {
            return false;
        } else if constexpr (input_checks::is_directly_forbidden_v<U>) {
            return false;
        } else if constexpr (!std::is_class_v<U>) {
            return false;
        } else if constexpr (introspection::has_struct_meta<U>) {
            return true;
        } else if constexpr (std::ranges::range<U>) {
            return false; // sequences and maps are handled separately
        } else if constexpr (!std::is_aggregate_v<U>) {
            return false; // optional, variant, smart pointers
        } else {
            return true;
        }
    }();
};

template<class C>
concept QueryRecord = is_query_record<C>::value;


/* ######## Optional ######## */
template<class Field>
struct is_query_optional {
    using AV  = AnnotatedValue<Field>; // unwrap Annotated only
    static constexpr bool value = []{
        if constexpr (is_specialization_of_v<AV, std::optional>) {
            using Inner = typename AV::value_type;
            if constexpr (is_specialization_of_v<Inner, std::optional>) {
                return false;
            } else {
                return is_query_field_value<Inner>::value;
            }
        } else {
            return false;
        }
    }();
};

template<class Field>
concept QueryOptional = is_query_optional<Field>::value;


template<class T, std::size_t... I>
consteval bool recordFieldsAreValid(std::index_sequence<I...>) {
    auto one = [](auto ic) consteval {
        constexpr std::size_t J = decltype(ic)::value;
        if constexpr (detail::fieldIsExcluded<T, J>()) {
            return true;
        } else {
            using Field = introspection::structureElementTypeByIndex<J, T>;
            return is_query_field_value<Field>::value;
        }
    };
    return (true && ... && one(std::integral_constant<std::size_t, I>{}));
}


template<class T>
struct is_query_field_value {
    static constexpr bool value = []{
        if constexpr (input_checks::is_directly_forbidden_v<T>) {
            return false;
        } else if constexpr (QueryScalar<T> || QueryTransformer<T> || QueryArray<T>
                             || QuerySequence<T> || QueryOptional<T>) {
            return true;
        } else if constexpr (QueryRecord<T>) {
            using U = AnnotatedValue<T>;
            return recordFieldsAreValid<U>(std::make_index_sequence<introspection::structureElementsCount<U>>{});
        } else {
            return false;
        }
    }();
};

template<class C>
concept QueryFieldValue = is_query_field_value<C>::value;

// Encode/Decode entry points accept records only
template<class C>
concept QueryRootValue = QueryRecord<C> && QueryFieldValue<C>;


/* ######## Diagnostics ######## */

template<class T>
consteval std::string_view scalar_type_name() {
    using U = AnnotatedValue<T>;
    if constexpr (std::is_same_v<U, bool>) {
        return "bool";
    } else if constexpr (std::is_same_v<U, char>) {
        return "char";
    } else if constexpr (std::is_same_v<U, float>) {
        return "float";
    } else if constexpr (std::is_same_v<U, double>) {
        return "double";
    } else if constexpr (std::is_same_v<U, std::string>) {
        return "string";
    } else if constexpr (std::is_same_v<U, std::vector<std::byte>>) {
        return "bytes";
    } else if constexpr (std::is_integral_v<U>) {
        constexpr bool s = std::is_signed_v<U>;
        if constexpr (sizeof(U) == 1) return s ? "int8" : "uint8";
        else if constexpr (sizeof(U) == 2) return s ? "int16" : "uint16";
        else if constexpr (sizeof(U) == 4) return s ? "int32" : "uint32";
        else if constexpr (sizeof(U) == 8) return s ? "int64" : "uint64";
        else return s ? "int128" : "uint128";
    } else {
        static_assert(detail::always_false<U>::value, "[[[ QueryFusion ]]] not a scalar type");
        return "";
    }
}

} // namespace static_schema
} // namespace QueryFusion
