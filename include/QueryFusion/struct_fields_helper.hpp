#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <ranges>
#include <string_view>
#include <utility>

#include "static_schema.hpp"

namespace QueryFusion {

namespace struct_fields_helper {

template<class T, std::size_t I>
static consteval bool fieldIsExcluded() {
    return static_schema::detail::fieldIsExcluded<T, I>();
}

template<class Field>
struct nested_record {
    static constexpr bool value = false;
};

template<class Field>
    requires static_schema::QueryRecord<Field>
struct nested_record<Field> {
    static constexpr bool value = true;
    using type = static_schema::AnnotatedValue<Field>;
};

template<class Field>
    requires static_schema::QueryOptional<Field>
          && static_schema::QueryRecord<typename static_schema::AnnotatedValue<Field>::value_type>
struct nested_record<Field> {
    static constexpr bool value = true;
    using type = static_schema::AnnotatedValue<typename static_schema::AnnotatedValue<Field>::value_type>;
};


template<class T>
struct FieldsHelper {

    static constexpr std::size_t rawFieldsCount = introspection::structureElementsCount<T>;

    template<std::size_t I>
    using FieldType = introspection::structureElementTypeByIndex<I, T>;

    template<std::size_t I>
    static consteval std::string_view fieldName() {
        using Opts    = options::detail::aggregate_field_opts_getter<T, I>;
        if constexpr (Opts::template has_option<options::detail::key_tag>) {
            using KeyOpt = typename Opts::template get_option<options::detail::key_tag>;
            return KeyOpt::name;
        } else {
            return introspection::structureElementNameByIndex<I, T>;
        }
    }

    // number of wire keys field I contributes once nested records are flattened
    template<std::size_t I>
    static consteval std::size_t flatKeysOf() {
        if constexpr (fieldIsExcluded<T, I>()) {
            return 0;
        } else if constexpr (nested_record<FieldType<I>>::value) {
            return FieldsHelper<typename nested_record<FieldType<I>>::type>::flatKeysCount;
        } else {
            return 1;
        }
    }

    static constexpr std::size_t flatKeysCount = []<std::size_t... I>(std::index_sequence<I...>) consteval {
        return (std::size_t{0} + ... + flatKeysOf<I>());
    }(std::make_index_sequence<rawFieldsCount>{});

    static constexpr std::array<std::string_view, flatKeysCount> flatKeys =
        []<std::size_t... I>(std::index_sequence<I...>) consteval {
            std::array<std::string_view, flatKeysCount> arr{};
            std::size_t index = 0;
            auto add_one = [&](auto ic) consteval {
                constexpr std::size_t J = decltype(ic)::value;
                if constexpr (fieldIsExcluded<T, J>()) {
                    return;
                } else if constexpr (nested_record<FieldType<J>>::value) {
                    for (const auto & k : FieldsHelper<typename nested_record<FieldType<J>>::type>::flatKeys) {
                        arr[index++] = k;
                    }
                } else {
                    arr[index++] = fieldName<J>();
                }
            };
            (add_one(std::integral_constant<std::size_t, I>{}), ...);
            return arr;
        }(std::make_index_sequence<rawFieldsCount>{});

    static constexpr bool keysAreUnique = [](std::array<std::string_view, flatKeysCount> inputArr) consteval{
        auto sortedArr = inputArr;
        std::ranges::sort(sortedArr);
        return std::ranges::adjacent_find(sortedArr) == sortedArr.end();
    }(flatKeys);

    static consteval bool hasFlatKey(std::string_view name) {
        for (const auto & k : flatKeys) {
            if (k == name) {
                return true;
            }
        }
        return false;
    }
};

} // namespace struct_fields_helper
} // namespace QueryFusion
