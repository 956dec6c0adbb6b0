#pragma once
#include <cstddef>
#include <optional>
#include <string_view>
#include <tuple>
#include <type_traits>
#include "annotated.hpp"
#include "const_string.hpp"
#include "struct_introspection.hpp"

namespace QueryFusion {

namespace options {

namespace detail {
struct key_tag{};
struct not_required_tag{};
struct exclude_tag{};
struct float_decimals_tag{};
}

// Field is not part of the wire format: never written, never read.
struct exclude {
    using tag = detail::exclude_tag;
};

// Absent key leaves the field at its default instead of failing with NO_VALUE.
struct not_required {
    using tag = detail::not_required_tag;
};

// Wire key used instead of the member name.
template<KeyLiteral Name>
struct key {
    static_assert(Name.isWireSafe(), "[[[ QueryFusion ]]] key contains control characters, '&' or '='");
    using tag = detail::key_tag;
    static constexpr std::string_view name = Name.view();
};

// Floats written in fixed notation with N digits after the point.
template<std::size_t N>
struct float_decimals {
    using tag = detail::float_decimals_tag;
    static constexpr std::size_t value = N;
};

namespace detail {

template<class Opt, class Tag>
consteval bool tagged_as() {
    if constexpr (requires { typename Opt::tag; }) {
        return std::is_same_v<typename Opt::tag, Tag>;
    } else {
        return false;
    }
}

// Options of one field. When an option is given twice the first one counts,
// so options declared through AnnotatedField win over the inline ones.
template<class Pack> struct field_options;

template<class... Opts>
struct field_options<OptionsPack<Opts...>> {
private:
    template<class Tag>
    static consteval std::size_t first_index() {
        constexpr bool matches[] = {tagged_as<Opts, Tag>()..., false};
        std::size_t i = 0;
        while(i < sizeof...(Opts) && !matches[i]) {
            ++i;
        }
        return i;
    }

public:
    template<class Tag>
    static constexpr bool has_option = first_index<Tag>() < sizeof...(Opts);

    template<class Tag>
        requires has_option<Tag>
    using get_option = std::tuple_element_t<first_index<Tag>(), std::tuple<Opts...>>;
};


template<class T>
struct is_options_pack : std::false_type {};

template<class... Opts>
struct is_options_pack<OptionsPack<Opts...>> : std::true_type {};


template<class P1, class P2> struct concat_packs;
template<class... L, class... R>
struct concat_packs<OptionsPack<L...>, OptionsPack<R...>> {
    using type = OptionsPack<L..., R...>;
};


// How a field declaration maps to the stored value and its inline options.
template<class T>
struct annotation_meta {
    using value_t = T;
    using OptionsP = OptionsPack<>;

    static constexpr T & getRef(T & f) { return f; }
    static constexpr const T & getRef(const T & f) { return f; }
};

template<class T, class... Opts>
struct annotation_meta<std::optional<Annotated<T, Opts...>>> {
    static_assert(!sizeof(T), "[[[ QueryFusion ]]] Use Annotated<std::optional<T>, ...> instead of std::optional<Annotated<T, ...>>");
};

template<class T, class... Opts>
struct annotation_meta<Annotated<T, Opts...>> {
    using value_t = T;
    using OptionsP = OptionsPack<Opts...>;

    static constexpr T & getRef(Annotated<T, Opts...> & f) { return f.value; }
    static constexpr const T & getRef(const Annotated<T, Opts...> & f) { return f.value; }

    // StructMeta fields report Annotated<T, ...> but hand out the bare member
    static constexpr T & getRef(T & f) { return f; }
    static constexpr const T & getRef(const T & f) { return f; }
};

template<class Field>
struct annotation_meta_getter : annotation_meta<std::remove_cvref_t<Field>> {};


template<class T, std::size_t I>
struct external_field_options {
    using type = OptionsPack<>;
};

template<class T, std::size_t I>
    requires is_options_pack<typename AnnotatedField<T, I>::Options>::value
struct external_field_options<T, I> {
    using type = typename AnnotatedField<T, I>::Options;
};

template<class Record, std::size_t Index>
struct record_field_options {
    using Field  = introspection::structureElementTypeByIndex<Index, Record>;
    using Inline = typename annotation_meta_getter<Field>::OptionsP;
    using type   = field_options<
        typename concat_packs<typename external_field_options<Record, Index>::type, Inline>::type>;
};

template<class Record, std::size_t Index>
using aggregate_field_opts_getter = typename record_field_options<std::remove_cvref_t<Record>, Index>::type;

} // namespace detail

} // namespace options

} // namespace QueryFusion
