#pragma once

#include <cstddef>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <pfr/tuple_size.hpp>
#include <pfr/core.hpp>
#include <pfr/core_name.hpp>

#include "const_string.hpp"
#include "annotated.hpp"

namespace QueryFusion {

// Explicit field list for records PFR cannot reflect (non-aggregates, or when
// only some members belong on the wire):
//
//   template<> struct QueryFusion::StructMeta<Session> {
//       using Fields = StructFields<Field<&Session::user, "user">,
//                                   Field<&Session::ttl, "ttl", options::not_required>>;
//   };
// Members left out of Fields are neither written nor read.
template <class T>
struct StructMeta {};

template <auto MPtr, KeyLiteral WireKey, class ... Opts>
struct Field;

template <class Record, class Member, Member Record::*MPtr, KeyLiteral WireKey, class ... Opts>
struct Field<MPtr, WireKey, Opts...> {
    static_assert(WireKey.isWireSafe(), "[[[ QueryFusion ]]] field key contains control characters, '&' or '='");

    using record_type = Record;
    // member type carrying the declared options, as an inline Annotated<> would
    using declared_type = Annotated<Member, Opts...>;

    static constexpr std::string_view name = WireKey.view();

    static constexpr Member & access(Record & r) { return r.*MPtr; }
    static constexpr const Member & access(const Record & r) { return r.*MPtr; }
};

template <class ... F>
struct StructFields {
    using list = std::tuple<F...>;
};


namespace introspection {

namespace detail {

template<class T>
struct is_struct_fields : std::false_type {};

template<class... F>
struct is_struct_fields<StructFields<F...>> : std::true_type {};

template<class T>
concept DeclaresFields = requires { typename StructMeta<T>::Fields; }
                         && is_struct_fields<typename StructMeta<T>::Fields>::value;


// Aggregates: members, types and names come from PFR.
template<class T>
struct RecordLayout {
    static constexpr std::size_t count = pfr::tuple_size_v<T>;

    template<std::size_t I>
    using member_type = pfr::tuple_element_t<I, T>;

    template<std::size_t I>
    static constexpr std::string_view name = pfr::get_name<I, T>();

    template<std::size_t I, class S>
    static constexpr auto & member(S & s) {
        return pfr::get<I>(s);
    }
};

// StructMeta records: everything comes from the declared Field list.
template<DeclaresFields T>
struct RecordLayout<T> {
    using Fields = typename StructMeta<T>::Fields::list;

    static constexpr std::size_t count = std::tuple_size_v<Fields>;

    template<std::size_t I>
    using member_type = typename std::tuple_element_t<I, Fields>::declared_type;

    template<std::size_t I>
    static constexpr std::string_view name = std::tuple_element_t<I, Fields>::name;

    template<std::size_t I, class S>
    static constexpr auto & member(S & s) {
        return std::tuple_element_t<I, Fields>::access(s);
    }
};

} // namespace detail

template<class T>
inline constexpr bool has_struct_meta = detail::DeclaresFields<std::remove_cv_t<T>>;

template<std::size_t Index, class StructT>
constexpr auto & getStructElementByIndex(StructT & s) {
    return detail::RecordLayout<std::remove_cv_t<StructT>>::template member<Index>(s);
}

template<class StructT>
inline constexpr std::size_t structureElementsCount = detail::RecordLayout<std::remove_cv_t<StructT>>::count;

template<std::size_t Index, class StructT>
using structureElementTypeByIndex = typename detail::RecordLayout<std::remove_cv_t<StructT>>::template member_type<Index>;

template<std::size_t Index, class StructT>
inline constexpr std::string_view structureElementNameByIndex = detail::RecordLayout<std::remove_cv_t<StructT>>::template name<Index>;

} // namespace introspection
} // namespace QueryFusion
