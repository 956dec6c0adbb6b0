#pragma once

#include <concepts>
#include <cstddef>
#include <memory>
#include <utility>

namespace QueryFusion {

template <class ... Opts>
struct OptionsPack {
    static constexpr std::size_t Count = sizeof...(Opts);
};

// A field value plus the options that say how it travels (wire key,
// presence, float precision). The options never change the stored value.
template <class T, typename... Options>
struct Annotated {
    using value_type = T;
    T value{};

    constexpr Annotated() = default;

    template<class U>
        requires std::convertible_to<U, T>
    constexpr Annotated(U && u): value(std::forward<U>(u)) {}

    template<class U>
        requires std::convertible_to<U, T>
    constexpr Annotated & operator=(U && u) {
        value = std::forward<U>(u);
        return *this;
    }

    constexpr T &       get()       { return value; }
    constexpr const T & get() const { return value; }

    constexpr T *       operator->()       { return std::addressof(value); }
    constexpr const T * operator->() const { return std::addressof(value); }

    constexpr operator T &()             { return value; }
    constexpr operator const T &() const { return value; }

    // options do not take part in equality
    template<class... Other>
    constexpr bool operator==(const Annotated<T, Other...> & other) const {
        return value == other.value;
    }
};

template <class T, typename... Options>
using A = Annotated<T, Options...>;

// Options for field Index of Struct, declared outside the struct:
//   template<> struct QueryFusion::AnnotatedField<Point, 1> { using Options = OptionsPack<key<"y_coord">>; };
// These take precedence over options given inline with Annotated<>.
template <class Struct, std::size_t Index>
struct AnnotatedField {};

} // namespace QueryFusion
