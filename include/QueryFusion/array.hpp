#pragma once

#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "json_array_codec.hpp"

namespace QueryFusion {

template<class Codec, class T>
concept ArraySubCodec = requires(const std::vector<T> & in, std::vector<T> & items,
                                 std::string & out, std::string_view text,
                                 ArrayCodecError & err) {
    { Codec::encode(in, out, err) } -> std::same_as<bool>;
    { Codec::decode(text, items, err) } -> std::same_as<bool>;
};

// A sequence that travels as one key holding a sub-encoded document
// (ids=["1","2"]) instead of one pair per element (ids=1&ids=2).
template<class T, class SubCodec = JsonArrayCodec>
    requires ArraySubCodec<SubCodec, T>
struct Array {
    using query_array_element = T;
    using query_array_codec = SubCodec;
    using value_type = T;

    std::vector<T> values{};

    constexpr Array() = default;
    constexpr Array(std::initializer_list<T> init) : values(init) {}
    constexpr explicit Array(std::vector<T> v) : values(std::move(v)) {}

    constexpr auto begin()       { return values.begin(); }
    constexpr auto begin() const { return values.begin(); }
    constexpr auto end()         { return values.end(); }
    constexpr auto end()   const { return values.end(); }

    constexpr std::size_t size() const { return values.size(); }
    constexpr bool empty() const { return values.empty(); }

    // vector<bool> hands out proxies, so take the container's reference types
    constexpr typename std::vector<T>::reference       operator[](std::size_t i)       { return values[i]; }
    constexpr typename std::vector<T>::const_reference operator[](std::size_t i) const { return values[i]; }

    constexpr void push_back(const T & v) { values.push_back(v); }
    constexpr void push_back(T && v) { values.push_back(std::move(v)); }
    constexpr void clear() { values.clear(); }

    friend constexpr bool operator==(const Array & lhs, const Array & rhs) {
        return lhs.values == rhs.values;
    }
};

} // namespace QueryFusion
