#pragma once

#include <array>
#include <charconv>
#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "base64.hpp"
#include "errors.hpp"
#include "static_schema.hpp"

namespace QueryFusion {

namespace scalar_codec {

// Decimals = -1 selects the shortest text that reads back to the same value.
template <int Decimals = -1, class T>
    requires static_schema::QueryScalar<T>
void EncodeScalar(const T & v, std::string & out) {
    if constexpr (static_schema::QueryBool<T>) {
        out += v ? "true" : "false";
    } else if constexpr (static_schema::QueryChar<T>) {
        out.push_back(v);
    } else if constexpr (static_schema::QueryString<T>) {
        out += v;
    } else if constexpr (static_schema::QueryBytes<T>) {
        base64::Encode(v, out);
    } else if constexpr (std::is_floating_point_v<T>) {
        static_assert(Decimals < 64, "[[[ QueryFusion ]]] float_decimals must be below 64");
        // widest fixed double: 309 integer digits, sign, point and decimals
        std::array<char, 384> buf;
        std::to_chars_result r;
        if constexpr (Decimals >= 0) {
            r = std::to_chars(buf.data(), buf.data() + buf.size(), v, std::chars_format::fixed, Decimals);
        } else {
            r = std::to_chars(buf.data(), buf.data() + buf.size(), v);
        }
        out.append(buf.data(), r.ptr);
    } else {
        std::array<char, 48> buf;
        auto r = std::to_chars(buf.data(), buf.data() + buf.size(), v);
        out.append(buf.data(), r.ptr);
    }
}

// Reads text into exactly T; the whole text must be consumed.
template <class T>
    requires static_schema::QueryScalar<T>
bool DecodeScalar(std::string_view text, T & v, Cause & cause) {
    if constexpr (static_schema::QueryBool<T>) {
        if(text == "true") {
            v = true;
        } else if(text == "false") {
            v = false;
        } else {
            cause = Cause::from_errc(std::errc::invalid_argument);
            return false;
        }
        return true;
    } else if constexpr (static_schema::QueryChar<T>) {
        if(text.size() != 1) {
            cause = Cause::from_errc(std::errc::invalid_argument);
            return false;
        }
        v = text.front();
        return true;
    } else if constexpr (static_schema::QueryString<T>) {
        v.assign(text.data(), text.size());
        return true;
    } else if constexpr (static_schema::QueryBytes<T>) {
        if(!base64::Decode(text, v)) {
            cause = Cause::from_base64();
            return false;
        }
        return true;
    } else {
        const char * const first = text.data();
        const char * const last = text.data() + text.size();
        T tmp{};
        auto [ptr, ec] = std::from_chars(first, last, tmp);
        if(ec != std::errc{}) {
            cause = Cause::from_errc(ec);
            return false;
        }
        if(ptr != last) {
            cause = Cause::from_errc(std::errc::invalid_argument);
            return false;
        }
        v = tmp;
        return true;
    }
}

} // namespace scalar_codec
} // namespace QueryFusion
