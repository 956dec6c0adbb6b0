#pragma once
#include <cstddef>
#include <string_view>

namespace QueryFusion {

// String literal usable as a template argument; holds wire key names.
template <std::size_t N>
struct KeyLiteral {
    char chars[N + 1]{};

    constexpr KeyLiteral(const char (&text)[N + 1]) {
        for(std::size_t i = 0; i <= N; ++i) {
            chars[i] = text[i];
        }
    }

    constexpr std::string_view view() const {
        return std::string_view(chars, N);
    }

    // A key must survive the pair splitter: '&' and '=' are separators and
    // control characters never appear on the wire.
    constexpr bool isWireSafe() const {
        for(char c : view()) {
            if(static_cast<unsigned char>(c) < 0x20 || c == '&' || c == '=') {
                return false;
            }
        }
        return true;
    }
};

template <std::size_t N>
KeyLiteral(const char (&)[N]) -> KeyLiteral<N - 1>;

} // namespace QueryFusion
