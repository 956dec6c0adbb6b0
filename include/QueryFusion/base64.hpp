#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace QueryFusion {

namespace base64 {

// RFC 4648 standard alphabet. Padding is never written: '=' separates key
// from value on the wire.

inline constexpr char kB64Table[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr std::size_t EncodedLen(std::size_t binLen) {
    return (binLen / 3) * 4 + (binLen % 3 == 0 ? 0 : binLen % 3 + 1);
}

inline void Encode(std::span<const std::byte> bin, std::string & out) {
    constexpr int kNbBits = 6;
    constexpr std::uint32_t kMask6 = (1U << kNbBits) - 1U;
    int bitsCollected = 0;
    std::uint32_t accumulator = 0;

    out.reserve(out.size() + EncodedLen(bin.size()));
    for (std::byte b : bin) {
        accumulator = (accumulator << 8) | std::to_integer<std::uint32_t>(b);
        bitsCollected += 8;
        while (bitsCollected >= kNbBits) {
            bitsCollected -= kNbBits;
            out.push_back(kB64Table[(accumulator >> bitsCollected) & kMask6]);
        }
    }
    if (bitsCollected > 0) {
        accumulator <<= kNbBits - bitsCollected;
        out.push_back(kB64Table[accumulator & kMask6]);
    }
}

namespace detail {
constexpr std::uint8_t kInvalid = 64;

constexpr std::uint8_t reverse(char ch) {
    if (ch >= 'A' && ch <= 'Z') return std::uint8_t(ch - 'A');
    if (ch >= 'a' && ch <= 'z') return std::uint8_t(ch - 'a' + 26);
    if (ch >= '0' && ch <= '9') return std::uint8_t(ch - '0' + 52);
    if (ch == '+') return 62;
    if (ch == '/') return 63;
    return kInvalid;
}
}

// Fails on characters outside the alphabet, on '=' and on a length no
// unpadded encoding can have.
inline bool Decode(std::string_view asc, std::vector<std::byte> & out) {
    out.clear();
    if (asc.size() % 4 == 1) {
        return false;
    }
    out.reserve((asc.size() * 3) / 4);
    int bitsCollected = 0;
    std::uint32_t accumulator = 0;

    for (char ch : asc) {
        const std::uint8_t v = detail::reverse(ch);
        if (v == detail::kInvalid) {
            out.clear();
            return false;
        }
        accumulator = (accumulator << 6) | v;
        bitsCollected += 6;
        if (bitsCollected >= 8) {
            bitsCollected -= 8;
            out.push_back(std::byte((accumulator >> bitsCollected) & 0xFFU));
        }
    }
    return true;
}

} // namespace base64
} // namespace QueryFusion
