#pragma once

#include <cstddef>
#include <string_view>
#include <system_error>

namespace QueryFusion {


enum class ErrorCode {
    NO_ERROR,

    INVALID_PAIR,
    NO_VALUE,
    INVALID_LITERAL,

    ARRAY_CODEC_ERROR,
    TRANSFORMER_ERROR
};

constexpr std::string_view error_to_string(ErrorCode e) {
    switch(e) {
    case ErrorCode::NO_ERROR: return "NO_ERROR"; break;
    case ErrorCode::INVALID_PAIR: return "INVALID_PAIR"; break;
    case ErrorCode::NO_VALUE: return "NO_VALUE"; break;
    case ErrorCode::INVALID_LITERAL: return "INVALID_LITERAL"; break;
    case ErrorCode::ARRAY_CODEC_ERROR: return "ARRAY_CODEC_ERROR"; break;
    case ErrorCode::TRANSFORMER_ERROR: return "TRANSFORMER_ERROR"; break;
    }
    return "N/A";
}


// ============================================================================
// Causes
// ============================================================================

enum class CauseKind {
    none,
    charconv,
    base64,
    array_codec
};

constexpr std::string_view cause_kind_to_string(CauseKind k) {
    switch(k) {
    case CauseKind::none       : return "none"; break;
    case CauseKind::charconv   : return "charconv"; break;
    case CauseKind::base64     : return "base64"; break;
    case CauseKind::array_codec: return "array_codec"; break;
    }
    return "N/A";
}

// Failure reported by an array sub-codec. message must outlive the result
// (string literals or library-owned static strings).
struct ArrayCodecError {
    int code = 0;
    std::string_view message{};
    std::size_t pos = 0;
};

struct Cause {
    CauseKind kind = CauseKind::none;
    std::errc parse_errc{};
    ArrayCodecError array_error{};

    constexpr explicit operator bool() const {
        return kind != CauseKind::none;
    }

    static constexpr Cause from_errc(std::errc e) {
        Cause c;
        c.kind = CauseKind::charconv;
        c.parse_errc = e;
        return c;
    }
    static constexpr Cause from_base64() {
        Cause c;
        c.kind = CauseKind::base64;
        return c;
    }
    static constexpr Cause from_array_codec(ArrayCodecError e) {
        Cause c;
        c.kind = CauseKind::array_codec;
        c.array_error = e;
        return c;
    }
};

// key and literal_type view either the decoded text or compile-time strings.
struct Error {
    ErrorCode code = ErrorCode::NO_ERROR;
    std::string_view key{};
    std::string_view literal_type{};
    std::size_t pos = 0;
    Cause cause{};
};

} // namespace QueryFusion
