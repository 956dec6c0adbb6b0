#pragma once

#include <string>
#include <string_view>
#include <system_error>

#include <fmt/format.h>

#include "decode_result.hpp"

namespace QueryFusion {

namespace error_formatting_detail {

inline std::string messageText(const Error & e) {
    switch(e.code) {
    case ErrorCode::NO_ERROR: return "no error";
    case ErrorCode::INVALID_PAIR: return fmt::format("invalid pair '{}' at offset {}", e.key, e.pos);
    case ErrorCode::NO_VALUE: return "no value";
    case ErrorCode::INVALID_LITERAL: return fmt::format("invalid {} literal", e.literal_type);
    case ErrorCode::ARRAY_CODEC_ERROR: return "array codec error";
    case ErrorCode::TRANSFORMER_ERROR: return "transformer rejected the value";
    }
    return std::string(error_to_string(e.code));
}

inline std::string causeText(const Cause & c) {
    switch(c.kind) {
    case CauseKind::none: return {};
    case CauseKind::charconv: return std::make_error_code(c.parse_errc).message();
    case CauseKind::base64: return "invalid base64 text";
    case CauseKind::array_codec:
        return fmt::format("{} (code {}, at {})", c.array_error.message, c.array_error.code, c.array_error.pos);
    }
    return std::string(cause_kind_to_string(c.kind));
}

inline std::string format(std::string_view direction, const Error & e) {
    if(e.code == ErrorCode::NO_ERROR) {
        return messageText(e);
    }
    std::string text = messageText(e);
    if(e.cause) {
        text = fmt::format("{}: {}", text, causeText(e.cause));
    }
    // INVALID_PAIR carries the offending piece, not a field key
    if(e.code == ErrorCode::INVALID_PAIR) {
        return fmt::format("When {}: {}", direction, text);
    }
    return fmt::format("When {} '{}': {}", direction, e.key, text);
}

}

inline std::string ResultToString(const DecodeResult & res) {
    return error_formatting_detail::format("decoding", res.details());
}

inline std::string ResultToString(const EncodeResult & res) {
    return error_formatting_detail::format("encoding", res.details());
}

}
