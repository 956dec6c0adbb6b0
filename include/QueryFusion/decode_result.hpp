#pragma once

#include <cstddef>
#include <string_view>

#include "errors.hpp"

namespace QueryFusion {

namespace result_detail {

template <class Derived>
class ResultBase {
    Error m_details{};
public:
    constexpr ResultBase() = default;
    constexpr explicit ResultBase(const Error & e): m_details(e) {}

    constexpr operator bool() const {
        return m_details.code == ErrorCode::NO_ERROR;
    }
    constexpr ErrorCode error() const {
        return m_details.code;
    }
    constexpr const Error & details() const {
        return m_details;
    }
    constexpr std::string_view key() const {
        return m_details.key;
    }
    constexpr const Cause & cause() const {
        return m_details.cause;
    }
    // byte offset into the decoded text; meaningful for INVALID_PAIR only
    constexpr std::size_t pos() const {
        return m_details.pos;
    }
};

} // namespace result_detail


class DecodeResult : public result_detail::ResultBase<DecodeResult> {
public:
    using ResultBase::ResultBase;
};

class EncodeResult : public result_detail::ResultBase<EncodeResult> {
public:
    using ResultBase::ResultBase;
};

} // namespace QueryFusion
