#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

#include "decoder.hpp"
#include "encoder.hpp"
#include "error_formatting.hpp"

namespace QueryFusion {

namespace http {

using StatusCode = std::int16_t;

inline constexpr StatusCode StatusCodeOK = 200;
inline constexpr StatusCode StatusCodeBadRequest = 400;

} // namespace http


template <static_schema::QueryRootValue T>
struct QueryExtraction;

// Request-side wrapper: a record read from (or written to) the query
// component of an HTTP request target. Framework neutral: it only sees the
// raw target text.
template <static_schema::QueryRootValue T>
class Query {
    T m_value{};
public:
    using value_type = T;

    Query() = default;
    explicit Query(T value): m_value(std::move(value)) {}

    T &       get()       { return m_value; }
    const T & get() const { return m_value; }
    T *       operator->()       { return &m_value; }
    const T * operator->() const { return &m_value; }
    T &       operator*()       { return m_value; }
    const T & operator*() const { return m_value; }

    // "/path?query#fragment": decodes "query"; no '?' decodes "".
    static QueryExtraction<T> FromTarget(std::string_view target);

    static QueryExtraction<T> FromQueryString(std::string_view query);

    // out becomes "path?query", or just "path" when nothing is encoded.
    // out is left unchanged on failure.
    EncodeResult ToTarget(std::string_view path, std::string & out) const;
};


// Owns everything it reports: on INVALID_PAIR the offending text is kept only
// in error, and result.key() is empty, so the target may be discarded.
template <static_schema::QueryRootValue T>
struct QueryExtraction {
    std::optional<Query<T>> query;
    DecodeResult result;
    http::StatusCode status = http::StatusCodeOK;
    std::string error;

    explicit operator bool() const {
        return query.has_value();
    }
};


inline std::string_view QueryComponent(std::string_view target) {
    if(auto hash = target.find('#'); hash != std::string_view::npos) {
        target = target.substr(0, hash);
    }
    auto q = target.find('?');
    if(q == std::string_view::npos) {
        return {};
    }
    return target.substr(q + 1);
}


template <static_schema::QueryRootValue T>
QueryExtraction<T> Query<T>::FromTarget(std::string_view target) {
    return FromQueryString(QueryComponent(target));
}

template <static_schema::QueryRootValue T>
QueryExtraction<T> Query<T>::FromQueryString(std::string_view query) {
    QueryExtraction<T> ret;
    T value{};
    ret.result = Decode(value, query);
    if(!ret.result) {
        ret.status = http::StatusCodeBadRequest;
        ret.error = ResultToString(ret.result);
        if(ret.result.error() == ErrorCode::INVALID_PAIR) {
            Error detached = ret.result.details();
            detached.key = {};
            ret.result = DecodeResult(detached);
        }
        spdlog::debug("rejected query string '{}' with status {}: {}", query, ret.status, ret.error);
        return ret;
    }
    ret.query.emplace(std::move(value));
    return ret;
}

template <static_schema::QueryRootValue T>
EncodeResult Query<T>::ToTarget(std::string_view path, std::string & out) const {
    std::string query;
    EncodeResult res = Encode(m_value, query);
    if(!res) {
        spdlog::debug("could not encode query for '{}': {}", path, ResultToString(res));
        return res;
    }
    out.assign(path.data(), path.size());
    if(!query.empty()) {
        out.push_back('?');
        out += query;
    }
    return res;
}

} // namespace QueryFusion
